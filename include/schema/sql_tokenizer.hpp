// EN: SQL tokenizer for DQ-Scanner DDL parsing - words, quoted identifiers, literals and punctuation
// FR: Tokeniseur SQL pour l'analyse DDL de DQ-Scanner - mots, identifiants entre guillemets, littéraux et ponctuation

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace DQS::Schema {

// EN: Token categories produced by the tokenizer
// FR: Catégories de tokens produites par le tokeniseur
enum class TokenType {
    WORD,               // EN: Unquoted identifier or keyword / FR: Identifiant ou mot-clé sans guillemets
    QUOTED_IDENTIFIER,  // EN: "name", `name` or [name] / FR: "nom", `nom` ou [nom]
    STRING,             // EN: 'literal' / FR: 'littéral'
    NUMBER,             // EN: Numeric literal / FR: Littéral numérique
    LPAREN,             // EN: ( / FR: (
    RPAREN,             // EN: ) / FR: )
    COMMA,              // EN: , / FR: ,
    SEMICOLON,          // EN: ; / FR: ;
    DOT,                // EN: . / FR: .
    OPERATOR,           // EN: Any other punctuation / FR: Toute autre ponctuation
    END                 // EN: End of input / FR: Fin de l'entrée
};

// EN: Single token with its source position (1-based)
// FR: Token unique avec sa position source (base 1)
struct SqlToken {
    TokenType type{TokenType::END};
    std::string text;       // EN: Unquoted value for quoted tokens / FR: Valeur sans guillemets pour les tokens entre guillemets
    size_t line{1};
    size_t column{1};

    SqlToken() = default;
    SqlToken(TokenType token_type, std::string token_text, size_t token_line, size_t token_column)
        : type(token_type), text(std::move(token_text)), line(token_line), column(token_column) {}

    // EN: Case-insensitive keyword comparison (WORD tokens only)
    // FR: Comparaison de mot-clé insensible à la casse (tokens WORD uniquement)
    bool isKeyword(const std::string& keyword) const;

    // EN: Text as it would appear in the source, used in error messages
    // FR: Texte tel qu'il apparaîtrait dans la source, utilisé dans les messages d'erreur
    std::string display() const;
};

// EN: Converts SQL text into a token vector terminated by an END token.
// FR: Convertit un texte SQL en vecteur de tokens terminé par un token END.
class SqlTokenizer {
public:
    SqlTokenizer() = default;

    // EN: Tokenize the whole input. Returns false on unterminated literal or comment.
    // FR: Tokenise toute l'entrée. Retourne false sur littéral ou commentaire non terminé.
    bool tokenize(const std::string& sql, std::vector<SqlToken>& tokens);

    const std::string& getLastError() const { return last_error_; }
    size_t getErrorLine() const { return error_line_; }
    size_t getErrorColumn() const { return error_column_; }

    static bool isIdentifierStart(char c);
    static bool isIdentifierPart(char c);

private:
    std::string last_error_;
    size_t error_line_{0};
    size_t error_column_{0};

    const std::string* sql_{nullptr};
    size_t pos_{0};
    size_t line_{1};
    size_t column_{1};

    char peek(size_t offset = 0) const;
    void advance();

    bool skipWhitespaceAndComments();
    bool readQuoted(char close_char, TokenType type, std::vector<SqlToken>& tokens);
    void readWord(std::vector<SqlToken>& tokens);
    void readNumber(std::vector<SqlToken>& tokens);

    void setError(const std::string& message, size_t line, size_t column);
};

} // namespace DQS::Schema
