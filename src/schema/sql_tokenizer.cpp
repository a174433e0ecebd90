// EN: SQL tokenizer implementation - comment skipping, quoting rules and position tracking
// FR: Implémentation du tokeniseur SQL - saut des commentaires, règles de guillemets et suivi de position

#include "schema/sql_tokenizer.hpp"

#include <algorithm>
#include <cctype>

namespace DQS::Schema {

bool SqlToken::isKeyword(const std::string& keyword) const {
    if (type != TokenType::WORD || text.size() != keyword.size()) {
        return false;
    }
    return std::equal(text.begin(), text.end(), keyword.begin(), [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
    });
}

std::string SqlToken::display() const {
    switch (type) {
        case TokenType::END:               return "EOF";
        case TokenType::STRING:            return "'" + text + "'";
        case TokenType::QUOTED_IDENTIFIER: return "\"" + text + "\"";
        default:                           return text;
    }
}

bool SqlTokenizer::isIdentifierStart(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || c == '#' || c == '@' || uc >= 0x80;
}

bool SqlTokenizer::isIdentifierPart(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '$' || c == '#' || c == '@' || uc >= 0x80;
}

bool SqlTokenizer::tokenize(const std::string& sql, std::vector<SqlToken>& tokens) {
    // EN: Reset state
    // FR: Réinitialiser l'état
    last_error_.clear();
    error_line_ = 0;
    error_column_ = 0;
    sql_ = &sql;
    pos_ = 0;
    line_ = 1;
    column_ = 1;
    tokens.clear();

    while (true) {
        if (!skipWhitespaceAndComments()) {
            return false;
        }

        if (pos_ >= sql.length()) {
            break;
        }

        char c = peek();
        size_t line = line_;
        size_t column = column_;

        if (c == '\'') {
            if (!readQuoted('\'', TokenType::STRING, tokens)) return false;
            continue;
        }
        if (c == '"') {
            if (!readQuoted('"', TokenType::QUOTED_IDENTIFIER, tokens)) return false;
            continue;
        }
        if (c == '`') {
            if (!readQuoted('`', TokenType::QUOTED_IDENTIFIER, tokens)) return false;
            continue;
        }
        if (c == '[') {
            // EN: After a type name or a closing bracket, '[' is an array suffix, not a quote.
            // FR: Après un nom de type ou un crochet fermant, '[' est un suffixe de tableau, pas un guillemet.
            bool array_suffix = !tokens.empty() &&
                (tokens.back().type == TokenType::WORD ||
                 tokens.back().type == TokenType::QUOTED_IDENTIFIER ||
                 tokens.back().type == TokenType::RPAREN ||
                 (tokens.back().type == TokenType::OPERATOR && tokens.back().text == "]"));
            if (!array_suffix) {
                if (!readQuoted(']', TokenType::QUOTED_IDENTIFIER, tokens)) return false;
                continue;
            }
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            readNumber(tokens);
            continue;
        }
        if (isIdentifierStart(c)) {
            readWord(tokens);
            continue;
        }

        TokenType type = TokenType::OPERATOR;
        switch (c) {
            case '(': type = TokenType::LPAREN; break;
            case ')': type = TokenType::RPAREN; break;
            case ',': type = TokenType::COMMA; break;
            case ';': type = TokenType::SEMICOLON; break;
            case '.': type = TokenType::DOT; break;
            default: break;
        }
        tokens.emplace_back(type, std::string(1, c), line, column);
        advance();
    }

    tokens.emplace_back(TokenType::END, "", line_, column_);
    return true;
}

char SqlTokenizer::peek(size_t offset) const {
    size_t index = pos_ + offset;
    return index < sql_->length() ? (*sql_)[index] : '\0';
}

void SqlTokenizer::advance() {
    if (pos_ >= sql_->length()) return;
    if ((*sql_)[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

bool SqlTokenizer::skipWhitespaceAndComments() {
    while (pos_ < sql_->length()) {
        char c = peek();

        if (std::isspace(static_cast<unsigned char>(c))) {
            advance();
            continue;
        }

        // EN: Line comment
        // FR: Commentaire de ligne
        if (c == '-' && peek(1) == '-') {
            while (pos_ < sql_->length() && peek() != '\n') {
                advance();
            }
            continue;
        }

        // EN: Block comment
        // FR: Commentaire de bloc
        if (c == '/' && peek(1) == '*') {
            size_t line = line_;
            size_t column = column_;
            advance();
            advance();
            bool closed = false;
            while (pos_ < sql_->length()) {
                if (peek() == '*' && peek(1) == '/') {
                    advance();
                    advance();
                    closed = true;
                    break;
                }
                advance();
            }
            if (!closed) {
                setError("Unterminated block comment", line, column);
                return false;
            }
            continue;
        }

        break;
    }
    return true;
}

// EN: A doubled closing character inside the quotes stands for itself.
// FR: Un caractère fermant doublé entre guillemets se représente lui-même.
bool SqlTokenizer::readQuoted(char close_char, TokenType type, std::vector<SqlToken>& tokens) {
    size_t line = line_;
    size_t column = column_;
    advance(); // EN: Skip opening quote / FR: Ignorer le guillemet d'ouverture

    std::string value;
    while (pos_ < sql_->length()) {
        char c = peek();
        if (c == close_char) {
            if (peek(1) == close_char) {
                value += c;
                advance();
                advance();
                continue;
            }
            advance(); // EN: Skip closing quote / FR: Ignorer le guillemet de fermeture
            tokens.emplace_back(type, value, line, column);
            return true;
        }
        value += c;
        advance();
    }

    setError(type == TokenType::STRING ? "Unterminated string literal" : "Unterminated quoted identifier",
             line, column);
    return false;
}

void SqlTokenizer::readWord(std::vector<SqlToken>& tokens) {
    size_t line = line_;
    size_t column = column_;
    std::string word;
    while (pos_ < sql_->length() && isIdentifierPart(peek())) {
        word += peek();
        advance();
    }
    tokens.emplace_back(TokenType::WORD, word, line, column);
}

void SqlTokenizer::readNumber(std::vector<SqlToken>& tokens) {
    size_t line = line_;
    size_t column = column_;
    std::string number;
    bool has_dot = false;
    bool has_exponent = false;

    while (pos_ < sql_->length()) {
        char c = peek();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            number += c;
        } else if (c == '.' && !has_dot) {
            has_dot = true;
            number += c;
        } else if ((c == 'e' || c == 'E') && !has_exponent &&
                   (std::isdigit(static_cast<unsigned char>(peek(1))) ||
                    ((peek(1) == '+' || peek(1) == '-') && std::isdigit(static_cast<unsigned char>(peek(2)))))) {
            number += c;
            advance();
            number += peek();
            has_dot = true;
            has_exponent = true;
        } else {
            break;
        }
        advance();
    }

    tokens.emplace_back(TokenType::NUMBER, number, line, column);
}

void SqlTokenizer::setError(const std::string& message, size_t line, size_t column) {
    last_error_ = message;
    error_line_ = line;
    error_column_ = column;
}

} // namespace DQS::Schema
