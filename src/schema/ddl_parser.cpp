// EN: DDL parser implementation - statement splitting, CREATE TABLE prefix and column definitions
// FR: Implémentation de l'analyseur DDL - découpage des déclarations, préfixe CREATE TABLE et définitions de colonnes

#include "schema/ddl_parser.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace DQS::Schema {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool isWordIn(const SqlToken& token, const std::unordered_set<std::string>& words) {
    return token.type == TokenType::WORD && words.count(toUpper(token.text)) > 0;
}

// EN: Statement tokens followed by an END sentinel placed just after the last token.
// FR: Tokens de la déclaration suivis d'une sentinelle END placée juste après le dernier token.
std::vector<SqlToken> withEndSentinel(const std::vector<SqlToken>& tokens) {
    std::vector<SqlToken> result = tokens;
    if (result.empty()) {
        result.emplace_back(TokenType::END, "", 1, 1);
    } else {
        const SqlToken& last = result.back();
        result.emplace_back(TokenType::END, "", last.line, last.column + last.text.size());
    }
    return result;
}

} // namespace

// EN: TableSchema implementation
// FR: Implémentation de TableSchema

void TableSchema::addColumn(const ColumnSchema& column) {
    auto it = column_index_.find(column.name);
    if (it != column_index_.end()) {
        columns_[it->second] = column;
        return;
    }
    column_index_[column.name] = columns_.size();
    columns_.push_back(column);
}

const ColumnSchema* TableSchema::getColumn(const std::string& name) const {
    auto it = column_index_.find(name);
    return it != column_index_.end() ? &columns_[it->second] : nullptr;
}

std::set<std::string> TableSchema::numericColumnNames() const {
    std::set<std::string> names;
    for (const auto& column : columns_) {
        if (column.is_numeric) {
            names.insert(column.name);
        }
    }
    return names;
}

bool isNumericType(const std::string& declared_type) {
    static const std::array<const char*, 5> kNumericMarkers = {"int", "numeric", "decimal", "float", "double"};

    std::string lowered = declared_type;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return std::any_of(kNumericMarkers.begin(), kNumericMarkers.end(), [&lowered](const char* marker) {
        return lowered.find(marker) != std::string::npos;
    });
}

// EN: DdlParser implementation
// FR: Implémentation de DdlParser

bool DdlParser::isStatementKeyword(const std::string& word) {
    static const std::unordered_set<std::string> kStatementKeywords = {
        "SELECT", "INSERT", "UPDATE", "DELETE", "CREATE", "ALTER", "DROP", "WITH",
        "TRUNCATE", "GRANT", "REVOKE", "COMMENT", "SET", "USE", "BEGIN", "COMMIT",
        "ROLLBACK", "EXPLAIN", "SHOW", "VALUES", "MERGE", "COPY", "ANALYZE", "VACUUM",
        "REPLACE", "DESCRIBE", "PRAGMA", "START", "DECLARE", "CALL", "EXECUTE"
    };
    return kStatementKeywords.count(toUpper(word)) > 0;
}

DdlError DdlParser::parse(const std::string& sql, std::vector<SqlStatement>& statements) {
    // EN: Reset state
    // FR: Réinitialiser l'état
    last_error_.clear();
    error_line_ = 0;
    error_column_ = 0;
    statements.clear();

    SqlTokenizer tokenizer;
    std::vector<SqlToken> tokens;
    if (!tokenizer.tokenize(sql, tokens)) {
        setError(tokenizer.getLastError(), tokenizer.getErrorLine(), tokenizer.getErrorColumn());
        return DdlError::TOKENIZE_ERROR;
    }

    SqlStatement current;
    int depth = 0;

    for (const auto& token : tokens) {
        bool terminator = token.type == TokenType::END || token.type == TokenType::SEMICOLON;

        if (terminator) {
            if (depth > 0) {
                setError("Expected ')', found: " + token.display(), token);
                return DdlError::SYNTAX_ERROR;
            }

            if (!current.tokens.empty()) {
                const SqlToken& first = current.tokens.front();
                if (first.type != TokenType::WORD || !isStatementKeyword(first.text)) {
                    setError("Expected an SQL statement, found: " + first.display(), first);
                    return DdlError::SYNTAX_ERROR;
                }

                current.keyword = toUpper(first.text);
                size_t pos = 0;
                std::vector<SqlToken> prefix_tokens = withEndSentinel(current.tokens);
                current.kind = parseCreatePrefix(prefix_tokens, pos) ? StatementKind::CREATE_TABLE : StatementKind::OTHER;
                statements.push_back(std::move(current));
                current = SqlStatement{};
            }

            if (token.type == TokenType::END) break;
            continue; // EN: Empty statements are skipped / FR: Les déclarations vides sont ignorées
        }

        if (token.type == TokenType::LPAREN) {
            depth++;
        } else if (token.type == TokenType::RPAREN) {
            if (depth == 0) {
                setError("Unexpected ')'", token);
                return DdlError::SYNTAX_ERROR;
            }
            depth--;
        }

        current.tokens.push_back(token);
    }

    LOG_DEBUG("ddl_parser", "Parsed " + std::to_string(statements.size()) + " SQL statement(s)");
    return DdlError::SUCCESS;
}

DdlError DdlParser::parseCreateTable(const SqlStatement& statement, TableSchema& schema) {
    last_error_.clear();
    error_line_ = 0;
    error_column_ = 0;

    std::vector<SqlToken> tokens = withEndSentinel(statement.tokens);
    size_t pos = 0;

    if (!parseCreatePrefix(tokens, pos)) {
        setError("Could not parse a CREATE TABLE statement.", tokens.front());
        return DdlError::NOT_CREATE_TABLE;
    }

    if (matchKeyword(tokens, pos, "IF")) {
        if (!matchKeyword(tokens, pos, "NOT") || !matchKeyword(tokens, pos, "EXISTS")) {
            setError("Expected NOT EXISTS, found: " + tokens[pos].display(), tokens[pos]);
            return DdlError::SYNTAX_ERROR;
        }
    }

    std::string table_name;
    if (!parseQualifiedName(tokens, pos, table_name)) {
        setError("Expected table name, found: " + tokens[pos].display(), tokens[pos]);
        return DdlError::SYNTAX_ERROR;
    }

    schema = TableSchema(table_name);

    // EN: CREATE TABLE ... AS / LIKE / options without a column list declare no columns.
    // FR: CREATE TABLE ... AS / LIKE / options sans liste de colonnes ne déclarent aucune colonne.
    if (tokens[pos].type != TokenType::LPAREN) {
        LOG_DEBUG("ddl_parser", "CREATE TABLE " + table_name + " has no column list");
        return DdlError::SUCCESS;
    }

    DdlError error = parseTableElements(tokens, pos, schema);
    if (error != DdlError::SUCCESS) return error;

    LOG_DEBUG("ddl_parser", "CREATE TABLE " + table_name + " declares " +
              std::to_string(schema.getColumns().size()) + " column(s)");
    return DdlError::SUCCESS;
}

std::string DdlParser::formatLastError() const {
    if (error_line_ == 0) {
        return last_error_;
    }
    return last_error_ + " at Line: " + std::to_string(error_line_) +
           ", Column: " + std::to_string(error_column_);
}

// EN: CREATE [OR REPLACE] [GLOBAL|LOCAL] [TEMPORARY|TEMP] [UNLOGGED|TRANSIENT|VOLATILE|EXTERNAL] TABLE
// FR: CREATE [OR REPLACE] [GLOBAL|LOCAL] [TEMPORARY|TEMP] [UNLOGGED|TRANSIENT|VOLATILE|EXTERNAL] TABLE
bool DdlParser::parseCreatePrefix(const std::vector<SqlToken>& tokens, size_t& pos) {
    if (!matchKeyword(tokens, pos, "CREATE")) return false;

    if (matchKeyword(tokens, pos, "OR") && !matchKeyword(tokens, pos, "REPLACE")) {
        return false;
    }

    if (!matchKeyword(tokens, pos, "GLOBAL")) {
        matchKeyword(tokens, pos, "LOCAL");
    }
    if (!matchKeyword(tokens, pos, "TEMPORARY")) {
        matchKeyword(tokens, pos, "TEMP");
    }
    for (const char* storage : {"UNLOGGED", "TRANSIENT", "VOLATILE", "EXTERNAL"}) {
        if (matchKeyword(tokens, pos, storage)) break;
    }

    return matchKeyword(tokens, pos, "TABLE");
}

bool DdlParser::parseQualifiedName(const std::vector<SqlToken>& tokens, size_t& pos, std::string& name) {
    auto is_name_part = [](const SqlToken& token) {
        return token.type == TokenType::WORD || token.type == TokenType::QUOTED_IDENTIFIER;
    };

    if (!is_name_part(tokens[pos])) return false;

    name = tokens[pos].text;
    pos++;

    while (tokens[pos].type == TokenType::DOT && is_name_part(tokens[pos + 1])) {
        name += "." + tokens[pos + 1].text;
        pos += 2;
    }
    return true;
}

// EN: Split the parenthesised list at depth-0 commas; constraints are skipped, columns are parsed.
// FR: Découpe la liste entre parenthèses aux virgules de profondeur 0 ; contraintes ignorées, colonnes analysées.
DdlError DdlParser::parseTableElements(const std::vector<SqlToken>& tokens, size_t& pos, TableSchema& schema) {
    pos++; // EN: Skip '(' / FR: Ignorer '('

    if (tokens[pos].type == TokenType::RPAREN) {
        pos++;
        return DdlError::SUCCESS;
    }

    std::vector<SqlToken> element;
    size_t element_count = 0;
    int depth = 0;

    while (true) {
        const SqlToken& token = tokens[pos];

        if (token.type == TokenType::END) {
            setError("Expected ')', found: " + token.display(), token);
            return DdlError::SYNTAX_ERROR;
        }

        bool element_end = depth == 0 && (token.type == TokenType::COMMA || token.type == TokenType::RPAREN);
        if (!element_end) {
            if (token.type == TokenType::LPAREN) depth++;
            if (token.type == TokenType::RPAREN) depth--;
            element.push_back(token);
            pos++;
            continue;
        }

        if (element.empty()) {
            setError("Expected column name or constraint definition, found: " + token.display(), token);
            return DdlError::SYNTAX_ERROR;
        }

        bool sole_element = element_count == 0 && token.type == TokenType::RPAREN;
        if (!isTableConstraint(element, sole_element)) {
            DdlError error = parseColumnDefinition(element, schema);
            if (error != DdlError::SUCCESS) return error;
        }

        element.clear();
        element_count++;
        pos++;
        if (token.type == TokenType::RPAREN) {
            return DdlError::SUCCESS;
        }
    }
}

// EN: name [type words] [(args)] [modifiers] [[]] [column options...]
// FR: nom [mots du type] [(args)] [modificateurs] [[]] [options de colonne...]
DdlError DdlParser::parseColumnDefinition(const std::vector<SqlToken>& element, TableSchema& schema) {
    const SqlToken& name = element.front();
    if (name.type != TokenType::WORD && name.type != TokenType::QUOTED_IDENTIFIER) {
        setError("Expected column name, found: " + name.display(), name);
        return DdlError::SYNTAX_ERROR;
    }

    std::vector<SqlToken> type_tokens;
    bool after_arguments = false;
    size_t i = 1;

    while (i < element.size()) {
        const SqlToken& token = element[i];

        if (token.type == TokenType::WORD) {
            if (isColumnOptionKeyword(token)) break;
            if (token.isKeyword("CHARACTER") && i + 1 < element.size() && element[i + 1].isKeyword("SET")) break;
            if (after_arguments && !isTypeModifier(token)) break;
            type_tokens.push_back(token);
            i++;
        } else if (token.type == TokenType::LPAREN) {
            if (type_tokens.empty()) break;
            int depth = 0;
            do {
                if (element[i].type == TokenType::LPAREN) depth++;
                if (element[i].type == TokenType::RPAREN) depth--;
                type_tokens.push_back(element[i]);
                i++;
            } while (i < element.size() && depth > 0);
            after_arguments = true;
        } else if (token.type == TokenType::OPERATOR && (token.text == "[" || token.text == "]")) {
            type_tokens.push_back(token);
            i++;
        } else if (token.type == TokenType::DOT && !type_tokens.empty()) {
            type_tokens.push_back(token);
            i++;
        } else if (token.type == TokenType::QUOTED_IDENTIFIER && type_tokens.empty()) {
            type_tokens.push_back(token);
            i++;
        } else {
            break;
        }
    }

    std::string data_type = renderType(type_tokens);
    bool numeric = isNumericType(data_type);
    schema.addColumn(ColumnSchema(name.text, data_type, numeric));

    LOG_DEBUG("ddl_parser", "Column '" + name.text + "' type '" + data_type + "'" +
              (numeric ? " (numeric)" : ""));
    return DdlError::SUCCESS;
}

bool DdlParser::matchKeyword(const std::vector<SqlToken>& tokens, size_t& pos, const std::string& keyword) {
    if (pos < tokens.size() && tokens[pos].isKeyword(keyword)) {
        pos++;
        return true;
    }
    return false;
}

// EN: A leading keyword only starts a constraint when the next tokens continue one,
//     so columns named period, key or like stay columns
// FR: Un mot-clé initial ne démarre une contrainte que si les tokens suivants la continuent,
//     les colonnes nommées period, key ou like restent des colonnes
bool DdlParser::isTableConstraint(const std::vector<SqlToken>& element, bool sole_element) {
    const SqlToken& first = element.front();
    if (first.type != TokenType::WORD || element.size() < 2) return false;
    const SqlToken& next = element[1];

    if (first.isKeyword("CONSTRAINT")) {
        static const std::unordered_set<std::string> kNamedConstraints = {
            "PRIMARY", "FOREIGN", "UNIQUE", "CHECK", "EXCLUDE"
        };
        return element.size() > 2 && isIdentifier(next) && isWordIn(element[2], kNamedConstraints);
    }
    if (first.isKeyword("PRIMARY") || first.isKeyword("FOREIGN")) {
        return next.isKeyword("KEY");
    }
    if (first.isKeyword("CHECK")) {
        return next.type == TokenType::LPAREN;
    }
    if (first.isKeyword("PERIOD")) {
        return next.isKeyword("FOR");
    }
    if (first.isKeyword("EXCLUDE")) {
        return next.isKeyword("USING") || next.type == TokenType::LPAREN;
    }
    if (first.isKeyword("UNIQUE") || first.isKeyword("FULLTEXT") || first.isKeyword("SPATIAL")) {
        return next.isKeyword("KEY") || next.isKeyword("INDEX") || opensIndexColumnList(element, 1);
    }
    if (first.isKeyword("KEY") || first.isKeyword("INDEX")) {
        return opensIndexColumnList(element, 1);
    }
    if (first.isKeyword("LIKE")) {
        // EN: LIKE source [INCLUDING ... | EXCLUDING ...]
        // FR: LIKE source [INCLUDING ... | EXCLUDING ...]
        size_t i = 1;
        if (!isIdentifier(element[i])) return false;
        i++;
        while (i + 1 < element.size() && element[i].type == TokenType::DOT && isIdentifier(element[i + 1])) {
            i += 2;
        }
        if (i == element.size()) return sole_element;
        return element[i].isKeyword("INCLUDING") || element[i].isKeyword("EXCLUDING");
    }
    return false;
}

// EN: [name] [USING method] ( column ... where the list starts with an identifier, not a type argument
// FR: [nom] [USING méthode] ( colonne ... où la liste commence par un identifiant, pas un argument de type
bool DdlParser::opensIndexColumnList(const std::vector<SqlToken>& element, size_t pos) {
    if (pos < element.size() && isIdentifier(element[pos]) && !element[pos].isKeyword("USING")) pos++;
    if (pos + 1 < element.size() && element[pos].isKeyword("USING") && isIdentifier(element[pos + 1])) pos += 2;
    return pos + 1 < element.size() &&
           element[pos].type == TokenType::LPAREN &&
           isIdentifier(element[pos + 1]);
}

bool DdlParser::isIdentifier(const SqlToken& token) {
    return token.type == TokenType::WORD || token.type == TokenType::QUOTED_IDENTIFIER;
}

bool DdlParser::isColumnOptionKeyword(const SqlToken& token) {
    static const std::unordered_set<std::string> kColumnOptions = {
        "NOT", "NULL", "DEFAULT", "PRIMARY", "UNIQUE", "REFERENCES", "CHECK", "CONSTRAINT",
        "COLLATE", "AUTO_INCREMENT", "AUTOINCREMENT", "GENERATED", "COMMENT", "AS", "IDENTITY",
        "ON", "KEY", "CHARSET", "ENCODE", "OPTIONS", "MATERIALIZED", "ALIAS", "CODEC", "TTL",
        "STORED", "VIRTUAL", "INVISIBLE", "VISIBLE"
    };
    return isWordIn(token, kColumnOptions);
}

bool DdlParser::isTypeModifier(const SqlToken& token) {
    static const std::unordered_set<std::string> kTypeModifiers = {
        "UNSIGNED", "SIGNED", "ZEROFILL", "VARYING", "PRECISION", "WITH", "WITHOUT",
        "TIME", "ZONE", "LOCAL", "ARRAY"
    };
    return isWordIn(token, kTypeModifiers);
}

// EN: Words are space-separated; punctuation is glued: "DECIMAL(10,2)", "DOUBLE PRECISION", "INT[]".
// FR: Les mots sont séparés par des espaces ; la ponctuation est collée : "DECIMAL(10,2)", "DOUBLE PRECISION", "INT[]".
std::string DdlParser::renderType(const std::vector<SqlToken>& type_tokens) {
    std::string rendered;
    bool glue_next = true;

    for (const auto& token : type_tokens) {
        switch (token.type) {
            case TokenType::LPAREN:
            case TokenType::COMMA:
            case TokenType::DOT:
                rendered += token.text;
                glue_next = true;
                break;
            case TokenType::RPAREN:
                rendered += token.text;
                glue_next = false;
                break;
            case TokenType::OPERATOR:
                rendered += token.text;
                glue_next = token.text == "[";
                break;
            default:
                if (!glue_next) rendered += ' ';
                rendered += token.type == TokenType::STRING ? token.display() : token.text;
                glue_next = false;
                break;
        }
    }
    return rendered;
}

void DdlParser::setError(const std::string& message, const SqlToken& token) {
    setError(message, token.line, token.column);
}

void DdlParser::setError(const std::string& message, size_t line, size_t column) {
    last_error_ = message;
    error_line_ = line;
    error_column_ = column;
}

} // namespace DQS::Schema
