// EN: DDL parser for DQ-Scanner - statement splitting and CREATE TABLE column extraction
// FR: Analyseur DDL pour DQ-Scanner - découpage des déclarations et extraction des colonnes CREATE TABLE

#pragma once

#include "schema/sql_tokenizer.hpp"

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace DQS::Schema {

// EN: DDL parsing status codes
// FR: Codes de statut d'analyse DDL
enum class DdlError {
    SUCCESS = 0,        // EN: Parsed successfully / FR: Analysé avec succès
    TOKENIZE_ERROR,     // EN: Unterminated literal or comment / FR: Littéral ou commentaire non terminé
    SYNTAX_ERROR,       // EN: Malformed statement / FR: Déclaration malformée
    NOT_CREATE_TABLE    // EN: Statement is not a table creation / FR: La déclaration n'est pas une création de table
};

// EN: Kind of a top-level statement
// FR: Type d'une déclaration de premier niveau
enum class StatementKind {
    CREATE_TABLE,
    OTHER
};

// EN: One statement of a SQL script, as its token range (without the terminating ';')
// FR: Une déclaration d'un script SQL, sous forme de plage de tokens (sans le ';' final)
struct SqlStatement {
    StatementKind kind{StatementKind::OTHER};
    std::string keyword;                // EN: Leading keyword, upper-cased / FR: Mot-clé initial, en majuscules
    std::vector<SqlToken> tokens;
};

// EN: Column declared in a CREATE TABLE statement
// FR: Colonne déclarée dans une déclaration CREATE TABLE
struct ColumnSchema {
    std::string name;                   // EN: Exact declared name (unquoted) / FR: Nom déclaré exact (sans guillemets)
    std::string data_type;              // EN: Rendered declared type, empty if none / FR: Type déclaré rendu, vide si absent
    bool is_numeric{false};             // EN: Declared type is numeric-like / FR: Le type déclaré est de nature numérique

    ColumnSchema() = default;
    ColumnSchema(const std::string& column_name, const std::string& column_type, bool numeric)
        : name(column_name), data_type(column_type), is_numeric(numeric) {}
};

// EN: Table schema built from one CREATE TABLE statement. Column names are unique; a redeclared
//     column replaces the earlier declaration in place.
// FR: Schéma de table construit depuis une déclaration CREATE TABLE. Les noms de colonnes sont uniques ;
//     une colonne redéclarée remplace la déclaration précédente à sa place.
class TableSchema {
public:
    TableSchema() = default;
    explicit TableSchema(const std::string& table_name) : name_(table_name) {}

    void addColumn(const ColumnSchema& column);

    const std::string& getName() const { return name_; }
    void setName(const std::string& name) { name_ = name; }
    const std::vector<ColumnSchema>& getColumns() const { return columns_; }
    const ColumnSchema* getColumn(const std::string& name) const;

    // EN: Names of the columns whose declared type is numeric-like
    // FR: Noms des colonnes dont le type déclaré est de nature numérique
    std::set<std::string> numericColumnNames() const;

private:
    std::string name_;
    std::vector<ColumnSchema> columns_;
    std::unordered_map<std::string, size_t> column_index_;
};

// EN: Heuristic numeric classification: lower-cased declared type contains int, numeric,
//     decimal, float or double.
// FR: Classification numérique heuristique : le type déclaré en minuscules contient int, numeric,
//     decimal, float ou double.
bool isNumericType(const std::string& declared_type);

// EN: Minimal dialect-tolerant DDL parser.
// FR: Analyseur DDL minimal tolérant aux dialectes.
class DdlParser {
public:
    DdlParser() = default;

    // EN: Split SQL text into statements and check each one starts like a statement and
    //     has balanced parentheses. Empty input yields zero statements.
    // FR: Découpe le texte SQL en déclarations et vérifie que chacune commence comme une déclaration
    //     et a des parenthèses équilibrées. Une entrée vide donne zéro déclaration.
    DdlError parse(const std::string& sql, std::vector<SqlStatement>& statements);

    // EN: Analyse a CREATE TABLE statement into a table schema.
    // FR: Analyse une déclaration CREATE TABLE en schéma de table.
    DdlError parseCreateTable(const SqlStatement& statement, TableSchema& schema);

    // EN: Error information for the last failed call
    // FR: Informations d'erreur du dernier appel échoué
    const std::string& getLastError() const { return last_error_; }
    size_t getErrorLine() const { return error_line_; }
    size_t getErrorColumn() const { return error_column_; }

    // EN: Last error with its position, e.g. "Expected ')', found: EOF at Line: 1, Column: 20"
    // FR: Dernière erreur avec sa position, ex: "Expected ')', found: EOF at Line: 1, Column: 20"
    std::string formatLastError() const;

    static bool isStatementKeyword(const std::string& word);

private:
    std::string last_error_;
    size_t error_line_{0};
    size_t error_column_{0};

    // EN: CREATE TABLE helpers
    // FR: Helpers CREATE TABLE
    bool parseCreatePrefix(const std::vector<SqlToken>& tokens, size_t& pos);
    bool parseQualifiedName(const std::vector<SqlToken>& tokens, size_t& pos, std::string& name);
    DdlError parseTableElements(const std::vector<SqlToken>& tokens, size_t& pos, TableSchema& schema);
    DdlError parseColumnDefinition(const std::vector<SqlToken>& element, TableSchema& schema);

    // EN: Token helpers
    // FR: Helpers de tokens
    static bool matchKeyword(const std::vector<SqlToken>& tokens, size_t& pos, const std::string& keyword);
    static bool isTableConstraint(const std::vector<SqlToken>& element, bool sole_element);
    static bool opensIndexColumnList(const std::vector<SqlToken>& element, size_t pos);
    static bool isIdentifier(const SqlToken& token);
    static bool isColumnOptionKeyword(const SqlToken& token);
    static bool isTypeModifier(const SqlToken& token);
    static std::string renderType(const std::vector<SqlToken>& type_tokens);

    void setError(const std::string& message, const SqlToken& token);
    void setError(const std::string& message, size_t line, size_t column);
};

} // namespace DQS::Schema
