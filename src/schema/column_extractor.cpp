// EN: DDL column extractor implementation
// FR: Implémentation de l'extracteur de colonnes DDL

#include "schema/column_extractor.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_error.hpp"

#include <vector>

namespace DQS::Schema {

namespace {

const char* const kNoCreateTable = "Could not parse a CREATE TABLE statement.";

} // namespace

TableSchema extractTableSchema(const std::string& sql) {
    DdlParser parser;
    std::vector<SqlStatement> statements;

    if (parser.parse(sql, statements) != DdlError::SUCCESS) {
        throw CommandError::sql(parser.formatLastError());
    }

    if (statements.empty() || statements.front().kind != StatementKind::CREATE_TABLE) {
        throw CommandError::sql(kNoCreateTable);
    }

    if (statements.size() > 1) {
        LOG_DEBUG("column_extractor", "Ignoring " + std::to_string(statements.size() - 1) +
                  " statement(s) after the first CREATE TABLE");
    }

    TableSchema schema;
    DdlError error = parser.parseCreateTable(statements.front(), schema);
    if (error == DdlError::NOT_CREATE_TABLE) {
        throw CommandError::sql(kNoCreateTable);
    }
    if (error != DdlError::SUCCESS) {
        throw CommandError::sql(parser.formatLastError());
    }

    return schema;
}

std::set<std::string> extractNumericColumns(const std::string& sql) {
    return extractTableSchema(sql).numericColumnNames();
}

} // namespace DQS::Schema
