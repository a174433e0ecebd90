// EN: DDL column extractor - numeric column set from the first CREATE TABLE statement of a SQL text
// FR: Extracteur de colonnes DDL - ensemble des colonnes numériques de la première déclaration CREATE TABLE

#pragma once

#include "schema/ddl_parser.hpp"

#include <set>
#include <string>

namespace DQS::Schema {

// EN: Parse the SQL text and analyse its first statement, which must be a CREATE TABLE.
//     Trailing statements are ignored. Throws CommandError (Kind::SQL) on failure.
// FR: Analyse le texte SQL et sa première déclaration, qui doit être un CREATE TABLE.
//     Les déclarations suivantes sont ignorées. Lance CommandError (Kind::SQL) en cas d'échec.
TableSchema extractTableSchema(const std::string& sql);

// EN: Names of the numeric-like columns of the first CREATE TABLE statement.
// FR: Noms des colonnes de nature numérique de la première déclaration CREATE TABLE.
std::set<std::string> extractNumericColumns(const std::string& sql);

} // namespace DQS::Schema
