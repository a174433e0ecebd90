// EN: Numeric conformance scanner implementation
// FR: Implémentation du scanner de conformité numérique

#include "scan/numeric_value_scanner.hpp"
#include "scan/json_document.hpp"
#include "schema/column_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace DQS::Scan {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool equalsIgnoreCase(const std::string& text, size_t pos, const std::string& word) {
    if (text.size() - pos != word.size()) return false;
    return std::equal(word.begin(), word.end(), text.begin() + static_cast<std::ptrdiff_t>(pos),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

} // namespace

bool isFloatLiteral(const std::string& text) {
    size_t pos = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        pos++;
    }
    if (pos == text.size()) return false;

    if (equalsIgnoreCase(text, pos, "inf") || equalsIgnoreCase(text, pos, "infinity") ||
        equalsIgnoreCase(text, pos, "nan")) {
        return true;
    }

    size_t mantissa_digits = 0;
    while (pos < text.size() && isDigit(text[pos])) {
        pos++;
        mantissa_digits++;
    }
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        while (pos < text.size() && isDigit(text[pos])) {
            pos++;
            mantissa_digits++;
        }
    }
    if (mantissa_digits == 0) return false;

    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        pos++;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            pos++;
        }
        size_t exponent_digits = 0;
        while (pos < text.size() && isDigit(text[pos])) {
            pos++;
            exponent_digits++;
        }
        if (exponent_digits == 0) return false;
    }

    return pos == text.size();
}

std::vector<NumericFinding> NumericValueScanner::scan(const std::string& json_text,
                                                      const std::string& sql_text) const {
    // EN: DDL errors win over JSON errors
    // FR: Les erreurs DDL priment sur les erreurs JSON
    std::set<std::string> numeric_columns = Schema::extractNumericColumns(sql_text);
    return scan(parseJsonDocument(json_text), numeric_columns);
}

std::vector<NumericFinding> NumericValueScanner::scan(const nlohmann::ordered_json& document,
                                                      const std::set<std::string>& numeric_columns) const {
    std::vector<NumericFinding> findings;
    if (numeric_columns.empty()) {
        return findings;
    }

    forEachRecord(document, "numeric_scanner",
                  [&findings, &numeric_columns](size_t index, const nlohmann::ordered_json& record) {
        for (auto it = record.begin(); it != record.end(); ++it) {
            if (numeric_columns.count(it.key()) == 0) continue;

            std::string offending;
            if (!checkValue(it.value(), offending)) {
                findings.emplace_back(index, it.key(), offending);
            }
        }
    });

    return findings;
}

bool NumericValueScanner::checkValue(const nlohmann::ordered_json& value, std::string& offending) {
    if (value.is_number()) {
        return true;
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (isFloatLiteral(text)) return true;
        offending = text;
        return false;
    }
    offending = value.dump();
    return false;
}

} // namespace DQS::Scan
