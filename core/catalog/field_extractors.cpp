#include "catalog/field_extractors.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <stdexcept>

namespace nonorec {

namespace {

std::string trimmed(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

// Whole-string decimal integer, optional sign.
int parseStrictInt(const std::string& text, const std::string& what) {
    if (text.empty()) {
        throw ConfigError("Empty " + what);
    }
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed, 10);
    } catch (const std::invalid_argument&) {
        throw ConfigError("Invalid " + what + ": '" + text + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(what + " out of range: '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError("Invalid " + what + ": '" + text + "'");
    }
    return value;
}

} // namespace

std::string ColumnRef::describe() const {
    if (isPositional()) return "#" + std::to_string(position);
    return "'" + name + "'";
}

size_t ColumnRef::resolve(const CsvTable& table) const {
    if (!isPositional()) return table.requireColumn(name);
    if (position >= table.columnCount()) {
        throw ConfigError(table.source() + ": missing required column at position " +
                          std::to_string(position) + " (table has " +
                          std::to_string(table.columnCount()) + " columns)");
    }
    return position;
}

int extractApproxInt(const std::string& cell) {
    std::string digits;
    digits.reserve(cell.size());
    for (char c : cell) {
        if (c != '~') digits.push_back(c);
    }
    return parseStrictInt(trimmed(digits), "integer");
}

std::pair<int, int> extractDimensions(const std::string& cell) {
    std::string text = trimmed(cell);
    size_t sep = text.find('x');
    if (sep == std::string::npos || text.find('x', sep + 1) != std::string::npos) {
        throw ConfigError("Size field is invalid '" + cell + "'");
    }
    int width = parseStrictInt(text.substr(0, sep), "size width");
    int height = parseStrictInt(text.substr(sep + 1), "size height");
    if (width <= 0 || height <= 0) {
        throw ConfigError("Size field is invalid '" + cell + "'");
    }
    return {width, height};
}

PuzzleDifficulty extractDifficulty(const std::string& cell, const std::string& marker) {
    if (!marker.empty() && cell.find(marker) != std::string::npos) {
        return PuzzleDifficulty::TrueNonogram;
    }
    return PuzzleDifficulty::OtherNonogram;
}

void RowDecoder::addRule(ColumnRef column, Extractor extract) {
    rules_.emplace_back(std::move(column), std::move(extract));
}

std::vector<PuzzleRecord> RowDecoder::decode(const CsvTable& table,
                                             const PuzzleRecord& prototype) const {
    // Resolve up front so a missing column fails before any row is read
    std::vector<size_t> indices;
    indices.reserve(rules_.size());
    for (const auto& [column, _] : rules_) {
        indices.push_back(column.resolve(table));
    }

    std::vector<PuzzleRecord> records;
    records.reserve(table.rowCount());
    for (size_t row = 0; row < table.rowCount(); row++) {
        PuzzleRecord record = prototype;
        for (size_t r = 0; r < rules_.size(); r++) {
            try {
                rules_[r].second(table.cell(row, indices[r]), record);
            } catch (const ConfigError& e) {
                throw ConfigError(table.source() + ": row " + std::to_string(row + 1) +
                                  ", column " + rules_[r].first.describe() + ": " + e.what());
            }
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace nonorec
