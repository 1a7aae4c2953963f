#include "catalog/csv_table.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <istream>
#include <ostream>

namespace nonorec {

namespace {

const std::string kEmptyCell;

// Reads one record, which may span several physical lines when a quoted
// field contains a newline. Returns false at end of input.
bool readRecord(std::istream& in, CsvRow& out, const std::string& source, size_t& line_no) {
    out.clear();
    std::string line;
    if (!std::getline(in, line)) return false;
    // A UTF-8 byte order mark may precede the first physical line
    if (line_no == 0 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        line.erase(0, 3);
    }
    ++line_no;

    std::string field;
    bool in_quotes = false;
    size_t i = 0;
    for (;;) {
        if (i >= line.size()) {
            if (!in_quotes) break;
            // Quoted field continues on the next line
            std::string next;
            if (!std::getline(in, next)) {
                throw ConfigError(source + ":" + std::to_string(line_no) +
                                  ": unterminated quoted field");
            }
            ++line_no;
            field.push_back('\n');
            line = std::move(next);
            i = 0;
            continue;
        }

        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else if (c == '\r' && i + 1 == line.size()) {
                // CRLF line ending inside a quoted field
            } else {
                field.push_back(c);
            }
        } else if (c == '"' && field.empty()) {
            in_quotes = true;
        } else if (c == ',') {
            out.push_back(std::move(field));
            field.clear();
        } else if (c == '\r' && i + 1 == line.size()) {
            // CRLF line ending
        } else {
            field.push_back(c);
        }
        ++i;
    }
    out.push_back(std::move(field));
    return true;
}

bool isBlank(const CsvRow& row) {
    return row.size() == 1 && row[0].empty();
}

bool needsQuoting(const std::string& field) {
    return field.find_first_of(",\"\r\n") != std::string::npos;
}

void writeField(std::ostream& out, const std::string& field) {
    if (!needsQuoting(field)) {
        out << field;
        return;
    }
    out << '"';
    for (char c : field) {
        if (c == '"') out << '"';
        out << c;
    }
    out << '"';
}

void writeRow(std::ostream& out, const CsvRow& row) {
    for (size_t i = 0; i < row.size(); i++) {
        if (i) out << ',';
        writeField(out, row[i]);
    }
    out << '\n';
}

} // namespace

CsvTable CsvTable::parse(std::istream& in, const std::string& source) {
    CsvTable table;
    table.source_ = source;

    size_t line_no = 0;
    CsvRow row;
    while (readRecord(in, row, source, line_no)) {
        if (isBlank(row)) continue;
        if (table.header_.empty()) {
            table.header_ = std::move(row);
        } else {
            table.rows_.push_back(std::move(row));
        }
        row = CsvRow();
    }

    if (table.header_.empty()) {
        throw ConfigError(source + ": missing header row");
    }
    return table;
}

CsvTable CsvTable::readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw IoError("Cannot open csv file for reading: " + path);
    }
    return parse(in, path);
}

void CsvTable::write(std::ostream& out) const {
    writeRow(out, header_);
    for (const auto& row : rows_) {
        writeRow(out, row);
    }
}

void CsvTable::writeFile(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw IoError("Cannot open csv file for writing: " + path);
    }
    write(out);
    out.flush();
    if (!out) {
        throw IoError("Failed writing csv file: " + path);
    }
}

std::optional<size_t> CsvTable::columnIndex(const std::string& name) const {
    for (size_t i = 0; i < header_.size(); i++) {
        if (header_[i] == name) return i;
    }
    return std::nullopt;
}

size_t CsvTable::requireColumn(const std::string& name) const {
    auto idx = columnIndex(name);
    if (!idx) {
        throw ConfigError(source_ + ": missing required column '" + name + "'");
    }
    return *idx;
}

const std::string& CsvTable::cell(size_t row, size_t column) const {
    const CsvRow& r = rows_.at(row);
    return column < r.size() ? r[column] : kEmptyCell;
}

} // namespace nonorec
