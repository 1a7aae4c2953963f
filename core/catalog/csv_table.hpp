#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace nonorec {

using CsvRow = std::vector<std::string>;

// ─── CSV Table ─────────────────────────────────────────────────
// A header row plus data rows, read and written as comma-separated
// text. Double-quoted fields may contain commas, quotes ("") and
// line breaks.

class CsvTable {
public:
    CsvTable() = default;
    explicit CsvTable(CsvRow header) : header_(std::move(header)) {}

    /// Parse a whole table. Throws ConfigError if there is no header row.
    /// `source` names the input in error messages.
    static CsvTable parse(std::istream& in, const std::string& source = "<stream>");

    /// Throws IoError if the file cannot be opened.
    static CsvTable readFile(const std::string& path);

    void write(std::ostream& out) const;

    /// Overwrites `path`. Throws IoError on open or write failure.
    void writeFile(const std::string& path) const;

    const CsvRow& header() const { return header_; }
    const std::vector<CsvRow>& rows() const { return rows_; }
    size_t rowCount() const { return rows_.size(); }
    size_t columnCount() const { return header_.size(); }
    const std::string& source() const { return source_; }

    std::optional<size_t> columnIndex(const std::string& name) const;

    /// Like columnIndex(), but a missing column is a ConfigError.
    size_t requireColumn(const std::string& name) const;

    /// Cell text; empty when the row is shorter than `column`.
    const std::string& cell(size_t row, size_t column) const;

    void addRow(CsvRow row) { rows_.push_back(std::move(row)); }

private:
    CsvRow header_;
    std::vector<CsvRow> rows_;
    std::string source_;
};

} // namespace nonorec
