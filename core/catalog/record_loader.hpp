#pragma once

#include "catalog/field_extractors.hpp"
#include "catalog/puzzle.hpp"
#include "ledger/completion_ledger.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace nonorec {

/// Where each field lives in a catalog export, and the marker that
/// identifies a true nonogram in the type column.
struct CatalogLayout {
    ColumnRef name_column = ColumnRef::byName("Puzzle ID:Puzzle Name");
    ColumnRef xp_column   = ColumnRef::byPosition(4);
    ColumnRef size_column = ColumnRef::byName("Size");
    ColumnRef type_column = ColumnRef::byName("Puzzle<br>type");
    std::string true_nonogram_marker = "True_nonogram_icon.png";
};

/// Build the decoder for one catalog category.
RowDecoder makeCatalogDecoder(const CatalogLayout& layout);

/// Decode a parsed catalog table. Each record's last_done comes from
/// the ledger (kNeverDone when absent).
std::vector<PuzzleRecord> decodeCatalog(const CsvTable& table,
                                        PuzzleCategory category,
                                        const CatalogLayout& layout,
                                        const CompletionLedger& ledger);

/// Load a catalog file. Throws IoError / ConfigError.
std::vector<PuzzleRecord> loadCatalog(const std::string& path,
                                      PuzzleCategory category,
                                      const CatalogLayout& layout,
                                      const CompletionLedger& ledger);

std::vector<PuzzleRecord> loadCatalog(std::istream& in,
                                      const std::string& source,
                                      PuzzleCategory category,
                                      const CatalogLayout& layout,
                                      const CompletionLedger& ledger);

} // namespace nonorec
