#include "catalog/record_loader.hpp"
#include "common/log.hpp"

namespace nonorec {

RowDecoder makeCatalogDecoder(const CatalogLayout& layout) {
    RowDecoder decoder;
    decoder.addRule(layout.name_column, [](const std::string& cell, PuzzleRecord& r) {
        r.name = cell;
    });
    decoder.addRule(layout.xp_column, [](const std::string& cell, PuzzleRecord& r) {
        r.xp = extractApproxInt(cell);
    });
    decoder.addRule(layout.size_column, [](const std::string& cell, PuzzleRecord& r) {
        auto [w, h] = extractDimensions(cell);
        r.width = w;
        r.height = h;
    });
    std::string marker = layout.true_nonogram_marker;
    decoder.addRule(layout.type_column, [marker](const std::string& cell, PuzzleRecord& r) {
        r.difficulty = extractDifficulty(cell, marker);
    });
    return decoder;
}

std::vector<PuzzleRecord> decodeCatalog(const CsvTable& table,
                                        PuzzleCategory category,
                                        const CatalogLayout& layout,
                                        const CompletionLedger& ledger) {
    PuzzleRecord prototype;
    prototype.category = category;

    auto records = makeCatalogDecoder(layout).decode(table, prototype);
    for (auto& record : records) {
        record.last_done = ledger.lastDone(record.name, kNeverDone);
    }
    return records;
}

std::vector<PuzzleRecord> loadCatalog(const std::string& path,
                                      PuzzleCategory category,
                                      const CatalogLayout& layout,
                                      const CompletionLedger& ledger) {
    NONOREC_LOG_INFO("Reading csv file : %s", path.c_str());
    auto records = decodeCatalog(CsvTable::readFile(path), category, layout, ledger);
    NONOREC_LOG_INFO("Loaded %zu %s puzzles", records.size(), toString(category));
    return records;
}

std::vector<PuzzleRecord> loadCatalog(std::istream& in,
                                      const std::string& source,
                                      PuzzleCategory category,
                                      const CatalogLayout& layout,
                                      const CompletionLedger& ledger) {
    return decodeCatalog(CsvTable::parse(in, source), category, layout, ledger);
}

} // namespace nonorec
