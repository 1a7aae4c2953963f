#pragma once

#include "catalog/puzzle.hpp"
#include "catalog/record_loader.hpp"
#include "common/timestamp.hpp"
#include <string>

namespace nonorec {

/// Recommendation and data-file configuration.
struct RecommendConfig {
    /// Puzzles completed more recently than this are not recommended.
    std::chrono::seconds recent_window = days(31);

    CatalogLayout catalog;

    std::string data_directory = "config";
    std::string color_catalog_file = "Colors.csv";
    std::string bw_catalog_file = "BWs.csv";
    std::string ledger_file = "LastDonePuzzles.csv";

    std::string catalogPath(PuzzleCategory category) const;
    std::string ledgerPath() const;
};

} // namespace nonorec
