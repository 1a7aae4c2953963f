#include "recommend/recommend_config.hpp"
#include <filesystem>

namespace nonorec {

namespace fs = std::filesystem;

std::string RecommendConfig::catalogPath(PuzzleCategory category) const {
    const std::string& file =
        category == PuzzleCategory::Color ? color_catalog_file : bw_catalog_file;
    return (fs::path(data_directory) / file).string();
}

std::string RecommendConfig::ledgerPath() const {
    return (fs::path(data_directory) / ledger_file).string();
}

} // namespace nonorec
