#pragma once

#include "catalog/puzzle.hpp"
#include "recommend/recommend_config.hpp"
#include <vector>

namespace nonorec {

enum class Order {
    XP,         // experience reward
    XPBySize    // experience per unit of size
};

enum class Filter {
    All,
    TrueNonogramOnly
};

const char* toString(Order order);
const char* toString(Filter filter);

/// Sort key of a record under `order`; higher is better.
double orderKey(const PuzzleRecord& record, Order order);

/// True if the record was completed within the window before `now`.
bool isRecentlyDone(const PuzzleRecord& record, Timestamp now,
                    const RecommendConfig& config);

/// Recommendation engine: drops recently completed puzzles, applies the
/// filter, then stable-sorts descending by the order key. Returns the
/// whole ranked sequence; the first element is the recommendation.
std::vector<PuzzleRecord> recommend(const std::vector<PuzzleRecord>& records,
                                    Order order,
                                    Filter filter,
                                    Timestamp now,
                                    const RecommendConfig& config);

} // namespace nonorec
