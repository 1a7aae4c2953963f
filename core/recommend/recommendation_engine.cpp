#include "recommend/recommendation_engine.hpp"
#include <algorithm>

namespace nonorec {

const char* toString(Order order) {
    switch (order) {
        case Order::XP:       return "XP";
        case Order::XPBySize: return "XP/Size";
    }
    return "unknown";
}

const char* toString(Filter filter) {
    switch (filter) {
        case Filter::All:              return "all";
        case Filter::TrueNonogramOnly: return "true nonogram only";
    }
    return "unknown";
}

double orderKey(const PuzzleRecord& record, Order order) {
    switch (order) {
        case Order::XP:       return static_cast<double>(record.xp);
        case Order::XPBySize: return record.scorePerSize();
    }
    return 0.0;
}

bool isRecentlyDone(const PuzzleRecord& record, Timestamp now,
                    const RecommendConfig& config) {
    Timestamp cutoff = now - config.recent_window;
    return !(record.last_done < cutoff);
}

std::vector<PuzzleRecord> recommend(const std::vector<PuzzleRecord>& records,
                                    Order order,
                                    Filter filter,
                                    Timestamp now,
                                    const RecommendConfig& config) {
    std::vector<PuzzleRecord> result;
    result.reserve(records.size());

    for (const auto& record : records) {
        if (isRecentlyDone(record, now, config)) continue;
        if (filter == Filter::TrueNonogramOnly &&
            record.difficulty != PuzzleDifficulty::TrueNonogram) {
            continue;
        }
        result.push_back(record);
    }

    std::stable_sort(result.begin(), result.end(),
        [order](const PuzzleRecord& a, const PuzzleRecord& b) {
            return orderKey(a, order) > orderKey(b, order);
        });

    return result;
}

} // namespace nonorec
