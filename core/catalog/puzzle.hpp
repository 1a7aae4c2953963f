#pragma once

#include "common/timestamp.hpp"
#include <algorithm>
#include <string>

namespace nonorec {

enum class PuzzleCategory { Color, BlackWhite };

enum class PuzzleDifficulty { TrueNonogram, OtherNonogram };

inline const char* toString(PuzzleCategory c) {
    return c == PuzzleCategory::Color ? "color" : "B&W";
}

inline const char* toString(PuzzleDifficulty d) {
    return d == PuzzleDifficulty::TrueNonogram ? "true nonogram" : "other nonogram";
}

// ─── Puzzle Record ─────────────────────────────────────────────
// One row of a puzzle catalog, merged with its ledger entry.

struct PuzzleRecord {
    std::string name;
    int xp = 0;
    int width = 0;
    int height = 0;
    PuzzleDifficulty difficulty = PuzzleDifficulty::OtherNonogram;
    PuzzleCategory category = PuzzleCategory::Color;
    Timestamp last_done = kNeverDone;

    /// Shorter of the two dimensions.
    int size() const { return std::min(width, height); }

    double scorePerSize() const {
        return static_cast<double>(xp) / size();
    }

    std::string dimensions() const {
        return std::to_string(width) + "x" + std::to_string(height);
    }
};

} // namespace nonorec
