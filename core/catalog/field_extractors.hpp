#pragma once

#include "catalog/csv_table.hpp"
#include "catalog/puzzle.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace nonorec {

// ─── Column Reference ──────────────────────────────────────────
// Names a catalog column either by header text or by zero-based position.

struct ColumnRef {
    std::string name;       // empty = refer by position
    size_t position = 0;

    static ColumnRef byName(std::string name) {
        ColumnRef ref;
        ref.name = std::move(name);
        return ref;
    }

    static ColumnRef byPosition(size_t position) {
        ColumnRef ref;
        ref.position = position;
        return ref;
    }

    bool isPositional() const { return name.empty(); }

    std::string describe() const;

    /// Column index in `table`. Throws ConfigError if it does not exist.
    size_t resolve(const CsvTable& table) const;
};

// ─── Extraction Rules ──────────────────────────────────────────
// Each rule throws ConfigError on a value it cannot decode.

/// Integer that may carry the approximation marker '~' (e.g. "~50").
int extractApproxInt(const std::string& cell);

/// "WxH" → {W, H}. Exactly two positive integers separated by 'x'.
std::pair<int, int> extractDimensions(const std::string& cell);

PuzzleDifficulty extractDifficulty(const std::string& cell, const std::string& marker);

// ─── Row Decoder ───────────────────────────────────────────────
// Declarative list of (column, extractor) pairs. Decoding a table
// resolves every column first, then applies the rules in order to
// a copy of the prototype record for each row.

class RowDecoder {
public:
    using Extractor = std::function<void(const std::string& cell, PuzzleRecord& out)>;

    void addRule(ColumnRef column, Extractor extract);

    std::vector<PuzzleRecord> decode(const CsvTable& table,
                                     const PuzzleRecord& prototype) const;

    size_t ruleCount() const { return rules_.size(); }

private:
    std::vector<std::pair<ColumnRef, Extractor>> rules_;
};

} // namespace nonorec
