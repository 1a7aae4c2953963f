#pragma once

#include "catalog/puzzle.hpp"
#include "ledger/completion_ledger.hpp"
#include "recommend/recommend_config.hpp"
#include "recommend/recommendation_engine.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace nonorec {

/// Top recommendation of one ranking view.
struct RecommendationView {
    std::string label;
    size_t eligible = 0;                // records left after filtering
    size_t total = 0;                   // records in the source catalog
    std::optional<PuzzleRecord> best;   // empty when nothing is eligible
    Order order = Order::XP;
};

/// One printed line: "Best <label> (<eligible>/<total> eligible): ..." or NONE.
std::string formatView(const RecommendationView& view);

enum class StepOutcome {
    Ignored,     // empty line
    NotFound,    // no puzzle with that name
    Updated,     // puzzle marked done and ledger saved
    EndOfInput
};

// ─── Interactive Session ───────────────────────────────────────
// Owns both catalogs and the ledger. Each step prints the six views,
// reads one line, and marks the named puzzle done if it exists.

class InteractiveSession {
public:
    using ClockFn = std::function<Timestamp()>;

    InteractiveSession(std::vector<PuzzleRecord> colors,
                       std::vector<PuzzleRecord> bws,
                       CompletionLedger ledger,
                       RecommendConfig config,
                       std::istream& in,
                       std::ostream& out,
                       ClockFn clock = nowSeconds);

    /// color (XP), color (XP/Size), B&W (XP), B&W (XP/Size),
    /// true nonogram (XP), true nonogram (XP/Size).
    std::vector<RecommendationView> views() const;

    void display();

    /// Display, then read and handle one line.
    StepOutcome step();

    /// Step until the input stream ends.
    void run();

    /// Set last_done on the named puzzle and persist the ledger.
    /// Returns false if no catalog has that name.
    bool markDone(const std::string& name);

    /// Color catalog first, then B&W. nullptr if absent.
    const PuzzleRecord* find(const std::string& name) const;

    const std::vector<PuzzleRecord>& colors() const { return colors_; }
    const std::vector<PuzzleRecord>& bws() const { return bws_; }
    const CompletionLedger& ledger() const { return ledger_; }

private:
    PuzzleRecord* findMutable(const std::string& name);

    std::vector<PuzzleRecord> colors_;
    std::vector<PuzzleRecord> bws_;
    CompletionLedger ledger_;
    RecommendConfig config_;
    std::istream& in_;
    std::ostream& out_;
    ClockFn clock_;
};

} // namespace nonorec
