#include "session/interactive_session.hpp"
#include "common/log.hpp"
#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>

namespace nonorec {

namespace {

struct ViewSpec {
    const char* label;
    PuzzleCategory source;
    Order order;
    Filter filter;
};

const ViewSpec kViews[] = {
    {"color (XP)",              PuzzleCategory::Color,      Order::XP,       Filter::All},
    {"color (XP/Size)",         PuzzleCategory::Color,      Order::XPBySize, Filter::All},
    {"B&W (XP)",                PuzzleCategory::BlackWhite, Order::XP,       Filter::All},
    {"B&W (XP/Size)",           PuzzleCategory::BlackWhite, Order::XPBySize, Filter::All},
    {"true nonogram (XP)",      PuzzleCategory::BlackWhite, Order::XP,       Filter::TrueNonogramOnly},
    {"true nonogram (XP/Size)", PuzzleCategory::BlackWhite, Order::XPBySize, Filter::TrueNonogramOnly},
};

constexpr int kLabelWidth = 25;
constexpr int kNameWidth = 50;

// Serves both the const and non-const lookups.
template <typename Catalog>
auto findByName(Catalog& catalog, const std::string& name) -> decltype(&catalog.front()) {
    for (auto& p : catalog) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

} // namespace

std::string formatView(const RecommendationView& view) {
    std::ostringstream oss;
    oss << "Best " << std::left << std::setw(kLabelWidth) << view.label
        << " (" << std::right << std::setw(4) << view.eligible
        << "/" << std::setw(4) << view.total << " eligible): ";

    if (!view.best) {
        oss << "NONE";
        return oss.str();
    }

    const PuzzleRecord& p = *view.best;
    oss << std::left << std::setw(kNameWidth) << p.name
        << ", XP:" << p.xp;
    if (view.order == Order::XPBySize) {
        oss << ", XP/Size:" << std::fixed << std::setprecision(2) << p.scorePerSize();
    }
    oss << ", Size: " << p.size() << " (" << p.dimensions() << ")";
    return oss.str();
}

InteractiveSession::InteractiveSession(std::vector<PuzzleRecord> colors,
                                       std::vector<PuzzleRecord> bws,
                                       CompletionLedger ledger,
                                       RecommendConfig config,
                                       std::istream& in,
                                       std::ostream& out,
                                       ClockFn clock)
    : colors_(std::move(colors)),
      bws_(std::move(bws)),
      ledger_(std::move(ledger)),
      config_(std::move(config)),
      in_(in),
      out_(out),
      clock_(std::move(clock)) {}

std::vector<RecommendationView> InteractiveSession::views() const {
    Timestamp now = clock_();
    std::vector<RecommendationView> result;

    for (const auto& spec : kViews) {
        const auto& source = spec.source == PuzzleCategory::Color ? colors_ : bws_;
        auto ranked = recommend(source, spec.order, spec.filter, now, config_);

        RecommendationView view;
        view.label = spec.label;
        view.eligible = ranked.size();
        view.total = source.size();
        view.order = spec.order;
        if (!ranked.empty()) view.best = ranked.front();
        result.push_back(std::move(view));
    }
    return result;
}

void InteractiveSession::display() {
    out_ << "\n";
    for (const auto& view : views()) {
        out_ << formatView(view) << "\n";
    }
    out_ << "Enter Puzzle Name to mark as done:" << std::endl;
}

StepOutcome InteractiveSession::step() {
    display();

    std::string line;
    if (!std::getline(in_, line)) return StepOutcome::EndOfInput;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) return StepOutcome::Ignored;

    if (!markDone(line)) {
        out_ << "Puzzle not found." << std::endl;
        return StepOutcome::NotFound;
    }
    out_ << "Marked '" << line << "' as done." << std::endl;
    return StepOutcome::Updated;
}

void InteractiveSession::run() {
    while (step() != StepOutcome::EndOfInput) {
    }
    NONOREC_LOG_DEBUG("Input closed, leaving session");
}

bool InteractiveSession::markDone(const std::string& name) {
    PuzzleRecord* puzzle = findMutable(name);
    if (!puzzle) return false;

    Timestamp now = clock_();
    puzzle->last_done = now;
    ledger_.markDone(puzzle->name, now, config_.ledgerPath());
    NONOREC_LOG_INFO("Marked %s as done", puzzle->name.c_str());
    return true;
}

const PuzzleRecord* InteractiveSession::find(const std::string& name) const {
    if (const PuzzleRecord* p = findByName(colors_, name)) return p;
    return findByName(bws_, name);
}

PuzzleRecord* InteractiveSession::findMutable(const std::string& name) {
    if (PuzzleRecord* p = findByName(colors_, name)) return p;
    return findByName(bws_, name);
}

} // namespace nonorec
