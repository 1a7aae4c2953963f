#pragma once

#include "common/timestamp.hpp"
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace nonorec {

struct CompletionEntry {
    std::string name;
    Timestamp last_done = kNeverDone;
};

// ─── Completion Ledger ─────────────────────────────────────────
// Puzzle name → last time it was completed. Persisted as a
// two-column CSV table (Name, LastDone) that is rewritten whole on
// every change. Holds at most one entry per name.

class CompletionLedger {
public:
    static constexpr const char* kNameColumn = "Name";
    static constexpr const char* kLastDoneColumn = "LastDone";

    CompletionLedger() = default;

    /// Load from a ledger file. Throws IoError if it cannot be read,
    /// ConfigError on a missing column or unparseable timestamp.
    static CompletionLedger load(const std::string& path);

    /// Load from a stream. Rows repeating a name overwrite the earlier entry.
    static CompletionLedger parse(std::istream& in, const std::string& source = "<stream>");

    /// Stored timestamp for `name`, or `fallback` when there is none.
    Timestamp lastDone(const std::string& name, Timestamp fallback = kNeverDone) const;

    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    /// Append a new entry, or overwrite the timestamp of the existing one.
    void upsert(const std::string& name, Timestamp when);

    /// Rewrite the whole table to `path`. Throws IoError on failure.
    void save(const std::string& path) const;

    void write(std::ostream& out) const;

    /// upsert() then save().
    void markDone(const std::string& name, Timestamp when, const std::string& path);

    const std::vector<CompletionEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<CompletionEntry> entries_;              // file order
    std::unordered_map<std::string, size_t> index_;     // name → entries_ slot
};

} // namespace nonorec
