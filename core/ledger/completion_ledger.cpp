#include "ledger/completion_ledger.hpp"
#include "catalog/csv_table.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

namespace nonorec {

namespace {

CompletionLedger fromTable(const CsvTable& table) {
    size_t name_col = table.requireColumn(CompletionLedger::kNameColumn);
    size_t done_col = table.requireColumn(CompletionLedger::kLastDoneColumn);

    CompletionLedger ledger;
    for (size_t row = 0; row < table.rowCount(); row++) {
        const std::string& name = table.cell(row, name_col);
        const std::string& text = table.cell(row, done_col);
        auto when = parseTimestamp(text);
        if (!when) {
            throw ConfigError(table.source() + ": row " + std::to_string(row + 1) +
                              ": invalid LastDone timestamp '" + text + "'");
        }
        ledger.upsert(name, *when);
    }

    if (ledger.size() != table.rowCount()) {
        NONOREC_LOG_WARN("%s: merged %zu duplicate ledger rows",
                         table.source().c_str(), table.rowCount() - ledger.size());
    }
    return ledger;
}

CsvTable toTable(const std::vector<CompletionEntry>& entries) {
    CsvTable table({CompletionLedger::kNameColumn, CompletionLedger::kLastDoneColumn});
    for (const auto& entry : entries) {
        table.addRow({entry.name, formatTimestamp(entry.last_done)});
    }
    return table;
}

} // namespace

CompletionLedger CompletionLedger::load(const std::string& path) {
    NONOREC_LOG_INFO("Reading csv file : %s", path.c_str());
    CompletionLedger ledger = fromTable(CsvTable::readFile(path));
    NONOREC_LOG_DEBUG("Loaded %zu ledger entries", ledger.size());
    return ledger;
}

CompletionLedger CompletionLedger::parse(std::istream& in, const std::string& source) {
    return fromTable(CsvTable::parse(in, source));
}

Timestamp CompletionLedger::lastDone(const std::string& name, Timestamp fallback) const {
    auto it = index_.find(name);
    if (it == index_.end()) return fallback;
    return entries_[it->second].last_done;
}

void CompletionLedger::upsert(const std::string& name, Timestamp when) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].last_done = when;
        return;
    }
    index_[name] = entries_.size();
    entries_.push_back({name, when});
}

void CompletionLedger::write(std::ostream& out) const {
    toTable(entries_).write(out);
}

void CompletionLedger::save(const std::string& path) const {
    toTable(entries_).writeFile(path);
}

void CompletionLedger::markDone(const std::string& name, Timestamp when,
                                const std::string& path) {
    upsert(name, when);
    save(path);
    NONOREC_LOG_DEBUG("Ledger saved to %s (%zu entries)", path.c_str(), entries_.size());
}

} // namespace nonorec
