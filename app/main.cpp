// nonorec: recommends the next nonogram to solve.
//
// Usage: nonorec [data-directory]
//
// The data directory (default "config") holds Colors.csv, BWs.csv and
// LastDonePuzzles.csv. Type a puzzle name to mark it done; Ctrl-D exits.

#include "catalog/record_loader.hpp"
#include "common/log.hpp"
#include "ledger/completion_ledger.hpp"
#include "recommend/recommend_config.hpp"
#include "session/interactive_session.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    using namespace nonorec;

    if (argc > 2) {
        std::cerr << "usage: " << argv[0] << " [data-directory]\n";
        return 2;
    }

    RecommendConfig config;
    if (argc == 2) config.data_directory = argv[1];

    try {
        CompletionLedger ledger = CompletionLedger::load(config.ledgerPath());
        auto colors = loadCatalog(config.catalogPath(PuzzleCategory::Color),
                                  PuzzleCategory::Color, config.catalog, ledger);
        auto bws = loadCatalog(config.catalogPath(PuzzleCategory::BlackWhite),
                               PuzzleCategory::BlackWhite, config.catalog, ledger);

        InteractiveSession session(std::move(colors), std::move(bws), std::move(ledger),
                                   config, std::cin, std::cout);
        session.run();
    } catch (const std::exception& e) {
        NONOREC_LOG_ERROR("%s", e.what());
        return 1;
    }
    return 0;
}
