#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "ledger_store.hpp"
#include "types.hpp"

namespace paperdesk {

// Binary-outcome betting: cash buys outcome shares at the current odds, and a
// resolved market pays one unit per winning share exactly once.
class PredictionEngine {
public:
    explicit PredictionEngine(std::shared_ptr<spdlog::logger> logger = nullptr);

    // Outcome names are matched case-insensitively (stored upper case).
    // market may be null, which reads as market_not_found.
    Result<Bet> place_bet(Account& account, const PredictionMarket* market,
                          const std::string& outcome, double amount) const;

    // Marks the market resolved, pays every holder of the winning outcome and
    // clears the market from every account's book, winners and losers alike.
    Result<Resolution> resolve_market(LedgerStore& store, const std::string& market_id,
                                      const std::string& winning_outcome) const;

    static std::string normalize_outcome(const std::string& outcome);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace paperdesk
