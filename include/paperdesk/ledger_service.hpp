#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "execution_engine.hpp"
#include "feeds.hpp"
#include "ledger_store.hpp"
#include "prediction_engine.hpp"
#include "snapshot_codec.hpp"
#include "state_db.hpp"
#include "types.hpp"
#include "valuation.hpp"

namespace paperdesk {

struct MarketListing {
    std::vector<PredictionMarket> markets;
    std::string source;   // "live" or "cache"
};

struct MarkToMarketStatus {
    std::chrono::seconds interval{0};
    std::string last_attempt_at;   // empty until the first attempt
    std::string last_success_at;
};

// Owns the ledger and serializes every operation on it behind one reentrant
// lock. Mutations persist synchronously before the lock is released; a
// failed save rolls the ledger back to the last committed document and
// reports persistence_failed. Feed calls are made without holding the lock.
class LedgerService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit LedgerService(LedgerConfig config,
                           std::shared_ptr<PriceFeed> price_feed = nullptr,
                           std::shared_ptr<MarketFeed> market_feed = nullptr,
                           Clock clock = nullptr);

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    // Holds the ledger lock for a caller-side sequence of operations.
    std::unique_lock<std::recursive_mutex> acquire() const;

    // Accounts
    Result<Registration> register_agent(const std::string& display_name, bool is_test = false);
    Status rename(const std::string& identifier, const std::string& new_name);
    std::optional<std::string> resolve(const std::string& identifier) const;
    std::optional<std::string> resolve_api_key(const std::string& api_key) const;
    std::optional<Account> account(const std::string& identifier) const;
    Result<PurgeSummary> purge(const std::string& identifier);

    // Orders
    // Fills at a caller-supplied price. multiplier defaults to the open
    // position's, else the symbol's contract multiplier; a different one is
    // rejected while a position is open.
    Result<Fill> execute_order(const std::string& identifier, const std::string& symbol, Side side,
                               double quantity, double fill_price,
                               std::optional<double> multiplier = std::nullopt);
    // Fetches the price first, falling back to the cached one.
    Result<Fill> submit_order(const std::string& identifier, const std::string& symbol, Side side,
                              double quantity);
    Status set_price(const std::string& symbol, double price);
    std::optional<double> last_price(const std::string& symbol) const;

    // Prediction markets
    MarketListing list_markets(std::size_t limit);
    Result<Bet> place_bet(const std::string& identifier, const std::string& market_id,
                          const std::string& outcome, double amount);
    Result<Resolution> resolve_market(const std::string& market_id, const std::string& winning_outcome);

    // Valuation
    Result<Valuation> value(const std::string& identifier) const;
    // limit 0 means every row.
    std::vector<LeaderboardRow> leaderboard(std::size_t limit = 0, bool eligible_only = true) const;
    std::pair<std::optional<std::size_t>, std::size_t> rank_of(const std::string& identifier) const;
    Result<std::vector<EquityPoint>> equity_curve(const std::string& identifier, std::size_t max_points = 80) const;

    // Re-prices held symbols and held markets when the interval has elapsed
    // (or when forced). Returns false when skipped by the interval gate.
    bool refresh_mark_to_market(bool force = false);
    MarkToMarketStatus mark_to_market_status() const;

    // Point-in-time copy of the whole ledger.
    LedgerStore snapshot() const;
    const LoadReport& load_report() const { return load_report_; }
    const LedgerConfig& config() const { return config_; }

private:
    void load();
    void load_snapshot();
    void reset_after_corrupt_snapshot(const std::string& payload, const std::string& reason);
    bool save_locked();
    // Restores the ledger to the last committed document.
    void rollback_locked();
    // Best-effort feed refresh of the market list; returns the fetched ids.
    std::optional<std::vector<std::string>> refresh_markets(std::size_t limit);
    Result<Fill> execute_locked(const std::string& account_id, const std::string& symbol, Side side,
                                double quantity, double fill_price, std::optional<double> contract_multiplier,
                                const std::string& price_source);
    std::string now_iso8601() const;

    LedgerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<PriceFeed> price_feed_;
    std::shared_ptr<MarketFeed> market_feed_;
    Clock clock_;

    mutable std::recursive_mutex mutex_;
    LedgerStore store_;
    Json committed_;   // what the database holds, or the ledger as loaded
    StateDB db_;
    LoadReport load_report_;

    ExecutionEngine execution_;
    PredictionEngine prediction_;
    ValuationService valuation_;

    mutable std::mutex mark_to_market_mutex_;
    std::optional<std::chrono::system_clock::time_point> last_refresh_attempt_;
    std::optional<std::chrono::system_clock::time_point> last_refresh_success_;
};

} // namespace paperdesk
