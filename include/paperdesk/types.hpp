#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace paperdesk {

// Insertion-ordered JSON, so snapshots keep account registration order.
using Json = nlohmann::ordered_json;

enum class Side {
    Buy,
    Sell
};

const char* to_string(Side side);
std::optional<Side> parse_side(const std::string& text);

struct PositionRecord {
    double quantity = 0.0;
    double avg_cost = 0.0;
    double multiplier = 1.0;   // contract size the position was opened with
};

// symbol -> position. A symbol is present iff its quantity is nonzero, and
// quantity and average cost always travel together.
class PositionBook {
public:
    using Map = std::map<std::string, PositionRecord>;

    const PositionRecord* find(const std::string& symbol) const;
    double quantity(const std::string& symbol) const;

    // Stores the position, or removes the symbol when quantity is zero.
    // Without a multiplier the open position keeps its own, and a new one
    // takes the symbol's contract multiplier.
    void set(const std::string& symbol, double quantity, double avg_cost,
             std::optional<double> multiplier = std::nullopt);
    void erase(const std::string& symbol);

    bool empty() const { return records_.empty(); }
    std::size_t size() const { return records_.size(); }
    Map::const_iterator begin() const { return records_.begin(); }
    Map::const_iterator end() const { return records_.end(); }

private:
    Map records_;
};

struct PolyHolding {
    double shares = 0.0;
    double cost_basis = 0.0;
};

// market_id -> outcome -> holding. Zero-share outcomes and empty markets are
// never stored.
class PolyBook {
public:
    using Outcomes = std::map<std::string, PolyHolding>;
    using Map = std::map<std::string, Outcomes>;

    const Outcomes* find(const std::string& market_id) const;
    double shares(const std::string& market_id, const std::string& outcome) const;

    void add(const std::string& market_id, const std::string& outcome, double shares, double cost);
    void set(const std::string& market_id, const std::string& outcome, double shares, double cost_basis);
    bool erase(const std::string& market_id);

    bool has_open_position() const;
    bool empty() const { return markets_.empty(); }
    Map::const_iterator begin() const { return markets_.begin(); }
    Map::const_iterator end() const { return markets_.end(); }

private:
    Map markets_;
};

struct Account {
    std::string id;
    std::string display_name;
    double cash = 0.0;
    PositionBook positions;
    double realized_pnl = 0.0;
    PolyBook poly;
    double poly_realized_pnl = 0.0;
    bool blocked = false;
    bool is_test = false;
    std::string registered_at;

    // Profile fields owned by outer layers (avatar, description, origin...).
    // Carried through snapshots untouched.
    Json profile = Json::object();
};

struct PredictionMarket {
    std::string market_id;
    std::string question;
    std::map<std::string, double> outcomes;
    bool resolved = false;
    std::string winning_outcome;
    std::string source;
};

struct ActivityEvent {
    std::int64_t id = 0;
    std::string type;
    std::string account_id;
    std::string display_name;
    Json details = Json::object();
    std::string created_at;
};

struct RiskLimits {
    double max_abs_position_per_symbol = 100.0;
    double max_daily_loss = 5000.0;
    bool allow_short_selling = false;
};

struct Fill {
    std::string order_id;
    std::string account_id;
    std::string symbol;
    Side side = Side::Buy;
    double quantity = 0.0;
    double fill_price = 0.0;
    double multiplier = 1.0;
    double notional = 0.0;
    double realized_pnl = 0.0;     // P&L crystallized by this fill
    double position_after = 0.0;
    double cash_after = 0.0;
    bool blocked_after = false;     // daily-loss limit breached by this fill
    std::string price_source = "caller";
};

struct Bet {
    std::string account_id;
    std::string market_id;
    std::string outcome;
    double amount = 0.0;
    double odds = 0.0;
    double shares = 0.0;
};

struct Payout {
    std::string account_id;
    std::string display_name;
    double payout = 0.0;
};

struct Resolution {
    std::string market_id;
    std::string winning_outcome;
    std::vector<Payout> payouts;
};

struct PositionValue {
    std::string symbol;
    double quantity = 0.0;
    double last_price = 0.0;
    double market_value = 0.0;
};

struct Valuation {
    double cash = 0.0;
    double stock_value = 0.0;
    double crypto_value = 0.0;
    double poly_value = 0.0;
    double equity = 0.0;
    double return_pct = 0.0;
    std::vector<PositionValue> positions;   // sorted by |market_value| desc
    bool has_open_position = false;
};

struct LeaderboardRow {
    std::string account_id;
    std::string display_name;
    Valuation valuation;
    bool has_stock_trade_history = false;
    bool leaderboard_eligible = false;
};

struct EquityPoint {
    std::string time;
    double equity = 0.0;
};

struct Registration {
    std::string account_id;
    std::string display_name;
    std::string api_key;
};

struct PurgeSummary {
    std::string account_id;
    std::string display_name;
    std::size_t removed_agent_keys = 0;
    std::size_t removed_key_to_agent = 0;
    std::size_t removed_name_mappings = 0;
    std::size_t removed_registration_challenges = 0;
    std::size_t removed_pending_challenges = 0;
    std::size_t removed_registration_by_api_key = 0;
    std::size_t removed_following_outgoing = 0;
    std::size_t removed_following_incoming = 0;
    std::size_t removed_forum_posts = 0;
    std::size_t removed_forum_comments = 0;
    std::size_t removed_activity_events = 0;
};

} // namespace paperdesk
