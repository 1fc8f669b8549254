#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "errors.hpp"
#include "types.hpp"

namespace paperdesk {

class SnapshotCodec;

// In-memory ledger: accounts, their name/key indices, the capped activity
// log, last-known prices, prediction markets, and the collaborator data that
// references accounts (pending registrations, follow graph, forum records).
// Not thread safe; LedgerService serializes access.
class LedgerStore {
public:
    explicit LedgerStore(std::size_t activity_log_capacity = 5000);

    // Price table and prediction markets a fresh deployment starts with.
    void seed_defaults();

    // Account identity
    std::optional<std::string> resolve(const std::string& identifier) const;
    std::optional<std::string> resolve_api_key(const std::string& api_key) const;
    std::optional<std::string> api_key_for(const std::string& account_id) const;

    Account* find_account(const std::string& account_id);
    const Account* find_account(const std::string& account_id) const;

    // Registration order.
    const std::vector<std::string>& account_ids() const { return account_order_; }
    std::size_t account_count() const { return account_order_.size(); }

    Result<Registration> create_account(const std::string& display_name, double starting_cash,
                                        bool is_test = false);
    Status rename(const std::string& account_id, const std::string& new_name);

    // Removes the account and every reference to it. identifier is an extra
    // alias (the name the caller used) that legacy records may carry.
    Result<PurgeSummary> purge(const std::string& account_id, const std::string& identifier = "");

    // Activity log
    const ActivityEvent& record_event(const std::string& type, const std::string& account_id,
                                      Json details = Json::object(),
                                      const std::string& display_name = "");
    const std::deque<ActivityEvent>& activity_log() const { return activity_log_; }
    std::int64_t next_activity_id() const { return next_activity_id_; }
    std::size_t activity_log_capacity() const { return activity_log_capacity_; }

    // Last-known prices
    std::optional<double> last_price(const std::string& symbol) const;
    void set_last_price(const std::string& symbol, double price);
    const std::map<std::string, double>& prices() const { return prices_; }

    // Prediction markets
    PredictionMarket* find_market(const std::string& market_id);
    const PredictionMarket* find_market(const std::string& market_id) const;
    // Inserts or refreshes a market from feed data. Resolved markets are
    // immutable and left untouched; returns whether anything changed.
    bool upsert_market(const PredictionMarket& incoming);
    const std::map<std::string, PredictionMarket>& markets() const { return markets_; }

    // Collaborator data
    void add_registration_challenge(const std::string& claim_token, Json challenge);
    void set_pending_registration(const std::string& display_name, const std::string& claim_token);
    void link_registration_key(const std::string& api_key, const std::string& claim_token);
    void follow(const std::string& follower_id, Json target);
    void add_forum_post(Json post);
    void add_forum_comment(Json comment);

    const std::map<std::string, Json>& registration_challenges() const { return registration_challenges_; }
    const std::map<std::string, std::string>& pending_by_agent() const { return pending_by_agent_; }
    const std::map<std::string, std::string>& registration_by_api_key() const { return registration_by_api_key_; }
    const std::map<std::string, std::vector<Json>>& following() const { return following_; }
    const Json& forum_posts() const { return forum_posts_; }
    const Json& forum_comments() const { return forum_comments_; }

private:
    friend class SnapshotCodec;

    void insert_account(Account account);
    std::string resolve_or_empty(const std::string& identifier) const;
    // Account id a follow target entry points at (string id or object form).
    static std::string follow_target_id(const Json& target);

    std::size_t activity_log_capacity_;

    std::unordered_map<std::string, Account> accounts_;
    std::vector<std::string> account_order_;
    std::map<std::string, std::string> name_to_id_;
    std::map<std::string, std::string> agent_keys_;     // account id -> api key
    std::map<std::string, std::string> key_to_agent_;   // api key -> account id

    std::deque<ActivityEvent> activity_log_;
    std::int64_t next_activity_id_ = 1;

    std::map<std::string, double> prices_;
    std::map<std::string, PredictionMarket> markets_;

    std::map<std::string, Json> registration_challenges_;
    std::map<std::string, std::string> pending_by_agent_;
    std::map<std::string, std::string> registration_by_api_key_;
    std::map<std::string, std::vector<Json>> following_;
    Json forum_posts_ = Json::array();
    Json forum_comments_ = Json::array();

    // Top-level snapshot keys owned by outer layers, written back unchanged.
    Json passthrough_ = Json::object();
};

} // namespace paperdesk
