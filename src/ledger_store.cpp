#include "paperdesk/ledger_store.hpp"

#include <algorithm>
#include "json_fields.hpp"
#include "paperdesk/util.hpp"

namespace paperdesk {

using json_fields::get_string;

LedgerStore::LedgerStore(std::size_t activity_log_capacity)
    : activity_log_capacity_(std::max<std::size_t>(1, activity_log_capacity)) {}

void LedgerStore::seed_defaults() {
    prices_ = {
        {"AAPL", 210.0},
        {"TSLA", 185.0},
        {"NVDA", 125.0},
        {"MSFT", 420.0},
        {"BTCUSD", 45000.0},
        {"ETHUSD", 2500.0},
    };

    PredictionMarket recession;
    recession.market_id = "poly-us-recession-2026";
    recession.question = "Will the US enter recession in 2026?";
    recession.outcomes = {{"YES", 0.42}, {"NO", 0.58}};
    recession.source = "seed";

    PredictionMarket btc;
    btc.market_id = "poly-btc-150k-2026";
    btc.question = "Will BTC touch 150k before 2027?";
    btc.outcomes = {{"YES", 0.35}, {"NO", 0.65}};
    btc.source = "seed";

    markets_[recession.market_id] = recession;
    markets_[btc.market_id] = btc;
}

std::optional<std::string> LedgerStore::resolve(const std::string& identifier) const {
    std::string ident = trim(identifier);
    if (ident.empty()) return std::nullopt;
    if (accounts_.count(ident)) return ident;
    auto it = name_to_id_.find(ident);
    if (it != name_to_id_.end() && accounts_.count(it->second)) return it->second;
    return std::nullopt;
}

std::string LedgerStore::resolve_or_empty(const std::string& identifier) const {
    auto resolved = resolve(identifier);
    return resolved ? *resolved : std::string();
}

std::optional<std::string> LedgerStore::resolve_api_key(const std::string& api_key) const {
    auto it = key_to_agent_.find(trim(api_key));
    if (it == key_to_agent_.end() || !accounts_.count(it->second)) return std::nullopt;
    return it->second;
}

std::optional<std::string> LedgerStore::api_key_for(const std::string& account_id) const {
    auto it = agent_keys_.find(account_id);
    if (it == agent_keys_.end()) return std::nullopt;
    return it->second;
}

Account* LedgerStore::find_account(const std::string& account_id) {
    auto it = accounts_.find(account_id);
    return it != accounts_.end() ? &it->second : nullptr;
}

const Account* LedgerStore::find_account(const std::string& account_id) const {
    auto it = accounts_.find(account_id);
    return it != accounts_.end() ? &it->second : nullptr;
}

void LedgerStore::insert_account(Account account) {
    std::string id = account.id;
    if (!accounts_.count(id)) account_order_.push_back(id);
    accounts_[id] = std::move(account);
}

Result<Registration> LedgerStore::create_account(const std::string& display_name, double starting_cash,
                                                 bool is_test) {
    std::string name = trim(display_name);
    if (!is_valid_agent_name(name)) return ErrorCode::InvalidAgentName;
    if (name_to_id_.count(name)) return ErrorCode::NameAlreadyExists;

    Account account;
    account.id = new_uuid();
    account.display_name = name;
    account.cash = starting_cash;
    account.is_test = is_test;
    account.registered_at = utc_now_iso8601();

    Registration registration{account.id, name, new_api_key()};
    name_to_id_[name] = account.id;
    agent_keys_[account.id] = registration.api_key;
    key_to_agent_[registration.api_key] = account.id;
    insert_account(std::move(account));

    record_event("agent_registered", registration.account_id,
                 Json{{"initial_cash", starting_cash}, {"is_test", is_test}});
    return registration;
}

Status LedgerStore::rename(const std::string& account_id, const std::string& new_name) {
    Account* account = find_account(account_id);
    if (!account) return ErrorCode::AgentNotFound;

    std::string name = trim(new_name);
    if (!is_valid_agent_name(name)) return ErrorCode::InvalidAgentName;

    std::string old_name = account->display_name;
    if (name == old_name) return Done{};

    auto owner = name_to_id_.find(name);
    if (owner != name_to_id_.end() && owner->second != account_id) return ErrorCode::NameAlreadyExists;

    auto old_entry = name_to_id_.find(old_name);
    if (old_entry != name_to_id_.end() && old_entry->second == account_id) name_to_id_.erase(old_entry);
    name_to_id_[name] = account_id;
    account->display_name = name;

    auto pending = pending_by_agent_.find(old_name);
    if (pending != pending_by_agent_.end()) {
        std::string token = pending->second;
        pending_by_agent_.erase(pending);
        pending_by_agent_[name] = token;
    }

    for (auto& [token, challenge] : registration_challenges_) {
        (void)token;
        if (get_string(challenge, "agent_uuid") == account_id || get_string(challenge, "agent_id") == old_name) {
            challenge["agent_uuid"] = account_id;
            challenge["agent_id"] = name;
        }
    }

    // Records that cached the old name: match by id, or by name when the
    // record predates ids.
    auto rewrite_author = [&](Json& record) {
        std::string record_id = get_string(record, "agent_uuid");
        if (record_id == account_id || (record_id.empty() && get_string(record, "agent_id") == old_name)) {
            record["agent_uuid"] = account_id;
            record["agent_id"] = name;
        }
    };
    for (auto& post : forum_posts_) rewrite_author(post);
    for (auto& comment : forum_comments_) rewrite_author(comment);

    for (auto& event : activity_log_) {
        if (event.account_id == account_id || (event.account_id.empty() && event.display_name == old_name)) {
            event.account_id = account_id;
            event.display_name = name;
        }
        if (event.details.is_object()) {
            if (get_string(event.details, "target_agent_uuid") == account_id ||
                get_string(event.details, "target_agent_id") == old_name) {
                event.details["target_agent_uuid"] = account_id;
                event.details["target_agent_id"] = name;
            }
        }
    }
    return Done{};
}

std::string LedgerStore::follow_target_id(const Json& target) {
    if (target.is_string()) return trim(target.get<std::string>());
    if (target.is_object()) {
        for (const char* key : {"agent_uuid", "target_agent_uuid"}) {
            std::string value = get_string(target, key);
            if (!value.empty()) return value;
        }
    }
    return "";
}

Result<PurgeSummary> LedgerStore::purge(const std::string& account_id, const std::string& identifier) {
    const Account* account = find_account(account_id);
    if (!account) return ErrorCode::AgentNotFound;

    PurgeSummary summary;
    summary.account_id = account_id;
    summary.display_name = account->display_name;

    std::set<std::string> aliases = {account_id, account->display_name, trim(identifier)};
    aliases.erase("");
    auto is_alias = [&](const std::string& value) { return !value.empty() && aliases.count(value) > 0; };

    // Resolve record authors before the name index is touched.
    auto author_of = [&](const std::string& record_id, const std::string& record_name) {
        if (!record_id.empty()) return record_id;
        return resolve_or_empty(record_name);
    };

    std::set<std::string> removed_keys;
    for (auto it = agent_keys_.begin(); it != agent_keys_.end();) {
        if (it->first == account_id) {
            removed_keys.insert(it->second);
            it = agent_keys_.erase(it);
        } else {
            ++it;
        }
    }
    summary.removed_agent_keys = removed_keys.size();

    for (auto it = key_to_agent_.begin(); it != key_to_agent_.end();) {
        if (removed_keys.count(it->first) || it->second == account_id) {
            removed_keys.insert(it->first);
            it = key_to_agent_.erase(it);
            ++summary.removed_key_to_agent;
        } else {
            ++it;
        }
    }

    // Activity, posts and comments before the name index so name-only legacy
    // records still resolve to this account.
    std::deque<ActivityEvent> retained_events;
    for (auto& event : activity_log_) {
        if (author_of(event.account_id, event.display_name) == account_id || is_alias(event.display_name)) {
            ++summary.removed_activity_events;
            continue;
        }
        retained_events.push_back(std::move(event));
    }
    activity_log_ = std::move(retained_events);

    std::set<long long> removed_post_ids;
    Json retained_posts = Json::array();
    for (auto& post : forum_posts_) {
        std::string author = author_of(get_string(post, "agent_uuid"), get_string(post, "agent_id"));
        if (author == account_id || is_alias(get_string(post, "agent_id"))) {
            ++summary.removed_forum_posts;
            removed_post_ids.insert(json_fields::get_int(post, "post_id"));
            continue;
        }
        retained_posts.push_back(std::move(post));
    }
    forum_posts_ = std::move(retained_posts);

    Json retained_comments = Json::array();
    for (auto& comment : forum_comments_) {
        std::string author = author_of(get_string(comment, "agent_uuid"), get_string(comment, "agent_id"));
        if (author == account_id || is_alias(get_string(comment, "agent_id")) ||
            removed_post_ids.count(json_fields::get_int(comment, "post_id"))) {
            ++summary.removed_forum_comments;
            continue;
        }
        retained_comments.push_back(std::move(comment));
    }
    forum_comments_ = std::move(retained_comments);

    for (auto it = name_to_id_.begin(); it != name_to_id_.end();) {
        if (is_alias(it->first) || it->second == account_id) {
            it = name_to_id_.erase(it);
            ++summary.removed_name_mappings;
        } else {
            ++it;
        }
    }

    std::set<std::string> removed_tokens;
    for (auto it = registration_challenges_.begin(); it != registration_challenges_.end();) {
        if (get_string(it->second, "agent_uuid") == account_id || is_alias(get_string(it->second, "agent_id"))) {
            removed_tokens.insert(it->first);
            it = registration_challenges_.erase(it);
        } else {
            ++it;
        }
    }
    summary.removed_registration_challenges = removed_tokens.size();

    for (auto it = pending_by_agent_.begin(); it != pending_by_agent_.end();) {
        if (is_alias(it->first) || removed_tokens.count(it->second)) {
            it = pending_by_agent_.erase(it);
            ++summary.removed_pending_challenges;
        } else {
            ++it;
        }
    }

    for (auto it = registration_by_api_key_.begin(); it != registration_by_api_key_.end();) {
        if (removed_keys.count(it->first) || removed_tokens.count(it->second)) {
            it = registration_by_api_key_.erase(it);
            ++summary.removed_registration_by_api_key;
        } else {
            ++it;
        }
    }

    auto outgoing = following_.find(account_id);
    if (outgoing != following_.end()) {
        summary.removed_following_outgoing = outgoing->second.size();
        following_.erase(outgoing);
    }
    for (auto& [follower, targets] : following_) {
        (void)follower;
        auto before = targets.size();
        targets.erase(std::remove_if(targets.begin(), targets.end(),
                                     [&](const Json& target) { return follow_target_id(target) == account_id; }),
                      targets.end());
        summary.removed_following_incoming += before - targets.size();
    }

    accounts_.erase(account_id);
    account_order_.erase(std::remove(account_order_.begin(), account_order_.end(), account_id),
                         account_order_.end());
    return summary;
}

const ActivityEvent& LedgerStore::record_event(const std::string& type, const std::string& account_id,
                                               Json details, const std::string& display_name) {
    ActivityEvent event;
    event.id = next_activity_id_++;
    event.type = type;
    event.account_id = resolve_or_empty(account_id);
    if (event.account_id.empty()) event.account_id = trim(account_id);
    event.display_name = trim(display_name);
    if (event.display_name.empty() && !event.account_id.empty()) {
        if (const Account* account = find_account(event.account_id)) event.display_name = account->display_name;
    }
    event.details = details.is_object() ? std::move(details) : Json::object();
    event.created_at = utc_now_iso8601();

    activity_log_.push_back(std::move(event));
    while (activity_log_.size() > activity_log_capacity_) activity_log_.pop_front();
    return activity_log_.back();
}

std::optional<double> LedgerStore::last_price(const std::string& symbol) const {
    auto it = prices_.find(symbol);
    if (it == prices_.end() || !(it->second > 0.0)) return std::nullopt;
    return it->second;
}

void LedgerStore::set_last_price(const std::string& symbol, double price) {
    prices_[symbol] = price;
}

PredictionMarket* LedgerStore::find_market(const std::string& market_id) {
    auto it = markets_.find(market_id);
    return it != markets_.end() ? &it->second : nullptr;
}

const PredictionMarket* LedgerStore::find_market(const std::string& market_id) const {
    auto it = markets_.find(market_id);
    return it != markets_.end() ? &it->second : nullptr;
}

bool LedgerStore::upsert_market(const PredictionMarket& incoming) {
    if (incoming.market_id.empty()) return false;
    auto it = markets_.find(incoming.market_id);
    if (it == markets_.end()) {
        PredictionMarket fresh = incoming;
        fresh.resolved = false;
        fresh.winning_outcome.clear();
        markets_.emplace(fresh.market_id, std::move(fresh));
        return true;
    }

    PredictionMarket& existing = it->second;
    if (existing.resolved) return false;

    bool changed = false;
    if (!incoming.question.empty() && incoming.question != existing.question) {
        existing.question = incoming.question;
        changed = true;
    }
    if (!incoming.outcomes.empty() && incoming.outcomes != existing.outcomes) {
        existing.outcomes = incoming.outcomes;
        changed = true;
    }
    if (!incoming.source.empty() && incoming.source != existing.source) {
        existing.source = incoming.source;
        changed = true;
    }
    return changed;
}

void LedgerStore::add_registration_challenge(const std::string& claim_token, Json challenge) {
    registration_challenges_[claim_token] = std::move(challenge);
}

void LedgerStore::set_pending_registration(const std::string& display_name, const std::string& claim_token) {
    pending_by_agent_[display_name] = claim_token;
}

void LedgerStore::link_registration_key(const std::string& api_key, const std::string& claim_token) {
    registration_by_api_key_[api_key] = claim_token;
}

void LedgerStore::follow(const std::string& follower_id, Json target) {
    auto& targets = following_[follower_id];
    std::string target_id = follow_target_id(target);
    for (const auto& existing : targets) {
        if (!target_id.empty() && follow_target_id(existing) == target_id) return;
    }
    targets.push_back(std::move(target));
}

void LedgerStore::add_forum_post(Json post) {
    forum_posts_.push_back(std::move(post));
}

void LedgerStore::add_forum_comment(Json comment) {
    forum_comments_.push_back(std::move(comment));
}

} // namespace paperdesk
