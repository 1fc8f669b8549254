#include "paperdesk/snapshot_codec.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include "json_fields.hpp"
#include "paperdesk/util.hpp"

namespace paperdesk {

using json_fields::get_array;
using json_fields::get_bool;
using json_fields::get_double;
using json_fields::get_int;
using json_fields::get_object;
using json_fields::get_string;
using json_fields::string_of;

namespace {

const std::set<std::string> kAccountFields = {
    "agent_uuid", "display_name", "agent_id", "cash", "registered_at", "is_test",
    "positions", "avg_cost", "contract_multiplier", "realized_pnl", "poly_positions", "poly_cost_basis",
    "poly_realized_pnl", "blocked",
};

const std::set<std::string> kDocumentFields = {
    "version", "accounts", "agent_name_to_id", "agent_name_to_uuid", "agent_keys", "key_to_agent",
    "registration_challenges", "pending_by_agent", "registration_by_api_key", "agent_following",
    "forum_posts", "forum_comments", "stock_prices", "poly_markets", "activity_log",
    "next_activity_id", "test_agents",
};

Json encode_account(const Account& account) {
    Json positions = Json::object();
    Json avg_cost = Json::object();
    Json multipliers = Json::object();
    for (const auto& [symbol, record] : account.positions) {
        positions[symbol] = record.quantity;
        avg_cost[symbol] = record.avg_cost;
        multipliers[symbol] = record.multiplier;
    }

    Json poly_positions = Json::object();
    Json poly_cost_basis = Json::object();
    for (const auto& [market_id, outcomes] : account.poly) {
        for (const auto& [outcome, holding] : outcomes) {
            poly_positions[market_id][outcome] = holding.shares;
            poly_cost_basis[market_id][outcome] = holding.cost_basis;
        }
    }

    Json out = Json::object();
    out["agent_uuid"] = account.id;
    out["display_name"] = account.display_name;
    out["cash"] = account.cash;
    out["registered_at"] = account.registered_at;
    out["is_test"] = account.is_test;
    out["positions"] = std::move(positions);
    out["avg_cost"] = std::move(avg_cost);
    out["contract_multiplier"] = std::move(multipliers);
    out["realized_pnl"] = account.realized_pnl;
    out["poly_positions"] = std::move(poly_positions);
    out["poly_cost_basis"] = std::move(poly_cost_basis);
    out["poly_realized_pnl"] = account.poly_realized_pnl;
    out["blocked"] = account.blocked;
    if (account.profile.is_object()) {
        for (const auto& entry : account.profile.items()) {
            if (!kAccountFields.count(entry.key())) out[entry.key()] = entry.value();
        }
    }
    return out;
}

Json encode_market(const PredictionMarket& market) {
    Json outcomes = Json::object();
    for (const auto& [outcome, odds] : market.outcomes) outcomes[outcome] = odds;

    Json out = Json::object();
    out["market_id"] = market.market_id;
    out["question"] = market.question;
    out["outcomes"] = std::move(outcomes);
    out["resolved"] = market.resolved;
    out["winning_outcome"] = market.winning_outcome;
    if (!market.source.empty()) out["source"] = market.source;
    return out;
}

Json encode_event(const ActivityEvent& event) {
    Json out = Json::object();
    out["id"] = event.id;
    out["type"] = event.type;
    out["agent_uuid"] = event.account_id;
    out["agent_id"] = event.display_name;
    out["details"] = event.details;
    out["created_at"] = event.created_at;
    return out;
}

template <typename Map>
Json encode_string_map(const Map& map) {
    Json out = Json::object();
    for (const auto& [key, value] : map) out[key] = value;
    return out;
}

// Positions and cost basis, with the zero-residue and matching-basis
// invariants restored.
Account decode_account(const std::string& account_id, const Json& payload,
                       const std::map<std::string, double>& prices, std::vector<std::string>& repairs) {
    Account account;
    account.id = account_id;
    account.display_name = get_string(payload, "display_name");
    account.cash = get_double(payload, "cash");
    account.registered_at = get_string(payload, "registered_at");
    account.is_test = get_bool(payload, "is_test");
    account.realized_pnl = get_double(payload, "realized_pnl");
    account.poly_realized_pnl = get_double(payload, "poly_realized_pnl");
    account.blocked = get_bool(payload, "blocked");

    const Json& avg_cost = get_object(payload, "avg_cost");
    const Json& multipliers = get_object(payload, "contract_multiplier");
    std::set<std::string> held;
    for (const auto& entry : get_object(payload, "positions").items()) {
        std::string symbol = trim(entry.key());
        if (symbol.empty() || !entry.value().is_number()) continue;
        double quantity = entry.value().get<double>();
        if (quantity == 0.0) {
            repairs.push_back("dropped zero position " + symbol + " for " + account_id);
            continue;
        }
        held.insert(symbol);

        double avg = 0.0;
        auto basis = avg_cost.find(entry.key());
        if (basis != avg_cost.end() && basis->is_number()) {
            avg = basis->get<double>();
        } else {
            auto px = prices.find(symbol);
            avg = (px != prices.end() && px->second > 0.0) ? px->second : 0.0;
            repairs.push_back("filled missing avg_cost " + symbol + " for " + account_id);
        }
        // Snapshots written before multipliers were stored fall back to the
        // symbol's contract multiplier.
        std::optional<double> multiplier;
        auto stored = multipliers.find(entry.key());
        if (stored != multipliers.end() && stored->is_number() && stored->get<double>() >= 1.0) {
            multiplier = stored->get<double>();
        }
        account.positions.set(symbol, quantity, avg, multiplier);
    }
    for (const auto& entry : avg_cost.items()) {
        if (!held.count(trim(entry.key()))) {
            repairs.push_back("dropped orphan avg_cost " + entry.key() + " for " + account_id);
        }
    }

    const Json& cost_basis = get_object(payload, "poly_cost_basis");
    for (const auto& market : get_object(payload, "poly_positions").items()) {
        if (!market.value().is_object()) continue;
        const Json& market_basis = get_object(cost_basis, market.key().c_str());
        for (const auto& outcome : market.value().items()) {
            if (!outcome.value().is_number()) continue;
            double shares = outcome.value().get<double>();
            if (shares == 0.0) {
                repairs.push_back("dropped zero poly holding " + market.key() + "/" + outcome.key());
                continue;
            }
            account.poly.set(market.key(), outcome.key(), shares,
                             get_double(market_basis, outcome.key().c_str()));
        }
    }

    Json profile = Json::object();
    for (const auto& entry : payload.items()) {
        if (!kAccountFields.count(entry.key())) profile[entry.key()] = entry.value();
    }
    account.profile = std::move(profile);
    return account;
}

PredictionMarket decode_market(const std::string& key, const Json& payload) {
    PredictionMarket market;
    market.market_id = get_string(payload, "market_id");
    if (market.market_id.empty()) market.market_id = trim(key);
    market.question = get_string(payload, "question");
    for (const auto& entry : get_object(payload, "outcomes").items()) {
        if (entry.value().is_number()) market.outcomes[entry.key()] = entry.value().get<double>();
    }
    market.resolved = get_bool(payload, "resolved");
    market.winning_outcome = get_string(payload, "winning_outcome");
    market.source = get_string(payload, "source");
    return market;
}

// Identity a legacy account record should carry: its own UUID, else a
// UUID-shaped map key, else a fresh one.
std::string account_identity(const std::string& key, const Json& payload,
                             const SnapshotCodec::IdGenerator& new_id) {
    std::string id = get_string(payload, "agent_uuid");
    if (is_uuid_like(id)) return id;
    if (is_uuid_like(key)) return key;
    return new_id();
}

} // namespace

int SnapshotCodec::version_of(const Json& document) {
    return static_cast<int>(get_int(document, "version", 0));
}

Json SnapshotCodec::migrate_v0_to_v5(Json document, const IdGenerator& new_id) {
    if (!document.is_object()) document = Json::object();

    Json accounts = Json::object();
    Json name_index = Json::object();
    for (const auto& entry : get_object(document, "accounts").items()) {
        if (!entry.value().is_object()) continue;
        std::string key = trim(entry.key());
        Json payload = entry.value();

        std::string id = account_identity(key, payload, new_id);
        std::string name = get_string(payload, "display_name");
        if (name.empty()) name = get_string(payload, "agent_id");
        if (name.empty()) name = key;
        if (name.empty()) name = "agent-" + id.substr(0, 8);

        payload["agent_uuid"] = id;
        payload["display_name"] = name;
        payload.erase("agent_id");
        if (name_index.find(name) == name_index.end()) name_index[name] = id;
        accounts[id] = std::move(payload);
    }

    document["accounts"] = std::move(accounts);
    if (document.find("agent_name_to_uuid") == document.end()) {
        document["agent_name_to_uuid"] = std::move(name_index);
    }
    document["version"] = 5;
    return document;
}

Json SnapshotCodec::migrate_v5_to_v6(Json document) {
    if (!document.is_object()) document = Json::object();

    auto legacy_index = document.find("agent_name_to_uuid");
    if (legacy_index != document.end()) {
        Json index = *legacy_index;
        document.erase("agent_name_to_uuid");
        if (document.find("agent_name_to_id") == document.end()) document["agent_name_to_id"] = std::move(index);
    }

    std::set<std::string> test_agents;
    for (const auto& identifier : get_array(document, "test_agents")) {
        std::string value = string_of(identifier);
        if (!value.empty()) test_agents.insert(value);
    }
    document.erase("test_agents");

    auto accounts = document.find("accounts");
    if (accounts != document.end() && accounts->is_object()) {
        for (auto& entry : accounts->items()) {
            Json& payload = entry.value();
            if (!payload.is_object()) continue;

            if (test_agents.count(trim(entry.key())) || test_agents.count(get_string(payload, "agent_uuid")) ||
                test_agents.count(get_string(payload, "display_name"))) {
                payload["is_test"] = true;
            }

            Json basis = get_object(payload, "poly_cost_basis");
            for (const auto& market : get_object(payload, "poly_positions").items()) {
                if (!market.value().is_object()) continue;
                for (const auto& outcome : market.value().items()) {
                    Json& market_basis = basis[market.key()];
                    if (!market_basis.is_object()) market_basis = Json::object();
                    if (market_basis.find(outcome.key()) == market_basis.end()) market_basis[outcome.key()] = 0.0;
                }
            }
            payload["poly_cost_basis"] = std::move(basis);
        }
    }

    document["version"] = 6;
    return document;
}

Json SnapshotCodec::migrate(Json document, const IdGenerator& new_id, LoadReport* report) {
    int version = version_of(document);
    if (report) report->source_version = version;

    if (version < 5) {
        document = migrate_v0_to_v5(std::move(document), new_id);
        if (report) report->migrated = true;
    }
    if (version < 6) {
        document = migrate_v5_to_v6(std::move(document));
        if (report) report->migrated = true;
    }
    return document;
}

Json SnapshotCodec::encode(const LedgerStore& store) {
    Json accounts = Json::object();
    for (const auto& id : store.account_order_) {
        auto it = store.accounts_.find(id);
        if (it != store.accounts_.end()) accounts[id] = encode_account(it->second);
    }

    Json following = Json::object();
    for (const auto& [follower, targets] : store.following_) following[follower] = Json(targets);

    Json challenges = Json::object();
    for (const auto& [token, challenge] : store.registration_challenges_) challenges[token] = challenge;

    Json markets = Json::object();
    for (const auto& [market_id, market] : store.markets_) markets[market_id] = encode_market(market);

    Json activity = Json::array();
    for (const auto& event : store.activity_log_) activity.push_back(encode_event(event));

    Json document = Json::object();
    document["version"] = kVersion;
    document["accounts"] = std::move(accounts);
    document["agent_name_to_id"] = encode_string_map(store.name_to_id_);
    document["agent_keys"] = encode_string_map(store.agent_keys_);
    document["key_to_agent"] = encode_string_map(store.key_to_agent_);
    document["registration_challenges"] = std::move(challenges);
    document["pending_by_agent"] = encode_string_map(store.pending_by_agent_);
    document["registration_by_api_key"] = encode_string_map(store.registration_by_api_key_);
    document["agent_following"] = std::move(following);
    document["forum_posts"] = store.forum_posts_;
    document["forum_comments"] = store.forum_comments_;
    document["stock_prices"] = encode_string_map(store.prices_);
    document["poly_markets"] = std::move(markets);
    document["activity_log"] = std::move(activity);
    document["next_activity_id"] = store.next_activity_id_;
    for (const auto& entry : store.passthrough_.items()) {
        if (!kDocumentFields.count(entry.key())) document[entry.key()] = entry.value();
    }
    return document;
}

LoadReport SnapshotCodec::decode(const Json& raw, LedgerStore& store, const IdGenerator& new_id) {
    LoadReport report;
    Json document = migrate(raw, new_id, &report);
    auto& repairs = report.repairs;

    LedgerStore loaded(store.activity_log_capacity_);
    loaded.prices_ = store.prices_;
    loaded.markets_ = store.markets_;

    // Prices first: missing cost basis is filled from them.
    if (document.find("stock_prices") != document.end() && document["stock_prices"].is_object()) {
        loaded.prices_.clear();
        for (const auto& entry : document["stock_prices"].items()) {
            if (entry.value().is_number()) loaded.prices_[trim(entry.key())] = entry.value().get<double>();
        }
    }
    if (document.find("poly_markets") != document.end() && document["poly_markets"].is_object()) {
        loaded.markets_.clear();
        for (const auto& entry : document["poly_markets"].items()) {
            if (!entry.value().is_object()) continue;
            PredictionMarket market = decode_market(entry.key(), entry.value());
            if (!market.market_id.empty()) loaded.markets_[market.market_id] = std::move(market);
        }
    }

    // Accounts, with display names made unique in document order. From
    // version 5 on the map key is the account id and is kept as stored.
    for (const auto& entry : get_object(document, "accounts").items()) {
        if (!entry.value().is_object()) continue;
        std::string id = trim(entry.key());
        std::string stored_id = get_string(entry.value(), "agent_uuid");
        if (id.empty()) id = stored_id;
        if (id.empty()) {
            id = new_id();
            repairs.push_back("assigned id " + id + " to unkeyed account record");
        } else if (!stored_id.empty() && stored_id != id) {
            repairs.push_back("aligned agent_uuid of " + id + " with its key");
        }
        if (loaded.accounts_.count(id)) {
            repairs.push_back("dropped duplicate account record " + id);
            continue;
        }
        Account account = decode_account(id, entry.value(), loaded.prices_, repairs);

        std::string name = account.display_name.empty() ? "agent-" + id.substr(0, 8) : account.display_name;
        std::string base = name;
        for (int suffix = 2; loaded.name_to_id_.count(name); ++suffix) {
            name = base + "_" + std::to_string(suffix);
        }
        if (name != account.display_name) {
            repairs.push_back("renamed " + id + " to " + name);
            account.display_name = name;
        }
        loaded.name_to_id_[name] = id;
        loaded.insert_account(std::move(account));
    }

    auto resolve = [&loaded](const std::string& identifier) { return loaded.resolve_or_empty(identifier); };

    // API keys, normalized to ids and reconciled in both directions.
    for (const auto& entry : get_object(document, "agent_keys").items()) {
        std::string id = resolve(entry.key());
        std::string token = string_of(entry.value());
        if (!id.empty() && !token.empty()) loaded.agent_keys_[id] = token;
    }
    for (const auto& entry : get_object(document, "key_to_agent").items()) {
        std::string token = trim(entry.key());
        std::string id = resolve(string_of(entry.value()));
        if (!id.empty() && !token.empty()) loaded.key_to_agent_[token] = id;
    }
    for (const auto& [id, token] : loaded.agent_keys_) {
        if (!loaded.key_to_agent_.count(token)) {
            loaded.key_to_agent_[token] = id;
            repairs.push_back("restored key_to_agent entry for " + id);
        }
    }
    for (const auto& [token, id] : loaded.key_to_agent_) {
        if (!loaded.agent_keys_.count(id)) {
            loaded.agent_keys_[id] = token;
            repairs.push_back("restored agent_keys entry for " + id);
        }
    }

    for (const auto& entry : get_object(document, "registration_challenges").items()) {
        loaded.registration_challenges_[entry.key()] = entry.value();
    }
    for (const auto& entry : get_object(document, "pending_by_agent").items()) {
        loaded.pending_by_agent_[entry.key()] = string_of(entry.value());
    }
    for (const auto& entry : get_object(document, "registration_by_api_key").items()) {
        loaded.registration_by_api_key_[entry.key()] = string_of(entry.value());
    }

    // Follow graph: ids only, unresolvable and duplicate targets dropped.
    for (const auto& entry : get_object(document, "agent_following").items()) {
        std::string follower = resolve(entry.key());
        if (follower.empty() || !entry.value().is_array()) {
            repairs.push_back("dropped follow list of " + entry.key());
            continue;
        }
        std::vector<Json> targets;
        std::set<std::string> seen;
        for (const auto& target : entry.value()) {
            std::string identifier;
            if (target.is_object()) {
                for (const char* key : {"agent_uuid", "target_agent_uuid", "agent_id", "target_agent_id"}) {
                    identifier = get_string(target, key);
                    if (!identifier.empty()) break;
                }
            } else {
                identifier = string_of(target);
            }
            std::string target_id = resolve(identifier);
            if (target_id.empty() || seen.count(target_id)) continue;
            seen.insert(target_id);

            if (target.is_object()) {
                Json normalized = target;
                normalized["agent_uuid"] = target_id;
                targets.push_back(std::move(normalized));
            } else {
                targets.push_back(target_id);
            }
        }
        if (Json(targets) != entry.value()) repairs.push_back("normalized follow list of " + follower);
        auto& merged = loaded.following_[follower];
        for (auto& target : targets) {
            std::string target_id = LedgerStore::follow_target_id(target);
            bool duplicate = std::any_of(merged.begin(), merged.end(), [&](const Json& existing) {
                return LedgerStore::follow_target_id(existing) == target_id;
            });
            if (!duplicate) merged.push_back(std::move(target));
        }
    }

    // Authored records: backfill the id by name, refresh the cached name.
    auto backfill_author = [&](Json& record, const char* kind) {
        std::string id = get_string(record, "agent_uuid");
        if (id.empty()) {
            id = resolve(get_string(record, "agent_id"));
            if (!id.empty()) {
                record["agent_uuid"] = id;
                repairs.push_back(std::string("backfilled ") + kind + " author " + id);
            }
        }
        const Account* author = loaded.find_account(id);
        if (author && get_string(record, "agent_id") != author->display_name) {
            record["agent_id"] = author->display_name;
            repairs.push_back(std::string("refreshed ") + kind + " author name " + id);
        }
    };

    for (const auto& post : get_array(document, "forum_posts")) {
        if (!post.is_object()) continue;
        Json record = post;
        backfill_author(record, "post");
        loaded.forum_posts_.push_back(std::move(record));
    }
    for (const auto& comment : get_array(document, "forum_comments")) {
        if (!comment.is_object()) continue;
        Json record = comment;
        backfill_author(record, "comment");
        loaded.forum_comments_.push_back(std::move(record));
    }

    std::int64_t max_event_id = 0;
    for (const auto& raw_event : get_array(document, "activity_log")) {
        if (!raw_event.is_object()) continue;
        Json record = raw_event;
        backfill_author(record, "event");

        ActivityEvent event;
        event.id = get_int(record, "id");
        event.type = get_string(record, "type");
        event.account_id = get_string(record, "agent_uuid");
        event.display_name = get_string(record, "agent_id");
        const Json& details = get_object(record, "details");
        event.details = details;
        event.created_at = get_string(record, "created_at");
        max_event_id = std::max(max_event_id, event.id);
        loaded.activity_log_.push_back(std::move(event));
    }
    while (loaded.activity_log_.size() > loaded.activity_log_capacity_) loaded.activity_log_.pop_front();

    std::int64_t next_id = get_int(document, "next_activity_id", 0);
    loaded.next_activity_id_ = next_id > 0 ? next_id : max_event_id + 1;

    for (const auto& entry : document.items()) {
        if (!kDocumentFields.count(entry.key())) loaded.passthrough_[entry.key()] = entry.value();
    }

    store = std::move(loaded);
    return report;
}

} // namespace paperdesk
