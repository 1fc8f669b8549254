#include "paperdesk/ledger_service.hpp"

#include <algorithm>
#include <map>
#include <set>
#include "paperdesk/logging.hpp"
#include "paperdesk/symbols.hpp"
#include "paperdesk/util.hpp"

namespace paperdesk {

LedgerService::LedgerService(LedgerConfig config, std::shared_ptr<PriceFeed> price_feed,
                             std::shared_ptr<MarketFeed> market_feed, Clock clock)
    : config_(std::move(config)),
      logger_(make_logger("ledger_service", config_.log_level)),
      price_feed_(std::move(price_feed)),
      market_feed_(std::move(market_feed)),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      store_(config_.activity_log_capacity),
      db_(expand_user_path(config_.state_db_path), logger_),
      execution_(config_.risk, logger_),
      prediction_(logger_),
      valuation_(config_.starting_cash) {
    load();
}

std::unique_lock<std::recursive_mutex> LedgerService::acquire() const {
    return std::unique_lock<std::recursive_mutex>(mutex_);
}

std::string LedgerService::now_iso8601() const {
    return format_iso8601(clock_());
}

void LedgerService::load() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    load_snapshot();
    committed_ = SnapshotCodec::encode(store_);
}

void LedgerService::load_snapshot() {
    store_.seed_defaults();

    if (!db_.open()) {
        logger_->error("State DB {} unavailable; mutations will fail until it can be written", db_.path());
    }

    std::optional<std::string> payload;
    if (db_.is_open()) {
        auto stored = db_.load();
        if (!stored) {
            // The row may still hold a good ledger; never write over it.
            logger_->error("Could not read saved ledger from {}; mutations will fail until restart", db_.path());
            db_.close();
            return;
        }
        payload = std::move(stored.value());
    }

    bool from_legacy = false;
    if (!payload) {
        payload = read_legacy_state_file(expand_user_path(config_.legacy_state_file));
        from_legacy = payload.has_value();
    }
    if (!payload) {
        logger_->info("No saved ledger found; starting fresh");
        return;
    }

    Json document;
    try {
        document = Json::parse(*payload);
    } catch (const Json::parse_error& e) {
        reset_after_corrupt_snapshot(*payload, e.what());
        return;
    }
    if (!document.is_object()) {
        reset_after_corrupt_snapshot(*payload, "snapshot root is not an object");
        return;
    }

    try {
        load_report_ = SnapshotCodec::decode(document, store_, [] { return new_uuid(); });
    } catch (const Json::exception& e) {
        reset_after_corrupt_snapshot(*payload, e.what());
        return;
    }

    for (const auto& repair : load_report_.repairs) {
        logger_->info("Snapshot repair: {}", repair);
    }
    logger_->info("Loaded ledger v{}{}: {} accounts, {} events", load_report_.source_version,
                  from_legacy ? " from legacy file" : "", store_.account_count(), store_.activity_log().size());

    if (load_report_.changed() || from_legacy) {
        if (!save_locked()) logger_->error("Could not re-save migrated ledger to {}", db_.path());
    }
}

void LedgerService::reset_after_corrupt_snapshot(const std::string& payload, const std::string& reason) {
    logger_->error("Saved ledger is unreadable ({}); starting empty", reason);
    store_ = LedgerStore(config_.activity_log_capacity);
    store_.seed_defaults();
    load_report_ = LoadReport();

    // Only overwrite the stored payload once a copy of it is kept.
    if (!db_.quarantine(payload, reason, now_iso8601())) {
        logger_->error("Could not quarantine unreadable ledger payload ({} bytes)", payload.size());
        return;
    }
    if (!save_locked()) logger_->error("Could not replace unreadable ledger in {}", db_.path());
}

bool LedgerService::save_locked() {
    Json document = SnapshotCodec::encode(store_);
    if (!db_.save(document.dump(), now_iso8601())) {
        logger_->error("Failed to persist ledger to {}", db_.path());
        return false;
    }
    committed_ = std::move(document);
    return true;
}

void LedgerService::rollback_locked() {
    SnapshotCodec::decode(committed_, store_, [] { return new_uuid(); });
}

Result<Registration> LedgerService::register_agent(const std::string& display_name, bool is_test) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto registration = store_.create_account(display_name, config_.starting_cash, is_test);
    if (!registration) {
        logger_->warn("Registration of '{}' rejected: {}", display_name, to_string(registration.error()));
        return registration.error();
    }
    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Registered agent {} ({})", registration->display_name, registration->account_id);
    return registration;
}

Status LedgerService::rename(const std::string& identifier, const std::string& new_name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;

    std::string old_name = store_.find_account(*account_id)->display_name;
    if (trim(new_name) == old_name) return Done{};

    Status renamed = store_.rename(*account_id, new_name);
    if (!renamed) {
        logger_->warn("Rename of {} to '{}' rejected: {}", old_name, new_name, to_string(renamed.error()));
        return renamed.error();
    }
    store_.record_event("agent_profile_update", *account_id,
                        Json{{"fields", Json::array({"display_name"})}, {"previous_display_name", old_name}});
    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Renamed {} to {}", old_name, trim(new_name));
    return Done{};
}

std::optional<std::string> LedgerService::resolve(const std::string& identifier) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return store_.resolve(identifier);
}

std::optional<std::string> LedgerService::resolve_api_key(const std::string& api_key) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return store_.resolve_api_key(api_key);
}

std::optional<Account> LedgerService::account(const std::string& identifier) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return std::nullopt;
    return *store_.find_account(*account_id);
}

Result<PurgeSummary> LedgerService::purge(const std::string& identifier) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;

    auto summary = store_.purge(*account_id, identifier);
    if (!summary) return summary.error();

    Json details = {
        {"agent_uuid", summary->account_id},
        {"agent_id", summary->display_name},
        {"removed_agent_keys", summary->removed_agent_keys},
        {"removed_key_to_agent", summary->removed_key_to_agent},
        {"removed_name_mappings", summary->removed_name_mappings},
        {"removed_registration_challenges", summary->removed_registration_challenges},
        {"removed_pending_challenges", summary->removed_pending_challenges},
        {"removed_registration_by_api_key", summary->removed_registration_by_api_key},
        {"removed_following_outgoing", summary->removed_following_outgoing},
        {"removed_following_incoming", summary->removed_following_incoming},
        {"removed_forum_posts", summary->removed_forum_posts},
        {"removed_forum_comments", summary->removed_forum_comments},
        {"removed_activity_events", summary->removed_activity_events},
    };
    store_.record_event("admin_agent_purge", "", std::move(details), "admin");

    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Purged agent {} ({}): {} events, {} posts, {} comments", summary->display_name,
                  summary->account_id, summary->removed_activity_events, summary->removed_forum_posts,
                  summary->removed_forum_comments);
    return summary;
}

Result<Fill> LedgerService::execute_locked(const std::string& account_id, const std::string& symbol, Side side,
                                           double quantity, double fill_price,
                                           std::optional<double> contract_multiplier,
                                           const std::string& price_source) {
    Account* account = store_.find_account(account_id);
    if (!account) return ErrorCode::AgentNotFound;

    // An open position trades at the multiplier it was opened with.
    double multiplier = symbols::contract_multiplier(symbol);
    if (contract_multiplier) {
        multiplier = *contract_multiplier;
    } else if (const PositionRecord* open = account->positions.find(symbol)) {
        multiplier = open->multiplier;
    }

    PriceLookup marks = [this](const std::string& sym) { return store_.last_price(sym); };

    auto fill = execution_.execute_order(*account, symbol, side, quantity, fill_price, multiplier, marks);
    if (!fill) {
        logger_->warn("Order rejected for {}: {} {} {} @ {:.4f}: {}", account->display_name, to_string(side),
                      quantity, symbol, fill_price, to_string(fill.error()));
        // The block survives the rejection.
        if (fill.error() == ErrorCode::MaxDailyLossBreached && !save_locked()) {
            logger_->error("Could not persist block of {}", account->display_name);
        }
        return fill.error();
    }

    fill->order_id = new_uuid();
    fill->price_source = price_source;
    store_.set_last_price(symbol, fill_price);
    store_.record_event("stock_order", account_id,
                        Json{{"order_id", fill->order_id},
                             {"symbol", symbol},
                             {"side", to_string(side)},
                             {"qty", quantity},
                             {"fill_price", fill_price},
                             {"multiplier", multiplier},
                             {"notional", fill->notional},
                             {"realized_pnl", fill->realized_pnl},
                             {"price_source", price_source}});

    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Filled {} {} {} @ {:.4f} for {} (cash ${:.2f})", to_string(side), quantity, symbol, fill_price,
                  fill->account_id, fill->cash_after);
    return fill;
}

Result<Fill> LedgerService::execute_order(const std::string& identifier, const std::string& symbol, Side side,
                                          double quantity, double fill_price, std::optional<double> multiplier) {
    auto normalized = symbols::normalize_symbol(symbol);
    if (!normalized) return normalized.error();

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;

    return execute_locked(*account_id, normalized.value(), side, quantity, fill_price, multiplier, "caller");
}

Result<Fill> LedgerService::submit_order(const std::string& identifier, const std::string& symbol, Side side,
                                         double quantity) {
    auto normalized = symbols::normalize_symbol(symbol);
    if (!normalized) return normalized.error();
    const std::string& sym = normalized.value();

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto account_id = store_.resolve(identifier);
        if (!account_id) return ErrorCode::AgentNotFound;
        if (store_.find_account(*account_id)->blocked) return ErrorCode::AgentBlocked;
    }

    std::optional<double> price;
    std::string source = "live";
    if (price_feed_) {
        auto quote = price_feed_->fetch_price(sym, config_.market_data_timeout);
        if (quote) {
            price = quote->price;
        } else {
            logger_->warn("Price fetch for {} failed: {}", sym, to_string(quote.error()));
        }
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    // The account may have been purged while the lock was released.
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;

    if (!price) {
        price = store_.last_price(sym);
        source = "cache_fallback";
        if (!price) return ErrorCode::MarketDataUnavailable;
    }
    return execute_locked(*account_id, sym, side, quantity, *price, std::nullopt, source);
}

Status LedgerService::set_price(const std::string& symbol, double price) {
    auto normalized = symbols::normalize_symbol(symbol);
    if (!normalized) return normalized.error();
    if (!(price > 0.0)) return ErrorCode::InvalidPrice;

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    store_.set_last_price(normalized.value(), price);
    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Price override {} = {:.4f}", normalized.value(), price);
    return Done{};
}

std::optional<double> LedgerService::last_price(const std::string& symbol) const {
    auto normalized = symbols::normalize_symbol(symbol);
    if (!normalized) return std::nullopt;
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return store_.last_price(normalized.value());
}

std::optional<std::vector<std::string>> LedgerService::refresh_markets(std::size_t limit) {
    if (!market_feed_) return std::nullopt;

    auto fetched = market_feed_->fetch_markets(limit, config_.market_data_timeout);
    if (!fetched) {
        logger_->debug("Market list fetch failed: {}", to_string(fetched.error()));
        return std::nullopt;
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<std::string> ids;
    bool changed = false;
    for (const auto& market : fetched.value()) {
        if (market.market_id.empty()) continue;
        ids.push_back(market.market_id);
        changed = store_.upsert_market(market) || changed;
    }
    if (changed && !save_locked()) {
        logger_->error("Could not persist refreshed market list");
    }
    return ids;
}

MarketListing LedgerService::list_markets(std::size_t limit) {
    MarketListing listing;
    auto ids = refresh_markets(limit);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (ids) {
        listing.source = "live";
        for (const auto& id : *ids) {
            if (const PredictionMarket* market = store_.find_market(id)) listing.markets.push_back(*market);
        }
        return listing;
    }

    listing.source = "cache";
    for (const auto& [id, market] : store_.markets()) {
        (void)id;
        if (limit && listing.markets.size() >= limit) break;
        listing.markets.push_back(market);
    }
    return listing;
}

Result<Bet> LedgerService::place_bet(const std::string& identifier, const std::string& market_id,
                                     const std::string& outcome, double amount) {
    refresh_markets(config_.market_refresh_limit);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;

    Account* account = store_.find_account(*account_id);
    auto bet = prediction_.place_bet(*account, store_.find_market(trim(market_id)), outcome, amount);
    if (!bet) {
        logger_->warn("Bet rejected for {} on {}: {}", account->display_name, market_id, to_string(bet.error()));
        return bet.error();
    }

    store_.record_event("poly_bet", *account_id,
                        Json{{"market_id", bet->market_id},
                             {"outcome", bet->outcome},
                             {"amount", bet->amount},
                             {"shares", bet->shares}});
    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Bet ${:.2f} on {} {} for {} ({:.4f} shares)", bet->amount, bet->market_id, bet->outcome,
                  account->display_name, bet->shares);
    return bet;
}

Result<Resolution> LedgerService::resolve_market(const std::string& market_id, const std::string& winning_outcome) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto resolution = prediction_.resolve_market(store_, market_id, winning_outcome);
    if (!resolution) {
        logger_->warn("Resolution of {} as {} rejected: {}", market_id, winning_outcome,
                      to_string(resolution.error()));
        return resolution.error();
    }

    store_.record_event("poly_resolve", "",
                        Json{{"market_id", resolution->market_id},
                             {"winning_outcome", resolution->winning_outcome},
                             {"payout_count", resolution->payouts.size()}});
    if (!save_locked()) {
        rollback_locked();
        return ErrorCode::PersistenceFailed;
    }
    logger_->info("Resolved {} as {}: {} payouts", resolution->market_id, resolution->winning_outcome,
                  resolution->payouts.size());
    return resolution;
}

Result<Valuation> LedgerService::value(const std::string& identifier) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;
    return valuation_.value(*store_.find_account(*account_id), store_);
}

std::vector<LeaderboardRow> LedgerService::leaderboard(std::size_t limit, bool eligible_only) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto rows = valuation_.leaderboard(store_, eligible_only);
    if (limit && rows.size() > limit) rows.resize(limit);
    return rows;
}

std::pair<std::optional<std::size_t>, std::size_t> LedgerService::rank_of(const std::string& identifier) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    return valuation_.rank_of(store_, account_id ? *account_id : std::string());
}

Result<std::vector<EquityPoint>> LedgerService::equity_curve(const std::string& identifier,
                                                             std::size_t max_points) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto account_id = store_.resolve(identifier);
    if (!account_id) return ErrorCode::AgentNotFound;
    return valuation_.equity_curve(store_, *account_id, max_points, now_iso8601());
}

bool LedgerService::refresh_mark_to_market(bool force) {
    {
        std::lock_guard<std::mutex> gate(mark_to_market_mutex_);
        auto now = clock_();
        if (!force && last_refresh_attempt_ && now - *last_refresh_attempt_ < config_.mark_to_market_interval) {
            return false;
        }
        last_refresh_attempt_ = now;
    }

    std::set<std::string> tracked_symbols;
    std::set<std::string> tracked_markets;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        for (const auto& id : store_.account_ids()) {
            const Account* account = store_.find_account(id);
            if (!account) continue;
            for (const auto& [symbol, record] : account->positions) {
                (void)record;
                tracked_symbols.insert(symbol);
            }
            for (const auto& [market_id, outcomes] : account->poly) {
                (void)outcomes;
                tracked_markets.insert(market_id);
            }
        }
    }

    std::map<std::string, double> price_updates;
    if (price_feed_) {
        std::size_t fetched = 0;
        for (const auto& symbol : tracked_symbols) {
            if (fetched++ >= config_.max_refresh_symbols) break;
            auto quote = price_feed_->fetch_price(symbol, config_.market_data_timeout);
            if (!quote) {
                logger_->debug("Mark-to-market: {} kept stale price ({})", symbol, to_string(quote.error()));
                continue;
            }
            price_updates[quote->symbol] = quote->price;
            if (quote->symbol != symbol) price_updates[symbol] = quote->price;
        }
    }

    std::vector<PredictionMarket> market_updates;
    if (market_feed_ && !tracked_markets.empty()) {
        auto fetched = market_feed_->fetch_markets(config_.market_refresh_limit, config_.market_data_timeout);
        if (fetched) {
            for (const auto& market : fetched.value()) {
                if (tracked_markets.count(market.market_id)) market_updates.push_back(market);
            }
        } else {
            logger_->debug("Mark-to-market: market list fetch failed ({})", to_string(fetched.error()));
        }
    }

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        bool changed = false;
        for (const auto& [symbol, price] : price_updates) {
            if (store_.last_price(symbol) != price) changed = true;
            store_.set_last_price(symbol, price);
        }
        for (const auto& market : market_updates) {
            changed = store_.upsert_market(market) || changed;
        }
        if (changed && !save_locked()) {
            logger_->error("Could not persist mark-to-market refresh");
        }
    }

    if (!price_updates.empty() || !market_updates.empty()) {
        std::lock_guard<std::mutex> gate(mark_to_market_mutex_);
        last_refresh_success_ = clock_();
    }
    return true;
}

MarkToMarketStatus LedgerService::mark_to_market_status() const {
    std::lock_guard<std::mutex> gate(mark_to_market_mutex_);
    MarkToMarketStatus status;
    status.interval = config_.mark_to_market_interval;
    if (last_refresh_attempt_) status.last_attempt_at = format_iso8601(*last_refresh_attempt_);
    if (last_refresh_success_) status.last_success_at = format_iso8601(*last_refresh_success_);
    return status;
}

LedgerStore LedgerService::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return store_;
}

} // namespace paperdesk
