#include "paperdesk/valuation.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <set>
#include "json_fields.hpp"
#include "paperdesk/symbols.hpp"

namespace paperdesk {

namespace {

constexpr std::size_t kMinCurvePoints = 3;
constexpr std::size_t kMaxCurvePoints = 200;

// Accounts that ever traded a non-crypto symbol, per the activity log.
std::set<std::string> stock_traders(const LedgerStore& store) {
    std::set<std::string> traders;
    for (const auto& event : store.activity_log()) {
        if (event.type != "stock_order") continue;
        std::string symbol = json_fields::get_string(event.details, "symbol");
        if (symbol.empty() || symbols::is_crypto_symbol(symbol)) continue;
        auto resolved = store.resolve(event.account_id);
        traders.insert(resolved ? *resolved : event.account_id);
    }
    return traders;
}

} // namespace

ValuationService::ValuationService(double starting_cash) : starting_cash_(starting_cash) {}

Valuation ValuationService::value(const Account& account, const LedgerStore& store) const {
    Valuation valuation;
    valuation.cash = account.cash;

    for (const auto& [symbol, record] : account.positions) {
        PositionValue position;
        position.symbol = symbol;
        position.quantity = record.quantity;
        position.last_price = store.last_price(symbol).value_or(0.0);
        position.market_value = record.quantity * position.last_price * record.multiplier;

        if (symbols::is_crypto_symbol(symbol)) {
            valuation.crypto_value += position.market_value;
        } else {
            valuation.stock_value += position.market_value;
        }
        valuation.positions.push_back(position);
    }
    std::stable_sort(valuation.positions.begin(), valuation.positions.end(),
                     [](const PositionValue& a, const PositionValue& b) {
                         return std::fabs(a.market_value) > std::fabs(b.market_value);
                     });

    for (const auto& [market_id, outcomes] : account.poly) {
        const PredictionMarket* market = store.find_market(market_id);
        if (!market || market->resolved) continue;
        for (const auto& [outcome, holding] : outcomes) {
            auto odds = market->outcomes.find(outcome);
            if (odds != market->outcomes.end() && odds->second > 0.0) {
                valuation.poly_value += holding.shares * odds->second;
            }
        }
    }

    valuation.equity = valuation.cash + valuation.stock_value + valuation.crypto_value + valuation.poly_value;
    if (starting_cash_ > 0.0) {
        valuation.return_pct = (valuation.equity - starting_cash_) / starting_cash_ * 100.0;
    }
    valuation.has_open_position = !account.positions.empty() || account.poly.has_open_position();
    return valuation;
}

std::vector<LeaderboardRow> ValuationService::leaderboard(const LedgerStore& store, bool eligible_only) const {
    std::set<std::string> traders = stock_traders(store);

    std::vector<LeaderboardRow> rows;
    rows.reserve(store.account_count());
    for (const auto& account_id : store.account_ids()) {
        const Account* account = store.find_account(account_id);
        if (!account) continue;

        LeaderboardRow row;
        row.account_id = account->id;
        row.display_name = account->display_name;
        row.valuation = value(*account, store);
        row.has_stock_trade_history = traders.count(account->id) > 0;
        row.leaderboard_eligible = row.valuation.has_open_position || row.has_stock_trade_history;
        if (eligible_only && !row.leaderboard_eligible) continue;
        rows.push_back(std::move(row));
    }

    std::stable_sort(rows.begin(), rows.end(), [](const LeaderboardRow& a, const LeaderboardRow& b) {
        return a.valuation.equity > b.valuation.equity;
    });
    return rows;
}

std::pair<std::optional<std::size_t>, std::size_t> ValuationService::rank_of(const LedgerStore& store,
                                                                            const std::string& account_id) const {
    auto rows = leaderboard(store, true);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].account_id == account_id) return {i + 1, rows.size()};
    }
    return {std::nullopt, rows.size()};
}

std::vector<EquityPoint> ValuationService::equity_curve(const LedgerStore& store, const std::string& account_id,
                                                        std::size_t max_points, const std::string& now) const {
    std::size_t budget = std::max(kMinCurvePoints, std::min(max_points, kMaxCurvePoints));

    std::vector<const ActivityEvent*> events;
    for (const auto& event : store.activity_log()) {
        if (event.type != "agent_registered" && event.type != "stock_order" && event.type != "poly_bet") continue;
        std::string actor = event.account_id;
        if (actor.empty()) {
            auto resolved = store.resolve(event.display_name);
            if (resolved) actor = *resolved;
        }
        if (actor == account_id) events.push_back(&event);
    }
    std::stable_sort(events.begin(), events.end(), [](const ActivityEvent* a, const ActivityEvent* b) {
        return a->created_at < b->created_at;
    });

    if (events.size() > budget) {
        std::vector<const ActivityEvent*> kept;
        auto head_end = events.begin() + std::min<std::size_t>(10, events.size());
        auto registration = std::find_if(events.begin(), head_end,
                                         [](const ActivityEvent* e) { return e->type == "agent_registered"; });
        if (registration != head_end) kept.push_back(*registration);
        auto tail = static_cast<std::ptrdiff_t>(budget - kept.size());
        kept.insert(kept.end(), events.end() - tail, events.end());
        events = std::move(kept);
    }

    double cash = starting_cash_;
    double poly_value = 0.0;
    std::map<std::string, double> positions;
    std::map<std::string, double> multipliers;
    std::map<std::string, double> last_fill;

    std::vector<EquityPoint> points;
    for (const ActivityEvent* event : events) {
        const Json& details = event->details;
        if (event->type == "agent_registered") {
            cash = json_fields::get_double(details, "initial_cash", cash);
        } else if (event->type == "stock_order") {
            std::string symbol = json_fields::get_string(details, "symbol");
            if (!symbol.empty()) {
                double qty = json_fields::get_double(details, "qty");
                double fill = json_fields::get_double(details, "fill_price");
                double multiplier = json_fields::get_double(details, "multiplier", symbols::contract_multiplier(symbol));
                double notional = json_fields::get_double(details, "notional", qty * fill * multiplier);
                std::string side = json_fields::get_string(details, "side");
                last_fill[symbol] = fill;
                multipliers[symbol] = multiplier;
                if (side == "BUY") {
                    cash -= notional;
                    positions[symbol] += qty;
                } else if (side == "SELL") {
                    cash += notional;
                    positions[symbol] -= qty;
                    if (std::fabs(positions[symbol]) < 1e-12) positions.erase(symbol);
                }
            }
        } else {
            // Bets are carried at cost.
            double amount = json_fields::get_double(details, "amount");
            cash -= amount;
            poly_value += amount;
        }

        double equity = cash + poly_value;
        for (const auto& [symbol, qty] : positions) {
            auto fill = last_fill.find(symbol);
            double px = (fill != last_fill.end() && fill->second > 0.0) ? fill->second
                                                                       : store.last_price(symbol).value_or(0.0);
            equity += qty * px * multipliers[symbol];
        }
        points.push_back({event->created_at, equity});
    }

    if (const Account* account = store.find_account(account_id)) {
        points.push_back({now, value(*account, store).equity});
    }
    if (points.size() > kMaxCurvePoints) {
        points.erase(points.begin(), points.end() - static_cast<std::ptrdiff_t>(kMaxCurvePoints));
    }
    return points;
}

} // namespace paperdesk
