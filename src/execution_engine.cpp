#include "paperdesk/execution_engine.hpp"

#include <algorithm>
#include <cmath>

namespace paperdesk {

namespace {

// After a fill the traded symbol is marked at its fill price, everything else
// at the book's last price.
PriceLookup with_fill_mark(const PriceLookup& marks, const std::string& symbol, double fill_price) {
    return [&marks, symbol, fill_price](const std::string& sym) -> std::optional<double> {
        if (sym == symbol) return fill_price;
        return marks ? marks(sym) : std::nullopt;
    };
}

} // namespace

ExecutionEngine::ExecutionEngine(RiskLimits limits, std::shared_ptr<spdlog::logger> logger)
    : limits_(limits), logger_(std::move(logger)) {}

Result<Fill> ExecutionEngine::execute_order(Account& account, const std::string& symbol, Side side,
                                            double quantity, double fill_price, double multiplier,
                                            const PriceLookup& marks) const {
    if (symbol.empty()) return ErrorCode::InvalidSymbol;
    if (!std::isfinite(quantity) || quantity <= 0.0) return ErrorCode::InvalidQuantity;
    if (!std::isfinite(fill_price) || fill_price <= 0.0) return ErrorCode::InvalidPrice;
    if (!std::isfinite(multiplier) || multiplier < 1.0) return ErrorCode::InvalidMultiplier;

    const PositionRecord* open = account.positions.find(symbol);
    if (open && open->multiplier != multiplier) {
        if (logger_) {
            logger_->warn("Multiplier {} does not match open {} position at {}", multiplier, symbol,
                          open->multiplier);
        }
        return ErrorCode::InvalidMultiplier;
    }

    Status risk = check_risk(account, symbol, side, quantity, fill_price, multiplier, marks);
    if (!risk) return risk.error();

    double notional = quantity * fill_price * multiplier;
    if (side == Side::Buy) {
        account.cash -= notional;
    } else {
        account.cash += notional;
    }

    double signed_quantity = side == Side::Buy ? quantity : -quantity;
    double realized = apply_trade(account, symbol, signed_quantity, fill_price, multiplier);

    Fill fill;
    fill.account_id = account.id;
    fill.symbol = symbol;
    fill.side = side;
    fill.quantity = quantity;
    fill.fill_price = fill_price;
    fill.multiplier = multiplier;
    fill.notional = notional;
    fill.realized_pnl = realized;
    fill.position_after = account.positions.quantity(symbol);
    fill.cash_after = account.cash;

    if (daily_loss_breached(account, with_fill_mark(marks, symbol, fill_price))) {
        account.blocked = true;
        fill.blocked_after = true;
        if (logger_) {
            logger_->warn("Account {} breached max daily loss {:.2f} after {} fill; blocking",
                          account.display_name, limits_.max_daily_loss, symbol);
        }
    }
    return fill;
}

Status ExecutionEngine::check_risk(Account& account, const std::string& symbol, Side side,
                                   double quantity, double fill_price, double multiplier,
                                   const PriceLookup& marks) const {
    if (account.blocked) return ErrorCode::AgentBlocked;

    double current = account.positions.quantity(symbol);
    double target = side == Side::Buy ? current + quantity : current - quantity;

    if (std::fabs(target) > limits_.max_abs_position_per_symbol) {
        if (logger_) {
            logger_->warn("Position limit: {} target {} exceeds {}", symbol, target,
                          limits_.max_abs_position_per_symbol);
        }
        return ErrorCode::MaxAbsPositionPerSymbol;
    }

    if (side == Side::Buy) {
        double cost = quantity * fill_price * multiplier;
        if (account.cash < cost) {
            if (logger_) {
                logger_->warn("Insufficient cash for buy order: need ${:.2f}, have ${:.2f}", cost, account.cash);
            }
            return ErrorCode::InsufficientCash;
        }
    } else if (!limits_.allow_short_selling && current < quantity) {
        if (logger_) {
            logger_->warn("Insufficient position to sell {}: have {}, trying to sell {}", symbol, current, quantity);
        }
        return ErrorCode::InsufficientPosition;
    }

    if (daily_loss_breached(account, marks)) {
        account.blocked = true;
        if (logger_) {
            logger_->warn("Account {} is past max daily loss {:.2f}; blocking", account.display_name,
                          limits_.max_daily_loss);
        }
        return ErrorCode::MaxDailyLossBreached;
    }
    return Done{};
}

double ExecutionEngine::apply_trade(Account& account, const std::string& symbol, double signed_quantity,
                                    double fill_price, double multiplier) {
    const PositionRecord* existing = account.positions.find(symbol);
    double old_qty = existing ? existing->quantity : 0.0;
    double old_avg = existing ? existing->avg_cost : fill_price;
    double new_qty = old_qty + signed_quantity;

    if (old_qty == 0.0 || old_qty * signed_quantity > 0.0) {
        double total_abs = std::fabs(old_qty) + std::fabs(signed_quantity);
        double new_avg = (std::fabs(old_qty) * old_avg + std::fabs(signed_quantity) * fill_price) / total_abs;
        account.positions.set(symbol, new_qty, new_avg, multiplier);
        return 0.0;
    }

    double closing = std::min(std::fabs(old_qty), std::fabs(signed_quantity));
    double pnl_per_unit = fill_price - old_avg;
    if (old_qty < 0.0) pnl_per_unit = -pnl_per_unit;
    double realized = pnl_per_unit * closing * multiplier;
    account.realized_pnl += realized;

    if (old_qty * new_qty < 0.0) {
        account.positions.set(symbol, new_qty, fill_price, multiplier);
    } else {
        // Shrinking (or flat): basis of the remainder is unchanged.
        account.positions.set(symbol, new_qty, old_avg, multiplier);
    }
    return realized;
}

double ExecutionEngine::unrealized_loss(const Account& account, const PriceLookup& marks) {
    double total = 0.0;
    for (const auto& [symbol, record] : account.positions) {
        auto mark = marks ? marks(symbol) : std::nullopt;
        if (!mark) continue;
        double pnl = (*mark - record.avg_cost) * record.quantity * record.multiplier;
        total += std::min(0.0, pnl);
    }
    return total;
}

bool ExecutionEngine::daily_loss_breached(const Account& account, const PriceLookup& marks) const {
    return account.realized_pnl + unrealized_loss(account, marks) <= -limits_.max_daily_loss;
}

} // namespace paperdesk
