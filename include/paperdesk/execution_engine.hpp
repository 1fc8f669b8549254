#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "types.hpp"

namespace paperdesk {

// Last-known mark for a symbol, if any.
using PriceLookup = std::function<std::optional<double>(const std::string&)>;

class ExecutionEngine {
public:
    explicit ExecutionEngine(RiskLimits limits = RiskLimits(),
                             std::shared_ptr<spdlog::logger> logger = nullptr);

    // Applies an order at the given fill price. Either the whole fill lands
    // (cash, position, cost basis, realized P&L) or the account is left as it
    // was; the one exception is a daily-loss breach found before the fill,
    // which blocks the account while rejecting the order.
    Result<Fill> execute_order(Account& account, const std::string& symbol, Side side,
                               double quantity, double fill_price, double multiplier,
                               const PriceLookup& marks) const;

    // Pre-trade checks against the last-known marks. Sets account.blocked on a
    // daily-loss breach.
    Status check_risk(Account& account, const std::string& symbol, Side side,
                      double quantity, double fill_price, double multiplier,
                      const PriceLookup& marks) const;

    // Weighted-average position update. Grows at the blended price, realizes
    // P&L on the closed part, reopens a flipped residual at the fill price.
    // Returns the realized P&L of this trade.
    static double apply_trade(Account& account, const std::string& symbol, double signed_quantity,
                              double fill_price, double multiplier);

    // Sum over symbols of min(0, (mark - avg_cost) * qty * multiplier).
    // Symbols without a mark are skipped.
    static double unrealized_loss(const Account& account, const PriceLookup& marks);

    bool daily_loss_breached(const Account& account, const PriceLookup& marks) const;

    const RiskLimits& limits() const { return limits_; }

private:
    RiskLimits limits_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace paperdesk
