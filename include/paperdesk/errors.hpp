#pragma once

#include <string>
#include <utility>
#include <variant>

namespace paperdesk {

enum class ErrorCode {
    // Not found
    AgentNotFound,
    MarketNotFound,

    // Insufficient resource
    InsufficientCash,
    InsufficientPosition,

    // Risk rejects
    MaxAbsPositionPerSymbol,
    MaxDailyLossBreached,

    // State conflicts
    AgentBlocked,
    MarketAlreadyResolved,
    AlreadyResolved,
    NameAlreadyExists,
    InvalidOutcome,
    InvalidWinningOutcome,
    InvalidOdds,

    // Validation
    InvalidSymbol,
    InvalidOptionSymbol,
    PreipoSymbolAlreadyListed,
    InvalidQuantity,
    InvalidPrice,
    InvalidMultiplier,
    InvalidAmount,
    InvalidAgentName,

    // Upstream / infrastructure
    MarketDataUnavailable,
    PersistenceFailed,
};

// Stable wire string for an error, e.g. "insufficient_cash".
const char* to_string(ErrorCode code);

// Value-or-error return type used by every ledger operation.
template <typename T, typename E = ErrorCode>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(E error) : data_(error) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    E error() const { return std::get<E>(data_); }

    const T* operator->() const { return &value(); }
    T* operator->() { return &value(); }

private:
    std::variant<T, E> data_;
};

// For operations with nothing to return on success.
struct Done {};

using Status = Result<Done>;

} // namespace paperdesk
