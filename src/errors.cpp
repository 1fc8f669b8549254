#include "paperdesk/errors.hpp"

namespace paperdesk {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::AgentNotFound: return "agent_not_found";
        case ErrorCode::MarketNotFound: return "market_not_found";
        case ErrorCode::InsufficientCash: return "insufficient_cash";
        case ErrorCode::InsufficientPosition: return "insufficient_position";
        case ErrorCode::MaxAbsPositionPerSymbol: return "risk_reject: max_abs_position_per_symbol";
        case ErrorCode::MaxDailyLossBreached: return "risk_reject: max_daily_loss_breached";
        case ErrorCode::AgentBlocked: return "agent_blocked";
        case ErrorCode::MarketAlreadyResolved: return "market_already_resolved";
        case ErrorCode::AlreadyResolved: return "already_resolved";
        case ErrorCode::NameAlreadyExists: return "name_already_exists";
        case ErrorCode::InvalidOutcome: return "invalid_outcome";
        case ErrorCode::InvalidWinningOutcome: return "invalid_winning_outcome";
        case ErrorCode::InvalidOdds: return "invalid_odds";
        case ErrorCode::InvalidSymbol: return "invalid_symbol";
        case ErrorCode::InvalidOptionSymbol: return "invalid_option_symbol";
        case ErrorCode::PreipoSymbolAlreadyListed: return "preipo_symbol_already_listed";
        case ErrorCode::InvalidQuantity: return "invalid_quantity";
        case ErrorCode::InvalidPrice: return "invalid_price";
        case ErrorCode::InvalidMultiplier: return "invalid_contract_multiplier";
        case ErrorCode::InvalidAmount: return "invalid_amount";
        case ErrorCode::InvalidAgentName: return "invalid_agent_id_format_use_3to64_chars_letters_numbers_underscore_dash";
        case ErrorCode::MarketDataUnavailable: return "market_data_unavailable";
        case ErrorCode::PersistenceFailed: return "persistence_failed";
    }
    return "unknown_error";
}

} // namespace paperdesk
