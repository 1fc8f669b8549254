#pragma once

#include <string>
#include "errors.hpp"

namespace paperdesk {
namespace symbols {

constexpr const char* kPreipoPrefix = "PRE:";
constexpr double kOptionContractMultiplier = 100.0;

// Canonical trading symbol: upper case, no spaces, crypto pairs folded to
// <BASE>USD for fiat quotes, "O:" stripped from option symbols.
Result<std::string> normalize_symbol(const std::string& raw);

bool is_crypto_symbol(const std::string& symbol);
bool is_option_symbol(const std::string& symbol);
bool is_preipo_symbol(const std::string& symbol);

// 100 for OCC option contracts, 1 for everything else.
double contract_multiplier(const std::string& symbol);

// OCC symbol such as AAPL260320C00200000 from its components.
// expiry is YYYY-MM-DD and must fall on a weekday; right is CALL/C/PUT/P.
Result<std::string> build_occ_option_symbol(const std::string& underlying,
                                            const std::string& expiry,
                                            const std::string& right,
                                            double strike);

} // namespace symbols
} // namespace paperdesk
