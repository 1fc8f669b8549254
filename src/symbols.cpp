#include "paperdesk/symbols.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <cstdio>
#include <map>
#include <regex>
#include <set>

namespace paperdesk {
namespace symbols {

namespace {

const std::map<std::string, std::string>& listed_ticker_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"FIGMA", "FIG"},
    };
    return aliases;
}

const std::set<std::string>& crypto_base_symbols() {
    static const std::set<std::string> bases = {
        "BTC", "ETH", "SOL", "DOGE", "LTC", "BNB", "XRP", "ADA",
        "AVAX", "DOT", "MATIC", "LINK", "BCH", "ETC", "UNI", "ATOM",
        "TRX", "SHIB", "PEPE", "ARB", "OP", "NEAR",
    };
    return bases;
}

// Longest first, so "USDT" wins over "USD" in suffix matching.
const char* const kCryptoQuotes[] = {"USDT", "USDC", "USD", "BTC", "ETH"};

bool is_fiat_quote(const std::string& quote) {
    return quote == "USD" || quote == "USDT" || quote == "USDC";
}

bool is_crypto_quote(const std::string& quote) {
    return std::find(std::begin(kCryptoQuotes), std::end(kCryptoQuotes), quote) != std::end(kCryptoQuotes);
}

bool is_crypto_base(const std::string& base) {
    return crypto_base_symbols().count(base) > 0;
}

const std::regex& option_symbol_pattern() {
    static const std::regex pattern("^[A-Z]{1,6}[0-9]{6}[CP][0-9]{8}$");
    return pattern;
}

std::string upper_no_spaces(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Result<std::string> normalize_symbol(const std::string& raw) {
    std::string s = upper_no_spaces(raw);
    if (s.empty()) return ErrorCode::InvalidSymbol;

    const auto& aliases = listed_ticker_aliases();
    auto alias = aliases.find(s);
    if (alias != aliases.end()) return alias->second;

    if (starts_with(s, kPreipoPrefix)) {
        std::string base = s.substr(std::char_traits<char>::length(kPreipoPrefix));
        if (base.empty()) return ErrorCode::InvalidSymbol;
        if (aliases.count(base)) return ErrorCode::PreipoSymbolAlreadyListed;
        return std::string(kPreipoPrefix) + base;
    }

    if (starts_with(s, "O:")) s = s.substr(2);
    if (std::regex_match(s, option_symbol_pattern())) return s;

    for (char sep : {'/', '-', '_'}) {
        auto pos = s.find(sep);
        if (pos == std::string::npos) continue;
        std::string left = s.substr(0, pos);
        std::string right = s.substr(pos + 1);
        if (is_crypto_base(left) && is_crypto_quote(right)) {
            return is_fiat_quote(right) ? left + "USD" : left + right;
        }
        return s;
    }

    if (is_crypto_base(s)) return s + "USD";

    for (const char* quote : kCryptoQuotes) {
        if (!ends_with(s, quote)) continue;
        std::string base = s.substr(0, s.size() - std::char_traits<char>::length(quote));
        if (is_crypto_base(base)) {
            return is_fiat_quote(quote) ? base + "USD" : s;
        }
    }
    return s;
}

bool is_crypto_symbol(const std::string& symbol) {
    std::string s = upper_no_spaces(symbol);
    if (s.empty()) return false;
    if (is_crypto_base(s)) return true;

    for (char sep : {'/', '-', '_'}) {
        auto pos = s.find(sep);
        if (pos != std::string::npos) {
            return is_crypto_base(s.substr(0, pos)) && is_crypto_quote(s.substr(pos + 1));
        }
    }

    for (const char* quote : kCryptoQuotes) {
        if (ends_with(s, quote) &&
            is_crypto_base(s.substr(0, s.size() - std::char_traits<char>::length(quote)))) {
            return true;
        }
    }
    return false;
}

bool is_option_symbol(const std::string& symbol) {
    std::string s = upper_no_spaces(symbol);
    if (starts_with(s, "O:")) s = s.substr(2);
    return std::regex_match(s, option_symbol_pattern());
}

bool is_preipo_symbol(const std::string& symbol) {
    return starts_with(upper_no_spaces(symbol), kPreipoPrefix);
}

double contract_multiplier(const std::string& symbol) {
    return is_option_symbol(symbol) ? kOptionContractMultiplier : 1.0;
}

Result<std::string> build_occ_option_symbol(const std::string& underlying,
                                            const std::string& expiry,
                                            const std::string& right,
                                            double strike) {
    std::string root = upper_no_spaces(underlying);
    static const std::regex root_pattern("^[A-Z]{1,6}$");
    if (!std::regex_match(root, root_pattern)) return ErrorCode::InvalidOptionSymbol;

    int year = 0, month = 0, day = 0;
    char trailing = 0;
    if (std::sscanf(expiry.c_str(), "%4d-%2d-%2d%c", &year, &month, &day, &trailing) != 3 ||
        month < 1 || month > 12 || day < 1 || day > 31) {
        return ErrorCode::InvalidOptionSymbol;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = 12;
    std::time_t t = timegm(&tm);
    std::tm normalized{};
    gmtime_r(&t, &normalized);
    // Reject dates like 2026-02-30 that timegm silently rolls over.
    if (normalized.tm_mday != day || normalized.tm_mon != month - 1) return ErrorCode::InvalidOptionSymbol;
    if (normalized.tm_wday == 0 || normalized.tm_wday == 6) return ErrorCode::InvalidOptionSymbol;

    std::string side = upper_no_spaces(right);
    char cp = 0;
    if (side == "CALL" || side == "C") {
        cp = 'C';
    } else if (side == "PUT" || side == "P") {
        cp = 'P';
    } else {
        return ErrorCode::InvalidOptionSymbol;
    }

    if (!(strike > 0.0)) return ErrorCode::InvalidOptionSymbol;
    long long strike_int = std::llround(strike * 1000.0);
    if (strike_int > 99999999LL) return ErrorCode::InvalidOptionSymbol;

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s%02d%02d%02d%c%08lld",
                  root.c_str(), year % 100, month, day, cp, strike_int);
    return std::string(buffer);
}

} // namespace symbols
} // namespace paperdesk
