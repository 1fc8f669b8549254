#include "paperdesk/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace paperdesk {

namespace {

std::string env_string(const char* name, const std::string& fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    std::string value(raw);
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return fallback;
    auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

double env_double(const char* name, double fallback, double min_value, double max_value) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    try {
        double value = std::stod(raw);
        return std::max(min_value, std::min(max_value, value));
    } catch (const std::exception&) {
        return fallback;
    }
}

std::size_t env_size(const char* name, std::size_t fallback, std::size_t min_value, std::size_t max_value) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;
    try {
        long long value = std::stoll(raw);
        if (value < static_cast<long long>(min_value)) return min_value;
        if (value > static_cast<long long>(max_value)) return max_value;
        return static_cast<std::size_t>(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

} // namespace

LedgerConfig LedgerConfig::from_env() {
    LedgerConfig config;
    config.state_db_path = expand_user_path(env_string("PAPERDESK_STATE_DB", config.state_db_path));
    config.legacy_state_file = expand_user_path(env_string("PAPERDESK_STATE_FILE", config.legacy_state_file));

    config.starting_cash = env_double("PAPERDESK_STARTING_CASH", config.starting_cash, 1.0, 1e12);
    config.risk.max_abs_position_per_symbol =
        env_double("PAPERDESK_MAX_ABS_POSITION", config.risk.max_abs_position_per_symbol, 0.0, 1e12);
    config.risk.max_daily_loss = env_double("PAPERDESK_MAX_DAILY_LOSS", config.risk.max_daily_loss, 0.0, 1e12);

    config.activity_log_capacity =
        env_size("PAPERDESK_ACTIVITY_LOG_CAPACITY", config.activity_log_capacity, 100, 1000000);

    config.mark_to_market_interval = std::chrono::seconds(static_cast<long long>(
        env_size("PAPERDESK_MARK_TO_MARKET_SECONDS", 300, 0, 86400)));
    config.max_refresh_symbols = env_size("PAPERDESK_MAX_REFRESH_SYMBOLS", config.max_refresh_symbols, 1, 1000);
    config.market_refresh_limit = env_size("PAPERDESK_MARKET_REFRESH_LIMIT", config.market_refresh_limit, 1, 100);

    double timeout_seconds = env_double("PAPERDESK_MARKET_DATA_TIMEOUT_SECONDS", 6.0, 1.0, 30.0);
    config.market_data_timeout = std::chrono::milliseconds(static_cast<long long>(timeout_seconds * 1000.0));

    config.log_level = env_string("PAPERDESK_LOG_LEVEL", config.log_level);
    return config;
}

std::string expand_user_path(const std::string& path) {
    if (path.rfind("~/", 0) != 0) return path;
    const char* home = std::getenv("HOME");
    if (!home || !*home) return path;
    return std::string(home) + path.substr(1);
}

} // namespace paperdesk
