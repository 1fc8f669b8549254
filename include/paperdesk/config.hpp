#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "types.hpp"

namespace paperdesk {

struct LedgerConfig {
    std::string state_db_path = "~/.local/share/paperdesk/runtime_state.db";
    std::string legacy_state_file = "~/.local/share/paperdesk/runtime_state.json";

    double starting_cash = 2000.0;
    RiskLimits risk;

    std::size_t activity_log_capacity = 5000;

    std::chrono::seconds mark_to_market_interval{300};
    std::size_t max_refresh_symbols = 60;
    std::size_t market_refresh_limit = 100;
    std::chrono::milliseconds market_data_timeout{6000};

    std::string log_level = "info";

    // Defaults overridden by PAPERDESK_* environment variables.
    static LedgerConfig from_env();
};

// Expands a leading "~/" using $HOME.
std::string expand_user_path(const std::string& path);

} // namespace paperdesk
