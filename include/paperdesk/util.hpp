#pragma once

#include <chrono>
#include <string>

namespace paperdesk {

// Random RFC-4122 id in canonical 8-4-4-4-12 form.
std::string new_uuid();

// 32 lowercase hex characters.
std::string new_api_key();

bool is_uuid_like(const std::string& text);

// 3-64 characters of [A-Za-z0-9_-].
bool is_valid_agent_name(const std::string& name);

std::string trim(const std::string& text);

// ISO-8601 UTC with microseconds and "+00:00" offset.
std::string format_iso8601(std::chrono::system_clock::time_point tp);
std::string utc_now_iso8601();

} // namespace paperdesk
