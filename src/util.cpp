#include "paperdesk/util.hpp"

#include <ctime>
#include <iomanip>
#include <mutex>
#include <regex>
#include <sstream>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace paperdesk {

namespace {

boost::uuids::uuid generate() {
    // random_generator is not thread safe; share one behind a mutex.
    static std::mutex mutex;
    static boost::uuids::random_generator generator;
    std::lock_guard<std::mutex> lock(mutex);
    return generator();
}

} // namespace

std::string new_uuid() {
    return boost::uuids::to_string(generate());
}

std::string new_api_key() {
    static const char* hex = "0123456789abcdef";
    auto id = generate();
    std::string key;
    key.reserve(32);
    for (auto byte : id) {
        key.push_back(hex[(byte >> 4) & 0x0F]);
        key.push_back(hex[byte & 0x0F]);
    }
    return key;
}

bool is_uuid_like(const std::string& text) {
    static const std::regex pattern(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
    return std::regex_match(trim(text), pattern);
}

bool is_valid_agent_name(const std::string& name) {
    static const std::regex pattern("^[A-Za-z0-9_\\-]{3,64}$");
    return std::regex_match(name, pattern);
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
    std::time_t t = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << "+00:00";
    return out.str();
}

std::string utc_now_iso8601() {
    return format_iso8601(std::chrono::system_clock::now());
}

} // namespace paperdesk
