#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace paperdesk {

// Registers a colour stdout logger named "<base>_<n>", unique per call so
// several services can live in one process.
std::shared_ptr<spdlog::logger> make_logger(const std::string& base, const std::string& level = "info");

} // namespace paperdesk
