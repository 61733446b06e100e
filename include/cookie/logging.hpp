#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cookie::logging {

// Creates (or reconfigures) the "cookie" logger on a colored stderr sink.
// Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
void init_logging(const std::string& level = "info");

// Shared "cookie" logger; created on first use if init_logging was not called.
std::shared_ptr<spdlog::logger> get();

} // namespace cookie::logging
