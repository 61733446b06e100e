#include "cookie/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace cookie::logging {
namespace {

constexpr const char* kLoggerName = "cookie";

std::shared_ptr<spdlog::logger> ensure_logger() {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%n][%l] %v");
  }
  return logger;
}

} // namespace

void init_logging(const std::string& level) {
  auto logger = ensure_logger();
  const auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    logger->set_level(spdlog::level::info);
    logger->warn("Unknown log level '{}', using info", level);
    return;
  }
  logger->set_level(parsed);
}

std::shared_ptr<spdlog::logger> get() {
  return ensure_logger();
}

} // namespace cookie::logging
