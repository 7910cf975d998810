// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================

#include "netbeacon/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace netbeacon {

std::shared_ptr<spdlog::logger> logger() {
  auto lg = spdlog::get(LOGGER_NAME);                 // already registered?
  if (lg) return lg;
  try {
    return spdlog::stderr_color_mt(LOGGER_NAME);
  } catch (const spdlog::spdlog_ex&) {
    // Lost a creation race with another caller; the registry has it now.
    return spdlog::get(LOGGER_NAME);
  }
}

bool set_log_level(const std::string& name) {
  auto lvl = spdlog::level::from_str(name);
  // from_str() maps unknown names to "off"; only accept "off" when asked for it.
  if (lvl == spdlog::level::off && name != "off") return false;
  logger()->set_level(lvl);
  return true;
}

} // namespace netbeacon
