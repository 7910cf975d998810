/**
 * @file log.hpp
 * @brief Shared spdlog logger for every netbeacon module.
 *
 * @details
 * All modules log through one named logger, `netbeacon`. Messages carry a short
 * subsystem prefix so a single stream stays readable:
 *
 *   beaconing: ...   engine, inference, rate limiter
 *   transport: ...   socket setup, joins, sends
 *   monitor:   ...   interface inventory and observer processes
 *
 * Executables call set_log_level() once after parsing their options. Library code
 * never configures sinks.
 */
#ifndef NETBEACON_LOG_HPP
#define NETBEACON_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace netbeacon {

/// Name of the shared logger.
inline constexpr const char* LOGGER_NAME = "netbeacon";

/**
 * @brief Return the shared logger, creating it on first use.
 *
 * The logger writes to stderr (colored when stderr is a TTY). Safe to call from
 * any module; creation is guarded by spdlog's registry.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the shared logger level from a name.
 *
 * Accepts spdlog level names: trace, debug, info, warn, error, critical, off.
 *
 * @retval true  Level applied.
 * @retval false Unknown name; level unchanged.
 */
bool set_log_level(const std::string& name);

} // namespace netbeacon

#endif // NETBEACON_LOG_HPP
