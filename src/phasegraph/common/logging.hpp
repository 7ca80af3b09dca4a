/**
 * @file logging.hpp
 * @brief Logger construction on top of spdlog.
 */
#pragma once
#include "phasegraph/common/common.hpp"
#include <spdlog/spdlog.h>
#include <ostream>
#include <string>

namespace phasegraph
{

/**
 * @brief Handle to a logger that components receive explicitly.
 *
 * @details
 * There is no process-wide default logger: executors and runners get a
 * `LoggerPtr` through their config or context, so tests can capture output
 * in a `std::ostringstream` and the driver can route it to the console.
 * Loggers created here are never registered in spdlog's global registry.
 *
 * Every factory uses the line pattern `[level] message`.
 *
 * @par Thread Safety
 * - All factories return loggers backed by `_mt` sinks; lines from different
 *   threads never interleave.
 */
using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Pattern shared by every phasegraph logger.
inline constexpr const char* log_pattern = "[%l] %v";

/**
 * @brief Logger writing to @p sink, which must outlive it.
 */
LoggerPtr make_stream_logger(
    const std::string& name,
    std::ostream& sink,
    spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Colored logger on standard output.
 */
LoggerPtr make_console_logger(const std::string& name, spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Logger that discards everything.
 */
LoggerPtr make_null_logger();

} // namespace phasegraph
