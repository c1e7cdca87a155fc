// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief spdlog setup for vnav
 *
 * Creates the "vnav" logger (colored console plus an optional system sink),
 * installs it as the spdlog default and routes libhv's own logging to the
 * same level.
 */

namespace vnav {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,   ///< Console only for an interactive tool
    Syslog, ///< syslog(3), Linux only
    File,   ///< Rotating log file (5 MB x 3)
    Console ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< File target path; empty picks $XDG_DATA_HOME/vnav/vnav.log
};

/**
 * @brief Build and install the default logger
 *
 * Safe to call more than once; the previous default logger is replaced.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" .. "off", "warning" accepted)
 *
 * Case sensitive. Returns `default_level` for anything else.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// libhv log level (LOG_LEVEL_*) matching an spdlog level
int to_hv_level(spdlog::level::level_enum level);

/**
 * @brief Effective level: CLI verbosity, then config value, then warn
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// Parse "auto" / "syslog" / "file" / "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace vnav
