// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for vnav-inspect
 */

#include "image_reformat.h"
#include "navigation_session.h"

#include <optional>
#include <string>
#include <vector>

namespace vnav {

/**
 * @brief Outcome of parse_cli_args()
 */
enum class CliStatus {
    RUN,        ///< Arguments valid, proceed
    EXIT,       ///< Help or version was printed, exit 0
    USAGE_ERROR ///< Bad arguments, exit 1
};

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string path;           // Positional PATH (may carry a trailing "first-last" range)
    std::string config_path;    // -c: empty = default location
    std::string base_dir;       // -b: empty = current directory
    std::string thumbnail_path; // -t: empty = no PNG

    std::optional<ReformatMode> reformat; // -r: overrides /session/thumb_reformat
    std::vector<NavCommand> commands;     // -n: replayed in order

    int verbosity = 0;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stdout together with a hint to run --help.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 */
CliStatus parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Split "next,prev,max" into commands
 *
 * @return false on an empty list or an unknown command name
 */
bool parse_command_list(const std::string& text, std::vector<NavCommand>& out);

} // namespace vnav
