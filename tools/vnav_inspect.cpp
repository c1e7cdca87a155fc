// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file vnav_inspect.cpp
 * @brief Print the versions of a file or sequence and replay navigation on it
 *
 * Usage:
 *   vnav-inspect [options] PATH
 *
 * PATH is treated as the path value of a single in-memory node. The tool opens
 * a navigation session on it, prints the version table, replays the -n
 * commands and optionally writes the preview of the resulting version.
 */

#define STB_IMAGE_WRITE_IMPLEMENTATION

#include "cli_args.h"
#include "config.h"
#include "format_utils.h"
#include "logging_init.h"
#include "navigation_session.h"
#include "node_adapter_memory.h"
#include "session_config.h"
#include "thumbnail_cache.h"
#include "thumbnail_generator.h"

#include "stb_image_write.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

using namespace vnav;

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_NO_VERSION = 2;

void init_logging(Config& config, int verbosity) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(verbosity, config.get<std::string>("/log_level", ""));
    log_config.target =
        logging::parse_log_target(config.get<std::string>("/log_target", "console"));
    log_config.file_path = config.get<std::string>("/log_path", "");
    logging::init(log_config);
}

std::string current_dir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        spdlog::warn("[vnav-inspect] Cannot read current directory: {}", ec.message());
        return ".";
    }
    return cwd.string();
}

void print_versions(NavigationSession& session) {
    const PathTemplate& tmpl = session.display_template();
    printf("%s: %s\n", session.display_node().name().c_str(), tmpl.source.c_str());
    printf("\n    %-8s %-20s %-16s %s\n", "VERSION", "FRAMES", "DATE", "PATH");

    for (const auto& entry : session.versions()) {
        const FrameRange range = session.frame_range(entry);
        const std::string frames =
            range.empty() ? "-" : format::format_frame_range(range.first, range.last, range.gaps);
        const char* marker = entry.version == session.current().version ? "->" : "  ";
        const std::string name = std::string(1, tmpl.marker_letter()) + entry.digits;

        printf("%s  %-8s %-20s %-16s %s\n", marker, name.c_str(),
               format::elide_middle(frames, 20).c_str(), session.format_date(entry).c_str(),
               entry.source_path.c_str());
    }

    if (!session.current().exists) {
        printf("\n  (v%d itself is not on disk)\n", session.current().version);
    }
}

void replay_commands(NavigationSession& session, const MemoryNodeAdapter& node,
                     const std::vector<NavCommand>& commands) {
    printf("\n");
    for (NavCommand command : commands) {
        if (session.handle(command)) {
            printf("  %-12s -> v%d\n", nav_command_name(command), session.current().version);
        } else {
            printf("  %-12s ignored (%s)\n", nav_command_name(command),
                   session.last_error().user_message().c_str());
        }
    }

    printf("\nState: %s\n", session_state_name(session.state()));
    printf("Path:  %s\n", node.get_path_value().c_str());
    if (auto range = node.get_frame_range()) {
        printf("Range: %d-%d\n", range->first, range->second);
    }
}

bool write_preview(NavigationSession& session, const SessionConfig& config,
                   const std::string& output) {
    const VersionEntry& entry = session.current();
    if (!entry.exists) {
        fprintf(stderr, "Error: v%d has no file to preview\n", entry.version);
        return false;
    }

    ThumbnailKey key;
    key.path = entry.path;
    key.frame = select_frame(session.frame_range(entry), config.thumb_frame_mode);
    key.mode = config.thumb_reformat;

    auto generator = std::make_shared<StbThumbnailGenerator>(config.thumbnail.canvas);
    ThumbnailCache cache(generator, config.thumbnail.cache_capacity,
                         config.thumbnail.worker_threads);
    cache.request(key);
    cache.wait_for_idle();
    cache.process_completions();
    auto handle = cache.peek(key);
    cache.shutdown();

    if (!handle || !handle->ready()) {
        fprintf(stderr, "Error: preview failed: %s\n",
                handle ? handle->error.c_str() : "not generated");
        return false;
    }

    const ThumbnailImage& image = *handle->image;
    if (stbi_write_png(output.c_str(), image.width, image.height, 4, image.pixels.data(),
                       image.width * 4) == 0) {
        fprintf(stderr, "Error: cannot write %s\n", output.c_str());
        return false;
    }
    printf("Preview: %s (%dx%d, %s, frame %d)\n", output.c_str(), image.width, image.height,
           reformat_mode_name(key.mode), key.frame);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    switch (parse_cli_args(argc, argv, args)) {
    case CliStatus::EXIT:
        return 0;
    case CliStatus::USAGE_ERROR:
        return EXIT_USAGE;
    case CliStatus::RUN:
        break;
    }

    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_config_path() : args.config_path);
    init_logging(*config, args.verbosity);

    SessionConfig session_config = SessionConfig::from_config(*config);
    if (args.reformat) {
        session_config.thumb_reformat = *args.reformat;
    }

    const std::string base_dir = args.base_dir.empty() ? current_dir() : args.base_dir;
    const format::SequenceSpec sequence = format::strip_sequence(args.path);

    std::optional<NodeFrameRange> range;
    if (sequence.first && sequence.last) {
        range = NodeFrameRange{*sequence.first, *sequence.last};
    }
    auto node = std::make_shared<MemoryNodeAdapter>("inspect", sequence.path, range);
    node->set_reveal_handler(
        [](const std::string& dir) { printf("  reveal: %s\n", dir.c_str()); });

    std::vector<SelectedNode> selection{{node, 0, 0}};
    NavigationSession session(selection, session_config, base_dir);

    VersionError error;
    if (!session.open(&error)) {
        fprintf(stderr, "Error: %s\n", error.user_message().c_str());
        return EXIT_NO_VERSION;
    }

    print_versions(session);
    for (const auto& warning : session.warnings()) {
        fprintf(stderr, "warning: %s\n", warning.user_message().c_str());
    }

    if (!args.commands.empty()) {
        replay_commands(session, *node, args.commands);
    }

    if (!args.thumbnail_path.empty() &&
        !write_preview(session, session_config, args.thumbnail_path)) {
        return EXIT_USAGE;
    }
    return 0;
}
