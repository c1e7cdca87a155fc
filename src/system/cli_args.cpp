// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>
#include <utility>

namespace vnav {

static void print_help(const char* program_name) {
    printf("Usage: %s [options] PATH\n", program_name);
    printf("\nPrints the versions found next to PATH. PATH holds a version token\n");
    printf("(v003, _v12) and may end with a frame range (\"shot.####.exr 1001-1050\").\n");
    printf("\nOptions:\n");
    printf("  -c, --config <file>    Config file (default: $XDG_CONFIG_HOME/vnav/vnavconfig.json)\n");
    printf("  -b, --base <dir>       Base directory for relative paths (default: cwd)\n");
    printf("  -t, --thumbnail <png>  Write the preview of the selected version\n");
    printf("  -r, --reformat <mode>  Preview mapping: fit, fill, distort, expanding\n");
    printf("  -n, --navigate <cmds>  Replay commands: next,prev,min,max,confirm,cancel\n");
    printf("  -v, --verbose          Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  -h, --help             Show this help message\n");
    printf("  -V, --version          Show version information\n");
    printf("\nExit codes:\n");
    printf("  0  success\n");
    printf("  1  usage error or preview failure\n");
    printf("  2  no version token in PATH\n");
    printf("\nExamples:\n");
    printf("  %s renders/shot_v003/shot_v003.####.exr\n", program_name);
    printf("  %s -n max,confirm -t /tmp/latest.png comp/plate_v2.png\n", program_name);
}

// Value of an option given as "-x VALUE", "--long VALUE" or "--long=VALUE"
static bool option_value(int argc, char** argv, int& i, const char* short_name,
                         const char* long_name, const char*& value) {
    const char* arg = argv[i];
    const size_t long_len = strlen(long_name);
    if (strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        value = arg + long_len + 1;
        return true;
    }
    if (strcmp(arg, short_name) != 0 && strcmp(arg, long_name) != 0) {
        return false;
    }
    if (i + 1 >= argc) {
        printf("Error: %s requires an argument\n", long_name);
        value = nullptr;
        return true;
    }
    value = argv[++i];
    return true;
}

bool parse_command_list(const std::string& text, std::vector<NavCommand>& out) {
    std::vector<NavCommand> commands;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        const std::string name = text.substr(start, comma - start);
        auto command = parse_nav_command(name);
        if (!command) {
            printf("Error: unknown command '%s'\n", name.c_str());
            return false;
        }
        commands.push_back(*command);
        start = comma + 1;
    }
    out = std::move(commands);
    return true;
}

CliStatus parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* value = nullptr;

        if (option_value(argc, argv, i, "-c", "--config", value)) {
            if (!value)
                return CliStatus::USAGE_ERROR;
            args.config_path = value;
        } else if (option_value(argc, argv, i, "-b", "--base", value)) {
            if (!value)
                return CliStatus::USAGE_ERROR;
            args.base_dir = value;
        } else if (option_value(argc, argv, i, "-t", "--thumbnail", value)) {
            if (!value)
                return CliStatus::USAGE_ERROR;
            args.thumbnail_path = value;
        } else if (option_value(argc, argv, i, "-r", "--reformat", value)) {
            if (!value)
                return CliStatus::USAGE_ERROR;
            ReformatMode mode;
            if (!parse_reformat_mode(value, mode)) {
                printf("Error: invalid --reformat value: %s\n", value);
                printf("Valid values: fit, fill, distort, expanding\n");
                return CliStatus::USAGE_ERROR;
            }
            args.reformat = mode;
        } else if (option_value(argc, argv, i, "-n", "--navigate", value)) {
            if (!value || !parse_command_list(value, args.commands))
                return CliStatus::USAGE_ERROR;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            return CliStatus::EXIT;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("vnav-inspect %s\n", VNAV_VERSION);
            return CliStatus::EXIT;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            printf("Error: unknown option: %s\n", argv[i]);
            printf("Run '%s --help' for usage\n", argv[0]);
            return CliStatus::USAGE_ERROR;
        } else if (args.path.empty()) {
            args.path = argv[i];
        } else {
            printf("Error: unexpected argument: %s\n", argv[i]);
            return CliStatus::USAGE_ERROR;
        }
    }

    if (args.path.empty()) {
        printf("Error: missing PATH\n");
        printf("Run '%s --help' for usage\n", argv[0]);
        return CliStatus::USAGE_ERROR;
    }
    return CliStatus::RUN;
}

} // namespace vnav
