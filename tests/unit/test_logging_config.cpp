// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <hv/hlog.h>

#include <catch2/catch_test_macros.hpp>

using namespace vnav::logging;

// ============================================================================
// parse_level() tests
// ============================================================================

TEST_CASE("parse_level: valid level strings", "[logging][config]") {
    SECTION("trace") {
        REQUIRE(parse_level("trace") == spdlog::level::trace);
    }

    SECTION("debug") {
        REQUIRE(parse_level("debug") == spdlog::level::debug);
    }

    SECTION("info") {
        REQUIRE(parse_level("info") == spdlog::level::info);
    }

    SECTION("warn and its alias") {
        REQUIRE(parse_level("warn") == spdlog::level::warn);
        REQUIRE(parse_level("warning") == spdlog::level::warn);
    }

    SECTION("error") {
        REQUIRE(parse_level("error") == spdlog::level::err);
    }

    SECTION("critical") {
        REQUIRE(parse_level("critical") == spdlog::level::critical);
    }

    SECTION("off") {
        REQUIRE(parse_level("off") == spdlog::level::off);
    }
}

TEST_CASE("parse_level: returns default for invalid input", "[logging][config]") {
    REQUIRE(parse_level("", spdlog::level::debug) == spdlog::level::debug);
    REQUIRE(parse_level("verbose") == spdlog::level::warn);
    REQUIRE(parse_level("TRACE", spdlog::level::info) == spdlog::level::info); // case sensitive
}

// ============================================================================
// verbosity_to_level() tests
// ============================================================================

TEST_CASE("verbosity_to_level: CLI verbosity flags", "[logging][config]") {
    REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(0) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(1) == spdlog::level::info);
    REQUIRE(verbosity_to_level(2) == spdlog::level::debug);
    REQUIRE(verbosity_to_level(3) == spdlog::level::trace);
    REQUIRE(verbosity_to_level(7) == spdlog::level::trace);
}

// ============================================================================
// to_hv_level() tests
// ============================================================================

TEST_CASE("to_hv_level: spdlog to libhv level mapping", "[logging][config]") {
    // libhv has no trace level
    REQUIRE(to_hv_level(spdlog::level::trace) == LOG_LEVEL_DEBUG);
    REQUIRE(to_hv_level(spdlog::level::debug) == LOG_LEVEL_DEBUG);
    REQUIRE(to_hv_level(spdlog::level::info) == LOG_LEVEL_INFO);
    REQUIRE(to_hv_level(spdlog::level::warn) == LOG_LEVEL_WARN);
    REQUIRE(to_hv_level(spdlog::level::err) == LOG_LEVEL_ERROR);
    REQUIRE(to_hv_level(spdlog::level::critical) == LOG_LEVEL_FATAL);
    REQUIRE(to_hv_level(spdlog::level::off) == LOG_LEVEL_SILENT);
}

// ============================================================================
// resolve_log_level() tests
// ============================================================================

TEST_CASE("resolve_log_level: precedence rules", "[logging][config]") {
    SECTION("CLI verbosity takes precedence over config") {
        REQUIRE(resolve_log_level(2, "error") == spdlog::level::debug);
    }

    SECTION("config file used when no CLI verbosity") {
        REQUIRE(resolve_log_level(0, "trace") == spdlog::level::trace);
    }

    SECTION("warn when neither is set") {
        REQUIRE(resolve_log_level(0, "") == spdlog::level::warn);
        REQUIRE(resolve_log_level(0, "loud") == spdlog::level::warn);
    }
}

// ============================================================================
// parse_log_target() tests
// ============================================================================

TEST_CASE("parse_log_target: valid targets", "[logging][config]") {
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
}

TEST_CASE("parse_log_target: defaults to Auto for unknown", "[logging][config]") {
    REQUIRE(parse_log_target("journal") == LogTarget::Auto);
    REQUIRE(parse_log_target("") == LogTarget::Auto);
    REQUIRE(parse_log_target("CONSOLE") == LogTarget::Auto); // case sensitive
}

TEST_CASE("log_target_name: round-trip", "[logging][config]") {
    for (LogTarget target :
         {LogTarget::Auto, LogTarget::Syslog, LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
    REQUIRE(std::string(log_target_name(LogTarget::File)) == "file");
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("init: installs the vnav logger at the requested level", "[logging]") {
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;

    init(config);

    REQUIRE(spdlog::default_logger()->name() == "vnav");
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::debug);

    // Leave tests quiet
    config.level = spdlog::level::warn;
    init(config);
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::warn);
}
