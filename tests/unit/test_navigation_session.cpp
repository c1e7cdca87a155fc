// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_shortcuts.h"
#include "navigation_session.h"

#include "../mocks/mock_thumbnail_generator.h"
#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace vnav;

// ============================================================================
// Opening
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: open resolves without touching nodes",
                 "[session][open]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    touch("comp/plate_v005.exr");
    auto node = add_node("read1", path("comp/plate_v002.exr"));

    auto session = make_session();
    REQUIRE(session->open());

    CHECK(session->is_open());
    CHECK(session->state() == SessionState::Idle);
    CHECK(session->versions().size() == 3);
    CHECK(session->current().version == 2);
    CHECK(session->initial() == session->current());
    CHECK(session->display_node().name() == "read1");
    CHECK(node->path_writes() == 0);
    CHECK(node->range_writes() == 0);
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: no displayable node",
                 "[session][open]") {
    auto plain = add_node("plain", path("comp/plate.exr"));
    auto empty = add_node("empty", "");

    auto session = make_session();
    VersionError error;
    CHECK_FALSE(session->open(&error));

    CHECK(error.type == VersionErrorType::NO_DISPLAYABLE_NODE);
    CHECK(session->last_error().type == VersionErrorType::NO_DISPLAYABLE_NODE);
    CHECK_FALSE(session->is_open());
    CHECK_FALSE(session->next_version());
    CHECK(session->last_error().type == VersionErrorType::INVALID_STATE);
    CHECK(plain->path_writes() == 0);
    CHECK(empty->path_writes() == 0);
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: sort key picks the display node",
                 "[session][open]") {
    touch("comp/bg_v001.exr");
    touch("comp/fg_v007.exr");
    add_node("bg", path("comp/bg_v001.exr"), std::nullopt, 2);
    add_node("fg", path("comp/fg_v007.exr"), std::nullopt, 0);

    config.node_sort_key_fct = [](const NodeAdapter&, int, int depth) {
        return SortKey{int64_t{depth}};
    };
    auto session = make_session();
    REQUIRE(session->open());

    CHECK(session->display_node().name() == "fg");
    CHECK(session->current().version == 7);
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: current version missing on disk",
                 "[session][open]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v004.exr");
    add_node("read1", path("comp/plate_v003.exr"));

    auto session = make_session();
    REQUIRE(session->open());

    CHECK(session->current().version == 3);
    CHECK_FALSE(session->current().exists);

    REQUIRE(session->next_version());
    CHECK(session->current().version == 4);
}

// ============================================================================
// Navigation and live preview
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: navigation with preview",
                 "[session][preview]") {
    for (int v : {1, 2, 5, 8}) {
        touch("comp/plate_v00" + std::to_string(v) + ".exr");
    }
    auto node = add_node("read1", path("comp/plate_v002.exr"));
    auto session = make_session();
    REQUIRE(session->open());

    REQUIRE(session->next_version());
    CHECK(session->state() == SessionState::Previewing);
    CHECK(session->current().version == 5);
    CHECK(node->get_path_value() == path("comp/plate_v005.exr"));

    session->max_version();
    CHECK(node->get_path_value() == path("comp/plate_v008.exr"));

    session->next_version();
    CHECK(session->current().version == 8);

    session->min_version();
    CHECK(node->get_path_value() == path("comp/plate_v001.exr"));

    session->prev_version();
    CHECK(session->current().version == 1);
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: navigation without preview",
                 "[session][preview]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    auto node = add_node("read1", path("comp/plate_v001.exr"));
    config.preview_enabled = false;

    auto session = make_session();
    REQUIRE(session->open());
    REQUIRE(session->next_version());

    CHECK(session->state() == SessionState::Idle);
    CHECK(session->current().version == 2);
    CHECK(node->path_writes() == 0);

    REQUIRE(session->confirm());
    CHECK(node->get_path_value() == path("comp/plate_v002.exr"));
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: toggling preview",
                 "[session][preview]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    const std::string original = path("comp/plate_v001.exr");
    auto node = add_node("read1", original);

    auto session = make_session();
    REQUIRE(session->open());
    session->next_version();
    REQUIRE(node->get_path_value() == path("comp/plate_v002.exr"));

    SECTION("turning it off restores the node and returns to Idle") {
        session->set_preview_enabled(false);
        CHECK(session->state() == SessionState::Idle);
        CHECK(node->get_path_value() == original);

        SECTION("turning it back on pushes the current version") {
            session->set_preview_enabled(true);
            CHECK(session->state() == SessionState::Previewing);
            CHECK(node->get_path_value() == path("comp/plate_v002.exr"));
        }
    }
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: frame ranges follow the version",
                 "[session][preview][range]") {
    touch_frames("r/shot_v001.%04d.exr", 1001, 1010);
    touch_frames("r/shot_v002.%04d.exr", 1, 5, {3});
    auto node = add_node("read1", path("r/shot_v001.####.exr"), NodeFrameRange{1001, 1010});

    SECTION("change_range on") {
        auto session = make_session();
        REQUIRE(session->open());
        session->next_version();

        CHECK(node->get_path_value() == path("r/shot_v002.####.exr"));
        CHECK(node->get_frame_range() == NodeFrameRange{1, 5});

        FrameRange range = session->frame_range(session->current());
        CHECK(range.gaps == std::vector<FrameGap>{{3, 3}});
    }

    SECTION("change_range off") {
        config.change_range = false;
        auto session = make_session();
        REQUIRE(session->open());
        session->next_version();

        CHECK(node->get_path_value() == path("r/shot_v002.####.exr"));
        CHECK(node->get_frame_range() == NodeFrameRange{1001, 1010});
        CHECK(node->range_writes() == 0);
    }
}

// ============================================================================
// Cancel / confirm
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: cancel restores every node",
                 "[session][cancel]") {
    touch_frames("r/shot_v001.%04d.exr", 1001, 1010);
    touch_frames("r/shot_v002.%04d.exr", 1, 5);
    touch_frames("r/shot_v003.%04d.exr", 1, 2);
    touch("r/matte_v001.exr");
    touch("r/matte_v003.exr");

    const std::string shot = path("r/shot_v001.####.exr");
    const std::string matte = path("r/matte_v001.exr");
    auto a = add_node("shot", shot, NodeFrameRange{1001, 1010});
    auto b = add_node("matte", matte);

    auto session = make_session();
    REQUIRE(session->open());
    session->next_version();
    session->next_version();
    REQUIRE(a->get_path_value() == path("r/shot_v003.####.exr"));
    REQUIRE(b->get_path_value() == path("r/matte_v003.exr"));

    REQUIRE(session->cancel());

    CHECK(session->state() == SessionState::Cancelled);
    CHECK(a->get_path_value() == shot);
    CHECK(a->get_frame_range() == NodeFrameRange{1001, 1010});
    CHECK(b->get_path_value() == matte);
    CHECK_FALSE(b->get_frame_range().has_value());
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: sequence node without a range keeps none",
                 "[session][cancel][range]") {
    touch_frames("shot_v001.%04d.exr", 1001, 1003);
    touch_frames("shot_v002.%04d.exr", 1001, 1003);
    const std::string original = path("shot_v001.####.exr");
    auto node = add_node("read1", original);

    auto session = make_session();
    REQUIRE(session->open());
    REQUIRE(session->next_version());
    REQUIRE(node->get_path_value() == path("shot_v002.####.exr"));
    CHECK_FALSE(node->get_frame_range().has_value());
    CHECK(node->range_writes() == 0);

    SECTION("cancel") {
        REQUIRE(session->cancel());
        CHECK(node->get_path_value() == original);
        CHECK_FALSE(node->get_frame_range().has_value());
    }

    SECTION("confirm") {
        REQUIRE(session->confirm());
        CHECK(node->get_path_value() == path("shot_v002.####.exr"));
        CHECK_FALSE(node->get_frame_range().has_value());
    }
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: confirm resolves per node",
                 "[session][confirm]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    touch("comp/plate_v003.exr");
    touch("comp/matte_v001.exr");
    touch("comp/matte_v002.exr");

    auto plate = add_node("plate", path("comp/plate_v001.exr"));
    auto matte = add_node("matte", path("comp/matte_v001.exr"));
    auto notes = add_node("notes", path("comp/notes.txt"));

    auto session = make_session();
    REQUIRE(session->open());
    session->max_version();
    // matte has no v003: it shows its own value during preview
    CHECK(matte->get_path_value() == path("comp/matte_v001.exr"));

    ConfirmReport report;
    REQUIRE(session->confirm(&report));

    CHECK(session->state() == SessionState::Confirmed);
    CHECK(report.version == 3);
    CHECK(report.updated == std::vector<std::string>{"plate"});
    CHECK(report.unchanged == std::vector<std::string>{"matte", "notes"});
    CHECK(plate->get_path_value() == path("comp/plate_v003.exr"));
    CHECK(matte->get_path_value() == path("comp/matte_v001.exr"));
    CHECK(notes->path_writes() == 0);
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: set_missing writes absent versions",
                 "[session][confirm][set_missing]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    touch("comp/plate_v003.exr");
    touch_frames("comp/matte_v01.%04d.exr", 1, 10);
    touch_frames("comp/matte_v02.%04d.exr", 1, 20);

    const std::string matte_path = path("comp/matte_v01.####.exr");
    auto plate = add_node("plate", path("comp/plate_v001.exr"));
    auto matte = add_node("matte", matte_path, NodeFrameRange{1, 10});
    auto notes = add_node("notes", path("comp/notes.txt"));
    config.set_missing = true;

    auto session = make_session();
    REQUIRE(session->open());

    SECTION("preview and confirm") {
        session->next_version();
        CHECK(matte->get_path_value() == path("comp/matte_v02.####.exr"));
        CHECK(matte->get_frame_range() == NodeFrameRange{1, 20});

        // No v03 on disk: the name is written with the node's own padding
        session->max_version();
        CHECK(matte->get_path_value() == path("comp/matte_v03.####.exr"));
        CHECK(matte->get_frame_range() == NodeFrameRange{1, 10});

        ConfirmReport report;
        REQUIRE(session->confirm(&report));
        CHECK(report.updated == std::vector<std::string>{"plate", "matte"});
        CHECK(report.unchanged == std::vector<std::string>{"notes"});
        CHECK(plate->get_path_value() == path("comp/plate_v003.exr"));
        CHECK(matte->get_path_value() == path("comp/matte_v03.####.exr"));
        CHECK(notes->path_writes() == 0);
    }

    SECTION("cancel restores") {
        session->max_version();
        REQUIRE(session->cancel());
        CHECK(matte->get_path_value() == matte_path);
        CHECK(matte->get_frame_range() == NodeFrameRange{1, 10});
    }

    SECTION("nodes that resolve no version at all are left alone") {
        auto orphan = add_node("orphan", path("gone/orphan_v001.exr"));
        auto late = make_session();
        REQUIRE(late->open());
        late->max_version();
        REQUIRE(late->confirm());
        CHECK(orphan->path_writes() == 0);
    }
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: terminal states reject commands",
                 "[session][terminal]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    auto node = add_node("read1", path("comp/plate_v001.exr"));

    auto session = make_session();
    REQUIRE(session->open());

    SECTION("after confirm") {
        REQUIRE(session->confirm());
        CHECK_FALSE(session->last_error().has_error());
        const int writes = node->path_writes();

        CHECK_FALSE(session->next_version());
        CHECK(session->last_error().type == VersionErrorType::INVALID_STATE);
        CHECK(session->last_error().message.find("Confirmed") != std::string::npos);
        CHECK_FALSE(session->cancel());
        CHECK_FALSE(session->confirm());
        CHECK_FALSE(session->open_folder());
        CHECK(session->state() == SessionState::Confirmed);
        CHECK(node->path_writes() == writes);
    }

    SECTION("after cancel") {
        REQUIRE(session->cancel());

        CHECK_FALSE(session->handle(NavCommand::MaxVersion));
        CHECK_FALSE(session->handle(NavCommand::Confirm));
        session->set_preview_enabled(false);
        CHECK(session->state() == SessionState::Cancelled);
        CHECK(session->preview_enabled());
    }
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: closing without a decision restores",
                 "[session][cancel]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    auto node = add_node("read1", path("comp/plate_v001.exr"));

    {
        auto session = make_session();
        REQUIRE(session->open());
        session->next_version();
        REQUIRE(node->get_path_value() == path("comp/plate_v002.exr"));
    }

    CHECK(node->get_path_value() == path("comp/plate_v001.exr"));
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: open folder reveals the version directory",
                 "[session]") {
    touch("shots/v001/plate_v001.exr");
    touch("shots/v002/plate_v002.exr");
    auto node = add_node("read1", path("shots/v001/plate_v001.exr"));

    auto session = make_session();
    REQUIRE(session->open());
    REQUIRE(session->open_folder());
    REQUIRE(node->revealed().size() == 1);
    CHECK(node->revealed()[0] == path("shots/v001"));
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: unreadable directory is a warning",
                 "[session]") {
    add_node("read1", path("gone/plate_v001.exr"));

    auto session = make_session();
    REQUIRE(session->open());
    CHECK(session->versions().empty());
    const std::vector<VersionError> warnings = session->warnings();
    REQUIRE_FALSE(warnings.empty());
    CHECK(warnings[0].type == VersionErrorType::IO_ERROR);
    CHECK(warnings[0].path == path("gone"));

    // Nothing to move to
    REQUIRE(session->next_version());
    CHECK(session->current().version == 1);
}

// ============================================================================
// Thumbnails
// ============================================================================

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: previews follow the current version",
                 "[session][thumbnail]") {
    touch_frames("r/shot_v001.%04d.exr", 1, 9);
    touch_frames("r/shot_v002.%04d.exr", 11, 21);
    add_node("read1", path("r/shot_v001.####.exr"));

    auto generator = std::make_shared<MockThumbnailGenerator>();
    auto cache = std::make_shared<ThumbnailCache>(generator, 8, 2);
    config.thumb_enabled = true;
    config.thumb_frame_mode = FrameMode::MIDDLE;

    std::vector<ThumbnailHandle> delivered;
    auto session = make_session(cache);
    session->set_thumbnail_listener(
        [&delivered](const ThumbnailHandle& h) { delivered.push_back(h); });

    generator->close_gate();
    REQUIRE(session->open());
    REQUIRE(session->next_version());

    auto key = session->current_thumbnail_key();
    REQUIRE(key.has_value());
    CHECK(key->path == path("r/shot_v002.####.exr"));
    CHECK(key->frame == 16);

    generator->release();
    cache->wait_for_idle();
    CHECK(cache->process_completions() == 2);

    // The v001 preview finished after the user moved on
    REQUIRE(delivered.size() == 1);
    CHECK(delivered[0].key == *key);
    CHECK(delivered[0].ready());
    REQUIRE(session->current_thumbnail().has_value());
    CHECK(session->current_thumbnail()->ready());
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: no previews when disabled",
                 "[session][thumbnail]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    add_node("read1", path("comp/plate_v001.exr"));

    auto generator = std::make_shared<MockThumbnailGenerator>();
    auto cache = std::make_shared<ThumbnailCache>(generator, 8, 1);
    config.thumb_enabled = false;

    auto session = make_session(cache);
    REQUIRE(session->open());
    session->next_version();
    cache->wait_for_idle();

    CHECK_FALSE(session->current_thumbnail_key().has_value());
    CHECK(generator->calls() == 0);
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: callbacks after destruction are ignored",
                 "[session][thumbnail]") {
    touch("comp/plate_v001.exr");
    add_node("read1", path("comp/plate_v001.exr"));

    auto generator = std::make_shared<MockThumbnailGenerator>();
    auto cache = std::make_shared<ThumbnailCache>(generator, 8, 1);
    config.thumb_enabled = true;
    int delivered = 0;

    {
        auto session = make_session(cache);
        session->set_thumbnail_listener([&delivered](const ThumbnailHandle&) { delivered++; });
        REQUIRE(session->open());
        cache->wait_for_idle();
    }

    CHECK(cache->process_completions() == 1);
    CHECK(delivered == 0);
}

// ============================================================================
// Commands and keys
// ============================================================================

TEST_CASE("NavigationSession: command names", "[session][commands]") {
    CHECK(parse_nav_command("next") == NavCommand::NextVersion);
    CHECK(parse_nav_command("prev") == NavCommand::PrevVersion);
    CHECK(parse_nav_command("min") == NavCommand::MinVersion);
    CHECK(parse_nav_command("max") == NavCommand::MaxVersion);
    CHECK(parse_nav_command("confirm") == NavCommand::Confirm);
    CHECK(parse_nav_command("cancel") == NavCommand::Cancel);
    CHECK(parse_nav_command("open") == NavCommand::OpenFolder);
    CHECK_FALSE(parse_nav_command("Next").has_value());
    CHECK_FALSE(parse_nav_command("").has_value());

    CHECK(std::string(nav_command_name(NavCommand::MaxVersion)) == "maxVersion");
    CHECK(std::string(session_state_name(SessionState::Previewing)) == "Previewing");
}

TEST_CASE_METHOD(SessionTestFixture, "NavigationSession: dialog key bindings",
                 "[session][commands]") {
    for (int v = 1; v <= 4; v++) {
        touch("comp/plate_v00" + std::to_string(v) + ".exr");
    }
    auto node = add_node("read1", path("comp/plate_v002.exr"));
    auto session = make_session();
    REQUIRE(session->open());

    input::KeyboardShortcuts keys;
    register_navigation_shortcuts(keys, *session);

    keys.dispatch(input::Key::Up, input::MOD_NONE);
    CHECK(session->current().version == 3);

    keys.dispatch(input::Key::Left, input::MOD_NONE);
    CHECK(session->current().version == 2);

    // Ctrl+Up is max only, not max then next
    keys.dispatch(input::Key::Up, input::MOD_CTRL);
    CHECK(session->current().version == 4);

    keys.dispatch(input::Key::Left, input::MOD_CTRL);
    CHECK(session->current().version == 1);

    keys.dispatch(input::Key::O, input::MOD_CTRL);
    CHECK(node->revealed().size() == 1);

    SECTION("Escape cancels") {
        keys.dispatch(input::Key::Escape, input::MOD_NONE);
        CHECK(session->state() == SessionState::Cancelled);
        CHECK(node->get_path_value() == path("comp/plate_v002.exr"));
    }

    SECTION("Return confirms") {
        keys.dispatch(input::Key::Return, input::MOD_NONE);
        CHECK(session->state() == SessionState::Confirmed);
        CHECK(node->get_path_value() == path("comp/plate_v001.exr"));
    }
}
