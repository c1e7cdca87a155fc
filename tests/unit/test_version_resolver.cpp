// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "format_utils.h"
#include "version_resolver.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

using namespace vnav;

namespace {

std::vector<int> numbers(const std::vector<VersionEntry>& entries) {
    std::vector<int> out;
    for (const auto& e : entries) {
        out.push_back(e.version);
    }
    return out;
}

VersionEntry entry_for(int version) {
    VersionEntry e;
    e.version = version;
    e.path = "/p/v" + std::to_string(version);
    e.exists = true;
    return e;
}

} // namespace

class VersionResolverFixture : public TempDirFixture {
  protected:
    DirectoryListingCache listings;
    VersionSetResolver resolver{listings};

    std::vector<VersionEntry> resolve(const std::string& rel) {
        auto tmpl = PathTemplateParser::parse(path(rel), "");
        REQUIRE(tmpl.has_value());
        return resolver.resolve(*tmpl);
    }
};

// ============================================================================
// resolve()
// ============================================================================

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: finds sibling files",
                 "[version_resolver][resolve]") {
    touch("comp/plate_v001.exr");
    touch("comp/plate_v002.exr");
    touch("comp/plate_v005.exr");
    touch("comp/plate_v008.exr");
    touch("comp/other_v003.exr");
    touch("comp/plate_v004.jpg");

    auto entries = resolve("comp/plate_v002.exr");

    CHECK(numbers(entries) == std::vector<int>{1, 2, 5, 8});
    CHECK(entries[2].path == path("comp/plate_v005.exr"));
    CHECK(entries[2].digits == "005");
    CHECK(std::all_of(entries.begin(), entries.end(),
                      [](const VersionEntry& e) { return e.exists; }));
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: accepts any digit count",
                 "[version_resolver][resolve]") {
    touch("comp/plate_v1.exr");
    touch("comp/plate_v02.exr");
    touch("comp/plate_v0010.exr");

    auto entries = resolve("comp/plate_v02.exr");

    REQUIRE(numbers(entries) == std::vector<int>{1, 2, 10});
    CHECK(entries[0].source_path == path("comp/plate_v1.exr"));
    CHECK(entries[2].source_path == path("comp/plate_v0010.exr"));
}

TEST_CASE_METHOD(VersionResolverFixture,
                 "VersionResolver: same number twice prefers the template width",
                 "[version_resolver][resolve]") {
    touch("comp/plate_v3.exr");
    touch("comp/plate_v003.exr");

    auto entries = resolve("comp/plate_v001.exr");

    REQUIRE(entries.size() == 1);
    CHECK(entries[0].digits == "003");
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: sequence files collapse per version",
                 "[version_resolver][resolve][sequence]") {
    touch_frames("seq/shot_v001.%04d.exr", 1, 3);
    touch_frames("seq/shot_v002.%04d.exr", 1, 3);

    auto entries = resolve("seq/shot_v001.####.exr");

    REQUIRE(numbers(entries) == std::vector<int>{1, 2});
    CHECK(entries[1].source_path == path("seq/shot_v002.####.exr"));
}

TEST_CASE_METHOD(VersionResolverFixture,
                 "VersionResolver: linked directory markers list sibling directories",
                 "[version_resolver][resolve]") {
    touch("render/v001/shot_v001.exr");
    touch("render/v002/shot_v002.exr");

    auto entries = resolve("render/v001/shot_v001.exr");

    REQUIRE(numbers(entries) == std::vector<int>{1, 2});
    CHECK(entries[1].path == path("render/v002/shot_v002.exr"));
    CHECK(entries[1].exists);
}

TEST_CASE_METHOD(VersionResolverFixture,
                 "VersionResolver: versioned directory and file must carry the same digits",
                 "[version_resolver][resolve]") {
    touch("shots/render_v001/shot_v001.exr");
    touch("shots/render_v002/shot_v002.exr");
    touch("shots/render_v001/shot_v007.exr"); // stray file, render_v007 does not exist
    touch("shots/render_v003/shot_v004.exr");

    auto entries = resolve("shots/render_v001/shot_v001.exr");

    REQUIRE(numbers(entries) == std::vector<int>{1, 2});
    CHECK(entries[0].path == path("shots/render_v001/shot_v001.exr"));
    CHECK(entries[1].path == path("shots/render_v002/shot_v002.exr"));
    CHECK(std::all_of(entries.begin(), entries.end(),
                      [](const VersionEntry& e) { return e.exists; }));
}

TEST_CASE_METHOD(VersionResolverFixture,
                 "VersionResolver: literal directories between linked markers",
                 "[version_resolver][resolve]") {
    touch_frames("seq_v001/exr/seq_v001.%04d.exr", 1, 2);
    touch_frames("seq_v002/exr/seq_v002.%04d.exr", 1, 2);
    touch_frames("seq_v003/jpg/seq_v003.%04d.exr", 1, 2);

    auto entries = resolve("seq_v001/exr/seq_v001.####.exr");

    REQUIRE(numbers(entries) == std::vector<int>{1, 2});
    CHECK(entries[1].source_path == path("seq_v002/exr/seq_v002.####.exr"));
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: markers in one name must agree",
                 "[version_resolver][resolve]") {
    touch("comp/v001_plate_v001.exr");
    touch("comp/v002_plate_v002.exr");
    touch("comp/v003_plate_v001.exr");

    auto entries = resolve("comp/v001_plate_v001.exr");

    CHECK(numbers(entries) == std::vector<int>{1, 2});
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: directory markers",
                 "[version_resolver][resolve][directory]") {
    touch("cache/sim_v001/points.abc");
    touch("cache/sim_v002/points.abc");
    make_dir("cache/sim_v003"); // no points.abc yet
    touch("cache/sim_v004.txt");

    auto entries = resolve("cache/sim_v001/points.abc");

    REQUIRE(numbers(entries) == std::vector<int>{1, 2, 3});
    CHECK(entries[0].exists);
    CHECK(entries[1].exists);
    CHECK_FALSE(entries[2].exists);
    CHECK(entries[1].path == path("cache/sim_v002/points.abc"));
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: directory marker over a sequence",
                 "[version_resolver][resolve][directory]") {
    touch_frames("r/shot_v001/beauty.%04d.exr", 1001, 1003);
    make_dir("r/shot_v002");

    auto entries = resolve("r/shot_v001/beauty.####.exr");

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].exists);
    CHECK_FALSE(entries[1].exists);
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: relative templates",
                 "[version_resolver][resolve]") {
    touch("proj/comp/plate_v001.exr");
    touch("proj/comp/plate_v002.exr");

    auto tmpl = PathTemplateParser::parse("comp/plate_v001.exr", path("proj"));
    REQUIRE(tmpl.has_value());
    auto entries = resolver.resolve(*tmpl);

    REQUIRE(entries.size() == 2);
    CHECK(entries[1].source_path == "comp/plate_v002.exr");
    CHECK(entries[1].path == path("proj/comp/plate_v002.exr"));
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: unreadable directory",
                 "[version_resolver][resolve]") {
    auto entries = resolve("missing/plate_v001.exr");

    CHECK(entries.empty());
    REQUIRE(resolver.warnings().size() == 1);
    const VersionError& warning = resolver.warnings()[0];
    CHECK(warning.type == VersionErrorType::IO_ERROR);
    CHECK(warning.path == path("missing"));
    CHECK(warning.user_message().find("missing") != std::string::npos);

    resolver.clear_warnings();
    CHECK(resolver.warnings().empty());
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: lists each directory once",
                 "[version_resolver][resolve]") {
    touch("comp/plate_v001.exr");
    touch("comp/matte_v001.exr");

    resolve("comp/plate_v001.exr");
    resolve("comp/matte_v001.exr");

    CHECK(listings.read_count() == 1);
}

// ============================================================================
// navigate()
// ============================================================================

TEST_CASE("VersionResolver: navigate over {1,2,5,8}", "[version_resolver][navigate]") {
    const std::vector<VersionEntry> entries = {entry_for(1), entry_for(2), entry_for(5),
                                               entry_for(8)};

    SECTION("from 2") {
        const VersionEntry current = entry_for(2);
        CHECK(VersionSetResolver::navigate(entries, current, NavDirection::NEXT).version == 5);
        CHECK(VersionSetResolver::navigate(entries, current, NavDirection::PREV).version == 1);
        CHECK(VersionSetResolver::navigate(entries, current, NavDirection::MAX).version == 8);
        CHECK(VersionSetResolver::navigate(entries, current, NavDirection::MIN).version == 1);
    }

    SECTION("clamps at the ends") {
        CHECK(VersionSetResolver::navigate(entries, entry_for(8), NavDirection::NEXT).version ==
              8);
        CHECK(VersionSetResolver::navigate(entries, entry_for(1), NavDirection::PREV).version ==
              1);
    }

    SECTION("current version not on disk") {
        CHECK(VersionSetResolver::navigate(entries, entry_for(3), NavDirection::NEXT).version ==
              5);
        CHECK(VersionSetResolver::navigate(entries, entry_for(3), NavDirection::PREV).version ==
              2);
        CHECK(VersionSetResolver::navigate(entries, entry_for(9), NavDirection::NEXT).version ==
              8);
        CHECK(VersionSetResolver::navigate(entries, entry_for(0), NavDirection::PREV).version ==
              1);
    }
}

TEST_CASE("VersionResolver: navigate over an empty set keeps the input",
          "[version_resolver][navigate]") {
    const std::vector<VersionEntry> none;
    VersionEntry current = entry_for(4);
    current.exists = false;

    for (NavDirection d :
         {NavDirection::NEXT, NavDirection::PREV, NavDirection::MIN, NavDirection::MAX}) {
        CHECK(VersionSetResolver::navigate(none, current, d) == current);
    }
}

// ============================================================================
// current_entry() / format_date()
// ============================================================================

TEST_CASE("VersionResolver: current_entry synthesizes a missing version",
          "[version_resolver]") {
    auto tmpl = PathTemplateParser::parse("/p/plate_v007.exr", "");
    REQUIRE(tmpl.has_value());

    SECTION("present in the set") {
        std::vector<VersionEntry> entries = {entry_for(7)};
        CHECK(VersionSetResolver::current_entry(*tmpl, entries) == entries[0]);
    }

    SECTION("absent from the set") {
        VersionEntry e = VersionSetResolver::current_entry(*tmpl, {entry_for(1)});
        CHECK(e.version == 7);
        CHECK(e.digits == "007");
        CHECK(e.path == "/p/plate_v007.exr");
        CHECK_FALSE(e.exists);
    }
}

TEST_CASE_METHOD(VersionResolverFixture, "VersionResolver: format_date",
                 "[version_resolver][date]") {
    SECTION("single file") {
        touch("d/plate_v001.exr");
        auto entries = resolve("d/plate_v001.exr");
        REQUIRE(entries.size() == 1);

        const std::string date = VersionSetResolver::format_date(entries[0], FrameRange{});
        CHECK(date != format::UNAVAILABLE);
        CHECK(date.size() == std::string("2026-01-01 00:00").size());
    }

    SECTION("sequence uses its last frame") {
        touch_frames("s/shot_v001.%04d.exr", 1, 2);
        auto entries = resolve("s/shot_v001.####.exr");
        REQUIRE(entries.size() == 1);

        FrameRange range;
        range.first = 1;
        range.last = 2;
        CHECK(VersionSetResolver::format_date(entries[0], range) != format::UNAVAILABLE);
        CHECK(VersionSetResolver::format_date(entries[0], FrameRange{}) == format::UNAVAILABLE);
    }

    SECTION("missing file") {
        VersionEntry ghost = entry_for(3);
        ghost.path = path("nowhere_v003.exr");
        CHECK(VersionSetResolver::format_date(ghost, FrameRange{}) == format::UNAVAILABLE);
    }
}
