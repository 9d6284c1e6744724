// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointer_trace.h"

#include <catch2/catch_all.hpp>

#include <cmath>
#include <sstream>

using namespace gridsnake;
using Catch::Matchers::ContainsSubstring;

namespace {

bool parse(const std::string& text, std::vector<PointerSample>& out, std::string& error) {
    std::istringstream in(text);
    return parse_pointer_trace(in, out, error);
}

} // namespace

// ============================================================================
// parse_pointer_trace()
// ============================================================================

TEST_CASE("parse_pointer_trace: samples with and without a pointer", "[replay][trace]") {
    std::vector<PointerSample> samples;
    std::string error;

    REQUIRE(parse("0 343 225\n30 -\n60 400.5 265\n", samples, error));
    REQUIRE(error.empty());
    REQUIRE(samples.size() == 3);

    REQUIRE(samples[0].at == Millis(0));
    REQUIRE(samples[0].pointer.has_value());
    REQUIRE(samples[0].pointer->x == 343.0);
    REQUIRE(samples[0].pointer->y == 225.0);

    REQUIRE(samples[1].at == Millis(30));
    REQUIRE_FALSE(samples[1].pointer.has_value());

    REQUIRE(samples[2].pointer->x == Catch::Approx(400.5));
}

TEST_CASE("parse_pointer_trace: comments and blank lines", "[replay][trace]") {
    std::vector<PointerSample> samples;
    std::string error;

    REQUIRE(parse("# recorded at 30Hz\n\n   \n0 10 20  # first\n30 -\r\n", samples, error));
    REQUIRE(samples.size() == 2);
    REQUIRE(samples[1].at == Millis(30));
}

TEST_CASE("parse_pointer_trace: equal timestamps are allowed", "[replay][trace]") {
    std::vector<PointerSample> samples;
    std::string error;

    REQUIRE(parse("10 1 1\n10 2 2\n", samples, error));
    REQUIRE(samples.size() == 2);
}

TEST_CASE("parse_pointer_trace: malformed input", "[replay][trace]") {
    std::vector<PointerSample> samples;
    std::string error;

    SECTION("timestamp goes backwards") {
        REQUIRE_FALSE(parse("0 1 1\n50 -\n40 2 2\n", samples, error));
        REQUIRE_THAT(error, ContainsSubstring("line 3"));
        REQUIRE_THAT(error, ContainsSubstring("backwards"));
    }

    SECTION("negative timestamp") {
        REQUIRE_FALSE(parse("-5 1 1\n", samples, error));
        REQUIRE_THAT(error, ContainsSubstring("line 1"));
    }

    SECTION("missing y") {
        REQUIRE_FALSE(parse("0 1\n", samples, error));
        REQUIRE_THAT(error, ContainsSubstring("coordinates"));
    }

    SECTION("non-numeric x") {
        REQUIRE_FALSE(parse("# header\n0 abc 4\n", samples, error));
        REQUIRE_THAT(error, ContainsSubstring("line 2"));
    }

    SECTION("trailing token") {
        REQUIRE_FALSE(parse("0 1 2 3\n", samples, error));
        REQUIRE_THAT(error, ContainsSubstring("unexpected '3'"));
    }

    SECTION("timestamp only") {
        REQUIRE_FALSE(parse("15\n", samples, error));
    }
}

TEST_CASE("load_pointer_trace: missing file", "[replay][trace]") {
    std::vector<PointerSample> samples;
    std::string error;

    REQUIRE_FALSE(load_pointer_trace("/nonexistent/gridsnake/trace.txt", samples, error));
    REQUIRE_THAT(error, ContainsSubstring("cannot open"));
}

// ============================================================================
// circling_trace()
// ============================================================================

TEST_CASE("circling_trace: evenly spaced points on the circle", "[replay][trace]") {
    PixelPoint center{300.0, 200.0};
    auto samples = circling_trace(center, 50.0, Millis(1000), Millis(100), Millis(4000));

    REQUIRE(samples.size() == 11);
    REQUIRE(samples.front().at == Millis(0));
    REQUIRE(samples.back().at == Millis(1000));

    for (const auto& sample : samples) {
        REQUIRE(sample.pointer.has_value());
        double r = std::hypot(sample.pointer->x - center.x, sample.pointer->y - center.y);
        REQUIRE(r == Catch::Approx(50.0));
    }

    // Quarter revolution after 1000ms of a 4000ms period
    REQUIRE(samples.back().pointer->x == Catch::Approx(300.0).margin(1e-9));
    REQUIRE(samples.back().pointer->y == Catch::Approx(250.0));
}

TEST_CASE("circling_trace: non-positive periods give no samples", "[replay][trace]") {
    REQUIRE(circling_trace({0, 0}, 10.0, Millis(100), Millis(0), Millis(1000)).empty());
    REQUIRE(circling_trace({0, 0}, 10.0, Millis(100), Millis(10), Millis(0)).empty());
}
