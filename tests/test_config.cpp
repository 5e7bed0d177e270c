// Copyright 2026 Maree Carroll
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "../curbside/config.hpp"
#include "../curbside/log.hpp"

using std::string;
using json = nlohmann::json;

using config::ConfigError;
using config::EngineConfig;

using config::applyJson;
using config::defaultConfig;
using config::effectiveThreads;
using config::loadConfig;
using config::validate;

// -----------------------------------------------------------------------------
// Tests for defaults and overrides
// -----------------------------------------------------------------------------

TEST_CASE("defaultConfig carries the join thresholds in meters") {
    const EngineConfig cfg = defaultConfig();
    CHECK(cfg.join.clearThresholdMeters == doctest::Approx(6.0));
    CHECK(cfg.join.boundaryThresholdMeters == doctest::Approx(15.0));
    CHECK(cfg.join.searchRadiusMeters == doctest::Approx(40.0));
    CHECK(cfg.join.curbOffsetMeters == doctest::Approx(5.0));
    CHECK_EQ(cfg.legality.rppDefaultVisitorMinutes, 120);
    CHECK_EQ(cfg.source.domain, "data.sfgov.org");
    CHECK_NOTHROW(validate(cfg));
}

TEST_CASE("applyJson overlays only the fields present") {
    EngineConfig cfg = defaultConfig();
    applyJson(json::parse(R"({
        "join": { "clear_threshold_m": 4.5, "curb_offset_m": 3 },
        "legality": { "rpp_default_visitor_minutes": 60 },
        "source": { "app_token": "abc", "page_size": 1000, "timeout_s": 60 },
        "threads": 2,
        "log_level": "debug"
    })"), &cfg);

    CHECK(cfg.join.clearThresholdMeters == doctest::Approx(4.5));
    CHECK(cfg.join.curbOffsetMeters == doctest::Approx(3.0));
    CHECK(cfg.join.boundaryThresholdMeters == doctest::Approx(15.0));
    CHECK_EQ(cfg.legality.rppDefaultVisitorMinutes, 60);
    CHECK_EQ(cfg.source.appToken, "abc");
    CHECK_EQ(cfg.source.pageSize, 1000);
    CHECK_EQ(cfg.source.timeoutSeconds, 60);
    CHECK_EQ(cfg.threads, 2u);
    CHECK_EQ(cfg.logLevel, "debug");
}

TEST_CASE("applyJson rejects a non-object root and mistyped values") {
    EngineConfig cfg = defaultConfig();
    CHECK_THROWS_AS(applyJson(json::array(), &cfg), ConfigError);
    CHECK_THROWS_AS(applyJson(json::parse(R"({"join": {"search_radius_m": "far"}})"), &cfg), ConfigError);
}

TEST_CASE("validate rejects inconsistent thresholds") {
    EngineConfig cfg = defaultConfig();
    cfg.join.clearThresholdMeters = 20.0;
    CHECK_THROWS_AS(validate(cfg), ConfigError);

    cfg = defaultConfig();
    cfg.join.boundaryThresholdMeters = 50.0;
    CHECK_THROWS_AS(validate(cfg), ConfigError);

    cfg = defaultConfig();
    cfg.source.pageSize = 0;
    CHECK_THROWS_AS(validate(cfg), ConfigError);

    cfg = defaultConfig();
    cfg.source.timeoutSeconds = 0;
    CHECK_THROWS_AS(validate(cfg), ConfigError);

    cfg = defaultConfig();
    cfg.logLevel = "chatty";
    CHECK_THROWS_AS(validate(cfg), ConfigError);
}

TEST_CASE("loadConfig reads a file and fails on a missing one") {
    const string path = "curbside_test_config.json";
    {
        std::ofstream out(path);
        out << R"({"join": {"search_radius_m": 60}, "legality": {"min_interpretation_confidence": 0.9}})";
    }
    const EngineConfig cfg = loadConfig(path);
    std::remove(path.c_str());

    CHECK(cfg.join.searchRadiusMeters == doctest::Approx(60.0));
    CHECK(cfg.legality.minInterpretationConfidence == doctest::Approx(0.9));
    CHECK_THROWS_AS(loadConfig("no/such/config.json"), ConfigError);
}

TEST_CASE("effectiveThreads falls back to hardware concurrency") {
    EngineConfig cfg = defaultConfig();
    cfg.threads = 3;
    CHECK_EQ(effectiveThreads(cfg), 3u);
    cfg.threads = 0;
    CHECK(effectiveThreads(cfg) >= 1u);
}

// -----------------------------------------------------------------------------
// Tests for logging
// -----------------------------------------------------------------------------

TEST_CASE("logging filters below the current level") {
    std::ostringstream sink;
    const logging::Level saved = logging::level();
    logging::setSink(&sink);
    logging::setLevel(logging::Level::Warn);

    logging::info("loaded 10 centerlines");
    logging::warn("regulation 7 skipped");

    logging::setSink(nullptr);
    logging::setLevel(saved);

    CHECK_EQ(sink.str(), "[warn] regulation 7 skipped\n");
}

TEST_CASE("parseLevel accepts level names in any case") {
    logging::Level lvl = logging::Level::Info;
    CHECK(logging::parseLevel("WARNING", &lvl));
    CHECK(lvl == logging::Level::Warn);
    CHECK(logging::parseLevel("quiet", &lvl));
    CHECK(lvl == logging::Level::Off);
    CHECK_FALSE(logging::parseLevel("verbose", &lvl));
}
