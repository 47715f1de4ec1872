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
#include <string>
#include "../sweep_reminder/config.hpp"

using json = nlohmann::json;
using std::string;

using config::ConfigError;
using config::EngineConfig;
using config::configFromJson;
using recurrence::Horizon;

TEST_CASE("EngineConfig: defaults") {
    const EngineConfig cfg;
    CHECK(cfg.maxMatchRadiusMeters == doctest::Approx(15.24));
    CHECK(cfg.cellSizeDeg == doctest::Approx(0.001));
    CHECK(cfg.horizon.unit == Horizon::Unit::Months);
    CHECK_EQ(cfg.horizon.amount, 3);
    CHECK_EQ(cfg.afterCleaningMinutes, 120);
    CHECK_EQ(cfg.maxPreferences, 25);
    CHECK_EQ(cfg.datasetUrl, config::DEFAULT_DATASET_URL);
}

TEST_CASE("configFromJson: empty object keeps the defaults") {
    const EngineConfig cfg = configFromJson(json::object());
    CHECK(cfg.maxMatchRadiusMeters == doctest::Approx(EngineConfig().maxMatchRadiusMeters));
    CHECK_EQ(cfg.pageSize, 1000);
}

TEST_CASE("configFromJson: present keys override, unknown keys ignored") {
    const EngineConfig cfg = configFromJson(json{
        {"max_match_radius_m", 20.0},
        {"horizon_unit", "weeks"},
        {"horizon_amount", 6},
        {"after_cleaning_minutes", 90},
        {"retry_backoff_ms", 0},
        {"dataset_url", "https://example.org/rules.json"},
        {"colour", "teal"},
    });
    CHECK(cfg.maxMatchRadiusMeters == doctest::Approx(20.0));
    CHECK(cfg.horizon.unit == Horizon::Unit::Weeks);
    CHECK_EQ(cfg.horizon.amount, 6);
    CHECK_EQ(cfg.afterCleaningMinutes, 90);
    CHECK_EQ(cfg.retryBackoffMs, 0);
    CHECK_EQ(cfg.datasetUrl, "https://example.org/rules.json");
}

TEST_CASE("configFromJson: wrong types and values are rejected") {
    CHECK_THROWS_AS(configFromJson(json::array()), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"cell_size_deg", "small"}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"cell_size_deg", 0}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"horizon_unit", "fortnights"}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"dataset_url", 42}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"after_cleaning_minutes", -1}}), ConfigError);
    CHECK_THROWS_WITH_AS(configFromJson(json{{"page_size", -5}}),
                         "Config key 'page_size' must be between 1 and 50000", ConfigError);
}

TEST_CASE("configFromJson: counts too large for an int are rejected") {
    CHECK_THROWS_AS(configFromJson(json{{"horizon_amount", 1e12}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"search_radius_cells", 3000000000.0}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"max_occurrences", 1e30}}), ConfigError);
    CHECK_THROWS_AS(configFromJson(json{{"retry_backoff_ms", 1e15}}), ConfigError);
    CHECK_EQ(configFromJson(json{{"horizon_amount", 520}}).horizon.amount, 520);
}

TEST_CASE("loadConfigJson: reads a file, rejects missing or broken ones") {
    const string path = "sweep_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"search_radius_cells": 3, "nearby_radius_m": 250})";
    }
    const EngineConfig cfg = config::loadConfigJson(path);
    CHECK_EQ(cfg.searchRadiusCells, 3);
    CHECK(cfg.nearbyRadiusMeters == doctest::Approx(250.0));

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    CHECK_THROWS_AS(config::loadConfigJson(path), ConfigError);
    std::remove(path.c_str());

    CHECK_THROWS_AS(config::loadConfigJson("/nonexistent/sweep.json"), ConfigError);
}
