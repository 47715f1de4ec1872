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
#include "config.hpp"
#include <fstream>            // for ifstream
#include <nlohmann/json.hpp>  // for basic_json
#include <string>             // for string, to_string

using std::ifstream;
using std::string;

namespace config {
    static double numberAt(const json& j, const char* key, double current) {
        if (!j.contains(key)) return current;
        if (!j[key].is_number()) throw ConfigError(string("Config key '") + key + "' must be a number");
        return j[key].get<double>();
    }

    static double positiveAt(const json& j, const char* key, double current) {
        const double value = numberAt(j, key, current);
        if (!(value > 0.0)) throw ConfigError(string("Config key '") + key + "' must be positive");
        return value;
    }

    // A whole number within [lo, hi]
    static int integerAt(const json& j, const char* key, int current, int lo, int hi) {
        const double value = numberAt(j, key, current);
        if (value < lo || value > hi) {
            throw ConfigError(string("Config key '") + key + "' must be between " +
                std::to_string(lo) + " and " + std::to_string(hi));
        }
        return static_cast<int>(value);
    }

    static string stringAt(const json& j, const char* key, const string& current) {
        if (!j.contains(key)) return current;
        if (!j[key].is_string()) throw ConfigError(string("Config key '") + key + "' must be a string");
        return j[key].get<string>();
    }

    // Overlays the keys present in j onto the defaults.
    // Unknown keys are ignored.
    //
    // Args:
    //    j: a JSON object
    // Returns:
    //    the resulting configuration
    // Throws:
    //    ConfigError naming the first key with a bad type or value
    EngineConfig configFromJson(const json& j) {
        if (!j.is_object()) throw ConfigError("Config must be a JSON object");
        EngineConfig cfg;
        cfg.maxMatchRadiusMeters = positiveAt(j, "max_match_radius_m", cfg.maxMatchRadiusMeters);
        cfg.cellSizeDeg = positiveAt(j, "cell_size_deg", cfg.cellSizeDeg);
        cfg.searchRadiusCells = integerAt(j, "search_radius_cells", cfg.searchRadiusCells, 0, 64);
        cfg.nearbyRadiusMeters = positiveAt(j, "nearby_radius_m", cfg.nearbyRadiusMeters);

        const string unit = stringAt(j, "horizon_unit", "months");
        const auto parsedUnit = recurrence::parseHorizonUnit(unit);
        if (!parsedUnit) throw ConfigError("Config key 'horizon_unit' must be \"weeks\" or \"months\"");
        cfg.horizon.unit = *parsedUnit;
        cfg.horizon.amount = integerAt(j, "horizon_amount", cfg.horizon.amount, 1, 520);

        cfg.maxOccurrences = static_cast<size_t>(integerAt(j, "max_occurrences",
            static_cast<int>(cfg.maxOccurrences), 1, 1000));
        cfg.afterCleaningMinutes = integerAt(j, "after_cleaning_minutes", cfg.afterCleaningMinutes, 0, 24 * 60);
        cfg.retryBackoffMs = integerAt(j, "retry_backoff_ms", cfg.retryBackoffMs, 0, 60 * 1000);
        cfg.maxPreferences = static_cast<size_t>(integerAt(j, "max_preferences",
            static_cast<int>(cfg.maxPreferences), 1, 1000));
        cfg.datasetUrl = stringAt(j, "dataset_url", cfg.datasetUrl);
        cfg.pageSize = integerAt(j, "page_size", cfg.pageSize, 1, 50000);
        return cfg;
    }

    // Reads an engine configuration file
    //
    // Args:
    //    path: JSON file path
    // Returns:
    //    defaults overlaid with the file's keys
    EngineConfig loadConfigJson(const string& path) {
        ifstream in(path);
        if (!in) throw ConfigError("Failed to open config: " + path);
        const json j = json::parse(in, nullptr, false);
        if (j.is_discarded()) throw ConfigError("Config is not valid JSON: " + path);
        return configFromJson(j);
    }
}  // namespace config
