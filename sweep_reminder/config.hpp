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
#ifndef SWEEP_REMINDER_CONFIG_HPP_
#define SWEEP_REMINDER_CONFIG_HPP_

#include <stddef.h>               // for size_t
#include <nlohmann/json_fwd.hpp>  // for json
#include <stdexcept>              // for runtime_error
#include <string>                 // for string
#include "geo.hpp"
#include "recurrence.hpp"

using std::runtime_error;
using std::string;
using json = nlohmann::json;

namespace config {

const char DEFAULT_DATASET_URL[] = "https://data.sfgov.org/resource/yhqp-riqs.json";

// engine tunables; defaults match the city dataset and the mobile app
struct EngineConfig {
    // 50 feet
    double maxMatchRadiusMeters = 50.0 * geo::METERS_PER_FOOT;
    // ~100 m at city latitudes
    double cellSizeDeg = 0.001;
    int searchRadiusCells = 2;
    double nearbyRadiusMeters = 150.0;
    recurrence::Horizon horizon;
    size_t maxOccurrences = 8;
    // assumed cleaning duration when anchoring reminders after cleaning
    int afterCleaningMinutes = 120;
    int retryBackoffMs = 1000;
    size_t maxPreferences = 25;
    string datasetUrl = DEFAULT_DATASET_URL;
    int pageSize = 1000;
};

// malformed configuration file or value
class ConfigError : public runtime_error {
 public:
    using runtime_error::runtime_error;
};

EngineConfig configFromJson(const json& j);
EngineConfig loadConfigJson(const string& path);

}  // namespace config

#endif  // SWEEP_REMINDER_CONFIG_HPP_
