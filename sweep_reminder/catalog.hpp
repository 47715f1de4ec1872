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
#ifndef SWEEP_REMINDER_CATALOG_HPP_
#define SWEEP_REMINDER_CATALOG_HPP_

#include <stddef.h>       // for size_t
#include <future>         // for future
#include <memory>         // for shared_ptr
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <vector>         // for vector
#include "config.hpp"
#include "geo.hpp"
#include "rules.hpp"
#include "spatial_index.hpp"

using std::future;
using std::shared_ptr;
using std::string;
using std::unordered_map;
using std::vector;

namespace catalog {

// Immutable rule table plus the grid built over it.
// Safe for concurrent readers once constructed.
class ScheduleCatalog {
 public:
    static shared_ptr<const ScheduleCatalog> fromRules(
        vector<rules::ScheduleRule> rules, const config::EngineConfig& cfg);
    static shared_ptr<const ScheduleCatalog> loadCsv(
        const string& path, const config::EngineConfig& cfg);
    static future<shared_ptr<const ScheduleCatalog>> loadCsvAsync(
        const string& path, const config::EngineConfig& cfg);

    // only the factories can make a Key
    class Key {
        friend class ScheduleCatalog;
        Key() {}
    };
    ScheduleCatalog(Key, vector<rules::ScheduleRule> rules, double cellSizeDeg);

    ScheduleCatalog(const ScheduleCatalog&) = delete;
    ScheduleCatalog& operator=(const ScheduleCatalog&) = delete;

    const vector<rules::ScheduleRule>& rules() const { return rules_; }
    bool empty() const { return rules_.empty(); }
    size_t size() const { return rules_.size(); }
    double cellSizeDeg() const { return grid_.cellSizeDeg(); }

    vector<const rules::ScheduleRule*> candidatesNear(const geo::Point& point, int radiusCells) const;
    const rules::ScheduleRule* findById(const string& id) const;

 private:
    vector<rules::ScheduleRule> rules_;
    spatial_index::SpatialGrid grid_;
    unordered_map<string, size_t> byId_;
};

typedef shared_ptr<const ScheduleCatalog> CatalogPtr;

}  // namespace catalog

#endif  // SWEEP_REMINDER_CATALOG_HPP_
