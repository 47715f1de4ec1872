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
#include "catalog.hpp"
#include <future>    // for async, launch
#include <iostream>  // for cerr
#include <memory>    // for make_shared
#include <utility>   // for move

using std::cerr;

using config::EngineConfig;
using rules::ScheduleRule;

namespace catalog {
    ScheduleCatalog::ScheduleCatalog(Key, vector<ScheduleRule> rules, double cellSizeDeg)
        : grid_(cellSizeDeg) {
        rules_.reserve(rules.size());
        size_t duplicates = 0;
        for (auto& rule : rules) {
            if (byId_.count(rule.id)) {
                ++duplicates;
                continue;
            }
            byId_[rule.id] = rules_.size();
            rules_.push_back(std::move(rule));
        }
        if (duplicates > 0) {
            cerr << "[warn] Ignored " << duplicates << " rules with a repeated id\n";
        }
        // rules_ is final; the grid may now point into it
        for (const auto& rule : rules_) grid_.insert(&rule);
    }

    shared_ptr<const ScheduleCatalog> ScheduleCatalog::fromRules(
        vector<ScheduleRule> rules, const EngineConfig& cfg) {
        return std::make_shared<const ScheduleCatalog>(Key(), std::move(rules), cfg.cellSizeDeg);
    }

    // Loads and indexes a rule table.
    // An unreadable file gives an empty catalog, never an exception.
    //
    // Args:
    //    path: delimited rule file
    //    cfg: supplies the grid cell size
    // Returns:
    //    the catalog, possibly empty
    shared_ptr<const ScheduleCatalog> ScheduleCatalog::loadCsv(const string& path, const EngineConfig& cfg) {
        auto loaded = rules::loadRulesCsv(path);
        if (loaded.sourceAvailable) {
            cerr << "[info] Loaded " << loaded.rules.size() << " rules from " << path
                << " (" << loaded.rowsDropped << " of " << loaded.rowsRead << " rows skipped)\n";
        }
        return fromRules(std::move(loaded.rules), cfg);
    }

    future<shared_ptr<const ScheduleCatalog>> ScheduleCatalog::loadCsvAsync(
        const string& path, const EngineConfig& cfg) {
        return std::async(std::launch::async, [path, cfg]() { return loadCsv(path, cfg); });
    }

    vector<const ScheduleRule*> ScheduleCatalog::candidatesNear(const geo::Point& point, int radiusCells) const {
        return grid_.candidatesNear(point, radiusCells);
    }

    const ScheduleRule* ScheduleCatalog::findById(const string& id) const {
        auto it = byId_.find(id);
        return it == byId_.end() ? nullptr : &rules_[it->second];
    }
}  // namespace catalog
