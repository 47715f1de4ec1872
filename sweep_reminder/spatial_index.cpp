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
#include "spatial_index.hpp"
#include <cmath>          // for floor
#include <stdexcept>      // for runtime_error
#include <string>         // for string
#include <unordered_set>  // for unordered_set
#include <vector>         // for vector

using std::runtime_error;
using std::string;
using std::unordered_set;
using std::vector;

using rules::ScheduleRule;

namespace spatial_index {
    SpatialGrid::SpatialGrid(double cellSizeDeg) : cellSizeDeg_(cellSizeDeg) {
        if (!(cellSizeDeg > 0.0)) throw runtime_error("Grid cell size must be positive");
    }

    CellKey SpatialGrid::cellOf(const geo::Point& point) const {
        CellKey key;
        key.x = static_cast<int64_t>(std::floor(point.lon / cellSizeDeg_));
        key.y = static_cast<int64_t>(std::floor(point.lat / cellSizeDeg_));
        return key;
    }

    // Registers a rule in every cell holding one of its vertices
    //
    // Args:
    //    rule: rule owned by the caller, listed at most once per cell
    void SpatialGrid::insert(const ScheduleRule* rule) {
        unordered_set<CellKey, CellKeyHash> seen;
        for (const auto& vertex : rule->geometry) {
            const CellKey key = cellOf(vertex);
            if (!seen.insert(key).second) continue;
            cells_[key].push_back(rule);
        }
    }

    // Collects rules from the (2r+1)^2 block of cells around point
    //
    // Args:
    //    point: query location
    //    radiusCells: block half-width in cells
    // Returns:
    //    candidate rules, each id listed once
    vector<const ScheduleRule*> SpatialGrid::candidatesNear(const geo::Point& point, int radiusCells) const {
        vector<const ScheduleRule*> out;
        if (radiusCells < 0) return out;
        unordered_set<string> seenIds;
        const CellKey centre = cellOf(point);
        for (int64_t dx = -radiusCells; dx <= radiusCells; ++dx) {
            for (int64_t dy = -radiusCells; dy <= radiusCells; ++dy) {
                auto it = cells_.find(CellKey{centre.x + dx, centre.y + dy});
                if (it == cells_.end()) continue;
                for (const auto* rule : it->second) {
                    if (seenIds.insert(rule->id).second) out.push_back(rule);
                }
            }
        }
        return out;
    }
}  // namespace spatial_index
