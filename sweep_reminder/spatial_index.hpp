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
#ifndef SWEEP_REMINDER_SPATIAL_INDEX_HPP_
#define SWEEP_REMINDER_SPATIAL_INDEX_HPP_

#include <stddef.h>       // for size_t
#include <cstdint>        // for int64_t
#include <unordered_map>  // for unordered_map
#include <vector>         // for vector
#include "geo.hpp"
#include "rules.hpp"

using std::unordered_map;
using std::vector;

namespace spatial_index {

// integer cell coordinates at the grid resolution
struct CellKey {
    int64_t x{}, y{};
    bool operator==(const CellKey& other) const { return x == other.x && y == other.y; }
};

struct CellKeyHash {
    size_t operator()(const CellKey& key) const {
        return static_cast<size_t>(key.x * 73856093) ^ static_cast<size_t>(key.y * 19349663);
    }
};

// Uniform lon/lat grid mapping each cell to the rules with a vertex in it.
//
// Rules are registered by vertex only, so a long segment crossing a cell with
// no vertex inside it is not listed for that cell. Street blocks in the city
// dataset are short and densely vertexed, so the search radius covers them.
//
// The grid stores pointers; the rules must outlive it.
class SpatialGrid {
 public:
    explicit SpatialGrid(double cellSizeDeg);

    void insert(const rules::ScheduleRule* rule);
    vector<const rules::ScheduleRule*> candidatesNear(const geo::Point& point, int radiusCells) const;
    CellKey cellOf(const geo::Point& point) const;

    double cellSizeDeg() const { return cellSizeDeg_; }
    size_t cellCount() const { return cells_.size(); }

 private:
    double cellSizeDeg_;
    unordered_map<CellKey, vector<const rules::ScheduleRule*>, CellKeyHash> cells_;
};

}  // namespace spatial_index

#endif  // SWEEP_REMINDER_SPATIAL_INDEX_HPP_
