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
#ifndef SWEEP_REMINDER_RESOLVER_HPP_
#define SWEEP_REMINDER_RESOLVER_HPP_

#include <stddef.h>  // for size_t
#include <ctime>     // for time_t
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector
#include "catalog.hpp"
#include "config.hpp"
#include "geo.hpp"
#include "recurrence.hpp"
#include "rules.hpp"

using std::optional;
using std::string;
using std::vector;

namespace resolver {

// largest cell block nearby() walks before scanning every rule
const int MAX_NEARBY_CELLS = 64;

enum class Side { North, South, East, West };

// the restriction that applies at a point
struct ResolvedMatch {
    rules::ScheduleRule rule;
    Side side{Side::North};
    // to the nearest segment of rule.geometry, never above the match radius
    double distanceMeters{};
    optional<recurrence::Occurrence> next;
};

// closest segment of one rule's polyline
struct NearestSegment {
    size_t index{};
    geo::Point start, end;
    geo::SegmentProjection projection;
};

string sideName(Side side);
bool blockSideMatches(const string& blockSide, Side side);
Side classifySide(const geo::Point& a, const geo::Point& b, const geo::Point& point);
optional<NearestSegment> nearestSegment(const rules::ScheduleRule& rule, const geo::Point& point);

class SegmentResolver {
 public:
    SegmentResolver(catalog::CatalogPtr catalog, const config::EngineConfig& cfg);

    optional<ResolvedMatch> resolve(const geo::Point& point, time_t now) const;
    optional<ResolvedMatch> resolveAmong(
        const geo::Point& point, const vector<const rules::ScheduleRule*>& candidates, time_t now) const;
    vector<ResolvedMatch> nearby(const geo::Point& point, double radiusMeters, time_t now) const;

 private:
    catalog::CatalogPtr catalog_;
    config::EngineConfig cfg_;
};

}  // namespace resolver

#endif  // SWEEP_REMINDER_RESOLVER_HPP_
