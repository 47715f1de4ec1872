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
#include "resolver.hpp"
#include <algorithm>  // for sort
#include <cmath>      // for ceil, cos, max
#include <utility>    // for move
#include "utils.hpp"

using geo::Point;
using recurrence::Occurrence;
using rules::ScheduleRule;

namespace resolver {
    string sideName(Side side) {
        switch (side) {
            case Side::North: return "North";
            case Side::South: return "South";
            case Side::East: return "East";
            case Side::West: return "West";
        }
        return "";
    }

    // Fuzzy match of free-text block side against a detected side.
    // Compound forms match either component: "Northeast" matches North and East.
    bool blockSideMatches(const string& blockSide, Side side) {
        return utils::toLower(blockSide).find(utils::toLower(sideName(side))) != string::npos;
    }

    // Which side of the street a point is on.
    //
    // The segment's bearing picks its travel direction (N, E, S or W
    // quadrant) and the cross product sign picks left or right of it.
    // Reversing the vertices flips both, so the answer does not depend on
    // vertex order.
    //
    // Args:
    //    a: segment start
    //    b: segment end
    //    point: query location
    // Returns:
    //    the cardinal side
    Side classifySide(const Point& a, const Point& b, const Point& point) {
        const double bearing = geo::bearingDegrees(a, b);
        const bool left = geo::crossProduct(a, b, point) > 0;
        if (bearing >= 315.0 || bearing < 45.0) return left ? Side::West : Side::East;
        if (bearing < 135.0) return left ? Side::North : Side::South;
        if (bearing < 225.0) return left ? Side::East : Side::West;
        return left ? Side::South : Side::North;
    }

    optional<NearestSegment> nearestSegment(const ScheduleRule& rule, const Point& point) {
        optional<NearestSegment> best;
        for (size_t i = 0; i + 1 < rule.geometry.size(); ++i) {
            const auto projection = geo::projectOntoSegment(point, rule.geometry[i], rule.geometry[i + 1]);
            if (best && projection.distanceMeters >= best->projection.distanceMeters) continue;
            NearestSegment candidate;
            candidate.index = i;
            candidate.start = rule.geometry[i];
            candidate.end = rule.geometry[i + 1];
            candidate.projection = projection;
            best = candidate;
        }
        return best;
    }

    SegmentResolver::SegmentResolver(catalog::CatalogPtr catalog, const config::EngineConfig& cfg)
        : catalog_(std::move(catalog)), cfg_(cfg) {}

    optional<ResolvedMatch> SegmentResolver::resolve(const Point& point, time_t now) const {
        if (!catalog_ || catalog_->empty()) return std::nullopt;
        return resolveAmong(point, catalog_->candidatesNear(point, cfg_.searchRadiusCells), now);
    }

    // Resolves the restriction at a point from a candidate set.
    //
    // The globally closest segment within the match radius fixes the block
    // (corridor + limits) and the side. Every candidate on that block whose
    // block side text agrees is considered, and the one that fires soonest
    // wins.
    //
    // Args:
    //    point: query location
    //    candidates: rules near the point
    //    now: reference instant for occurrence lookup
    // Returns:
    //    the match, or nullopt for "no restriction here"
    optional<ResolvedMatch> SegmentResolver::resolveAmong(
        const Point& point, const vector<const ScheduleRule*>& candidates, time_t now) const {
        const ScheduleRule* bestRule = nullptr;
        optional<NearestSegment> bestSegment;
        for (const auto* rule : candidates) {
            const auto segment = nearestSegment(*rule, point);
            if (!segment || segment->projection.distanceMeters > cfg_.maxMatchRadiusMeters) continue;
            if (bestSegment && segment->projection.distanceMeters >= bestSegment->projection.distanceMeters)
                continue;
            bestRule = rule;
            bestSegment = segment;
        }
        if (!bestRule) return std::nullopt;

        const Side side = classifySide(bestSegment->start, bestSegment->end, point);

        optional<ResolvedMatch> chosen;
        for (const auto* rule : candidates) {
            if (rule->corridorName != bestRule->corridorName ||
                rule->limitsDescription != bestRule->limitsDescription ||
                !blockSideMatches(rule->blockSide, side))
                continue;
            const auto segment = nearestSegment(*rule, point);
            if (!segment || segment->projection.distanceMeters > cfg_.maxMatchRadiusMeters) continue;

            const auto next = recurrence::nextOccurrence(*rule, now, cfg_.horizon);
            bool better = false;
            if (!chosen) {
                better = true;
            } else if (next && !chosen->next) {
                better = true;
            } else if (next && chosen->next) {
                better = next->start < chosen->next->start ||
                    (next->start == chosen->next->start &&
                     segment->projection.distanceMeters < chosen->distanceMeters);
            } else if (!next && !chosen->next) {
                better = segment->projection.distanceMeters < chosen->distanceMeters;
            }
            if (!better) continue;

            ResolvedMatch match;
            match.rule = *rule;
            match.side = side;
            match.distanceMeters = segment->projection.distanceMeters;
            match.next = next;
            chosen = std::move(match);
        }
        return chosen;
    }

    // Every rule whose polyline passes within radiusMeters of the point
    //
    // Args:
    //    point: query location
    //    radiusMeters: search radius
    //    now: reference instant for occurrence lookup
    // Returns:
    //    matches with their own side and distance, nearest first
    vector<ResolvedMatch> SegmentResolver::nearby(const Point& point, double radiusMeters, time_t now) const {
        vector<ResolvedMatch> out;
        if (!catalog_ || catalog_->empty() || !(radiusMeters > 0.0)) return out;

        // longitude cells are the narrow ones; size the block by them
        const double metersPerDegree = geo::EARTH_RADIUS_M * geo::toRadians(1.0);
        const double cellMeters = catalog_->cellSizeDeg() * metersPerDegree *
            std::max(0.01, std::cos(geo::toRadians(point.lat)));
        const double cells = std::ceil(radiusMeters / cellMeters);

        // past a few dozen cells a full scan is cheaper than the block walk
        vector<const ScheduleRule*> candidates;
        if (cells <= MAX_NEARBY_CELLS) {
            candidates = catalog_->candidatesNear(point, static_cast<int>(cells));
        } else {
            for (const auto& rule : catalog_->rules()) candidates.push_back(&rule);
        }

        for (const auto* rule : candidates) {
            const auto segment = nearestSegment(*rule, point);
            if (!segment || segment->projection.distanceMeters > radiusMeters) continue;
            ResolvedMatch match;
            match.rule = *rule;
            match.side = classifySide(segment->start, segment->end, point);
            match.distanceMeters = segment->projection.distanceMeters;
            match.next = recurrence::nextOccurrence(*rule, now, cfg_.horizon);
            out.push_back(std::move(match));
        }
        std::sort(out.begin(), out.end(), [](const ResolvedMatch& a, const ResolvedMatch& b) {
            if (a.distanceMeters != b.distanceMeters) return a.distanceMeters < b.distanceMeters;
            return a.rule.id < b.rule.id;
        });
        return out;
    }
}  // namespace resolver
