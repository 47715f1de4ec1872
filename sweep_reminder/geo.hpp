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
#ifndef SWEEP_REMINDER_GEO_HPP_
#define SWEEP_REMINDER_GEO_HPP_

#include <vector>  // for vector

using std::vector;

namespace geo {

const double EARTH_RADIUS_M = 6371008.8;  // mean Earth radius
const double METERS_PER_FOOT = 0.3048;

// lon/lat point, degrees
struct Point { double lon{}, lat{}; };

// axis-aligned bounding box in degrees
struct Bounds {
    double minLon{}, minLat{}, maxLon{}, maxLat{};
};

// point on a local east/north tangent plane, meters
struct LocalXY { double x{}, y{}; };

// result of projecting a point onto one polyline segment
struct SegmentProjection {
    Point closest;
    // clamped projection parameter along the segment, in [0,1]
    double t{};
    double distanceMeters{};
};

double toRadians(double degrees);
double haversineMeters(const Point& a, const Point& b);
LocalXY toLocal(const Point& origin, const Point& p);
Point fromLocal(const Point& origin, const LocalXY& xy);
SegmentProjection projectOntoSegment(const Point& p, const Point& a, const Point& b);
double bearingDegrees(const Point& a, const Point& b);
double crossProduct(const Point& a, const Point& b, const Point& p);
Bounds lineBounds(const vector<Point>& points);
void extendBounds(Bounds* bounds, const Bounds& other);

}  // namespace geo

#endif  // SWEEP_REMINDER_GEO_HPP_
