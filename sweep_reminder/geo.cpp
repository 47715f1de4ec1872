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
#include "geo.hpp"
#include <algorithm>  // for max, min
#include <cmath>      // for sin, cos, asin, sqrt, atan2, hypot
#include <vector>     // for vector

using std::vector;
using std::min;
using std::max;

namespace geo {
    const double PI = 3.14159265358979323846;

    double toRadians(double degrees) {
        return degrees * (PI / 180.0);
    }

    // Great-circle distance between two lon/lat points
    //
    // Args:
    //    a: first point
    //    b: second point
    // Returns:
    //    distance in meters
    double haversineMeters(const Point& a, const Point& b) {
        const double phi1 = toRadians(a.lat);
        const double phi2 = toRadians(b.lat);
        const double dPhi = toRadians(b.lat - a.lat);
        const double dLambda = toRadians(b.lon - a.lon);
        const double h = std::sin(dPhi / 2) * std::sin(dPhi / 2) +
            std::cos(phi1) * std::cos(phi2) * std::sin(dLambda / 2) * std::sin(dLambda / 2);
        return 2 * EARTH_RADIUS_M * std::asin(std::sqrt(min(1.0, h)));
    }

    // Equirectangular projection onto a tangent plane centred on origin.
    // Accurate to well under a centimetre at street-block scale.
    //
    // Args:
    //    origin: plane origin
    //    p: point to project
    // Returns:
    //    east (x) and north (y) offsets from origin in meters
    LocalXY toLocal(const Point& origin, const Point& p) {
        const double lat0 = toRadians(origin.lat);
        LocalXY xy;
        xy.x = EARTH_RADIUS_M * toRadians(p.lon - origin.lon) * std::cos(lat0);
        xy.y = EARTH_RADIUS_M * toRadians(p.lat - origin.lat);
        return xy;
    }

    // Inverse of toLocal
    Point fromLocal(const Point& origin, const LocalXY& xy) {
        const double lat0 = toRadians(origin.lat);
        Point p;
        p.lat = origin.lat + (xy.y / EARTH_RADIUS_M) * (180.0 / PI);
        p.lon = origin.lon + (xy.x / (EARTH_RADIUS_M * std::cos(lat0))) * (180.0 / PI);
        return p;
    }

    // Closest point on segment [a,b] to p, measured in meters.
    // Projection happens on a plane centred on p so degree deltas are never
    // compared directly.
    //
    // Args:
    //    p: query point
    //    a: segment start
    //    b: segment end
    // Returns:
    //    closest point, clamped projection parameter and distance in meters
    SegmentProjection projectOntoSegment(const Point& p, const Point& a, const Point& b) {
        const LocalXY la = toLocal(p, a);
        const LocalXY lb = toLocal(p, b);
        const double dx = lb.x - la.x;
        const double dy = lb.y - la.y;
        const double lengthSquared = dx * dx + dy * dy;

        SegmentProjection out;
        if (lengthSquared == 0.0) {
            out.closest = a;
            out.t = 0.0;
            out.distanceMeters = std::hypot(la.x, la.y);
            return out;
        }

        // p is the plane origin, so (p - a) == -la
        const double t = max(0.0, min(1.0, (-la.x * dx + -la.y * dy) / lengthSquared));
        const LocalXY c{ la.x + t * dx, la.y + t * dy };
        out.closest = fromLocal(p, c);
        out.t = t;
        out.distanceMeters = std::hypot(c.x, c.y);
        return out;
    }

    // Compass bearing of the direction a -> b (0 = north, 90 = east)
    //
    // Returns:
    //    bearing in degrees, [0, 360)
    double bearingDegrees(const Point& a, const Point& b) {
        const LocalXY d = toLocal(a, b);
        double bearing = std::atan2(d.x, d.y) * 180.0 / PI;
        if (bearing < 0) bearing += 360.0;
        if (bearing >= 360.0) bearing -= 360.0;
        return bearing;
    }

    // 2D cross product (b - a) x (p - a) on the tangent plane at a.
    // Positive when p lies to the left of the direction a -> b.
    double crossProduct(const Point& a, const Point& b, const Point& p) {
        const LocalXY lb = toLocal(a, b);
        const LocalXY lp = toLocal(a, p);
        return lb.x * lp.y - lb.y * lp.x;
    }

    // Compute axis-aligned bounding box for a polyline
    //
    // Args:
    //    points: polyline vertices
    // Returns:
    //    bounds; sentinel values when points is empty
    Bounds lineBounds(const vector<Point>& points) {
        Bounds b;
        b.minLon =  1e300; b.minLat =  1e300;
        b.maxLon = -1e300; b.maxLat = -1e300;
        for (const auto& point : points) {
            b.minLon = min(b.minLon, point.lon);
            b.minLat = min(b.minLat, point.lat);
            b.maxLon = max(b.maxLon, point.lon);
            b.maxLat = max(b.maxLat, point.lat);
        }
        return b;
    }

    void extendBounds(Bounds* bounds, const Bounds& other) {
        bounds->minLon = min(bounds->minLon, other.minLon);
        bounds->minLat = min(bounds->minLat, other.minLat);
        bounds->maxLon = max(bounds->maxLon, other.maxLon);
        bounds->maxLat = max(bounds->maxLat, other.maxLat);
    }
}  // namespace geo
