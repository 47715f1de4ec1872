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
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <vector>
#include "../sweep_reminder/geo.hpp"

using std::vector;

using geo::Point;
using geo::LocalXY;
using geo::Bounds;

using geo::haversineMeters;
using geo::toLocal;
using geo::fromLocal;
using geo::projectOntoSegment;
using geo::bearingDegrees;
using geo::crossProduct;
using geo::lineBounds;
using geo::extendBounds;

static const Point ORIGIN{-122.4215, 37.7650};

// -----------------------------------------------------------------------------
// Tests for haversineMeters
// -----------------------------------------------------------------------------

TEST_CASE("haversineMeters: one thousandth of a degree of latitude is about 111 m") {
    const Point north{ORIGIN.lon, ORIGIN.lat + 0.001};
    CHECK(haversineMeters(ORIGIN, north) == doctest::Approx(111.19).epsilon(0.001));
}

TEST_CASE("haversineMeters: zero for identical points") {
    CHECK(haversineMeters(ORIGIN, ORIGIN) == doctest::Approx(0.0));
}

TEST_CASE("haversineMeters: longitude degrees shrink with latitude") {
    const Point east{ORIGIN.lon + 0.001, ORIGIN.lat};
    const double d = haversineMeters(ORIGIN, east);
    CHECK(d < 100.0);
    CHECK(d > 80.0);
}

// -----------------------------------------------------------------------------
// Tests for toLocal / fromLocal
// -----------------------------------------------------------------------------

TEST_CASE("toLocal: fromLocal inverts it at street scale") {
    const Point p = fromLocal(ORIGIN, LocalXY{25.0, -40.0});
    const LocalXY xy = toLocal(ORIGIN, p);
    CHECK(xy.x == doctest::Approx(25.0).epsilon(1e-6));
    CHECK(xy.y == doctest::Approx(-40.0).epsilon(1e-6));
}

TEST_CASE("toLocal: agrees with haversine for short offsets") {
    const Point p = fromLocal(ORIGIN, LocalXY{30.0, 40.0});
    CHECK(haversineMeters(ORIGIN, p) == doctest::Approx(50.0).epsilon(0.001));
}

// -----------------------------------------------------------------------------
// Tests for projectOntoSegment
// -----------------------------------------------------------------------------

TEST_CASE("projectOntoSegment: perpendicular foot inside the segment") {
    const Point a = ORIGIN;
    const Point b = fromLocal(ORIGIN, LocalXY{0.0, 100.0});
    const Point p = fromLocal(ORIGIN, LocalXY{10.0, 50.0});

    const auto proj = projectOntoSegment(p, a, b);
    CHECK(proj.t == doctest::Approx(0.5).epsilon(1e-4));
    CHECK(proj.distanceMeters == doctest::Approx(10.0).epsilon(1e-3));
}

TEST_CASE("projectOntoSegment: clamps to the nearest endpoint") {
    const Point a = ORIGIN;
    const Point b = fromLocal(ORIGIN, LocalXY{0.0, 100.0});
    const Point p = fromLocal(ORIGIN, LocalXY{0.0, 130.0});

    const auto proj = projectOntoSegment(p, a, b);
    CHECK(proj.t == doctest::Approx(1.0));
    CHECK(proj.distanceMeters == doctest::Approx(30.0).epsilon(1e-3));
    CHECK(proj.closest.lat == doctest::Approx(b.lat));
}

TEST_CASE("projectOntoSegment: degenerate segment measures to its start") {
    const Point p = fromLocal(ORIGIN, LocalXY{3.0, 4.0});
    const auto proj = projectOntoSegment(p, ORIGIN, ORIGIN);
    CHECK(proj.t == doctest::Approx(0.0));
    CHECK(proj.distanceMeters == doctest::Approx(5.0).epsilon(1e-3));
}

// -----------------------------------------------------------------------------
// Tests for bearingDegrees and crossProduct
// -----------------------------------------------------------------------------

TEST_CASE("bearingDegrees: cardinal directions") {
    CHECK(bearingDegrees(ORIGIN, fromLocal(ORIGIN, LocalXY{0, 10})) == doctest::Approx(0.0));
    CHECK(bearingDegrees(ORIGIN, fromLocal(ORIGIN, LocalXY{10, 0})) == doctest::Approx(90.0));
    CHECK(bearingDegrees(ORIGIN, fromLocal(ORIGIN, LocalXY{0, -10})) == doctest::Approx(180.0));
    CHECK(bearingDegrees(ORIGIN, fromLocal(ORIGIN, LocalXY{-10, 0})) == doctest::Approx(270.0));
}

TEST_CASE("crossProduct: positive on the left of the direction of travel") {
    const Point b = fromLocal(ORIGIN, LocalXY{0, 100});
    CHECK(crossProduct(ORIGIN, b, fromLocal(ORIGIN, LocalXY{-5, 50})) > 0);
    CHECK(crossProduct(ORIGIN, b, fromLocal(ORIGIN, LocalXY{5, 50})) < 0);
}

// -----------------------------------------------------------------------------
// Tests for lineBounds / extendBounds
// -----------------------------------------------------------------------------

TEST_CASE("lineBounds: computes the box of a polyline") {
    const vector<Point> line{{1.0, 2.0}, {3.0, -1.0}, {2.5, 4.0}};
    const Bounds b = lineBounds(line);
    CHECK(b.minLon == doctest::Approx(1.0));
    CHECK(b.maxLon == doctest::Approx(3.0));
    CHECK(b.minLat == doctest::Approx(-1.0));
    CHECK(b.maxLat == doctest::Approx(4.0));
}

TEST_CASE("extendBounds: grows to cover both boxes") {
    Bounds b = lineBounds({{0.0, 0.0}, {1.0, 1.0}});
    extendBounds(&b, lineBounds({{-2.0, 0.5}, {0.5, 3.0}}));
    CHECK(b.minLon == doctest::Approx(-2.0));
    CHECK(b.maxLat == doctest::Approx(3.0));
    CHECK(b.maxLon == doctest::Approx(1.0));
    CHECK(b.minLat == doctest::Approx(0.0));
}
