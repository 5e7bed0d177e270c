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
#ifndef CURBSIDE_TESTS_FIXTURES_HPP_
#define CURBSIDE_TESTS_FIXTURES_HPP_

#include <cmath>   // for cos
#include <string>  // for string

#include "../curbside/boundary.hpp"
#include "../curbside/geometry.hpp"
#include "../curbside/records.hpp"
#include "../curbside/schedule.hpp"
#include "../curbside/segment.hpp"

namespace fixtures {

// Mission District, San Francisco
const double LON0 = -122.4150;
const double LAT0 = 37.7600;

inline double metersToLat(double m) { return m / geometry::METERS_PER_DEGREE_LAT; }
inline double metersToLon(double m) {
    return m / (geometry::METERS_PER_DEGREE_LAT * std::cos(LAT0 * 3.14159265358979323846 / 180.0));
}

// Eastbound line `northMeters` north of LAT0, from `startMeters` to
// `startMeters + lengthMeters` east of LON0
inline geometry::Polyline eastbound(double northMeters, double lengthMeters = 100.0, double startMeters = 0.0) {
    const double lat = LAT0 + metersToLat(northMeters);
    return geometry::Polyline{
        {LON0 + metersToLon(startMeters), lat},
        {LON0 + metersToLon(startMeters + lengthMeters / 2.0), lat},
        {LON0 + metersToLon(startMeters + lengthMeters), lat}};
}

inline schedule::Schedule daily() { return schedule::Schedule{schedule::DaySet::daily(), std::nullopt}; }

inline schedule::Schedule window(schedule::DaySet days, int startMinute, int endMinute) {
    return schedule::Schedule{days, schedule::TimeWindow{startMinute, endMinute}};
}

inline records::Centerline centerline(const string& id, const string& street, double northMeters = 0.0) {
    records::Centerline c;
    c.id = id;
    c.streetName = street;
    c.geometry = eastbound(northMeters);
    return c;
}

inline records::Regulation regulation(const string& id, segment::RuleKind kind, double northMeters) {
    records::Regulation r;
    r.id = id;
    r.kind = kind;
    r.regulation = "Time limited";
    r.description = "2 hour limit";
    r.hourLimitMinutes = 120;
    r.schedule = window(schedule::DaySet{0x1f}, 8 * 60, 18 * 60);
    r.geometry = eastbound(northMeters, 60.0, 20.0);
    return r;
}

// Rectangular parcel spanning the block between two northward offsets
inline boundary::Parcel parcel(const string& hood, const string& district, double southMeters, double northMeters) {
    const double s = LAT0 + metersToLat(southMeters);
    const double n = LAT0 + metersToLat(northMeters);
    const double w = LON0 - metersToLon(50.0);
    const double e = LON0 + metersToLon(150.0);

    geometry::Polygon poly;
    poly.rings = {geometry::Ring{{{w, s}, {e, s}, {e, n}, {w, n}, {w, s}}}};
    poly.minLon = w; poly.minLat = s; poly.maxLon = e; poly.maxLat = n;

    boundary::Parcel p;
    p.neighborhood = hood;
    p.district = district;
    p.polys = {poly};
    p.minLon = w; p.minLat = s; p.maxLon = e; p.maxLat = n;
    return p;
}

}  // namespace fixtures

#endif  // CURBSIDE_TESTS_FIXTURES_HPP_
