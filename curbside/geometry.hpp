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
#ifndef CURBSIDE_GEOMETRY_HPP_
#define CURBSIDE_GEOMETRY_HPP_

#include <stddef.h>   // for size_t
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <vector>     // for vector

using std::string;
using std::vector;

namespace geometry {

const double EARTH_RADIUS_METERS = 6371008.8;
const double METERS_PER_DEGREE_LAT = 111320.0;

// Thrown for malformed or degenerate input geometry
class GeometryError : public std::runtime_error {
 public:
    explicit GeometryError(const string& what) : std::runtime_error(what) {}
};

// -------------------------------------
// primitive geometry types (lon/lat degrees, GeoJSON order)
// -------------------------------------

// lat/lon point
struct Point { double lon{}, lat{}; };

// ordered vertices of a street or curb line
using Polyline = vector<Point>;

// axis-aligned bounding box
struct Bounds {
    double minLon{1e300}, minLat{1e300}, maxLon{-1e300}, maxLat{-1e300};
};

// polygon ring
struct Ring {
    // Closed or open ring of lon/lat points
    vector<Point> points;
};

// polygon shape
struct Polygon {
    // rings[0] = outer; rings[1..] = holes
    vector<Ring> rings;
    // bounding box for fast reject
    double minLon{}, minLat{}, maxLon{}, maxLat{};
};

// where a point lands when projected onto a polyline
struct Projection {
    Point point;
    double distanceAlong{};   // meters from the first vertex
    double distance{};        // meters from the input point
    size_t segmentIndex{};
};

void validatePolyline(const Polyline& line);

double haversineDistance(const Point& p1, const Point& p2);
double bearing(const Point& p1, const Point& p2);
int crossProductSide(const Point& a, const Point& b, const Point& test);

double lineLength(const Polyline& line);
Point interpolate(const Polyline& line, double fraction);
Point pointAtDistance(const Polyline& line, double meters);
Projection projectOntoLine(const Point& point, const Polyline& line);
double distanceToLine(const Point& point, const Polyline& line);
double lineToLineDistance(const Polyline& a, const Polyline& b);

Polyline offsetLine(const Polyline& line, double meters, bool leftSide);
Point offsetPoint(const Point& origin, const Point& towards, double meters, bool leftSide);

string cardinalFromBearing(double degrees);
string sideFacingCardinal(const Polyline& line, bool leftSide);

Bounds lineBounds(const Polyline& line);
Bounds expandBounds(const Bounds& bounds, double meters);
bool boundsIntersect(const Bounds& a, const Bounds& b);

void ringBounds(const Ring& ring, double* minLon, double* minLat, double* maxLon, double* maxLat);
bool pointInRing(const Ring& ring, const Point& point);
bool pointInPolygon(const Polygon& poly, const Point& point);

}  // namespace geometry

#endif  // CURBSIDE_GEOMETRY_HPP_
