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
#include "geometry.hpp"
#include <algorithm>  // for max, min, clamp
#include <cmath>      // for cos, sin, atan2, sqrt, fabs, isfinite
#include <cstddef>    // for size_t
#include <string>     // for string
#include <vector>     // for vector

using std::string;
using std::vector;
using std::min;
using std::max;

using geometry::Bounds;
using geometry::GeometryError;
using geometry::Point;
using geometry::Polygon;
using geometry::Polyline;
using geometry::Projection;
using geometry::Ring;

namespace {
    const double PI = 3.14159265358979323846;

    double toRadians(double degrees) { return degrees * PI / 180.0; }
    double toDegrees(double radians) { return radians * 180.0 / PI; }

    // planar coordinates in meters around a reference point
    struct XY { double x{}, y{}; };

    // Local equirectangular projection. All threshold comparisons in the
    // project run on these meters, never on raw degrees.
    XY toLocal(const Point& p, const Point& ref) {
        const double scale = std::cos(toRadians(ref.lat));
        return XY{
            (p.lon - ref.lon) * geometry::METERS_PER_DEGREE_LAT * scale,
            (p.lat - ref.lat) * geometry::METERS_PER_DEGREE_LAT };
    }

    Point fromLocal(const XY& xy, const Point& ref) {
        const double scale = std::cos(toRadians(ref.lat));
        return Point{
            ref.lon + xy.x / (geometry::METERS_PER_DEGREE_LAT * scale),
            ref.lat + xy.y / geometry::METERS_PER_DEGREE_LAT };
    }

    double length(const XY& v) { return std::sqrt(v.x * v.x + v.y * v.y); }

    // closest point on segment ab to p, as parameter t in [0, 1]
    double closestParam(const XY& a, const XY& b, const XY& p) {
        const double dx = b.x - a.x;
        const double dy = b.y - a.y;
        const double len2 = dx * dx + dy * dy;
        if (len2 == 0.0) return 0.0;
        const double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / len2;
        return std::clamp(t, 0.0, 1.0);
    }

    double pointSegmentDistance(const XY& p, const XY& a, const XY& b) {
        const double t = closestParam(a, b, p);
        const XY c{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
        return length(XY{p.x - c.x, p.y - c.y});
    }

    double cross(const XY& o, const XY& a, const XY& b) {
        return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
    }

    bool segmentsIntersect(const XY& a, const XY& b, const XY& c, const XY& d) {
        const double d1 = cross(c, d, a);
        const double d2 = cross(c, d, b);
        const double d3 = cross(a, b, c);
        const double d4 = cross(a, b, d);
        return ((d1 > 0) != (d2 > 0)) && ((d3 > 0) != (d4 > 0)) &&
            d1 != 0 && d2 != 0 && d3 != 0 && d4 != 0;
    }

    double segmentSegmentDistance(const XY& a, const XY& b, const XY& c, const XY& d) {
        if (segmentsIntersect(a, b, c, d)) return 0.0;
        return min(
            min(pointSegmentDistance(a, c, d), pointSegmentDistance(b, c, d)),
            min(pointSegmentDistance(c, a, b), pointSegmentDistance(d, a, b)));
    }

    vector<XY> toLocalLine(const Polyline& line, const Point& ref) {
        vector<XY> out;
        out.reserve(line.size());
        for (const auto& p : line) out.push_back(toLocal(p, ref));
        return out;
    }
}  // namespace

namespace geometry {
    // Rejects polylines the join cannot reason about
    //
    // Args:
    //    line: candidate centerline or regulation geometry
    // Throws:
    //    GeometryError for fewer than 2 vertices, non-finite coordinates,
    //    or zero total length
    void validatePolyline(const Polyline& line) {
        if (line.size() < 2) {
            throw GeometryError("polyline has fewer than 2 vertices");
        }
        for (const auto& p : line) {
            if (!std::isfinite(p.lon) || !std::isfinite(p.lat)) {
                throw GeometryError("polyline has non-finite coordinates");
            }
        }
        if (lineLength(line) <= 0.0) {
            throw GeometryError("polyline has zero length");
        }
    }

    // Great-circle distance in meters
    double haversineDistance(const Point& p1, const Point& p2) {
        const double dLat = toRadians(p2.lat - p1.lat);
        const double dLon = toRadians(p2.lon - p1.lon);
        const double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
            std::cos(toRadians(p1.lat)) * std::cos(toRadians(p2.lat)) *
            std::sin(dLon / 2) * std::sin(dLon / 2);
        return 2.0 * EARTH_RADIUS_METERS * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    }

    // Initial bearing from p1 to p2 in degrees, 0 = north, clockwise, [0, 360)
    double bearing(const Point& p1, const Point& p2) {
        const double phi1 = toRadians(p1.lat);
        const double phi2 = toRadians(p2.lat);
        const double dLon = toRadians(p2.lon - p1.lon);
        const double y = std::sin(dLon) * std::cos(phi2);
        const double x = std::cos(phi1) * std::sin(phi2) -
            std::sin(phi1) * std::cos(phi2) * std::cos(dLon);
        const double deg = toDegrees(std::atan2(y, x));
        return deg < 0.0 ? deg + 360.0 : deg;
    }

    // Which side of the directed line a->b the test point is on
    //
    // Args:
    //    a: start of the directed line
    //    b: end of the directed line
    //    test: the point to classify
    // Returns:
    //    +1 when left of a->b, -1 when right, 0 when collinear (indeterminate)
    int crossProductSide(const Point& a, const Point& b, const Point& test) {
        const XY o{};
        const XY bb = toLocal(b, a);
        const XY tt = toLocal(test, a);
        const double c = cross(o, bb, tt);
        if (std::fabs(c) < 1e-9) return 0;
        return c > 0 ? 1 : -1;
    }

    // Planar length in meters
    double lineLength(const Polyline& line) {
        if (line.size() < 2) return 0.0;
        const auto local = toLocalLine(line, line.front());
        double total = 0.0;
        for (size_t i = 1; i < local.size(); ++i) {
            total += length(XY{local[i].x - local[i - 1].x, local[i].y - local[i - 1].y});
        }
        return total;
    }

    Point pointAtDistance(const Polyline& line, double meters) {
        if (line.empty()) throw GeometryError("cannot walk an empty polyline");
        if (line.size() == 1 || meters <= 0.0) return line.front();

        const Point& ref = line.front();
        const auto local = toLocalLine(line, ref);
        double walked = 0.0;
        for (size_t i = 1; i < local.size(); ++i) {
            const XY d{local[i].x - local[i - 1].x, local[i].y - local[i - 1].y};
            const double segLen = length(d);
            if (segLen > 0.0 && walked + segLen >= meters) {
                const double t = (meters - walked) / segLen;
                return fromLocal(XY{local[i - 1].x + t * d.x, local[i - 1].y + t * d.y}, ref);
            }
            walked += segLen;
        }
        return line.back();
    }

    // Point at normalized arc-length position along the line
    //
    // Args:
    //    line: the polyline to walk
    //    fraction: position in [0, 1], clamped
    // Returns:
    //    interpolated point; a single-vertex line returns that vertex
    Point interpolate(const Polyline& line, double fraction) {
        const double f = std::clamp(fraction, 0.0, 1.0);
        return pointAtDistance(line, f * lineLength(line));
    }

    Projection projectOntoLine(const Point& point, const Polyline& line) {
        if (line.empty()) throw GeometryError("cannot project onto an empty polyline");

        const Point& ref = line.front();
        const auto local = toLocalLine(line, ref);
        const XY p = toLocal(point, ref);

        Projection best;
        best.point = line.front();
        best.distance = length(p);
        double walked = 0.0;
        for (size_t i = 1; i < local.size(); ++i) {
            const XY& a = local[i - 1];
            const XY& b = local[i];
            const double segLen = length(XY{b.x - a.x, b.y - a.y});
            const double t = closestParam(a, b, p);
            const XY c{a.x + t * (b.x - a.x), a.y + t * (b.y - a.y)};
            const double d = length(XY{p.x - c.x, p.y - c.y});
            if (d < best.distance) {
                best.distance = d;
                best.point = fromLocal(c, ref);
                best.distanceAlong = walked + t * segLen;
                best.segmentIndex = i - 1;
            }
            walked += segLen;
        }
        return best;
    }

    // Minimum planar distance in meters from a point to a polyline
    double distanceToLine(const Point& point, const Polyline& line) {
        return projectOntoLine(point, line).distance;
    }

    // Minimum planar distance in meters between two polylines, 0 when they cross
    double lineToLineDistance(const Polyline& a, const Polyline& b) {
        if (a.empty() || b.empty()) throw GeometryError("cannot measure an empty polyline");
        if (a.size() == 1) return distanceToLine(a.front(), b);
        if (b.size() == 1) return distanceToLine(b.front(), a);

        const Point& ref = a.front();
        const auto la = toLocalLine(a, ref);
        const auto lb = toLocalLine(b, ref);
        double best = 1e300;
        for (size_t i = 1; i < la.size(); ++i) {
            for (size_t j = 1; j < lb.size(); ++j) {
                best = min(best, segmentSegmentDistance(la[i - 1], la[i], lb[j - 1], lb[j]));
                if (best == 0.0) return 0.0;
            }
        }
        return best;
    }

    // Builds a line parallel to the input at a fixed perpendicular distance.
    // Each vertex moves along the average of the normals of its incident
    // segments, which keeps the vertex count and direction of the input.
    //
    // Args:
    //    line: the centerline to offset
    //    meters: perpendicular offset distance
    //    leftSide: offset to the left of the direction of travel when true
    // Returns:
    //    the offset polyline
    Polyline offsetLine(const Polyline& line, double meters, bool leftSide) {
        validatePolyline(line);
        const Point& ref = line.front();
        const auto local = toLocalLine(line, ref);
        const double sign = leftSide ? 1.0 : -1.0;

        // unit left-normals per segment, zero for degenerate segments
        vector<XY> normals;
        normals.reserve(local.size() - 1);
        for (size_t i = 1; i < local.size(); ++i) {
            const XY d{local[i].x - local[i - 1].x, local[i].y - local[i - 1].y};
            const double len = length(d);
            normals.push_back(len > 0.0 ? XY{-d.y / len, d.x / len} : XY{});
        }

        Polyline out;
        out.reserve(local.size());
        for (size_t i = 0; i < local.size(); ++i) {
            XY n{};
            if (i > 0) { n.x += normals[i - 1].x; n.y += normals[i - 1].y; }
            if (i < normals.size()) { n.x += normals[i].x; n.y += normals[i].y; }
            const double len = length(n);
            if (len > 0.0) { n.x /= len; n.y /= len; }
            out.push_back(fromLocal(
                XY{local[i].x + sign * meters * n.x, local[i].y + sign * meters * n.y}, ref));
        }
        return out;
    }

    // Point displaced perpendicular to the direction origin->towards
    Point offsetPoint(const Point& origin, const Point& towards, double meters, bool leftSide) {
        const XY d = toLocal(towards, origin);
        const double len = length(d);
        if (len == 0.0) throw GeometryError("cannot offset along a zero-length direction");
        const double sign = leftSide ? 1.0 : -1.0;
        return fromLocal(XY{sign * meters * -d.y / len, sign * meters * d.x / len}, origin);
    }

    string cardinalFromBearing(double degrees) {
        static const char* const names[] = {
            "North", "Northeast", "East", "Southeast",
            "South", "Southwest", "West", "Northwest"
        };
        double d = std::fmod(degrees, 360.0);
        if (d < 0.0) d += 360.0;
        const int sector = static_cast<int>((d + 22.5) / 45.0) % 8;
        return names[sector];
    }

    // Cardinal direction a curb faces, e.g. "North" for the left side of an
    // eastbound centerline
    string sideFacingCardinal(const Polyline& line, bool leftSide) {
        validatePolyline(line);
        const double travel = bearing(line.front(), line.back());
        return cardinalFromBearing(travel + (leftSide ? -90.0 : 90.0));
    }

    Bounds lineBounds(const Polyline& line) {
        Bounds b;
        for (const auto& p : line) {
            b.minLon = min(b.minLon, p.lon);
            b.minLat = min(b.minLat, p.lat);
            b.maxLon = max(b.maxLon, p.lon);
            b.maxLat = max(b.maxLat, p.lat);
        }
        return b;
    }

    // Grows a bounding box by a distance in meters on every side
    Bounds expandBounds(const Bounds& bounds, double meters) {
        const double midLat = (bounds.minLat + bounds.maxLat) / 2.0;
        const double dLat = meters / METERS_PER_DEGREE_LAT;
        const double dLon = meters / (METERS_PER_DEGREE_LAT * std::cos(toRadians(midLat)));
        return Bounds{bounds.minLon - dLon, bounds.minLat - dLat,
                      bounds.maxLon + dLon, bounds.maxLat + dLat};
    }

    bool boundsIntersect(const Bounds& a, const Bounds& b) {
        return a.minLon <= b.maxLon && b.minLon <= a.maxLon &&
            a.minLat <= b.maxLat && b.minLat <= a.maxLat;
    }

    // Compute axis-aligned bounding box for given polygon ring
    //
    // Args:
    //    ring: reference to a polygon ring
    //    minLon: minimum longitude component of the ring's bounding box computed here
    //    minLat: minimum latitude component of the ring's bounding box computed here
    //    maxLon: maximum longitude component of the ring's bounding box computed here
    //    maxLat: maximum latitude component of the ring's bounding box computed here
    void ringBounds(const Ring& ring, double* minLon, double* minLat, double* maxLon, double* maxLat) {
        *minLon =  1e300; *minLat =  1e300;
        *maxLon = -1e300; *maxLat = -1e300;
        for (const auto& point : ring.points) {
            *minLon = min(*minLon, point.lon);
            *minLat = min(*minLat, point.lat);
            *maxLon = max(*maxLon, point.lon);
            *maxLat = max(*maxLat, point.lat);
        }
    }

    // Ray casting for point in ring (boundary ambiguity treated as inside)
    bool pointInRing(const Ring& ring, const Point& q) {
        bool inside = false;
        const auto& points = ring.points;
        const size_t n = points.size();
        if (n < 3) return false;
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const Point& a = points[j];
            const Point& b = points[i];
            const bool intersect = ((a.lat > q.lat) != (b.lat > q.lat)) &&
                (q.lon < (b.lon - a.lon) * (q.lat - a.lat) / (b.lat - a.lat + 1e-20) + a.lon);
            if (intersect) inside = !inside;
        }
        return inside;
    }

    // Returns true if point is inside polygon and outside all of its holes
    bool pointInPolygon(const Polygon& poly, const Point& point) {
        // Fast bounding box reject
        if (point.lon < poly.minLon ||
            point.lon > poly.maxLon ||
            point.lat < poly.minLat ||
            point.lat > poly.maxLat)
            return false;
        if (poly.rings.empty()) return false;
        if (!pointInRing(poly.rings.front(), point)) return false;
        for (size_t i = 1; i < poly.rings.size(); ++i) {
            if (pointInRing(poly.rings[i], point)) return false;
        }
        return true;
    }
}  // namespace geometry
