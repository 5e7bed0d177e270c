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
#include "boundary.hpp"
#include <algorithm>                                // for max, min, find_if, any_of
#include <cstddef>                                  // for size_t
#include <fstream>                                  // for basic_ifstream
#include <nlohmann/detail/iterators/iter_impl.hpp>  // for iter_impl
#include <nlohmann/json.hpp>                        // for basic_json, opera...
#include <stdexcept>                                // for runtime_error
#include <string>                                   // for basic_string, string
#include <utility>                                  // for move
#include <vector>                                   // for vector

#include "segment.hpp"

using std::ifstream;
using std::max;
using std::min;
using std::runtime_error;
using std::string;
using std::vector;
using json = nlohmann::json;

using boundary::BoundaryOutcome;
using boundary::Parcel;
using boundary::ParcelIndex;
using geometry::Point;
using geometry::Polygon;
using geometry::Ring;

namespace {
    // attribute value as text; district numbers arrive as numbers or strings
    string attributeText(const json& props, const string& key) {
        if (key.empty() || !props.contains(key)) return {};
        const auto& v = props[key];
        if (v.is_string()) return v.get<string>();
        if (v.is_number_integer()) return std::to_string(v.get<long long>());
        if (v.is_number()) return std::to_string(v.get<double>());
        return {};
    }
}  // namespace

namespace boundary {
    ParcelIndex::ParcelIndex(vector<Parcel> parcels) : parcels_(std::move(parcels)) {}

    // First parcel containing the point; parcels are not expected to overlap
    const Parcel* ParcelIndex::findAt(const Point& point) const {
        for (const auto& p : parcels_) {
            if (pointInParcel(p, point)) return &p;
        }
        return nullptr;
    }

    // Returns true if point is inside any polygon of the parcel
    //
    // Args:
    //     parcel: the parcel including bounding box
    //     point: the point lat/lon to check
    // Returns:
    //     true if point sits inside the parcel
    bool pointInParcel(const Parcel& parcel, const Point& point) {
        // Parcel-level bounding box
        if (point.lon < parcel.minLon ||
            point.lon > parcel.maxLon ||
            point.lat < parcel.minLat ||
            point.lat > parcel.maxLat)
            return false;

        return std::any_of(
            parcel.polys.begin(),
            parcel.polys.end(),
            [&](const auto& poly) {
                return geometry::pointInPolygon(poly, point);
            });
    }

    // Case and whitespace insensitive; empty never matches
    bool sameAttribute(const string& a, const string& b) {
        const string ka = segment::normalizeStreetKey(a);
        const string kb = segment::normalizeStreetKey(b);
        return !ka.empty() && ka == kb;
    }

    // Point inside the parcel on the candidate's side: the centerline midpoint
    // pushed out past the curb line by probeMeters. Probing the centerline
    // itself would land on the shared border of a boundary street.
    Point probePoint(const segment::StreetSegment& seg, double probeMeters) {
        const auto& cl = seg.centerline;
        const double total = geometry::lineLength(cl);
        const double half = total / 2.0;
        const Point mid = geometry::pointAtDistance(cl, half);
        const Point ahead = geometry::pointAtDistance(cl, min(total, half + 1.0));
        const double curbDistance = geometry::distanceToLine(mid, seg.curbLine());
        return geometry::offsetPoint(mid, ahead, curbDistance + probeMeters, seg.side == side::Side::Left);
    }

    // Confirms a BOUNDARY candidate by administrative attributes
    //
    // Args:
    //    regulation: raw regulation carrying its own neighborhood and district
    //    candidate: segment side being considered
    //    parcels: administrative overlay
    //    cfg: join settings (probe distance)
    // Returns:
    //    Confirmed only when the parcel on that side matches both fields;
    //    a missing parcel or missing attributes fail closed
    BoundaryOutcome resolveBoundary(const records::Regulation& regulation,
                                    const segment::StreetSegment& candidate,
                                    const ParcelIndex& parcels,
                                    const config::JoinConfig& cfg) {
        if (!regulation.neighborhood || !regulation.district ||
            regulation.neighborhood->empty() || regulation.district->empty()) {
            return BoundaryOutcome::MissingAttributes;
        }
        const Parcel* parcel = parcels.findAt(probePoint(candidate, cfg.parcelProbeMeters));
        if (!parcel) return BoundaryOutcome::NoParcel;
        if (sameAttribute(parcel->neighborhood, *regulation.neighborhood) &&
            sameAttribute(parcel->district, *regulation.district)) {
            return BoundaryOutcome::Confirmed;
        }
        return BoundaryOutcome::Mismatch;
    }

    string toString(BoundaryOutcome outcome) {
        switch (outcome) {
            case BoundaryOutcome::Confirmed: return "confirmed";
            case BoundaryOutcome::Mismatch: return "mismatch";
            case BoundaryOutcome::NoParcel: return "no-parcel";
            case BoundaryOutcome::MissingAttributes: return "missing-attributes";
        }
        return "mismatch";
    }

    // Generic detector for an attribute field in json properties
    //
    // Args:
    //     props: json object of properties
    //     candidates: field names to try, in order
    // Returns:
    //     the first candidate present as a string or number, or empty
    string detectField(const json& props, const vector<string>& candidates) {
        auto it = std::find_if(
            candidates.begin(),
            candidates.end(),
            [&](const auto& k) {
                return props.contains(k) && (props[k].is_string() || props[k].is_number());
            });
        if (it != candidates.end()) return *it;
        return {};
    }

    // Parses a parcel FeatureCollection into Parcel structures
    //
    // Args:
    //    gj: GeoJSON FeatureCollection of Polygon / MultiPolygon features
    // Returns:
    //    parcels with neighborhood, district and bounding boxes
    vector<Parcel> parseParcelsGeoJSON(const json& gj) {
        static const vector<string> neighborhoodFields = {
            "neighborhood", "analysis_neighborhood", "nhood", "NEIGHBORHOOD", "Neighborhood"
        };
        static const vector<string> districtFields = {
            "district", "supervisor_district", "supdist", "DISTRICT", "District"
        };

        if (!gj.contains("features") || !gj["features"].is_array())
            throw runtime_error("Invalid GeoJSON (no features array)");

        vector<Parcel> parcels;
        for (const auto& feat : gj["features"]) {
            if (!feat.contains("geometry") || feat["geometry"].is_null()) continue;
            const auto& geom = feat["geometry"];
            const auto type = geom.value("type", "");
            const auto& props = feat.value("properties", json::object());

            Parcel parcel;
            parcel.neighborhood = attributeText(props, detectField(props, neighborhoodFields));
            parcel.district = attributeText(props, detectField(props, districtFields));
            parcel.minLon =  1e300;
            parcel.minLat =  1e300;
            parcel.maxLon = -1e300;
            parcel.maxLat = -1e300;

            // coords: [ [ [lon,lat], ... ], [hole...], ... ]
            auto addPolygon = [&](const json& coords) {
                Polygon poly;
                for (const auto& ringCoords : coords) {
                    Ring ring;
                    for (const auto& p : ringCoords) {
                        ring.points.push_back(Point{ p.at(0).get<double>(), p.at(1).get<double>() });
                    }
                    // ensure closed ring for numeric stability
                    if (!ring.points.empty() && (
                            ring.points.front().lon != ring.points.back().lon ||
                            ring.points.front().lat != ring.points.back().lat)) {
                        ring.points.push_back(ring.points.front());
                    }
                    poly.rings.push_back(std::move(ring));
                }
                if (poly.rings.empty()) return;

                double minLon, minLat, maxLon, maxLat;
                geometry::ringBounds(poly.rings.front(), &minLon, &minLat, &maxLon, &maxLat);
                poly.minLon = minLon; poly.minLat = minLat; poly.maxLon = maxLon; poly.maxLat = maxLat;

                parcel.minLon = min(parcel.minLon, minLon);
                parcel.minLat = min(parcel.minLat, minLat);
                parcel.maxLon = max(parcel.maxLon, maxLon);
                parcel.maxLat = max(parcel.maxLat, maxLat);

                parcel.polys.push_back(std::move(poly));
            };

            if (type == "Polygon") {
                addPolygon(geom["coordinates"]);
            } else if (type == "MultiPolygon") {
                for (const auto& polyCoords : geom["coordinates"]) addPolygon(polyCoords);
            } else {
                // Ignore non-area features
                continue;
            }
            if (parcel.polys.empty()) continue;

            parcels.push_back(std::move(parcel));
        }
        return parcels;
    }

    vector<Parcel> loadParcelsGeoJSON(const string& path) {
        ifstream in(path);
        if (!in) throw runtime_error("Failed to open GeoJSON: " + path);
        json gj; in >> gj;
        auto parcels = parseParcelsGeoJSON(gj);
        if (parcels.empty()) throw runtime_error("No parcel polygons loaded from GeoJSON: " + path);
        return parcels;
    }
}  // namespace boundary
