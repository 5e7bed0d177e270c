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
#ifndef CURBSIDE_BOUNDARY_HPP_
#define CURBSIDE_BOUNDARY_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include <vector>                 // for vector

#include "config.hpp"
#include "geometry.hpp"
#include "records.hpp"
#include "segment.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

namespace boundary {

// administrative parcel from geojson: attributes, polygons, bounding box
struct Parcel {
    string neighborhood;
    string district;
    vector<geometry::Polygon> polys;
    // bounding box
    double minLon{}, minLat{}, maxLon{}, maxLat{};
};

enum class BoundaryOutcome { Confirmed, Mismatch, NoParcel, MissingAttributes };

// read-only lookup of the parcel containing a point
class ParcelIndex {
 public:
    ParcelIndex() = default;
    explicit ParcelIndex(vector<Parcel> parcels);

    const Parcel* findAt(const geometry::Point& point) const;
    size_t size() const { return parcels_.size(); }

 private:
    vector<Parcel> parcels_;
};

bool pointInParcel(const Parcel& parcel, const geometry::Point& point);
bool sameAttribute(const string& a, const string& b);
geometry::Point probePoint(const segment::StreetSegment& seg, double probeMeters);

BoundaryOutcome resolveBoundary(const records::Regulation& regulation,
                                const segment::StreetSegment& candidate,
                                const ParcelIndex& parcels,
                                const config::JoinConfig& cfg);
string toString(BoundaryOutcome outcome);

string detectField(const json& props, const vector<string>& candidates);
vector<Parcel> parseParcelsGeoJSON(const json& gj);
vector<Parcel> loadParcelsGeoJSON(const string& path);

}  // namespace boundary

#endif  // CURBSIDE_BOUNDARY_HPP_
