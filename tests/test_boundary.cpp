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
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>
#include "../curbside/boundary.hpp"
#include "fixtures.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

using boundary::BoundaryOutcome;
using boundary::Parcel;
using boundary::ParcelIndex;
using geometry::Point;
using segment::SegmentStore;
using segment::StreetSegment;
using side::Side;

using boundary::detectField;
using boundary::parseParcelsGeoJSON;
using boundary::pointInParcel;
using boundary::probePoint;
using boundary::resolveBoundary;
using boundary::sameAttribute;

using fixtures::LAT0;
using fixtures::LON0;
using fixtures::metersToLat;
using fixtures::metersToLon;

namespace {
    // one eastbound block of 18th Street; Mission to the north, Castro to the south
    struct Block {
        SegmentStore store;
        ParcelIndex parcels;
        config::JoinConfig cfg;

        Block() : parcels(vector<Parcel>{
                      fixtures::parcel("Mission", "9", 3.0, 60.0),
                      fixtures::parcel("Castro/Upper Market", "8", -60.0, -3.0)}) {
            store.addCenterline("1001", "18TH ST", fixtures::eastbound(0.0), std::nullopt, std::nullopt,
                                cfg.curbOffsetMeters);
        }

        const StreetSegment& segmentOn(Side s) const { return *store.find("1001", s); }
    };

    records::Regulation missionRegulation() {
        records::Regulation reg = fixtures::regulation("r1", segment::RuleKind::TimeLimit, 13.0);
        reg.neighborhood = "Mission";
        reg.district = "9";
        return reg;
    }
}  // namespace

// -----------------------------------------------------------------------------
// Tests for parseParcelsGeoJSON
// -----------------------------------------------------------------------------

TEST_CASE("parseParcelsGeoJSON reads polygons and attribute fields") {
    const json gj = json::parse(R"({
        "type": "FeatureCollection",
        "features": [
            {
                "type": "Feature",
                "properties": { "analysis_neighborhood": "Mission", "supervisor_district": 9 },
                "geometry": { "type": "Polygon", "coordinates": [
                    [ [-122.42, 37.75], [-122.41, 37.75], [-122.41, 37.76], [-122.42, 37.76] ]
                ] }
            },
            {
                "type": "Feature",
                "properties": { "nhood": "Noe Valley", "district": "8" },
                "geometry": { "type": "MultiPolygon", "coordinates": [
                    [ [ [-122.44, 37.74], [-122.43, 37.74], [-122.43, 37.75], [-122.44, 37.74] ] ],
                    [ [ [-122.45, 37.74], [-122.44, 37.74], [-122.44, 37.75], [-122.45, 37.74] ] ]
                ] }
            },
            { "type": "Feature", "properties": {}, "geometry": { "type": "Point", "coordinates": [0, 0] } },
            { "type": "Feature", "properties": {}, "geometry": null }
        ]
    })");

    const vector<Parcel> parcels = parseParcelsGeoJSON(gj);
    REQUIRE_EQ(parcels.size(), 2);

    CHECK_EQ(parcels[0].neighborhood, "Mission");
    CHECK_EQ(parcels[0].district, "9");
    CHECK_EQ(parcels[0].polys.front().rings.front().points.size(), 5);
    CHECK(parcels[0].minLon == doctest::Approx(-122.42));
    CHECK(parcels[0].maxLat == doctest::Approx(37.76));

    CHECK_EQ(parcels[1].neighborhood, "Noe Valley");
    CHECK_EQ(parcels[1].polys.size(), 2);
    CHECK(parcels[1].minLon == doctest::Approx(-122.45));
}

TEST_CASE("parseParcelsGeoJSON requires a features array") {
    CHECK_THROWS_AS(parseParcelsGeoJSON(json::parse(R"({"type": "FeatureCollection"})")), std::runtime_error);
}

TEST_CASE("detectField returns the first usable candidate") {
    const json props = json::parse(R"({"nhood": null, "NEIGHBORHOOD": "Bernal Heights", "district": 9})");
    CHECK_EQ(detectField(props, {"nhood", "NEIGHBORHOOD"}), "NEIGHBORHOOD");
    CHECK_EQ(detectField(props, {"district"}), "district");
    CHECK_EQ(detectField(props, {"zone"}), "");
}

TEST_CASE("loadParcelsGeoJSON fails on a missing file") {
    CHECK_THROWS_AS(boundary::loadParcelsGeoJSON("no/such/parcels.geojson"), std::runtime_error);
}

// -----------------------------------------------------------------------------
// Tests for parcel lookup
// -----------------------------------------------------------------------------

TEST_CASE("ParcelIndex finds the parcel containing a point") {
    const Block block;
    const Point north{LON0 + metersToLon(50.0), LAT0 + metersToLat(20.0)};
    const Point street{LON0 + metersToLon(50.0), LAT0};

    const Parcel* found = block.parcels.findAt(north);
    REQUIRE(found != nullptr);
    CHECK_EQ(found->neighborhood, "Mission");
    CHECK(block.parcels.findAt(street) == nullptr);
    CHECK(pointInParcel(fixtures::parcel("Mission", "9", 3.0, 60.0), north));
}

TEST_CASE("sameAttribute ignores case and spacing but never matches empty") {
    CHECK(sameAttribute("Mission ", "MISSION"));
    CHECK(sameAttribute("Castro/Upper  Market", "castro/upper market"));
    CHECK_FALSE(sameAttribute("Mission", "Castro/Upper Market"));
    CHECK_FALSE(sameAttribute("", ""));
}

TEST_CASE("probePoint lands past the curb on the segment's own side") {
    const Block block;
    const Point left = probePoint(block.segmentOn(Side::Left), 10.0);
    const Point right = probePoint(block.segmentOn(Side::Right), 10.0);

    CHECK(left.lat == doctest::Approx(LAT0 + metersToLat(15.0)).epsilon(1e-9));
    CHECK(right.lat == doctest::Approx(LAT0 - metersToLat(15.0)).epsilon(1e-9));
    CHECK(left.lon == doctest::Approx(LON0 + metersToLon(50.0)));
}

// -----------------------------------------------------------------------------
// Tests for resolveBoundary
// -----------------------------------------------------------------------------

TEST_CASE("resolveBoundary confirms when both attributes match") {
    const Block block;
    CHECK(resolveBoundary(missionRegulation(), block.segmentOn(Side::Left), block.parcels, block.cfg) ==
          BoundaryOutcome::Confirmed);
}

TEST_CASE("resolveBoundary rejects the side across a neighborhood border") {
    const Block block;
    CHECK(resolveBoundary(missionRegulation(), block.segmentOn(Side::Right), block.parcels, block.cfg) ==
          BoundaryOutcome::Mismatch);
}

TEST_CASE("resolveBoundary needs the district to match as well") {
    const Block block;
    records::Regulation reg = missionRegulation();
    reg.district = "8";
    CHECK(resolveBoundary(reg, block.segmentOn(Side::Left), block.parcels, block.cfg) == BoundaryOutcome::Mismatch);
}

TEST_CASE("resolveBoundary fails closed without a parcel") {
    const Block block;
    const ParcelIndex empty{};
    CHECK(resolveBoundary(missionRegulation(), block.segmentOn(Side::Left), empty, block.cfg) ==
          BoundaryOutcome::NoParcel);
}

TEST_CASE("resolveBoundary fails closed without regulation attributes") {
    const Block block;
    records::Regulation reg = missionRegulation();
    reg.district.reset();
    CHECK(resolveBoundary(reg, block.segmentOn(Side::Left), block.parcels, block.cfg) ==
          BoundaryOutcome::MissingAttributes);

    reg = missionRegulation();
    reg.neighborhood = "";
    CHECK(resolveBoundary(reg, block.segmentOn(Side::Left), block.parcels, block.cfg) ==
          BoundaryOutcome::MissingAttributes);
}

TEST_CASE("BoundaryOutcome names") {
    CHECK_EQ(boundary::toString(BoundaryOutcome::Confirmed), "confirmed");
    CHECK_EQ(boundary::toString(BoundaryOutcome::NoParcel), "no-parcel");
}
