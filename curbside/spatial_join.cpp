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
#include "spatial_join.hpp"
#include <algorithm>  // for max
#include <cmath>      // for cos, floor
#include <set>        // for set
#include <sstream>    // for ostringstream
#include <string>     // for string
#include <utility>    // for move
#include <vector>     // for vector

#include "log.hpp"
#include "side.hpp"

using std::ostringstream;
using std::set;
using std::string;
using std::vector;

using geometry::Bounds;
using geometry::Polyline;
using segment::MatchConfidence;
using segment::SegmentStore;
using segment::StreetSegment;
using spatial_join::Attachment;
using spatial_join::JoinOutcome;
using spatial_join::JoinResult;
using spatial_join::SegmentIndex;
using spatial_join::SideCandidate;
using spatial_join::Tier;

namespace {
    const double PI = 3.14159265358979323846;

    string describe(const SideCandidate& c) {
        ostringstream oss;
        oss << c.segment->centerlineId << "/" << side::toCode(c.segment->side)
            << " at " << c.distanceMeters << "m";
        return oss.str();
    }
}  // namespace

namespace spatial_join {
    SegmentIndex::SegmentIndex(const SegmentStore& store, double cellMeters) : store_(store) {
        const double cell = std::max(cellMeters, 1.0);
        double refLat = 0.0;
        if (!store.segments().empty()) refLat = store.segments().front().centerline.front().lat;
        cellLat_ = cell / geometry::METERS_PER_DEGREE_LAT;
        cellLon_ = cellLat_ / std::max(std::cos(refLat * PI / 180.0), 0.01);

        // both sides share a centerline, so index every other segment
        for (const auto& seg : store.segments()) {
            if (seg.side != side::Side::Left) continue;
            const size_t idx = centerlineIds_.size();
            centerlineIds_.push_back(seg.centerlineId);

            long long x0, y0, x1, y1;
            cellRange(geometry::lineBounds(seg.centerline), &x0, &y0, &x1, &y1);
            for (long long x = x0; x <= x1; ++x) {
                for (long long y = y0; y <= y1; ++y) cells_[cellKey(x, y)].push_back(idx);
            }
        }
    }

    long long SegmentIndex::cellKey(long long ix, long long iy) const {
        return ix * 4294967296LL + (iy & 0xffffffffLL);
    }

    void SegmentIndex::cellRange(const Bounds& b, long long* x0, long long* y0, long long* x1, long long* y1) const {
        *x0 = static_cast<long long>(std::floor(b.minLon / cellLon_));
        *y0 = static_cast<long long>(std::floor(b.minLat / cellLat_));
        *x1 = static_cast<long long>(std::floor(b.maxLon / cellLon_));
        *y1 = static_cast<long long>(std::floor(b.maxLat / cellLat_));
    }

    // Grid lookup followed by an exact centerline distance check
    //
    // Args:
    //    line: regulation geometry
    //    radiusMeters: search radius around the line
    // Returns:
    //    per centerline, its sides in Left, Right order; centerlines sorted by id
    vector<vector<const StreetSegment*>> SegmentIndex::candidates(const Polyline& line, double radiusMeters) const {
        long long x0, y0, x1, y1;
        cellRange(geometry::expandBounds(geometry::lineBounds(line), radiusMeters), &x0, &y0, &x1, &y1);

        set<string> ids;
        for (long long x = x0; x <= x1; ++x) {
            for (long long y = y0; y <= y1; ++y) {
                auto it = cells_.find(cellKey(x, y));
                if (it == cells_.end()) continue;
                for (size_t idx : it->second) ids.insert(centerlineIds_[idx]);
            }
        }

        vector<vector<const StreetSegment*>> out;
        for (const auto& id : ids) {
            auto sides = store_.sidesOf(id);
            if (sides.empty()) continue;
            if (geometry::lineToLineDistance(line, sides.front()->centerline) > radiusMeters) continue;
            out.push_back(std::move(sides));
        }
        return out;
    }

    Tier classify(double distanceMeters, const config::JoinConfig& cfg) {
        if (distanceMeters < cfg.clearThresholdMeters) return Tier::Clear;
        if (distanceMeters < cfg.boundaryThresholdMeters) return Tier::Boundary;
        return Tier::OutOfRange;
    }

    // Mean distance of the regulation's sample points to a curb line
    double regulationDistance(const Polyline& regulation, const Polyline& curb) {
        double total = 0.0;
        int n = 0;
        for (double f : side::SAMPLE_POSITIONS) {
            total += geometry::distanceToLine(geometry::interpolate(regulation, f), curb);
            ++n;
        }
        return total / n;
    }

    vector<SideCandidate> rankCandidates(const Polyline& regulation,
                                         const SegmentIndex& index,
                                         const config::JoinConfig& cfg) {
        vector<SideCandidate> out;
        for (const auto& group : index.candidates(regulation, cfg.searchRadiusMeters)) {
            for (const StreetSegment* seg : group) {
                SideCandidate c;
                c.segment = seg;
                c.distanceMeters = regulationDistance(regulation, seg->curbLine());
                c.tier = classify(c.distanceMeters, cfg);
                out.push_back(c);
            }
        }
        return out;
    }

    // Decides which segment sides a regulation belongs to
    //
    // Args:
    //    regulation: raw regulation with geometry
    //    index: read-only grid over the segment store
    //    parcels: administrative overlay for boundary candidates
    //    cfg: distance thresholds
    // Returns:
    //    every CLEAR side when any exists; otherwise the BOUNDARY sides the
    //    resolver confirmed; otherwise no attachment
    // Throws:
    //    GeometryError for degenerate regulation geometry
    JoinResult joinRegulationToSegments(const records::Regulation& regulation,
                                        const SegmentIndex& index,
                                        const boundary::ParcelIndex& parcels,
                                        const config::JoinConfig& cfg) {
        geometry::validatePolyline(regulation.geometry);

        JoinResult result;
        result.candidates = rankCandidates(regulation.geometry, index, cfg);

        for (const auto& c : result.candidates) {
            if (c.tier != Tier::Clear) continue;
            result.attachments.push_back(Attachment{c.segment->key(), MatchConfidence::Clear, c.distanceMeters});
        }
        if (!result.attachments.empty()) {
            result.outcome = JoinOutcome::Matched;
            return result;
        }

        bool anyBoundary = false;
        for (const auto& c : result.candidates) {
            if (c.tier != Tier::Boundary) continue;
            anyBoundary = true;
            const auto outcome = boundary::resolveBoundary(regulation, *c.segment, parcels, cfg);
            if (outcome == boundary::BoundaryOutcome::Confirmed) {
                result.attachments.push_back(
                    Attachment{c.segment->key(), MatchConfidence::BoundaryResolved, c.distanceMeters});
            } else {
                logging::debug("regulation " + regulation.id + ": boundary candidate " + describe(c) +
                               " rejected (" + boundary::toString(outcome) + ")");
            }
        }

        if (!result.attachments.empty()) {
            result.outcome = JoinOutcome::Matched;
        } else {
            result.outcome = anyBoundary ? JoinOutcome::BoundaryRejected : JoinOutcome::NoCandidates;
        }
        return result;
    }

    string toString(Tier tier) {
        switch (tier) {
            case Tier::Clear: return "clear";
            case Tier::Boundary: return "boundary";
            case Tier::OutOfRange: return "out-of-range";
        }
        return "out-of-range";
    }

    string toString(JoinOutcome outcome) {
        switch (outcome) {
            case JoinOutcome::Matched: return "matched";
            case JoinOutcome::NoCandidates: return "no-candidates";
            case JoinOutcome::BoundaryRejected: return "boundary-rejected";
        }
        return "no-candidates";
    }
}  // namespace spatial_join
