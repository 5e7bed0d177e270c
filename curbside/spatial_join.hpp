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
#ifndef CURBSIDE_SPATIAL_JOIN_HPP_
#define CURBSIDE_SPATIAL_JOIN_HPP_

#include <stddef.h>       // for size_t
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <vector>         // for vector

#include "boundary.hpp"
#include "config.hpp"
#include "geometry.hpp"
#include "records.hpp"
#include "segment.hpp"

using std::string;
using std::unordered_map;
using std::vector;

namespace spatial_join {

enum class Tier { Clear, Boundary, OutOfRange };

// one segment side near a regulation, with its curb distance
struct SideCandidate {
    const segment::StreetSegment* segment{nullptr};
    double distanceMeters{};
    Tier tier{Tier::OutOfRange};
};

struct Attachment {
    segment::SegmentKey key;
    segment::MatchConfidence confidence{segment::MatchConfidence::Clear};
    double distanceMeters{};
};

enum class JoinOutcome { Matched, NoCandidates, BoundaryRejected };

struct JoinResult {
    vector<Attachment> attachments;
    JoinOutcome outcome{JoinOutcome::NoCandidates};
    vector<SideCandidate> candidates;   // every side considered, for logging
};

// Uniform grid over centerline bounds. Built once from a finished store and
// only read afterwards, so the join workers can share it.
class SegmentIndex {
 public:
    SegmentIndex(const segment::SegmentStore& store, double cellMeters);

    // segment sides whose centerline lies within radiusMeters of the line,
    // grouped per centerline and ordered by centerline id
    vector<vector<const segment::StreetSegment*>> candidates(
        const geometry::Polyline& line, double radiusMeters) const;

    const segment::SegmentStore& store() const { return store_; }

 private:
    long long cellKey(long long ix, long long iy) const;
    void cellRange(const geometry::Bounds& b, long long* x0, long long* y0, long long* x1, long long* y1) const;

    const segment::SegmentStore& store_;
    vector<string> centerlineIds_;
    unordered_map<long long, vector<size_t>> cells_;
    double cellLon_{};
    double cellLat_{};
};

Tier classify(double distanceMeters, const config::JoinConfig& cfg);
double regulationDistance(const geometry::Polyline& regulation, const geometry::Polyline& curb);

vector<SideCandidate> rankCandidates(const geometry::Polyline& regulation,
                                     const SegmentIndex& index,
                                     const config::JoinConfig& cfg);

JoinResult joinRegulationToSegments(const records::Regulation& regulation,
                                    const SegmentIndex& index,
                                    const boundary::ParcelIndex& parcels,
                                    const config::JoinConfig& cfg);

string toString(Tier tier);
string toString(JoinOutcome outcome);

}  // namespace spatial_join

#endif  // CURBSIDE_SPATIAL_JOIN_HPP_
