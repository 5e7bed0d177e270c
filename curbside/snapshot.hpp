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
#ifndef CURBSIDE_SNAPSHOT_HPP_
#define CURBSIDE_SNAPSHOT_HPP_

#include <stddef.h>               // for size_t
#include <memory>                 // for shared_ptr
#include <mutex>                  // for mutex
#include <nlohmann/json_fwd.hpp>  // for json
#include <string>                 // for string
#include <utility>                // for pair
#include <vector>                 // for vector

#include "geometry.hpp"
#include "segment.hpp"
#include "side.hpp"

using std::shared_ptr;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace snapshot {

// A finished, read-only segment store. Built once per ingestion run and
// replaced as a whole, never edited in place.
class Snapshot {
 public:
    Snapshot(segment::SegmentStore store, double curbOffsetMeters);

    const segment::StreetSegment* find(const string& centerlineId, side::Side s) const {
        return store_.find(centerlineId, s);
    }
    // segment sides whose curb line is within radiusMeters, nearest first
    vector<std::pair<const segment::StreetSegment*, double>> nearest(
        const geometry::Point& point, double radiusMeters) const;

    const segment::SegmentStore& store() const { return store_; }
    size_t size() const { return store_.size(); }
    double curbOffsetMeters() const { return curbOffsetMeters_; }

 private:
    segment::SegmentStore store_;
    double curbOffsetMeters_;
};

// Serves the current snapshot to readers. publish swaps the whole snapshot;
// a reader holding the previous one keeps it alive until it lets go.
class SnapshotHolder {
 public:
    shared_ptr<const Snapshot> current() const;
    void publish(shared_ptr<const Snapshot> next);

 private:
    mutable std::mutex mutex_;
    shared_ptr<const Snapshot> current_;
};

json toJson(const segment::Rule& rule);
segment::Rule ruleFromJson(const json& j);
json toJson(const Snapshot& snap);
shared_ptr<const Snapshot> fromJson(const json& j);

void writeSnapshotJson(const Snapshot& snap, const string& path);
shared_ptr<const Snapshot> readSnapshotJson(const string& path);

}  // namespace snapshot

#endif  // CURBSIDE_SNAPSHOT_HPP_
