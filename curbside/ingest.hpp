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
#ifndef CURBSIDE_INGEST_HPP_
#define CURBSIDE_INGEST_HPP_

#include <stddef.h>  // for size_t
#include <memory>    // for shared_ptr
#include <string>    // for string
#include <utility>   // for pair
#include <vector>    // for vector

#include "boundary.hpp"
#include "config.hpp"
#include "records.hpp"
#include "segment.hpp"
#include "snapshot.hpp"
#include "spatial_join.hpp"

using std::shared_ptr;
using std::string;
using std::vector;

namespace ingest {

// everything one ingestion run reads; never modified by the run
struct IngestInputs {
    vector<records::Centerline> centerlines;
    vector<records::Blockface> blockfaces;
    vector<records::SweepingRecord> sweeping;
    vector<records::Regulation> regulations;
    vector<records::MeterRecord> meters;
    vector<boundary::Parcel> parcels;
    vector<records::Override> overrides;
};

struct IngestReport {
    size_t segments{};
    size_t invalidCenterlines{};
    size_t duplicateCenterlines{};
    size_t blockfacesAttached{};
    size_t blockfacesIndeterminate{};
    size_t blockfacesUnmatched{};
    size_t sweepingAttached{};
    size_t sweepingUnmatched{};
    size_t regulationsAddressMatched{};
    size_t regulationsClear{};
    size_t regulationsBoundaryResolved{};
    size_t regulationsBoundaryRejected{};
    size_t regulationsUnmatched{};
    size_t regulationsInvalid{};
    size_t rulesAttached{};
    size_t metersAttached{};
    size_t metersUnmatched{};
    size_t overridesApplied{};
    size_t overridesUnmatched{};
    vector<string> unmatchedRegulationIds;
    vector<string> unmatchedOverrideIds;
};

struct IngestResult {
    shared_ptr<const snapshot::Snapshot> snapshot;
    IngestReport report;
};

// outcome of placing one regulation, computed by a join worker
struct RegulationPlan {
    enum class Status { AddressMatched, Joined, BoundaryRejected, Unmatched, Invalid };

    Status status{Status::Unmatched};
    vector<spatial_join::Attachment> attachments;
    string error;
};

RegulationPlan planRegulation(const records::Regulation& regulation,
                              const spatial_join::SegmentIndex& index,
                              const boundary::ParcelIndex& parcels,
                              const config::JoinConfig& cfg);

vector<RegulationPlan> planRegulations(const vector<records::Regulation>& regulations,
                                       const spatial_join::SegmentIndex& index,
                                       const boundary::ParcelIndex& parcels,
                                       const config::JoinConfig& cfg,
                                       unsigned threads);

void applyOverrides(const vector<records::Override>& overrides, segment::SegmentStore* store,
                    IngestReport* report);
IngestResult buildSnapshot(const IngestInputs& inputs, const config::EngineConfig& cfg);

segment::Rule ruleFromRegulation(const records::Regulation& regulation, segment::MatchConfidence confidence);
segment::Rule ruleFromSweeping(const records::SweepingRecord& sweeping);
segment::Rule ruleFromOverride(const records::Override& entry);
bool overrideMatches(const records::Override& entry, const segment::StreetSegment& seg);
std::pair<string, string> splitLimits(const string& limits);
string summarize(const IngestReport& report);

}  // namespace ingest

#endif  // CURBSIDE_INGEST_HPP_
