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
#ifndef CURBSIDE_RECORDS_HPP_
#define CURBSIDE_RECORDS_HPP_

#include <optional>  // for optional
#include <string>    // for string

#include "geometry.hpp"
#include "schedule.hpp"
#include "segment.hpp"
#include "side.hpp"

using std::optional;
using std::string;

// -------------------------------------
// ingestion-time input records, already normalized: day and hour strings
// are parsed into schedule::Schedule before anything downstream sees them
// -------------------------------------
namespace records {

// one surveyed street centerline
struct Centerline {
    string id;
    string streetName;
    geometry::Polyline geometry;
    optional<segment::AddressRange> leftRange;
    optional<segment::AddressRange> rightRange;
};

// surveyed curb line of one side of a centerline; its side is not given
struct Blockface {
    string id;
    string centerlineId;
    geometry::Polyline geometry;
};

// street sweeping schedule keyed directly by centerline and side
struct SweepingRecord {
    string centerlineId;
    side::Side side{side::Side::Left};
    schedule::Schedule schedule;
    string rawDays;
    string rawHours;
    string limits;       // "York St - Bryant St"
    string blockside;    // cardinal direction, e.g. "North"
};

// raw regulation with geometry but no side or segment
struct Regulation {
    string id;
    geometry::Polyline geometry;
    segment::RuleKind kind{segment::RuleKind::NoParking};
    string regulation;   // raw type text, e.g. "Time limited"
    string description;
    schedule::Schedule schedule;
    optional<int> hourLimitMinutes;
    optional<string> permitZone;
    optional<string> neighborhood;
    optional<string> district;
    optional<string> streetName;
    optional<int> addressNumber;
};

// meter schedule keyed by centerline; side optional
struct MeterRecord {
    string centerlineId;
    optional<side::Side> side;
    double rate{};
    schedule::Schedule schedule;
    string postId;
};

// hand-verified street sweeping schedule for a block the datasets get
// wrong or omit; applied to the first segment side its criteria match
struct Override {
    string id;
    string verifiedDate;
    // match criteria, absent ones match anything
    optional<string> streetPattern;   // case-insensitive regex over the street name
    optional<side::Side> side;
    optional<string> centerlineId;
    optional<int> fromAddress;
    optional<int> toAddress;
    // the schedule to add
    schedule::Schedule schedule;
    string rawDays;
    string rawHours;
    string limits;
    string blockside;
};

}  // namespace records

#endif  // CURBSIDE_RECORDS_HPP_
