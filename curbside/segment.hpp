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
#ifndef CURBSIDE_SEGMENT_HPP_
#define CURBSIDE_SEGMENT_HPP_

#include <stddef.h>  // for size_t
#include <map>       // for map
#include <optional>  // for optional
#include <string>    // for string
#include <utility>   // for pair
#include <vector>    // for vector

#include "geometry.hpp"
#include "schedule.hpp"
#include "side.hpp"

using std::optional;
using std::string;
using std::vector;

namespace segment {

enum class RuleKind { Sweeping, TimeLimit, RppZone, TowAway, NoParking, Meter };

// how a rule came to be attached to its segment
enum class MatchConfidence { Clear, BoundaryResolved, AddressMatched, Direct, Manual };

// one regulation applicable to one segment side; never edited once attached
struct Rule {
    RuleKind kind{RuleKind::NoParking};
    schedule::Schedule schedule;
    optional<int> limitMinutes;
    optional<string> permitZone;
    optional<double> meterRate;       // dollars per hour
    string description;               // display text
    string sourceText;                // raw regulation text
    string sourceId;
    optional<string> interpretationKey;
    MatchConfidence confidence{MatchConfidence::Clear};
};

struct MeterSchedule {
    double rate{};                    // dollars per hour
    schedule::Schedule schedule;
    string description;
    string postId;
};

// inclusive address interval of one side of a block
struct AddressRange {
    int fromAddress{};
    int toAddress{};
};

struct SegmentKey {
    string centerlineId;
    side::Side side{side::Side::Left};
};

// one physical side of one street centerline
struct StreetSegment {
    string centerlineId;
    side::Side side{side::Side::Left};
    string streetName;
    optional<string> fromStreet;
    optional<string> toStreet;
    optional<AddressRange> addressRange;
    geometry::Polyline centerline;
    optional<geometry::Polyline> curbGeometry;   // surveyed blockface
    geometry::Polyline syntheticCurb;            // offset from the centerline
    string cardinal;
    vector<Rule> rules;
    vector<MeterSchedule> meters;

    SegmentKey key() const { return SegmentKey{centerlineId, side}; }
    const geometry::Polyline& curbLine() const { return curbGeometry ? *curbGeometry : syntheticCurb; }
};

// Accumulates rules per segment side during one ingestion run. Segments are
// only created through addCenterline, so the side of a segment is fixed at
// creation and its centerline never changes afterwards.
class SegmentStore {
 public:
    bool addCenterline(const string& centerlineId, const string& streetName,
                       const geometry::Polyline& centerline,
                       const optional<AddressRange>& leftRange,
                       const optional<AddressRange>& rightRange,
                       double curbOffsetMeters);

    void attach(const SegmentKey& key, Rule rule);
    void attachMeter(const SegmentKey& key, MeterSchedule meter);
    bool setCurbGeometry(const SegmentKey& key, const geometry::Polyline& curb);
    void setCrossStreets(const SegmentKey& key, const string& fromStreet, const string& toStreet);
    void setCardinal(const SegmentKey& key, const string& cardinal);

    const StreetSegment* find(const string& centerlineId, side::Side s) const;
    const StreetSegment* find(const SegmentKey& key) const { return find(key.centerlineId, key.side); }
    vector<const StreetSegment*> sidesOf(const string& centerlineId) const;
    vector<const StreetSegment*> byStreet(const string& streetName) const;

    const vector<StreetSegment>& segments() const { return segments_; }
    size_t size() const { return segments_.size(); }

 private:
    StreetSegment& mutableAt(const SegmentKey& key);

    vector<StreetSegment> segments_;
    std::map<std::pair<string, int>, size_t> index_;
    std::map<string, vector<size_t>> byStreet_;
};

string toString(RuleKind kind);
bool parseRuleKind(const string& text, RuleKind* out);
string toString(MatchConfidence confidence);
bool parseMatchConfidence(const string& text, MatchConfidence* out);
RuleKind classifyRegulation(const string& text, bool* recognized);

string normalizeStreetKey(const string& streetName);
string normalizeStreetName(const string& streetName);
string displayName(const StreetSegment& seg);

}  // namespace segment

#endif  // CURBSIDE_SEGMENT_HPP_
