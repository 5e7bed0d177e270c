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
#include "segment.hpp"
#include <algorithm>      // for transform, all_of
#include <cctype>         // for toupper, tolower, isdigit, isspace
#include <map>            // for map
#include <sstream>        // for istringstream, ostringstream
#include <stdexcept>      // for out_of_range
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <utility>        // for move, make_pair
#include <vector>         // for vector

using std::istringstream;
using std::ostringstream;
using std::string;
using std::unordered_map;
using std::vector;

using geometry::Polyline;
using segment::AddressRange;
using segment::MatchConfidence;
using segment::MeterSchedule;
using segment::Rule;
using segment::RuleKind;
using segment::SegmentKey;
using segment::SegmentStore;
using segment::StreetSegment;
using side::Side;

namespace {
    string upper(const string& s) {
        string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    string lower(const string& s) {
        string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    bool contains(const string& haystack, const char* needle) {
        return haystack.find(needle) != string::npos;
    }

    bool allDigits(const string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(),
            [](unsigned char c) { return std::isdigit(c); });
    }

    std::pair<string, int> indexKey(const string& id, Side s) {
        return std::make_pair(id, s == Side::Left ? 0 : 1);
    }
}  // namespace

namespace segment {
    // Creates the Left and Right segments of one centerline
    //
    // Args:
    //    centerlineId: stable id of the surveyed centerline
    //    streetName: raw street name from the dataset
    //    centerline: the centerline vertices
    //    leftRange: address interval of the left side, if surveyed
    //    rightRange: address interval of the right side, if surveyed
    //    curbOffsetMeters: distance of the synthetic curb lines
    // Returns:
    //    false when the centerline id already exists
    // Throws:
    //    GeometryError for a degenerate centerline
    bool SegmentStore::addCenterline(const string& centerlineId, const string& streetName,
                                     const Polyline& centerline,
                                     const optional<AddressRange>& leftRange,
                                     const optional<AddressRange>& rightRange,
                                     double curbOffsetMeters) {
        geometry::validatePolyline(centerline);
        if (index_.count(indexKey(centerlineId, Side::Left))) return false;

        for (Side s : {Side::Left, Side::Right}) {
            const bool left = s == Side::Left;
            StreetSegment seg;
            seg.centerlineId = centerlineId;
            seg.side = s;
            seg.streetName = streetName;
            seg.addressRange = left ? leftRange : rightRange;
            seg.centerline = centerline;
            seg.syntheticCurb = geometry::offsetLine(centerline, curbOffsetMeters, left);
            seg.cardinal = geometry::sideFacingCardinal(centerline, left);

            index_[indexKey(centerlineId, s)] = segments_.size();
            byStreet_[normalizeStreetKey(streetName)].push_back(segments_.size());
            segments_.push_back(std::move(seg));
        }
        return true;
    }

    StreetSegment& SegmentStore::mutableAt(const SegmentKey& key) {
        auto it = index_.find(indexKey(key.centerlineId, key.side));
        if (it == index_.end()) {
            throw std::out_of_range("unknown segment " + key.centerlineId + "/" + side::toCode(key.side));
        }
        return segments_[it->second];
    }

    // Appends without deduplication; precedence is settled at query time
    void SegmentStore::attach(const SegmentKey& key, Rule rule) {
        mutableAt(key).rules.push_back(std::move(rule));
    }

    void SegmentStore::attachMeter(const SegmentKey& key, MeterSchedule meter) {
        mutableAt(key).meters.push_back(std::move(meter));
    }

    // First surveyed curb line wins
    bool SegmentStore::setCurbGeometry(const SegmentKey& key, const Polyline& curb) {
        StreetSegment& seg = mutableAt(key);
        if (seg.curbGeometry) return false;
        seg.curbGeometry = curb;
        return true;
    }

    void SegmentStore::setCrossStreets(const SegmentKey& key, const string& fromStreet, const string& toStreet) {
        StreetSegment& seg = mutableAt(key);
        if (!seg.fromStreet && !fromStreet.empty()) seg.fromStreet = fromStreet;
        if (!seg.toStreet && !toStreet.empty()) seg.toStreet = toStreet;
    }

    void SegmentStore::setCardinal(const SegmentKey& key, const string& cardinal) {
        if (!cardinal.empty()) mutableAt(key).cardinal = cardinal;
    }

    const StreetSegment* SegmentStore::find(const string& centerlineId, Side s) const {
        auto it = index_.find(indexKey(centerlineId, s));
        return it == index_.end() ? nullptr : &segments_[it->second];
    }

    vector<const StreetSegment*> SegmentStore::sidesOf(const string& centerlineId) const {
        vector<const StreetSegment*> out;
        for (Side s : {Side::Left, Side::Right}) {
            if (const StreetSegment* seg = find(centerlineId, s)) out.push_back(seg);
        }
        return out;
    }

    vector<const StreetSegment*> SegmentStore::byStreet(const string& streetName) const {
        vector<const StreetSegment*> out;
        auto it = byStreet_.find(normalizeStreetKey(streetName));
        if (it == byStreet_.end()) return out;
        for (size_t i : it->second) out.push_back(&segments_[i]);
        return out;
    }

    string toString(RuleKind kind) {
        switch (kind) {
            case RuleKind::Sweeping: return "sweeping";
            case RuleKind::TimeLimit: return "time-limit";
            case RuleKind::RppZone: return "rpp-zone";
            case RuleKind::TowAway: return "tow-away";
            case RuleKind::NoParking: return "no-parking";
            case RuleKind::Meter: return "meter";
        }
        return "no-parking";
    }

    bool parseRuleKind(const string& text, RuleKind* out) {
        static const unordered_map<string, RuleKind> kinds = {
            {"sweeping", RuleKind::Sweeping}, {"street-sweeping", RuleKind::Sweeping},
            {"time-limit", RuleKind::TimeLimit}, {"rpp-zone", RuleKind::RppZone},
            {"tow-away", RuleKind::TowAway}, {"no-parking", RuleKind::NoParking},
            {"meter", RuleKind::Meter}
        };
        auto it = kinds.find(lower(text));
        if (it == kinds.end()) return false;
        *out = it->second;
        return true;
    }

    string toString(MatchConfidence confidence) {
        switch (confidence) {
            case MatchConfidence::Clear: return "clear";
            case MatchConfidence::BoundaryResolved: return "boundary-resolved";
            case MatchConfidence::AddressMatched: return "address-matched";
            case MatchConfidence::Direct: return "direct";
            case MatchConfidence::Manual: return "manual";
        }
        return "clear";
    }

    bool parseMatchConfidence(const string& text, MatchConfidence* out) {
        for (MatchConfidence c : {MatchConfidence::Clear, MatchConfidence::BoundaryResolved,
                                  MatchConfidence::AddressMatched, MatchConfidence::Direct,
                                  MatchConfidence::Manual}) {
            if (toString(c) == text) {
                *out = c;
                return true;
            }
        }
        return false;
    }

    // Maps free regulation text to a rule kind
    //
    // Args:
    //    text: raw regulation text, e.g. "Time limited", "Tow away no stopping"
    //    recognized: set to false when nothing matched (result is then NoParking)
    // Returns:
    //    the rule kind
    RuleKind classifyRegulation(const string& text, bool* recognized) {
        const string t = upper(text);
        *recognized = true;
        if (contains(t, "SWEEP") || contains(t, "CLEANING")) return RuleKind::Sweeping;
        if (contains(t, "TOW")) return RuleKind::TowAway;
        if (contains(t, "GOVERNMENT PERMIT")) return RuleKind::NoParking;
        if (contains(t, "NO PARKING") || contains(t, "NO STOPPING") ||
            contains(t, "NO OVERNIGHT")) return RuleKind::NoParking;
        if (contains(t, "METER") || contains(t, "PAY")) return RuleKind::Meter;
        if (contains(t, "RPP") || contains(t, "RESIDENTIAL") || contains(t, "PERMIT")) {
            return RuleKind::RppZone;
        }
        if (contains(t, "TIME") || contains(t, "LIMIT") || contains(t, "HOUR")) return RuleKind::TimeLimit;
        *recognized = false;
        return RuleKind::NoParking;
    }

    // Upper case with collapsed whitespace, used as a lookup key
    string normalizeStreetKey(const string& streetName) {
        istringstream in(upper(streetName));
        string word, out;
        while (in >> word) {
            if (!out.empty()) out += ' ';
            out += word;
        }
        return out;
    }

    // "18TH ST" -> "18th Street", "MCALLISTER ST" -> "McAllister Street"
    string normalizeStreetName(const string& streetName) {
        static const unordered_map<string, string> streetTypes = {
            {"ST", "Street"}, {"AVE", "Avenue"}, {"BLVD", "Boulevard"}, {"DR", "Drive"},
            {"RD", "Road"}, {"LN", "Lane"}, {"CT", "Court"}, {"PL", "Place"},
            {"WAY", "Way"}, {"TER", "Terrace"}, {"CIR", "Circle"}, {"PKWY", "Parkway"}
        };

        istringstream in(streetName);
        vector<string> words;
        string w;
        while (in >> w) words.push_back(w);
        if (words.empty()) return "Unknown Street";

        vector<string> formatted;
        for (size_t i = 0; i < words.size(); ++i) {
            const string& word = words[i];
            const string up = upper(word);

            // ordinals: 18TH -> 18th
            if (up.size() > 2) {
                const string suffix = up.substr(up.size() - 2);
                const string prefix = up.substr(0, up.size() - 2);
                if ((suffix == "ST" || suffix == "ND" || suffix == "RD" || suffix == "TH") && allDigits(prefix)) {
                    formatted.push_back(prefix + lower(suffix));
                    continue;
                }
            }
            // street type abbreviation, last word only
            if (i == words.size() - 1) {
                auto it = streetTypes.find(up);
                if (it != streetTypes.end()) {
                    formatted.push_back(it->second);
                    continue;
                }
            }
            string lw = lower(word);
            if (lw.size() > 2 && lw.compare(0, 2, "mc") == 0) {
                lw[2] = static_cast<char>(std::toupper(static_cast<unsigned char>(lw[2])));
            }
            // capitalize after apostrophes too: O'SHAUGHNESSY -> O'Shaughnessy
            for (size_t k = 0; k < lw.size(); ++k) {
                if (k == 0 || lw[k - 1] == '\'') {
                    lw[k] = static_cast<char>(std::toupper(static_cast<unsigned char>(lw[k])));
                }
            }
            formatted.push_back(lw);
        }

        ostringstream oss;
        for (size_t i = 0; i < formatted.size(); ++i) {
            if (i) oss << ' ';
            oss << formatted[i];
        }
        return oss.str();
    }

    // "18th Street (North side, 3401-3449)"
    string displayName(const StreetSegment& seg) {
        ostringstream oss;
        oss << normalizeStreetName(seg.streetName) << " (";
        if (!seg.cardinal.empty()) {
            oss << seg.cardinal << " side";
        } else {
            oss << side::toString(seg.side) << " side";
        }
        if (seg.addressRange) {
            oss << ", " << seg.addressRange->fromAddress << "-" << seg.addressRange->toAddress;
        }
        oss << ")";
        return oss.str();
    }
}  // namespace segment
