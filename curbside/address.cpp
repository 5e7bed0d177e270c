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
#include "address.hpp"
#include <algorithm>  // for min, max
#include <cctype>     // for isdigit
#include <optional>   // for optional, nullopt
#include <string>     // for string, stoi
#include <vector>     // for vector

using std::nullopt;
using std::optional;
using std::string;
using std::vector;

using segment::AddressRange;
using segment::SegmentStore;
using segment::StreetSegment;

namespace address {
    // Leading house number of an address field: "3401A" -> 3401, "1/2" -> 1
    optional<int> parseAddressNumber(const string& text) {
        string digits;
        for (char c : text) {
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digits += c;
            } else if (!digits.empty()) {
                break;
            }
        }
        if (digits.empty() || digits.size() > 9) return nullopt;
        return std::stoi(digits);
    }

    // Inclusive containment. When both ends share a parity the side is
    // numbered odd-only or even-only, and the address must match it.
    bool rangeContains(const AddressRange& range, int addressNumber) {
        const int lo = std::min(range.fromAddress, range.toAddress);
        const int hi = std::max(range.fromAddress, range.toAddress);
        if (addressNumber < lo || addressNumber > hi) return false;
        const bool sameParity = (lo % 2) == (hi % 2);
        return !sameParity || (addressNumber % 2) == (lo % 2);
    }

    string addressParity(const AddressRange& range) {
        if ((range.fromAddress % 2) != (range.toAddress % 2)) return "mixed";
        return range.fromAddress % 2 == 0 ? "even" : "odd";
    }

    // Finds the segment side whose address interval holds the number
    //
    // Args:
    //    streetName: street to match, compared after normalization
    //    addressNumber: the house number
    //    segments: candidate segments, typically every side of the street
    // Returns:
    //    the matching segment, or nullptr so the caller falls back to geometry.
    //    Segments without an address interval are skipped.
    const StreetSegment* matchByAddress(
        const string& streetName, int addressNumber,
        const vector<const StreetSegment*>& segments) {
        const string key = segment::normalizeStreetKey(streetName);
        for (const StreetSegment* seg : segments) {
            if (!seg || !seg->addressRange) continue;
            if (segment::normalizeStreetKey(seg->streetName) != key) continue;
            if (rangeContains(*seg->addressRange, addressNumber)) return seg;
        }
        return nullptr;
    }

    const StreetSegment* matchByAddress(
        const string& streetName, int addressNumber, const SegmentStore& store) {
        return matchByAddress(streetName, addressNumber, store.byStreet(streetName));
    }
}  // namespace address
