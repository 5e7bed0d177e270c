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
#ifndef CURBSIDE_ADDRESS_HPP_
#define CURBSIDE_ADDRESS_HPP_

#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

#include "segment.hpp"

using std::optional;
using std::string;
using std::vector;

namespace address {

optional<int> parseAddressNumber(const string& text);
bool rangeContains(const segment::AddressRange& range, int addressNumber);
string addressParity(const segment::AddressRange& range);

const segment::StreetSegment* matchByAddress(
    const string& streetName, int addressNumber,
    const vector<const segment::StreetSegment*>& segments);
const segment::StreetSegment* matchByAddress(
    const string& streetName, int addressNumber, const segment::SegmentStore& store);

}  // namespace address

#endif  // CURBSIDE_ADDRESS_HPP_
