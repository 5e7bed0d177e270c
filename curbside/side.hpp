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
#ifndef CURBSIDE_SIDE_HPP_
#define CURBSIDE_SIDE_HPP_

#include <string>  // for string

#include "geometry.hpp"

using std::string;

namespace side {

// fractions of the candidate geometry sampled for voting
const double SAMPLE_POSITIONS[] = {0.25, 0.5, 0.75};

// finite difference step along the centerline for the local tangent
const double TANGENT_STEP_METERS = 1.0;

// one physical side of a centerline, relative to its digitized direction
enum class Side { Left, Right };

// outcome of a vote; Indeterminate is a failed match, never a default side
enum class SideVote { Left, Right, Indeterminate };

struct SideDecision {
    SideVote vote{SideVote::Indeterminate};
    int leftVotes{};
    int rightVotes{};
};

string toString(Side s);
string toCode(Side s);
bool parseSide(const string& text, Side* out);

SideDecision determineSide(const geometry::Polyline& centerline, const geometry::Polyline& candidate);
SideDecision determineSide(const geometry::Polyline& centerline, const geometry::Point& candidate);

}  // namespace side

#endif  // CURBSIDE_SIDE_HPP_
