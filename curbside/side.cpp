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
#include "side.hpp"
#include <algorithm>  // for transform
#include <cctype>     // for toupper
#include <string>     // for string

using std::string;

using geometry::Point;
using geometry::Polyline;
using side::Side;
using side::SideDecision;
using side::SideVote;

namespace {
    // Sign of the cross product between the local centerline tangent at the
    // sample's projection and the vector from the projection to the sample
    int voteForPoint(const Polyline& centerline, const Point& sample) {
        const auto proj = geometry::projectOntoLine(sample, centerline);
        const double total = geometry::lineLength(centerline);

        // forward difference, backward at the far end of the line
        Point from = proj.point;
        Point to = proj.point;
        if (proj.distanceAlong + side::TANGENT_STEP_METERS > total) {
            from = geometry::pointAtDistance(centerline, proj.distanceAlong - side::TANGENT_STEP_METERS);
        } else {
            to = geometry::pointAtDistance(centerline, proj.distanceAlong + side::TANGENT_STEP_METERS);
        }

        // Shift the sample by the tangent origin so the cross product is taken
        // from the projected point, not from the tangent's start
        const Point shifted{
            from.lon + (sample.lon - proj.point.lon),
            from.lat + (sample.lat - proj.point.lat) };
        return geometry::crossProductSide(from, to, shifted);
    }

    SideDecision tally(int left, int right) {
        SideDecision d;
        d.leftVotes = left;
        d.rightVotes = right;
        if (left >= 2 && left > right) {
            d.vote = SideVote::Left;
        } else if (right >= 2 && right > left) {
            d.vote = SideVote::Right;
        }
        return d;
    }
}  // namespace

namespace side {
    string toString(Side s) {
        return s == Side::Left ? "Left" : "Right";
    }

    // Single letter code used by the source datasets ("L" / "R")
    string toCode(Side s) {
        return s == Side::Left ? "L" : "R";
    }

    bool parseSide(const string& text, Side* out) {
        string upper(text);
        std::transform(upper.begin(), upper.end(), upper.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "L" || upper == "LEFT") {
            *out = Side::Left;
            return true;
        }
        if (upper == "R" || upper == "RIGHT") {
            *out = Side::Right;
            return true;
        }
        return false;
    }

    // Majority vote over three samples of the candidate geometry
    //
    // Args:
    //    centerline: the reference street centerline (validated by caller)
    //    candidate: regulation or curb geometry to classify
    // Returns:
    //    decision with vote counts; Indeterminate unless one side has >= 2 votes
    SideDecision determineSide(const Polyline& centerline, const Polyline& candidate) {
        geometry::validatePolyline(centerline);
        if (candidate.empty()) throw geometry::GeometryError("candidate geometry is empty");

        int left = 0, right = 0;
        for (double position : SAMPLE_POSITIONS) {
            const int v = voteForPoint(centerline, geometry::interpolate(candidate, position));
            if (v > 0) ++left;
            else if (v < 0) ++right;
        }
        return tally(left, right);
    }

    // Point candidates (parcel centroids) vote with the same point three times
    SideDecision determineSide(const Polyline& centerline, const Point& candidate) {
        return determineSide(centerline, Polyline{candidate});
    }
}  // namespace side
