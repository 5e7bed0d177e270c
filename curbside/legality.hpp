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
#ifndef CURBSIDE_LEGALITY_HPP_
#define CURBSIDE_LEGALITY_HPP_

#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

#include "config.hpp"
#include "interpretation.hpp"
#include "schedule.hpp"
#include "segment.hpp"

using std::optional;
using std::string;
using std::vector;

namespace legality {

enum class Status { Legal, Illegal };

struct LegalityResult {
    Status status{Status::Legal};
    string explanation;
    optional<double> costEstimate;      // dollars
    optional<string> nextRestriction;
    vector<segment::Rule> applicableRules;
};

// thresholds plus an optional, non-owning interpretation cache
struct EvaluationContext {
    config::LegalityConfig config;
    const interpretation::IInterpretationSource* interpretations{nullptr};
};

LegalityResult evaluate(const segment::StreetSegment& seg,
                        const schedule::WeekTime& start,
                        int durationMinutes,
                        const EvaluationContext& ctx);

LegalityResult evaluate(const vector<segment::Rule>& rules,
                        const vector<segment::MeterSchedule>& meters,
                        const schedule::WeekTime& start,
                        int durationMinutes,
                        const EvaluationContext& ctx);

optional<int> parseVisitorAllowance(const string& text);
bool isHardBlocker(segment::RuleKind kind);
int precedenceRank(segment::RuleKind kind);
string formatHours(int minutes);
string toString(Status status);

}  // namespace legality

#endif  // CURBSIDE_LEGALITY_HPP_
