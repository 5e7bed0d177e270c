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
#include "legality.hpp"
#include <algorithm>  // for stable_sort, min_element
#include <iomanip>    // for setprecision
#include <optional>   // for optional, nullopt
#include <regex>      // for regex, regex_search, smatch
#include <sstream>    // for ostringstream
#include <stdexcept>  // for invalid_argument
#include <string>     // for string
#include <vector>     // for vector

using std::nullopt;
using std::optional;
using std::ostringstream;
using std::regex;
using std::smatch;
using std::string;
using std::vector;

using legality::EvaluationContext;
using legality::LegalityResult;
using legality::Status;
using schedule::WeekTime;
using segment::MeterSchedule;
using segment::Rule;
using segment::RuleKind;

namespace {
    string kindTitle(RuleKind kind) {
        switch (kind) {
            case RuleKind::TowAway: return "Tow-away zone";
            case RuleKind::Sweeping: return "Street sweeping";
            case RuleKind::NoParking: return "No parking";
            case RuleKind::RppZone: return "Residential permit zone";
            case RuleKind::TimeLimit: return "Time limit";
            case RuleKind::Meter: return "Metered parking";
        }
        return "Restriction";
    }

    // Display text for a rule; a confident cached interpretation wins
    string ruleLabel(const Rule& rule, const EvaluationContext& ctx) {
        if (ctx.interpretations) {
            const string key = rule.interpretationKey ? *rule.interpretationKey
                                                      : interpretation::canonicalKey(rule);
            const auto cached = ctx.interpretations->lookup(key);
            if (cached && cached->confidence >= ctx.config.minInterpretationConfidence &&
                !cached->summary.empty()) {
                return cached->summary;
            }
        }
        const string when = schedule::describeSchedule(rule.schedule);
        if (!rule.description.empty()) return rule.description + " (" + when + ")";
        return kindTitle(rule.kind) + " (" + when + ")";
    }

    string money(double dollars) {
        ostringstream oss;
        oss << "$" << std::fixed << std::setprecision(2) << dollars;
        return oss.str();
    }

    Rule meterAsRule(const MeterSchedule& m) {
        Rule r;
        r.kind = RuleKind::Meter;
        r.schedule = m.schedule;
        r.meterRate = m.rate;
        r.description = m.description.empty() ? "Metered parking" : m.description;
        r.sourceId = m.postId;
        r.confidence = segment::MatchConfidence::Direct;
        return r;
    }

    // precedence first, then description, so insertion order never matters
    bool ruleOrder(const Rule& a, const Rule& b) {
        const int ra = legality::precedenceRank(a.kind);
        const int rb = legality::precedenceRank(b.kind);
        if (ra != rb) return ra < rb;
        return a.description < b.description;
    }

    int rppAllowance(const Rule& rule, const EvaluationContext& ctx) {
        auto parsed = legality::parseVisitorAllowance(rule.description);
        if (!parsed) parsed = legality::parseVisitorAllowance(rule.sourceText);
        if (parsed) return *parsed;
        if (rule.limitMinutes) return *rule.limitMinutes;
        return ctx.config.rppDefaultVisitorMinutes;
    }

    string zoneSuffix(const Rule& rule) {
        return rule.permitZone ? " except Zone " + *rule.permitZone : " except permit holders";
    }

    // the stay's end within the repeating week; the sum is taken in 64 bits
    // so any non-negative duration is safe
    WeekTime stayEnd(const WeekTime& start, int durationMinutes) {
        const long long end = static_cast<long long>(start.minuteOfWeek()) + durationMinutes;
        return WeekTime::fromMinuteOfWeek(static_cast<int>(end % schedule::MINUTES_PER_WEEK));
    }

    // next hard blocker beginning after the stay ends, within the horizon
    optional<string> nextRestriction(const vector<Rule>& rules, const WeekTime& end,
                                     const EvaluationContext& ctx) {
        const Rule* best = nullptr;
        int bestDelta = 0;
        for (const auto& rule : rules) {
            if (!legality::isHardBlocker(rule.kind)) continue;
            const auto delta = schedule::minutesUntilNextStart(
                rule.schedule, end, ctx.config.nextRestrictionHorizonMinutes);
            if (!delta) continue;
            if (!best || *delta < bestDelta || (*delta == bestDelta && ruleOrder(rule, *best))) {
                best = &rule;
                bestDelta = *delta;
            }
        }
        if (!best) return nullopt;

        const WeekTime at = WeekTime::fromMinuteOfWeek(end.minuteOfWeek() + bestDelta);
        ostringstream oss;
        oss << ruleLabel(*best, ctx) << " starts " << schedule::weekdayName(at.day) << " "
            << schedule::formatMinutes(at.minuteOfDay) << " (in " << legality::formatHours(bestDelta) << ")";
        return oss.str();
    }
}  // namespace

namespace legality {
    bool isHardBlocker(RuleKind kind) {
        return kind == RuleKind::TowAway || kind == RuleKind::Sweeping || kind == RuleKind::NoParking;
    }

    int precedenceRank(RuleKind kind) {
        switch (kind) {
            case RuleKind::TowAway: return 0;
            case RuleKind::Sweeping: return 1;
            case RuleKind::NoParking: return 2;
            case RuleKind::RppZone: return 3;
            case RuleKind::TimeLimit: return 4;
            case RuleKind::Meter: return 5;
        }
        return 6;
    }

    // 120 -> "2hr", 90 -> "1.5hr"
    string formatHours(int minutes) {
        ostringstream oss;
        if (minutes % 60 == 0) {
            oss << minutes / 60;
        } else {
            oss << std::setprecision(3) << minutes / 60.0;
        }
        oss << "hr";
        return oss.str();
    }

    string toString(Status status) {
        return status == Status::Legal ? "legal" : "illegal";
    }

    // Visitor allowance stated in permit zone text
    //
    // Args:
    //    text: e.g. "2 hour visitor parking", "visitors 2 hours", "2hr non-permit"
    // Returns:
    //    minutes, or nullopt when the text names no allowance
    optional<int> parseVisitorAllowance(const string& text) {
        static const vector<regex> patterns = {
            regex(R"(visitors?\s+(\d+)\s+hours?)", regex::icase),
            regex(R"((\d+)\s*(?:hr|hour)s?\s+visitor)", regex::icase),
            regex(R"((\d+)\s*(?:hr|hour)s?\s+(?:for\s+)?non-permit)", regex::icase),
            regex(R"(non-permit\s+holders?\s+(\d+)\s+hours?)", regex::icase),
            regex(R"((\d+)\s*(?:hr|hour)s?\s+(?:for\s+)?non-resident)", regex::icase),
            regex(R"((\d+)\s*(?:hr|hour)s?\s+(?:parking\s+)?except)", regex::icase),
        };
        for (const auto& re : patterns) {
            smatch m;
            if (std::regex_search(text, m, re)) {
                const string digits = m[1].str();
                if (digits.size() > 3) continue;
                return std::stoi(digits) * 60;
            }
        }
        return nullopt;
    }

    // Decides whether parking is allowed for the requested stay
    //
    // Args:
    //    rules: regulations attached to one segment side
    //    meters: meter schedules of that side
    //    start: when the stay begins
    //    durationMinutes: length of the stay; 0 checks the instant
    //    ctx: defaults and interpretation overrides
    // Returns:
    //    status with the deciding explanation; pure, so repeated calls agree
    // Throws:
    //    invalid_argument for a negative duration
    LegalityResult evaluate(const vector<Rule>& rules,
                            const vector<MeterSchedule>& meters,
                            const WeekTime& start,
                            int durationMinutes,
                            const EvaluationContext& ctx) {
        if (durationMinutes < 0) throw std::invalid_argument("duration must not be negative");

        LegalityResult result;
        for (const auto& rule : rules) {
            if (schedule::overlaps(rule.schedule, start, durationMinutes)) result.applicableRules.push_back(rule);
        }
        for (const auto& m : meters) {
            if (schedule::overlaps(m.schedule, start, durationMinutes)) result.applicableRules.push_back(meterAsRule(m));
        }
        std::stable_sort(result.applicableRules.begin(), result.applicableRules.end(), ruleOrder);

        if (result.applicableRules.empty()) {
            result.status = Status::Legal;
            result.explanation = "No restrictions found";
            result.nextRestriction = nextRestriction(rules, stayEnd(start, durationMinutes), ctx);
            return result;
        }

        // applicable rules are sorted, so the first hard blocker outranks the rest
        for (const auto& rule : result.applicableRules) {
            if (!isHardBlocker(rule.kind)) continue;
            const string title = kindTitle(rule.kind);
            const string label = ruleLabel(rule, ctx);
            result.status = Status::Illegal;
            result.explanation = label.compare(0, title.size(), title) == 0 ? label : title + ": " + label;
            return result;
        }

        vector<string> notes;
        for (const auto& rule : result.applicableRules) {
            if (rule.kind != RuleKind::RppZone) continue;
            const int allowance = rppAllowance(rule, ctx);
            if (durationMinutes > allowance) {
                result.status = Status::Illegal;
                result.explanation = "Exceeds " + formatHours(allowance) + " visitor limit" + zoneSuffix(rule) +
                    " (requested " + formatHours(durationMinutes) + ")";
                return result;
            }
            notes.push_back(formatHours(allowance) + " visitor parking" + zoneSuffix(rule));
        }

        const Rule* tightest = nullptr;
        int tightestLimit = 0;
        for (const auto& rule : result.applicableRules) {
            if (rule.kind != RuleKind::TimeLimit) continue;
            const int limit = rule.limitMinutes.value_or(ctx.config.timeLimitDefaultMinutes);
            if (!tightest || limit < tightestLimit) {
                tightest = &rule;
                tightestLimit = limit;
            }
        }
        if (tightest) {
            if (durationMinutes > tightestLimit) {
                result.status = Status::Illegal;
                result.explanation = "Exceeds " + formatHours(tightestLimit) + " time limit (" +
                    ruleLabel(*tightest, ctx) + "; requested " + formatHours(durationMinutes) + ")";
                return result;
            }
            notes.push_back(formatHours(tightestLimit) + " time limit: " + ruleLabel(*tightest, ctx));
        }

        optional<double> rate;
        for (const auto& rule : result.applicableRules) {
            if (rule.kind != RuleKind::Meter) continue;
            if (rule.meterRate && (!rate || *rule.meterRate > *rate)) rate = rule.meterRate;
            if (!rule.meterRate) notes.push_back(ruleLabel(rule, ctx));
        }

        result.status = Status::Legal;
        ostringstream oss;
        bool sep = false;
        if (rate) {
            result.costEstimate = *rate * durationMinutes / 60.0;
            oss << "Meter: " << money(*result.costEstimate) << " for " << formatHours(durationMinutes)
                << " at " << money(*rate) << "/hr";
            sep = true;
        }
        for (const auto& n : notes) {
            if (sep) oss << "; ";
            oss << n;
            sep = true;
        }
        result.explanation = sep ? oss.str() : "No restrictions found";
        result.nextRestriction = nextRestriction(rules, stayEnd(start, durationMinutes), ctx);
        return result;
    }

    LegalityResult evaluate(const segment::StreetSegment& seg,
                            const WeekTime& start,
                            int durationMinutes,
                            const EvaluationContext& ctx) {
        return evaluate(seg.rules, seg.meters, start, durationMinutes, ctx);
    }
}  // namespace legality
