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
#include "ingest.hpp"
#include <algorithm>   // for min, max
#include <functional>  // for cref
#include <future>      // for async, future
#include <iomanip>     // for setprecision
#include <memory>      // for make_shared
#include <optional>    // for optional
#include <regex>       // for regex, regex_search
#include <sstream>     // for ostringstream
#include <string>      // for string
#include <utility>     // for move, pair
#include <vector>      // for vector

#include "address.hpp"
#include "geometry.hpp"
#include "interpretation.hpp"
#include "log.hpp"
#include "side.hpp"

using std::make_shared;
using std::ostringstream;
using std::string;
using std::vector;

using ingest::IngestReport;
using ingest::RegulationPlan;
using segment::MatchConfidence;
using segment::Rule;
using segment::SegmentKey;
using segment::SegmentStore;
using side::Side;

namespace {
    void addCenterlines(const vector<records::Centerline>& centerlines, const config::JoinConfig& cfg,
                        SegmentStore* store, IngestReport* report) {
        for (const auto& c : centerlines) {
            try {
                if (!store->addCenterline(c.id, c.streetName, c.geometry, c.leftRange, c.rightRange,
                                          cfg.curbOffsetMeters)) {
                    logging::warn("duplicate centerline " + c.id + " ignored");
                    ++report->duplicateCenterlines;
                }
            } catch (const geometry::GeometryError& e) {
                logging::warn("centerline " + c.id + " skipped: " + e.what());
                ++report->invalidCenterlines;
            }
        }
        report->segments = store->size();
    }

    // surveyed curb lines carry no side; vote it from the centerline
    void attachBlockfaces(const vector<records::Blockface>& blockfaces, SegmentStore* store, IngestReport* report) {
        for (const auto& bf : blockfaces) {
            const auto sides = store->sidesOf(bf.centerlineId);
            if (sides.empty()) {
                ++report->blockfacesUnmatched;
                continue;
            }
            const auto decision = side::determineSide(sides.front()->centerline, bf.geometry);
            if (decision.vote == side::SideVote::Indeterminate) {
                logging::debug("blockface " + bf.id + " on " + bf.centerlineId + ": side indeterminate (" +
                               std::to_string(decision.leftVotes) + "L/" + std::to_string(decision.rightVotes) + "R)");
                ++report->blockfacesIndeterminate;
                continue;
            }
            const Side s = decision.vote == side::SideVote::Left ? Side::Left : Side::Right;
            if (store->setCurbGeometry(SegmentKey{bf.centerlineId, s}, bf.geometry)) ++report->blockfacesAttached;
        }
    }

    void attachSweeping(const vector<records::SweepingRecord>& sweeping, SegmentStore* store, IngestReport* report) {
        for (const auto& sw : sweeping) {
            const SegmentKey key{sw.centerlineId, sw.side};
            if (!store->find(key)) {
                logging::debug("sweeping for " + sw.centerlineId + "/" + side::toCode(sw.side) + " has no segment");
                ++report->sweepingUnmatched;
                continue;
            }
            store->attach(key, ingest::ruleFromSweeping(sw));
            const auto limits = ingest::splitLimits(sw.limits);
            store->setCrossStreets(key, limits.first, limits.second);
            store->setCardinal(key, sw.blockside);
            ++report->sweepingAttached;
            ++report->rulesAttached;
        }
    }

    void attachMeters(const vector<records::MeterRecord>& meters, SegmentStore* store, IngestReport* report) {
        for (const auto& m : meters) {
            vector<SegmentKey> keys;
            if (m.side) {
                if (store->find(m.centerlineId, *m.side)) keys.push_back(SegmentKey{m.centerlineId, *m.side});
            } else {
                for (const auto* seg : store->sidesOf(m.centerlineId)) keys.push_back(seg->key());
            }
            if (keys.empty()) {
                ++report->metersUnmatched;
                continue;
            }
            ostringstream desc;
            desc << "Meter $" << std::fixed << std::setprecision(2) << m.rate << "/hr";
            for (const auto& key : keys) {
                segment::MeterSchedule meter;
                meter.rate = m.rate;
                meter.schedule = m.schedule;
                meter.description = desc.str();
                meter.postId = m.postId;
                store->attachMeter(key, std::move(meter));
            }
            ++report->metersAttached;
        }
    }

    // pattern is the compiled street regex, nullptr when the entry has none
    bool matchesOverride(const records::Override& entry, const std::regex* pattern,
                         const segment::StreetSegment& seg) {
        if (pattern && !std::regex_search(seg.streetName, *pattern)) return false;
        if (entry.side && seg.side != *entry.side) return false;
        if (entry.centerlineId && seg.centerlineId != *entry.centerlineId) return false;
        if (entry.fromAddress || entry.toAddress) {
            if (!seg.addressRange) return false;
            if (entry.fromAddress && seg.addressRange->fromAddress != *entry.fromAddress) return false;
            if (entry.toAddress && seg.addressRange->toAddress != *entry.toAddress) return false;
        }
        return true;
    }

    vector<RegulationPlan> planChunk(const vector<records::Regulation>& regulations, size_t begin, size_t end,
                                     const spatial_join::SegmentIndex& index,
                                     const boundary::ParcelIndex& parcels,
                                     const config::JoinConfig& cfg) {
        vector<RegulationPlan> out;
        out.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            out.push_back(ingest::planRegulation(regulations[i], index, parcels, cfg));
        }
        return out;
    }
}  // namespace

namespace ingest {
    // Places one regulation: address interval first, then the spatial join
    //
    // Args:
    //    regulation: raw regulation
    //    index: read-only segment index
    //    parcels: administrative overlay
    //    cfg: join thresholds
    // Returns:
    //    the sides to attach to; a malformed geometry yields Invalid
    //    rather than an exception
    RegulationPlan planRegulation(const records::Regulation& regulation,
                                  const spatial_join::SegmentIndex& index,
                                  const boundary::ParcelIndex& parcels,
                                  const config::JoinConfig& cfg) {
        RegulationPlan plan;
        if (regulation.streetName && regulation.addressNumber) {
            const auto* seg = address::matchByAddress(*regulation.streetName, *regulation.addressNumber, index.store());
            if (seg) {
                plan.status = RegulationPlan::Status::AddressMatched;
                plan.attachments.push_back(spatial_join::Attachment{seg->key(), MatchConfidence::AddressMatched, 0.0});
                return plan;
            }
        }

        try {
            const auto result = spatial_join::joinRegulationToSegments(regulation, index, parcels, cfg);
            plan.attachments = result.attachments;
            switch (result.outcome) {
                case spatial_join::JoinOutcome::Matched: plan.status = RegulationPlan::Status::Joined; break;
                case spatial_join::JoinOutcome::BoundaryRejected:
                    plan.status = RegulationPlan::Status::BoundaryRejected;
                    break;
                case spatial_join::JoinOutcome::NoCandidates: plan.status = RegulationPlan::Status::Unmatched; break;
            }
        } catch (const geometry::GeometryError& e) {
            plan.status = RegulationPlan::Status::Invalid;
            plan.error = e.what();
        }
        return plan;
    }

    // Parallel map over contiguous chunks; results come back in input order
    vector<RegulationPlan> planRegulations(const vector<records::Regulation>& regulations,
                                           const spatial_join::SegmentIndex& index,
                                           const boundary::ParcelIndex& parcels,
                                           const config::JoinConfig& cfg,
                                           unsigned threads) {
        const size_t n = regulations.size();
        const size_t workers = std::max<size_t>(1, std::min<size_t>(threads, n));
        if (workers <= 1) return planChunk(regulations, 0, n, index, parcels, cfg);

        const size_t chunk = (n + workers - 1) / workers;
        vector<std::future<vector<RegulationPlan>>> futures;
        for (size_t begin = 0; begin < n; begin += chunk) {
            const size_t end = std::min(n, begin + chunk);
            futures.push_back(std::async(std::launch::async, planChunk, std::cref(regulations), begin, end,
                                         std::cref(index), std::cref(parcels), std::cref(cfg)));
        }

        vector<RegulationPlan> plans;
        plans.reserve(n);
        // get() rethrows a worker's exception, abandoning the whole run
        for (auto& f : futures) {
            auto part = f.get();
            for (auto& p : part) plans.push_back(std::move(p));
        }
        return plans;
    }

    // Builds a complete snapshot from one set of inputs
    //
    // Args:
    //    inputs: parsed dataset records
    //    cfg: join thresholds and worker count
    // Returns:
    //    the finished read-only snapshot and the run's counters.
    //    Malformed records are logged and skipped; anything else propagates
    //    and no snapshot is produced.
    IngestResult buildSnapshot(const IngestInputs& inputs, const config::EngineConfig& cfg) {
        IngestResult result;
        IngestReport& report = result.report;
        SegmentStore store;

        addCenterlines(inputs.centerlines, cfg.join, &store, &report);
        logging::info("Created " + std::to_string(store.size()) + " street segments");

        attachBlockfaces(inputs.blockfaces, &store, &report);
        attachSweeping(inputs.sweeping, &store, &report);

        {
            const spatial_join::SegmentIndex index(store, cfg.join.searchRadiusMeters);
            const boundary::ParcelIndex parcels(inputs.parcels);
            const auto plans = planRegulations(inputs.regulations, index, parcels, cfg.join,
                                               config::effectiveThreads(cfg));

            for (size_t i = 0; i < plans.size(); ++i) {
                const auto& plan = plans[i];
                const auto& reg = inputs.regulations[i];
                switch (plan.status) {
                    case RegulationPlan::Status::AddressMatched: ++report.regulationsAddressMatched; break;
                    case RegulationPlan::Status::Joined:
                        if (plan.attachments.front().confidence == MatchConfidence::Clear) {
                            ++report.regulationsClear;
                        } else {
                            ++report.regulationsBoundaryResolved;
                        }
                        break;
                    case RegulationPlan::Status::BoundaryRejected:
                        ++report.regulationsBoundaryRejected;
                        report.unmatchedRegulationIds.push_back(reg.id);
                        logging::debug("regulation " + reg.id + " unmatched: boundary candidates rejected");
                        break;
                    case RegulationPlan::Status::Unmatched:
                        ++report.regulationsUnmatched;
                        report.unmatchedRegulationIds.push_back(reg.id);
                        logging::debug("regulation " + reg.id + " unmatched: no segment in range");
                        break;
                    case RegulationPlan::Status::Invalid:
                        ++report.regulationsInvalid;
                        logging::warn("regulation " + reg.id + " skipped: " + plan.error);
                        break;
                }
                for (const auto& a : plan.attachments) {
                    store.attach(a.key, ruleFromRegulation(reg, a.confidence));
                    ++report.rulesAttached;
                }
            }
        }

        attachMeters(inputs.meters, &store, &report);
        applyOverrides(inputs.overrides, &store, &report);

        result.snapshot = make_shared<const snapshot::Snapshot>(std::move(store), cfg.join.curbOffsetMeters);
        logging::info(summarize(report));
        return result;
    }

    // Adds each override's schedule to the first segment side it matches,
    // in store order. Cross streets and the cardinal are only filled in
    // where the datasets left them empty.
    void applyOverrides(const vector<records::Override>& overrides, SegmentStore* store, IngestReport* report) {
        for (const auto& o : overrides) {
            std::optional<std::regex> pattern;
            if (o.streetPattern) pattern.emplace(*o.streetPattern, std::regex::icase);

            const segment::StreetSegment* target = nullptr;
            for (const auto& seg : store->segments()) {
                if (matchesOverride(o, pattern ? &*pattern : nullptr, seg)) {
                    target = &seg;
                    break;
                }
            }
            if (!target) {
                logging::warn("override " + o.id + " matched no segment");
                ++report->overridesUnmatched;
                report->unmatchedOverrideIds.push_back(o.id);
                continue;
            }

            const SegmentKey key = target->key();
            const bool hasCardinal = !target->cardinal.empty();
            store->attach(key, ruleFromOverride(o));
            const auto limits = splitLimits(o.limits);
            store->setCrossStreets(key, limits.first, limits.second);
            if (!hasCardinal) store->setCardinal(key, o.blockside);
            logging::debug("override " + o.id + " applied to " + key.centerlineId + "/" + side::toCode(key.side));
            ++report->overridesApplied;
            ++report->rulesAttached;
        }
    }

    bool overrideMatches(const records::Override& entry, const segment::StreetSegment& seg) {
        if (!entry.streetPattern) return matchesOverride(entry, nullptr, seg);
        const std::regex pattern(*entry.streetPattern, std::regex::icase);
        return matchesOverride(entry, &pattern, seg);
    }

    Rule ruleFromOverride(const records::Override& o) {
        Rule rule;
        rule.kind = segment::RuleKind::Sweeping;
        rule.schedule = o.schedule;
        rule.description = "Street sweeping";
        rule.sourceText = "Street sweeping " + o.rawDays + " " + o.rawHours;
        rule.sourceId = o.id;
        rule.confidence = MatchConfidence::Manual;
        rule.interpretationKey = interpretation::canonicalKey(rule);
        return rule;
    }

    Rule ruleFromRegulation(const records::Regulation& regulation, MatchConfidence confidence) {
        Rule rule;
        rule.kind = regulation.kind;
        rule.schedule = regulation.schedule;
        rule.limitMinutes = regulation.hourLimitMinutes;
        rule.permitZone = regulation.permitZone;
        rule.description = regulation.description;
        rule.sourceText = regulation.regulation;
        rule.sourceId = regulation.id;
        rule.confidence = confidence;
        rule.interpretationKey = interpretation::canonicalKey(rule);
        return rule;
    }

    Rule ruleFromSweeping(const records::SweepingRecord& sweeping) {
        Rule rule;
        rule.kind = segment::RuleKind::Sweeping;
        rule.schedule = sweeping.schedule;
        rule.description = "Street sweeping";
        rule.sourceText = "Street sweeping " + sweeping.rawDays + " " + sweeping.rawHours;
        rule.sourceId = sweeping.centerlineId + side::toCode(sweeping.side);
        rule.confidence = MatchConfidence::Direct;
        rule.interpretationKey = interpretation::canonicalKey(rule);
        return rule;
    }

    // "York St  -  Bryant St" -> {"York St", "Bryant St"}
    std::pair<string, string> splitLimits(const string& limits) {
        const size_t dash = limits.find('-');
        if (dash == string::npos || limits.find('-', dash + 1) != string::npos) return {};
        auto trim = [](const string& s) {
            const size_t b = s.find_first_not_of(" \t");
            if (b == string::npos) return string();
            return s.substr(b, s.find_last_not_of(" \t") - b + 1);
        };
        return {trim(limits.substr(0, dash)), trim(limits.substr(dash + 1))};
    }

    string summarize(const IngestReport& r) {
        ostringstream oss;
        oss << "Ingested " << r.segments << " segments; blockfaces " << r.blockfacesAttached
            << " attached, " << r.blockfacesIndeterminate << " indeterminate; sweeping "
            << r.sweepingAttached << " attached, " << r.sweepingUnmatched << " unmatched; regulations "
            << r.regulationsClear << " clear, " << r.regulationsBoundaryResolved << " boundary-resolved, "
            << r.regulationsAddressMatched << " address-matched, "
            << r.regulationsUnmatched + r.regulationsBoundaryRejected << " unmatched, "
            << r.regulationsInvalid << " invalid; meters " << r.metersAttached << " attached; overrides "
            << r.overridesApplied << " applied, " << r.overridesUnmatched << " unmatched";
        return oss.str();
    }
}  // namespace ingest
