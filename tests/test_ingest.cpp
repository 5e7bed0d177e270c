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
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>
#include "../curbside/ingest.hpp"
#include "../curbside/legality.hpp"
#include "fixtures.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

using ingest::IngestInputs;
using ingest::IngestReport;
using ingest::IngestResult;
using ingest::RegulationPlan;
using records::Regulation;
using segment::AddressRange;
using segment::MatchConfidence;
using segment::RuleKind;
using side::Side;

using ingest::buildSnapshot;
using ingest::splitLimits;

using fixtures::eastbound;

namespace {
    // Two blocks: 18th Street at the origin and 19th Street 200m north.
    // Regulations cover a clear match, a boundary match, an address
    // match, one out of range and one with broken geometry.
    IngestInputs sampleInputs() {
        IngestInputs in;

        records::Centerline eighteenth = fixtures::centerline("1001", "18TH ST", 0.0);
        eighteenth.leftRange = AddressRange{3201, 3299};
        in.centerlines.push_back(eighteenth);
        in.centerlines.push_back(fixtures::centerline("1002", "19TH ST", 200.0));
        in.centerlines.push_back(fixtures::centerline("1001", "18TH ST", 0.0));
        records::Centerline broken = fixtures::centerline("1003", "20TH ST", 400.0);
        broken.geometry.resize(1);
        in.centerlines.push_back(broken);

        in.blockfaces.push_back(records::Blockface{"bf1", "1002", eastbound(206.0)});
        in.blockfaces.push_back(records::Blockface{"bf2", "1002", eastbound(200.0)});
        in.blockfaces.push_back(records::Blockface{"bf3", "9999", eastbound(206.0)});

        records::SweepingRecord sweep;
        sweep.centerlineId = "1001";
        sweep.side = Side::Right;
        sweep.schedule = schedule::makeSchedule("Tues", "8", "10", "");
        sweep.rawDays = "Tues";
        sweep.rawHours = "8-10";
        sweep.limits = "Valencia St - Guerrero St";
        sweep.blockside = "South";
        in.sweeping.push_back(sweep);
        sweep.centerlineId = "9999";
        in.sweeping.push_back(sweep);

        in.regulations.push_back(fixtures::regulation("r1", RuleKind::TimeLimit, 5.0));

        Regulation boundaryReg = fixtures::regulation("r2", RuleKind::TowAway, 13.0);
        boundaryReg.regulation = "Tow away";
        boundaryReg.description = "Tow away";
        boundaryReg.neighborhood = "Mission";
        boundaryReg.district = "9";
        in.regulations.push_back(boundaryReg);

        in.regulations.push_back(fixtures::regulation("r3", RuleKind::TimeLimit, 100.0));

        Regulation degenerate = fixtures::regulation("r4", RuleKind::TimeLimit, 5.0);
        degenerate.geometry.resize(1);
        in.regulations.push_back(degenerate);

        Regulation byAddress = fixtures::regulation("r5", RuleKind::NoParking, 500.0);
        byAddress.description = "No parking";
        byAddress.streetName = "18th St";
        byAddress.addressNumber = 3251;
        in.regulations.push_back(byAddress);

        records::MeterRecord meter;
        meter.centerlineId = "1001";
        meter.rate = 3.5;
        meter.schedule = fixtures::window(schedule::DaySet{0x3f}, 9 * 60, 18 * 60);
        meter.postId = "P-1";
        in.meters.push_back(meter);
        meter.centerlineId = "9999";
        in.meters.push_back(meter);

        in.parcels.push_back(fixtures::parcel("Mission", "9", 3.0, 60.0));
        in.parcels.push_back(fixtures::parcel("Castro/Upper Market", "8", -60.0, -3.0));
        return in;
    }

    config::EngineConfig singleThreaded() {
        config::EngineConfig cfg = config::defaultConfig();
        cfg.threads = 1;
        return cfg;
    }
}  // namespace

// -----------------------------------------------------------------------------
// Tests for buildSnapshot
// -----------------------------------------------------------------------------

TEST_CASE("buildSnapshot counts every record it places or skips") {
    const IngestResult result = buildSnapshot(sampleInputs(), singleThreaded());
    const IngestReport& r = result.report;

    CHECK_EQ(r.segments, 4);
    CHECK_EQ(r.duplicateCenterlines, 1);
    CHECK_EQ(r.invalidCenterlines, 1);
    CHECK_EQ(r.blockfacesAttached, 1);
    CHECK_EQ(r.blockfacesIndeterminate, 1);
    CHECK_EQ(r.blockfacesUnmatched, 1);
    CHECK_EQ(r.sweepingAttached, 1);
    CHECK_EQ(r.sweepingUnmatched, 1);
    CHECK_EQ(r.regulationsClear, 1);
    CHECK_EQ(r.regulationsBoundaryResolved, 1);
    CHECK_EQ(r.regulationsAddressMatched, 1);
    CHECK_EQ(r.regulationsUnmatched, 1);
    CHECK_EQ(r.regulationsBoundaryRejected, 0);
    CHECK_EQ(r.regulationsInvalid, 1);
    CHECK_EQ(r.rulesAttached, 4);
    CHECK_EQ(r.metersAttached, 1);
    CHECK_EQ(r.metersUnmatched, 1);
    CHECK_EQ(r.unmatchedRegulationIds, vector<string>{"r3"});
}

TEST_CASE("buildSnapshot attaches rules to the right sides") {
    const IngestResult result = buildSnapshot(sampleInputs(), singleThreaded());
    const auto& snap = *result.snapshot;

    const auto* left = snap.find("1001", Side::Left);
    REQUIRE(left != nullptr);
    REQUIRE_EQ(left->rules.size(), 3);
    CHECK_EQ(left->rules[0].sourceId, "r1");
    CHECK(left->rules[0].confidence == MatchConfidence::Clear);
    CHECK_EQ(left->rules[1].sourceId, "r2");
    CHECK(left->rules[1].confidence == MatchConfidence::BoundaryResolved);
    CHECK_EQ(left->rules[2].sourceId, "r5");
    CHECK(left->rules[2].confidence == MatchConfidence::AddressMatched);
    CHECK(left->rules[0].interpretationKey.has_value());

    const auto* right = snap.find("1001", Side::Right);
    REQUIRE(right != nullptr);
    REQUIRE_EQ(right->rules.size(), 1);
    CHECK(right->rules[0].kind == RuleKind::Sweeping);
    CHECK(right->rules[0].confidence == MatchConfidence::Direct);
    CHECK_EQ(*right->fromStreet, "Valencia St");
    CHECK_EQ(*right->toStreet, "Guerrero St");
    CHECK_EQ(right->cardinal, "South");

    CHECK_EQ(left->meters.size(), 1);
    CHECK_EQ(right->meters.size(), 1);
    CHECK_EQ(right->meters[0].description, "Meter $3.50/hr");

    CHECK(snap.find("1002", Side::Left)->curbGeometry.has_value());
    CHECK_FALSE(snap.find("1002", Side::Right)->curbGeometry.has_value());
    CHECK(snap.find("1003", Side::Left) == nullptr);
}

TEST_CASE("buildSnapshot output is deterministic and independent of thread count") {
    const IngestInputs inputs = sampleInputs();
    const json first = snapshot::toJson(*buildSnapshot(inputs, singleThreaded()).snapshot);
    const json again = snapshot::toJson(*buildSnapshot(inputs, singleThreaded()).snapshot);

    config::EngineConfig parallel = singleThreaded();
    parallel.threads = 4;
    const json threaded = snapshot::toJson(*buildSnapshot(inputs, parallel).snapshot);

    CHECK_EQ(first, again);
    CHECK_EQ(first, threaded);
}

TEST_CASE("buildSnapshot feeds legality checks end to end") {
    const IngestResult result = buildSnapshot(sampleInputs(), singleThreaded());
    const auto* left = result.snapshot->find("1001", Side::Left);
    REQUIRE(left != nullptr);

    // r2 tows on weekdays 8am-6pm and outranks the other rules on this side
    const auto weekday = legality::evaluate(*left, schedule::WeekTime{schedule::Weekday::Monday, 10 * 60}, 30,
                                            legality::EvaluationContext{});
    CHECK(weekday.status == legality::Status::Illegal);
    CHECK(weekday.explanation.find("Tow-away zone") == 0);

    const auto sunday = legality::evaluate(*left, schedule::WeekTime{schedule::Weekday::Sunday, 10 * 60}, 300,
                                           legality::EvaluationContext{});
    CHECK(sunday.status == legality::Status::Legal);
}

TEST_CASE("buildSnapshot with no inputs yields an empty snapshot") {
    const IngestResult result = buildSnapshot(IngestInputs{}, singleThreaded());
    REQUIRE(result.snapshot != nullptr);
    CHECK_EQ(result.snapshot->size(), 0);
    CHECK_EQ(result.report.rulesAttached, 0);
}

// -----------------------------------------------------------------------------
// Tests for manual overrides
// -----------------------------------------------------------------------------

namespace {
    records::Override sweepingOverride(const string& id, const string& days, const string& from, const string& to) {
        records::Override o;
        o.id = id;
        o.schedule = schedule::makeSchedule(days, from, to, "");
        o.rawDays = days;
        o.rawHours = from + "-" + to;
        return o;
    }
}  // namespace

TEST_CASE("buildSnapshot applies overrides after the join") {
    IngestInputs inputs = sampleInputs();

    records::Override byAddress = sweepingOverride("o1", "Thu", "6", "8");
    byAddress.streetPattern = "^18th";
    byAddress.side = Side::Left;
    byAddress.fromAddress = 3201;
    byAddress.toAddress = 3299;
    byAddress.limits = "Valencia St - Guerrero St";
    byAddress.blockside = "Northside";
    inputs.overrides.push_back(byAddress);

    records::Override byStreet = sweepingOverride("o2", "Wed", "6", "8");
    byStreet.streetPattern = "19TH";
    inputs.overrides.push_back(byStreet);

    records::Override missing = sweepingOverride("o3", "Wed", "6", "8");
    missing.centerlineId = "4242";
    inputs.overrides.push_back(missing);

    const IngestResult plain = buildSnapshot(sampleInputs(), singleThreaded());
    const IngestResult result = buildSnapshot(inputs, singleThreaded());
    const IngestReport& r = result.report;
    CHECK_EQ(r.overridesApplied, 2);
    CHECK_EQ(r.overridesUnmatched, 1);
    CHECK_EQ(r.unmatchedOverrideIds, vector<string>{"o3"});
    CHECK_EQ(r.rulesAttached, plain.report.rulesAttached + 2);
    CHECK(ingest::summarize(r).find("overrides 2 applied, 1 unmatched") != string::npos);

    const auto* left = result.snapshot->find("1001", Side::Left);
    REQUIRE_EQ(left->rules.size(), 4);
    CHECK_EQ(left->rules[3].sourceId, "o1");
    CHECK(left->rules[3].kind == RuleKind::Sweeping);
    CHECK(left->rules[3].confidence == MatchConfidence::Manual);
    CHECK_EQ(*left->fromStreet, "Valencia St");
    // a cardinal already on the segment is kept
    CHECK_EQ(left->cardinal, plain.snapshot->find("1001", Side::Left)->cardinal);

    // without a side, the first matching side in store order takes it
    CHECK_EQ(result.snapshot->find("1002", Side::Left)->rules.size(), 1);
    CHECK(result.snapshot->find("1002", Side::Right)->rules.empty());

    const auto swept = legality::evaluate(*result.snapshot->find("1002", Side::Left),
                                          schedule::WeekTime{schedule::Weekday::Wednesday, 7 * 60}, 30,
                                          legality::EvaluationContext{});
    CHECK(swept.status == legality::Status::Illegal);
    CHECK(swept.explanation.find("Street sweeping") == 0);
}

TEST_CASE("overrideMatches requires every given criterion") {
    segment::SegmentStore store;
    store.addCenterline("1001", "18TH ST", eastbound(0.0), AddressRange{3201, 3299}, std::nullopt, 5.0);
    const auto& left = *store.find("1001", Side::Left);
    const auto& right = *store.find("1001", Side::Right);

    records::Override o = sweepingOverride("o1", "Tue", "8", "10");
    CHECK(ingest::overrideMatches(o, left));

    o.streetPattern = "18th st";
    CHECK(ingest::overrideMatches(o, left));
    o.streetPattern = "^19";
    CHECK_FALSE(ingest::overrideMatches(o, left));
    o.streetPattern.reset();

    o.fromAddress = 3201;
    CHECK(ingest::overrideMatches(o, left));
    CHECK_FALSE(ingest::overrideMatches(o, right));
    o.toAddress = 3298;
    CHECK_FALSE(ingest::overrideMatches(o, left));
    o.toAddress.reset();

    o.side = Side::Right;
    CHECK_FALSE(ingest::overrideMatches(o, left));
    o.fromAddress.reset();
    CHECK(ingest::overrideMatches(o, right));
    o.centerlineId = "1002";
    CHECK_FALSE(ingest::overrideMatches(o, right));
}

TEST_CASE("ruleFromOverride tags the rule as manual") {
    const segment::Rule rule = ingest::ruleFromOverride(sweepingOverride("fix-7", "Tue", "8", "10"));
    CHECK(rule.kind == RuleKind::Sweeping);
    CHECK(rule.confidence == MatchConfidence::Manual);
    CHECK_EQ(rule.sourceId, "fix-7");
    CHECK_EQ(rule.sourceText, "Street sweeping Tue 8-10");
    CHECK_EQ(segment::toString(rule.confidence), "manual");
}

// -----------------------------------------------------------------------------
// Tests for planRegulations
// -----------------------------------------------------------------------------

TEST_CASE("planRegulations keeps input order across workers") {
    const IngestInputs inputs = sampleInputs();
    segment::SegmentStore store;
    for (const auto& c : {inputs.centerlines[0], inputs.centerlines[1]}) {
        store.addCenterline(c.id, c.streetName, c.geometry, c.leftRange, c.rightRange, 5.0);
    }
    const spatial_join::SegmentIndex index(store, 40.0);
    const boundary::ParcelIndex parcels(inputs.parcels);
    const config::JoinConfig cfg;

    for (unsigned threads : {1u, 2u, 3u, 16u}) {
        const auto plans = ingest::planRegulations(inputs.regulations, index, parcels, cfg, threads);
        REQUIRE_EQ(plans.size(), 5);
        CHECK(plans[0].status == RegulationPlan::Status::Joined);
        CHECK(plans[1].status == RegulationPlan::Status::Joined);
        CHECK(plans[2].status == RegulationPlan::Status::Unmatched);
        CHECK(plans[3].status == RegulationPlan::Status::Invalid);
        CHECK_FALSE(plans[3].error.empty());
        CHECK(plans[4].status == RegulationPlan::Status::AddressMatched);
    }
}

TEST_CASE("planRegulation prefers the address interval over geometry") {
    segment::SegmentStore store;
    records::Centerline c = fixtures::centerline("1001", "18TH ST", 0.0);
    store.addCenterline(c.id, c.streetName, c.geometry, AddressRange{3201, 3299}, AddressRange{3200, 3298}, 5.0);
    const spatial_join::SegmentIndex index(store, 40.0);
    const config::JoinConfig cfg;

    Regulation reg = fixtures::regulation("r1", RuleKind::TimeLimit, 5.0);
    reg.streetName = "18TH ST";
    reg.addressNumber = 3250;
    const RegulationPlan plan = ingest::planRegulation(reg, index, boundary::ParcelIndex(), cfg);
    CHECK(plan.status == RegulationPlan::Status::AddressMatched);
    REQUIRE_EQ(plan.attachments.size(), 1);
    CHECK(plan.attachments[0].key.side == Side::Right);

    // an address outside both ranges falls through to the spatial join
    reg.addressNumber = 3401;
    const RegulationPlan joined = ingest::planRegulation(reg, index, boundary::ParcelIndex(), cfg);
    CHECK(joined.status == RegulationPlan::Status::Joined);
    CHECK(joined.attachments[0].key.side == Side::Left);
}

// -----------------------------------------------------------------------------
// Tests for rule conversion and helpers
// -----------------------------------------------------------------------------

TEST_CASE("ruleFromSweeping marks the rule as directly keyed") {
    records::SweepingRecord sweep;
    sweep.centerlineId = "1001";
    sweep.side = Side::Left;
    sweep.schedule = schedule::makeSchedule("Tues", "8", "10", "");
    sweep.rawDays = "Tues";
    sweep.rawHours = "8-10";

    const segment::Rule rule = ingest::ruleFromSweeping(sweep);
    CHECK(rule.kind == RuleKind::Sweeping);
    CHECK(rule.confidence == MatchConfidence::Direct);
    CHECK_EQ(rule.description, "Street sweeping");
    CHECK_EQ(rule.sourceId, "1001L");
    CHECK_EQ(*rule.interpretationKey, interpretation::canonicalKey(rule));
}

TEST_CASE("ruleFromRegulation carries limit, zone and confidence") {
    Regulation reg = fixtures::regulation("r9", RuleKind::RppZone, 5.0);
    reg.permitZone = "S";
    const segment::Rule rule = ingest::ruleFromRegulation(reg, MatchConfidence::BoundaryResolved);
    CHECK(rule.kind == RuleKind::RppZone);
    CHECK_EQ(*rule.limitMinutes, 120);
    CHECK_EQ(*rule.permitZone, "S");
    CHECK_EQ(rule.sourceText, "Time limited");
    CHECK(rule.confidence == MatchConfidence::BoundaryResolved);
}

TEST_CASE("splitLimits separates the two cross streets") {
    CHECK_EQ(splitLimits("York St - Bryant St"), std::make_pair(string("York St"), string("Bryant St")));
    CHECK_EQ(splitLimits("  York St-Bryant St "), std::make_pair(string("York St"), string("Bryant St")));
    CHECK_EQ(splitLimits("Cesar Chavez St"), std::make_pair(string(), string()));
    CHECK_EQ(splitLimits("A - B - C"), std::make_pair(string(), string()));
}

TEST_CASE("summarize reports the regulation outcomes") {
    const IngestResult result = buildSnapshot(sampleInputs(), singleThreaded());
    const string text = ingest::summarize(result.report);
    CHECK(text.find("Ingested 4 segments") == 0);
    CHECK(text.find("regulations 1 clear, 1 boundary-resolved, 1 address-matched, 1 unmatched, 1 invalid") !=
          string::npos);
}
