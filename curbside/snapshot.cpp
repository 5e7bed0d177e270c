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
#include "snapshot.hpp"
#include <algorithm>          // for sort
#include <cstdio>             // for remove, rename
#include <fstream>            // for ifstream, ofstream
#include <memory>             // for make_shared, shared_ptr
#include <mutex>              // for lock_guard
#include <nlohmann/json.hpp>  // for basic_json
#include <optional>           // for optional
#include <stdexcept>          // for runtime_error
#include <string>             // for string
#include <utility>            // for move, pair
#include <vector>             // for vector

using std::ifstream;
using std::make_shared;
using std::ofstream;
using std::optional;
using std::runtime_error;
using std::string;
using std::vector;

using geometry::Point;
using geometry::Polyline;
using segment::AddressRange;
using segment::MeterSchedule;
using segment::Rule;
using segment::SegmentKey;
using segment::SegmentStore;
using segment::StreetSegment;
using side::Side;
using snapshot::Snapshot;

namespace {
    const int FORMAT_VERSION = 1;

    json lineToJson(const Polyline& line) {
        json arr = json::array();
        for (const auto& p : line) arr.push_back({p.lon, p.lat});
        return arr;
    }

    Polyline lineFromJson(const json& arr) {
        Polyline line;
        for (const auto& p : arr) line.push_back(Point{p.at(0).get<double>(), p.at(1).get<double>()});
        return line;
    }

    json scheduleToJson(const schedule::Schedule& s) {
        json j = {{"days", s.days.mask & 0x7f}};
        if (s.window) {
            j["start"] = s.window->startMinute;
            j["end"] = s.window->endMinute;
        }
        return j;
    }

    schedule::Schedule scheduleFromJson(const json& j) {
        schedule::Schedule s;
        s.days.mask = j.at("days").get<unsigned>() & 0x7f;
        if (j.contains("start")) {
            s.window = schedule::TimeWindow{j.at("start").get<int>(), j.at("end").get<int>()};
        }
        return s;
    }

    optional<AddressRange> rangeFromJson(const json& side) {
        if (!side.contains("address_from")) return std::nullopt;
        return AddressRange{side["address_from"].get<int>(), side["address_to"].get<int>()};
    }

    json sideToJson(const StreetSegment& seg) {
        json j = {{"cardinal", seg.cardinal}};
        if (seg.addressRange) {
            j["address_from"] = seg.addressRange->fromAddress;
            j["address_to"] = seg.addressRange->toAddress;
        }
        if (seg.fromStreet) j["from_street"] = *seg.fromStreet;
        if (seg.toStreet) j["to_street"] = *seg.toStreet;
        if (seg.curbGeometry) j["curb"] = lineToJson(*seg.curbGeometry);

        json rules = json::array();
        for (const auto& r : seg.rules) rules.push_back(snapshot::toJson(r));
        j["rules"] = rules;

        json meters = json::array();
        for (const auto& m : seg.meters) {
            meters.push_back({{"rate", m.rate}, {"schedule", scheduleToJson(m.schedule)},
                              {"description", m.description}, {"post_id", m.postId}});
        }
        j["meters"] = meters;
        return j;
    }

    void sideFromJson(const json& j, const SegmentKey& key, SegmentStore* store) {
        if (j.contains("curb")) store->setCurbGeometry(key, lineFromJson(j["curb"]));
        store->setCrossStreets(key, j.value("from_street", ""), j.value("to_street", ""));
        store->setCardinal(key, j.value("cardinal", ""));
        for (const auto& r : j.value("rules", json::array())) store->attach(key, snapshot::ruleFromJson(r));
        for (const auto& m : j.value("meters", json::array())) {
            MeterSchedule meter;
            meter.rate = m.at("rate").get<double>();
            meter.schedule = scheduleFromJson(m.at("schedule"));
            meter.description = m.value("description", "");
            meter.postId = m.value("post_id", "");
            store->attachMeter(key, std::move(meter));
        }
    }
}  // namespace

namespace snapshot {
    Snapshot::Snapshot(SegmentStore store, double curbOffsetMeters)
        : store_(std::move(store)), curbOffsetMeters_(curbOffsetMeters) {}

    vector<std::pair<const StreetSegment*, double>> Snapshot::nearest(const Point& point, double radiusMeters) const {
        vector<std::pair<const StreetSegment*, double>> out;
        for (const auto& seg : store_.segments()) {
            const double d = geometry::distanceToLine(point, seg.curbLine());
            if (d <= radiusMeters) out.emplace_back(&seg, d);
        }
        std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second < b.second;
            if (a.first->centerlineId != b.first->centerlineId) return a.first->centerlineId < b.first->centerlineId;
            return a.first->side < b.first->side;
        });
        return out;
    }

    shared_ptr<const Snapshot> SnapshotHolder::current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void SnapshotHolder::publish(shared_ptr<const Snapshot> next) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(next);
    }

    json toJson(const Rule& rule) {
        json j = {
            {"kind", segment::toString(rule.kind)},
            {"schedule", scheduleToJson(rule.schedule)},
            {"description", rule.description},
            {"source_text", rule.sourceText},
            {"source_id", rule.sourceId},
            {"confidence", segment::toString(rule.confidence)}
        };
        if (rule.limitMinutes) j["limit_minutes"] = *rule.limitMinutes;
        if (rule.permitZone) j["permit_zone"] = *rule.permitZone;
        if (rule.meterRate) j["meter_rate"] = *rule.meterRate;
        if (rule.interpretationKey) j["interpretation_key"] = *rule.interpretationKey;
        return j;
    }

    Rule ruleFromJson(const json& j) {
        Rule rule;
        const string kind = j.at("kind").get<string>();
        if (!segment::parseRuleKind(kind, &rule.kind)) throw runtime_error("unknown rule kind in snapshot: " + kind);
        const string confidence = j.value("confidence", "clear");
        if (!segment::parseMatchConfidence(confidence, &rule.confidence)) {
            throw runtime_error("unknown match confidence in snapshot: " + confidence);
        }
        rule.schedule = scheduleFromJson(j.at("schedule"));
        rule.description = j.value("description", "");
        rule.sourceText = j.value("source_text", "");
        rule.sourceId = j.value("source_id", "");
        if (j.contains("limit_minutes")) rule.limitMinutes = j["limit_minutes"].get<int>();
        if (j.contains("permit_zone")) rule.permitZone = j["permit_zone"].get<string>();
        if (j.contains("meter_rate")) rule.meterRate = j["meter_rate"].get<double>();
        if (j.contains("interpretation_key")) rule.interpretationKey = j["interpretation_key"].get<string>();
        return rule;
    }

    // One entry per centerline with both sides nested under "L" and "R"
    json toJson(const Snapshot& snap) {
        json centerlines = json::array();
        for (const auto& seg : snap.store().segments()) {
            if (seg.side != Side::Left) continue;
            const StreetSegment* right = snap.find(seg.centerlineId, Side::Right);
            json entry = {
                {"cnn", seg.centerlineId},
                {"street", seg.streetName},
                {"centerline", lineToJson(seg.centerline)},
                {"sides", {{"L", sideToJson(seg)}}}
            };
            if (right) entry["sides"]["R"] = sideToJson(*right);
            centerlines.push_back(entry);
        }
        return json{
            {"version", FORMAT_VERSION},
            {"curb_offset_m", snap.curbOffsetMeters()},
            {"centerlines", centerlines}
        };
    }

    shared_ptr<const Snapshot> fromJson(const json& j) {
        if (j.value("version", 0) != FORMAT_VERSION) throw runtime_error("unsupported snapshot version");
        const double offset = j.value("curb_offset_m", 5.0);

        SegmentStore store;
        try {
            for (const auto& c : j.at("centerlines")) {
                const string id = c.at("cnn").get<string>();
                const auto& sides = c.at("sides");
                const json none = json::object();
                const json& left = sides.contains("L") ? sides["L"] : none;
                const json& right = sides.contains("R") ? sides["R"] : none;
                if (!store.addCenterline(id, c.value("street", ""), lineFromJson(c.at("centerline")),
                                         rangeFromJson(left), rangeFromJson(right), offset)) {
                    throw runtime_error("duplicate centerline in snapshot: " + id);
                }
                sideFromJson(left, SegmentKey{id, Side::Left}, &store);
                sideFromJson(right, SegmentKey{id, Side::Right}, &store);
            }
        } catch (const json::exception& e) {
            throw runtime_error(string("malformed snapshot: ") + e.what());
        }
        return make_shared<const Snapshot>(std::move(store), offset);
    }

    // Writes beside the target and renames over it, so a failed write
    // never leaves a partial snapshot at `path`
    void writeSnapshotJson(const Snapshot& snap, const string& path) {
        const string tmp = path + ".tmp";
        {
            ofstream out(tmp);
            if (!out) throw runtime_error("Failed to open for writing: " + tmp);
            out << toJson(snap).dump(2) << "\n";
            out.close();
            if (!out) {
                std::remove(tmp.c_str());
                throw runtime_error("Failed to write snapshot: " + tmp);
            }
        }
        if (std::rename(tmp.c_str(), path.c_str()) != 0) {
            std::remove(tmp.c_str());
            throw runtime_error("Failed to move snapshot into place: " + path);
        }
    }

    shared_ptr<const Snapshot> readSnapshotJson(const string& path) {
        ifstream in(path);
        if (!in) throw runtime_error("Failed to open snapshot: " + path);
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw runtime_error("Invalid snapshot JSON in " + path + ": " + e.what());
        }
        return fromJson(j);
    }
}  // namespace snapshot
