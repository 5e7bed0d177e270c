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
#include "interpretation.hpp"
#include <fstream>            // for ifstream
#include <nlohmann/json.hpp>  // for basic_json
#include <sstream>            // for ostringstream
#include <stdexcept>          // for runtime_error
#include <string>             // for string
#include <utility>            // for move

using std::ifstream;
using std::nullopt;
using std::ostringstream;
using std::runtime_error;
using std::string;

namespace interpretation {
    JsonInterpretationSource::JsonInterpretationSource(const json& j) {
        if (!j.is_object()) throw runtime_error("interpretation cache must be a JSON object");
        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& v = it.value();
            Interpretation entry;
            if (v.is_string()) {
                entry.summary = v.get<string>();
                entry.confidence = 1.0;
            } else if (v.is_object() && v.contains("summary") && v["summary"].is_string()) {
                entry.summary = v["summary"].get<string>();
                if (v.contains("confidence") && !v["confidence"].is_number()) {
                    throw runtime_error("interpretation '" + it.key() + "' has a non-numeric confidence");
                }
                entry.confidence = v.value("confidence", 0.0);
            } else {
                continue;
            }
            entries_[it.key()] = std::move(entry);
        }
    }

    optional<Interpretation> JsonInterpretationSource::lookup(const string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return nullopt;
        return it->second;
    }

    void JsonInterpretationSource::put(const string& key, Interpretation value) {
        entries_[key] = std::move(value);
    }

    JsonInterpretationSource JsonInterpretationSource::fromFile(const string& path) {
        ifstream in(path);
        if (!in) throw runtime_error("Failed to open interpretation cache: " + path);
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw runtime_error("Invalid interpretation cache JSON in " + path + ": " + e.what());
        }
        return JsonInterpretationSource(j);
    }

    // Deterministic key over the fields that change a rule's meaning:
    // "time-limit|31|540-1080|120||2 HR PARKING"
    string canonicalKey(const segment::Rule& rule) {
        ostringstream oss;
        oss << segment::toString(rule.kind) << "|" << (rule.schedule.days.mask & 0x7f) << "|";
        if (rule.schedule.window) {
            oss << rule.schedule.window->startMinute << "-" << rule.schedule.window->endMinute;
        }
        oss << "|";
        if (rule.limitMinutes) oss << *rule.limitMinutes;
        oss << "|";
        if (rule.permitZone) oss << segment::normalizeStreetKey(*rule.permitZone);
        oss << "|" << segment::normalizeStreetKey(rule.sourceText);
        return oss.str();
    }
}  // namespace interpretation
