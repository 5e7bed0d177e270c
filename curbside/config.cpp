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
#include "config.hpp"
#include <cstdlib>            // for getenv
#include <fstream>            // for ifstream
#include <nlohmann/json.hpp>  // for basic_json
#include <string>             // for string
#include <thread>             // for thread

#include "log.hpp"

using std::ifstream;
using std::string;
using json = nlohmann::json;

using config::ConfigError;
using config::EngineConfig;

namespace {
    // Copies a value from the object when present, keeping the default otherwise
    template <typename T>
    void readField(const json& obj, const char* key, T* out) {
        if (!obj.contains(key) || obj[key].is_null()) return;
        try {
            *out = obj[key].get<T>();
        } catch (const json::exception& e) {
            throw ConfigError(string("invalid config value for '") + key + "': " + e.what());
        }
    }
}  // namespace

namespace config {
    EngineConfig defaultConfig() {
        return EngineConfig{};
    }

    // Overlays a JSON document onto the configuration
    //
    // Args:
    //    j: object with optional "join", "legality", "source" sections and
    //       top-level "threads" and "log_level"
    //    cfg: configuration updated in place
    void applyJson(const json& j, EngineConfig* cfg) {
        if (!j.is_object()) throw ConfigError("config root must be a JSON object");

        if (j.contains("join")) {
            const auto& s = j["join"];
            readField(s, "search_radius_m", &cfg->join.searchRadiusMeters);
            readField(s, "clear_threshold_m", &cfg->join.clearThresholdMeters);
            readField(s, "boundary_threshold_m", &cfg->join.boundaryThresholdMeters);
            readField(s, "curb_offset_m", &cfg->join.curbOffsetMeters);
            readField(s, "parcel_probe_m", &cfg->join.parcelProbeMeters);
        }
        if (j.contains("legality")) {
            const auto& s = j["legality"];
            readField(s, "rpp_default_visitor_minutes", &cfg->legality.rppDefaultVisitorMinutes);
            readField(s, "time_limit_default_minutes", &cfg->legality.timeLimitDefaultMinutes);
            readField(s, "next_restriction_horizon_minutes", &cfg->legality.nextRestrictionHorizonMinutes);
            readField(s, "min_interpretation_confidence", &cfg->legality.minInterpretationConfidence);
        }
        if (j.contains("source")) {
            const auto& s = j["source"];
            readField(s, "domain", &cfg->source.domain);
            readField(s, "app_token", &cfg->source.appToken);
            readField(s, "streets", &cfg->source.streetsDataset);
            readField(s, "blockfaces", &cfg->source.blockfacesDataset);
            readField(s, "sweeping", &cfg->source.sweepingDataset);
            readField(s, "regulations", &cfg->source.regulationsDataset);
            readField(s, "meters", &cfg->source.metersDataset);
            readField(s, "page_size", &cfg->source.pageSize);
            readField(s, "timeout_s", &cfg->source.timeoutSeconds);
        }
        readField(j, "threads", &cfg->threads);
        readField(j, "log_level", &cfg->logLevel);
    }

    // SFMTA_APP_TOKEN and CURBSIDE_LOG_LEVEL override the file
    void applyEnvironment(EngineConfig* cfg) {
        if (const char* token = std::getenv("SFMTA_APP_TOKEN")) cfg->source.appToken = token;
        if (const char* lvl = std::getenv("CURBSIDE_LOG_LEVEL")) cfg->logLevel = lvl;
    }

    void validate(const EngineConfig& cfg) {
        const auto& join = cfg.join;
        if (join.clearThresholdMeters <= 0.0) throw ConfigError("clear threshold must be positive");
        if (join.clearThresholdMeters >= join.boundaryThresholdMeters) {
            throw ConfigError("clear threshold must be below the boundary threshold");
        }
        if (join.boundaryThresholdMeters > join.searchRadiusMeters) {
            throw ConfigError("boundary threshold must not exceed the search radius");
        }
        if (join.curbOffsetMeters < 0.0 || join.parcelProbeMeters < 0.0) {
            throw ConfigError("offsets must not be negative");
        }
        if (cfg.legality.rppDefaultVisitorMinutes < 0 || cfg.legality.timeLimitDefaultMinutes < 0) {
            throw ConfigError("default limits must not be negative");
        }
        if (cfg.source.pageSize <= 0) throw ConfigError("page size must be positive");
        if (cfg.source.timeoutSeconds <= 0) throw ConfigError("request timeout must be positive");
        logging::Level lvl;
        if (!logging::parseLevel(cfg.logLevel, &lvl)) throw ConfigError("unknown log level: " + cfg.logLevel);
    }

    // Defaults, then the file (when a path is given), then the environment
    EngineConfig loadConfig(const string& path) {
        EngineConfig cfg = defaultConfig();
        if (!path.empty()) {
            ifstream in(path);
            if (!in) throw ConfigError("Failed to open config: " + path);
            json j;
            try {
                in >> j;
            } catch (const json::parse_error& e) {
                throw ConfigError("Invalid config JSON in " + path + ": " + e.what());
            }
            applyJson(j, &cfg);
        }
        applyEnvironment(&cfg);
        validate(cfg);
        return cfg;
    }

    unsigned effectiveThreads(const EngineConfig& cfg) {
        if (cfg.threads > 0) return cfg.threads;
        const unsigned hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }
}  // namespace config
