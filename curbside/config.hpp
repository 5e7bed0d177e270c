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
#ifndef CURBSIDE_CONFIG_HPP_
#define CURBSIDE_CONFIG_HPP_

#include <nlohmann/json_fwd.hpp>  // for json
#include <stdexcept>              // for runtime_error
#include <string>                 // for string

using std::string;
using json = nlohmann::json;

namespace config {

class ConfigError : public std::runtime_error {
 public:
    explicit ConfigError(const string& what) : std::runtime_error(what) {}
};

// distances in meters
struct JoinConfig {
    double searchRadiusMeters = 40.0;
    double clearThresholdMeters = 6.0;
    double boundaryThresholdMeters = 15.0;
    double curbOffsetMeters = 5.0;       // synthetic curb line distance
    double parcelProbeMeters = 10.0;     // beyond the curb, into the parcel
};

struct LegalityConfig {
    int rppDefaultVisitorMinutes = 120;
    int timeLimitDefaultMinutes = 120;
    int nextRestrictionHorizonMinutes = 7 * 24 * 60;
    double minInterpretationConfidence = 0.8;
};

// open-data portal and dataset ids
struct SourceConfig {
    string domain = "data.sfgov.org";
    string appToken;
    string streetsDataset = "3psu-pn9h";
    string blockfacesDataset = "pep9-66vw";
    string sweepingDataset = "yhqp-riqs";
    string regulationsDataset = "hi6h-neyh";
    string metersDataset = "8vzz-qzz9";
    int pageSize = 50000;
    long timeoutSeconds = 300;
};

struct EngineConfig {
    JoinConfig join;
    LegalityConfig legality;
    SourceConfig source;
    unsigned threads = 0;    // 0 = hardware concurrency
    string logLevel = "info";
};

EngineConfig defaultConfig();
void applyJson(const json& j, EngineConfig* cfg);
void applyEnvironment(EngineConfig* cfg);
void validate(const EngineConfig& cfg);
EngineConfig loadConfig(const string& path);
unsigned effectiveThreads(const EngineConfig& cfg);

}  // namespace config

#endif  // CURBSIDE_CONFIG_HPP_
