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

// main.cpp

#include <exception>          // for exception
#include <iomanip>            // for setprecision
#include <iostream>           // for cerr, cout
#include <memory>             // for shared_ptr
#include <nlohmann/json.hpp>  // for basic_json
#include <optional>           // for optional
#include <stdexcept>          // for runtime_error
#include <string>             // for string, stoi
#include <vector>             // for vector

#include "boundary.hpp"
#include "config.hpp"
#include "datasets.hpp"
#include "ingest.hpp"
#include "interpretation.hpp"
#include "legality.hpp"
#include "log.hpp"
#include "schedule.hpp"
#include "segment.hpp"
#include "side.hpp"
#include "snapshot.hpp"
#include "utils.hpp"

using std::cerr;
using std::cout;
using std::exception;
using std::optional;
using std::runtime_error;
using std::string;
using std::vector;
using json = nlohmann::json;

// input args for main entry point
struct Args {
    string command;
    string configPath;
    // ingest
    optional<string> streets, regulations, sweeping, meters, blockfaces, parcels, overrides;
    bool fetch = false;
    optional<string> out;
    // check
    optional<string> snapshotPath;
    optional<string> cnn;
    optional<string> side;
    optional<double> lon, lat;
    optional<string> time;
    int duration = 60;
    optional<string> interpretations;
};

// Parses arguments from main entry point
//
// Args:
//    argc: number of arguments given
//    argv: provided arguments
//    out: pointer to the Args structure to set state on
// Returns:
//    false when the arguments are incomplete or unknown
bool parseArgs(int argc, char** argv, Args* out) {
    if (argc < 2) return false;
    out->command = argv[1];
    for (int i = 2; i < argc; ++i) {
        string a(argv[i]);
        const bool hasValue = i + 1 < argc;
        if (a == "--help" || a == "-h") {
            return false;
        } else if (a == "--fetch") {
            out->fetch = true;
        } else if (!hasValue) {
            return false;
        } else if (a == "--config") {
            out->configPath = argv[++i];
        } else if (a == "--streets") {
            out->streets = argv[++i];
        } else if (a == "--regulations") {
            out->regulations = argv[++i];
        } else if (a == "--sweeping") {
            out->sweeping = argv[++i];
        } else if (a == "--meters") {
            out->meters = argv[++i];
        } else if (a == "--blockfaces") {
            out->blockfaces = argv[++i];
        } else if (a == "--parcels") {
            out->parcels = argv[++i];
        } else if (a == "--overrides") {
            out->overrides = argv[++i];
        } else if (a == "--out") {
            out->out = argv[++i];
        } else if (a == "--snapshot") {
            out->snapshotPath = argv[++i];
        } else if (a == "--cnn") {
            out->cnn = argv[++i];
        } else if (a == "--side") {
            out->side = argv[++i];
        } else if (a == "--lon") {
            out->lon = std::stod(argv[++i]);
        } else if (a == "--lat") {
            out->lat = std::stod(argv[++i]);
        } else if (a == "--time") {
            out->time = argv[++i];
        } else if (a == "--duration") {
            out->duration = std::stoi(argv[++i]);
        } else if (a == "--interpretations") {
            out->interpretations = argv[++i];
        } else {
            return false;
        }
    }

    if (out->command == "ingest") {
        if (!out->out) return false;
        return out->fetch || (out->streets && out->regulations);
    }
    if (out->command == "check") {
        const bool byKey = out->cnn && out->side;
        const bool byPoint = out->lon && out->lat;
        return out->snapshotPath && out->time && (byKey || byPoint);
    }
    return false;
}

// CLI usage message output as console error message
//
// Args:
//     exe: executable's name
void usage(const char* exe) {
    cerr << "Usage:\n"
    << "  " << exe << " ingest [--config engine.json] --out snapshot.json\n"
    << "      (--fetch | --streets s.json --regulations r.json)\n"
    << "      [--sweeping w.json] [--meters m.json] [--blockfaces b.json] [--parcels p.geojson]\n"
    << "      [--overrides manual_overrides.json]\n"
    << "  " << exe << " check [--config engine.json] --snapshot snapshot.json\n"
    << "      (--cnn ID --side L|R | --lon X --lat Y) --time \"Tue 09:30\"\n"
    << "      [--duration 90] [--interpretations cache.json]\n";
}

// Reads one dataset from a file, or from the portal when fetching
json loadRows(const optional<string>& path, bool fetch, utils::IHttpClient* client,
              const config::SourceConfig& source, const string& datasetId) {
    if (path) return datasets::loadRecordsFile(*path);
    if (fetch && client) return datasets::fetchDataset(*client, source, datasetId);
    return json::array();
}

int runIngest(const Args& args, const config::EngineConfig& cfg) {
    optional<utils::CurlHttpClient> client;
    if (args.fetch) {
        client.emplace(cfg.source.timeoutSeconds);
        if (!cfg.source.appToken.empty()) client->addHeader("X-App-Token: " + cfg.source.appToken);
    }
    utils::IHttpClient* http = client ? &*client : nullptr;
    const auto& src = cfg.source;

    size_t skipped = 0;
    ingest::IngestInputs inputs;
    inputs.centerlines = datasets::parseAll(
        loadRows(args.streets, args.fetch, http, src, src.streetsDataset),
        datasets::parseCenterline, "streets", &skipped);
    inputs.regulations = datasets::parseAll(
        loadRows(args.regulations, args.fetch, http, src, src.regulationsDataset),
        datasets::parseRegulation, "regulations", &skipped);
    inputs.sweeping = datasets::parseAll(
        loadRows(args.sweeping, args.fetch, http, src, src.sweepingDataset),
        datasets::parseSweeping, "sweeping", &skipped);
    inputs.meters = datasets::parseAll(
        loadRows(args.meters, args.fetch, http, src, src.metersDataset),
        datasets::parseMeter, "meters", &skipped);
    inputs.blockfaces = datasets::parseAll(
        loadRows(args.blockfaces, args.fetch, http, src, src.blockfacesDataset),
        datasets::parseBlockface, "blockfaces", &skipped);
    if (args.parcels) inputs.parcels = boundary::loadParcelsGeoJSON(*args.parcels);
    if (args.overrides) {
        inputs.overrides = datasets::parseAll(datasets::loadOverridesFile(*args.overrides),
                                              datasets::parseOverride, "overrides", &skipped);
    }

    if (inputs.centerlines.empty()) throw runtime_error("No street centerlines loaded");
    logging::info("Loaded " + std::to_string(inputs.centerlines.size()) + " centerlines, " +
                  std::to_string(inputs.regulations.size()) + " regulations, " +
                  std::to_string(inputs.parcels.size()) + " parcels, " +
                  std::to_string(inputs.overrides.size()) + " overrides; " +
                  std::to_string(skipped) + " malformed records skipped");

    const auto result = ingest::buildSnapshot(inputs, cfg);
    snapshot::writeSnapshotJson(*result.snapshot, *args.out);
    cerr << "Wrote snapshot to " << *args.out << "\n";
    return 0;
}

int runCheck(const Args& args, const config::EngineConfig& cfg) {
    snapshot::SnapshotHolder holder;
    holder.publish(snapshot::readSnapshotJson(*args.snapshotPath));
    const auto snap = holder.current();

    const segment::StreetSegment* seg = nullptr;
    if (args.cnn) {
        side::Side s;
        if (!side::parseSide(*args.side, &s)) throw runtime_error("side must be L or R: " + *args.side);
        seg = snap->find(*args.cnn, s);
        if (!seg) throw runtime_error("no segment " + *args.cnn + "/" + *args.side + " in snapshot");
    } else {
        const auto near = snap->nearest(geometry::Point{*args.lon, *args.lat}, cfg.join.searchRadiusMeters);
        if (near.empty()) throw runtime_error("no segment within search radius of the given point");
        seg = near.front().first;
    }

    optional<interpretation::JsonInterpretationSource> cache;
    if (args.interpretations) cache = interpretation::JsonInterpretationSource::fromFile(*args.interpretations);

    legality::EvaluationContext ctx;
    ctx.config = cfg.legality;
    ctx.interpretations = cache ? &*cache : nullptr;

    const auto start = schedule::parseWeekTime(*args.time);
    const auto result = legality::evaluate(*seg, start, args.duration, ctx);

    cout << segment::displayName(*seg) << " [" << seg->centerlineId << "/" << side::toCode(seg->side) << "]\n";
    cout << legality::toString(result.status) << ": " << result.explanation << "\n";
    if (result.costEstimate) {
        cout << "Estimated cost: $" << std::fixed << std::setprecision(2) << *result.costEstimate << "\n";
    }
    if (result.nextRestriction) cout << "Next restriction: " << *result.nextRestriction << "\n";
    for (const auto& rule : result.applicableRules) {
        cout << "  - " << segment::toString(rule.kind) << ": " << rule.description
             << " (" << schedule::describeSchedule(rule.schedule) << ", "
             << segment::toString(rule.confidence) << ")\n";
    }
    return 0;
}

int main(int argc, char** argv) {
    Args args;
    try {
        if (!parseArgs(argc, argv, &args)) {
            usage(argv[0]);
            return 1;
        }
    } catch (const exception& e) {
        cerr << "Invalid argument: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    try {
        const auto cfg = config::loadConfig(args.configPath);
        logging::Level lvl;
        if (logging::parseLevel(cfg.logLevel, &lvl)) logging::setLevel(lvl);

        if (args.command == "ingest") return runIngest(args, cfg);
        return runCheck(args, cfg);
    } catch (const exception& e) {
        cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }
}
