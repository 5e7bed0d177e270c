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
#ifndef CURBSIDE_DATASETS_HPP_
#define CURBSIDE_DATASETS_HPP_

#include <stddef.h>           // for size_t
#include <nlohmann/json.hpp>  // for json
#include <stdexcept>          // for runtime_error
#include <string>             // for string
#include <vector>             // for vector

#include "config.hpp"
#include "geometry.hpp"
#include "log.hpp"
#include "records.hpp"
#include "schedule.hpp"
#include "utils.hpp"

using std::string;
using std::vector;
using json = nlohmann::json;

namespace datasets {

// A dataset row that lacks a required field or holds an unusable value
class InvalidRecordError : public std::runtime_error {
 public:
    explicit InvalidRecordError(const string& what) : std::runtime_error(what) {}
};

string fieldText(const json& row, const string& key);
geometry::Polyline parseLineGeometry(const json& geom);

records::Centerline parseCenterline(const json& row);
records::Blockface parseBlockface(const json& row);
records::SweepingRecord parseSweeping(const json& row);
records::Regulation parseRegulation(const json& row);
records::MeterRecord parseMeter(const json& row);
records::Override parseOverride(const json& entry);

// Parses every row, logging and skipping the malformed ones
//
// Args:
//    rows: JSON array of dataset rows
//    parse: row parser, throwing on a malformed row
//    datasetName: used in log messages
//    skipped: incremented per skipped row, may be nullptr
// Returns:
//    the parsed records in input order
template <typename T>
vector<T> parseAll(const json& rows, T (*parse)(const json&), const string& datasetName, size_t* skipped) {
    vector<T> out;
    if (!rows.is_array()) throw std::runtime_error(datasetName + ": expected a JSON array of records");
    size_t i = 0;
    for (const auto& row : rows) {
        try {
            out.push_back(parse(row));
        } catch (const InvalidRecordError& e) {
            logging::warn(datasetName + " record " + std::to_string(i) + " skipped: " + e.what());
            if (skipped) ++*skipped;
        } catch (const geometry::GeometryError& e) {
            logging::warn(datasetName + " record " + std::to_string(i) + " skipped: " + e.what());
            if (skipped) ++*skipped;
        } catch (const schedule::ScheduleError& e) {
            logging::warn(datasetName + " record " + std::to_string(i) + " skipped: " + e.what());
            if (skipped) ++*skipped;
        } catch (const json::exception& e) {
            logging::warn(datasetName + " record " + std::to_string(i) + " skipped: " + e.what());
            if (skipped) ++*skipped;
        }
        ++i;
    }
    return out;
}

json loadRecordsFile(const string& path);
json loadOverridesFile(const string& path);

string urlEncode(const string& s);
string httpGet(utils::IHttpClient& client, const string& url);
string datasetUrl(const config::SourceConfig& source, const string& datasetId, int offset);
json fetchDataset(utils::IHttpClient& client, const config::SourceConfig& source, const string& datasetId);

}  // namespace datasets

#endif  // CURBSIDE_DATASETS_HPP_
