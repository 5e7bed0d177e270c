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
#include "datasets.hpp"
#include <curl/curl.h>        // for curl_easy_escape, curl_free
#include <cmath>              // for lround
#include <exception>          // for exception
#include <fstream>            // for ifstream
#include <initializer_list>   // for initializer_list
#include <nlohmann/json.hpp>  // for basic_json
#include <optional>           // for optional
#include <regex>              // for regex, regex_error
#include <sstream>            // for ostringstream
#include <stdexcept>          // for runtime_error
#include <string>             // for string
#include <utility>            // for make_pair, move
#include <vector>             // for vector

#include "address.hpp"
#include "segment.hpp"
#include "side.hpp"

using std::exception;
using std::ifstream;
using std::optional;
using std::ostringstream;
using std::runtime_error;
using std::string;
using std::vector;

using datasets::InvalidRecordError;
using geometry::Point;
using geometry::Polyline;
using segment::AddressRange;
using segment::RuleKind;

namespace {
    // first non-empty text among the candidate fields
    string firstField(const json& row, std::initializer_list<const char*> keys) {
        for (const char* k : keys) {
            string v = datasets::fieldText(row, k);
            if (!v.empty()) return v;
        }
        return {};
    }

    string requireField(const json& row, std::initializer_list<const char*> keys, const char* what) {
        string v = firstField(row, keys);
        if (v.empty()) throw InvalidRecordError(string("missing ") + what);
        return v;
    }

    // geometry may sit under several keys depending on the export
    const json* findGeometry(const json& row, std::initializer_list<const char*> keys) {
        for (const char* k : keys) {
            if (row.contains(k) && row[k].is_object()) return &row[k];
        }
        return nullptr;
    }

    Polyline requireLine(const json& row, std::initializer_list<const char*> keys) {
        const json* geom = findGeometry(row, keys);
        if (!geom) throw InvalidRecordError("missing geometry");
        return datasets::parseLineGeometry(*geom);
    }

    // both ends required; 0-0 marks a side with no addresses
    optional<AddressRange> addressRange(const json& row, const char* fromKey, const char* toKey) {
        const auto from = address::parseAddressNumber(datasets::fieldText(row, fromKey));
        const auto to = address::parseAddressNumber(datasets::fieldText(row, toKey));
        if (!from || !to) return std::nullopt;
        if (*from == 0 && *to == 0) return std::nullopt;
        return AddressRange{*from, *to};
    }

    optional<int> hoursToMinutes(const string& text) {
        if (text.empty()) return std::nullopt;
        double hours = 0.0;
        try {
            hours = std::stod(text);
        } catch (const exception&) {
            throw InvalidRecordError("unusable hour limit: " + text);
        }
        if (hours <= 0.0) return std::nullopt;
        return static_cast<int>(std::lround(hours * 60.0));
    }

    string hoursPhrase(int minutes) {
        ostringstream oss;
        if (minutes % 60 == 0) {
            oss << minutes / 60;
        } else {
            oss << minutes / 60.0;
        }
        oss << " hour";
        return oss.str();
    }

    void appendPart(const json& coords, Polyline* line) {
        for (const auto& p : coords) {
            const Point pt{p.at(0).get<double>(), p.at(1).get<double>()};
            if (!line->empty() && line->back().lon == pt.lon && line->back().lat == pt.lat) continue;
            line->push_back(pt);
        }
    }
}  // namespace

namespace datasets {
    // Row value as text; Socrata sends most numbers as strings but not all
    string fieldText(const json& row, const string& key) {
        if (!row.is_object() || !row.contains(key)) return {};
        const auto& v = row[key];
        if (v.is_string()) {
            const string s = v.get<string>();
            const size_t b = s.find_first_not_of(" \t\r\n");
            if (b == string::npos) return {};
            const size_t e = s.find_last_not_of(" \t\r\n");
            return s.substr(b, e - b + 1);
        }
        if (v.is_number_integer()) return std::to_string(v.get<long long>());
        if (v.is_number()) {
            ostringstream oss;
            oss << v.get<double>();
            return oss.str();
        }
        return {};
    }

    // LineString, or MultiLineString with its parts joined in order
    Polyline parseLineGeometry(const json& geom) {
        const string type = geom.value("type", "");
        if (!geom.contains("coordinates") || !geom["coordinates"].is_array()) {
            throw InvalidRecordError("geometry without coordinates");
        }
        Polyline line;
        if (type == "LineString") {
            appendPart(geom["coordinates"], &line);
        } else if (type == "MultiLineString") {
            for (const auto& part : geom["coordinates"]) appendPart(part, &line);
        } else {
            throw InvalidRecordError("unsupported geometry type: " + type);
        }
        geometry::validatePolyline(line);
        return line;
    }

    records::Centerline parseCenterline(const json& row) {
        records::Centerline c;
        c.id = requireField(row, {"cnn"}, "cnn");
        c.streetName = requireField(row, {"streetname", "street"}, "street name");
        c.geometry = requireLine(row, {"line", "geometry"});
        c.leftRange = addressRange(row, "lf_fadd", "lf_toadd");
        c.rightRange = addressRange(row, "rt_fadd", "rt_toadd");
        return c;
    }

    records::Blockface parseBlockface(const json& row) {
        records::Blockface b;
        b.centerlineId = requireField(row, {"cnn_id", "cnn"}, "cnn_id");
        b.id = firstField(row, {"globalid", "objectid"});
        b.geometry = requireLine(row, {"shape", "geometry"});
        return b;
    }

    records::SweepingRecord parseSweeping(const json& row) {
        records::SweepingRecord s;
        s.centerlineId = requireField(row, {"cnn"}, "cnn");
        const string sideText = requireField(row, {"cnnrightleft"}, "cnnrightleft");
        if (!side::parseSide(sideText, &s.side)) throw InvalidRecordError("unknown side: " + sideText);
        s.rawDays = requireField(row, {"weekday"}, "weekday");
        s.rawHours = fieldText(row, "fromhour") + "-" + fieldText(row, "tohour");
        s.schedule = schedule::makeSchedule(s.rawDays, fieldText(row, "fromhour"), fieldText(row, "tohour"), "");
        s.limits = fieldText(row, "limits");
        s.blockside = fieldText(row, "blockside");
        return s;
    }

    // Regulation row with its kind classified and description prepared.
    // "Time limited" rows naming a permit area become permit-zone rules.
    records::Regulation parseRegulation(const json& row) {
        records::Regulation r;
        r.id = requireField(row, {"objectid", "globalid", "id"}, "id");
        r.regulation = requireField(row, {"regulation"}, "regulation");
        r.geometry = requireLine(row, {"shape", "geometry"});

        bool recognized = false;
        r.kind = segment::classifyRegulation(r.regulation, &recognized);
        if (!recognized) throw InvalidRecordError("unrecognized regulation: " + r.regulation);

        r.schedule = schedule::makeSchedule(fieldText(row, "days"), fieldText(row, "from_time"),
                                            fieldText(row, "to_time"), fieldText(row, "hours"));
        r.hourLimitMinutes = hoursToMinutes(fieldText(row, "hrlimit"));

        const string zone = firstField(row, {"rpparea1", "rpparea2"});
        if (!zone.empty()) r.permitZone = zone;
        if (r.kind == RuleKind::TimeLimit && r.permitZone) r.kind = RuleKind::RppZone;

        switch (r.kind) {
            case RuleKind::TimeLimit:
                r.description = r.hourLimitMinutes ? hoursPhrase(*r.hourLimitMinutes) + " limit" : r.regulation;
                break;
            case RuleKind::RppZone:
                if (r.hourLimitMinutes) {
                    r.description = hoursPhrase(*r.hourLimitMinutes) + " visitor parking except Zone " +
                        r.permitZone.value_or("?");
                } else {
                    r.description = "Residential permit Zone " + r.permitZone.value_or("?");
                }
                break;
            default:
                r.description = r.regulation;
                break;
        }

        const string hood = fieldText(row, "analysis_neighborhood");
        if (!hood.empty()) r.neighborhood = hood;
        const string district = fieldText(row, "supervisor_district");
        if (!district.empty()) r.district = district;
        const string street = firstField(row, {"streetname", "street"});
        if (!street.empty()) r.streetName = street;
        const auto number = address::parseAddressNumber(firstField(row, {"address", "address_number"}));
        if (number && r.streetName) r.addressNumber = number;
        return r;
    }

    records::MeterRecord parseMeter(const json& row) {
        records::MeterRecord m;
        m.centerlineId = requireField(row, {"street_seg_ctrln_id", "cnn"}, "street_seg_ctrln_id");
        m.postId = firstField(row, {"post_id"});
        const string rate = requireField(row, {"rate"}, "rate");
        try {
            m.rate = std::stod(rate);
        } catch (const exception&) {
            throw InvalidRecordError("unusable rate: " + rate);
        }
        if (m.rate < 0.0) throw InvalidRecordError("negative rate: " + rate);

        const string sideText = firstField(row, {"cnnrightleft", "side"});
        if (!sideText.empty()) {
            side::Side s;
            if (!side::parseSide(sideText, &s)) throw InvalidRecordError("unknown side: " + sideText);
            m.side = s;
        }
        m.schedule = schedule::makeSchedule(
            firstField(row, {"days_applied", "days"}),
            firstField(row, {"beg_time_dt", "from_time"}),
            firstField(row, {"end_time_dt", "to_time"}),
            fieldText(row, "hours"));
        return m;
    }

    // Manual override entry:
    //   {"id", "type": "street_sweeping", "verified_date",
    //    "match_criteria": {"street_name_regex", "side", "cnn", "from_address", "to_address"},
    //    "data": {"weekday", "fromhour", "tohour", "limits", "blockside"}}
    records::Override parseOverride(const json& entry) {
        if (!entry.is_object()) throw InvalidRecordError("override is not an object");
        records::Override o;
        o.id = requireField(entry, {"id"}, "id");
        const string type = fieldText(entry, "type");
        if (type != "street_sweeping") throw InvalidRecordError("unsupported override type: " + type);
        o.verifiedDate = fieldText(entry, "verified_date");

        const json criteria = entry.value("match_criteria", json::object());
        const string pattern = fieldText(criteria, "street_name_regex");
        if (!pattern.empty()) {
            try {
                std::regex check(pattern, std::regex::icase);
            } catch (const std::regex_error& e) {
                throw InvalidRecordError("bad street_name_regex '" + pattern + "': " + e.what());
            }
            o.streetPattern = pattern;
        }
        const string sideText = fieldText(criteria, "side");
        if (!sideText.empty()) {
            side::Side s;
            if (!side::parseSide(sideText, &s)) throw InvalidRecordError("unknown side: " + sideText);
            o.side = s;
        }
        const string cnn = fieldText(criteria, "cnn");
        if (!cnn.empty()) o.centerlineId = cnn;
        for (const auto& bound : {std::make_pair("from_address", &o.fromAddress),
                                  std::make_pair("to_address", &o.toAddress)}) {
            const string text = fieldText(criteria, bound.first);
            if (text.empty()) continue;
            *bound.second = address::parseAddressNumber(text);
            if (!*bound.second) throw InvalidRecordError(string("unusable ") + bound.first + ": " + text);
        }

        const json data = entry.value("data", json::object());
        o.rawDays = requireField(data, {"weekday"}, "weekday");
        o.rawHours = fieldText(data, "fromhour") + "-" + fieldText(data, "tohour");
        o.schedule = schedule::makeSchedule(o.rawDays, fieldText(data, "fromhour"), fieldText(data, "tohour"), "");
        o.limits = fieldText(data, "limits");
        o.blockside = fieldText(data, "blockside");
        return o;
    }

    // Reads a JSON array of rows, or a GeoJSON FeatureCollection whose
    // properties become rows with the feature geometry under "geometry"
    json loadRecordsFile(const string& path) {
        ifstream in(path);
        if (!in) throw runtime_error("Failed to open records file: " + path);
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw runtime_error("Invalid JSON in " + path + ": " + e.what());
        }
        if (j.is_array()) return j;
        if (j.is_object() && j.contains("features") && j["features"].is_array()) {
            json rows = json::array();
            for (const auto& feat : j["features"]) {
                json row = feat.value("properties", json::object());
                if (feat.contains("geometry")) row["geometry"] = feat["geometry"];
                rows.push_back(row);
            }
            return rows;
        }
        throw runtime_error("Expected a JSON array or FeatureCollection in " + path);
    }

    // {"overrides": [...]} or a bare array of entries
    json loadOverridesFile(const string& path) {
        ifstream in(path);
        if (!in) throw runtime_error("Failed to open overrides file: " + path);
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw runtime_error("Invalid JSON in " + path + ": " + e.what());
        }
        if (j.is_array()) return j;
        if (j.is_object() && j.contains("overrides") && j["overrides"].is_array()) return j["overrides"];
        throw runtime_error("Expected an \"overrides\" array in " + path);
    }

    // Returns encoded url component for Socrata queries
    //
    // Args:
    //     s: the text to encode
    // Returns:
    //    the encoded text, or the input when encoding fails
    string urlEncode(const string& s) {
        char* out = curl_easy_escape(nullptr, s.c_str(), static_cast<int>(s.size()));
        if (!out) return s;
        string encoded(out);
        curl_free(out);
        return encoded;
    }

    // HTTP GET through the client
    //
    // Args:
    //    client: HTTP client
    //    url: the API url
    // Returns:
    //   response body, or empty on a non-2xx status or transport failure
    string httpGet(utils::IHttpClient& client, const string& url) {
        try {
            const auto resp = client.get(url);
            if (resp.status < 200 || resp.status >= 300) {
                ostringstream oss;
                oss << "HTTP " << resp.status << " for URL: " << url;
                throw runtime_error(oss.str());
            }
            return resp.body;
        } catch (const exception& e) {
            logging::error(e.what());
            return "";
        }
    }

    string datasetUrl(const config::SourceConfig& source, const string& datasetId, int offset) {
        ostringstream url;
        url << "https://" << source.domain << "/resource/" << datasetId << ".json"
            << "?$limit=" << source.pageSize
            << "&$offset=" << offset
            << "&$order=" << urlEncode(":id");
        return url.str();
    }

    // Fetches every row of a dataset, one page at a time
    //
    // Args:
    //    client: HTTP client
    //    source: portal domain, token and page size
    //    datasetId: Socrata dataset id, e.g. "3psu-pn9h"
    // Returns:
    //    JSON array of rows; empty when any page fails
    json fetchDataset(utils::IHttpClient& client, const config::SourceConfig& source, const string& datasetId) {
        json rows = json::array();
        int offset = 0;
        while (true) {
            const string body = httpGet(client, datasetUrl(source, datasetId, offset));
            if (body.empty()) {
                logging::error("Couldn't fetch dataset " + datasetId);
                return json::array();
            }
            json page;
            try {
                page = json::parse(body);
            } catch (const json::parse_error& e) {
                logging::error("Malformed response for dataset " + datasetId + ": " + e.what());
                return json::array();
            }
            if (!page.is_array()) {
                logging::error("Unexpected response for dataset " + datasetId);
                return json::array();
            }
            for (auto& row : page) rows.push_back(std::move(row));
            logging::debug("dataset " + datasetId + ": " + std::to_string(rows.size()) + " rows so far");

            if (static_cast<int>(page.size()) < source.pageSize) break;
            offset += source.pageSize;
        }
        logging::info("Fetched " + std::to_string(rows.size()) + " records from " + datasetId);
        return rows;
    }
}  // namespace datasets
