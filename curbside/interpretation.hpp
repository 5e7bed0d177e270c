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
#ifndef CURBSIDE_INTERPRETATION_HPP_
#define CURBSIDE_INTERPRETATION_HPP_

#include <stddef.h>                // for size_t
#include <map>                    // for map
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string

#include "segment.hpp"

using std::optional;
using std::string;
using json = nlohmann::json;

namespace interpretation {

// human-readable summary of a rule, produced offline
struct Interpretation {
    string summary;
    double confidence{};
};

// Read-only lookup of cached interpretations by canonical rule key.
// Implementations must be safe to call from several threads.
class IInterpretationSource {
 public:
    virtual ~IInterpretationSource() = default;
    virtual optional<Interpretation> lookup(const string& key) const = 0;
};

// Cache loaded from a JSON object: { "<key>": {"summary": ..., "confidence": ...} }
class JsonInterpretationSource : public IInterpretationSource {
 public:
    JsonInterpretationSource() = default;
    explicit JsonInterpretationSource(const json& j);

    optional<Interpretation> lookup(const string& key) const override;
    void put(const string& key, Interpretation value);
    size_t size() const { return entries_.size(); }

    static JsonInterpretationSource fromFile(const string& path);

 private:
    std::map<string, Interpretation> entries_;
};

string canonicalKey(const segment::Rule& rule);

}  // namespace interpretation

#endif  // CURBSIDE_INTERPRETATION_HPP_
