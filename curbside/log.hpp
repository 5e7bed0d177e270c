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
#ifndef CURBSIDE_LOG_HPP_
#define CURBSIDE_LOG_HPP_

#include <ostream>  // for ostream
#include <string>   // for string

using std::string;

// Leveled progress and diagnostic messages on stderr, one line per call.
// Safe to call from the parallel join workers.
namespace logging {

enum class Level { Debug = 0, Info, Warn, Error, Off };

void setLevel(Level level);
Level level();
bool parseLevel(const string& text, Level* out);

// redirect output, used by tests; pass nullptr to restore stderr
void setSink(std::ostream* sink);

void log(Level level, const string& message);
void debug(const string& message);
void info(const string& message);
void warn(const string& message);
void error(const string& message);

}  // namespace logging

#endif  // CURBSIDE_LOG_HPP_
