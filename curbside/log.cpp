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
#include "log.hpp"
#include <algorithm>  // for transform
#include <atomic>     // for atomic
#include <cctype>     // for tolower
#include <iostream>   // for cerr
#include <mutex>      // for mutex, lock_guard
#include <string>     // for string

using std::cerr;
using std::string;

namespace {
    std::atomic<logging::Level> currentLevel{logging::Level::Info};
    std::mutex sinkMutex;
    std::ostream* currentSink = nullptr;

    const char* prefix(logging::Level level) {
        switch (level) {
            case logging::Level::Debug: return "[debug] ";
            case logging::Level::Info: return "[info] ";
            case logging::Level::Warn: return "[warn] ";
            case logging::Level::Error: return "[error] ";
            case logging::Level::Off: return "";
        }
        return "";
    }
}  // namespace

namespace logging {
    void setLevel(Level level) { currentLevel = level; }

    Level level() { return currentLevel; }

    bool parseLevel(const string& text, Level* out) {
        string t(text);
        std::transform(t.begin(), t.end(), t.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (t == "debug") *out = Level::Debug;
        else if (t == "info") *out = Level::Info;
        else if (t == "warn" || t == "warning") *out = Level::Warn;
        else if (t == "error") *out = Level::Error;
        else if (t == "off" || t == "quiet") *out = Level::Off;
        else
            return false;
        return true;
    }

    void setSink(std::ostream* sink) {
        std::lock_guard<std::mutex> lock(sinkMutex);
        currentSink = sink;
    }

    void log(Level level, const string& message) {
        if (level == Level::Off || level < currentLevel.load()) return;
        std::lock_guard<std::mutex> lock(sinkMutex);
        std::ostream& out = currentSink ? *currentSink : cerr;
        out << prefix(level) << message << "\n";
    }

    void debug(const string& message) { log(Level::Debug, message); }
    void info(const string& message) { log(Level::Info, message); }
    void warn(const string& message) { log(Level::Warn, message); }
    void error(const string& message) { log(Level::Error, message); }
}  // namespace logging
