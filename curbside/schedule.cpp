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
#include "schedule.hpp"
#include <algorithm>      // for transform
#include <cctype>         // for isdigit, isspace, toupper
#include <ctime>          // for tm
#include <optional>       // for optional, nullopt
#include <sstream>        // for ostringstream
#include <string>         // for string
#include <unordered_map>  // for unordered_map
#include <vector>         // for vector

using std::nullopt;
using std::optional;
using std::ostringstream;
using std::string;
using std::unordered_map;
using std::vector;

using schedule::DaySet;
using schedule::Schedule;
using schedule::ScheduleError;
using schedule::TimeWindow;
using schedule::Weekday;
using schedule::WeekTime;
using schedule::MINUTES_PER_DAY;
using schedule::MINUTES_PER_WEEK;

namespace {
    string upperTrim(const string& text) {
        size_t b = 0, e = text.size();
        while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
        string out = text.substr(b, e - b);
        std::transform(out.begin(), out.end(), out.begin(),
            [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    void replaceAll(string* s, const string& from, const string& to) {
        size_t pos = 0;
        while ((pos = s->find(from, pos)) != string::npos) {
            s->replace(pos, from.size(), to);
            pos += to.size();
        }
    }

    vector<string> splitAny(const string& s, const string& separators) {
        vector<string> out;
        string current;
        for (char c : s) {
            if (separators.find(c) != string::npos) {
                out.push_back(current);
                current.clear();
            } else {
                current += c;
            }
        }
        out.push_back(current);
        return out;
    }

    // whole-token day names only; a bare "T" could be Tuesday or Thursday
    optional<Weekday> dayToken(const string& raw) {
        static const unordered_map<string, Weekday> names = {
            {"M", Weekday::Monday}, {"MO", Weekday::Monday}, {"MON", Weekday::Monday},
            {"MONDAY", Weekday::Monday},
            {"TU", Weekday::Tuesday}, {"TUE", Weekday::Tuesday}, {"TUES", Weekday::Tuesday},
            {"TUESDAY", Weekday::Tuesday},
            {"W", Weekday::Wednesday}, {"WE", Weekday::Wednesday}, {"WED", Weekday::Wednesday},
            {"WEDS", Weekday::Wednesday}, {"WEDNESDAY", Weekday::Wednesday},
            {"R", Weekday::Thursday}, {"TH", Weekday::Thursday}, {"THU", Weekday::Thursday},
            {"THUR", Weekday::Thursday}, {"THURS", Weekday::Thursday}, {"THURSDAY", Weekday::Thursday},
            {"F", Weekday::Friday}, {"FR", Weekday::Friday}, {"FRI", Weekday::Friday},
            {"FRIDAY", Weekday::Friday},
            {"SA", Weekday::Saturday}, {"SAT", Weekday::Saturday}, {"SATURDAY", Weekday::Saturday},
            {"SU", Weekday::Sunday}, {"SUN", Weekday::Sunday}, {"SUNDAY", Weekday::Sunday}
        };

        string token = upperTrim(raw);
        while (!token.empty() && token.back() == '.') token.pop_back();
        if (token.empty()) return nullopt;

        auto it = names.find(token);
        // "Mondays"
        if (it == names.end() && token.size() > 4 && token.back() == 'S') {
            it = names.find(token.substr(0, token.size() - 1));
        }
        if (it == names.end()) return nullopt;
        return it->second;
    }

    DaySet dayRange(Weekday from, Weekday to) {
        DaySet set = DaySet::none();
        int d = static_cast<int>(from);
        const int end = static_cast<int>(to);
        // Fri-Mon wraps through the weekend
        while (true) {
            set.add(static_cast<Weekday>(d));
            if (d == end) break;
            d = (d + 1) % 7;
        }
        return set;
    }

    // one list item: "Wed", "W-F", "Mon thru Fri" or "Sat Sun"
    optional<DaySet> dayItem(const string& item) {
        for (const string sep : {"-", " THRU ", " THROUGH ", " TO "}) {
            const size_t pos = item.find(sep);
            if (pos == string::npos) continue;
            const auto from = dayToken(item.substr(0, pos));
            const auto to = dayToken(item.substr(pos + sep.size()));
            if (!from || !to) return nullopt;
            return dayRange(*from, *to);
        }

        DaySet set = DaySet::none();
        for (const auto& word : splitAny(item, " ")) {
            if (word.empty()) continue;
            const auto day = dayToken(word);
            if (!day) return nullopt;
            set.add(*day);
        }
        if (set.empty()) return nullopt;
        return set;
    }

    struct ClockTime {
        optional<int> minutes;
        bool hasMeridiem{};
    };

    ClockTime parseClock(const string& text) {
        ClockTime out;
        const string t = upperTrim(text);
        out.hasMeridiem = t.find("AM") != string::npos || t.find("PM") != string::npos;
        out.minutes = schedule::parseTimeToMinutes(t);
        return out;
    }
}  // namespace

namespace schedule {
    int TimeWindow::lengthMinutes() const {
        if (endMinute > startMinute) return endMinute - startMinute;
        return endMinute + MINUTES_PER_DAY - startMinute;
    }

    WeekTime WeekTime::fromMinuteOfWeek(int minutes) {
        int m = minutes % MINUTES_PER_WEEK;
        if (m < 0) m += MINUTES_PER_WEEK;
        return WeekTime{static_cast<Weekday>(m / MINUTES_PER_DAY), m % MINUTES_PER_DAY};
    }

    // tm_wday counts from Sunday; Weekday counts from Monday
    WeekTime WeekTime::fromTm(const std::tm& tm) {
        return WeekTime{static_cast<Weekday>((tm.tm_wday + 6) % 7), tm.tm_hour * 60 + tm.tm_min};
    }

    // Normalizes the many real-world spellings of a day list
    //
    // Args:
    //    text: e.g. "Mon-Fri", "M-F", "Tues & Thurs", "Daily", "School days"
    // Returns:
    //    the day set; empty text means every day; nullopt when any item
    //    is not a recognizable day or range
    optional<DaySet> parseDays(const string& text) {
        string s = upperTrim(text);
        if (s.empty()) return DaySet::daily();

        replaceAll(&s, "\xE2\x80\x93", "-");  // en dash
        replaceAll(&s, "\xE2\x80\x94", "-");  // em dash

        if (s == "DAILY" || s == "EVERY DAY" || s == "EVERYDAY" || s == "7 DAYS" ||
            s == "ALL DAYS" || s == "ANY DAY") {
            return DaySet::daily();
        }
        if (s.find("SCHOOL") != string::npos || s == "WEEKDAYS") {
            return dayRange(Weekday::Monday, Weekday::Friday);
        }
        if (s == "WEEKENDS" || s == "WEEKEND") {
            return dayRange(Weekday::Saturday, Weekday::Sunday);
        }

        // lists such as "Mon, Wed & Fri" or "Tu/Th"; each item is a single
        // day, a range, or space-separated days
        replaceAll(&s, " AND ", ",");
        DaySet set = DaySet::none();
        for (const auto& item : splitAny(s, ",&/;")) {
            const string part = upperTrim(item);
            if (part.empty()) continue;
            const auto days = dayItem(part);
            if (!days) return nullopt;
            set.mask |= days->mask;
        }
        if (set.empty()) return nullopt;
        return set;
    }

    // Converts a clock time to minutes from midnight
    //
    // Args:
    //    text: "900", "0900", "9", "9:00", "9AM", "6:30 PM", "noon", "midnight", "2400"
    // Returns:
    //    minutes in [0, 1440], nullopt when unparseable
    optional<int> parseTimeToMinutes(const string& text) {
        const string t = upperTrim(text);
        if (t.empty()) return nullopt;
        if (t == "NOON" || t == "12 NOON") return 12 * 60;
        if (t == "MIDNIGHT" || t == "12 MIDNIGHT") return 0;

        const bool pm = t.find("PM") != string::npos;
        const bool am = t.find("AM") != string::npos;

        string digits;
        for (char c : t) {
            if (std::isdigit(static_cast<unsigned char>(c)) || c == ':') digits += c;
        }
        if (digits.empty() || digits.front() == ':') return nullopt;

        int hours = 0, minutes = 0;
        const size_t colon = digits.find(':');
        try {
            if (colon != string::npos) {
                hours = std::stoi(digits.substr(0, colon));
                const string rest = digits.substr(colon + 1);
                minutes = rest.empty() ? 0 : std::stoi(rest);
            } else if (digits.size() >= 3) {
                const int val = std::stoi(digits);
                hours = val / 100;
                minutes = val % 100;
            } else {
                hours = std::stoi(digits);
            }
        } catch (const std::exception&) {
            return nullopt;
        }

        if (pm && hours < 12) hours += 12;
        else if (am && hours == 12) hours = 0;

        if (minutes < 0 || minutes >= 60 || hours < 0 || hours > 24) return nullopt;
        if (hours == 24 && minutes != 0) return nullopt;
        return hours * 60 + minutes;
    }

    // Both ends present or both absent; an end of 0 or 1440 means end of day
    optional<TimeWindow> makeWindow(const optional<int>& from, const optional<int>& to) {
        if (!from && !to) return nullopt;
        if (!from || !to) throw ScheduleError("time window needs both a start and an end");
        TimeWindow w;
        w.startMinute = *from % MINUTES_PER_DAY;
        w.endMinute = *to == 0 ? MINUTES_PER_DAY : *to;
        return w;
    }

    // Parses a combined hours field such as "9AM-6PM", "0900-1800" or "7-9AM".
    // A start without AM/PM borrows the end's meridiem unless that would put
    // it after the end ("10-2PM" is 10am to 2pm).
    optional<TimeWindow> parseHours(const string& text) {
        string s = upperTrim(text);
        if (s.empty() || s == "ALL DAY" || s == "ANYTIME" || s == "24 HOURS" || s == "24HRS") {
            return nullopt;
        }
        replaceAll(&s, "\xE2\x80\x93", "-");
        replaceAll(&s, " TO ", "-");

        const size_t dash = s.find('-');
        if (dash == string::npos) throw ScheduleError("unrecognized hours: " + text);

        ClockTime from = parseClock(s.substr(0, dash));
        const ClockTime to = parseClock(s.substr(dash + 1));
        if (!from.minutes || !to.minutes) throw ScheduleError("unrecognized hours: " + text);

        if (!from.hasMeridiem && to.hasMeridiem && *from.minutes < 12 * 60) {
            const bool toIsPm = *to.minutes >= 12 * 60;
            if (toIsPm && *from.minutes + 12 * 60 <= *to.minutes) {
                from.minutes = *from.minutes + 12 * 60;
            }
        }
        return makeWindow(from.minutes, to.minutes);
    }

    // Builds the canonical schedule from raw dataset fields
    //
    // Args:
    //    days: raw day text, e.g. "M-F"
    //    from: raw start time, may be empty
    //    to: raw end time, may be empty
    //    hours: combined hours field, used when from/to are both empty
    // Returns:
    //    normalized schedule
    // Throws:
    //    ScheduleError when a non-empty field cannot be parsed
    Schedule makeSchedule(const string& days, const string& from, const string& to, const string& hours) {
        Schedule sched;
        const auto parsedDays = parseDays(days);
        if (!parsedDays) throw ScheduleError("unrecognized days: " + days);
        sched.days = *parsedDays;

        const bool hasFrom = !upperTrim(from).empty();
        const bool hasTo = !upperTrim(to).empty();
        if (hasFrom || hasTo) {
            const auto start = parseTimeToMinutes(from);
            const auto end = parseTimeToMinutes(to);
            if ((hasFrom && !start) || (hasTo && !end)) {
                throw ScheduleError("unrecognized time range: " + from + " - " + to);
            }
            sched.window = makeWindow(start, end);
        } else {
            sched.window = parseHours(hours);
        }
        return sched;
    }

    optional<Weekday> parseWeekday(const string& text) {
        return dayToken(text);
    }

    // Parses "Tue 09:30" or "Saturday 6:15 PM"
    WeekTime parseWeekTime(const string& text) {
        const string t = upperTrim(text);
        const size_t space = t.find(' ');
        if (space == string::npos) throw ScheduleError("expected '<day> <time>': " + text);
        const auto day = parseWeekday(t.substr(0, space));
        const auto minutes = parseTimeToMinutes(t.substr(space + 1));
        if (!day || !minutes || *minutes >= MINUTES_PER_DAY) {
            throw ScheduleError("expected '<day> <time>': " + text);
        }
        return WeekTime{*day, *minutes};
    }

    // True when any occurrence of the schedule intersects the requested
    // parking interval [start, start + duration]. The stay's last minute
    // counts, so a stay ending as a window opens overlaps it. A zero-minute
    // request checks the single instant.
    //
    // Args:
    //    sched: normalized rule schedule
    //    start: when parking begins
    //    durationMinutes: requested stay
    // Returns:
    //    true on any overlap, partial or full
    bool overlaps(const Schedule& sched, const WeekTime& start, int durationMinutes) {
        if (sched.days.empty()) return false;
        if (durationMinutes >= MINUTES_PER_WEEK) return true;

        const int qs = start.minuteOfWeek();
        const int qe = qs + durationMinutes;
        const int offset = sched.window ? sched.window->startMinute : 0;
        const int length = sched.window ? sched.window->lengthMinutes() : MINUTES_PER_DAY;

        // previous week catches overnight windows running into Monday,
        // next week catches requests running past Sunday
        for (int week = -1; week <= 1; ++week) {
            for (int d = 0; d < 7; ++d) {
                if (!sched.days.contains(static_cast<Weekday>(d))) continue;
                const int rs = week * MINUTES_PER_WEEK + d * MINUTES_PER_DAY + offset;
                const int re = rs + length;
                if (rs <= qe && qs < re) return true;
            }
        }
        return false;
    }

    // Minutes from `from` until the next occurrence of the schedule begins,
    // looking no further than the horizon
    optional<int> minutesUntilNextStart(const Schedule& sched, const WeekTime& from, int horizonMinutes) {
        if (sched.days.empty()) return nullopt;
        const int t = from.minuteOfWeek();
        const int offset = sched.window ? sched.window->startMinute : 0;

        optional<int> best;
        for (int week = 0; week <= 1; ++week) {
            for (int d = 0; d < 7; ++d) {
                if (!sched.days.contains(static_cast<Weekday>(d))) continue;
                const int delta = week * MINUTES_PER_WEEK + d * MINUTES_PER_DAY + offset - t;
                if (delta < 0 || delta > horizonMinutes) continue;
                if (!best || delta < *best) best = delta;
            }
        }
        return best;
    }

    string weekdayName(Weekday d) {
        static const char* const names[] = {"Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};
        return names[static_cast<int>(d)];
    }

    // "Daily", "Mon-Fri" for a single run of three or more days, else "Tue, Thu"
    string describeDays(const DaySet& days) {
        if (days.isDaily()) return "Daily";
        if (days.empty()) return "Never";

        int runs = 0, first = -1, last = -1;
        for (int d = 0; d < 7; ++d) {
            const bool in = days.contains(static_cast<Weekday>(d));
            const bool prev = d > 0 && days.contains(static_cast<Weekday>(d - 1));
            if (in && !prev) {
                ++runs;
                first = d;
            }
            if (in) last = d;
        }
        if (runs == 1 && last - first >= 2) {
            return weekdayName(static_cast<Weekday>(first)) + "-" + weekdayName(static_cast<Weekday>(last));
        }

        ostringstream oss;
        bool sep = false;
        for (int d = 0; d < 7; ++d) {
            if (!days.contains(static_cast<Weekday>(d))) continue;
            if (sep) oss << ", ";
            oss << weekdayName(static_cast<Weekday>(d));
            sep = true;
        }
        return oss.str();
    }

    // "9am", "6:30pm", "noon", "midnight"
    string formatMinutes(int minuteOfDay) {
        const int m = minuteOfDay % MINUTES_PER_DAY;
        if (m == 0) return "midnight";
        if (m == 12 * 60) return "noon";
        const int hour = m / 60;
        const int minute = m % 60;
        const int hour12 = hour % 12 == 0 ? 12 : hour % 12;
        ostringstream oss;
        oss << hour12;
        if (minute != 0) oss << ':' << (minute < 10 ? "0" : "") << minute;
        oss << (hour < 12 ? "am" : "pm");
        return oss.str();
    }

    string describeSchedule(const Schedule& sched) {
        string out = describeDays(sched.days);
        if (sched.window) {
            out += " " + formatMinutes(sched.window->startMinute) + "-" +
                formatMinutes(sched.window->endMinute);
        } else {
            out += ", all day";
        }
        return out;
    }
}  // namespace schedule
