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
#ifndef CURBSIDE_SCHEDULE_HPP_
#define CURBSIDE_SCHEDULE_HPP_

#include <ctime>      // for tm
#include <optional>   // for optional
#include <stdexcept>  // for runtime_error
#include <string>     // for string

using std::optional;
using std::string;

namespace schedule {

const int MINUTES_PER_DAY = 1440;
const int MINUTES_PER_WEEK = 7 * MINUTES_PER_DAY;

// Thrown when a raw day/hour string cannot be normalized
class ScheduleError : public std::runtime_error {
 public:
    explicit ScheduleError(const string& what) : std::runtime_error(what) {}
};

// Monday-first, matching the source datasets
enum class Weekday { Monday = 0, Tuesday, Wednesday, Thursday, Friday, Saturday, Sunday };

// set of weekdays as a 7-bit mask, bit 0 = Monday
struct DaySet {
    unsigned mask{0x7f};

    static DaySet daily() { return DaySet{0x7f}; }
    static DaySet none() { return DaySet{0}; }
    bool isDaily() const { return (mask & 0x7f) == 0x7f; }
    bool empty() const { return (mask & 0x7f) == 0; }
    bool contains(Weekday d) const { return (mask >> static_cast<int>(d)) & 1u; }
    void add(Weekday d) { mask |= 1u << static_cast<int>(d); }
};

// half-open [start, end) minute-of-day window; end <= start wraps past midnight
struct TimeWindow {
    int startMinute{};
    int endMinute{};

    int lengthMinutes() const;
};

// canonical shape every raw day/hour spelling is normalized into;
// an absent window means all day
struct Schedule {
    DaySet days;
    optional<TimeWindow> window;
};

// a moment within the repeating week
struct WeekTime {
    Weekday day{Weekday::Monday};
    int minuteOfDay{};

    int minuteOfWeek() const { return static_cast<int>(day) * MINUTES_PER_DAY + minuteOfDay; }
    static WeekTime fromMinuteOfWeek(int minutes);
    static WeekTime fromTm(const std::tm& tm);
};

optional<DaySet> parseDays(const string& text);
optional<int> parseTimeToMinutes(const string& text);
optional<TimeWindow> makeWindow(const optional<int>& from, const optional<int>& to);
optional<TimeWindow> parseHours(const string& text);
Schedule makeSchedule(const string& days, const string& from, const string& to, const string& hours);

WeekTime parseWeekTime(const string& text);
optional<Weekday> parseWeekday(const string& text);

bool overlaps(const Schedule& sched, const WeekTime& start, int durationMinutes);
optional<int> minutesUntilNextStart(const Schedule& sched, const WeekTime& from, int horizonMinutes);

string describeDays(const DaySet& days);
string formatMinutes(int minuteOfDay);
string describeSchedule(const Schedule& sched);
string weekdayName(Weekday d);

}  // namespace schedule

#endif  // CURBSIDE_SCHEDULE_HPP_
