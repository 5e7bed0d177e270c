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
#include <doctest/doctest.h>
#include <ctime>
#include <string>
#include "../curbside/schedule.hpp"

using std::string;

using schedule::DaySet;
using schedule::Schedule;
using schedule::ScheduleError;
using schedule::TimeWindow;
using schedule::Weekday;
using schedule::WeekTime;

using schedule::describeSchedule;
using schedule::makeSchedule;
using schedule::makeWindow;
using schedule::minutesUntilNextStart;
using schedule::overlaps;
using schedule::parseDays;
using schedule::parseHours;
using schedule::parseTimeToMinutes;
using schedule::parseWeekTime;

namespace {
    const unsigned WEEKDAYS = 0x1f;

    Schedule weekdays(int start, int end) {
        return Schedule{DaySet{WEEKDAYS}, TimeWindow{start, end}};
    }

    Schedule onDay(Weekday d, int start, int end) {
        DaySet days = DaySet::none();
        days.add(d);
        return Schedule{days, TimeWindow{start, end}};
    }
}  // namespace

// -----------------------------------------------------------------------------
// Tests for parseDays
// -----------------------------------------------------------------------------

TEST_CASE("parseDays: ranges in several spellings") {
    CHECK_EQ(parseDays("Mon-Fri")->mask, WEEKDAYS);
    CHECK_EQ(parseDays("M-F")->mask, WEEKDAYS);
    CHECK_EQ(parseDays("Monday thru Friday")->mask, WEEKDAYS);
    CHECK_EQ(parseDays("Weekdays")->mask, WEEKDAYS);
}

TEST_CASE("parseDays: a range through the weekend wraps") {
    const auto days = parseDays("Fri-Mon");
    REQUIRE(days);
    CHECK(days->contains(Weekday::Friday));
    CHECK(days->contains(Weekday::Sunday));
    CHECK(days->contains(Weekday::Monday));
    CHECK_FALSE(days->contains(Weekday::Wednesday));
}

TEST_CASE("parseDays: lists") {
    const auto days = parseDays("Tues & Thurs");
    REQUIRE(days);
    CHECK(days->contains(Weekday::Tuesday));
    CHECK(days->contains(Weekday::Thursday));
    CHECK_FALSE(days->contains(Weekday::Monday));

    CHECK_EQ(parseDays("Mon, Wed and Fri")->mask, 0x15u);
}

TEST_CASE("parseDays: lists mixing single days and ranges") {
    CHECK_EQ(parseDays("M, W-F")->mask, 0x1du);
    CHECK_EQ(parseDays("Mon, Wed-Fri")->mask, 0x1du);
    CHECK_EQ(parseDays("Sa, M-W")->mask, 0x47u);
    CHECK_EQ(parseDays("Tu/Th")->mask, 0x0au);
    CHECK_EQ(parseDays("MON, WED")->mask, 0x05u);
    CHECK_EQ(parseDays("Sat Sun")->mask, 0x60u);
    CHECK_EQ(parseDays("Mondays")->mask, 0x01u);
}

TEST_CASE("parseDays: any unrecognized item rejects the whole list") {
    CHECK_FALSE(parseDays("T, Th").has_value());
    CHECK_FALSE(parseDays("Mon, Holiday").has_value());
    CHECK_FALSE(parseDays("Mon-Someday").has_value());
    CHECK_FALSE(parseDays("Monkey").has_value());
    CHECK_THROWS_AS(makeSchedule("T, Th", "8", "10", ""), ScheduleError);
}

TEST_CASE("parseDays: daily, empty and unrecognized") {
    CHECK(parseDays("Daily")->isDaily());
    CHECK(parseDays("")->isDaily());
    CHECK_FALSE(parseDays("holidays").has_value());
}

// -----------------------------------------------------------------------------
// Tests for clock times and hour ranges
// -----------------------------------------------------------------------------

TEST_CASE("parseTimeToMinutes accepts common clock spellings") {
    CHECK_EQ(*parseTimeToMinutes("900"), 540);
    CHECK_EQ(*parseTimeToMinutes("0900"), 540);
    CHECK_EQ(*parseTimeToMinutes("9:30"), 570);
    CHECK_EQ(*parseTimeToMinutes("6:30 PM"), 1110);
    CHECK_EQ(*parseTimeToMinutes("12AM"), 0);
    CHECK_EQ(*parseTimeToMinutes("noon"), 720);
    CHECK_EQ(*parseTimeToMinutes("2400"), 1440);
}

TEST_CASE("parseTimeToMinutes rejects nonsense") {
    CHECK_FALSE(parseTimeToMinutes("").has_value());
    CHECK_FALSE(parseTimeToMinutes("late").has_value());
    CHECK_FALSE(parseTimeToMinutes("9:75").has_value());
    CHECK_FALSE(parseTimeToMinutes("2530").has_value());
}

TEST_CASE("parseHours: a start without meridiem borrows from the end") {
    const auto evening = parseHours("7-9PM");
    REQUIRE(evening);
    CHECK_EQ(evening->startMinute, 19 * 60);
    CHECK_EQ(evening->endMinute, 21 * 60);

    const auto midday = parseHours("10-2PM");
    REQUIRE(midday);
    CHECK_EQ(midday->startMinute, 10 * 60);
    CHECK_EQ(midday->endMinute, 14 * 60);
}

TEST_CASE("parseHours: all-day spellings have no window") {
    CHECK_FALSE(parseHours("").has_value());
    CHECK_FALSE(parseHours("24 hours").has_value());
    CHECK_THROWS_AS(parseHours("sometimes"), ScheduleError);
}

TEST_CASE("makeWindow needs both ends and maps midnight end to end of day") {
    CHECK_FALSE(makeWindow(std::nullopt, std::nullopt).has_value());
    CHECK_THROWS_AS(makeWindow(600, std::nullopt), ScheduleError);
    CHECK_EQ(makeWindow(1320, 0)->endMinute, 1440);
}

TEST_CASE("makeSchedule prefers separate from/to fields over combined hours") {
    const Schedule sched = makeSchedule("Mon-Fri", "8:00", "18:00", "garbage");
    CHECK_EQ(sched.days.mask, WEEKDAYS);
    REQUIRE(sched.window);
    CHECK_EQ(sched.window->startMinute, 480);
    CHECK_EQ(sched.window->endMinute, 1080);

    CHECK_THROWS_AS(makeSchedule("someday", "", "", ""), ScheduleError);
}

TEST_CASE("TimeWindow::lengthMinutes wraps past midnight") {
    CHECK_EQ((TimeWindow{480, 1080}).lengthMinutes(), 600);
    CHECK_EQ((TimeWindow{1320, 360}).lengthMinutes(), 480);
}

// -----------------------------------------------------------------------------
// Tests for overlaps
// -----------------------------------------------------------------------------

TEST_CASE("overlaps: partial overlap counts") {
    const Schedule sched = weekdays(8 * 60, 18 * 60);
    CHECK(overlaps(sched, WeekTime{Weekday::Tuesday, 7 * 60 + 30}, 60));
    CHECK(overlaps(sched, WeekTime{Weekday::Tuesday, 17 * 60 + 59}, 1));
}

TEST_CASE("overlaps: starting as the window closes does not overlap") {
    const Schedule sched = weekdays(8 * 60, 18 * 60);
    CHECK_FALSE(overlaps(sched, WeekTime{Weekday::Tuesday, 18 * 60}, 60));
    CHECK_FALSE(overlaps(sched, WeekTime{Weekday::Tuesday, 6 * 60}, 119));
}

TEST_CASE("overlaps: a stay ending as the window opens overlaps it") {
    const Schedule sweeping = onDay(Weekday::Tuesday, 10 * 60, 12 * 60);
    CHECK(overlaps(sweeping, WeekTime{Weekday::Tuesday, 8 * 60}, 120));
    CHECK_FALSE(overlaps(sweeping, WeekTime{Weekday::Tuesday, 8 * 60}, 119));

    const Schedule sched = weekdays(8 * 60, 18 * 60);
    CHECK(overlaps(sched, WeekTime{Weekday::Tuesday, 7 * 60}, 60));
}

TEST_CASE("overlaps: days outside the set never match") {
    const Schedule sched = weekdays(8 * 60, 18 * 60);
    CHECK_FALSE(overlaps(sched, WeekTime{Weekday::Saturday, 9 * 60}, 120));
}

TEST_CASE("overlaps: an overnight window reaches into the next morning") {
    const Schedule sched = onDay(Weekday::Sunday, 22 * 60, 6 * 60);
    CHECK(overlaps(sched, WeekTime{Weekday::Monday, 5 * 60}, 30));
    CHECK_FALSE(overlaps(sched, WeekTime{Weekday::Monday, 6 * 60}, 30));
}

TEST_CASE("overlaps: a stay running past Sunday wraps into Monday") {
    const Schedule sched = onDay(Weekday::Monday, 0, 60);
    CHECK(overlaps(sched, WeekTime{Weekday::Sunday, 23 * 60 + 30}, 120));
}

TEST_CASE("overlaps: a zero-minute stay checks the instant") {
    const Schedule sched = weekdays(8 * 60, 18 * 60);
    CHECK(overlaps(sched, WeekTime{Weekday::Monday, 8 * 60}, 0));
    CHECK_FALSE(overlaps(sched, WeekTime{Weekday::Monday, 7 * 60 + 59}, 0));
}

TEST_CASE("overlaps: an all-day schedule covers every minute of its days") {
    const Schedule sched{DaySet::daily(), std::nullopt};
    CHECK(overlaps(sched, WeekTime{Weekday::Wednesday, 3 * 60}, 10));
}

TEST_CASE("minutesUntilNextStart looks forward within the horizon") {
    const Schedule sched = onDay(Weekday::Thursday, 8 * 60, 10 * 60);
    CHECK_EQ(*minutesUntilNextStart(sched, WeekTime{Weekday::Wednesday, 20 * 60}, 7 * 24 * 60), 12 * 60);
    CHECK_FALSE(minutesUntilNextStart(sched, WeekTime{Weekday::Wednesday, 20 * 60}, 60).has_value());
}

// -----------------------------------------------------------------------------
// Tests for week times and descriptions
// -----------------------------------------------------------------------------

TEST_CASE("parseWeekTime reads a day and a clock time") {
    const WeekTime t = parseWeekTime("Tue 09:30");
    CHECK(t.day == Weekday::Tuesday);
    CHECK_EQ(t.minuteOfDay, 570);

    const WeekTime pm = parseWeekTime("Saturday 6:15 PM");
    CHECK(pm.day == Weekday::Saturday);
    CHECK_EQ(pm.minuteOfDay, 18 * 60 + 15);

    CHECK_THROWS_AS(parseWeekTime("Tuesday"), ScheduleError);
    CHECK_THROWS_AS(parseWeekTime("Funday 9:00"), ScheduleError);
}

TEST_CASE("WeekTime converts from tm and minute of week") {
    std::tm tm{};
    tm.tm_wday = 0;   // Sunday
    tm.tm_hour = 13;
    tm.tm_min = 5;
    const WeekTime t = WeekTime::fromTm(tm);
    CHECK(t.day == Weekday::Sunday);
    CHECK_EQ(t.minuteOfDay, 785);

    CHECK(WeekTime::fromMinuteOfWeek(-1).day == Weekday::Sunday);
    CHECK_EQ(WeekTime::fromMinuteOfWeek(1440 + 60).minuteOfDay, 60);
}

TEST_CASE("describeSchedule formats days and hours") {
    CHECK_EQ(describeSchedule(weekdays(8 * 60, 18 * 60)), "Mon-Fri 8am-6pm");
    CHECK_EQ(describeSchedule(onDay(Weekday::Tuesday, 12 * 60, 14 * 60 + 30)), "Tue noon-2:30pm");
    CHECK_EQ(describeSchedule(Schedule{DaySet::daily(), std::nullopt}), "Daily, all day");

    DaySet tueThu = DaySet::none();
    tueThu.add(Weekday::Tuesday);
    tueThu.add(Weekday::Thursday);
    CHECK_EQ(schedule::describeDays(tueThu), "Tue, Thu");
}
