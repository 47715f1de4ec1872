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
#include "recurrence.hpp"
#include <algorithm>  // for sort
#include <ctime>      // for mktime, localtime_r, strftime
#include <string>     // for string
#include <vector>     // for vector
#include "utils.hpp"

using std::sort;
using std::string;
using std::vector;

using rules::ScheduleRule;
using rules::Weekday;

namespace recurrence {
    optional<Horizon::Unit> parseHorizonUnit(const string& text) {
        const string t = utils::toLower(utils::trim(text));
        if (t == "weeks" || t == "week") return Horizon::Unit::Weeks;
        if (t == "months" || t == "month") return Horizon::Unit::Months;
        return std::nullopt;
    }

    // Builds a local civil instant; out-of-range fields roll over the way
    // mktime normalises them (day 32 is the 1st of the next month).
    //
    // Args:
    //    year: full year, e.g. 2026
    //    month: 1..12
    //    day: day of month
    //    hour: 0..24
    //    minute: 0..59
    // Returns:
    //    the instant, with DST resolved by the C library
    time_t makeLocal(int year, int month, int day, int hour, int minute) {
        std::tm t{};
        t.tm_year = year - 1900;
        t.tm_mon = month - 1;
        t.tm_mday = day;
        t.tm_hour = hour;
        t.tm_min = minute;
        t.tm_sec = 0;
        t.tm_isdst = -1;
        return std::mktime(&t);
    }

    std::tm toLocalTm(time_t instant) {
        std::tm t{};
        localtime_r(&instant, &t);
        return t;
    }

    // Moves an instant by whole calendar days, keeping the local wall time
    time_t addDays(time_t instant, int days) {
        std::tm t = toLocalTm(instant);
        t.tm_mday += days;
        t.tm_isdst = -1;
        return std::mktime(&t);
    }

    time_t horizonEnd(time_t from, const Horizon& horizon) {
        if (horizon.unit == Horizon::Unit::Weeks) return addDays(from, 7 * horizon.amount);
        std::tm t = toLocalTm(from);
        t.tm_mon += horizon.amount;
        t.tm_isdst = -1;
        return std::mktime(&t);
    }

    int daysInMonth(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2) {
            const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return leap ? 29 : 28;
        }
        return days[month - 1];
    }

    Weekday weekdayOf(int year, int month, int day) {
        // noon keeps clear of DST transitions
        const std::tm t = toLocalTm(makeLocal(year, month, day, 12));
        return static_cast<Weekday>(t.tm_wday + 1);
    }

    // Computes the next firings of a rule.
    //
    // Walks month by month from the month containing `after`. In each month
    // the rule's weekday occurs 4 or 5 times, numbered 1..k; occurrence n
    // fires only when week n of the mask is set.
    //
    // Args:
    //    rule: the restriction
    //    after: reference instant; results start strictly later
    //    horizon: results never start after after + horizon
    //    maxResults: stop once this many are found
    // Returns:
    //    occurrences sorted by start; empty for an unknown weekday or an
    //    all-false week mask
    vector<Occurrence> nextOccurrences(
        const ScheduleRule& rule, time_t after,
        const Horizon& horizon, size_t maxResults) {
        vector<Occurrence> out;
        if (!rule.weekday || !rule.hasActiveWeek() || maxResults == 0 || horizon.amount <= 0)
            return out;

        const time_t limit = horizonEnd(after, horizon);
        const std::tm from = toLocalTm(after);
        int year = from.tm_year + 1900;
        int month = from.tm_mon + 1;
        const int target = static_cast<int>(*rule.weekday);

        bool done = false;
        while (!done && makeLocal(year, month, 1, 0) <= limit) {
            const int firstWeekday = static_cast<int>(weekdayOf(year, month, 1));
            const int firstDay = 1 + (target - firstWeekday + 7) % 7;
            const int lastDay = daysInMonth(year, month);

            int ordinal = 1;
            for (int day = firstDay; day <= lastDay; day += 7, ++ordinal) {
                if (!rule.firesInWeek(ordinal)) continue;
                const time_t start = makeLocal(year, month, day, rule.fromHour);
                if (start <= after) continue;
                if (start > limit) {
                    done = true;
                    break;
                }
                Occurrence occurrence;
                occurrence.start = start;
                occurrence.end = rule.toHour > rule.fromHour
                    ? makeLocal(year, month, day, rule.toHour)
                    : makeLocal(year, month, day + 1, rule.toHour);
                out.push_back(occurrence);
                if (out.size() >= maxResults) {
                    done = true;
                    break;
                }
            }

            if (++month > 12) {
                month = 1;
                ++year;
            }
        }

        sort(out.begin(), out.end(),
            [](const Occurrence& a, const Occurrence& b) { return a.start < b.start; });
        return out;
    }

    optional<Occurrence> nextOccurrence(const ScheduleRule& rule, time_t after, const Horizon& horizon) {
        const auto found = nextOccurrences(rule, after, horizon, 1);
        if (found.empty()) return std::nullopt;
        return found.front();
    }

    // ISO-8601 local timestamp, e.g. 2026-03-02T08:00:00
    string formatLocal(time_t instant) {
        const std::tm t = toLocalTm(instant);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &t);
        return buffer;
    }

    string formatDate(time_t instant) {
        const std::tm t = toLocalTm(instant);
        char buffer[16];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &t);
        return buffer;
    }
}  // namespace recurrence
