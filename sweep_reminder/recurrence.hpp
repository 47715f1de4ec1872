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
#ifndef SWEEP_REMINDER_RECURRENCE_HPP_
#define SWEEP_REMINDER_RECURRENCE_HPP_

#include <stddef.h>   // for size_t
#include <ctime>      // for time_t, tm
#include <optional>   // for optional
#include <string>     // for string
#include <vector>     // for vector
#include "rules.hpp"

using std::optional;
using std::string;
using std::vector;

namespace recurrence {

// one concrete restriction window, local civil time, end > start
struct Occurrence {
    time_t start{};
    time_t end{};
};

// bounded lookahead for occurrence searches
struct Horizon {
    enum class Unit { Weeks, Months };
    Unit unit{Unit::Months};
    int amount{3};
};

optional<Horizon::Unit> parseHorizonUnit(const string& text);

time_t makeLocal(int year, int month, int day, int hour, int minute = 0);
std::tm toLocalTm(time_t instant);
time_t addDays(time_t instant, int days);
time_t horizonEnd(time_t from, const Horizon& horizon);
int daysInMonth(int year, int month);
rules::Weekday weekdayOf(int year, int month, int day);

vector<Occurrence> nextOccurrences(
    const rules::ScheduleRule& rule, time_t after,
    const Horizon& horizon, size_t maxResults);
optional<Occurrence> nextOccurrence(
    const rules::ScheduleRule& rule, time_t after, const Horizon& horizon);

string formatLocal(time_t instant);
string formatDate(time_t instant);

}  // namespace recurrence

#endif  // SWEEP_REMINDER_RECURRENCE_HPP_
