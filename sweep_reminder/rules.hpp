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
#ifndef SWEEP_REMINDER_RULES_HPP_
#define SWEEP_REMINDER_RULES_HPP_

#include <stddef.h>               // for size_t
#include <array>                  // for array
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string
#include <vector>                 // for vector
#include "geo.hpp"

using std::array;
using std::optional;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace rules {

// Sunday = 1 .. Saturday = 7, shared by parsing and calendar arithmetic
enum class Weekday {
    Sunday = 1, Monday, Tuesday, Wednesday, Thursday, Friday, Saturday
};

const int WEEKS_PER_MONTH_MAX = 5;

// informational, never used for resolution
struct CitationStats {
    int count{};
    double avg{}, min{}, max{};
};

// one street-segment cleaning restriction, immutable once loaded
struct ScheduleRule {
    string id;
    string cnn;
    string corridorName;
    string limitsDescription;
    // free text, e.g. "North", "Northeast", "West side"
    string blockSide;
    string fullName;
    // empty when the source weekday text was not recognised
    optional<Weekday> weekday;
    int fromHour{};
    int toHour{};
    // weeks 1..5 of the month
    array<bool, WEEKS_PER_MONTH_MAX> weekOfMonthMask{};
    bool holidays{};
    // ordered lon/lat vertices, >= 2, consecutive points distinct
    vector<geo::Point> geometry;
    optional<CitationStats> citationStats;

    bool firesInWeek(int ordinal) const;
    bool hasActiveWeek() const;
};

// outcome of a table load; an empty rule vector means "no data"
struct LoadResult {
    vector<ScheduleRule> rules;
    size_t rowsRead{};
    size_t rowsDropped{};
    bool sourceAvailable{};
};

optional<Weekday> parseWeekday(const string& text);
string weekdayName(Weekday day);
int parseIntOr(const string& text, int fallback);
optional<double> parseDouble(const string& text);
bool parseWeekFlag(const string& text);
vector<vector<string>> parseCsvRecords(const string& text, char delimiter = ',');
optional<vector<geo::Point>> parseLineGeometry(const string& text);
LoadResult parseRulesCsv(const string& text);
LoadResult loadRulesCsv(const string& path);
optional<ScheduleRule> ruleFromJson(const json& row, size_t rowNumber = 0);
string geometryToJson(const vector<geo::Point>& points);
void writeRulesCsv(const string& path, const vector<ScheduleRule>& rules);

}  // namespace rules

#endif  // SWEEP_REMINDER_RULES_HPP_
