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
#ifndef SWEEP_REMINDER_REMINDERS_HPP_
#define SWEEP_REMINDER_REMINDERS_HPP_

#include <stddef.h>               // for size_t
#include <ctime>                  // for time_t
#include <nlohmann/json_fwd.hpp>  // for json
#include <optional>               // for optional
#include <string>                 // for string
#include <vector>                 // for vector
#include "store.hpp"

using std::optional;
using std::string;
using std::vector;
using json = nlohmann::json;

namespace reminders {

const char PREFERENCES_KEY[] = "reminder_preferences";
const size_t DEFAULT_MAX_PREFERENCES = 25;
// custom offsets reach at most ten years from the cleaning
const int MAX_OFFSET_DAYS = 3650;

enum class PresetTiming {
    WeekBefore, ThreeDaysBefore, DayBefore, MorningOf,
    TwoHoursBefore, OneHourBefore, ThirtyMinutes, FifteenMinutes, FiveMinutes,
    AtCleaningTime, AfterCleaning
};

enum class TimeUnit { Minutes, Hours, Days, Weeks };

// before: relative to cleaning start; after: relative to the assumed end
enum class Anchor { BeforeCleaning, AfterCleaning };

struct TimeOfDay {
    int hour{};
    int minute{};
    bool operator==(const TimeOfDay& other) const { return hour == other.hour && minute == other.minute; }
};

struct CustomTiming {
    int amount{};
    TimeUnit unit{TimeUnit::Minutes};
    Anchor anchor{Anchor::BeforeCleaning};
    // snaps the offset instant's date to this wall time
    optional<TimeOfDay> timeOfDay;

    bool operator==(const CustomTiming& other) const {
        return amount == other.amount && unit == other.unit &&
            anchor == other.anchor && timeOfDay == other.timeOfDay;
    }
};

// A preset keeps its identity for display, but is computed (and compared)
// through its custom equivalent.
struct ReminderTiming {
    optional<PresetTiming> preset;
    CustomTiming custom;
};

struct ReminderPreference {
    string id;
    string title;
    optional<string> message;
    ReminderTiming timing;
    bool active = true;
    time_t createdAt{};
};

enum class AddPreferenceResult { Added, Duplicate, LimitReached, Invalid };

// preset identifiers, e.g. "one_hour_before"
string presetIdentifier(PresetTiming preset);
optional<PresetTiming> parsePresetTiming(const string& text);
const vector<PresetTiming>& allPresets();
string unitName(TimeUnit unit);
optional<TimeUnit> parseTimeUnit(const string& text);
string anchorName(Anchor anchor);
optional<Anchor> parseAnchor(const string& text);

ReminderTiming presetTiming(PresetTiming preset);
ReminderTiming customTiming(const CustomTiming& custom);
CustomTiming normalize(const CustomTiming& timing);
bool isValid(const CustomTiming& timing);
time_t computeFireInstant(const CustomTiming& timing, time_t cleaningStart, int afterCleaningMinutes);

string displayText(const ReminderTiming& timing);
string defaultBody(const ReminderTiming& timing);
string newPreferenceId();

json timingToJson(const ReminderTiming& timing);
optional<ReminderTiming> timingFromJson(const json& j);
json preferenceToJson(const ReminderPreference& pref);
optional<ReminderPreference> preferenceFromJson(const json& j);

// The user's reminder preferences, bounded by a count cap
class PreferenceSet {
 public:
    explicit PreferenceSet(size_t maxPreferences = DEFAULT_MAX_PREFERENCES);

    AddPreferenceResult add(ReminderPreference pref, bool force = false);
    bool remove(const string& id);
    bool setActive(const string& id, bool active);
    bool update(const ReminderPreference& pref);

    const ReminderPreference* find(const string& id) const;
    bool isDuplicate(const ReminderTiming& timing, const string& ignoreId = "") const;
    vector<ReminderPreference> active() const;
    const vector<ReminderPreference>& all() const { return prefs_; }
    size_t size() const { return prefs_.size(); }
    size_t maxPreferences() const { return maxPreferences_; }

    json toJson() const;
    static PreferenceSet fromJson(const json& j, size_t maxPreferences);
    static PreferenceSet defaults(size_t maxPreferences, time_t now);

 private:
    size_t maxPreferences_;
    vector<ReminderPreference> prefs_;
};

PreferenceSet loadPreferences(store::IKeyValueStore& store, size_t maxPreferences, time_t now);
void savePreferences(store::IKeyValueStore& store, const PreferenceSet& prefs);

}  // namespace reminders

#endif  // SWEEP_REMINDER_REMINDERS_HPP_
