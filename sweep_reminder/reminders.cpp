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
#include "reminders.hpp"
#include <algorithm>          // for any_of, find_if, remove_if
#include <cctype>             // for toupper
#include <ctime>              // for mktime, tm
#include <iomanip>            // for setw, setfill
#include <iostream>           // for cerr
#include <limits>             // for numeric_limits
#include <nlohmann/json.hpp>  // for basic_json
#include <random>             // for mt19937_64, random_device
#include <sstream>            // for ostringstream
#include <utility>            // for move
#include "recurrence.hpp"

using std::cerr;
using std::ostringstream;

namespace reminders {
    namespace {
        // fixed offsets of the named presets
        struct PresetInfo {
            PresetTiming preset;
            const char* identifier;
            const char* display;
            CustomTiming timing;
        };

        const vector<PresetInfo>& presetTable() {
            static const vector<PresetInfo> table = {
                {PresetTiming::WeekBefore, "week_before", "1 Week Before",
                    {1, TimeUnit::Weeks, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::ThreeDaysBefore, "three_days_before", "3 Days Before",
                    {3, TimeUnit::Days, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::DayBefore, "day_before", "1 Day Before",
                    {1, TimeUnit::Days, Anchor::BeforeCleaning, TimeOfDay{20, 0}}},
                {PresetTiming::MorningOf, "morning_of", "Day Of",
                    {0, TimeUnit::Days, Anchor::BeforeCleaning, TimeOfDay{8, 0}}},
                {PresetTiming::TwoHoursBefore, "two_hours_before", "2 Hours Before",
                    {2, TimeUnit::Hours, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::OneHourBefore, "one_hour_before", "1 Hour Before",
                    {1, TimeUnit::Hours, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::ThirtyMinutes, "thirty_minutes", "30 Minutes Before",
                    {30, TimeUnit::Minutes, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::FifteenMinutes, "fifteen_minutes", "15 Minutes Before",
                    {15, TimeUnit::Minutes, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::FiveMinutes, "five_minutes", "5 Minutes Before",
                    {5, TimeUnit::Minutes, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::AtCleaningTime, "at_cleaning_time", "When Cleaning Starts",
                    {0, TimeUnit::Minutes, Anchor::BeforeCleaning, std::nullopt}},
                {PresetTiming::AfterCleaning, "after_cleaning", "After Cleaning Ends",
                    {0, TimeUnit::Minutes, Anchor::AfterCleaning, std::nullopt}},
            };
            return table;
        }

        const PresetInfo& presetInfo(PresetTiming preset) {
            const auto& table = presetTable();
            return *std::find_if(table.begin(), table.end(),
                [&](const PresetInfo& info) { return info.preset == preset; });
        }
    }  // namespace

    string presetIdentifier(PresetTiming preset) {
        return presetInfo(preset).identifier;
    }

    optional<PresetTiming> parsePresetTiming(const string& text) {
        for (const auto& info : presetTable()) {
            if (text == info.identifier) return info.preset;
        }
        return std::nullopt;
    }

    const vector<PresetTiming>& allPresets() {
        static const vector<PresetTiming> presets = [] {
            vector<PresetTiming> out;
            for (const auto& info : presetTable()) out.push_back(info.preset);
            return out;
        }();
        return presets;
    }

    string unitName(TimeUnit unit) {
        switch (unit) {
            case TimeUnit::Minutes: return "minutes";
            case TimeUnit::Hours: return "hours";
            case TimeUnit::Days: return "days";
            case TimeUnit::Weeks: return "weeks";
        }
        return "";
    }

    optional<TimeUnit> parseTimeUnit(const string& text) {
        if (text == "minutes" || text == "minute") return TimeUnit::Minutes;
        if (text == "hours" || text == "hour") return TimeUnit::Hours;
        if (text == "days" || text == "day") return TimeUnit::Days;
        if (text == "weeks" || text == "week") return TimeUnit::Weeks;
        return std::nullopt;
    }

    string anchorName(Anchor anchor) {
        return anchor == Anchor::BeforeCleaning ? "before" : "after";
    }

    optional<Anchor> parseAnchor(const string& text) {
        if (text == "before") return Anchor::BeforeCleaning;
        if (text == "after") return Anchor::AfterCleaning;
        return std::nullopt;
    }

    ReminderTiming presetTiming(PresetTiming preset) {
        ReminderTiming timing;
        timing.preset = preset;
        timing.custom = presetInfo(preset).timing;
        return timing;
    }

    ReminderTiming customTiming(const CustomTiming& custom) {
        ReminderTiming timing;
        timing.custom = custom;
        return timing;
    }

    // Canonical form used for duplicate detection: 120 minutes == 2 hours,
    // 14 days == 2 weeks, and a zero offset is 0 minutes whatever its unit.
    CustomTiming normalize(const CustomTiming& timing) {
        CustomTiming out = timing;
        if (out.amount == 0) {
            out.unit = TimeUnit::Minutes;
        } else if (out.unit == TimeUnit::Minutes && out.amount % 60 == 0) {
            out.unit = TimeUnit::Hours;
            out.amount /= 60;
        } else if (out.unit == TimeUnit::Days && out.amount % 7 == 0) {
            out.unit = TimeUnit::Weeks;
            out.amount /= 7;
        }
        return out;
    }

    // largest amount of each unit that stays within MAX_OFFSET_DAYS
    static int maxAmount(TimeUnit unit) {
        switch (unit) {
            case TimeUnit::Minutes: return MAX_OFFSET_DAYS * 24 * 60;
            case TimeUnit::Hours: return MAX_OFFSET_DAYS * 24;
            case TimeUnit::Days: return MAX_OFFSET_DAYS;
            case TimeUnit::Weeks: return MAX_OFFSET_DAYS / 7;
        }
        return 0;
    }

    bool isValid(const CustomTiming& timing) {
        if (timing.amount < 0 || timing.amount > maxAmount(timing.unit)) return false;
        if (timing.timeOfDay) {
            if (timing.timeOfDay->hour < 0 || timing.timeOfDay->hour > 23) return false;
            if (timing.timeOfDay->minute < 0 || timing.timeOfDay->minute > 59) return false;
        }
        return true;
    }

    // When a reminder should fire for one cleaning occurrence.
    //
    // Minute and hour offsets are exact durations; day and week offsets are
    // calendar days so the wall time survives DST changes.
    //
    // Args:
    //    timing: the offset rule
    //    cleaningStart: occurrence start
    //    afterCleaningMinutes: assumed cleaning duration for the after anchor
    // Returns:
    //    the fire instant, which may be in the past
    time_t computeFireInstant(const CustomTiming& timing, time_t cleaningStart, int afterCleaningMinutes) {
        const bool before = timing.anchor == Anchor::BeforeCleaning;
        const time_t sign = before ? -1 : 1;
        const time_t origin = before
            ? cleaningStart
            : cleaningStart + static_cast<time_t>(afterCleaningMinutes) * 60;

        time_t base = origin;
        switch (timing.unit) {
            case TimeUnit::Minutes:
                base = origin + sign * static_cast<time_t>(timing.amount) * 60;
                break;
            case TimeUnit::Hours:
                base = origin + sign * static_cast<time_t>(timing.amount) * 3600;
                break;
            case TimeUnit::Days:
                base = recurrence::addDays(origin, static_cast<int>(sign * timing.amount));
                break;
            case TimeUnit::Weeks:
                base = recurrence::addDays(origin, static_cast<int>(sign * 7 * timing.amount));
                break;
        }

        if (!timing.timeOfDay) return base;
        std::tm t = recurrence::toLocalTm(base);
        t.tm_hour = timing.timeOfDay->hour;
        t.tm_min = timing.timeOfDay->minute;
        t.tm_sec = 0;
        t.tm_isdst = -1;
        return std::mktime(&t);
    }

    // e.g. "1 Day Before", "30 Minutes Before", "On The Day", "2 Hours After"
    string displayText(const ReminderTiming& timing) {
        if (timing.preset) return presetInfo(*timing.preset).display;

        const auto& custom = timing.custom;
        if (custom.anchor == Anchor::BeforeCleaning && custom.unit == TimeUnit::Days && custom.amount == 0)
            return "On The Day";

        string unit = unitName(custom.unit);
        if (custom.amount == 1) unit.pop_back();
        unit[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(unit[0])));
        ostringstream out;
        out << custom.amount << " " << unit
            << (custom.anchor == Anchor::BeforeCleaning ? " Before" : " After");
        return out.str();
    }

    string defaultBody(const ReminderTiming& timing) {
        if (!timing.preset) return "Parking reminder - check your street cleaning schedule!";
        switch (*timing.preset) {
            case PresetTiming::WeekBefore:
            case PresetTiming::ThreeDaysBefore:
            case PresetTiming::DayBefore:
                return "Don't forget - street cleaning is coming up!";
            case PresetTiming::MorningOf:
                return "Street cleaning today - move your car!";
            case PresetTiming::TwoHoursBefore:
            case PresetTiming::OneHourBefore:
                return "Street cleaning starts soon - time to move your car!";
            case PresetTiming::ThirtyMinutes:
            case PresetTiming::FifteenMinutes:
            case PresetTiming::FiveMinutes:
                return "Move your car now - street cleaning starts soon!";
            case PresetTiming::AtCleaningTime:
                return "Street cleaning is starting now!";
            case PresetTiming::AfterCleaning:
                return "Street cleaning is done - you can park again!";
        }
        return "";
    }

    // 16 random hex digits
    string newPreferenceId() {
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        ostringstream out;
        out << std::hex << std::setw(16) << std::setfill('0') << rng();
        return out.str();
    }

    // an integer member that fits in int, else nullopt
    static optional<int> intAt(const json& j, const char* key) {
        if (!j.contains(key) || !j[key].is_number_integer()) return std::nullopt;
        const long long value = j[key].get<long long>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max())
            return std::nullopt;
        return static_cast<int>(value);
    }

    json timingToJson(const ReminderTiming& timing) {
        if (timing.preset) return json{{"preset", presetIdentifier(*timing.preset)}};
        json j = {
            {"amount", timing.custom.amount},
            {"unit", unitName(timing.custom.unit)},
            {"anchor", anchorName(timing.custom.anchor)},
        };
        if (timing.custom.timeOfDay) {
            j["time_of_day"] = {{"hour", timing.custom.timeOfDay->hour},
                                {"minute", timing.custom.timeOfDay->minute}};
        }
        return j;
    }

    optional<ReminderTiming> timingFromJson(const json& j) {
        if (!j.is_object()) return std::nullopt;
        if (j.contains("preset")) {
            if (!j["preset"].is_string()) return std::nullopt;
            const auto preset = parsePresetTiming(j["preset"].get<string>());
            if (!preset) return std::nullopt;
            return presetTiming(*preset);
        }

        const auto amount = intAt(j, "amount");
        if (!amount) return std::nullopt;
        if (!j.contains("unit") || !j["unit"].is_string()) return std::nullopt;
        if (!j.contains("anchor") || !j["anchor"].is_string()) return std::nullopt;
        const auto unit = parseTimeUnit(j["unit"].get<string>());
        const auto anchor = parseAnchor(j["anchor"].get<string>());
        if (!unit || !anchor) return std::nullopt;

        CustomTiming custom;
        custom.amount = *amount;
        custom.unit = *unit;
        custom.anchor = *anchor;
        if (j.contains("time_of_day") && !j["time_of_day"].is_null()) {
            const auto& tod = j["time_of_day"];
            if (!tod.is_object()) return std::nullopt;
            const auto hour = intAt(tod, "hour");
            const auto minute = tod.contains("minute") ? intAt(tod, "minute") : optional<int>(0);
            if (!hour || !minute) return std::nullopt;
            custom.timeOfDay = TimeOfDay{*hour, *minute};
        }
        if (!isValid(custom)) return std::nullopt;
        return customTiming(custom);
    }

    json preferenceToJson(const ReminderPreference& pref) {
        json j = {
            {"id", pref.id},
            {"title", pref.title},
            {"timing", timingToJson(pref.timing)},
            {"active", pref.active},
            {"created_at", static_cast<long long>(pref.createdAt)},
        };
        if (pref.message) j["message"] = *pref.message;
        return j;
    }

    optional<ReminderPreference> preferenceFromJson(const json& j) {
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) return std::nullopt;
        if (!j.contains("timing")) return std::nullopt;
        const auto timing = timingFromJson(j["timing"]);
        if (!timing) return std::nullopt;

        ReminderPreference pref;
        pref.id = j["id"].get<string>();
        pref.title = j.contains("title") && j["title"].is_string() ? j["title"].get<string>() : displayText(*timing);
        if (j.contains("message") && j["message"].is_string()) pref.message = j["message"].get<string>();
        pref.timing = *timing;
        if (j.contains("active")) {
            if (!j["active"].is_boolean()) return std::nullopt;
            pref.active = j["active"].get<bool>();
        }
        if (j.contains("created_at") && j["created_at"].is_number_integer())
            pref.createdAt = static_cast<time_t>(j["created_at"].get<long long>());
        return pref;
    }

    PreferenceSet::PreferenceSet(size_t maxPreferences) : maxPreferences_(maxPreferences) {}

    // Adds a preference.
    //
    // The cap is checked first, so a full set rejects even a forced add.
    // A preference whose normalized timing equals an active one is a
    // duplicate unless force is set.
    //
    // Args:
    //    pref: the preference; an empty id is filled in
    //    force: accept a duplicate timing
    // Returns:
    //    Added, or why it was rejected
    AddPreferenceResult PreferenceSet::add(ReminderPreference pref, bool force) {
        if (prefs_.size() >= maxPreferences_) return AddPreferenceResult::LimitReached;
        if (!isValid(pref.timing.custom)) return AddPreferenceResult::Invalid;
        if (!force && isDuplicate(pref.timing)) return AddPreferenceResult::Duplicate;
        while (pref.id.empty() || find(pref.id)) pref.id = newPreferenceId();
        prefs_.push_back(std::move(pref));
        return AddPreferenceResult::Added;
    }

    bool PreferenceSet::remove(const string& id) {
        const auto before = prefs_.size();
        prefs_.erase(std::remove_if(prefs_.begin(), prefs_.end(),
            [&](const ReminderPreference& p) { return p.id == id; }), prefs_.end());
        return prefs_.size() != before;
    }

    bool PreferenceSet::setActive(const string& id, bool active) {
        for (auto& pref : prefs_) {
            if (pref.id != id) continue;
            pref.active = active;
            return true;
        }
        return false;
    }

    bool PreferenceSet::update(const ReminderPreference& pref) {
        if (!isValid(pref.timing.custom)) return false;
        for (auto& existing : prefs_) {
            if (existing.id != pref.id) continue;
            existing = pref;
            return true;
        }
        return false;
    }

    const ReminderPreference* PreferenceSet::find(const string& id) const {
        for (const auto& pref : prefs_) {
            if (pref.id == id) return &pref;
        }
        return nullptr;
    }

    bool PreferenceSet::isDuplicate(const ReminderTiming& timing, const string& ignoreId) const {
        const CustomTiming key = normalize(timing.custom);
        return std::any_of(prefs_.begin(), prefs_.end(), [&](const ReminderPreference& p) {
            return p.active && p.id != ignoreId && normalize(p.timing.custom) == key;
        });
    }

    vector<ReminderPreference> PreferenceSet::active() const {
        vector<ReminderPreference> out;
        for (const auto& pref : prefs_) {
            if (pref.active) out.push_back(pref);
        }
        return out;
    }

    json PreferenceSet::toJson() const {
        json list = json::array();
        for (const auto& pref : prefs_) list.push_back(preferenceToJson(pref));
        return list;
    }

    PreferenceSet PreferenceSet::fromJson(const json& j, size_t maxPreferences) {
        PreferenceSet set(maxPreferences);
        if (!j.is_array()) return set;
        for (const auto& item : j) {
            optional<ReminderPreference> pref;
            try {
                pref = preferenceFromJson(item);
            } catch (const json::exception& e) {
                cerr << "[warn] " << e.what() << "\n";
            }
            if (!pref) {
                cerr << "[warn] Skipping unreadable reminder preference\n";
                continue;
            }
            if (set.prefs_.size() >= maxPreferences) {
                cerr << "[warn] More than " << maxPreferences << " stored preferences, extras ignored\n";
                break;
            }
            set.prefs_.push_back(std::move(*pref));
        }
        return set;
    }

    // evening before at 17:00, morning of at 08:00, 30 minutes before
    PreferenceSet PreferenceSet::defaults(size_t maxPreferences, time_t now) {
        PreferenceSet set(maxPreferences);
        auto make = [&](const string& title, const CustomTiming& custom) {
            ReminderPreference pref;
            pref.title = title;
            pref.timing = customTiming(custom);
            pref.createdAt = now;
            set.add(pref);
        };
        make("Evening Before", CustomTiming{1, TimeUnit::Days, Anchor::BeforeCleaning, TimeOfDay{17, 0}});
        make("Morning Of", CustomTiming{0, TimeUnit::Days, Anchor::BeforeCleaning, TimeOfDay{8, 0}});
        make("30 Minutes Before", CustomTiming{30, TimeUnit::Minutes, Anchor::BeforeCleaning, std::nullopt});
        return set;
    }

    // Reads the stored preferences; the first run gets (and saves) the defaults
    //
    // Args:
    //    store: persistence
    //    maxPreferences: cap for the set
    //    now: creation time for defaults
    // Returns:
    //    the preference set
    PreferenceSet loadPreferences(store::IKeyValueStore& store, size_t maxPreferences, time_t now) {
        const auto raw = store.get(PREFERENCES_KEY);
        if (!raw) {
            PreferenceSet set = PreferenceSet::defaults(maxPreferences, now);
            savePreferences(store, set);
            cerr << "[info] Created " << set.size() << " default reminder preferences\n";
            return set;
        }
        const json j = json::parse(*raw, nullptr, false);
        if (j.is_discarded()) throw store::StoreError("Stored reminder preferences are not valid JSON");
        return PreferenceSet::fromJson(j, maxPreferences);
    }

    void savePreferences(store::IKeyValueStore& store, const PreferenceSet& prefs) {
        store.set(PREFERENCES_KEY, prefs.toJson().dump(-1, ' ', false, json::error_handler_t::replace));
    }
}  // namespace reminders
