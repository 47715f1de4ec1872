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
#include <vector>
#include "../sweep_reminder/recurrence.hpp"
#include "../sweep_reminder/reminders.hpp"
#include "../sweep_reminder/resolver.hpp"
#include "../sweep_reminder/scheduler.hpp"
#include "fakes.hpp"

using std::string;
using std::vector;

using recurrence::makeLocal;
using recurrence::Occurrence;
using reminders::PresetTiming;
using reminders::ReminderPreference;
using resolver::ResolvedMatch;
using rules::ScheduleRule;
using rules::Weekday;
using scheduler::ReminderScheduler;
using scheduler::ScheduleReport;
using scheduler::SchedulerOptions;

static const geo::Point ORIGIN{-122.42, 37.76};

static ReminderPreference presetPref(const string& id, PresetTiming preset, bool active = true) {
    ReminderPreference pref;
    pref.id = id;
    pref.title = id;
    pref.timing = reminders::presetTiming(preset);
    pref.active = active;
    return pref;
}

static vector<ReminderPreference> threePrefs() {
    return {
        presetPref("day", PresetTiming::DayBefore),
        presetPref("half", PresetTiming::ThirtyMinutes),
        presetPref("after", PresetTiming::AfterCleaning),
    };
}

// Monday 2026-07-06 08:00 to 10:00
static ResolvedMatch mondayMatch(const string& ruleId = "r1") {
    ResolvedMatch match;
    match.rule = northSouthRule(ruleId, ORIGIN, "East", Weekday::Monday, {1, 3});
    match.side = resolver::Side::East;
    match.distanceMeters = 10.0;
    match.next = Occurrence{makeLocal(2026, 7, 6, 8), makeLocal(2026, 7, 6, 10)};
    return match;
}

static SchedulerOptions fastOptions() {
    SchedulerOptions options;
    options.retryBackoffMs = 0;
    return options;
}

static time_t wednesdayNoon() {
    return makeLocal(2026, 7, 1, 12);
}

// -----------------------------------------------------------------------------
// Tests for reminderId / compute
// -----------------------------------------------------------------------------

TEST_CASE("reminderId: location, rule, local start and preference") {
    CHECK_EQ(scheduler::reminderId("home", "r1", makeLocal(2026, 7, 6, 8), "day"),
             "home_r1_2026-07-06T08:00:00_day");
}

TEST_CASE("compute: one reminder per active preference, sorted by fire time") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    const auto match = mondayMatch();

    auto prefs = threePrefs();
    prefs.push_back(presetPref("paused", PresetTiming::WeekBefore, false));
    const auto out = sched.compute("home", match.rule, *match.next, prefs, wednesdayNoon());

    REQUIRE_EQ(out.size(), 3);
    CHECK_EQ(out[0].preferenceId, "day");
    CHECK_EQ(out[0].fireAt, makeLocal(2026, 7, 5, 20));
    CHECK_EQ(out[1].preferenceId, "half");
    CHECK_EQ(out[1].fireAt, makeLocal(2026, 7, 6, 7, 30));
    CHECK_EQ(out[2].preferenceId, "after");
    CHECK_EQ(out[2].fireAt, makeLocal(2026, 7, 6, 10));
    CHECK_EQ(out[0].streetName, "Valencia St");
    CHECK_EQ(out[0].body, reminders::defaultBody(reminders::presetTiming(PresetTiming::DayBefore)));
}

TEST_CASE("compute: instants at or before now are dropped") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    const auto match = mondayMatch();

    const auto out = sched.compute("home", match.rule, *match.next, threePrefs(), makeLocal(2026, 7, 6, 7, 30));
    REQUIRE_EQ(out.size(), 1);
    CHECK_EQ(out[0].preferenceId, "after");
}

TEST_CASE("compute: custom message replaces the default body") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    const auto match = mondayMatch();

    auto pref = presetPref("half", PresetTiming::ThirtyMinutes);
    pref.message = "Move the van to the garage";
    const auto out = sched.compute("home", match.rule, *match.next, {pref}, wednesdayNoon());
    REQUIRE_EQ(out.size(), 1);
    CHECK_EQ(out[0].body, "Move the van to the garage");
}

// -----------------------------------------------------------------------------
// Tests for scheduleForLocation
// -----------------------------------------------------------------------------

TEST_CASE("scheduleForLocation: persists and submits every reminder") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    const auto report = sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    CHECK_EQ(report.cancelled, 0);
    CHECK_EQ(report.submitted, 3);
    CHECK_EQ(report.failed, 0);
    CHECK_EQ(report.skippedPast, 0);
    CHECK_EQ(delivery.pending.size(), 3);
    CHECK_EQ(sched.persisted().size(), 3);
    CHECK(delivery.pending.count("home_r1_2026-07-06T08:00:00_half") == 1);

    const auto& request = delivery.pending["home_r1_2026-07-06T08:00:00_half"];
    CHECK_EQ(request.metadata.at("type"), "street_cleaning");
    CHECK_EQ(request.metadata.at("rule_id"), "r1");
    CHECK_EQ(request.metadata.at("cleaning_start"), "2026-07-06T08:00:00");
}

TEST_CASE("scheduleForLocation: rescheduling yields the same ids, never duplicates") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    const auto first = delivery.pendingIds();

    const auto report = sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon() + 60);
    CHECK_EQ(report.cancelled, 3);
    CHECK_EQ(report.submitted, 3);
    CHECK_EQ(delivery.pendingIds(), first);
    CHECK_EQ(sched.persisted().size(), 3);
}

TEST_CASE("scheduleForLocation: a new rule replaces the old reminders") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    sched.scheduleForLocation("home", mondayMatch("r1"), threePrefs(), wednesdayNoon());
    sched.scheduleForLocation("home", mondayMatch("r2"), threePrefs(), wednesdayNoon());

    CHECK_EQ(delivery.cancelled.size(), 3);
    for (const auto& r : sched.persisted()) CHECK_EQ(r.ruleId, "r2");
    for (const auto& id : delivery.pendingIds()) CHECK(id.find("_r2_") != string::npos);
}

TEST_CASE("scheduleForLocation: other locations are left alone") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    sched.scheduleForLocation("work", mondayMatch(), threePrefs(), wednesdayNoon());
    CHECK(delivery.cancelled.empty());
    CHECK_EQ(delivery.pending.size(), 6);
}

TEST_CASE("scheduleForLocation: no next occurrence only cancels") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    auto match = mondayMatch();
    match.next.reset();
    const auto report = sched.scheduleForLocation("home", match, threePrefs(), wednesdayNoon());
    CHECK_EQ(report.cancelled, 3);
    CHECK_EQ(report.submitted, 0);
    CHECK(delivery.pending.empty());
    CHECK(sched.persisted().empty());
}

TEST_CASE("scheduleForLocation: past reminders counted as skipped") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    const auto report = sched.scheduleForLocation("home", mondayMatch(), threePrefs(), makeLocal(2026, 7, 6, 7));
    CHECK_EQ(report.skippedPast, 1);
    CHECK_EQ(report.submitted, 2);
}

TEST_CASE("scheduleForLocation: one failed submission is retried") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    delivery.failuresLeft = 1;
    ReminderScheduler sched(delivery, store, fastOptions());

    const auto report = sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    CHECK_EQ(report.submitted, 3);
    CHECK_EQ(report.failed, 0);
    CHECK_EQ(delivery.submitCalls, 4);
}

TEST_CASE("scheduleForLocation: a reminder failing twice stays persisted") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    delivery.failuresLeft = 2;
    ReminderScheduler sched(delivery, store, fastOptions());

    const vector<ReminderPreference> prefs = {presetPref("half", PresetTiming::ThirtyMinutes)};
    const auto report = sched.scheduleForLocation("home", mondayMatch(), prefs, wednesdayNoon());
    CHECK_EQ(report.submitted, 0);
    CHECK_EQ(report.failed, 1);
    CHECK_EQ(delivery.submitCalls, 2);
    CHECK(delivery.pending.empty());
    CHECK_EQ(sched.persisted().size(), 1);
}

// -----------------------------------------------------------------------------
// Tests for recover
// -----------------------------------------------------------------------------

TEST_CASE("recover: missing future reminders are submitted again") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());

    // the notifier lost everything, e.g. after a reinstall
    delivery.pending.clear();
    const auto report = sched.recover(wednesdayNoon() + 3600);
    CHECK_EQ(report.expired, 0);
    CHECK_EQ(report.alreadyPending, 0);
    CHECK_EQ(report.resubmitted, 3);
    CHECK_EQ(delivery.pending.size(), 3);
}

TEST_CASE("recover: passed reminders are dropped, pending ones left alone") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    const int submitsBefore = delivery.submitCalls;

    // Monday 07:45, after the evening-before and half-hour reminders fired
    const auto report = sched.recover(makeLocal(2026, 7, 6, 7, 45));
    CHECK_EQ(report.expired, 2);
    CHECK_EQ(report.alreadyPending, 1);
    CHECK_EQ(report.resubmitted, 0);
    CHECK_EQ(delivery.submitCalls, submitsBefore);
    REQUIRE_EQ(sched.persisted().size(), 1);
    CHECK_EQ(sched.persisted()[0].preferenceId, "after");
}

TEST_CASE("recover: a reminder whose submission failed is retried later") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    delivery.failuresLeft = 2;
    ReminderScheduler sched(delivery, store, fastOptions());
    const vector<ReminderPreference> prefs = {presetPref("half", PresetTiming::ThirtyMinutes)};
    sched.scheduleForLocation("home", mondayMatch(), prefs, wednesdayNoon());
    REQUIRE(delivery.pending.empty());

    const auto report = sched.recover(wednesdayNoon());
    CHECK_EQ(report.resubmitted, 1);
    CHECK_EQ(delivery.pending.size(), 1);
}

TEST_CASE("recover: nothing stored is nothing to do") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    const auto report = sched.recover(wednesdayNoon());
    CHECK_EQ(report.expired + report.alreadyPending + report.resubmitted + report.failed, 0);
}

TEST_CASE("recover: a corrupt stored set throws") {
    MemoryStore store;
    store.values[scheduler::SCHEDULED_KEY] = "[1, 2, 3]";
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    CHECK_THROWS_AS(sched.recover(wednesdayNoon()), store::StoreError);
}

// -----------------------------------------------------------------------------
// Tests for cancelForLocation / cancelForPreference
// -----------------------------------------------------------------------------

TEST_CASE("cancelForPreference: removes that preference everywhere") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    sched.scheduleForLocation("work", mondayMatch(), threePrefs(), wednesdayNoon());

    CHECK_EQ(sched.cancelForPreference("half"), 2);
    CHECK_EQ(delivery.pending.size(), 4);
    for (const auto& r : sched.persisted()) CHECK(r.preferenceId != "half");
    CHECK_EQ(sched.cancelForPreference("half"), 0);
}

TEST_CASE("cancelForLocation: removes only that location") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    sched.scheduleForLocation("work", mondayMatch(), threePrefs(), wednesdayNoon());

    CHECK_EQ(sched.cancelForLocation("home"), 3);
    CHECK_EQ(delivery.pending.size(), 3);
    for (const auto& r : sched.persisted()) CHECK_EQ(r.locationId, "work");
}

// -----------------------------------------------------------------------------
// Tests for submission outside the lock / non-UTF-8 rule text
// -----------------------------------------------------------------------------

// Reads the persisted set from inside submit, as a notifier callback might
struct ReentrantDeliveryClient : ScriptedDeliveryClient {
    ReminderScheduler* sched = nullptr;
    vector<size_t> persistedSeen;

    void submit(const delivery::DeliveryRequest& request) override {
        persistedSeen.push_back(sched->persisted().size());
        ScriptedDeliveryClient::submit(request);
    }
};

TEST_CASE("scheduleForLocation: submissions run after the set is saved and unlocked") {
    MemoryStore store;
    ReentrantDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    delivery.sched = &sched;

    const auto report = sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());
    CHECK_EQ(report.submitted, 3);
    REQUIRE_EQ(delivery.persistedSeen.size(), 3);
    for (size_t seen : delivery.persistedSeen) CHECK_EQ(seen, 3);
}

TEST_CASE("recover: resubmissions run after the set is saved and unlocked") {
    MemoryStore store;
    ReentrantDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());
    delivery.sched = &sched;
    sched.scheduleForLocation("home", mondayMatch(), threePrefs(), wednesdayNoon());

    delivery.pending.clear();
    delivery.persistedSeen.clear();
    const auto report = sched.recover(wednesdayNoon() + 3600);
    CHECK_EQ(report.resubmitted, 3);
    REQUIRE_EQ(delivery.persistedSeen.size(), 3);
    for (size_t seen : delivery.persistedSeen) CHECK_EQ(seen, 3);
}

TEST_CASE("scheduleForLocation: corridor names that are not UTF-8 still persist") {
    MemoryStore store;
    ScriptedDeliveryClient delivery;
    ReminderScheduler sched(delivery, store, fastOptions());

    auto match = mondayMatch();
    match.rule.corridorName = "Ca\xF1" "ada Rd";  // Latin-1 n-tilde
    ScheduleReport report;
    CHECK_NOTHROW(report = sched.scheduleForLocation("home", match, threePrefs(), wednesdayNoon()));
    CHECK_EQ(report.submitted, 3);
    CHECK_EQ(sched.persisted().size(), 3);
}
