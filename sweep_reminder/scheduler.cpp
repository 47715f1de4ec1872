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
#include "scheduler.hpp"
#include <algorithm>          // for sort
#include <chrono>             // for milliseconds
#include <iostream>           // for cerr
#include <nlohmann/json.hpp>  // for basic_json
#include <set>                // for set
#include <thread>             // for sleep_for
#include <utility>            // for move

using std::cerr;
using std::set;
using std::chrono::milliseconds;
using std::this_thread::sleep_for;
using json = nlohmann::json;

using delivery::DeliveryError;
using delivery::DeliveryRequest;
using recurrence::Occurrence;
using reminders::ReminderPreference;
using rules::ScheduleRule;

namespace scheduler {
    // Deterministic identity of a reminder, so recomputing never duplicates
    //
    // Returns:
    //    "<location>_<rule>_<occurrence ISO time>_<preference>"
    string reminderId(const string& locationId, const string& ruleId,
                      time_t occurrenceStart, const string& preferenceId) {
        return locationId + "_" + ruleId + "_" + recurrence::formatLocal(occurrenceStart) + "_" + preferenceId;
    }

    DeliveryRequest toRequest(const ScheduledReminder& reminder) {
        DeliveryRequest request;
        request.id = reminder.id;
        request.fireAt = reminder.fireAt;
        request.title = reminder.title;
        request.body = reminder.body;
        request.metadata = {
            {"type", "street_cleaning"},
            {"location_id", reminder.locationId},
            {"rule_id", reminder.ruleId},
            {"preference_id", reminder.preferenceId},
            {"cleaning_start", recurrence::formatLocal(reminder.occurrenceStart)},
            {"street", reminder.streetName},
        };
        return request;
    }

    static json reminderToJson(const ScheduledReminder& r) {
        return json{
            {"location_id", r.locationId},
            {"rule_id", r.ruleId},
            {"preference_id", r.preferenceId},
            {"occurrence_start", static_cast<long long>(r.occurrenceStart)},
            {"occurrence_end", static_cast<long long>(r.occurrenceEnd)},
            {"fire_at", static_cast<long long>(r.fireAt)},
            {"title", r.title},
            {"body", r.body},
            {"street", r.streetName},
        };
    }

    static ScheduledReminder reminderFromJson(const string& id, const json& j) {
        ScheduledReminder r;
        r.id = id;
        r.locationId = j.at("location_id").get<string>();
        r.ruleId = j.at("rule_id").get<string>();
        r.preferenceId = j.at("preference_id").get<string>();
        r.occurrenceStart = static_cast<time_t>(j.at("occurrence_start").get<long long>());
        r.occurrenceEnd = static_cast<time_t>(j.at("occurrence_end").get<long long>());
        r.fireAt = static_cast<time_t>(j.at("fire_at").get<long long>());
        r.title = j.value("title", "");
        r.body = j.value("body", "");
        r.streetName = j.value("street", "");
        return r;
    }

    ReminderScheduler::ReminderScheduler(delivery::IDeliveryClient& delivery, store::IKeyValueStore& store,
                                         const SchedulerOptions& options)
        : delivery_(delivery), store_(store), options_(options) {}

    // Reminder instants for one occurrence, one per active preference.
    // Instants not strictly after now are dropped.
    //
    // Args:
    //    locationId: the parked location
    //    rule: the resolved restriction
    //    occurrence: the cleaning window to remind about
    //    prefs: timing preferences; inactive ones are ignored
    //    now: reference instant
    // Returns:
    //    reminders sorted by fire time
    vector<ScheduledReminder> ReminderScheduler::compute(
        const string& locationId, const ScheduleRule& rule, const Occurrence& occurrence,
        const vector<ReminderPreference>& prefs, time_t now) const {
        vector<ScheduledReminder> out;
        for (const auto& pref : prefs) {
            if (!pref.active) continue;
            const time_t fireAt = reminders::computeFireInstant(
                pref.timing.custom, occurrence.start, options_.afterCleaningMinutes);
            if (fireAt <= now) continue;

            ScheduledReminder r;
            r.id = reminderId(locationId, rule.id, occurrence.start, pref.id);
            r.locationId = locationId;
            r.ruleId = rule.id;
            r.preferenceId = pref.id;
            r.occurrenceStart = occurrence.start;
            r.occurrenceEnd = occurrence.end;
            r.fireAt = fireAt;
            r.title = pref.title;
            r.body = pref.message ? *pref.message : reminders::defaultBody(pref.timing);
            r.streetName = rule.corridorName.empty() ? rule.fullName : rule.corridorName;
            out.push_back(std::move(r));
        }
        std::sort(out.begin(), out.end(), [](const ScheduledReminder& a, const ScheduledReminder& b) {
            return a.fireAt < b.fireAt || (a.fireAt == b.fireAt && a.id < b.id);
        });
        return out;
    }

    map<string, ScheduledReminder> ReminderScheduler::load() const {
        map<string, ScheduledReminder> out;
        const auto raw = store_.get(SCHEDULED_KEY);
        if (!raw) return out;
        const json j = json::parse(*raw, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            throw store::StoreError("Stored reminder set is not a JSON object");
        for (const auto& item : j.items()) {
            try {
                out[item.key()] = reminderFromJson(item.key(), item.value());
            } catch (const json::exception& e) {
                cerr << "[warn] Dropping unreadable stored reminder " << item.key() << ": " << e.what() << "\n";
            }
        }
        return out;
    }

    void ReminderScheduler::save(const map<string, ScheduledReminder>& reminders) {
        json j = json::object();
        for (const auto& kv : reminders) j[kv.first] = reminderToJson(kv.second);
        store_.set(SCHEDULED_KEY, j.dump(-1, ' ', false, json::error_handler_t::replace));
    }

    // One attempt, then one retry after the backoff
    bool ReminderScheduler::submitWithRetry(const ScheduledReminder& reminder) {
        const DeliveryRequest request = toRequest(reminder);
        try {
            delivery_.submit(request);
            return true;
        } catch (const DeliveryError& e) {
            cerr << "[warn] Submitting " << reminder.id << " failed (" << e.what() << "), retrying\n";
        }
        sleep_for(milliseconds(options_.retryBackoffMs));
        try {
            delivery_.submit(request);
            return true;
        } catch (const DeliveryError& e) {
            cerr << "[error] Submitting " << reminder.id << " failed again: " << e.what() << "\n";
        }
        return false;
    }

    // Replaces a location's reminders with ones for the resolved match.
    //
    // Existing reminders for the location are cancelled first. New ones are
    // persisted before they are submitted, so a failed submission stays in
    // the set for the next recovery pass. Submission and its retry backoff
    // run after the lock on the persisted set is released.
    //
    // Args:
    //    locationId: the parked location
    //    match: resolved restriction; without a next occurrence only the
    //        cancellation happens
    //    prefs: timing preferences
    //    now: reference instant
    // Returns:
    //    counts of what happened
    ScheduleReport ReminderScheduler::scheduleForLocation(
        const string& locationId, const resolver::ResolvedMatch& match,
        const vector<ReminderPreference>& prefs, time_t now) {
        ScheduleReport report;
        vector<ScheduledReminder> fresh;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto current = load();

            vector<string> stale;
            for (const auto& kv : current) {
                if (kv.second.locationId == locationId) stale.push_back(kv.first);
            }
            if (!stale.empty()) delivery_.cancel(stale);
            for (const auto& id : stale) current.erase(id);
            report.cancelled = stale.size();

            if (match.next) {
                fresh = compute(locationId, match.rule, *match.next, prefs, now);
                for (const auto& pref : prefs) {
                    if (pref.active) ++report.skippedPast;
                }
                report.skippedPast -= fresh.size();
            }
            for (const auto& r : fresh) current[r.id] = r;
            save(current);
        }

        for (const auto& r : fresh) {
            if (submitWithRetry(r)) {
                ++report.submitted;
            } else {
                ++report.failed;
            }
        }
        return report;
    }

    template <typename Pred>
    size_t ReminderScheduler::cancelWhere(Pred pred) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto current = load();
        vector<string> ids;
        for (const auto& kv : current) {
            if (pred(kv.second)) ids.push_back(kv.first);
        }
        if (ids.empty()) return 0;
        delivery_.cancel(ids);
        for (const auto& id : ids) current.erase(id);
        save(current);
        return ids.size();
    }

    size_t ReminderScheduler::cancelForLocation(const string& locationId) {
        return cancelWhere([&](const ScheduledReminder& r) { return r.locationId == locationId; });
    }

    size_t ReminderScheduler::cancelForPreference(const string& preferenceId) {
        return cancelWhere([&](const ScheduledReminder& r) { return r.preferenceId == preferenceId; });
    }

    // Reconciles the persisted set with the notifier after a restart.
    //
    // Reminders whose time has passed are dropped; the notifier is the
    // authority on whether they fired. Future reminders it no longer lists
    // are submitted again.
    //
    // Args:
    //    now: reference instant
    // Returns:
    //    counts of what happened
    RecoveryReport ReminderScheduler::recover(time_t now) {
        RecoveryReport report;
        vector<ScheduledReminder> missing;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto current = load();

            for (auto it = current.begin(); it != current.end();) {
                if (it->second.fireAt <= now) {
                    it = current.erase(it);
                    ++report.expired;
                } else {
                    ++it;
                }
            }

            const auto pendingList = delivery_.pendingIds();
            const set<string> pending(pendingList.begin(), pendingList.end());
            for (const auto& kv : current) {
                if (pending.count(kv.first)) {
                    ++report.alreadyPending;
                } else {
                    missing.push_back(kv.second);
                }
            }
            save(current);
        }

        for (const auto& r : missing) {
            if (submitWithRetry(r)) {
                ++report.resubmitted;
            } else {
                ++report.failed;
            }
        }
        return report;
    }

    vector<ScheduledReminder> ReminderScheduler::persisted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        vector<ScheduledReminder> out;
        for (const auto& kv : load()) out.push_back(kv.second);
        std::sort(out.begin(), out.end(), [](const ScheduledReminder& a, const ScheduledReminder& b) {
            return a.fireAt < b.fireAt || (a.fireAt == b.fireAt && a.id < b.id);
        });
        return out;
    }
}  // namespace scheduler
