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
#ifndef SWEEP_REMINDER_SCHEDULER_HPP_
#define SWEEP_REMINDER_SCHEDULER_HPP_

#include <stddef.h>  // for size_t
#include <ctime>     // for time_t
#include <map>       // for map
#include <mutex>     // for mutex
#include <string>    // for string
#include <vector>    // for vector
#include "delivery.hpp"
#include "recurrence.hpp"
#include "reminders.hpp"
#include "resolver.hpp"
#include "rules.hpp"
#include "store.hpp"

using std::map;
using std::string;
using std::vector;

namespace scheduler {

const char SCHEDULED_KEY[] = "scheduled_reminders";

// one reminder instant for one occurrence and one preference
struct ScheduledReminder {
    string id;
    string locationId;
    string ruleId;
    string preferenceId;
    time_t occurrenceStart{};
    time_t occurrenceEnd{};
    time_t fireAt{};
    string title;
    string body;
    string streetName;
};

struct ScheduleReport {
    size_t cancelled{};
    size_t submitted{};
    size_t failed{};
    size_t skippedPast{};
};

struct RecoveryReport {
    size_t expired{};
    size_t alreadyPending{};
    size_t resubmitted{};
    size_t failed{};
};

struct SchedulerOptions {
    int afterCleaningMinutes = 120;
    int retryBackoffMs = 1000;
};

string reminderId(const string& locationId, const string& ruleId,
                  time_t occurrenceStart, const string& preferenceId);
delivery::DeliveryRequest toRequest(const ScheduledReminder& reminder);

// Owns the persisted reminder set and keeps the notifier in step with it.
// Every mutation is a read-modify-write of the whole set under one lock;
// submissions to the notifier happen after the lock is released.
class ReminderScheduler {
 public:
    ReminderScheduler(delivery::IDeliveryClient& delivery, store::IKeyValueStore& store,
                      const SchedulerOptions& options);

    vector<ScheduledReminder> compute(
        const string& locationId, const rules::ScheduleRule& rule,
        const recurrence::Occurrence& occurrence,
        const vector<reminders::ReminderPreference>& prefs, time_t now) const;

    ScheduleReport scheduleForLocation(
        const string& locationId, const resolver::ResolvedMatch& match,
        const vector<reminders::ReminderPreference>& prefs, time_t now);
    size_t cancelForLocation(const string& locationId);
    size_t cancelForPreference(const string& preferenceId);
    RecoveryReport recover(time_t now);
    vector<ScheduledReminder> persisted() const;

 private:
    map<string, ScheduledReminder> load() const;
    void save(const map<string, ScheduledReminder>& reminders);
    bool submitWithRetry(const ScheduledReminder& reminder);
    template <typename Pred>
    size_t cancelWhere(Pred pred);

    delivery::IDeliveryClient& delivery_;
    store::IKeyValueStore& store_;
    SchedulerOptions options_;
    mutable std::mutex mutex_;
};

}  // namespace scheduler

#endif  // SWEEP_REMINDER_SCHEDULER_HPP_
