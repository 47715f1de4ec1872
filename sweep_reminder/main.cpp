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
#include "main.hpp"
#include <ctime>      // for time
#include <exception>  // for exception
#include <iomanip>    // for setprecision
#include <iostream>   // for cerr, cout
#include <optional>   // for optional
#include <sstream>    // for ostringstream
#include <string>     // for string
#include <vector>     // for vector
#include "catalog.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "delivery.hpp"
#include "recurrence.hpp"
#include "reminders.hpp"
#include "resolver.hpp"
#include "rules.hpp"
#include "scheduler.hpp"
#include "store.hpp"
#include "utils.hpp"

using std::cerr;
using std::cout;
using std::exception;
using std::fixed;
using std::optional;
using std::ostringstream;
using std::setprecision;
using std::string;
using std::vector;

using config::EngineConfig;
using reminders::AddPreferenceResult;
using reminders::PreferenceSet;
using reminders::ReminderPreference;
using resolver::ResolvedMatch;

// input args for main entry point
struct Args {
    string command;
    string action;
    optional<string> configPath;
    string rulesPath = DEFAULT_RULES_PATH;
    string statePath = DEFAULT_STATE_PATH;
    string locationId = DEFAULT_LOCATION_ID;
    optional<string> outPath;
    optional<string> url;
    optional<double> lat, lon;
    bool nearby = false;
    optional<double> radius;
    // prefs add / remove / enable / disable
    optional<string> preset;
    optional<int> amount;
    string unit = "minutes";
    string anchor = "before";
    optional<string> timeOfDay;
    optional<string> title;
    optional<string> message;
    optional<string> id;
    bool force = false;
};

static optional<double> parseNumber(const char* text) {
    return rules::parseDouble(text);
}

// Parses arguments from main entry point
//
// Args:
//    argc: number of arguments given
//    argv: provided arguments
//    out: pointer to the Args structure to set state on
// Returns:
//    false on --help or when the command line is unusable
bool parseArgs(int argc, char** argv, Args* out) {
    if (argc < 2) return false;
    (*out).command = argv[1];
    int i = 2;
    if ((*out).command == "prefs") {
        if (argc < 3) return false;
        (*out).action = argv[2];
        i = 3;
    }

    for (; i < argc; ++i) {
        string a(argv[i]);
        const bool hasValue = i + 1 < argc;
        if (a == "--help" || a == "-h") {
            return false;
        } else if (a == "--nearby") {
            (*out).nearby = true;
        } else if (a == "--force") {
            (*out).force = true;
        } else if (!hasValue) {
            cerr << "[error] Missing value for " << a << "\n";
            return false;
        } else if (a == "--config") {
            (*out).configPath = argv[++i];
        } else if (a == "--rules") {
            (*out).rulesPath = argv[++i];
        } else if (a == "--state") {
            (*out).statePath = argv[++i];
        } else if (a == "--location") {
            (*out).locationId = argv[++i];
        } else if (a == "--out") {
            (*out).outPath = argv[++i];
        } else if (a == "--url") {
            (*out).url = argv[++i];
        } else if (a == "--amount") {
            const int amount = rules::parseIntOr(argv[++i], -1);
            if (amount < 0) {
                cerr << "[error] --amount needs a non-negative whole number\n";
                return false;
            }
            (*out).amount = amount;
        } else if (a == "--lat" || a == "--lon" || a == "--radius") {
            const auto value = parseNumber(argv[++i]);
            if (!value) {
                cerr << "[error] " << a << " needs a number\n";
                return false;
            }
            if (a == "--lat") (*out).lat = *value;
            if (a == "--lon") (*out).lon = *value;
            if (a == "--radius") (*out).radius = *value;
        } else if (a == "--preset") {
            (*out).preset = argv[++i];
        } else if (a == "--unit") {
            (*out).unit = argv[++i];
        } else if (a == "--anchor") {
            (*out).anchor = argv[++i];
        } else if (a == "--at") {
            (*out).timeOfDay = argv[++i];
        } else if (a == "--title") {
            (*out).title = argv[++i];
        } else if (a == "--message") {
            (*out).message = argv[++i];
        } else if (a == "--id") {
            (*out).id = argv[++i];
        } else {
            cerr << "[error] Unknown option " << a << "\n";
            return false;
        }
    }

    const string& cmd = (*out).command;
    if (cmd == "fetch") return (*out).outPath.has_value();
    if (cmd == "resolve" || cmd == "remind") return (*out).lat && (*out).lon;
    if (cmd == "recover") return true;
    if (cmd == "prefs") {
        const string& action = (*out).action;
        if (action == "list") return true;
        if (action == "add") return (*out).preset || (*out).amount;
        if (action == "remove" || action == "enable" || action == "disable") return (*out).id.has_value();
    }
    return false;
}

// CLI usage message output as console error message
//
// Args:
//     exe: executable's name
void usage(const char* exe) {
    cerr << "Usage:\n"
        << "  " << exe << " fetch --out rules.csv [--url DATASET_URL]\n"
        << "  " << exe << " resolve --rules rules.csv --lat LAT --lon LON [--nearby [--radius M]]\n"
        << "  " << exe << " remind --rules rules.csv --lat LAT --lon LON [--location ID] [--state state.json]\n"
        << "  " << exe << " recover [--state state.json]\n"
        << "  " << exe << " prefs list [--state state.json]\n"
        << "  " << exe << " prefs add (--preset NAME | --amount N --unit minutes|hours|days|weeks\n"
        << "        --anchor before|after [--at HH:MM]) [--title T] [--message M] [--force]\n"
        << "  " << exe << " prefs remove|enable|disable --id ID\n"
        << "Common options: --config engine.json, --help\n";
}

static string describeSchedule(const rules::ScheduleRule& rule) {
    ostringstream out;
    out << (rule.weekday ? rules::weekdayName(*rule.weekday) : string("Unknown day"))
        << " " << rule.fromHour << ":00-" << rule.toHour << ":00, weeks";
    for (int week = 1; week <= rules::WEEKS_PER_MONTH_MAX; ++week) {
        if (rule.firesInWeek(week)) out << " " << week;
    }
    return out.str();
}

static void printMatch(const ResolvedMatch& match) {
    cout << match.rule.corridorName << " (" << match.rule.limitsDescription << ")\n"
        << "  side: " << resolver::sideName(match.side) << " [" << match.rule.blockSide << "]\n"
        << "  distance: " << fixed << setprecision(1) << match.distanceMeters << " m\n"
        << "  schedule: " << describeSchedule(match.rule) << "\n"
        << "  next cleaning: "
        << (match.next ? recurrence::formatLocal(match.next->start) : string("none in lookahead"))
        << "\n";
}

static void printPreference(const ReminderPreference& pref) {
    cout << pref.id << "  " << (pref.active ? "on " : "off") << "  "
        << pref.title << " (" << reminders::displayText(pref.timing) << ")\n";
}

static int runFetch(const Args& args, const EngineConfig& cfg) {
    utils::CurlHttpClient client;
    const string url = args.url ? *args.url : cfg.datasetUrl;
    cerr << "[info] Fetching street sweeping rules from " << url << " ...\n";
    const auto fetched = dataset::fetchRules(client, url, cfg.pageSize);
    if (fetched.empty()) {
        cerr << "[error] No rules fetched\n";
        return 2;
    }
    rules::writeRulesCsv(*args.outPath, fetched);
    cerr << "[info] Wrote " << fetched.size() << " rules to " << *args.outPath << "\n";
    return 0;
}

static int runResolve(const Args& args, const EngineConfig& cfg) {
    auto pending = catalog::ScheduleCatalog::loadCsvAsync(args.rulesPath, cfg);
    const auto cat = pending.get();
    const resolver::SegmentResolver engine(cat, cfg);
    const geo::Point point{*args.lon, *args.lat};
    const time_t now = std::time(nullptr);

    if (args.nearby) {
        const double radius = args.radius ? *args.radius : cfg.nearbyRadiusMeters;
        const auto matches = engine.nearby(point, radius, now);
        if (matches.empty()) cout << "No street cleaning schedules within " << radius << " m.\n";
        for (const auto& match : matches) printMatch(match);
        return 0;
    }

    const auto match = engine.resolve(point, now);
    if (!match) {
        cout << "No street cleaning restriction here.\n";
        return 0;
    }
    printMatch(*match);
    return 0;
}

static int runRemind(const Args& args, const EngineConfig& cfg) {
    auto pending = catalog::ScheduleCatalog::loadCsvAsync(args.rulesPath, cfg);
    store::FileKeyValueStore kv(args.statePath);
    delivery::OutboxDeliveryClient outbox(kv);
    scheduler::ReminderScheduler sched(outbox, kv, {cfg.afterCleaningMinutes, cfg.retryBackoffMs});
    const time_t now = std::time(nullptr);
    const PreferenceSet prefs = reminders::loadPreferences(kv, cfg.maxPreferences, now);

    const resolver::SegmentResolver engine(pending.get(), cfg);
    const auto match = engine.resolve(geo::Point{*args.lon, *args.lat}, now);
    if (!match) {
        const size_t cleared = sched.cancelForLocation(args.locationId);
        cout << "No street cleaning restriction here; cleared " << cleared << " reminders.\n";
        return 0;
    }
    printMatch(*match);

    const auto report = sched.scheduleForLocation(args.locationId, *match, prefs.active(), now);
    cerr << "[info] cancelled " << report.cancelled << ", submitted " << report.submitted
        << ", failed " << report.failed << ", already past " << report.skippedPast << "\n";
    for (const auto& r : sched.persisted()) {
        if (r.locationId != args.locationId) continue;
        cout << "  " << recurrence::formatLocal(r.fireAt) << "  " << r.title << ": " << r.body << "\n";
    }
    return report.failed > 0 ? 2 : 0;
}

static int runRecover(const Args& args, const EngineConfig& cfg) {
    store::FileKeyValueStore kv(args.statePath);
    delivery::OutboxDeliveryClient outbox(kv);
    scheduler::ReminderScheduler sched(outbox, kv, {cfg.afterCleaningMinutes, cfg.retryBackoffMs});
    const auto report = sched.recover(std::time(nullptr));
    cout << "expired " << report.expired << ", pending " << report.alreadyPending
        << ", resubmitted " << report.resubmitted << ", failed " << report.failed << "\n";
    return report.failed > 0 ? 2 : 0;
}

// "HH:MM" -> time of day
static optional<reminders::TimeOfDay> parseTimeOfDay(const string& text) {
    const size_t colon = text.find(':');
    if (colon == string::npos) return std::nullopt;
    const int hour = rules::parseIntOr(text.substr(0, colon), -1);
    const int minute = rules::parseIntOr(text.substr(colon + 1), -1);
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) return std::nullopt;
    return reminders::TimeOfDay{hour, minute};
}

static optional<ReminderPreference> preferenceFromArgs(const Args& args, time_t now) {
    ReminderPreference pref;
    pref.createdAt = now;
    if (args.preset) {
        const auto preset = reminders::parsePresetTiming(*args.preset);
        if (!preset) {
            cerr << "[error] Unknown preset " << *args.preset << "\n";
            return std::nullopt;
        }
        pref.timing = reminders::presetTiming(*preset);
    } else {
        const auto unit = reminders::parseTimeUnit(args.unit);
        const auto anchor = reminders::parseAnchor(args.anchor);
        if (!unit || !anchor) {
            cerr << "[error] Bad --unit or --anchor\n";
            return std::nullopt;
        }
        reminders::CustomTiming custom;
        custom.amount = *args.amount;
        custom.unit = *unit;
        custom.anchor = *anchor;
        if (args.timeOfDay) {
            custom.timeOfDay = parseTimeOfDay(*args.timeOfDay);
            if (!custom.timeOfDay) {
                cerr << "[error] --at expects HH:MM\n";
                return std::nullopt;
            }
        }
        pref.timing = reminders::customTiming(custom);
    }
    pref.title = args.title ? *args.title : reminders::displayText(pref.timing);
    pref.message = args.message;
    return pref;
}

static int runPrefs(const Args& args, const EngineConfig& cfg) {
    store::FileKeyValueStore kv(args.statePath);
    const time_t now = std::time(nullptr);
    PreferenceSet prefs = reminders::loadPreferences(kv, cfg.maxPreferences, now);

    if (args.action == "list") {
        for (const auto& pref : prefs.all()) printPreference(pref);
        return 0;
    }

    if (args.action == "add") {
        auto pref = preferenceFromArgs(args, now);
        if (!pref) return 1;
        switch (prefs.add(*pref, args.force)) {
            case AddPreferenceResult::Added:
                break;
            case AddPreferenceResult::Duplicate:
                cerr << "[error] A reminder with the same timing already exists (use --force to add anyway)\n";
                return 1;
            case AddPreferenceResult::LimitReached:
                cerr << "[error] At most " << prefs.maxPreferences() << " reminders are allowed\n";
                return 1;
            case AddPreferenceResult::Invalid:
                cerr << "[error] Invalid reminder timing\n";
                return 1;
        }
        reminders::savePreferences(kv, prefs);
        printPreference(prefs.all().back());
        return 0;
    }

    // remove / enable / disable
    const string& id = *args.id;
    const bool found = args.action == "remove" ? prefs.remove(id)
        : prefs.setActive(id, args.action == "enable");
    if (!found) {
        cerr << "[error] No reminder with id " << id << "\n";
        return 1;
    }
    reminders::savePreferences(kv, prefs);
    if (args.action != "enable") {
        delivery::OutboxDeliveryClient outbox(kv);
        scheduler::ReminderScheduler sched(outbox, kv, {cfg.afterCleaningMinutes, cfg.retryBackoffMs});
        const size_t cancelled = sched.cancelForPreference(id);
        cerr << "[info] Cancelled " << cancelled << " scheduled reminders\n";
    }
    return 0;
}

// Entry point
int main(int argc, char** argv) {
    Args args;
    if (!parseArgs(argc, argv, &args)) {
        usage(argv[0]);
        return 1;
    }

    try {
        const EngineConfig cfg = args.configPath ? config::loadConfigJson(*args.configPath) : EngineConfig{};
        if (args.command == "fetch") return runFetch(args, cfg);
        if (args.command == "resolve") return runResolve(args, cfg);
        if (args.command == "remind") return runRemind(args, cfg);
        if (args.command == "recover") return runRecover(args, cfg);
        return runPrefs(args, cfg);
    } catch (const exception& e) {
        cerr << "Fatal: " << e.what() << "\n";
        return 2;
    }
}
