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
#include "rules.hpp"
#include <algorithm>             // for any_of, replace
#include <cmath>                 // for isfinite
#include <cstdlib>               // for strtod
#include <fstream>               // for ifstream, ofstream
#include <iostream>              // for cerr
#include <nlohmann/json.hpp>     // for basic_json
#include <sstream>               // for ostringstream
#include <stdexcept>             // for runtime_error
#include <string>                // for string, to_string
#include <unordered_map>         // for unordered_map
#include <utility>               // for move, pair
#include "utils.hpp"

using std::cerr;
using std::ifstream;
using std::isfinite;
using std::ofstream;
using std::ostringstream;
using std::pair;
using std::runtime_error;
using std::unordered_map;

using geo::Point;

namespace rules {
    // rows whose parse failure is logged individually before summarising
    const size_t MAX_LOGGED_DROPS = 5;

    // canonical field name -> accepted source column names
    static const vector<pair<string, vector<string>>> FIELD_ALIASES = {
        {"id", {"blocksweepid", "schedule_id", "clean_id", "id"}},
        {"cnn", {"cnn"}},
        {"corridor", {"corridor", "corridor_name", "streetname"}},
        {"limits", {"limits"}},
        {"blockside", {"blockside", "block_side"}},
        {"fullname", {"fullname", "full_name"}},
        {"weekday", {"weekday"}},
        {"fromhour", {"fromhour", "scheduled_from_hour"}},
        {"tohour", {"tohour", "scheduled_to_hour"}},
        {"week1", {"week1"}},
        {"week2", {"week2"}},
        {"week3", {"week3"}},
        {"week4", {"week4"}},
        {"week5", {"week5"}},
        {"holidays", {"holidays"}},
        {"line", {"line", "geometry"}},
        {"citation_count", {"citation_count"}},
        {"avg_citation_time", {"avg_citation_time"}},
        {"min_citation_time", {"min_citation_time"}},
        {"max_citation_time", {"max_citation_time"}},
    };

    typedef unordered_map<string, string> FieldMap;

    bool ScheduleRule::firesInWeek(int ordinal) const {
        if (ordinal < 1 || ordinal > WEEKS_PER_MONTH_MAX) return false;
        return weekOfMonthMask[ordinal - 1];
    }

    bool ScheduleRule::hasActiveWeek() const {
        return std::any_of(weekOfMonthMask.begin(), weekOfMonthMask.end(),
            [](bool active) { return active; });
    }

    // Parses a weekday name or abbreviation, case-insensitive
    //
    // Args:
    //    text: e.g. "Monday", "Mon", "tues", "Thur"
    // Returns:
    //    the weekday, or nullopt when the text is not recognised
    optional<Weekday> parseWeekday(const string& text) {
        static const unordered_map<string, Weekday> names = {
            {"sun", Weekday::Sunday}, {"sunday", Weekday::Sunday},
            {"mon", Weekday::Monday}, {"monday", Weekday::Monday},
            {"tue", Weekday::Tuesday}, {"tues", Weekday::Tuesday},
            {"tuesday", Weekday::Tuesday},
            {"wed", Weekday::Wednesday}, {"wednesday", Weekday::Wednesday},
            {"thu", Weekday::Thursday}, {"thur", Weekday::Thursday},
            {"thurs", Weekday::Thursday}, {"thursday", Weekday::Thursday},
            {"fri", Weekday::Friday}, {"friday", Weekday::Friday},
            {"sat", Weekday::Saturday}, {"saturday", Weekday::Saturday},
        };
        auto it = names.find(utils::toLower(utils::trim(text)));
        if (it == names.end()) return std::nullopt;
        return it->second;
    }

    string weekdayName(Weekday day) {
        switch (day) {
            case Weekday::Sunday: return "Sunday";
            case Weekday::Monday: return "Monday";
            case Weekday::Tuesday: return "Tuesday";
            case Weekday::Wednesday: return "Wednesday";
            case Weekday::Thursday: return "Thursday";
            case Weekday::Friday: return "Friday";
            case Weekday::Saturday: return "Saturday";
        }
        return "";
    }

    // Parses a finite number that fills the whole (trimmed) text
    optional<double> parseDouble(const string& text) {
        const string t = utils::trim(text);
        if (t.empty()) return std::nullopt;
        char* end = nullptr;
        const double value = std::strtod(t.c_str(), &end);
        if (end != t.c_str() + t.size() || !isfinite(value)) return std::nullopt;
        return value;
    }

    // Parses an integer field, accepting "8" and "8.0"
    //
    // Args:
    //    text: the raw field text
    //    fallback: returned when the text is not a number
    // Returns:
    //    the truncated integer value or fallback
    int parseIntOr(const string& text, int fallback) {
        const auto value = parseDouble(text);
        if (!value || *value < -2147483648.0 || *value > 2147483647.0) return fallback;
        return static_cast<int>(*value);
    }

    bool parseWeekFlag(const string& text) {
        const string t = utils::toLower(utils::trim(text));
        return t == "1" || t == "true" || t == "t" || t == "yes" || t == "y";
    }

    // Splits delimited text into records of fields.
    //
    // Quoted fields may contain the delimiter, line breaks and "" escapes.
    // Unquoted {...} groups are kept whole so a bare geometry object with
    // commas stays in one field.
    //
    // Args:
    //    text: the whole file contents
    //    delimiter: field separator
    // Returns:
    //    records in file order, blank lines skipped
    vector<vector<string>> parseCsvRecords(const string& text, char delimiter) {
        vector<vector<string>> records;
        vector<string> row;
        string field;
        bool inQuotes = false;
        int braceDepth = 0;

        auto endRow = [&]() {
            row.push_back(std::move(field));
            field.clear();
            const bool blank = row.size() == 1 && utils::trim(row[0]).empty();
            if (!blank) records.push_back(std::move(row));
            row.clear();
        };

        for (size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (inQuotes) {
                if (c == '"') {
                    if (i + 1 < text.size() && text[i + 1] == '"') {
                        field += '"';
                        ++i;
                    } else {
                        inQuotes = false;
                    }
                } else {
                    field += c;
                }
                continue;
            }
            if (c == '"') {
                inQuotes = true;
            } else if (c == '{') {
                ++braceDepth;
                field += c;
            } else if (c == '}') {
                if (braceDepth > 0) --braceDepth;
                field += c;
            } else if (c == delimiter && braceDepth == 0) {
                row.push_back(std::move(field));
                field.clear();
            } else if ((c == '\n' || c == '\r') && braceDepth == 0) {
                if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
                endRow();
            } else {
                field += c;
            }
        }
        if (!field.empty() || !row.empty()) endRow();
        return records;
    }

    // collapse repeated vertices and reject non-finite or too-short lines
    static optional<vector<Point>> normalizeVertices(const vector<Point>& raw) {
        vector<Point> points;
        points.reserve(raw.size());
        for (const auto& p : raw) {
            if (!isfinite(p.lon) || !isfinite(p.lat)) return std::nullopt;
            if (!points.empty() && points.back().lon == p.lon && points.back().lat == p.lat)
                continue;
            points.push_back(p);
        }
        if (points.size() < 2) return std::nullopt;
        return points;
    }

    static optional<vector<Point>> pointsFromJsonArray(const json& coords) {
        if (!coords.is_array()) return std::nullopt;
        vector<Point> raw;
        for (const auto& vertex : coords) {
            if (!vertex.is_array() || vertex.size() < 2 ||
                !vertex[0].is_number() || !vertex[1].is_number())
                return std::nullopt;
            raw.push_back(Point{vertex[0].get<double>(), vertex[1].get<double>()});
        }
        return normalizeVertices(raw);
    }

    // LINESTRING (lon lat, lon lat, ...)
    static optional<vector<Point>> parseWkt(const string& text) {
        const size_t open = text.find('(');
        const size_t close = text.rfind(')');
        if (open == string::npos || close == string::npos || close <= open)
            return std::nullopt;

        vector<Point> raw;
        std::istringstream body(text.substr(open + 1, close - open - 1));
        string pairText;
        while (std::getline(body, pairText, ',')) {
            std::istringstream coords(pairText);
            string lonText, latText, extra;
            if (!(coords >> lonText >> latText) || (coords >> extra)) return std::nullopt;
            const auto lon = parseDouble(lonText);
            const auto lat = parseDouble(latText);
            if (!lon || !lat) return std::nullopt;
            raw.push_back(Point{*lon, *lat});
        }
        return normalizeVertices(raw);
    }

    // Extracts the vertices of a serialized LineString.
    //
    // Accepts {'type': 'LineString', 'coordinates': [[lon, lat], ...]} with
    // single or double quotes, and WKT LINESTRING (lon lat, ...).
    //
    // Args:
    //    text: the raw geometry field
    // Returns:
    //    ordered vertices, or nullopt when the geometry is unusable
    optional<vector<Point>> parseLineGeometry(const string& text) {
        const string t = utils::trim(text);
        if (utils::startsWithIgnoreCase(t, "LINESTRING")) return parseWkt(t);

        const size_t key = t.find("coordinates");
        if (key == string::npos) return std::nullopt;
        const size_t open = t.find('[', key);
        if (open == string::npos) return std::nullopt;

        // bracket-match the coordinate list
        int depth = 0;
        size_t close = string::npos;
        for (size_t i = open; i < t.size(); ++i) {
            if (t[i] == '[') {
                ++depth;
            } else if (t[i] == ']') {
                if (--depth == 0) {
                    close = i;
                    break;
                }
            }
        }
        if (close == string::npos) return std::nullopt;

        string sub = t.substr(open, close - open + 1);
        std::replace(sub.begin(), sub.end(), '\'', '"');
        const json coords = json::parse(sub, nullptr, false);
        if (coords.is_discarded()) return std::nullopt;
        return pointsFromJsonArray(coords);
    }

    static string fieldOr(const FieldMap& fields, const string& key) {
        auto it = fields.find(key);
        return it == fields.end() ? string() : utils::trim(it->second);
    }

    // Builds a rule from canonical fields; geometry has been validated
    static ScheduleRule ruleFromFields(const FieldMap& fields, vector<Point> geometry, size_t rowNumber) {
        ScheduleRule rule;
        rule.cnn = fieldOr(fields, "cnn");
        rule.id = fieldOr(fields, "id");
        if (rule.id.empty()) {
            rule.id = (rule.cnn.empty() ? string("row") : rule.cnn) + "-" + std::to_string(rowNumber);
        }
        rule.corridorName = fieldOr(fields, "corridor");
        rule.limitsDescription = fieldOr(fields, "limits");
        rule.blockSide = fieldOr(fields, "blockside");
        rule.fullName = fieldOr(fields, "fullname");
        rule.weekday = parseWeekday(fieldOr(fields, "weekday"));

        rule.fromHour = parseIntOr(fieldOr(fields, "fromhour"), 0);
        if (rule.fromHour < 0 || rule.fromHour > 23) rule.fromHour = 0;
        rule.toHour = parseIntOr(fieldOr(fields, "tohour"), 0);
        if (rule.toHour < 0 || rule.toHour > 24) rule.toHour = 0;

        for (int week = 1; week <= WEEKS_PER_MONTH_MAX; ++week) {
            rule.weekOfMonthMask[week - 1] = parseWeekFlag(fieldOr(fields, "week" + std::to_string(week)));
        }
        rule.holidays = parseWeekFlag(fieldOr(fields, "holidays"));
        rule.geometry = std::move(geometry);

        const int count = parseIntOr(fieldOr(fields, "citation_count"), -1);
        if (count >= 0) {
            CitationStats stats;
            stats.count = count;
            stats.avg = parseDouble(fieldOr(fields, "avg_citation_time")).value_or(0.0);
            stats.min = parseDouble(fieldOr(fields, "min_citation_time")).value_or(0.0);
            stats.max = parseDouble(fieldOr(fields, "max_citation_time")).value_or(0.0);
            rule.citationStats = stats;
        }
        return rule;
    }

    // Parses a rule table: a header record followed by one rule per record.
    //
    // Rows whose geometry cannot be parsed are dropped and counted, the rest
    // of the load continues.
    //
    // Args:
    //    text: delimited file contents
    // Returns:
    //    the rules and row counts
    LoadResult parseRulesCsv(const string& text) {
        LoadResult result;
        result.sourceAvailable = true;

        const auto records = parseCsvRecords(text);
        if (records.empty()) return result;

        // map canonical field -> column index
        unordered_map<string, size_t> columns;
        const auto& header = records.front();
        for (const auto& alias : FIELD_ALIASES) {
            for (size_t col = 0; col < header.size() && !columns.count(alias.first); ++col) {
                const string name = utils::toLower(utils::trim(header[col]));
                for (const auto& candidate : alias.second) {
                    if (name == candidate) {
                        columns[alias.first] = col;
                        break;
                    }
                }
            }
        }
        if (!columns.count("line")) {
            cerr << "[warn] Rule table has no geometry column; nothing loaded\n";
            result.rowsRead = records.size() - 1;
            result.rowsDropped = result.rowsRead;
            return result;
        }

        for (size_t row = 1; row < records.size(); ++row) {
            const auto& record = records[row];
            ++result.rowsRead;

            FieldMap fields;
            for (const auto& kv : columns) {
                if (kv.second < record.size()) fields[kv.first] = record[kv.second];
            }

            auto geometry = parseLineGeometry(fieldOr(fields, "line"));
            if (!geometry) {
                ++result.rowsDropped;
                if (result.rowsDropped <= MAX_LOGGED_DROPS) {
                    cerr << "[warn] Row " << row << ": unparseable geometry, row skipped\n";
                }
                continue;
            }
            result.rules.push_back(ruleFromFields(fields, std::move(*geometry), row));
        }

        if (result.rowsDropped > MAX_LOGGED_DROPS) {
            cerr << "[warn] " << result.rowsDropped << " of " << result.rowsRead
                << " rows skipped for bad geometry\n";
        }
        return result;
    }

    // Loads the rule table from disk
    //
    // Args:
    //    path: the delimited rule file
    // Returns:
    //    parsed rules; sourceAvailable is false when the file can't be read
    LoadResult loadRulesCsv(const string& path) {
        ifstream in(path);
        if (!in) {
            cerr << "[error] Failed to open rule table: " << path << "\n";
            return LoadResult{};
        }
        ostringstream contents;
        contents << in.rdbuf();
        return parseRulesCsv(contents.str());
    }

    // Socrata values arrive as strings, numbers or booleans
    static string textOf(const json& value) {
        if (value.is_string()) return value.get<string>();
        if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
        if (value.is_number()) return value.dump();
        return "";
    }

    // Converts one row of the city open-data JSON feed into a rule
    //
    // Args:
    //    row: a JSON object; "line" is either a GeoJSON object or a string
    //    rowNumber: position in the feed, used for an id when the row has none
    // Returns:
    //    the rule, or nullopt when the row has no usable geometry
    optional<ScheduleRule> ruleFromJson(const json& row, size_t rowNumber) {
        if (!row.is_object()) return std::nullopt;

        FieldMap fields;
        for (const auto& alias : FIELD_ALIASES) {
            for (const auto& key : alias.second) {
                if (row.contains(key) && !row[key].is_null() && !row[key].is_object()) {
                    fields[alias.first] = textOf(row[key]);
                    break;
                }
            }
        }

        optional<vector<Point>> geometry;
        for (const char* key : {"line", "geometry"}) {
            if (!row.contains(key)) continue;
            const auto& line = row[key];
            if (line.is_object() && line.contains("coordinates")) {
                geometry = pointsFromJsonArray(line["coordinates"]);
            } else if (line.is_string()) {
                geometry = parseLineGeometry(line.get<string>());
            }
            break;
        }
        if (!geometry) return std::nullopt;

        return ruleFromFields(fields, std::move(*geometry), rowNumber);
    }

    string geometryToJson(const vector<Point>& points) {
        json coords = json::array();
        for (const auto& p : points) coords.push_back({p.lon, p.lat});
        json line = {{"type", "LineString"}, {"coordinates", coords}};
        return line.dump();
    }

    static string quoteCsv(const string& value) {
        string out = "\"";
        for (char c : value) {
            if (c == '"') out += '"';
            out += c;
        }
        out += '"';
        return out;
    }

    // Writes rules in the format parseRulesCsv reads
    //
    // Args:
    //    path: destination file, overwritten
    //    rules: the rules to write
    void writeRulesCsv(const string& path, const vector<ScheduleRule>& rules) {
        ofstream out(path);
        if (!out) throw runtime_error("Failed to open CSV for writing: " + path);
        out << "blocksweepid,cnn,corridor,limits,blockside,fullname,weekday,fromhour,tohour,"
            << "week1,week2,week3,week4,week5,holidays,line,"
            << "citation_count,avg_citation_time,min_citation_time,max_citation_time\n";
        for (const auto& rule : rules) {
            out << quoteCsv(rule.id) << ","
                << quoteCsv(rule.cnn) << ","
                << quoteCsv(rule.corridorName) << ","
                << quoteCsv(rule.limitsDescription) << ","
                << quoteCsv(rule.blockSide) << ","
                << quoteCsv(rule.fullName) << ","
                << (rule.weekday ? weekdayName(*rule.weekday) : string()) << ","
                << rule.fromHour << ","
                << rule.toHour << ",";
            for (bool active : rule.weekOfMonthMask) out << (active ? "1" : "0") << ",";
            out << (rule.holidays ? "1" : "0") << ","
                << quoteCsv(geometryToJson(rule.geometry)) << ",";
            if (rule.citationStats) {
                out << rule.citationStats->count << ","
                    << rule.citationStats->avg << ","
                    << rule.citationStats->min << ","
                    << rule.citationStats->max;
            } else {
                out << ",,,";
            }
            out << "\n";
        }
        if (!out) throw runtime_error("Failed writing CSV: " + path);
    }
}  // namespace rules
