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
#include "dataset.hpp"
#include <chrono>             // for milliseconds
#include <exception>          // for exception
#include <iostream>           // for cerr
#include <nlohmann/json.hpp>  // for basic_json
#include <sstream>            // for ostringstream
#include <thread>             // for sleep_for
#include <utility>            // for move

using std::cerr;
using std::exception;
using std::ostringstream;
using std::chrono::milliseconds;
using std::this_thread::sleep_for;
using json = nlohmann::json;

using rules::ScheduleRule;

namespace dataset {
// Builds one Socrata page request
//
// Args:
//    baseUrl: the dataset resource URL
//    limit: rows per page
//    offset: rows to skip
// Returns:
//    the page URL, ordered by row id so paging is stable
string pageUrl(const string& baseUrl, int limit, int offset) {
    ostringstream url;
    url << baseUrl
        << (baseUrl.find('?') == string::npos ? "?" : "&")
        << "$limit=" << limit
        << "&$offset=" << offset
        << "&$order=" << utils::urlEncode(":id");
    return url.str();
}

// Downloads the street sweeping rule table from the city open-data API
//
// Args:
//    client: HTTP client
//    baseUrl: the dataset resource URL
//    pageSize: rows per request
//    delayMs: pause between pages
// Returns:
//    every rule with usable geometry; on a failed page, what was fetched
//    before it
vector<ScheduleRule> fetchRules(utils::IHttpClient& client, const string& baseUrl, int pageSize, int delayMs) {
    vector<ScheduleRule> out;
    size_t skipped = 0;
    int offset = 0;

    for (int page = 1; ; ++page) {
        const string url = pageUrl(baseUrl, pageSize, offset);
        utils::HttpResponse resp;
        try {
            resp = client.get(url);
        } catch (const exception& e) {
            cerr << "[warn] Dataset request failed: " << e.what() << "; stopping with "
                << out.size() << " rules\n";
            break;
        }
        if (resp.status < 200 || resp.status >= 300) {
            cerr << "[warn] HTTP " << resp.status << " for " << url << "; stopping with "
                << out.size() << " rules\n";
            break;
        }

        const json rows = json::parse(resp.body, nullptr, false);
        if (rows.is_discarded() || !rows.is_array()) {
            cerr << "[warn] Dataset page " << page << " is not a JSON array; stopping\n";
            break;
        }
        if (rows.empty()) break;

        size_t rowNumber = static_cast<size_t>(offset);
        for (const auto& row : rows) {
            auto rule = rules::ruleFromJson(row, ++rowNumber);
            if (rule) {
                out.push_back(std::move(*rule));
            } else {
                ++skipped;
            }
        }

        // crude stop conditions
        if (static_cast<int>(rows.size()) < pageSize) break;
        if (page >= MAX_PAGES) {
            cerr << "[warn] Reached page " << MAX_PAGES << "; stopping\n";
            break;
        }
        offset += pageSize;
        if (delayMs > 0) sleep_for(milliseconds(delayMs));  // politeness delay
    }

    if (skipped > 0) cerr << "[warn] " << skipped << " dataset rows had no usable geometry\n";
    return out;
}
}  // namespace dataset
