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
#ifndef SWEEP_REMINDER_DATASET_HPP_
#define SWEEP_REMINDER_DATASET_HPP_

#include <string>  // for string
#include <vector>  // for vector
#include "rules.hpp"
#include "utils.hpp"

using std::string;
using std::vector;

namespace dataset {

// stop paging after this many pages
const int MAX_PAGES = 200;
const int POLITENESS_DELAY_MS = 250;

string pageUrl(const string& baseUrl, int limit, int offset);
vector<rules::ScheduleRule> fetchRules(
    utils::IHttpClient& client, const string& baseUrl, int pageSize, int delayMs = POLITENESS_DELAY_MS);

}  // namespace dataset

#endif  // SWEEP_REMINDER_DATASET_HPP_
