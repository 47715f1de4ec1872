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
#ifndef SWEEP_REMINDER_TESTS_FAKE_HTTP_CLIENT_HPP_
#define SWEEP_REMINDER_TESTS_FAKE_HTTP_CLIENT_HPP_

#include <deque>   // for deque
#include <string>  // for string
#include <vector>  // for vector
#include "../sweep_reminder/utils.hpp"

using utils::HttpResponse;
using utils::IHttpClient;

// Returns queued responses in order, then `next` for every later call
struct FakeHttpClient : IHttpClient {
    HttpResponse next{200, "[]"};
    std::deque<HttpResponse> queued;
    std::vector<std::string> urls;

    HttpResponse get(const std::string& url) override {
        urls.push_back(url);
        if (queued.empty()) return next;
        HttpResponse resp = queued.front();
        queued.pop_front();
        return resp;
    }
};

#endif  // SWEEP_REMINDER_TESTS_FAKE_HTTP_CLIENT_HPP_
