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
#ifndef SWEEP_REMINDER_UTILS_HPP_
#define SWEEP_REMINDER_UTILS_HPP_

#include <curl/curl.h>
#include <algorithm>  // for transform
#include <cctype>     // for isspace, tolower
#include <cstdint>    // for uint16_t
#include <memory>     // for unique_ptr
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <utility>    // for move

using std::runtime_error;
using std::string;
using std::unique_ptr;

namespace utils {

const char USER_AGENT[] = "sweep-reminder/1.0 (+street cleaning reminders)";
const long HTTP_CONNECT_TIMEOUT_S = 15L;
const long HTTP_TOTAL_TIMEOUT_S = 60L;

struct HttpResponse {
    uint16_t status = 0;
    string body;
};

// Seam between the dataset pager and the network; tests substitute a fake
struct IHttpClient {
    virtual ~IHttpClient() = default;
    // throws runtime_error when no response was received at all
    virtual HttpResponse get(const string& url) = 0;
};

// libcurl GET client asking for JSON. One instance per process is enough;
// it owns curl's global state for its lifetime.
class CurlHttpClient : public IHttpClient {
 public:
    CurlHttpClient() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw runtime_error("curl_global_init failed");
    }
    ~CurlHttpClient() override { curl_global_cleanup(); }

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    // Fetches one page
    //
    // Args:
    //    url: fully built request URL
    // Returns:
    //    status and body; a non-2xx status is returned, not thrown
    // Throws:
    //    runtime_error on DNS, connect, TLS or timeout failure
    HttpResponse get(const string& url) override {
        EasyHandle curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) throw runtime_error("curl_easy_init failed");
        HeaderList headers(curl_slist_append(nullptr, "Accept: application/json"), curl_slist_free_all);

        string body;
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, USER_AGENT);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, HTTP_CONNECT_TIMEOUT_S);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, HTTP_TOTAL_TIMEOUT_S);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

        const CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) throw runtime_error(string("GET ") + url + " failed: " + curl_easy_strerror(rc));

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        HttpResponse resp;
        resp.status = static_cast<uint16_t>(status);
        resp.body = std::move(body);
        return resp;
    }

 private:
    typedef unique_ptr<CURL, void (*)(CURL*)> EasyHandle;
    typedef unique_ptr<curl_slist, void (*)(curl_slist*)> HeaderList;

    static size_t appendBody(char* data, size_t size, size_t count, void* target) {
        static_cast<string*>(target)->append(data, size * count);
        return size * count;
    }
};

// Percent-encodes a query component; unencodable input is returned as is
inline string urlEncode(const string& value) {
    unique_ptr<char, void (*)(void*)> escaped(
        curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())), curl_free);
    return escaped ? string(escaped.get()) : value;
}

inline string trim(const string& s) {
    const auto first = std::find_if_not(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c) != 0; });
    const auto last = std::find_if_not(s.rbegin(), s.rend(),
        [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return first < last ? string(first, last) : string();
}

inline string toLower(string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool startsWithIgnoreCase(const string& s, const string& prefix) {
    return s.size() >= prefix.size() && toLower(s.substr(0, prefix.size())) == toLower(prefix);
}

}  // namespace utils

#endif  // SWEEP_REMINDER_UTILS_HPP_
