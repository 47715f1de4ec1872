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
#ifndef SWEEP_REMINDER_STORE_HPP_
#define SWEEP_REMINDER_STORE_HPP_

#include <mutex>      // for mutex
#include <optional>   // for optional
#include <stdexcept>  // for runtime_error
#include <string>     // for string

using std::optional;
using std::runtime_error;
using std::string;

namespace store {

// persistence I/O failure
class StoreError : public runtime_error {
 public:
    using runtime_error::runtime_error;
};

// Byte-string key-value persistence
struct IKeyValueStore {
    virtual ~IKeyValueStore() = default;
    virtual optional<string> get(const string& key) = 0;
    virtual void set(const string& key, const string& value) = 0;
};

// Keeps every key in one JSON object file. Writes go through a temporary
// file and a rename so a crash never leaves a half-written file.
class FileKeyValueStore : public IKeyValueStore {
 public:
    explicit FileKeyValueStore(string path);

    optional<string> get(const string& key) override;
    void set(const string& key, const string& value) override;

    const string& path() const { return path_; }

 private:
    string path_;
    std::mutex mutex_;
};

}  // namespace store

#endif  // SWEEP_REMINDER_STORE_HPP_
