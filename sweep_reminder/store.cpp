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
#include "store.hpp"
#include <cstdio>             // for rename, remove
#include <fstream>            // for ifstream, ofstream
#include <nlohmann/json.hpp>  // for basic_json
#include <utility>            // for move

using std::ifstream;
using std::ofstream;
using json = nlohmann::json;

namespace store {
    // Reads the whole store; a missing file is an empty store
    static json readObject(const string& path) {
        ifstream in(path);
        if (!in) return json::object();
        json j = json::parse(in, nullptr, false);
        if (j.is_discarded() || !j.is_object()) throw StoreError("Store file is not a JSON object: " + path);
        return j;
    }

    FileKeyValueStore::FileKeyValueStore(string path) : path_(std::move(path)) {}

    optional<string> FileKeyValueStore::get(const string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        const json j = readObject(path_);
        if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
        return j[key].get<string>();
    }

    void FileKeyValueStore::set(const string& key, const string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        json j = readObject(path_);
        j[key] = value;

        const string tmp = path_ + ".tmp";
        {
            ofstream out(tmp, std::ios::trunc);
            if (!out) throw StoreError("Failed to open store for writing: " + tmp);
            out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
            if (!out) throw StoreError("Failed writing store: " + tmp);
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            std::remove(tmp.c_str());
            throw StoreError("Failed to replace store file: " + path_);
        }
    }
}  // namespace store
