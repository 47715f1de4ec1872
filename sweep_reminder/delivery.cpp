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
#include "delivery.hpp"
#include <nlohmann/json.hpp>  // for basic_json

using json = nlohmann::json;

namespace delivery {
    static json readOutbox(store::IKeyValueStore& store) {
        const auto raw = store.get(OUTBOX_KEY);
        if (!raw) return json::object();
        json j = json::parse(*raw, nullptr, false);
        if (j.is_discarded() || !j.is_object()) throw DeliveryError("Outbox is corrupt");
        return j;
    }

    static void writeOutbox(store::IKeyValueStore& store, const json& outbox) {
        try {
            store.set(OUTBOX_KEY, outbox.dump(-1, ' ', false, json::error_handler_t::replace));
        } catch (const store::StoreError& e) {
            throw DeliveryError(string("Outbox write failed: ") + e.what());
        }
    }

    OutboxDeliveryClient::OutboxDeliveryClient(store::IKeyValueStore& store) : store_(store) {}

    void OutboxDeliveryClient::submit(const DeliveryRequest& request) {
        json outbox = readOutbox(store_);
        json entry = {
            {"fire_at", static_cast<long long>(request.fireAt)},
            {"title", request.title},
            {"body", request.body},
            {"metadata", request.metadata},
        };
        outbox[request.id] = entry;
        writeOutbox(store_, outbox);
    }

    vector<string> OutboxDeliveryClient::pendingIds() {
        vector<string> ids;
        for (const auto& item : readOutbox(store_).items()) ids.push_back(item.key());
        return ids;
    }

    void OutboxDeliveryClient::cancel(const vector<string>& ids) {
        json outbox = readOutbox(store_);
        bool changed = false;
        for (const auto& id : ids) changed = outbox.erase(id) > 0 || changed;
        if (changed) writeOutbox(store_, outbox);
    }

    vector<DeliveryRequest> OutboxDeliveryClient::pending() {
        vector<DeliveryRequest> out;
        for (const auto& item : readOutbox(store_).items()) {
            const auto& entry = item.value();
            DeliveryRequest request;
            request.id = item.key();
            request.fireAt = static_cast<time_t>(entry.value("fire_at", 0LL));
            request.title = entry.value("title", "");
            request.body = entry.value("body", "");
            if (entry.contains("metadata") && entry["metadata"].is_object()) {
                request.metadata = entry["metadata"].get<map<string, string>>();
            }
            out.push_back(request);
        }
        return out;
    }
}  // namespace delivery
