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
#ifndef SWEEP_REMINDER_DELIVERY_HPP_
#define SWEEP_REMINDER_DELIVERY_HPP_

#include <ctime>      // for time_t
#include <map>        // for map
#include <stdexcept>  // for runtime_error
#include <string>     // for string
#include <vector>     // for vector
#include "store.hpp"

using std::map;
using std::runtime_error;
using std::string;
using std::vector;

namespace delivery {

const char OUTBOX_KEY[] = "outbox";

// a transient failure handing a reminder to the notifier
class DeliveryError : public runtime_error {
 public:
    using runtime_error::runtime_error;
};

struct DeliveryRequest {
    string id;
    time_t fireAt{};
    string title;
    string body;
    map<string, string> metadata;
};

// External notifier: accepts requests, lists pending ids, cancels by id.
// The notifier decides when something has fired.
struct IDeliveryClient {
    virtual ~IDeliveryClient() = default;
    // throws DeliveryError
    virtual void submit(const DeliveryRequest& request) = 0;
    virtual vector<string> pendingIds() = 0;
    virtual void cancel(const vector<string>& ids) = 0;
};

// Queues requests in a key-value store for a separate notifier process
class OutboxDeliveryClient : public IDeliveryClient {
 public:
    explicit OutboxDeliveryClient(store::IKeyValueStore& store);

    void submit(const DeliveryRequest& request) override;
    vector<string> pendingIds() override;
    void cancel(const vector<string>& ids) override;

    vector<DeliveryRequest> pending();

 private:
    store::IKeyValueStore& store_;
};

}  // namespace delivery

#endif  // SWEEP_REMINDER_DELIVERY_HPP_
