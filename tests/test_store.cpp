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
#include <doctest/doctest.h>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <optional>
#include <string>
#include "../sweep_reminder/delivery.hpp"
#include "../sweep_reminder/store.hpp"
#include "fakes.hpp"

using std::string;

using delivery::DeliveryRequest;
using delivery::OutboxDeliveryClient;
using store::FileKeyValueStore;

// -----------------------------------------------------------------------------
// Tests for FileKeyValueStore
// -----------------------------------------------------------------------------

TEST_CASE("FileKeyValueStore: missing file reads as empty") {
    FileKeyValueStore kv("/nonexistent/dir/state.json");
    CHECK_FALSE(kv.get("anything").has_value());
}

TEST_CASE("FileKeyValueStore: values survive a new instance") {
    const string path = "sweep_store_test.json";
    std::remove(path.c_str());
    {
        FileKeyValueStore kv(path);
        kv.set("a", "1");
        kv.set("b", "{\"x\": 2}");
        kv.set("a", "3");
    }
    FileKeyValueStore kv(path);
    CHECK(kv.get("a") == std::optional<string>("3"));
    CHECK(kv.get("b") == std::optional<string>("{\"x\": 2}"));
    CHECK_FALSE(kv.get("c").has_value());
    std::remove(path.c_str());
}

TEST_CASE("FileKeyValueStore: values that are not UTF-8 are written") {
    const string path = "sweep_store_latin1_test.json";
    std::remove(path.c_str());
    FileKeyValueStore kv(path);
    CHECK_NOTHROW(kv.set("street", "Ca\xF1" "ada Rd"));
    REQUIRE(kv.get("street").has_value());
    std::remove(path.c_str());
}

TEST_CASE("FileKeyValueStore: corrupt file throws") {
    const string path = "sweep_store_corrupt.json";
    {
        std::ofstream out(path);
        out << "[1, 2";
    }
    FileKeyValueStore kv(path);
    CHECK_THROWS_AS(kv.get("a"), store::StoreError);
    CHECK_THROWS_AS(kv.set("a", "1"), store::StoreError);
    std::remove(path.c_str());
}

TEST_CASE("FileKeyValueStore: unwritable location throws") {
    FileKeyValueStore kv("/nonexistent/dir/state.json");
    CHECK_THROWS_AS(kv.set("a", "1"), store::StoreError);
}

// -----------------------------------------------------------------------------
// Tests for OutboxDeliveryClient
// -----------------------------------------------------------------------------

static DeliveryRequest request(const string& id, time_t fireAt) {
    DeliveryRequest r;
    r.id = id;
    r.fireAt = fireAt;
    r.title = "Street Cleaning";
    r.body = "Move your car now - street cleaning starts soon!";
    r.metadata = {{"type", "street_cleaning"}, {"rule_id", "r1"}};
    return r;
}

TEST_CASE("OutboxDeliveryClient: submit, list and cancel") {
    MemoryStore memory;
    OutboxDeliveryClient outbox(memory);

    outbox.submit(request("one", 100));
    outbox.submit(request("two", 200));
    outbox.submit(request("one", 150));

    const auto ids = outbox.pendingIds();
    REQUIRE_EQ(ids.size(), 2);
    CHECK_EQ(ids[0], "one");
    CHECK_EQ(ids[1], "two");

    const auto pending = outbox.pending();
    REQUIRE_EQ(pending.size(), 2);
    CHECK_EQ(pending[0].fireAt, 150);
    CHECK_EQ(pending[0].metadata.at("rule_id"), "r1");

    const int writes = memory.writes;
    outbox.cancel({"one", "missing"});
    CHECK_EQ(outbox.pendingIds().size(), 1);
    outbox.cancel({"missing"});
    CHECK_EQ(memory.writes, writes + 1);
}

TEST_CASE("OutboxDeliveryClient: titles that are not UTF-8 are queued") {
    MemoryStore memory;
    OutboxDeliveryClient outbox(memory);
    DeliveryRequest r = request("one", 100);
    r.body = "Street cleaning on Ca\xF1" "ada Rd";
    CHECK_NOTHROW(outbox.submit(r));
    CHECK_EQ(outbox.pendingIds().size(), 1);
}

TEST_CASE("OutboxDeliveryClient: corrupt outbox is a delivery error") {
    MemoryStore memory;
    memory.values[delivery::OUTBOX_KEY] = "not json";
    OutboxDeliveryClient outbox(memory);
    CHECK_THROWS_AS(outbox.submit(request("one", 100)), delivery::DeliveryError);
    CHECK_THROWS_AS(outbox.pendingIds(), delivery::DeliveryError);
}

TEST_CASE("OutboxDeliveryClient: store write failure is a delivery error") {
    FileKeyValueStore kv("/nonexistent/dir/state.json");
    OutboxDeliveryClient outbox(kv);
    CHECK_THROWS_AS(outbox.submit(request("one", 100)), delivery::DeliveryError);
}
