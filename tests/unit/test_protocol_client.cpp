#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "runtime/protocol_client.hpp"

namespace {

using nlohmann::json;
using toolmux::core::errors::ErrorCategory;
using toolmux::core::errors::get_error;
using toolmux::core::errors::get_value;
using toolmux::core::errors::is_error;
using toolmux::runtime::ProtocolClient;
using toolmux::testing::FakeChannel;
using toolmux::testing::make_fake_transport;

constexpr std::chrono::milliseconds kLongWait{5000};

bool wait_until(const std::function<bool()>& predicate,
                std::chrono::milliseconds timeout = kLongWait) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

TEST(ProtocolClientTest, CallReturnsMatchingResponse) {
    auto channel = std::make_shared<FakeChannel>();
    channel->set_responder([](const json& message, FakeChannel& self) {
        self.push(toolmux::protocol::make_result_response(message["id"], {{"pong", true}}));
    });
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    auto response = client.call("tools/list", json::object(), kLongWait);
    ASSERT_FALSE(is_error(response));
    EXPECT_EQ((*get_value(response).result)["pong"], true);

    const auto sent = channel->written_messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0]["jsonrpc"], "2.0");
    EXPECT_EQ(sent[0]["method"], "tools/list");
    EXPECT_EQ(client.outstanding_calls(), 0u);
}

TEST(ProtocolClientTest, RequestIdsAreUniqueAndIncreasing) {
    auto channel = std::make_shared<FakeChannel>();
    channel->set_responder([](const json& message, FakeChannel& self) {
        self.push(toolmux::protocol::make_result_response(message["id"], json::object()));
    });
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(is_error(client.call("ping", json::object(), kLongWait)));
    }
    const auto sent = channel->written_messages();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_LT(sent[0]["id"].get<std::int64_t>(), sent[1]["id"].get<std::int64_t>());
    EXPECT_LT(sent[1]["id"].get<std::int64_t>(), sent[2]["id"].get<std::int64_t>());
}

TEST(ProtocolClientTest, OutOfOrderResponsesReachTheirCallers) {
    auto channel = std::make_shared<FakeChannel>();
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    auto first = std::async(std::launch::async, [&client] {
        return client.call("tools/call", {{"name", "first"}}, kLongWait);
    });
    ASSERT_TRUE(wait_until([&channel] { return channel->write_count() == 1; }));
    auto second = std::async(std::launch::async, [&client] {
        return client.call("tools/call", {{"name", "second"}}, kLongWait);
    });
    ASSERT_TRUE(wait_until([&channel] { return channel->write_count() == 2; }));

    const auto sent = channel->written_messages();
    channel->push(toolmux::protocol::make_result_response(sent[1]["id"], {{"who", "second"}}));
    channel->push(toolmux::protocol::make_result_response(sent[0]["id"], {{"who", "first"}}));

    auto first_result = first.get();
    auto second_result = second.get();
    ASSERT_FALSE(is_error(first_result));
    ASSERT_FALSE(is_error(second_result));
    EXPECT_EQ((*get_value(first_result).result)["who"], "first");
    EXPECT_EQ((*get_value(second_result).result)["who"], "second");
}

TEST(ProtocolClientTest, MalformedLinesAreSkipped) {
    auto channel = std::make_shared<FakeChannel>();
    channel->set_responder([](const json& message, FakeChannel& self) {
        self.push_line("");
        self.push_line("this is {not json");
        self.push_line(R"({"jsonrpc":"2.0","id":1})");
        self.push(toolmux::protocol::make_result_response(message["id"], {{"ok", true}}));
    });
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    auto response = client.call("tools/list", json::object(), kLongWait);
    ASSERT_FALSE(is_error(response));
    EXPECT_EQ((*get_value(response).result)["ok"], true);
    EXPECT_TRUE(client.is_open());
}

TEST(ProtocolClientTest, TimeoutLeavesNoPendingCallAndLateResponseIsDiscarded) {
    auto channel = std::make_shared<FakeChannel>();
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    auto response = client.call("tools/call", json::object(), std::chrono::milliseconds(50));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(response).code, "call_timeout");
    EXPECT_EQ(client.outstanding_calls(), 0u);

    const auto sent = channel->written_messages();
    ASSERT_EQ(sent.size(), 1u);
    channel->push(toolmux::protocol::make_result_response(sent[0]["id"], {{"late", true}}));
    EXPECT_TRUE(wait_until([&client] { return client.discarded_responses() == 1; }));
    EXPECT_TRUE(client.is_open());

    // The stale reply must not be handed to the next call.
    channel->set_responder([](const json& message, FakeChannel& self) {
        self.push(toolmux::protocol::make_result_response(message["id"], {{"fresh", true}}));
    });
    auto next = client.call("tools/call", json::object(), kLongWait);
    ASSERT_FALSE(is_error(next)) << get_error(next).message;
    const auto& result = *get_value(next).result;
    EXPECT_EQ(result["fresh"], true);
    EXPECT_FALSE(result.contains("late"));
    EXPECT_EQ(client.discarded_responses(), 1u);
}

TEST(ProtocolClientTest, StalledWriteHonoursCallTimeoutAndClose) {
    auto channel = std::make_shared<FakeChannel>();
    channel->stall_writes(true);
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    const auto started = std::chrono::steady_clock::now();
    auto response = client.call("tools/call", json::object(), std::chrono::milliseconds(100));
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).category, ErrorCategory::Timeout);
    EXPECT_EQ(get_error(response).code, "call_timeout");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
    EXPECT_EQ(client.outstanding_calls(), 0u);

    // A writer parked on the stalled channel is released by close().
    auto parked = std::async(std::launch::async, [&client] {
        return client.call("tools/call", json::object(), std::chrono::seconds(60));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    client.close();
    ASSERT_EQ(parked.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    auto released = parked.get();
    ASSERT_TRUE(is_error(released));
    EXPECT_EQ(get_error(released).category, ErrorCategory::ServerUnavailable);
}

TEST(ProtocolClientTest, ResponsesWithUnknownIdsAreDiscarded) {
    auto channel = std::make_shared<FakeChannel>();
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    channel->push(toolmux::protocol::make_result_response(999, json::object()));
    channel->push(toolmux::protocol::make_result_response("abc", json::object()));
    EXPECT_TRUE(wait_until([&client] { return client.discarded_responses() == 2; }));
}

TEST(ProtocolClientTest, EndOfStreamFailsPendingCallsAndReportsClosure) {
    auto channel = std::make_shared<FakeChannel>();
    std::atomic_bool closed_reported{false};
    ProtocolClient client("fake", make_fake_transport(channel),
                          [&closed_reported](const std::string& server, const std::string&) {
                              if (server == "fake") {
                                  closed_reported.store(true);
                              }
                          });
    client.start();

    auto pending = std::async(std::launch::async, [&client] {
        return client.call("tools/call", json::object(), kLongWait);
    });
    ASSERT_TRUE(wait_until([&channel] { return channel->write_count() == 1; }));
    channel->end_stream();

    auto response = pending.get();
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).category, ErrorCategory::ServerUnavailable);
    EXPECT_TRUE(wait_until([&closed_reported] { return closed_reported.load(); }));
    EXPECT_FALSE(client.is_open());

    auto after = client.call("tools/call", json::object(), kLongWait);
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).category, ErrorCategory::ServerUnavailable);
}

TEST(ProtocolClientTest, CloseFailsPendingCallsWithoutClosureCallback) {
    auto channel = std::make_shared<FakeChannel>();
    std::atomic_bool closed_reported{false};
    ProtocolClient client("fake", make_fake_transport(channel),
                          [&closed_reported](const std::string&, const std::string&) {
                              closed_reported.store(true);
                          });
    client.start();

    auto pending = std::async(std::launch::async, [&client] {
        return client.call("tools/call", json::object(), kLongWait);
    });
    ASSERT_TRUE(wait_until([&channel] { return channel->write_count() == 1; }));
    client.close();
    client.close();

    auto response = pending.get();
    ASSERT_TRUE(is_error(response));
    EXPECT_EQ(get_error(response).code, "server_unavailable");
    EXPECT_FALSE(closed_reported.load());
}

TEST(ProtocolClientTest, AnswersServerPingAndRejectsOtherRequests) {
    auto channel = std::make_shared<FakeChannel>();
    ProtocolClient client("fake", make_fake_transport(channel));
    client.start();

    channel->push(json{{"jsonrpc", "2.0"}, {"id", "srv-1"}, {"method", "ping"}});
    channel->push(json{{"jsonrpc", "2.0"}, {"id", "srv-2"}, {"method", "sampling/createMessage"}});
    channel->push(json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
    ASSERT_TRUE(wait_until([&channel] { return channel->write_count() == 2; }));

    const auto sent = channel->written_messages();
    EXPECT_EQ(sent[0]["id"], "srv-1");
    EXPECT_TRUE(sent[0]["result"].is_object());
    EXPECT_EQ(sent[1]["id"], "srv-2");
    EXPECT_EQ(sent[1]["error"]["code"], toolmux::protocol::kMethodNotFound);
}

}  // namespace
