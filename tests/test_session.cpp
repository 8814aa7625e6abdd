//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session.cpp
// Purpose: End-to-end Session tests against the fixture server: handshake, correlation, timeouts,
//          notifications and shutdown
//==========================================================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <utility>
#include <optional>
#include <signal.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "mcphost/Session.h"

using namespace mcphost;
using namespace std::chrono_literals;
using test::FixtureDefinition;
using test::Run;
using test::RunUntil;

namespace {

std::string firstText(const JSONValue& toolResult) {
    const JSONValue* content = toolResult.find("content");
    if (content == nullptr || !content->isArray()) {
        return {};
    }
    const auto& arr = std::get<JSONValue::Array>(content->value);
    return arr.empty() ? std::string() : GetString(*arr.front(), "text");
}

SessionOptions fastOptions() {
    SessionOptions o;
    o.requestTimeout = 5000ms;
    o.killGrace = 1000ms;
    return o;
}

} // namespace

TEST(Session, HandshakeDiscoversToolsAndResources) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha", {"--tool=extra"}), fastOptions());
    std::vector<SessionEventType> events;
    s->SetEventHandler([&](const SessionEvent& ev) { events.push_back(ev.type); });

    test::Run(io, s->connect());
    EXPECT_TRUE(s->isConnected());
    EXPECT_EQ(s->serverInfo().name, "alpha");
    EXPECT_EQ(s->serverInfo().version, "0.1.0");
    EXPECT_TRUE(s->serverCapabilities().tools.has_value());
    EXPECT_TRUE(s->serverCapabilities().resources.has_value());
    EXPECT_EQ(s->tools().size(), 4u);
    EXPECT_TRUE(s->hasTool("extra"));
    ASSERT_EQ(s->resources().size(), 1u);
    EXPECT_EQ(s->resources()[0].uri, "fixture://alpha/readme");
    EXPECT_NE(std::find(events.begin(), events.end(), SessionEventType::Connected), events.end());

    SessionInfo info = s->info();
    EXPECT_TRUE(info.isConnected);
    JSONValue j = info.ToJSON();
    EXPECT_EQ(GetString(*j.find("info"), "name"), "alpha");
    EXPECT_TRUE(GetBool(j, "isConnected", false));

    test::Run(io, s->disconnect());
}

TEST(Session, CapabilitiesGateDiscovery) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("bare", {"--no-tools", "--no-resources"}),
                             fastOptions());
    test::Run(io, s->connect());
    EXPECT_TRUE(s->isConnected());
    EXPECT_FALSE(s->serverCapabilities().tools.has_value());
    EXPECT_TRUE(s->tools().empty());
    EXPECT_TRUE(s->resources().empty());
    test::Run(io, s->disconnect());
}

TEST(Session, CallToolEcho) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    JSONValue result = test::Run(io, s->callTool("echo", MakeObject({{"text", JSONValue("hi")}})));
    EXPECT_EQ(firstText(result), "hi");

    JSONValue sum = test::Run(io, s->callTool("sum", MakeObject({{"a", JSONValue(static_cast<int64_t>(2))},
                                                          {"b", JSONValue(static_cast<int64_t>(40))}})));
    EXPECT_EQ(firstText(sum), "42");
    EXPECT_EQ(s->pendingCount(), 0u);
    test::Run(io, s->disconnect());
}

TEST(Session, ReadResource) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    JSONValue result = test::Run(io, s->readResource("fixture://alpha/readme"));
    const auto& contents = std::get<JSONValue::Array>(result.find("contents")->value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(GetString(*contents[0], "text"), "contents of fixture://alpha/readme from alpha");
    test::Run(io, s->disconnect());
}

TEST(Session, RemoteErrorPropagatesMessage) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    try {
        test::Run(io, s->sendRequest("test/fail", MakeObject({{"message", JSONValue("kaboom")}})));
        FAIL() << "expected RemoteError";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::RemoteError);
        EXPECT_STREQ(e.what(), "kaboom");
        EXPECT_EQ(e.error().code, -32000);
    }
    EXPECT_TRUE(s->isConnected());
    test::Run(io, s->disconnect());
}

TEST(Session, OutOfOrderResponsesMatchById) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());

    std::optional<JSONValue> first, second;
    boost::asio::co_spawn(io, s->sendRequest("test/hold", MakeObject({{"tag", JSONValue("first")}})),
                          [&](std::exception_ptr, JSONValue v) { first = std::move(v); });
    boost::asio::co_spawn(io, s->sendRequest("test/hold", MakeObject({{"tag", JSONValue("second")}})),
                          [&](std::exception_ptr, JSONValue v) { second = std::move(v); });
    ASSERT_TRUE(RunUntil(io, [&] { return s->pendingCount() == 2; }, 5s));

    JSONValue released = test::Run(io, s->sendRequest("test/release"));
    EXPECT_EQ(GetInt(released, "released", 0), 2);
    ASSERT_TRUE(RunUntil(io, [&] { return first && second; }, 5s));
    EXPECT_EQ(GetString(*first, "tag"), "first");
    EXPECT_EQ(GetString(*second, "tag"), "second");
    EXPECT_EQ(s->pendingCount(), 0u);
    test::Run(io, s->disconnect());
}

TEST(Session, TimeoutRetiresOnlyThatRequestAndLateReplyIsDropped) {
    boost::asio::io_context io;
    SessionOptions opts = fastOptions();
    opts.requestTimeout = 300ms;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), opts);
    test::Run(io, s->connect());

    try {
        test::Run(io, s->sendRequest("test/hold", MakeObject({{"tag", JSONValue("late")}})));
        FAIL() << "expected RequestTimeout";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::RequestTimeout);
        EXPECT_STREQ(e.what(), "Request timeout: test/hold");
    }
    EXPECT_EQ(s->pendingCount(), 0u);

    // The held reply now arrives for an id nobody waits on
    JSONValue released = test::Run(io, s->sendRequest("test/release"));
    EXPECT_EQ(GetInt(released, "released", 0), 1);
    EXPECT_TRUE(s->isConnected());
    JSONValue echo = test::Run(io, s->callTool("echo", MakeObject({{"text", JSONValue("still here")}})));
    EXPECT_EQ(firstText(echo), "still here");
    test::Run(io, s->disconnect());
}

TEST(Session, DisconnectRejectsPendingAndIsIdempotent) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    const pid_t pid = *s->pid();

    std::optional<errors::ErrorCategory> failure;
    boost::asio::co_spawn(io, s->sendRequest("test/ignore"), [&](std::exception_ptr ep, JSONValue) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const errors::McpException& e) {
            failure = e.category();
        }
    });
    ASSERT_TRUE(RunUntil(io, [&] { return s->pendingCount() == 1; }, 5s));

    int disconnects = 0;
    s->SetEventHandler([&](const SessionEvent& ev) {
        if (ev.type == SessionEventType::Disconnected) ++disconnects;
    });
    test::Run(io, s->disconnect());
    test::Run(io, s->disconnect());
    ASSERT_TRUE(RunUntil(io, [&] { return failure.has_value(); }, 5s));
    EXPECT_EQ(*failure, errors::ErrorCategory::ConnectionClosed);
    EXPECT_EQ(disconnects, 1);
    EXPECT_EQ(s->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(s->tools().empty());
    EXPECT_EQ(::kill(pid, 0), -1);

    try {
        test::Run(io, s->callTool("echo", MakeObject()));
        FAIL() << "expected NotConnected";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::NotConnected);
    }
    EXPECT_THROW(test::Run(io, s->connect()), errors::McpException);
}

TEST(Session, SpawnErrorFailsUntilDisconnected) {
    boost::asio::io_context io;
    ServerDefinition def = FixtureDefinition("ghost");
    def.command = "/nonexistent/mcphost-missing-server";
    auto s = Session::Create(io.get_executor(), def, fastOptions());
    try {
        test::Run(io, s->connect());
        FAIL() << "expected SpawnError";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::SpawnError);
    }
    EXPECT_EQ(s->state(), ConnectionState::Failed);
    EXPECT_NO_THROW(test::Run(io, s->disconnect()));
    EXPECT_EQ(s->state(), ConnectionState::Disconnected);
    EXPECT_NO_THROW(test::Run(io, s->disconnect()));
    EXPECT_STREQ(connectionStateName(s->state()), "Disconnected");
    EXPECT_THROW(test::Run(io, s->connect()), errors::McpException);
}

TEST(Session, HandshakeErrorOnRejectedInitialize) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("grumpy", {"--bad-init"}), fastOptions());
    try {
        test::Run(io, s->connect());
        FAIL() << "expected HandshakeError";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::HandshakeError);
        EXPECT_STREQ(e.what(), "Handshake failed: Initialization rejected");
    }
    EXPECT_EQ(s->state(), ConnectionState::Failed);
}

TEST(Session, HandshakeErrorWhenServerExits) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("quitter", {"--exit-on-init"}), fastOptions());
    try {
        test::Run(io, s->connect());
        FAIL() << "expected HandshakeError";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::HandshakeError);
    }
    EXPECT_FALSE(s->isConnected());
}

TEST(Session, DisconnectDuringHandshakeEndsDisconnected) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("sleepy", {"--hang-init"}), fastOptions());
    std::optional<errors::ErrorCategory> failure;
    boost::asio::co_spawn(io, s->connect(), [&](std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const errors::McpException& e) {
            failure = e.category();
        }
    });
    ASSERT_TRUE(RunUntil(io, [&] { return s->pendingCount() == 1; }, 5s));
    test::Run(io, s->disconnect());
    ASSERT_TRUE(RunUntil(io, [&] { return failure.has_value(); }, 5s));
    EXPECT_EQ(*failure, errors::ErrorCategory::HandshakeError);
    EXPECT_EQ(s->state(), ConnectionState::Disconnected);
}

TEST(Session, UnexpectedExitEmitsDisconnected) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());

    bool disconnected = false;
    s->SetEventHandler([&](const SessionEvent& ev) {
        if (ev.type == SessionEventType::Disconnected) disconnected = true;
    });
    std::optional<errors::ErrorCategory> failure;
    boost::asio::co_spawn(io, s->sendRequest("test/exit", MakeObject({{"code", JSONValue(static_cast<int64_t>(5))}})),
                          [&](std::exception_ptr ep, JSONValue) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const errors::McpException& e) {
            failure = e.category();
        }
    });
    ASSERT_TRUE(RunUntil(io, [&] { return disconnected && failure.has_value(); }, 5s));
    EXPECT_EQ(*failure, errors::ErrorCategory::ConnectionClosed);
    EXPECT_EQ(s->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(s->tools().empty());

    try {
        test::Run(io, s->sendRequest("tools/list"));
        FAIL() << "expected ConnectionClosed";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ConnectionClosed);
        EXPECT_STREQ(e.what(), "MCP Server not running");
    }
}

TEST(Session, ToolListChangedRefreshesCache) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    int toolUpdates = 0;
    s->SetEventHandler([&](const SessionEvent& ev) {
        if (ev.type == SessionEventType::ToolsUpdated) ++toolUpdates;
    });
    test::Run(io, s->sendRequest("test/addTool", MakeObject({{"name", JSONValue("fresh")}})));
    ASSERT_TRUE(RunUntil(io, [&] { return s->hasTool("fresh"); }, 5s));
    EXPECT_EQ(toolUpdates, 1);
    EXPECT_EQ(s->tools().size(), 4u);

    test::Run(io, s->disconnect());
}

TEST(Session, ResourceListChangedRefreshesCache) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    int resourceUpdates = 0;
    int generic = 0;
    s->SetEventHandler([&](const SessionEvent& ev) {
        if (ev.type == SessionEventType::ResourcesUpdated) ++resourceUpdates;
        if (ev.type == SessionEventType::Notification) ++generic;
    });

    test::Run(io, s->sendRequest("test/addResource", MakeObject({{"uri", JSONValue("fixture://alpha/new")}})));
    ASSERT_TRUE(RunUntil(io, [&] { return resourceUpdates == 1; }, 5s));
    ASSERT_EQ(s->resources().size(), 2u);
    EXPECT_EQ(s->resources()[1].uri, "fixture://alpha/new");

    // A bare list_changed re-fetches even when nothing was added
    test::Run(io, s->sendRequest("test/notify", MakeObject({{"method", JSONValue("notifications/resources/list_changed")}})));
    ASSERT_TRUE(RunUntil(io, [&] { return resourceUpdates == 2; }, 5s));
    EXPECT_EQ(s->resources().size(), 2u);
    EXPECT_EQ(generic, 0);
    test::Run(io, s->disconnect());
}

TEST(Session, ResourceUpdatedAndGenericNotificationsAreForwarded) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    std::optional<SessionEvent> updated;
    std::vector<std::string> methods;
    s->SetEventHandler([&](const SessionEvent& ev) {
        if (ev.type == SessionEventType::ResourceUpdated) updated = ev;
        if (ev.type == SessionEventType::Notification) methods.push_back(ev.method);
    });
    test::Run(io, s->sendRequest("test/notify", MakeObject({
        {"method", JSONValue("notifications/resources/updated")},
        {"params", MakeObject({{"uri", JSONValue("fixture://alpha/readme")}})}
    })));
    test::Run(io, s->sendRequest("test/notify", MakeObject({{"method", JSONValue("notifications/message")}})));
    ASSERT_TRUE(RunUntil(io, [&] { return updated.has_value() && methods.size() == 1; }, 5s));
    EXPECT_EQ(updated->serverId, "id-alpha");
    EXPECT_EQ(GetString(updated->params, "uri"), "fixture://alpha/readme");
    // Handled methods are not repeated as generic notifications
    EXPECT_EQ(methods[0], "notifications/message");
    test::Run(io, s->disconnect());
}

TEST(Session, ServerInitiatedRequestGetsMethodNotFound) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha"), fastOptions());
    test::Run(io, s->connect());
    JSONValue result = test::Run(io, s->sendRequest("test/request", MakeObject({{"method", JSONValue("roots/list")}})));
    const JSONValue* reply = result.find("clientReply");
    ASSERT_NE(reply, nullptr);
    const JSONValue* err = reply->find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetInt(*err, "code", 0), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(GetString(*err, "message"), "Method not found: roots/list");
    test::Run(io, s->disconnect());
}

TEST(Session, GarbageOnStdoutIsIgnored) {
    boost::asio::io_context io;
    auto s = Session::Create(io.get_executor(), FixtureDefinition("alpha", {"--stderr=starting up"}), fastOptions());
    test::Run(io, s->connect());
    JSONValue after = test::Run(io, s->sendRequest("test/garbage"));
    EXPECT_TRUE(GetBool(after, "afterGarbage", false));
    EXPECT_TRUE(s->isConnected());
    EXPECT_EQ(s->pendingCount(), 0u);

    try {
        test::Run(io, s->sendRequest("no/such/method"));
        FAIL() << "expected RemoteError";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::RemoteError);
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::MethodNotFound);
    }
    test::Run(io, s->disconnect());
}
