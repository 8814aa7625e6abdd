//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_supervisor.cpp
// Purpose: Supervisor lifecycle, aggregation, qualified-name routing, cancellation and config testing
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <optional>
#include <utility>
#include <signal.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "mcphost/Supervisor.h"

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

SupervisorOptions fastOptions() {
    SupervisorOptions o;
    o.restartDelay = 50ms;
    o.testTimeout = 1000ms;
    o.session.requestTimeout = 5000ms;
    o.session.killGrace = 1000ms;
    return o;
}

class SupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ServerDefinition disabled = FixtureDefinition("Off");
        disabled.enabled = false;
        store = std::make_shared<InMemoryConfigStore>(std::vector<ServerDefinition>{
            FixtureDefinition("A", {"--tool=do__thing", "--tool=wait"}),
            FixtureDefinition("B"),
            FixtureDefinition("C"),
            disabled
        });
        sup = Supervisor::Create(io.get_executor(), store, fastOptions());
        sup->SetEventHandler([this](const SupervisorEvent& ev) { events.push_back(ev); });
    }

    void TearDown() override {
        test::Run(io, sup->stopAll());
    }

    std::size_t countEvents(SupervisorEventType t) const {
        std::size_t n = 0;
        for (const auto& e : events) n += (e.type == t) ? 1 : 0;
        return n;
    }

    boost::asio::io_context io;
    std::shared_ptr<InMemoryConfigStore> store;
    std::shared_ptr<Supervisor> sup;
    std::vector<SupervisorEvent> events;
};

} // namespace

TEST(QualifiedToolName, SplitsAtFirstSeparator) {
    auto bare = ParseQualifiedToolName("read_file");
    EXPECT_FALSE(bare.serverName.has_value());
    EXPECT_EQ(bare.toolName, "read_file");

    auto q = ParseQualifiedToolName("Files__read_file");
    ASSERT_TRUE(q.serverName.has_value());
    EXPECT_EQ(*q.serverName, "Files");
    EXPECT_EQ(q.toolName, "read_file");

    auto nested = ParseQualifiedToolName("Srv__do__thing");
    EXPECT_EQ(*nested.serverName, "Srv");
    EXPECT_EQ(nested.toolName, "do__thing");

    auto leading = ParseQualifiedToolName("__tool");
    EXPECT_FALSE(leading.serverName.has_value());
    EXPECT_EQ(leading.toolName, "tool");
}

TEST(SupervisorOptions, ReadsEnvironment) {
    ::setenv("MCPHOST_RESTART_DELAY_MS", "250", 1);
    ::setenv("MCPHOST_TEST_TIMEOUT_MS", "nope", 1);
    ::setenv("MCPHOST_REQUEST_TIMEOUT_MS", "1200", 1);
    SupervisorOptions o = SupervisorOptions::FromEnvironment();
    EXPECT_EQ(o.restartDelay, 250ms);
    EXPECT_EQ(o.testTimeout, 15000ms);
    EXPECT_EQ(o.session.requestTimeout, 1200ms);
    ::unsetenv("MCPHOST_RESTART_DELAY_MS");
    ::unsetenv("MCPHOST_TEST_TIMEOUT_MS");
    ::unsetenv("MCPHOST_REQUEST_TIMEOUT_MS");
}

TEST_F(SupervisorTest, StartAggregatesCatalogs) {
    SessionInfo a = test::Run(io, sup->startServer("id-A"));
    EXPECT_TRUE(a.isConnected);
    EXPECT_EQ(a.serverInfo.name, "A");
    test::Run(io, sup->startServer("id-B"));

    EXPECT_EQ(sup->getRunningCount(), 2u);
    EXPECT_TRUE(sup->isServerRunning("id-A"));
    EXPECT_FALSE(sup->isServerRunning("id-C"));
    auto tools = sup->getAllTools();
    EXPECT_EQ(tools.size(), 5u + 3u);
    EXPECT_EQ(tools.front().serverName, "A");
    EXPECT_EQ(GetString(tools.back().ToJSON(), "serverId"), "id-B");
    EXPECT_EQ(sup->getAllResources().size(), 2u);
    EXPECT_EQ(countEvents(SupervisorEventType::ServerConnected), 2u);

    auto all = sup->getAllServerStatus();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_TRUE(all.at("id-B").running);
    ServerStatus none = sup->getServerStatus("id-C");
    EXPECT_FALSE(none.running);
    EXPECT_FALSE(GetBool(none.ToJSON(), "running", true));
}

TEST_F(SupervisorTest, StartingRunningServerReturnsSameSession) {
    test::Run(io, sup->startServer("id-A"));
    const pid_t pid = *sup->session("id-A")->pid();
    test::Run(io, sup->startServer("id-A"));
    EXPECT_EQ(*sup->session("id-A")->pid(), pid);
    EXPECT_EQ(sup->getRunningCount(), 1u);
}

TEST_F(SupervisorTest, ConcurrentStartsShareOneProcess) {
    int completed = 0;
    for (int i = 0; i < 3; ++i) {
        boost::asio::co_spawn(io, sup->startServer("id-B"), [&](std::exception_ptr ep, SessionInfo) {
            EXPECT_FALSE(ep);
            ++completed;
        });
    }
    ASSERT_TRUE(RunUntil(io, [&] { return completed == 3; }, 10s));
    EXPECT_EQ(sup->getRunningCount(), 1u);
    EXPECT_EQ(countEvents(SupervisorEventType::ServerConnected), 1u);
}

TEST_F(SupervisorTest, StartErrors) {
    try {
        test::Run(io, sup->startServer("missing"));
        FAIL() << "expected ServerNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ServerNotFound);
        EXPECT_STREQ(e.what(), "Server config not found: missing");
    }
    try {
        test::Run(io, sup->startServer("id-Off"));
        FAIL() << "expected ServerDisabled";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ServerDisabled);
        EXPECT_STREQ(e.what(), "Server Off is disabled");
    }
    EXPECT_EQ(sup->getRunningCount(), 0u);
}

TEST_F(SupervisorTest, FailedStartIsNotRegistered) {
    ServerDefinitionPatch broken;
    broken.args = std::vector<std::string>{"--name=C", "--bad-init"};
    store->update("id-C", broken);
    EXPECT_THROW(test::Run(io, sup->startServer("id-C")), errors::McpException);
    EXPECT_FALSE(sup->isServerRunning("id-C"));
    EXPECT_EQ(sup->session("id-C"), nullptr);
}

TEST_F(SupervisorTest, RoutesBareAndQualifiedNames) {
    test::Run(io, sup->startServer("id-A"));
    test::Run(io, sup->startServer("id-B"));

    EXPECT_EQ(firstText(test::Run(io, sup->callToolByName("ping", MakeObject()))), "pong from A");
    EXPECT_EQ(firstText(test::Run(io, sup->callToolByName("B__ping", MakeObject()))), "pong from B");
    EXPECT_EQ(firstText(test::Run(io, sup->callToolByName("A__do__thing", MakeObject()))), "do__thing from A");
    EXPECT_EQ(firstText(test::Run(io, sup->callToolByName("__ping", MakeObject()))), "pong from A");
    EXPECT_EQ(firstText(test::Run(io, sup->callTool("id-B", "echo", MakeObject({{"text", JSONValue("direct")}})))), "direct");

    try {
        test::Run(io, sup->callToolByName("C__ping", MakeObject()));
        FAIL() << "expected ToolNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ToolNotFound);
        EXPECT_STREQ(e.what(), "Tool not found: C__ping");
    }
    try {
        test::Run(io, sup->callToolByName("nosuch", MakeObject()));
        FAIL() << "expected ToolNotFound";
    } catch (const errors::McpException& e) {
        EXPECT_STREQ(e.what(), "Tool not found: nosuch");
    }
    try {
        test::Run(io, sup->callTool("id-C", "ping", MakeObject()));
        FAIL() << "expected ServerNotRunning";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ServerNotRunning);
        EXPECT_STREQ(e.what(), "Server id-C not running");
    }
}

TEST_F(SupervisorTest, ReadResourceThroughSupervisor) {
    test::Run(io, sup->startServer("id-B"));
    JSONValue r = test::Run(io, sup->readResource("id-B", "fixture://B/readme"));
    EXPECT_NE(r.find("contents"), nullptr);
    EXPECT_THROW(test::Run(io, sup->readResource("id-A", "fixture://A/readme")), errors::McpException);
}

TEST_F(SupervisorTest, StopAndRestart) {
    test::Run(io, sup->startServer("id-A"));
    const pid_t first = *sup->session("id-A")->pid();

    SessionInfo again = test::Run(io, sup->restartServer("id-A"));
    EXPECT_TRUE(again.isConnected);
    EXPECT_NE(*sup->session("id-A")->pid(), first);
    EXPECT_EQ(::kill(first, 0), -1);

    test::Run(io, sup->stopServer("id-A"));
    EXPECT_FALSE(sup->isServerRunning("id-A"));
    EXPECT_NO_THROW(test::Run(io, sup->stopServer("id-A")));
    EXPECT_GE(countEvents(SupervisorEventType::ServerDisconnected), 2u);
}

TEST_F(SupervisorTest, UnexpectedExitRemovesSession) {
    test::Run(io, sup->startServer("id-B"));
    auto session = sup->session("id-B");
    boost::asio::co_spawn(io, session->sendRequest("test/exit"), [](std::exception_ptr, JSONValue) {});
    ASSERT_TRUE(RunUntil(io, [&] { return !sup->isServerRunning("id-B"); }, 5s));
    EXPECT_EQ(sup->getRunningCount(), 0u);
    EXPECT_EQ(countEvents(SupervisorEventType::ServerDisconnected), 1u);
    EXPECT_TRUE(sup->getAllTools().empty());
}

TEST_F(SupervisorTest, StopAllIsConcurrent) {
    test::Run(io, sup->startServer("id-A"));
    test::Run(io, sup->startServer("id-B"));
    test::Run(io, sup->startServer("id-C"));
    std::vector<pid_t> pids;
    for (const char* id : {"id-A", "id-B", "id-C"}) pids.push_back(*sup->session(id)->pid());

    const auto start = std::chrono::steady_clock::now();
    test::Run(io, sup->stopAll());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2500ms);
    EXPECT_EQ(sup->getRunningCount(), 0u);
    for (pid_t p : pids) EXPECT_EQ(::kill(p, 0), -1);
    EXPECT_NO_THROW(test::Run(io, sup->stopAll()));
}

TEST_F(SupervisorTest, CancelAllToolCallsFailsInFlightCallsOnly) {
    test::Run(io, sup->startServer("id-A"));
    std::optional<errors::ErrorCategory> failure;
    boost::asio::co_spawn(io, sup->callTool("id-A", "wait", MakeObject()), [&](std::exception_ptr ep, JSONValue) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const errors::McpException& e) {
            failure = e.category();
        }
    });
    auto session = sup->session("id-A");
    ASSERT_TRUE(RunUntil(io, [&] { return session->pendingCount() == 1; }, 5s));

    const uint64_t before = sup->cancelGeneration();
    sup->cancelAllToolCalls();
    EXPECT_EQ(sup->cancelGeneration(), before + 1);
    test::Run(io, session->sendRequest("test/release"));
    ASSERT_TRUE(RunUntil(io, [&] { return failure.has_value(); }, 5s));
    EXPECT_EQ(*failure, errors::ErrorCategory::Cancelled);

    EXPECT_EQ(firstText(test::Run(io, sup->callToolByName("echo", MakeObject({{"text", JSONValue("after")}})))), "after");
}

TEST_F(SupervisorTest, SessionEventsAreForwarded) {
    test::Run(io, sup->startServer("id-A"));
    auto session = sup->session("id-A");
    test::Run(io, session->sendRequest("test/addTool", MakeObject({{"name", JSONValue("late")}})));
    ASSERT_TRUE(RunUntil(io, [&] { return countEvents(SupervisorEventType::ToolsUpdated) > 0; }, 5s));
    const SupervisorEvent* toolsEv = nullptr;
    for (const auto& e : events) if (e.type == SupervisorEventType::ToolsUpdated) toolsEv = &e;
    ASSERT_NE(toolsEv, nullptr);
    EXPECT_EQ(toolsEv->serverId, "id-A");
    EXPECT_EQ(std::get<JSONValue::Array>(toolsEv->payload.value).size(), 6u);

    test::Run(io, session->sendRequest("test/notify", MakeObject({
        {"method", JSONValue("notifications/resources/updated")},
        {"params", MakeObject({{"uri", JSONValue("fixture://A/readme")}})}
    })));
    ASSERT_TRUE(RunUntil(io, [&] { return countEvents(SupervisorEventType::ResourceUpdated) == 1; }, 5s));
    EXPECT_EQ(GetString(events.back().payload, "uri"), "fixture://A/readme");
}

TEST_F(SupervisorTest, InitializeStartsAutoStartServers) {
    ServerDefinitionPatch autoStart;
    autoStart.autoStart = true;
    store->update("id-B", autoStart);
    store->update("id-Off", autoStart);
    ServerDefinition broken = FixtureDefinition("Broken");
    broken.command = "/nonexistent/mcphost-broken";
    broken.autoStart = true;
    store->save(broken);

    EXPECT_NO_THROW(test::Run(io, sup->initialize()));
    EXPECT_EQ(sup->getRunningCount(), 1u);
    EXPECT_TRUE(sup->isServerRunning("id-B"));
    EXPECT_NO_THROW(test::Run(io, sup->initialize()));
    EXPECT_EQ(sup->getRunningCount(), 1u);
}

TEST_F(SupervisorTest, TestServerConfigSuccess) {
    TestResult r = test::Run(io, sup->testServerConfig(FixtureDefinition("Probe")));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(r.message, "Connection successful");
    EXPECT_EQ(r.serverInfo.name, "Probe");
    EXPECT_EQ(r.toolCount, 3u);
    EXPECT_EQ(r.resourceCount, 1u);
    ASSERT_EQ(r.tools.size(), 3u);
    EXPECT_EQ(r.tools[0].name, "echo");
    EXPECT_EQ(sup->getRunningCount(), 0u);
    EXPECT_TRUE(GetBool(r.ToJSON(), "success", false));
}

TEST_F(SupervisorTest, TestServerConfigNeverThrows) {
    ServerDefinition missing = FixtureDefinition("Missing");
    missing.command = "/nonexistent/mcphost-missing";
    TestResult spawn = test::Run(io, sup->testServerConfig(missing));
    EXPECT_FALSE(spawn.success);
    EXPECT_NE(spawn.message.find("Failed to start"), std::string::npos);
    ASSERT_TRUE(spawn.error.has_value());
    EXPECT_EQ(spawn.error->category, errors::ErrorCategory::SpawnError);

    const auto start = std::chrono::steady_clock::now();
    TestResult hung = test::Run(io, sup->testServerConfig(FixtureDefinition("Hung", {"--hang-init"})));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    EXPECT_FALSE(hung.success);
    EXPECT_EQ(hung.message, "Connection timeout (1s)");
    EXPECT_EQ(hung.error->category, errors::ErrorCategory::RequestTimeout);

    TestResult bad = test::Run(io, sup->testServerConfig(FixtureDefinition("Bad", {"--bad-init"})));
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.error->category, errors::ErrorCategory::HandshakeError);
    EXPECT_EQ(sup->getRunningCount(), 0u);
}
