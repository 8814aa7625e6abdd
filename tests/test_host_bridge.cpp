//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_host_bridge.cpp
// Purpose: Definition CRUD through the host bridge, stop-before-change and forwarded host events
//==========================================================================================================

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include "TestSupport.h"
#include "mcphost/HostBridge.h"

using namespace mcphost;
using namespace std::chrono_literals;
using test::FixtureDefinition;
using test::Run;
using test::RunUntil;

namespace {

class HostBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        SupervisorOptions opts;
        opts.testTimeout = 1000ms;
        opts.restartDelay = 20ms;
        opts.session.killGrace = 1000ms;
        store = std::make_shared<InMemoryConfigStore>();
        bridge = std::make_unique<HostBridge>(io.get_executor(), store, opts);
        bridge->SetEventHandler([this](const HostEvent& ev) { events.push_back(ev); });
    }

    void TearDown() override {
        test::Run(io, bridge->shutdown());
    }

    std::size_t count(HostEventType t) const {
        std::size_t n = 0;
        for (const auto& e : events) n += (e.type == t) ? 1 : 0;
        return n;
    }

    ServerDefinition addFixture(const std::string& name) {
        ServerDefinition def = FixtureDefinition(name);
        def.id.clear();
        return bridge->createServer(def);
    }

    boost::asio::io_context io;
    std::shared_ptr<InMemoryConfigStore> store;
    std::unique_ptr<HostBridge> bridge;
    std::vector<HostEvent> events;
};

} // namespace

TEST(HostEventNames, MatchChannelNames) {
    EXPECT_STREQ(hostEventName(HostEventType::ServersChanged), "mcp-servers-updated");
    EXPECT_STREQ(hostEventName(HostEventType::ServerConnected), "mcp-server-connected");
    EXPECT_STREQ(hostEventName(HostEventType::ToolsUpdated), "mcp-tools-updated");
    EXPECT_STREQ(hostEventName(HostEventType::ResourceUpdated), "mcp-resource-updated");
}

TEST_F(HostBridgeTest, CreateListsAndNotifies) {
    ServerDefinition def = addFixture("Alpha");
    EXPECT_FALSE(def.id.empty());
    EXPECT_EQ(count(HostEventType::ServersChanged), 1u);
    EXPECT_EQ(events.back().serverId, def.id);

    auto listing = bridge->listServers();
    ASSERT_EQ(listing.size(), 1u);
    EXPECT_FALSE(listing[0].isRunning);
    EXPECT_FALSE(GetBool(listing[0].ToJSON(), "isRunning", true));
    EXPECT_EQ(GetString(listing[0].ToJSON(), "_id"), def.id);

    EXPECT_THROW(addFixture("Alpha"), errors::McpException);
    EXPECT_EQ(count(HostEventType::ServersChanged), 1u);
    EXPECT_FALSE(bridge->getServer("missing").has_value());
}

TEST_F(HostBridgeTest, StartReportsRunningAndForwardsEvents) {
    ServerDefinition def = addFixture("Alpha");
    test::Run(io, bridge->startServer(def.id));
    auto listing = bridge->getServer(def.id);
    ASSERT_TRUE(listing.has_value());
    EXPECT_TRUE(listing->isRunning);
    EXPECT_EQ(bridge->getRunningCount(), 1u);
    EXPECT_EQ(count(HostEventType::ServerConnected), 1u);
    EXPECT_EQ(bridge->getAllTools().size(), 3u);

    JSONValue r = test::Run(io, bridge->callToolByName("Alpha__ping", MakeObject()));
    EXPECT_NE(SerializeJSON(r).find("pong from Alpha"), std::string::npos);

    auto session = bridge->supervisor()->session(def.id);
    test::Run(io, session->sendRequest("test/addResource", MakeObject({{"uri", JSONValue("fixture://Alpha/extra")}})));
    ASSERT_TRUE(RunUntil(io, [&] { return count(HostEventType::ResourcesUpdated) > 0; }, 5s));
    EXPECT_EQ(bridge->getAllResources().size(), 2u);
}

TEST_F(HostBridgeTest, UpdateStopsRunningServerFirst) {
    ServerDefinition def = addFixture("Alpha");
    test::Run(io, bridge->startServer(def.id));
    events.clear();

    ServerDefinitionPatch patch;
    patch.description = "changed";
    auto updated = test::Run(io, bridge->updateServer(def.id, patch));
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->description, "changed");
    EXPECT_FALSE(bridge->getServerStatus(def.id).running);
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events.front().type, HostEventType::ServerDisconnected);
    EXPECT_EQ(events.back().type, HostEventType::ServersChanged);

    auto byName = test::Run(io, bridge->updateServerByName("Alpha", patch));
    EXPECT_TRUE(byName.has_value());
    EXPECT_FALSE(test::Run(io, bridge->updateServerByName("nobody", patch)).has_value());
    EXPECT_FALSE(test::Run(io, bridge->updateServer("missing", patch)).has_value());
}

TEST_F(HostBridgeTest, DeleteStopsAndRemoves) {
    ServerDefinition a = addFixture("Alpha");
    addFixture("Beta");
    test::Run(io, bridge->startServer(a.id));

    EXPECT_TRUE(test::Run(io, bridge->deleteServer(a.id)));
    EXPECT_EQ(bridge->getRunningCount(), 0u);
    EXPECT_FALSE(bridge->getServer(a.id).has_value());
    EXPECT_FALSE(test::Run(io, bridge->deleteServer(a.id)));

    const std::size_t before = count(HostEventType::ServersChanged);
    EXPECT_TRUE(test::Run(io, bridge->deleteServerByName("Beta")));
    EXPECT_EQ(count(HostEventType::ServersChanged), before + 1);
    EXPECT_FALSE(test::Run(io, bridge->deleteServerByName("Beta")));
    EXPECT_TRUE(bridge->listServers().empty());
}

TEST_F(HostBridgeTest, ToggleDisableStopsServer) {
    ServerDefinition def = addFixture("Alpha");
    test::Run(io, bridge->startServer(def.id));

    auto off = test::Run(io, bridge->toggleServerEnabled(def.id));
    ASSERT_TRUE(off.has_value());
    EXPECT_FALSE(off->enabled);
    EXPECT_EQ(bridge->getRunningCount(), 0u);
    EXPECT_THROW(test::Run(io, bridge->startServer(def.id)), errors::McpException);

    auto on = test::Run(io, bridge->toggleServerEnabled(def.id));
    ASSERT_TRUE(on.has_value());
    EXPECT_TRUE(on->enabled);
    EXPECT_EQ(bridge->getRunningCount(), 0u);
    EXPECT_FALSE(test::Run(io, bridge->toggleServerEnabled("missing")).has_value());
    EXPECT_EQ(count(HostEventType::ServersChanged), 3u);
}

TEST_F(HostBridgeTest, TestServerReportsWithoutRegistering) {
    TestResult ok = test::Run(io, bridge->testServer(FixtureDefinition("Probe")));
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.toolCount, 3u);

    ServerDefinition bad = FixtureDefinition("Nope");
    bad.command = "/nonexistent/mcphost-nope";
    TestResult failed = test::Run(io, bridge->testServer(bad));
    EXPECT_FALSE(failed.success);
    EXPECT_FALSE(failed.message.empty());
    EXPECT_EQ(bridge->getRunningCount(), 0u);
    EXPECT_TRUE(bridge->listServers().empty());
}

TEST_F(HostBridgeTest, RestartReconnectsServer) {
    ServerDefinition def = addFixture("Alpha");
    test::Run(io, bridge->startServer(def.id));
    test::Run(io, bridge->restartServer(def.id));
    EXPECT_TRUE(bridge->getServerStatus(def.id).running);
    EXPECT_EQ(bridge->getAllServerStatus().size(), 1u);
    EXPECT_EQ(count(HostEventType::ServerConnected), 2u);
}
