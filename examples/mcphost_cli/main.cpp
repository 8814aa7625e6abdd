//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcphost command-line host: loads server definitions, runs them, lists and calls their tools
//==========================================================================================================

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/ConfigStore.h"
#include "mcphost/HostBridge.h"
#include "mcphost/version.h"

using namespace mcphost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage() {
    std::cerr << "mcphost " << getVersionString() << "\n"
              << "usage: mcphost --config=<servers.json> [--list] [--call=<tool> [--args=<json>]]\n"
              << "               [--read=<serverId>:<uri>] [--test=<serverName>]\n";
}

struct CliOptions {
    bool list{false};
    std::optional<std::string> call;
    std::string args{"{}"};
    std::optional<std::string> read;
    std::optional<std::string> test;
};

//==========================================================================================================
// runCommands
// Purpose: Executes the requested commands against the bridge. A --test run never starts the configured
//          servers; everything else initializes first and stops all servers before returning.
// Returns:
//   Process exit code.
//==========================================================================================================
static net::awaitable<int> runCommands(HostBridge& bridge, const CliOptions& opts) {
    if (opts.test) {
        auto def = bridge.supervisor()->store()->getConfigByName(*opts.test);
        if (!def) {
            LOG_ERROR("No server named {}", *opts.test);
            co_return 1;
        }
        TestResult result = co_await bridge.testServer(*def);
        std::cout << SerializeJSONPretty(result.ToJSON()) << std::endl;
        co_return result.success ? 0 : 1;
    }

    int rc = 0;
    co_await bridge.initialize();
    try {
        if (opts.list) {
            for (const auto& s : bridge.listServers()) {
                std::cout << (s.isRunning ? "[running] " : "[stopped] ") << s.definition.name << " (" << s.definition.id
                          << ")" << (s.definition.enabled ? "" : " disabled") << "\n";
            }
            for (const auto& t : bridge.getAllTools()) {
                std::cout << "  " << t.serverName << "__" << t.tool.name << "  " << t.tool.description << "\n";
            }
            for (const auto& r : bridge.getAllResources()) {
                std::cout << "  " << r.serverName << "  " << r.resource.uri << "\n";
            }
            std::cout.flush();
        }
        if (opts.call) {
            JSONValue result = co_await bridge.callToolByName(*opts.call, ParseJSON(opts.args));
            std::cout << SerializeJSONPretty(result) << std::endl;
        }
        if (opts.read) {
            auto colon = opts.read->find(':');
            if (colon == std::string::npos) {
                LOG_ERROR("--read expects <serverId>:<uri>");
                rc = 2;
            } else {
                JSONValue result = co_await bridge.readResource(opts.read->substr(0, colon), opts.read->substr(colon + 1));
                std::cout << SerializeJSONPretty(result) << std::endl;
            }
        }
    } catch (const errors::McpException& e) {
        LOG_ERROR("{} ({})", e.what(), errors::categoryName(e.category()));
        rc = 1;
    } catch (const JSONParseError& e) {
        LOG_ERROR("Invalid --args JSON: {}", e.what());
        rc = 2;
    }
    co_await bridge.shutdown();
    co_return rc;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::ConfigureFromEnvironment();

    if (hasFlag(argc, argv, "--help")) {
        printUsage();
        return 0;
    }
    std::string configPath = getArgValue(argc, argv, "--config").value_or(GetEnvOrDefault("MCPHOST_CONFIG", ""));
    if (configPath.empty()) {
        printUsage();
        return 2;
    }

    CliOptions opts;
    opts.list = hasFlag(argc, argv, "--list");
    opts.call = getArgValue(argc, argv, "--call");
    opts.args = getArgValue(argc, argv, "--args").value_or("{}");
    opts.read = getArgValue(argc, argv, "--read");
    opts.test = getArgValue(argc, argv, "--test");
    if (!opts.list && !opts.call && !opts.read && !opts.test) {
        opts.list = true;
    }

    std::shared_ptr<IConfigStore> store;
    try {
        store = std::make_shared<JsonFileConfigStore>(configPath);
    } catch (const errors::McpException& e) {
        LOG_ERROR("{}", e.what());
        return 2;
    }

    net::io_context io;
    HostBridge bridge(io.get_executor(), store, SupervisorOptions::FromEnvironment());
    bridge.SetEventHandler([](const HostEvent& ev) {
        LOG_DEBUG("event {} {}", hostEventName(ev.type), ev.serverId);
    });

    int exitCode = 0;
    net::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) {
            return;
        }
        LOG_WARN("Signal {} received; stopping servers", sig);
        exitCode = 128 + sig;
        net::co_spawn(io, bridge.shutdown(), [&](std::exception_ptr) { io.stop(); });
    });

    net::co_spawn(io, runCommands(bridge, opts), [&](std::exception_ptr ep, int rc) {
        if (ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                LOG_ERROR("mcphost failed: {}", e.what());
            }
            exitCode = 1;
        } else {
            exitCode = rc;
        }
        signals.cancel();
    });
    io.run();
    return exitCode;
}
