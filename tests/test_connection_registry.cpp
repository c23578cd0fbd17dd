//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection_registry.cpp
// Purpose: Lazy connect, shared connect attempts, replacement of dead sessions and shutdown
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "FakeToolServer.h"
#include "toolclient/ConnectionRegistry.h"
#include "toolclient/errors/Errors.h"

using namespace toolclient;
using namespace toolclient::testing;
using errors::ErrorKind;
using errors::ToolClientError;

namespace {
ServerCatalog catalogOf(std::initializer_list<const char*> names) {
    ServerCatalog catalog;
    for (const char* n : names) {
        catalog.emplace(n, fakeSpec(n));
    }
    return catalog;
}

// Wraps fake transports so Close() takes a while, like a server that ignores stdin EOF.
class SlowCloseFactory : public ITransportFactory {
public:
    SlowCloseFactory(std::shared_ptr<FakeToolServer> server, std::chrono::milliseconds delay)
        : inner(std::make_shared<FakeTransportFactory>(std::move(server))), delay(delay) {}

    std::unique_ptr<ITransport> CreateTransport(const ServerSpec& spec) override {
        return std::make_unique<SlowClose>(inner->CreateTransport(spec), delay);
    }

private:
    class SlowClose : public ITransport {
    public:
        SlowClose(std::unique_ptr<ITransport> t, std::chrono::milliseconds delay) : t(std::move(t)), delay(delay) {}
        std::future<void> Start() override { return t->Start(); }
        std::future<void> Close() override {
            std::this_thread::sleep_for(delay);
            return t->Close();
        }
        bool IsConnected() const override { return t->IsConnected(); }
        void Send(const std::string& payload) override { t->Send(payload); }
        void SetMessageHandler(MessageHandler h) override { t->SetMessageHandler(std::move(h)); }
        void SetErrorHandler(ErrorHandler h) override { t->SetErrorHandler(std::move(h)); }
        void SetCloseHandler(CloseHandler h) override { t->SetCloseHandler(std::move(h)); }

    private:
        std::unique_ptr<ITransport> t;
        std::chrono::milliseconds delay;
    };

    std::shared_ptr<FakeTransportFactory> inner;
    std::chrono::milliseconds delay;
};

SessionOptions fastOptions() {
    SessionOptions o;
    o.handshakeTimeout = std::chrono::milliseconds(2000);
    o.callTimeout = std::chrono::milliseconds(100);
    return o;
}
} // namespace

TEST(ConnectionRegistry, UnknownServerDoesNotLaunch) {
    auto server = std::make_shared<FakeToolServer>();
    ConnectionRegistry registry(catalogOf({"echo"}), std::make_shared<FakeTransportFactory>(server), fastOptions());
    try {
        registry.GetOrConnect("missing");
        FAIL() << "expected UnknownServer";
    } catch (const ToolClientError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnknownServer);
    }
    EXPECT_EQ(server->launches.load(), 0);
    EXPECT_EQ(registry.Find("missing"), nullptr);
}

TEST(ConnectionRegistry, ReusesLiveSession) {
    auto server = std::make_shared<FakeToolServer>();
    ConnectionRegistry registry(catalogOf({"echo"}), std::make_shared<FakeTransportFactory>(server), fastOptions());
    auto a = registry.GetOrConnect("echo");
    auto b = registry.GetOrConnect("echo");
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(server->launches.load(), 1);
    EXPECT_TRUE(registry.IsConnected("echo"));
}

TEST(ConnectionRegistry, ConcurrentCallersShareOneConnect) {
    auto server = std::make_shared<FakeToolServer>();
    server->launchDelay = std::chrono::milliseconds(100);
    ConnectionRegistry registry(catalogOf({"echo"}), std::make_shared<FakeTransportFactory>(server), fastOptions());

    std::vector<std::thread> callers;
    std::vector<Session*> seen(8, nullptr);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        callers.emplace_back([&, i]() { seen[i] = registry.GetOrConnect("echo").get(); });
    }
    for (auto& t : callers) t.join();
    for (auto* s : seen) {
        EXPECT_EQ(s, seen[0]);
    }
    EXPECT_EQ(server->launches.load(), 1);
    EXPECT_EQ(server->CountSent("initialize"), 1);
}

TEST(ConnectionRegistry, ConcurrentCallersShareTheSameFailure) {
    auto server = std::make_shared<FakeToolServer>();
    server->failLaunch = true;
    server->launchDelay = std::chrono::milliseconds(100);
    ConnectionRegistry registry(catalogOf({"echo"}), std::make_shared<FakeTransportFactory>(server), fastOptions());

    std::atomic<int> connectErrors{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < 4; ++i) {
        callers.emplace_back([&]() {
            try {
                registry.GetOrConnect("echo");
            } catch (const ToolClientError& e) {
                if (e.kind() == ErrorKind::ConnectError) ++connectErrors;
            }
        });
    }
    for (auto& t : callers) t.join();
    EXPECT_EQ(connectErrors.load(), 4);
    EXPECT_EQ(registry.Find("echo"), nullptr);
}

TEST(ConnectionRegistry, ClosedSessionIsReplaced) {
    auto server = std::make_shared<FakeToolServer>();
    server->callMode = CallMode::Silent;
    ConnectionRegistry registry(catalogOf({"echo"}), std::make_shared<FakeTransportFactory>(server), fastOptions());

    auto first = registry.GetOrConnect("echo");
    JSONValue::Object args;
    args["text"] = std::make_shared<JSONValue>("x");
    EXPECT_EQ(first->CallTool("repeat", JSONValue(args)).get().failure->kind, ErrorKind::Timeout);
    EXPECT_EQ(first->CallTool("repeat", JSONValue(args)).get().failure->kind, ErrorKind::Timeout);
    EXPECT_EQ(first->State(), SessionState::Closed);
    EXPECT_EQ(registry.Find("echo"), nullptr);

    server->callMode = CallMode::Echo;
    auto second = registry.GetOrConnect("echo");
    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(second->State(), SessionState::Ready);
    EXPECT_EQ(server->launches.load(), 2);
    EXPECT_TRUE(second->CallTool("repeat", JSONValue(args)).get().IsSuccess());
}

TEST(ConnectionRegistry, DisconnectAndDisconnectAll) {
    auto server = std::make_shared<FakeToolServer>();
    ConnectionRegistry registry(catalogOf({"a", "b"}), std::make_shared<FakeTransportFactory>(server), fastOptions());
    auto a = registry.GetOrConnect("a");
    auto b = registry.GetOrConnect("b");

    EXPECT_TRUE(registry.Disconnect("a"));
    EXPECT_FALSE(registry.Disconnect("a"));
    EXPECT_EQ(a->State(), SessionState::Closed);
    EXPECT_FALSE(registry.IsConnected("a"));

    auto failures = registry.DisconnectAll();
    EXPECT_TRUE(failures.empty());
    EXPECT_EQ(b->State(), SessionState::Closed);
    EXPECT_FALSE(registry.IsConnected("b"));
    EXPECT_TRUE(registry.DisconnectAll().empty());
}

TEST(ConnectionRegistry, ServersListsCatalogSorted) {
    auto server = std::make_shared<FakeToolServer>();
    ConnectionRegistry registry(catalogOf({"zeta", "alpha"}), std::make_shared<FakeTransportFactory>(server));
    auto names = registry.Servers();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "alpha");
    EXPECT_EQ(names[1], "zeta");
    EXPECT_EQ(server->launches.load(), 0);
}

TEST(ConnectionRegistry, ReplacingSlowClosingSessionDoesNotBlockOtherServers) {
    auto server = std::make_shared<FakeToolServer>();
    ConnectionRegistry registry(catalogOf({"slow", "other"}),
                                std::make_shared<SlowCloseFactory>(server, std::chrono::milliseconds(1500)),
                                fastOptions());
    registry.GetOrConnect("slow");  // the registry keeps the only reference
    server->EndStream();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (registry.Find("slow") != nullptr && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(registry.Find("slow"), nullptr);
    // Let the worker enter the slow Close().
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    std::thread replacer([&]() { registry.GetOrConnect("slow"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(registry.Find("other"), nullptr);
    EXPECT_FALSE(registry.IsConnected("other"));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    EXPECT_LT(ms, 200);

    replacer.join();
    EXPECT_TRUE(registry.IsConnected("slow"));
    EXPECT_EQ(server->launches.load(), 2);
}
