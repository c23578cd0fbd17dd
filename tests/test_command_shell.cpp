//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_command_shell.cpp
// Purpose: Operator console dispatch, argument prompting and confirmation
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>

#include "FakeToolServer.h"
#include "toolclient/Client.h"
#include "toolclient/cli/CommandShell.h"

using namespace toolclient;
using namespace toolclient::testing;
using toolclient::cli::CommandShell;
using toolclient::cli::ShellOptions;

namespace {
struct ShellFixture : public ::testing::Test {
    std::shared_ptr<FakeToolServer> server = std::make_shared<FakeToolServer>();
    std::unique_ptr<ConnectionRegistry> registry;
    std::unique_ptr<Client> client;
    std::istringstream in;
    std::ostringstream out;

    void SetUp() override {
        server->tools = {
            makeTool("repeat", R"({"type":"object","properties":{"text":{"type":"string","description":"Text to echo"}},"required":["text"]})"),
            makeTool("sleep", R"({"type":"object","properties":{"ms":{"type":"integer","default":5},"note":{"type":"string"}}})")};
        ServerCatalog catalog;
        catalog.emplace("echo", fakeSpec("echo"));
        registry = std::make_unique<ConnectionRegistry>(std::move(catalog),
                                                        std::make_shared<FakeTransportFactory>(server));
        client = std::make_unique<Client>(*registry);
    }

    std::string run(const std::string& input, ShellOptions options = ShellOptions{}) {
        options.color = false;
        in.str(input);
        in.clear();
        out.str("");
        CommandShell shell(*client, in, out, options);
        shell.Run();
        return out.str();
    }
};
} // namespace

TEST(CommandParsing, SplitKeepsRemainderVerbatim) {
    auto parts = cli::splitCommand(R"(  call echo repeat {"text": "a b"}  )", 4);
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "call");
    EXPECT_EQ(parts[2], "repeat");
    EXPECT_EQ(parts[3], R"({"text": "a b"})");
    EXPECT_EQ(cli::splitCommand("servers", 2).size(), 1u);
    EXPECT_TRUE(cli::splitCommand("   ", 2).empty());
}

TEST(CommandParsing, ConvertsTypedArguments) {
    std::string error;
    EXPECT_EQ(std::get<int64_t>(cli::convertArgument("42", "integer", error)->value), 42);
    EXPECT_DOUBLE_EQ(std::get<double>(cli::convertArgument("2.5", "number", error)->value), 2.5);
    EXPECT_TRUE(std::get<bool>(cli::convertArgument("Yes", "boolean", error)->value));
    EXPECT_FALSE(std::get<bool>(cli::convertArgument("no", "boolean", error)->value));
    EXPECT_TRUE(cli::convertArgument("[1,2]", "array", error)->isArray());
    EXPECT_EQ(std::get<std::string>(cli::convertArgument("plain", "string", error)->value), "plain");

    EXPECT_FALSE(cli::convertArgument("4x", "integer", error).has_value());
    EXPECT_FALSE(cli::convertArgument("abc", "number", error).has_value());
    EXPECT_FALSE(cli::convertArgument("{}", "array", error).has_value());
    EXPECT_FALSE(cli::convertArgument("{", "object", error).has_value());
}

TEST_F(ShellFixture, ServersAndUnknownCommands) {
    const std::string text = run("servers\nfrobnicate\nexit\n");
    EXPECT_NE(text.find("echo"), std::string::npos);
    EXPECT_NE(text.find("not connected"), std::string::npos);
    EXPECT_NE(text.find("Unknown command: frobnicate"), std::string::npos);
    EXPECT_EQ(server->launches.load(), 0);
}

TEST_F(ShellFixture, CallWithJsonArgumentsPrintsResult) {
    const std::string text = run("call echo repeat {\"text\":\"hi\"}\nquit\n");
    EXPECT_NE(text.find("Result:"), std::string::npos);
    EXPECT_NE(text.find("\"hi\""), std::string::npos);
    EXPECT_NE(text.find(" ms)"), std::string::npos);
}

TEST_F(ShellFixture, FailuresArePrintedAndLoopContinues) {
    const std::string text = run("tools nowhere\ncall echo subtract {}\ncall echo repeat [1]\nservers\n");
    EXPECT_NE(text.find("Error [UnknownServer]"), std::string::npos);
    EXPECT_NE(text.find("Error [UnknownTool]"), std::string::npos);
    EXPECT_NE(text.find("Arguments must be a JSON object"), std::string::npos);
    EXPECT_NE(text.find("connected"), std::string::npos);
}

TEST_F(ShellFixture, UsageMessages) {
    const std::string text = run("call echo\ninfo\nconnect\n");
    EXPECT_NE(text.find("Usage: call <server> <tool> [json-arguments]"), std::string::npos);
    EXPECT_NE(text.find("Usage: info <server> [tool]"), std::string::npos);
    EXPECT_NE(text.find("Usage: connect <server>"), std::string::npos);
}

TEST_F(ShellFixture, PromptsForArgumentsWithDefaults) {
    // sleep: optional "ms" (default 5) and "note"; both left empty.
    const std::string text = run("call echo sleep\n\n\nexit\n");
    EXPECT_NE(text.find("Enter arguments for sleep"), std::string::npos);
    EXPECT_NE(text.find("default: 5"), std::string::npos);
    EXPECT_NE(text.find("\\\"ms\\\":5"), std::string::npos);
    EXPECT_EQ(server->CountSent("tools/call"), 1);
}

TEST_F(ShellFixture, EmptyRequiredValueAbortsCall) {
    const std::string text = run("call echo repeat\n\nexit\n");
    EXPECT_NE(text.find("text is required"), std::string::npos);
    EXPECT_NE(text.find("Tool call aborted"), std::string::npos);
    EXPECT_EQ(server->CountSent("tools/call"), 0);
}

TEST_F(ShellFixture, PromptedValueIsSent) {
    const std::string text = run("call echo repeat\nhello there\nexit\n");
    EXPECT_NE(text.find("Text to echo"), std::string::npos);
    EXPECT_NE(text.find("hello there"), std::string::npos);
    EXPECT_EQ(server->CountSent("tools/call"), 1);
}

TEST_F(ShellFixture, ConfirmationGuardsCalls) {
    ShellOptions options;
    options.confirmCalls = true;
    const std::string declined = run("call echo repeat {\"text\":\"x\"}\nn\nexit\n", options);
    EXPECT_NE(declined.find("Tool execution cancelled"), std::string::npos);
    EXPECT_EQ(server->CountSent("tools/call"), 0);

    const std::string accepted = run("call echo repeat {\"text\":\"x\"}\nyes\nexit\n", options);
    EXPECT_NE(accepted.find("Result:"), std::string::npos);
    EXPECT_EQ(server->CountSent("tools/call"), 1);
}

TEST_F(ShellFixture, ConnectInfoAndDisconnect) {
    const std::string text = run("connect echo\ninfo echo repeat\ntools echo\ndisconnect echo\nservers\n");
    EXPECT_NE(text.find("Connected to echo"), std::string::npos);
    EXPECT_NE(text.find("input schema"), std::string::npos);
    EXPECT_NE(text.find("repeat - repeat tool"), std::string::npos);
    EXPECT_NE(text.find("Disconnected from echo"), std::string::npos);
    EXPECT_FALSE(registry->IsConnected("echo"));
}

TEST_F(ShellFixture, ConnectAllConnectsEveryServer) {
    in.str("");
    CommandShell shell(*client, in, out, ShellOptions{false, false, true});
    shell.ConnectAll();
    EXPECT_TRUE(registry->IsConnected("echo"));
    EXPECT_NE(out.str().find("Connected to echo"), std::string::npos);
}
