//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that launches a tool server as a child process and talks to it over its stdio
//==========================================================================================================
#pragma once

#include "toolclient/Transport.h"
#include "toolclient/ServerSpec.h"
#include <chrono>
#include <memory>
#include <cstdint>
#include <sys/types.h>

namespace toolclient {

//==========================================================================================================
// ProcessTransportOptions
// Purpose: Timing and size limits of a process transport.
// Fields:
//   startupTimeout: Bound on fork+exec; LaunchError when exceeded.
//   writeTimeout: Bound on writing one frame into the child's stdin.
//   closeGrace: Wait after closing the child's stdin, and again after SIGTERM, before escalating.
//   maxFrameBytes: Largest inbound line accepted from the child.
//==========================================================================================================
struct ProcessTransportOptions {
    std::chrono::milliseconds startupTimeout{5000};
    std::chrono::milliseconds writeTimeout{10000};
    std::chrono::milliseconds closeGrace{2000};
    std::size_t maxFrameBytes{16 * 1024 * 1024};

    // Defaults overridden by TOOLCLIENT_STARTUP_TIMEOUT_MS / TOOLCLIENT_WRITE_TIMEOUT_MS / TOOLCLIENT_CLOSE_GRACE_MS.
    static ProcessTransportOptions FromEnvironment();
};

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process and its stdin/stdout pipes. Frames are newline-delimited JSON; the
//          child's stderr is inherited so server diagnostics reach the operator's terminal.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(ServerSpec spec, ProcessTransportOptions options = ProcessTransportOptions{});
    virtual ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Launches the child and starts the reader loop.
    // Returns:
    //   Ready future; holds ToolClientError(LaunchError) when the executable is missing, not executable,
    //   the working directory is invalid, or exec does not complete within startupTimeout.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the child's stdin, waits closeGrace, then SIGTERM, then SIGKILL; reaps the child and joins
    // the reader. Idempotent.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    void Send(const std::string& payload) override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;

    // Child pid while running, -1 before Start() or after reaping.
    pid_t GetProcessId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessTransportFactory
// Purpose: Default factory used by the connection registry.
//==========================================================================================================
class ProcessTransportFactory : public ITransportFactory {
public:
    explicit ProcessTransportFactory(ProcessTransportOptions options = ProcessTransportOptions::FromEnvironment())
        : options(options) {}
    std::unique_ptr<ITransport> CreateTransport(const ServerSpec& spec) override;

private:
    ProcessTransportOptions options;
};

} // namespace toolclient
