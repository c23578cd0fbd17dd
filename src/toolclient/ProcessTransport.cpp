//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport: fork/exec, newline framing over pipes, epoll reader, close escalation
//==========================================================================================================

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolclient/ContentFramer.h"
#include "toolclient/ProcessTransport.hpp"
#include "toolclient/errors/Errors.h"

extern char** environ;

namespace toolclient {

using errors::ErrorKind;
using errors::ToolClientError;

namespace {
std::once_flag gSigpipeOnce;

// Writes to a pipe whose reader exited must surface as EPIPE, not kill the client.
void ignoreSigpipe() {
    std::call_once(gSigpipeOnce, []() {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        ::sigemptyset(&sa.sa_mask);
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
            LOG_WARN("ProcessTransport: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool setNonBlocking(int fd) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    return fl >= 0 && ::fcntl(fd, F_SETFL, fl | O_NONBLOCK) == 0;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Child environment: parent environment with overrides applied.
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

// Runs in the forked child; only async-signal-safe calls from here on.
[[noreturn]] void execChild(int stdinFd, int stdoutFd, int errFd, const char* cwd,
                            const char* file, char* const* argv, char* const* envp) {
    auto report = [errFd](int code) {
        ssize_t ignored = ::write(errFd, &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    };
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    ::sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);

    if (stdinFd == STDIN_FILENO) {
        ::fcntl(stdinFd, F_SETFD, 0);
    } else if (::dup2(stdinFd, STDIN_FILENO) < 0) {
        report(errno);
    }
    if (stdoutFd == STDOUT_FILENO) {
        ::fcntl(stdoutFd, F_SETFD, 0);
    } else if (::dup2(stdoutFd, STDOUT_FILENO) < 0) {
        report(errno);
    }
    if (cwd != nullptr && ::chdir(cwd) != 0) {
        report(errno);
    }
    ::execvpe(file, argv, envp);
    report(errno);
    ::_exit(127);
}
} // namespace

ProcessTransportOptions ProcessTransportOptions::FromEnvironment() {
    ProcessTransportOptions o;
    o.startupTimeout = std::chrono::milliseconds(
        GetEnvUintOrDefault("TOOLCLIENT_STARTUP_TIMEOUT_MS", static_cast<std::uint64_t>(o.startupTimeout.count())));
    o.writeTimeout = std::chrono::milliseconds(
        GetEnvUintOrDefault("TOOLCLIENT_WRITE_TIMEOUT_MS", static_cast<std::uint64_t>(o.writeTimeout.count())));
    o.closeGrace = std::chrono::milliseconds(
        GetEnvUintOrDefault("TOOLCLIENT_CLOSE_GRACE_MS", static_cast<std::uint64_t>(o.closeGrace.count())));
    return o;
}

class ProcessTransport::Impl {
public:
    ServerSpec spec;
    ProcessTransportOptions options;
    std::unique_ptr<IContentFramer> framer;

    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    bool started{false};
    bool closed{false};
    std::mutex lifecycleMutex;

    // Process state; pid is -1 once reaped.
    mutable std::mutex procMutex;
    pid_t pid{-1};
    std::optional<int> exitStatus;

    int stdinFd{-1};
    int stdoutFd{-1};
    int wakeEventFd{-1};

    std::mutex writeMutex;
    std::thread readerThread;

    MessageHandler messageHandler;
    ErrorHandler errorHandler;
    CloseHandler closeHandler;

    Impl(ServerSpec s, ProcessTransportOptions o)
        : spec(std::move(s)), options(o), framer(MakeNewlineFramer(o.maxFrameBytes)) {}

    //------------------------------------------------------------------------------------------------------
    // Process control
    //------------------------------------------------------------------------------------------------------
    void launch() {
        ignoreSigpipe();

        int inPipe[2] = {-1, -1};
        int outPipe[2] = {-1, -1};
        int errPipe[2] = {-1, -1};
        auto cleanup = [&]() {
            for (int* p : {inPipe, outPipe, errPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 || ::pipe2(errPipe, O_CLOEXEC) != 0) {
            int err = errno;
            cleanup();
            throw ToolClientError(ErrorKind::LaunchError,
                                  "server '" + spec.name + "': pipe creation failed: " + ::strerror(err));
        }

        // Everything the child needs is built before fork.
        std::vector<std::string> argStore;
        argStore.push_back(spec.command);
        argStore.insert(argStore.end(), spec.args.begin(), spec.args.end());
        std::vector<char*> argv;
        for (auto& a : argStore) argv.push_back(a.data());
        argv.push_back(nullptr);
        std::vector<std::string> envStore = buildEnvironment(spec.env);
        std::vector<char*> envp;
        for (auto& e : envStore) envp.push_back(e.data());
        envp.push_back(nullptr);
        const char* cwd = spec.cwd.has_value() ? spec.cwd->c_str() : nullptr;

        pid_t child = ::fork();
        if (child < 0) {
            int err = errno;
            cleanup();
            throw ToolClientError(ErrorKind::LaunchError,
                                  "server '" + spec.name + "': fork failed: " + ::strerror(err));
        }
        if (child == 0) {
            execChild(inPipe[0], outPipe[1], errPipe[1], cwd, spec.command.c_str(), argv.data(), envp.data());
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        {
            std::lock_guard<std::mutex> lk(procMutex);
            pid = child;
        }

        // The exec-error pipe closes on successful exec (CLOEXEC) or carries errno on failure.
        int execErr = 0;
        bool timedOut = false;
        auto deadline = std::chrono::steady_clock::now() + options.startupTimeout;
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) { timedOut = true; break; }
            struct pollfd pfd{errPipe[0], POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0) {
                if (errno == EINTR) continue;
                execErr = errno;
                break;
            }
            if (rc == 0) { timedOut = true; break; }
            ssize_t n = ::read(errPipe[0], &execErr, sizeof(execErr));
            if (n < 0 && errno == EINTR) continue;
            if (n == 0) execErr = 0;
            break;
        }
        closeFd(errPipe[0]);

        if (timedOut || execErr != 0) {
            if (timedOut) {
                ::kill(child, SIGKILL);
            }
            reap(true);
            closeFd(inPipe[1]);
            closeFd(outPipe[0]);
            std::string detail = timedOut
                ? "did not start within " + std::to_string(options.startupTimeout.count()) + " ms"
                : "cannot execute '" + spec.command + "': " + ::strerror(execErr);
            LOG_ERROR("ProcessTransport: server '{}' {}", spec.name, detail);
            throw ToolClientError(ErrorKind::LaunchError, "server '" + spec.name + "': " + detail);
        }

        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        if (!setNonBlocking(stdinFd) || !setNonBlocking(stdoutFd)) {
            LOG_WARN("ProcessTransport: failed to set non-blocking pipes (errno={} msg={})", errno, ::strerror(errno));
        }
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            int err = errno;
            ::kill(child, SIGKILL);
            reap(true);
            closeFd(stdinFd);
            closeFd(stdoutFd);
            throw ToolClientError(ErrorKind::LaunchError,
                                  "server '" + spec.name + "': eventfd failed: " + ::strerror(err));
        }
        LOG_INFO("ProcessTransport: launched '{}' (pid={})", spec.CommandLine(), child);
    }

    // Reaps the child. Non-blocking unless block is set. Returns true once the child is gone.
    bool reap(bool block) {
        std::lock_guard<std::mutex> lk(procMutex);
        if (pid <= 0) {
            return true;
        }
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == pid) {
            exitStatus = decodeWaitStatus(status);
            LOG_DEBUG("ProcessTransport: '{}' exited with status {}", spec.name, *exitStatus);
            pid = -1;
            return true;
        }
        if (r < 0) {
            // ECHILD: already reaped elsewhere.
            pid = -1;
            return true;
        }
        return false;
    }

    bool waitForExit(std::chrono::milliseconds timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!reap(false)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    void signalChild(int sig) {
        std::lock_guard<std::mutex> lk(procMutex);
        if (pid > 0) {
            ::kill(pid, sig);
        }
    }

    void stopProcess() {
        closeFd(stdinFd);
        if (waitForExit(options.closeGrace)) {
            return;
        }
        LOG_WARN("ProcessTransport: '{}' did not exit after stdin close; sending SIGTERM", spec.name);
        signalChild(SIGTERM);
        if (waitForExit(options.closeGrace)) {
            return;
        }
        LOG_WARN("ProcessTransport: '{}' ignored SIGTERM; sending SIGKILL", spec.name);
        signalChild(SIGKILL);
        reap(true);
    }

    //------------------------------------------------------------------------------------------------------
    // Reader
    //------------------------------------------------------------------------------------------------------
    void wakeReader() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("ProcessTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void deliver(const std::string& payload) {
        LOG_DEBUG("ProcessTransport[{}] <- {}", spec.name, payload);
        if (messageHandler) {
            messageHandler(payload);
        }
    }

    // Returns false when an oversized frame ended the stream.
    bool drainFrames(std::string& buffer) {
        while (!closing.load()) {
            auto r = framer->tryDecodeEx(buffer);
            switch (r.status) {
                case IContentFramer::DecodeStatus::Ok:
                    buffer.erase(0, r.bytesConsumed);
                    deliver(*r.payload);
                    continue;
                case IContentFramer::DecodeStatus::EmptyFrame:
                    buffer.erase(0, r.bytesConsumed);
                    continue;
                case IContentFramer::DecodeStatus::FrameTooLarge:
                    buffer.clear();
                    return false;
                case IContentFramer::DecodeStatus::Incomplete:
                    return true;
            }
        }
        return true;
    }

    void readerLoop() {
        TransportCloseInfo info;
        std::string buffer;
        std::vector<char> tmp(64 * 1024);

        int ep = ::epoll_create1(EPOLL_CLOEXEC);
        if (ep < 0) {
            info.error = true;
            info.reason = std::string("epoll_create1 failed: ") + ::strerror(errno);
        } else {
            epoll_event evIn{}; evIn.events = EPOLLIN | EPOLLRDHUP; evIn.data.fd = stdoutFd;
            epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, stdoutFd, &evIn) != 0 ||
                ::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake) != 0) {
                info.error = true;
                info.reason = std::string("epoll_ctl failed: ") + ::strerror(errno);
            }
        }

        bool ended = info.error;
        while (!ended && !closing.load()) {
            epoll_event events[2];
            int rc = ::epoll_wait(ep, events, 2, -1);
            if (rc < 0) {
                if (errno == EINTR) continue;
                info.error = true;
                info.reason = std::string("epoll_wait failed: ") + ::strerror(errno);
                break;
            }
            bool readable = false;
            for (int k = 0; k < rc; ++k) {
                if (events[k].data.fd == wakeEventFd) {
                    uint64_t v = 0;
                    ssize_t r = ::read(wakeEventFd, &v, sizeof(v));
                    (void)r;
                } else {
                    readable = true;
                }
            }
            if (closing.load()) break;
            if (!readable) continue;

            // Drain everything currently available; EPOLLRDHUP alone still ends in a read() of 0.
            while (true) {
                ssize_t n = ::read(stdoutFd, tmp.data(), tmp.size());
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                    continue;
                }
                if (n == 0) {
                    info.reason = "end of stream";
                    ended = true;
                } else if (errno == EINTR) {
                    continue;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    info.error = true;
                    info.reason = std::string("read failed: ") + ::strerror(errno);
                    ended = true;
                }
                break;
            }
            if (!drainFrames(buffer)) {
                info.error = true;
                info.reason = "inbound frame exceeds " + std::to_string(options.maxFrameBytes) + " bytes";
                if (errorHandler) {
                    errorHandler("ProcessTransport: " + info.reason);
                }
                ended = true;
            }
        }
        if (ep >= 0) {
            ::close(ep);
        }
        if (closing.load()) {
            return;
        }

        // A final line without a terminator is still a message.
        if (!info.error && !buffer.empty()) {
            buffer.push_back('\n');
            drainFrames(buffer);
        }
        connected = false;
        // Give the child a moment to exit so the status can be reported.
        waitForExit(std::chrono::milliseconds(200));
        {
            std::lock_guard<std::mutex> lk(procMutex);
            info.exitStatus = exitStatus;
        }
        if (info.error) {
            LOG_ERROR("ProcessTransport: '{}' {}", spec.name, info.reason);
            if (errorHandler) {
                errorHandler("ProcessTransport: " + info.reason);
            }
        } else {
            LOG_INFO("ProcessTransport: '{}' closed its output (exit status {})", spec.name,
                     info.exitStatus.has_value() ? std::to_string(*info.exitStatus) : std::string("unknown"));
        }
        if (closeHandler && !closing.load()) {
            closeHandler(info);
        }
    }

    void joinReader() {
        if (!readerThread.joinable()) {
            return;
        }
        if (readerThread.get_id() == std::this_thread::get_id()) {
            // Close() requested from a handler; the loop exits as soon as the handler returns.
            readerThread.detach();
        } else {
            readerThread.join();
        }
    }
};

ProcessTransport::ProcessTransport(ServerSpec spec, ProcessTransportOptions options)
    : pImpl(std::make_unique<Impl>(std::move(spec), options)) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    Close().get();
}

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
    if (pImpl->started) {
        promise.set_exception(std::make_exception_ptr(
            ToolClientError(ErrorKind::LaunchError, "server '" + pImpl->spec.name + "': transport already started")));
        return promise.get_future();
    }
    pImpl->started = true;
    try {
        pImpl->launch();
    } catch (const ToolClientError&) {
        pImpl->closed = true;
        promise.set_exception(std::current_exception());
        return promise.get_future();
    }
    pImpl->connected = true;
    pImpl->readerThread = std::thread([this]() { pImpl->readerLoop(); });
    promise.set_value();
    return promise.get_future();
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> promise;
    {
        std::lock_guard<std::mutex> lk(pImpl->lifecycleMutex);
        if (pImpl->closed || !pImpl->started) {
            pImpl->closed = true;
            promise.set_value();
            return promise.get_future();
        }
        pImpl->closed = true;
    }
    LOG_INFO("ProcessTransport: closing '{}'", pImpl->spec.name);
    pImpl->closing = true;
    pImpl->connected = false;
    {
        // No frame may be half-written when stdin goes away.
        std::lock_guard<std::mutex> wl(pImpl->writeMutex);
        pImpl->stopProcess();
    }
    pImpl->wakeReader();
    pImpl->joinReader();
    closeFd(pImpl->stdoutFd);
    closeFd(pImpl->wakeEventFd);
    promise.set_value();
    return promise.get_future();
}

bool ProcessTransport::IsConnected() const {
    return pImpl->connected.load();
}

pid_t ProcessTransport::GetProcessId() const {
    std::lock_guard<std::mutex> lk(pImpl->procMutex);
    return pImpl->pid;
}

void ProcessTransport::Send(const std::string& payload) {
    if (!pImpl->connected.load()) {
        throw ToolClientError(ErrorKind::TransportError, "server '" + pImpl->spec.name + "': transport not connected");
    }
    const std::string frame = pImpl->framer->encode(payload);
    LOG_DEBUG("ProcessTransport[{}] -> {}", pImpl->spec.name, payload);

    std::lock_guard<std::mutex> lk(pImpl->writeMutex);
    const int fd = pImpl->stdinFd;
    if (fd < 0) {
        throw ToolClientError(ErrorKind::TransportError, "server '" + pImpl->spec.name + "': stdin closed");
    }
    auto deadline = std::chrono::steady_clock::now() + pImpl->options.writeTimeout;
    std::size_t off = 0;
    while (off < frame.size()) {
        ssize_t w = ::write(fd, frame.data() + off, frame.size() - off);
        if (w > 0) {
            off += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) {
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                LOG_ERROR("ProcessTransport: write timeout ({} ms) to '{}'", pImpl->options.writeTimeout.count(), pImpl->spec.name);
                pImpl->connected = false;
                throw ToolClientError(ErrorKind::TransportError, "server '" + pImpl->spec.name + "': write timed out");
            }
            struct pollfd pfd{fd, POLLOUT, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
            if (rc < 0 && errno != EINTR) {
                pImpl->connected = false;
                throw ToolClientError(ErrorKind::TransportError,
                                      "server '" + pImpl->spec.name + "': poll failed: " + ::strerror(errno));
            }
            continue;
        }
        const int err = (w < 0) ? errno : EIO;
        LOG_ERROR("ProcessTransport: write error to '{}' (errno={} msg={})", pImpl->spec.name, err, ::strerror(err));
        pImpl->connected = false;
        throw ToolClientError(ErrorKind::TransportError,
                              "server '" + pImpl->spec.name + "': write failed: " + ::strerror(err));
    }
}

void ProcessTransport::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void ProcessTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void ProcessTransport::SetCloseHandler(CloseHandler handler) {
    pImpl->closeHandler = std::move(handler);
}

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport(const ServerSpec& spec) {
    FUNC_SCOPE();
    return std::make_unique<ProcessTransport>(spec, options);
}

} // namespace toolclient
