//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session state machine, request correlation and the per-session request worker
//==========================================================================================================

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolclient/JsonRpcMessageRouter.h"
#include "toolclient/Session.h"
#include "toolclient/errors/Errors.h"
#include "toolclient/validation/Validators.h"
#include "toolclient/version.h"

namespace toolclient {

using errors::ErrorKind;
using errors::Failure;
using errors::ToolClientError;

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Ready: return "Ready";
        case SessionState::Closing: return "Closing";
        case SessionState::Closed: return "Closed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

SessionOptions SessionOptions::FromEnvironment() {
    SessionOptions o;
    o.handshakeTimeout = std::chrono::milliseconds(
        GetEnvUintOrDefault("TOOLCLIENT_HANDSHAKE_TIMEOUT_MS", static_cast<std::uint64_t>(o.handshakeTimeout.count())));
    o.callTimeout = std::chrono::milliseconds(
        GetEnvUintOrDefault("TOOLCLIENT_CALL_TIMEOUT_MS", static_cast<std::uint64_t>(o.callTimeout.count())));
    o.validationMode = validation::parseMode(GetEnvOrDefault("TOOLCLIENT_VALIDATION", "off"));
    o.clientInfo = Implementation("toolclient", getVersionString());
    return o;
}

namespace {
// Guard against servers that keep returning the same cursor.
constexpr std::size_t kMaxCatalogPages = 1000;

bool isTerminal(SessionState s) {
    return s == SessionState::Closed || s == SessionState::Failed;
}

void logServerMessage(const std::string& server, const JSONValue& params) {
    const std::string level = getStringField(params, "level").value_or("info");
    const JSONValue* data = findField(params, "data");
    std::string text;
    if (data != nullptr) {
        text = data->isString() ? std::get<std::string>(data->value) : serializeJSONValue(*data);
    }
    if (auto logger = getStringField(params, "logger")) {
        text = *logger + ": " + text;
    }
    if (level == "debug") {
        LOG_DEBUG("server '{}': {}", server, text);
    } else if (level == "info" || level == "notice") {
        LOG_INFO("server '{}': {}", server, text);
    } else if (level == "warning") {
        LOG_WARN("server '{}': {}", server, text);
    } else {
        LOG_ERROR("server '{}' [{}]: {}", server, level, text);
    }
}
} // namespace

class Session::Impl {
public:
    // One queued unit of work; abort runs instead of run when the session goes away first.
    struct Job {
        std::function<void()> run;
        std::function<void(const Failure&)> abort;
    };

    // Recorded by the reader thread when the transport ends underneath the session.
    struct Loss {
        SessionState finalState;
        std::string reason;
    };

    using PendingMap = std::unordered_map<int64_t, std::shared_ptr<std::promise<JSONRPCResponse>>>;

    ServerSpec spec;
    std::shared_ptr<ITransportFactory> factory;
    SessionOptions options;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    mutable std::mutex mutex;
    std::condition_variable cv;
    SessionState state{SessionState::Disconnected};
    bool tearingDown{false};
    std::optional<Loss> lost;

    std::unique_ptr<ITransport> transport;
    int64_t lastId{0};
    PendingMap inflight;

    std::deque<Job> queue;
    bool workerStop{false};
    std::thread worker;
    std::thread::id workerId;

    std::optional<std::chrono::steady_clock::time_point> lastTimeout;

    InitializeResult serverInfo;
    std::vector<ToolDescriptor> tools;
    std::vector<ResourceDescriptor> resources;

    std::mutex connectMutex;

    Impl(ServerSpec s, std::shared_ptr<ITransportFactory> f, SessionOptions o)
        : spec(std::move(s)), factory(std::move(f)), options(std::move(o)),
          router(MakeDefaultJsonRpcMessageRouter()) {}

    std::string label() const { return "server '" + spec.name + "'"; }

    ToolClientError notConnected(const std::string& detail) const {
        return ToolClientError(ErrorKind::NotConnected, label() + " " + detail);
    }

    //------------------------------------------------------------------------------------------------------
    // Inbound traffic (reader thread)
    //------------------------------------------------------------------------------------------------------
    void installHandlers(ITransport& t) {
        ITransport* raw = &t;
        t.SetMessageHandler([this, raw](const std::string& payload) { onMessage(*raw, payload); });
        t.SetErrorHandler([this](const std::string& error) {
            LOG_WARN("{} transport error: {}", label(), error);
        });
        t.SetCloseHandler([this](const TransportCloseInfo& info) { onTransportClosed(info); });
    }

    void onMessage(ITransport& t, const std::string& payload) {
        RouterHandlers handlers;
        handlers.requestHandler = [this](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
            if (req.method == Methods::Ping) {
                return std::make_unique<JSONRPCResponse>(req.id, JSONValue(JSONValue::Object{}));
            }
            LOG_DEBUG("{} sent unsupported request '{}'", label(), req.method);
            return nullptr;
        };
        handlers.notificationHandler = [this](const JSONRPCNotification& n) { onNotification(n); };
        handlers.errorHandler = [this](const std::string& err) {
            LOG_WARN("{}: {}", label(), err);
        };
        auto reply = router->route(payload, handlers, [this](JSONRPCResponse&& r) { resolve(std::move(r)); });
        if (reply.has_value()) {
            try {
                t.Send(*reply);
            } catch (const ToolClientError& e) {
                LOG_WARN("{}: failed to answer server request: {}", label(), e.what());
            }
        }
    }

    void onNotification(const JSONRPCNotification& n) {
        if (n.method == Methods::Log) {
            logServerMessage(spec.name, n.params.value_or(JSONValue{}));
        } else if (n.method == Methods::ToolListChanged) {
            LOG_INFO("{} reports its tool list changed; run refresh to reload it", label());
        } else {
            LOG_DEBUG("{} notification '{}' ignored", label(), n.method);
        }
    }

    void resolve(JSONRPCResponse&& response) {
        std::shared_ptr<std::promise<JSONRPCResponse>> promise;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (const auto* id = std::get_if<int64_t>(&response.id)) {
                auto it = inflight.find(*id);
                if (it != inflight.end()) {
                    promise = std::move(it->second);
                    inflight.erase(it);
                }
            }
        }
        if (!promise) {
            LOG_DEBUG("{}: discarding response for abandoned id {}", label(), idToString(response.id));
            return;
        }
        promise->set_value(std::move(response));
    }

    void onTransportClosed(const TransportCloseInfo& info) {
        PendingMap pending;
        std::string reason = info.reason;
        if (info.exitStatus.has_value()) {
            reason += " (exit status " + std::to_string(*info.exitStatus) + ")";
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (tearingDown || isTerminal(state) || lost.has_value()) {
                return;
            }
            SessionState finalState = SessionState::Closed;
            if (info.error || state == SessionState::Connecting) {
                finalState = SessionState::Failed;
            }
            lost = Loss{finalState, "connection lost: " + reason};
            if (state == SessionState::Ready) {
                state = SessionState::Closing;
            }
            pending.swap(inflight);
            cv.notify_all();
        }
        LOG_WARN("{} connection lost: {}", label(), reason);
        failPending(pending, notConnected("connection lost: " + reason));
    }

    static void failPending(PendingMap& pending, const ToolClientError& err) {
        for (auto& [id, p] : pending) {
            p->set_exception(std::make_exception_ptr(err));
        }
        pending.clear();
    }

    //------------------------------------------------------------------------------------------------------
    // Outbound exchanges
    //------------------------------------------------------------------------------------------------------
    //======================================================================================================
    // exchange
    // Purpose: Sends one request and waits for its response.
    // Throws:
    //   NotConnected when the session is going away, TransportError when the write fails,
    //   Timeout when no response arrives in time (the id is abandoned).
    //======================================================================================================
    JSONRPCResponse exchange(const char* method, std::optional<JSONValue> params, std::chrono::milliseconds timeout) {
        auto promise = std::make_shared<std::promise<JSONRPCResponse>>();
        auto future = promise->get_future();
        int64_t id = 0;
        ITransport* t = nullptr;
        {
            std::lock_guard<std::mutex> lk(mutex);
            const bool usable = state == SessionState::Ready || state == SessionState::Connecting;
            if (!usable || tearingDown || lost.has_value() || !transport) {
                throw notConnected("is not connected");
            }
            id = ++lastId;
            inflight[id] = promise;
            t = transport.get();
        }
        JSONRPCRequest request(id, method, std::move(params));
        try {
            t->Send(request.Serialize());
        } catch (const ToolClientError&) {
            abandon(id);
            throw;
        }
        if (future.wait_for(timeout) != std::future_status::ready) {
            abandon(id);
            throw ToolClientError(ErrorKind::Timeout, label() + ": no response to '" + method + "' within " +
                                  std::to_string(timeout.count()) + " ms");
        }
        return future.get();
    }

    void abandon(int64_t id) {
        std::lock_guard<std::mutex> lk(mutex);
        inflight.erase(id);
    }

    void notify(const char* method, std::optional<JSONValue> params) {
        ITransport* t = nullptr;
        {
            std::lock_guard<std::mutex> lk(mutex);
            t = transport.get();
        }
        if (t == nullptr) {
            throw notConnected("is not connected");
        }
        t->Send(JSONRPCNotification(method, std::move(params)).Serialize());
    }

    // Throws ServerError on an error response or missing result.
    static const JSONValue& requireResult(const JSONRPCResponse& response, const char* method) {
        if (response.IsError()) {
            throw ToolClientError(ErrorKind::ServerError,
                                  std::string(method) + " failed: " + errors::describeRpcError(response));
        }
        if (!response.result.has_value()) {
            throw ToolClientError(ErrorKind::ServerError, std::string(method) + " returned no result");
        }
        return response.result.value();
    }

    std::vector<ToolDescriptor> fetchTools(std::chrono::milliseconds timeout) {
        std::vector<ToolDescriptor> out;
        std::set<std::string> seenCursors;
        std::optional<std::string> cursor;
        for (std::size_t page = 0; page < kMaxCatalogPages; ++page) {
            JSONRPCResponse resp = exchange(Methods::ListTools, MakeListParams(cursor), timeout);
            ToolsListPage parsed = ParseToolsListPage(requireResult(resp, Methods::ListTools));
            for (auto& tool : parsed.tools) {
                out.push_back(std::move(tool));
            }
            if (!parsed.nextCursor.has_value() || !seenCursors.insert(*parsed.nextCursor).second) {
                break;
            }
            cursor = parsed.nextCursor;
        }
        return out;
    }

    std::vector<ResourceDescriptor> fetchResources(std::chrono::milliseconds timeout) {
        std::vector<ResourceDescriptor> out;
        std::set<std::string> seenCursors;
        std::optional<std::string> cursor;
        for (std::size_t page = 0; page < kMaxCatalogPages; ++page) {
            JSONRPCResponse resp = exchange(Methods::ListResources, MakeListParams(cursor), timeout);
            ResourcesListPage parsed = ParseResourcesListPage(requireResult(resp, Methods::ListResources));
            for (auto& r : parsed.resources) {
                out.push_back(std::move(r));
            }
            if (!parsed.nextCursor.has_value() || !seenCursors.insert(*parsed.nextCursor).second) {
                break;
            }
            cursor = parsed.nextCursor;
        }
        return out;
    }

    //------------------------------------------------------------------------------------------------------
    // Handshake
    //------------------------------------------------------------------------------------------------------
    void handshake() {
        JSONRPCResponse resp = exchange(Methods::Initialize, MakeInitializeParams(options.clientInfo),
                                        options.handshakeTimeout);
        if (resp.IsError()) {
            throw ToolClientError(ErrorKind::ConnectError, "initialize rejected: " + errors::describeRpcError(resp));
        }
        if (!resp.result.has_value()) {
            throw ToolClientError(ErrorKind::ConnectError, "initialize returned no result");
        }
        InitializeResult init = ParseInitializeResult(resp.result.value());
        LOG_INFO("{} initialized: {} {} (protocol {})", label(), init.serverInfo.name, init.serverInfo.version,
                 init.protocolVersion);
        notify(Methods::Initialized, std::nullopt);

        std::vector<ToolDescriptor> discovered;
        if (init.capabilities.tools.has_value()) {
            discovered = fetchTools(options.handshakeTimeout);
        } else {
            LOG_INFO("{} does not advertise tools", label());
        }
        std::vector<ResourceDescriptor> discoveredResources;
        if (init.capabilities.resources.has_value()) {
            try {
                discoveredResources = fetchResources(options.handshakeTimeout);
            } catch (const ToolClientError& e) {
                if (e.kind() != ErrorKind::ServerError) {
                    throw;
                }
                LOG_WARN("{}: resource listing failed: {}", label(), e.what());
            }
        }

        std::lock_guard<std::mutex> lk(mutex);
        serverInfo = std::move(init);
        tools = std::move(discovered);
        resources = std::move(discoveredResources);
    }

    //------------------------------------------------------------------------------------------------------
    // Worker
    //------------------------------------------------------------------------------------------------------
    void workerLoop() {
        while (true) {
            Job job;
            std::optional<Loss> loss;
            {
                std::unique_lock<std::mutex> lk(mutex);
                cv.wait(lk, [this]() { return workerStop || lost.has_value() || !queue.empty(); });
                if (workerStop) {
                    return;
                }
                if (lost.has_value()) {
                    loss = lost;
                } else {
                    job = std::move(queue.front());
                    queue.pop_front();
                }
            }
            if (loss.has_value()) {
                teardown(loss->finalState, loss->reason);
                return;
            }
            job.run();
        }
    }

    bool onWorkerThread() const {
        return std::this_thread::get_id() == workerId;
    }

    void joinWorker() {
        std::thread w;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (!worker.joinable() || onWorkerThread()) {
                return;
            }
            w = std::move(worker);
        }
        w.join();
    }

    // Returns true when the timeout escalates to closing the session.
    bool recordTimeout() {
        std::lock_guard<std::mutex> lk(mutex);
        const auto now = std::chrono::steady_clock::now();
        if (lastTimeout.has_value() && now - *lastTimeout <= options.timeoutEscalationWindow) {
            return true;
        }
        lastTimeout = now;
        return false;
    }

    void recordSuccess() {
        std::lock_guard<std::mutex> lk(mutex);
        lastTimeout.reset();
    }

    ToolCallResult runCall(const std::string& name, const JSONValue& arguments) {
        try {
            JSONRPCResponse resp = exchange(Methods::CallTool, MakeCallToolParams(name, arguments), options.callTimeout);
            recordSuccess();
            if (resp.IsError()) {
                return ToolCallResult::Fail(ErrorKind::ServerError, errors::describeRpcError(resp));
            }
            if (!resp.result.has_value()) {
                return ToolCallResult::Fail(ErrorKind::ServerError, "tool call returned no result");
            }
            return ParseToolCallResult(resp.result.value(), options.validationMode);
        } catch (const ToolClientError& e) {
            switch (e.kind()) {
                case ErrorKind::Timeout:
                    if (recordTimeout()) {
                        LOG_ERROR("{}: second call timeout, closing the session", label());
                        teardown(SessionState::Closed, "closed after repeated call timeouts");
                        return ToolCallResult::Fail(ErrorKind::Timeout,
                                                    std::string(e.what()) + "; session closed after repeated timeouts");
                    }
                    LOG_WARN("{}", e.what());
                    return ToolCallResult::Fail(ErrorKind::Timeout, e.what());
                case ErrorKind::TransportError:
                    teardown(SessionState::Failed, std::string("transport failure: ") + e.what());
                    return ToolCallResult::Fail(ErrorKind::TransportError, e.what());
                default:
                    return ToolCallResult::Fail(e.kind(), e.what());
            }
        } catch (const std::future_error& e) {
            return ToolCallResult::Fail(ErrorKind::NotConnected, label() + ": " + e.what());
        }
    }

    //------------------------------------------------------------------------------------------------------
    // Teardown
    //------------------------------------------------------------------------------------------------------
    //======================================================================================================
    // teardown
    // Purpose: Single exit path out of a live session. Fails queued and in-flight work with NotConnected,
    //          closes the transport, joins the worker (unless called on it) and publishes the final state.
    //          A terminal state is kept; a recorded transport loss decides between Closed and Failed.
    //======================================================================================================
    void teardown(SessionState finalState, const std::string& reason) {
        std::deque<Job> drained;
        PendingMap pending;
        std::unique_ptr<ITransport> t;
        SessionState target = finalState;
        {
            std::unique_lock<std::mutex> lk(mutex);
            if (tearingDown) {
                if (!onWorkerThread()) {
                    cv.wait(lk, [this]() { return !tearingDown; });
                }
                return;
            }
            tearingDown = true;
            if (isTerminal(state)) {
                target = state;
            } else {
                if (lost.has_value()) {
                    target = lost->finalState;
                }
                state = SessionState::Closing;
            }
            drained.swap(queue);
            pending.swap(inflight);
            workerStop = true;
            t = std::move(transport);
            cv.notify_all();
        }

        const ToolClientError err = notConnected(reason);
        failPending(pending, err);
        for (auto& job : drained) {
            job.abort(err.toFailure());
        }
        if (t) {
            t->Close().get();
            t.reset();
        }
        joinWorker();

        {
            std::lock_guard<std::mutex> lk(mutex);
            state = target;
            tearingDown = false;
            cv.notify_all();
        }
        LOG_INFO("{} is now {} ({})", label(), toString(target), reason);
    }
};

Session::Session(ServerSpec spec, std::shared_ptr<ITransportFactory> factory, SessionOptions options)
    : pImpl(std::make_unique<Impl>(std::move(spec), std::move(factory), std::move(options))) {
    FUNC_SCOPE();
}

Session::~Session() {
    FUNC_SCOPE();
    Disconnect();
}

const std::string& Session::Name() const {
    return pImpl->spec.name;
}

const ServerSpec& Session::Spec() const {
    return pImpl->spec;
}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->state;
}

void Session::Connect() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> connectGuard(pImpl->connectMutex);
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        switch (pImpl->state) {
            case SessionState::Ready:
                return;
            case SessionState::Closed:
            case SessionState::Closing:
                throw pImpl->notConnected("is closed");
            default:
                break;
        }
    }
    // A previous worker may still be parked after a failure.
    pImpl->joinWorker();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        // Disconnect() does not take connectMutex and may have closed the session meanwhile.
        if (pImpl->state != SessionState::Disconnected && pImpl->state != SessionState::Failed) {
            throw pImpl->notConnected("is closed");
        }
        pImpl->state = SessionState::Connecting;
        pImpl->lost.reset();
        pImpl->workerStop = false;
        pImpl->lastTimeout.reset();
        pImpl->tools.clear();
        pImpl->resources.clear();
    }
    LOG_INFO("Connecting to {} ({})", pImpl->label(), pImpl->spec.CommandLine());

    auto fail = [this](const std::string& reason) -> ToolClientError {
        pImpl->teardown(SessionState::Failed, reason);
        LOG_ERROR("Connect to {} failed: {}", pImpl->label(), reason);
        return ToolClientError(ErrorKind::ConnectError, pImpl->label() + ": " + reason);
    };

    std::unique_ptr<ITransport> t = pImpl->factory->CreateTransport(pImpl->spec);
    pImpl->installHandlers(*t);
    try {
        t->Start().get();
    } catch (const ToolClientError& e) {
        throw fail(e.what());
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state == SessionState::Connecting && !pImpl->tearingDown) {
            pImpl->transport = std::move(t);
        }
    }
    if (t) {
        // Disconnected while the process was starting.
        t->Close().get();
        throw ToolClientError(ErrorKind::ConnectError, pImpl->label() + ": disconnected during connect");
    }

    try {
        pImpl->handshake();
    } catch (const ToolClientError& e) {
        std::string reason = e.what();
        if (e.kind() == ErrorKind::Timeout) {
            reason = "handshake timed out: " + reason;
        }
        throw fail(reason);
    } catch (const std::future_error& e) {
        throw fail(e.what());
    }

    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state == SessionState::Connecting && !pImpl->lost.has_value() && !pImpl->tearingDown) {
            pImpl->state = SessionState::Ready;
            pImpl->worker = std::thread([impl = pImpl.get()]() { impl->workerLoop(); });
            pImpl->workerId = pImpl->worker.get_id();
            LOG_INFO("{} ready with {} tool(s)", pImpl->label(), pImpl->tools.size());
            return;
        }
    }
    throw fail("connection lost during handshake");
}

std::vector<ToolDescriptor> Session::ListTools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->state != SessionState::Ready) {
        throw pImpl->notConnected(std::string("is not connected (state ") + toString(pImpl->state) + ")");
    }
    return pImpl->tools;
}

std::optional<ToolDescriptor> Session::FindTool(const std::string& name) const {
    for (const auto& tool : ListTools()) {
        if (tool.name == name) {
            return tool;
        }
    }
    return std::nullopt;
}

std::vector<ResourceDescriptor> Session::ListResources() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->state != SessionState::Ready) {
        throw pImpl->notConnected(std::string("is not connected (state ") + toString(pImpl->state) + ")");
    }
    return pImpl->resources;
}

InitializeResult Session::ServerInfo() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->state != SessionState::Ready) {
        throw pImpl->notConnected(std::string("is not connected (state ") + toString(pImpl->state) + ")");
    }
    return pImpl->serverInfo;
}

std::future<ToolCallResult> Session::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<ToolCallResult>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->state != SessionState::Ready || pImpl->tearingDown) {
        promise->set_value(ToolCallResult::Fail(ErrorKind::NotConnected,
            pImpl->label() + " is not connected (state " + toString(pImpl->state) + ")"));
        return future;
    }
    const ToolDescriptor* tool = nullptr;
    for (const auto& t : pImpl->tools) {
        if (t.name == name) { tool = &t; break; }
    }
    if (tool == nullptr) {
        promise->set_value(ToolCallResult::Fail(ErrorKind::UnknownTool, pImpl->label() + " has no tool '" + name + "'"));
        return future;
    }
    if (auto problem = validation::checkToolArguments(tool->inputSchema, arguments)) {
        promise->set_value(ToolCallResult::Fail(ErrorKind::InvalidArguments, "tool '" + name + "': " + *problem));
        return future;
    }

    Impl* impl = pImpl.get();
    Impl::Job job;
    job.run = [impl, promise, name, arguments]() {
        promise->set_value(impl->runCall(name, arguments));
    };
    job.abort = [promise](const Failure& f) {
        promise->set_value(ToolCallResult::Fail(f.kind, f.message));
    };
    pImpl->queue.push_back(std::move(job));
    pImpl->cv.notify_all();
    return future;
}

std::vector<ToolDescriptor> Session::RefreshTools() {
    FUNC_SCOPE();
    auto promise = std::make_shared<std::promise<std::vector<ToolDescriptor>>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state != SessionState::Ready || pImpl->tearingDown) {
            throw pImpl->notConnected(std::string("is not connected (state ") + toString(pImpl->state) + ")");
        }
        Impl* impl = pImpl.get();
        Impl::Job job;
        job.run = [impl, promise]() {
            try {
                std::vector<ToolDescriptor> fresh = impl->fetchTools(impl->options.callTimeout);
                impl->recordSuccess();
                {
                    std::lock_guard<std::mutex> inner(impl->mutex);
                    impl->tools = fresh;
                }
                promise->set_value(std::move(fresh));
            } catch (const ToolClientError& e) {
                if (e.kind() == ErrorKind::TransportError) {
                    impl->teardown(SessionState::Failed, std::string("transport failure: ") + e.what());
                }
                promise->set_exception(std::current_exception());
            }
        };
        job.abort = [promise](const Failure& f) {
            promise->set_exception(std::make_exception_ptr(ToolClientError(f.kind, f.message)));
        };
        pImpl->queue.push_back(std::move(job));
        pImpl->cv.notify_all();
    }
    return future.get();
}

void Session::Disconnect() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state == SessionState::Disconnected) {
            pImpl->state = SessionState::Closed;
            return;
        }
    }
    pImpl->teardown(SessionState::Closed, "disconnected");
    pImpl->joinWorker();
}

} // namespace toolclient
