//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeToolServer.h
// Purpose: Scriptable in-process tool server and transport for session, registry and console tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "toolclient/JSONRPCTypes.h"
#include "toolclient/Protocol.h"
#include "toolclient/ServerSpec.h"
#include "toolclient/Transport.h"
#include "toolclient/errors/Errors.h"

namespace toolclient {
namespace testing {

// How the fake answers tools/call.
enum class CallMode {
    Echo,       // content text = arguments.text (or the serialized arguments)
    Silent,     // never answers
    EndStream,  // ends the stream instead of answering
    RpcError    // JSON-RPC error "boom"
};

inline ToolDescriptor makeTool(const std::string& name, const std::string& schemaJson = R"({"type":"object"})") {
    return ToolDescriptor(name, name + " tool", parseJSON(schemaJson));
}

inline ServerSpec fakeSpec(const std::string& name = "fake") {
    ServerSpec spec;
    spec.name = name;
    spec.command = "fake-server";
    return spec;
}

class FakeTransport;

//==========================================================================================================
// FakeToolServer
// Purpose: Script and observations shared by every transport the factory creates. Script fields are set
//          by the test before the session uses them; observations are thread-safe.
//==========================================================================================================
class FakeToolServer {
public:
    // Script
    std::vector<ToolDescriptor> tools{makeTool(
        "repeat", R"({"type":"object","properties":{"text":{"type":"string"}},"required":["text"]})")};
    bool advertiseTools{true};
    bool advertiseResources{false};
    std::atomic<bool> failLaunch{false};
    bool answerInitialize{true};
    bool rejectInitialize{false};
    std::size_t toolsPageSize{0};  // 0 = single page
    std::atomic<CallMode> callMode{CallMode::Echo};
    std::deque<CallMode> callScript;  // consumed before callMode
    std::chrono::milliseconds replyDelay{0};
    std::chrono::milliseconds launchDelay{0};

    // Observations
    std::atomic<int> launches{0};

    int CountSent(const std::string& method) const {
        std::lock_guard<std::mutex> lk(mutex_);
        int n = 0;
        for (const auto& m : sent_) {
            if (m == method) ++n;
        }
        return n;
    }

    std::vector<std::string> SentMethods() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return sent_;
    }

    // Responses the client sent to server-initiated requests, in order.
    std::vector<std::string> ClientReplies() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return replies_;
    }

    // Highest number of client requests awaiting an answer at once.
    int MaxOutstanding() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return maxOutstanding_;
    }

    bool WaitForSent(const std::string& method, int count, std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, timeout, [&]() {
            int n = 0;
            for (const auto& m : sent_) {
                if (m == method) ++n;
            }
            return n >= count;
        });
    }

    // Ends the stream of the most recently started transport.
    inline void EndStream();

    // Delivers a raw frame to the client over the most recently started transport.
    inline void Inject(const std::string& payload);

private:
    friend class FakeTransport;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::string> sent_;
    std::vector<std::string> replies_;
    int outstanding_{0};
    int maxOutstanding_{0};
    std::weak_ptr<FakeTransport> live_;

    void recordSent(const std::string& method, bool isRequest) {
        std::lock_guard<std::mutex> lk(mutex_);
        sent_.push_back(method);
        if (isRequest) {
            ++outstanding_;
            if (outstanding_ > maxOutstanding_) maxOutstanding_ = outstanding_;
        }
        cv_.notify_all();
    }

    void recordAnswered() {
        std::lock_guard<std::mutex> lk(mutex_);
        if (outstanding_ > 0) --outstanding_;
    }

    void recordReply(const std::string& payload) {
        std::lock_guard<std::mutex> lk(mutex_);
        replies_.push_back(payload);
        cv_.notify_all();
    }

    CallMode nextCallMode() {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!callScript.empty()) {
            CallMode m = callScript.front();
            callScript.pop_front();
            return m;
        }
        return callMode.load();
    }
};

//==========================================================================================================
// FakeTransport
// Purpose: ITransport whose peer is a FakeToolServer. Frames travel to the client on a delivery thread,
//          which plays the role of a reader thread.
//==========================================================================================================
class FakeTransport : public ITransport, public std::enable_shared_from_this<FakeTransport> {
public:
    explicit FakeTransport(std::shared_ptr<FakeToolServer> server) : server(std::move(server)) {}

    ~FakeTransport() override { stop(); }

    std::future<void> Start() override {
        std::promise<void> started;
        server->launches++;
        if (server->launchDelay.count() > 0) {
            std::this_thread::sleep_for(server->launchDelay);
        }
        if (server->failLaunch) {
            started.set_exception(std::make_exception_ptr(errors::ToolClientError(
                errors::ErrorKind::LaunchError, "cannot execute fake-server: No such file or directory")));
            return started.get_future();
        }
        connected = true;
        {
            std::lock_guard<std::mutex> lk(server->mutex_);
            server->live_ = weak_from_this();
        }
        delivery = std::thread([this]() { deliveryLoop(); });
        started.set_value();
        return started.get_future();
    }

    std::future<void> Close() override {
        connected = false;
        stop();
        std::promise<void> closed;
        closed.set_value();
        return closed.get_future();
    }

    bool IsConnected() const override { return connected; }

    void Send(const std::string& payload) override {
        if (!connected) {
            throw errors::ToolClientError(errors::ErrorKind::TransportError, "fake transport is closed");
        }
        JSONValue doc = parseJSON(payload);
        auto method = getStringField(doc, "method");
        const JSONValue* id = findField(doc, "id");
        if (!method.has_value()) {
            server->recordReply(payload);
            return;
        }
        server->recordSent(*method, id != nullptr);
        if (id == nullptr) {
            return;
        }
        JSONRPCRequest request;
        if (!request.FromJSONValue(doc)) {
            return;
        }
        answer(request);
    }

    void SetMessageHandler(MessageHandler handler) override { messageHandler = std::move(handler); }
    void SetErrorHandler(ErrorHandler handler) override { errorHandler = std::move(handler); }
    void SetCloseHandler(CloseHandler handler) override { closeHandler = std::move(handler); }

    // Queues an end-of-stream event behind any frames already queued.
    void EndStream() { enqueue(Frame{std::string(), true, false, std::chrono::steady_clock::now()}); }

    void Inject(const std::string& payload) {
        enqueue(Frame{payload, false, false, std::chrono::steady_clock::now()});
    }

private:
    struct Frame {
        std::string payload;
        bool endOfStream{false};
        bool answersRequest{false};
        std::chrono::steady_clock::time_point due;
    };

    std::shared_ptr<FakeToolServer> server;
    std::atomic<bool> connected{false};
    MessageHandler messageHandler;
    ErrorHandler errorHandler;
    CloseHandler closeHandler;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Frame> frames;
    bool stopping{false};
    std::thread delivery;

    void reply(const JSONRPCResponse& response) {
        enqueue(Frame{response.Serialize(), false, true, std::chrono::steady_clock::now() + server->replyDelay});
    }

    void enqueue(Frame frame) {
        std::lock_guard<std::mutex> lk(mutex);
        frames.push_back(std::move(frame));
        cv.notify_all();
    }

    void answer(const JSONRPCRequest& request) {
        if (request.method == Methods::Initialize) {
            if (!server->answerInitialize) {
                return;
            }
            if (server->rejectInitialize) {
                reply(JSONRPCResponse(request.id,
                                      CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "unsupported protocol"),
                                      true));
                return;
            }
            JSONValue::Object caps;
            if (server->advertiseTools) caps["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
            if (server->advertiseResources) caps["resources"] = std::make_shared<JSONValue>(JSONValue::Object{});
            JSONValue::Object info;
            info["name"] = std::make_shared<JSONValue>("fake");
            info["version"] = std::make_shared<JSONValue>("1.0");
            JSONValue::Object result;
            result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
            result["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
            result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
            reply(JSONRPCResponse(request.id, JSONValue(std::move(result))));
        } else if (request.method == Methods::ListTools) {
            answerToolsList(request);
        } else if (request.method == Methods::ListResources) {
            JSONValue::Array list;
            JSONValue::Object a;
            a["uri"] = std::make_shared<JSONValue>("mem://a");
            a["name"] = std::make_shared<JSONValue>("a");
            JSONValue::Object b;
            b["uri"] = std::make_shared<JSONValue>("mem://b");
            b["name"] = std::make_shared<JSONValue>("b");
            b["mimeType"] = std::make_shared<JSONValue>("text/plain");
            list.push_back(std::make_shared<JSONValue>(std::move(a)));
            list.push_back(std::make_shared<JSONValue>(std::move(b)));
            JSONValue::Object result;
            result["resources"] = std::make_shared<JSONValue>(std::move(list));
            reply(JSONRPCResponse(request.id, JSONValue(std::move(result))));
        } else if (request.method == Methods::CallTool) {
            answerCall(request);
        } else {
            reply(JSONRPCResponse(request.id,
                                  CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "Method not found"), true));
        }
    }

    void answerToolsList(const JSONRPCRequest& request) {
        std::size_t start = 0;
        if (request.params.has_value()) {
            if (auto cursor = getStringField(*request.params, "cursor")) {
                start = static_cast<std::size_t>(std::stoul(*cursor));
            }
        }
        const std::size_t page = server->toolsPageSize == 0 ? server->tools.size() : server->toolsPageSize;
        const std::size_t end = std::min(server->tools.size(), start + page);
        JSONValue::Array list;
        for (std::size_t i = start; i < end; ++i) {
            list.push_back(std::make_shared<JSONValue>(server->tools[i].ToJSON()));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(std::move(list));
        if (end < server->tools.size()) {
            result["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
        }
        reply(JSONRPCResponse(request.id, JSONValue(std::move(result))));
    }

    void answerCall(const JSONRPCRequest& request) {
        switch (server->nextCallMode()) {
        case CallMode::Silent:
            return;
        case CallMode::EndStream:
            EndStream();
            return;
        case CallMode::RpcError:
            reply(JSONRPCResponse(request.id, CreateErrorObject(JSONRPCErrorCodes::InternalError, "boom"), true));
            return;
        case CallMode::Echo:
            break;
        }
        std::string text;
        const JSONValue* arguments = request.params.has_value() ? findField(*request.params, "arguments") : nullptr;
        if (arguments != nullptr) {
            auto field = getStringField(*arguments, "text");
            text = field.has_value() ? *field : serializeJSONValue(*arguments);
        }
        JSONValue::Object block;
        block["type"] = std::make_shared<JSONValue>("text");
        block["text"] = std::make_shared<JSONValue>(text);
        JSONValue::Array content;
        content.push_back(std::make_shared<JSONValue>(std::move(block)));
        JSONValue::Object result;
        result["content"] = std::make_shared<JSONValue>(std::move(content));
        reply(JSONRPCResponse(request.id, JSONValue(std::move(result))));
    }

    void deliveryLoop() {
        std::unique_lock<std::mutex> lk(mutex);
        while (!stopping) {
            if (frames.empty()) {
                cv.wait(lk);
                continue;
            }
            const auto due = frames.front().due;
            if (std::chrono::steady_clock::now() < due) {
                cv.wait_until(lk, due);
                continue;
            }
            Frame frame = std::move(frames.front());
            frames.pop_front();
            lk.unlock();
            if (frame.endOfStream) {
                connected = false;
                if (closeHandler) closeHandler(TransportCloseInfo{false, "end of stream", 0});
                lk.lock();
                frames.clear();
                return;
            }
            if (frame.answersRequest) {
                server->recordAnswered();
            }
            if (messageHandler) messageHandler(frame.payload);
            lk.lock();
        }
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            stopping = true;
            cv.notify_all();
        }
        if (delivery.joinable()) {
            if (delivery.get_id() == std::this_thread::get_id()) {
                delivery.detach();
            } else {
                delivery.join();
            }
        }
    }
};

inline void FakeToolServer::EndStream() {
    std::shared_ptr<FakeTransport> t;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        t = live_.lock();
    }
    if (t) t->EndStream();
}

inline void FakeToolServer::Inject(const std::string& payload) {
    std::shared_ptr<FakeTransport> t;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        t = live_.lock();
    }
    if (t) t->Inject(payload);
}

//==========================================================================================================
// FakeTransportFactory
// Purpose: Hands out FakeTransports bound to one FakeToolServer.
//==========================================================================================================
class FakeTransportFactory : public ITransportFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeToolServer> server) : server(std::move(server)) {}

    std::unique_ptr<ITransport> CreateTransport(const ServerSpec&) override {
        return std::make_unique<Owned>(server);
    }

private:
    // Keeps the transport in a shared_ptr so the server can reach it through a weak_ptr.
    class Owned : public ITransport {
    public:
        explicit Owned(std::shared_ptr<FakeToolServer> server)
            : inner(std::make_shared<FakeTransport>(std::move(server))) {}
        ~Owned() override { inner->Close().get(); }
        std::future<void> Start() override { return inner->Start(); }
        std::future<void> Close() override { return inner->Close(); }
        bool IsConnected() const override { return inner->IsConnected(); }
        void Send(const std::string& payload) override { inner->Send(payload); }
        void SetMessageHandler(MessageHandler h) override { inner->SetMessageHandler(std::move(h)); }
        void SetErrorHandler(ErrorHandler h) override { inner->SetErrorHandler(std::move(h)); }
        void SetCloseHandler(CloseHandler h) override { inner->SetCloseHandler(std::move(h)); }

    private:
        std::shared_ptr<FakeTransport> inner;
    };

    std::shared_ptr<FakeToolServer> server;
};

} // namespace testing
} // namespace toolclient
