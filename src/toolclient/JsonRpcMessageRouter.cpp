//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolclient/JsonRpcMessageRouter.h"
#include "toolclient/JSONRPCTypes.h"

namespace toolclient {

namespace {
using MessageKind = IJsonRpcMessageRouter::MessageKind;

// Classification looks at top-level keys only; nested "id"/"method" inside params never count.
MessageKind classifyValue(const JSONValue& doc) {
    if (!doc.isObject()) {
        return MessageKind::Unknown;
    }
    const bool hasMethod = findField(doc, "method") != nullptr;
    const bool hasId = findField(doc, "id") != nullptr;
    if (!hasMethod && hasId && (findField(doc, "result") != nullptr || findField(doc, "error") != nullptr)) {
        return MessageKind::Response;
    }
    if (hasMethod) {
        return hasId ? MessageKind::Request : MessageKind::Notification;
    }
    return MessageKind::Unknown;
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const std::string& json) override {
        try {
            return classifyValue(parseJSON(json));
        } catch (const JSONParseError& e) {
            LOG_DEBUG("Router: classify parse failure: {}", e.what());
            return MessageKind::Unknown;
        }
    }

    std::optional<std::string> route(
        const std::string& json,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        JSONValue doc;
        try {
            doc = parseJSON(json);
        } catch (const JSONParseError& e) {
            LOG_WARN("Router: malformed JSON from server: {}", e.what());
            if (handlers.errorHandler) {
                handlers.errorHandler(std::string("Router: malformed JSON: ") + e.what());
            }
            return std::nullopt;
        }

        switch (classifyValue(doc)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromJSONValue(doc)) {
                    resolve(std::move(response));
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromJSONValue(doc)) {
                    break;
                }
                std::unique_ptr<JSONRPCResponse> resp;
                if (handlers.requestHandler) {
                    try {
                        resp = handlers.requestHandler(request);
                    } catch (const std::exception& e) {
                        LOG_ERROR("Request handler exception: {}", e.what());
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                }
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                               "Method not found: " + request.method);
                }
                resp->id = request.id;
                return resp->Serialize();
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (notification.FromJSONValue(doc)) {
                    if (handlers.notificationHandler) {
                        handlers.notificationHandler(notification);
                    }
                    return std::nullopt;
                }
                break;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", json);
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace toolclient
