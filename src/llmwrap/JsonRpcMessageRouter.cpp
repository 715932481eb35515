//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC line routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "llmwrap/JsonRpcMessageRouter.h"
#include "llmwrap/JSONRPCTypes.h"

namespace llmwrap {

namespace {
class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    std::optional<std::string> route(
        const std::string& json,
        const RouterHandlers& handlers) override {
        JSONValue message;
        try {
            message = ParseJSON(json);
        } catch (const JSONParseError& e) {
            LOG_WARN("Router: parse error: {}", e.what());
            return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
        }
        if (!message.isObject()) {
            LOG_WARN("Router: message is not a JSON object");
            return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest,
                                       "Invalid Request: expected a JSON object")->Serialize();
        }

        JSONRPCRequest request;
        if (!request.FromValue(message)) {
            LOG_WARN("Router: invalid request (missing/invalid method or id)");
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequest,
                                       "Invalid Request: missing or invalid 'method'")->Serialize();
        }

        if (request.IsNotification()) {
            if (handlers.notificationHandler) {
                handlers.notificationHandler(request);
            }
            return std::nullopt;
        }

        if (!handlers.requestHandler) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found")->Serialize();
        }
        try {
            auto resp = handlers.requestHandler(request);
            if (!resp) {
                resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
            }
            resp->id = request.id;
            return resp->Serialize();
        } catch (const std::exception& e) {
            const std::string msg = handlers.redact ? handlers.redact(e.what()) : std::string(e.what());
            LOG_ERROR("Request handler exception: {}", msg);
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, msg)->Serialize();
        }
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace llmwrap
