//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC line routing (parse, classify, dispatch, error framing)
//========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <memory>

#include "llmwrap/JSONRPCTypes.h"

namespace llmwrap {

struct RouterHandlers {
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using NotificationHandler = std::function<void(const JSONRPCRequest&)>;
    using RedactFn = std::function<std::string(const std::string&)>;

    RequestHandler requestHandler;
    NotificationHandler notificationHandler;
    // Applied to exception text before it is echoed in an error response
    RedactFn redact;
};

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    // Routes one JSON-RPC line. Returns the serialized response for requests (including parse and
    // invalid-request errors, which carry id null when no usable id was present); returns std::nullopt
    // for notifications (absent or null id), which are never answered.
    virtual std::optional<std::string> route(
        const std::string& json,
        const RouterHandlers& handlers) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace llmwrap
