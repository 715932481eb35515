//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP method dispatch (initialize, tools/*, resources/*) over the tool registry
//==========================================================================================================

#pragma once

#include "Protocol.h"
#include "JsonRpcMessageRouter.h"
#include <memory>
#include <string>

namespace llmwrap {
namespace tools { class ToolRegistry; }
namespace redaction { class Redactor; }

//==========================================================================================================
// Server
// Purpose: Stateless request handler. Requests are served whether or not initialize was called, and
//          initialize may be repeated. Safe to call from several threads once the registry is frozen.
//==========================================================================================================
class Server {
public:
    //==========================================================================================================
    // Args:
    //   info: Identity reported in the readiness message and initialize result.
    //   registry, redactor: Must outlive the server.
    //==========================================================================================================
    Server(ServerInfo info, const tools::ToolRegistry& registry, const redaction::Redactor& redactor);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // HandleJSONRPC
    // Purpose: Dispatch one request by method name.
    // Returns:
    //   Exactly one response with req.id. Handler failures become error responses with redacted
    //   messages; this function does not throw for handler failures.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleJSONRPC(const JSONRPCRequest& req);

    // Notifications are acknowledged in the log only.
    void HandleNotification(const JSONRPCRequest& notification);

    // The unsolicited mcp/serverReady line (id null) written before serving.
    std::string ReadyMessage() const;

    // Handlers wiring this server into a router.
    RouterHandlers MakeRouterHandlers();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace llmwrap
