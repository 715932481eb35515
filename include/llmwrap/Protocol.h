//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants and server identity exchanged during the handshake
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>

namespace llmwrap {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Server identity ///////////////////////////////////////////
// Reported in the readiness message and the initialize result
struct ServerInfo {
    std::string name;
    std::string version;
    std::string description;

    ServerInfo() = default;
    ServerInfo(std::string name, std::string version, std::string description)
        : name(std::move(name)), version(std::move(version)), description(std::move(description)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ListResourceTemplates = "resources/templates/list";

    // Server to client, unsolicited, sent once before serving
    constexpr const char* ServerReady = "mcp/serverReady";
}

} // namespace llmwrap
