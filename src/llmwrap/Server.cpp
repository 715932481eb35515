//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: MCP method dispatch implementation
//==========================================================================================================

#include "llmwrap/Server.h"

#include <functional>
#include <unordered_map>

#include "logging/Logger.h"
#include "llmwrap/errors/Errors.h"
#include "llmwrap/redaction/Redactor.h"
#include "llmwrap/tools/ToolRegistry.h"

namespace llmwrap {

class Server::Impl {
public:
    using MethodHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;

    ServerInfo serverInfo;
    const tools::ToolRegistry& registry;
    const redaction::Redactor& redactor;
    // Built once in the constructor, never mutated afterwards
    std::unordered_map<std::string, MethodHandler> dispatchTable;

    Impl(ServerInfo info, const tools::ToolRegistry& reg, const redaction::Redactor& red)
        : serverInfo(std::move(info)), registry(reg), redactor(red) {
        dispatchTable[Methods::Initialize] = [this](const JSONRPCRequest& r) { return handleInitialize(r); };
        dispatchTable[Methods::ListTools] = [this](const JSONRPCRequest& r) { return handleToolsList(r); };
        dispatchTable[Methods::CallTool] = [this](const JSONRPCRequest& r) { return handleToolsCall(r); };
        dispatchTable[Methods::ListResources] = [this](const JSONRPCRequest& r) { return emptyList(r, "resources"); };
        dispatchTable[Methods::ListResourceTemplates] = [this](const JSONRPCRequest& r) { return emptyList(r, "resourceTemplates"); };
    }

    static std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCRequest& req, JSONValue::Object obj) {
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{std::move(obj)});
    }

    // Strings anywhere inside an error payload may echo caller input
    JSONValue redactValue(const JSONValue& v) const {
        if (v.isString()) {
            return JSONValue{redactor.Redact(std::get<std::string>(v.value))};
        }
        if (v.isObject()) {
            JSONValue::Object out;
            for (const auto& [k, child] : std::get<JSONValue::Object>(v.value)) {
                out[k] = std::make_shared<JSONValue>(child ? redactValue(*child) : JSONValue{});
            }
            return JSONValue{std::move(out)};
        }
        if (std::holds_alternative<JSONValue::Array>(v.value)) {
            JSONValue::Array out;
            for (const auto& child : std::get<JSONValue::Array>(v.value)) {
                out.push_back(std::make_shared<JSONValue>(child ? redactValue(*child) : JSONValue{}));
            }
            return JSONValue{std::move(out)};
        }
        return v;
    }

    std::unique_ptr<JSONRPCResponse> makeError(const JSONRPCRequest& req, errors::McpError e) const {
        e.message = redactor.Redact(e.message);
        if (e.data.has_value()) {
            e.data = redactValue(*e.data);
        }
        return errors::makeErrorResponse(req.id, e);
    }

    JSONValue serverInfoJson() const {
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(serverInfo.name);
        info["version"] = std::make_shared<JSONValue>(serverInfo.version);
        info["description"] = std::make_shared<JSONValue>(serverInfo.description);
        return JSONValue{std::move(info)};
    }

    JSONValue capabilities() const {
        JSONValue::Object toolsCap;
        for (const auto& def : registry.List()) {
            JSONValue::Object t;
            t["description"] = std::make_shared<JSONValue>(def.description);
            t["inputSchema"] = std::make_shared<JSONValue>(tools::InputSchemaToJson(def));
            toolsCap[def.name] = std::make_shared<JSONValue>(std::move(t));
        }
        JSONValue::Object caps;
        caps["tools"] = std::make_shared<JSONValue>(std::move(toolsCap));
        caps["resources"] = std::make_shared<JSONValue>(JSONValue::Object{});
        caps["prompts"] = std::make_shared<JSONValue>(JSONValue::Object{});
        caps["sampling"] = std::make_shared<JSONValue>(JSONValue::Object{});
        return JSONValue{std::move(caps)};
    }

    JSONValue::Object handshake() const {
        JSONValue::Object obj;
        obj["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        obj["serverInfo"] = std::make_shared<JSONValue>(serverInfoJson());
        obj["capabilities"] = std::make_shared<JSONValue>(capabilities());
        return obj;
    }

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req) {
        LOG_INFO("Handling initialize request");
        return makeResult(req, handshake());
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        JSONValue::Array list;
        for (const auto& def : registry.List()) {
            list.push_back(std::make_shared<JSONValue>(tools::ToJson(def)));
        }
        JSONValue::Object obj;
        obj["tools"] = std::make_shared<JSONValue>(std::move(list));
        return makeResult(req, std::move(obj));
    }

    std::unique_ptr<JSONRPCResponse> emptyList(const JSONRPCRequest& req, const char* key) {
        JSONValue::Object obj;
        obj[key] = std::make_shared<JSONValue>(JSONValue::Array{});
        return makeResult(req, std::move(obj));
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/call request");
        std::string name;
        JSONValue arguments{JSONValue::Object{}};
        if (req.params.has_value() && req.params->isObject()) {
            const JSONValue* n = req.params->find("name");
            if (n != nullptr && n->isString()) name = std::get<std::string>(n->value);
            const JSONValue* a = req.params->find("arguments");
            if (a != nullptr && !std::holds_alternative<std::nullptr_t>(a->value)) arguments = *a;
        }
        if (name.empty()) {
            return makeError(req, errors::makeError(JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name"));
        }

        auto tool = registry.Get(name);
        if (!tool) {
            LOG_WARN("tools/call for unknown tool '{}'", name);
            JSONValue::Object data;
            data["tool"] = std::make_shared<JSONValue>(name);
            return makeError(req, errors::makeError(JSONRPCErrorCodes::MethodNotFound,
                                                    "Tool '" + name + "' not found", JSONValue{std::move(data)}));
        }

        std::string text;
        try {
            tools::ValidateArguments(tool->definition, arguments);
            text = tool->handler(arguments);
        } catch (const std::exception& e) {
            LOG_ERROR("Tool '{}' failed: {}", name, e.what());
            return makeError(req, errors::errorFromException(e));
        }

        JSONValue::Object item;
        item["type"] = std::make_shared<JSONValue>("text");
        item["text"] = std::make_shared<JSONValue>(redactor.Redact(text));
        JSONValue::Array content;
        content.push_back(std::make_shared<JSONValue>(std::move(item)));
        JSONValue::Object obj;
        obj["content"] = std::make_shared<JSONValue>(std::move(content));
        obj["isError"] = std::make_shared<JSONValue>(false);
        return makeResult(req, std::move(obj));
    }
};

Server::Server(ServerInfo info, const tools::ToolRegistry& registry, const redaction::Redactor& redactor)
    : pImpl(std::make_unique<Impl>(std::move(info), registry, redactor)) {}

Server::~Server() = default;

std::unique_ptr<JSONRPCResponse> Server::HandleJSONRPC(const JSONRPCRequest& req) {
    FUNC_SCOPE();
    auto it = pImpl->dispatchTable.find(req.method);
    if (it == pImpl->dispatchTable.end()) {
        LOG_WARN("Method not found: {}", req.method);
        return pImpl->makeError(req, errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method));
    }
    try {
        return it->second(req);
    } catch (const std::exception& e) {
        LOG_ERROR("Handler for {} failed: {}", req.method, e.what());
        return pImpl->makeError(req, errors::errorFromException(e));
    }
}

void Server::HandleNotification(const JSONRPCRequest& notification) {
    LOG_DEBUG("Notification received (no response): {}", notification.method);
}

std::string Server::ReadyMessage() const {
    JSONValue::Object msg;
    msg["jsonrpc"] = std::make_shared<JSONValue>("2.0");
    msg["id"] = std::make_shared<JSONValue>(nullptr);
    msg["method"] = std::make_shared<JSONValue>(Methods::ServerReady);
    msg["params"] = std::make_shared<JSONValue>(pImpl->handshake());
    return SerializeJSON(JSONValue{std::move(msg)});
}

RouterHandlers Server::MakeRouterHandlers() {
    RouterHandlers handlers;
    handlers.requestHandler = [this](const JSONRPCRequest& req) { return HandleJSONRPC(req); };
    handlers.notificationHandler = [this](const JSONRPCRequest& n) { HandleNotification(n); };
    const redaction::Redactor& redactor = pImpl->redactor;
    handlers.redact = [&redactor](const std::string& s) { return redactor.Redact(s); };
    return handlers;
}

} // namespace llmwrap
