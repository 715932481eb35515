//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registry, schema rendering, and argument validation
//==========================================================================================================

#include "llmwrap/tools/ToolRegistry.h"

#include <stdexcept>

#include "logging/Logger.h"
#include "llmwrap/errors/Errors.h"

namespace llmwrap {
namespace tools {

namespace {
bool hasType(const JSONValue& v, const std::string& type) {
    if (type == "string") return std::holds_alternative<std::string>(v.value);
    if (type == "integer") return std::holds_alternative<int64_t>(v.value);
    if (type == "number") return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "object") return std::holds_alternative<JSONValue::Object>(v.value);
    if (type == "array") return std::holds_alternative<JSONValue::Array>(v.value);
    // Unknown declared types accept any value
    return true;
}
} // namespace

void ToolRegistry::Register(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool '" + def.name + "' has no handler");
    }
    if (index_.count(def.name) != 0) {
        throw std::invalid_argument("Tool '" + def.name + "' is already registered");
    }
    LOG_DEBUG("Registering tool: {}", def.name);
    index_[def.name] = tools_.size();
    tools_.push_back(RegisteredTool{std::move(def), std::move(handler)});
}

std::optional<RegisteredTool> ToolRegistry::Get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return tools_[it->second];
}

std::vector<ToolDefinition> ToolRegistry::List() const {
    std::vector<ToolDefinition> out;
    out.reserve(tools_.size());
    for (const auto& t : tools_) {
        out.push_back(t.definition);
    }
    return out;
}

JSONValue InputSchemaToJson(const ToolDefinition& def) {
    JSONValue::Object properties;
    JSONValue::Array required;
    for (const auto& p : def.inputSchema) {
        JSONValue::Object prop;
        prop["type"] = std::make_shared<JSONValue>(p.type);
        if (!p.description.empty()) {
            prop["description"] = std::make_shared<JSONValue>(p.description);
        }
        properties[p.name] = std::make_shared<JSONValue>(std::move(prop));
        if (p.required) {
            required.push_back(std::make_shared<JSONValue>(p.name));
        }
    }
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    schema["required"] = std::make_shared<JSONValue>(std::move(required));
    return JSONValue{std::move(schema)};
}

JSONValue ToJson(const ToolDefinition& def) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(def.name);
    obj["description"] = std::make_shared<JSONValue>(def.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(InputSchemaToJson(def));
    return JSONValue{std::move(obj)};
}

void ValidateArguments(const ToolDefinition& def, const JSONValue& arguments) {
    if (std::holds_alternative<std::nullptr_t>(arguments.value)) {
        for (const auto& p : def.inputSchema) {
            if (p.required) {
                throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing required '" + p.name + "' argument");
            }
        }
        return;
    }
    if (!arguments.isObject()) {
        throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object");
    }
    for (const auto& p : def.inputSchema) {
        const JSONValue* v = arguments.find(p.name);
        if (v == nullptr || std::holds_alternative<std::nullptr_t>(v->value)) {
            if (p.required) {
                throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing required '" + p.name + "' argument");
            }
            continue;
        }
        if (!hasType(*v, p.type)) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams,
                                        "Invalid type for '" + p.name + "': expected " + p.type);
        }
    }
}

} // namespace tools
} // namespace llmwrap
