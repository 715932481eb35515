//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Static tool table (name -> definition + handler) built at startup and read-only while serving
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "llmwrap/JSONRPCTypes.h"

namespace llmwrap {
namespace tools {

//==========================================================================================================
// ParamSpec
// Purpose: One input parameter of a tool.
// Fields:
//   type: JSON type name ("string", "integer", "number", "boolean", "object", "array").
//==========================================================================================================
struct ParamSpec {
    std::string name;
    std::string type;
    bool required{false};
    std::string description;
};

//==========================================================================================================
// ToolDefinition
// Purpose: Immutable tool metadata answered by tools/list and used to validate tools/call arguments.
//==========================================================================================================
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ParamSpec> inputSchema;
};

// Handler receives the (validated) arguments object and returns the result text. Throws to fail.
using ToolHandler = std::function<std::string(const JSONValue& arguments)>;

struct RegisteredTool {
    ToolDefinition definition;
    ToolHandler handler;
};

//==========================================================================================================
// ToolRegistry
// Purpose: Registration happens once before serving; afterwards the registry is only read, so lookups
//          need no locking.
//==========================================================================================================
class ToolRegistry {
public:
    //==========================================================================================================
    // Register
    // Purpose: Add a tool.
    // Args:
    //   def: Tool metadata; name must be non-empty and unique.
    //   handler: Callable invoked by tools/call; must be non-empty.
    // Returns:
    //   (none) Throws std::invalid_argument on duplicate/empty name or empty handler.
    //==========================================================================================================
    void Register(ToolDefinition def, ToolHandler handler);

    // Lookup by name; nullopt is the NotFound outcome.
    std::optional<RegisteredTool> Get(const std::string& name) const;

    // Definitions in registration order.
    std::vector<ToolDefinition> List() const;

    std::size_t Size() const { return tools_.size(); }

private:
    std::vector<RegisteredTool> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

//==========================================================================================================
// ToJson
// Purpose: Render { name, description, inputSchema: { type: "object", properties, required } }.
//==========================================================================================================
JSONValue ToJson(const ToolDefinition& def);

// JSON Schema object for the tool's inputs.
JSONValue InputSchemaToJson(const ToolDefinition& def);

//==========================================================================================================
// ValidateArguments
// Purpose: Check required parameters are present and every declared parameter has its declared type.
// Args:
//   def: Tool definition.
//   arguments: The params.arguments value (must be an object; null is treated as {}).
// Returns:
//   (none) Throws errors::ProtocolError(InvalidParams) naming the offending parameter.
//==========================================================================================================
void ValidateArguments(const ToolDefinition& def, const JSONValue& arguments);

} // namespace tools
} // namespace llmwrap
