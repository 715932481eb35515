//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LlmCallTool.cpp
// Purpose: llm_call tool definition and handler
//==========================================================================================================

#include "llmwrap/tools/LlmCallTool.h"

#include <fmt/format.h>

#include "logging/Logger.h"
#include "llmwrap/errors/Errors.h"
#include "llmwrap/llm/LLMClient.h"
#include "llmwrap/redaction/Redactor.h"

namespace llmwrap {
namespace tools {

int64_t EstimateTokens(const std::string& text) {
    return static_cast<int64_t>((text.size() + 3) / 4);
}

ToolDefinition LlmCallToolDefinition() {
    ToolDefinition def;
    def.name = LlmCallToolName;
    def.description = "Make a generic call to the configured LLM with a given prompt.";
    def.inputSchema = {
        ParamSpec{"prompt", "string", true, "The prompt to send to the LLM"},
        ParamSpec{"model", "string", false, "Optional model override in provider/name form"},
    };
    return def;
}

void RegisterLlmCallTool(ToolRegistry& registry,
                         llm::LLMClient& client,
                         const redaction::Redactor& redactor,
                         LlmCallToolOptions options) {
    auto handler = [&client, &redactor, opts = std::move(options)](const JSONValue& arguments) -> std::string {
        const JSONValue* p = arguments.find("prompt");
        if (p == nullptr || !p->isString() || std::get<std::string>(p->value).empty()) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Missing required 'prompt' argument");
        }
        const std::string& prompt = std::get<std::string>(p->value);

        if (opts.rejectKeyLeaks && redactor.Contains(prompt)) {
            LOG_WARN("Rejected llm_call: prompt contains the API key");
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams, "Security violation");
        }

        const int64_t tokens = EstimateTokens(prompt);
        if (opts.maxPromptTokens > 0 && tokens > opts.maxPromptTokens) {
            throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams,
                fmt::format("User prompt exceeds maximum length of {} tokens (estimated {})", opts.maxPromptTokens, tokens));
        }

        std::string model;
        if (const JSONValue* m = arguments.find("model"); m != nullptr && m->isString()) {
            model = std::get<std::string>(m->value);
            if (!llm::IsValidModelSpec(model)) {
                throw errors::ProtocolError(JSONRPCErrorCodes::InvalidParams,
                    "Invalid model specification: expected 'provider/model-name', got '" + model + "'");
            }
        }

        return client.Call(prompt, model, opts.credential).text;
    };
    registry.Register(LlmCallToolDefinition(), std::move(handler));
}

} // namespace tools
} // namespace llmwrap
