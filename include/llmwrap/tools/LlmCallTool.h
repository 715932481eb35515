//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LlmCallTool.h
// Purpose: The built-in "llm_call" tool wiring prompt checks to the LLM client
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>

#include "llmwrap/tools/ToolRegistry.h"

namespace llmwrap {
namespace redaction { class Redactor; }
namespace llm { class LLMClient; }

namespace tools {

constexpr const char* LlmCallToolName = "llm_call";

struct LlmCallToolOptions {
    std::string credential;
    // Upper bound on EstimateTokens(prompt); 0 disables the check
    int64_t maxPromptTokens{100};
    // Reject prompts that contain the credential
    bool rejectKeyLeaks{true};
};

// Approximate token count used for the prompt limit: one token per four bytes, rounded up.
int64_t EstimateTokens(const std::string& text);

ToolDefinition LlmCallToolDefinition();

//==========================================================================================================
// RegisterLlmCallTool
// Purpose: Register llm_call. The handler rejects (InvalidParams) prompts carrying the credential,
//          prompts over the token limit, and malformed model overrides, then delegates to client.Call.
// Args:
//   client, redactor: Must outlive the registry.
//==========================================================================================================
void RegisterLlmCallTool(ToolRegistry& registry,
                         llm::LLMClient& client,
                         const redaction::Redactor& redactor,
                         LlmCallToolOptions options);

} // namespace tools
} // namespace llmwrap
