//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LLMClient.h
// Purpose: LLM call adapter: builds the chat-completions request, extracts text and usage, redacts,
//          and books every attempt in the usage ledger
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "llmwrap/llm/HttpTransport.h"

namespace llmwrap {
namespace redaction { class Redactor; }
namespace accounting { class UsageLedger; class AuditLog; }

namespace llm {

// Provider attribution headers sent with every call
constexpr const char* ReferrerHeaderValue = "https://github.com/llm-wrapper-mcp-server";
constexpr const char* TitleHeaderValue = "Ask MCP Server";

//==========================================================================================================
// LLMClientConfig
// Purpose: Values resolved once at startup; the client treats them as opaque strings.
// Fields:
//   allowedModels: nullopt when no allow-list is configured (any well-formed override is accepted).
//   maxTokens: omitted from the payload when unset.
//==========================================================================================================
struct LLMClientConfig {
    std::string baseUrl{"https://openrouter.ai/api/v1"};
    std::string defaultModel;
    std::string systemPrompt;
    std::optional<int64_t> maxTokens;
    std::optional<std::vector<std::string>> allowedModels;
    std::string appName{"llm_wrapper_mcp_server"};
    std::string project{"llm_wrapper_mcp_server"};
    std::string username{"unknown_user"};
};

//==========================================================================================================
// LLMResult
// Purpose: Redacted reply text plus provider usage (zero for anything the provider omitted).
//==========================================================================================================
struct LLMResult {
    std::string text;
    std::string model;
    int64_t promptTokens{0};
    int64_t completionTokens{0};
    int64_t totalTokens{0};
    int64_t cachedTokens{0};
    int64_t reasoningTokens{0};
    double cost{0.0};
    std::string remoteCompletionId;
};

//==========================================================================================================
// IsValidModelSpec
// Purpose: "provider/name": at least two characters after trimming, exactly one '/', both parts non-empty.
//==========================================================================================================
bool IsValidModelSpec(const std::string& model);

//==========================================================================================================
// LLMClient
// Purpose: Stateless per call apart from the ledger append, so concurrent Call()s are independent.
//==========================================================================================================
class LLMClient {
public:
    LLMClient(LLMClientConfig config,
              IHttpTransport& transport,
              const redaction::Redactor& redactor,
              accounting::UsageLedger& ledger,
              accounting::AuditLog* audit = nullptr);

    //==========================================================================================================
    // Call
    // Purpose: One chat completion.
    // Args:
    //   prompt: User message text.
    //   model: Per-call override; empty means "use the default model". See ResolveModel.
    //   credential: Bearer credential for the Authorization header.
    // Returns:
    //   LLMResult with redacted text. Throws errors::ProviderError (status, redacted message) on any
    //   provider or transport failure. Exactly one UsageRecord is appended either way.
    //==========================================================================================================
    LLMResult Call(const std::string& prompt, const std::string& model, const std::string& credential);

    //==========================================================================================================
    // ResolveModel
    // Purpose: The override wins when it is non-empty and either no allow-list is configured or the
    //          allow-list contains it; otherwise the default model is used.
    //==========================================================================================================
    std::string ResolveModel(const std::string& overrideModel) const;

    // Request body sent for the given prompt/model (exposed for diagnostics and tests).
    std::string BuildPayload(const std::string& prompt, const std::string& model) const;

    const LLMClientConfig& config() const { return config_; }

private:
    LLMClientConfig config_;
    IHttpTransport& transport_;
    const redaction::Redactor& redactor_;
    accounting::UsageLedger& ledger_;
    accounting::AuditLog* audit_;
};

} // namespace llm
} // namespace llmwrap
