//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Process configuration built once at startup from command-line flags and environment variables
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmwrap {
namespace config {

constexpr const char* DefaultModel = "perplexity/llama-3.1-sonar-small-128k-online";
constexpr const char* DefaultApiBaseUrl = "https://openrouter.ai/api/v1";
constexpr const char* DefaultSystemPromptFile = "config/prompts/system.txt";
constexpr const char* DefaultLedgerUrl = "file://data/accounting.jsonl";
constexpr std::size_t MinApiKeyLength = 32;
constexpr int64_t MaxConcurrentCalls = 1024;

//==========================================================================================================
// ConfigError
// Purpose: Invalid flag, flag value, credential, or configuration file. The launcher exits with code 1.
//==========================================================================================================
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// ServerConfig
// Purpose: Everything the server needs, as parsed. File-backed values (system prompt, allow-list) are
//          loaded separately with LoadSystemPrompt / LoadAllowedModels.
//==========================================================================================================
struct ServerConfig {
    std::string serverName{"llm-wrapper-mcp-server"};
    std::string serverDescription{"Generic LLM API MCP server"};
    std::string systemPromptFile{DefaultSystemPromptFile};
    std::string model{DefaultModel};
    std::string logFile;
    std::string logLevel{"INFO"};
    std::string apiBaseUrl{DefaultApiBaseUrl};
    std::optional<std::string> allowedModelsFile;
    int64_t maxUserPromptTokens{100};
    std::optional<int64_t> maxTokens;
    std::string ledgerUrl{DefaultLedgerUrl};
    unsigned int maxConcurrentCalls{1};
    uint64_t timeoutMs{30000};
    bool disableUsageLedger{false};
    bool disableAuditLog{false};
    bool skipOutboundKeyLeaks{false};
    std::optional<std::string> cwd;
    bool showHelp{false};

    // From the environment only
    std::string apiKey;
    std::string username{"unknown_user"};
};

//==========================================================================================================
// ParseServerConfig
// Purpose: Parse flags (argv without the program name) in "--key=value" or "--key value" form, then fill
//          unset values from the environment (LLMWRAP_LOG_LEVEL, LLM_API_BASE_URL,
//          LLM_ACCOUNTING_DB_URL, OPENROUTER_API_KEY, USERNAME).
// Returns:
//   ServerConfig. Throws ConfigError on unknown flags, missing values, or malformed numbers.
//==========================================================================================================
ServerConfig ParseServerConfig(const std::vector<std::string>& args);

// Throws ConfigError when the key is missing, does not start with "sk-", or is shorter than 32 characters.
// The message never includes the key.
void ValidateApiKey(const std::string& apiKey);

//==========================================================================================================
// LoadAllowedModels
// Purpose: One model id per line; blank lines and '#' comments ignored.
// Returns:
//   Model ids in file order. Throws ConfigError when the file is missing or lists no models.
//==========================================================================================================
std::vector<std::string> LoadAllowedModels(const std::string& path);

// Whole file, trimmed. A missing file logs a warning and yields an empty prompt.
std::string LoadSystemPrompt(const std::string& path);

// Human-readable flag summary for --help.
std::string Usage(const std::string& program);

} // namespace config
} // namespace llmwrap
