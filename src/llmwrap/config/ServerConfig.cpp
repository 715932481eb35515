//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Flag parsing, environment fallbacks, and configuration file loading
//==========================================================================================================

#include "llmwrap/config/ServerConfig.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace llmwrap {
namespace config {

namespace {
std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

int64_t parseInt(const std::string& flag, const std::string& value, int64_t minValue,
                 int64_t maxValue = std::numeric_limits<int64_t>::max()) {
    std::size_t used = 0;
    int64_t v = 0;
    try {
        v = static_cast<int64_t>(std::stoll(value, &used));
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + flag + ": '" + value + "' is not an integer");
    }
    if (used != value.size()) {
        throw ConfigError("Invalid value for " + flag + ": '" + value + "' is not an integer");
    }
    if (v < minValue) {
        throw ConfigError("Invalid value for " + flag + ": must be >= " + std::to_string(minValue));
    }
    if (v > maxValue) {
        throw ConfigError("Invalid value for " + flag + ": must be <= " + std::to_string(maxValue));
    }
    return v;
}

const std::vector<std::string>& valueFlags() {
    static const std::vector<std::string> flags = {
        "--server-name", "--server-description", "--system-prompt-file", "--model", "--log-file",
        "--log-level", "--llm-api-base-url", "--allowed-models-file", "--limit-user-prompt-length",
        "--max-tokens", "--ledger", "--max-concurrent-calls", "--timeout-ms", "--cwd",
    };
    return flags;
}

const std::vector<std::string>& switchFlags() {
    static const std::vector<std::string> flags = {
        "--disable-logging", "--disable-audit-log", "--skip-outbound-key-leaks", "--help", "-h",
    };
    return flags;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}
} // namespace

ServerConfig ParseServerConfig(const std::vector<std::string>& args) {
    ServerConfig cfg;
    std::optional<std::string> logLevel;
    std::optional<std::string> baseUrl;
    std::optional<std::string> ledger;

    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string key = args[i];
        std::optional<std::string> value;
        const auto eq = key.find('=');
        if (key.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        }

        if (contains(switchFlags(), key)) {
            if (value.has_value()) {
                throw ConfigError("Flag " + key + " does not take a value");
            }
            if (key == "--disable-logging") cfg.disableUsageLedger = true;
            else if (key == "--disable-audit-log") cfg.disableAuditLog = true;
            else if (key == "--skip-outbound-key-leaks") cfg.skipOutboundKeyLeaks = true;
            else cfg.showHelp = true;
            continue;
        }
        if (!contains(valueFlags(), key)) {
            throw ConfigError("Unknown argument: " + key);
        }
        if (!value.has_value()) {
            if (i + 1 >= args.size()) {
                throw ConfigError("Missing value for " + key);
            }
            value = args[++i];
        }
        const std::string& v = value.value();

        if (key == "--server-name") cfg.serverName = v;
        else if (key == "--server-description") cfg.serverDescription = v;
        else if (key == "--system-prompt-file") cfg.systemPromptFile = v;
        else if (key == "--model") cfg.model = v;
        else if (key == "--log-file") cfg.logFile = v;
        else if (key == "--log-level") logLevel = v;
        else if (key == "--llm-api-base-url") baseUrl = v;
        else if (key == "--allowed-models-file") cfg.allowedModelsFile = v;
        else if (key == "--limit-user-prompt-length") cfg.maxUserPromptTokens = parseInt(key, v, 0);
        else if (key == "--max-tokens") cfg.maxTokens = parseInt(key, v, 1);
        else if (key == "--ledger") ledger = v;
        else if (key == "--max-concurrent-calls") cfg.maxConcurrentCalls = static_cast<unsigned int>(parseInt(key, v, 1, MaxConcurrentCalls));
        else if (key == "--timeout-ms") cfg.timeoutMs = static_cast<uint64_t>(parseInt(key, v, 1));
        else if (key == "--cwd") cfg.cwd = v;
    }

    cfg.logLevel = logLevel.value_or(GetEnvOrDefault("LLMWRAP_LOG_LEVEL", cfg.logLevel));
    cfg.apiBaseUrl = baseUrl.value_or(GetEnvOrDefault("LLM_API_BASE_URL", cfg.apiBaseUrl));
    cfg.ledgerUrl = ledger.value_or(GetEnvOrDefault("LLM_ACCOUNTING_DB_URL", cfg.ledgerUrl));
    cfg.apiKey = trim(GetEnvOrDefault("OPENROUTER_API_KEY", ""));
    cfg.username = GetEnvOrDefault("USERNAME", cfg.username);
    if (trim(cfg.model).empty()) {
        throw ConfigError("Model must not be empty");
    }
    return cfg;
}

void ValidateApiKey(const std::string& apiKey) {
    if (apiKey.empty()) {
        throw ConfigError("OPENROUTER_API_KEY environment variable is not set");
    }
    if (apiKey.rfind("sk-", 0) != 0) {
        throw ConfigError("Invalid API key format: expected a key starting with 'sk-'");
    }
    if (apiKey.size() < MinApiKeyLength) {
        throw ConfigError("Invalid API key format: key must be at least " + std::to_string(MinApiKeyLength) + " characters");
    }
}

std::vector<std::string> LoadAllowedModels(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("Allowed models file not found: " + path);
    }
    std::vector<std::string> models;
    std::string line;
    while (std::getline(in, line)) {
        const std::string m = trim(line);
        if (m.empty() || m.front() == '#') {
            continue;
        }
        models.push_back(m);
    }
    if (models.empty()) {
        throw ConfigError("Allowed models file is empty: " + path);
    }
    LOG_INFO("Loaded {} allowed model(s) from {}", models.size(), path);
    return models;
}

std::string LoadSystemPrompt(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN("System prompt file not found: {}; using an empty system prompt", path);
        return std::string();
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return trim(oss.str());
}

std::string Usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "  --server-name NAME              Server name reported to clients\n"
        << "  --server-description TEXT       Server description reported to clients\n"
        << "  --system-prompt-file PATH       System prompt file (default " << DefaultSystemPromptFile << ")\n"
        << "  --model MODEL                   Default model (default " << DefaultModel << ")\n"
        << "  --log-file PATH                 Also write logs to PATH\n"
        << "  --log-level LEVEL               DEBUG, INFO, WARN, ERROR or FATAL (env LLMWRAP_LOG_LEVEL)\n"
        << "  --llm-api-base-url URL          Provider base URL (env LLM_API_BASE_URL)\n"
        << "  --allowed-models-file PATH      Models a caller may select per call, one per line\n"
        << "  --limit-user-prompt-length N    Maximum prompt size in estimated tokens (default 100, 0 = off)\n"
        << "  --max-tokens N                  max_tokens sent to the provider\n"
        << "  --ledger URL                    Usage ledger: file://PATH, PATH or memory (env LLM_ACCOUNTING_DB_URL)\n"
        << "  --max-concurrent-calls N        Requests handled in parallel (default 1)\n"
        << "  --timeout-ms N                  Provider connect/read timeout (default 30000)\n"
        << "  --disable-logging               Disable LLM usage accounting\n"
        << "  --disable-audit-log             Do not record prompts and responses\n"
        << "  --skip-outbound-key-leaks       Do not reject prompts containing the API key\n"
        << "  --cwd DIR                       Change working directory before resolving paths\n"
        << "Environment: OPENROUTER_API_KEY (required), USERNAME\n";
    return oss.str();
}

} // namespace config
} // namespace llmwrap
