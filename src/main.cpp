//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: llmwrap-server launcher: configuration, logging, ledger, LLM client, and the stdio loop
//==========================================================================================================

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "llmwrap/JsonRpcMessageRouter.h"
#include "llmwrap/Protocol.h"
#include "llmwrap/Server.h"
#include "llmwrap/StdioServer.hpp"
#include "llmwrap/version.h"
#include "llmwrap/accounting/LedgerStore.h"
#include "llmwrap/accounting/UsageLedger.h"
#include "llmwrap/config/ServerConfig.h"
#include "llmwrap/errors/Errors.h"
#include "llmwrap/llm/BeastHttpTransport.hpp"
#include "llmwrap/llm/LLMClient.h"
#include "llmwrap/redaction/Redactor.h"
#include "llmwrap/tools/LlmCallTool.h"
#include "llmwrap/tools/ToolRegistry.h"

using namespace llmwrap;

//==========================================================================================================
// Applies --cwd and the logging flags. Runs before anything resolves a relative path.
// Returns:
//   false when the working directory cannot be changed.
//==========================================================================================================
static bool setupProcess(const config::ServerConfig& cfg) {
    if (cfg.cwd.has_value()) {
        std::error_code ec;
        std::filesystem::current_path(cfg.cwd.value(), ec);
        if (ec) {
            std::cerr << "Failed to change working directory to " << cfg.cwd.value() << ": " << ec.message() << std::endl;
            return false;
        }
    }
    Logger::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty()) {
        std::error_code ec;
        const auto parent = std::filesystem::path(cfg.logFile).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        if (!Logger::setLogFile(cfg.logFile)) {
            LOG_WARN("Continuing with console logging only");
        }
    }
    return true;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::vector<std::string> args(argv + 1, argv + argc);

    config::ServerConfig cfg;
    try {
        cfg = config::ParseServerConfig(args);
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n" << config::Usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cfg.showHelp) {
        std::cerr << config::Usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (!setupProcess(cfg)) {
        return EXIT_FAILURE;
    }

    // Credential and file-backed settings
    std::optional<std::vector<std::string>> allowedModels;
    try {
        config::ValidateApiKey(cfg.apiKey);
        if (cfg.allowedModelsFile.has_value()) {
            allowedModels = config::LoadAllowedModels(cfg.allowedModelsFile.value());
            const auto& list = allowedModels.value();
            if (std::find(list.begin(), list.end(), cfg.model) == list.end()) {
                throw config::ConfigError("Default model '" + cfg.model + "' is not in the allowed models list");
            }
        }
    } catch (const config::ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // From here on no log line may carry the credential
    const redaction::Redactor logRedactor = redaction::Redactor::ForSecret(cfg.apiKey, redaction::LogPlaceholder);
    Logger::setRedactor([logRedactor](const std::string& s) { return logRedactor.Redact(s); });
    const redaction::Redactor redactor = redaction::Redactor::ForSecret(cfg.apiKey, redaction::ResultPlaceholder);

    std::unique_ptr<accounting::UsageLedger> ledger;
    std::unique_ptr<accounting::AuditLog> audit;
    try {
        if (cfg.disableUsageLedger) {
            LOG_INFO("LLM usage accounting is disabled");
            ledger = std::make_unique<accounting::UsageLedger>(std::make_unique<accounting::NullLedgerStore>());
        } else {
            ledger = std::make_unique<accounting::UsageLedger>(accounting::OpenLedgerStore(cfg.ledgerUrl));
        }
        if (!cfg.disableAuditLog) {
            audit = std::make_unique<accounting::AuditLog>(accounting::OpenLedgerStore(accounting::AuditUrlFor(cfg.ledgerUrl)));
        }
    } catch (const errors::LedgerError& e) {
        LOG_ERROR("Cannot open ledger store '{}': {}", cfg.ledgerUrl, e.what());
        return EXIT_FAILURE;
    }

    llm::LLMClientConfig clientCfg;
    clientCfg.baseUrl = cfg.apiBaseUrl;
    clientCfg.defaultModel = cfg.model;
    clientCfg.systemPrompt = config::LoadSystemPrompt(cfg.systemPromptFile);
    clientCfg.maxTokens = cfg.maxTokens;
    clientCfg.allowedModels = allowedModels;
    clientCfg.username = cfg.username;

    llm::BeastHttpTransport::Options httpOpts;
    httpOpts.connectTimeoutMs = cfg.timeoutMs;
    httpOpts.readTimeoutMs = cfg.timeoutMs;
    llm::BeastHttpTransport transport(httpOpts);
    llm::LLMClient client(clientCfg, transport, redactor, *ledger, audit.get());

    tools::ToolRegistry registry;
    tools::LlmCallToolOptions toolOpts;
    toolOpts.credential = cfg.apiKey;
    toolOpts.maxPromptTokens = cfg.maxUserPromptTokens;
    toolOpts.rejectKeyLeaks = !cfg.skipOutboundKeyLeaks;
    tools::RegisterLlmCallTool(registry, client, redactor, toolOpts);

    Server server(ServerInfo{cfg.serverName, getVersionString(), cfg.serverDescription}, registry, redactor);
    auto router = MakeDefaultJsonRpcMessageRouter();
    StdioServer::Options stdioOpts;
    stdioOpts.maxConcurrentCalls = cfg.maxConcurrentCalls;
    StdioServer stdio(*router, server.MakeRouterHandlers(), server.ReadyMessage(), stdioOpts);

    LOG_INFO("{} {} ready: model={} base_url={} ledger={}",
             cfg.serverName, getVersionString(), cfg.model, cfg.apiBaseUrl, cfg.ledgerUrl);
    const bool clean = stdio.Serve(std::cin, std::cout);

    if (audit) {
        audit->Close();
    }
    ledger->Close();
    LOG_INFO("Server shutdown complete");
    Logger::closeLogFile();
    return clean ? EXIT_SUCCESS : EXIT_FAILURE;
}
