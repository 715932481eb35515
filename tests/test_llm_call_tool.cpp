//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_llm_call_tool.cpp
// Purpose: llm_call tool argument checks (key leaks, prompt size, model format) ahead of the provider call
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "FakeHttpTransport.h"
#include "llmwrap/JSONRPCTypes.h"
#include "llmwrap/accounting/LedgerStore.h"
#include "llmwrap/accounting/UsageLedger.h"
#include "llmwrap/errors/Errors.h"
#include "llmwrap/llm/LLMClient.h"
#include "llmwrap/redaction/Redactor.h"
#include "llmwrap/tools/LlmCallTool.h"
#include "llmwrap/tools/ToolRegistry.h"

using namespace llmwrap;

namespace {
const std::string kKey = "sk-or-v1-0123456789abcdef0123456789abcdef";

class LlmCallToolTest : public ::testing::Test {
protected:
    fakes::FakeHttpTransport transport;
    redaction::Redactor redactor = redaction::Redactor::ForSecret(kKey);
    accounting::UsageLedger ledger{std::make_unique<accounting::InMemoryLedgerStore>()};
    std::unique_ptr<llm::LLMClient> client;
    tools::ToolRegistry registry;

    void install(tools::LlmCallToolOptions opts) {
        llm::LLMClientConfig cfg;
        cfg.baseUrl = "https://api.test/v1";
        cfg.defaultModel = "default/model";
        client = std::make_unique<llm::LLMClient>(cfg, transport, redactor, ledger);
        opts.credential = kKey;
        tools::RegisterLlmCallTool(registry, *client, redactor, opts);
    }

    static JSONValue args(const std::string& prompt, const std::string& model = "") {
        JSONValue::Object o;
        o["prompt"] = std::make_shared<JSONValue>(prompt);
        if (!model.empty()) {
            o["model"] = std::make_shared<JSONValue>(model);
        }
        return JSONValue{std::move(o)};
    }

    std::string call(const JSONValue& a) {
        auto tool = registry.Get(tools::LlmCallToolName);
        EXPECT_TRUE(tool.has_value());
        return tool->handler(a);
    }

    // Message of the ProtocolError(InvalidParams) raised by the handler
    std::string rejection(const JSONValue& a) {
        try {
            call(a);
        } catch (const errors::ProtocolError& e) {
            EXPECT_EQ(e.code(), JSONRPCErrorCodes::InvalidParams);
            return e.what();
        }
        ADD_FAILURE() << "expected ProtocolError";
        return std::string();
    }
};
} // namespace

TEST(LlmCallToolDefinition, DeclaresPromptRequiredAndModelOptional) {
    auto def = tools::LlmCallToolDefinition();
    EXPECT_EQ(def.name, "llm_call");
    ASSERT_EQ(def.inputSchema.size(), 2u);
    EXPECT_EQ(def.inputSchema[0].name, "prompt");
    EXPECT_TRUE(def.inputSchema[0].required);
    EXPECT_EQ(def.inputSchema[1].name, "model");
    EXPECT_FALSE(def.inputSchema[1].required);
}

TEST(LlmCallToolDefinition, TokenEstimateRoundsUp) {
    EXPECT_EQ(tools::EstimateTokens(""), 0);
    EXPECT_EQ(tools::EstimateTokens("abc"), 1);
    EXPECT_EQ(tools::EstimateTokens("abcd"), 1);
    EXPECT_EQ(tools::EstimateTokens("abcde"), 2);
}

TEST_F(LlmCallToolTest, ForwardsPromptAndReturnsReplyText) {
    install({});
    transport.Push(200, fakes::CompletionBody("four"));
    EXPECT_EQ(call(args("2+2?")), "four");
    EXPECT_EQ(transport.Requests().size(), 1u);
    EXPECT_EQ(ledger.ReadAll().size(), 1u);
}

TEST_F(LlmCallToolTest, PromptContainingKeyIsRejectedBeforeAnyRequest) {
    install({});
    EXPECT_EQ(rejection(args("leak " + kKey)), "Security violation");
    EXPECT_TRUE(transport.Requests().empty());
    EXPECT_TRUE(ledger.ReadAll().empty());
}

TEST_F(LlmCallToolTest, LeakCheckCanBeDisabledButReplyIsStillRedacted) {
    tools::LlmCallToolOptions opts;
    opts.rejectKeyLeaks = false;
    opts.maxPromptTokens = 0;
    install(opts);
    transport.Push(200, fakes::CompletionBody("echo " + kKey));
    const std::string out = call(args("leak " + kKey));
    EXPECT_EQ(out.find(kKey), std::string::npos);
    EXPECT_EQ(transport.Requests().size(), 1u);
}

TEST_F(LlmCallToolTest, OversizedPromptIsRejected) {
    tools::LlmCallToolOptions opts;
    opts.maxPromptTokens = 5;
    install(opts);
    EXPECT_EQ(rejection(args(std::string(40, 'x'))), "User prompt exceeds maximum length of 5 tokens (estimated 10)");
    EXPECT_TRUE(transport.Requests().empty());
}

TEST_F(LlmCallToolTest, InvalidModelFormatIsRejected) {
    install({});
    EXPECT_EQ(rejection(args("hi", "gpt-4o")).rfind("Invalid model specification", 0), 0u);
    EXPECT_TRUE(transport.Requests().empty());
}

TEST_F(LlmCallToolTest, ModelOverrideReachesPayload) {
    install({});
    transport.Push(200, fakes::CompletionBody("ok"));
    call(args("hi", "openai/gpt-4o-mini"));
    auto payload = ParseJSON(transport.Requests().at(0).body);
    EXPECT_EQ(std::get<std::string>(payload.find("model")->value), "openai/gpt-4o-mini");
}

TEST_F(LlmCallToolTest, MissingPromptIsRejected) {
    install({});
    EXPECT_EQ(rejection(JSONValue{JSONValue::Object{}}), "Missing required 'prompt' argument");
}

TEST_F(LlmCallToolTest, EmptyPromptIsRejectedWithoutBooking) {
    install({});
    transport.Push(200, fakes::CompletionBody("ok"));
    EXPECT_EQ(rejection(args("")), "Missing required 'prompt' argument");
    EXPECT_TRUE(transport.Requests().empty());
    EXPECT_TRUE(ledger.ReadAll().empty());
}
