//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_llm_client.cpp
// Purpose: LLMClient tests with a scripted transport: request shape, usage booking, failures, redaction
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

using namespace llmwrap;
using llmwrap::fakes::FakeHttpTransport;

namespace {
const std::string kKey = "sk-or-v1-0123456789abcdef0123456789abcdef";

struct ClientFixture {
    FakeHttpTransport transport;
    redaction::Redactor redactor = redaction::Redactor::ForSecret(kKey);
    accounting::UsageLedger ledger{std::make_unique<accounting::InMemoryLedgerStore>()};
    accounting::AuditLog audit{std::make_unique<accounting::InMemoryLedgerStore>()};
    llm::LLMClientConfig config;

    ClientFixture() {
        config.baseUrl = "https://api.test/v1/";
        config.defaultModel = "default/model";
        config.systemPrompt = "Be brief.";
        config.username = "tester";
    }

    llm::LLMClient client() { return llm::LLMClient(config, transport, redactor, ledger, &audit); }
};

// Runs fn and returns the ProviderError it throws; fails the test when nothing is thrown.
template <typename Fn>
errors::ProviderError expectProviderError(Fn&& fn) {
    try {
        fn();
    } catch (const errors::ProviderError& e) {
        return e;
    }
    ADD_FAILURE() << "expected ProviderError";
    return errors::ProviderError(-1, "");
}
} // namespace

TEST(LLMClient, SuccessfulCallSendsExpectedRequestAndBooksUsage) {
    ClientFixture f;
    f.transport.Push(200, fakes::CompletionBody("Paris",
        "{\"prompt_tokens\":12,\"completion_tokens\":3,\"total_tokens\":15,\"cost\":0.0015,"
        "\"prompt_tokens_details\":{\"cached_tokens\":2},\"completion_tokens_details\":{\"reasoning_tokens\":1}}"));
    auto client = f.client();

    auto result = client.Call("Capital of France?", "", kKey);

    EXPECT_EQ(result.text, "Paris");
    EXPECT_EQ(result.model, "default/model");
    EXPECT_EQ(result.promptTokens, 12);
    EXPECT_EQ(result.completionTokens, 3);
    EXPECT_EQ(result.totalTokens, 15);
    EXPECT_EQ(result.cachedTokens, 2);
    EXPECT_EQ(result.reasoningTokens, 1);
    EXPECT_DOUBLE_EQ(result.cost, 0.0015);
    EXPECT_EQ(result.remoteCompletionId, "gen-123");

    auto reqs = f.transport.Requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "POST");
    EXPECT_EQ(reqs[0].url, "https://api.test/v1/chat/completions");
    EXPECT_EQ(fakes::HeaderValue(reqs[0], "Authorization"), "Bearer " + kKey);
    EXPECT_EQ(fakes::HeaderValue(reqs[0], "Content-Type"), "application/json");
    EXPECT_EQ(fakes::HeaderValue(reqs[0], "X-Title"), "Ask MCP Server");

    auto payload = ParseJSON(reqs[0].body);
    EXPECT_EQ(std::get<std::string>(payload.find("model")->value), "default/model");
    const auto& messages = std::get<JSONValue::Array>(payload.find("messages")->value);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(std::get<std::string>(messages[0]->find("role")->value), "system");
    EXPECT_EQ(std::get<std::string>(messages[0]->find("content")->value), "Be brief.");
    EXPECT_EQ(std::get<std::string>(messages[1]->find("role")->value), "user");
    EXPECT_EQ(std::get<std::string>(messages[1]->find("content")->value), "Capital of France?");
    EXPECT_EQ(payload.find("max_tokens"), nullptr);

    auto records = f.ledger.ReadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].success);
    EXPECT_EQ(records[0].model, "default/model");
    EXPECT_EQ(records[0].promptTokens, 12);
    EXPECT_EQ(records[0].completionTokens, 3);
    EXPECT_EQ(records[0].username, "tester");
    EXPECT_EQ(records[0].remoteCompletionId, "gen-123");
}

TEST(LLMClient, UsageFallsBackToResponseHeaders) {
    ClientFixture f;
    f.transport.Push(200, fakes::CompletionBody("ok"),
                     {{"X-Prompt-Tokens", "7"}, {"X-Completion-Tokens", "4"}, {"X-Total-Cost", "0.5"}});
    auto client = f.client();

    auto result = client.Call("hi", "", kKey);
    EXPECT_EQ(result.promptTokens, 7);
    EXPECT_EQ(result.completionTokens, 4);
    EXPECT_EQ(result.totalTokens, 11);
    EXPECT_DOUBLE_EQ(result.cost, 0.5);
    EXPECT_EQ(result.cachedTokens, 0);
}

TEST(LLMClient, RateLimitReportsRetryAfterAndBooksFailure) {
    ClientFixture f;
    f.transport.Push(429, "{}", {{"Retry-After", "30"}}, "Too Many Requests");
    auto client = f.client();

    auto e = expectProviderError([&] { client.Call("hi", "", kKey); });
    EXPECT_EQ(e.status(), 429);
    EXPECT_EQ(std::string(e.what()), "API rate limit exceeded: Retry after 30 seconds");

    auto records = f.ledger.ReadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].success);
    EXPECT_EQ(records[0].promptTokens, 0);
}

TEST(LLMClient, RateLimitWithoutHeaderDefaultsToSixtySeconds) {
    ClientFixture f;
    f.transport.Push(429, "{}");
    auto client = f.client();
    auto e = expectProviderError([&] { client.Call("hi", "", kKey); });
    EXPECT_EQ(std::string(e.what()), "API rate limit exceeded: Retry after 60 seconds");
}

TEST(LLMClient, HttpErrorStatusIsReported) {
    ClientFixture f;
    f.transport.Push(500, "oops", {}, "Internal Server Error");
    auto client = f.client();
    auto e = expectProviderError([&] { client.Call("hi", "", kKey); });
    EXPECT_EQ(e.status(), 500);
    EXPECT_EQ(std::string(e.what()), "API HTTP error: 500 Internal Server Error");
    EXPECT_EQ(f.ledger.ReadAll().size(), 1u);
}

TEST(LLMClient, TransportFailureBooksExactlyOneFailedRecord) {
    ClientFixture f;
    f.transport.PushTransportFailure();
    auto client = f.client();
    auto e = expectProviderError([&] { client.Call("hi", "", kKey); });
    EXPECT_EQ(e.status(), 0);
    EXPECT_EQ(std::string(e.what()).rfind("API request failed:", 0), 0u);

    auto records = f.ledger.ReadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].success);
}

TEST(LLMClient, MalformedReplyBodies) {
    ClientFixture f;
    f.transport.Push(200, "not json");
    auto client = f.client();
    auto e1 = expectProviderError([&] { client.Call("hi", "", kKey); });
    EXPECT_EQ(std::string(e1.what()).rfind("Invalid API response format", 0), 0u);

    ClientFixture g;
    g.transport.Push(200, "{\"choices\":[]}");
    auto client2 = g.client();
    auto e2 = expectProviderError([&] { client2.Call("hi", "", kKey); });
    EXPECT_EQ(std::string(e2.what()), "Invalid API response format: Missing choices array");

    ClientFixture h;
    h.transport.Push(200, "{\"choices\":[{\"message\":{}}]}");
    auto client3 = h.client();
    auto e3 = expectProviderError([&] { client3.Call("hi", "", kKey); });
    EXPECT_EQ(std::string(e3.what()), "Invalid API response format: Missing message content");
}

TEST(LLMClient, ReplyContainingCredentialIsRedacted) {
    ClientFixture f;
    f.transport.Push(200, fakes::CompletionBody("your key is " + kKey));
    auto client = f.client();
    auto result = client.Call("echo my key", "", kKey);
    EXPECT_EQ(result.text.find(kKey), std::string::npos);
    EXPECT_EQ(result.text, std::string("your key is ") + redaction::ResultPlaceholder);

    for (const auto& entry : f.audit.ReadAll()) {
        EXPECT_EQ(entry.text.find(kKey), std::string::npos);
    }
}

TEST(LLMClient, AuditLogCapturesPromptAndResponse) {
    ClientFixture f;
    f.transport.Push(200, fakes::CompletionBody("pong"));
    auto client = f.client();
    client.Call("ping", "", kKey);

    auto entries = f.audit.ReadAll();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].kind, accounting::AuditEntry::Kind::Prompt);
    EXPECT_EQ(entries[0].text, "ping");
    EXPECT_EQ(entries[1].kind, accounting::AuditEntry::Kind::Response);
    EXPECT_EQ(entries[1].text, "pong");
    EXPECT_EQ(entries[1].remoteCompletionId, "gen-123");
}

TEST(LLMClient, ModelResolutionWithoutAllowList) {
    ClientFixture f;
    auto client = f.client();
    EXPECT_EQ(client.ResolveModel(""), "default/model");
    EXPECT_EQ(client.ResolveModel("  "), "default/model");
    EXPECT_EQ(client.ResolveModel("openai/gpt-4o-mini"), "openai/gpt-4o-mini");
}

TEST(LLMClient, ModelResolutionWithAllowList) {
    ClientFixture f;
    f.config.allowedModels = std::vector<std::string>{"default/model", "openai/gpt-4o-mini"};
    auto client = f.client();
    EXPECT_EQ(client.ResolveModel("openai/gpt-4o-mini"), "openai/gpt-4o-mini");
    EXPECT_EQ(client.ResolveModel("other/model"), "default/model");

    f.transport.Push(200, fakes::CompletionBody("ok"));
    auto result = client.Call("hi", "other/model", kKey);
    EXPECT_EQ(result.model, "default/model");
    EXPECT_EQ(f.ledger.ReadAll().at(0).model, "default/model");
}

TEST(LLMClient, EmptyAllowListPermitsNoOverride) {
    ClientFixture f;
    f.config.allowedModels = std::vector<std::string>{};
    auto client = f.client();
    EXPECT_EQ(client.ResolveModel("openai/gpt-4o-mini"), "default/model");
    EXPECT_EQ(client.ResolveModel(""), "default/model");
}

TEST(LLMClient, PayloadOmitsEmptySystemPromptAndCarriesMaxTokens) {
    ClientFixture f;
    f.config.systemPrompt.clear();
    f.config.maxTokens = 64;
    auto client = f.client();
    auto payload = ParseJSON(client.BuildPayload("hi", "a/b"));
    EXPECT_EQ(std::get<JSONValue::Array>(payload.find("messages")->value).size(), 1u);
    EXPECT_EQ(std::get<int64_t>(payload.find("max_tokens")->value), 64);
}

TEST(LLMClient, ModelSpecValidation) {
    EXPECT_TRUE(llm::IsValidModelSpec("openai/gpt-4o-mini"));
    EXPECT_FALSE(llm::IsValidModelSpec("gpt-4o"));
    EXPECT_FALSE(llm::IsValidModelSpec("a/b/c"));
    EXPECT_FALSE(llm::IsValidModelSpec("/model"));
    EXPECT_FALSE(llm::IsValidModelSpec("provider/ "));
    EXPECT_FALSE(llm::IsValidModelSpec(""));
}

TEST(LLMClient, OutOfRangeUsageCountsAreDropped) {
    ClientFixture f;
    f.transport.Push(200, fakes::CompletionBody("ok", "{\"prompt_tokens\":1e300,\"completion_tokens\":-3}"));
    auto client = f.client();
    auto result = client.Call("hi", "", kKey);
    EXPECT_EQ(result.promptTokens, 0);
    EXPECT_EQ(result.completionTokens, 0);

    auto records = f.ledger.ReadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].promptTokens, 0);
    EXPECT_EQ(records[0].completionTokens, 0);
}
