//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_serve.cpp
// Purpose: StdioServer line loop: readiness line, ordering under concurrency, notifications, end-to-end llm_call
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "FakeHttpTransport.h"
#include "llmwrap/JSONRPCTypes.h"
#include "llmwrap/JsonRpcMessageRouter.h"
#include "llmwrap/Protocol.h"
#include "llmwrap/Server.h"
#include "llmwrap/StdioServer.hpp"
#include "llmwrap/accounting/LedgerStore.h"
#include "llmwrap/accounting/UsageLedger.h"
#include "llmwrap/llm/LLMClient.h"
#include "llmwrap/redaction/Redactor.h"
#include "llmwrap/tools/LlmCallTool.h"
#include "llmwrap/tools/ToolRegistry.h"

using namespace llmwrap;

namespace {
const std::string kKey = "sk-or-v1-0123456789abcdef0123456789abcdef";

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string l;
    while (std::getline(in, l)) {
        out.push_back(l);
    }
    return out;
}

int64_t idOf(const std::string& line) {
    JSONRPCResponse r;
    EXPECT_TRUE(r.Deserialize(line)) << line;
    return std::holds_alternative<int64_t>(r.id) ? std::get<int64_t>(r.id) : -1;
}

std::string requestLine(int64_t id, const std::string& method, const std::string& params = "{}") {
    return "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) + ",\"method\":\"" + method + "\",\"params\":" + params + "}";
}

// Server wired the way the launcher wires it, minus the network
struct Stack {
    fakes::FakeHttpTransport transport;
    redaction::Redactor redactor = redaction::Redactor::ForSecret(kKey);
    accounting::UsageLedger ledger{std::make_unique<accounting::InMemoryLedgerStore>()};
    tools::ToolRegistry registry;
    std::unique_ptr<llm::LLMClient> client;
    std::unique_ptr<Server> server;
    std::unique_ptr<IJsonRpcMessageRouter> router = MakeDefaultJsonRpcMessageRouter();

    Stack() {
        llm::LLMClientConfig cfg;
        cfg.baseUrl = "https://api.test/v1";
        cfg.defaultModel = "default/model";
        client = std::make_unique<llm::LLMClient>(cfg, transport, redactor, ledger);
        tools::LlmCallToolOptions opts;
        opts.credential = kKey;
        tools::RegisterLlmCallTool(registry, *client, redactor, opts);
        server = std::make_unique<Server>(ServerInfo{"llm-wrapper-mcp-server", "0.1.0", "Generic LLM API MCP server"},
                                          registry, redactor);
    }

    std::string serve(const std::string& input, unsigned int maxConcurrent = 1) {
        StdioServer stdio(*router, server->MakeRouterHandlers(), server->ReadyMessage(), StdioServer::Options{maxConcurrent});
        std::istringstream in(input);
        std::ostringstream out;
        EXPECT_TRUE(stdio.Serve(in, out));
        EXPECT_EQ(stdio.GetState(), StdioServer::State::Terminated);
        return out.str();
    }
};
} // namespace

TEST(StdioServe, ReadinessLineComesFirst) {
    Stack s;
    auto out = lines(s.serve(requestLine(1, Methods::Initialize) + "\n" + requestLine(2, Methods::ListTools) + "\n"));
    ASSERT_EQ(out.size(), 3u);
    auto ready = ParseJSON(out[0]);
    EXPECT_EQ(std::get<std::string>(ready.find("method")->value), Methods::ServerReady);
    EXPECT_EQ(idOf(out[1]), 1);
    EXPECT_EQ(idOf(out[2]), 2);
}

TEST(StdioServe, ToolsListScenario) {
    Stack s;
    auto out = lines(s.serve(requestLine(1, Methods::ListTools) + "\n"));
    ASSERT_EQ(out.size(), 2u);
    JSONRPCResponse r;
    ASSERT_TRUE(r.Deserialize(out[1]));
    const auto& list = std::get<JSONValue::Array>(r.result->find("tools")->value);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(std::get<std::string>(list[0]->find("name")->value), "llm_call");
}

TEST(StdioServe, BlankLinesAndNotificationsProduceNoOutput) {
    Stack s;
    const std::string input = "\n   \n{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n" +
                              requestLine(3, Methods::ListResources) + "\r\n";
    auto out = lines(s.serve(input));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(idOf(out[1]), 3);
}

TEST(StdioServe, MalformedLineGetsParseErrorAndServingContinues) {
    Stack s;
    auto out = lines(s.serve("{not json\n" + requestLine(4, Methods::ListTools) + "\n"));
    ASSERT_EQ(out.size(), 3u);
    JSONRPCResponse err;
    ASSERT_TRUE(err.Deserialize(out[1]));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(err.id));
    EXPECT_EQ(std::get<int64_t>(err.error->find("code")->value), JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(idOf(out[2]), 4);
}

TEST(StdioServe, LlmCallScenarioBooksExactlyOneRecord) {
    Stack s;
    s.transport.Push(200, fakes::CompletionBody("Hello there", "{\"prompt_tokens\":5,\"completion_tokens\":2}"));
    auto out = lines(s.serve(requestLine(7, Methods::CallTool, "{\"name\":\"llm_call\",\"arguments\":{\"prompt\":\"Say hi\"}}") + "\n"));
    ASSERT_EQ(out.size(), 2u);

    JSONRPCResponse r;
    ASSERT_TRUE(r.Deserialize(out[1]));
    ASSERT_FALSE(r.IsError());
    const auto& content = std::get<JSONValue::Array>(r.result->find("content")->value);
    EXPECT_EQ(std::get<std::string>(content[0]->find("text")->value), "Hello there");

    auto records = s.ledger.ReadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_TRUE(records[0].success);
    EXPECT_EQ(records[0].promptTokens, 5);
}

TEST(StdioServe, ProviderFailureIsAnsweredAndBooked) {
    Stack s;
    s.transport.Push(503, "down", {}, "Service Unavailable");
    auto out = lines(s.serve(requestLine(8, Methods::CallTool, "{\"name\":\"llm_call\",\"arguments\":{\"prompt\":\"hi\"}}") + "\n"));
    ASSERT_EQ(out.size(), 2u);
    JSONRPCResponse r;
    ASSERT_TRUE(r.Deserialize(out[1]));
    ASSERT_TRUE(r.IsError());
    EXPECT_EQ(std::get<int64_t>(r.error->find("code")->value), JSONRPCErrorCodes::ProviderError);
    auto records = s.ledger.ReadAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_FALSE(records[0].success);
}

TEST(StdioServe, TransportFailureIsAnsweredAndBooked) {
    Stack s;
    s.transport.PushTransportFailure();
    auto out = lines(s.serve(requestLine(9, Methods::CallTool, "{\"name\":\"llm_call\",\"arguments\":{\"prompt\":\"ping\"}}") + "\n"));
    ASSERT_EQ(out.size(), 2u);
    JSONRPCResponse r;
    ASSERT_TRUE(r.Deserialize(out[1]));
    EXPECT_EQ(idOf(out[1]), 9);
    EXPECT_EQ(std::get<int64_t>(r.error->find("code")->value), JSONRPCErrorCodes::ProviderError);
    EXPECT_EQ(out[1].find(kKey), std::string::npos);
    ASSERT_EQ(s.ledger.ReadAll().size(), 1u);
    EXPECT_FALSE(s.ledger.ReadAll()[0].success);
}

TEST(StdioServe, ResponsesKeepInputOrderUnderConcurrency) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    RouterHandlers handlers{};
    handlers.requestHandler = [&](const JSONRPCRequest& req) {
        const int now = ++active;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        // Earlier requests take longer so completions arrive out of order
        const int64_t id = std::get<int64_t>(req.id);
        std::this_thread::sleep_for(std::chrono::milliseconds(5 * (10 - id)));
        --active;
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(req.method));
    };

    std::string input;
    for (int64_t id = 1; id <= 8; ++id) {
        input += requestLine(id, "work") + "\n";
    }
    StdioServer stdio(*router, handlers, std::string(), StdioServer::Options{4});
    std::istringstream in(input);
    std::ostringstream out;
    ASSERT_TRUE(stdio.Serve(in, out));

    auto got = lines(out.str());
    ASSERT_EQ(got.size(), 8u);
    for (int64_t id = 1; id <= 8; ++id) {
        EXPECT_EQ(idOf(got[static_cast<std::size_t>(id - 1)]), id);
    }
    EXPECT_LE(peak.load(), 4);
}

TEST(StdioServe, StateTransitions) {
    Stack s;
    StdioServer stdio(*s.router, s.server->MakeRouterHandlers(), s.server->ReadyMessage());
    EXPECT_EQ(stdio.GetState(), StdioServer::State::Uninitialized);
    std::istringstream in("");
    std::ostringstream out;
    EXPECT_TRUE(stdio.Serve(in, out));
    EXPECT_EQ(stdio.GetState(), StdioServer::State::Terminated);
    EXPECT_EQ(lines(out.str()).size(), 1u);
}
