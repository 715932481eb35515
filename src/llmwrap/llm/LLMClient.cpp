//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LLMClient.cpp
// Purpose: Chat-completions call adapter implementation
//==========================================================================================================

#include "llmwrap/llm/LLMClient.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "llmwrap/JSONRPCTypes.h"
#include "llmwrap/accounting/UsageLedger.h"
#include "llmwrap/errors/Errors.h"
#include "llmwrap/redaction/Redactor.h"

namespace llmwrap {
namespace llm {

namespace {
constexpr int DefaultRetryAfterSeconds = 60;

// Everything one call needs; owned by that call only.
struct CallContext {
    std::string resolvedModel;
    std::string prompt;
    std::string modelOverride;
    std::string credential;
};

// 2^63, the first double past INT64_MAX
constexpr double kInt64Bound = 9223372036854775808.0;

std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

// Token counts are non-negative; anything a provider sends outside [0, INT64_MAX] is dropped.
std::optional<int64_t> intField(const JSONValue* obj, const char* key) {
    if (obj == nullptr) return std::nullopt;
    const JSONValue* v = obj->find(key);
    if (v == nullptr) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) {
        const int64_t n = std::get<int64_t>(v->value);
        return n >= 0 ? std::optional<int64_t>(n) : std::nullopt;
    }
    if (std::holds_alternative<double>(v->value)) {
        const double d = std::get<double>(v->value);
        if (!std::isfinite(d) || d < 0.0 || d >= kInt64Bound) {
            LOG_WARN("Ignoring out-of-range usage field {}", key);
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

std::optional<double> doubleField(const JSONValue* obj, const char* key) {
    if (obj == nullptr) return std::nullopt;
    const JSONValue* v = obj->find(key);
    if (v == nullptr) return std::nullopt;
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    if (std::holds_alternative<int64_t>(v->value)) return static_cast<double>(std::get<int64_t>(v->value));
    return std::nullopt;
}

int64_t headerInt(const HttpResponse& res, const char* name) {
    auto h = res.Header(name);
    if (!h) return 0;
    try {
        const int64_t n = static_cast<int64_t>(std::stoll(*h));
        return n >= 0 ? n : 0;
    } catch (const std::exception&) {
        LOG_DEBUG("Ignoring non-numeric {} header: {}", name, *h);
        return 0;
    }
}

double headerDouble(const HttpResponse& res, const char* name) {
    auto h = res.Header(name);
    if (!h) return 0.0;
    try {
        return std::stod(*h);
    } catch (const std::exception&) {
        LOG_DEBUG("Ignoring non-numeric {} header: {}", name, *h);
        return 0.0;
    }
}

JSONValue message(const char* role, const std::string& content) {
    JSONValue::Object m;
    m["role"] = std::make_shared<JSONValue>(role);
    m["content"] = std::make_shared<JSONValue>(content);
    return JSONValue{std::move(m)};
}

// choices[0].message.content, or nullptr when the reply does not have that shape
const JSONValue* replyContent(const JSONValue& body, bool& haveChoices) {
    haveChoices = false;
    const JSONValue* choices = body.find("choices");
    if (choices == nullptr || !std::holds_alternative<JSONValue::Array>(choices->value)) {
        return nullptr;
    }
    const auto& arr = std::get<JSONValue::Array>(choices->value);
    if (arr.empty() || !arr.front()) {
        return nullptr;
    }
    haveChoices = true;
    const JSONValue* msg = arr.front()->find("message");
    if (msg == nullptr) {
        return nullptr;
    }
    const JSONValue* content = msg->find("content");
    if (content == nullptr || !content->isString()) {
        return nullptr;
    }
    return content;
}

void extractUsage(const JSONValue& body, const HttpResponse& res, LLMResult& out) {
    const JSONValue* usage = body.find("usage");
    const JSONValue* promptDetails = usage ? usage->find("prompt_tokens_details") : nullptr;
    const JSONValue* completionDetails = usage ? usage->find("completion_tokens_details") : nullptr;

    out.promptTokens = intField(usage, "prompt_tokens").value_or(headerInt(res, "X-Prompt-Tokens"));
    out.completionTokens = intField(usage, "completion_tokens").value_or(headerInt(res, "X-Completion-Tokens"));
    out.totalTokens = intField(usage, "total_tokens").value_or(headerInt(res, "X-Total-Tokens"));
    out.cost = doubleField(usage, "cost").value_or(headerDouble(res, "X-Total-Cost"));
    out.cachedTokens = intField(promptDetails, "cached_tokens").value_or(headerInt(res, "X-Cached-Tokens"));
    out.reasoningTokens = intField(completionDetails, "reasoning_tokens").value_or(headerInt(res, "X-Reasoning-Tokens"));
    if (out.totalTokens == 0) {
        out.totalTokens = out.promptTokens + out.completionTokens;
    }
}
} // namespace

bool IsValidModelSpec(const std::string& model) {
    const std::string m = trim(model);
    if (m.size() < 2) {
        return false;
    }
    const auto slash = m.find('/');
    if (slash == std::string::npos || m.find('/', slash + 1) != std::string::npos) {
        return false;
    }
    return !trim(m.substr(0, slash)).empty() && !trim(m.substr(slash + 1)).empty();
}

LLMClient::LLMClient(LLMClientConfig config,
                     IHttpTransport& transport,
                     const redaction::Redactor& redactor,
                     accounting::UsageLedger& ledger,
                     accounting::AuditLog* audit)
    : config_(std::move(config)), transport_(transport), redactor_(redactor), ledger_(ledger), audit_(audit) {
    while (!config_.baseUrl.empty() && config_.baseUrl.back() == '/') {
        config_.baseUrl.pop_back();
    }
}

std::string LLMClient::ResolveModel(const std::string& overrideModel) const {
    const std::string requested = trim(overrideModel);
    if (requested.empty()) {
        return config_.defaultModel;
    }
    if (!config_.allowedModels.has_value()) {
        return requested;
    }
    const auto& allowed = config_.allowedModels.value();
    if (std::find(allowed.begin(), allowed.end(), requested) != allowed.end()) {
        return requested;
    }
    LOG_WARN("Model '{}' is not in the allowed list; using default model '{}'", requested, config_.defaultModel);
    return config_.defaultModel;
}

std::string LLMClient::BuildPayload(const std::string& prompt, const std::string& model) const {
    JSONValue::Array messages;
    if (!config_.systemPrompt.empty()) {
        messages.push_back(std::make_shared<JSONValue>(message("system", config_.systemPrompt)));
    }
    messages.push_back(std::make_shared<JSONValue>(message("user", prompt)));

    JSONValue::Object payload;
    payload["model"] = std::make_shared<JSONValue>(model);
    payload["messages"] = std::make_shared<JSONValue>(std::move(messages));
    if (config_.maxTokens.has_value()) {
        payload["max_tokens"] = std::make_shared<JSONValue>(config_.maxTokens.value());
    }
    return SerializeJSON(JSONValue{std::move(payload)});
}

LLMResult LLMClient::Call(const std::string& prompt, const std::string& model, const std::string& credential) {
    FUNC_SCOPE();
    const CallContext ctx{ResolveModel(model), prompt, model, credential};
    LOG_INFO("LLM call: model={} prompt_chars={}", ctx.resolvedModel, ctx.prompt.size());

    auto book = [this, &ctx](bool success, const LLMResult* r) {
        accounting::UsageRecord rec;
        rec.model = ctx.resolvedModel;
        rec.project = config_.project;
        rec.username = config_.username;
        rec.success = success;
        if (r != nullptr) {
            rec.promptTokens = r->promptTokens;
            rec.completionTokens = r->completionTokens;
            rec.cachedTokens = r->cachedTokens;
            rec.reasoningTokens = r->reasoningTokens;
            rec.cost = r->cost;
            rec.remoteCompletionId = r->remoteCompletionId;
        }
        (void)ledger_.Record(std::move(rec));
    };
    auto audit = [this, &ctx](accounting::AuditEntry::Kind kind, const std::string& text, const std::string& remoteId) {
        if (audit_ == nullptr) {
            return;
        }
        accounting::AuditEntry e;
        e.appName = config_.appName;
        e.userName = config_.username;
        e.model = ctx.resolvedModel;
        e.kind = kind;
        e.text = redactor_.Redact(text);
        e.remoteCompletionId = remoteId;
        (void)audit_->Log(std::move(e));
    };
    auto fail = [this](int status, const std::string& msg) {
        return errors::ProviderError(status, redactor_.Redact(msg));
    };

    HttpRequest req;
    req.method = "POST";
    req.url = config_.baseUrl + "/chat/completions";
    req.headers = {
        {"Authorization", "Bearer " + ctx.credential},
        {"Content-Type", "application/json"},
        {"HTTP-Referer", ReferrerHeaderValue},
        {"X-Title", TitleHeaderValue},
        {"X-API-Version", "1"},
        {"X-Response-Content", "usage"},
    };
    req.body = BuildPayload(ctx.prompt, ctx.resolvedModel);
    audit(accounting::AuditEntry::Kind::Prompt, ctx.prompt, std::string());

    LLMResult result;
    result.model = ctx.resolvedModel;
    try {
        HttpResponse res;
        try {
            res = transport_.Send(req);
        } catch (const TransportError& e) {
            throw fail(0, std::string("API request failed: ") + e.what());
        }
        LOG_DEBUG("LLM response status={} bytes={}", res.status, res.body.size());

        if (res.status == 429) {
            int retryAfter = DefaultRetryAfterSeconds;
            if (auto h = res.Header("Retry-After")) {
                try {
                    retryAfter = std::stoi(*h);
                } catch (const std::exception&) {
                    LOG_DEBUG("Non-numeric Retry-After header: {}", *h);
                }
            }
            throw fail(429, fmt::format("API rate limit exceeded: Retry after {} seconds", retryAfter));
        }
        if (res.status < 200 || res.status >= 300) {
            throw fail(res.status, fmt::format("API HTTP error: {} {}", res.status, res.reason));
        }

        JSONValue body;
        try {
            body = ParseJSON(res.body);
        } catch (const JSONParseError& e) {
            throw fail(res.status, std::string("Invalid API response format: ") + e.what());
        }
        bool haveChoices = false;
        const JSONValue* content = replyContent(body, haveChoices);
        if (content == nullptr) {
            throw fail(res.status, haveChoices ? "Invalid API response format: Missing message content"
                                               : "Invalid API response format: Missing choices array");
        }
        result.text = redactor_.Redact(std::get<std::string>(content->value));
        if (const JSONValue* id = body.find("id"); id != nullptr && id->isString()) {
            result.remoteCompletionId = std::get<std::string>(id->value);
        }
        extractUsage(body, res, result);
    } catch (const std::exception& e) {
        LOG_ERROR("LLM call failed: {}", e.what());
        book(false, nullptr);
        throw;
    }

    book(true, &result);
    audit(accounting::AuditEntry::Kind::Response, result.text, result.remoteCompletionId);
    LOG_INFO("LLM call completed: model={} prompt_tokens={} completion_tokens={} cost={}",
             result.model, result.promptTokens, result.completionTokens, result.cost);
    return result;
}

} // namespace llm
} // namespace llmwrap
