//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UsageRecord.cpp
// Purpose: JSON mapping for ledger entries
//==========================================================================================================

#include "llmwrap/accounting/UsageRecord.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>

#include <fmt/format.h>

namespace llmwrap {
namespace accounting {

namespace {
void put(JSONValue::Object& o, const char* key, JSONValue v) {
    o[key] = std::make_shared<JSONValue>(std::move(v));
}

std::optional<std::string> getString(const JSONValue& v, const char* key) {
    const JSONValue* f = v.find(key);
    if (f == nullptr || !f->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(f->value);
}

// Numbers written as integers may come back as doubles and vice versa.
int64_t getInt(const JSONValue& v, const char* key) {
    const JSONValue* f = v.find(key);
    if (f == nullptr) return 0;
    if (std::holds_alternative<int64_t>(f->value)) return std::max<int64_t>(std::get<int64_t>(f->value), 0);
    if (std::holds_alternative<double>(f->value)) {
        const double d = std::get<double>(f->value);
        // Out-of-range values read back as 0 rather than wrapping
        if (!std::isfinite(d) || d < 0.0 || d >= 9223372036854775808.0) return 0;
        return static_cast<int64_t>(d);
    }
    return 0;
}

double getDouble(const JSONValue& v, const char* key) {
    const JSONValue* f = v.find(key);
    if (f == nullptr) return 0.0;
    if (std::holds_alternative<double>(f->value)) return std::get<double>(f->value);
    if (std::holds_alternative<int64_t>(f->value)) return static_cast<double>(std::get<int64_t>(f->value));
    return 0.0;
}
} // namespace

std::string CurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                       static_cast<int>(ms));
}

JSONValue ToJson(const UsageRecord& r) {
    JSONValue::Object o;
    put(o, "sequence", JSONValue(static_cast<int64_t>(r.sequence)));
    put(o, "timestamp", JSONValue(r.timestamp));
    put(o, "model", JSONValue(r.model));
    put(o, "prompt_tokens", JSONValue(r.promptTokens));
    put(o, "completion_tokens", JSONValue(r.completionTokens));
    put(o, "cached_tokens", JSONValue(r.cachedTokens));
    put(o, "reasoning_tokens", JSONValue(r.reasoningTokens));
    put(o, "cost", JSONValue(r.cost));
    put(o, "project", JSONValue(r.project));
    put(o, "username", JSONValue(r.username));
    put(o, "success", JSONValue(r.success));
    if (!r.remoteCompletionId.empty()) {
        put(o, "remote_completion_id", JSONValue(r.remoteCompletionId));
    }
    return JSONValue{std::move(o)};
}

std::optional<UsageRecord> UsageRecordFromJson(const JSONValue& v) {
    auto model = getString(v, "model");
    const JSONValue* success = v.find("success");
    if (!model || success == nullptr || !std::holds_alternative<bool>(success->value)) {
        return std::nullopt;
    }
    UsageRecord r;
    r.sequence = static_cast<uint64_t>(getInt(v, "sequence"));
    r.timestamp = getString(v, "timestamp").value_or("");
    r.model = *model;
    r.promptTokens = getInt(v, "prompt_tokens");
    r.completionTokens = getInt(v, "completion_tokens");
    r.cachedTokens = getInt(v, "cached_tokens");
    r.reasoningTokens = getInt(v, "reasoning_tokens");
    r.cost = getDouble(v, "cost");
    r.project = getString(v, "project").value_or("");
    r.username = getString(v, "username").value_or("");
    r.success = std::get<bool>(success->value);
    r.remoteCompletionId = getString(v, "remote_completion_id").value_or("");
    return r;
}

JSONValue ToJson(const AuditEntry& e) {
    JSONValue::Object o;
    put(o, "timestamp", JSONValue(e.timestamp));
    put(o, "app_name", JSONValue(e.appName));
    put(o, "user_name", JSONValue(e.userName));
    put(o, "model", JSONValue(e.model));
    put(o, "kind", JSONValue(e.kind == AuditEntry::Kind::Prompt ? "prompt" : "response"));
    put(o, "text", JSONValue(e.text));
    if (!e.remoteCompletionId.empty()) {
        put(o, "remote_completion_id", JSONValue(e.remoteCompletionId));
    }
    return JSONValue{std::move(o)};
}

std::optional<AuditEntry> AuditEntryFromJson(const JSONValue& v) {
    auto kind = getString(v, "kind");
    auto text = getString(v, "text");
    if (!kind || !text || (*kind != "prompt" && *kind != "response")) {
        return std::nullopt;
    }
    AuditEntry e;
    e.timestamp = getString(v, "timestamp").value_or("");
    e.appName = getString(v, "app_name").value_or("");
    e.userName = getString(v, "user_name").value_or("");
    e.model = getString(v, "model").value_or("");
    e.kind = (*kind == "prompt") ? AuditEntry::Kind::Prompt : AuditEntry::Kind::Response;
    e.text = *text;
    e.remoteCompletionId = getString(v, "remote_completion_id").value_or("");
    return e;
}

} // namespace accounting
} // namespace llmwrap
