//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UsageRecord.h
// Purpose: Ledger entry types (usage bookkeeping and prompt/response audit) and their JSON line form
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "llmwrap/JSONRPCTypes.h"

namespace llmwrap {
namespace accounting {

//==========================================================================================================
// UsageRecord
// Purpose: One completed or failed model call. Append-only; never mutated after it is written.
// Fields:
//   sequence: Assigned by UsageLedger at append time (1-based, monotonic per ledger).
//   timestamp: UTC ISO-8601 with milliseconds.
//   success: false when the provider call failed; token counts are then zero.
//==========================================================================================================
struct UsageRecord {
    uint64_t sequence{0};
    std::string timestamp;
    std::string model;
    int64_t promptTokens{0};
    int64_t completionTokens{0};
    int64_t cachedTokens{0};
    int64_t reasoningTokens{0};
    double cost{0.0};
    std::string project;
    std::string username;
    bool success{false};
    std::string remoteCompletionId;
};

//==========================================================================================================
// AuditEntry
// Purpose: Prompt sent to, or response received from, the provider. Text is stored redacted.
//==========================================================================================================
struct AuditEntry {
    enum class Kind { Prompt, Response };

    std::string timestamp;
    std::string appName;
    std::string userName;
    std::string model;
    Kind kind{Kind::Prompt};
    std::string text;
    std::string remoteCompletionId;
};

// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string CurrentTimestamp();

JSONValue ToJson(const UsageRecord& r);
// Returns nullopt when required fields are missing or mistyped.
std::optional<UsageRecord> UsageRecordFromJson(const JSONValue& v);

JSONValue ToJson(const AuditEntry& e);
std::optional<AuditEntry> AuditEntryFromJson(const JSONValue& v);

} // namespace accounting
} // namespace llmwrap
