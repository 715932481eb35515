//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UsageLedger.cpp
// Purpose: Usage ledger and audit log implementation
//==========================================================================================================

#include "llmwrap/accounting/UsageLedger.h"

#include "logging/Logger.h"
#include "llmwrap/errors/Errors.h"

namespace llmwrap {
namespace accounting {

UsageLedger::UsageLedger(std::unique_ptr<ILedgerStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("UsageLedger requires a store");
    }
}

UsageLedger::~UsageLedger() {
    Close();
}

bool UsageLedger::Record(UsageRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        LOG_WARN("Ledger {} is closed; dropping usage record for model {}", store_->Describe(), record.model);
        ++failedAppends_;
        return false;
    }
    record.sequence = nextSequence_;
    if (record.timestamp.empty()) {
        record.timestamp = CurrentTimestamp();
    }
    try {
        store_->Append(ToJson(record));
    } catch (const std::exception& e) {
        LOG_WARN("Failed to record usage in {}: {}", store_->Describe(), e.what());
        ++failedAppends_;
        return false;
    }
    ++nextSequence_;
    LOG_DEBUG("Usage recorded: seq={} model={} prompt={} completion={} cost={} success={}",
              record.sequence, record.model, record.promptTokens, record.completionTokens, record.cost, record.success);
    return true;
}

void UsageLedger::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    try {
        store_->Flush();
    } catch (const std::exception& e) {
        LOG_WARN("Failed to flush ledger {}: {}", store_->Describe(), e.what());
    }
}

std::vector<UsageRecord> UsageLedger::ReadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<UsageRecord> out;
    for (const auto& v : store_->ReadAll()) {
        auto r = UsageRecordFromJson(v);
        if (r) {
            out.push_back(std::move(*r));
        } else {
            LOG_WARN("Skipping ledger entry without model/success fields");
        }
    }
    return out;
}

AuditLog::AuditLog(std::unique_ptr<ILedgerStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("AuditLog requires a store");
    }
}

AuditLog::~AuditLog() {
    Close();
}

bool AuditLog::Log(AuditEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    if (entry.timestamp.empty()) {
        entry.timestamp = CurrentTimestamp();
    }
    try {
        store_->Append(ToJson(entry));
    } catch (const std::exception& e) {
        LOG_WARN("Failed to write audit entry to {}: {}", store_->Describe(), e.what());
        return false;
    }
    return true;
}

void AuditLog::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    try {
        store_->Flush();
    } catch (const std::exception& e) {
        LOG_WARN("Failed to flush audit log {}: {}", store_->Describe(), e.what());
    }
}

std::vector<AuditEntry> AuditLog::ReadAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditEntry> out;
    for (const auto& v : store_->ReadAll()) {
        if (auto e = AuditEntryFromJson(v)) {
            out.push_back(std::move(*e));
        }
    }
    return out;
}

} // namespace accounting
} // namespace llmwrap
