//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UsageLedger.h
// Purpose: Accounting ledger (usage records) and audit log over an ILedgerStore
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "llmwrap/accounting/LedgerStore.h"
#include "llmwrap/accounting/UsageRecord.h"

namespace llmwrap {
namespace accounting {

//==========================================================================================================
// UsageLedger
// Purpose: Serialized append path for UsageRecords.
// Notes:
//   Record() is safe from concurrent call contexts and never throws: a store failure is logged as a
//   warning and the record is dropped. The lock covers only the append, never a network call.
//   Close() flushes once; later Record() calls are dropped with a warning.
//==========================================================================================================
class UsageLedger {
public:
    explicit UsageLedger(std::unique_ptr<ILedgerStore> store);
    ~UsageLedger();

    UsageLedger(const UsageLedger&) = delete;
    UsageLedger& operator=(const UsageLedger&) = delete;

    //==========================================================================================================
    // Record
    // Purpose: Assign the next sequence number (and a timestamp when unset) and append the record.
    // Returns:
    //   true when the store accepted the record.
    //==========================================================================================================
    bool Record(UsageRecord record);

    // Flushes buffered writes. Idempotent.
    void Close();

    // Read path for reporting; records in append order. Throws errors::LedgerError when the store is unreadable.
    std::vector<UsageRecord> ReadAll();

    uint64_t FailedAppends() const { return failedAppends_.load(); }

private:
    std::mutex mutex_;
    std::unique_ptr<ILedgerStore> store_;
    uint64_t nextSequence_{1};
    bool closed_{false};
    std::atomic<uint64_t> failedAppends_{0};
};

//==========================================================================================================
// AuditLog
// Purpose: Prompt and response trail kept next to the usage ledger, same failure policy.
//==========================================================================================================
class AuditLog {
public:
    explicit AuditLog(std::unique_ptr<ILedgerStore> store);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    bool Log(AuditEntry entry);
    void Close();
    std::vector<AuditEntry> ReadAll();

private:
    std::mutex mutex_;
    std::unique_ptr<ILedgerStore> store_;
    bool closed_{false};
};

} // namespace accounting
} // namespace llmwrap
