//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LedgerStore.h
// Purpose: Append-only JSON line stores backing the usage ledger and the audit log
//==========================================================================================================

#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "llmwrap/JSONRPCTypes.h"

namespace llmwrap {
namespace accounting {

//==========================================================================================================
// ILedgerStore
// Purpose: Durable, order-preserving append target. Callers serialize access; implementations need not.
// Methods:
//   Append(entry): Writes one entry. Throws errors::LedgerError on failure.
//   Flush(): Pushes buffered writes to the backing medium. Throws errors::LedgerError on failure.
//   ReadAll(): Returns every entry in append order. Throws errors::LedgerError when unreadable.
//   Describe(): Diagnostic name for log lines.
//==========================================================================================================
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual void Append(const JSONValue& entry) = 0;
    virtual void Flush() = 0;
    virtual std::vector<JSONValue> ReadAll() = 0;
    virtual std::string Describe() const = 0;
};

//==========================================================================================================
// FileLedgerStore
// Purpose: One compact JSON object per line, file opened in append mode. Parent directories are created.
// Notes:
//   Lines that fail to parse on ReadAll are skipped with a warning (a torn final line after a crash).
//==========================================================================================================
class FileLedgerStore : public ILedgerStore {
public:
    explicit FileLedgerStore(std::string path);
    ~FileLedgerStore() override;

    void Append(const JSONValue& entry) override;
    void Flush() override;
    std::vector<JSONValue> ReadAll() override;
    std::string Describe() const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream out_;
};

//==========================================================================================================
// InMemoryLedgerStore
// Purpose: Non-persistent store for tests and the "memory" ledger mode.
//==========================================================================================================
class InMemoryLedgerStore : public ILedgerStore {
public:
    void Append(const JSONValue& entry) override;
    void Flush() override {}
    std::vector<JSONValue> ReadAll() override;
    std::string Describe() const override { return "memory"; }

private:
    std::vector<std::string> lines_;
};

// Discards every entry; used when usage accounting is switched off.
class NullLedgerStore : public ILedgerStore {
public:
    void Append(const JSONValue&) override {}
    void Flush() override {}
    std::vector<JSONValue> ReadAll() override { return {}; }
    std::string Describe() const override { return "disabled"; }
};

//==========================================================================================================
// OpenLedgerStore
// Purpose: Open the store named by a ledger URL.
// Args:
//   url: "memory" or "mock" for an in-memory store; "file://<path>" or a bare path for a file store.
// Returns:
//   Owned store. Throws errors::LedgerError for unsupported schemes or when the file cannot be opened.
//==========================================================================================================
std::unique_ptr<ILedgerStore> OpenLedgerStore(const std::string& url);

//==========================================================================================================
// AuditUrlFor
// Purpose: Ledger URL of the audit log kept beside the usage ledger ("audit.jsonl" in the same directory).
//   Throws errors::LedgerError when the ledger file itself is named audit.jsonl.
//==========================================================================================================
std::string AuditUrlFor(const std::string& ledgerUrl);

} // namespace accounting
} // namespace llmwrap
