//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LedgerStore.cpp
// Purpose: File and in-memory JSON line stores
//==========================================================================================================

#include "llmwrap/accounting/LedgerStore.h"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include "logging/Logger.h"
#include "llmwrap/errors/Errors.h"

namespace llmwrap {
namespace accounting {

namespace {
constexpr const char* FileScheme = "file://";

bool isMemoryUrl(const std::string& url) {
    return url == "memory" || url == "mock" || url == "memory://";
}
} // namespace

FileLedgerStore::FileLedgerStore(std::string path) : path_(std::move(path)) {
    std::error_code ec;
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw errors::LedgerError("Failed to create ledger directory " + parent.string() + ": " + ec.message());
        }
    }
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open()) {
        throw errors::LedgerError("Failed to open ledger file: " + path_ + " (" + std::strerror(errno) + ")");
    }
    LOG_DEBUG("Ledger file opened: {}", path_);
}

FileLedgerStore::~FileLedgerStore() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

void FileLedgerStore::Append(const JSONValue& entry) {
    const std::string line = SerializeJSON(entry);
    out_ << line << '\n';
    if (!out_.good()) {
        out_.clear();
        throw errors::LedgerError("Failed to append to ledger file: " + path_);
    }
}

void FileLedgerStore::Flush() {
    out_.flush();
    if (!out_.good()) {
        out_.clear();
        throw errors::LedgerError("Failed to flush ledger file: " + path_);
    }
}

std::vector<JSONValue> FileLedgerStore::ReadAll() {
    out_.flush();
    std::ifstream in(path_);
    if (!in.is_open()) {
        throw errors::LedgerError("Failed to read ledger file: " + path_);
    }
    std::vector<JSONValue> entries;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }
        try {
            entries.push_back(ParseJSON(line));
        } catch (const JSONParseError& e) {
            LOG_WARN("Skipping malformed ledger line {} in {}: {}", lineNo, path_, e.what());
        }
    }
    return entries;
}

std::string FileLedgerStore::Describe() const {
    return std::string(FileScheme) + path_;
}

void InMemoryLedgerStore::Append(const JSONValue& entry) {
    // Stored serialized so readers get a deep copy, like a file store would return
    lines_.push_back(SerializeJSON(entry));
}

std::vector<JSONValue> InMemoryLedgerStore::ReadAll() {
    std::vector<JSONValue> entries;
    entries.reserve(lines_.size());
    for (const auto& l : lines_) {
        entries.push_back(ParseJSON(l));
    }
    return entries;
}

std::unique_ptr<ILedgerStore> OpenLedgerStore(const std::string& url) {
    if (isMemoryUrl(url)) {
        return std::make_unique<InMemoryLedgerStore>();
    }
    if (url.rfind(FileScheme, 0) == 0) {
        return std::make_unique<FileLedgerStore>(url.substr(std::strlen(FileScheme)));
    }
    if (url.find("://") != std::string::npos) {
        throw errors::LedgerError("Unsupported ledger url scheme: " + url);
    }
    if (url.empty()) {
        throw errors::LedgerError("Empty ledger url");
    }
    return std::make_unique<FileLedgerStore>(url);
}

std::string AuditUrlFor(const std::string& ledgerUrl) {
    if (isMemoryUrl(ledgerUrl)) {
        return ledgerUrl;
    }
    std::string path = ledgerUrl;
    const bool hasScheme = path.rfind(FileScheme, 0) == 0;
    if (hasScheme) {
        path = path.substr(std::strlen(FileScheme));
    }
    const std::filesystem::path ledgerPath(path);
    if (ledgerPath.filename() == "audit.jsonl") {
        throw errors::LedgerError("Ledger file " + path + " would be shared with the audit log");
    }
    const auto audit = (ledgerPath.parent_path() / "audit.jsonl").string();
    return hasScheme ? std::string(FileScheme) + audit : audit;
}

} // namespace accounting
} // namespace llmwrap
