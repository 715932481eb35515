//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy (typed exceptions) and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "llmwrap/JSONRPCTypes.h"

namespace llmwrap {
namespace errors {

// Categorization of the error codes this server emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Provider,
    Unknown
};

// Typed error representation turned into a JSON-RPC error object at the dispatch boundary.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ProviderError: return ErrorCategory::Provider;
        default: return ErrorCategory::Unknown;
    }
}

//==========================================================================================================
// ProtocolError
// Purpose: Request-level failure (bad method, bad params) carrying the JSON-RPC code to report.
//==========================================================================================================
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

//==========================================================================================================
// ProviderError
// Purpose: The model provider call failed (non-2xx, malformed body, transport failure).
// Fields:
//   status: HTTP status when a response was received, 0 when the exchange never completed.
// Notes:
//   The message is expected to be redacted by whoever raises it.
//==========================================================================================================
class ProviderError : public std::runtime_error {
public:
    ProviderError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    int status() const noexcept { return status_; }

private:
    int status_;
};

//==========================================================================================================
// LedgerError
// Purpose: The ledger store could not open, append, flush, or read. Never surfaces to protocol callers.
//==========================================================================================================
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message) : std::runtime_error(message) {}
};

// Create a typed McpError from a code and message.
inline McpError makeError(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = message;
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Map an exception caught at the dispatch boundary to the error reported to the caller.
//
// Args:
//   ex: ProtocolError keeps its own code; ProviderError maps to ProviderError (-32000) with
//       data.status; anything else is InternalError (-32603).
//
// Returns:
//   McpError with the unredacted exception message.
inline McpError errorFromException(const std::exception& ex) {
    if (const auto* pe = dynamic_cast<const ProtocolError*>(&ex)) {
        return makeError(pe->code(), pe->what());
    }
    if (const auto* prov = dynamic_cast<const ProviderError*>(&ex)) {
        JSONValue::Object data;
        data["status"] = std::make_shared<JSONValue>(static_cast<int64_t>(prov->status()));
        return makeError(JSONRPCErrorCodes::ProviderError, prov->what(), JSONValue{std::move(data)});
    }
    return makeError(JSONRPCErrorCodes::InternalError, ex.what());
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace llmwrap
