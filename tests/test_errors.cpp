//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>

#include "llmwrap/JSONRPCTypes.h"
#include "llmwrap/errors/Errors.h"

using namespace llmwrap;

TEST(Errors, CategoryMapping) {
    using llmwrap::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ProviderError), ErrorCategory::Provider);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, ProtocolErrorKeepsItsCode) {
    errors::ProtocolError pe(JSONRPCErrorCodes::InvalidParams, "Missing required 'prompt' argument");
    auto e = errors::errorFromException(pe);
    EXPECT_EQ(e.code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(e.message, "Missing required 'prompt' argument");
    EXPECT_EQ(e.category, errors::ErrorCategory::JsonRpcInvalidParams);
    EXPECT_FALSE(e.data.has_value());
}

TEST(Errors, ProviderErrorCarriesHttpStatus) {
    errors::ProviderError prov(429, "API rate limit exceeded: Retry after 60 seconds");
    auto e = errors::errorFromException(prov);
    EXPECT_EQ(e.code, JSONRPCErrorCodes::ProviderError);
    ASSERT_TRUE(e.data.has_value());
    const JSONValue* status = e.data->find("status");
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(std::get<int64_t>(status->value), 429);
}

TEST(Errors, OtherExceptionsAreInternal) {
    std::runtime_error boom("boom");
    auto e = errors::errorFromException(boom);
    EXPECT_EQ(e.code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(e.message, "boom");
}

TEST(Errors, ErrorResponseShape) {
    auto resp = errors::makeErrorResponse(static_cast<int64_t>(9), errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: x"));
    ASSERT_TRUE(resp);
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(std::get<int64_t>(resp->id), 9);

    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(resp->Serialize()));
    EXPECT_EQ(std::get<int64_t>(parsed.error->find("code")->value), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<std::string>(parsed.error->find("message")->value), "Method not found: x");
    EXPECT_EQ(parsed.error->find("data"), nullptr);
}
