//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastHttpTransport.hpp
// Purpose: HTTP/HTTPS client transport for provider calls using Boost.Beast coroutines
//==========================================================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "llmwrap/llm/HttpTransport.h"

namespace llmwrap {
namespace llm {

//==========================================================================================================
// BeastHttpTransport
// Purpose: Blocking Send() facade over an io_context thread owned by the transport. Each Send spawns a
//          coroutine and waits on its future, so any number of caller threads may share one instance.
// Notes:
//   Retries (connection failure, timeout, 429, 5xx) with a linear backoff; the final status is returned
//   as-is and the last I/O failure is thrown as TransportError.
//==========================================================================================================
class BeastHttpTransport : public IHttpTransport {
public:
    struct Options {
        uint64_t connectTimeoutMs{10000};
        uint64_t readTimeoutMs{30000};
        unsigned int maxRetries{2};
        uint64_t retryBackoffMs{250};
        // Optional CA bundle; system default verify paths otherwise
        std::string caFile;
    };

    BeastHttpTransport();
    explicit BeastHttpTransport(const Options& opts);
    ~BeastHttpTransport() override;

    BeastHttpTransport(const BeastHttpTransport&) = delete;
    BeastHttpTransport& operator=(const BeastHttpTransport&) = delete;

    //==========================================================================================================
    // Send
    // Purpose: Perform the exchange described by request (absolute http:// or https:// URL).
    // Returns:
    //   Final HttpResponse. Throws TransportError on invalid URL or when every attempt failed at I/O level.
    //==========================================================================================================
    HttpResponse Send(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace llm
} // namespace llmwrap
