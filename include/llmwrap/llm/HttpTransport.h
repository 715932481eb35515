//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTransport.h
// Purpose: Network collaborator used by the LLM client: one HTTP request in, one HTTP response out
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace llmwrap {
namespace llm {

struct HttpRequest {
    std::string method{"POST"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

//==========================================================================================================
// HttpResponse
// Fields:
//   headers: Keys are lower-cased.
//==========================================================================================================
struct HttpResponse {
    int status{0};
    std::string reason;
    std::map<std::string, std::string> headers;
    std::string body;

    // Case-insensitive header lookup.
    std::optional<std::string> Header(const std::string& name) const;
};

//==========================================================================================================
// TransportError
// Purpose: The exchange did not complete (resolve/connect/TLS/read failure or timeout).
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// IHttpTransport
// Purpose: Connection handling, timeouts and HTTP-level retry belong here; callers see one final outcome.
// Methods:
//   Send(request): Returns the final response (any status). Throws TransportError on I/O failure.
//==========================================================================================================
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

} // namespace llm
} // namespace llmwrap
