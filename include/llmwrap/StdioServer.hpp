//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.hpp
// Purpose: Line-delimited JSON-RPC serving loop over an input/output stream pair (stdin/stdout)
//==========================================================================================================
#pragma once

#include "llmwrap/JsonRpcMessageRouter.h"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>

namespace llmwrap {

//==========================================================================================================
// StdioServer
// Purpose: Reads one JSON-RPC message per line, routes it, and writes one response line per request.
// Notes:
//   Up to Options::maxConcurrentCalls requests are handled in parallel; a writer drains a FIFO of
//   pending results so responses are written in the order their requests were read.
//   At end of input the reader stops, in-flight requests finish and are written, then Serve returns.
//==========================================================================================================
class StdioServer {
public:
    enum class State {
        Uninitialized,
        Serving,
        Terminated
    };

    struct Options {
        unsigned int maxConcurrentCalls{1};
    };

    //==========================================================================================================
    // Args:
    //   router: Line router (must outlive the server).
    //   handlers: Request/notification handlers passed to the router for every line.
    //   readyMessage: Line written before the first read; skipped when empty.
    //==========================================================================================================
    StdioServer(IJsonRpcMessageRouter& router, RouterHandlers handlers, std::string readyMessage);
    StdioServer(IJsonRpcMessageRouter& router, RouterHandlers handlers, std::string readyMessage, Options opts);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    //==========================================================================================================
    // Serve
    // Purpose: Run until the input stream closes or the output stream fails.
    // Returns:
    //   true on clean end of input; false when reading or writing hit an unrecoverable stream error.
    //==========================================================================================================
    bool Serve(std::istream& in, std::ostream& out);

    State GetState() const { return state.load(); }

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    std::atomic<State> state{State::Uninitialized};
};

} // namespace llmwrap
