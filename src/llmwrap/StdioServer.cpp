//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.cpp
// Purpose: stdio serving loop implementation (reader, bounded workers, in-order writer)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <future>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

#include "logging/Logger.h"
#include "llmwrap/StdioServer.hpp"

namespace llmwrap {

class StdioServer::Impl {
public:
    using PendingResult = std::future<std::optional<std::string>>;

    IJsonRpcMessageRouter& router;
    RouterHandlers handlers;
    std::string readyMessage;
    StdioServer::Options opts;

    std::mutex mutex; // protects pending, inFlight, readerDone
    std::condition_variable cv;
    std::deque<PendingResult> pending;
    unsigned int inFlight{0};
    bool readerDone{false};
    std::atomic<bool> outputFailed{false};

    Impl(IJsonRpcMessageRouter& r, RouterHandlers h, std::string ready, StdioServer::Options o)
        : router(r), handlers(std::move(h)), readyMessage(std::move(ready)), opts(o) {
        if (opts.maxConcurrentCalls == 0) {
            opts.maxConcurrentCalls = 1;
        }
    }

    static bool isBlank(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    }

    bool writeLine(std::ostream& out, const std::string& line) {
        out << line << '\n';
        out.flush();
        if (!out) {
            LOG_ERROR("StdioServer: write to output stream failed");
            outputFailed.store(true);
            return false;
        }
        return true;
    }

    PendingResult dispatch(std::string line) {
        auto task = [this, l = std::move(line)]() { return router.route(l, handlers); };
        try {
            return std::async(std::launch::async, task);
        } catch (const std::system_error& e) {
            // No thread available: handle inline, ordering is unaffected
            LOG_WARN("StdioServer: async dispatch unavailable ({}); handling inline", e.what());
            std::promise<std::optional<std::string>> p;
            p.set_value(task());
            return p.get_future();
        }
    }

    void writerLoop(std::ostream& out) {
        while (true) {
            PendingResult next;
            {
                std::unique_lock<std::mutex> lk(mutex);
                cv.wait(lk, [&] { return !pending.empty() || readerDone; });
                if (pending.empty()) {
                    break;
                }
                next = std::move(pending.front());
                pending.pop_front();
            }

            std::optional<std::string> response;
            try {
                response = next.get();
            } catch (const std::exception& e) {
                LOG_ERROR("StdioServer: request task failed: {}", e.what());
            }
            if (response.has_value() && !outputFailed.load()) {
                (void)writeLine(out, response.value());
            }

            {
                std::lock_guard<std::mutex> lk(mutex);
                --inFlight;
            }
            cv.notify_all();
        }
    }
};

StdioServer::StdioServer(IJsonRpcMessageRouter& router, RouterHandlers handlers, std::string readyMessage)
    : StdioServer(router, std::move(handlers), std::move(readyMessage), Options{}) {}

StdioServer::StdioServer(IJsonRpcMessageRouter& router, RouterHandlers handlers, std::string readyMessage, Options opts)
    : pImpl(std::make_unique<Impl>(router, std::move(handlers), std::move(readyMessage), opts)) {}

StdioServer::~StdioServer() = default;

bool StdioServer::Serve(std::istream& in, std::ostream& out) {
    FUNC_SCOPE();
    state.store(State::Serving);
    LOG_INFO("StdioServer: serving (max concurrent calls: {})", pImpl->opts.maxConcurrentCalls);

    if (!pImpl->readyMessage.empty() && !pImpl->writeLine(out, pImpl->readyMessage)) {
        state.store(State::Terminated);
        return false;
    }

    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->readerDone = false;
    }
    std::thread writer([this, &out]() { pImpl->writerLoop(out); });

    std::string line;
    while (!pImpl->outputFailed.load() && std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (Impl::isBlank(line)) {
            continue;
        }
        LOG_DEBUG("StdioServer: received {} bytes", line.size());
        {
            std::unique_lock<std::mutex> lk(pImpl->mutex);
            pImpl->cv.wait(lk, [&] { return pImpl->inFlight < pImpl->opts.maxConcurrentCalls; });
            ++pImpl->inFlight;
        }
        auto result = pImpl->dispatch(std::move(line));
        {
            std::lock_guard<std::mutex> lk(pImpl->mutex);
            pImpl->pending.push_back(std::move(result));
        }
        pImpl->cv.notify_all();
    }
    const bool inputFailed = in.bad();
    if (inputFailed) {
        LOG_ERROR("StdioServer: input stream error");
    } else {
        LOG_INFO("StdioServer: end of input; draining in-flight requests");
    }

    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->readerDone = true;
    }
    pImpl->cv.notify_all();
    writer.join();

    state.store(State::Terminated);
    LOG_INFO("StdioServer: terminated");
    return !inputFailed && !pImpl->outputFailed.load();
}

} // namespace llmwrap
