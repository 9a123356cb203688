//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BeastResponseSink.hpp
// Purpose: IResponseSink over a Boost.Beast stream (plain tcp_stream or ssl_stream<tcp_stream>)
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpgw/http/HttpTypes.hpp"

namespace mcpgw {

//==========================================================================================================
// BeastResponseSink
// Purpose: Connection-bound sink for one request. Every write is bounded by writeTimeout; a failed
//          stream write marks the connection for closing.
//==========================================================================================================
template <class Stream>
class BeastResponseSink : public IResponseSink {
public:
    BeastResponseSink(Stream& stream, std::chrono::milliseconds writeTimeout)
        : stream(stream), writeTimeout(writeTimeout) {}

    boost::asio::awaitable<void> Send(HttpResponse res) override {
        if (closeRequested) {
            res.keep_alive(false);
        }
        armTimer();
        headersSent = true;
        co_await boost::beast::http::async_write(stream, res, boost::asio::use_awaitable);
        if (!res.keep_alive()) {
            closeRequested = true;
        }
    }

    boost::asio::awaitable<bool> OpenStream(StreamHeader header) override {
        header.chunked(true);
        boost::beast::http::response_serializer<boost::beast::http::empty_body> sr{header};
        boost::system::error_code ec;
        armTimer();
        headersSent = true;
        co_await boost::beast::http::async_write_header(stream, sr,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("BeastResponseSink: stream header write failed: {}", ec.message());
            failed = true;
            closeRequested = true;
            co_return false;
        }
        if (!header.keep_alive()) {
            closeRequested = true;
        }
        streaming = true;
        co_return true;
    }

    boost::asio::awaitable<bool> WriteStream(std::string data) override {
        if (!streaming || failed) {
            co_return false;
        }
        if (data.empty()) {
            // An empty chunk would terminate the body
            co_return true;
        }
        boost::system::error_code ec;
        armTimer();
        co_await boost::asio::async_write(stream,
            boost::beast::http::make_chunk(boost::asio::buffer(data)),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("BeastResponseSink: chunk write failed: {}", ec.message());
            failed = true;
            closeRequested = true;
            co_return false;
        }
        co_return true;
    }

    boost::asio::awaitable<void> CloseStream() override {
        if (!streaming) {
            co_return;
        }
        streaming = false;
        if (failed) {
            co_return;
        }
        boost::system::error_code ec;
        armTimer();
        co_await boost::asio::async_write(stream, boost::beast::http::make_chunk_last(),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("BeastResponseSink: final chunk write failed: {}", ec.message());
            failed = true;
            closeRequested = true;
        }
    }

    bool HeadersSent() const override { return headersSent; }

    void RequestClose() override { closeRequested = true; }

    bool CloseRequested() const { return closeRequested; }

private:
    void armTimer() {
        boost::beast::get_lowest_layer(stream).expires_after(writeTimeout);
    }

    Stream& stream;
    std::chrono::milliseconds writeTimeout;
    bool headersSent{false};
    bool streaming{false};
    bool failed{false};
    bool closeRequested{false};
};

} // namespace mcpgw
