//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpTypes.hpp
// Purpose: HTTP message aliases, the response sink abstraction and small request/response helpers
//==========================================================================================================

#pragma once

#include <string>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/http.hpp>

namespace mcpgw {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;
using HttpStatus = boost::beast::http::status;

// Header-only response used to start a chunked (streaming) reply.
using StreamHeader = boost::beast::http::response<boost::beast::http::empty_body>;

//==========================================================================================================
// IResponseSink
// Purpose: Destination for the reply to one HTTP request. The connection loop provides a socket-backed
//          implementation; tests provide a recording one. Exactly one of Send() or OpenStream() is used
//          per request.
//==========================================================================================================
class IResponseSink {
public:
    virtual ~IResponseSink() = default;

    //==========================================================================================================
    // Writes a complete response.
    // Throws:
    //   boost::system::system_error when the peer cannot be written to.
    //==========================================================================================================
    virtual boost::asio::awaitable<void> Send(HttpResponse res) = 0;

    //==========================================================================================================
    // Writes the header of a chunked response.
    // Returns:
    //   false when the peer is gone; the stream must not be used further.
    //==========================================================================================================
    virtual boost::asio::awaitable<bool> OpenStream(StreamHeader header) = 0;

    //==========================================================================================================
    // Writes one chunk on an open stream.
    // Returns:
    //   false when the peer is gone.
    //==========================================================================================================
    virtual boost::asio::awaitable<bool> WriteStream(std::string data) = 0;

    // Terminates an open stream with the final chunk. No-op when no stream is open.
    virtual boost::asio::awaitable<void> CloseStream() = 0;

    // True once any response bytes have been handed to the peer.
    virtual bool HeadersSent() const = 0;

    // Ask the connection loop to close the connection after the current exchange.
    virtual void RequestClose() = 0;
};

// Request target without query string.
std::string RequestPath(const HttpRequest& req);

// Header value or empty string when the header is absent.
std::string HeaderValue(const HttpRequest& req, const std::string& name);

// Response with keep-alive and version mirrored from req.
HttpResponse MakeResponse(const HttpRequest& req, HttpStatus status, std::string body,
                          const std::string& contentType = "text/plain; charset=utf-8");

HttpResponse MakeJsonResponse(const HttpRequest& req, HttpStatus status, std::string body);

} // namespace mcpgw
