#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "votebridge/errors.hpp"

namespace votebridge::utils
{
    struct HttpRequest
    {
        std::string method;
        std::string target;  // Path and query, e.g. "/update?x=1".
        std::string contentType;
        std::string body;
    };

    // Where a request is sent. With TLS the server certificate is verified against the system
    // trust store and the host name.
    struct HttpTarget
    {
        std::string host;
        uint16_t port = 443;
        bool useTls = true;
    };

    struct HttpResponse
    {
        int status = 0;
        std::string body;  // Already de-chunked.
    };

    // Percent-encodes a string for use in a query string or form body.
    std::string urlEncode(std::string_view value);

    // Parses a complete HTTP/1.1 response, decoding a chunked body if needed.
    tl::expected<HttpResponse, Error> parseResponse(std::string_view raw);

    // Returns true once raw holds a whole response: the headers followed by Content-Length bytes
    // or by a chunked body up to its last chunk. A response with neither header is delimited by
    // the server closing the connection, so it is never complete before that.
    bool isCompleteResponse(std::string_view raw);

    // Sends one request on a fresh connection and reads the response until it is complete or
    // the server closes the connection. The whole exchange, name resolution and the TLS
    // handshake included, is bounded by the timeout.
    tl::expected<HttpResponse, Error> send(HttpTarget const& target,
                                           HttpRequest const& request,
                                           std::chrono::milliseconds timeout);
}  // namespace votebridge::utils
