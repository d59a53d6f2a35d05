#include "http.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <optional>

#include <asio/connect.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/read_until.hpp>
#include <asio/ssl.hpp>
#include <asio/write.hpp>
#include <fmt/format.h>

namespace votebridge::utils
{
    namespace
    {
        constexpr std::string_view HEADER_END = "\r\n\r\n";
        constexpr std::string_view LINE_END = "\r\n";

        bool equalsIgnoreCase(std::string_view a, std::string_view b)
        {
            if (a.size() != b.size())
            {
                return false;
            }
            for (size_t i = 0; i < a.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(a[i]))
                    != std::tolower(static_cast<unsigned char>(b[i])))
                {
                    return false;
                }
            }
            return true;
        }

        // Decodes a chunked body. Returns std::nullopt while the last chunk has not arrived yet.
        tl::expected<std::optional<std::string>, Error> decodeChunked(std::string_view body)
        {
            std::string decoded;
            while (true)
            {
                auto lineEnd = body.find(LINE_END);
                if (lineEnd == std::string_view::npos)
                {
                    return std::nullopt;
                }
                auto sizeText = body.substr(0, lineEnd);
                // Chunk extensions follow a semicolon.
                sizeText = sizeText.substr(0, sizeText.find(';'));

                size_t size = 0;
                auto [end, ec] =
                    std::from_chars(sizeText.data(), sizeText.data() + sizeText.size(), size, 16);
                if (ec != std::errc {} || sizeText.empty())
                {
                    return tl::make_unexpected(errors::Unknown {
                        .message = fmt::format("invalid chunk size '{}'", sizeText)});
                }
                body.remove_prefix(lineEnd + LINE_END.size());
                if (size == 0)
                {
                    return decoded;
                }
                if (body.size() < size + LINE_END.size())
                {
                    return std::nullopt;
                }
                decoded.append(body.substr(0, size));
                body.remove_prefix(size + LINE_END.size());
            }
        }

        struct ResponseHead
        {
            int status = 0;
            bool chunked = false;
            std::optional<size_t> contentLength;
            std::string_view body;
        };

        tl::expected<ResponseHead, Error> parseHead(std::string_view raw)
        {
            auto headerEnd = raw.find(HEADER_END);
            if (headerEnd == std::string_view::npos)
            {
                return tl::make_unexpected(
                    errors::Unknown {.message = "incomplete HTTP response"});
            }
            auto head = raw.substr(0, headerEnd);
            ResponseHead result {.body = raw.substr(headerEnd + HEADER_END.size())};

            auto statusLineEnd = head.find(LINE_END);
            auto statusLine = head.substr(0, statusLineEnd);
            // "HTTP/1.1 200 OK"
            auto firstSpace = statusLine.find(' ');
            if (!statusLine.starts_with("HTTP/") || firstSpace == std::string_view::npos)
            {
                return tl::make_unexpected(errors::Unknown {
                    .message = fmt::format("malformed status line '{}'", statusLine)});
            }
            auto statusText = statusLine.substr(firstSpace + 1, 3);
            auto [end, ec] = std::from_chars(
                statusText.data(), statusText.data() + statusText.size(), result.status);
            if (ec != std::errc {})
            {
                return tl::make_unexpected(errors::Unknown {
                    .message = fmt::format("malformed status line '{}'", statusLine)});
            }

            auto headers = statusLineEnd == std::string_view::npos
                ? std::string_view {}
                : head.substr(statusLineEnd + LINE_END.size());
            while (!headers.empty())
            {
                auto lineEnd = headers.find(LINE_END);
                auto line = headers.substr(0, lineEnd);
                headers = lineEnd == std::string_view::npos
                    ? std::string_view {}
                    : headers.substr(lineEnd + LINE_END.size());

                auto colon = line.find(':');
                if (colon == std::string_view::npos)
                {
                    continue;
                }
                auto name = line.substr(0, colon);
                auto value = line.substr(colon + 1);
                value.remove_prefix(std::min(value.find_first_not_of(' '), value.size()));

                if (equalsIgnoreCase(name, "Transfer-Encoding")
                    && equalsIgnoreCase(value, "chunked"))
                {
                    result.chunked = true;
                }
                else if (equalsIgnoreCase(name, "Content-Length"))
                {
                    size_t length = 0;
                    if (std::from_chars(value.data(), value.data() + value.size(), length).ec
                        == std::errc {})
                    {
                        result.contentLength = length;
                    }
                }
            }
            return result;
        }

        using TlsStream = asio::ssl::stream<asio::ip::tcp::socket>;

        // Exchange drives one request/response over a single connection. Every handler runs on
        // the io_context owned by send(), so no locking is needed.
        class Exchange
        {
          public:
            Exchange(asio::io_context& io,
                     asio::ssl::context& tls,
                     HttpTarget target,
                     std::string payload)
                : resolver_(io)
                , stream_(io, tls)
                , target_(std::move(target))
                , payload_(std::move(payload))
            {
            }

            void start()
            {
                resolver_.async_resolve(
                    target_.host,
                    std::to_string(target_.port),
                    [this](asio::error_code ec, asio::ip::tcp::resolver::results_type results)
                    {
                        if (ec)
                        {
                            fail(fmt::format(
                                "failed to resolve {}: {}", target_.host, ec.message()));
                            return;
                        }
                        connect(results);
                    });
            }

            [[nodiscard]] bool finished() const { return finished_; }
            [[nodiscard]] std::optional<std::string> const& failure() const { return failure_; }
            [[nodiscard]] std::string const& response() const { return response_; }

          private:
            // Calls handler with the TLS stream or, for plain HTTP, the bare socket.
            template<typename Handler>
            void withStream(Handler&& handler)
            {
                if (target_.useTls)
                {
                    handler(stream_);
                }
                else
                {
                    handler(stream_.next_layer());
                }
            }

            void connect(asio::ip::tcp::resolver::results_type const& results)
            {
                asio::async_connect(stream_.next_layer(),
                                    results,
                                    [this](asio::error_code ec, asio::ip::tcp::endpoint const&)
                                    {
                                        if (ec)
                                        {
                                            fail(fmt::format("failed to connect to {}:{}: {}",
                                                             target_.host,
                                                             target_.port,
                                                             ec.message()));
                                            return;
                                        }
                                        if (target_.useTls)
                                        {
                                            handshake();
                                        }
                                        else
                                        {
                                            write();
                                        }
                                    });
            }

            void handshake()
            {
                // Servers hosting several names pick the certificate by SNI.
                if (SSL_set_tlsext_host_name(stream_.native_handle(), target_.host.c_str()) != 1)
                {
                    fail(fmt::format("failed to set TLS server name {}", target_.host));
                    return;
                }
                stream_.set_verify_mode(asio::ssl::verify_peer);
                stream_.set_verify_callback(asio::ssl::host_name_verification(target_.host));
                stream_.async_handshake(asio::ssl::stream_base::client,
                                        [this](asio::error_code ec)
                                        {
                                            if (ec)
                                            {
                                                fail(fmt::format("TLS handshake with {} failed: {}",
                                                                 target_.host,
                                                                 ec.message()));
                                                return;
                                            }
                                            write();
                                        });
            }

            void write()
            {
                withStream(
                    [this](auto& stream)
                    {
                        asio::async_write(stream,
                                          asio::buffer(payload_),
                                          [this](asio::error_code ec, std::size_t)
                                          {
                                              if (ec)
                                              {
                                                  fail(fmt::format("failed to send request: {}",
                                                                   ec.message()));
                                                  return;
                                              }
                                              readHead();
                                          });
                    });
            }

            void readHead()
            {
                withStream(
                    [this](auto& stream)
                    {
                        asio::async_read_until(
                            stream,
                            asio::dynamic_buffer(response_),
                            HEADER_END,
                            [this](asio::error_code ec, std::size_t)
                            {
                                if (ec)
                                {
                                    fail(fmt::format("failed to read response headers: {}",
                                                     ec.message()));
                                    return;
                                }
                                readBody();
                            });
                    });
            }

            // Reads until the response is complete. The server may keep the connection open
            // after the last byte, so end of stream is not awaited.
            void readBody()
            {
                if (isCompleteResponse(response_))
                {
                    finished_ = true;
                    return;
                }
                withStream(
                    [this](auto& stream)
                    {
                        stream.async_read_some(
                            asio::buffer(readBuffer_),
                            [this](asio::error_code ec, std::size_t bytes)
                            {
                                response_.append(readBuffer_.data(), bytes);
                                if (ec == asio::error::eof
                                    || ec == asio::ssl::error::stream_truncated)
                                {
                                    finished_ = true;
                                    return;
                                }
                                if (ec)
                                {
                                    fail(fmt::format("failed to read response: {}",
                                                     ec.message()));
                                    return;
                                }
                                readBody();
                            });
                    });
            }

            void fail(std::string message)
            {
                failure_ = std::move(message);
                finished_ = true;
            }

            asio::ip::tcp::resolver resolver_;
            TlsStream stream_;
            HttpTarget target_;
            std::string payload_;
            std::string response_;
            std::array<char, 4096> readBuffer_ {};
            std::optional<std::string> failure_;
            bool finished_ = false;
        };
    }  // namespace

    std::string urlEncode(std::string_view value)
    {
        std::string encoded;
        encoded.reserve(value.size());
        for (char c : value)
        {
            auto byte = static_cast<unsigned char>(c);
            if (std::isalnum(byte) || c == '-' || c == '_' || c == '.' || c == '~')
            {
                encoded.push_back(c);
            }
            else
            {
                encoded += fmt::format("%{:02X}", byte);
            }
        }
        return encoded;
    }

    tl::expected<HttpResponse, Error> parseResponse(std::string_view raw)
    {
        auto head = parseHead(raw);
        if (!head)
        {
            return tl::make_unexpected(head.error());
        }

        HttpResponse response {.status = head->status};
        if (head->chunked)
        {
            auto decoded = decodeChunked(head->body);
            if (!decoded)
            {
                return tl::make_unexpected(decoded.error());
            }
            if (!decoded->has_value())
            {
                return tl::make_unexpected(errors::Unknown {.message = "truncated chunked body"});
            }
            response.body = std::move(**decoded);
        }
        else if (head->contentLength.has_value())
        {
            if (head->body.size() < *head->contentLength)
            {
                return tl::make_unexpected(errors::Unknown {.message = "truncated HTTP body"});
            }
            response.body = std::string(head->body.substr(0, *head->contentLength));
        }
        else
        {
            response.body = std::string(head->body);
        }
        return response;
    }

    bool isCompleteResponse(std::string_view raw)
    {
        if (raw.find(HEADER_END) == std::string_view::npos)
        {
            return false;
        }
        auto head = parseHead(raw);
        if (!head)
        {
            // Reading further cannot repair a malformed head.
            return true;
        }
        if (head->chunked)
        {
            auto decoded = decodeChunked(head->body);
            return !decoded || decoded->has_value();
        }
        if (head->contentLength.has_value())
        {
            return head->body.size() >= *head->contentLength;
        }
        return false;
    }

    tl::expected<HttpResponse, Error> send(HttpTarget const& target,
                                           HttpRequest const& request,
                                           std::chrono::milliseconds timeout)
    {
        std::string payload = fmt::format(
            "{} {} HTTP/1.1\r\nHost: {}\r\nUser-Agent: votebridge\r\nAccept: */*\r\n"
            "Connection: close\r\n",
            request.method,
            request.target,
            target.host);
        if (!request.body.empty() || request.method == "POST")
        {
            if (!request.contentType.empty())
            {
                payload += fmt::format("Content-Type: {}\r\n", request.contentType);
            }
            payload += fmt::format("Content-Length: {}\r\n", request.body.size());
        }
        payload += "\r\n";
        payload += request.body;

        asio::ssl::context tls(asio::ssl::context::tls_client);
        asio::error_code ec;
        tls.set_default_verify_paths(ec);
        if (ec)
        {
            return tl::make_unexpected(errors::Unknown {
                .message = fmt::format("failed to load the system trust store: {}", ec.message())});
        }

        asio::io_context io;
        Exchange exchange(io, tls, target, std::move(payload));
        exchange.start();
        io.run_for(timeout);

        if (!exchange.finished())
        {
            return tl::make_unexpected(errors::Timeout {});
        }
        if (exchange.failure().has_value())
        {
            return tl::make_unexpected(errors::Unknown {.message = *exchange.failure()});
        }
        return parseResponse(exchange.response());
    }
}  // namespace votebridge::utils
