#include <spdlog/spdlog.h>

#include "../utils/http.hpp"
#include "feed.hpp"
#include "votebridge/fmt/errors.hpp"
#include "votebridge/remote.hpp"

namespace votebridge
{
    namespace
    {
        constexpr int HTTP_OK = 200;
        constexpr std::string_view FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

        class ThingSpeakEndpoint final : public RemoteEndpoint
        {
          public:
            explicit ThingSpeakEndpoint(ThingSpeakConfig config)
                : config_(std::move(config))
            {
            }

            tl::expected<data::Tally, Error> readLatest(uint32_t candidateCount) override
            {
                utils::HttpRequest request {
                    .method = "GET",
                    .target = fmt::format("/channels/{}/feeds/last.csv?api_key={}",
                                          utils::urlEncode(config_.channelId),
                                          utils::urlEncode(config_.readApiKey)),
                };
                auto response = utils::send(target(), request, timeout());
                if (!response)
                {
                    return tl::make_unexpected(errors::SyncUnavailable {
                        .message = fmt::format("read request failed: {}", response.error())});
                }
                if (response->status != HTTP_OK)
                {
                    return tl::make_unexpected(errors::SyncUnavailable {
                        .message = fmt::format("read request returned HTTP {}", response->status)});
                }
                return remote::parseLastFeed(response->body, candidateCount);
            }

            tl::expected<uint64_t, Error> write(data::Tally const& tally) override
            {
                if (tally.candidateCount() > THINGSPEAK_MAX_FIELDS)
                {
                    return tl::make_unexpected(errors::InvalidArgument {
                        fmt::format("a channel holds at most {} fields, got {}",
                                    THINGSPEAK_MAX_FIELDS,
                                    tally.candidateCount())});
                }

                utils::HttpRequest request {
                    .method = "POST",
                    .target = "/update",
                    .contentType = std::string(FORM_CONTENT_TYPE),
                    .body = remote::formatUpdate(config_.writeApiKey, tally),
                };
                auto response = utils::send(target(), request, timeout());
                if (!response)
                {
                    return tl::make_unexpected(errors::PushFailed {
                        .message = fmt::format("write request failed: {}", response.error())});
                }
                if (response->status != HTTP_OK)
                {
                    return tl::make_unexpected(errors::PushFailed {
                        .message =
                            fmt::format("write request returned HTTP {}", response->status)});
                }
                return remote::parseUpdateResponse(response->body);
            }

          private:
            [[nodiscard]] utils::HttpTarget target() const
            {
                return {.host = config_.host, .port = config_.port, .useTls = config_.useTls};
            }

            [[nodiscard]] std::chrono::milliseconds timeout() const
            {
                return std::chrono::milliseconds(config_.requestConfig.timeout);
            }

            ThingSpeakConfig config_;
        };
    }  // namespace

    tl::expected<std::unique_ptr<RemoteEndpoint>, Error> createThingSpeakEndpoint(
        ThingSpeakConfig config)
    {
        if (config.host.empty())
        {
            return tl::make_unexpected(errors::InvalidArgument {"host must not be empty"});
        }
        if (config.channelId.empty())
        {
            return tl::make_unexpected(errors::InvalidArgument {"channel ID must not be empty"});
        }
        if (config.writeApiKey.empty())
        {
            return tl::make_unexpected(errors::InvalidArgument {"write API key must not be empty"});
        }
        if (config.requestConfig.timeout == 0)
        {
            return tl::make_unexpected(errors::InvalidArgument {"request timeout must be > 0"});
        }
        if (!config.useTls)
        {
            spdlog::warn("[sync] TLS is disabled, API keys are sent to {} in clear text",
                         config.host);
        }
        spdlog::debug("[sync] using channel {} on {}://{}:{}",
                      config.channelId,
                      config.useTls ? "https" : "http",
                      config.host,
                      config.port);
        return std::make_unique<ThingSpeakEndpoint>(std::move(config));
    }
}  // namespace votebridge
