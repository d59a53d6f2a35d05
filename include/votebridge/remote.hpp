#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <tl/expected.hpp>

#include "votebridge/data.hpp"
#include "votebridge/errors.hpp"

namespace votebridge
{
    /// The default timeout for remote requests in milliseconds.
    constexpr uint64_t DEFAULT_REQUEST_TIMEOUT_MS = 10000;

    /// The number of numeric fields a ThingSpeak channel has, and so the most candidates it can
    /// hold.
    constexpr uint32_t THINGSPEAK_MAX_FIELDS = 8;

    /// RequestConfig defines the configuration for a request.
    struct RequestConfig
    {
        uint64_t timeout = DEFAULT_REQUEST_TIMEOUT_MS;  ///< The timeout in milliseconds.
    };

    /// RemoteEndpoint is the rate-limited store the tally is published to. It holds one numeric
    /// field per candidate and only ever needs the latest absolute counts.
    class RemoteEndpoint
    {
      public:
        virtual ~RemoteEndpoint() = default;

        /// Reads the most recently recorded counts.
        /// @param candidateCount The number of fields to read.
        /// @return The recorded tally, the zero tally if nothing was recorded yet, or an error.
        virtual tl::expected<data::Tally, Error> readLatest(uint32_t candidateCount) = 0;

        /// Records the absolute counts of every candidate in one request.
        /// @param tally The counts to record.
        /// @return The ID the endpoint assigned to the new entry, or an error.
        virtual tl::expected<uint64_t, Error> write(data::Tally const& tally) = 0;
    };

    /// Configuration for a ThingSpeak channel.
    struct ThingSpeakConfig
    {
        std::string host = "api.thingspeak.com";  ///< The API host.
        uint16_t port = 443;  ///< The API port.
        bool useTls = true;  ///< Whether to use HTTPS. Plain HTTP sends the API keys in clear text.
        std::string channelId;  ///< The channel to read from.
        std::string writeApiKey;  ///< The channel's write API key.
        std::string readApiKey;  ///< The channel's read API key.
        RequestConfig requestConfig;  ///< The configuration applied to every request.
    };

    /// Creates an endpoint that reads and writes a ThingSpeak channel over HTTPS. Field k of the
    /// channel holds the count of candidate k.
    /// @param config The channel configuration.
    /// @return The endpoint or an InvalidArgument error if the configuration is incomplete.
    tl::expected<std::unique_ptr<RemoteEndpoint>, Error> createThingSpeakEndpoint(
        ThingSpeakConfig config);
}  // namespace votebridge
