#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>

#include "votebridge/data.hpp"
#include "votebridge/errors.hpp"
#include "votebridge/remote.hpp"

namespace votebridge
{
    /// The free-tier ThingSpeak rate floor.
    constexpr std::chrono::seconds DEFAULT_MIN_PUSH_INTERVAL = std::chrono::seconds(15);

    /// The outcome of a push attempt.
    enum class PushOutcome : uint8_t
    {
        Pushed,  ///< The tally was written to the endpoint.
        Skipped,  ///< No request was made: the rate floor was not reached or nothing changed.
        Failed  ///< The request failed. It will be retried on the next eligible attempt.
    };

    /// The synchronizer's view of what the endpoint holds.
    struct SyncState
    {
        data::Tally lastPushedTally;  ///< The tally the endpoint is known to hold.
        std::optional<std::chrono::steady_clock::time_point>
            lastPushTime;  ///< When the last successful push happened, if any.
        bool lastPushSucceeded = false;  ///< Whether the most recent push request succeeded.
    };

    /// The result of the startup read. If the endpoint could not be read the tally is zero and
    /// the error says why.
    struct PullResult
    {
        data::Tally tally;  ///< The pulled tally, or the zero tally.
        std::optional<Error> error;  ///< The SyncUnavailable condition, if the read failed.

        [[nodiscard]] bool available() const { return !error.has_value(); }
    };

    /// Configuration for a Synchronizer.
    struct SynchronizerConfig
    {
        uint32_t candidateCount = data::DEFAULT_CANDIDATE_COUNT;  ///< The number of candidates.
        std::chrono::nanoseconds minPushInterval =
            DEFAULT_MIN_PUSH_INTERVAL;  ///< The minimum time between two successful pushes.
    };

    /// Synchronizer publishes the tally to a rate-limited endpoint. It keeps no queue: the
    /// endpoint only needs the latest absolute counts, so a newer tally supersedes any push that
    /// was skipped or failed.
    ///
    /// All functions are thread-safe. maybePush() holds the synchronizer's lock for the duration
    /// of the request, so concurrent pushes never interleave.
    class Synchronizer
    {
      public:
        Synchronizer(std::shared_ptr<RemoteEndpoint> endpoint, SynchronizerConfig config);

        Synchronizer(Synchronizer const&) = delete;
        Synchronizer& operator=(Synchronizer const&) = delete;

        /// Reads the endpoint's latest tally. This never fails: if the endpoint cannot be read,
        /// the zero tally is returned along with the SyncUnavailable condition. A successful read
        /// becomes the last pushed tally, since the endpoint is known to hold it.
        PullResult pullInitial();

        /// Pushes the tally unless the rate floor has not been reached since the last successful
        /// push or the endpoint already holds the same tally.
        /// @param tally The tally to publish.
        /// @param now The current time.
        /// @return Pushed, Skipped or Failed. Failures are logged, never raised.
        PushOutcome maybePush(data::Tally const& tally, std::chrono::steady_clock::time_point now);

        /// Returns a copy of the synchronizer's state.
        [[nodiscard]] SyncState state() const;

      private:
        mutable std::mutex mutex_;
        std::shared_ptr<RemoteEndpoint> endpoint_;
        SynchronizerConfig config_;
        SyncState state_;
    };
}  // namespace votebridge
