#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace votebridge
{
    namespace errors
    {
        /// An unknown error.
        struct Unknown
        {
            std::string message;  ///< The error message.
        };

        /// A timeout has occurred.
        struct Timeout
        {
        };

        /// An invalid argument error.
        struct InvalidArgument
        {
            std::string message;  ///< The error message.
        };

        /// A line from the device stream is not a vote.
        struct Decode
        {
            std::string line;  ///< The offending line, without its line terminator.
            std::string reason;  ///< Why the line was rejected.
        };

        /// A candidate ID is outside 1..N.
        struct InvalidCandidate
        {
            int64_t candidate;  ///< The rejected candidate ID.
            uint32_t candidateCount;  ///< The number of configured candidates.
        };

        /// The tally store was already initialized or has already counted a vote.
        struct AlreadyInitialized
        {
        };

        /// Persistence operation failed.
        struct PersistenceFailed
        {
            std::string message;  ///< The error message.
        };

        /// The device stream could not be opened or read.
        struct Connection
        {
            std::string message;  ///< The error message.
        };

        /// The remote endpoint could not be read.
        struct SyncUnavailable
        {
            std::string message;  ///< The error message.
        };

        /// A write to the remote endpoint failed.
        struct PushFailed
        {
            std::string message;  ///< The error message.
        };

        /// The component is not running.
        struct NotRunning
        {
        };

        /// The component failed to start.
        struct FailedToStart
        {
            std::string message;  ///< The error message.
        };
    }  // namespace errors

    using Error = std::variant<errors::Unknown,
                               errors::Timeout,
                               errors::InvalidArgument,
                               errors::Decode,
                               errors::InvalidCandidate,
                               errors::AlreadyInitialized,
                               errors::PersistenceFailed,
                               errors::Connection,
                               errors::SyncUnavailable,
                               errors::PushFailed,
                               errors::NotRunning,
                               errors::FailedToStart>;

}  // namespace votebridge
