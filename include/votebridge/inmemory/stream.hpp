#pragma once

#include <memory>
#include <string>

#include "votebridge/stream.hpp"

namespace votebridge::inmemory
{
    /// @brief Stream is a LineStream fed by the caller instead of a device.
    ///
    /// Lines and disconnects are delivered in the order they were queued, so a test can script a
    /// device that drops off the bus halfway through a burst of votes. Queued lines survive a
    /// disconnect and are read after the stream is opened again.
    class Stream : public LineStream
    {
      public:
        /// Queues a line as if the device had written it.
        /// @param line The line, without a terminator.
        virtual void pushLine(std::string line) = 0;

        /// Queues a disconnect. The read that reaches it fails with a Connection error and the
        /// stream must be opened again.
        virtual void pushDisconnect() = 0;

        /// Makes the next opens fail with a Connection error.
        /// @param count The number of opens that should fail.
        virtual void failNextOpens(uint32_t count) = 0;

        /// Returns how many times the stream was opened successfully.
        [[nodiscard]] virtual uint32_t openCount() const = 0;

        /// Returns the number of queued lines and disconnects that were not read yet.
        [[nodiscard]] virtual size_t pending() const = 0;
    };

    /// Creates a new in-memory stream. It starts closed.
    /// @param name The name returned by describe().
    /// @return A shared pointer to the stream.
    std::shared_ptr<Stream> createStream(std::string name = "memory");
}  // namespace votebridge::inmemory
