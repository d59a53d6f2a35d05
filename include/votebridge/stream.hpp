#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "votebridge/errors.hpp"

namespace votebridge
{
    /// The device address that asks for the first detected serial adapter.
    constexpr std::string_view AUTO_DEVICE_ADDRESS = "auto";

    /// The longest line a stream buffers. A device sending noise without line feeds, such as one
    /// running at another baud rate, is cut off here.
    constexpr std::size_t MAX_LINE_LENGTH = 256;

    /// LineStream is the byte stream the device writes its events to, read one line at a time.
    /// A stream can be opened again after it was closed or after a read failed.
    class LineStream
    {
      public:
        virtual ~LineStream() = default;

        /// Opens the stream.
        /// @return Success or a Connection error.
        virtual tl::expected<void, Error> open() = 0;

        /// Blocks until a complete line is available and returns it without its terminator.
        /// @return The line, a Decode error if MAX_LINE_LENGTH bytes arrived without a line feed
        /// (those bytes are dropped and the stream stays open), a Connection error if the stream
        /// failed or was disconnected, or NotRunning if cancel() was called.
        virtual tl::expected<std::string, Error> readLine() = 0;

        /// Closes the stream. A later open() reconnects it.
        virtual void close() = 0;

        /// Unblocks a pending readLine() and makes later reads return NotRunning until the next
        /// open(). This may be called from any thread.
        virtual void cancel() = 0;

        /// Returns a human-readable description of the stream for logging.
        [[nodiscard]] virtual std::string describe() const = 0;
    };

    /// Configuration for a serial port stream.
    struct SerialConfig
    {
        std::string address;  ///< The device path, or "auto" to use the first detected adapter.
        uint32_t baudRate = 9600;  ///< The baud rate of the device.
        std::chrono::milliseconds openSettle =
            std::chrono::milliseconds(2000);  ///< The wait after opening while the board resets.
    };

    /// Lists the serial adapters an Arduino-class board usually shows up as, sorted by path.
    /// @return Paths such as /dev/ttyACM0 and /dev/ttyUSB0.
    std::vector<std::string> findSerialDevices();

    /// Creates a stream reading lines from a serial port.
    /// @param config The serial configuration.
    /// @return The stream or an InvalidArgument error.
    tl::expected<std::unique_ptr<LineStream>, Error> createSerialStream(SerialConfig config);
}  // namespace votebridge
