#pragma once

#include <chrono>
#include <string_view>

#include <tl/expected.hpp>

#include "votebridge/data.hpp"
#include "votebridge/errors.hpp"

namespace votebridge::decoder
{
    /// The banner the device prints once after it boots.
    constexpr std::string_view DEVICE_READY_LINE = "READY";

    /// Removes leading and trailing whitespace.
    std::string_view trim(std::string_view line);

    /// Removes the carriage returns and line feeds a serial line ends with. Other whitespace is
    /// part of the line.
    std::string_view stripLineEnd(std::string_view line);

    /// Decodes one line of the device stream. The only accepted shape is `VOTE,<int>` where the
    /// integer is a candidate ID in 1..candidateCount. Only the line terminator is stripped, and
    /// every line is decoded independently.
    /// @param line The line, with or without its line terminator.
    /// @param candidateCount The number of configured candidates.
    /// @param now The time to stamp the event with.
    /// @return The vote event, or a Decode error describing why the line is not a vote.
    tl::expected<data::VoteEvent, Error> decode(
        std::string_view line,
        uint32_t candidateCount,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /// Returns whether the line is the device's boot banner.
    bool isDeviceReady(std::string_view line);
}  // namespace votebridge::decoder
