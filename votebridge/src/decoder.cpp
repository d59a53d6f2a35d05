#include "votebridge/decoder.hpp"

#include <charconv>
#include <cstdint>
#include <string>

namespace votebridge::decoder
{
    namespace
    {
        constexpr std::string_view VOTE_PREFIX = "VOTE,";
        constexpr std::string_view WHITESPACE = " \t\r\n";
        constexpr std::string_view LINE_END = "\r\n";

        errors::Decode decodeError(std::string_view line, std::string reason)
        {
            return errors::Decode {.line = std::string(line), .reason = std::move(reason)};
        }
    }  // namespace

    std::string_view trim(std::string_view line)
    {
        auto begin = line.find_first_not_of(WHITESPACE);
        if (begin == std::string_view::npos)
        {
            return {};
        }
        auto end = line.find_last_not_of(WHITESPACE);
        return line.substr(begin, end - begin + 1);
    }

    std::string_view stripLineEnd(std::string_view line)
    {
        auto end = line.find_last_not_of(LINE_END);
        return end == std::string_view::npos ? std::string_view {} : line.substr(0, end + 1);
    }

    tl::expected<data::VoteEvent, Error> decode(std::string_view line,
                                                uint32_t candidateCount,
                                                std::chrono::system_clock::time_point now)
    {
        auto trimmed = stripLineEnd(line);
        if (trimmed.empty())
        {
            return tl::make_unexpected(decodeError(trimmed, "empty line"));
        }
        if (!trimmed.starts_with(VOTE_PREFIX))
        {
            return tl::make_unexpected(decodeError(trimmed, "missing VOTE prefix"));
        }

        auto digits = trimmed.substr(VOTE_PREFIX.size());
        if (digits.empty())
        {
            return tl::make_unexpected(decodeError(trimmed, "missing candidate"));
        }

        int64_t candidate = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), candidate);
        if (ec != std::errc {} || end != digits.data() + digits.size())
        {
            return tl::make_unexpected(decodeError(trimmed, "candidate is not an integer"));
        }
        if (candidate < 1 || candidate > static_cast<int64_t>(candidateCount))
        {
            return tl::make_unexpected(decodeError(trimmed, "candidate out of range"));
        }

        return data::VoteEvent {.candidate = static_cast<data::CandidateId>(candidate),
                                .receivedAt = now};
    }

    bool isDeviceReady(std::string_view line)
    {
        return stripLineEnd(line) == DEVICE_READY_LINE;
    }
}  // namespace votebridge::decoder
