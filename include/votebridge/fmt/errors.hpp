#pragma once

#include <fmt/core.h>
#include <fmt/std.h>

#include "votebridge/errors.hpp"

namespace votebridge::errors::detail
{
    template<typename T>
    constexpr std::string_view getMessage()
    {
        if constexpr (std::is_same_v<T, Timeout>)
        {
            return "timeout";
        }
        if constexpr (std::is_same_v<T, AlreadyInitialized>)
        {
            return "tally already initialized";
        }
        if constexpr (std::is_same_v<T, NotRunning>)
        {
            return "not running";
        }
        return "unknown error";
    }

    template<typename T>
    concept SimpleError = std::is_same_v<T, Timeout> || std::is_same_v<T, AlreadyInitialized>
        || std::is_same_v<T, NotRunning>;

    template<typename T>
    concept MessageError = std::is_same_v<T, Unknown> || std::is_same_v<T, InvalidArgument>
        || std::is_same_v<T, PersistenceFailed> || std::is_same_v<T, Connection>
        || std::is_same_v<T, SyncUnavailable> || std::is_same_v<T, PushFailed>
        || std::is_same_v<T, FailedToStart>;

    template<typename T>
    constexpr std::string_view getPrefix()
    {
        if constexpr (std::is_same_v<T, InvalidArgument>)
        {
            return "invalid argument";
        }
        if constexpr (std::is_same_v<T, PersistenceFailed>)
        {
            return "persistence failed";
        }
        if constexpr (std::is_same_v<T, Connection>)
        {
            return "connection error";
        }
        if constexpr (std::is_same_v<T, SyncUnavailable>)
        {
            return "sync unavailable";
        }
        if constexpr (std::is_same_v<T, PushFailed>)
        {
            return "push failed";
        }
        if constexpr (std::is_same_v<T, FailedToStart>)
        {
            return "failed to start";
        }
        return "unknown error";
    }
}  // namespace votebridge::errors::detail

template<>
struct fmt::formatter<votebridge::errors::Decode>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(votebridge::errors::Decode const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "decode error: {} (line '{}')", err.reason, err.line);
    }
};

template<>
struct fmt::formatter<votebridge::errors::InvalidCandidate>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(votebridge::errors::InvalidCandidate const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(),
                              "invalid candidate {}, expected 1..{}",
                              err.candidate,
                              err.candidateCount);
    }
};

template<votebridge::errors::detail::MessageError T>
struct fmt::formatter<T>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(T const& err, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{}: {}", votebridge::errors::detail::getPrefix<T>(), err.message);
    }
};

template<votebridge::errors::detail::SimpleError T>
struct fmt::formatter<T>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(T const& err, FormatContext& ctx) const
    {
        (void)err;
        return fmt::format_to(ctx.out(), "{}", votebridge::errors::detail::getMessage<T>());
    }
};
