#pragma once

#include <string>
#include <variant>

#include <fmt/core.h>
#include <fmt/std.h>

#include "votebridge/errors.hpp"
#include "votebridge/fmt/errors.hpp"

namespace votebridge_cli
{
    namespace errors
    {
        struct ConfigError
        {
            std::string message;
        };

        using votebridge::errors::Unknown;

    }  // namespace errors

    using Error = std::variant<errors::ConfigError, errors::Unknown>;
}  // namespace votebridge_cli

template<>
struct fmt::formatter<votebridge_cli::errors::ConfigError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(votebridge_cli::errors::ConfigError const& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "config error: {}", err.message);
    }
};
