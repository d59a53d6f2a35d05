#include "feed.hpp"

#include <charconv>
#include <optional>
#include <vector>

#include <fmt/format.h>

#include "../utils/http.hpp"
#include "votebridge/decoder.hpp"

namespace votebridge::remote
{
    namespace
    {
        constexpr std::string_view EMPTY_CHANNEL = "-1";

        std::vector<std::string_view> splitLines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            while (!text.empty())
            {
                auto end = text.find('\n');
                auto line = decoder::trim(text.substr(0, end));
                if (!line.empty())
                {
                    lines.push_back(line);
                }
                if (end == std::string_view::npos)
                {
                    break;
                }
                text.remove_prefix(end + 1);
            }
            return lines;
        }

        std::vector<std::string_view> splitCells(std::string_view line)
        {
            std::vector<std::string_view> cells;
            while (true)
            {
                auto end = line.find(',');
                auto cell = decoder::trim(line.substr(0, end));
                if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"')
                {
                    cell = cell.substr(1, cell.size() - 2);
                }
                cells.push_back(cell);
                if (end == std::string_view::npos)
                {
                    return cells;
                }
                line.remove_prefix(end + 1);
            }
        }

        std::optional<size_t> findColumn(std::vector<std::string_view> const& header,
                                         std::string_view name)
        {
            for (size_t i = 0; i < header.size(); ++i)
            {
                if (header[i] == name)
                {
                    return i;
                }
            }
            return std::nullopt;
        }
    }  // namespace

    tl::expected<data::Tally, Error> parseLastFeed(std::string_view csv, uint32_t candidateCount)
    {
        auto tally = data::Tally::zero(candidateCount);
        auto lines = splitLines(csv);
        if (lines.empty() || (lines.size() == 1 && lines[0] == EMPTY_CHANNEL))
        {
            return tally;
        }

        auto header = splitCells(lines[0]);
        if (!findColumn(header, "entry_id").has_value())
        {
            return tl::make_unexpected(errors::SyncUnavailable {
                .message = fmt::format("unexpected feed header '{}'", lines[0])});
        }
        if (lines.size() < 2)
        {
            return tally;
        }

        auto row = splitCells(lines[1]);
        for (data::CandidateId candidate = 1; candidate <= candidateCount; ++candidate)
        {
            auto column = findColumn(header, fmt::format("field{}", candidate));
            if (!column.has_value() || *column >= row.size() || row[*column].empty())
            {
                continue;
            }

            auto cell = row[*column];
            uint64_t count = 0;
            auto [end, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), count);
            if (ec != std::errc {} || end != cell.data() + cell.size())
            {
                return tl::make_unexpected(errors::SyncUnavailable {
                    .message = fmt::format("field{} holds '{}', not a count", candidate, cell)});
            }
            tally.counts[candidate - 1] = count;
        }
        return tally;
    }

    std::string formatUpdate(std::string_view apiKey, data::Tally const& tally)
    {
        std::string body = fmt::format("api_key={}", utils::urlEncode(apiKey));
        for (size_t i = 0; i < tally.counts.size(); ++i)
        {
            body += fmt::format("&field{}={}", i + 1, tally.counts[i]);
        }
        return body;
    }

    tl::expected<uint64_t, Error> parseUpdateResponse(std::string_view body)
    {
        auto text = decoder::trim(body);
        uint64_t entryId = 0;
        auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), entryId);
        if (ec != std::errc {} || end != text.data() + text.size())
        {
            return tl::make_unexpected(errors::PushFailed {
                .message = fmt::format("unexpected update response '{}'", text)});
        }
        if (entryId == 0)
        {
            return tl::make_unexpected(
                errors::PushFailed {.message = "update rejected by the endpoint"});
        }
        return entryId;
    }
}  // namespace votebridge::remote
