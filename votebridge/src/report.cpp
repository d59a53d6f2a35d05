#include "votebridge/report.hpp"

#include <algorithm>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace votebridge::report
{
    namespace
    {
        // One bar character per five percent.
        constexpr double PERCENT_PER_BAR = 5.0;

        std::string csvCell(std::string const& value)
        {
            if (value.find_first_of(",\"\n") == std::string::npos)
            {
                return value;
            }
            std::string quoted = "\"";
            for (char c : value)
            {
                if (c == '"')
                {
                    quoted += '"';
                }
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }
    }  // namespace

    std::vector<std::string> formatTally(data::Tally const& tally,
                                         std::vector<std::string> const& candidateNames)
    {
        size_t nameWidth = 5;
        for (data::CandidateId candidate = 1; candidate <= tally.candidateCount(); ++candidate)
        {
            nameWidth = std::max(nameWidth, data::candidateName(candidateNames, candidate).size());
        }

        std::vector<std::string> rows;
        auto total = tally.total();
        for (data::CandidateId candidate = 1; candidate <= tally.candidateCount(); ++candidate)
        {
            auto count = tally[candidate];
            double percent =
                total > 0 ? static_cast<double>(count) * 100.0 / static_cast<double>(total) : 0.0;
            auto bar = std::string(static_cast<size_t>(percent / PERCENT_PER_BAR), '#');
            rows.push_back(fmt::format("{:<{}} | {:>4} votes | {:5.1f}% {}",
                                       data::candidateName(candidateNames, candidate),
                                       nameWidth,
                                       count,
                                       percent,
                                       bar));
        }
        rows.push_back(fmt::format("{:<{}} | {:>4} votes", "TOTAL", nameWidth, total));
        return rows;
    }

    std::string formatAuditRow(data::AuditRecord const& record,
                               std::vector<std::string> const& candidateNames)
    {
        auto seconds = std::chrono::system_clock::to_time_t(record.timestamp);
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          record.timestamp.time_since_epoch())
                          .count()
            % 1000000;
        return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:06}Z,{},{},{}",
                           fmt::gmtime(seconds),
                           micros < 0 ? micros + 1000000 : micros,
                           record.candidate,
                           csvCell(data::candidateName(candidateNames, record.candidate)),
                           record.resultingCount);
    }
}  // namespace votebridge::report
