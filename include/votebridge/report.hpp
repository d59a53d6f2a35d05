#pragma once

#include <string>
#include <vector>

#include "votebridge/data.hpp"

namespace votebridge::report
{
    /// Formats the tally as a table with one row per candidate (name, votes, share and a bar)
    /// followed by a total row.
    /// @param tally The tally to format.
    /// @param candidateNames The display names, indexed by candidate ID - 1.
    /// @return The table rows, without line terminators.
    std::vector<std::string> formatTally(data::Tally const& tally,
                                         std::vector<std::string> const& candidateNames);

    /// Formats an audit record as a CSV row: timestamp, candidate_id, candidate_name, count.
    std::string formatAuditRow(data::AuditRecord const& record,
                               std::vector<std::string> const& candidateNames);

    /// The header row matching formatAuditRow().
    constexpr std::string_view AUDIT_CSV_HEADER = "timestamp,candidate_id,candidate_name,count";
}  // namespace votebridge::report
