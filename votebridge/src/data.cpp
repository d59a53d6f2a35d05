#include "votebridge/data.hpp"

#include <algorithm>
#include <numeric>

#include <fmt/format.h>

namespace votebridge::data
{
    uint64_t Tally::total() const
    {
        return std::accumulate(counts.begin(), counts.end(), uint64_t {0});
    }

    Tally reconcile(Tally const& local, Tally const& remote)
    {
        auto size = std::max(local.counts.size(), remote.counts.size());
        Tally result = Tally::zero(static_cast<uint32_t>(size));
        for (size_t i = 0; i < size; ++i)
        {
            uint64_t localCount = i < local.counts.size() ? local.counts[i] : 0;
            uint64_t remoteCount = i < remote.counts.size() ? remote.counts[i] : 0;
            result.counts[i] = std::max(localCount, remoteCount);
        }
        return result;
    }

    Tally replay(std::vector<AuditRecord> const& records, uint32_t candidateCount)
    {
        Tally tally = Tally::zero(candidateCount);
        for (auto const& record : records)
        {
            if (!tally.contains(record.candidate))
            {
                continue;
            }
            tally.counts[record.candidate - 1] = record.resultingCount;
        }
        return tally;
    }

    std::string candidateName(std::vector<std::string> const& names, CandidateId candidate)
    {
        if (candidate >= 1 && candidate <= names.size() && !names[candidate - 1].empty())
        {
            return names[candidate - 1];
        }
        return fmt::format("Candidate {}", candidate);
    }
}  // namespace votebridge::data
