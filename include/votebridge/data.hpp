#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace votebridge::data
{
    /// A candidate ID in 1..N.
    using CandidateId = uint32_t;

    /// The number of candidates the original voting booth was built with.
    constexpr uint32_t DEFAULT_CANDIDATE_COUNT = 4;

    /// Tally holds the vote count of every candidate. It is never sparse: a tally for N candidates
    /// always has N counts, and counts[i] belongs to candidate i + 1.
    struct Tally
    {
        std::vector<uint64_t> counts;  ///< The per-candidate counts.

        /// Returns a tally of N candidates with every count set to zero.
        static Tally zero(uint32_t candidateCount)
        {
            return Tally {.counts = std::vector<uint64_t>(candidateCount, 0)};
        }

        [[nodiscard]] uint32_t candidateCount() const
        {
            return static_cast<uint32_t>(counts.size());
        }

        /// Returns whether the candidate ID is in 1..N for this tally.
        [[nodiscard]] bool contains(CandidateId candidate) const
        {
            return candidate >= 1 && candidate <= counts.size();
        }

        /// Returns the count of the candidate. The candidate must be in range.
        [[nodiscard]] uint64_t operator[](CandidateId candidate) const
        {
            return counts[candidate - 1];
        }

        /// Returns the total number of votes across all candidates.
        [[nodiscard]] uint64_t total() const;

        bool operator==(Tally const& other) const = default;
    };

    /// VoteEvent is a single decoded vote from the device.
    struct VoteEvent
    {
        CandidateId candidate;  ///< The candidate voted for.
        std::chrono::system_clock::time_point receivedAt;  ///< When the line was decoded.

        bool operator==(VoteEvent const& other) const = default;
    };

    /// AuditRecord is an immutable entry of the append-only audit log.
    struct AuditRecord
    {
        uint64_t sequence;  ///< The position of the record in the log, starting at 1.
        std::chrono::system_clock::time_point timestamp;  ///< When the vote was received.
        CandidateId candidate;  ///< The candidate voted for.
        uint64_t resultingCount;  ///< The candidate's count after this vote was applied.

        bool operator==(AuditRecord const& other) const = default;
    };

    /// Merges two independently maintained tallies by taking the maximum count per candidate.
    /// The result covers max(local, remote) candidates; missing counts are treated as zero.
    /// @param local The tally read from the local snapshot.
    /// @param remote The tally pulled from the remote endpoint.
    /// @return The reconciled tally.
    Tally reconcile(Tally const& local, Tally const& remote);

    /// Rebuilds a tally from audit records by replaying the committed count of each record in
    /// order. Records for candidates outside 1..N are ignored.
    /// @param records The audit records, ordered by sequence.
    /// @param candidateCount The number of candidates.
    /// @return The tally the records describe.
    Tally replay(std::vector<AuditRecord> const& records, uint32_t candidateCount);

    /// Returns the display name of the candidate, or "Candidate <id>" if none is configured.
    std::string candidateName(std::vector<std::string> const& names, CandidateId candidate);
}  // namespace votebridge::data
