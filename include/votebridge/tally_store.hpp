#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <tl/expected.hpp>

#include "votebridge/data.hpp"
#include "votebridge/errors.hpp"
#include "votebridge/persister.hpp"

namespace votebridge
{
    /// TallyStore owns the authoritative vote counts. Every mutation is written to the persister
    /// (snapshot and audit record in one transaction) before it becomes visible in memory.
    ///
    /// All functions are thread-safe and atomic with respect to each other.
    class TallyStore
    {
      public:
        /// Creates a store for the given number of candidates. The in-memory tally starts at zero
        /// until initialize() is called.
        /// @param persister The durable storage for the snapshot and audit log.
        /// @param candidateCount The number of candidates N.
        TallyStore(std::shared_ptr<Persister> persister, uint32_t candidateCount);

        TallyStore(TallyStore const&) = delete;
        TallyStore& operator=(TallyStore const&) = delete;

        /// Reads the persisted snapshot, sized to the configured number of candidates.
        /// @return The snapshot, the zero tally if none was stored, or an error if the storage
        /// could not be read or holds votes for candidates beyond N.
        [[nodiscard]] tl::expected<data::Tally, Error> loadSnapshot() const;

        /// Sets the in-memory tally to the seed and persists it as the snapshot. This may be
        /// repeated until the first vote is applied, after which it returns AlreadyInitialized.
        /// @param seed The reconciled starting tally. It must cover exactly N candidates.
        /// @return Success or an error.
        tl::expected<void, Error> initialize(data::Tally seed);

        /// Counts one vote. The audit record and the updated snapshot are persisted before the
        /// in-memory tally changes; if persistence fails the tally is left as it was.
        /// @param event The vote to count.
        /// @return The candidate's new count, InvalidCandidate or PersistenceFailed.
        tl::expected<uint64_t, Error> apply(data::VoteEvent const& event);

        /// Reads the persisted audit log in sequence order.
        /// @return The records or a PersistenceFailed error.
        [[nodiscard]] tl::expected<std::vector<data::AuditRecord>, Error> auditRecords() const;

        /// Returns a copy of the current counts. This never performs I/O.
        [[nodiscard]] data::Tally currentTally() const;

        [[nodiscard]] uint32_t candidateCount() const { return candidateCount_; }

      private:
        mutable std::mutex mutex_;
        std::shared_ptr<Persister> persister_;
        uint32_t candidateCount_;
        data::Tally tally_;
        uint64_t nextSequence_;
        bool voteApplied_ = false;
    };
}  // namespace votebridge
