#pragma once

#include <optional>
#include <vector>

#include <tl/expected.hpp>

#include "votebridge/data.hpp"
#include "votebridge/errors.hpp"

namespace votebridge
{
    /// Represents a transaction for persisting tally changes.
    /// A transaction may overwrite the snapshot, append one audit record, or both. Either every
    /// requested change becomes durable or none of them does.
    struct PersistedTransaction
    {
        /// Flag indicating whether the snapshot should be overwritten.
        bool updateSnapshot = false;
        /// The full tally to store. Only used if updateSnapshot is true.
        data::Tally snapshot;

        /// The audit record to append, if any.
        std::optional<data::AuditRecord> record;

        /// Configures the transaction to overwrite the snapshot.
        /// @param tally The tally to store.
        void setSnapshot(data::Tally tally)
        {
            updateSnapshot = true;
            snapshot = std::move(tally);
        }

        /// Configures the transaction to append an audit record.
        /// @param newRecord The record to append. Its sequence must follow the last stored one.
        void append(data::AuditRecord newRecord) { record = newRecord; }
    };

    /// The interface for the durable tally state: a full-tally snapshot and an append-only audit
    /// log. Implementations must apply transactions atomically, so a crash never leaves a
    /// snapshot that disagrees with the audit log.
    struct Persister
    {
        virtual ~Persister() = default;

        /// Reads the stored snapshot.
        /// @return The snapshot, std::nullopt if none was ever stored, or an error if the storage
        /// could not be read.
        [[nodiscard]] virtual tl::expected<std::optional<data::Tally>, Error> loadSnapshot()
            const = 0;

        /// Reads every audit record in sequence order.
        /// @return The records or an error if the storage could not be read.
        [[nodiscard]] virtual tl::expected<std::vector<data::AuditRecord>, Error> getRecords()
            const = 0;

        /// Gets the sequence number of the last audit record.
        /// @return The last sequence if any record exists, std::nullopt otherwise.
        [[nodiscard]] virtual std::optional<uint64_t> getLastSequence() const = 0;

        /// Applies a set of changes to persistent storage.
        /// @param transaction The transaction containing the changes to persist.
        /// @return Success or error result of the persistence operation.
        virtual tl::expected<void, Error> apply(PersistedTransaction const& transaction) = 0;
    };
}  // namespace votebridge
