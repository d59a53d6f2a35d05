#pragma once

#include <atomic>
#include <mutex>

#include "votebridge/persister.hpp"

namespace votebridge::testing
{
    // MemoryPersister keeps the snapshot and audit log in memory. Setting failWrites makes every
    // apply() fail without changing anything, like a full disk would.
    class MemoryPersister final : public votebridge::Persister
    {
      public:
        MemoryPersister() = default;
        ~MemoryPersister() override = default;

        [[nodiscard]] tl::expected<std::optional<data::Tally>, Error> loadSnapshot() const override
        {
            std::lock_guard lock {mutex_};
            return snapshot_;
        }

        [[nodiscard]] tl::expected<std::vector<data::AuditRecord>, Error> getRecords()
            const override
        {
            std::lock_guard lock {mutex_};
            return records_;
        }

        [[nodiscard]] std::optional<uint64_t> getLastSequence() const override
        {
            std::lock_guard lock {mutex_};
            if (records_.empty())
            {
                return std::nullopt;
            }
            return records_.back().sequence;
        }

        tl::expected<void, Error> apply(PersistedTransaction const& transaction) override
        {
            std::lock_guard lock {mutex_};
            applyCalls++;
            if (failWrites)
            {
                return tl::make_unexpected(errors::PersistenceFailed {.message = "disk full"});
            }
            if (transaction.record.has_value())
            {
                records_.push_back(*transaction.record);
            }
            if (transaction.updateSnapshot)
            {
                snapshot_ = transaction.snapshot;
            }
            return {};
        }

        std::atomic<bool> failWrites = false;
        std::atomic<uint32_t> applyCalls = 0;

      private:
        mutable std::mutex mutex_;
        std::optional<data::Tally> snapshot_;
        std::vector<data::AuditRecord> records_;
    };
}  // namespace votebridge::testing
