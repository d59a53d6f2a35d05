#include "votebridge/tally_store.hpp"

#include <spdlog/spdlog.h>

#include "votebridge/fmt/errors.hpp"

namespace votebridge
{
    TallyStore::TallyStore(std::shared_ptr<Persister> persister, uint32_t candidateCount)
        : persister_(std::move(persister))
        , candidateCount_(candidateCount)
        , tally_(data::Tally::zero(candidateCount))
        , nextSequence_(persister_->getLastSequence().value_or(0) + 1)
    {
    }

    tl::expected<data::Tally, Error> TallyStore::loadSnapshot() const
    {
        auto stored = persister_->loadSnapshot();
        if (!stored)
        {
            return tl::make_unexpected(stored.error());
        }
        auto snapshot = data::Tally::zero(candidateCount_);
        if (!stored->has_value())
        {
            return snapshot;
        }

        auto const& counts = (*stored)->counts;
        for (size_t i = 0; i < counts.size(); ++i)
        {
            if (i < candidateCount_)
            {
                snapshot.counts[i] = counts[i];
            }
            else if (counts[i] != 0)
            {
                return tl::make_unexpected(errors::InvalidArgument {
                    fmt::format("snapshot holds {} votes for candidate {} but only {} are "
                                "configured",
                                counts[i],
                                i + 1,
                                candidateCount_)});
            }
        }
        return snapshot;
    }

    tl::expected<void, Error> TallyStore::initialize(data::Tally seed)
    {
        std::lock_guard lock {mutex_};
        if (voteApplied_)
        {
            return tl::make_unexpected(errors::AlreadyInitialized {});
        }
        if (seed.candidateCount() != candidateCount_)
        {
            return tl::make_unexpected(errors::InvalidArgument {
                fmt::format("seed covers {} candidates, expected {}",
                            seed.candidateCount(),
                            candidateCount_)});
        }

        PersistedTransaction transaction;
        transaction.setSnapshot(seed);
        if (auto result = persister_->apply(transaction); !result)
        {
            return tl::make_unexpected(result.error());
        }

        tally_ = std::move(seed);
        spdlog::info("[store] initialized with {} votes", tally_.total());
        return {};
    }

    tl::expected<uint64_t, Error> TallyStore::apply(data::VoteEvent const& event)
    {
        std::lock_guard lock {mutex_};
        if (!tally_.contains(event.candidate))
        {
            return tl::make_unexpected(errors::InvalidCandidate {
                .candidate = event.candidate, .candidateCount = candidateCount_});
        }

        auto updated = tally_;
        auto newCount = ++updated.counts[event.candidate - 1];

        PersistedTransaction transaction;
        transaction.append(data::AuditRecord {.sequence = nextSequence_,
                                              .timestamp = event.receivedAt,
                                              .candidate = event.candidate,
                                              .resultingCount = newCount});
        transaction.setSnapshot(updated);

        if (auto result = persister_->apply(transaction); !result)
        {
            spdlog::error("[store] vote for candidate {} not counted: {}",
                          event.candidate,
                          result.error());
            return tl::make_unexpected(result.error());
        }

        tally_ = std::move(updated);
        nextSequence_++;
        voteApplied_ = true;
        return newCount;
    }

    tl::expected<std::vector<data::AuditRecord>, Error> TallyStore::auditRecords() const
    {
        return persister_->getRecords();
    }

    data::Tally TallyStore::currentTally() const
    {
        std::lock_guard lock {mutex_};
        return tally_;
    }
}  // namespace votebridge
