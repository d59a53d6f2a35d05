#include "votebridge/synchronizer.hpp"

#include <spdlog/spdlog.h>

#include <fmt/ranges.h>

#include "votebridge/fmt/errors.hpp"

namespace votebridge
{
    Synchronizer::Synchronizer(std::shared_ptr<RemoteEndpoint> endpoint, SynchronizerConfig config)
        : endpoint_(std::move(endpoint))
        , config_(config)
    {
        state_.lastPushedTally = data::Tally::zero(config_.candidateCount);
    }

    PullResult Synchronizer::pullInitial()
    {
        std::lock_guard lock {mutex_};
        auto result = endpoint_->readLatest(config_.candidateCount);
        if (!result)
        {
            Error error = result.error();
            if (!std::holds_alternative<errors::SyncUnavailable>(error))
            {
                error = errors::SyncUnavailable {.message = fmt::format("{}", error)};
            }
            spdlog::warn("[sync] remote tally unavailable, continuing with local state: {}",
                         error);
            return PullResult {.tally = data::Tally::zero(config_.candidateCount),
                               .error = std::move(error)};
        }
        if (result->candidateCount() != config_.candidateCount)
        {
            Error error = errors::SyncUnavailable {
                .message = fmt::format("remote returned {} counts, expected {}",
                                       result->candidateCount(),
                                       config_.candidateCount)};
            spdlog::warn("[sync] {}", error);
            return PullResult {.tally = data::Tally::zero(config_.candidateCount),
                               .error = std::move(error)};
        }

        spdlog::info("[sync] remote tally: {}", fmt::join(result->counts, ", "));
        state_.lastPushedTally = *result;
        return PullResult {.tally = std::move(*result)};
    }

    PushOutcome Synchronizer::maybePush(data::Tally const& tally,
                                        std::chrono::steady_clock::time_point now)
    {
        std::lock_guard lock {mutex_};
        if (state_.lastPushTime.has_value() && now - *state_.lastPushTime < config_.minPushInterval)
        {
            return PushOutcome::Skipped;
        }
        if (tally == state_.lastPushedTally)
        {
            return PushOutcome::Skipped;
        }

        auto result = endpoint_->write(tally);
        if (!result)
        {
            state_.lastPushSucceeded = false;
            spdlog::warn("[sync] push failed, retrying on the next tick: {}", result.error());
            return PushOutcome::Failed;
        }

        state_.lastPushedTally = tally;
        state_.lastPushTime = now;
        state_.lastPushSucceeded = true;
        spdlog::info("[sync] pushed entry #{}: {}", *result, fmt::join(tally.counts, ", "));
        return PushOutcome::Pushed;
    }

    SyncState Synchronizer::state() const
    {
        std::lock_guard lock {mutex_};
        return state_;
    }
}  // namespace votebridge
