#include "votebridge/coordinator.hpp"

#include <algorithm>

#include <asio/post.hpp>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "votebridge/decoder.hpp"
#include "votebridge/fmt/errors.hpp"
#include "votebridge/report.hpp"

namespace votebridge
{
    std::chrono::milliseconds BackoffPolicy::delay(uint32_t failures) const
    {
        auto result = initial;
        for (uint32_t i = 1; i < failures && result < max; ++i)
        {
            result *= 2;
        }
        return std::min(result, max);
    }

    Coordinator::Coordinator(CoordinatorConfig config)
        : config_(std::move(config))
        , work_(io_.get_executor())
        , timer_(io_)
    {
    }

    Coordinator::~Coordinator()
    {
        stop();
        stopSchedule();
    }

    CoordinatorStats Coordinator::stats() const
    {
        std::lock_guard lock {mutex_};
        return stats_;
    }

    tl::expected<void, Error> Coordinator::run()
    {
        bool startup = true;
        tl::expected<void, Error> result;
        while (!stopping())
        {
            auto connected = connect(startup);
            if (!connected)
            {
                if (!std::holds_alternative<errors::NotRunning>(connected.error()))
                {
                    result = tl::make_unexpected(connected.error());
                }
                break;
            }

            if (!initialized_)
            {
                auto synced = synchronizeStartup();
                if (!synced)
                {
                    result = tl::make_unexpected(synced.error());
                    break;
                }
                initialized_ = true;
                startSchedule();
            }
            else
            {
                std::lock_guard lock {mutex_};
                stats_.reconnects++;
            }
            startup = false;

            auto read = readLoop();
            if (read || std::holds_alternative<errors::NotRunning>(read.error()))
            {
                break;
            }
            if (!std::holds_alternative<errors::Connection>(read.error()))
            {
                result = tl::make_unexpected(read.error());
                break;
            }
            spdlog::warn("[coordinator] {}, reconnecting", read.error());
            config_.stream->close();
            state_ = ConnectionState::Disconnected;
        }

        stop();
        config_.stream->close();
        stopSchedule();
        state_ = ConnectionState::Stopped;
        if (!result)
        {
            spdlog::error("[coordinator] stopped: {}", result.error());
        }
        else
        {
            spdlog::info("[coordinator] stopped");
        }
        return result;
    }

    void Coordinator::stop()
    {
        {
            std::lock_guard lock {mutex_};
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
        }
        condition_.notify_all();
        config_.stream->cancel();
        asio::post(io_, [this] { timer_.cancel(); });
    }

    tl::expected<void, Error> Coordinator::connect(bool startup)
    {
        state_ = ConnectionState::Disconnected;
        uint32_t failures = 0;
        while (!stopping())
        {
            auto opened = config_.stream->open();
            if (opened)
            {
                state_ = ConnectionState::Connected;
                spdlog::info("[coordinator] connected to {}", config_.stream->describe());
                return {};
            }

            failures++;
            if (startup && config_.backoff.startupAttempts > 0
                && failures >= config_.backoff.startupAttempts)
            {
                return tl::make_unexpected(errors::FailedToStart {
                    .message = fmt::format("could not open {} after {} attempts: {}",
                                           config_.stream->describe(),
                                           failures,
                                           opened.error())});
            }

            auto delay = config_.backoff.delay(failures);
            spdlog::warn("[coordinator] {}, retrying in {} ms", opened.error(), delay.count());
            if (!waitFor(delay))
            {
                break;
            }
        }
        return tl::make_unexpected(errors::NotRunning {});
    }

    tl::expected<void, Error> Coordinator::synchronizeStartup()
    {
        auto local = config_.store->loadSnapshot();
        if (!local)
        {
            return tl::make_unexpected(local.error());
        }

        auto pulled = config_.synchronizer->pullInitial();
        auto seed = pulled.available() ? data::reconcile(*local, pulled.tally) : *local;
        spdlog::info("[coordinator] local snapshot [{}], remote [{}], seed [{}]",
                     fmt::join(local->counts, ", "),
                     pulled.available() ? fmt::format("{}", fmt::join(pulled.tally.counts, ", "))
                                        : "unavailable",
                     fmt::join(seed.counts, ", "));

        auto initialized = config_.store->initialize(std::move(seed));
        if (!initialized)
        {
            return tl::make_unexpected(initialized.error());
        }
        for (auto const& row : report::formatTally(config_.store->currentTally(),
                                                   config_.candidateNames))
        {
            spdlog::info("[coordinator] {}", row);
        }
        return {};
    }

    tl::expected<void, Error> Coordinator::readLoop()
    {
        state_ = ConnectionState::Reading;
        while (!stopping())
        {
            auto line = config_.stream->readLine();
            if (!line && std::holds_alternative<errors::Decode>(line.error()))
            {
                spdlog::warn("[coordinator] dropped input: {}", line.error());
                std::lock_guard lock {mutex_};
                stats_.decodeFailures++;
                continue;
            }
            if (!line)
            {
                return tl::make_unexpected(line.error());
            }
            if (auto handled = handleLine(*line); !handled)
            {
                return handled;
            }
        }
        return {};
    }

    tl::expected<void, Error> Coordinator::handleLine(std::string const& line)
    {
        auto event = decoder::decode(line, config_.store->candidateCount());
        if (!event)
        {
            if (decoder::isDeviceReady(line))
            {
                spdlog::info("[coordinator] device ready");
            }
            else
            {
                spdlog::warn("[coordinator] ignored line: {}", event.error());
            }
            std::lock_guard lock {mutex_};
            stats_.decodeFailures++;
            return {};
        }

        auto applied = config_.store->apply(*event);
        if (applied)
        {
            consecutivePersistenceFailures_ = 0;
            spdlog::info("[coordinator] vote for {}, now {} votes",
                         data::candidateName(config_.candidateNames, event->candidate),
                         *applied);
            {
                std::lock_guard lock {mutex_};
                stats_.votesApplied++;
            }
            if (config_.pushAfterVote)
            {
                // Pushes run on the timer thread so a slow request never stalls reading.
                asio::post(io_, [this] { tick(); });
            }
            return {};
        }

        {
            std::lock_guard lock {mutex_};
            stats_.rejectedVotes++;
        }
        if (!std::holds_alternative<errors::PersistenceFailed>(applied.error()))
        {
            spdlog::warn("[coordinator] vote rejected: {}", applied.error());
            return {};
        }

        consecutivePersistenceFailures_++;
        if (consecutivePersistenceFailures_ >= config_.maxPersistenceFailures)
        {
            return tl::make_unexpected(errors::PersistenceFailed {
                .message = fmt::format("{} consecutive votes could not be stored, last: {}",
                                       consecutivePersistenceFailures_,
                                       applied.error())});
        }
        return {};
    }

    void Coordinator::startSchedule()
    {
        scheduleTick();
        timerThread_ = std::thread {[this] { io_.run(); }};
    }

    void Coordinator::scheduleTick()
    {
        if (stopping())
        {
            return;
        }
        timer_.expires_after(
            std::chrono::duration_cast<asio::steady_timer::duration>(config_.pushInterval));
        timer_.async_wait(
            [this](asio::error_code ec)
            {
                if (ec)
                {
                    return;
                }
                tick();
                scheduleTick();
            });
    }

    void Coordinator::tick()
    {
        if (stopping())
        {
            return;
        }
        auto tally = config_.store->currentTally();
        auto outcome = config_.synchronizer->maybePush(tally, std::chrono::steady_clock::now());
        if (outcome == PushOutcome::Skipped)
        {
            return;
        }

        std::lock_guard lock {mutex_};
        if (outcome == PushOutcome::Failed)
        {
            stats_.failedPushes++;
            return;
        }
        stats_.pushes++;
        for (auto const& row : report::formatTally(tally, config_.candidateNames))
        {
            spdlog::info("[coordinator] {}", row);
        }
    }

    void Coordinator::stopSchedule()
    {
        asio::post(io_, [this] { timer_.cancel(); });
        work_.reset();
        if (timerThread_.joinable())
        {
            timerThread_.join();
        }
    }

    bool Coordinator::waitFor(std::chrono::milliseconds delay)
    {
        std::unique_lock lock {mutex_};
        return !condition_.wait_for(lock, delay, [this] { return stopping_.load(); });
    }
}  // namespace votebridge
