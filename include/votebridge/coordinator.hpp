#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>
#include <tl/expected.hpp>

#include "votebridge/errors.hpp"
#include "votebridge/stream.hpp"
#include "votebridge/synchronizer.hpp"
#include "votebridge/tally_store.hpp"

namespace votebridge
{
    /// The default cadence of the push schedule.
    constexpr std::chrono::seconds DEFAULT_PUSH_INTERVAL = std::chrono::seconds(15);
    /// The default number of consecutive persistence failures that stop the bridge.
    constexpr uint32_t DEFAULT_MAX_PERSISTENCE_FAILURES = 3;

    /// How the coordinator waits between failed attempts to open the stream. The delay doubles
    /// after every failure, starting at initial and capped at max.
    struct BackoffPolicy
    {
        std::chrono::milliseconds initial = std::chrono::milliseconds(500);
        std::chrono::milliseconds max = std::chrono::seconds(30);
        /// The number of attempts before startup fails. Reconnects after the first successful
        /// connection are never bounded.
        uint32_t startupAttempts = 10;

        /// Returns the delay after the given number of consecutive failures (1-based).
        [[nodiscard]] std::chrono::milliseconds delay(uint32_t failures) const;
    };

    /// The state of the device connection.
    enum class ConnectionState : uint8_t
    {
        Disconnected,
        Connected,
        Reading,
        Stopped
    };

    /// Counters describing what the coordinator has done so far.
    struct CoordinatorStats
    {
        uint64_t votesApplied = 0;  ///< Votes counted by the tally store.
        uint64_t decodeFailures = 0;  ///< Lines that were not votes.
        uint64_t rejectedVotes = 0;  ///< Votes the store refused (invalid candidate, storage).
        uint64_t reconnects = 0;  ///< Successful reconnects after the first connection.
        uint64_t pushes = 0;  ///< Successful pushes to the remote endpoint.
        uint64_t failedPushes = 0;  ///< Push requests that failed.
    };

    /// Configuration for creating a coordinator.
    struct CoordinatorConfig
    {
        std::shared_ptr<LineStream> stream;  ///< The device stream.
        std::shared_ptr<TallyStore> store;  ///< The tally store.
        std::shared_ptr<Synchronizer> synchronizer;  ///< The remote synchronizer.
        std::chrono::nanoseconds pushInterval = DEFAULT_PUSH_INTERVAL;  ///< The push cadence.
        /// Whether every counted vote also triggers a push. The rate floor still applies, so a
        /// vote inside the floor waits for a later vote or the next scheduled tick.
        bool pushAfterVote = true;
        BackoffPolicy backoff;  ///< The reconnect policy.
        uint32_t maxPersistenceFailures =
            DEFAULT_MAX_PERSISTENCE_FAILURES;  ///< Consecutive failures before stopping.
        std::vector<std::string> candidateNames;  ///< Display names used in status logs.
    };

    /// Coordinator is the bridge between the device and the remote endpoint. It reads the stream
    /// on the thread that calls run(), counts every decoded vote in the tally store and pushes
    /// the tally from a timer thread, on a fixed schedule and after each vote.
    class Coordinator
    {
      public:
        explicit Coordinator(CoordinatorConfig config);
        ~Coordinator();

        Coordinator(Coordinator const&) = delete;
        Coordinator& operator=(Coordinator const&) = delete;

        /// Connects to the device, seeds the tally store from the local snapshot and the remote
        /// tally, and reads votes until stop() is called.
        /// @return Success after stop(), FailedToStart if the device never connected, or the
        /// error that made the bridge give up (storage or startup sync).
        tl::expected<void, Error> run();

        /// Stops run(). A push that is in flight completes; no new push starts. This may be
        /// called from any thread, including before run().
        void stop();

        [[nodiscard]] ConnectionState state() const { return state_; }

        [[nodiscard]] CoordinatorStats stats() const;

      private:
        // Opens the stream, waiting between attempts. Returns NotRunning if stopped while waiting.
        tl::expected<void, Error> connect(bool startup);
        // Pulls the remote tally, reconciles it with the snapshot and initializes the store.
        tl::expected<void, Error> synchronizeStartup();
        // Reads until the stream fails (Connection), stop() (NotRunning) or a fatal error.
        tl::expected<void, Error> readLoop();
        // Returns an error only when the line made the bridge give up.
        tl::expected<void, Error> handleLine(std::string const& line);

        void startSchedule();
        void scheduleTick();
        void tick();
        void stopSchedule();

        // Sleeps for the delay unless stop() is called first. Returns false if stopped.
        bool waitFor(std::chrono::milliseconds delay);
        [[nodiscard]] bool stopping() const { return stopping_; }

        CoordinatorConfig config_;

        std::atomic<ConnectionState> state_ {ConnectionState::Disconnected};
        std::atomic<bool> stopping_ = false;
        bool initialized_ = false;
        uint32_t consecutivePersistenceFailures_ = 0;

        mutable std::mutex mutex_;
        std::condition_variable condition_;
        CoordinatorStats stats_;

        asio::io_context io_;
        asio::executor_work_guard<asio::io_context::executor_type> work_;
        asio::steady_timer timer_;
        std::thread timerThread_;
    };
}  // namespace votebridge
