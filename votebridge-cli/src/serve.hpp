#pragma once
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "config/config.hpp"
#include "votebridge/coordinator.hpp"
#include "votebridge/fmt/errors.hpp"
#include "votebridge/fs/sqlite.hpp"
#include "votebridge/remote.hpp"
#include "votebridge/stream.hpp"
#include "votebridge/synchronizer.hpp"
#include "votebridge/tally_store.hpp"

namespace votebridge_cli
{
    // Creates the storage directory and opens the tally store inside it.
    inline tl::expected<std::shared_ptr<votebridge::TallyStore>, Error> openStore(
        config::Tally const& tally)
    {
        std::error_code ec;
        std::filesystem::create_directories(tally.storagePath, ec);
        if (ec)
        {
            return tl::unexpected(errors::Unknown {.message = fmt::format(
                                                       "failed to create {}: {}",
                                                       tally.storagePath,
                                                       ec.message())});
        }

        auto path = std::filesystem::path(tally.storagePath) / votebridge::fs::DATABASE_FILE_NAME;
        auto persister = votebridge::fs::createSQLitePersister(path.string());
        if (!persister)
        {
            return tl::unexpected(errors::Unknown {
                .message = fmt::format("failed to create persister: {}", persister.error())});
        }
        return std::make_shared<votebridge::TallyStore>(*persister, tally.candidateCount);
    }

    inline int serve(std::string const& configPath,
                     std::optional<std::string> const& deviceAddress,
                     std::string const& logLevel)
    {
        auto level = spdlog::level::from_str(logLevel);
        if (level == spdlog::level::off && logLevel != "off")
        {
            std::cerr << fmt::format("unknown log level {}\n", logLevel);
            return 1;
        }
        spdlog::set_level(level);

        auto config = config::loadConfig(configPath);
        if (!config)
        {
            std::cerr << fmt::format("{}\n", config.error());
            return 1;
        }
        if (deviceAddress.has_value())
        {
            config->device.address = *deviceAddress;
        }

        auto store = openStore(config->tally);
        if (!store)
        {
            std::cerr << fmt::format("{}\n", store.error());
            return 1;
        }

        auto endpoint = votebridge::createThingSpeakEndpoint(votebridge::ThingSpeakConfig {
            .host = config->remote.host,
            .port = config->remote.port,
            .channelId = config->remote.channelId,
            .writeApiKey = config->remote.writeApiKey,
            .readApiKey = config->remote.readApiKey,
            .requestConfig = {.timeout =
                                  static_cast<uint64_t>(config->remote.requestTimeout.count())},
        });
        if (!endpoint)
        {
            std::cerr << fmt::format("Failed to create remote endpoint: {}\n", endpoint.error());
            return 1;
        }

        auto synchronizer = std::make_shared<votebridge::Synchronizer>(
            std::shared_ptr<votebridge::RemoteEndpoint>(std::move(*endpoint)),
            votebridge::SynchronizerConfig {
                .candidateCount = config->tally.candidateCount,
                .minPushInterval = config->sync.minPushInterval,
            });

        auto stream = votebridge::createSerialStream(votebridge::SerialConfig {
            .address = config->device.address,
            .baudRate = config->device.baudRate,
            .openSettle = config->device.openSettle,
        });
        if (!stream)
        {
            std::cerr << fmt::format("Failed to create serial stream: {}\n", stream.error());
            return 1;
        }

        votebridge::Coordinator coordinator(votebridge::CoordinatorConfig {
            .stream = std::shared_ptr<votebridge::LineStream>(std::move(*stream)),
            .store = *store,
            .synchronizer = synchronizer,
            .pushInterval = config->sync.pushInterval,
            .pushAfterVote = config->sync.pushAfterVote,
            .backoff = {.initial = config->device.reconnectInitial,
                        .max = config->device.reconnectMax,
                        .startupAttempts = config->device.connectAttempts},
            .maxPersistenceFailures = config->tally.maxPersistenceFailures,
            .candidateNames = config->tally.candidates,
        });

        // Runs until Ctrl+C or SIGTERM.
        asio::io_context signalContext;
        asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait(
            [&coordinator](asio::error_code ec, int signal)
            {
                if (ec)
                {
                    return;
                }
                spdlog::info("received signal {}, stopping", signal);
                coordinator.stop();
            });
        std::thread signalThread {[&signalContext] { signalContext.run(); }};

        spdlog::info("bridging {} to {} channel {} for {} candidates",
                     config->device.address,
                     config->remote.host,
                     config->remote.channelId,
                     config->tally.candidateCount);
        auto result = coordinator.run();

        signals.cancel();
        signalContext.stop();
        signalThread.join();

        if (!result)
        {
            std::cerr << fmt::format("{}\n", result.error());
            return 1;
        }
        return 0;
    }
}  // namespace votebridge_cli
