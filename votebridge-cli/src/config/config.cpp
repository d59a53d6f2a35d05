#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>

#include "config.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "votebridge/remote.hpp"

namespace votebridge_cli::config
{
    namespace
    {
        // The destinations of the holiday vote the bridge was first deployed for.
        const std::vector<std::string> DEFAULT_CANDIDATES = {
            "Japan", "Germany", "Switzerland", "Norway"};

        const toml::table EMPTY_TABLE;

        const toml::table& section(const toml::table& config, std::string_view name)
        {
            auto table = config[name].as_table();
            return table ? *table : EMPTY_TABLE;
        }

        tl::expected<int64_t, Error> readInteger(const toml::table& table,
                                                 std::string_view sectionName,
                                                 std::string_view key,
                                                 int64_t defaultValue,
                                                 int64_t min,
                                                 int64_t max = std::numeric_limits<int64_t>::max())
        {
            auto node = table[key];
            if (!node)
            {
                return defaultValue;
            }
            if (!node.as_integer())
            {
                return tl::unexpected(errors::ConfigError {fmt::format(
                    "invalid {} in [{}] - must be an integer", key, sectionName)});
            }
            auto value = node.as_integer()->get();
            if (value < min || value > max)
            {
                return tl::unexpected(errors::ConfigError {fmt::format(
                    "invalid {} in [{}] - must be between {} and {}", key, sectionName, min, max)});
            }
            return value;
        }

        tl::expected<std::string, Error> readString(const toml::table& table,
                                                    std::string_view sectionName,
                                                    std::string_view key,
                                                    std::string_view defaultValue)
        {
            auto node = table[key];
            if (!node)
            {
                return std::string(defaultValue);
            }
            if (!node.as_string())
            {
                return tl::unexpected(errors::ConfigError {
                    fmt::format("invalid {} in [{}] - must be a string", key, sectionName)});
            }
            return node.as_string()->get();
        }

        tl::expected<bool, Error> readBoolean(const toml::table& table,
                                              std::string_view sectionName,
                                              std::string_view key,
                                              bool defaultValue)
        {
            auto node = table[key];
            if (!node)
            {
                return defaultValue;
            }
            if (!node.as_boolean())
            {
                return tl::unexpected(errors::ConfigError {
                    fmt::format("invalid {} in [{}] - must be a boolean", key, sectionName)});
            }
            return node.as_boolean()->get();
        }

        tl::expected<Device, Error> parseDevice(const toml::table& config)
        {
            const auto& table = section(config, "device");
            Device device;

            auto address = readString(table, "device", "address", DEFAULT_DEVICE_ADDRESS);
            if (!address)
            {
                return tl::unexpected(address.error());
            }
            if (address->empty())
            {
                return tl::unexpected(errors::ConfigError {"empty address in [device]"});
            }
            device.address = std::move(*address);

            auto baudRate = readInteger(table,
                                        "device",
                                        "baud_rate",
                                        DEFAULT_BAUD_RATE,
                                        1,
                                        std::numeric_limits<uint32_t>::max());
            if (!baudRate)
            {
                return tl::unexpected(baudRate.error());
            }
            device.baudRate = static_cast<uint32_t>(*baudRate);

            auto openSettle =
                readInteger(table, "device", "open_settle_ms", DEFAULT_OPEN_SETTLE.count(), 0);
            if (!openSettle)
            {
                return tl::unexpected(openSettle.error());
            }
            device.openSettle = std::chrono::milliseconds(*openSettle);

            // Startup must give up eventually, so at least one attempt is required.
            auto connectAttempts = readInteger(table,
                                               "device",
                                               "connect_attempts",
                                               DEFAULT_CONNECT_ATTEMPTS,
                                               1,
                                               std::numeric_limits<uint32_t>::max());
            if (!connectAttempts)
            {
                return tl::unexpected(connectAttempts.error());
            }
            device.connectAttempts = static_cast<uint32_t>(*connectAttempts);

            auto reconnectInitial = readInteger(
                table, "device", "reconnect_initial_ms", DEFAULT_RECONNECT_INITIAL.count(), 1);
            if (!reconnectInitial)
            {
                return tl::unexpected(reconnectInitial.error());
            }
            device.reconnectInitial = std::chrono::milliseconds(*reconnectInitial);

            auto reconnectMax = readInteger(table,
                                            "device",
                                            "reconnect_max_ms",
                                            DEFAULT_RECONNECT_MAX.count(),
                                            *reconnectInitial);
            if (!reconnectMax)
            {
                return tl::unexpected(reconnectMax.error());
            }
            device.reconnectMax = std::chrono::milliseconds(*reconnectMax);

            return device;
        }

        tl::expected<Remote, Error> parseRemote(const toml::table& config)
        {
            const auto& table = section(config, "remote");
            Remote remote;

            auto host = readString(table, "remote", "host", DEFAULT_REMOTE_HOST);
            if (!host)
            {
                return tl::unexpected(host.error());
            }
            remote.host = std::move(*host);

            auto port = readInteger(table, "remote", "port", DEFAULT_REMOTE_PORT, 1, 65535);
            if (!port)
            {
                return tl::unexpected(port.error());
            }
            remote.port = static_cast<uint16_t>(*port);

            auto channelId = readString(table, "remote", "channel_id", "");
            if (!channelId)
            {
                return tl::unexpected(channelId.error());
            }
            remote.channelId = std::move(*channelId);

            auto writeApiKey = readString(table, "remote", "write_api_key", "");
            if (!writeApiKey)
            {
                return tl::unexpected(writeApiKey.error());
            }
            remote.writeApiKey = std::move(*writeApiKey);

            auto readApiKey = readString(table, "remote", "read_api_key", "");
            if (!readApiKey)
            {
                return tl::unexpected(readApiKey.error());
            }
            remote.readApiKey = std::move(*readApiKey);

            auto timeout = readInteger(
                table, "remote", "request_timeout_ms", DEFAULT_REQUEST_TIMEOUT.count(), 1);
            if (!timeout)
            {
                return tl::unexpected(timeout.error());
            }
            remote.requestTimeout = std::chrono::milliseconds(*timeout);

            return remote;
        }

        tl::expected<Sync, Error> parseSync(const toml::table& config)
        {
            const auto& table = section(config, "sync");
            Sync sync;

            auto pushInterval = readInteger(
                table, "sync", "push_interval_seconds", DEFAULT_PUSH_INTERVAL.count(), 1);
            if (!pushInterval)
            {
                return tl::unexpected(pushInterval.error());
            }
            sync.pushInterval = std::chrono::seconds(*pushInterval);

            auto minPushInterval = readInteger(
                table, "sync", "min_push_interval_seconds", DEFAULT_MIN_PUSH_INTERVAL.count(), 0);
            if (!minPushInterval)
            {
                return tl::unexpected(minPushInterval.error());
            }
            sync.minPushInterval = std::chrono::seconds(*minPushInterval);
            if (sync.minPushInterval < DEFAULT_MIN_PUSH_INTERVAL)
            {
                spdlog::warn("min_push_interval_seconds = {} is below the endpoint's rate floor of "
                             "{}s, writes inside the floor will be rejected",
                             *minPushInterval,
                             DEFAULT_MIN_PUSH_INTERVAL.count());
            }

            auto pushAfterVote =
                readBoolean(table, "sync", "push_after_vote", DEFAULT_PUSH_AFTER_VOTE);
            if (!pushAfterVote)
            {
                return tl::unexpected(pushAfterVote.error());
            }
            sync.pushAfterVote = *pushAfterVote;

            return sync;
        }

        tl::expected<Tally, Error> parseTally(const toml::table& config)
        {
            const auto& table = section(config, "tally");
            Tally tally;

            std::optional<std::vector<std::string>> names;
            if (auto namesNode = table["candidates"])
            {
                auto array = namesNode.as_array();
                if (!array)
                {
                    return tl::unexpected(errors::ConfigError {
                        "invalid candidates in [tally] - must be an array of strings"});
                }
                names.emplace();
                for (auto& nameNode : *array)
                {
                    auto name = nameNode.as_string();
                    if (!name)
                    {
                        return tl::unexpected(errors::ConfigError {
                            "invalid candidates in [tally] - must be an array of strings"});
                    }
                    names->push_back(name->get());
                }
            }

            auto defaultCount = names.has_value() ? static_cast<int64_t>(names->size())
                                                  : static_cast<int64_t>(DEFAULT_CANDIDATE_COUNT);
            auto candidateCount = readInteger(table,
                                              "tally",
                                              "candidate_count",
                                              defaultCount,
                                              1,
                                              votebridge::THINGSPEAK_MAX_FIELDS);
            if (!candidateCount)
            {
                return tl::unexpected(candidateCount.error());
            }
            tally.candidateCount = static_cast<uint32_t>(*candidateCount);

            if (names.has_value())
            {
                if (names->size() != tally.candidateCount)
                {
                    return tl::unexpected(errors::ConfigError {
                        fmt::format("[tally] names {} candidates but candidate_count is {}",
                                    names->size(),
                                    tally.candidateCount)});
                }
                tally.candidates = std::move(*names);
            }
            else
            {
                auto count = std::min<size_t>(tally.candidateCount, DEFAULT_CANDIDATES.size());
                tally.candidates.assign(DEFAULT_CANDIDATES.begin(),
                                        DEFAULT_CANDIDATES.begin() + static_cast<long>(count));
            }

            auto storagePath = readString(table, "tally", "storage_path", DEFAULT_STORAGE_PATH);
            if (!storagePath)
            {
                return tl::unexpected(storagePath.error());
            }
            if (storagePath->empty())
            {
                return tl::unexpected(errors::ConfigError {"empty storage_path in [tally]"});
            }
            tally.storagePath = std::move(*storagePath);

            auto maxFailures = readInteger(table,
                                           "tally",
                                           "max_persistence_failures",
                                           DEFAULT_MAX_PERSISTENCE_FAILURES,
                                           1,
                                           std::numeric_limits<uint32_t>::max());
            if (!maxFailures)
            {
                return tl::unexpected(maxFailures.error());
            }
            tally.maxPersistenceFailures = static_cast<uint32_t>(*maxFailures);

            return tally;
        }

        tl::expected<Config, Error> parseTable(const toml::table& config)
        {
            auto device = parseDevice(config);
            if (!device)
            {
                return tl::unexpected(device.error());
            }

            auto remote = parseRemote(config);
            if (!remote)
            {
                return tl::unexpected(remote.error());
            }

            auto sync = parseSync(config);
            if (!sync)
            {
                return tl::unexpected(sync.error());
            }

            auto tally = parseTally(config);
            if (!tally)
            {
                return tl::unexpected(tally.error());
            }

            return Config {.device = std::move(*device),
                           .remote = std::move(*remote),
                           .sync = *sync,
                           .tally = std::move(*tally)};
        }
    }  // namespace

    tl::expected<Config, Error> parseConfig(std::string_view content)
    {
        toml::table config;
        try
        {
            config = toml::parse(content);
        }
        catch (const toml::parse_error& err)
        {
            return tl::unexpected(
                errors::ConfigError {"failed to parse TOML: " + std::string(err.what())});
        }
        return parseTable(config);
    }

    tl::expected<Config, Error> loadConfig(std::string_view path)
    {
        if (!std::filesystem::exists(path))
        {
            return tl::unexpected(
                errors::ConfigError {"config file not found: " + std::string(path)});
        }

        toml::table config;
        try
        {
            config = toml::parse_file(path);
        }
        catch (const toml::parse_error& err)
        {
            return tl::unexpected(
                errors::ConfigError {"failed to parse TOML file: " + std::string(err.what())});
        }

        auto parsed = parseTable(config);
        if (!parsed)
        {
            return tl::unexpected(parsed.error());
        }
        applyEnvironment(*parsed);
        return parsed;
    }

    void applyEnvironment(Config& config)
    {
        if (const char* value = std::getenv(WRITE_API_KEY_ENV); value != nullptr && *value != '\0')
        {
            config.remote.writeApiKey = value;
        }
        if (const char* value = std::getenv(READ_API_KEY_ENV); value != nullptr && *value != '\0')
        {
            config.remote.readApiKey = value;
        }
        if (const char* value = std::getenv(CHANNEL_ID_ENV); value != nullptr && *value != '\0')
        {
            config.remote.channelId = value;
        }
    }
}  // namespace votebridge_cli::config
