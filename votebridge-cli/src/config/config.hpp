#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "../errors.hpp"

namespace votebridge_cli::config
{
    constexpr std::string_view DEFAULT_DEVICE_ADDRESS = "auto";
    constexpr uint32_t DEFAULT_BAUD_RATE = 9600;
    constexpr std::chrono::milliseconds DEFAULT_OPEN_SETTLE = std::chrono::milliseconds(2000);
    constexpr uint32_t DEFAULT_CONNECT_ATTEMPTS = 10;
    constexpr std::chrono::milliseconds DEFAULT_RECONNECT_INITIAL = std::chrono::milliseconds(500);
    constexpr std::chrono::milliseconds DEFAULT_RECONNECT_MAX = std::chrono::seconds(30);

    constexpr std::string_view DEFAULT_REMOTE_HOST = "api.thingspeak.com";
    constexpr uint16_t DEFAULT_REMOTE_PORT = 443;
    constexpr std::chrono::milliseconds DEFAULT_REQUEST_TIMEOUT = std::chrono::seconds(10);

    constexpr std::chrono::seconds DEFAULT_PUSH_INTERVAL = std::chrono::seconds(15);
    constexpr std::chrono::seconds DEFAULT_MIN_PUSH_INTERVAL = std::chrono::seconds(15);
    constexpr bool DEFAULT_PUSH_AFTER_VOTE = true;

    constexpr uint32_t DEFAULT_CANDIDATE_COUNT = 4;
    constexpr std::string_view DEFAULT_STORAGE_PATH = "./data";
    constexpr uint32_t DEFAULT_MAX_PERSISTENCE_FAILURES = 3;

    // Environment variables that override the [remote] credentials.
    constexpr const char* WRITE_API_KEY_ENV = "THINGSPEAK_WRITE_API_KEY";
    constexpr const char* READ_API_KEY_ENV = "THINGSPEAK_READ_API_KEY";
    constexpr const char* CHANNEL_ID_ENV = "THINGSPEAK_CHANNEL_ID";

    struct Device
    {
        std::string address;
        uint32_t baudRate;
        std::chrono::milliseconds openSettle;
        uint32_t connectAttempts;
        std::chrono::milliseconds reconnectInitial;
        std::chrono::milliseconds reconnectMax;
    };

    struct Remote
    {
        std::string host;
        uint16_t port;
        std::string channelId;
        std::string writeApiKey;
        std::string readApiKey;
        std::chrono::milliseconds requestTimeout;
    };

    struct Sync
    {
        std::chrono::seconds pushInterval;
        std::chrono::seconds minPushInterval;
        bool pushAfterVote;
    };

    struct Tally
    {
        uint32_t candidateCount;
        std::vector<std::string> candidates;
        std::string storagePath;
        uint32_t maxPersistenceFailures;
    };

    struct Config
    {
        Device device;
        Remote remote;
        Sync sync;
        Tally tally;
    };

    // Every section and key is optional; missing values take the defaults above.
    tl::expected<Config, Error> parseConfig(std::string_view content);

    tl::expected<Config, Error> loadConfig(std::string_view path);

    // Replaces the remote credentials with the THINGSPEAK_* environment variables that are set.
    void applyEnvironment(Config& config);

}  // namespace votebridge_cli::config
