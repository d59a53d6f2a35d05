#include <algorithm>
#include <array>
#include <atomic>
#include <filesystem>
#include <optional>
#include <thread>

#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/serial_port.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "votebridge/stream.hpp"

namespace votebridge
{
    namespace
    {
        // Name prefixes of USB serial adapters (CH340, FTDI) and CDC-ACM boards on Linux.
        constexpr std::array<std::string_view, 2> SERIAL_DEVICE_PREFIXES = {"ttyUSB", "ttyACM"};
        constexpr std::string_view DEVICE_DIRECTORY = "/dev";
        // How much of an overlong line is kept in the error.
        constexpr std::size_t OVERLONG_PREVIEW_LENGTH = 32;

        class SerialStream final : public LineStream
        {
          public:
            explicit SerialStream(SerialConfig config)
                : config_(std::move(config))
                , port_(io_)
            {
            }

            ~SerialStream() override { close(); }

            tl::expected<void, Error> open() override
            {
                close();
                // Drop a cancellation posted before this reconnect.
                io_.restart();
                io_.poll();
                cancelled_ = false;
                buffer_.clear();

                auto path = config_.address;
                if (path == AUTO_DEVICE_ADDRESS)
                {
                    auto devices = findSerialDevices();
                    if (devices.empty())
                    {
                        return tl::make_unexpected(
                            errors::Connection {.message = "no serial adapter detected"});
                    }
                    path = devices.front();
                    spdlog::info("[serial] detected {}", path);
                }

                asio::error_code ec;
                port_.open(path, ec);
                if (ec)
                {
                    return tl::make_unexpected(errors::Connection {
                        .message = fmt::format("failed to open {}: {}", path, ec.message())});
                }

                port_.set_option(asio::serial_port::baud_rate(config_.baudRate), ec);
                if (!ec)
                {
                    port_.set_option(asio::serial_port::character_size(8), ec);
                }
                if (!ec)
                {
                    port_.set_option(asio::serial_port::parity(asio::serial_port::parity::none),
                                     ec);
                }
                if (!ec)
                {
                    port_.set_option(
                        asio::serial_port::stop_bits(asio::serial_port::stop_bits::one), ec);
                }
                if (!ec)
                {
                    port_.set_option(
                        asio::serial_port::flow_control(asio::serial_port::flow_control::none),
                        ec);
                }
                if (ec)
                {
                    close();
                    return tl::make_unexpected(errors::Connection {
                        .message = fmt::format("failed to configure {}: {}", path, ec.message())});
                }

                openPath_ = path;
                spdlog::info("[serial] opened {} at {} baud", path, config_.baudRate);
                // Opening the port resets most Arduino boards.
                std::this_thread::sleep_for(config_.openSettle);
                return {};
            }

            tl::expected<std::string, Error> readLine() override
            {
                if (cancelled_)
                {
                    return tl::make_unexpected(errors::NotRunning {});
                }
                if (!port_.is_open())
                {
                    return tl::make_unexpected(errors::Connection {.message = "port is not open"});
                }

                std::optional<asio::error_code> result;
                std::size_t length = 0;
                asio::async_read_until(port_,
                                       asio::dynamic_buffer(buffer_, MAX_LINE_LENGTH),
                                       '\n',
                                       [&result, &length](asio::error_code ec, std::size_t n)
                                       {
                                           result = ec;
                                           length = n;
                                       });
                io_.restart();
                io_.run();

                if (cancelled_)
                {
                    return tl::make_unexpected(errors::NotRunning {});
                }
                if (result.has_value() && *result == asio::error::not_found)
                {
                    auto preview = buffer_.substr(0, OVERLONG_PREVIEW_LENGTH);
                    buffer_.clear();
                    return tl::make_unexpected(errors::Decode {
                        .line = std::move(preview),
                        .reason = fmt::format("no line feed within {} bytes", MAX_LINE_LENGTH)});
                }
                if (!result.has_value() || *result)
                {
                    auto message = result.has_value() ? result->message() : "read interrupted";
                    close();
                    return tl::make_unexpected(errors::Connection {
                        .message = fmt::format("read from {} failed: {}", openPath_, message)});
                }

                std::string line = buffer_.substr(0, length - 1);
                buffer_.erase(0, length);
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                return line;
            }

            void close() override
            {
                if (port_.is_open())
                {
                    asio::error_code ec;
                    port_.close(ec);
                    if (ec)
                    {
                        spdlog::warn("[serial] failed to close {}: {}", openPath_, ec.message());
                    }
                }
            }

            void cancel() override
            {
                cancelled_ = true;
                asio::post(io_,
                           [this]
                           {
                               asio::error_code ec;
                               port_.cancel(ec);
                           });
            }

            [[nodiscard]] std::string describe() const override
            {
                return openPath_.empty() ? config_.address : openPath_;
            }

          private:
            SerialConfig config_;
            asio::io_context io_;
            asio::serial_port port_;
            std::string buffer_;
            std::string openPath_;
            std::atomic<bool> cancelled_ = false;
        };
    }  // namespace

    std::vector<std::string> findSerialDevices()
    {
        std::vector<std::string> devices;
        std::error_code ec;
        for (auto const& entry : std::filesystem::directory_iterator(DEVICE_DIRECTORY, ec))
        {
            auto name = entry.path().filename().string();
            bool matches = std::any_of(SERIAL_DEVICE_PREFIXES.begin(),
                                       SERIAL_DEVICE_PREFIXES.end(),
                                       [&name](auto prefix) { return name.starts_with(prefix); });
            if (matches)
            {
                devices.push_back(entry.path().string());
            }
        }
        std::sort(devices.begin(), devices.end());
        return devices;
    }

    tl::expected<std::unique_ptr<LineStream>, Error> createSerialStream(SerialConfig config)
    {
        if (config.address.empty())
        {
            return tl::make_unexpected(
                errors::InvalidArgument {"device address must not be empty"});
        }
        if (config.baudRate == 0)
        {
            return tl::make_unexpected(errors::InvalidArgument {"baud rate must be > 0"});
        }
        return std::make_unique<SerialStream>(std::move(config));
    }
}  // namespace votebridge
