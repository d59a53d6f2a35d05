#include "votebridge/inmemory/stream.hpp"

#include <atomic>
#include <mutex>
#include <variant>

#include <fmt/format.h>

#include "common/mpsc_queue.hpp"

namespace votebridge::inmemory
{
    namespace
    {
        constexpr std::size_t OVERLONG_PREVIEW_LENGTH = 32;

        struct Disconnect
        {
        };

        using Item = std::variant<std::string, Disconnect>;

        class StreamImpl final : public Stream
        {
          public:
            explicit StreamImpl(std::string name)
                : name_(std::move(name))
            {
            }

            tl::expected<void, Error> open() override
            {
                std::lock_guard lock {mutex_};
                if (failedOpens_ > 0)
                {
                    failedOpens_--;
                    return tl::make_unexpected(
                        errors::Connection {.message = name_ + " is not attached"});
                }
                cancelled_ = false;
                open_ = true;
                queue_.reopen();
                openCount_++;
                return {};
            }

            tl::expected<std::string, Error> readLine() override
            {
                if (cancelled_)
                {
                    return tl::make_unexpected(errors::NotRunning {});
                }
                if (!open_)
                {
                    return tl::make_unexpected(
                        errors::Connection {.message = name_ + " is closed"});
                }

                auto item = queue_.pop();
                if (!item.has_value())
                {
                    return tl::make_unexpected(errors::NotRunning {});
                }
                if (std::holds_alternative<Disconnect>(*item))
                {
                    open_ = false;
                    return tl::make_unexpected(
                        errors::Connection {.message = name_ + " disconnected"});
                }
                auto line = std::get<std::string>(std::move(*item));
                if (line.size() >= MAX_LINE_LENGTH)
                {
                    return tl::make_unexpected(errors::Decode {
                        .line = line.substr(0, OVERLONG_PREVIEW_LENGTH),
                        .reason = fmt::format("no line feed within {} bytes", MAX_LINE_LENGTH)});
                }
                return line;
            }

            void close() override { open_ = false; }

            void cancel() override
            {
                cancelled_ = true;
                queue_.close();
            }

            [[nodiscard]] std::string describe() const override { return name_; }

            void pushLine(std::string line) override { queue_.push(std::move(line)); }

            void pushDisconnect() override { queue_.push(Disconnect {}); }

            void failNextOpens(uint32_t count) override
            {
                std::lock_guard lock {mutex_};
                failedOpens_ = count;
            }

            [[nodiscard]] uint32_t openCount() const override
            {
                std::lock_guard lock {mutex_};
                return openCount_;
            }

            [[nodiscard]] size_t pending() const override { return queue_.size(); }

          private:
            std::string name_;
            common::MPSCQueue<Item> queue_;

            mutable std::mutex mutex_;
            uint32_t failedOpens_ = 0;
            uint32_t openCount_ = 0;

            std::atomic<bool> open_ = false;
            std::atomic<bool> cancelled_ = false;
        };
    }  // namespace

    std::shared_ptr<Stream> createStream(std::string name)
    {
        return std::make_shared<StreamImpl>(std::move(name));
    }
}  // namespace votebridge::inmemory
