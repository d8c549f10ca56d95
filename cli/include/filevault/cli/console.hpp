#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <thread>

#include "filevault/service/collaborators.hpp"

namespace filevault::cli
{

    // Status block on a stream. With `rewrite` set (a terminal), the previous
    // block is erased before the next one is printed.
    class ConsoleStatus : public service::StatusDisplay
    {
    public:
        explicit ConsoleStatus(std::ostream &out, bool rewrite = false);

        service::NotifyResult notify(const std::string &text) override;

        const std::string &last() const noexcept { return last_; }

    private:
        std::ostream &out_;
        bool rewrite_;
        std::string last_;
        std::size_t last_lines_{0};
    };

    // Feeds a local file into the staging path from a background thread.
    class LocalFileSource : public service::IncomingTransfer
    {
    public:
        static constexpr std::size_t kBlockSize = 1024 * 1024;

        explicit LocalFileSource(std::filesystem::path source);
        ~LocalFileSource() override;

        LocalFileSource(const LocalFileSource &) = delete;
        LocalFileSource &operator=(const LocalFileSource &) = delete;

        void receive(const std::filesystem::path &destination, service::ProgressSink progress,
                     service::StatusHandler done) override;

    private:
        std::filesystem::path source_;
        std::thread worker_;
    };

    // Copies the delivered file to `destination`; never overwrites.
    class LocalFileDelivery : public service::OutgoingDelivery
    {
    public:
        explicit LocalFileDelivery(std::filesystem::path destination);

        void deliver(const std::filesystem::path &file, const std::string &caption,
                     service::StatusHandler done) override;

        const std::filesystem::path &destination() const noexcept { return destination_; }

    private:
        std::filesystem::path destination_;
    };

} // namespace filevault::cli
