#pragma once

#include <asio/any_io_executor.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace filevault::service
{

    // Single-slot channel carrying byte counts from worker threads to the
    // scheduler. publish() keeps only the furthest sample and queues at most
    // one drain at a time, so a chatty backend cannot flood the scheduler.
    // flush() and close() must be called on the scheduler.
    class ProgressRelay : public std::enable_shared_from_this<ProgressRelay>
    {
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        using Sink = std::function<void(std::uint64_t bytes, std::uint64_t total)>;

        static std::shared_ptr<ProgressRelay> create(asio::any_io_executor scheduler, Sink sink);

        // Only reachable through create().
        ProgressRelay(Passkey, asio::any_io_executor scheduler, Sink sink);

        void publish(std::uint64_t bytes, std::uint64_t total);

        void flush();

        void close();

    private:
        struct Sample
        {
            std::uint64_t bytes{};
            std::uint64_t total{};
        };

        void drain();
        std::optional<Sample> take_locked();

        asio::any_io_executor scheduler_;
        Sink sink_;

        std::mutex mutex_;
        std::optional<Sample> latest_;
        bool drain_pending_{false};
        bool closed_{false};
    };

} // namespace filevault::service
