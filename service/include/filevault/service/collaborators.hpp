/**
 * FileVault - Capabilities the coordinator consumes from its front end.
 *
 * Implementations may invoke `progress` and `done` from any thread; the
 * coordinator marshals both back onto its scheduler. `done` must be called
 * exactly once. The collaborator must outlive the operation it serves.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "filevault/result.hpp"
#include "filevault/service/progress_throttler.hpp"

namespace filevault::service
{

    using ProgressSink = std::function<void(std::uint64_t bytes, std::uint64_t total)>;
    using StatusHandler = std::function<void(Status)>;

    // Delivers inbound bytes (e.g. from a chat upload) into a local file.
    class IncomingTransfer
    {
    public:
        virtual ~IncomingTransfer() = default;

        virtual void receive(const std::filesystem::path &destination, ProgressSink progress, StatusHandler done) = 0;
    };

    // Hands a finished local file back to the requester.
    class OutgoingDelivery
    {
    public:
        virtual ~OutgoingDelivery() = default;

        virtual void deliver(const std::filesystem::path &file, const std::string &caption, StatusHandler done) = 0;
    };

    // User-visible status element. Only called on the scheduler thread.
    class StatusDisplay
    {
    public:
        virtual ~StatusDisplay() = default;

        virtual NotifyResult notify(const std::string &text) = 0;
    };

} // namespace filevault::service
