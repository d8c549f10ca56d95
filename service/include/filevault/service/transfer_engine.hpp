#pragma once

#include <asio/any_io_executor.hpp>
#include <asio/thread_pool.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "filevault/result.hpp"
#include "filevault/service/collaborators.hpp"
#include "filevault/service/link_issuer.hpp"
#include "filevault/service/object_storage.hpp"

namespace filevault::service
{

    // Runs the blocking ObjectStorage calls on a fixed worker pool and reports
    // back on the scheduler executor. Progress is relayed through a
    // ProgressRelay, so `on_progress` and `done` both run on the scheduler, and
    // every progress callback of an operation precedes its `done`.
    //
    // The scheduler's execution context must outlive the engine.
    class TransferEngine
    {
    public:
        static constexpr std::size_t kDefaultWorkers = 4;

        TransferEngine(asio::any_io_executor scheduler, ObjectStorage &storage,
                       std::size_t worker_threads = kDefaultWorkers);
        ~TransferEngine();

        TransferEngine(const TransferEngine &) = delete;
        TransferEngine &operator=(const TransferEngine &) = delete;

        void upload(std::filesystem::path local_path, std::string storage_key, ProgressSink on_progress,
                    StatusHandler done);

        void download(std::string storage_key, std::filesystem::path local_path, ProgressSink on_progress,
                      StatusHandler done);

        void remove(std::string storage_key, StatusHandler done);

        void test_connection(StatusHandler done);

        std::optional<std::string> issue_presigned_url(const std::string &storage_key,
                                                       std::chrono::seconds ttl = LinkIssuer::kDefaultTtl) const;

        bool configured() const noexcept { return storage_.configured(); }

    private:
        using Work = std::function<Status(const ByteProgress &)>;

        void dispatch(std::string operation, std::string storage_key, ErrorCode failure_code,
                      ProgressSink on_progress, Work work, StatusHandler done);

        asio::any_io_executor scheduler_;
        ObjectStorage &storage_;
        LinkIssuer links_;
        asio::thread_pool pool_;
    };

} // namespace filevault::service
