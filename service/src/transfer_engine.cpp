#include "filevault/service/transfer_engine.hpp"

#include <asio/execution/outstanding_work.hpp>
#include <asio/post.hpp>
#include <asio/prefer.hpp>

#include <exception>
#include <memory>

#include <spdlog/spdlog.h>

#include "filevault/service/progress_relay.hpp"

namespace filevault::service
{

    TransferEngine::TransferEngine(asio::any_io_executor scheduler, ObjectStorage &storage, std::size_t worker_threads)
        : scheduler_(std::move(scheduler)),
          storage_(storage),
          links_(storage),
          pool_(worker_threads == 0 ? kDefaultWorkers : worker_threads)
    {
    }

    TransferEngine::~TransferEngine()
    {
        pool_.join();
    }

    void TransferEngine::upload(std::filesystem::path local_path, std::string storage_key, ProgressSink on_progress,
                                StatusHandler done)
    {
        auto key = storage_key;
        dispatch("Upload", std::move(storage_key), ErrorCode::TransferFailed, std::move(on_progress),
                 [this, local_path = std::move(local_path), key = std::move(key)](const ByteProgress &progress)
                 {
                     std::error_code ec;
                     if (!std::filesystem::is_regular_file(local_path, ec))
                     {
                         return Status::failure(ErrorCode::TransferFailed,
                                                "Local file missing: " + local_path.string());
                     }
                     return storage_.upload_file(local_path, key, progress);
                 },
                 std::move(done));
    }

    void TransferEngine::download(std::string storage_key, std::filesystem::path local_path, ProgressSink on_progress,
                                  StatusHandler done)
    {
        auto key = storage_key;
        dispatch("Download", std::move(storage_key), ErrorCode::TransferFailed, std::move(on_progress),
                 [this, local_path = std::move(local_path), key = std::move(key)](const ByteProgress &progress)
                 {
                     const auto parent = local_path.parent_path();
                     if (!parent.empty())
                     {
                         std::filesystem::create_directories(parent);
                     }
                     return storage_.download_file(key, local_path, progress);
                 },
                 std::move(done));
    }

    void TransferEngine::remove(std::string storage_key, StatusHandler done)
    {
        auto key = storage_key;
        dispatch("Delete", std::move(storage_key), ErrorCode::BackendDeleteFailed, {},
                 [this, key = std::move(key)](const ByteProgress &)
                 { return storage_.delete_object(key); },
                 std::move(done));
    }

    void TransferEngine::test_connection(StatusHandler done)
    {
        dispatch("Connection test", "<bucket>", ErrorCode::BackendUnavailable, {},
                 [this](const ByteProgress &)
                 { return storage_.probe(); },
                 std::move(done));
    }

    std::optional<std::string> TransferEngine::issue_presigned_url(const std::string &storage_key,
                                                                   std::chrono::seconds ttl) const
    {
        return links_.issue(storage_key, ttl);
    }

    void TransferEngine::dispatch(std::string operation, std::string storage_key, ErrorCode failure_code,
                                  ProgressSink on_progress, Work work, StatusHandler done)
    {
        auto tracked = asio::prefer(scheduler_, asio::execution::outstanding_work.tracked);

        if (!storage_.configured())
        {
            spdlog::warn("{} of {} skipped: object storage is not configured", operation, storage_key);
            asio::post(tracked, [done = std::move(done)]()
                       {
                           if (done)
                           {
                               done(Status::failure(ErrorCode::ConfigurationMissing,
                                                    "Object storage is not configured"));
                           } });
            return;
        }

        std::shared_ptr<ProgressRelay> relay;
        if (on_progress)
        {
            relay = ProgressRelay::create(scheduler_, std::move(on_progress));
        }

        spdlog::debug("{} queued: {}", operation, storage_key);
        asio::post(pool_, [tracked, relay, operation = std::move(operation), storage_key = std::move(storage_key),
                           failure_code, work = std::move(work), done = std::move(done)]() mutable
                   {
                       ByteProgress progress;
                       if (relay)
                       {
                           progress = [relay](std::uint64_t bytes, std::uint64_t total)
                           { relay->publish(bytes, total); };
                       }

                       Status status;
                       try
                       {
                           status = work(progress);
                       }
                       catch (const std::exception &ex)
                       {
                           status = Status::failure(failure_code, ex.what());
                       }

                       if (status.ok())
                       {
                           spdlog::info("{} succeeded: {}", operation, storage_key);
                       }
                       else
                       {
                           spdlog::error("{} failed for {}: [{}] {}", operation, storage_key, to_string(status.code),
                                         status.message);
                       }

                       asio::post(tracked, [relay, status = std::move(status), done = std::move(done)]() mutable
                                  {
                                      if (relay)
                                      {
                                          if (status.ok())
                                          {
                                              relay->flush();
                                          }
                                          relay->close();
                                      }
                                      if (done)
                                      {
                                          done(std::move(status));
                                      } }); });
    }

} // namespace filevault::service
