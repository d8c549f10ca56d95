#include "filevault/service/lifecycle.hpp"

#include <asio/execution/outstanding_work.hpp>
#include <asio/post.hpp>
#include <asio/prefer.hpp>
#include <asio/steady_timer.hpp>

#include <algorithm>
#include <exception>
#include <optional>
#include <system_error>

#include <spdlog/spdlog.h>

#include "filevault/format.hpp"
#include "filevault/service/progress_relay.hpp"
#include "filevault/service/progress_throttler.hpp"

namespace filevault::service
{
    namespace
    {

        void remove_staging(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove staging file {}: {}", path.string(), ec.message());
            }
        }

        template <typename Handler, typename Value>
        void post_result(const asio::any_io_executor &executor, Handler handler, Value value)
        {
            asio::post(executor, [handler = std::move(handler), value = std::move(value)]() mutable
                       {
                           if (handler)
                           {
                               handler(std::move(value));
                           } });
        }

        ProgressThrottler::Observer display_observer(StatusDisplay *display, std::string action)
        {
            return [display, action = std::move(action)](const ProgressUpdate &update)
            {
                return display->notify(format_progress(action, update));
            };
        }

        void show(StatusDisplay *display, const std::string &text)
        {
            if (display == nullptr)
            {
                return;
            }
            try
            {
                display->notify(text);
            }
            catch (const std::exception &ex)
            {
                spdlog::debug("Status update failed: {}", ex.what());
            }
        }

        // Runs `next` once the phase's last held-back progress sample has been
        // shown, waiting out a rate-limit pause on the scheduler if needed.
        template <typename Job, typename Next>
        void settle_progress(const asio::any_io_executor &executor, const std::shared_ptr<Job> &job, Next next)
        {
            if (!job->throttler || !job->throttler->has_pending())
            {
                next();
                return;
            }
            const auto now = ProgressThrottler::Clock::now();
            const auto resume_at = job->throttler->resume_at();
            if (!resume_at || *resume_at <= now)
            {
                job->throttler->flush(now);
                next();
                return;
            }

            auto timer = std::make_shared<asio::steady_timer>(executor, *resume_at);
            timer->async_wait([timer, job, next = std::move(next)](const std::error_code &ec) mutable
                              {
                                  if (!ec && !job->throttler->flush())
                                  {
                                      spdlog::debug("Final progress update was not delivered");
                                  }
                                  next(); });
        }

        // Backend reachability problems keep their own category; anything else
        // during a transfer is reported as TransferFailed.
        ErrorCode transfer_failure(ErrorCode code) noexcept
        {
            switch (code)
            {
            case ErrorCode::ConfigurationMissing:
            case ErrorCode::BackendUnavailable:
                return code;
            default:
                return ErrorCode::TransferFailed;
            }
        }

    } // namespace

    struct LifecycleCoordinator::IngestJob
    {
        std::string id;
        std::string name;
        std::string mime_type;
        std::string origin_ref;
        std::string storage_key;
        std::filesystem::path staging_path;
        std::uint64_t size_bytes{};
        StatusDisplay *display{nullptr};
        RecordHandler done;
        std::optional<ProgressThrottler> throttler;

        void finish(Result<FileRecord> result)
        {
            auto handler = std::move(done);
            done = nullptr;
            if (handler)
            {
                handler(std::move(result));
            }
        }
    };

    struct LifecycleCoordinator::RetrieveJob
    {
        FileRecord record;
        std::filesystem::path staging_path;
        OutgoingDelivery *delivery{nullptr};
        StatusDisplay *display{nullptr};
        PathHandler done;
        std::optional<ProgressThrottler> throttler;

        void finish(Result<std::filesystem::path> result)
        {
            auto handler = std::move(done);
            done = nullptr;
            if (handler)
            {
                handler(std::move(result));
            }
        }
    };

    LifecycleCoordinator::LifecycleCoordinator(asio::any_io_executor scheduler, MetadataStore &store,
                                               TransferEngine &engine, Options options)
        : scheduler_(std::move(scheduler)), store_(store), engine_(engine), options_(std::move(options))
    {
        if (options_.staging_dir.empty())
        {
            options_.staging_dir = std::filesystem::temp_directory_path() / "filevault-staging";
        }
        std::filesystem::create_directories(options_.staging_dir);
    }

    void LifecycleCoordinator::ingest(IngestRequest request, IncomingTransfer &source, StatusDisplay *display,
                                      RecordHandler done)
    {
        if (request.size_bytes > options_.max_file_size)
        {
            spdlog::warn("Rejected '{}': {} exceeds the {} limit", request.name, format_size(request.size_bytes),
                         format_size(options_.max_file_size));
            post_result(scheduler_, std::move(done),
                        Result<FileRecord>::failure(ErrorCode::SizeExceeded,
                                                    "File too large! Maximum size: " +
                                                        format_size(options_.max_file_size)));
            return;
        }

        auto job = std::make_shared<IngestJob>();
        job->mime_type = !request.mime_type.empty() ? std::move(request.mime_type)
                         : !request.name.empty()    ? guess_mime_type(request.name)
                                                    : std::string{"application/octet-stream"};
        job->name = !request.name.empty()
                        ? std::move(request.name)
                        : default_name_for(content_kind_from_mime(job->mime_type), std::chrono::system_clock::now());
        job->origin_ref = std::move(request.origin_ref);
        job->size_bytes = request.size_bytes;
        job->display = display;
        job->done = std::move(done);

        auto id = ids_.generate(job->name, job->size_bytes, [this](const std::string &candidate)
                                { return store_.contains(candidate); });
        if (!id.ok())
        {
            spdlog::error("Could not assign an id to '{}': {}", job->name, id.status.message);
            post_result(scheduler_, std::move(job->done), Result<FileRecord>::failure(id.status));
            return;
        }
        job->id = std::move(*id.value);
        job->storage_key = make_storage_key(job->id, job->name);
        job->staging_path = options_.staging_dir / ("temp_" + job->id + "_" + sanitize_name(job->name));

        ProgressSink progress;
        std::shared_ptr<ProgressRelay> relay;
        if (display != nullptr)
        {
            job->throttler.emplace(display_observer(display, "Receiving file..."), options_.progress_step_percent);
            relay = ProgressRelay::create(scheduler_, [job](std::uint64_t bytes, std::uint64_t total)
                                          { job->throttler->sample(bytes, total); });
            progress = [relay](std::uint64_t bytes, std::uint64_t total)
            { relay->publish(bytes, total); };
        }

        spdlog::info("Receiving '{}' ({}) as {}", job->name, format_size(job->size_bytes), job->id);
        auto tracked = asio::prefer(scheduler_, asio::execution::outstanding_work.tracked);
        try
        {
            source.receive(job->staging_path, std::move(progress),
                           [this, tracked, relay, job](Status status)
                           {
                               asio::post(tracked, [this, relay, job, status = std::move(status)]() mutable
                                          {
                                              if (relay)
                                              {
                                                  if (status.ok())
                                                  {
                                                      relay->flush();
                                                  }
                                                  relay->close();
                                              }
                                              on_received(job, std::move(status)); });
                           });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Receiving '{}' failed to start: {}", job->name, ex.what());
            if (relay)
            {
                relay->close();
            }
            remove_staging(job->staging_path);
            post_result(scheduler_, std::move(job->done),
                        Result<FileRecord>::failure(ErrorCode::TransferFailed, ex.what()));
        }
    }

    void LifecycleCoordinator::on_received(const std::shared_ptr<IngestJob> &job, Status status)
    {
        if (!status.ok())
        {
            spdlog::error("Receiving '{}' failed: {}", job->name, status.message);
            remove_staging(job->staging_path);
            job->finish(Result<FileRecord>::failure(ErrorCode::TransferFailed, std::move(status.message)));
            return;
        }

        std::error_code ec;
        const auto actual_size = std::filesystem::file_size(job->staging_path, ec);
        if (ec)
        {
            spdlog::error("Staged file {} is unreadable: {}", job->staging_path.string(), ec.message());
            remove_staging(job->staging_path);
            job->finish(Result<FileRecord>::failure(ErrorCode::TransferFailed, ec.message()));
            return;
        }
        if (actual_size > options_.max_file_size)
        {
            remove_staging(job->staging_path);
            job->finish(Result<FileRecord>::failure(ErrorCode::SizeExceeded,
                                                    "File too large! Maximum size: " +
                                                        format_size(options_.max_file_size)));
            return;
        }
        job->size_bytes = actual_size;

        settle_progress(scheduler_, job, [this, job]()
                        { start_upload(job); });
    }

    void LifecycleCoordinator::start_upload(const std::shared_ptr<IngestJob> &job)
    {
        ProgressSink progress;
        if (job->display != nullptr)
        {
            job->throttler.emplace(display_observer(job->display, "Uploading to cloud storage..."),
                                   options_.progress_step_percent);
            progress = [job](std::uint64_t bytes, std::uint64_t total)
            { job->throttler->sample(bytes, total); };
        }

        engine_.upload(job->staging_path, job->storage_key, std::move(progress),
                       [this, job](Status uploaded)
                       { on_uploaded(job, std::move(uploaded)); });
    }

    void LifecycleCoordinator::on_uploaded(const std::shared_ptr<IngestJob> &job, Status status)
    {
        remove_staging(job->staging_path);

        if (!status.ok())
        {
            job->finish(Result<FileRecord>::failure(transfer_failure(status.code), std::move(status.message)));
            return;
        }

        settle_progress(scheduler_, job, [this, job]()
                        { record_upload(job); });
    }

    void LifecycleCoordinator::record_upload(const std::shared_ptr<IngestJob> &job)
    {
        FileRecord record{
            .id = job->id,
            .name = job->name,
            .size_bytes = job->size_bytes,
            .mime_type = job->mime_type,
            .storage_key = job->storage_key,
            .created_at = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())),
            .origin_ref = job->origin_ref,
        };

        auto persisted = store_.put(record);
        if (!persisted.ok())
        {
            // The object stays in the bucket and the record stays in memory.
            spdlog::error("Uploaded {} but could not persist its record: {}", record.storage_key, persisted.message);
            job->finish(Result<FileRecord>::failure(std::move(persisted)));
            return;
        }

        spdlog::info("Stored '{}' ({}) as {}", record.name, format_size(record.size_bytes), record.id);
        job->finish(Result<FileRecord>::success(std::move(record)));
    }

    void LifecycleCoordinator::retrieve(const std::string &id, OutgoingDelivery &delivery, StatusDisplay *display,
                                        PathHandler done)
    {
        auto record = store_.get(id);
        if (!record)
        {
            post_result(scheduler_, std::move(done),
                        Result<std::filesystem::path>::failure(ErrorCode::NotFound, "No file with ID " + id));
            return;
        }

        auto job = std::make_shared<RetrieveJob>();
        job->staging_path = options_.staging_dir / ("dl_" + record->id + "_" + sanitize_name(record->name));
        job->record = std::move(*record);
        job->delivery = &delivery;
        job->display = display;
        job->done = std::move(done);

        ProgressSink progress;
        if (display != nullptr)
        {
            job->throttler.emplace(display_observer(display, "Downloading from cloud storage..."),
                                   options_.progress_step_percent);
            progress = [job](std::uint64_t bytes, std::uint64_t total)
            { job->throttler->sample(bytes, total); };
        }

        engine_.download(job->record.storage_key, job->staging_path, std::move(progress),
                         [this, job](Status status)
                         { on_downloaded(job, std::move(status)); });
    }

    void LifecycleCoordinator::on_downloaded(const std::shared_ptr<RetrieveJob> &job, Status status)
    {
        if (!status.ok())
        {
            remove_staging(job->staging_path);
            job->finish(
                Result<std::filesystem::path>::failure(transfer_failure(status.code), std::move(status.message)));
            return;
        }

        settle_progress(scheduler_, job, [this, job]()
                        { deliver_download(job); });
    }

    void LifecycleCoordinator::deliver_download(const std::shared_ptr<RetrieveJob> &job)
    {
        show(job->display, "Sending file...");
        const auto caption = job->record.name + "\nFile ID: " + job->record.id;
        auto tracked = asio::prefer(scheduler_, asio::execution::outstanding_work.tracked);
        try
        {
            job->delivery->deliver(job->staging_path, caption, [tracked, job](Status delivered)
                                   {
                                       asio::post(tracked, [job, delivered = std::move(delivered)]() mutable
                                                  {
                                                      remove_staging(job->staging_path);
                                                      if (!delivered.ok())
                                                      {
                                                          spdlog::error("Delivering {} failed: {}", job->record.id,
                                                                        delivered.message);
                                                          job->finish(Result<std::filesystem::path>::failure(
                                                              ErrorCode::TransferFailed, std::move(delivered.message)));
                                                          return;
                                                      }
                                                      spdlog::info("Delivered '{}' ({})", job->record.name,
                                                                   job->record.id);
                                                      job->finish(Result<std::filesystem::path>::success(
                                                          job->staging_path)); }); });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Delivering {} failed to start: {}", job->record.id, ex.what());
            remove_staging(job->staging_path);
            job->finish(Result<std::filesystem::path>::failure(ErrorCode::TransferFailed, ex.what()));
        }
    }

    Result<StreamLink> LifecycleCoordinator::streaming_link(const std::string &id, std::chrono::seconds ttl) const
    {
        auto record = store_.get(id);
        if (!record)
        {
            return Result<StreamLink>::failure(ErrorCode::NotFound, "No file with ID " + id);
        }

        auto url = engine_.issue_presigned_url(record->storage_key, ttl);
        if (!url)
        {
            return Result<StreamLink>::failure(ErrorCode::LinkGenerationFailed,
                                               engine_.configured() ? "Signing failed for " + record->storage_key
                                                                    : std::string{"Object storage is not configured"});
        }

        return Result<StreamLink>::success(StreamLink{
            .id = record->id,
            .url = std::move(*url),
            .name = record->name,
            .size_bytes = record->size_bytes,
            .kind = record->kind(),
            .created_at = record->created_at,
            .ttl = std::min(ttl, LinkIssuer::kMaxTtl),
        });
    }

    void LifecycleCoordinator::remove(const std::string &id, StatusHandler done)
    {
        auto record = store_.get(id);
        if (!record)
        {
            post_result(scheduler_, std::move(done), Status::failure(ErrorCode::NotFound, "No file with ID " + id));
            return;
        }

        engine_.remove(record->storage_key, [this, id, done = std::move(done)](Status status)
                       {
                           if (!status.ok())
                           {
                               const auto code = status.code == ErrorCode::ConfigurationMissing
                                                     ? status.code
                                                     : ErrorCode::BackendDeleteFailed;
                               if (done)
                               {
                                   done(Status::failure(code, std::move(status.message)));
                               }
                               return;
                           }

                           auto removed = store_.remove(id);
                           if (!removed.status.ok())
                           {
                               spdlog::error("Deleted object for {} but could not persist removal: {}", id,
                                             removed.status.message);
                           }
                           else
                           {
                               spdlog::info("Deleted {}", id);
                           }
                           if (done)
                           {
                               done(std::move(removed.status));
                           } });
    }

    std::optional<FileRecord> LifecycleCoordinator::find(const std::string &id) const
    {
        return store_.get(id);
    }

    std::vector<FileRecord> LifecycleCoordinator::list() const
    {
        return store_.list();
    }

    void LifecycleCoordinator::check_backend(StatusHandler done)
    {
        engine_.test_connection(std::move(done));
    }

} // namespace filevault::service
