#pragma once

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "filevault/file_record.hpp"
#include "filevault/identifier.hpp"
#include "filevault/result.hpp"
#include "filevault/service/collaborators.hpp"
#include "filevault/service/link_issuer.hpp"
#include "filevault/service/metadata_store.hpp"
#include "filevault/service/transfer_engine.hpp"

namespace filevault::service
{

    struct IngestRequest
    {
        // Empty: a name is derived from the content kind and the current time.
        std::string name;
        std::uint64_t size_bytes{};
        // Empty: guessed from the name.
        std::string mime_type;
        std::string origin_ref;
    };

    struct StreamLink
    {
        std::string id;
        std::string url;
        std::string name;
        std::uint64_t size_bytes{};
        ContentKind kind{ContentKind::Other};
        std::chrono::system_clock::time_point created_at{};
        std::chrono::seconds ttl{};
    };

    // Drives every file operation end to end: staging, transfer, metadata and
    // cleanup of temporary files on every exit path. All handlers run on the
    // scheduler executor, and each operation calls its handler exactly once.
    // The store, the engine and the collaborators must outlive the operations.
    class LifecycleCoordinator
    {
    public:
        struct Options
        {
            std::filesystem::path staging_dir;
            std::uint64_t max_file_size{4294967296ULL};
            double progress_step_percent{5.0};
        };

        using RecordHandler = std::function<void(Result<FileRecord>)>;
        using PathHandler = std::function<void(Result<std::filesystem::path>)>;

        // Creates the staging directory; throws std::filesystem::filesystem_error if that fails.
        LifecycleCoordinator(asio::any_io_executor scheduler, MetadataStore &store, TransferEngine &engine,
                             Options options);

        // Size check, id, receive into staging, upload, record. SizeExceeded is
        // reported before the source is asked for any bytes.
        void ingest(IngestRequest request, IncomingTransfer &source, StatusDisplay *display, RecordHandler done);

        // Downloads into staging and hands the file to `delivery`. The staged
        // file is removed before `done` runs; the path is informational.
        void retrieve(const std::string &id, OutgoingDelivery &delivery, StatusDisplay *display, PathHandler done);

        Result<StreamLink> streaming_link(const std::string &id,
                                          std::chrono::seconds ttl = LinkIssuer::kDefaultTtl) const;

        // The record is dropped only after the backend delete succeeded.
        void remove(const std::string &id, StatusHandler done);

        std::optional<FileRecord> find(const std::string &id) const;

        std::vector<FileRecord> list() const;

        void check_backend(StatusHandler done);

        const Options &options() const noexcept { return options_; }

    private:
        struct IngestJob;
        struct RetrieveJob;

        void on_received(const std::shared_ptr<IngestJob> &job, Status status);
        void start_upload(const std::shared_ptr<IngestJob> &job);
        void on_uploaded(const std::shared_ptr<IngestJob> &job, Status status);
        void record_upload(const std::shared_ptr<IngestJob> &job);
        void on_downloaded(const std::shared_ptr<RetrieveJob> &job, Status status);
        void deliver_download(const std::shared_ptr<RetrieveJob> &job);

        asio::any_io_executor scheduler_;
        MetadataStore &store_;
        TransferEngine &engine_;
        Options options_;
        IdentifierGenerator ids_;
    };

} // namespace filevault::service
