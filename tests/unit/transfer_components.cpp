#include <asio/io_context.hpp>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "filevault/service/lifecycle.hpp"
#include "filevault/service/metadata_store.hpp"
#include "filevault/service/progress_relay.hpp"
#include "filevault/service/transfer_engine.hpp"
#include "test_storage.hpp"

using namespace filevault;
using namespace filevault::service;

namespace
{

    template <typename T>
    T run_until_done(asio::io_context &io_context, std::optional<T> &slot)
    {
        io_context.restart();
        io_context.run();
        assert(slot.has_value());
        return std::move(*slot);
    }

    // Collects relayed progress and checks it arrives on the scheduler thread,
    // in order, and never after completion.
    struct ProgressProbe
    {
        std::thread::id scheduler{std::this_thread::get_id()};
        std::vector<std::uint64_t> bytes;
        std::uint64_t total{};
        bool completed{false};

        ProgressSink sink()
        {
            return [this](std::uint64_t transferred, std::uint64_t of)
            {
                assert(std::this_thread::get_id() == scheduler);
                assert(!completed);
                assert(bytes.empty() || transferred >= bytes.back());
                bytes.push_back(transferred);
                total = of;
            };
        }
    };

    class ThreadedSource : public IncomingTransfer
    {
    public:
        explicit ThreadedSource(std::uint64_t size, bool fail = false) : size_(size), fail_(fail) {}

        ~ThreadedSource() override
        {
            if (worker_.joinable())
            {
                worker_.join();
            }
        }

        void receive(const std::filesystem::path &destination, ProgressSink progress, StatusHandler done) override
        {
            ++calls;
            worker_ = std::thread([this, destination, progress = std::move(progress), done = std::move(done)]()
                                  {
                worker_id = std::this_thread::get_id();
                std::ofstream out(destination, std::ios::binary | std::ios::trunc);
                std::vector<char> block(1024 * 1024, 'x');
                std::uint64_t written = 0;
                while (written < size_)
                {
                    const auto count = std::min<std::uint64_t>(block.size(), size_ - written);
                    out.write(block.data(), static_cast<std::streamsize>(count));
                    written += count;
                    if (progress)
                    {
                        progress(written, size_);
                    }
                    if (fail_)
                    {
                        done(Status::failure(ErrorCode::TransferFailed, "peer closed the connection"));
                        return;
                    }
                }
                out.close();
                done(Status::success()); });
        }

        int calls{0};
        std::thread::id worker_id;

    private:
        std::uint64_t size_;
        bool fail_;
        std::thread worker_;
    };

    class RecordingDisplay : public StatusDisplay
    {
    public:
        NotifyResult notify(const std::string &text) override
        {
            assert(std::this_thread::get_id() == scheduler);
            texts.push_back(text);
            return NotifyResult::delivered();
        }

        bool saw(const std::string &fragment) const
        {
            for (const auto &text : texts)
            {
                if (text.find(fragment) != std::string::npos)
                {
                    return true;
                }
            }
            return false;
        }

        std::thread::id scheduler{std::this_thread::get_id()};
        std::vector<std::string> texts;
    };

    // Asks for a pause on the first upload update, then accepts everything.
    class ThrottledDisplay : public StatusDisplay
    {
    public:
        NotifyResult notify(const std::string &text) override
        {
            if (!paused && text.find("Uploading to cloud storage...") != std::string::npos)
            {
                paused = true;
                return NotifyResult::rate_limited(std::chrono::seconds(1));
            }
            texts.push_back(text);
            return NotifyResult::delivered();
        }

        bool paused{false};
        std::vector<std::string> texts;
    };

    class CapturingDelivery : public OutgoingDelivery
    {
    public:
        void deliver(const std::filesystem::path &file, const std::string &text, StatusHandler done) override
        {
            ++calls;
            caption = text;
            delivered_size = std::filesystem::file_size(file);
            done(fail ? Status::failure(ErrorCode::TransferFailed, "chat not found") : Status::success());
        }

        int calls{0};
        bool fail{false};
        std::string caption;
        std::uint64_t delivered_size{};
    };

    // One coordinator over a directory-backed bucket, rebuilt per test.
    struct Harness
    {
        explicit Harness(const std::string &name, bool configured = true,
                         std::uint64_t max_file_size = 4294967296ULL)
            : root(make_test_dir(name)),
              storage(root / "bucket", configured),
              store(root / "files_database.json"),
              engine(io_context.get_executor(), storage),
              coordinator(io_context.get_executor(), store, engine,
                          {.staging_dir = root / "staging", .max_file_size = max_file_size})
        {
            store.load();
        }

        ~Harness() { cleanup_path(root); }

        bool staging_empty() const { return std::filesystem::is_empty(root / "staging"); }

        Result<FileRecord> ingest(IngestRequest request, IncomingTransfer &source, StatusDisplay *display = nullptr)
        {
            std::optional<Result<FileRecord>> outcome;
            int calls = 0;
            coordinator.ingest(std::move(request), source, display, [&](Result<FileRecord> result)
                               {
                                   ++calls;
                                   outcome = std::move(result); });
            auto result = run_until_done(io_context, outcome);
            assert(calls == 1);
            return result;
        }

        Status remove(const std::string &id)
        {
            std::optional<Status> outcome;
            coordinator.remove(id, [&outcome](Status status)
                               { outcome = std::move(status); });
            return run_until_done(io_context, outcome);
        }

        std::filesystem::path root;
        asio::io_context io_context;
        DirectoryStorage storage;
        MetadataStore store;
        TransferEngine engine;
        LifecycleCoordinator coordinator;
    };

    void test_relay_coalesces_samples()
    {
        asio::io_context io_context;
        std::vector<std::uint64_t> seen;
        auto relay = ProgressRelay::create(io_context.get_executor(), [&seen](std::uint64_t bytes, std::uint64_t)
                                           { seen.push_back(bytes); });
        relay->publish(1, 10);
        relay->publish(5, 10);
        relay->publish(3, 10);
        io_context.run();
        assert(seen.size() == 1);
        assert(seen.front() == 5);
        assert(relay.use_count() == 1);

        relay->publish(7, 10);
        relay->close();
        relay->publish(9, 10);
        io_context.restart();
        io_context.run();
        relay->flush();
        assert(seen.size() == 1);
    }

    void test_engine_upload_reports_on_scheduler()
    {
        const auto dir = make_test_dir("filevault_engine_upload");
        asio::io_context io_context;
        DirectoryStorage storage(dir / "bucket");
        TransferEngine engine(io_context.get_executor(), storage);

        const auto local = dir / "payload.bin";
        const std::uint64_t size = 1024 * 1024 + 123;
        write_pattern_file(local, size);

        ProgressProbe probe;
        std::optional<Status> outcome;
        engine.upload(local, "files/aaaaaaaaaaaa/payload.bin", probe.sink(), [&](Status status)
                      {
                          assert(std::this_thread::get_id() == probe.scheduler);
                          probe.completed = true;
                          outcome = std::move(status); });
        const auto status = run_until_done(io_context, outcome);

        assert(status.ok());
        assert(storage.uploads == 1);
        assert(storage.last_worker() != std::this_thread::get_id());
        assert(storage.has_object("files/aaaaaaaaaaaa/payload.bin"));
        assert(std::filesystem::file_size(storage.object_path("files/aaaaaaaaaaaa/payload.bin")) == size);
        assert(!probe.bytes.empty());
        assert(probe.bytes.back() == size);
        assert(probe.total == size);

        cleanup_path(dir);
    }

    void test_engine_upload_failure()
    {
        const auto dir = make_test_dir("filevault_engine_upload_fail");
        asio::io_context io_context;
        DirectoryStorage storage(dir / "bucket");
        storage.fail_upload_after = 256 * 1024;
        TransferEngine engine(io_context.get_executor(), storage);

        const auto local = dir / "payload.bin";
        write_pattern_file(local, 1024 * 1024);

        std::optional<Status> outcome;
        engine.upload(local, "files/bbbbbbbbbbbb/payload.bin", {}, [&outcome](Status status)
                      { outcome = std::move(status); });
        const auto status = run_until_done(io_context, outcome);
        assert(status.code == ErrorCode::TransferFailed);
        assert(status.message.find("connection reset") != std::string::npos);
        assert(!storage.has_object("files/bbbbbbbbbbbb/payload.bin"));

        std::optional<Status> missing;
        engine.upload(dir / "nope.bin", "files/cccccccccccc/nope.bin", {}, [&missing](Status status)
                      { missing = std::move(status); });
        assert(run_until_done(io_context, missing).code == ErrorCode::TransferFailed);

        cleanup_path(dir);
    }

    void test_engine_download_and_delete()
    {
        const auto dir = make_test_dir("filevault_engine_download");
        asio::io_context io_context;
        DirectoryStorage storage(dir / "bucket");
        TransferEngine engine(io_context.get_executor(), storage);

        const std::string key = "files/dddddddddddd/movie.mp4";
        std::filesystem::create_directories(storage.object_path(key).parent_path());
        write_pattern_file(storage.object_path(key), 300 * 1024);

        ProgressProbe probe;
        std::optional<Status> downloaded;
        const auto target = dir / "nested" / "out" / "movie.mp4";
        engine.download(key, target, probe.sink(), [&](Status status)
                        {
                            probe.completed = true;
                            downloaded = std::move(status); });
        assert(run_until_done(io_context, downloaded).ok());
        assert(std::filesystem::file_size(target) == 300 * 1024);
        assert(probe.bytes.back() == 300 * 1024);

        std::optional<Status> missing;
        engine.download("files/none/none.bin", dir / "none.bin", {}, [&missing](Status status)
                        { missing = std::move(status); });
        assert(run_until_done(io_context, missing).code == ErrorCode::TransferFailed);

        storage.fail_deletes = true;
        std::optional<Status> refused;
        engine.remove(key, [&refused](Status status)
                      { refused = std::move(status); });
        assert(run_until_done(io_context, refused).code == ErrorCode::BackendDeleteFailed);
        assert(storage.has_object(key));

        storage.fail_deletes = false;
        std::optional<Status> deleted;
        engine.remove(key, [&deleted](Status status)
                      { deleted = std::move(status); });
        assert(run_until_done(io_context, deleted).ok());
        assert(!storage.has_object(key));

        cleanup_path(dir);
    }

    void test_engine_probe_and_links()
    {
        const auto dir = make_test_dir("filevault_engine_probe");
        asio::io_context io_context;
        DirectoryStorage storage(dir / "bucket");
        TransferEngine engine(io_context.get_executor(), storage, 2);

        std::optional<Status> reachable;
        engine.test_connection([&reachable](Status status)
                               { reachable = std::move(status); });
        assert(run_until_done(io_context, reachable).ok());

        storage.reachable = false;
        std::optional<Status> unreachable;
        engine.test_connection([&unreachable](Status status)
                               { unreachable = std::move(status); });
        assert(run_until_done(io_context, unreachable).code == ErrorCode::BackendUnavailable);

        const std::string key = "files/eeeeeeeeeeee/song.mp3";
        const auto url = engine.issue_presigned_url(key, std::chrono::seconds(3600));
        assert(url && url->find(key) != std::string::npos);
        assert(url->find("X-Amz-Expires=3600") != std::string::npos);

        const auto clamped = engine.issue_presigned_url(key, std::chrono::hours(24 * 30));
        assert(clamped && clamped->find("X-Amz-Expires=604800") != std::string::npos);

        assert(!engine.issue_presigned_url(key, std::chrono::seconds(0)));
        storage.fail_presign = true;
        assert(!engine.issue_presigned_url(key));

        cleanup_path(dir);
    }

    void test_engine_without_credentials()
    {
        const auto dir = make_test_dir("filevault_engine_unconfigured");
        asio::io_context io_context;
        DirectoryStorage storage(dir / "bucket", false);
        TransferEngine engine(io_context.get_executor(), storage);
        assert(!engine.configured());

        write_pattern_file(dir / "a.bin", 10);
        std::optional<Status> outcome;
        engine.upload(dir / "a.bin", "files/ffffffffffff/a.bin", {}, [&outcome](Status status)
                      { outcome = std::move(status); });
        assert(run_until_done(io_context, outcome).code == ErrorCode::ConfigurationMissing);
        assert(storage.uploads == 0);
        assert(!engine.issue_presigned_url("files/ffffffffffff/a.bin"));

        cleanup_path(dir);
    }

    void test_end_to_end_clip()
    {
        Harness harness("filevault_lifecycle_e2e");
        ThreadedSource source(10485760);
        RecordingDisplay display;

        auto result = harness.ingest({.name = "clip.mp4", .size_bytes = 10485760}, source, &display);
        assert(result.ok());
        const auto id = result.value->id;
        assert(id.size() == 12);
        assert(is_valid_file_id(id));
        assert(source.worker_id != std::this_thread::get_id());

        const auto records = harness.coordinator.list();
        assert(records.size() == 1);
        assert(records.front().size_bytes == 10485760);
        assert(records.front().storage_key == "files/" + id + "/clip.mp4");
        assert(records.front().mime_type == "video/mp4");
        assert(harness.storage.has_object("files/" + id + "/clip.mp4"));
        assert(harness.staging_empty());
        assert(display.saw("Receiving file..."));
        assert(display.saw("Uploading to cloud storage..."));
        assert(display.saw("Progress: 100.0%"));

        auto link = harness.coordinator.streaming_link(id, std::chrono::seconds(3600));
        assert(link.ok());
        assert(link.value->url.find("files/" + id + "/clip.mp4") != std::string::npos);
        assert(link.value->name == "clip.mp4");
        assert(link.value->kind == ContentKind::Video);
        assert(link.value->ttl == std::chrono::seconds(3600));

        assert(harness.remove(id).ok());
        assert(harness.coordinator.list().empty());
        assert(!harness.storage.has_object("files/" + id + "/clip.mp4"));

        MetadataStore reloaded(harness.store.path());
        reloaded.load();
        assert(reloaded.size() == 0);
    }

    void test_ingest_shows_completion_after_rate_limit()
    {
        Harness harness("filevault_lifecycle_rate_limited");
        ThreadedSource source(512 * 1024);
        ThrottledDisplay display;

        auto result = harness.ingest({.name = "voice.ogg", .size_bytes = 512 * 1024}, source, &display);
        assert(result.ok());
        assert(display.paused);
        assert(!display.texts.empty());
        const auto &last = display.texts.back();
        assert(last.find("Uploading to cloud storage...") != std::string::npos);
        assert(last.find("Progress: 100.0%") != std::string::npos);
    }

    void test_ingest_rejects_oversize_before_transfer()
    {
        Harness harness("filevault_lifecycle_oversize", true, 1000);
        ThreadedSource source(2000);

        auto result = harness.ingest({.name = "big.zip", .size_bytes = 2000}, source);
        assert(result.code() == ErrorCode::SizeExceeded);
        assert(source.calls == 0);
        assert(harness.storage.uploads == 0);
        assert(harness.staging_empty());
        assert(harness.coordinator.list().empty());
    }

    void test_ingest_upload_failure_cleans_up()
    {
        Harness harness("filevault_lifecycle_upload_fail");
        harness.storage.fail_upload_after = 128 * 1024;
        ThreadedSource source(1024 * 1024);

        auto result = harness.ingest({.name = "report.pdf", .size_bytes = 1024 * 1024}, source);
        assert(result.code() == ErrorCode::TransferFailed);
        assert(harness.storage.uploads == 1);
        assert(harness.coordinator.list().empty());
        assert(harness.staging_empty());

        MetadataStore reloaded(harness.store.path());
        reloaded.load();
        assert(reloaded.size() == 0);
    }

    void test_ingest_receive_failure_cleans_up()
    {
        Harness harness("filevault_lifecycle_receive_fail");
        ThreadedSource source(4 * 1024 * 1024, true);
        RecordingDisplay display;

        auto result = harness.ingest({.name = "voice.ogg", .size_bytes = 4 * 1024 * 1024}, source, &display);
        assert(result.code() == ErrorCode::TransferFailed);
        assert(harness.storage.uploads == 0);
        assert(harness.staging_empty());
        assert(harness.coordinator.list().empty());
    }

    void test_ingest_default_name_and_persistence_failure()
    {
        Harness harness("filevault_lifecycle_default_name");
        ThreadedSource source(2048);
        auto result = harness.ingest({.size_bytes = 2048, .mime_type = "video/mp4", .origin_ref = "chat-42"}, source);
        assert(result.ok());
        assert(result.value->name.rfind("video_", 0) == 0);
        assert(result.value->name.ends_with(".mp4"));
        assert(result.value->origin_ref == "chat-42");

        // A parent that is a regular file makes every save fail.
        const auto blocker = harness.root / "blocker";
        {
            std::ofstream out(blocker);
            out << "x";
        }
        MetadataStore blocked(blocker / "db.json");
        TransferEngine engine(harness.io_context.get_executor(), harness.storage);
        LifecycleCoordinator coordinator(harness.io_context.get_executor(), blocked, engine,
                                         {.staging_dir = harness.root / "staging"});
        ThreadedSource second(512);
        std::optional<Result<FileRecord>> outcome;
        coordinator.ingest({.name = "notes.txt", .size_bytes = 512}, second, nullptr,
                           [&outcome](Result<FileRecord> record)
                           { outcome = std::move(record); });
        const auto failed = run_until_done(harness.io_context, outcome);
        assert(failed.code() == ErrorCode::PersistenceFailed);
        assert(blocked.size() == 1);
        assert(harness.storage.has_object(blocked.list().front().storage_key));
        assert(harness.staging_empty());
    }

    void test_retrieve_paths()
    {
        Harness harness("filevault_lifecycle_retrieve");
        ThreadedSource source(700 * 1024);
        auto stored = harness.ingest({.name = "song.mp3", .size_bytes = 700 * 1024}, source);
        assert(stored.ok());
        const auto id = stored.value->id;

        CapturingDelivery delivery;
        RecordingDisplay display;
        std::optional<Result<std::filesystem::path>> outcome;
        harness.coordinator.retrieve(id, delivery, &display, [&outcome](Result<std::filesystem::path> result)
                                     { outcome = std::move(result); });
        auto result = run_until_done(harness.io_context, outcome);
        assert(result.ok());
        assert(delivery.calls == 1);
        assert(delivery.delivered_size == 700 * 1024);
        assert(delivery.caption == "song.mp3\nFile ID: " + id);
        assert(result.value->filename().string() == "dl_" + id + "_song.mp3");
        assert(display.saw("Sending file..."));
        assert(harness.staging_empty());

        delivery.fail = true;
        std::optional<Result<std::filesystem::path>> refused;
        harness.coordinator.retrieve(id, delivery, nullptr, [&refused](Result<std::filesystem::path> r)
                                     { refused = std::move(r); });
        assert(run_until_done(harness.io_context, refused).code() == ErrorCode::TransferFailed);
        assert(harness.staging_empty());

        harness.storage.fail_downloads = true;
        delivery.fail = false;
        const auto before = delivery.calls;
        std::optional<Result<std::filesystem::path>> broken;
        harness.coordinator.retrieve(id, delivery, nullptr, [&broken](Result<std::filesystem::path> r)
                                     { broken = std::move(r); });
        assert(run_until_done(harness.io_context, broken).code() == ErrorCode::TransferFailed);
        assert(delivery.calls == before);
        assert(harness.staging_empty());

        std::optional<Result<std::filesystem::path>> unknown;
        harness.coordinator.retrieve("000000000000", delivery, nullptr, [&unknown](Result<std::filesystem::path> r)
                                     { unknown = std::move(r); });
        assert(run_until_done(harness.io_context, unknown).code() == ErrorCode::NotFound);
    }

    void test_delete_and_link_failures()
    {
        Harness harness("filevault_lifecycle_delete");
        ThreadedSource source(4096);
        auto stored = harness.ingest({.name = "photo.jpg", .size_bytes = 4096}, source);
        assert(stored.ok());
        const auto id = stored.value->id;

        harness.storage.fail_deletes = true;
        assert(harness.remove(id).code == ErrorCode::BackendDeleteFailed);
        assert(harness.coordinator.find(id));
        assert(harness.storage.has_object(stored.value->storage_key));

        assert(harness.remove("000000000000").code == ErrorCode::NotFound);
        assert(harness.coordinator.streaming_link("000000000000").code() == ErrorCode::NotFound);

        harness.storage.fail_presign = true;
        assert(harness.coordinator.streaming_link(id).code() == ErrorCode::LinkGenerationFailed);

        harness.storage.fail_deletes = false;
        assert(harness.remove(id).ok());
        assert(!harness.coordinator.find(id));
    }

    void test_unconfigured_backend()
    {
        Harness harness("filevault_lifecycle_unconfigured", false);
        ThreadedSource source(1024);

        auto result = harness.ingest({.name = "a.txt", .size_bytes = 1024}, source);
        assert(result.code() == ErrorCode::ConfigurationMissing);
        assert(harness.coordinator.list().empty());
        assert(harness.staging_empty());

        std::optional<Status> probe;
        harness.coordinator.check_backend([&probe](Status status)
                                          { probe = std::move(status); });
        assert(run_until_done(harness.io_context, probe).code == ErrorCode::ConfigurationMissing);
    }

    void test_check_backend()
    {
        Harness harness("filevault_lifecycle_probe");
        std::optional<Status> ok;
        harness.coordinator.check_backend([&ok](Status status)
                                          { ok = std::move(status); });
        assert(run_until_done(harness.io_context, ok).ok());
        assert(harness.storage.probes == 1);

        harness.storage.reachable = false;
        std::optional<Status> down;
        harness.coordinator.check_backend([&down](Status status)
                                          { down = std::move(status); });
        assert(run_until_done(harness.io_context, down).code == ErrorCode::BackendUnavailable);
    }

} // namespace

void run_transfer_tests()
{
    test_relay_coalesces_samples();
    test_engine_upload_reports_on_scheduler();
    test_engine_upload_failure();
    test_engine_download_and_delete();
    test_engine_probe_and_links();
    test_engine_without_credentials();
}

void run_lifecycle_tests()
{
    test_end_to_end_clip();
    test_ingest_rejects_oversize_before_transfer();
    test_ingest_shows_completion_after_rate_limit();
    test_ingest_upload_failure_cleans_up();
    test_ingest_receive_failure_cleans_up();
    test_ingest_default_name_and_persistence_failure();
    test_retrieve_paths();
    test_delete_and_link_failures();
    test_unconfigured_backend();
    test_check_backend();
}
