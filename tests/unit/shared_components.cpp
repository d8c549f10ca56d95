#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include "filevault/crypto.hpp"
#include "filevault/error_codes.hpp"
#include "filevault/file_record.hpp"
#include "filevault/format.hpp"
#include "filevault/identifier.hpp"

using namespace filevault;

void run_store_tests();
void run_throttler_tests();
void run_transfer_tests();
void run_lifecycle_tests();
void run_cli_tests();

namespace
{

    std::chrono::system_clock::time_point at_seconds(long long seconds)
    {
        return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
    }

    void test_identifier_shape()
    {
        const auto when = std::chrono::system_clock::now();
        const auto id = generate_file_id("clip.mp4", 10485760, when);
        assert(id.size() == kFileIdLength);
        assert(is_valid_file_id(id));
        assert(id == generate_file_id("clip.mp4", 10485760, when));

        std::set<std::string> ids;
        for (int i = 0; i < 100; ++i)
        {
            ids.insert(generate_file_id("clip.mp4", 10485760, when + std::chrono::milliseconds(i)));
        }
        assert(ids.size() == 100);

        assert(generate_file_id("clip.mp4", 1, when) != generate_file_id("clip.mp4", 2, when));
        assert(generate_file_id("clip.mp4", 1, when, 0) != generate_file_id("clip.mp4", 1, when, 1));

        assert(!is_valid_file_id("abc"));
        assert(!is_valid_file_id("ABCDEF123456"));
        assert(!is_valid_file_id("zzzzzzzzzzzz"));
    }

    void test_identifier_collision_retry()
    {
        IdentifierGenerator generator(4);

        int calls = 0;
        auto result = generator.generate("a.txt", 3, [&calls](const std::string &)
                                         { return ++calls < 3; });
        assert(result.ok());
        assert(calls == 3);
        assert(is_valid_file_id(*result.value));

        auto exhausted = generator.generate("a.txt", 3, [](const std::string &)
                                            { return true; });
        assert(!exhausted.ok());
        assert(exhausted.code() == ErrorCode::InternalError);

        auto unchecked = generator.generate("a.txt", 3);
        assert(unchecked.ok());
    }

    void test_record_json()
    {
        FileRecord record{
            .id = "0123456789ab",
            .name = "clip.mp4",
            .size_bytes = 10485760,
            .mime_type = "video/mp4",
            .storage_key = "files/0123456789ab/clip.mp4",
            .created_at = at_seconds(1700000000),
            .origin_ref = "BAACAgIAAxkBAAI",
        };

        const nlohmann::ordered_json json = record;
        assert(!json.contains("id"));
        assert(json.at("size") == 10485760);
        assert(json.at("upload_date") == "2023-11-14 22:13:20");
        assert(json.begin().key() == "name");

        auto decoded = json.get<FileRecord>();
        decoded.id = record.id;
        assert(decoded == record);
        assert(decoded.kind() == ContentKind::Video);
    }

    void test_record_legacy_fields()
    {
        const auto json = nlohmann::ordered_json::parse(R"({
            "name": "song.mp3",
            "size": 4096,
            "mime_type": "audio/mpeg",
            "wasabi_key": "files/aaaaaaaaaaaa/song.mp3",
            "upload_date": "2024-01-02 03:04:05",
            "telegram_file_id": "legacy-ref"
        })");
        const auto record = json.get<FileRecord>();
        assert(record.storage_key == "files/aaaaaaaaaaaa/song.mp3");
        assert(record.origin_ref == "legacy-ref");
        assert(record.created_at == parse_local_timestamp("2024-01-02 03:04:05"));

        // Saving and reloading keeps the instant; only the legacy read is local time.
        const auto reloaded = nlohmann::ordered_json(record).get<FileRecord>();
        assert(reloaded.created_at == record.created_at);
        assert(parse_timestamp(format_timestamp(record.created_at)) == record.created_at);

        const nlohmann::ordered_json rewritten = record;
        assert(rewritten.contains("storage_key"));
        assert(rewritten.contains("origin_ref"));
        assert(!rewritten.contains("wasabi_key"));
        assert(!rewritten.contains("telegram_file_id"));
    }

    void test_names_and_keys()
    {
        assert(sanitize_name("clip.mp4") == "clip.mp4");
        assert(sanitize_name("../etc/passwd") == "..etcpasswd");
        assert(sanitize_name("dir\\file.txt") == "dirfile.txt");
        assert(sanitize_name("//") == "file");
        assert(sanitize_name("") == "file");
        assert(make_storage_key("0123456789ab", "clip.mp4") == "files/0123456789ab/clip.mp4");
        assert(make_storage_key("0123456789ab", "a/b.txt") == "files/0123456789ab/ab.txt");

        const auto when = at_seconds(1700000000);
        assert(default_name_for(ContentKind::Video, when) == "video_1700000000.mp4");
        assert(default_name_for(ContentKind::Audio, when) == "audio_1700000000.mp3");
        assert(default_name_for(ContentKind::Image, when) == "photo_1700000000.jpg");
        assert(default_name_for(ContentKind::Other, when) == "document");
    }

    void test_content_kinds()
    {
        assert(content_kind_from_mime("video/mp4") == ContentKind::Video);
        assert(content_kind_from_mime("audio/ogg") == ContentKind::Audio);
        assert(content_kind_from_mime("image/png") == ContentKind::Image);
        assert(content_kind_from_mime("application/pdf") == ContentKind::Document);
        assert(content_kind_from_mime("application/zip") == ContentKind::Archive);
        assert(content_kind_from_mime("text/plain") == ContentKind::Other);
        assert(content_kind_from_mime("") == ContentKind::Other);

        assert(guess_mime_type("movie.MKV") == "video/x-matroska");
        assert(guess_mime_type("files/abc/photo.jpeg") == "image/jpeg");
        assert(guess_mime_type("report.pdf") == "application/pdf");
        assert(guess_mime_type("noext") == "application/octet-stream");
        assert(guess_mime_type("trailing.") == "application/octet-stream");

        assert(glyph(ContentKind::Video) != glyph(ContentKind::Audio));
        assert(to_string(ContentKind::Archive) == "archive");
    }

    void test_format_size()
    {
        assert(format_size(0) == "0 Bytes");
        assert(format_size(1) == "1 Byte");
        assert(format_size(10) == "10 Bytes");
        assert(format_size(999) == "999 Bytes");
        assert(format_size(1000) == "1.0 kB");
        assert(format_size(10500000) == "10.5 MB");
        assert(format_size(4294967296ULL) == "4.3 GB");
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::Ok) == "ok");
        assert(to_string(ErrorCode::SizeExceeded) == "size_exceeded");
        assert(to_string(ErrorCode::BackendDeleteFailed) == "backend_delete_failed");
        assert(!describe(ErrorCode::NotFound).empty());

        const auto ok = Status::success();
        assert(ok.ok());
        const auto failed = Result<int>::failure(ErrorCode::NotFound, "missing");
        assert(!failed.ok());
        assert(failed.code() == ErrorCode::NotFound);
        assert(Result<int>::success(7).value == 7);
    }

    void test_crypto()
    {
        const auto digest = crypto::hash_text("filevault");
        assert(digest.size() == 64);
        assert(digest == crypto::hash_text("filevault"));
        assert(digest != crypto::hash_text("filevault!"));
    }

} // namespace

int main()
{
    try
    {
        test_identifier_shape();
        test_identifier_collision_retry();
        test_record_json();
        test_record_legacy_fields();
        test_names_and_keys();
        test_content_kinds();
        test_format_size();
        test_error_codes();
        test_crypto();
        run_store_tests();
        run_throttler_tests();
        run_transfer_tests();
        run_lifecycle_tests();
        run_cli_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
