#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "filevault/result.hpp"

namespace filevault::service
{

    struct S3Settings
    {
        std::string access_key;
        std::string secret_key;
        std::string bucket;
        std::string region{"us-east-1"};
        // Host (optionally with scheme and port). Derived from the region when unset.
        std::optional<std::string> endpoint;
        bool use_tls{true};
        std::uint64_t multipart_threshold{25ULL * 1024 * 1024};
        std::uint64_t part_size{25ULL * 1024 * 1024};
        std::size_t max_concurrency{10};
        long connect_timeout_ms{10000};
        long request_timeout_ms{300000};

        bool configured() const noexcept
        {
            return !access_key.empty() && !secret_key.empty() && !bucket.empty();
        }

        std::string resolved_endpoint() const;
    };

    struct ServiceConfig
    {
        std::filesystem::path metadata_path{"files_database.json"};
        // Empty: <system temp>/filevault-staging.
        std::filesystem::path staging_dir;
        std::uint64_t max_file_size{4294967296ULL};
        std::chrono::seconds link_ttl{3600};
        std::chrono::seconds player_link_ttl{7200};
        std::size_t worker_threads{4};
        double progress_step_percent{5.0};
        S3Settings storage;
        std::optional<std::filesystem::path> log_file;
    };

    // "s3.eu-central-1.wasabisys.com" -> "eu-central-1"
    std::string clean_region(std::string_view region);

    // Base-10 unsigned value; InvalidArgument names `what` on failure.
    Result<std::uint64_t> parse_unsigned(const std::string &text, std::string_view what);

    // Overlays WASABI_* / MAX_FILE_SIZE / FILEVAULT_* variables onto `config`.
    Status load_environment(ServiceConfig &config);

} // namespace filevault::service
