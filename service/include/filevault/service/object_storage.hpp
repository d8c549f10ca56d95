#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "filevault/result.hpp"

namespace filevault::service
{

    // Fired synchronously on whichever thread is moving the bytes.
    using ByteProgress = std::function<void(std::uint64_t transferred, std::uint64_t total)>;

    // Blocking object-storage backend. Implementations report failures through
    // Status where they can; TransferEngine also guards against them throwing.
    class ObjectStorage
    {
    public:
        virtual ~ObjectStorage() = default;

        virtual bool configured() const noexcept = 0;

        // Cheap reachability/credentials check against the bucket.
        virtual Status probe() = 0;

        virtual Status upload_file(const std::filesystem::path &local_path, const std::string &key,
                                   const ByteProgress &progress) = 0;

        virtual Status download_file(const std::string &key, const std::filesystem::path &local_path,
                                     const ByteProgress &progress) = 0;

        virtual Status delete_object(const std::string &key) = 0;

        // Anonymous GET URL valid for `ttl`; nullopt when signing is impossible.
        virtual std::optional<std::string> presign_get(const std::string &key, std::chrono::seconds ttl) = 0;
    };

} // namespace filevault::service
