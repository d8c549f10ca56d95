#pragma once

#include <memory>

#include "filevault/service/config.hpp"
#include "filevault/service/object_storage.hpp"

namespace filevault::service
{

    // Owns the AWS SDK's global state. Exactly one must be alive while any
    // S3ObjectStorage exists, and it must be destroyed after all of them.
    class AwsApiGuard
    {
    public:
        AwsApiGuard();
        ~AwsApiGuard();

        AwsApiGuard(const AwsApiGuard &) = delete;
        AwsApiGuard &operator=(const AwsApiGuard &) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

    // S3-compatible backend (Wasabi by default). Files at or above the
    // multipart threshold go through the SDK's TransferManager in `part_size`
    // parts with up to `max_concurrency` in flight; smaller ones use a single
    // PutObject. Without credentials every call fails with ConfigurationMissing.
    class S3ObjectStorage : public ObjectStorage
    {
    public:
        explicit S3ObjectStorage(S3Settings settings);
        ~S3ObjectStorage() override;

        S3ObjectStorage(const S3ObjectStorage &) = delete;
        S3ObjectStorage &operator=(const S3ObjectStorage &) = delete;

        bool configured() const noexcept override;

        Status probe() override;

        Status upload_file(const std::filesystem::path &local_path, const std::string &key,
                           const ByteProgress &progress) override;

        Status download_file(const std::string &key, const std::filesystem::path &local_path,
                             const ByteProgress &progress) override;

        Status delete_object(const std::string &key) override;

        std::optional<std::string> presign_get(const std::string &key, std::chrono::seconds ttl) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace filevault::service
