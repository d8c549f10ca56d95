#include "filevault/service/s3_storage.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/AsyncCallerContext.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/http/Scheme.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/core/utils/threading/Executor.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/HeadBucketRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/transfer/TransferManager.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "filevault/file_record.hpp"

namespace filevault::service
{
    namespace
    {

        constexpr const char *kAllocationTag = "filevault";

        ErrorCode classify(Aws::S3::S3Errors error, ErrorCode fallback)
        {
            switch (error)
            {
            case Aws::S3::S3Errors::NETWORK_CONNECTION:
            case Aws::S3::S3Errors::ACCESS_DENIED:
            case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
            case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
            case Aws::S3::S3Errors::NO_SUCH_BUCKET:
            case Aws::S3::S3Errors::SERVICE_UNAVAILABLE:
                return ErrorCode::BackendUnavailable;
            default:
                return fallback;
            }
        }

        Status from_aws_error(const Aws::Client::AWSError<Aws::S3::S3Errors> &error, ErrorCode fallback)
        {
            std::string message = error.GetExceptionName().c_str();
            if (!error.GetMessage().empty())
            {
                message += ": ";
                message += error.GetMessage().c_str();
            }
            return Status::failure(classify(error.GetErrorType(), fallback), std::move(message));
        }

        // Carries one transfer's progress sink through the shared TransferManager.
        class TransferContext : public Aws::Client::AsyncCallerContext
        {
        public:
            explicit TransferContext(ByteProgress progress) : progress_(std::move(progress)) {}

            void report(std::uint64_t bytes, std::uint64_t total) const
            {
                if (progress_)
                {
                    progress_(bytes, total);
                }
            }

        private:
            ByteProgress progress_;
        };

        void report_progress(const Aws::Transfer::TransferManager *,
                             const std::shared_ptr<const Aws::Transfer::TransferHandle> &handle)
        {
            if (auto context = std::dynamic_pointer_cast<const TransferContext>(handle->GetContext()))
            {
                context->report(handle->GetBytesTransferred(), handle->GetBytesTotalSize());
            }
        }

        void remove_partial(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
            {
                spdlog::warn("Failed to remove partial download {}: {}", path.string(), ec.message());
            }
        }

    } // namespace

    struct AwsApiGuard::Impl
    {
        Aws::SDKOptions options;
    };

    AwsApiGuard::AwsApiGuard() : impl_(std::make_unique<Impl>())
    {
        Aws::InitAPI(impl_->options);
    }

    AwsApiGuard::~AwsApiGuard()
    {
        Aws::ShutdownAPI(impl_->options);
    }

    struct S3ObjectStorage::Impl
    {
        S3Settings settings;
        std::shared_ptr<Aws::S3::S3Client> client;
        std::shared_ptr<Aws::Utils::Threading::PooledThreadExecutor> executor;
        std::shared_ptr<Aws::Transfer::TransferManager> transfers;

        Status put_small(const std::filesystem::path &local_path, const std::string &key, std::uint64_t size,
                         const ByteProgress &progress) const
        {
            auto body = Aws::MakeShared<Aws::FStream>(kAllocationTag, local_path.string().c_str(),
                                                      std::ios_base::in | std::ios_base::binary);
            if (!body->good())
            {
                return Status::failure(ErrorCode::TransferFailed, "Cannot open " + local_path.string());
            }

            Aws::S3::Model::PutObjectRequest request;
            request.SetBucket(settings.bucket.c_str());
            request.SetKey(key.c_str());
            request.SetContentType(guess_mime_type(key).c_str());
            request.SetContentLength(static_cast<long long>(size));
            request.SetBody(body);

            auto sent = std::make_shared<std::atomic<std::uint64_t>>(0);
            request.SetDataSentEventHandler(
                [progress, sent, size](const Aws::Http::HttpRequest *, long long amount)
                {
                    const auto now = sent->fetch_add(static_cast<std::uint64_t>(amount)) + amount;
                    if (progress)
                    {
                        progress(std::min<std::uint64_t>(now, size), size);
                    }
                });

            auto outcome = client->PutObject(request);
            if (!outcome.IsSuccess())
            {
                return from_aws_error(outcome.GetError(), ErrorCode::TransferFailed);
            }
            if (progress)
            {
                progress(size, size);
            }
            return Status::success();
        }

        Status put_multipart(const std::filesystem::path &local_path, const std::string &key,
                             const ByteProgress &progress) const
        {
            auto context = Aws::MakeShared<TransferContext>(kAllocationTag, progress);
            auto handle = transfers->UploadFile(local_path.string().c_str(), settings.bucket.c_str(), key.c_str(),
                                                guess_mime_type(key).c_str(), {}, context);
            handle->WaitUntilFinished();

            if (handle->GetStatus() == Aws::Transfer::TransferStatus::COMPLETED)
            {
                return Status::success();
            }

            auto status = from_aws_error(handle->GetLastError(), ErrorCode::TransferFailed);
            if (handle->IsMultipart())
            {
                spdlog::warn("Aborting multipart upload {} for {}", handle->GetMultiPartId().c_str(), key);
                transfers->AbortMultipartUpload(handle);
                handle->WaitUntilFinished();
            }
            return status;
        }
    };

    S3ObjectStorage::S3ObjectStorage(S3Settings settings) : impl_(std::make_unique<Impl>())
    {
        impl_->settings = std::move(settings);
        if (!impl_->settings.configured())
        {
            spdlog::warn("Object storage credentials missing; backend operations are disabled");
            return;
        }

        const auto &s = impl_->settings;
        Aws::Client::ClientConfiguration config;
        config.region = clean_region(s.region).c_str();
        config.endpointOverride = s.resolved_endpoint().c_str();
        config.scheme = s.use_tls ? Aws::Http::Scheme::HTTPS : Aws::Http::Scheme::HTTP;
        config.connectTimeoutMs = s.connect_timeout_ms;
        config.requestTimeoutMs = s.request_timeout_ms;
        config.maxConnections = static_cast<unsigned>(s.max_concurrency);

        Aws::Auth::AWSCredentials credentials(s.access_key.c_str(), s.secret_key.c_str());
        impl_->client = Aws::MakeShared<Aws::S3::S3Client>(
            kAllocationTag, credentials, config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never, false);
        impl_->executor = Aws::MakeShared<Aws::Utils::Threading::PooledThreadExecutor>(kAllocationTag,
                                                                                      s.max_concurrency);

        // One manager per storage keeps a single buffer pool across transfers.
        Aws::Transfer::TransferManagerConfiguration transfer_config(impl_->executor.get());
        transfer_config.s3Client = impl_->client;
        transfer_config.bufferSize = s.part_size;
        transfer_config.transferBufferMaxHeapSize = s.part_size * s.max_concurrency;
        transfer_config.uploadProgressCallback = report_progress;
        transfer_config.downloadProgressCallback = report_progress;
        impl_->transfers = Aws::Transfer::TransferManager::Create(transfer_config);

        spdlog::info("Object storage: bucket '{}' at {} ({})", s.bucket, s.resolved_endpoint(),
                     clean_region(s.region));
    }

    S3ObjectStorage::~S3ObjectStorage() = default;

    bool S3ObjectStorage::configured() const noexcept
    {
        return impl_->client != nullptr;
    }

    Status S3ObjectStorage::probe()
    {
        if (!configured())
        {
            return Status::failure(ErrorCode::ConfigurationMissing);
        }
        Aws::S3::Model::HeadBucketRequest request;
        request.SetBucket(impl_->settings.bucket.c_str());
        auto outcome = impl_->client->HeadBucket(request);
        if (!outcome.IsSuccess())
        {
            return from_aws_error(outcome.GetError(), ErrorCode::BackendUnavailable);
        }
        return Status::success();
    }

    Status S3ObjectStorage::upload_file(const std::filesystem::path &local_path, const std::string &key,
                                        const ByteProgress &progress)
    {
        if (!configured())
        {
            return Status::failure(ErrorCode::ConfigurationMissing);
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            return Status::failure(ErrorCode::TransferFailed, local_path.string() + ": " + ec.message());
        }

        if (size < impl_->settings.multipart_threshold)
        {
            return impl_->put_small(local_path, key, size, progress);
        }
        return impl_->put_multipart(local_path, key, progress);
    }

    Status S3ObjectStorage::download_file(const std::string &key, const std::filesystem::path &local_path,
                                          const ByteProgress &progress)
    {
        if (!configured())
        {
            return Status::failure(ErrorCode::ConfigurationMissing);
        }
        auto context = Aws::MakeShared<TransferContext>(kAllocationTag, progress);
        auto handle = impl_->transfers->DownloadFile(impl_->settings.bucket.c_str(), key.c_str(),
                                                     local_path.string().c_str(),
                                                     Aws::Transfer::DownloadConfiguration(), context);
        handle->WaitUntilFinished();

        if (handle->GetStatus() != Aws::Transfer::TransferStatus::COMPLETED)
        {
            remove_partial(local_path);
            return from_aws_error(handle->GetLastError(), ErrorCode::TransferFailed);
        }
        return Status::success();
    }

    Status S3ObjectStorage::delete_object(const std::string &key)
    {
        if (!configured())
        {
            return Status::failure(ErrorCode::ConfigurationMissing);
        }
        Aws::S3::Model::DeleteObjectRequest request;
        request.SetBucket(impl_->settings.bucket.c_str());
        request.SetKey(key.c_str());
        auto outcome = impl_->client->DeleteObject(request);
        if (!outcome.IsSuccess())
        {
            return from_aws_error(outcome.GetError(), ErrorCode::BackendDeleteFailed);
        }
        return Status::success();
    }

    std::optional<std::string> S3ObjectStorage::presign_get(const std::string &key, std::chrono::seconds ttl)
    {
        if (!configured())
        {
            return std::nullopt;
        }
        auto url = impl_->client->GeneratePresignedUrl(impl_->settings.bucket.c_str(), key.c_str(),
                                                       Aws::Http::HttpMethod::HTTP_GET,
                                                       static_cast<long long>(ttl.count()));
        if (url.empty())
        {
            return std::nullopt;
        }
        return std::string(url.c_str());
    }

} // namespace filevault::service
