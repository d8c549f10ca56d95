#include "filevault/service/link_issuer.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace filevault::service
{

    LinkIssuer::LinkIssuer(ObjectStorage &storage) : storage_(storage)
    {
    }

    std::optional<std::string> LinkIssuer::issue(const std::string &storage_key, std::chrono::seconds ttl) const
    {
        if (!storage_.configured())
        {
            spdlog::warn("Cannot sign URL for {}: object storage is not configured", storage_key);
            return std::nullopt;
        }
        if (ttl.count() <= 0)
        {
            spdlog::warn("Refusing to sign URL for {} with non-positive TTL {}s", storage_key, ttl.count());
            return std::nullopt;
        }
        if (ttl > kMaxTtl)
        {
            spdlog::debug("Clamping URL TTL for {} from {}s to {}s", storage_key, ttl.count(), kMaxTtl.count());
            ttl = kMaxTtl;
        }

        try
        {
            auto url = storage_.presign_get(storage_key, ttl);
            if (!url || url->empty())
            {
                spdlog::error("Failed to generate presigned URL for {}", storage_key);
                return std::nullopt;
            }
            return url;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to generate presigned URL for {}: {}", storage_key, ex.what());
            return std::nullopt;
        }
    }

} // namespace filevault::service
