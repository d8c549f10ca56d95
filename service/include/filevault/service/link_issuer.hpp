#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "filevault/service/object_storage.hpp"

namespace filevault::service
{

    class LinkIssuer
    {
    public:
        static constexpr std::chrono::seconds kDefaultTtl{3600};
        // SigV4 presigned URLs cannot outlive seven days.
        static constexpr std::chrono::seconds kMaxTtl{7 * 24 * 3600};

        explicit LinkIssuer(ObjectStorage &storage);

        // Never throws; nullopt when the backend is unconfigured or signing fails.
        std::optional<std::string> issue(const std::string &storage_key, std::chrono::seconds ttl = kDefaultTtl) const;

    private:
        ObjectStorage &storage_;
    };

} // namespace filevault::service
