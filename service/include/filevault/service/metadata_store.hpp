#pragma once

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "filevault/file_record.hpp"
#include "filevault/result.hpp"

namespace filevault::service
{

    // Process-wide id -> FileRecord map persisted as one JSON object.
    // Every mutation rewrites the whole file (write to "<path>.tmp", then rename).
    // After a failed write the in-memory map stays ahead of disk and the failure
    // is returned as PersistenceFailed.
    class MetadataStore
    {
    public:
        explicit MetadataStore(std::filesystem::path database_path);

        // Replaces the in-memory map with the file contents. A missing file yields
        // an empty store; an unreadable or corrupt one is logged and also yields
        // an empty store.
        void load();

        Status put(const FileRecord &record);

        std::optional<FileRecord> get(const std::string &id) const;

        bool contains(const std::string &id) const;

        // Snapshot in insertion order.
        std::vector<FileRecord> list() const;

        std::size_t size() const;

        // value: whether a record was removed. The status reports persistence.
        Result<bool> remove(const std::string &id);

        const std::filesystem::path &path() const noexcept { return database_path_; }

    private:
        Status persist_locked() const;

        std::filesystem::path database_path_;

        mutable std::shared_mutex mutex_;
        std::vector<std::string> order_;
        std::unordered_map<std::string, FileRecord> records_;
    };

} // namespace filevault::service
