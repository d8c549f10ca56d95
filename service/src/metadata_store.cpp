#include "filevault/service/metadata_store.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <mutex>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace filevault::service
{
    namespace
    {

        std::error_code sync_path(const std::filesystem::path &path)
        {
            const int fd = ::open(path.c_str(), O_RDONLY);
            if (fd < 0)
            {
                return {errno, std::generic_category()};
            }
            std::error_code ec;
            if (::fsync(fd) != 0)
            {
                ec = {errno, std::generic_category()};
            }
            ::close(fd);
            return ec;
        }

    } // namespace

    MetadataStore::MetadataStore(std::filesystem::path database_path)
        : database_path_(std::move(database_path))
    {
    }

    void MetadataStore::load()
    {
        std::unique_lock lock(mutex_);
        order_.clear();
        records_.clear();

        std::error_code ec;
        if (!std::filesystem::exists(database_path_, ec))
        {
            spdlog::info("No file database at {}, starting empty", database_path_.string());
            return;
        }

        std::ifstream in(database_path_);
        if (!in.is_open())
        {
            spdlog::error("Failed to open file database {}, starting empty", database_path_.string());
            return;
        }

        try
        {
            nlohmann::ordered_json json;
            in >> json;
            if (!json.is_object())
            {
                spdlog::error("File database {} is not a JSON object, starting empty", database_path_.string());
                return;
            }
            for (const auto &[id, value] : json.items())
            {
                auto record = value.get<FileRecord>();
                record.id = id;
                order_.push_back(id);
                records_.emplace(id, std::move(record));
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::error("Failed to load file database {}: {}", database_path_.string(), ex.what());
            order_.clear();
            records_.clear();
            return;
        }
        spdlog::info("Loaded {} file record(s) from {}", records_.size(), database_path_.string());
    }

    Status MetadataStore::put(const FileRecord &record)
    {
        std::unique_lock lock(mutex_);
        auto [it, inserted] = records_.insert_or_assign(record.id, record);
        if (inserted)
        {
            order_.push_back(record.id);
        }
        return persist_locked();
    }

    std::optional<FileRecord> MetadataStore::get(const std::string &id) const
    {
        std::shared_lock lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool MetadataStore::contains(const std::string &id) const
    {
        std::shared_lock lock(mutex_);
        return records_.contains(id);
    }

    std::vector<FileRecord> MetadataStore::list() const
    {
        std::shared_lock lock(mutex_);
        std::vector<FileRecord> result;
        result.reserve(order_.size());
        for (const auto &id : order_)
        {
            result.push_back(records_.at(id));
        }
        return result;
    }

    std::size_t MetadataStore::size() const
    {
        std::shared_lock lock(mutex_);
        return records_.size();
    }

    Result<bool> MetadataStore::remove(const std::string &id)
    {
        std::unique_lock lock(mutex_);
        if (records_.erase(id) == 0)
        {
            return Result<bool>::success(false);
        }
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        auto status = persist_locked();
        return {std::move(status), true};
    }

    Status MetadataStore::persist_locked() const
    {
        try
        {
            nlohmann::ordered_json json = nlohmann::ordered_json::object();
            for (const auto &id : order_)
            {
                json[id] = records_.at(id);
            }

            const auto dir = database_path_.parent_path();
            if (!dir.empty())
            {
                std::filesystem::create_directories(dir);
            }

            auto temp_path = database_path_;
            temp_path += ".tmp";
            {
                std::ofstream out(temp_path, std::ios::trunc);
                if (!out.is_open())
                {
                    spdlog::error("Failed to open {} for writing", temp_path.string());
                    return Status::failure(ErrorCode::PersistenceFailed,
                                           "Cannot write " + temp_path.string());
                }
                out << json.dump(2);
                out.flush();
                if (!out)
                {
                    spdlog::error("Failed to write file database to {}", temp_path.string());
                    return Status::failure(ErrorCode::PersistenceFailed,
                                           "Write failed for " + temp_path.string());
                }
            }
            if (const auto ec = sync_path(temp_path))
            {
                spdlog::error("Failed to sync {}: {}", temp_path.string(), ec.message());
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                return Status::failure(ErrorCode::PersistenceFailed, "Sync failed for " + temp_path.string());
            }
            std::filesystem::rename(temp_path, database_path_);
            if (const auto ec = sync_path(dir.empty() ? std::filesystem::path(".") : dir))
            {
                spdlog::warn("Failed to sync directory of {}: {}", database_path_.string(), ec.message());
            }
        }
        catch (const std::filesystem::filesystem_error &ex)
        {
            spdlog::error("Failed to save file database {}: {}", database_path_.string(), ex.what());
            return Status::failure(ErrorCode::PersistenceFailed, ex.what());
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::error("Failed to serialise file database: {}", ex.what());
            return Status::failure(ErrorCode::PersistenceFailed, ex.what());
        }
        return Status::success();
    }

} // namespace filevault::service
