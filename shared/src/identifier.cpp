#include "filevault/identifier.hpp"

#include <algorithm>
#include <stdexcept>

#include "filevault/crypto.hpp"

namespace filevault
{

    std::string generate_file_id(std::string_view name, std::uint64_t size_bytes,
                                 std::chrono::system_clock::time_point when, unsigned attempt)
    {
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(when.time_since_epoch()).count();
        std::string material(name);
        material += '_';
        material += std::to_string(size_bytes);
        material += '_';
        material += std::to_string(nanos);
        if (attempt > 0)
        {
            material += '#';
            material += std::to_string(attempt);
        }
        return crypto::hash_text(material).substr(0, kFileIdLength);
    }

    bool is_valid_file_id(std::string_view id) noexcept
    {
        if (id.size() != kFileIdLength)
        {
            return false;
        }
        return std::all_of(id.begin(), id.end(), [](char c)
                           { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
    }

    IdentifierGenerator::IdentifierGenerator(unsigned max_attempts)
        : max_attempts_(max_attempts == 0 ? 1 : max_attempts)
    {
    }

    Result<std::string> IdentifierGenerator::generate(std::string_view name, std::uint64_t size_bytes,
                                                      const ExistsFn &exists) const
    {
        try
        {
            for (unsigned attempt = 0; attempt < max_attempts_; ++attempt)
            {
                auto id = generate_file_id(name, size_bytes, std::chrono::system_clock::now(), attempt);
                if (!exists || !exists(id))
                {
                    return Result<std::string>::success(std::move(id));
                }
            }
        }
        catch (const std::runtime_error &ex)
        {
            return Result<std::string>::failure(ErrorCode::InternalError, ex.what());
        }
        return Result<std::string>::failure(ErrorCode::InternalError,
                                            "Could not allocate an unused file id after " +
                                                std::to_string(max_attempts_) + " attempts");
    }

} // namespace filevault
