/**
 * FileVault - Short opaque file identifiers.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "filevault/result.hpp"

namespace filevault
{

    constexpr std::size_t kFileIdLength = 12;

    // Truncated hash of name, size, the timestamp and (when non-zero) a retry counter.
    std::string generate_file_id(std::string_view name, std::uint64_t size_bytes,
                                 std::chrono::system_clock::time_point when, unsigned attempt = 0);

    bool is_valid_file_id(std::string_view id) noexcept;

    class IdentifierGenerator
    {
    public:
        using ExistsFn = std::function<bool(const std::string &)>;

        explicit IdentifierGenerator(unsigned max_attempts = 8);

        // Retries with a fresh timestamp while `exists` reports a taken id.
        Result<std::string> generate(std::string_view name, std::uint64_t size_bytes,
                                     const ExistsFn &exists = {}) const;

    private:
        unsigned max_attempts_;
    };

} // namespace filevault
