/**
 * FileVault - Failure categories shared by the service and its front ends.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace filevault
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ConfigurationMissing = 1,
        SizeExceeded = 2,
        NotFound = 3,
        BackendUnavailable = 4,
        TransferFailed = 5,
        LinkGenerationFailed = 6,
        PersistenceFailed = 7,
        BackendDeleteFailed = 8,
        InvalidArgument = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // Human-readable sentence for display next to the code.
    std::string_view describe(ErrorCode code) noexcept;

} // namespace filevault
