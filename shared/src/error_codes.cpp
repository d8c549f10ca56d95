#include "filevault/error_codes.hpp"

#include <array>

namespace filevault
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view name;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok", "Operation completed."},
            {ErrorCode::ConfigurationMissing, "configuration_missing",
             "Object storage credentials are not configured."},
            {ErrorCode::SizeExceeded, "size_exceeded", "File is larger than the configured maximum size."},
            {ErrorCode::NotFound, "not_found", "No file with that ID."},
            {ErrorCode::BackendUnavailable, "backend_unavailable", "Object storage could not be reached."},
            {ErrorCode::TransferFailed, "transfer_failed", "The transfer failed before completing."},
            {ErrorCode::LinkGenerationFailed, "link_generation_failed", "Failed to generate a streaming URL."},
            {ErrorCode::PersistenceFailed, "persistence_failed", "Failed to save the file database."},
            {ErrorCode::BackendDeleteFailed, "backend_delete_failed",
             "Object storage refused to delete the file; it was kept."},
            {ErrorCode::InvalidArgument, "invalid_argument", "Invalid argument."},
            {ErrorCode::InternalError, "internal_error", "Internal error."},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.name;
            }
        }
        return "unknown";
    }

    std::string_view describe(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "Unknown error.";
    }

} // namespace filevault
