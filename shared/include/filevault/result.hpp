/**
 * FileVault - Typed outcomes returned across component boundaries.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>

#include "filevault/error_codes.hpp"

namespace filevault
{

    struct Status
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message{};

        bool ok() const noexcept { return code == ErrorCode::Ok; }

        static Status success() { return {}; }

        static Status failure(ErrorCode code, std::string message = {})
        {
            return {code, std::move(message)};
        }
    };

    template <typename T>
    struct Result
    {
        Status status{};
        std::optional<T> value{};

        bool ok() const noexcept { return status.ok() && value.has_value(); }

        ErrorCode code() const noexcept { return status.code; }

        static Result success(T value)
        {
            return {Status::success(), std::move(value)};
        }

        static Result failure(ErrorCode code, std::string message = {})
        {
            return {Status::failure(code, std::move(message)), std::nullopt};
        }

        static Result failure(Status status)
        {
            return {std::move(status), std::nullopt};
        }
    };

} // namespace filevault
