#include "filevault/service/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace filevault::service
{
    namespace
    {

        std::optional<std::string> read_env(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        }

        void erase_all(std::string &text, std::string_view token)
        {
            for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token))
            {
                text.erase(pos, token.size());
            }
        }

    } // namespace

    std::string clean_region(std::string_view region)
    {
        std::string cleaned(region);
        erase_all(cleaned, "s3.");
        erase_all(cleaned, ".wasabisys.com");
        return cleaned.empty() ? std::string{"us-east-1"} : cleaned;
    }

    std::string S3Settings::resolved_endpoint() const
    {
        if (endpoint && !endpoint->empty())
        {
            return *endpoint;
        }
        return "s3." + clean_region(region) + ".wasabisys.com";
    }

    Result<std::uint64_t> parse_unsigned(const std::string &text, std::string_view what)
    {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        {
            return Result<std::uint64_t>::failure(ErrorCode::InvalidArgument,
                                                  "Invalid value for " + std::string(what) + ": '" + text + "'");
        }
        try
        {
            return Result<std::uint64_t>::success(std::stoull(text));
        }
        catch (const std::logic_error &)
        {
            return Result<std::uint64_t>::failure(ErrorCode::InvalidArgument,
                                                  "Value out of range for " + std::string(what) + ": '" + text + "'");
        }
    }

    Status load_environment(ServiceConfig &config)
    {
        auto &storage = config.storage;
        if (auto value = read_env("WASABI_ACCESS_KEY"))
        {
            storage.access_key = *value;
        }
        if (auto value = read_env("WASABI_SECRET_KEY"))
        {
            storage.secret_key = *value;
        }
        if (auto value = read_env("WASABI_BUCKET"))
        {
            storage.bucket = *value;
        }
        if (auto value = read_env("WASABI_REGION"))
        {
            storage.region = clean_region(*value);
        }
        if (auto value = read_env("WASABI_ENDPOINT"))
        {
            storage.endpoint = *value;
        }
        if (auto value = read_env("FILEVAULT_DB"))
        {
            config.metadata_path = *value;
        }
        if (auto value = read_env("FILEVAULT_STAGING_DIR"))
        {
            config.staging_dir = *value;
        }
        if (auto value = read_env("MAX_FILE_SIZE"))
        {
            auto parsed = parse_unsigned(*value, "MAX_FILE_SIZE");
            if (!parsed.ok())
            {
                return parsed.status;
            }
            config.max_file_size = *parsed.value;
        }
        return Status::success();
    }

} // namespace filevault::service
