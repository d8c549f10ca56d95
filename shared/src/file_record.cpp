#include "filevault/file_record.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace filevault
{

    namespace
    {
        constexpr auto kTimestampFormat = "%Y-%m-%d %H:%M:%S";

        struct ExtensionMapping
        {
            std::string_view extension;
            std::string_view mime_type;
        };

        constexpr std::array<ExtensionMapping, 25> kExtensions{{
            {"mp4", "video/mp4"},
            {"mkv", "video/x-matroska"},
            {"avi", "video/x-msvideo"},
            {"mov", "video/quicktime"},
            {"webm", "video/webm"},
            {"mp3", "audio/mpeg"},
            {"wav", "audio/wav"},
            {"flac", "audio/flac"},
            {"ogg", "audio/ogg"},
            {"m4a", "audio/mp4"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"png", "image/png"},
            {"gif", "image/gif"},
            {"webp", "image/webp"},
            {"pdf", "application/pdf"},
            {"zip", "application/zip"},
            {"rar", "application/vnd.rar"},
            {"7z", "application/x-7z-compressed"},
            {"tar", "application/x-tar"},
            {"gz", "application/gzip"},
            {"txt", "text/plain"},
            {"doc", "application/msword"},
            {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {"json", "application/json"},
        }};

        bool starts_with(std::string_view value, std::string_view prefix) noexcept
        {
            return value.substr(0, prefix.size()) == prefix;
        }

        std::tm to_utc_tm(std::time_t time)
        {
            std::tm tm{};
#ifdef _WIN32
            gmtime_s(&tm, &time);
#else
            gmtime_r(&time, &tm);
#endif
            return tm;
        }

        std::time_t from_utc_tm(std::tm &tm)
        {
#ifdef _WIN32
            return _mkgmtime(&tm);
#else
            return timegm(&tm);
#endif
        }

    } // namespace

    std::string_view to_string(ContentKind kind) noexcept
    {
        switch (kind)
        {
        case ContentKind::Video:
            return "video";
        case ContentKind::Audio:
            return "audio";
        case ContentKind::Image:
            return "image";
        case ContentKind::Document:
            return "document";
        case ContentKind::Archive:
            return "archive";
        case ContentKind::Other:
            break;
        }
        return "other";
    }

    ContentKind content_kind_from_mime(std::string_view mime_type) noexcept
    {
        if (starts_with(mime_type, "video/"))
        {
            return ContentKind::Video;
        }
        if (starts_with(mime_type, "audio/"))
        {
            return ContentKind::Audio;
        }
        if (starts_with(mime_type, "image/"))
        {
            return ContentKind::Image;
        }
        if (starts_with(mime_type, "application/pdf"))
        {
            return ContentKind::Document;
        }
        if (starts_with(mime_type, "application/"))
        {
            return ContentKind::Archive;
        }
        return ContentKind::Other;
    }

    std::string_view glyph(ContentKind kind) noexcept
    {
        switch (kind)
        {
        case ContentKind::Video:
            return "\xF0\x9F\x8E\xA5"; // 🎥
        case ContentKind::Audio:
            return "\xF0\x9F\x8E\xB5"; // 🎵
        case ContentKind::Image:
            return "\xF0\x9F\x96\xBC"; // 🖼
        case ContentKind::Document:
            return "\xF0\x9F\x93\x84"; // 📄
        case ContentKind::Archive:
            return "\xF0\x9F\x93\x81"; // 📁
        case ContentKind::Other:
            break;
        }
        return "\xF0\x9F\x93\x8E"; // 📎
    }

    std::string guess_mime_type(std::string_view file_name)
    {
        const auto dot = file_name.rfind('.');
        if (dot == std::string_view::npos || dot + 1 >= file_name.size())
        {
            return "application/octet-stream";
        }
        std::string extension(file_name.substr(dot + 1));
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        for (const auto &mapping : kExtensions)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.mime_type);
            }
        }
        return "application/octet-stream";
    }

    std::string sanitize_name(std::string_view name)
    {
        std::string result;
        result.reserve(name.size());
        for (const char c : name)
        {
            if (c != '/' && c != '\\')
            {
                result.push_back(c);
            }
        }
        if (result.empty() || result == "." || result == "..")
        {
            return "file";
        }
        return result;
    }

    std::string make_storage_key(std::string_view id, std::string_view name)
    {
        return "files/" + std::string(id) + "/" + sanitize_name(name);
    }

    std::string default_name_for(ContentKind kind, std::chrono::system_clock::time_point when)
    {
        const auto stamp = std::to_string(std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count());
        switch (kind)
        {
        case ContentKind::Video:
            return "video_" + stamp + ".mp4";
        case ContentKind::Audio:
            return "audio_" + stamp + ".mp3";
        case ContentKind::Image:
            return "photo_" + stamp + ".jpg";
        default:
            return "document";
        }
    }

    std::string format_timestamp(std::chrono::system_clock::time_point when)
    {
        const auto tm = to_utc_tm(std::chrono::system_clock::to_time_t(when));
        std::ostringstream oss;
        oss << std::put_time(&tm, kTimestampFormat);
        return oss.str();
    }

    std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text)
    {
        std::tm tm{};
        std::istringstream iss{std::string(text)};
        iss >> std::get_time(&tm, kTimestampFormat);
        if (iss.fail())
        {
            return std::nullopt;
        }
        const auto time = from_utc_tm(tm);
        if (time == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(time);
    }

    std::optional<std::chrono::system_clock::time_point> parse_local_timestamp(std::string_view text)
    {
        std::tm tm{};
        std::istringstream iss{std::string(text)};
        iss >> std::get_time(&tm, kTimestampFormat);
        if (iss.fail())
        {
            return std::nullopt;
        }
        tm.tm_isdst = -1;
        const auto time = std::mktime(&tm);
        if (time == static_cast<std::time_t>(-1))
        {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(time);
    }

    void to_json(nlohmann::ordered_json &json, const FileRecord &record)
    {
        json = {
            {"name", record.name},
            {"size", record.size_bytes},
            {"mime_type", record.mime_type},
            {"storage_key", record.storage_key},
            {"upload_date", format_timestamp(record.created_at)},
            {"origin_ref", record.origin_ref},
        };
    }

    void from_json(const nlohmann::ordered_json &json, FileRecord &record)
    {
        record.name = json.value("name", std::string{"Unknown"});
        record.size_bytes = json.value("size", 0ULL);
        record.mime_type = json.value("mime_type", std::string{});
        // Records without storage_key predate FileVault and carry local-time dates.
        const bool legacy = !json.contains("storage_key");
        if (!legacy)
        {
            record.storage_key = json.at("storage_key").get<std::string>();
        }
        else
        {
            record.storage_key = json.at("wasabi_key").get<std::string>();
        }
        if (auto it = json.find("origin_ref"); it != json.end())
        {
            record.origin_ref = it->get<std::string>();
        }
        else
        {
            record.origin_ref = json.value("telegram_file_id", std::string{});
        }
        const auto text = json.value("upload_date", std::string{});
        const auto date = legacy ? parse_local_timestamp(text) : parse_timestamp(text);
        record.created_at = date.value_or(std::chrono::system_clock::time_point{});
    }

} // namespace filevault
