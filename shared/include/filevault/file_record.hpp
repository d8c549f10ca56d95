/**
 * FileVault - Stored file records and their persisted JSON form.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace filevault
{

    enum class ContentKind : std::uint8_t
    {
        Video,
        Audio,
        Image,
        Document,
        Archive,
        Other
    };

    std::string_view to_string(ContentKind kind) noexcept;
    ContentKind content_kind_from_mime(std::string_view mime_type) noexcept;
    std::string_view glyph(ContentKind kind) noexcept;
    std::string guess_mime_type(std::string_view file_name);

    struct FileRecord
    {
        std::string id;
        std::string name;
        std::uint64_t size_bytes{};
        std::string mime_type;
        std::string storage_key;
        std::chrono::system_clock::time_point created_at{};
        std::string origin_ref;

        ContentKind kind() const noexcept { return content_kind_from_mime(mime_type); }

        bool operator==(const FileRecord &) const = default;
    };

    // Drops directory separators; never returns an empty name.
    std::string sanitize_name(std::string_view name);

    // files/{id}/{name}
    std::string make_storage_key(std::string_view id, std::string_view name);

    std::string default_name_for(ContentKind kind, std::chrono::system_clock::time_point when);

    // "YYYY-MM-DD HH:MM:SS", UTC.
    std::string format_timestamp(std::chrono::system_clock::time_point when);
    std::optional<std::chrono::system_clock::time_point> parse_timestamp(std::string_view text);
    // Same format, read in the host's local time zone.
    std::optional<std::chrono::system_clock::time_point> parse_local_timestamp(std::string_view text);

    // The id is the key of the enclosing object and is not part of the record body.
    void to_json(nlohmann::ordered_json &json, const FileRecord &record);
    void from_json(const nlohmann::ordered_json &json, FileRecord &record);

} // namespace filevault
