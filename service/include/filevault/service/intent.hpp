#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace filevault::service
{

    enum class IntentKind : std::uint8_t
    {
        Download,
        Stream,
        WebPlayer,
        ConfirmDelete,
        CancelDelete,
        CopyId,
        CopyUrl,
        ShareUrl,
        ListFiles,
        Help,
        TestConnection
    };

    // A user action addressed at the coordinator, e.g. from a button press.
    // `id` is empty for kinds that do not target a file.
    struct Intent
    {
        IntentKind kind{IntentKind::Help};
        std::string id;

        bool operator==(const Intent &) const = default;
    };

    bool intent_requires_id(IntentKind kind) noexcept;

    // "download_<id>", "confirm_delete_<id>", "list_files", ...
    std::optional<Intent> parse_intent(std::string_view data);

    std::string to_callback_data(const Intent &intent);

} // namespace filevault::service
