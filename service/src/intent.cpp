#include "filevault/service/intent.hpp"

#include <array>

namespace filevault::service
{
    namespace
    {

        struct Route
        {
            IntentKind kind;
            std::string_view token;
            bool takes_id;
        };

        // Longer prefixes first so "confirm_delete_" is never read as another kind.
        constexpr std::array<Route, 11> kRoutes{{
            {IntentKind::ConfirmDelete, "confirm_delete_", true},
            {IntentKind::CancelDelete, "cancel_delete", false},
            {IntentKind::TestConnection, "test_connection", false},
            {IntentKind::ShareUrl, "share_url_", true},
            {IntentKind::ListFiles, "list_files", false},
            {IntentKind::Download, "download_", true},
            {IntentKind::WebPlayer, "web_", true},
            {IntentKind::Stream, "stream_", true},
            {IntentKind::CopyId, "copy_id_", true},
            {IntentKind::CopyUrl, "copy_url_", true},
            {IntentKind::Help, "help", false},
        }};

    } // namespace

    bool intent_requires_id(IntentKind kind) noexcept
    {
        for (const auto &route : kRoutes)
        {
            if (route.kind == kind)
            {
                return route.takes_id;
            }
        }
        return false;
    }

    std::optional<Intent> parse_intent(std::string_view data)
    {
        for (const auto &route : kRoutes)
        {
            if (!route.takes_id)
            {
                if (data == route.token)
                {
                    return Intent{route.kind, {}};
                }
                continue;
            }
            if (data.starts_with(route.token))
            {
                auto id = data.substr(route.token.size());
                if (id.empty())
                {
                    return std::nullopt;
                }
                return Intent{route.kind, std::string(id)};
            }
        }
        return std::nullopt;
    }

    std::string to_callback_data(const Intent &intent)
    {
        for (const auto &route : kRoutes)
        {
            if (route.kind == intent.kind)
            {
                std::string data(route.token);
                if (route.takes_id)
                {
                    data += intent.id;
                }
                return data;
            }
        }
        return "help";
    }

} // namespace filevault::service
