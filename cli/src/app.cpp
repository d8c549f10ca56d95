#include "filevault/cli/app.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filevault/cli/console.hpp"
#include "filevault/format.hpp"

namespace filevault::cli
{
    namespace
    {

        std::string trim(std::string value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        std::string describe_ttl(std::chrono::seconds ttl)
        {
            const auto hours = ttl.count() / 3600;
            if (hours > 0 && ttl.count() % 3600 == 0)
            {
                return std::to_string(hours) + (hours == 1 ? " hour" : " hours");
            }
            return std::to_string(ttl.count()) + " seconds";
        }

    } // namespace

    App::App(asio::io_context &io_context, service::LifecycleCoordinator &coordinator, const CliOptions &options,
             std::ostream &out, std::istream &in, bool interactive)
        : io_context_(io_context),
          coordinator_(coordinator),
          options_(options),
          out_(out),
          in_(in),
          interactive_(interactive)
    {
    }

    int App::run()
    {
        if (options_.command == "upload")
        {
            return upload();
        }

        auto intent = intent_from_command();
        if (!intent)
        {
            return EXIT_FAILURE;
        }
        return dispatch(*intent);
    }

    std::optional<service::Intent> App::intent_from_command()
    {
        using service::Intent;
        using service::IntentKind;

        const auto &command = options_.command;
        const auto &args = options_.arguments;

        auto require_id = [&](const char *usage) -> std::optional<std::string>
        {
            if (args.empty())
            {
                fail(ErrorCode::InvalidArgument, std::string("Usage: ") + usage);
                return std::nullopt;
            }
            return args.front();
        };

        if (command == "download")
        {
            auto id = require_id("download <id> [destination]");
            if (!id)
            {
                return std::nullopt;
            }
            return Intent{IntentKind::Download, *id};
        }
        if (command == "link")
        {
            auto id = require_id("link <id> [--ttl <seconds>] [--player]");
            if (!id)
            {
                return std::nullopt;
            }
            return Intent{options_.player ? IntentKind::WebPlayer : IntentKind::Stream, *id};
        }
        if (command == "delete")
        {
            auto id = require_id("delete <id> [--yes]");
            if (!id)
            {
                return std::nullopt;
            }
            auto record = coordinator_.find(*id);
            if (!record)
            {
                fail(ErrorCode::NotFound, "No file with ID " + *id);
                return std::nullopt;
            }
            if (options_.assume_yes ||
                ask_yes_no("Delete '" + record->name + "' (" + format_size(record->size_bytes) + ")?"))
            {
                return Intent{IntentKind::ConfirmDelete, *id};
            }
            return Intent{IntentKind::CancelDelete, {}};
        }
        if (command == "list")
        {
            return Intent{IntentKind::ListFiles, {}};
        }
        if (command == "test")
        {
            return Intent{IntentKind::TestConnection, {}};
        }
        if (command == "help")
        {
            return Intent{IntentKind::Help, {}};
        }
        if (command == "action")
        {
            if (args.empty())
            {
                fail(ErrorCode::InvalidArgument, "Usage: action <callback-data>");
                return std::nullopt;
            }
            auto intent = service::parse_intent(args.front());
            if (!intent)
            {
                fail(ErrorCode::InvalidArgument, "Unrecognised action: " + args.front());
            }
            return intent;
        }

        fail(ErrorCode::InvalidArgument, "Unknown command: " + command);
        return std::nullopt;
    }

    int App::dispatch(const service::Intent &intent)
    {
        using service::IntentKind;

        spdlog::debug("Dispatching {}", service::to_callback_data(intent));
        switch (intent.kind)
        {
        case IntentKind::Download:
        {
            std::optional<std::string> destination;
            if (options_.command == "download" && options_.arguments.size() > 1)
            {
                destination = options_.arguments[1];
            }
            return download(intent.id, destination);
        }
        case IntentKind::Stream:
            return link(intent.id, options_.ttl.value_or(options_.service.link_ttl));
        case IntentKind::WebPlayer:
            return link(intent.id, options_.ttl.value_or(options_.service.player_link_ttl));
        case IntentKind::ConfirmDelete:
            return remove(intent.id);
        case IntentKind::CancelDelete:
            out_ << "OK" << std::endl;
            out_ << "Deletion cancelled." << std::endl;
            return EXIT_SUCCESS;
        case IntentKind::CopyId:
            return copy_id(intent.id);
        case IntentKind::CopyUrl:
            return copy_url(intent.id);
        case IntentKind::ShareUrl:
            return share(intent.id);
        case IntentKind::ListFiles:
            return list();
        case IntentKind::Help:
            out_ << usage("filevault");
            return EXIT_SUCCESS;
        case IntentKind::TestConnection:
            return test_connection();
        }
        return fail(ErrorCode::InvalidArgument, "Unsupported action");
    }

    int App::upload()
    {
        if (options_.arguments.empty())
        {
            return fail(ErrorCode::InvalidArgument, "Usage: upload <file> [--name <NAME>] [--mime <TYPE>]");
        }
        const std::filesystem::path source = options_.arguments.front();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(source, ec))
        {
            return fail(ErrorCode::InvalidArgument, "Not a regular file: " + source.string());
        }
        const auto size = std::filesystem::file_size(source, ec);
        if (ec)
        {
            return fail(ErrorCode::InvalidArgument, source.string() + ": " + ec.message());
        }

        service::IngestRequest request{
            .name = options_.name.value_or(source.filename().string()),
            .size_bytes = size,
            .mime_type = options_.mime_type.value_or(std::string{}),
            .origin_ref = std::filesystem::absolute(source, ec).string(),
        };

        LocalFileSource file_source(source);
        ConsoleStatus status(out_, interactive_);
        std::optional<Result<FileRecord>> outcome;
        coordinator_.ingest(std::move(request), file_source, &status, [&outcome](Result<FileRecord> result)
                            { outcome = std::move(result); });
        wait();

        if (!outcome)
        {
            return fail(ErrorCode::InternalError, "Upload did not complete");
        }
        if (!outcome->ok())
        {
            return fail(outcome->status);
        }

        const auto &record = *outcome->value;
        out_ << "OK" << std::endl;
        out_ << glyph(record.kind()) << " " << record.name << std::endl;
        out_ << "File ID: " << record.id << std::endl;
        out_ << "Size: " << format_size(record.size_bytes) << std::endl;
        out_ << "Type: " << record.mime_type << std::endl;
        return EXIT_SUCCESS;
    }

    int App::download(const std::string &id, const std::optional<std::string> &destination)
    {
        auto record = coordinator_.find(id);
        if (!record)
        {
            return fail(ErrorCode::NotFound, "No file with ID " + id);
        }

        std::error_code ec;
        std::filesystem::path target = destination ? std::filesystem::path(*destination)
                                                   : std::filesystem::current_path(ec);
        if (std::filesystem::is_directory(target, ec))
        {
            target /= sanitize_name(record->name);
        }
        if (std::filesystem::exists(target, ec))
        {
            return fail(ErrorCode::InvalidArgument, "Refusing to overwrite existing file " + target.string());
        }

        LocalFileDelivery delivery(target);
        ConsoleStatus status(out_, interactive_);
        std::optional<Result<std::filesystem::path>> outcome;
        coordinator_.retrieve(id, delivery, &status, [&outcome](Result<std::filesystem::path> result)
                              { outcome = std::move(result); });
        wait();

        if (!outcome)
        {
            return fail(ErrorCode::InternalError, "Download did not complete");
        }
        if (!outcome->ok())
        {
            return fail(outcome->status);
        }
        out_ << "OK" << std::endl;
        out_ << "Saved " << record->name << " (" << format_size(record->size_bytes) << ") to "
             << delivery.destination().string() << std::endl;
        return EXIT_SUCCESS;
    }

    int App::link(const std::string &id, std::chrono::seconds ttl)
    {
        auto link = coordinator_.streaming_link(id, ttl);
        if (!link.ok())
        {
            return fail(link.status);
        }
        const auto &value = *link.value;
        out_ << "OK" << std::endl;
        out_ << glyph(value.kind) << " " << value.name << std::endl;
        out_ << "Size: " << format_size(value.size_bytes) << std::endl;
        out_ << "Uploaded: " << format_timestamp(value.created_at) << std::endl;
        out_ << "Expires in: " << describe_ttl(value.ttl) << std::endl;
        out_ << value.url << std::endl;
        return EXIT_SUCCESS;
    }

    int App::share(const std::string &id)
    {
        auto link = coordinator_.streaming_link(id, options_.service.link_ttl);
        if (!link.ok())
        {
            return fail(link.status);
        }
        out_ << "OK" << std::endl;
        out_ << "Share this link (valid for " << describe_ttl(link.value->ttl) << "):" << std::endl;
        out_ << link.value->url << std::endl;
        return EXIT_SUCCESS;
    }

    int App::copy_id(const std::string &id)
    {
        if (!coordinator_.find(id))
        {
            return fail(ErrorCode::NotFound, "No file with ID " + id);
        }
        out_ << id << std::endl;
        return EXIT_SUCCESS;
    }

    int App::copy_url(const std::string &id)
    {
        auto link = coordinator_.streaming_link(id, options_.service.link_ttl);
        if (!link.ok())
        {
            return fail(link.status);
        }
        out_ << link.value->url << std::endl;
        return EXIT_SUCCESS;
    }

    int App::remove(const std::string &id)
    {
        std::optional<Status> outcome;
        coordinator_.remove(id, [&outcome](Status status)
                            { outcome = std::move(status); });
        wait();

        if (!outcome)
        {
            return fail(ErrorCode::InternalError, "Delete did not complete");
        }
        if (!outcome->ok())
        {
            return fail(*outcome);
        }
        out_ << "OK" << std::endl;
        out_ << "Deleted " << id << std::endl;
        return EXIT_SUCCESS;
    }

    int App::list()
    {
        auto records = coordinator_.list();
        std::stable_sort(records.begin(), records.end(), [](const FileRecord &lhs, const FileRecord &rhs)
                         { return lhs.created_at > rhs.created_at; });

        if (options_.json)
        {
            auto files = nlohmann::ordered_json::array();
            for (const auto &record : records)
            {
                files.push_back({
                    {"id", record.id},
                    {"name", record.name},
                    {"size", record.size_bytes},
                    {"size_human", format_size(record.size_bytes)},
                    {"mime_type", record.mime_type},
                    {"upload_date", format_timestamp(record.created_at)},
                });
            }
            out_ << files.dump(2) << std::endl;
            return EXIT_SUCCESS;
        }

        out_ << "OK" << std::endl;
        if (records.empty())
        {
            out_ << "No files stored yet." << std::endl;
            return EXIT_SUCCESS;
        }
        out_ << "Files: " << records.size() << std::endl;
        for (const auto &record : records)
        {
            out_ << glyph(record.kind()) << " " << record.name << std::endl;
            out_ << "   ID: " << record.id << "  |  " << format_size(record.size_bytes) << "  |  "
                 << format_timestamp(record.created_at) << std::endl;
        }
        return EXIT_SUCCESS;
    }

    int App::test_connection()
    {
        std::optional<Status> outcome;
        coordinator_.check_backend([&outcome](Status status)
                                   { outcome = std::move(status); });
        wait();

        if (!outcome)
        {
            return fail(ErrorCode::InternalError, "Connection test did not complete");
        }
        if (!outcome->ok())
        {
            return fail(*outcome);
        }
        out_ << "OK" << std::endl;
        out_ << "Object storage is reachable." << std::endl;
        return EXIT_SUCCESS;
    }

    bool App::ask_yes_no(const std::string &question) const
    {
        while (true)
        {
            out_ << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(in_, answer))
            {
                return false;
            }
            answer = trim(answer);
            std::transform(answer.begin(), answer.end(), answer.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (answer == "y" || answer == "yes")
            {
                return true;
            }
            if (answer == "n" || answer == "no")
            {
                return false;
            }
            out_ << "Please answer y or n." << std::endl;
        }
    }

    void App::wait()
    {
        io_context_.restart();
        io_context_.run();
    }

    int App::fail(const Status &status) const
    {
        out_ << "ERROR: " << to_string(status.code) << std::endl;
        out_ << describe(status.code) << std::endl;
        if (!status.message.empty())
        {
            out_ << status.message << std::endl;
        }
        return EXIT_FAILURE;
    }

    int App::fail(ErrorCode code, const std::string &message) const
    {
        return fail(Status::failure(code, message));
    }

} // namespace filevault::cli
