#include "filevault/cli/config.hpp"

#include "filevault/service/link_issuer.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace filevault::cli
{
    namespace
    {

        std::string next_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            ++index;
            return argv[index];
        }

        std::uint64_t next_number(int &index, int argc, char *argv[], const std::string &flag)
        {
            auto parsed = service::parse_unsigned(next_value(index, argc, argv, flag), flag);
            if (!parsed.ok())
            {
                throw std::runtime_error(parsed.status.message);
            }
            return *parsed.value;
        }

    } // namespace

    CliOptions parse_arguments(int argc, char *argv[], service::ServiceConfig base)
    {
        CliOptions options;
        options.service = std::move(base);

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                options.show_help = true;
            }
            else if (arg == "--version")
            {
                options.show_version = true;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                options.verbose = true;
            }
            else if (arg == "--db")
            {
                options.service.metadata_path = next_value(i, argc, argv, arg);
            }
            else if (arg == "--staging-dir")
            {
                options.service.staging_dir = next_value(i, argc, argv, arg);
            }
            else if (arg == "--max-size")
            {
                options.service.max_file_size = next_number(i, argc, argv, arg);
            }
            else if (arg == "--endpoint")
            {
                options.service.storage.endpoint = next_value(i, argc, argv, arg);
            }
            else if (arg == "--bucket")
            {
                options.service.storage.bucket = next_value(i, argc, argv, arg);
            }
            else if (arg == "--region")
            {
                options.service.storage.region = service::clean_region(next_value(i, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                options.service.log_file = std::filesystem::path(next_value(i, argc, argv, arg));
            }
            else if (arg == "--name")
            {
                options.name = next_value(i, argc, argv, arg);
            }
            else if (arg == "--mime")
            {
                options.mime_type = next_value(i, argc, argv, arg);
            }
            else if (arg == "--ttl")
            {
                const auto seconds = next_number(i, argc, argv, arg);
                if (seconds == 0)
                {
                    throw std::runtime_error("--ttl must be positive");
                }
                if (seconds > static_cast<std::uint64_t>(service::LinkIssuer::kMaxTtl.count()))
                {
                    throw std::runtime_error("--ttl must not exceed " +
                                             std::to_string(service::LinkIssuer::kMaxTtl.count()) + " seconds");
                }
                options.ttl = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
            }
            else if (arg == "--player")
            {
                options.player = true;
            }
            else if (arg == "--yes" || arg == "-y")
            {
                options.assume_yes = true;
            }
            else if (arg == "--json")
            {
                options.json = true;
            }
            else if (arg.size() > 1 && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (options.command.empty())
            {
                options.command = arg;
            }
            else
            {
                options.arguments.push_back(arg);
            }
        }

        if (options.command.empty() && !options.show_help && !options.show_version)
        {
            throw std::runtime_error("Missing command");
        }
        return options;
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream out;
        out << "Usage: " << program_name << " [options] <command> [arguments]\n"
            << "\n"
            << "Commands:\n"
            << "  upload <file> [--name <NAME>] [--mime <TYPE>]  Store a local file\n"
            << "  download <id> [destination]                   Fetch a stored file\n"
            << "  link <id> [--ttl <seconds>] [--player]        Print a temporary streaming URL\n"
            << "  delete <id> [--yes]                           Delete a stored file\n"
            << "  list [--json]                                 List stored files, newest first\n"
            << "  test                                          Check the storage connection\n"
            << "  action <callback-data>                        Run a button action, e.g. stream_<id>\n"
            << "\n"
            << "Options:\n"
            << "  --db <FILE>           Metadata file (FILEVAULT_DB)\n"
            << "  --staging-dir <DIR>   Temporary file directory (FILEVAULT_STAGING_DIR)\n"
            << "  --max-size <BYTES>    Upload size limit (MAX_FILE_SIZE)\n"
            << "  --bucket <NAME>       Bucket (WASABI_BUCKET)\n"
            << "  --region <REGION>     Region (WASABI_REGION)\n"
            << "  --endpoint <HOST>     Endpoint override (WASABI_ENDPOINT)\n"
            << "  --log <FILE>          Append logs to FILE\n"
            << "  --verbose             Debug output on stderr\n"
            << "  --help, --version\n"
            << "\n"
            << "Credentials are read from WASABI_ACCESS_KEY and WASABI_SECRET_KEY.\n";
        return out.str();
    }

} // namespace filevault::cli
