#include <asio/io_context.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <unistd.h>

#include "filevault/cli/app.hpp"
#include "filevault/cli/config.hpp"
#include "filevault/crypto.hpp"
#include "filevault/service/lifecycle.hpp"
#include "filevault/service/metadata_store.hpp"
#include "filevault/service/s3_storage.hpp"
#include "filevault/service/transfer_engine.hpp"
#include "filevault/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void configure_logging(const filevault::cli::CliOptions &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console);
        if (options.service.log_file)
        {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.service.log_file->string(), false);
            file->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
            sinks.push_back(file);
        }
        auto logger = std::make_shared<spdlog::logger>("filevault", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace filevault;

    service::ServiceConfig base;
    if (auto env = service::load_environment(base); !env.ok())
    {
        std::cerr << "ERROR: " << to_string(env.code) << std::endl;
        std::cerr << env.message << std::endl;
        return EXIT_FAILURE;
    }

    cli::CliOptions options;
    try
    {
        options = cli::parse_arguments(argc, argv, std::move(base));
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << cli::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (options.show_help)
    {
        std::cout << "FileVault " << version() << "\n"
                  << cli::usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (options.show_version)
    {
        std::cout << "FileVault " << version() << std::endl;
        return EXIT_SUCCESS;
    }

    try
    {
        configure_logging(options);
        spdlog::info("FileVault {} running '{}'", version(), options.command);
        crypto::ensure_sodium_init();

        service::AwsApiGuard aws;
        asio::io_context io_context;

        service::MetadataStore store(options.service.metadata_path);
        store.load();

        service::S3ObjectStorage storage(options.service.storage);
        service::TransferEngine engine(io_context.get_executor(), storage, options.service.worker_threads);
        service::LifecycleCoordinator coordinator(io_context.get_executor(), store, engine,
                                                  {.staging_dir = options.service.staging_dir,
                                                   .max_file_size = options.service.max_file_size,
                                                   .progress_step_percent = options.service.progress_step_percent});

        cli::App app(io_context, coordinator, options, std::cout, std::cin, ::isatty(STDOUT_FILENO) == 1);
        return app.run();
    }
    catch (const std::exception &ex)
    {
        std::cout << "ERROR: " << to_string(ErrorCode::InternalError) << std::endl;
        std::cout << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
