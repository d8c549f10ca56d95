#pragma once

#include <asio/io_context.hpp>

#include <iosfwd>
#include <optional>
#include <string>

#include "filevault/cli/config.hpp"
#include "filevault/result.hpp"
#include "filevault/service/intent.hpp"
#include "filevault/service/lifecycle.hpp"

namespace filevault::cli
{

    // Runs one command against the coordinator, driving `io_context` on the
    // calling thread until the command's completion handler has run.
    // `interactive` redraws progress in place instead of appending it.
    class App
    {
    public:
        App(asio::io_context &io_context, service::LifecycleCoordinator &coordinator, const CliOptions &options,
            std::ostream &out, std::istream &in, bool interactive = false);

        // Exit code: 0 on success, 1 on failure.
        int run();

        int dispatch(const service::Intent &intent);

    private:
        int upload();
        int download(const std::string &id, const std::optional<std::string> &destination);
        int link(const std::string &id, std::chrono::seconds ttl);
        int share(const std::string &id);
        int copy_id(const std::string &id);
        int copy_url(const std::string &id);
        int remove(const std::string &id);
        int list();
        int test_connection();

        std::optional<service::Intent> intent_from_command();
        bool ask_yes_no(const std::string &question) const;
        void wait();
        int fail(const Status &status) const;
        int fail(ErrorCode code, const std::string &message) const;

        asio::io_context &io_context_;
        service::LifecycleCoordinator &coordinator_;
        const CliOptions &options_;
        std::ostream &out_;
        std::istream &in_;
        bool interactive_;
    };

} // namespace filevault::cli
