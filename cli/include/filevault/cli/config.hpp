#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "filevault/service/config.hpp"

namespace filevault::cli
{

    struct CliOptions
    {
        service::ServiceConfig service;
        std::string command;
        std::vector<std::string> arguments;
        std::optional<std::string> name;
        std::optional<std::string> mime_type;
        std::optional<std::chrono::seconds> ttl;
        bool player{false};
        bool assume_yes{false};
        bool json{false};
        bool verbose{false};
        bool show_help{false};
        bool show_version{false};
    };

    // Global and command flags may appear anywhere. Values in `base` (defaults
    // plus environment) are overridden by flags. Throws std::runtime_error on
    // malformed input.
    CliOptions parse_arguments(int argc, char *argv[], service::ServiceConfig base);

    std::string usage(const char *program_name);

} // namespace filevault::cli
