#include "filevault/cli/console.hpp"

#include <algorithm>
#include <exception>
#include <fstream>
#include <ostream>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace filevault::cli
{

    ConsoleStatus::ConsoleStatus(std::ostream &out, bool rewrite) : out_(out), rewrite_(rewrite)
    {
    }

    service::NotifyResult ConsoleStatus::notify(const std::string &text)
    {
        if (!out_)
        {
            return service::NotifyResult::failed();
        }
        if (text == last_)
        {
            return service::NotifyResult::unchanged();
        }

        if (rewrite_ && last_lines_ > 0)
        {
            // Cursor up to the first line of the previous block, then clear to the end.
            out_ << "\x1b[" << last_lines_ << "F\x1b[J";
        }
        out_ << text << '\n' << std::flush;
        if (!out_)
        {
            return service::NotifyResult::failed();
        }

        last_ = text;
        last_lines_ = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
        return service::NotifyResult::delivered();
    }

    LocalFileSource::LocalFileSource(std::filesystem::path source) : source_(std::move(source))
    {
    }

    LocalFileSource::~LocalFileSource()
    {
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void LocalFileSource::receive(const std::filesystem::path &destination, service::ProgressSink progress,
                                  service::StatusHandler done)
    {
        if (worker_.joinable())
        {
            worker_.join();
        }

        worker_ = std::thread([source = source_, destination, progress = std::move(progress),
                               done = std::move(done)]()
                              {
            Status status;
            try
            {
                std::error_code ec;
                const auto total = std::filesystem::file_size(source, ec);
                std::ifstream in(source, std::ios::binary);
                std::ofstream out(destination, std::ios::binary | std::ios::trunc);
                if (ec || !in || !out)
                {
                    status = Status::failure(ErrorCode::TransferFailed,
                                             "Cannot copy " + source.string() + " to " + destination.string());
                }
                else
                {
                    std::vector<char> buffer(kBlockSize);
                    std::uint64_t copied = 0;
                    while (in)
                    {
                        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                        const auto count = in.gcount();
                        if (count <= 0)
                        {
                            break;
                        }
                        out.write(buffer.data(), count);
                        if (!out)
                        {
                            break;
                        }
                        copied += static_cast<std::uint64_t>(count);
                        if (progress)
                        {
                            progress(copied, total);
                        }
                    }
                    out.flush();
                    if (!out || in.bad())
                    {
                        status = Status::failure(ErrorCode::TransferFailed, "I/O error while reading " + source.string());
                    }
                }
            }
            catch (const std::exception &ex)
            {
                status = Status::failure(ErrorCode::TransferFailed, ex.what());
            }
            if (done)
            {
                done(std::move(status));
            } });
    }

    LocalFileDelivery::LocalFileDelivery(std::filesystem::path destination) : destination_(std::move(destination))
    {
    }

    void LocalFileDelivery::deliver(const std::filesystem::path &file, const std::string &caption,
                                    service::StatusHandler done)
    {
        spdlog::debug("Delivering {} to {} ({})", file.string(), destination_.string(), caption);

        std::error_code ec;
        if (std::filesystem::exists(destination_, ec))
        {
            done(Status::failure(ErrorCode::InvalidArgument,
                                 "Refusing to overwrite existing file " + destination_.string()));
            return;
        }
        const auto parent = destination_.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
        }
        if (!ec)
        {
            std::filesystem::copy_file(file, destination_, std::filesystem::copy_options::none, ec);
        }
        if (ec)
        {
            done(Status::failure(ErrorCode::TransferFailed, destination_.string() + ": " + ec.message()));
            return;
        }
        done(Status::success());
    }

} // namespace filevault::cli
