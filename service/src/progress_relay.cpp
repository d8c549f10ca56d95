#include "filevault/service/progress_relay.hpp"

#include <asio/post.hpp>

namespace filevault::service
{

    std::shared_ptr<ProgressRelay> ProgressRelay::create(asio::any_io_executor scheduler, Sink sink)
    {
        return std::make_shared<ProgressRelay>(Passkey{}, std::move(scheduler), std::move(sink));
    }

    ProgressRelay::ProgressRelay(Passkey, asio::any_io_executor scheduler, Sink sink)
        : scheduler_(std::move(scheduler)), sink_(std::move(sink))
    {
    }

    void ProgressRelay::publish(std::uint64_t bytes, std::uint64_t total)
    {
        {
            std::lock_guard lock(mutex_);
            if (closed_)
            {
                return;
            }
            if (!latest_ || bytes >= latest_->bytes || total != latest_->total)
            {
                latest_ = Sample{bytes, total};
            }
            if (drain_pending_)
            {
                return;
            }
            drain_pending_ = true;
        }
        asio::post(scheduler_, [self = shared_from_this()]()
                   { self->drain(); });
    }

    void ProgressRelay::flush()
    {
        std::optional<Sample> sample;
        {
            std::lock_guard lock(mutex_);
            sample = take_locked();
        }
        if (sample && sink_)
        {
            sink_(sample->bytes, sample->total);
        }
    }

    void ProgressRelay::close()
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        latest_.reset();
    }

    void ProgressRelay::drain()
    {
        std::optional<Sample> sample;
        {
            std::lock_guard lock(mutex_);
            drain_pending_ = false;
            sample = take_locked();
        }
        if (sample && sink_)
        {
            sink_(sample->bytes, sample->total);
        }
    }

    std::optional<ProgressRelay::Sample> ProgressRelay::take_locked()
    {
        if (closed_)
        {
            return std::nullopt;
        }
        auto sample = latest_;
        latest_.reset();
        return sample;
    }

} // namespace filevault::service
