#include "filevault/service/progress_throttler.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#include "filevault/format.hpp"

namespace filevault::service
{

    namespace
    {
        constexpr int kBarCells = 10;

        double percent_of(std::uint64_t bytes, std::uint64_t total) noexcept
        {
            if (total == 0)
            {
                return 100.0;
            }
            const auto percent = static_cast<double>(bytes) * 100.0 / static_cast<double>(total);
            return std::clamp(percent, 0.0, 100.0);
        }
    } // namespace

    ProgressThrottler::ProgressThrottler(Observer observer, double step_percent)
        : observer_(std::move(observer)), step_percent_(step_percent > 0.0 ? step_percent : 5.0)
    {
    }

    bool ProgressThrottler::sample(std::uint64_t bytes, std::uint64_t total)
    {
        return sample(bytes, total, Clock::now());
    }

    bool ProgressThrottler::sample(std::uint64_t bytes, std::uint64_t total, Clock::time_point now)
    {
        const auto percent = percent_of(bytes, total);
        if (last_percent_)
        {
            if (percent <= *last_percent_)
            {
                return false;
            }
            if (percent - *last_percent_ < step_percent_ && percent < 100.0)
            {
                return false;
            }
        }
        if (backing_off(now))
        {
            pending_ = Sample{bytes, total};
            return false;
        }
        return deliver(percent, bytes, total, now);
    }

    bool ProgressThrottler::flush()
    {
        return flush(Clock::now());
    }

    bool ProgressThrottler::flush(Clock::time_point now)
    {
        if (!pending_ || backing_off(now))
        {
            return false;
        }
        const auto sample = *pending_;
        return deliver(percent_of(sample.bytes, sample.total), sample.bytes, sample.total, now);
    }

    bool ProgressThrottler::deliver(double percent, std::uint64_t bytes, std::uint64_t total, Clock::time_point now)
    {
        resume_at_.reset();
        pending_.reset();

        ProgressUpdate update{.percent = percent, .bytes = bytes, .total = total, .bytes_per_second = 0.0};
        if (last_percent_ && bytes >= last_bytes_)
        {
            const auto elapsed = std::chrono::duration<double>(now - last_time_).count();
            if (elapsed > 0.0)
            {
                update.bytes_per_second = static_cast<double>(bytes - last_bytes_) / elapsed;
            }
        }

        auto result = NotifyResult::failed();
        if (observer_)
        {
            try
            {
                result = observer_(update);
            }
            catch (const std::exception &ex)
            {
                spdlog::debug("Progress notification failed: {}", ex.what());
            }
        }

        if (result.kind == NotifyResult::Kind::RateLimited)
        {
            spdlog::warn("Status display rate limited, pausing progress updates for {}s", result.retry_after.count());
            resume_at_ = now + result.retry_after;
            pending_ = Sample{bytes, total};
            return false;
        }

        last_percent_ = percent;
        last_bytes_ = bytes;
        last_time_ = now;
        ++emitted_;
        return result.kind != NotifyResult::Kind::Failed;
    }

    bool ProgressThrottler::backing_off(Clock::time_point now) const noexcept
    {
        return resume_at_ && now < *resume_at_;
    }

    std::string format_progress(std::string_view action, const ProgressUpdate &update)
    {
        const auto filled = std::clamp(static_cast<int>(update.percent / 10.0), 0, kBarCells);
        std::string bar;
        for (int i = 0; i < kBarCells; ++i)
        {
            bar += i < filled ? "\xE2\x96\x88" : "\xE2\x96\x91"; // █ / ░
        }

        std::ostringstream oss;
        oss << action << "\n\n";
        oss << "Progress: " << std::fixed << std::setprecision(1) << update.percent << "%\n";
        oss << "[" << bar << "]\n";
        oss << format_size(update.bytes) << " / " << format_size(update.total);
        if (update.bytes_per_second > 0.0)
        {
            oss << " \xE2\x80\xA2 " << format_size(static_cast<std::uint64_t>(update.bytes_per_second)) << "/s";
        }
        return oss.str();
    }

} // namespace filevault::service
