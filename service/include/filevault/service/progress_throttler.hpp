#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace filevault::service
{

    struct ProgressUpdate
    {
        double percent{};
        std::uint64_t bytes{};
        std::uint64_t total{};
        double bytes_per_second{};
    };

    struct NotifyResult
    {
        enum class Kind : std::uint8_t
        {
            Delivered,
            Unchanged,
            RateLimited,
            Failed
        };

        Kind kind{Kind::Delivered};
        std::chrono::seconds retry_after{};

        static NotifyResult delivered() { return {Kind::Delivered, {}}; }
        static NotifyResult unchanged() { return {Kind::Unchanged, {}}; }
        static NotifyResult rate_limited(std::chrono::seconds retry_after) { return {Kind::RateLimited, retry_after}; }
        static NotifyResult failed() { return {Kind::Failed, {}}; }
    };

    // Turns a dense stream of byte counts into at most one notification per
    // `step_percent`, plus a final one at 100%. Samples at or below the last
    // emitted percentage are dropped. Observer failures never propagate; a
    // RateLimited answer pauses delivery for the requested duration. The latest
    // sample held back by a pause stays pending until the next sample after the
    // pause, or until flush().
    class ProgressThrottler
    {
    public:
        using Clock = std::chrono::steady_clock;
        using Observer = std::function<NotifyResult(const ProgressUpdate &)>;

        explicit ProgressThrottler(Observer observer, double step_percent = 5.0);

        // True when the observer was invoked and did not ask to back off.
        bool sample(std::uint64_t bytes, std::uint64_t total);
        bool sample(std::uint64_t bytes, std::uint64_t total, Clock::time_point now);

        // Delivers the pending sample unless still paused. True when delivered.
        bool flush();
        bool flush(Clock::time_point now);

        std::size_t emitted() const noexcept { return emitted_; }
        std::optional<double> last_percent() const noexcept { return last_percent_; }
        bool backing_off(Clock::time_point now) const noexcept;
        bool has_pending() const noexcept { return pending_.has_value(); }
        std::optional<Clock::time_point> resume_at() const noexcept { return resume_at_; }

    private:
        struct Sample
        {
            std::uint64_t bytes{};
            std::uint64_t total{};
        };

        bool deliver(double percent, std::uint64_t bytes, std::uint64_t total, Clock::time_point now);

        Observer observer_;
        double step_percent_;
        std::size_t emitted_{0};
        std::optional<double> last_percent_;
        std::uint64_t last_bytes_{0};
        Clock::time_point last_time_{};
        std::optional<Clock::time_point> resume_at_;
        std::optional<Sample> pending_;
    };

    // Multi-line status text: action, percentage, a 10-cell bar, sizes and speed.
    std::string format_progress(std::string_view action, const ProgressUpdate &update);

} // namespace filevault::service
