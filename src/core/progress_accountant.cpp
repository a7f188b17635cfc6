/**
 * @file progress_accountant.cpp
 * @brief Implementation of confirmed-byte accounting
 */

#include <kcenon/serial_transfer/core/progress_accountant.h>

#include <deque>

namespace kcenon::serial_transfer {

namespace {

struct rate_sample {
    time_point timestamp;
    uint64_t bytes;
};

auto seconds_between(time_point from, time_point to) -> double {
    return std::chrono::duration<double>(to - from).count();
}

}  // namespace

struct progress_accountant::impl {
    config cfg;

    time_point start_time;
    uint64_t total_bytes = 0;
    uint64_t bytes_confirmed = 0;

    // Cumulative byte count at each of the last rate_window_size confirmations,
    // plus the point the window started from
    std::deque<rate_sample> rate_samples;

    impl() : cfg{} {}
    explicit impl(config c) : cfg(c) {
        if (cfg.rate_window_size == 0) {
            cfg.rate_window_size = 1;
        }
    }

    [[nodiscard]] auto calculate_current_rate() const -> double {
        if (rate_samples.size() < 2) {
            return 0.0;
        }

        const auto& oldest = rate_samples.front();
        const auto& newest = rate_samples.back();

        double seconds = seconds_between(oldest.timestamp, newest.timestamp);
        if (seconds <= 0.0) {
            return 0.0;
        }

        return static_cast<double>(newest.bytes - oldest.bytes) / seconds;
    }

    [[nodiscard]] auto calculate_average_rate(time_point now) const -> double {
        double seconds = seconds_between(start_time, now);
        if (seconds <= 0.0) {
            return 0.0;
        }
        return static_cast<double>(bytes_confirmed) / seconds;
    }

    [[nodiscard]] auto calculate_eta(double avg_rate) const -> std::optional<duration> {
        if (bytes_confirmed >= total_bytes) {
            return duration{0};
        }

        if (avg_rate <= 0.0) {
            return std::nullopt;
        }

        uint64_t remaining = total_bytes - bytes_confirmed;
        auto eta_ms = static_cast<int64_t>(static_cast<double>(remaining) * 1000.0 / avg_rate);
        return duration{eta_ms};
    }

    [[nodiscard]] auto make_sample(time_point now) const -> sample {
        sample s;
        s.bytes_confirmed = bytes_confirmed;
        s.total_bytes = total_bytes;
        s.elapsed = std::chrono::duration_cast<duration>(now - start_time);
        s.instantaneous_rate = calculate_current_rate();
        s.average_rate = calculate_average_rate(now);
        s.eta = calculate_eta(s.average_rate);
        return s;
    }
};

progress_accountant::progress_accountant() : impl_(std::make_unique<impl>()) {}

progress_accountant::progress_accountant(config cfg)
    : impl_(std::make_unique<impl>(cfg)) {}

progress_accountant::progress_accountant(progress_accountant&&) noexcept = default;
auto progress_accountant::operator=(progress_accountant&&) noexcept
    -> progress_accountant& = default;
progress_accountant::~progress_accountant() = default;

void progress_accountant::start(uint64_t total_bytes, time_point now) {
    impl_->start_time = now;
    impl_->total_bytes = total_bytes;
    impl_->bytes_confirmed = 0;
    impl_->rate_samples.clear();
    impl_->rate_samples.push_back({now, 0});
}

auto progress_accountant::record_confirmed(uint64_t bytes, time_point now) -> sample {
    impl_->bytes_confirmed += bytes;
    impl_->rate_samples.push_back({now, impl_->bytes_confirmed});

    while (impl_->rate_samples.size() > impl_->cfg.rate_window_size + 1) {
        impl_->rate_samples.pop_front();
    }

    return impl_->make_sample(now);
}

auto progress_accountant::snapshot(time_point now) const -> sample {
    return impl_->make_sample(now);
}

auto progress_accountant::bytes_confirmed() const noexcept -> uint64_t {
    return impl_->bytes_confirmed;
}

auto progress_accountant::total_bytes() const noexcept -> uint64_t {
    return impl_->total_bytes;
}

auto progress_accountant::is_complete() const noexcept -> bool {
    return impl_->bytes_confirmed >= impl_->total_bytes;
}

}  // namespace kcenon::serial_transfer
