/**
 * @file progress_accountant.h
 * @brief Confirmed-byte accounting, transfer rate and ETA for one file
 *
 * The accountant only counts bytes the peer has acknowledged, so the
 * reported progress never runs ahead of what actually arrived.
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_PROGRESS_ACCOUNTANT_H
#define KCENON_SERIAL_TRANSFER_CORE_PROGRESS_ACCOUNTANT_H

#include <kcenon/serial_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::serial_transfer {

using duration = std::chrono::milliseconds;
using time_point = std::chrono::steady_clock::time_point;

/**
 * @brief Progress notification emitted once per confirmed chunk
 */
struct progress_report {
    std::string filename;
    transfer_direction direction = transfer_direction::send;
    uint64_t bytes_confirmed = 0;
    uint64_t total_bytes = 0;
    double instantaneous_rate = 0.0;  ///< bytes/sec over the rolling window
    double average_rate = 0.0;        ///< bytes/sec since the file started
    std::optional<duration> eta;      ///< empty while the rate is unknown

    [[nodiscard]] auto completion_percentage() const -> double {
        if (total_bytes == 0) return 100.0;
        return static_cast<double>(bytes_confirmed) / static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Rolling-window throughput accounting for one file task
 *
 * Not thread-safe; owned by the sub-protocol driving the file.
 *
 * @code
 * progress_accountant accountant;
 * accountant.start(meta.file_size);
 *
 * // after each ACK
 * auto s = accountant.record_confirmed(chunk_bytes);
 * if (s.eta) show(*s.eta);
 * @endcode
 */
class progress_accountant {
public:
    struct config {
        std::size_t rate_window_size = 8;  ///< Confirmations in the rolling window
    };

    struct sample {
        uint64_t bytes_confirmed = 0;
        uint64_t total_bytes = 0;
        duration elapsed{0};
        double instantaneous_rate = 0.0;
        double average_rate = 0.0;
        std::optional<duration> eta;
    };

    progress_accountant();
    explicit progress_accountant(config cfg);

    progress_accountant(const progress_accountant&) = delete;
    auto operator=(const progress_accountant&) -> progress_accountant& = delete;
    progress_accountant(progress_accountant&&) noexcept;
    auto operator=(progress_accountant&&) noexcept -> progress_accountant&;

    ~progress_accountant();

    /**
     * @brief Begin accounting for a file of @p total_bytes
     */
    void start(uint64_t total_bytes, time_point now = std::chrono::steady_clock::now());

    /**
     * @brief Record one confirmed chunk
     * @return Updated sample
     */
    auto record_confirmed(uint64_t bytes, time_point now = std::chrono::steady_clock::now())
        -> sample;

    [[nodiscard]] auto snapshot(time_point now = std::chrono::steady_clock::now()) const
        -> sample;

    [[nodiscard]] auto bytes_confirmed() const noexcept -> uint64_t;

    [[nodiscard]] auto total_bytes() const noexcept -> uint64_t;

    [[nodiscard]] auto is_complete() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Build the report for @p name from an accountant sample
 */
[[nodiscard]] inline auto make_progress_report(std::string name,
                                               transfer_direction direction,
                                               const progress_accountant::sample& s)
    -> progress_report {
    progress_report report;
    report.filename = std::move(name);
    report.direction = direction;
    report.bytes_confirmed = s.bytes_confirmed;
    report.total_bytes = s.total_bytes;
    report.instantaneous_rate = s.instantaneous_rate;
    report.average_rate = s.average_rate;
    report.eta = s.eta;
    return report;
}

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_PROGRESS_ACCOUNTANT_H
