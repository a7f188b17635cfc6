/**
 * @file progress_format.h
 * @brief Terminal rendering of progress reports
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_PROGRESS_FORMAT_H
#define KCENON_SERIAL_TRANSFER_CORE_PROGRESS_FORMAT_H

#include <kcenon/serial_transfer/core/progress_accountant.h>

#include <cstddef>
#include <optional>
#include <string>

namespace kcenon::serial_transfer {

/**
 * @brief Format an ETA as "mm:ss", or "--:--" when indeterminate
 *
 * Minutes are not wrapped, so 2 hours renders as "120:00".
 */
[[nodiscard]] auto format_eta(const std::optional<duration>& eta) -> std::string;

/**
 * @brief Format a byte rate as "  12.34 KB/s" (1 KB = 1024 bytes)
 */
[[nodiscard]] auto format_rate(double bytes_per_second) -> std::string;

/**
 * @brief Render a single progress line
 *
 * @code
 * [########--------]  50.00% 2048/4096 bytes     1.95 KB/s ETA 00:01
 * @endcode
 *
 * @param report Progress report to render
 * @param bar_width Number of cells inside the brackets
 */
[[nodiscard]] auto format_progress_line(const progress_report& report,
                                        std::size_t bar_width = 34) -> std::string;

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_PROGRESS_FORMAT_H
