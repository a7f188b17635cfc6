/**
 * @file progress_format.cpp
 * @brief Implementation of progress line rendering
 */

#include <kcenon/serial_transfer/core/progress_format.h>

#include <iomanip>
#include <sstream>

namespace kcenon::serial_transfer {

auto format_eta(const std::optional<duration>& eta) -> std::string {
    if (!eta || eta->count() < 0) {
        return "--:--";
    }

    auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(*eta).count();

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << total_seconds / 60 << ':'
        << std::setw(2) << total_seconds % 60;
    return oss.str();
}

auto format_rate(double bytes_per_second) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << std::setw(7) << bytes_per_second / 1024.0
        << " KB/s";
    return oss.str();
}

auto format_progress_line(const progress_report& report, std::size_t bar_width) -> std::string {
    double fraction = report.completion_percentage() / 100.0;
    if (fraction > 1.0) fraction = 1.0;

    auto filled = static_cast<std::size_t>(static_cast<double>(bar_width) * fraction);

    std::ostringstream oss;
    oss << '[' << std::string(filled, '#') << std::string(bar_width - filled, '-') << "] "
        << std::fixed << std::setprecision(2) << std::setw(6) << fraction * 100.0 << "% "
        << report.bytes_confirmed << '/' << report.total_bytes << " bytes  "
        << format_rate(report.average_rate) << " ETA " << format_eta(report.eta);
    return oss.str();
}

}  // namespace kcenon::serial_transfer
