/**
 * @file session_types.h
 * @brief Session state, per-file results and callbacks
 */

#ifndef KCENON_SERIAL_TRANSFER_SESSION_SESSION_TYPES_H
#define KCENON_SERIAL_TRANSFER_SESSION_SESSION_TYPES_H

#include <kcenon/serial_transfer/core/progress_accountant.h>
#include <kcenon/serial_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::serial_transfer {

/**
 * @brief Session lifecycle state
 */
enum class session_state {
    idle,       ///< Started, nothing to do yet
    handshake,  ///< Waiting for the peer to confirm HELLO
    sending,    ///< A file is being sent
    receiving,  ///< A file is being received
    listening,  ///< Waiting for the peer to offer a file
    closed      ///< Terminal
};

[[nodiscard]] constexpr auto to_string(session_state state) noexcept -> const char* {
    switch (state) {
        case session_state::idle: return "idle";
        case session_state::handshake: return "handshake";
        case session_state::sending: return "sending";
        case session_state::receiving: return "receiving";
        case session_state::listening: return "listening";
        case session_state::closed: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Outcome of one file task
 */
struct file_transfer_result {
    std::string filename;
    std::filesystem::path path;  ///< Source path (send) or written path (receive)
    transfer_direction direction = transfer_direction::send;
    bool success = false;
    uint64_t bytes_confirmed = 0;
    uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<struct error> failure;  ///< Set when success is false
};

/**
 * @brief What a finished session did
 */
struct session_summary {
    std::vector<file_transfer_result> files;
    uint64_t frames_retransmitted = 0;
    uint64_t corrupt_frames = 0;
    bool cancelled = false;

    [[nodiscard]] auto succeeded_count() const -> std::size_t {
        std::size_t count = 0;
        for (const auto& f : files) {
            if (f.success) ++count;
        }
        return count;
    }

    [[nodiscard]] auto failed_count() const -> std::size_t {
        return files.size() - succeeded_count();
    }

    [[nodiscard]] auto all_succeeded() const -> bool { return failed_count() == 0; }

    /**
     * @brief Failed files that were only cut short by stop()
     */
    [[nodiscard]] auto interrupted_count() const -> std::size_t {
        if (!cancelled) {
            return 0;
        }
        std::size_t count = 0;
        for (const auto& f : files) {
            if (!f.success && f.failure && f.failure->code == error_code::transfer_cancelled) {
                ++count;
            }
        }
        return count;
    }

    /**
     * @brief True when some file failed for a reason other than stop()
     */
    [[nodiscard]] auto has_errors() const -> bool {
        return failed_count() > interrupted_count();
    }
};

using progress_callback = std::function<void(const progress_report&)>;
using file_complete_callback = std::function<void(const file_transfer_result&)>;
using state_changed_callback = std::function<void(session_state)>;

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SESSION_SESSION_TYPES_H
