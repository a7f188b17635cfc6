/**
 * @file error_codes.h
 * @brief Error classification helpers for serial_trans_system
 *
 * Error code ranges:
 * - -100 to -119: Frame Errors
 * - -120 to -139: Transfer Errors
 * - -140 to -159: Channel Errors
 * - -160 to -179: File System Errors
 * - -180 to -199: Configuration Errors
 * - -200 to -219: Internal Errors
 *
 * The range of an error decides its scope: frame errors are recovered by
 * retransmission, transfer and file system errors fail one file task, and
 * channel errors close the whole session.
 */

#ifndef KCENON_SERIAL_TRANSFER_CORE_ERROR_CODES_H
#define KCENON_SERIAL_TRANSFER_CORE_ERROR_CODES_H

#include "types.h"

#include <cstdint>

namespace kcenon::serial_transfer {

[[nodiscard]] constexpr auto to_int(error_code code) noexcept -> int32_t {
    return static_cast<int32_t>(code);
}

/**
 * @brief Check if error code is in frame error range
 */
[[nodiscard]] constexpr auto is_frame_error(int32_t code) noexcept -> bool {
    return code <= -100 && code >= -119;
}

/**
 * @brief Check if error code is in transfer error range
 */
[[nodiscard]] constexpr auto is_transfer_error(int32_t code) noexcept -> bool {
    return code <= -120 && code >= -139;
}

/**
 * @brief Check if error code is in channel error range
 */
[[nodiscard]] constexpr auto is_channel_error(int32_t code) noexcept -> bool {
    return code <= -140 && code >= -159;
}

/**
 * @brief Check if error code is in file system error range
 */
[[nodiscard]] constexpr auto is_file_system_error(int32_t code) noexcept -> bool {
    return code <= -160 && code >= -179;
}

/**
 * @brief Check if error code is in configuration error range
 */
[[nodiscard]] constexpr auto is_config_error(int32_t code) noexcept -> bool {
    return code <= -180 && code >= -199;
}

[[nodiscard]] constexpr auto is_channel_error(error_code code) noexcept -> bool {
    return is_channel_error(to_int(code));
}

[[nodiscard]] constexpr auto is_frame_error(error_code code) noexcept -> bool {
    return is_frame_error(to_int(code));
}

[[nodiscard]] constexpr auto is_file_system_error(error_code code) noexcept -> bool {
    return is_file_system_error(to_int(code));
}

/**
 * @brief Check if a frame should be retransmitted after this error
 *
 * Used on NAK reasons as well: a peer that rejects a frame for one of the
 * non-retryable reasons will reject an identical retransmission too.
 */
[[nodiscard]] constexpr auto is_retryable(int32_t code) noexcept -> bool {
    switch (static_cast<error_code>(code)) {
        case error_code::frame_incomplete:
        case error_code::frame_corrupt:
        case error_code::frame_too_large:
        case error_code::invalid_frame_type:
        case error_code::ack_timeout:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return is_retryable(to_int(code));
}

/**
 * @brief Check if an error must terminate the whole session
 */
[[nodiscard]] constexpr auto is_session_fatal(error_code code) noexcept -> bool {
    return is_channel_error(code) || code == error_code::transfer_cancelled;
}

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_CORE_ERROR_CODES_H
