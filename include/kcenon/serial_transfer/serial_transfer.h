/**
 * @file serial_transfer.h
 * @brief Main header for serial_trans_system library
 * @version 0.1.0
 *
 * This is the primary include file for the serial_trans_system library.
 * Include this header to access all serial transfer functionality.
 *
 * @code
 * #include <kcenon/serial_transfer/serial_transfer.h>
 *
 * using namespace kcenon::serial_transfer;
 *
 * auto channel = serial_channel::open({"/dev/ttyUSB0", 115200});
 *
 * auto session = transfer_session::builder()
 *     .with_mode(session_mode::recv)
 *     .with_output_directory("/tmp/incoming")
 *     .build();
 * @endcode
 */

#ifndef KCENON_SERIAL_TRANSFER_SERIAL_TRANSFER_H
#define KCENON_SERIAL_TRANSFER_SERIAL_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/serial_transfer/core/types.h"
#include "kcenon/serial_transfer/core/error_codes.h"
#include "kcenon/serial_transfer/core/progress_format.h"

// Transport
#include "kcenon/serial_transfer/transport/byte_channel.h"
#include "kcenon/serial_transfer/transport/serial_channel.h"
#include "kcenon/serial_transfer/transport/memory_channel.h"

// Session
#include "kcenon/serial_transfer/session/session_config.h"
#include "kcenon/serial_transfer/session/session_types.h"
#include "kcenon/serial_transfer/session/transfer_session.h"

namespace kcenon::serial_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::serial_transfer

#endif  // KCENON_SERIAL_TRANSFER_SERIAL_TRANSFER_H
