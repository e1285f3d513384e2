/**
 * @file p2p_convert.h
 * @brief Main header for p2p_convert_system library
 * @version 0.1.0
 *
 * Include this header to access the sender, the receiver and the transports.
 *
 * @code
 * #include <kcenon/p2p_convert/p2p_convert.h>
 *
 * using namespace kcenon::p2p_convert;
 *
 * auto network = memory_network::create();
 * auto receiver_transport = memory_transport::create(network, {"receiver", "mem://receiver"});
 * auto sender_transport = memory_transport::create(network, {"sender", "mem://sender"});
 *
 * auto receiver = file_receiver::builder()
 *     .with_transport(receiver_transport.value())
 *     .build();
 *
 * auto sender = file_sender::builder()
 *     .with_transport(sender_transport.value())
 *     .build();
 * @endcode
 */

#ifndef KCENON_P2P_CONVERT_P2P_CONVERT_H
#define KCENON_P2P_CONVERT_P2P_CONVERT_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/p2p_convert/core/types.h"
#include "kcenon/p2p_convert/core/transfer_types.h"
#include "kcenon/p2p_convert/core/chunk_codec.h"
#include "kcenon/p2p_convert/core/wire_codec.h"
#include "kcenon/p2p_convert/core/statistics_collector.h"

// Transport
#include "kcenon/p2p_convert/transport/transport_interface.h"
#include "kcenon/p2p_convert/transport/memory_transport.h"

// Conversion
#include "kcenon/p2p_convert/conversion/conversion_service.h"
#include "kcenon/p2p_convert/conversion/format_detector.h"

// Receiver
#include "kcenon/p2p_convert/server/server_types.h"
#include "kcenon/p2p_convert/server/file_receiver.h"

// Sender
#include "kcenon/p2p_convert/client/client_types.h"
#include "kcenon/p2p_convert/client/file_sender.h"

// Adapters
#include "kcenon/p2p_convert/adapters/thread_pool_adapter.h"

namespace kcenon::p2p_convert {

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

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_P2P_CONVERT_H
