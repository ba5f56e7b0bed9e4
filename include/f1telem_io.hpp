#pragma once

/**
 * @file f1telem_io.hpp
 * @brief Convenience header for telemetry I/O utilities
 *
 * Primary types:
 * - TelemetryListener: Blocking UDP listener returning decoded Packets
 * - SamplePacketStore: Directory of captured sample packets, one per variant
 */

#include "f1telem.hpp"
#include "f1telem/utils/fileio/sample_packet_store.hpp"
#include "f1telem/utils/netio/telemetry_listener.hpp"
#include "f1telem/utils/netio/udp_transport_status.hpp"

namespace f1telem {

// Listener with a caller-chosen receive buffer size
using utils::netio::BasicTelemetryListener;
using utils::netio::UDPTransportStatus;

} // namespace f1telem
