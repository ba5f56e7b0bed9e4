#pragma once

// F1TELEM - F1 2021 UDP Telemetry Codec
//
// A header-only C++20 library for decoding and encoding the binary packets
// broadcast by F1 2021 over UDP.
//
// Features:
// - All twelve packet variants of the 2021 wire format (packet format 2021, version 1)
// - Fixed-size, little-endian, unpadded layouts described by static field tables
// - Header peek and dispatch on (packet_format, packet_version, packet_id)
// - Event packets with a code-selected detail union
// - Byte-exact round trip: encode(decode(b)) == b for every registered packet
// - Ordered mapping and canonical text views for presentation

// ====================
// Public API
// ====================

// Core types, constants and errors
#include "f1telem/errors.hpp"
#include "f1telem/types.hpp"

// Generic record engine
#include "f1telem/core/fixed_text.hpp"
#include "f1telem/core/header.hpp"
#include "f1telem/core/record_traits.hpp"
#include "f1telem/core/wire_codec.hpp"

// ====================
// Packets
// ====================

#include "f1telem/packet/car_damage.hpp"
#include "f1telem/packet/car_setup.hpp"
#include "f1telem/packet/car_status.hpp"
#include "f1telem/packet/car_telemetry.hpp"
#include "f1telem/packet/event.hpp"
#include "f1telem/packet/final_classification.hpp"
#include "f1telem/packet/lap_data.hpp"
#include "f1telem/packet/lobby_info.hpp"
#include "f1telem/packet/motion.hpp"
#include "f1telem/packet/participants.hpp"
#include "f1telem/packet/session.hpp"
#include "f1telem/packet/session_history.hpp"

#include "f1telem/packet/packet_variant.hpp"
#include "f1telem/registry.hpp"

// ====================
// Presentation
// ====================

#include "f1telem/format/formatter.hpp"
