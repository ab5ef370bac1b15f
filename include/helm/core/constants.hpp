#pragma once

#include "../pgn_defs.hpp"
#include "types.hpp"

namespace helm {

    // ─── Address constants (NMEA 2000 / ISO 11783-5) ─────────────────────────────
    inline constexpr Address NULL_ADDRESS = 0xFE;
    inline constexpr Address BROADCAST_ADDRESS = 0xFF;

    // ─── Protocol limits ─────────────────────────────────────────────────────────
    inline constexpr u32 CAN_DATA_LENGTH = 8;
    inline constexpr u32 FAST_PACKET_MAX_DATA = 223;
    inline constexpr u32 FAST_PACKET_TIMEOUT_MS = 750;
    inline constexpr u32 FAST_PACKET_MAX_SESSIONS = 32;
    inline constexpr usize NMEA0183_MAX_LENGTH = 82; // includes $ and CR/LF

    // ─── History retention ───────────────────────────────────────────────────────
    inline constexpr u32 HISTORY_DEFAULT_CAPACITY = 150;
    inline constexpr u32 HISTORY_RECENT_WINDOW_MS = 60'000;
    inline constexpr u32 HISTORY_FOLD_TARGET = 10;

    // ─── Staleness and detection (ms) ────────────────────────────────────────────
    inline constexpr u32 ALARM_STALE_TIMEOUT_MS = 10'000;
    inline constexpr u32 ALARM_TANK_STALE_TIMEOUT_MS = 30'000;
    inline constexpr u32 INSTANCE_TIMEOUT_MS = 30'000;
    inline constexpr u32 DETECTION_GRACE_MS = 5'000;
    inline constexpr u32 DETECTION_THROTTLE_MS = 100;

    // ─── Schedule intervals (ms) ─────────────────────────────────────────────────
    inline constexpr u32 ALARM_EVALUATE_INTERVAL_MS = 1'000;
    inline constexpr u32 HISTORY_PRUNE_INTERVAL_MS = 5'000;
    inline constexpr u32 DETECTION_SCAN_INTERVAL_MS = 1'000;

    // ─── SI conversion factors ───────────────────────────────────────────────────
    inline constexpr f64 PI = 3.14159265358979323846;
    inline constexpr f64 DEG_TO_RAD = PI / 180.0;
    inline constexpr f64 RAD_TO_DEG = 180.0 / PI;
    inline constexpr f64 KELVIN_OFFSET = 273.15;
    inline constexpr f64 KNOTS_TO_MPS = 1852.0 / 3600.0;
    inline constexpr f64 KMH_TO_MPS = 1.0 / 3.6;
    inline constexpr f64 MPH_TO_MPS = 1609.344 / 3600.0;
    inline constexpr f64 FEET_TO_M = 0.3048;
    inline constexpr f64 FATHOM_TO_M = 1.8288;
    inline constexpr f64 NM_TO_M = 1852.0;
    inline constexpr f64 KM_TO_M = 1000.0;
    inline constexpr f64 LITRE_TO_M3 = 0.001;
    inline constexpr f64 BAR_TO_PA = 100'000.0;
    inline constexpr f64 PSI_TO_PA = 6894.757293168;
    inline constexpr f64 LPH_TO_M3PS = 0.001 / 3600.0;

} // namespace helm
