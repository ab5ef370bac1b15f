#pragma once

#include "core/types.hpp"
#include <datapod/datapod.hpp>

namespace helm {

    // ═════════════════════════════════════════════════════════════════════════════
    // NMEA 2000 PGN DEFINITIONS
    // ═════════════════════════════════════════════════════════════════════════════

    // ─── Navigation / GNSS ───────────────────────────────────────────────────────
    inline constexpr PGN PGN_GNSS_POSITION_RAPID = 129025; // Position, Rapid Update (8B)
    inline constexpr PGN PGN_GNSS_COG_SOG_RAPID = 129026;  // COG & SOG, Rapid Update (8B)
    inline constexpr PGN PGN_GNSS_POSITION_DATA = 129029;  // GNSS Position Data (FP, 43+B)
    inline constexpr PGN PGN_HEADING_TRACK = 127250;       // Vessel Heading (8B)
    inline constexpr PGN PGN_RATE_OF_TURN = 127251;        // Rate of Turn (8B)
    inline constexpr PGN PGN_ATTITUDE = 127257;            // Yaw/Pitch/Roll (8B)
    inline constexpr PGN PGN_MAGNETIC_VARIATION = 127258;  // Magnetic Variation (8B)
    inline constexpr PGN PGN_XTE = 129283;                 // Cross Track Error (6B)
    inline constexpr PGN PGN_NAVIGATION_DATA = 129284;     // Navigation Data (FP, 34B)

    // ─── Steering / Autopilot ────────────────────────────────────────────────────
    inline constexpr PGN PGN_HEADING_TRACK_CONTROL = 127237; // FP, 21B
    inline constexpr PGN PGN_RUDDER = 127245;

    // ─── Engine / Propulsion ─────────────────────────────────────────────────────
    inline constexpr PGN PGN_ENGINE_PARAMS_RAPID = 127488;
    inline constexpr PGN PGN_ENGINE_PARAMS_DYNAMIC = 127489; // FP, 26B

    // ─── Electrical / Tanks ──────────────────────────────────────────────────────
    inline constexpr PGN PGN_FLUID_LEVEL = 127505;
    inline constexpr PGN PGN_DC_DETAILED_STATUS = 127506; // FP, 11B
    inline constexpr PGN PGN_BATTERY_STATUS = 127508;

    // ─── Speed / Distance / Depth ────────────────────────────────────────────────
    inline constexpr PGN PGN_SPEED_WATER = 128259;
    inline constexpr PGN PGN_WATER_DEPTH = 128267;
    inline constexpr PGN PGN_DISTANCE_LOG = 128275; // FP, 14B

    // ─── Environment ─────────────────────────────────────────────────────────────
    inline constexpr PGN PGN_WIND_DATA = 130306;
    inline constexpr PGN PGN_OUTSIDE_ENVIRONMENTAL = 130310;
    inline constexpr PGN PGN_ENVIRONMENTAL_PARAMS = 130311;
    inline constexpr PGN PGN_TEMPERATURE = 130312;
    inline constexpr PGN PGN_HUMIDITY = 130313;
    inline constexpr PGN PGN_PRESSURE = 130314;
    inline constexpr PGN PGN_TEMPERATURE_EXT = 130316;

    // ─── Proprietary (Raymarine SeaTalk-NG, manufacturer 1851) ──────────────────
    inline constexpr PGN PGN_SEATALK_PILOT_HEADING = 65359;        // 0xFF4F
    inline constexpr PGN PGN_SEATALK_PILOT_LOCKED_HEADING = 65360; // 0xFF50
    inline constexpr PGN PGN_SEATALK_PILOT_MODE = 65379;           // 0xFF63
    inline constexpr u16 MANUFACTURER_RAYMARINE = 1851;
    inline constexpr u8 INDUSTRY_MARINE = 4;

    // ─── Other fast-packet PGNs seen on typical networks ────────────────────────
    inline constexpr PGN PGN_GROUP_FUNCTION = 126208;
    inline constexpr PGN PGN_PRODUCT_INFO = 126996;
    inline constexpr PGN PGN_CONFIG_INFO = 126998;
    inline constexpr PGN PGN_ROUTE_WP_INFO = 129285;
    inline constexpr PGN PGN_AIS_CLASS_A_POSITION = 129038;
    inline constexpr PGN PGN_AIS_CLASS_B_POSITION = 129039;
    inline constexpr PGN PGN_GNSS_SATS_IN_VIEW = 129540;

    // ─── PGN metadata ────────────────────────────────────────────────────────────
    struct PGNInfo {
        PGN pgn;
        const char *name;
        u32 min_length; // bytes required by the decoder
        bool fast_packet;
    };

    inline constexpr PGNInfo PGN_TABLE[] = {
        {PGN_HEADING_TRACK_CONTROL, "Heading/Track Control", 21, true},
        {PGN_RUDDER, "Rudder", 6, false},
        {PGN_HEADING_TRACK, "Vessel Heading", 8, false},
        {PGN_RATE_OF_TURN, "Rate of Turn", 5, false},
        {PGN_ATTITUDE, "Attitude", 7, false},
        {PGN_MAGNETIC_VARIATION, "Magnetic Variation", 6, false},
        {PGN_ENGINE_PARAMS_RAPID, "Engine Parameters, Rapid", 8, false},
        {PGN_ENGINE_PARAMS_DYNAMIC, "Engine Parameters, Dynamic", 26, true},
        {PGN_FLUID_LEVEL, "Fluid Level", 7, false},
        {PGN_DC_DETAILED_STATUS, "DC Detailed Status", 9, true},
        {PGN_BATTERY_STATUS, "Battery Status", 7, false},
        {PGN_SPEED_WATER, "Speed", 5, false},
        {PGN_WATER_DEPTH, "Water Depth", 7, false},
        {PGN_DISTANCE_LOG, "Distance Log", 14, true},
        {PGN_GNSS_POSITION_RAPID, "Position, Rapid Update", 8, false},
        {PGN_GNSS_COG_SOG_RAPID, "COG & SOG, Rapid Update", 6, false},
        {PGN_GNSS_POSITION_DATA, "GNSS Position Data", 43, true},
        {PGN_XTE, "Cross Track Error", 6, false},
        {PGN_NAVIGATION_DATA, "Navigation Data", 34, true},
        {PGN_WIND_DATA, "Wind Data", 6, false},
        {PGN_OUTSIDE_ENVIRONMENTAL, "Environmental Parameters (Outside)", 7, false},
        {PGN_ENVIRONMENTAL_PARAMS, "Environmental Parameters", 8, false},
        {PGN_TEMPERATURE, "Temperature", 5, false},
        {PGN_HUMIDITY, "Humidity", 5, false},
        {PGN_PRESSURE, "Actual Pressure", 7, false},
        {PGN_TEMPERATURE_EXT, "Temperature, Extended Range", 6, false},
        {PGN_SEATALK_PILOT_HEADING, "SeaTalk: Pilot Heading", 7, false},
        {PGN_SEATALK_PILOT_LOCKED_HEADING, "SeaTalk: Pilot Locked Heading", 7, false},
        {PGN_SEATALK_PILOT_MODE, "SeaTalk: Pilot Mode", 7, false},
        // Transported but not decoded
        {PGN_GROUP_FUNCTION, "NMEA Group Function", 0, true},
        {PGN_PRODUCT_INFO, "Product Information", 0, true},
        {PGN_CONFIG_INFO, "Configuration Information", 0, true},
        {PGN_ROUTE_WP_INFO, "Route/WP Information", 0, true},
        {PGN_AIS_CLASS_A_POSITION, "AIS Class A Position Report", 0, true},
        {PGN_AIS_CLASS_B_POSITION, "AIS Class B Position Report", 0, true},
        {PGN_GNSS_SATS_IN_VIEW, "GNSS Sats in View", 0, true},
    };

    inline constexpr usize PGN_TABLE_SIZE = sizeof(PGN_TABLE) / sizeof(PGN_TABLE[0]);

    // ─── PGN utility functions ───────────────────────────────────────────────────
    inline dp::Optional<PGNInfo> pgn_lookup(PGN pgn) noexcept {
        for (usize i = 0; i < PGN_TABLE_SIZE; ++i) {
            if (PGN_TABLE[i].pgn == pgn) {
                return PGN_TABLE[i];
            }
        }
        return dp::nullopt;
    }

    inline bool pgn_is_fast_packet(PGN pgn) noexcept {
        auto info = pgn_lookup(pgn);
        return info.has_value() && info->fast_packet;
    }

    inline bool pgn_is_proprietary(PGN pgn) noexcept {
        return (pgn >= 0xEF00 && pgn <= 0xEFFF) || (pgn >= 0xFF00 && pgn <= 0xFFFF) ||
               (pgn >= 0x1EF00 && pgn <= 0x1EFFF) || (pgn >= 0x1FF00 && pgn <= 0x1FFFF);
    }

} // namespace helm
