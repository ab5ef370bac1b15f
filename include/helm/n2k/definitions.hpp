#pragma once

// ─── NMEA 2000 Definitions ─────────────────────────────────────────────────────
// Resolution constants, not-available sentinels, enumerations and typed
// payload structures for the PGNs the decoder understands. Every quantity is
// SI. A field the sender marks "not available" is an empty Optional.
// ─────────────────────────────────────────────────────────────────────────────────

#include "../core/constants.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace helm {
    namespace n2k {

        // ═════════════════════════════════════════════════════════════════════════════
        // RESOLUTIONS
        // ═════════════════════════════════════════════════════════════════════════════
        inline constexpr f64 RES_VOLTAGE = 0.01;          // V
        inline constexpr f64 RES_CURRENT = 0.1;           // A
        inline constexpr f64 RES_TEMPERATURE = 0.01;      // K
        inline constexpr f64 RES_TEMPERATURE_FINE = 0.001; // K (u24)
        inline constexpr f64 RES_TEMPERATURE_OIL = 0.1;   // K
        inline constexpr f64 RES_DEPTH = 0.01;            // m
        inline constexpr f64 RES_DEPTH_OFFSET = 0.001;    // m
        inline constexpr f64 RES_ANGLE = 0.0001;          // rad
        inline constexpr f64 RES_SPEED = 0.01;            // m/s
        inline constexpr f64 RES_RPM = 0.25;              // rpm
        inline constexpr f64 RES_ENGINE_PRESSURE = 100.0; // Pa
        inline constexpr f64 RES_FUEL_PRESSURE = 1000.0;  // Pa
        inline constexpr f64 RES_ENV_PRESSURE = 100.0;    // Pa (u16)
        inline constexpr f64 RES_ACTUAL_PRESSURE = 0.1;   // Pa (i32)
        inline constexpr f64 RES_FLUID_LEVEL = 0.004;     // %
        inline constexpr f64 RES_HUMIDITY = 0.004;        // %
        inline constexpr f64 RES_CAPACITY = 0.1;          // L
        inline constexpr f64 RES_FUEL_RATE = 0.1;         // L/h
        inline constexpr f64 RES_RATE_OF_TURN = 3.125e-8; // rad/s
        inline constexpr f64 RES_LAT_LON_RAPID = 1e-7;    // deg
        inline constexpr f64 RES_LAT_LON_PRECISE = 1e-16; // deg
        inline constexpr f64 RES_ALTITUDE = 1e-6;         // m
        inline constexpr f64 RES_XTE = 0.01;              // m
        inline constexpr f64 RES_DISTANCE = 0.01;         // m
        inline constexpr f64 RES_DOP = 0.01;
        inline constexpr f64 RES_TIME_OF_DAY = 0.0001; // s

        // ═════════════════════════════════════════════════════════════════════════════
        // NOT-AVAILABLE AWARE FIELD READERS
        // The top two codes of each unsigned width (all-ones "not available" and
        // all-ones-minus-one "out of range") read as absent; for signed widths the
        // two largest positive codes do.
        // ═════════════════════════════════════════════════════════════════════════════
        inline dp::Optional<f64> read_u8(const Message &m, usize offset, f64 resolution = 1.0) {
            u8 raw = m.get_u8(offset);
            if (raw >= 0xFE)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_i8(const Message &m, usize offset, f64 resolution = 1.0) {
            i8 raw = m.get_i8(offset);
            if (raw >= 0x7E)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_u16(const Message &m, usize offset, f64 resolution = 1.0) {
            u16 raw = m.get_u16_le(offset);
            if (raw >= 0xFFFE)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_i16(const Message &m, usize offset, f64 resolution = 1.0) {
            i16 raw = m.get_i16_le(offset);
            if (raw >= 0x7FFE)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_u24(const Message &m, usize offset, f64 resolution = 1.0) {
            u32 raw = m.get_u24_le(offset);
            if (raw >= 0xFFFFFE)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_u32(const Message &m, usize offset, f64 resolution = 1.0) {
            u32 raw = m.get_u32_le(offset);
            if (raw >= 0xFFFFFFFE)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_i32(const Message &m, usize offset, f64 resolution = 1.0) {
            i32 raw = m.get_i32_le(offset);
            if (raw >= 0x7FFFFFFE)
                return dp::nullopt;
            return raw * resolution;
        }

        inline dp::Optional<f64> read_i64(const Message &m, usize offset, f64 resolution = 1.0) {
            i64 raw = m.get_i64_le(offset);
            if (raw >= 0x7FFFFFFFFFFFFFFE)
                return dp::nullopt;
            return static_cast<f64>(raw) * resolution;
        }

        // ═════════════════════════════════════════════════════════════════════════════
        // ENUMERATION TYPES
        // ═════════════════════════════════════════════════════════════════════════════

        enum class HeadingReference : u8 { True = 0, Magnetic = 1, Error = 2, Unavailable = 3 };

        enum class WindReference : u8 {
            TrueNorth = 0,
            Magnetic = 1,
            Apparent = 2,
            TrueBoat = 3,
            TrueWater = 4,
            Error = 6,
            Unavailable = 7
        };

        enum class TemperatureSource : u8 {
            Sea = 0,
            Outside = 1,
            Inside = 2,
            EngineRoom = 3,
            MainCabin = 4,
            LiveWell = 5,
            BaitWell = 6,
            Refrigeration = 7,
            Heating = 8,
            DewPoint = 9,
            ApparentWindChill = 10,
            TheoreticalWindChill = 11,
            HeatIndex = 12,
            Freezer = 13,
            ExhaustGas = 14,
        };

        inline const char *temperature_source_name(TemperatureSource s) noexcept {
            switch (s) {
            case TemperatureSource::Sea:
                return "sea";
            case TemperatureSource::Outside:
                return "outside";
            case TemperatureSource::Inside:
                return "inside";
            case TemperatureSource::EngineRoom:
                return "engine_room";
            case TemperatureSource::MainCabin:
                return "cabin";
            case TemperatureSource::LiveWell:
                return "live_well";
            case TemperatureSource::BaitWell:
                return "bait_well";
            case TemperatureSource::Refrigeration:
                return "refrigeration";
            case TemperatureSource::Heating:
                return "heating";
            case TemperatureSource::DewPoint:
                return "dew_point";
            case TemperatureSource::ApparentWindChill:
                return "apparent_wind_chill";
            case TemperatureSource::TheoreticalWindChill:
                return "theoretical_wind_chill";
            case TemperatureSource::HeatIndex:
                return "heat_index";
            case TemperatureSource::Freezer:
                return "freezer";
            case TemperatureSource::ExhaustGas:
                return "exhaust";
            }
            return "unknown";
        }

        enum class FluidType : u8 {
            Fuel = 0,
            Water = 1,
            GrayWater = 2,
            LiveWell = 3,
            Oil = 4,
            BlackWater = 5,
            FuelGasoline = 6,
            Unavailable = 15
        };

        inline const char *fluid_type_name(FluidType t) noexcept {
            switch (t) {
            case FluidType::Fuel:
                return "fuel";
            case FluidType::Water:
                return "water";
            case FluidType::GrayWater:
                return "gray_water";
            case FluidType::LiveWell:
                return "live_well";
            case FluidType::Oil:
                return "oil";
            case FluidType::BlackWater:
                return "black_water";
            case FluidType::FuelGasoline:
                return "gasoline";
            case FluidType::Unavailable:
                return "unavailable";
            }
            return "unknown";
        }

        enum class SteeringMode : u8 {
            MainSteering = 0,
            NonFollowUp = 1,
            FollowUp = 2,
            HeadingStandalone = 3,
            HeadingControl = 4,
            TrackControl = 5,
            Unavailable = 7
        };

        inline const char *steering_mode_name(SteeringMode m) noexcept {
            switch (m) {
            case SteeringMode::MainSteering:
                return "standby";
            case SteeringMode::NonFollowUp:
                return "non_follow_up";
            case SteeringMode::FollowUp:
                return "follow_up";
            case SteeringMode::HeadingStandalone:
            case SteeringMode::HeadingControl:
                return "auto";
            case SteeringMode::TrackControl:
                return "track";
            case SteeringMode::Unavailable:
                return "unavailable";
            }
            return "unknown";
        }

        // Raymarine pilot mode words (PGN 65379), from community captures
        enum class PilotMode : u16 {
            Standby = 0x0000,
            Auto = 0x0040,
            Wind = 0x0100,
            Track = 0x0180,
            NoDrift = 0x0181,
        };

        inline const char *pilot_mode_name(PilotMode m) noexcept {
            switch (m) {
            case PilotMode::Standby:
                return "standby";
            case PilotMode::Auto:
                return "auto";
            case PilotMode::Wind:
                return "wind";
            case PilotMode::Track:
                return "track";
            case PilotMode::NoDrift:
                return "no_drift";
            }
            return "unknown";
        }

        // How much a decoded layout can be trusted
        enum class Confidence : u8 {
            Documented,        // published standard layout
            ReverseEngineered, // vendor-proprietary, community-derived
        };

        // ═════════════════════════════════════════════════════════════════════════════
        // TYPED PGN PAYLOADS
        // ═════════════════════════════════════════════════════════════════════════════

        // PGN 127245
        struct RudderData {
            u8 instance = 0;
            dp::Optional<f64> angle_order_rad;
            dp::Optional<f64> position_rad;
        };

        // PGN 127250
        struct VesselHeadingData {
            dp::Optional<f64> heading_rad;
            dp::Optional<f64> deviation_rad;
            dp::Optional<f64> variation_rad;
            HeadingReference reference = HeadingReference::Unavailable;
        };

        // PGN 127251
        struct RateOfTurnData {
            dp::Optional<f64> rate_radps;
        };

        // PGN 127257
        struct AttitudeData {
            dp::Optional<f64> yaw_rad;
            dp::Optional<f64> pitch_rad;
            dp::Optional<f64> roll_rad;
        };

        // PGN 127258
        struct MagneticVariationData {
            dp::Optional<f64> variation_rad;
        };

        // PGN 127488
        struct EngineRapidData {
            u8 instance = 0;
            dp::Optional<f64> rpm;
            dp::Optional<f64> boost_pressure_pa;
            dp::Optional<f64> tilt_trim_ratio;
        };

        // PGN 127489
        struct EngineDynamicData {
            u8 instance = 0;
            dp::Optional<f64> oil_pressure_pa;
            dp::Optional<f64> oil_temperature_k;
            dp::Optional<f64> coolant_temperature_k;
            dp::Optional<f64> alternator_voltage_v;
            dp::Optional<f64> fuel_rate_m3ps;
            dp::Optional<f64> engine_hours_s;
            dp::Optional<f64> coolant_pressure_pa;
            dp::Optional<f64> fuel_pressure_pa;
            dp::Optional<f64> load_ratio;
            dp::Optional<f64> torque_ratio;
        };

        // PGN 127505
        struct FluidLevelData {
            u8 instance = 0;
            FluidType type = FluidType::Unavailable;
            dp::Optional<f64> level_ratio;
            dp::Optional<f64> capacity_m3;
        };

        // PGN 127506
        struct DcDetailedData {
            u8 instance = 0;
            u8 dc_type = 0;
            dp::Optional<f64> state_of_charge_ratio;
            dp::Optional<f64> state_of_health_ratio;
            dp::Optional<f64> time_remaining_s;
            dp::Optional<f64> ripple_voltage_v;
            dp::Optional<f64> capacity_ah;
        };

        // PGN 127508
        struct BatteryStatusData {
            u8 instance = 0;
            dp::Optional<f64> voltage_v;
            dp::Optional<f64> current_a;
            dp::Optional<f64> temperature_k;
        };

        // PGN 128259
        struct SpeedWaterData {
            dp::Optional<f64> water_mps;
            dp::Optional<f64> ground_mps;
        };

        // PGN 128267
        struct WaterDepthData {
            dp::Optional<f64> depth_m;
            dp::Optional<f64> offset_m;
            dp::Optional<f64> max_range_m;
        };

        // PGN 128275
        struct DistanceLogData {
            dp::Optional<f64> log_m;
            dp::Optional<f64> trip_m;
        };

        // PGN 129025
        struct PositionRapidData {
            dp::Optional<f64> latitude_deg;
            dp::Optional<f64> longitude_deg;
        };

        // PGN 129026
        struct CogSogData {
            HeadingReference reference = HeadingReference::Unavailable;
            dp::Optional<f64> cog_rad;
            dp::Optional<f64> sog_mps;
        };

        // PGN 129029
        struct GnssPositionData {
            dp::Optional<f64> utc_seconds;
            dp::Optional<u16> days_since_epoch;
            dp::Optional<f64> latitude_deg;
            dp::Optional<f64> longitude_deg;
            dp::Optional<f64> altitude_m;
            u8 method = 0; // 0 = no fix
            dp::Optional<u8> satellites;
            dp::Optional<f64> hdop;
            dp::Optional<f64> pdop;
        };

        // PGN 129283
        struct XteData {
            dp::Optional<f64> xte_m;
            bool navigation_terminated = false;
        };

        // PGN 129284
        struct NavigationData {
            dp::Optional<f64> distance_to_waypoint_m;
            dp::Optional<f64> bearing_to_waypoint_rad;
            HeadingReference reference = HeadingReference::Unavailable;
            dp::Optional<f64> closing_velocity_mps;
            bool arrival_circle_entered = false;
        };

        // PGN 130306
        struct WindData {
            dp::Optional<f64> speed_mps;
            dp::Optional<f64> angle_rad;
            WindReference reference = WindReference::Unavailable;
        };

        // PGN 130310
        struct OutsideEnvironmentData {
            dp::Optional<f64> water_temperature_k;
            dp::Optional<f64> air_temperature_k;
            dp::Optional<f64> pressure_pa;
        };

        // PGN 130311
        struct EnvironmentData {
            TemperatureSource temperature_source = TemperatureSource::Outside;
            dp::Optional<f64> temperature_k;
            dp::Optional<f64> humidity_ratio;
            dp::Optional<f64> pressure_pa;
        };

        // PGN 130312 / 130316
        struct TemperatureData {
            u8 instance = 0;
            TemperatureSource source = TemperatureSource::Sea;
            dp::Optional<f64> actual_k;
            dp::Optional<f64> set_k;
        };

        // PGN 130313
        struct HumidityData {
            u8 instance = 0;
            dp::Optional<f64> actual_ratio;
        };

        // PGN 130314
        struct PressureData {
            u8 instance = 0;
            dp::Optional<f64> pressure_pa;
        };

        // PGN 127237
        struct HeadingTrackControlData {
            SteeringMode mode = SteeringMode::Unavailable;
            dp::Optional<f64> commanded_rudder_rad;
            dp::Optional<f64> heading_to_steer_rad;
            dp::Optional<f64> vessel_heading_rad;
            HeadingReference reference = HeadingReference::Unavailable;
            Confidence confidence = Confidence::Documented;
        };

        // PGN 65359 / 65360 / 65379 (Raymarine)
        struct PilotData {
            dp::Optional<PilotMode> mode;
            dp::Optional<f64> heading_true_rad;
            dp::Optional<f64> heading_magnetic_rad;
            dp::Optional<f64> locked_true_rad;
            dp::Optional<f64> locked_magnetic_rad;
            Confidence confidence = Confidence::ReverseEngineered;
            bool validated = false; // manufacturer/industry header matched
        };

    } // namespace n2k
    using namespace n2k;
} // namespace helm
