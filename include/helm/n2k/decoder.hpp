#pragma once

#include "../core/error.hpp"
#include "../core/message.hpp"
#include "../pgn_defs.hpp"
#include "definitions.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <variant>

namespace helm {
    namespace n2k {

        struct UnhandledPgn {};

        using PgnPayload =
            std::variant<UnhandledPgn, RudderData, VesselHeadingData, RateOfTurnData, AttitudeData,
                         MagneticVariationData, EngineRapidData, EngineDynamicData, FluidLevelData, DcDetailedData,
                         BatteryStatusData, SpeedWaterData, WaterDepthData, DistanceLogData, PositionRapidData,
                         CogSogData, GnssPositionData, XteData, NavigationData, WindData, OutsideEnvironmentData,
                         EnvironmentData, TemperatureData, HumidityData, PressureData, HeadingTrackControlData,
                         PilotData>;

        struct DecodedPgn {
            PGN pgn = 0;
            Address source = NULL_ADDRESS;
            Timestamp timestamp_ms = 0;
            PgnPayload payload;

            bool handled() const noexcept { return !std::holds_alternative<UnhandledPgn>(payload); }

            template <typename T> const T *get() const noexcept { return std::get_if<T>(&payload); }
        };

        // ─── PGN decoder ───────────────────────────────────────────────────────────
        // Input is one complete payload (single frame or reassembled fast packet).
        class PgnDecoder {
          public:
            Result<DecodedPgn> decode(const Message &msg) const {
                DecodedPgn out;
                out.pgn = msg.pgn;
                out.source = msg.source;
                out.timestamp_ms = msg.timestamp_ms;

                auto info = pgn_lookup(msg.pgn);
                if (!info.has_value() || info->min_length == 0) {
                    out.payload = UnhandledPgn{};
                    return Result<DecodedPgn>::ok(std::move(out));
                }
                if (msg.size() < info->min_length) {
                    return Result<DecodedPgn>::err(Error::malformed_field(
                        dp::String(info->name) + " needs " + dp::String(std::to_string(info->min_length)) +
                        " bytes, got " + dp::String(std::to_string(msg.size()))));
                }

                auto payload = dispatch(msg);
                if (payload.is_err()) {
                    return Result<DecodedPgn>::err(payload.error());
                }
                out.payload = std::move(payload.value());
                return Result<DecodedPgn>::ok(std::move(out));
            }

            Result<DecodedPgn> decode(PGN pgn, Address source, const dp::Vector<u8> &data,
                                      Timestamp timestamp_ms = 0) const {
                Message msg(pgn, data, source);
                msg.timestamp_ms = timestamp_ms;
                return decode(msg);
            }

          private:
            using PayloadResult = Result<PgnPayload>;

            static PayloadResult dispatch(const Message &m) {
                switch (m.pgn) {
                case PGN_RUDDER:
                    return decode_rudder(m);
                case PGN_HEADING_TRACK:
                    return decode_heading(m);
                case PGN_RATE_OF_TURN:
                    return PayloadResult::ok(RateOfTurnData{read_i32(m, 1, RES_RATE_OF_TURN)});
                case PGN_ATTITUDE:
                    return PayloadResult::ok(AttitudeData{read_i16(m, 1, RES_ANGLE), read_i16(m, 3, RES_ANGLE),
                                                          read_i16(m, 5, RES_ANGLE)});
                case PGN_MAGNETIC_VARIATION:
                    return PayloadResult::ok(MagneticVariationData{read_i16(m, 4, RES_ANGLE)});
                case PGN_ENGINE_PARAMS_RAPID:
                    return decode_engine_rapid(m);
                case PGN_ENGINE_PARAMS_DYNAMIC:
                    return decode_engine_dynamic(m);
                case PGN_FLUID_LEVEL:
                    return decode_fluid_level(m);
                case PGN_DC_DETAILED_STATUS:
                    return decode_dc_detailed(m);
                case PGN_BATTERY_STATUS:
                    return decode_battery(m);
                case PGN_SPEED_WATER:
                    return PayloadResult::ok(SpeedWaterData{read_u16(m, 1, RES_SPEED), read_u16(m, 3, RES_SPEED)});
                case PGN_WATER_DEPTH:
                    return decode_depth(m);
                case PGN_DISTANCE_LOG:
                    return PayloadResult::ok(DistanceLogData{read_u32(m, 6), read_u32(m, 10)});
                case PGN_GNSS_POSITION_RAPID:
                    return decode_position_rapid(m);
                case PGN_GNSS_COG_SOG_RAPID:
                    return decode_cog_sog(m);
                case PGN_GNSS_POSITION_DATA:
                    return decode_gnss_position(m);
                case PGN_XTE:
                    return decode_xte(m);
                case PGN_NAVIGATION_DATA:
                    return decode_navigation(m);
                case PGN_WIND_DATA:
                    return decode_wind(m);
                case PGN_OUTSIDE_ENVIRONMENTAL:
                    return PayloadResult::ok(OutsideEnvironmentData{read_u16(m, 1, RES_TEMPERATURE),
                                                                    read_u16(m, 3, RES_TEMPERATURE),
                                                                    read_u16(m, 5, RES_ENV_PRESSURE)});
                case PGN_ENVIRONMENTAL_PARAMS:
                    return decode_environment(m);
                case PGN_TEMPERATURE:
                    return decode_temperature(m, false);
                case PGN_TEMPERATURE_EXT:
                    return decode_temperature(m, true);
                case PGN_HUMIDITY:
                    return decode_humidity(m);
                case PGN_PRESSURE:
                    return PayloadResult::ok(PressureData{m.get_u8(1), read_i32(m, 3, RES_ACTUAL_PRESSURE)});
                case PGN_HEADING_TRACK_CONTROL:
                    return decode_heading_track_control(m);
                case PGN_SEATALK_PILOT_HEADING:
                case PGN_SEATALK_PILOT_LOCKED_HEADING:
                case PGN_SEATALK_PILOT_MODE:
                    return decode_seatalk_pilot(m);
                default:
                    return PayloadResult::ok(UnhandledPgn{});
                }
            }

            static dp::Optional<Error> check_angle(const dp::Optional<f64> &rad, const char *what) {
                if (rad.has_value() && (*rad < -2.0 * PI || *rad > 2.0 * PI))
                    return Error::out_of_range(dp::String(what) + " outside +/-2pi");
                return dp::nullopt;
            }

            static PayloadResult decode_rudder(const Message &m) {
                RudderData r;
                r.instance = m.get_u8(0);
                r.angle_order_rad = read_i16(m, 2, RES_ANGLE);
                r.position_rad = read_i16(m, 4, RES_ANGLE);
                return PayloadResult::ok(r);
            }

            static PayloadResult decode_heading(const Message &m) {
                VesselHeadingData h;
                h.heading_rad = read_u16(m, 1, RES_ANGLE);
                h.deviation_rad = read_i16(m, 3, RES_ANGLE);
                h.variation_rad = read_i16(m, 5, RES_ANGLE);
                h.reference = static_cast<HeadingReference>(m.get_u8(7) & 0x03);
                auto range = check_angle(h.heading_rad, "heading");
                if (range.has_value())
                    return PayloadResult::err(*range);
                return PayloadResult::ok(h);
            }

            static PayloadResult decode_engine_rapid(const Message &m) {
                EngineRapidData e;
                e.instance = m.get_u8(0);
                e.rpm = read_u16(m, 1, RES_RPM);
                e.boost_pressure_pa = read_u16(m, 3, RES_ENGINE_PRESSURE);
                auto tilt = read_i8(m, 5);
                if (tilt.has_value())
                    e.tilt_trim_ratio = *tilt / 100.0;
                return PayloadResult::ok(e);
            }

            static PayloadResult decode_engine_dynamic(const Message &m) {
                EngineDynamicData e;
                e.instance = m.get_u8(0);
                e.oil_pressure_pa = read_u16(m, 1, RES_ENGINE_PRESSURE);
                e.oil_temperature_k = read_u16(m, 3, RES_TEMPERATURE_OIL);
                e.coolant_temperature_k = read_u16(m, 5, RES_TEMPERATURE);
                e.alternator_voltage_v = read_i16(m, 7, RES_VOLTAGE);
                auto fuel = read_i16(m, 9, RES_FUEL_RATE);
                if (fuel.has_value())
                    e.fuel_rate_m3ps = *fuel * LPH_TO_M3PS;
                e.engine_hours_s = read_u32(m, 11);
                e.coolant_pressure_pa = read_u16(m, 15, RES_ENGINE_PRESSURE);
                e.fuel_pressure_pa = read_u16(m, 17, RES_FUEL_PRESSURE);
                auto load = read_i8(m, 24);
                if (load.has_value())
                    e.load_ratio = *load / 100.0;
                auto torque = read_i8(m, 25);
                if (torque.has_value())
                    e.torque_ratio = *torque / 100.0;
                return PayloadResult::ok(e);
            }

            static PayloadResult decode_fluid_level(const Message &m) {
                FluidLevelData f;
                u8 b0 = m.get_u8(0);
                f.instance = b0 & 0x0F;
                f.type = static_cast<FluidType>((b0 >> 4) & 0x0F);
                auto level = read_i16(m, 1, RES_FLUID_LEVEL);
                if (level.has_value()) {
                    if (*level < 0.0 || *level > 100.0)
                        return PayloadResult::err(Error::out_of_range("fluid level outside 0-100%"));
                    f.level_ratio = *level / 100.0;
                }
                auto capacity = read_u32(m, 3, RES_CAPACITY);
                if (capacity.has_value())
                    f.capacity_m3 = *capacity * LITRE_TO_M3;
                return PayloadResult::ok(f);
            }

            static PayloadResult decode_dc_detailed(const Message &m) {
                DcDetailedData d;
                d.instance = m.get_u8(1);
                d.dc_type = m.get_u8(2);
                auto soc = read_u8(m, 3);
                if (soc.has_value())
                    d.state_of_charge_ratio = *soc / 100.0;
                auto soh = read_u8(m, 4);
                if (soh.has_value())
                    d.state_of_health_ratio = *soh / 100.0;
                d.time_remaining_s = read_u16(m, 5, 60.0);
                d.ripple_voltage_v = read_u16(m, 7, RES_VOLTAGE);
                d.capacity_ah = read_u16(m, 9);
                return PayloadResult::ok(d);
            }

            static PayloadResult decode_battery(const Message &m) {
                BatteryStatusData b;
                b.instance = m.get_u8(0);
                b.voltage_v = read_u16(m, 1, RES_VOLTAGE);
                b.current_a = read_i16(m, 3, RES_CURRENT);
                b.temperature_k = read_u16(m, 5, RES_TEMPERATURE);
                return PayloadResult::ok(b);
            }

            static PayloadResult decode_depth(const Message &m) {
                WaterDepthData d;
                d.depth_m = read_u32(m, 1, RES_DEPTH);
                d.offset_m = read_i16(m, 5, RES_DEPTH_OFFSET);
                d.max_range_m = read_u8(m, 7, 10.0);
                return PayloadResult::ok(d);
            }

            static PayloadResult decode_position_rapid(const Message &m) {
                PositionRapidData p;
                p.latitude_deg = read_i32(m, 0, RES_LAT_LON_RAPID);
                p.longitude_deg = read_i32(m, 4, RES_LAT_LON_RAPID);
                if (p.latitude_deg.has_value() && std::fabs(*p.latitude_deg) > 90.0)
                    return PayloadResult::err(Error::out_of_range("latitude beyond 90 degrees"));
                if (p.longitude_deg.has_value() && std::fabs(*p.longitude_deg) > 180.0)
                    return PayloadResult::err(Error::out_of_range("longitude beyond 180 degrees"));
                return PayloadResult::ok(p);
            }

            static PayloadResult decode_cog_sog(const Message &m) {
                CogSogData c;
                c.reference = static_cast<HeadingReference>(m.get_u8(1) & 0x03);
                c.cog_rad = read_u16(m, 2, RES_ANGLE);
                c.sog_mps = read_u16(m, 4, RES_SPEED);
                auto range = check_angle(c.cog_rad, "course");
                if (range.has_value())
                    return PayloadResult::err(*range);
                return PayloadResult::ok(c);
            }

            static PayloadResult decode_gnss_position(const Message &m) {
                GnssPositionData g;
                u16 days = m.get_u16_le(1);
                if (days < 0xFFFE)
                    g.days_since_epoch = days;
                g.utc_seconds = read_u32(m, 3, RES_TIME_OF_DAY);
                g.latitude_deg = read_i64(m, 7, RES_LAT_LON_PRECISE);
                g.longitude_deg = read_i64(m, 15, RES_LAT_LON_PRECISE);
                g.altitude_m = read_i64(m, 23, RES_ALTITUDE);
                g.method = (m.get_u8(31) >> 4) & 0x0F;
                u8 sats = m.get_u8(33);
                if (sats < 0xFE)
                    g.satellites = sats;
                g.hdop = read_i16(m, 34, RES_DOP);
                g.pdop = read_i16(m, 36, RES_DOP);
                if (g.latitude_deg.has_value() && std::fabs(*g.latitude_deg) > 90.0)
                    return PayloadResult::err(Error::out_of_range("latitude beyond 90 degrees"));
                if (g.longitude_deg.has_value() && std::fabs(*g.longitude_deg) > 180.0)
                    return PayloadResult::err(Error::out_of_range("longitude beyond 180 degrees"));
                return PayloadResult::ok(g);
            }

            static PayloadResult decode_xte(const Message &m) {
                XteData x;
                x.navigation_terminated = ((m.get_u8(1) >> 6) & 0x03) == 1;
                x.xte_m = read_i32(m, 2, RES_XTE);
                return PayloadResult::ok(x);
            }

            static PayloadResult decode_navigation(const Message &m) {
                NavigationData n;
                n.distance_to_waypoint_m = read_u32(m, 1, RES_DISTANCE);
                u8 flags = m.get_u8(5);
                n.reference = static_cast<HeadingReference>(flags & 0x03);
                n.arrival_circle_entered = ((flags >> 4) & 0x03) == 1;
                n.bearing_to_waypoint_rad = read_u16(m, 14, RES_ANGLE);
                n.closing_velocity_mps = read_i16(m, 32, RES_SPEED);
                return PayloadResult::ok(n);
            }

            static PayloadResult decode_wind(const Message &m) {
                WindData w;
                w.speed_mps = read_u16(m, 1, RES_SPEED);
                w.angle_rad = read_u16(m, 3, RES_ANGLE);
                w.reference = static_cast<WindReference>(m.get_u8(5) & 0x07);
                auto range = check_angle(w.angle_rad, "wind angle");
                if (range.has_value())
                    return PayloadResult::err(*range);
                return PayloadResult::ok(w);
            }

            static PayloadResult decode_environment(const Message &m) {
                EnvironmentData e;
                e.temperature_source = static_cast<TemperatureSource>(m.get_u8(1) & 0x3F);
                e.temperature_k = read_u16(m, 2, RES_TEMPERATURE);
                auto humidity = read_i16(m, 4, RES_HUMIDITY);
                if (humidity.has_value())
                    e.humidity_ratio = *humidity / 100.0;
                e.pressure_pa = read_u16(m, 6, RES_ENV_PRESSURE);
                return PayloadResult::ok(e);
            }

            static PayloadResult decode_temperature(const Message &m, bool extended) {
                TemperatureData t;
                t.instance = m.get_u8(1);
                t.source = static_cast<TemperatureSource>(m.get_u8(2));
                if (extended) {
                    t.actual_k = read_u24(m, 3, RES_TEMPERATURE_FINE);
                    t.set_k = read_u16(m, 6, 0.1);
                } else {
                    t.actual_k = read_u16(m, 3, RES_TEMPERATURE);
                    t.set_k = read_u16(m, 5, RES_TEMPERATURE);
                }
                return PayloadResult::ok(t);
            }

            static PayloadResult decode_humidity(const Message &m) {
                HumidityData h;
                h.instance = m.get_u8(1);
                auto actual = read_i16(m, 3, RES_HUMIDITY);
                if (actual.has_value())
                    h.actual_ratio = *actual / 100.0;
                return PayloadResult::ok(h);
            }

            // [alarms:8][steering:3|turn:3|ref:2][rsvd:5|dir:3][rudder i16][heading-to-steer u16]
            // [track u16][rudder limit u16][off-heading u16][radius i16][rot i16][off-track i16]
            // [vessel heading u16]
            static PayloadResult decode_heading_track_control(const Message &m) {
                HeadingTrackControlData h;
                u8 b1 = m.get_u8(1);
                h.mode = static_cast<SteeringMode>(b1 & 0x07);
                h.reference = static_cast<HeadingReference>((b1 >> 6) & 0x03);
                h.commanded_rudder_rad = read_i16(m, 3, RES_ANGLE);
                h.heading_to_steer_rad = read_u16(m, 5, RES_ANGLE);
                h.vessel_heading_rad = read_u16(m, 19, RES_ANGLE);
                h.confidence = Confidence::Documented;
                return PayloadResult::ok(h);
            }

            // Proprietary single frame: [manufacturer:11|rsvd:2|industry:3] then vendor data.
            // Layout is community-derived; the header check is the only validation available.
            static PayloadResult decode_seatalk_pilot(const Message &m) {
                PilotData p;
                u16 header = m.get_u16_le(0);
                u16 manufacturer = header & 0x07FF;
                u8 industry = static_cast<u8>((header >> 13) & 0x07);
                p.validated = manufacturer == MANUFACTURER_RAYMARINE && industry == INDUSTRY_MARINE;
                p.confidence = Confidence::ReverseEngineered;
                if (!p.validated) {
                    echo::category("helm.n2k").debug("proprietary pgn ", m.pgn, " from manufacturer ", manufacturer,
                                                     " not decoded");
                    return PayloadResult::ok(UnhandledPgn{});
                }

                switch (m.pgn) {
                case PGN_SEATALK_PILOT_HEADING:
                    p.heading_true_rad = read_u16(m, 3, RES_ANGLE);
                    p.heading_magnetic_rad = read_u16(m, 5, RES_ANGLE);
                    break;
                case PGN_SEATALK_PILOT_LOCKED_HEADING:
                    p.locked_true_rad = read_u16(m, 3, RES_ANGLE);
                    p.locked_magnetic_rad = read_u16(m, 5, RES_ANGLE);
                    break;
                case PGN_SEATALK_PILOT_MODE: {
                    u16 word = m.get_u16_le(2);
                    switch (word) {
                    case static_cast<u16>(PilotMode::Standby):
                    case static_cast<u16>(PilotMode::Auto):
                    case static_cast<u16>(PilotMode::Wind):
                    case static_cast<u16>(PilotMode::Track):
                    case static_cast<u16>(PilotMode::NoDrift):
                        p.mode = static_cast<PilotMode>(word);
                        break;
                    default:
                        echo::category("helm.n2k").debug("unrecognised pilot mode word ", word);
                        p.validated = false;
                        break;
                    }
                    break;
                }
                default:
                    break;
                }
                return PayloadResult::ok(p);
            }
        };

    } // namespace n2k
    using namespace n2k;
} // namespace helm
