#pragma once

#include "../core/constants.hpp"
#include "../n2k/decoder.hpp"
#include "../nmea0183/decoder.hpp"
#include "types.hpp"
#include <cctype>
#include <cstdlib>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>

namespace helm {
    namespace sensor {

        struct MapperConfig {
            bool talker_instances_enabled = true;

            // When disabled every source without an explicit instance byte maps to 0
            MapperConfig &talker_instances(bool enabled) {
                talker_instances_enabled = enabled;
                return *this;
            }
        };

        // ─── Instance resolution ────────────────────────────────────────────────────
        // Assigns instance numbers per sensor type in order of first appearance of a
        // source identity (0183 talker id, N2K source address).
        class InstanceResolver {
            dp::Array<dp::Map<dp::String, u8>, SENSOR_TYPE_COUNT> assigned_;

          public:
            u8 resolve(SensorType type, const dp::String &identity) {
                if (identity.empty())
                    return 0;
                auto &table = assigned_[static_cast<u8>(type)];
                auto it = table.find(identity);
                if (it != table.end())
                    return it->second;
                if (table.size() >= 0xFF) {
                    echo::category("helm.sensor.mapper")
                        .warn("instance space exhausted for ", sensor_type_name(type), ", mapping ", identity, " to 0");
                    return 0;
                }
                u8 instance = static_cast<u8>(table.size());
                table[identity] = instance;
                echo::category("helm.sensor.mapper")
                    .debug(sensor_type_name(type), " source ", identity, " -> instance ", static_cast<u32>(instance));
                return instance;
            }

            usize known(SensorType type) const noexcept { return assigned_[static_cast<u8>(type)].size(); }

            void reset() {
                for (auto &table : assigned_) {
                    table.clear();
                }
            }
        };

        inline dp::String talker_identity(const dp::String &talker) { return talker; }

        inline dp::String source_identity(Address source) {
            return dp::String("n2k:") + dp::String(std::to_string(source));
        }

        // ─── Sensor update mapper ───────────────────────────────────────────────────
        // One decoded message becomes one update per logical sensor it touches. All
        // updates from one message share instance and timestamp.
        class Mapper {
            MapperConfig config_;
            InstanceResolver resolver_;

          public:
            explicit Mapper(MapperConfig config = {}) : config_(std::move(config)) {}

            const MapperConfig &config() const noexcept { return config_; }
            InstanceResolver &resolver() noexcept { return resolver_; }

            // ═════════════════════════════════════════════════════════════════════
            // NMEA 0183
            // ═════════════════════════════════════════════════════════════════════
            dp::Vector<SensorUpdate> map(const DecodedSentence &s) {
                dp::Vector<SensorUpdate> out;
                Timestamp ts = s.timestamp_ms;
                dp::String who = talker_identity(s.talker);

                if (auto d = s.get<DepthSentence>()) {
                    SensorUpdate u(SensorType::Depth, instance_for(SensorType::Depth, who), ts);
                    u.set("depth", d->depth_m);
                    u.set("offset", d->offset_m);
                    u.set("max_range", d->max_range_m);
                    u.set("reference", depth_reference_name(d->reference));
                    u.set("source", s.type);
                    out.push_back(std::move(u));
                } else if (auto d = s.get<WaterTemperatureSentence>()) {
                    // Sea water temperature has a fixed home
                    SensorUpdate u(SensorType::Temperature, 0, ts);
                    u.set("temperature", d->temperature_k);
                    u.set("location", "sea");
                    out.push_back(std::move(u));
                } else if (auto d = s.get<WindSentence>()) {
                    if (!d->valid)
                        return out;
                    SensorUpdate u(SensorType::Wind, instance_for(SensorType::Wind, who), ts);
                    if (d->true_wind) {
                        u.set("true_speed", d->speed_mps);
                        u.set("true_angle", d->angle_rad);
                    } else {
                        u.set("apparent_speed", d->speed_mps);
                        u.set("apparent_angle", d->angle_rad);
                    }
                    out.push_back(std::move(u));
                } else if (auto d = s.get<WaterSpeedSentence>()) {
                    u8 instance = instance_for(SensorType::Speed, who);
                    if (d->speed_mps.has_value()) {
                        SensorUpdate u(SensorType::Speed, instance, ts);
                        u.set("through_water", d->speed_mps);
                        out.push_back(std::move(u));
                    }
                    SensorUpdate h(SensorType::Heading, instance, ts);
                    h.set("true", d->heading_true_rad);
                    h.set("magnetic", d->heading_magnetic_rad);
                    push_if_any(out, std::move(h));
                } else if (auto d = s.get<GroundTrackSentence>()) {
                    u8 instance = instance_for(SensorType::Gps, who);
                    SensorUpdate g(SensorType::Gps, instance, ts);
                    g.set("speed_over_ground", d->speed_mps);
                    g.set("course_over_ground", d->course_true_rad);
                    push_if_any(out, std::move(g));
                    SensorUpdate sp(SensorType::Speed, instance, ts);
                    sp.set("over_ground", d->speed_mps);
                    push_if_any(out, std::move(sp));
                } else if (auto d = s.get<RmcSentence>()) {
                    if (!d->valid)
                        return out;
                    u8 instance = instance_for(SensorType::Gps, who);
                    SensorUpdate g(SensorType::Gps, instance, ts);
                    g.set("latitude", d->latitude_deg);
                    g.set("longitude", d->longitude_deg);
                    g.set("speed_over_ground", d->speed_mps);
                    g.set("course_over_ground", d->course_true_rad);
                    g.set("utc_time", d->utc_seconds);
                    g.set("magnetic_variation", d->variation_rad);
                    push_if_any(out, std::move(g));
                    SensorUpdate sp(SensorType::Speed, instance, ts);
                    sp.set("over_ground", d->speed_mps);
                    push_if_any(out, std::move(sp));
                } else if (auto d = s.get<GgaSentence>()) {
                    if (!d->valid())
                        return out;
                    SensorUpdate g(SensorType::Gps, instance_for(SensorType::Gps, who), ts);
                    g.set("latitude", d->latitude_deg);
                    g.set("longitude", d->longitude_deg);
                    g.set("fix_quality", static_cast<f64>(d->fix_quality));
                    if (d->satellites.has_value())
                        g.set("satellites", static_cast<f64>(*d->satellites));
                    g.set("hdop", d->hdop);
                    g.set("altitude", d->altitude_m);
                    g.set("utc_time", d->utc_seconds);
                    out.push_back(std::move(g));
                } else if (auto d = s.get<GllSentence>()) {
                    if (!d->valid)
                        return out;
                    SensorUpdate g(SensorType::Gps, instance_for(SensorType::Gps, who), ts);
                    g.set("latitude", d->latitude_deg);
                    g.set("longitude", d->longitude_deg);
                    g.set("utc_time", d->utc_seconds);
                    out.push_back(std::move(g));
                } else if (auto d = s.get<HeadingSentence>()) {
                    SensorUpdate h(SensorType::Heading, instance_for(SensorType::Heading, who), ts);
                    h.set("magnetic", d->magnetic_rad);
                    h.set("true", d->true_rad);
                    h.set("deviation", d->deviation_rad);
                    h.set("variation", d->variation_rad);
                    push_if_any(out, std::move(h));
                } else if (auto d = s.get<RateOfTurnSentence>()) {
                    if (!d->valid)
                        return out;
                    SensorUpdate h(SensorType::Heading, instance_for(SensorType::Heading, who), ts);
                    h.set("rate_of_turn", d->rate_radps);
                    out.push_back(std::move(h));
                } else if (auto d = s.get<RudderSentence>()) {
                    SensorUpdate stbd(SensorType::Rudder, 0, ts);
                    stbd.set("angle", d->starboard_rad);
                    push_if_any(out, std::move(stbd));
                    SensorUpdate port(SensorType::Rudder, 1, ts);
                    port.set("angle", d->port_rad);
                    push_if_any(out, std::move(port));
                } else if (auto d = s.get<RpmSentence>()) {
                    // Shaft readings are not engine data
                    if (!d->valid || d->source != 'E')
                        return out;
                    SensorUpdate e(SensorType::Engine, d->number, ts);
                    e.set("rpm", d->rpm);
                    out.push_back(std::move(e));
                } else if (auto d = s.get<DistanceLogSentence>()) {
                    SensorUpdate l(SensorType::Log, instance_for(SensorType::Log, who), ts);
                    l.set("total_distance", d->total_m);
                    l.set("trip_distance", d->trip_m);
                    push_if_any(out, std::move(l));
                } else if (auto d = s.get<CrossTrackSentence>()) {
                    if (!d->valid)
                        return out;
                    SensorUpdate n(SensorType::Navigation, instance_for(SensorType::Navigation, who), ts);
                    n.set("cross_track_error", d->error_m);
                    out.push_back(std::move(n));
                } else if (auto d = s.get<XdrSentence>()) {
                    map_xdr(*d, ts, out);
                }
                return out;
            }

            // ═════════════════════════════════════════════════════════════════════
            // NMEA 2000
            // ═════════════════════════════════════════════════════════════════════
            dp::Vector<SensorUpdate> map(const DecodedPgn &p) {
                dp::Vector<SensorUpdate> out;
                Timestamp ts = p.timestamp_ms;
                dp::String who = source_identity(p.source);

                if (auto d = p.get<RudderData>()) {
                    SensorUpdate u(SensorType::Rudder, d->instance, ts);
                    u.set("angle", d->position_rad);
                    u.set("order", d->angle_order_rad);
                    push_if_any(out, std::move(u));
                } else if (auto d = p.get<VesselHeadingData>()) {
                    SensorUpdate h(SensorType::Heading, instance_for(SensorType::Heading, who), ts);
                    if (d->reference == HeadingReference::True) {
                        h.set("true", d->heading_rad);
                    } else if (d->reference == HeadingReference::Magnetic) {
                        h.set("magnetic", d->heading_rad);
                    }
                    h.set("deviation", d->deviation_rad);
                    h.set("variation", d->variation_rad);
                    push_if_any(out, std::move(h));
                } else if (auto d = p.get<RateOfTurnData>()) {
                    SensorUpdate h(SensorType::Heading, instance_for(SensorType::Heading, who), ts);
                    h.set("rate_of_turn", d->rate_radps);
                    push_if_any(out, std::move(h));
                } else if (auto d = p.get<AttitudeData>()) {
                    SensorUpdate h(SensorType::Heading, instance_for(SensorType::Heading, who), ts);
                    h.set("pitch", d->pitch_rad);
                    h.set("roll", d->roll_rad);
                    push_if_any(out, std::move(h));
                } else if (auto d = p.get<MagneticVariationData>()) {
                    SensorUpdate h(SensorType::Heading, instance_for(SensorType::Heading, who), ts);
                    h.set("variation", d->variation_rad);
                    push_if_any(out, std::move(h));
                } else if (auto d = p.get<EngineRapidData>()) {
                    SensorUpdate e(SensorType::Engine, d->instance, ts);
                    e.set("rpm", d->rpm);
                    e.set("boost_pressure", d->boost_pressure_pa);
                    e.set("tilt_trim", d->tilt_trim_ratio);
                    push_if_any(out, std::move(e));
                } else if (auto d = p.get<EngineDynamicData>()) {
                    SensorUpdate e(SensorType::Engine, d->instance, ts);
                    e.set("oil_pressure", d->oil_pressure_pa);
                    e.set("oil_temperature", d->oil_temperature_k);
                    e.set("coolant_temperature", d->coolant_temperature_k);
                    e.set("alternator_voltage", d->alternator_voltage_v);
                    e.set("fuel_rate", d->fuel_rate_m3ps);
                    e.set("engine_hours", d->engine_hours_s);
                    e.set("coolant_pressure", d->coolant_pressure_pa);
                    e.set("fuel_pressure", d->fuel_pressure_pa);
                    e.set("load", d->load_ratio);
                    e.set("torque", d->torque_ratio);
                    push_if_any(out, std::move(e));
                } else if (auto d = p.get<FluidLevelData>()) {
                    SensorUpdate t(SensorType::Tank, d->instance, ts);
                    t.set("level", d->level_ratio);
                    t.set("capacity", d->capacity_m3);
                    if (d->type != FluidType::Unavailable)
                        t.set("fluid_type", fluid_type_name(d->type));
                    push_if_any(out, std::move(t));
                } else if (auto d = p.get<DcDetailedData>()) {
                    SensorUpdate b(SensorType::Battery, d->instance, ts);
                    b.set("state_of_charge", d->state_of_charge_ratio);
                    b.set("state_of_health", d->state_of_health_ratio);
                    b.set("time_remaining", d->time_remaining_s);
                    b.set("ripple_voltage", d->ripple_voltage_v);
                    b.set("capacity", d->capacity_ah);
                    push_if_any(out, std::move(b));
                } else if (auto d = p.get<BatteryStatusData>()) {
                    SensorUpdate b(SensorType::Battery, d->instance, ts);
                    b.set("voltage", d->voltage_v);
                    b.set("current", d->current_a);
                    b.set("temperature", d->temperature_k);
                    push_if_any(out, std::move(b));
                } else if (auto d = p.get<SpeedWaterData>()) {
                    SensorUpdate sp(SensorType::Speed, instance_for(SensorType::Speed, who), ts);
                    sp.set("through_water", d->water_mps);
                    sp.set("over_ground", d->ground_mps);
                    push_if_any(out, std::move(sp));
                } else if (auto d = p.get<WaterDepthData>()) {
                    if (!d->depth_m.has_value())
                        return out;
                    SensorUpdate u(SensorType::Depth, instance_for(SensorType::Depth, who), ts);
                    u.set("depth", d->depth_m);
                    u.set("offset", d->offset_m);
                    u.set("max_range", d->max_range_m);
                    u.set("reference", "transducer");
                    u.set("source", "n2k");
                    out.push_back(std::move(u));
                } else if (auto d = p.get<DistanceLogData>()) {
                    SensorUpdate l(SensorType::Log, instance_for(SensorType::Log, who), ts);
                    l.set("total_distance", d->log_m);
                    l.set("trip_distance", d->trip_m);
                    push_if_any(out, std::move(l));
                } else if (auto d = p.get<PositionRapidData>()) {
                    SensorUpdate g(SensorType::Gps, instance_for(SensorType::Gps, who), ts);
                    g.set("latitude", d->latitude_deg);
                    g.set("longitude", d->longitude_deg);
                    push_if_any(out, std::move(g));
                } else if (auto d = p.get<CogSogData>()) {
                    u8 instance = instance_for(SensorType::Gps, who);
                    SensorUpdate g(SensorType::Gps, instance, ts);
                    g.set("speed_over_ground", d->sog_mps);
                    if (d->reference == HeadingReference::True)
                        g.set("course_over_ground", d->cog_rad);
                    push_if_any(out, std::move(g));
                    SensorUpdate sp(SensorType::Speed, instance, ts);
                    sp.set("over_ground", d->sog_mps);
                    push_if_any(out, std::move(sp));
                } else if (auto d = p.get<GnssPositionData>()) {
                    if (d->method == 0)
                        return out;
                    SensorUpdate g(SensorType::Gps, instance_for(SensorType::Gps, who), ts);
                    g.set("latitude", d->latitude_deg);
                    g.set("longitude", d->longitude_deg);
                    g.set("altitude", d->altitude_m);
                    g.set("fix_quality", static_cast<f64>(d->method));
                    if (d->satellites.has_value())
                        g.set("satellites", static_cast<f64>(*d->satellites));
                    g.set("hdop", d->hdop);
                    g.set("utc_time", d->utc_seconds);
                    out.push_back(std::move(g));
                } else if (auto d = p.get<XteData>()) {
                    if (d->navigation_terminated)
                        return out;
                    SensorUpdate n(SensorType::Navigation, instance_for(SensorType::Navigation, who), ts);
                    n.set("cross_track_error", d->xte_m);
                    push_if_any(out, std::move(n));
                } else if (auto d = p.get<NavigationData>()) {
                    SensorUpdate n(SensorType::Navigation, instance_for(SensorType::Navigation, who), ts);
                    n.set("distance_to_waypoint", d->distance_to_waypoint_m);
                    n.set("bearing_to_waypoint", d->bearing_to_waypoint_rad);
                    n.set("velocity_made_good", d->closing_velocity_mps);
                    push_if_any(out, std::move(n));
                } else if (auto d = p.get<WindData>()) {
                    SensorUpdate w(SensorType::Wind, instance_for(SensorType::Wind, who), ts);
                    switch (d->reference) {
                    case WindReference::Apparent:
                        w.set("apparent_speed", d->speed_mps);
                        w.set("apparent_angle", d->angle_rad);
                        break;
                    case WindReference::TrueBoat:
                    case WindReference::TrueWater:
                        w.set("true_speed", d->speed_mps);
                        w.set("true_angle", d->angle_rad);
                        break;
                    case WindReference::TrueNorth:
                    case WindReference::Magnetic:
                        w.set("true_speed", d->speed_mps);
                        w.set("true_direction", d->angle_rad);
                        break;
                    default:
                        break;
                    }
                    push_if_any(out, std::move(w));
                } else if (auto d = p.get<OutsideEnvironmentData>()) {
                    u8 instance = instance_for(SensorType::Weather, who);
                    SensorUpdate w(SensorType::Weather, instance, ts);
                    w.set("air_temperature", d->air_temperature_k);
                    w.set("pressure", d->pressure_pa);
                    push_if_any(out, std::move(w));
                    if (d->water_temperature_k.has_value()) {
                        SensorUpdate t(SensorType::Temperature, 0, ts);
                        t.set("temperature", d->water_temperature_k);
                        t.set("location", "sea");
                        out.push_back(std::move(t));
                    }
                } else if (auto d = p.get<EnvironmentData>()) {
                    map_environment(*d, who, ts, out);
                } else if (auto d = p.get<TemperatureData>()) {
                    SensorUpdate t(SensorType::Temperature, d->instance, ts);
                    t.set("temperature", d->actual_k);
                    t.set("set_temperature", d->set_k);
                    if (!t.empty())
                        t.set("location", temperature_source_name(d->source));
                    push_if_any(out, std::move(t));
                } else if (auto d = p.get<HumidityData>()) {
                    SensorUpdate w(SensorType::Weather, d->instance, ts);
                    w.set("humidity", d->actual_ratio);
                    push_if_any(out, std::move(w));
                } else if (auto d = p.get<PressureData>()) {
                    SensorUpdate w(SensorType::Weather, d->instance, ts);
                    w.set("pressure", d->pressure_pa);
                    push_if_any(out, std::move(w));
                } else if (auto d = p.get<HeadingTrackControlData>()) {
                    SensorUpdate a(SensorType::Autopilot, instance_for(SensorType::Autopilot, who), ts);
                    if (d->mode != SteeringMode::Unavailable) {
                        a.set("mode", steering_mode_name(d->mode));
                        bool engaged = d->mode == SteeringMode::HeadingStandalone ||
                                       d->mode == SteeringMode::HeadingControl || d->mode == SteeringMode::TrackControl;
                        a.set("engaged", engaged ? 1.0 : 0.0);
                    }
                    a.set("rudder_angle", d->commanded_rudder_rad);
                    a.set("target_heading", d->heading_to_steer_rad);
                    a.set("actual_heading", d->vessel_heading_rad);
                    if (!a.empty())
                        a.set("confidence", confidence_name(d->confidence));
                    push_if_any(out, std::move(a));
                } else if (auto d = p.get<PilotData>()) {
                    if (!d->validated)
                        return out;
                    SensorUpdate a(SensorType::Autopilot, instance_for(SensorType::Autopilot, who), ts);
                    if (d->mode.has_value()) {
                        a.set("mode", pilot_mode_name(*d->mode));
                        a.set("engaged", *d->mode == PilotMode::Standby ? 0.0 : 1.0);
                    }
                    a.set("actual_heading",
                          d->heading_true_rad.has_value() ? d->heading_true_rad : d->heading_magnetic_rad);
                    a.set("target_heading",
                          d->locked_true_rad.has_value() ? d->locked_true_rad : d->locked_magnetic_rad);
                    if (!a.empty())
                        a.set("confidence", confidence_name(d->confidence));
                    push_if_any(out, std::move(a));
                }
                return out;
            }

          private:
            u8 instance_for(SensorType type, const dp::String &identity) {
                if (!config_.talker_instances_enabled)
                    return 0;
                return resolver_.resolve(type, identity);
            }

            static void push_if_any(dp::Vector<SensorUpdate> &out, SensorUpdate u) {
                if (!u.empty())
                    out.push_back(std::move(u));
            }

            static const char *depth_reference_name(DepthReference r) noexcept {
                switch (r) {
                case DepthReference::Transducer:
                    return "transducer";
                case DepthReference::Keel:
                    return "keel";
                case DepthReference::Surface:
                    return "surface";
                }
                return "transducer";
            }

            static const char *confidence_name(Confidence c) noexcept {
                return c == Confidence::Documented ? "documented" : "reverse_engineered";
            }

            void map_environment(const EnvironmentData &d, const dp::String &who, Timestamp ts,
                                 dp::Vector<SensorUpdate> &out) {
                u8 instance = instance_for(SensorType::Weather, who);
                SensorUpdate w(SensorType::Weather, instance, ts);
                w.set("humidity", d.humidity_ratio);
                w.set("pressure", d.pressure_pa);
                switch (d.temperature_source) {
                case TemperatureSource::Outside:
                    w.set("air_temperature", d.temperature_k);
                    break;
                case TemperatureSource::DewPoint:
                    w.set("dew_point", d.temperature_k);
                    break;
                default:
                    if (d.temperature_k.has_value()) {
                        SensorUpdate t(SensorType::Temperature, instance_for(SensorType::Temperature, who), ts);
                        t.set("temperature", d.temperature_k);
                        t.set("location", temperature_source_name(d.temperature_source));
                        out.push_back(std::move(t));
                    }
                    break;
                }
                push_if_any(out, std::move(w));
            }

            // ─── XDR transducer identifiers ─────────────────────────────────────────
            // BAT_n, BAT_n_SOC, BAT_n_NOM, BAT_n_CAP, BAT_n_CHEM     battery n
            // ENGINE#n, ENGINE#n_FUEL, ENGINE#n_HOURS, ALTERNATOR#n  engine n-1
            // FUEL_n, WATR_n, WAST_n, BALL_n, BWAT_n                 tank n
            // BARO, Barometer, HUMI, AIRX, ...                       weather 0
            // <LOC>[_]n                                              temperature n
            static dp::Optional<u32> parse_index(const dp::String &digits) {
                if (digits.empty() || digits.size() > 3)
                    return dp::nullopt;
                for (usize i = 0; i < digits.size(); ++i) {
                    if (!std::isdigit(static_cast<unsigned char>(digits[i])))
                        return dp::nullopt;
                }
                return static_cast<u32>(std::strtoul(digits.c_str(), nullptr, 10));
            }

            static bool starts_with(const dp::String &s, const char *prefix) {
                dp::String p(prefix);
                return s.size() >= p.size() && s.substr(0, p.size()) == p;
            }

            static dp::String upper(const dp::String &s) {
                dp::String out = s;
                for (usize i = 0; i < out.size(); ++i) {
                    out[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i])));
                }
                return out;
            }

            static SensorUpdate &slot(dp::Vector<SensorUpdate> &out, SensorType type, u8 instance, Timestamp ts) {
                for (auto &u : out) {
                    if (u.type == type && u.instance == instance)
                        return u;
                }
                out.push_back(SensorUpdate(type, instance, ts));
                return out.back();
            }

            void map_xdr(const XdrSentence &x, Timestamp ts, dp::Vector<SensorUpdate> &out) {
                for (const auto &m : x.measurements) {
                    if (!m.value.has_value() || m.id.empty())
                        continue;
                    if (!map_xdr_measurement(m, ts, out)) {
                        echo::category("helm.sensor.mapper").debug("unmapped XDR transducer ", m.id);
                    }
                }
                // Slots are created before a field is known to be usable
                for (auto it = out.begin(); it != out.end();) {
                    if (it->empty()) {
                        it = out.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

            bool map_xdr_measurement(const XdrMeasurement &m, Timestamp ts, dp::Vector<SensorUpdate> &out) {
                f64 raw = *m.value;
                dp::String id = upper(m.id);

                if (starts_with(id, "BAT_")) {
                    dp::String rest = id.substr(4);
                    usize sep = rest.find('_');
                    dp::String digits = sep == dp::String::npos ? rest : rest.substr(0, sep);
                    dp::String suffix = sep == dp::String::npos ? dp::String() : rest.substr(sep + 1);
                    auto index = parse_index(digits);
                    if (!index.has_value() || *index > 0xFF)
                        return false;
                    auto &b = slot(out, SensorType::Battery, static_cast<u8>(*index), ts);
                    if (suffix.empty()) {
                        if (m.type == 'U' && m.unit == 'V')
                            b.set("voltage", raw);
                        else if (m.type == 'I' && m.unit == 'A')
                            b.set("current", raw);
                        else if (m.type == 'C' && m.si.has_value())
                            b.set("temperature", *m.si);
                        else
                            return false;
                    } else if (suffix == "SOC" && m.type == 'P') {
                        b.set("state_of_charge", raw / 100.0);
                    } else if (suffix == "NOM" && m.type == 'U') {
                        b.set("nominal_voltage", raw);
                    } else if (suffix == "CAP" && m.type == 'V') {
                        b.set("capacity", raw);
                    } else if (suffix == "CHEM" && m.type == 'G') {
                        b.set("chemistry", chemistry_name(raw));
                    } else if (suffix == "TEMP" && m.type == 'C' && m.si.has_value()) {
                        b.set("temperature", *m.si);
                    } else {
                        return false;
                    }
                    return true;
                }

                if (starts_with(id, "ENGINE#") || starts_with(id, "ALTERNATOR")) {
                    bool alternator = starts_with(id, "ALTERNATOR");
                    dp::String rest = alternator ? id.substr(10) : id.substr(7);
                    if (alternator && !rest.empty() && rest[0] == '#')
                        rest = rest.substr(1);
                    usize sep = rest.find('_');
                    dp::String digits = sep == dp::String::npos ? rest : rest.substr(0, sep);
                    dp::String suffix = sep == dp::String::npos ? dp::String() : rest.substr(sep + 1);
                    u32 number = 1;
                    if (!digits.empty()) {
                        auto index = parse_index(digits);
                        if (!index.has_value() || *index == 0 || *index > 0x100)
                            return false;
                        number = *index;
                    } else if (!alternator) {
                        return false;
                    }
                    auto &e = slot(out, SensorType::Engine, static_cast<u8>(number - 1), ts);
                    if (alternator) {
                        if (m.type != 'U')
                            return false;
                        e.set("alternator_voltage", raw);
                    } else if (suffix.empty()) {
                        if (m.type == 'C' && m.si.has_value())
                            e.set("coolant_temperature", *m.si);
                        else if (m.type == 'P' && m.si.has_value())
                            e.set("oil_pressure", *m.si);
                        else if (m.type == 'U')
                            e.set("alternator_voltage", raw);
                        else if (m.type == 'T')
                            e.set("rpm", raw);
                        else
                            return false;
                    } else if (suffix == "FUEL" && m.type == 'V') {
                        e.set("fuel_rate", raw * LPH_TO_M3PS);
                    } else if (suffix == "HOURS" && m.type == 'G') {
                        e.set("engine_hours", raw * 3600.0);
                    } else if (suffix == "OIL" && m.type == 'C' && m.si.has_value()) {
                        e.set("oil_temperature", *m.si);
                    } else {
                        return false;
                    }
                    return true;
                }

                if (m.type == 'V' && (m.unit == 'P' || m.unit == 'L')) {
                    static constexpr const char *TANK_CODES[][2] = {{"FUEL", "fuel"},
                                                                     {"WATR", "water"},
                                                                     {"WAST", "gray_water"},
                                                                     {"BALL", "ballast"},
                                                                     {"BWAT", "black_water"}};
                    for (const auto &code : TANK_CODES) {
                        dp::String prefix = dp::String(code[0]) + "_";
                        if (!starts_with(id, prefix.c_str()))
                            continue;
                        auto index = parse_index(id.substr(prefix.size()));
                        if (!index.has_value() || *index > 0xFF)
                            return false;
                        auto &t = slot(out, SensorType::Tank, static_cast<u8>(*index), ts);
                        if (m.unit == 'P')
                            t.set("level", raw / 100.0);
                        else
                            t.set("capacity", raw * LITRE_TO_M3);
                        t.set("fluid_type", code[1]);
                        return true;
                    }
                    return false;
                }

                if (m.type == 'P' && m.si.has_value() && (starts_with(id, "BARO") || id == "AIRP")) {
                    slot(out, SensorType::Weather, 0, ts).set("pressure", *m.si);
                    return true;
                }
                if (m.type == 'H' && m.si.has_value()) {
                    slot(out, SensorType::Weather, 0, ts).set("humidity", *m.si);
                    return true;
                }

                if (m.type == 'C' && m.si.has_value()) {
                    return map_xdr_temperature(id, *m.si, ts, out);
                }
                return false;
            }

            bool map_xdr_temperature(const dp::String &id, f64 kelvin, Timestamp ts, dp::Vector<SensorUpdate> &out) {
                if (id == "AIRX" || id == "AIR" || id == "ENV_OUTAIR_T") {
                    slot(out, SensorType::Weather, 0, ts).set("air_temperature", kelvin);
                    return true;
                }
                if (id == "DEWP" || id == "DEW_POINT") {
                    slot(out, SensorType::Weather, 0, ts).set("dew_point", kelvin);
                    return true;
                }

                // Split a trailing instance number off the location code
                usize end = id.size();
                while (end > 0 && std::isdigit(static_cast<unsigned char>(id[end - 1]))) {
                    --end;
                }
                dp::String code = id.substr(0, end);
                u32 instance = 0;
                if (end < id.size()) {
                    auto index = parse_index(id.substr(end));
                    if (!index.has_value() || *index > 0xFF)
                        return false;
                    instance = *index;
                }
                while (!code.empty() && (code[code.size() - 1] == '_' || code[code.size() - 1] == '-')) {
                    code = code.substr(0, code.size() - 1);
                }
                if (code.size() < 2 || code.size() > 8)
                    return false;

                auto &t = slot(out, SensorType::Temperature, static_cast<u8>(instance), ts);
                t.set("temperature", kelvin);
                t.set("location", xdr_location(code));
                return true;
            }

            static const char *xdr_location(const dp::String &code) {
                static constexpr const char *LOCATIONS[][2] = {
                    {"SEAW", "sea"},         {"SEA", "sea"},
                    {"WTR", "sea"},          {"ENGR", "engine_room"},
                    {"ENG", "engine"},       {"EXH", "exhaust"},
                    {"EXHT", "exhaust"},     {"REFR", "refrigeration"},
                    {"FRIDGE", "refrigeration"}, {"FRZR", "freezer"},
                    {"FREE", "freezer"},     {"LIVE", "live_well"},
                    {"BAIT", "bait_well"},   {"OUT", "outside"},
                    {"TEMP", "cabin"},
                };
                for (const auto &loc : LOCATIONS) {
                    if (code == loc[0])
                        return loc[1];
                }
                return "cabin";
            }

            // Chemistry code as sent by battery monitors in a generic transducer
            static const char *chemistry_name(f64 code) {
                switch (static_cast<i32>(code)) {
                case 0:
                    return "lead_acid";
                case 1:
                    return "li_ion";
                case 2:
                    return "nicd";
                case 3:
                    return "zno";
                case 4:
                    return "nimh";
                case 5:
                    return "agm";
                case 6:
                    return "gel";
                case 7:
                    return "lifepo4";
                default:
                    return "unknown";
                }
            }
        };

    } // namespace sensor
    using namespace sensor;
} // namespace helm
