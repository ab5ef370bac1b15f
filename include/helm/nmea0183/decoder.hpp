#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "sentence.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <variant>

namespace helm {
    namespace nmea0183 {

        // ═════════════════════════════════════════════════════════════════════════════
        // DECODED SENTENCE PAYLOADS
        // All quantities are SI: metres, m/s, radians, kelvin, seconds.
        // ═════════════════════════════════════════════════════════════════════════════

        enum class DepthReference : u8 { Transducer, Keel, Surface };

        // DBT / DBK / DBS / DPT
        struct DepthSentence {
            f64 depth_m = 0.0;
            DepthReference reference = DepthReference::Transducer;
            dp::Optional<f64> offset_m;    // DPT only; positive = transducer to waterline
            dp::Optional<f64> max_range_m; // DPT only
        };

        // MTW
        struct WaterTemperatureSentence {
            f64 temperature_k = 0.0;
        };

        // MWV
        struct WindSentence {
            f64 angle_rad = 0.0;
            f64 speed_mps = 0.0;
            bool true_wind = false; // reference 'T', otherwise relative (apparent)
            bool valid = true;
        };

        // VHW
        struct WaterSpeedSentence {
            dp::Optional<f64> heading_true_rad;
            dp::Optional<f64> heading_magnetic_rad;
            dp::Optional<f64> speed_mps;
        };

        // VTG
        struct GroundTrackSentence {
            dp::Optional<f64> course_true_rad;
            dp::Optional<f64> course_magnetic_rad;
            dp::Optional<f64> speed_mps;
        };

        // RMC
        struct RmcSentence {
            bool valid = false;
            dp::Optional<f64> utc_seconds;
            dp::Optional<f64> latitude_deg;
            dp::Optional<f64> longitude_deg;
            dp::Optional<f64> speed_mps;
            dp::Optional<f64> course_true_rad;
            dp::Optional<u32> date_ddmmyy;
            dp::Optional<f64> variation_rad; // east positive
        };

        // GGA
        struct GgaSentence {
            u8 fix_quality = 0;
            dp::Optional<f64> utc_seconds;
            dp::Optional<f64> latitude_deg;
            dp::Optional<f64> longitude_deg;
            dp::Optional<u8> satellites;
            dp::Optional<f64> hdop;
            dp::Optional<f64> altitude_m;

            bool valid() const noexcept { return fix_quality != 0; }
        };

        // GLL
        struct GllSentence {
            bool valid = false;
            f64 latitude_deg = 0.0;
            f64 longitude_deg = 0.0;
            dp::Optional<f64> utc_seconds;
        };

        // HDG / HDM / HDT
        struct HeadingSentence {
            dp::Optional<f64> magnetic_rad;
            dp::Optional<f64> true_rad;
            dp::Optional<f64> deviation_rad; // east positive
            dp::Optional<f64> variation_rad; // east positive
        };

        // ROT
        struct RateOfTurnSentence {
            f64 rate_radps = 0.0; // negative = bow turns to port
            bool valid = true;
        };

        // RSA
        struct RudderSentence {
            dp::Optional<f64> starboard_rad; // negative = port
            dp::Optional<f64> port_rad;
        };

        // RPM
        struct RpmSentence {
            char source = 'E'; // 'E' engine, 'S' shaft
            u8 number = 0;
            f64 rpm = 0.0;
            dp::Optional<f64> pitch_ratio;
            bool valid = true;
        };

        // VLW
        struct DistanceLogSentence {
            dp::Optional<f64> total_m;
            dp::Optional<f64> trip_m;
        };

        // XTE
        struct CrossTrackSentence {
            f64 error_m = 0.0; // positive = steer right
            bool valid = true;
        };

        // XDR measurement group: type, value, unit, identifier
        struct XdrMeasurement {
            char type = '\0';
            dp::Optional<f64> value; // raw, as transmitted
            char unit = '\0';
            dp::String id;
            dp::Optional<f64> si; // value in SI for known (type, unit) pairs
        };

        struct XdrSentence {
            dp::Vector<XdrMeasurement> measurements;
        };

        struct UnhandledSentence {};

        using SentencePayload =
            std::variant<UnhandledSentence, DepthSentence, WaterTemperatureSentence, WindSentence, WaterSpeedSentence,
                         GroundTrackSentence, RmcSentence, GgaSentence, GllSentence, HeadingSentence,
                         RateOfTurnSentence, RudderSentence, RpmSentence, DistanceLogSentence, CrossTrackSentence,
                         XdrSentence>;

        struct DecodedSentence {
            dp::String talker;
            dp::String type;
            Timestamp timestamp_ms = 0;
            SentencePayload payload;

            bool handled() const noexcept { return !std::holds_alternative<UnhandledSentence>(payload); }

            template <typename T> const T *get() const noexcept { return std::get_if<T>(&payload); }
        };

        // Standard XDR units to SI; nullopt when the pair is not recognised
        inline dp::Optional<f64> xdr_to_si(char type, char unit, f64 value) noexcept {
            switch (type) {
            case 'C': // temperature
                if (unit == 'C')
                    return value + KELVIN_OFFSET;
                if (unit == 'F')
                    return (value - 32.0) * 5.0 / 9.0 + KELVIN_OFFSET;
                if (unit == 'K')
                    return value;
                return dp::nullopt;
            case 'P': // pressure (or percentage on some battery monitors)
                if (unit == 'B')
                    return value * BAR_TO_PA;
                if (unit == 'P')
                    return value;
                return dp::nullopt;
            case 'U': // voltage
                return unit == 'V' ? dp::Optional<f64>(value) : dp::nullopt;
            case 'I': // current
                return unit == 'A' ? dp::Optional<f64>(value) : dp::nullopt;
            case 'H': // humidity
                return unit == 'P' ? dp::Optional<f64>(value / 100.0) : dp::nullopt;
            case 'A': // angle
                return unit == 'D' ? dp::Optional<f64>(value * DEG_TO_RAD) : dp::nullopt;
            case 'V': // volume
                if (unit == 'M')
                    return value;
                if (unit == 'L')
                    return value * LITRE_TO_M3;
                if (unit == 'P')
                    return value / 100.0;
                return dp::nullopt;
            case 'T': // tachometer
            case 'G': // generic
                return value;
            default:
                return dp::nullopt;
            }
        }

        // ─── Sentence decoder ──────────────────────────────────────────────────────
        // Stateless apart from its configuration. Failures are returned, never thrown.
        class SentenceDecoder {
            Nmea0183Config config_;

          public:
            explicit SentenceDecoder(Nmea0183Config config = {}) : config_(std::move(config)) {}

            const Nmea0183Config &config() const noexcept { return config_; }

            Result<DecodedSentence> decode(const dp::String &line, Timestamp timestamp_ms = 0) const {
                auto framed = parse_sentence(line, config_);
                if (framed.is_err()) {
                    return Result<DecodedSentence>::err(framed.error());
                }
                return decode(framed.value(), timestamp_ms);
            }

            Result<DecodedSentence> decode(const Sentence &s, Timestamp timestamp_ms = 0) const {
                DecodedSentence out;
                out.talker = s.talker;
                out.type = s.type;
                out.timestamp_ms = timestamp_ms;

                auto payload = dispatch(s);
                if (payload.is_err()) {
                    return Result<DecodedSentence>::err(payload.error());
                }
                out.payload = std::move(payload.value());
                return Result<DecodedSentence>::ok(std::move(out));
            }

          private:
            using PayloadResult = Result<SentencePayload>;

            static PayloadResult dispatch(const Sentence &s) {
                if (s.is_proprietary()) {
                    echo::category("helm.nmea0183").trace("proprietary sentence ignored: ", s.type);
                    return PayloadResult::ok(UnhandledSentence{});
                }
                if (s.type == "DBT" || s.type == "DBK" || s.type == "DBS")
                    return decode_dbx(s);
                if (s.type == "DPT")
                    return decode_dpt(s);
                if (s.type == "MTW")
                    return decode_mtw(s);
                if (s.type == "MWV")
                    return decode_mwv(s);
                if (s.type == "VHW")
                    return decode_vhw(s);
                if (s.type == "VTG")
                    return decode_vtg(s);
                if (s.type == "RMC")
                    return decode_rmc(s);
                if (s.type == "GGA")
                    return decode_gga(s);
                if (s.type == "GLL")
                    return decode_gll(s);
                if (s.type == "HDG" || s.type == "HDM" || s.type == "HDT")
                    return decode_heading(s);
                if (s.type == "ROT")
                    return decode_rot(s);
                if (s.type == "RSA")
                    return decode_rsa(s);
                if (s.type == "RPM")
                    return decode_rpm(s);
                if (s.type == "VLW")
                    return decode_vlw(s);
                if (s.type == "XTE")
                    return decode_xte(s);
                if (s.type == "XDR")
                    return decode_xdr(s);
                return PayloadResult::ok(UnhandledSentence{});
            }

            static PayloadResult too_short(const Sentence &s, usize expected) {
                return PayloadResult::err(Error::malformed_field(
                    s.type + " expects " + dp::String(std::to_string(expected)) + " fields, got " +
                    dp::String(std::to_string(s.fields.size()))));
            }

            static PayloadResult reader_error(const FieldReader &r) { return PayloadResult::err(*r.error()); }

            static dp::Optional<f64> utc_seconds(FieldReader &r, usize index) {
                auto raw = r.number(index);
                if (!raw.has_value())
                    return dp::nullopt;
                f64 hours = std::floor(*raw / 10000.0);
                f64 minutes = std::floor((*raw - hours * 10000.0) / 100.0);
                f64 seconds = *raw - hours * 10000.0 - minutes * 100.0;
                if (hours > 23.0 || minutes > 59.0 || seconds >= 61.0) {
                    r.fail("bad UTC time: " + r.text(index));
                    return dp::nullopt;
                }
                return hours * 3600.0 + minutes * 60.0 + seconds;
            }

            static bool direction_in_range(const dp::Optional<f64> &deg) {
                return !deg.has_value() || (*deg >= 0.0 && *deg <= 360.0);
            }

            static dp::Optional<f64> to_rad(const dp::Optional<f64> &deg) {
                if (!deg.has_value())
                    return dp::nullopt;
                return *deg * DEG_TO_RAD;
            }

            // Signed by an E/W letter: east positive
            static dp::Optional<f64> east_west(FieldReader &r, usize value_index, usize dir_index) {
                auto v = r.number(value_index);
                if (!v.has_value())
                    return dp::nullopt;
                f64 rad = *v * DEG_TO_RAD;
                return r.flag(dir_index) == 'W' ? -rad : rad;
            }

            static dp::Optional<Error> check_position(const dp::Optional<f64> &lat, const dp::Optional<f64> &lon) {
                if (lat.has_value() && std::fabs(*lat) > 90.0)
                    return Error::out_of_range("latitude beyond 90 degrees");
                if (lon.has_value() && std::fabs(*lon) > 180.0)
                    return Error::out_of_range("longitude beyond 180 degrees");
                return dp::nullopt;
            }

            // $--DBT,x.x,f,x.x,M,x.x,F  (same layout for DBK/DBS)
            static PayloadResult decode_dbx(const Sentence &s) {
                if (s.fields.size() < 6)
                    return too_short(s, 6);
                FieldReader r(s);
                auto feet = r.number(0);
                auto metres = r.number(2);
                auto fathoms = r.number(4);
                if (!r.ok())
                    return reader_error(r);

                DepthSentence d;
                if (metres.has_value())
                    d.depth_m = *metres;
                else if (feet.has_value())
                    d.depth_m = *feet * FEET_TO_M;
                else if (fathoms.has_value())
                    d.depth_m = *fathoms * FATHOM_TO_M;
                else
                    return PayloadResult::err(Error::malformed_field(s.type + " carries no depth value"));

                if (d.depth_m < 0.0)
                    return PayloadResult::err(Error::out_of_range("negative depth"));
                d.reference = s.type == "DBK"   ? DepthReference::Keel
                              : s.type == "DBS" ? DepthReference::Surface
                                                : DepthReference::Transducer;
                return PayloadResult::ok(d);
            }

            // $--DPT,x.x,x.x[,x.x]
            static PayloadResult decode_dpt(const Sentence &s) {
                if (s.fields.size() < 2)
                    return too_short(s, 2);
                FieldReader r(s);
                auto depth = r.number(0);
                auto offset = r.number(1);
                auto range = r.number(2);
                if (!r.ok())
                    return reader_error(r);
                if (!depth.has_value())
                    return PayloadResult::err(Error::malformed_field("DPT carries no depth value"));
                if (*depth < 0.0)
                    return PayloadResult::err(Error::out_of_range("negative depth"));

                DepthSentence d;
                d.depth_m = *depth;
                d.offset_m = offset;
                d.max_range_m = range;
                return PayloadResult::ok(d);
            }

            // $--MTW,x.x,C
            static PayloadResult decode_mtw(const Sentence &s) {
                if (s.fields.size() < 2)
                    return too_short(s, 2);
                FieldReader r(s);
                auto temp = r.number(0);
                if (!r.ok())
                    return reader_error(r);
                if (!temp.has_value())
                    return PayloadResult::err(Error::malformed_field("MTW carries no temperature"));
                auto kelvin = xdr_to_si('C', r.flag(1) == '\0' ? 'C' : r.flag(1), *temp);
                if (!kelvin.has_value())
                    return PayloadResult::err(Error::malformed_field("MTW unit must be C or F"));
                if (*kelvin < 0.0)
                    return PayloadResult::err(Error::out_of_range("temperature below absolute zero"));
                return PayloadResult::ok(WaterTemperatureSentence{*kelvin});
            }

            // $--MWV,x.x,R,x.x,N,A
            static PayloadResult decode_mwv(const Sentence &s) {
                if (s.fields.size() < 5)
                    return too_short(s, 5);
                FieldReader r(s);
                auto angle = r.number(0);
                auto speed = r.number(2);
                if (!r.ok())
                    return reader_error(r);
                if (!angle.has_value() || !speed.has_value())
                    return PayloadResult::err(Error::malformed_field("MWV requires angle and speed"));
                if (!direction_in_range(angle))
                    return PayloadResult::err(Error::out_of_range("wind angle outside 0-360"));
                if (*speed < 0.0)
                    return PayloadResult::err(Error::out_of_range("negative wind speed"));

                WindSentence w;
                w.angle_rad = *angle * DEG_TO_RAD;
                w.true_wind = r.flag(1) == 'T';
                switch (r.flag(3)) {
                case 'N':
                    w.speed_mps = *speed * KNOTS_TO_MPS;
                    break;
                case 'K':
                    w.speed_mps = *speed * KMH_TO_MPS;
                    break;
                case 'S':
                    w.speed_mps = *speed * MPH_TO_MPS;
                    break;
                case 'M':
                    w.speed_mps = *speed;
                    break;
                default:
                    return PayloadResult::err(Error::malformed_field("MWV speed unit: " + r.text(3)));
                }
                w.valid = r.flag(4) == 'A';
                return PayloadResult::ok(w);
            }

            // $--VHW,x.x,T,x.x,M,x.x,N,x.x,K
            static PayloadResult decode_vhw(const Sentence &s) {
                if (s.fields.size() < 6)
                    return too_short(s, 6);
                FieldReader r(s);
                auto hdg_true = r.number(0);
                auto hdg_mag = r.number(2);
                auto knots = r.number(4);
                auto kmh = r.number(6);
                if (!r.ok())
                    return reader_error(r);
                if (!direction_in_range(hdg_true) || !direction_in_range(hdg_mag))
                    return PayloadResult::err(Error::out_of_range("heading outside 0-360"));

                WaterSpeedSentence v;
                v.heading_true_rad = to_rad(hdg_true);
                v.heading_magnetic_rad = to_rad(hdg_mag);
                if (knots.has_value())
                    v.speed_mps = *knots * KNOTS_TO_MPS;
                else if (kmh.has_value())
                    v.speed_mps = *kmh * KMH_TO_MPS;
                return PayloadResult::ok(v);
            }

            // $--VTG,x.x,T,x.x,M,x.x,N,x.x,K[,a]
            static PayloadResult decode_vtg(const Sentence &s) {
                if (s.fields.size() < 8)
                    return too_short(s, 8);
                FieldReader r(s);
                auto cog_true = r.number(0);
                auto cog_mag = r.number(2);
                auto knots = r.number(4);
                auto kmh = r.number(6);
                if (!r.ok())
                    return reader_error(r);
                if (!direction_in_range(cog_true) || !direction_in_range(cog_mag))
                    return PayloadResult::err(Error::out_of_range("course outside 0-360"));
                if (s.fields.size() > 8 && r.flag(8) == 'N')
                    return PayloadResult::ok(UnhandledSentence{}); // mode indicator: data not valid

                GroundTrackSentence g;
                g.course_true_rad = to_rad(cog_true);
                g.course_magnetic_rad = to_rad(cog_mag);
                if (knots.has_value())
                    g.speed_mps = *knots * KNOTS_TO_MPS;
                else if (kmh.has_value())
                    g.speed_mps = *kmh * KMH_TO_MPS;
                return PayloadResult::ok(g);
            }

            // $--RMC,hhmmss.ss,A,llll.ll,a,yyyyy.yy,a,x.x,x.x,ddmmyy,x.x,a[,a]
            static PayloadResult decode_rmc(const Sentence &s) {
                if (s.fields.size() < 11)
                    return too_short(s, 11);
                FieldReader r(s);
                RmcSentence m;
                m.utc_seconds = utc_seconds(r, 0);
                m.valid = r.flag(1) == 'A';
                m.latitude_deg = r.coordinate(2, 3, false);
                m.longitude_deg = r.coordinate(4, 5, true);
                auto sog = r.number(6);
                auto cog = r.number(7);
                auto date = r.integer(8);
                m.variation_rad = east_west(r, 9, 10);
                if (!r.ok())
                    return reader_error(r);
                auto range = check_position(m.latitude_deg, m.longitude_deg);
                if (range.has_value())
                    return PayloadResult::err(*range);
                if (!direction_in_range(cog))
                    return PayloadResult::err(Error::out_of_range("course outside 0-360"));
                if (sog.has_value())
                    m.speed_mps = *sog * KNOTS_TO_MPS;
                m.course_true_rad = to_rad(cog);
                if (date.has_value())
                    m.date_ddmmyy = static_cast<u32>(*date);
                return PayloadResult::ok(m);
            }

            // $--GGA,hhmmss.ss,llll.ll,a,yyyyy.yy,a,x,xx,x.x,x.x,M,x.x,M,x.x,xxxx
            static PayloadResult decode_gga(const Sentence &s) {
                if (s.fields.size() < 14)
                    return too_short(s, 14);
                FieldReader r(s);
                GgaSentence g;
                g.utc_seconds = utc_seconds(r, 0);
                g.latitude_deg = r.coordinate(1, 2, false);
                g.longitude_deg = r.coordinate(3, 4, true);
                auto quality = r.integer(5);
                auto sats = r.integer(6);
                g.hdop = r.number(7);
                g.altitude_m = r.number(8);
                if (!r.ok())
                    return reader_error(r);
                auto range = check_position(g.latitude_deg, g.longitude_deg);
                if (range.has_value())
                    return PayloadResult::err(*range);
                if (quality.has_value()) {
                    if (*quality < 0 || *quality > 8)
                        return PayloadResult::err(Error::out_of_range("GGA fix quality"));
                    g.fix_quality = static_cast<u8>(*quality);
                }
                if (sats.has_value()) {
                    if (*sats < 0 || *sats > 255)
                        return PayloadResult::err(Error::out_of_range("GGA satellite count"));
                    g.satellites = static_cast<u8>(*sats);
                }
                return PayloadResult::ok(g);
            }

            // $--GLL,llll.ll,a,yyyyy.yy,a[,hhmmss.ss,A[,a]]
            static PayloadResult decode_gll(const Sentence &s) {
                if (s.fields.size() < 4)
                    return too_short(s, 4);
                FieldReader r(s);
                auto lat = r.coordinate(0, 1, false);
                auto lon = r.coordinate(2, 3, true);
                GllSentence g;
                g.utc_seconds = utc_seconds(r, 4);
                if (!r.ok())
                    return reader_error(r);
                if (!lat.has_value() || !lon.has_value())
                    return PayloadResult::err(Error::malformed_field("GLL requires a position"));
                auto range = check_position(lat, lon);
                if (range.has_value())
                    return PayloadResult::err(*range);
                g.latitude_deg = *lat;
                g.longitude_deg = *lon;
                g.valid = s.fields.size() < 6 || r.flag(5) == 'A';
                return PayloadResult::ok(g);
            }

            // $--HDG,x.x,x.x,a,x.x,a / $--HDM,x.x,M / $--HDT,x.x,T
            static PayloadResult decode_heading(const Sentence &s) {
                usize expected = s.type == "HDG" ? 5 : 2;
                if (s.fields.size() < expected)
                    return too_short(s, expected);
                FieldReader r(s);
                HeadingSentence h;
                auto heading = r.number(0);
                if (s.type == "HDG") {
                    h.deviation_rad = east_west(r, 1, 2);
                    h.variation_rad = east_west(r, 3, 4);
                }
                if (!r.ok())
                    return reader_error(r);
                if (!heading.has_value())
                    return PayloadResult::err(Error::malformed_field(s.type + " carries no heading"));
                if (!direction_in_range(heading))
                    return PayloadResult::err(Error::out_of_range("heading outside 0-360"));
                if (s.type == "HDT")
                    h.true_rad = *heading * DEG_TO_RAD;
                else
                    h.magnetic_rad = *heading * DEG_TO_RAD;
                return PayloadResult::ok(h);
            }

            // $--ROT,x.x,A  (degrees per minute)
            static PayloadResult decode_rot(const Sentence &s) {
                if (s.fields.size() < 2)
                    return too_short(s, 2);
                FieldReader r(s);
                auto rate = r.number(0);
                if (!r.ok())
                    return reader_error(r);
                if (!rate.has_value())
                    return PayloadResult::err(Error::malformed_field("ROT carries no rate"));
                RateOfTurnSentence t;
                t.rate_radps = *rate * DEG_TO_RAD / 60.0;
                t.valid = r.flag(1) == 'A';
                return PayloadResult::ok(t);
            }

            // $--RSA,x.x,A,x.x,A
            static PayloadResult decode_rsa(const Sentence &s) {
                if (s.fields.size() < 4)
                    return too_short(s, 4);
                FieldReader r(s);
                auto stbd = r.number(0);
                auto port = r.number(2);
                if (!r.ok())
                    return reader_error(r);
                RudderSentence rudder;
                if (stbd.has_value() && r.flag(1) == 'A')
                    rudder.starboard_rad = *stbd * DEG_TO_RAD;
                if (port.has_value() && r.flag(3) == 'A')
                    rudder.port_rad = *port * DEG_TO_RAD;
                if (rudder.starboard_rad.has_value() && std::fabs(*rudder.starboard_rad) > PI / 2.0)
                    return PayloadResult::err(Error::out_of_range("rudder angle beyond 90 degrees"));
                if (rudder.port_rad.has_value() && std::fabs(*rudder.port_rad) > PI / 2.0)
                    return PayloadResult::err(Error::out_of_range("port rudder angle beyond 90 degrees"));
                return PayloadResult::ok(rudder);
            }

            // $--RPM,a,x,x.x,x.x,A
            static PayloadResult decode_rpm(const Sentence &s) {
                if (s.fields.size() < 5)
                    return too_short(s, 5);
                FieldReader r(s);
                auto number = r.integer(1);
                auto rpm = r.number(2);
                auto pitch = r.number(3);
                if (!r.ok())
                    return reader_error(r);
                if (!rpm.has_value())
                    return PayloadResult::err(Error::malformed_field("RPM carries no speed"));
                if (number.has_value() && (*number < 0 || *number > 252))
                    return PayloadResult::err(Error::out_of_range("RPM engine number"));

                RpmSentence m;
                m.source = r.flag(0);
                m.number = number.has_value() ? static_cast<u8>(*number) : 0;
                m.rpm = *rpm;
                if (pitch.has_value())
                    m.pitch_ratio = *pitch / 100.0;
                m.valid = r.flag(4) == 'A';
                return PayloadResult::ok(m);
            }

            // $--VLW,x.x,N,x.x,N
            static PayloadResult decode_vlw(const Sentence &s) {
                if (s.fields.size() < 4)
                    return too_short(s, 4);
                FieldReader r(s);
                auto total = r.number(0);
                auto trip = r.number(2);
                if (!r.ok())
                    return reader_error(r);
                DistanceLogSentence log;
                if (total.has_value())
                    log.total_m = *total * NM_TO_M;
                if (trip.has_value())
                    log.trip_m = *trip * NM_TO_M;
                return PayloadResult::ok(log);
            }

            // $--XTE,A,A,x.x,a,N[,a]
            static PayloadResult decode_xte(const Sentence &s) {
                if (s.fields.size() < 5)
                    return too_short(s, 5);
                FieldReader r(s);
                auto magnitude = r.number(2);
                if (!r.ok())
                    return reader_error(r);
                if (!magnitude.has_value())
                    return PayloadResult::err(Error::malformed_field("XTE carries no magnitude"));
                CrossTrackSentence x;
                f64 scale = r.flag(4) == 'K' ? KM_TO_M : NM_TO_M;
                x.error_m = (r.flag(3) == 'L' ? -*magnitude : *magnitude) * scale;
                x.valid = r.flag(0) == 'A' && r.flag(1) == 'A';
                return PayloadResult::ok(x);
            }

            // $--XDR,a,x.x,a,c--c[,a,x.x,a,c--c ...]
            static PayloadResult decode_xdr(const Sentence &s) {
                usize count = s.fields.size();
                // Some transmitters leave a trailing empty field
                if (count % 4 == 1 && s.fields.back().empty())
                    --count;
                if (count < 4 || count % 4 != 0)
                    return PayloadResult::err(Error::malformed_field("XDR fields must come in groups of four"));

                FieldReader r(s);
                XdrSentence x;
                for (usize i = 0; i < count; i += 4) {
                    XdrMeasurement m;
                    m.type = r.flag(i);
                    m.value = r.number(i + 1);
                    m.unit = r.flag(i + 2);
                    m.id = r.text(i + 3);
                    if (m.value.has_value())
                        m.si = xdr_to_si(m.type, m.unit, *m.value);
                    x.measurements.push_back(std::move(m));
                }
                if (!r.ok())
                    return reader_error(r);
                return PayloadResult::ok(std::move(x));
            }
        };

    } // namespace nmea0183
    using namespace nmea0183;
} // namespace helm
