#include <doctest/doctest.h>
#include <helm/nmea0183/decoder.hpp>

using namespace helm;

namespace {
    DecodedSentence decode_ok(const dp::String &line) {
        SentenceDecoder decoder;
        auto r = decoder.decode(line, 1000);
        REQUIRE(r.is_ok());
        return r.value();
    }

    ErrorCode decode_err(const dp::String &line) {
        SentenceDecoder decoder;
        auto r = decoder.decode(line);
        REQUIRE(r.is_err());
        return r.error().code;
    }
} // namespace

TEST_CASE("Depth sentences") {
    SUBCASE("DBT prefers metres") {
        auto d = decode_ok("$SDDBT,12.4,f,3.8,M,2.1,F*39");
        CHECK(d.talker == "SD");
        CHECK(d.type == "DBT");
        CHECK(d.timestamp_ms == 1000);
        auto depth = d.get<DepthSentence>();
        REQUIRE(depth != nullptr);
        CHECK(depth->depth_m == doctest::Approx(3.8));
        CHECK(depth->reference == DepthReference::Transducer);
        CHECK_FALSE(depth->offset_m.has_value());
    }

    SUBCASE("DBK below keel") {
        auto d = decode_ok("$SDDBK,,f,5.0,M,,F*1C");
        auto depth = d.get<DepthSentence>();
        REQUIRE(depth != nullptr);
        CHECK(depth->depth_m == doctest::Approx(5.0));
        CHECK(depth->reference == DepthReference::Keel);
    }

    SUBCASE("DPT with offset and range") {
        auto d = decode_ok("$SDDPT,3.8,-0.5,100*69");
        auto depth = d.get<DepthSentence>();
        REQUIRE(depth != nullptr);
        CHECK(depth->depth_m == doctest::Approx(3.8));
        REQUIRE(depth->offset_m.has_value());
        CHECK(*depth->offset_m == doctest::Approx(-0.5));
        REQUIRE(depth->max_range_m.has_value());
        CHECK(*depth->max_range_m == doctest::Approx(100.0));
    }

    SUBCASE("DPT without range") {
        auto d = decode_ok("$IIDPT,4.2,0.3*45");
        auto depth = d.get<DepthSentence>();
        REQUIRE(depth != nullptr);
        CHECK_FALSE(depth->max_range_m.has_value());
    }

    SUBCASE("negative depth is out of range") { CHECK(decode_err("$SDDBT,12.4,f,-3.8,M,2.1,F*14") == ErrorCode::OutOfRange); }

    SUBCASE("non-numeric depth is malformed") {
        CHECK(decode_err("$SDDBT,abc,f,3.8,M,2.1,F*40") == ErrorCode::MalformedField);
    }

    SUBCASE("too few fields") { CHECK(decode_err("$SDDBT,12.4,f*3A") == ErrorCode::MalformedField); }
}

TEST_CASE("Environment sentences") {
    SUBCASE("MTW in kelvin") {
        auto d = decode_ok("$IIMTW,18.5,C*1F");
        auto t = d.get<WaterTemperatureSentence>();
        REQUIRE(t != nullptr);
        CHECK(t->temperature_k == doctest::Approx(291.65));
    }

    SUBCASE("MWV apparent in knots") {
        auto d = decode_ok("$IIMWV,45.0,R,10.0,N,A*3D");
        auto w = d.get<WindSentence>();
        REQUIRE(w != nullptr);
        CHECK(w->angle_rad == doctest::Approx(PI / 4.0));
        CHECK(w->speed_mps == doctest::Approx(5.14444).epsilon(1e-4));
        CHECK_FALSE(w->true_wind);
        CHECK(w->valid);
    }

    SUBCASE("MWV true in m/s") {
        auto d = decode_ok("$IIMWV,270.0,T,5.0,M,A*38");
        auto w = d.get<WindSentence>();
        REQUIRE(w != nullptr);
        CHECK(w->true_wind);
        CHECK(w->speed_mps == doctest::Approx(5.0));
    }

    SUBCASE("MWV status V decodes as invalid") {
        auto d = decode_ok("$IIMWV,45.0,R,10.0,N,V*2A");
        auto w = d.get<WindSentence>();
        REQUIRE(w != nullptr);
        CHECK_FALSE(w->valid);
    }

    SUBCASE("MWV angle past 360") { CHECK(decode_err("$IIMWV,400.0,R,10.0,N,A*08") == ErrorCode::OutOfRange); }
}

TEST_CASE("Navigation sentences") {
    SUBCASE("VHW heading and water speed") {
        auto d = decode_ok("$IIVHW,90.0,T,85.0,M,6.0,N,11.1,K*66");
        auto v = d.get<WaterSpeedSentence>();
        REQUIRE(v != nullptr);
        CHECK(*v->heading_true_rad == doctest::Approx(PI / 2.0));
        CHECK(*v->heading_magnetic_rad == doctest::Approx(85.0 * DEG_TO_RAD));
        CHECK(*v->speed_mps == doctest::Approx(6.0 * KNOTS_TO_MPS));
    }

    SUBCASE("VTG course and speed over ground") {
        auto d = decode_ok("$GPVTG,054.7,T,034.4,M,005.5,N,010.2,K*48");
        auto g = d.get<GroundTrackSentence>();
        REQUIRE(g != nullptr);
        CHECK(*g->course_true_rad == doctest::Approx(54.7 * DEG_TO_RAD));
        CHECK(*g->speed_mps == doctest::Approx(5.5 * KNOTS_TO_MPS));
    }

    SUBCASE("VTG with mode N carries no data") {
        auto d = decode_ok("$GPVTG,054.7,T,034.4,M,005.5,N,010.2,K,N*2A");
        CHECK_FALSE(d.handled());
    }

    SUBCASE("RMC") {
        auto d = decode_ok("$GPRMC,123519,A,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6A");
        auto m = d.get<RmcSentence>();
        REQUIRE(m != nullptr);
        CHECK(m->valid);
        CHECK(*m->utc_seconds == doctest::Approx(12 * 3600 + 35 * 60 + 19));
        CHECK(*m->latitude_deg == doctest::Approx(48.1173).epsilon(1e-6));
        CHECK(*m->longitude_deg == doctest::Approx(11.516667).epsilon(1e-6));
        CHECK(*m->speed_mps == doctest::Approx(22.4 * KNOTS_TO_MPS));
        CHECK(*m->course_true_rad == doctest::Approx(84.4 * DEG_TO_RAD));
        CHECK(*m->date_ddmmyy == 230394);
        CHECK(*m->variation_rad == doctest::Approx(-3.1 * DEG_TO_RAD));
    }

    SUBCASE("RMC void status") {
        auto d = decode_ok("$GPRMC,123519,V,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W*7D");
        auto m = d.get<RmcSentence>();
        REQUIRE(m != nullptr);
        CHECK_FALSE(m->valid);
    }

    SUBCASE("RMC latitude beyond 90") {
        CHECK(decode_err("$GPRMC,123519,A,9107.038,N,01131.000,E,022.4,084.4,230394,003.1,W*6E") ==
              ErrorCode::OutOfRange);
    }

    SUBCASE("GGA fix") {
        auto d = decode_ok("$GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,*47");
        auto g = d.get<GgaSentence>();
        REQUIRE(g != nullptr);
        CHECK(g->valid());
        CHECK(g->fix_quality == 1);
        CHECK(*g->satellites == 8);
        CHECK(*g->hdop == doctest::Approx(0.9));
        CHECK(*g->altitude_m == doctest::Approx(545.4));
    }

    SUBCASE("GGA satellite count beyond a byte") {
        CHECK(decode_err("$GPGGA,123519,4807.038,N,01131.000,E,1,300,0.9,545.4,M,46.9,M,,*7C") ==
              ErrorCode::OutOfRange);
    }

    SUBCASE("GGA without fix") {
        auto d = decode_ok("$GPGGA,123519,4807.038,N,01131.000,E,0,00,,,M,,M,,*52");
        auto g = d.get<GgaSentence>();
        REQUIRE(g != nullptr);
        CHECK_FALSE(g->valid());
        CHECK_FALSE(g->hdop.has_value());
    }

    SUBCASE("GLL") {
        auto d = decode_ok("$GPGLL,4916.45,N,12311.12,W,225444,A*31");
        auto g = d.get<GllSentence>();
        REQUIRE(g != nullptr);
        CHECK(g->valid);
        CHECK(g->latitude_deg == doctest::Approx(49.274166).epsilon(1e-6));
        CHECK(g->longitude_deg == doctest::Approx(-123.185333).epsilon(1e-6));
        CHECK(*g->utc_seconds == doctest::Approx(22 * 3600 + 54 * 60 + 44));
    }

    SUBCASE("XTE steer left is negative") {
        auto d = decode_ok("$GPXTE,A,A,0.67,L,N*6F");
        auto x = d.get<CrossTrackSentence>();
        REQUIRE(x != nullptr);
        CHECK(x->valid);
        CHECK(x->error_m == doctest::Approx(-0.67 * NM_TO_M));
    }

    SUBCASE("VLW distances") {
        auto d = decode_ok("$IIVLW,1234.5,N,12.3,N*4C");
        auto log = d.get<DistanceLogSentence>();
        REQUIRE(log != nullptr);
        CHECK(*log->total_m == doctest::Approx(1234.5 * NM_TO_M));
        CHECK(*log->trip_m == doctest::Approx(12.3 * NM_TO_M));
    }
}

TEST_CASE("Heading and steering sentences") {
    SUBCASE("HDG magnetic with deviation and variation") {
        auto d = decode_ok("$HCHDG,98.3,0.0,E,12.6,W*57");
        auto h = d.get<HeadingSentence>();
        REQUIRE(h != nullptr);
        CHECK(*h->magnetic_rad == doctest::Approx(98.3 * DEG_TO_RAD));
        CHECK_FALSE(h->true_rad.has_value());
        CHECK(*h->deviation_rad == doctest::Approx(0.0));
        CHECK(*h->variation_rad == doctest::Approx(-12.6 * DEG_TO_RAD));
    }

    SUBCASE("HDM") {
        auto d = decode_ok("$HCHDM,98.3,M*1B");
        auto h = d.get<HeadingSentence>();
        REQUIRE(h != nullptr);
        CHECK(*h->magnetic_rad == doctest::Approx(98.3 * DEG_TO_RAD));
    }

    SUBCASE("HDT") {
        auto d = decode_ok("$HEHDT,271.1,T*2A");
        auto h = d.get<HeadingSentence>();
        REQUIRE(h != nullptr);
        CHECK(*h->true_rad == doctest::Approx(271.1 * DEG_TO_RAD));
        CHECK_FALSE(h->magnetic_rad.has_value());
    }

    SUBCASE("ROT degrees per minute to rad/s") {
        auto d = decode_ok("$TIROT,-30.0,A*25");
        auto t = d.get<RateOfTurnSentence>();
        REQUIRE(t != nullptr);
        CHECK(t->rate_radps == doctest::Approx(-0.5 * DEG_TO_RAD));
        CHECK(t->valid);
    }

    SUBCASE("RSA both rudders") {
        auto d = decode_ok("$IIRSA,10.0,A,-5.0,A*59");
        auto r = d.get<RudderSentence>();
        REQUIRE(r != nullptr);
        CHECK(*r->starboard_rad == doctest::Approx(10.0 * DEG_TO_RAD));
        CHECK(*r->port_rad == doctest::Approx(-5.0 * DEG_TO_RAD));
    }

    SUBCASE("RSA port rudder beyond 90 degrees") {
        CHECK(decode_err("$IIRSA,10.0,A,-95.0,A*60") == ErrorCode::OutOfRange);
        // An invalid port reading is dropped, not range-checked
        auto d = decode_ok("$IIRSA,10.0,A,-95.0,V*77");
        auto r = d.get<RudderSentence>();
        REQUIRE(r != nullptr);
        CHECK_FALSE(r->port_rad.has_value());
    }

    SUBCASE("RPM engine") {
        auto d = decode_ok("$IIRPM,E,1,2200,,A*56");
        auto m = d.get<RpmSentence>();
        REQUIRE(m != nullptr);
        CHECK(m->source == 'E');
        CHECK(m->number == 1);
        CHECK(m->rpm == doctest::Approx(2200.0));
        CHECK_FALSE(m->pitch_ratio.has_value());
    }
}

TEST_CASE("XDR transducer groups") {
    SUBCASE("multiple groups with SI conversion") {
        auto d = decode_ok("$IIXDR,C,25.0,C,ENGINE#1,P,2.5,B,ENGINE#1_OIL*79");
        auto x = d.get<XdrSentence>();
        REQUIRE(x != nullptr);
        REQUIRE(x->measurements.size() == 2);
        CHECK(x->measurements[0].type == 'C');
        CHECK(x->measurements[0].id == "ENGINE#1");
        CHECK(*x->measurements[0].si == doctest::Approx(298.15));
        CHECK(*x->measurements[1].si == doctest::Approx(250000.0));
    }

    SUBCASE("unknown unit keeps the raw value") {
        CHECK_FALSE(xdr_to_si('C', 'X', 1.0).has_value());
        CHECK(*xdr_to_si('V', 'L', 200.0) == doctest::Approx(0.2));
        CHECK(*xdr_to_si('H', 'P', 55.0) == doctest::Approx(0.55));
    }

    SUBCASE("incomplete group") { CHECK(decode_err("$IIXDR,U,12.6,V*7A") == ErrorCode::MalformedField); }
}

TEST_CASE("Unknown sentences are not errors") {
    SUBCASE("unknown type") {
        auto d = decode_ok("$IIZZZ,1,2,3*46");
        CHECK_FALSE(d.handled());
        CHECK(d.type == "ZZZ");
    }

    SUBCASE("proprietary") {
        auto d = decode_ok("$PSMDST,1,2*0E");
        CHECK_FALSE(d.handled());
    }

    SUBCASE("framing errors pass through") {
        // Correct checksum for this body is *39
        CHECK(decode_err("$SDDBT,12.4,f,3.8,M,2.1,F*3A") == ErrorCode::BadChecksum);
        CHECK(decode_err("garbage") == ErrorCode::MalformedSentence);
    }
}
