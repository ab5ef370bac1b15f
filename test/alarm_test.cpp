#include <doctest/doctest.h>
#include <helm/alarm/evaluator.hpp>

using namespace helm;

namespace {
    void put(SensorCache &cache, SensorType type, u8 instance, const char *field, f64 value, Timestamp ts) {
        SensorUpdate u(type, instance, ts);
        u.set(field, value);
        cache.apply(u);
    }
} // namespace

TEST_CASE("Alarm thresholds") {
    SUBCASE("built-in defaults") {
        auto depth = default_thresholds(SensorType::Depth, "depth");
        REQUIRE(depth.has_value());
        CHECK(*depth->critical_min == doctest::Approx(2.0));
        CHECK(*depth->warning_min == doctest::Approx(2.5));
        CHECK(depth->hysteresis == doctest::Approx(0.2));

        auto tank = default_thresholds(SensorType::Tank, "level");
        REQUIRE(tank.has_value());
        CHECK(tank->stale_timeout_ms == ALARM_TANK_STALE_TIMEOUT_MS);

        CHECK(default_thresholds(SensorType::Engine, "coolant_temperature").has_value());
        CHECK(default_thresholds(SensorType::Battery, "voltage").has_value());
        CHECK_FALSE(default_thresholds(SensorType::Wind, "apparent_speed").has_value());
    }

    SUBCASE("validation") {
        CHECK(validate(AlarmThresholds{}.critical_below(2.0).warning_below(2.5)).is_ok());
        CHECK(validate(AlarmThresholds{}.enable(false)).is_ok());
        CHECK(validate(AlarmThresholds{}).is_err());
        CHECK(validate(AlarmThresholds{}.critical_below(3.0).warning_below(2.0)).is_err());
        CHECK(validate(AlarmThresholds{}.critical_above(90.0).warning_above(95.0)).is_err());
        CHECK(validate(AlarmThresholds{}.warning_below(5.0).warning_above(4.0)).is_err());
        CHECK(validate(AlarmThresholds{}.critical_below(1.0).band(-0.1)).is_err());
        auto r = validate(AlarmThresholds{});
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidThreshold);
    }

    SUBCASE("severity with hysteresis") {
        auto t = *default_thresholds(SensorType::Depth, "depth");
        CHECK(next_severity(t, AlarmState::Normal, 3.0) == AlarmState::Normal);
        CHECK(next_severity(t, AlarmState::Normal, 2.5) == AlarmState::Normal); // strict crossing
        CHECK(next_severity(t, AlarmState::Normal, 2.4) == AlarmState::Warning);
        CHECK(next_severity(t, AlarmState::Warning, 2.6) == AlarmState::Warning);
        CHECK(next_severity(t, AlarmState::Warning, 2.75) == AlarmState::Normal);
        CHECK(next_severity(t, AlarmState::Normal, 1.9) == AlarmState::Critical);
        CHECK(next_severity(t, AlarmState::Critical, 2.1) == AlarmState::Critical);
        CHECK(next_severity(t, AlarmState::Critical, 2.3) == AlarmState::Warning);
        CHECK(next_severity(t, AlarmState::Critical, 2.8) == AlarmState::Normal);
    }
}

TEST_CASE("Alarm evaluation") {
    UnitRegistry units;
    SensorCache cache(units);
    AlarmEvaluator alarms(cache);

    dp::Vector<AlarmTransition> transitions;
    alarms.on_alarm_change.subscribe([&](const AlarmTransition &t) { transitions.push_back(t); });

    put(cache, SensorType::Depth, 0, "depth", 3.0, 1000);
    cache.add_consumer(SensorType::Depth, 0);

    SUBCASE("defaults are installed on new instances") {
        REQUIRE(cache.thresholds(SensorType::Depth, 0, "depth").has_value());
        CHECK(alarms.evaluate(1000) == 0);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Normal);
    }

    SUBCASE("shallow water raises a warning then a critical") {
        put(cache, SensorType::Depth, 0, "depth", 2.4, 2000);
        CHECK(alarms.evaluate(2000) == 1);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Warning);
        auto status = alarms.status(SensorType::Depth, 0, "depth");
        REQUIRE(status.has_value());
        CHECK(status->sound_pattern == SoundPattern::MorseU);
        CHECK(status->since_ms == 2000);
        CHECK(*status->value == doctest::Approx(2.4));

        put(cache, SensorType::Depth, 0, "depth", 1.8, 3000);
        alarms.evaluate(3000);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Critical);
        REQUIRE(transitions.size() == 2);
        CHECK(transitions[1].from == AlarmState::Warning);
        CHECK(transitions[1].to == AlarmState::Critical);
        CHECK(transitions[1].sound_pattern == SoundPattern::RapidPulse);
        CHECK(transitions[1].field == "depth");
    }

    SUBCASE("no flapping inside the hysteresis band") {
        f64 readings[] = {2.45, 2.55, 2.45, 2.6, 2.5, 2.65};
        Timestamp ts = 2000;
        for (f64 v : readings) {
            put(cache, SensorType::Depth, 0, "depth", v, ts);
            alarms.evaluate(ts);
            ts += 500;
        }
        CHECK(transitions.size() == 1);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Warning);

        put(cache, SensorType::Depth, 0, "depth", 2.75, ts);
        alarms.evaluate(ts);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Normal);
        CHECK(transitions.size() == 2);
    }

    SUBCASE("missing readings go stale and return to the prior severity") {
        put(cache, SensorType::Depth, 0, "depth", 2.4, 2000);
        alarms.evaluate(2000);
        alarms.evaluate(2000 + ALARM_STALE_TIMEOUT_MS);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Warning);
        alarms.evaluate(2001 + ALARM_STALE_TIMEOUT_MS);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Stale);
        CHECK(alarms.status(SensorType::Depth, 0, "depth")->sound_pattern == SoundPattern::None);

        // A fresh reading leaves Stale without waiting for the next evaluation
        put(cache, SensorType::Depth, 0, "depth", 2.4, 14'000);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Warning);
        REQUIRE(transitions.size() == 3);
        CHECK(transitions[2].from == AlarmState::Stale);
        CHECK(transitions[2].to == AlarmState::Warning);
    }

    SUBCASE("readings stamped ahead of the clock are fresh") {
        put(cache, SensorType::Depth, 0, "depth", 2.4, 50'000);
        alarms.evaluate(20'000);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Warning);
    }

    SUBCASE("acknowledge silences until the next transition") {
        CHECK_FALSE(alarms.acknowledge(SensorType::Depth, 0, "depth"));
        put(cache, SensorType::Depth, 0, "depth", 2.4, 2000);
        alarms.evaluate(2000);
        CHECK(alarms.acknowledge(SensorType::Depth, 0, "depth"));
        auto status = alarms.status(SensorType::Depth, 0, "depth");
        REQUIRE(status.has_value());
        CHECK(status->acknowledged);
        CHECK(status->sound_pattern == SoundPattern::None);

        put(cache, SensorType::Depth, 0, "depth", 1.5, 3000);
        alarms.evaluate(3000);
        status = alarms.status(SensorType::Depth, 0, "depth");
        CHECK_FALSE(status->acknowledged);
        CHECK(status->sound_pattern == SoundPattern::RapidPulse);
    }

    SUBCASE("unwatched instances are not evaluated") {
        cache.remove_consumer(SensorType::Depth, 0);
        put(cache, SensorType::Depth, 0, "depth", 1.0, 2000);
        CHECK(alarms.evaluate(2000) == 0);
        CHECK(alarms.evaluate_instance(SensorKey(SensorType::Depth, 0), 2000) == 1);
    }

    SUBCASE("disabled thresholds stay normal") {
        REQUIRE(alarms.set_enabled(SensorType::Depth, 0, "depth", false).is_ok());
        put(cache, SensorType::Depth, 0, "depth", 1.0, 2000);
        alarms.evaluate(2000);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Normal);
    }

    SUBCASE("removal forgets alarm state") {
        put(cache, SensorType::Depth, 0, "depth", 1.0, 2000);
        alarms.evaluate(2000);
        cache.remove(SensorKey(SensorType::Depth, 0));
        CHECK_FALSE(alarms.status(SensorType::Depth, 0, "depth").has_value());
        CHECK(alarms.active_alarms().empty());
    }
}

TEST_CASE("Alarm fields that never report") {
    UnitRegistry units;
    SensorCache cache(units);
    AlarmEvaluator alarms(cache);
    cache.add_consumer(SensorType::Engine, 0);

    // Only rpm arrives; coolant temperature has default thresholds but no reading
    const Timestamp created = 5000;
    put(cache, SensorType::Engine, 0, "rpm", 1800.0, created);
    REQUIRE(cache.thresholds(SensorType::Engine, 0, "coolant_temperature").has_value());

    CHECK(alarms.evaluate(created + 1000) == 0);
    CHECK(alarms.state(SensorType::Engine, 0, "coolant_temperature") == AlarmState::Normal);

    // Other fields reporting do not keep the silent one fresh
    put(cache, SensorType::Engine, 0, "rpm", 1850.0, created + ALARM_STALE_TIMEOUT_MS);
    CHECK(alarms.evaluate(created + ALARM_STALE_TIMEOUT_MS) == 0);
    CHECK(alarms.state(SensorType::Engine, 0, "coolant_temperature") == AlarmState::Normal);

    CHECK(alarms.evaluate(created + ALARM_STALE_TIMEOUT_MS + 1) == 1);
    auto status = alarms.status(SensorType::Engine, 0, "coolant_temperature");
    REQUIRE(status.has_value());
    CHECK(status->state == AlarmState::Stale);
    CHECK_FALSE(status->value.has_value());
}

TEST_CASE("Alarm evaluation follows changed instances") {
    UnitRegistry units;
    SensorCache cache(units);
    AlarmEvaluator alarms(cache);
    cache.add_consumer(SensorType::Depth, 0);

    put(cache, SensorType::Depth, 0, "depth", 1.0, 1000);
    put(cache, SensorType::Depth, 1, "depth", 1.0, 1000);

    SUBCASE("watched changes are consumed") {
        CHECK(alarms.evaluate(1000) == 1);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Critical);
        CHECK(alarms.state(SensorType::Depth, 1, "depth") == AlarmState::Normal);

        auto left = cache.take_dirty();
        REQUIRE(left.size() == 1);
        CHECK(left[0] == SensorKey(SensorType::Depth, 1));
    }

    SUBCASE("unwatched changes wait for a consumer") {
        CHECK(alarms.evaluate(1000) == 1);
        CHECK(alarms.evaluate(1500) == 0);

        cache.add_consumer(SensorType::Depth, 1);
        CHECK(alarms.evaluate(2000) == 1);
        CHECK(alarms.state(SensorType::Depth, 1, "depth") == AlarmState::Critical);
        CHECK(cache.take_dirty().empty());
    }

    SUBCASE("clean instances still age out") {
        CHECK(alarms.evaluate(1000) == 1);
        CHECK(alarms.evaluate(1000 + ALARM_STALE_TIMEOUT_MS + 1) == 1);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Stale);
        CHECK(alarms.state(SensorType::Depth, 1, "depth") == AlarmState::Normal);
    }
}

TEST_CASE("Alarm configuration errors") {
    UnitRegistry units;
    SensorCache cache(units);
    AlarmEvaluator alarms(cache);
    put(cache, SensorType::Depth, 0, "depth", 3.0, 1000);

    SUBCASE("text field") {
        auto r = alarms.configure(SensorType::Depth, 0, "reference", AlarmThresholds{}.critical_below(1.0));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::SchemaMismatch);
    }

    SUBCASE("invalid bounds") {
        auto r = alarms.configure(SensorType::Depth, 0, "depth", AlarmThresholds{}.critical_below(3.0).warning_below(2.0));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidThreshold);
    }

    SUBCASE("unknown instance") {
        auto r = alarms.configure(SensorType::Depth, 4, "depth", AlarmThresholds{}.critical_below(1.0));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::UnknownInstance);
    }

    SUBCASE("enabling a field without thresholds") {
        auto r = alarms.set_enabled(SensorType::Depth, 0, "offset", true);
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::MissingThreshold);
    }

    SUBCASE("custom thresholds replace the defaults") {
        REQUIRE(alarms.configure(SensorType::Depth, 0, "depth", AlarmThresholds{}.critical_below(5.0)).is_ok());
        cache.add_global_consumer();
        alarms.evaluate(1000);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Critical);
    }
}

TEST_CASE("Active alarms") {
    UnitRegistry units;
    SensorCache cache(units);
    AlarmEvaluator alarms(cache);
    cache.add_global_consumer();

    put(cache, SensorType::Depth, 0, "depth", 2.4, 1000);   // warning
    put(cache, SensorType::Battery, 1, "voltage", 11.5, 1000); // critical
    put(cache, SensorType::Tank, 0, "level", 0.5, 1000);    // normal
    alarms.evaluate(1000);

    auto active = alarms.active_alarms();
    REQUIRE(active.size() == 2);
    CHECK(active[0].key == SensorKey(SensorType::Battery, 1));
    CHECK(active[0].status.state == AlarmState::Critical);
    CHECK(active[0].status.sound_pattern == SoundPattern::Warble);
    CHECK(active[1].key == SensorKey(SensorType::Depth, 0));
    CHECK(active[1].field == "depth");

    SUBCASE("tank stale timeout is longer") {
        alarms.evaluate(1000 + ALARM_STALE_TIMEOUT_MS + 1);
        CHECK(alarms.state(SensorType::Tank, 0, "level") == AlarmState::Normal);
        CHECK(alarms.state(SensorType::Depth, 0, "depth") == AlarmState::Stale);
        alarms.evaluate(1000 + ALARM_TANK_STALE_TIMEOUT_MS + 1);
        CHECK(alarms.state(SensorType::Tank, 0, "level") == AlarmState::Stale);
    }

    SUBCASE("evaluator without defaults") {
        UnitRegistry other_units;
        SensorCache other(other_units);
        AlarmEvaluator bare(other, AlarmConfig{}.install_defaults(false));
        put(other, SensorType::Depth, 0, "depth", 1.0, 1000);
        CHECK_FALSE(other.thresholds(SensorType::Depth, 0, "depth").has_value());
    }
}
