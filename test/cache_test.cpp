#include <doctest/doctest.h>
#include <helm/cache/sensor_cache.hpp>

#include <algorithm>
#include <limits>

using namespace helm;

namespace {
    SensorUpdate depth_update(f64 depth, Timestamp ts, u8 instance = 0) {
        SensorUpdate u(SensorType::Depth, instance, ts);
        u.set("depth", depth);
        u.set("reference", "transducer");
        return u;
    }
} // namespace

TEST_CASE("Sensor cache apply") {
    UnitRegistry units;
    SensorCache cache(units);

    dp::Vector<SensorKey> created;
    dp::Vector<SensorKey> applied;
    cache.on_instance_created.subscribe([&](SensorKey k) { created.push_back(k); });
    cache.on_applied.subscribe([&](SensorKey k) { applied.push_back(k); });

    SUBCASE("first update creates the instance") {
        CHECK(cache.apply(depth_update(3.8, 1000)) == 2);
        CHECK(cache.size() == 1);
        CHECK(cache.contains(SensorType::Depth, 0));
        REQUIRE(created.size() == 1);
        CHECK(created[0] == SensorKey(SensorType::Depth, 0));
        CHECK(applied.size() == 1);

        auto m = cache.get_metric(SensorType::Depth, 0, "depth");
        REQUIRE(m.has_value());
        CHECK(*m->number() == doctest::Approx(3.8));
        CHECK(m->category == UnitCategory::Depth);
        CHECK(m->timestamp_ms == 1000);
        CHECK(m->formatted == "3.8");
        CHECK(m->formatted_with_unit == "3.8 m");
        CHECK(m->unit == "m");

        auto ref = cache.get_metric(SensorType::Depth, 0, "reference");
        REQUIRE(ref.has_value());
        CHECK_FALSE(ref->numeric());
        CHECK(*ref->text() == "transducer");
        CHECK(ref->formatted == "transducer");
    }

    SUBCASE("later updates reuse the instance") {
        cache.apply(depth_update(3.8, 1000));
        cache.apply(depth_update(4.0, 2000));
        CHECK(created.size() == 1);
        CHECK(applied.size() == 2);
        CHECK(*cache.get_metric(SensorType::Depth, 0, "depth")->number() == doctest::Approx(4.0));
        auto snap = cache.snapshot(SensorType::Depth, 0);
        REQUIRE(snap.has_value());
        CHECK(snap->created_ms == 1000);
        CHECK(snap->last_update_ms == 2000);
        CHECK(snap->name == "depth-0");
        CHECK_FALSE(snap->named);
    }

    SUBCASE("unknown field is a counted schema mismatch") {
        SensorUpdate u(SensorType::Depth, 0, 1000);
        u.set("depth", 3.8);
        u.set("salinity", 35.0);
        CHECK(cache.apply(u) == 1);
        CHECK(cache.stats().schema_mismatches == 1);
        CHECK_FALSE(cache.get_metric(SensorType::Depth, 0, "salinity").has_value());
    }

    SUBCASE("text in a numeric field is rejected") {
        SensorUpdate u(SensorType::Depth, 0, 1000);
        u.set("depth", "deep");
        CHECK(cache.apply(u) == 0);
        CHECK(cache.stats().kind_mismatches == 1);
        CHECK(applied.empty());
    }

    SUBCASE("non-finite values are not stored") {
        SensorUpdate u(SensorType::Depth, 0, 1000);
        u.set("depth", std::numeric_limits<f64>::quiet_NaN());
        CHECK(cache.apply(u) == 0);
        CHECK(cache.stats().non_finite == 1);
        CHECK_FALSE(cache.get_metric(SensorType::Depth, 0, "depth").has_value());
    }

    SUBCASE("name field overrides the display name") {
        SensorUpdate u(SensorType::Battery, 1, 1000);
        u.set("voltage", 12.6);
        u.set("name", "House bank");
        cache.apply(u);
        auto snap = cache.snapshot(SensorType::Battery, 1);
        REQUIRE(snap.has_value());
        CHECK(snap->name == "House bank");
        CHECK(snap->named);
    }

    SUBCASE("history is kept per numeric field") {
        for (Timestamp t = 0; t < 10; ++t)
            cache.apply(depth_update(3.0 + static_cast<f64>(t) * 0.1, t * 1000));
        auto history = cache.get_history(SensorType::Depth, 0, "depth", HistoryWindow{0, 100'000});
        CHECK(history.size() == 10);
        auto recent = cache.get_recent_history(SensorType::Depth, 0, "depth", 2'000, 9'000);
        CHECK(recent.size() == 3);
        auto stats = cache.get_stats(SensorType::Depth, 0, "depth");
        REQUIRE(stats.has_value());
        CHECK(stats->min == doctest::Approx(3.0));
        CHECK(stats->max == doctest::Approx(3.9));
        CHECK(cache.get_history(SensorType::Depth, 0, "reference", HistoryWindow{0, 100'000}).empty());
    }

    SUBCASE("a long burst stays bounded and keeps its extremes") {
        f64 lowest = std::numeric_limits<f64>::infinity();
        f64 highest = -std::numeric_limits<f64>::infinity();
        const Timestamp start = 50'000;
        for (u32 i = 0; i < 1000; ++i) {
            f64 depth = 5.0 + static_cast<f64>((i * 37) % 101) / 10.0;
            if (i == 123)
                depth = 0.5;
            if (i == 777)
                depth = 42.0;
            lowest = std::min(lowest, depth);
            highest = std::max(highest, depth);
            cache.apply(depth_update(depth, start + i));
        }

        Timestamp now = start + 999;
        auto recent = cache.get_recent_history(SensorType::Depth, 0, "depth", 10'000, now);
        CHECK(recent.size() > 0);
        CHECK(recent.size() <= HISTORY_DEFAULT_CAPACITY);
        CHECK(recent.back().timestamp_ms == now);

        auto stats = cache.get_stats(SensorType::Depth, 0, "depth");
        REQUIRE(stats.has_value());
        CHECK(stats->min == doctest::Approx(lowest));
        CHECK(stats->max == doctest::Approx(highest));
        CHECK(stats->count <= HISTORY_DEFAULT_CAPACITY);
    }

    SUBCASE("queries on missing instances") {
        CHECK_FALSE(cache.get_metric(SensorType::Gps, 0, "latitude").has_value());
        CHECK_FALSE(cache.snapshot(SensorType::Gps, 0).has_value());
        CHECK(cache.get_history(SensorType::Gps, 0, "latitude", HistoryWindow{0, 10}).empty());
    }
}

TEST_CASE("Sensor cache enrichment") {
    UnitRegistry units;
    SensorCache cache(units);
    cache.apply(depth_update(3.8, 1000));

    REQUIRE(units.select(UnitCategory::Depth, "ft").is_ok());
    CHECK(cache.re_enrich(UnitCategory::Depth) == 1);

    auto m = cache.get_metric(SensorType::Depth, 0, "depth");
    REQUIRE(m.has_value());
    CHECK(*m->number() == doctest::Approx(3.8)); // SI unchanged
    CHECK(*m->display == doctest::Approx(12.467).epsilon(1e-3));
    CHECK(m->formatted_with_unit == "12.5 ft");

    auto history = cache.get_history(SensorType::Depth, 0, "depth", HistoryWindow{0, 10'000});
    REQUIRE(history.size() == 1);
    CHECK(history[0].value == doctest::Approx(3.8));

    CHECK(cache.re_enrich(UnitCategory::Speed) == 0);
}

TEST_CASE("Sensor cache instance management") {
    UnitRegistry units;
    SensorCache cache(units);
    dp::Vector<SensorKey> removed;
    cache.on_instance_removed.subscribe([&](SensorKey k) { removed.push_back(k); });

    cache.apply(depth_update(3.8, 1000, 0));
    cache.apply(depth_update(5.1, 1000, 2));
    SensorUpdate b(SensorType::Battery, 0, 1000);
    b.set("voltage", 12.6);
    cache.apply(b);

    SUBCASE("instances are ordered by number") {
        auto depth = cache.instances(SensorType::Depth);
        REQUIRE(depth.size() == 2);
        CHECK(depth[0].instance == 0);
        CHECK(depth[1].instance == 2);
        CHECK(cache.all_instances().size() == 3);
    }

    SUBCASE("set_name") {
        REQUIRE(cache.set_name(SensorType::Depth, 2, "Forward sounder").is_ok());
        CHECK(cache.snapshot(SensorType::Depth, 2)->name == "Forward sounder");
        REQUIRE(cache.set_name(SensorType::Depth, 2, "").is_ok());
        CHECK(cache.snapshot(SensorType::Depth, 2)->name == "depth-2");
        auto r = cache.set_name(SensorType::Depth, 7, "nope");
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::UnknownInstance);
    }

    SUBCASE("stale instances drop out of the active list until updated") {
        CHECK(cache.mark_stale(SensorKey(SensorType::Depth, 2)));
        CHECK(cache.is_stale(SensorKey(SensorType::Depth, 2)));
        CHECK(cache.active_instances(SensorType::Depth).size() == 1);
        cache.apply(depth_update(5.0, 2000, 2));
        CHECK_FALSE(cache.is_stale(SensorKey(SensorType::Depth, 2)));
        CHECK(cache.active_instances(SensorType::Depth).size() == 2);
        CHECK_FALSE(cache.mark_stale(SensorKey(SensorType::Gps, 0)));
    }

    SUBCASE("remove emits once") {
        CHECK(cache.remove(SensorKey(SensorType::Depth, 0)));
        CHECK_FALSE(cache.remove(SensorKey(SensorType::Depth, 0)));
        REQUIRE(removed.size() == 1);
        CHECK(removed[0] == SensorKey(SensorType::Depth, 0));
        CHECK(cache.size() == 2);
    }

    SUBCASE("clear emits for every instance") {
        cache.clear();
        CHECK(cache.size() == 0);
        CHECK(removed.size() == 3);
        CHECK(cache.take_dirty().empty());
    }

    SUBCASE("thresholds need a known field and instance") {
        auto bad_field = cache.set_thresholds(SensorType::Depth, 0, "salinity", AlarmThresholds{}.critical_below(1));
        REQUIRE(bad_field.is_err());
        CHECK(bad_field.error().code == ErrorCode::SchemaMismatch);
        auto bad_instance = cache.set_thresholds(SensorType::Depth, 5, "depth", AlarmThresholds{}.critical_below(1));
        REQUIRE(bad_instance.is_err());
        CHECK(bad_instance.error().code == ErrorCode::UnknownInstance);
        REQUIRE(cache.set_thresholds(SensorType::Depth, 0, "depth", AlarmThresholds{}.critical_below(1)).is_ok());
        auto t = cache.thresholds(SensorType::Depth, 0, "depth");
        REQUIRE(t.has_value());
        CHECK(*t->critical_min == doctest::Approx(1.0));
    }
}

TEST_CASE("Sensor cache consumers and dirty tracking") {
    UnitRegistry units;
    SensorCache cache(units);

    SUBCASE("consumers may precede the instance") {
        CHECK_FALSE(cache.has_consumers());
        cache.add_consumer(SensorType::Depth, 0);
        cache.add_consumer(SensorType::Depth, 0);
        CHECK(cache.has_consumers());
        CHECK(cache.consumer_count(SensorType::Depth, 0) == 2);
        CHECK(cache.is_watched(SensorKey(SensorType::Depth, 0)));
        CHECK_FALSE(cache.is_watched(SensorKey(SensorType::Depth, 1)));
        cache.remove_consumer(SensorType::Depth, 0);
        cache.remove_consumer(SensorType::Depth, 0);
        CHECK_FALSE(cache.has_consumers());
    }

    SUBCASE("global consumers watch everything") {
        cache.add_global_consumer();
        CHECK(cache.is_watched(SensorKey(SensorType::Tank, 4)));
        cache.remove_global_consumer();
        cache.remove_global_consumer();
        CHECK(cache.global_consumers() == 0);
    }

    SUBCASE("dirty keys are taken once") {
        cache.apply(depth_update(3.8, 1000));
        cache.apply(depth_update(3.9, 1100));
        auto dirty = cache.take_dirty();
        REQUIRE(dirty.size() == 1);
        CHECK(dirty[0] == SensorKey(SensorType::Depth, 0));
        CHECK(cache.take_dirty().empty());
    }
}
