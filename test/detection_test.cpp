#include <doctest/doctest.h>
#include <helm/detect/detection_service.hpp>

#include <atomic>
#include <thread>

using namespace helm;

namespace {
    void put(SensorCache &cache, SensorType type, u8 instance, const char *field, f64 value, Timestamp ts) {
        SensorUpdate u(type, instance, ts);
        u.set(field, value);
        cache.apply(u);
    }

    EquipmentRegistration depth_sounder() {
        return EquipmentRegistration("depth", "Depth", SensorType::Depth).require("depth").optional("offset");
    }

    EquipmentRegistration batteries(u8 max = 0) {
        return EquipmentRegistration("battery", "Battery", SensorType::Battery)
            .require("voltage")
            .multi(true, max)
            .with_priority(5);
    }
} // namespace

TEST_CASE("Equipment registration") {
    UnitRegistry units;
    SensorCache cache(units);
    DetectionService detection(cache);

    SUBCASE("valid registration") {
        REQUIRE(detection.register_equipment(depth_sounder()).is_ok());
        CHECK(detection.registrations().size() == 1);
    }

    SUBCASE("empty id") {
        auto r = detection.register_equipment(EquipmentRegistration("", "Depth", SensorType::Depth).require("depth"));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidRegistration);
    }

    SUBCASE("no required fields") {
        auto r = detection.register_equipment(EquipmentRegistration("depth", "Depth", SensorType::Depth));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidRegistration);
    }

    SUBCASE("required field outside the schema") {
        auto r = detection.register_equipment(
            EquipmentRegistration("depth", "Depth", SensorType::Depth).require("salinity"));
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidRegistration);
        CHECK(r.error().message.find("salinity") != dp::String::npos);
    }

    SUBCASE("duplicate id") {
        REQUIRE(detection.register_equipment(depth_sounder()).is_ok());
        auto r = detection.register_equipment(depth_sounder());
        REQUIRE(r.is_err());
        CHECK(r.error().code == ErrorCode::InvalidRegistration);
        CHECK(detection.registrations().size() == 1);
    }
}

TEST_CASE("Detection lifecycle") {
    UnitRegistry units;
    SensorCache cache(units);
    DetectionService detection(cache);

    dp::Vector<DetectedInstance> found;
    dp::Vector<DetectedInstance> lost;
    detection.on_detected.subscribe([&](const DetectedInstance &d) { found.push_back(d); });
    detection.on_removed.subscribe([&](const DetectedInstance &d) { lost.push_back(d); });

    REQUIRE(detection.register_equipment(depth_sounder()).is_ok());

    SUBCASE("a qualifying update is detected at once") {
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
        REQUIRE(found.size() == 1);
        CHECK(found[0].equipment_id == "depth");
        CHECK(found[0].title == "Depth");
        CHECK(found[0].instance == 0);
        CHECK(found[0].last_update_ms == 1000);
        CHECK(detection.is_detected("depth", 0));
        CHECK(detection.size() == 1);
    }

    SUBCASE("data before registration is found on registering") {
        put(cache, SensorType::Battery, 0, "voltage", 12.6, 1000);
        REQUIRE(detection.register_equipment(batteries()).is_ok());
        CHECK(detection.is_detected("battery", 0));
    }

    SUBCASE("only the required fields count") {
        put(cache, SensorType::Depth, 0, "offset", 0.3, 1000);
        CHECK_FALSE(detection.is_detected("depth", 0));
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1100);
        CHECK(detection.is_detected("depth", 0));
    }

    SUBCASE("removed once after the grace period") {
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
        detection.scan(1000 + INSTANCE_TIMEOUT_MS);
        CHECK_FALSE(detection.removal_pending("depth", 0));

        Timestamp unfit = 1001 + INSTANCE_TIMEOUT_MS;
        detection.scan(unfit);
        CHECK(detection.is_detected("depth", 0));
        CHECK(detection.removal_pending("depth", 0));

        detection.scan(unfit + DETECTION_GRACE_MS - 1);
        CHECK(detection.is_detected("depth", 0));
        CHECK(lost.empty());

        detection.scan(unfit + DETECTION_GRACE_MS);
        CHECK_FALSE(detection.is_detected("depth", 0));
        REQUIRE(lost.size() == 1);
        CHECK(lost[0].equipment_id == "depth");
        CHECK(cache.is_stale(SensorKey(SensorType::Depth, 0)));

        detection.scan(unfit + DETECTION_GRACE_MS + 1000);
        detection.rescan(unfit + DETECTION_GRACE_MS + 2000);
        CHECK(lost.size() == 1);
        CHECK(detection.size() == 0);
    }

    SUBCASE("requalifying cancels a pending removal") {
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
        Timestamp unfit = 1001 + INSTANCE_TIMEOUT_MS;
        detection.scan(unfit);
        REQUIRE(detection.removal_pending("depth", 0));

        put(cache, SensorType::Depth, 0, "depth", 3.9, unfit + 100);
        CHECK_FALSE(detection.removal_pending("depth", 0));
        detection.scan(unfit + DETECTION_GRACE_MS + 100);
        CHECK(detection.is_detected("depth", 0));
        CHECK(lost.empty());
        CHECK(found.size() == 1);
    }

    SUBCASE("a removed instance comes back with fresh data") {
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
        Timestamp unfit = 1001 + INSTANCE_TIMEOUT_MS;
        detection.scan(unfit);
        detection.scan(unfit + DETECTION_GRACE_MS);
        REQUIRE_FALSE(detection.is_detected("depth", 0));

        put(cache, SensorType::Depth, 0, "depth", 4.0, unfit + DETECTION_GRACE_MS + 500);
        CHECK(detection.is_detected("depth", 0));
        CHECK_FALSE(cache.is_stale(SensorKey(SensorType::Depth, 0)));
        CHECK(found.size() == 2);
    }

    SUBCASE("unregistering drops its instances") {
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
        CHECK(detection.unregister_equipment("depth"));
        CHECK_FALSE(detection.unregister_equipment("depth"));
        CHECK(detection.size() == 0);
        CHECK(lost.size() == 1);
        detection.rescan(2000);
        CHECK(detection.size() == 0);
    }
}

TEST_CASE("Detection of multiple instances") {
    UnitRegistry units;
    SensorCache cache(units);
    DetectionService detection(cache);

    SUBCASE("single-instance equipment ignores other instances") {
        REQUIRE(detection.register_equipment(depth_sounder()).is_ok());
        put(cache, SensorType::Depth, 1, "depth", 3.8, 1000);
        CHECK(detection.size() == 0);
    }

    SUBCASE("numbered titles and instance limit") {
        REQUIRE(detection.register_equipment(batteries(2)).is_ok());
        put(cache, SensorType::Battery, 0, "voltage", 12.6, 1000);
        put(cache, SensorType::Battery, 1, "voltage", 12.4, 1000);
        put(cache, SensorType::Battery, 2, "voltage", 12.5, 1000);
        auto list = detection.detected();
        REQUIRE(list.size() == 2);
        CHECK(list[0].title == "Battery 1");
        CHECK(list[1].title == "Battery 2");
        CHECK_FALSE(detection.is_detected("battery", 2));
    }

    SUBCASE("explicit name wins over the numbered title") {
        REQUIRE(detection.register_equipment(batteries()).is_ok());
        SensorUpdate u(SensorType::Battery, 3, 1000);
        u.set("voltage", 12.8);
        u.set("name", "Starter");
        cache.apply(u);
        auto list = detection.detected();
        REQUIRE(list.size() == 1);
        CHECK(list[0].title == "Starter");
    }

    SUBCASE("ordered by priority, id, instance") {
        REQUIRE(detection.register_equipment(batteries()).is_ok());
        REQUIRE(detection.register_equipment(depth_sounder()).is_ok());
        REQUIRE(detection.register_equipment(
                        EquipmentRegistration("anchor_depth", "Anchor", SensorType::Depth).require("depth"))
                    .is_ok());
        put(cache, SensorType::Battery, 1, "voltage", 12.4, 1000);
        put(cache, SensorType::Battery, 0, "voltage", 12.6, 1000);
        put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);

        auto list = detection.detected();
        REQUIRE(list.size() == 4);
        CHECK(list[0].equipment_id == "anchor_depth");
        CHECK(list[1].equipment_id == "depth");
        CHECK(list[2].equipment_id == "battery");
        CHECK(list[2].instance == 0);
        CHECK(list[3].instance == 1);
    }
}

TEST_CASE("Detection change notifications are throttled") {
    UnitRegistry units;
    SensorCache cache(units);
    DetectionService detection(cache, DetectionConfig{}.throttle_ms(100));
    REQUIRE(detection.register_equipment(depth_sounder()).is_ok());
    REQUIRE(detection.register_equipment(batteries()).is_ok());

    dp::Vector<usize> counts;
    detection.on_detected_changed.subscribe([&](usize n) { counts.push_back(n); });

    put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
    put(cache, SensorType::Battery, 0, "voltage", 12.6, 1050);
    REQUIRE(counts.size() == 1);
    CHECK(counts[0] == 1);

    detection.scan(1200);
    REQUIRE(counts.size() == 2);
    CHECK(counts[1] == 2);

    detection.scan(1400);
    CHECK(counts.size() == 2);
}

TEST_CASE("Detection under concurrent updates") {
    UnitRegistry units;
    SensorCache cache(units);
    DetectionService detection(cache);
    REQUIRE(detection.register_equipment(batteries()).is_ok());

    std::atomic<i32> found{0};
    detection.on_detected.subscribe([&](const DetectedInstance &) { found++; });

    auto feed = [&](u8 instance) {
        for (i32 i = 0; i < 500; ++i)
            put(cache, SensorType::Battery, instance, "voltage", 12.5, 1000 + static_cast<Timestamp>(i));
    };
    std::atomic<bool> done{false};
    bool ordered = true;
    std::thread reader([&] {
        while (!done.load()) {
            auto list = detection.detected();
            if (list.size() > 2 || (list.size() == 2 && list[0].instance != 0))
                ordered = false;
            detection.is_detected("battery", 1);
        }
    });
    std::thread first(feed, u8(0));
    std::thread second(feed, u8(1));
    first.join();
    second.join();
    done.store(true);
    reader.join();

    CHECK(ordered);
    CHECK(found.load() == 2);
    auto list = detection.detected();
    REQUIRE(list.size() == 2);
    CHECK(list[0].title == "Battery 1");
    CHECK(list[1].title == "Battery 2");
}

TEST_CASE("Detection grace survives a clock step back") {
    UnitRegistry units;
    SensorCache cache(units);
    DetectionService detection(cache);
    REQUIRE(detection.register_equipment(depth_sounder()).is_ok());

    put(cache, SensorType::Depth, 0, "depth", 3.8, 1000);
    Timestamp unfit = 1500 + INSTANCE_TIMEOUT_MS;
    detection.scan(unfit);
    REQUIRE(detection.removal_pending("depth", 0));

    // Still unfit at an earlier time: the elapsed grace must not wrap around
    detection.scan(unfit - 400);
    CHECK(detection.is_detected("depth", 0));
    CHECK(detection.removal_pending("depth", 0));

    detection.scan(unfit + DETECTION_GRACE_MS - 1);
    CHECK(detection.is_detected("depth", 0));
    detection.scan(unfit + DETECTION_GRACE_MS);
    CHECK_FALSE(detection.is_detected("depth", 0));
}
