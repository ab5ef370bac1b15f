#include <helm/pipeline.hpp>
#include <echo/echo.hpp>

using namespace helm;

int main() {
    echo::info("=== NMEA 2000 Battery Monitor ===");

    Pipeline pipeline;
    auto reg = pipeline.register_equipment(
        EquipmentRegistration("battery", "Battery", SensorType::Battery).require("voltage").multi(true));
    if (reg.is_err()) {
        echo::error("Registration failed: ", reg.error().message);
        return 1;
    }

    pipeline.detection().on_detected.subscribe(
        [](const DetectedInstance &d) { echo::info("Detected ", d.title, " (instance ", static_cast<u32>(d.instance), ")"); });
    pipeline.alarms().on_alarm_change.subscribe([](const AlarmTransition &tr) {
        echo::warn("Battery ", static_cast<u32>(tr.instance), " ", tr.field, ": ", alarm_state_name(tr.to));
    });
    pipeline.subscribe_all();

    // Battery Status from a shunt at 0x23: 13.20 V, 200.0 A, 286.0 K
    const u8 house[8] = {0x00, 0x28, 0x05, 0xD0, 0x07, 0x2C, 0x0B, 0x01};
    if (auto r = pipeline.feed_frame(Frame::make(PGN_BATTERY_STATUS, 0x23, house)); r.is_err()) {
        echo::error("Battery status: ", r.error().message);
    }

    // Starter bank sagging to 11.50 V
    const u8 starter[8] = {0x01, 0x7E, 0x04, 0x00, 0x00, 0x2C, 0x0B, 0x02};
    if (auto r = pipeline.feed_frame(Frame::make(PGN_BATTERY_STATUS, 0x23, starter)); r.is_err()) {
        echo::error("Battery status: ", r.error().message);
    }

    // DC Detailed Status is a fast packet; split it the way a sender would
    FastPacketReassembler sender;
    dp::Vector<u8> dc = {0x00, 0x01, 0x00, 0x55, 0x5F, 0x78, 0x00, 0x05, 0x00, 0xC8, 0x00};
    auto frames = sender.fragment(PGN_DC_DETAILED_STATUS, dc, 0x30);
    if (frames.is_ok()) {
        for (const auto &f : frames.value()) {
            auto r = pipeline.feed_frame(f);
            if (r.is_err())
                echo::error("DC status: ", r.error().message);
        }
    }

    pipeline.update(ALARM_EVALUATE_INTERVAL_MS);

    for (u8 i = 0; i < 2; ++i) {
        auto v = pipeline.get_metric(SensorType::Battery, i, "voltage");
        if (v)
            echo::info("Battery ", static_cast<u32>(i), ": ", v->formatted_with_unit);
    }
    if (auto soc = pipeline.get_metric(SensorType::Battery, 1, "state_of_charge")) {
        echo::info("Battery 1 state of charge: ", soc->formatted_with_unit);
    }

    for (const auto &alarm : pipeline.alarms().active_alarms()) {
        echo::warn("Active: ", sensor_type_name(alarm.key.type), " ", static_cast<u32>(alarm.key.instance), " ",
                   alarm.field);
    }
    return 0;
}
