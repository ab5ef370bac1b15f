#include <helm/pipeline.hpp>
#include <echo/echo.hpp>

using namespace helm;

int main() {
    echo::info("=== NMEA 0183 Depth Monitor ===");

    Pipeline pipeline;
    pipeline.subscribe(SensorType::Depth, 0);

    pipeline.alarms().on_alarm_change.subscribe([](const AlarmTransition &tr) {
        echo::warn("Depth alarm: ", alarm_state_name(tr.from), " -> ", alarm_state_name(tr.to), " (",
                   sound_pattern_name(tr.sound_pattern), ")");
    });

    // One second apart, shoaling towards the critical depth
    const char *lines[] = {
        "$SDDBT,12.4,f,3.8,M,2.1,F*39",
        "$SDDBT,6.6,f,2.0,M,1.1,F*04",
        "$SDDBT,4.9,f,1.5,M,0.8,F*07",
        "$SDDBT,12.4,f,3.8,M,2.1,F*3A", // corrupted checksum
    };

    Timestamp now = 0;
    for (const char *line : lines) {
        now += 1000;
        auto r = pipeline.feed_line(line, now);
        if (r.is_err()) {
            echo::error("Rejected: ", r.error().message);
        }
        pipeline.update(1000);

        if (auto depth = pipeline.get_metric(SensorType::Depth, 0, "depth")) {
            echo::info("Depth: ", depth->formatted_with_unit);
        }
    }

    // Switch the display to feet; stored SI values are untouched
    if (pipeline.units().select(UnitCategory::Depth, "ft").is_ok()) {
        auto depth = pipeline.get_metric(SensorType::Depth, 0, "depth");
        if (depth)
            echo::info("Depth in feet: ", depth->formatted_with_unit);
    }

    auto stats = pipeline.stats();
    echo::info("Lines: ", stats.lines, ", decoded: ", stats.decoded, ", errors: ", stats.total_errors());
    return 0;
}
