#include <helm/pipeline.hpp>
#include <echo/echo.hpp>

#include <fstream>
#include <string>

using namespace helm;

// Replays an NMEA 0183 log, one sentence per line, at a fixed rate and
// prints a summary of every instance seen.
int main(int argc, char **argv) {
    if (argc < 2) {
        echo::error("usage: nmea_replay <log file> [interval ms]");
        return 1;
    }
    u32 interval = argc > 2 ? static_cast<u32>(std::stoul(argv[2])) : 100;

    std::ifstream in(argv[1]);
    if (!in) {
        echo::error("cannot open ", argv[1]);
        return 1;
    }

    Pipeline pipeline(PipelineConfig{}.sentences(Nmea0183Config{}.require_checksum(false)));
    pipeline.subscribe_all();

    Timestamp now = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty())
            continue;
        now += interval;
        auto r = pipeline.feed_line(dp::String(line.c_str()), now);
        if (r.is_err()) {
            echo::debug("skipped: ", r.error().message);
        }
        pipeline.update(interval);
    }

    auto stats = pipeline.stats();
    echo::info("Replayed ", stats.lines, " lines: ", stats.decoded, " decoded, ", stats.unhandled, " unhandled, ",
               stats.total_errors(), " errors");

    for (const auto &key : pipeline.cache().all_instances()) {
        auto snap = pipeline.cache().snapshot(key.type, key.instance);
        if (!snap)
            continue;
        echo::info(sensor_type_name(key.type), " ", static_cast<u32>(key.instance), " (", snap->name, ")");
        for (const auto &[field, metric] : snap->metrics) {
            echo::info("  ", field, " = ", metric.formatted_with_unit);
        }
    }
    return 0;
}
