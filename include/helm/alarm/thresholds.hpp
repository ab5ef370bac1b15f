#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../sensor/types.hpp"
#include <datapod/datapod.hpp>

namespace helm {
    namespace alarm {

        enum class AlarmState : u8 { Normal = 0, Warning = 1, Critical = 2, Stale = 3 };

        inline const char *alarm_state_name(AlarmState s) noexcept {
            switch (s) {
            case AlarmState::Normal:
                return "normal";
            case AlarmState::Warning:
                return "warning";
            case AlarmState::Critical:
                return "critical";
            case AlarmState::Stale:
                return "stale";
            }
            return "unknown";
        }

        // Audible pattern ids; carried for the presentation layer, never played here
        enum class SoundPattern : u8 { None = 0, RapidPulse, MorseU, Warble, TripleBlast, Intermittent };

        inline const char *sound_pattern_name(SoundPattern p) noexcept {
            switch (p) {
            case SoundPattern::None:
                return "none";
            case SoundPattern::RapidPulse:
                return "rapid_pulse";
            case SoundPattern::MorseU:
                return "morse_u";
            case SoundPattern::Warble:
                return "warble";
            case SoundPattern::TripleBlast:
                return "triple_blast";
            case SoundPattern::Intermittent:
                return "intermittent";
            }
            return "none";
        }

        // ─── Thresholds for one metric field ─────────────────────────────────────────
        // Values are SI, matching the stored metric.
        struct AlarmThresholds {
            dp::Optional<f64> critical_min;
            dp::Optional<f64> critical_max;
            dp::Optional<f64> warning_min;
            dp::Optional<f64> warning_max;
            f64 hysteresis = 0.0;
            SoundPattern critical_sound = SoundPattern::RapidPulse;
            SoundPattern warning_sound = SoundPattern::Intermittent;
            u32 stale_timeout_ms = ALARM_STALE_TIMEOUT_MS;
            bool enabled = true;

            AlarmThresholds &critical_below(f64 v) {
                critical_min = v;
                return *this;
            }
            AlarmThresholds &critical_above(f64 v) {
                critical_max = v;
                return *this;
            }
            AlarmThresholds &warning_below(f64 v) {
                warning_min = v;
                return *this;
            }
            AlarmThresholds &warning_above(f64 v) {
                warning_max = v;
                return *this;
            }
            AlarmThresholds &band(f64 h) {
                hysteresis = h;
                return *this;
            }
            AlarmThresholds &sounds(SoundPattern critical, SoundPattern warning) {
                critical_sound = critical;
                warning_sound = warning;
                return *this;
            }
            AlarmThresholds &stale_after(u32 ms) {
                stale_timeout_ms = ms;
                return *this;
            }
            AlarmThresholds &enable(bool on = true) {
                enabled = on;
                return *this;
            }

            bool has_bounds() const noexcept {
                return critical_min.has_value() || critical_max.has_value() || warning_min.has_value() ||
                       warning_max.has_value();
            }
        };

        // ─── Validation ──────────────────────────────────────────────────────────────
        inline Result<void> validate(const AlarmThresholds &t) {
            if (t.enabled && !t.has_bounds())
                return Result<void>::err(Error::invalid_threshold("enabled threshold has no bounds"));
            if (!(t.hysteresis >= 0.0))
                return Result<void>::err(Error::invalid_threshold("hysteresis must be >= 0"));
            if (t.critical_min.has_value() && t.critical_max.has_value() && !(*t.critical_min < *t.critical_max))
                return Result<void>::err(Error::invalid_threshold("critical_min must be below critical_max"));
            if (t.warning_min.has_value() && t.warning_max.has_value() && !(*t.warning_min < *t.warning_max))
                return Result<void>::err(Error::invalid_threshold("warning_min must be below warning_max"));
            if (t.critical_min.has_value() && t.warning_min.has_value() && *t.critical_min > *t.warning_min)
                return Result<void>::err(Error::invalid_threshold("critical_min must not exceed warning_min"));
            if (t.critical_max.has_value() && t.warning_max.has_value() && *t.critical_max < *t.warning_max)
                return Result<void>::err(Error::invalid_threshold("critical_max must not be below warning_max"));
            return {};
        }

        // ─── Built-in defaults ───────────────────────────────────────────────────────
        inline dp::Optional<AlarmThresholds> default_thresholds(SensorType type, const dp::String &field) {
            if (type == SensorType::Depth && field == "depth") {
                return AlarmThresholds{}
                    .critical_below(2.0)
                    .warning_below(2.5)
                    .band(0.2)
                    .sounds(SoundPattern::RapidPulse, SoundPattern::MorseU);
            }
            if (type == SensorType::Battery && field == "voltage") {
                return AlarmThresholds{}
                    .critical_below(12.0)
                    .warning_below(12.2)
                    .band(0.1)
                    .sounds(SoundPattern::Warble, SoundPattern::Intermittent);
            }
            if (type == SensorType::Engine && field == "coolant_temperature") {
                return AlarmThresholds{}
                    .critical_above(368.15)
                    .warning_above(358.15)
                    .band(2.0)
                    .sounds(SoundPattern::TripleBlast, SoundPattern::Intermittent);
            }
            if (type == SensorType::Tank && field == "level") {
                return AlarmThresholds{}
                    .critical_below(0.05)
                    .warning_below(0.15)
                    .band(0.02)
                    .stale_after(ALARM_TANK_STALE_TIMEOUT_MS)
                    .sounds(SoundPattern::Intermittent, SoundPattern::None);
            }
            return dp::nullopt;
        }

    } // namespace alarm
    using namespace alarm;
} // namespace helm
