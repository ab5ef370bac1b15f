#pragma once

#include "../cache/sensor_cache.hpp"
#include "../core/error.hpp"
#include "../sensor/schema.hpp"
#include "../util/event.hpp"
#include "../util/state_machine.hpp"
#include "thresholds.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <mutex>

namespace helm {
    namespace alarm {

        struct AlarmConfig {
            bool install_defaults_enabled = true;

            // Schema default thresholds are attached to every new instance
            AlarmConfig &install_defaults(bool enabled) {
                install_defaults_enabled = enabled;
                return *this;
            }
        };

        struct AlarmStatus {
            AlarmState state = AlarmState::Normal;
            Timestamp since_ms = 0;
            dp::Optional<f64> value;
            SoundPattern sound_pattern = SoundPattern::None;
            bool acknowledged = false;
        };

        struct AlarmTransition {
            SensorType sensor_type = SensorType::Depth;
            u8 instance = 0;
            dp::String field;
            AlarmState from = AlarmState::Normal;
            AlarmState to = AlarmState::Normal;
            dp::Optional<f64> value;
            SoundPattern sound_pattern = SoundPattern::None;
            Timestamp timestamp_ms = 0;
        };

        struct ActiveAlarm {
            SensorKey key;
            dp::String field;
            AlarmStatus status;
        };

        // ─── Severity with hysteresis ────────────────────────────────────────────────
        // Entering needs a strict crossing of the raw bound; leaving needs the value
        // back inside the bound by the hysteresis band.
        inline bool crosses(const dp::Optional<f64> &min, const dp::Optional<f64> &max, f64 v) noexcept {
            return (min.has_value() && v < *min) || (max.has_value() && v > *max);
        }

        inline bool cleared(const dp::Optional<f64> &min, const dp::Optional<f64> &max, f64 h, f64 v) noexcept {
            return (!min.has_value() || v >= *min + h) && (!max.has_value() || v <= *max - h);
        }

        inline AlarmState next_severity(const AlarmThresholds &t, AlarmState from, f64 v) noexcept {
            bool critical_now = crosses(t.critical_min, t.critical_max, v);
            bool warning_now = crosses(t.warning_min, t.warning_max, v);
            bool warning_cleared = cleared(t.warning_min, t.warning_max, t.hysteresis, v);

            switch (from) {
            case AlarmState::Critical:
                if (!cleared(t.critical_min, t.critical_max, t.hysteresis, v))
                    return AlarmState::Critical;
                if (warning_now || !warning_cleared)
                    return AlarmState::Warning;
                return AlarmState::Normal;
            case AlarmState::Warning:
                if (critical_now)
                    return AlarmState::Critical;
                if (!warning_cleared)
                    return AlarmState::Warning;
                return AlarmState::Normal;
            default:
                if (critical_now)
                    return AlarmState::Critical;
                if (warning_now)
                    return AlarmState::Warning;
                return AlarmState::Normal;
            }
        }

        inline SoundPattern sound_for(const AlarmThresholds &t, AlarmState s) noexcept {
            if (s == AlarmState::Critical)
                return t.critical_sound;
            if (s == AlarmState::Warning)
                return t.warning_sound;
            return SoundPattern::None;
        }

        // ═════════════════════════════════════════════════════════════════════════════
        // ALARM EVALUATOR
        // One state machine per (instance, field) that has thresholds.
        // ═════════════════════════════════════════════════════════════════════════════
        class AlarmEvaluator {
            // Which transitions a pass may make
            enum class Pass {
                Full,       // severity and staleness
                EnterStale, // clean instances: nothing changed but the clock
                LeaveStale, // a reading just arrived for a Stale field
            };

            struct FieldAlarm {
                StateMachine<AlarmState> machine{AlarmState::Normal};
                AlarmState severity = AlarmState::Normal; // last state other than Stale
                dp::Optional<f64> value;
                SoundPattern sound = SoundPattern::None;
                bool acknowledged = false;
            };

            SensorCache &cache_;
            AlarmConfig config_;
            dp::Map<u16, dp::Map<dp::String, FieldAlarm>> alarms_;
            mutable std::mutex mutex_;
            ListenerToken created_token_ = INVALID_TOKEN;
            ListenerToken applied_token_ = INVALID_TOKEN;
            ListenerToken removed_token_ = INVALID_TOKEN;
            std::atomic<Timestamp> last_now_{0};

          public:
            explicit AlarmEvaluator(SensorCache &cache, AlarmConfig config = {})
                : cache_(cache), config_(std::move(config)) {
                created_token_ = cache_.on_instance_created.subscribe([this](SensorKey key) { install_defaults(key); });
                applied_token_ = cache_.on_applied.subscribe([this](SensorKey key) { refresh_stale(key); });
                removed_token_ = cache_.on_instance_removed.subscribe([this](SensorKey key) { forget(key); });
            }

            ~AlarmEvaluator() {
                cache_.on_instance_created.unsubscribe(created_token_);
                cache_.on_applied.unsubscribe(applied_token_);
                cache_.on_instance_removed.unsubscribe(removed_token_);
            }

            AlarmEvaluator(const AlarmEvaluator &) = delete;
            AlarmEvaluator &operator=(const AlarmEvaluator &) = delete;

            const AlarmConfig &config() const noexcept { return config_; }

            // ─── Configuration ───────────────────────────────────────────────────────
            Result<void> validate(const AlarmThresholds &t) const { return alarm::validate(t); }

            Result<void> configure(SensorType type, u8 instance, const dp::String &field,
                                   const AlarmThresholds &thresholds) {
                const FieldDef *def = find_field(type, field);
                if (def == nullptr || def->text) {
                    return Result<void>::err(Error::schema_mismatch(dp::String(sensor_type_name(type)) +
                                                                    " has no numeric field " + field));
                }
                auto valid = alarm::validate(thresholds);
                if (valid.is_err())
                    return valid;
                auto stored = cache_.set_thresholds(type, instance, field, thresholds);
                if (stored.is_err())
                    return stored;
                echo::category("helm.alarm")
                    .debug("thresholds configured for ", SensorKey(type, instance).to_string(), ".", field);
                return {};
            }

            Result<void> set_enabled(SensorType type, u8 instance, const dp::String &field, bool enabled) {
                auto current = cache_.thresholds(type, instance, field);
                if (!current.has_value())
                    return Result<void>::err(Error::missing_threshold(field));
                AlarmThresholds updated = *current;
                updated.enabled = enabled;
                return configure(type, instance, field, updated);
            }

            // ─── Evaluation ──────────────────────────────────────────────────────────
            // Watched instances only: those with a consumer, or all with a global consumer.
            // Instances changed since the last call get the full pass; the rest are
            // only checked for readings that have aged out. Changed instances nobody
            // watches stay queued until they are watched.
            usize evaluate(Timestamp now_ms) {
                last_now_.store(now_ms);
                dp::Vector<SensorKey> dirty = cache_.take_dirty();
                usize changes = 0;
                for (const auto &key : dirty) {
                    if (!cache_.is_watched(key)) {
                        cache_.mark_dirty(key);
                        continue;
                    }
                    changes += run(key, now_ms, Pass::Full);
                }
                for (const auto &key : cache_.all_instances()) {
                    if (!cache_.is_watched(key))
                        continue;
                    if (std::find(dirty.begin(), dirty.end(), key) != dirty.end())
                        continue;
                    changes += run(key, now_ms, Pass::EnterStale);
                }
                return changes;
            }

            usize evaluate_instance(const SensorKey &key, Timestamp now_ms) { return run(key, now_ms, Pass::Full); }

            // ─── Queries ─────────────────────────────────────────────────────────────
            AlarmState state(SensorType type, u8 instance, const dp::String &field) const {
                auto s = status(type, instance, field);
                return s.has_value() ? s->state : AlarmState::Normal;
            }

            dp::Optional<AlarmStatus> status(SensorType type, u8 instance, const dp::String &field) const {
                std::lock_guard<std::mutex> lock(mutex_);
                const FieldAlarm *a = find(SensorKey(type, instance), field);
                if (a == nullptr)
                    return dp::nullopt;
                return to_status(*a);
            }

            // Silences the sound until the next transition of this field
            bool acknowledge(SensorType type, u8 instance, const dp::String &field) {
                std::lock_guard<std::mutex> lock(mutex_);
                auto kit = alarms_.find(SensorKey(type, instance).packed());
                if (kit == alarms_.end())
                    return false;
                auto fit = kit->second.find(field);
                if (fit == kit->second.end())
                    return false;
                auto s = fit->second.machine.state();
                if (s != AlarmState::Warning && s != AlarmState::Critical)
                    return false;
                fit->second.acknowledged = true;
                echo::category("helm.alarm")
                    .info("acknowledged ", SensorKey(type, instance).to_string(), ".", field, " (",
                          alarm_state_name(s), ")");
                return true;
            }

            // Fields in Warning or Critical, most severe first
            dp::Vector<ActiveAlarm> active_alarms() const {
                dp::Vector<ActiveAlarm> out;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    for (const auto &[packed, fields] : alarms_) {
                        for (const auto &[field, a] : fields) {
                            auto s = a.machine.state();
                            if (s != AlarmState::Warning && s != AlarmState::Critical)
                                continue;
                            out.push_back({SensorKey::unpack(packed), field, to_status(a)});
                        }
                    }
                }
                std::sort(out.begin(), out.end(), [](const ActiveAlarm &a, const ActiveAlarm &b) {
                    if (a.status.state != b.status.state)
                        return a.status.state == AlarmState::Critical;
                    if (a.key != b.key)
                        return a.key < b.key;
                    return std::strcmp(a.field.c_str(), b.field.c_str()) < 0;
                });
                return out;
            }

            Event<const AlarmTransition &> on_alarm_change;

          private:
            const FieldAlarm *find(const SensorKey &key, const dp::String &field) const {
                auto kit = alarms_.find(key.packed());
                if (kit == alarms_.end())
                    return nullptr;
                auto fit = kit->second.find(field);
                if (fit == kit->second.end())
                    return nullptr;
                return &fit->second;
            }

            static AlarmStatus to_status(const FieldAlarm &a) {
                AlarmStatus s;
                s.state = a.machine.state();
                s.since_ms = a.machine.since();
                s.value = a.value;
                s.acknowledged = a.acknowledged;
                s.sound_pattern = a.acknowledged ? SoundPattern::None : a.sound;
                return s;
            }

            usize run(const SensorKey &key, Timestamp now_ms, Pass pass) {
                auto snap = cache_.snapshot(key.type, key.instance);
                if (!snap.has_value())
                    return 0;

                dp::Vector<AlarmTransition> transitions;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto &fields = alarms_[key.packed()];
                    for (const auto &[field, t] : cache_.all_thresholds(key)) {
                        auto &a = fields[field];
                        if (pass == Pass::LeaveStale && !a.machine.is(AlarmState::Stale))
                            continue;

                        auto metric = snap->metric(field);
                        dp::Optional<f64> value = metric.has_value() ? metric->number() : dp::Optional<f64>();
                        // A field never reported ages from the instance's creation.
                        // Readings stamped ahead of the evaluation clock count as fresh.
                        Timestamp reported = metric.has_value() ? metric->timestamp_ms : snap->created_ms;
                        bool fresh = now_ms < reported || now_ms - reported <= t.stale_timeout_ms;
                        if (metric.has_value() && !value.has_value())
                            fresh = false;

                        AlarmState target = AlarmState::Normal;
                        if (!t.enabled) {
                            a.severity = AlarmState::Normal;
                        } else if (!fresh) {
                            target = AlarmState::Stale;
                        } else if (value.has_value()) {
                            target = next_severity(t, a.severity, *value);
                        } else {
                            target = a.severity;
                        }
                        if (pass == Pass::EnterStale && target != AlarmState::Stale)
                            continue;
                        if (target != AlarmState::Stale)
                            a.severity = target;
                        if (value.has_value())
                            a.value = value;

                        AlarmState from = a.machine.state();
                        if (!a.machine.transition(target, now_ms))
                            continue;
                        a.sound = sound_for(t, target);
                        a.acknowledged = false;

                        AlarmTransition tr;
                        tr.sensor_type = key.type;
                        tr.instance = key.instance;
                        tr.field = field;
                        tr.from = from;
                        tr.to = target;
                        tr.value = value;
                        tr.sound_pattern = a.sound;
                        tr.timestamp_ms = now_ms;
                        transitions.push_back(std::move(tr));
                    }
                }

                for (const auto &tr : transitions) {
                    log_transition(tr);
                    on_alarm_change.emit(tr);
                }
                return transitions.size();
            }

            static void log_transition(const AlarmTransition &tr) {
                dp::String where = SensorKey(tr.sensor_type, tr.instance).to_string() + "." + tr.field;
                f64 v = tr.value.has_value() ? *tr.value : 0.0;
                switch (tr.to) {
                case AlarmState::Critical:
                    echo::category("helm.alarm").error(where, " ", alarm_state_name(tr.from), " -> critical, value=", v);
                    break;
                case AlarmState::Warning:
                    echo::category("helm.alarm").warn(where, " ", alarm_state_name(tr.from), " -> warning, value=", v);
                    break;
                default:
                    echo::category("helm.alarm")
                        .info(where, " ", alarm_state_name(tr.from), " -> ", alarm_state_name(tr.to));
                    break;
                }
            }

            void install_defaults(SensorKey key) {
                if (!config_.install_defaults_enabled)
                    return;
                auto schema = schema_for(key.type);
                for (usize i = 0; i < schema.size; ++i) {
                    dp::String field(schema.begin[i].name);
                    auto t = default_thresholds(key.type, field);
                    if (!t.has_value())
                        continue;
                    auto stored = cache_.set_thresholds(key.type, key.instance, field, *t);
                    if (stored.is_err()) {
                        echo::category("helm.alarm")
                            .warn("default thresholds for ", key.to_string(), ".", field,
                                  " not installed: ", stored.error().message);
                    }
                }
            }

            // A fresh reading leaves Stale at once instead of waiting for the next tick
            void refresh_stale(SensorKey key) {
                bool any_stale = false;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto kit = alarms_.find(key.packed());
                    if (kit == alarms_.end())
                        return;
                    for (const auto &[field, a] : kit->second) {
                        (void)field;
                        if (a.machine.is(AlarmState::Stale))
                            any_stale = true;
                    }
                }
                if (!any_stale)
                    return;
                auto snap = cache_.snapshot(key.type, key.instance);
                if (!snap.has_value())
                    return;
                Timestamp now = std::max(last_now_.load(), snap->last_update_ms);
                run(key, now, Pass::LeaveStale);
            }

            void forget(SensorKey key) {
                std::lock_guard<std::mutex> lock(mutex_);
                alarms_.erase(key.packed());
            }
        };

    } // namespace alarm
    using namespace alarm;
} // namespace helm
