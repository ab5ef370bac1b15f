#pragma once

#include "../alarm/thresholds.hpp"
#include "../history/history_buffer.hpp"
#include "../sensor/schema.hpp"
#include "../sensor/types.hpp"
#include "../units/registry.hpp"
#include "metric_value.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <mutex>
#include <utility>

namespace helm {
    namespace cache {

        // ─── Read-only copy of one instance ──────────────────────────────────────────
        struct InstanceSnapshot {
            SensorKey key;
            dp::String name;
            bool named = false; // name came from a "name" field or set_name
            Timestamp created_ms = 0;
            Timestamp last_update_ms = 0;
            bool stale = false;
            dp::Map<dp::String, MetricValue> metrics;

            dp::Optional<MetricValue> metric(const dp::String &field) const {
                auto it = metrics.find(field);
                if (it == metrics.end())
                    return dp::nullopt;
                return it->second;
            }
        };

        // What one apply did to an instance
        struct ApplyOutcome {
            usize stored = 0;
            usize schema_mismatches = 0;
            usize kind_mismatches = 0;
            usize non_finite = 0;
            dp::Vector<std::pair<dp::String, UnitCategory>> first_seen; // numeric fields stored for the first time
            dp::Vector<dp::String> rejected;
        };

        // ─── One (sensor type, instance) ─────────────────────────────────────────────
        // All access goes through the instance mutex; callers receive copies.
        class SensorInstance {
            SensorKey key_;
            dp::String name_;
            bool named_ = false;
            Timestamp created_ms_ = 0;
            Timestamp last_update_ms_ = 0;
            bool stale_ = false;
            HistoryConfig history_config_;
            dp::Map<dp::String, MetricValue> metrics_;
            dp::Map<dp::String, HistoryBuffer> history_;
            dp::Map<dp::String, AlarmThresholds> thresholds_;
            mutable std::mutex mutex_;

          public:
            SensorInstance(SensorKey key, Timestamp created_ms, HistoryConfig history = {})
                : key_(key), name_(key.to_string()), created_ms_(created_ms), last_update_ms_(created_ms),
                  history_config_(std::move(history)) {}

            SensorInstance(const SensorInstance &) = delete;
            SensorInstance &operator=(const SensorInstance &) = delete;

            const SensorKey &key() const noexcept { return key_; }

            // ─── Update ──────────────────────────────────────────────────────────────
            ApplyOutcome apply(const SensorUpdate &update, const UnitRegistry &units) {
                ApplyOutcome out;
                auto schema = schema_for(key_.type);

                std::lock_guard<std::mutex> lock(mutex_);
                for (const auto &[field, value] : update.fields) {
                    const FieldDef *def = schema.find(field);
                    if (def == nullptr) {
                        out.schema_mismatches++;
                        out.rejected.push_back(field);
                        continue;
                    }
                    if (def->text != is_text(value)) {
                        out.kind_mismatches++;
                        out.rejected.push_back(field);
                        continue;
                    }
                    if (const f64 *number = std::get_if<f64>(&value)) {
                        if (!std::isfinite(*number)) {
                            out.non_finite++;
                            continue;
                        }
                    }

                    MetricValue metric(value, def->category, update.timestamp_ms);
                    metric.enrich(units);

                    bool first = metrics_.find(field) == metrics_.end();
                    metrics_[field] = std::move(metric);
                    out.stored++;

                    if (const f64 *number = std::get_if<f64>(&value)) {
                        auto hit = history_.find(field);
                        if (hit == history_.end()) {
                            history_[field] = HistoryBuffer(history_config_);
                            hit = history_.find(field);
                        }
                        hit->second.add(*number, update.timestamp_ms);
                        if (first && def->category != UnitCategory::None)
                            out.first_seen.push_back({field, def->category});
                    }

                    if (field == "name") {
                        name_ = std::get<dp::String>(value);
                        named_ = true;
                    }
                }

                if (out.stored > 0) {
                    stale_ = false;
                    if (update.timestamp_ms > last_update_ms_)
                        last_update_ms_ = update.timestamp_ms;
                }
                return out;
            }

            void re_enrich(const dp::String &field, const UnitRegistry &units) {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = metrics_.find(field);
                if (it != metrics_.end())
                    it->second.enrich(units);
            }

            // ─── Queries ─────────────────────────────────────────────────────────────
            dp::Optional<MetricValue> metric(const dp::String &field) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = metrics_.find(field);
                if (it == metrics_.end())
                    return dp::nullopt;
                return it->second;
            }

            dp::Vector<HistoryPoint> history(const dp::String &field, const HistoryWindow &window) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = history_.find(field);
                if (it == history_.end())
                    return {};
                return it->second.get_range(window);
            }

            dp::Optional<HistoryStats> stats(const dp::String &field) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = history_.find(field);
                if (it == history_.end())
                    return dp::nullopt;
                return it->second.get_stats();
            }

            InstanceSnapshot snapshot() const {
                std::lock_guard<std::mutex> lock(mutex_);
                InstanceSnapshot s;
                s.key = key_;
                s.name = name_;
                s.named = named_;
                s.created_ms = created_ms_;
                s.last_update_ms = last_update_ms_;
                s.stale = stale_;
                s.metrics = metrics_;
                return s;
            }

            void prune(Timestamp now_ms) {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto &[field, buffer] : history_) {
                    (void)field;
                    buffer.prune(now_ms);
                }
            }

            // ─── Identity and liveness ───────────────────────────────────────────────
            dp::String name() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return name_;
            }

            void set_name(const dp::String &name) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (name.empty()) {
                    name_ = key_.to_string();
                    named_ = false;
                } else {
                    name_ = name;
                    named_ = true;
                }
            }

            bool stale() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return stale_;
            }

            void mark_stale() {
                std::lock_guard<std::mutex> lock(mutex_);
                stale_ = true;
            }

            Timestamp created_ms() const noexcept { return created_ms_; }

            Timestamp last_update_ms() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return last_update_ms_;
            }

            // ─── Alarm thresholds ────────────────────────────────────────────────────
            void set_thresholds(const dp::String &field, const AlarmThresholds &t) {
                std::lock_guard<std::mutex> lock(mutex_);
                thresholds_[field] = t;
            }

            dp::Optional<AlarmThresholds> thresholds(const dp::String &field) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = thresholds_.find(field);
                if (it == thresholds_.end())
                    return dp::nullopt;
                return it->second;
            }

            dp::Vector<std::pair<dp::String, AlarmThresholds>> all_thresholds() const {
                std::lock_guard<std::mutex> lock(mutex_);
                dp::Vector<std::pair<dp::String, AlarmThresholds>> out;
                for (const auto &[field, t] : thresholds_) {
                    out.push_back({field, t});
                }
                return out;
            }
        };

    } // namespace cache
    using namespace cache;
} // namespace helm
