#pragma once

#include "../core/error.hpp"
#include "../util/event.hpp"
#include "sensor_instance.hpp"
#include <algorithm>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace helm {
    namespace cache {

        struct CacheStats {
            u64 applied = 0;
            u64 instances_created = 0;
            u64 fields_stored = 0;
            u64 schema_mismatches = 0;
            u64 kind_mismatches = 0;
            u64 non_finite = 0;
        };

        // ═════════════════════════════════════════════════════════════════════════════
        // SENSOR CACHE
        // Instance map under a shared_mutex (shared for lookup, exclusive for insert and
        // removal); each instance serializes its own updates. Queries return copies.
        // ═════════════════════════════════════════════════════════════════════════════
        class SensorCache {
            using InstancePtr = std::shared_ptr<SensorInstance>;

            const UnitRegistry &units_;
            HistoryConfig history_config_;

            mutable std::shared_mutex map_mutex_;
            dp::Map<u16, InstancePtr> instances_;

            // (key, field) per unit category, for re-enrichment
            mutable std::mutex index_mutex_;
            dp::Array<dp::Vector<std::pair<u16, dp::String>>, UNIT_CATEGORY_COUNT> category_index_;

            mutable std::mutex bookkeeping_mutex_;
            dp::Vector<u16> dirty_;
            dp::Map<u16, u32> consumers_;
            u32 global_consumers_ = 0;
            CacheStats stats_;

          public:
            explicit SensorCache(const UnitRegistry &units, HistoryConfig history = {})
                : units_(units), history_config_(std::move(history)) {}

            SensorCache(const SensorCache &) = delete;
            SensorCache &operator=(const SensorCache &) = delete;

            // ─── Apply one mapped update ─────────────────────────────────────────────
            // Returns the number of fields stored.
            usize apply(const SensorUpdate &update) {
                SensorKey key = update.key();
                bool created = false;
                InstancePtr inst = find_or_create(key, update.timestamp_ms, created);

                ApplyOutcome outcome = inst->apply(update, units_);

                for (const auto &field : outcome.rejected) {
                    echo::category("helm.cache").warn("schema mismatch: ", key.to_string(), ".", field, " ignored");
                }
                if (!outcome.first_seen.empty()) {
                    std::lock_guard<std::mutex> lock(index_mutex_);
                    for (const auto &[field, category] : outcome.first_seen) {
                        category_index_[static_cast<u8>(category)].push_back({key.packed(), field});
                    }
                }
                {
                    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                    stats_.applied++;
                    stats_.fields_stored += outcome.stored;
                    stats_.schema_mismatches += outcome.schema_mismatches;
                    stats_.kind_mismatches += outcome.kind_mismatches;
                    stats_.non_finite += outcome.non_finite;
                    if (created)
                        stats_.instances_created++;
                    if (outcome.stored > 0 &&
                        std::find(dirty_.begin(), dirty_.end(), key.packed()) == dirty_.end()) {
                        dirty_.push_back(key.packed());
                    }
                }

                if (created) {
                    echo::category("helm.cache").info("instance created: ", key.to_string());
                    on_instance_created.emit(key);
                }
                if (outcome.stored > 0)
                    on_applied.emit(key);
                return outcome.stored;
            }

            // ─── Queries ─────────────────────────────────────────────────────────────
            dp::Optional<MetricValue> get_metric(SensorType type, u8 instance, const dp::String &field) const {
                auto inst = lookup(SensorKey(type, instance));
                if (!inst)
                    return dp::nullopt;
                return inst->metric(field);
            }

            dp::Vector<HistoryPoint> get_history(SensorType type, u8 instance, const dp::String &field,
                                                 const HistoryWindow &window) const {
                auto inst = lookup(SensorKey(type, instance));
                if (!inst)
                    return {};
                return inst->history(field, window);
            }

            dp::Vector<HistoryPoint> get_recent_history(SensorType type, u8 instance, const dp::String &field,
                                                        u32 span_ms, Timestamp now_ms) const {
                HistoryWindow window;
                window.start_ms = now_ms > span_ms ? now_ms - span_ms : 0;
                window.end_ms = now_ms;
                return get_history(type, instance, field, window);
            }

            dp::Optional<HistoryStats> get_stats(SensorType type, u8 instance, const dp::String &field) const {
                auto inst = lookup(SensorKey(type, instance));
                if (!inst)
                    return dp::nullopt;
                return inst->stats(field);
            }

            dp::Optional<InstanceSnapshot> snapshot(SensorType type, u8 instance) const {
                auto inst = lookup(SensorKey(type, instance));
                if (!inst)
                    return dp::nullopt;
                return inst->snapshot();
            }

            bool contains(SensorType type, u8 instance) const { return lookup(SensorKey(type, instance)) != nullptr; }

            // Instances of a type, ordered by instance number
            dp::Vector<SensorKey> instances(SensorType type) const { return collect(type, false); }

            dp::Vector<SensorKey> active_instances(SensorType type) const { return collect(type, true); }

            dp::Vector<SensorKey> all_instances() const {
                dp::Vector<SensorKey> out;
                {
                    std::shared_lock<std::shared_mutex> lock(map_mutex_);
                    for (const auto &[packed, inst] : instances_) {
                        (void)inst;
                        out.push_back(SensorKey::unpack(packed));
                    }
                }
                std::sort(out.begin(), out.end());
                return out;
            }

            usize size() const {
                std::shared_lock<std::shared_mutex> lock(map_mutex_);
                return instances_.size();
            }

            CacheStats stats() const {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                return stats_;
            }

            // ─── Enrichment ──────────────────────────────────────────────────────────
            // Recomputes display values of one category; SI values and history untouched
            usize re_enrich(UnitCategory category) {
                dp::Vector<std::pair<u16, dp::String>> entries;
                {
                    std::lock_guard<std::mutex> lock(index_mutex_);
                    entries = category_index_[static_cast<u8>(category)];
                }
                usize count = 0;
                for (const auto &[packed, field] : entries) {
                    auto inst = lookup(SensorKey::unpack(packed));
                    if (!inst)
                        continue;
                    inst->re_enrich(field, units_);
                    count++;
                }
                echo::category("helm.cache").debug("re-enriched ", count, " ", category_name(category), " metrics");
                return count;
            }

            // ─── Instance management ─────────────────────────────────────────────────
            Result<void> set_name(SensorType type, u8 instance, const dp::String &name) {
                auto inst = lookup(SensorKey(type, instance));
                if (!inst)
                    return Result<void>::err(Error::unknown_instance(SensorKey(type, instance).to_string()));
                inst->set_name(name);
                return {};
            }

            Result<void> set_thresholds(SensorType type, u8 instance, const dp::String &field,
                                        const AlarmThresholds &thresholds) {
                SensorKey key(type, instance);
                if (find_field(type, field) == nullptr)
                    return Result<void>::err(
                        Error::schema_mismatch(dp::String(sensor_type_name(type)) + " has no field " + field));
                auto inst = lookup(key);
                if (!inst)
                    return Result<void>::err(Error::unknown_instance(key.to_string()));
                inst->set_thresholds(field, thresholds);
                mark_dirty(key);
                return {};
            }

            dp::Optional<AlarmThresholds> thresholds(SensorType type, u8 instance, const dp::String &field) const {
                auto inst = lookup(SensorKey(type, instance));
                if (!inst)
                    return dp::nullopt;
                return inst->thresholds(field);
            }

            dp::Vector<std::pair<dp::String, AlarmThresholds>> all_thresholds(const SensorKey &key) const {
                auto inst = lookup(key);
                if (!inst)
                    return {};
                return inst->all_thresholds();
            }

            bool mark_stale(const SensorKey &key) {
                auto inst = lookup(key);
                if (!inst)
                    return false;
                inst->mark_stale();
                echo::category("helm.cache").debug("instance marked stale: ", key.to_string());
                return true;
            }

            bool is_stale(const SensorKey &key) const {
                auto inst = lookup(key);
                return inst ? inst->stale() : false;
            }

            bool remove(const SensorKey &key) {
                {
                    std::unique_lock<std::shared_mutex> lock(map_mutex_);
                    auto it = instances_.find(key.packed());
                    if (it == instances_.end())
                        return false;
                    instances_.erase(it);
                }
                drop_from_index(key.packed());
                {
                    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                    dirty_.erase(std::remove(dirty_.begin(), dirty_.end(), key.packed()), dirty_.end());
                }
                echo::category("helm.cache").info("instance removed: ", key.to_string());
                on_instance_removed.emit(key);
                return true;
            }

            void clear() {
                dp::Vector<SensorKey> removed = all_instances();
                {
                    std::unique_lock<std::shared_mutex> lock(map_mutex_);
                    instances_.clear();
                }
                {
                    std::lock_guard<std::mutex> lock(index_mutex_);
                    for (auto &entries : category_index_) {
                        entries.clear();
                    }
                }
                {
                    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                    dirty_.clear();
                }
                for (const auto &key : removed) {
                    on_instance_removed.emit(key);
                }
            }

            void prune_history(Timestamp now_ms) {
                for (auto &inst : snapshot_instances()) {
                    inst->prune(now_ms);
                }
            }

            // ─── Consumers ───────────────────────────────────────────────────────────
            // Counts may be registered before the instance exists.
            void add_consumer(SensorType type, u8 instance) {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                consumers_[SensorKey(type, instance).packed()]++;
            }

            void remove_consumer(SensorType type, u8 instance) {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                auto it = consumers_.find(SensorKey(type, instance).packed());
                if (it == consumers_.end())
                    return;
                if (it->second <= 1) {
                    consumers_.erase(it);
                } else {
                    it->second--;
                }
            }

            void add_global_consumer() {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                global_consumers_++;
            }

            void remove_global_consumer() {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                if (global_consumers_ > 0)
                    global_consumers_--;
            }

            u32 consumer_count(SensorType type, u8 instance) const {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                auto it = consumers_.find(SensorKey(type, instance).packed());
                return it == consumers_.end() ? 0 : it->second;
            }

            u32 global_consumers() const {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                return global_consumers_;
            }

            bool has_consumers() const {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                return global_consumers_ > 0 || consumers_.size() > 0;
            }

            // Watched by this instance's evaluation: a global consumer or its own
            bool is_watched(const SensorKey &key) const {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                if (global_consumers_ > 0)
                    return true;
                auto it = consumers_.find(key.packed());
                return it != consumers_.end() && it->second > 0;
            }

            // ─── Dirty tracking ──────────────────────────────────────────────────────
            dp::Vector<SensorKey> take_dirty() {
                dp::Vector<u16> taken;
                {
                    std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                    taken = std::move(dirty_);
                    dirty_.clear();
                }
                dp::Vector<SensorKey> out;
                for (u16 packed : taken) {
                    out.push_back(SensorKey::unpack(packed));
                }
                return out;
            }

            // Queues an instance for the next take_dirty()
            void mark_dirty(const SensorKey &key) {
                std::lock_guard<std::mutex> lock(bookkeeping_mutex_);
                if (std::find(dirty_.begin(), dirty_.end(), key.packed()) == dirty_.end())
                    dirty_.push_back(key.packed());
            }

            // ─── Events ──────────────────────────────────────────────────────────────
            Event<SensorKey> on_instance_created;
            Event<SensorKey> on_instance_removed;
            Event<SensorKey> on_applied; // after at least one field was stored

          private:
            InstancePtr lookup(const SensorKey &key) const {
                std::shared_lock<std::shared_mutex> lock(map_mutex_);
                auto it = instances_.find(key.packed());
                if (it == instances_.end())
                    return nullptr;
                return it->second;
            }

            InstancePtr find_or_create(const SensorKey &key, Timestamp ts, bool &created) {
                created = false;
                if (auto inst = lookup(key))
                    return inst;

                std::unique_lock<std::shared_mutex> lock(map_mutex_);
                auto it = instances_.find(key.packed());
                if (it != instances_.end())
                    return it->second;
                auto inst = std::make_shared<SensorInstance>(key, ts, history_config_);
                instances_[key.packed()] = inst;
                created = true;
                return inst;
            }

            dp::Vector<InstancePtr> snapshot_instances() const {
                dp::Vector<InstancePtr> out;
                std::shared_lock<std::shared_mutex> lock(map_mutex_);
                for (const auto &[packed, inst] : instances_) {
                    (void)packed;
                    out.push_back(inst);
                }
                return out;
            }

            dp::Vector<SensorKey> collect(SensorType type, bool skip_stale) const {
                dp::Vector<SensorKey> out;
                for (const auto &inst : snapshot_instances()) {
                    if (inst->key().type != type)
                        continue;
                    if (skip_stale && inst->stale())
                        continue;
                    out.push_back(inst->key());
                }
                std::sort(out.begin(), out.end());
                return out;
            }

            void drop_from_index(u16 packed) {
                std::lock_guard<std::mutex> lock(index_mutex_);
                for (auto &entries : category_index_) {
                    for (auto it = entries.begin(); it != entries.end();) {
                        if (it->first == packed) {
                            it = entries.erase(it);
                        } else {
                            ++it;
                        }
                    }
                }
            }
        };

    } // namespace cache
    using namespace cache;
} // namespace helm
