#pragma once

#include "../cache/sensor_cache.hpp"
#include "../util/event.hpp"
#include "registration.hpp"
#include <algorithm>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <mutex>
#include <string>

namespace helm {
    namespace detect {

        // ═════════════════════════════════════════════════════════════════════════════
        // DETECTION SERVICE
        // Decides which registered equipment instances have live data. New instances
        // appear as soon as an update qualifies them; instances that stop qualifying
        // are removed only after the grace period, once.
        // ═════════════════════════════════════════════════════════════════════════════
        class DetectionService {
            struct Entry {
                DetectedInstance info;
                dp::Optional<Timestamp> unfit_since;
            };

            // Events collected under the lock and emitted after it is released
            struct Notice {
                bool detected = false;
                bool mark_stale = false;
                DetectedInstance info;
            };
            struct Outbox {
                dp::Vector<Notice> notices;
                dp::Optional<usize> changed;
            };

            SensorCache &cache_;
            DetectionConfig config_;
            mutable std::mutex mutex_;
            dp::Vector<EquipmentRegistration> registrations_;
            dp::Vector<Entry> entries_;
            Timestamp now_ms_ = 0;
            dp::Optional<Timestamp> last_change_emit_;
            bool change_pending_ = false;
            ListenerToken applied_token_ = INVALID_TOKEN;

          public:
            explicit DetectionService(SensorCache &cache, DetectionConfig config = {})
                : cache_(cache), config_(std::move(config)) {
                applied_token_ = cache_.on_applied.subscribe([this](SensorKey key) { on_applied(key); });
            }

            ~DetectionService() { cache_.on_applied.unsubscribe(applied_token_); }

            DetectionService(const DetectionService &) = delete;
            DetectionService &operator=(const DetectionService &) = delete;

            const DetectionConfig &config() const noexcept { return config_; }

            // ─── Registrations ───────────────────────────────────────────────────────
            Result<void> register_equipment(EquipmentRegistration reg) {
                auto valid = validate_registration(reg);
                if (valid.is_err())
                    return valid;
                Outbox out;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    for (const auto &r : registrations_) {
                        if (r.equipment_id == reg.equipment_id)
                            return Result<void>::err(
                                Error::invalid_registration("duplicate equipment id " + reg.equipment_id));
                    }
                    echo::category("helm.detect")
                        .info("registered ", reg.equipment_id, " for ", sensor_type_name(reg.sensor_type));
                    registrations_.push_back(std::move(reg));
                    evaluate_registration(registrations_.back(), now_ms_, out);
                }
                publish(out);
                return {};
            }

            // Drops the registration and every instance detected for it
            bool unregister_equipment(const dp::String &equipment_id) {
                Outbox out;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto it = std::find_if(registrations_.begin(), registrations_.end(),
                                           [&](const EquipmentRegistration &r) { return r.equipment_id == equipment_id; });
                    if (it == registrations_.end())
                        return false;
                    registrations_.erase(it);

                    for (auto e = entries_.begin(); e != entries_.end();) {
                        if (e->info.equipment_id == equipment_id) {
                            out.notices.push_back({false, false, e->info});
                            e = entries_.erase(e);
                        } else {
                            ++e;
                        }
                    }
                    if (out.notices.size() > 0)
                        note_change();
                }
                publish(out);
                return true;
            }

            dp::Vector<EquipmentRegistration> registrations() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return registrations_;
            }

            // ─── Periodic scan ───────────────────────────────────────────────────────
            void scan(Timestamp now_ms) {
                Outbox out;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    scan_locked(now_ms, out);
                }
                publish(out);
            }

            // Full recomputation from the cache with the same predicate and grace state
            void rescan(Timestamp now_ms) {
                Outbox out;
                usize count = 0;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    advance(now_ms);
                    for (auto e = entries_.begin(); e != entries_.end();) {
                        if (find_registration(e->info.equipment_id) == nullptr) {
                            out.notices.push_back({false, false, e->info});
                            e = entries_.erase(e);
                            note_change();
                        } else {
                            ++e;
                        }
                    }
                    scan_locked(now_ms, out);
                    count = entries_.size();
                }
                publish(out);
                echo::category("helm.detect").debug("rescan: ", count, " detected");
            }

            // ─── Queries ─────────────────────────────────────────────────────────────
            // Ordered by priority, then equipment id, then instance
            dp::Vector<DetectedInstance> detected() const {
                dp::Vector<DetectedInstance> out;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    for (const auto &e : entries_) {
                        out.push_back(e.info);
                    }
                }
                std::sort(out.begin(), out.end(), [](const DetectedInstance &a, const DetectedInstance &b) {
                    if (a.priority != b.priority)
                        return a.priority < b.priority;
                    int cmp = std::strcmp(a.equipment_id.c_str(), b.equipment_id.c_str());
                    if (cmp != 0)
                        return cmp < 0;
                    return a.instance < b.instance;
                });
                return out;
            }

            bool is_detected(const dp::String &equipment_id, u8 instance) const {
                std::lock_guard<std::mutex> lock(mutex_);
                return find_entry(equipment_id, instance) != nullptr;
            }

            bool removal_pending(const dp::String &equipment_id, u8 instance) const {
                std::lock_guard<std::mutex> lock(mutex_);
                const Entry *e = find_entry(equipment_id, instance);
                return e != nullptr && e->unfit_since.has_value();
            }

            usize size() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return entries_.size();
            }

            // An instance qualifies when its type matches, every required field is
            // present and fresh, and the instance number is allowed
            bool qualifies(const EquipmentRegistration &reg, const SensorKey &key, Timestamp now_ms) const {
                if (key.type != reg.sensor_type)
                    return false;
                if (!reg.multi_instance && key.instance != 0)
                    return false;
                if (reg.max_instances > 0 && key.instance >= reg.max_instances)
                    return false;
                auto snap = cache_.snapshot(key.type, key.instance);
                if (!snap.has_value())
                    return false;
                for (const auto &field : reg.required_fields) {
                    auto m = snap->metric(field);
                    if (!m.has_value())
                        return false;
                    if (now_ms > m->timestamp_ms && now_ms - m->timestamp_ms > config_.staleness)
                        return false;
                }
                return true;
            }

            Event<const DetectedInstance &> on_detected;
            Event<const DetectedInstance &> on_removed;
            Event<usize> on_detected_changed; // (detected count), throttled

          private:
            void advance(Timestamp now_ms) {
                if (now_ms > now_ms_)
                    now_ms_ = now_ms;
            }

            const EquipmentRegistration *find_registration(const dp::String &id) const {
                for (const auto &r : registrations_) {
                    if (r.equipment_id == id)
                        return &r;
                }
                return nullptr;
            }

            const Entry *find_entry(const dp::String &id, u8 instance) const {
                for (const auto &e : entries_) {
                    if (e.info.equipment_id == id && e.info.instance == instance)
                        return &e;
                }
                return nullptr;
            }

            Entry *find_entry(const dp::String &id, u8 instance) {
                for (auto &e : entries_) {
                    if (e.info.equipment_id == id && e.info.instance == instance)
                        return &e;
                }
                return nullptr;
            }

            dp::String title_for(const EquipmentRegistration &reg, const SensorKey &key) const {
                auto snap = cache_.snapshot(key.type, key.instance);
                if (snap.has_value() && snap->named)
                    return snap->name;
                if (!reg.multi_instance)
                    return reg.display_name;
                return reg.display_name + " " + dp::String(std::to_string(key.instance + 1));
            }

            // Listeners run without the lock held and may call back into the service
            void publish(const Outbox &out) {
                for (const auto &n : out.notices) {
                    if (n.detected) {
                        on_detected.emit(n.info);
                        continue;
                    }
                    if (n.mark_stale)
                        cache_.mark_stale(n.info.key());
                    on_removed.emit(n.info);
                }
                if (out.changed.has_value())
                    on_detected_changed.emit(*out.changed);
            }

            void scan_locked(Timestamp now_ms, Outbox &out) {
                advance(now_ms);
                for (const auto &reg : registrations_) {
                    evaluate_registration(reg, now_ms, out);
                }
                sweep(now_ms, out);
                flush_change(now_ms, out);
            }

            // Adds or refreshes one instance; never removes
            void consider(const EquipmentRegistration &reg, const SensorKey &key, Timestamp now_ms, Outbox &out) {
                bool fit = qualifies(reg, key, now_ms);
                Entry *e = find_entry(reg.equipment_id, key.instance);
                if (e != nullptr) {
                    if (fit) {
                        if (e->unfit_since.has_value()) {
                            echo::category("helm.detect")
                                .debug(reg.equipment_id, " #", static_cast<u32>(key.instance),
                                       " requalified, removal cancelled");
                        }
                        e->unfit_since = dp::nullopt;
                        auto snap = cache_.snapshot(key.type, key.instance);
                        if (snap.has_value())
                            e->info.last_update_ms = snap->last_update_ms;
                    }
                    return;
                }
                if (!fit)
                    return;

                Entry entry;
                entry.info.equipment_id = reg.equipment_id;
                entry.info.sensor_type = reg.sensor_type;
                entry.info.instance = key.instance;
                entry.info.title = title_for(reg, key);
                entry.info.priority = reg.priority;
                entry.info.detected_at_ms = now_ms;
                auto snap = cache_.snapshot(key.type, key.instance);
                entry.info.last_update_ms = snap.has_value() ? snap->last_update_ms : now_ms;
                entries_.push_back(entry);

                echo::category("helm.detect")
                    .info("detected ", entry.info.equipment_id, " #", static_cast<u32>(key.instance), " \"",
                          entry.info.title, "\"");
                out.notices.push_back({true, false, entry.info});
                note_change();
            }

            void evaluate_registration(const EquipmentRegistration &reg, Timestamp now_ms, Outbox &out) {
                for (const auto &key : cache_.instances(reg.sensor_type)) {
                    consider(reg, key, now_ms, out);
                }
            }

            // Starts grace periods and removes instances whose grace has run out
            void sweep(Timestamp now_ms, Outbox &out) {
                for (auto e = entries_.begin(); e != entries_.end();) {
                    const EquipmentRegistration *reg = find_registration(e->info.equipment_id);
                    bool fit = reg != nullptr && qualifies(*reg, e->info.key(), now_ms);
                    if (fit) {
                        e->unfit_since = dp::nullopt;
                        ++e;
                        continue;
                    }
                    if (!e->unfit_since.has_value()) {
                        e->unfit_since = now_ms;
                        echo::category("helm.detect")
                            .debug(e->info.equipment_id, " #", static_cast<u32>(e->info.instance),
                                   " no longer qualifies, grace started");
                    }
                    // A clock that stepped back leaves the grace period where it was
                    Timestamp unfit_for = now_ms > *e->unfit_since ? now_ms - *e->unfit_since : 0;
                    if (unfit_for >= config_.grace) {
                        echo::category("helm.detect")
                            .info("removed ", e->info.equipment_id, " #", static_cast<u32>(e->info.instance),
                                  " after grace");
                        out.notices.push_back({false, true, e->info});
                        e = entries_.erase(e);
                        note_change();
                        continue;
                    }
                    ++e;
                }
            }

            void on_applied(SensorKey key) {
                auto snap = cache_.snapshot(key.type, key.instance);
                Outbox out;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    Timestamp now = now_ms_;
                    if (snap.has_value() && snap->last_update_ms > now)
                        now = snap->last_update_ms;
                    for (const auto &reg : registrations_) {
                        if (reg.sensor_type == key.type)
                            consider(reg, key, now, out);
                    }
                    flush_change(now, out);
                }
                publish(out);
            }

            void note_change() { change_pending_ = true; }

            void flush_change(Timestamp now_ms, Outbox &out) {
                if (!change_pending_)
                    return;
                if (last_change_emit_.has_value() && now_ms >= *last_change_emit_ &&
                    now_ms - *last_change_emit_ < config_.throttle)
                    return;
                change_pending_ = false;
                last_change_emit_ = now_ms;
                out.changed = entries_.size();
            }
        };

    } // namespace detect
    using namespace detect;
} // namespace helm
