#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace helm {
    namespace util {

        // ─── Periodic task scheduler ──────────────────────────────────────────────────
        // Tick-driven: the owner calls update(elapsed_ms) and due tasks run inline.
        // Tasks start disabled so that no work happens until a consumer asks for it.
        struct PeriodicTask {
            dp::String name;
            u32 interval_ms = 0;
            u32 elapsed_ms = 0;
            bool enabled = false;
            u64 runs = 0;
            std::function<void()> callback;

            bool due() const noexcept { return enabled && elapsed_ms >= interval_ms; }
        };

        using TaskId = usize;

        class Scheduler {
            dp::Vector<PeriodicTask> tasks_;

          public:
            Scheduler() = default;

            TaskId add(dp::String name, u32 interval_ms, std::function<void()> callback) {
                PeriodicTask task;
                task.name = std::move(name);
                task.interval_ms = interval_ms;
                task.callback = std::move(callback);
                tasks_.push_back(std::move(task));
                return tasks_.size() - 1;
            }

            // Enabling restarts the interval from zero
            void enable(TaskId id, bool enabled = true) {
                if (id >= tasks_.size() || tasks_[id].enabled == enabled)
                    return;
                tasks_[id].enabled = enabled;
                tasks_[id].elapsed_ms = 0;
            }

            void disable(TaskId id) { enable(id, false); }

            void enable_all(bool enabled = true) {
                for (TaskId i = 0; i < tasks_.size(); ++i) {
                    enable(i, enabled);
                }
            }

            void set_interval(TaskId id, u32 interval_ms) {
                if (id < tasks_.size())
                    tasks_[id].interval_ms = interval_ms;
            }

            // Run a task on the next update regardless of its interval
            void trigger(TaskId id) {
                if (id < tasks_.size())
                    tasks_[id].elapsed_ms = tasks_[id].interval_ms;
            }

            void update(u32 elapsed_ms) {
                for (auto &task : tasks_) {
                    if (!task.enabled)
                        continue;
                    task.elapsed_ms += elapsed_ms;
                    if (task.due()) {
                        task.elapsed_ms = 0;
                        task.runs++;
                        if (task.callback)
                            task.callback();
                    }
                }
            }

            dp::Optional<TaskId> find(const dp::String &name) const {
                for (TaskId i = 0; i < tasks_.size(); ++i) {
                    if (tasks_[i].name == name)
                        return i;
                }
                return dp::nullopt;
            }

            usize count() const noexcept { return tasks_.size(); }
            bool is_enabled(TaskId id) const noexcept { return id < tasks_.size() && tasks_[id].enabled; }
            u64 runs(TaskId id) const noexcept { return id < tasks_.size() ? tasks_[id].runs : 0; }

            bool any_enabled() const noexcept {
                for (const auto &t : tasks_) {
                    if (t.enabled)
                        return true;
                }
                return false;
            }
        };

    } // namespace util
    using namespace util;
} // namespace helm
