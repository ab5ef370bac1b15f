#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <limits>

namespace helm {
    namespace history {

        struct HistoryPoint {
            f64 value = 0.0;
            Timestamp timestamp_ms = 0;
        };

        struct HistoryStats {
            f64 min = 0.0;
            f64 max = 0.0;
            f64 avg = 0.0;
            usize count = 0;
        };

        struct HistoryWindow {
            Timestamp start_ms = 0;
            Timestamp end_ms = 0;
        };

        // ─── Largest-Triangle-Three-Buckets ──────────────────────────────────────────
        // Returns indices into points, ascending, always including first and last.
        inline dp::Vector<usize> lttb_indices(const dp::Vector<HistoryPoint> &points, usize threshold) {
            dp::Vector<usize> out;
            usize n = points.size();
            if (threshold >= n || threshold < 3) {
                if (threshold >= n) {
                    for (usize i = 0; i < n; ++i)
                        out.push_back(i);
                } else if (n > 0) {
                    out.push_back(0);
                    if (threshold == 2)
                        out.push_back(n - 1);
                }
                return out;
            }

            f64 bucket = static_cast<f64>(n - 2) / static_cast<f64>(threshold - 2);
            usize a = 0;
            out.push_back(0);

            for (usize i = 0; i < threshold - 2; ++i) {
                // Average of the next bucket is the third triangle vertex
                usize next_start = static_cast<usize>(std::floor((i + 1) * bucket)) + 1;
                usize next_end = static_cast<usize>(std::floor((i + 2) * bucket)) + 1;
                if (next_end > n)
                    next_end = n;
                f64 avg_x = 0.0;
                f64 avg_y = 0.0;
                usize span = next_end > next_start ? next_end - next_start : 0;
                if (span == 0) {
                    avg_x = static_cast<f64>(points[n - 1].timestamp_ms);
                    avg_y = points[n - 1].value;
                } else {
                    for (usize j = next_start; j < next_end; ++j) {
                        avg_x += static_cast<f64>(points[j].timestamp_ms);
                        avg_y += points[j].value;
                    }
                    avg_x /= static_cast<f64>(span);
                    avg_y /= static_cast<f64>(span);
                }

                usize range_start = static_cast<usize>(std::floor(i * bucket)) + 1;
                usize range_end = static_cast<usize>(std::floor((i + 1) * bucket)) + 1;
                if (range_end > n - 1)
                    range_end = n - 1;

                f64 ax = static_cast<f64>(points[a].timestamp_ms);
                f64 ay = points[a].value;
                f64 best_area = -1.0;
                usize best = range_start;
                for (usize j = range_start; j < range_end; ++j) {
                    f64 area = std::fabs((ax - avg_x) * (points[j].value - ay) -
                                         (ax - static_cast<f64>(points[j].timestamp_ms)) * (avg_y - ay)) *
                               0.5;
                    if (area > best_area) {
                        best_area = area;
                        best = j;
                    }
                }
                out.push_back(best);
                a = best;
            }

            out.push_back(n - 1);
            return out;
        }

        inline dp::Vector<HistoryPoint> lttb(const dp::Vector<HistoryPoint> &points, usize threshold) {
            dp::Vector<HistoryPoint> out;
            for (usize i : lttb_indices(points, threshold)) {
                out.push_back(points[i]);
            }
            return out;
        }

        // LTTB reduction that never drops the minimum or maximum sample
        inline dp::Vector<HistoryPoint> reduce_keeping_extremes(const dp::Vector<HistoryPoint> &points, usize target) {
            if (points.size() <= target)
                return points;

            usize imin = 0;
            usize imax = 0;
            for (usize i = 1; i < points.size(); ++i) {
                if (points[i].value < points[imin].value)
                    imin = i;
                if (points[i].value > points[imax].value)
                    imax = i;
            }

            dp::Vector<usize> keep;
            if (target >= 5) {
                keep = lttb_indices(points, target - 2);
            } else {
                keep.push_back(0);
                keep.push_back(points.size() - 1);
            }
            dp::Vector<usize> required;
            required.push_back(imin);
            if (imax != imin)
                required.push_back(imax);
            for (usize idx : keep) {
                if (required.size() >= target)
                    break;
                bool present = false;
                for (usize r : required) {
                    if (r == idx)
                        present = true;
                }
                if (!present)
                    required.push_back(idx);
            }
            std::sort(required.begin(), required.end());

            dp::Vector<HistoryPoint> out;
            for (usize idx : required) {
                out.push_back(points[idx]);
            }
            return out;
        }

        struct HistoryConfig {
            usize capacity_points = HISTORY_DEFAULT_CAPACITY;
            u32 recent_window = HISTORY_RECENT_WINDOW_MS;
            usize fold_points = HISTORY_FOLD_TARGET;

            HistoryConfig &capacity(usize n) {
                capacity_points = n;
                return *this;
            }
            HistoryConfig &recent_window_ms(u32 ms) {
                recent_window = ms;
                return *this;
            }
            HistoryConfig &fold_target(usize n) {
                fold_points = n;
                return *this;
            }
        };

        inline constexpr usize HISTORY_MIN_CAPACITY = 6;

        // ─── Two-tier adaptive history ───────────────────────────────────────────────
        // Recent tier: full resolution, about two thirds of capacity.
        // Downsampled tier: LTTB folds of older data, about one third of capacity.
        // Both tiers are time-ordered, downsampled points first.
        class HistoryBuffer {
            HistoryConfig config_;
            usize recent_capacity_ = 0;
            usize downsampled_capacity_ = 0;
            dp::Vector<HistoryPoint> recent_;
            dp::Vector<HistoryPoint> downsampled_;
            Timestamp last_ts_ = 0;
            u64 total_added_ = 0;

          public:
            explicit HistoryBuffer(HistoryConfig config = {}) : config_(std::move(config)) {
                if (config_.capacity_points < HISTORY_MIN_CAPACITY) {
                    echo::category("helm.history")
                        .warn("history capacity ", config_.capacity_points, " raised to ", HISTORY_MIN_CAPACITY);
                    config_.capacity_points = HISTORY_MIN_CAPACITY;
                }
                if (config_.fold_points < 2)
                    config_.fold_points = 2;
                recent_capacity_ = config_.capacity_points * 67 / 100;
                downsampled_capacity_ = config_.capacity_points * 33 / 100;
            }

            void add(f64 value, Timestamp timestamp_ms) {
                if (!std::isfinite(value))
                    return;
                if (total_added_ > 0 && timestamp_ms < last_ts_) {
                    timestamp_ms = last_ts_;
                }
                last_ts_ = timestamp_ms;
                total_added_++;
                recent_.push_back({value, timestamp_ms});

                if (recent_.size() > recent_capacity_) {
                    usize half = recent_.size() / 2;
                    fold_front(half);
                }
            }

            // Folds recent points older than the recent window
            void prune(Timestamp now_ms) {
                if (now_ms <= config_.recent_window)
                    return;
                Timestamp cutoff = now_ms - config_.recent_window;
                usize count = 0;
                while (count < recent_.size() && recent_[count].timestamp_ms < cutoff) {
                    ++count;
                }
                if (count > 0)
                    fold_front(count);
            }

            dp::Vector<HistoryPoint> get_all() const {
                dp::Vector<HistoryPoint> out;
                out.reserve(downsampled_.size() + recent_.size());
                for (const auto &p : downsampled_)
                    out.push_back(p);
                for (const auto &p : recent_)
                    out.push_back(p);
                return out;
            }

            dp::Vector<HistoryPoint> get_range(Timestamp start_ms, Timestamp end_ms) const {
                dp::Vector<HistoryPoint> out;
                if (start_ms > end_ms)
                    return out;
                for (const auto &p : downsampled_) {
                    if (p.timestamp_ms >= start_ms && p.timestamp_ms <= end_ms)
                        out.push_back(p);
                }
                for (const auto &p : recent_) {
                    if (p.timestamp_ms >= start_ms && p.timestamp_ms <= end_ms)
                        out.push_back(p);
                }
                return out;
            }

            dp::Vector<HistoryPoint> get_range(const HistoryWindow &window) const {
                return get_range(window.start_ms, window.end_ms);
            }

            dp::Optional<HistoryStats> get_stats() const {
                if (size() == 0)
                    return dp::nullopt;
                HistoryStats s;
                s.min = std::numeric_limits<f64>::infinity();
                s.max = -std::numeric_limits<f64>::infinity();
                f64 sum = 0.0;
                auto accumulate = [&](const dp::Vector<HistoryPoint> &tier) {
                    for (const auto &p : tier) {
                        s.min = std::min(s.min, p.value);
                        s.max = std::max(s.max, p.value);
                        sum += p.value;
                        s.count++;
                    }
                };
                accumulate(downsampled_);
                accumulate(recent_);
                s.avg = sum / static_cast<f64>(s.count);
                return s;
            }

            dp::Optional<HistoryPoint> latest() const {
                if (!recent_.empty())
                    return recent_.back();
                if (!downsampled_.empty())
                    return downsampled_.back();
                return dp::nullopt;
            }

            usize size() const noexcept { return recent_.size() + downsampled_.size(); }
            usize recent_size() const noexcept { return recent_.size(); }
            usize downsampled_size() const noexcept { return downsampled_.size(); }
            usize capacity() const noexcept { return config_.capacity_points; }
            u64 total_added() const noexcept { return total_added_; }
            const HistoryConfig &config() const noexcept { return config_; }

            void clear() {
                recent_.clear();
                downsampled_.clear();
                last_ts_ = 0;
                total_added_ = 0;
            }

          private:
            void fold_front(usize count) {
                dp::Vector<HistoryPoint> chunk;
                chunk.reserve(count);
                for (usize i = 0; i < count; ++i) {
                    chunk.push_back(recent_[i]);
                }
                recent_.erase(recent_.begin(), recent_.begin() + static_cast<std::ptrdiff_t>(count));

                for (const auto &p : reduce_keeping_extremes(chunk, config_.fold_points)) {
                    downsampled_.push_back(p);
                }
                if (downsampled_.size() > downsampled_capacity_) {
                    downsampled_ = reduce_keeping_extremes(downsampled_, downsampled_capacity_);
                }
            }
        };

    } // namespace history
    using namespace history;
} // namespace helm
