#pragma once

#include "alarm/evaluator.hpp"
#include "cache/sensor_cache.hpp"
#include "core/error.hpp"
#include "core/frame.hpp"
#include "core/message.hpp"
#include "detect/detection_service.hpp"
#include "n2k/decoder.hpp"
#include "nmea0183/decoder.hpp"
#include "pgn_defs.hpp"
#include "sensor/mapper.hpp"
#include "transport/fast_packet.hpp"
#include "units/registry.hpp"
#include "util/event.hpp"
#include "util/scheduler.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace helm {

    // ─── Pipeline configuration ──────────────────────────────────────────────────
    struct PipelineConfig {
        Nmea0183Config nmea0183;
        MapperConfig mapper;
        ReassemblerConfig reassembler;
        HistoryConfig history;
        AlarmConfig alarms;
        DetectionConfig detection;
        u32 prune_interval_ms = HISTORY_PRUNE_INTERVAL_MS;
        u32 evaluate_interval_ms = ALARM_EVALUATE_INTERVAL_MS;
        u32 scan_interval_ms = DETECTION_SCAN_INTERVAL_MS;

        PipelineConfig &sentences(Nmea0183Config c) {
            nmea0183 = std::move(c);
            return *this;
        }
        PipelineConfig &mapping(MapperConfig c) {
            mapper = std::move(c);
            return *this;
        }
        PipelineConfig &fast_packet(ReassemblerConfig c) {
            reassembler = std::move(c);
            return *this;
        }
        PipelineConfig &retention(HistoryConfig c) {
            history = std::move(c);
            return *this;
        }
        PipelineConfig &alarm(AlarmConfig c) {
            alarms = std::move(c);
            return *this;
        }
        PipelineConfig &detect(DetectionConfig c) {
            detection = std::move(c);
            return *this;
        }
        PipelineConfig &prune_every(u32 ms) {
            prune_interval_ms = ms;
            return *this;
        }
        PipelineConfig &evaluate_every(u32 ms) {
            evaluate_interval_ms = ms;
            return *this;
        }
        PipelineConfig &scan_every(u32 ms) {
            scan_interval_ms = ms;
            return *this;
        }
    };

    struct PipelineStats {
        u64 lines = 0;
        u64 frames = 0;
        u64 payloads = 0; // complete N2K payloads decoded or attempted
        u64 decoded = 0;
        u64 unhandled = 0;
        u64 updates = 0;
        u64 fields_stored = 0;
        u64 fast_packet_aborts = 0;
        u64 schema_mismatches = 0;
        dp::Map<u32, u64> errors; // ErrorCode -> count

        u64 error_count(ErrorCode code) const {
            auto it = errors.find(static_cast<u32>(code));
            return it == errors.end() ? 0 : it->second;
        }

        u64 total_errors() const {
            u64 total = 0;
            for (const auto &[code, count] : errors) {
                (void)code;
                total += count;
            }
            return total;
        }
    };

    using SubscriptionToken = u32;
    inline constexpr SubscriptionToken INVALID_SUBSCRIPTION = 0;

    // ═════════════════════════════════════════════════════════════════════════════
    // PIPELINE
    // decode -> map -> cache -> (alarms, detection). Single writer; the owner feeds
    // input and calls update(elapsed_ms) to drive the clock and periodic work.
    // ═════════════════════════════════════════════════════════════════════════════
    class Pipeline {
        struct Subscription {
            bool global = false;
            SensorKey key;
        };

        PipelineConfig config_;
        UnitRegistry units_;
        SentenceDecoder sentence_decoder_;
        PgnDecoder pgn_decoder_;
        FastPacketReassembler reassembler_;
        Mapper mapper_;
        SensorCache cache_;
        AlarmEvaluator alarms_;
        DetectionService detection_;
        Scheduler scheduler_;

        Timestamp now_ms_ = 0;
        PipelineStats stats_;
        dp::Map<SubscriptionToken, Subscription> subscriptions_;
        SubscriptionToken next_token_ = 1;

        TaskId prune_task_ = 0;
        TaskId evaluate_task_ = 0;
        TaskId scan_task_ = 0;

      public:
        explicit Pipeline(PipelineConfig config = {})
            : config_(std::move(config)), sentence_decoder_(config_.nmea0183), reassembler_(config_.reassembler),
              mapper_(config_.mapper), cache_(units_, config_.history), alarms_(cache_, config_.alarms),
              detection_(cache_, config_.detection) {
            units_.on_unit_changed.subscribe([this](UnitCategory category) { cache_.re_enrich(category); });
            reassembler_.on_abort.subscribe([this](PGN, Address, const Error &reason) {
                stats_.fast_packet_aborts++;
                count_error(reason.code);
            });

            prune_task_ = scheduler_.add("history.prune", config_.prune_interval_ms,
                                         [this]() { cache_.prune_history(now_ms_); });
            evaluate_task_ = scheduler_.add("alarm.evaluate", config_.evaluate_interval_ms,
                                            [this]() { alarms_.evaluate(now_ms_); });
            scan_task_ =
                scheduler_.add("detect.scan", config_.scan_interval_ms, [this]() { detection_.scan(now_ms_); });
        }

        Pipeline(const Pipeline &) = delete;
        Pipeline &operator=(const Pipeline &) = delete;

        // ─── Input ───────────────────────────────────────────────────────────────
        // Each returns the number of fields stored; decode failures are counted,
        // logged and returned, and never stop the stream.
        Result<usize> feed_line(const dp::String &line) { return feed_line(line, now_ms_); }

        Result<usize> feed_line(const dp::String &line, Timestamp timestamp_ms) {
            stats_.lines++;
            auto decoded = sentence_decoder_.decode(line, timestamp_ms);
            if (decoded.is_err()) {
                count_error(decoded.error().code);
                echo::category("helm.pipeline").warn("sentence dropped: ", decoded.error().message);
                return Result<usize>::err(decoded.error());
            }
            if (!decoded.value().handled()) {
                stats_.unhandled++;
                echo::category("helm.pipeline")
                    .trace("unhandled sentence ", decoded.value().talker, decoded.value().type);
                return Result<usize>::ok(0);
            }
            stats_.decoded++;
            return Result<usize>::ok(apply_all(mapper_.map(decoded.value())));
        }

        // Raw CAN frame; fast-packet PGNs go through reassembly first
        Result<usize> feed_frame(const Frame &frame) {
            stats_.frames++;
            Frame stamped = frame;
            if (stamped.timestamp_ms == 0)
                stamped.timestamp_ms = now_ms_;

            if (pgn_is_fast_packet(stamped.pgn())) {
                auto msg = reassembler_.process_frame(stamped);
                if (!msg.has_value())
                    return Result<usize>::ok(0);
                return feed_message(*msg);
            }

            return feed_message(stamped.to_message());
        }

        // Already reassembled payload
        Result<usize> feed_pgn(PGN pgn, Address source, const dp::Vector<u8> &data) {
            return feed_pgn(pgn, source, data, now_ms_);
        }

        Result<usize> feed_pgn(PGN pgn, Address source, const dp::Vector<u8> &data, Timestamp timestamp_ms) {
            Message msg(pgn, data, source);
            msg.timestamp_ms = timestamp_ms;
            return feed_message(msg);
        }

        // ─── Clock ───────────────────────────────────────────────────────────────
        void update(u32 elapsed_ms) {
            now_ms_ += elapsed_ms;
            reassembler_.update(elapsed_ms);
            scheduler_.update(elapsed_ms);
        }

        Timestamp now_ms() const noexcept { return now_ms_; }

        // Runs every periodic job once at the current clock, consumers or not
        void run_now() {
            cache_.prune_history(now_ms_);
            alarms_.evaluate(now_ms_);
            detection_.scan(now_ms_);
        }

        // ─── Consumers ───────────────────────────────────────────────────────────
        // Periodic work runs only while at least one subscription is held.
        SubscriptionToken subscribe(SensorType type, u8 instance) {
            Subscription sub;
            sub.key = SensorKey(type, instance);
            cache_.add_consumer(type, instance);
            return add_subscription(sub);
        }

        SubscriptionToken subscribe_all() {
            Subscription sub;
            sub.global = true;
            cache_.add_global_consumer();
            return add_subscription(sub);
        }

        bool unsubscribe(SubscriptionToken token) {
            auto it = subscriptions_.find(token);
            if (it == subscriptions_.end())
                return false;
            if (it->second.global) {
                cache_.remove_global_consumer();
            } else {
                cache_.remove_consumer(it->second.key.type, it->second.key.instance);
            }
            subscriptions_.erase(it);
            sync_schedules();
            return true;
        }

        usize subscriptions() const noexcept { return subscriptions_.size(); }

        // ─── Query shortcuts ─────────────────────────────────────────────────────
        dp::Optional<MetricValue> get_metric(SensorType type, u8 instance, const dp::String &field) const {
            return cache_.get_metric(type, instance, field);
        }

        dp::Vector<HistoryPoint> get_history(SensorType type, u8 instance, const dp::String &field,
                                             const HistoryWindow &window) const {
            return cache_.get_history(type, instance, field, window);
        }

        dp::Optional<HistoryStats> get_stats(SensorType type, u8 instance, const dp::String &field) const {
            return cache_.get_stats(type, instance, field);
        }

        AlarmState alarm_state(SensorType type, u8 instance, const dp::String &field) const {
            return alarms_.state(type, instance, field);
        }

        Result<void> register_equipment(EquipmentRegistration reg) {
            return detection_.register_equipment(std::move(reg));
        }

        dp::Vector<DetectedInstance> detected() const { return detection_.detected(); }

        // ─── Components ──────────────────────────────────────────────────────────
        UnitRegistry &units() noexcept { return units_; }
        const UnitRegistry &units() const noexcept { return units_; }
        SensorCache &cache() noexcept { return cache_; }
        const SensorCache &cache() const noexcept { return cache_; }
        AlarmEvaluator &alarms() noexcept { return alarms_; }
        const AlarmEvaluator &alarms() const noexcept { return alarms_; }
        DetectionService &detection() noexcept { return detection_; }
        const DetectionService &detection() const noexcept { return detection_; }
        Mapper &mapper() noexcept { return mapper_; }
        FastPacketReassembler &reassembler() noexcept { return reassembler_; }
        const Scheduler &scheduler() const noexcept { return scheduler_; }
        const PipelineConfig &config() const noexcept { return config_; }

        PipelineStats stats() const {
            PipelineStats out = stats_;
            out.schema_mismatches = cache_.stats().schema_mismatches;
            return out;
        }

      private:
        Result<usize> feed_message(const Message &msg) {
            stats_.payloads++;
            auto decoded = pgn_decoder_.decode(msg);
            if (decoded.is_err()) {
                count_error(decoded.error().code);
                echo::category("helm.pipeline")
                    .warn("pgn ", msg.pgn, " from ", static_cast<u32>(msg.source),
                          " dropped: ", decoded.error().message);
                return Result<usize>::err(decoded.error());
            }
            if (!decoded.value().handled()) {
                stats_.unhandled++;
                return Result<usize>::ok(0);
            }
            stats_.decoded++;
            return Result<usize>::ok(apply_all(mapper_.map(decoded.value())));
        }

        usize apply_all(const dp::Vector<SensorUpdate> &updates) {
            usize stored = 0;
            for (const auto &update : updates) {
                stats_.updates++;
                stored += cache_.apply(update);
            }
            stats_.fields_stored += stored;
            return stored;
        }

        void count_error(ErrorCode code) { stats_.errors[static_cast<u32>(code)]++; }

        SubscriptionToken add_subscription(const Subscription &sub) {
            SubscriptionToken token = next_token_++;
            subscriptions_[token] = sub;
            sync_schedules();
            return token;
        }

        void sync_schedules() {
            bool active = cache_.has_consumers();
            if (active == scheduler_.is_enabled(evaluate_task_))
                return;
            scheduler_.enable(prune_task_, active);
            scheduler_.enable(evaluate_task_, active);
            scheduler_.enable(scan_task_, active);
            echo::category("helm.pipeline").debug(active ? "schedules enabled" : "schedules paused");
        }
    };

} // namespace helm
