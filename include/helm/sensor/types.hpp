#pragma once

#include "../core/types.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <string>
#include <variant>

namespace helm {
    namespace sensor {

        // ─── Logical sensor kinds ────────────────────────────────────────────────────
        enum class SensorType : u8 {
            Depth = 0,
            Gps,
            Speed,
            Wind,
            Heading,
            Temperature,
            Engine,
            Battery,
            Tank,
            Autopilot,
            Rudder,
            Weather,
            Navigation,
            Log,
        };

        inline constexpr u8 SENSOR_TYPE_COUNT = static_cast<u8>(SensorType::Log) + 1;

        inline const char *sensor_type_name(SensorType t) noexcept {
            switch (t) {
            case SensorType::Depth:
                return "depth";
            case SensorType::Gps:
                return "gps";
            case SensorType::Speed:
                return "speed";
            case SensorType::Wind:
                return "wind";
            case SensorType::Heading:
                return "heading";
            case SensorType::Temperature:
                return "temperature";
            case SensorType::Engine:
                return "engine";
            case SensorType::Battery:
                return "battery";
            case SensorType::Tank:
                return "tank";
            case SensorType::Autopilot:
                return "autopilot";
            case SensorType::Rudder:
                return "rudder";
            case SensorType::Weather:
                return "weather";
            case SensorType::Navigation:
                return "navigation";
            case SensorType::Log:
                return "log";
            }
            return "unknown";
        }

        inline dp::Optional<SensorType> sensor_type_from_name(const dp::String &name) noexcept {
            for (u8 i = 0; i < SENSOR_TYPE_COUNT; ++i) {
                auto t = static_cast<SensorType>(i);
                if (name == sensor_type_name(t))
                    return t;
            }
            return dp::nullopt;
        }

        // ─── Field values: numeric SI or text ────────────────────────────────────────
        using FieldValue = std::variant<f64, dp::String>;

        inline bool is_numeric(const FieldValue &v) noexcept { return std::holds_alternative<f64>(v); }
        inline bool is_text(const FieldValue &v) noexcept { return std::holds_alternative<dp::String>(v); }

        inline dp::Optional<f64> numeric_of(const FieldValue &v) noexcept {
            if (const f64 *d = std::get_if<f64>(&v))
                return *d;
            return dp::nullopt;
        }

        inline dp::Optional<dp::String> text_of(const FieldValue &v) {
            if (const dp::String *s = std::get_if<dp::String>(&v))
                return *s;
            return dp::nullopt;
        }

        // ─── Instance key ────────────────────────────────────────────────────────────
        struct SensorKey {
            SensorType type = SensorType::Depth;
            u8 instance = 0;

            SensorKey() = default;
            SensorKey(SensorType t, u8 i) : type(t), instance(i) {}

            u16 packed() const noexcept { return static_cast<u16>((static_cast<u16>(type) << 8) | instance); }

            static SensorKey unpack(u16 raw) noexcept {
                return SensorKey(static_cast<SensorType>(raw >> 8), static_cast<u8>(raw & 0xFF));
            }

            dp::String to_string() const {
                return dp::String(sensor_type_name(type)) + "-" + dp::String(std::to_string(instance));
            }

            bool operator==(const SensorKey &other) const noexcept {
                return type == other.type && instance == other.instance;
            }
            bool operator!=(const SensorKey &other) const noexcept { return !(*this == other); }
            bool operator<(const SensorKey &other) const noexcept { return packed() < other.packed(); }
        };

        // ─── One mapped reading for one logical sensor ───────────────────────────────
        // Produced by the mapper, consumed once by the cache.
        struct SensorUpdate {
            SensorType type = SensorType::Depth;
            u8 instance = 0;
            dp::Map<dp::String, FieldValue> fields;
            Timestamp timestamp_ms = 0;

            SensorUpdate() = default;
            SensorUpdate(SensorType t, u8 i, Timestamp ts) : type(t), instance(i), timestamp_ms(ts) {}

            SensorKey key() const noexcept { return SensorKey(type, instance); }

            SensorUpdate &set(const dp::String &field, f64 value) {
                fields[field] = value;
                return *this;
            }

            SensorUpdate &set(const dp::String &field, const dp::String &value) {
                fields[field] = value;
                return *this;
            }

            SensorUpdate &set(const dp::String &field, const char *value) { return set(field, dp::String(value)); }

            // Absent readings are skipped
            SensorUpdate &set(const dp::String &field, const dp::Optional<f64> &value) {
                if (value.has_value())
                    fields[field] = *value;
                return *this;
            }

            bool has(const dp::String &field) const { return fields.find(field) != fields.end(); }

            dp::Optional<f64> number(const dp::String &field) const {
                auto it = fields.find(field);
                if (it == fields.end())
                    return dp::nullopt;
                return numeric_of(it->second);
            }

            dp::Optional<dp::String> text(const dp::String &field) const {
                auto it = fields.find(field);
                if (it == fields.end())
                    return dp::nullopt;
                return text_of(it->second);
            }

            bool empty() const noexcept { return fields.size() == 0; }
        };

    } // namespace sensor
    using namespace sensor;
} // namespace helm
