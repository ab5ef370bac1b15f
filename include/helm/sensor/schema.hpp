#pragma once

#include "../units/category.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace helm {
    namespace sensor {

        // ─── Field definition ────────────────────────────────────────────────────────
        struct FieldDef {
            const char *name;
            UnitCategory category; // None for text fields
            bool text;
        };

        inline constexpr FieldDef num(const char *name, UnitCategory c) { return {name, c, false}; }
        inline constexpr FieldDef txt(const char *name) { return {name, UnitCategory::None, true}; }

        // ═════════════════════════════════════════════════════════════════════════════
        // FIELD SCHEMAS PER SENSOR TYPE
        // Every type also accepts a text "name" that overrides the display name.
        // ═════════════════════════════════════════════════════════════════════════════
        inline constexpr FieldDef DEPTH_FIELDS[] = {
            num("depth", UnitCategory::Depth),
            num("offset", UnitCategory::Depth),
            num("max_range", UnitCategory::Depth),
            txt("source"),
            txt("reference"),
            txt("name"),
        };

        inline constexpr FieldDef GPS_FIELDS[] = {
            num("latitude", UnitCategory::Coordinates),
            num("longitude", UnitCategory::Coordinates),
            num("speed_over_ground", UnitCategory::Speed),
            num("course_over_ground", UnitCategory::Angle),
            num("fix_quality", UnitCategory::None),
            num("satellites", UnitCategory::None),
            num("hdop", UnitCategory::None),
            num("altitude", UnitCategory::Depth),
            num("utc_time", UnitCategory::Time),
            num("magnetic_variation", UnitCategory::Angle),
            txt("name"),
        };

        inline constexpr FieldDef SPEED_FIELDS[] = {
            num("through_water", UnitCategory::Speed),
            num("over_ground", UnitCategory::Speed),
            txt("name"),
        };

        inline constexpr FieldDef LOG_FIELDS[] = {
            num("trip_distance", UnitCategory::Distance),
            num("total_distance", UnitCategory::Distance),
            txt("name"),
        };

        inline constexpr FieldDef WIND_FIELDS[] = {
            num("apparent_speed", UnitCategory::Wind),
            num("apparent_angle", UnitCategory::Angle),
            num("true_speed", UnitCategory::Wind),
            num("true_angle", UnitCategory::Angle),
            num("true_direction", UnitCategory::Angle),
            txt("name"),
        };

        inline constexpr FieldDef HEADING_FIELDS[] = {
            num("magnetic", UnitCategory::Angle),
            num("true", UnitCategory::Angle),
            num("variation", UnitCategory::Angle),
            num("deviation", UnitCategory::Angle),
            num("rate_of_turn", UnitCategory::AngularVelocity),
            num("pitch", UnitCategory::Angle),
            num("roll", UnitCategory::Angle),
            txt("name"),
        };

        inline constexpr FieldDef TEMPERATURE_FIELDS[] = {
            num("temperature", UnitCategory::Temperature),
            num("set_temperature", UnitCategory::Temperature),
            txt("location"),
            txt("name"),
        };

        inline constexpr FieldDef ENGINE_FIELDS[] = {
            num("rpm", UnitCategory::Rpm),
            num("coolant_temperature", UnitCategory::Temperature),
            num("oil_pressure", UnitCategory::Pressure),
            num("oil_temperature", UnitCategory::Temperature),
            num("alternator_voltage", UnitCategory::Voltage),
            num("fuel_rate", UnitCategory::FlowRate),
            num("engine_hours", UnitCategory::Time),
            num("boost_pressure", UnitCategory::Pressure),
            num("fuel_pressure", UnitCategory::Pressure),
            num("coolant_pressure", UnitCategory::Pressure),
            num("load", UnitCategory::Percentage),
            num("torque", UnitCategory::Percentage),
            num("tilt_trim", UnitCategory::Percentage),
            txt("name"),
        };

        inline constexpr FieldDef BATTERY_FIELDS[] = {
            num("voltage", UnitCategory::Voltage),
            num("current", UnitCategory::Current),
            num("temperature", UnitCategory::Temperature),
            num("state_of_charge", UnitCategory::Percentage),
            num("state_of_health", UnitCategory::Percentage),
            num("time_remaining", UnitCategory::Time),
            num("capacity", UnitCategory::Capacity),
            num("nominal_voltage", UnitCategory::Voltage),
            num("ripple_voltage", UnitCategory::Voltage),
            txt("chemistry"),
            txt("name"),
        };

        inline constexpr FieldDef TANK_FIELDS[] = {
            num("level", UnitCategory::Percentage),
            num("capacity", UnitCategory::Volume),
            txt("fluid_type"),
            txt("name"),
        };

        inline constexpr FieldDef WEATHER_FIELDS[] = {
            num("pressure", UnitCategory::AtmosphericPressure),
            num("air_temperature", UnitCategory::Temperature),
            num("humidity", UnitCategory::Percentage),
            num("dew_point", UnitCategory::Temperature),
            txt("name"),
        };

        inline constexpr FieldDef AUTOPILOT_FIELDS[] = {
            txt("mode"),
            num("engaged", UnitCategory::None),
            num("target_heading", UnitCategory::Angle),
            num("actual_heading", UnitCategory::Angle),
            num("rudder_angle", UnitCategory::Angle),
            txt("confidence"),
            txt("name"),
        };

        inline constexpr FieldDef RUDDER_FIELDS[] = {
            num("angle", UnitCategory::Angle),
            num("order", UnitCategory::Angle),
            txt("name"),
        };

        inline constexpr FieldDef NAVIGATION_FIELDS[] = {
            num("cross_track_error", UnitCategory::Distance),
            num("distance_to_waypoint", UnitCategory::Distance),
            num("bearing_to_waypoint", UnitCategory::Angle),
            num("velocity_made_good", UnitCategory::Speed),
            txt("name"),
        };

        struct FieldSchema {
            const FieldDef *begin;
            usize size;

            const FieldDef *find(const dp::String &field) const noexcept {
                for (usize i = 0; i < size; ++i) {
                    if (field == begin[i].name)
                        return &begin[i];
                }
                return nullptr;
            }

            bool contains(const dp::String &field) const noexcept { return find(field) != nullptr; }
        };

        template <usize N> constexpr FieldSchema schema_of(const FieldDef (&arr)[N]) { return {arr, N}; }

        inline FieldSchema schema_for(SensorType t) noexcept {
            switch (t) {
            case SensorType::Depth:
                return schema_of(DEPTH_FIELDS);
            case SensorType::Gps:
                return schema_of(GPS_FIELDS);
            case SensorType::Speed:
                return schema_of(SPEED_FIELDS);
            case SensorType::Wind:
                return schema_of(WIND_FIELDS);
            case SensorType::Heading:
                return schema_of(HEADING_FIELDS);
            case SensorType::Temperature:
                return schema_of(TEMPERATURE_FIELDS);
            case SensorType::Engine:
                return schema_of(ENGINE_FIELDS);
            case SensorType::Battery:
                return schema_of(BATTERY_FIELDS);
            case SensorType::Tank:
                return schema_of(TANK_FIELDS);
            case SensorType::Autopilot:
                return schema_of(AUTOPILOT_FIELDS);
            case SensorType::Rudder:
                return schema_of(RUDDER_FIELDS);
            case SensorType::Weather:
                return schema_of(WEATHER_FIELDS);
            case SensorType::Navigation:
                return schema_of(NAVIGATION_FIELDS);
            case SensorType::Log:
                return schema_of(LOG_FIELDS);
            }
            return {nullptr, 0};
        }

        inline const FieldDef *find_field(SensorType t, const dp::String &field) noexcept {
            return schema_for(t).find(field);
        }

    } // namespace sensor
    using namespace sensor;
} // namespace helm
