#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace helm {
    namespace units {

        // ─── Unit categories ─────────────────────────────────────────────────────────
        // Each category has one SI storage unit; presentations convert from it.
        enum class UnitCategory : u8 {
            None = 0, // text fields, no conversion
            Depth,
            Distance,
            Speed,
            Wind,
            Angle,
            AngularVelocity,
            Temperature,
            Voltage,
            Current,
            Percentage,
            Pressure,
            AtmosphericPressure,
            Rpm,
            Volume,
            FlowRate,
            Time,
            Coordinates,
            Capacity,
            Power,
        };

        inline constexpr u8 UNIT_CATEGORY_COUNT = static_cast<u8>(UnitCategory::Power) + 1;

        inline const char *category_name(UnitCategory c) noexcept {
            switch (c) {
            case UnitCategory::None:
                return "none";
            case UnitCategory::Depth:
                return "depth";
            case UnitCategory::Distance:
                return "distance";
            case UnitCategory::Speed:
                return "speed";
            case UnitCategory::Wind:
                return "wind";
            case UnitCategory::Angle:
                return "angle";
            case UnitCategory::AngularVelocity:
                return "angular_velocity";
            case UnitCategory::Temperature:
                return "temperature";
            case UnitCategory::Voltage:
                return "voltage";
            case UnitCategory::Current:
                return "current";
            case UnitCategory::Percentage:
                return "percentage";
            case UnitCategory::Pressure:
                return "pressure";
            case UnitCategory::AtmosphericPressure:
                return "atmospheric_pressure";
            case UnitCategory::Rpm:
                return "rpm";
            case UnitCategory::Volume:
                return "volume";
            case UnitCategory::FlowRate:
                return "flow_rate";
            case UnitCategory::Time:
                return "time";
            case UnitCategory::Coordinates:
                return "coordinates";
            case UnitCategory::Capacity:
                return "capacity";
            case UnitCategory::Power:
                return "power";
            }
            return "unknown";
        }

        // ─── Presentation: one way of displaying a category ──────────────────────────
        // display = si * factor + offset
        struct Presentation {
            const char *id;
            const char *name;
            const char *symbol;
            f64 factor;
            f64 offset;
            u8 decimals;

            f64 to_display(f64 si) const noexcept { return si * factor + offset; }
            f64 to_si(f64 display) const noexcept { return (display - offset) / factor; }
        };

    } // namespace units
    using namespace units;
} // namespace helm
