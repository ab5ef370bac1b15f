#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../util/event.hpp"
#include "category.hpp"
#include <cmath>
#include <cstdio>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <mutex>

namespace helm {
    namespace units {

        // ═════════════════════════════════════════════════════════════════════════════
        // PRESENTATION TABLES (first entry is the default)
        // ═════════════════════════════════════════════════════════════════════════════
        inline constexpr Presentation DEPTH_UNITS[] = {
            {"m", "Meters", "m", 1.0, 0.0, 1},
            {"ft", "Feet", "ft", 1.0 / FEET_TO_M, 0.0, 1},
            {"fathom", "Fathoms", "fth", 1.0 / FATHOM_TO_M, 0.0, 1},
        };
        inline constexpr Presentation DISTANCE_UNITS[] = {
            {"nm", "Nautical miles", "nm", 1.0 / NM_TO_M, 0.0, 2},
            {"km", "Kilometers", "km", 1.0 / KM_TO_M, 0.0, 2},
            {"mi", "Statute miles", "mi", 1.0 / 1609.344, 0.0, 2},
            {"m", "Meters", "m", 1.0, 0.0, 0},
        };
        inline constexpr Presentation SPEED_UNITS[] = {
            {"kn", "Knots", "kn", 1.0 / KNOTS_TO_MPS, 0.0, 1},
            {"kmh", "Kilometers per hour", "km/h", 3.6, 0.0, 1},
            {"mph", "Miles per hour", "mph", 1.0 / MPH_TO_MPS, 0.0, 1},
            {"mps", "Meters per second", "m/s", 1.0, 0.0, 1},
        };
        inline constexpr Presentation WIND_UNITS[] = {
            {"kn", "Knots", "kn", 1.0 / KNOTS_TO_MPS, 0.0, 1},
            {"mps", "Meters per second", "m/s", 1.0, 0.0, 1},
            {"kmh", "Kilometers per hour", "km/h", 3.6, 0.0, 1},
            {"mph", "Miles per hour", "mph", 1.0 / MPH_TO_MPS, 0.0, 1},
        };
        inline constexpr Presentation ANGLE_UNITS[] = {
            {"deg", "Degrees", "\xC2\xB0", RAD_TO_DEG, 0.0, 0},
            {"rad", "Radians", "rad", 1.0, 0.0, 3},
        };
        inline constexpr Presentation ANGULAR_VELOCITY_UNITS[] = {
            {"degmin", "Degrees per minute", "\xC2\xB0/min", RAD_TO_DEG * 60.0, 0.0, 0},
            {"degs", "Degrees per second", "\xC2\xB0/s", RAD_TO_DEG, 0.0, 1},
        };
        inline constexpr Presentation TEMPERATURE_UNITS[] = {
            {"c", "Celsius", "\xC2\xB0""C", 1.0, -KELVIN_OFFSET, 1},
            {"f", "Fahrenheit", "\xC2\xB0""F", 1.8, -KELVIN_OFFSET * 1.8 + 32.0, 1},
            {"k", "Kelvin", "K", 1.0, 0.0, 1},
        };
        inline constexpr Presentation VOLTAGE_UNITS[] = {
            {"v", "Volts", "V", 1.0, 0.0, 2},
        };
        inline constexpr Presentation CURRENT_UNITS[] = {
            {"a", "Amperes", "A", 1.0, 0.0, 1},
        };
        inline constexpr Presentation PERCENTAGE_UNITS[] = {
            {"pct", "Percent", "%", 100.0, 0.0, 0},
        };
        inline constexpr Presentation PRESSURE_UNITS[] = {
            {"kpa", "Kilopascals", "kPa", 0.001, 0.0, 0},
            {"bar", "Bar", "bar", 1.0 / BAR_TO_PA, 0.0, 2},
            {"psi", "Pounds per square inch", "psi", 1.0 / PSI_TO_PA, 0.0, 0},
        };
        inline constexpr Presentation ATMOSPHERIC_PRESSURE_UNITS[] = {
            {"hpa", "Hectopascals", "hPa", 0.01, 0.0, 0},
            {"mbar", "Millibar", "mbar", 0.01, 0.0, 0},
            {"inhg", "Inches of mercury", "inHg", 1.0 / 3386.389, 0.0, 2},
            {"mmhg", "Millimeters of mercury", "mmHg", 1.0 / 133.322387, 0.0, 0},
        };
        inline constexpr Presentation RPM_UNITS[] = {
            {"rpm", "Revolutions per minute", "rpm", 1.0, 0.0, 0},
            {"hz", "Hertz", "Hz", 1.0 / 60.0, 0.0, 1},
        };
        inline constexpr Presentation VOLUME_UNITS[] = {
            {"l", "Liters", "L", 1000.0, 0.0, 0},
            {"gal", "US gallons", "gal", 264.172052, 0.0, 1},
            {"impgal", "Imperial gallons", "gal", 219.969248, 0.0, 1},
        };
        inline constexpr Presentation FLOW_RATE_UNITS[] = {
            {"lph", "Liters per hour", "L/h", 3.6e6, 0.0, 1},
            {"gph", "US gallons per hour", "gal/h", 264.172052 * 3600.0, 0.0, 1},
        };
        inline constexpr Presentation TIME_UNITS[] = {
            {"h", "Hours", "h", 1.0 / 3600.0, 0.0, 1},
            {"min", "Minutes", "min", 1.0 / 60.0, 0.0, 0},
            {"s", "Seconds", "s", 1.0, 0.0, 0},
        };
        inline constexpr Presentation COORDINATE_UNITS[] = {
            {"dd", "Decimal degrees", "\xC2\xB0", 1.0, 0.0, 6},
        };
        inline constexpr Presentation CAPACITY_UNITS[] = {
            {"ah", "Amp-hours", "Ah", 1.0, 0.0, 0},
        };
        inline constexpr Presentation POWER_UNITS[] = {
            {"w", "Watts", "W", 1.0, 0.0, 0},
            {"kw", "Kilowatts", "kW", 0.001, 0.0, 2},
        };

        struct PresentationTable {
            const Presentation *begin;
            usize size;
        };

        template <usize N> constexpr PresentationTable table_of(const Presentation (&arr)[N]) { return {arr, N}; }

        inline PresentationTable presentations_for(UnitCategory c) noexcept {
            switch (c) {
            case UnitCategory::Depth:
                return table_of(DEPTH_UNITS);
            case UnitCategory::Distance:
                return table_of(DISTANCE_UNITS);
            case UnitCategory::Speed:
                return table_of(SPEED_UNITS);
            case UnitCategory::Wind:
                return table_of(WIND_UNITS);
            case UnitCategory::Angle:
                return table_of(ANGLE_UNITS);
            case UnitCategory::AngularVelocity:
                return table_of(ANGULAR_VELOCITY_UNITS);
            case UnitCategory::Temperature:
                return table_of(TEMPERATURE_UNITS);
            case UnitCategory::Voltage:
                return table_of(VOLTAGE_UNITS);
            case UnitCategory::Current:
                return table_of(CURRENT_UNITS);
            case UnitCategory::Percentage:
                return table_of(PERCENTAGE_UNITS);
            case UnitCategory::Pressure:
                return table_of(PRESSURE_UNITS);
            case UnitCategory::AtmosphericPressure:
                return table_of(ATMOSPHERIC_PRESSURE_UNITS);
            case UnitCategory::Rpm:
                return table_of(RPM_UNITS);
            case UnitCategory::Volume:
                return table_of(VOLUME_UNITS);
            case UnitCategory::FlowRate:
                return table_of(FLOW_RATE_UNITS);
            case UnitCategory::Time:
                return table_of(TIME_UNITS);
            case UnitCategory::Coordinates:
                return table_of(COORDINATE_UNITS);
            case UnitCategory::Capacity:
                return table_of(CAPACITY_UNITS);
            case UnitCategory::Power:
                return table_of(POWER_UNITS);
            case UnitCategory::None:
                break;
            }
            return {nullptr, 0};
        }

        inline constexpr const char *NOT_AVAILABLE_TEXT = "---";

        // ─── Unit conversion registry ─────────────────────────────────────────────────
        // Holds the active presentation per category. Conversion is pure; selection
        // changes only display output, never stored SI values.
        class UnitRegistry {
            dp::Array<u8, UNIT_CATEGORY_COUNT> active_ = {};
            mutable std::mutex mutex_;

          public:
            UnitRegistry() = default;
            UnitRegistry(const UnitRegistry &) = delete;
            UnitRegistry &operator=(const UnitRegistry &) = delete;

            // ─── Selection ───────────────────────────────────────────────────────────
            Result<void> select(UnitCategory category, const dp::String &unit_id) {
                auto table = presentations_for(category);
                if (table.size == 0) {
                    return Result<void>::err(
                        Error::invalid_category(dp::String("category has no units: ") + category_name(category)));
                }
                for (usize i = 0; i < table.size; ++i) {
                    if (unit_id == table.begin[i].id) {
                        bool changed = false;
                        {
                            std::lock_guard<std::mutex> lock(mutex_);
                            changed = active_[static_cast<u8>(category)] != i;
                            active_[static_cast<u8>(category)] = static_cast<u8>(i);
                        }
                        if (changed) {
                            echo::category("helm.units")
                                .info("unit for ", category_name(category), " set to ", table.begin[i].id);
                            on_unit_changed.emit(category);
                        }
                        return {};
                    }
                }
                return Result<void>::err(Error::unknown_unit(unit_id));
            }

            // Active presentation; nullptr for None
            const Presentation *active(UnitCategory category) const noexcept {
                auto table = presentations_for(category);
                if (table.size == 0)
                    return nullptr;
                std::lock_guard<std::mutex> lock(mutex_);
                return &table.begin[active_[static_cast<u8>(category)]];
            }

            dp::Optional<Presentation> find(UnitCategory category, const dp::String &unit_id) const noexcept {
                auto table = presentations_for(category);
                for (usize i = 0; i < table.size; ++i) {
                    if (unit_id == table.begin[i].id)
                        return table.begin[i];
                }
                return dp::nullopt;
            }

            dp::Vector<Presentation> presentations(UnitCategory category) const {
                dp::Vector<Presentation> out;
                auto table = presentations_for(category);
                for (usize i = 0; i < table.size; ++i) {
                    out.push_back(table.begin[i]);
                }
                return out;
            }

            // ─── Conversion ──────────────────────────────────────────────────────────
            Result<f64> to_display(f64 si, UnitCategory category) const {
                auto p = active(category);
                if (p == nullptr)
                    return Result<f64>::err(Error::invalid_category("no conversion for text fields"));
                if (!std::isfinite(si))
                    return Result<f64>::err(Error::non_finite());
                return Result<f64>::ok(p->to_display(si));
            }

            Result<f64> to_si(f64 display, UnitCategory category) const {
                auto p = active(category);
                if (p == nullptr)
                    return Result<f64>::err(Error::invalid_category("no conversion for text fields"));
                if (!std::isfinite(display))
                    return Result<f64>::err(Error::non_finite());
                return Result<f64>::ok(p->to_si(display));
            }

            // Fixed decimals of the active presentation; "---" for non-finite values.
            // Negative zero prints without its sign.
            dp::String format(f64 display, UnitCategory category, bool include_unit) const {
                if (!std::isfinite(display))
                    return NOT_AVAILABLE_TEXT;
                auto p = active(category);
                // Unitless numbers (counts, codes) print as integers when integral
                u8 decimals = p != nullptr ? p->decimals : (std::floor(display) == display ? 0 : 2);
                char buf[48];
                std::snprintf(buf, sizeof(buf), "%.*f", static_cast<int>(decimals), display);
                dp::String out(buf);
                if (out == "-0" || out.substr(0, 3) == "-0.") {
                    bool all_zero = true;
                    for (usize i = 1; i < out.size(); ++i) {
                        if (out[i] != '0' && out[i] != '.')
                            all_zero = false;
                    }
                    if (all_zero)
                        out = out.substr(1);
                }
                if (include_unit && p != nullptr) {
                    out += ' ';
                    out += p->symbol;
                }
                return out;
            }

            dp::String symbol(UnitCategory category) const {
                auto p = active(category);
                return p != nullptr ? dp::String(p->symbol) : dp::String();
            }

            // (category) after a selection actually changed
            Event<UnitCategory> on_unit_changed;
        };

    } // namespace units
    using namespace units;
} // namespace helm
