#pragma once

#include "../sensor/types.hpp"
#include "../units/registry.hpp"
#include <datapod/datapod.hpp>
#include <limits>
#include <variant>

namespace helm {
    namespace cache {

        // ─── Cached metric snapshot ──────────────────────────────────────────────────
        // SI value plus display enrichment. Enrichment depends only on the value and
        // the active presentation of its category.
        struct MetricValue {
            FieldValue si = 0.0;
            UnitCategory category = UnitCategory::None;
            Timestamp timestamp_ms = 0;

            dp::Optional<f64> display;
            dp::String unit;
            dp::String formatted;
            dp::String formatted_with_unit;

            MetricValue() = default;
            MetricValue(FieldValue value, UnitCategory c, Timestamp ts)
                : si(std::move(value)), category(c), timestamp_ms(ts) {}

            bool numeric() const noexcept { return is_numeric(si); }
            dp::Optional<f64> number() const noexcept { return numeric_of(si); }
            dp::Optional<dp::String> text() const { return text_of(si); }

            void enrich(const UnitRegistry &units) {
                if (const dp::String *t = std::get_if<dp::String>(&si)) {
                    display = dp::nullopt;
                    unit = dp::String();
                    formatted = *t;
                    formatted_with_unit = *t;
                    return;
                }

                f64 value = std::get<f64>(si);
                if (category == UnitCategory::None) {
                    display = value;
                } else {
                    auto converted = units.to_display(value, category);
                    if (converted.is_ok()) {
                        display = converted.value();
                    } else {
                        display = dp::nullopt;
                    }
                }
                unit = units.symbol(category);
                f64 shown = display.has_value() ? *display : std::numeric_limits<f64>::quiet_NaN();
                formatted = units.format(shown, category, false);
                formatted_with_unit = units.format(shown, category, display.has_value());
            }
        };

    } // namespace cache
    using namespace cache;
} // namespace helm
