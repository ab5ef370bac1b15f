#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../sensor/schema.hpp"
#include "../sensor/types.hpp"
#include <datapod/datapod.hpp>

namespace helm {
    namespace detect {

        // ─── What a piece of equipment needs before it is shown ──────────────────────
        struct EquipmentRegistration {
            dp::String equipment_id;
            dp::String display_name;
            SensorType sensor_type = SensorType::Depth;
            dp::Vector<dp::String> required_fields;
            dp::Vector<dp::String> optional_fields;
            bool multi_instance = false;
            u8 max_instances = 0; // 0 = unlimited
            i32 priority = 0;     // lower sorts first

            EquipmentRegistration() = default;
            EquipmentRegistration(dp::String id, dp::String name, SensorType type)
                : equipment_id(std::move(id)), display_name(std::move(name)), sensor_type(type) {}

            EquipmentRegistration &require(const dp::String &field) {
                required_fields.push_back(field);
                return *this;
            }
            EquipmentRegistration &optional(const dp::String &field) {
                optional_fields.push_back(field);
                return *this;
            }
            EquipmentRegistration &multi(bool enabled, u8 max = 0) {
                multi_instance = enabled;
                max_instances = max;
                return *this;
            }
            EquipmentRegistration &with_priority(i32 p) {
                priority = p;
                return *this;
            }
        };

        inline Result<void> validate_registration(const EquipmentRegistration &reg) {
            if (reg.equipment_id.empty())
                return Result<void>::err(Error::invalid_registration("equipment id is empty"));
            if (reg.required_fields.empty())
                return Result<void>::err(
                    Error::invalid_registration(reg.equipment_id + " has no required fields"));
            for (const auto &field : reg.required_fields) {
                if (find_field(reg.sensor_type, field) == nullptr) {
                    return Result<void>::err(Error::invalid_registration(
                        reg.equipment_id + ": " + sensor_type_name(reg.sensor_type) + " has no field " + field));
                }
            }
            return {};
        }

        // ─── One visible instance of registered equipment ────────────────────────────
        struct DetectedInstance {
            dp::String equipment_id;
            SensorType sensor_type = SensorType::Depth;
            u8 instance = 0;
            dp::String title;
            i32 priority = 0;
            Timestamp detected_at_ms = 0;
            Timestamp last_update_ms = 0;

            SensorKey key() const noexcept { return SensorKey(sensor_type, instance); }
        };

        struct DetectionConfig {
            u32 staleness = INSTANCE_TIMEOUT_MS;
            u32 grace = DETECTION_GRACE_MS;
            u32 throttle = DETECTION_THROTTLE_MS;

            DetectionConfig &staleness_ms(u32 ms) {
                staleness = ms;
                return *this;
            }
            DetectionConfig &grace_ms(u32 ms) {
                grace = ms;
                return *this;
            }
            // Minimum interval between on_detected_changed notifications
            DetectionConfig &throttle_ms(u32 ms) {
                throttle = ms;
                return *this;
            }
        };

    } // namespace detect
    using namespace detect;
} // namespace helm
