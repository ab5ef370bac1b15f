#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "helm/core/constants.hpp"
#include "helm/core/error.hpp"
#include "helm/core/frame.hpp"
#include "helm/core/identifier.hpp"
#include "helm/core/message.hpp"
#include "helm/core/types.hpp"
#include "helm/pgn_defs.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "helm/util/event.hpp"
#include "helm/util/scheduler.hpp"
#include "helm/util/state_machine.hpp"

// ─── Decoders ────────────────────────────────────────────────────────────────
#include "helm/n2k/decoder.hpp"
#include "helm/n2k/definitions.hpp"
#include "helm/nmea0183/decoder.hpp"
#include "helm/nmea0183/sentence.hpp"

// ─── Transport (NMEA 2000 fast packet) ───────────────────────────────────────
#include "helm/transport/fast_packet.hpp"

// ─── Sensor model ────────────────────────────────────────────────────────────
#include "helm/sensor/mapper.hpp"
#include "helm/sensor/schema.hpp"
#include "helm/sensor/types.hpp"

// ─── Units ───────────────────────────────────────────────────────────────────
#include "helm/units/category.hpp"
#include "helm/units/registry.hpp"

// ─── History ─────────────────────────────────────────────────────────────────
#include "helm/history/history_buffer.hpp"

// ─── Cache ───────────────────────────────────────────────────────────────────
#include "helm/cache/metric_value.hpp"
#include "helm/cache/sensor_cache.hpp"
#include "helm/cache/sensor_instance.hpp"

// ─── Alarms ──────────────────────────────────────────────────────────────────
#include "helm/alarm/evaluator.hpp"
#include "helm/alarm/thresholds.hpp"

// ─── Detection ───────────────────────────────────────────────────────────────
#include "helm/detect/detection_service.hpp"
#include "helm/detect/registration.hpp"

// ─── Pipeline ────────────────────────────────────────────────────────────────
#include "helm/pipeline.hpp"
