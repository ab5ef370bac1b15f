#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace helm {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        // decode
        BadChecksum,
        MissingChecksum,
        MalformedSentence,
        MalformedField,
        OutOfRange,
        // reassembly
        ReassemblyAborted,
        ReassemblyTimeout,
        // cache
        SchemaMismatch,
        UnknownInstance,
        NonFiniteValue,
        // configuration
        InvalidCategory,
        UnknownUnit,
        InvalidThreshold,
        MissingThreshold,
        InvalidRegistration,
    };

    inline const char *error_code_name(ErrorCode code) noexcept {
        switch (code) {
        case ErrorCode::Ok:
            return "ok";
        case ErrorCode::BadChecksum:
            return "bad checksum";
        case ErrorCode::MissingChecksum:
            return "missing checksum";
        case ErrorCode::MalformedSentence:
            return "malformed sentence";
        case ErrorCode::MalformedField:
            return "malformed field";
        case ErrorCode::OutOfRange:
            return "out of range";
        case ErrorCode::ReassemblyAborted:
            return "reassembly aborted";
        case ErrorCode::ReassemblyTimeout:
            return "reassembly timeout";
        case ErrorCode::SchemaMismatch:
            return "schema mismatch";
        case ErrorCode::UnknownInstance:
            return "unknown instance";
        case ErrorCode::NonFiniteValue:
            return "non-finite value";
        case ErrorCode::InvalidCategory:
            return "invalid category";
        case ErrorCode::UnknownUnit:
            return "unknown unit";
        case ErrorCode::InvalidThreshold:
            return "invalid threshold";
        case ErrorCode::MissingThreshold:
            return "missing threshold";
        case ErrorCode::InvalidRegistration:
            return "invalid registration";
        }
        return "unknown";
    }

    // Decode errors are recoverable: the message is dropped and the stream continues.
    inline bool is_decode_error(ErrorCode code) noexcept {
        return code == ErrorCode::BadChecksum || code == ErrorCode::MissingChecksum ||
               code == ErrorCode::MalformedSentence || code == ErrorCode::MalformedField ||
               code == ErrorCode::OutOfRange;
    }

    inline bool is_configuration_error(ErrorCode code) noexcept {
        return code == ErrorCode::InvalidCategory || code == ErrorCode::UnknownUnit ||
               code == ErrorCode::InvalidThreshold || code == ErrorCode::MissingThreshold ||
               code == ErrorCode::InvalidRegistration || code == ErrorCode::UnknownInstance;
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error bad_checksum(u8 computed, u8 expected) noexcept {
            return Error(ErrorCode::BadChecksum, "checksum mismatch: computed=" +
                                                     dp::String(std::to_string(computed)) +
                                                     " expected=" + dp::String(std::to_string(expected)));
        }
        static Error malformed_sentence(dp::String msg = "") noexcept {
            return Error(ErrorCode::MalformedSentence, std::move(msg));
        }
        static Error malformed_field(dp::String msg = "") noexcept {
            return Error(ErrorCode::MalformedField, std::move(msg));
        }
        static Error out_of_range(dp::String msg = "") noexcept { return Error(ErrorCode::OutOfRange, std::move(msg)); }
        static Error reassembly_aborted(PGN pgn) noexcept {
            return Error(ErrorCode::ReassemblyAborted, "fast packet aborted: pgn=" + dp::String(std::to_string(pgn)));
        }
        static Error reassembly_timeout(PGN pgn) noexcept {
            return Error(ErrorCode::ReassemblyTimeout, "fast packet timeout: pgn=" + dp::String(std::to_string(pgn)));
        }
        static Error schema_mismatch(dp::String msg = "") noexcept {
            return Error(ErrorCode::SchemaMismatch, std::move(msg));
        }
        static Error unknown_instance(dp::String msg = "") noexcept {
            return Error(ErrorCode::UnknownInstance, std::move(msg));
        }
        static Error non_finite() noexcept { return Error(ErrorCode::NonFiniteValue, "value is not finite"); }
        static Error invalid_category(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidCategory, std::move(msg));
        }
        static Error unknown_unit(const dp::String &unit) noexcept {
            return Error(ErrorCode::UnknownUnit, "unknown unit: " + unit);
        }
        static Error invalid_threshold(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidThreshold, std::move(msg));
        }
        static Error missing_threshold(const dp::String &field) noexcept {
            return Error(ErrorCode::MissingThreshold, "no threshold defined for " + field);
        }
        static Error invalid_registration(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidRegistration, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace helm
