#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include <cstdio>
#include <cstdlib>
#include <datapod/datapod.hpp>

namespace helm {
    namespace nmea0183 {

        // ─── Parsed sentence framing ───────────────────────────────────────────────
        // "$SDDBT,12.4,f,3.8,M,2.1,F*39" -> talker "SD", type "DBT", fields {...}
        // Proprietary "$PSMDST,..." -> talker "P", type "SMDST"
        struct Sentence {
            char start = '$';
            dp::String talker;
            dp::String type;
            dp::Vector<dp::String> fields;
            bool has_checksum = true;

            bool is_proprietary() const noexcept { return talker == "P"; }

            // Field access that tolerates short sentences
            const dp::String &field(usize index) const noexcept {
                static const dp::String empty;
                return index < fields.size() ? fields[index] : empty;
            }

            bool operator==(const Sentence &other) const noexcept {
                if (start != other.start || talker != other.talker || type != other.type ||
                    fields.size() != other.fields.size())
                    return false;
                for (usize i = 0; i < fields.size(); ++i) {
                    if (fields[i] != other.fields[i])
                        return false;
                }
                return true;
            }
        };

        // ─── Parser configuration ──────────────────────────────────────────────────
        struct Nmea0183Config {
            bool checksum_required = true;
            bool enforce_max_length = false;

            Nmea0183Config &require_checksum(bool required) {
                checksum_required = required;
                return *this;
            }
            Nmea0183Config &max_length(bool enforce) {
                enforce_max_length = enforce;
                return *this;
            }
        };

        // XOR of every byte between the start character and '*'
        inline u8 compute_checksum(const dp::String &body) noexcept {
            u8 sum = 0;
            for (usize i = 0; i < body.size(); ++i) {
                sum ^= static_cast<u8>(body[i]);
            }
            return sum;
        }

        inline dp::Optional<u8> hex_value(char c) noexcept {
            if (c >= '0' && c <= '9')
                return static_cast<u8>(c - '0');
            if (c >= 'A' && c <= 'F')
                return static_cast<u8>(c - 'A' + 10);
            if (c >= 'a' && c <= 'f')
                return static_cast<u8>(c - 'a' + 10);
            return dp::nullopt;
        }

        namespace detail {
            inline bool is_space(char c) noexcept { return c == ' ' || c == '\r' || c == '\n' || c == '\t'; }

            inline dp::String trim(const dp::String &line) {
                usize begin = 0;
                usize end = line.size();
                while (begin < end && is_space(line[begin]))
                    ++begin;
                while (end > begin && is_space(line[end - 1]))
                    --end;
                return line.substr(begin, end - begin);
            }

            inline dp::Vector<dp::String> split(const dp::String &body) {
                dp::Vector<dp::String> parts;
                dp::String current;
                for (usize i = 0; i < body.size(); ++i) {
                    if (body[i] == ',') {
                        parts.push_back(current);
                        current.clear();
                    } else {
                        current += body[i];
                    }
                }
                parts.push_back(current);
                return parts;
            }
        } // namespace detail

        // ─── Parse framing and verify checksum ─────────────────────────────────────
        inline Result<Sentence> parse_sentence(const dp::String &raw, const Nmea0183Config &config = {}) {
            dp::String line = detail::trim(raw);
            if (line.size() < 6 || (line[0] != '$' && line[0] != '!')) {
                return Result<Sentence>::err(Error::malformed_sentence("not an NMEA 0183 sentence"));
            }
            if (config.enforce_max_length && line.size() + 2 > NMEA0183_MAX_LENGTH) {
                return Result<Sentence>::err(Error::malformed_sentence("sentence exceeds 82 characters"));
            }

            auto star = line.find('*');
            dp::String body;
            bool has_checksum = star != dp::String::npos;
            if (has_checksum) {
                if (star + 3 != line.size()) {
                    return Result<Sentence>::err(Error::malformed_sentence("checksum trailer must be two hex digits"));
                }
                auto hi = hex_value(line[star + 1]);
                auto lo = hex_value(line[star + 2]);
                if (!hi.has_value() || !lo.has_value()) {
                    return Result<Sentence>::err(Error::malformed_sentence("checksum trailer is not hex"));
                }
                body = line.substr(1, star - 1);
                u8 expected = static_cast<u8>((*hi << 4) | *lo);
                u8 computed = compute_checksum(body);
                if (computed != expected) {
                    return Result<Sentence>::err(Error::bad_checksum(computed, expected));
                }
            } else {
                if (config.checksum_required) {
                    return Result<Sentence>::err(Error(ErrorCode::MissingChecksum, "sentence has no checksum"));
                }
                body = line.substr(1);
            }

            auto parts = detail::split(body);
            const dp::String &address = parts[0];
            Sentence sentence;
            sentence.start = line[0];
            sentence.has_checksum = has_checksum;
            if (!address.empty() && address[0] == 'P') {
                if (address.size() < 2) {
                    return Result<Sentence>::err(Error::malformed_sentence("empty proprietary address"));
                }
                sentence.talker = "P";
                sentence.type = address.substr(1);
            } else {
                if (address.size() != 5) {
                    return Result<Sentence>::err(Error::malformed_sentence("address field must be 5 characters"));
                }
                sentence.talker = address.substr(0, 2);
                sentence.type = address.substr(2, 3);
            }
            for (usize i = 1; i < parts.size(); ++i) {
                sentence.fields.push_back(parts[i]);
            }
            return Result<Sentence>::ok(std::move(sentence));
        }

        // ─── Encode with checksum trailer ──────────────────────────────────────────
        inline dp::String encode_sentence(const Sentence &sentence) {
            dp::String body = sentence.talker + sentence.type;
            for (const auto &f : sentence.fields) {
                body += ',';
                body += f;
            }
            char trailer[4];
            std::snprintf(trailer, sizeof(trailer), "*%02X", compute_checksum(body));
            dp::String out;
            out += sentence.start;
            out += body;
            out += trailer;
            return out;
        }

        // ─── Field reader ──────────────────────────────────────────────────────────
        // Empty fields read as absent. The first malformed field is remembered so a
        // decoder can read everything and check once.
        class FieldReader {
            const Sentence &sentence_;
            dp::Optional<Error> error_;

          public:
            explicit FieldReader(const Sentence &sentence) : sentence_(sentence) {}

            usize size() const noexcept { return sentence_.fields.size(); }
            const dp::String &text(usize index) const noexcept { return sentence_.field(index); }
            bool empty(usize index) const noexcept { return sentence_.field(index).empty(); }

            char flag(usize index) const noexcept {
                const auto &f = sentence_.field(index);
                return f.empty() ? '\0' : f[0];
            }

            dp::Optional<f64> number(usize index) {
                const auto &f = sentence_.field(index);
                if (f.empty())
                    return dp::nullopt;
                char *end = nullptr;
                f64 v = std::strtod(f.c_str(), &end);
                if (end == f.c_str() || *end != '\0') {
                    fail("field " + dp::String(std::to_string(index)) + " is not numeric: " + f);
                    return dp::nullopt;
                }
                return v;
            }

            dp::Optional<i32> integer(usize index) {
                const auto &f = sentence_.field(index);
                if (f.empty())
                    return dp::nullopt;
                char *end = nullptr;
                long v = std::strtol(f.c_str(), &end, 10);
                if (end == f.c_str() || *end != '\0') {
                    fail("field " + dp::String(std::to_string(index)) + " is not an integer: " + f);
                    return dp::nullopt;
                }
                return static_cast<i32>(v);
            }

            // DDMM.MMMM / DDDMM.MMMM with hemisphere letter, in decimal degrees
            dp::Optional<f64> coordinate(usize value_index, usize hemisphere_index, bool longitude) {
                auto raw = number(value_index);
                if (!raw.has_value())
                    return dp::nullopt;
                f64 degrees = static_cast<f64>(static_cast<i32>(*raw / 100.0));
                f64 minutes = *raw - degrees * 100.0;
                if (minutes < 0.0 || minutes >= 60.0) {
                    fail("coordinate minutes out of range: " + text(value_index));
                    return dp::nullopt;
                }
                f64 result = degrees + minutes / 60.0;
                char hemi = flag(hemisphere_index);
                if (longitude ? (hemi != 'E' && hemi != 'W') : (hemi != 'N' && hemi != 'S')) {
                    fail("bad hemisphere: " + text(hemisphere_index));
                    return dp::nullopt;
                }
                if (hemi == 'S' || hemi == 'W')
                    result = -result;
                return result;
            }

            void fail(dp::String message) {
                if (!error_.has_value())
                    error_ = Error::malformed_field(std::move(message));
            }

            bool ok() const noexcept { return !error_.has_value(); }
            const dp::Optional<Error> &error() const noexcept { return error_; }
        };

    } // namespace nmea0183
    using namespace nmea0183;
} // namespace helm
