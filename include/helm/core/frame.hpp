#pragma once

#include "identifier.hpp"
#include "message.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace helm {

    // ─── CAN Frame (8-byte physical frame) ──────────────────────────────────────
    // What the transport layer hands over: a 29-bit extended id, up to eight
    // data bytes and the receive time.
    struct Frame {
        Identifier id;
        dp::Array<u8, 8> data = {};
        u8 length = 8;
        Timestamp timestamp_ms = 0;

        constexpr Frame() = default;

        constexpr Frame(Identifier identifier, dp::Array<u8, 8> payload, u8 len = 8)
            : id(identifier), data(payload), length(len) {}

        // Build a broadcast frame, padding unused bytes with 0xFF
        static Frame make(PGN pgn, Address src, const u8 *payload, u8 len = 8,
                          Priority prio = Priority::Default) noexcept {
            Frame f;
            f.id = Identifier::encode(prio, pgn, src, BROADCAST_ADDRESS);
            f.fill(payload, len);
            return f;
        }

        // Wrap a raw extended CAN id as read from a socket or gateway
        static Frame from_raw(u32 can_id, const u8 *payload, u8 len, Timestamp ts = 0) noexcept {
            Frame f;
            f.id = Identifier(can_id);
            f.fill(payload, len);
            f.timestamp_ms = ts;
            return f;
        }

        constexpr PGN pgn() const noexcept { return id.pgn(); }
        constexpr Address source() const noexcept { return id.source(); }
        constexpr Address destination() const noexcept { return id.destination(); }
        constexpr Priority priority() const noexcept { return id.priority(); }

        // Fast-packet header byte: [sequence:3][frame counter:5]
        u8 fast_packet_sequence() const noexcept { return (data[0] >> 5) & 0x07; }
        u8 fast_packet_counter() const noexcept { return data[0] & 0x1F; }

        // A single-frame PGN is its own complete payload
        Message to_message() const {
            Message msg;
            msg.pgn = pgn();
            msg.source = source();
            msg.destination = destination();
            msg.priority = priority();
            msg.timestamp_ms = timestamp_ms;
            msg.data.assign(data.begin(), data.begin() + length);
            return msg;
        }

      private:
        void fill(const u8 *payload, u8 len) noexcept {
            length = len > 8 ? 8 : len;
            for (u8 i = 0; i < length; ++i) {
                data[i] = payload[i];
            }
            for (u8 i = length; i < 8; ++i) {
                data[i] = 0xFF;
            }
        }
    };

} // namespace helm
