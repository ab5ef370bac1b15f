#pragma once

#include "constants.hpp"
#include "types.hpp"

namespace helm {

    // ─── CAN Identifier (29-bit extended ID) ────────────────────────────────────
    // Layout: [Priority:3][Reserved:1][DataPage:1][PDU Format:8][PDU Specific:8][Source:8]
    struct Identifier {
        u32 raw = 0;

        constexpr Identifier() = default;
        constexpr explicit Identifier(u32 id) : raw(id & 0x1FFFFFFF) {}

        constexpr Priority priority() const noexcept { return static_cast<Priority>((raw >> 26) & 0x07); }

        constexpr u8 pdu_format() const noexcept { return static_cast<u8>((raw >> 16) & 0xFF); }

        constexpr u8 pdu_specific() const noexcept { return static_cast<u8>((raw >> 8) & 0xFF); }

        constexpr Address source() const noexcept { return static_cast<Address>(raw & 0xFF); }

        constexpr bool is_pdu2() const noexcept { return pdu_format() >= 240; }

        constexpr PGN pgn() const noexcept {
            u32 page = (raw >> 24) & 0x03;
            u32 pf = pdu_format();
            if (pf < 240) {
                // PDU1: destination in PS, not part of the PGN
                return (page << 16) | (pf << 8);
            }
            return (page << 16) | (pf << 8) | pdu_specific();
        }

        constexpr Address destination() const noexcept { return is_pdu2() ? BROADCAST_ADDRESS : pdu_specific(); }

        static constexpr Identifier encode(Priority prio, PGN pgn, Address src,
                                           Address dst = BROADCAST_ADDRESS) noexcept {
            u32 id = (static_cast<u32>(prio) & 0x07) << 26;
            id |= ((pgn >> 16) & 0x03) << 24;
            u8 pf = (pgn >> 8) & 0xFF;
            id |= static_cast<u32>(pf) << 16;
            id |= static_cast<u32>(pf < 240 ? dst : (pgn & 0xFF)) << 8;
            id |= static_cast<u32>(src);
            return Identifier(id);
        }

        constexpr bool operator==(const Identifier &other) const noexcept { return raw == other.raw; }
        constexpr bool operator!=(const Identifier &other) const noexcept { return raw != other.raw; }
    };

} // namespace helm
