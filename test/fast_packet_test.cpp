#include <doctest/doctest.h>
#include <helm/core/constants.hpp>
#include <helm/transport/fast_packet.hpp>

using namespace helm;

namespace {
    dp::Vector<u8> counting_payload(usize size, u8 start = 0) {
        dp::Vector<u8> data(size);
        for (usize i = 0; i < size; ++i)
            data[i] = static_cast<u8>(start + i);
        return data;
    }
} // namespace

TEST_CASE("Fast packet fragment") {
    FastPacketReassembler fp;

    SUBCASE("26-byte payload takes four frames") {
        auto result = fp.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x20);
        REQUIRE(result.is_ok());
        auto &frames = result.value();
        CHECK(frames.size() == 4); // 6 + 7 + 7 + 7
        CHECK((frames[0].data[0] & 0x1F) == 0);
        CHECK(frames[0].data[1] == 26);
        CHECK(frames[0].data[2] == 0);
        CHECK((frames[1].data[0] & 0x1F) == 1);
        CHECK(frames[1].data[1] == 6);
        CHECK(frames[3].data[6] == 25);
        CHECK(frames[3].data[7] == 0xFF); // padding
        CHECK(frames[0].pgn() == PGN_ENGINE_PARAMS_DYNAMIC);
        CHECK(frames[0].source() == 0x20);
    }

    SUBCASE("sequence counter advances per payload") {
        auto a = fp.fragment(PGN_DISTANCE_LOG, counting_payload(14), 0x20);
        auto b = fp.fragment(PGN_DISTANCE_LOG, counting_payload(14), 0x20);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        CHECK(((a.value()[0].data[0] >> 5) & 0x07) != ((b.value()[0].data[0] >> 5) & 0x07));
    }

    SUBCASE("oversized payload is rejected") {
        auto result = fp.fragment(PGN_PRODUCT_INFO, dp::Vector<u8>(FAST_PACKET_MAX_DATA + 1), 0x20);
        CHECK(result.is_err());
    }
}

TEST_CASE("Fast packet reassembly") {
    FastPacketReassembler tx;
    FastPacketReassembler rx;

    SUBCASE("frames in order") {
        auto original = counting_payload(43);
        auto frames = tx.fragment(PGN_GNSS_POSITION_DATA, original, 0x30);
        REQUIRE(frames.is_ok());

        dp::Optional<Message> msg;
        usize completions = 0;
        for (const auto &frame : frames.value()) {
            msg = rx.process_frame(frame);
            if (msg.has_value())
                completions++;
        }
        CHECK(completions == 1);
        REQUIRE(msg.has_value());
        CHECK(msg->pgn == PGN_GNSS_POSITION_DATA);
        CHECK(msg->source == 0x30);
        REQUIRE(msg->data.size() == 43);
        for (usize i = 0; i < 43; ++i)
            CHECK(msg->data[i] == original[i]);
        CHECK(rx.active_sessions() == 0);
        CHECK(rx.stats().completed == 1);
    }

    SUBCASE("payload that fits the first frame completes immediately") {
        auto frames = tx.fragment(PGN_DISTANCE_LOG, counting_payload(5), 0x30);
        REQUIRE(frames.is_ok());
        REQUIRE(frames.value().size() == 1);
        auto msg = rx.process_frame(frames.value()[0]);
        REQUIRE(msg.has_value());
        CHECK(msg->data.size() == 5);
    }

    SUBCASE("interleaved sources are reassembled independently") {
        auto a_data = counting_payload(26, 0x00);
        auto b_data = counting_payload(26, 0x80);
        auto a = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, a_data, 0x10);
        auto b = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, b_data, 0x11);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());

        dp::Vector<Message> done;
        for (usize i = 0; i < a.value().size(); ++i) {
            auto ma = rx.process_frame(a.value()[i]);
            if (ma.has_value())
                done.push_back(*ma);
            auto mb = rx.process_frame(b.value()[i]);
            if (mb.has_value())
                done.push_back(*mb);
        }
        REQUIRE(done.size() == 2);
        CHECK(done[0].source == 0x10);
        CHECK(done[1].source == 0x11);
        for (usize i = 0; i < 26; ++i) {
            CHECK(done[0].data[i] == a_data[i]);
            CHECK(done[1].data[i] == b_data[i]);
        }
        CHECK(rx.stats().aborted == 0);
    }

    SUBCASE("same source, different PGNs interleaved") {
        auto a = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x10);
        auto b = tx.fragment(PGN_DISTANCE_LOG, counting_payload(14), 0x10);
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        usize completions = 0;
        CHECK_FALSE(rx.process_frame(a.value()[0]).has_value());
        CHECK_FALSE(rx.process_frame(b.value()[0]).has_value());
        CHECK(rx.active_sessions() == 2);
        for (usize i = 1; i < b.value().size(); ++i)
            completions += rx.process_frame(b.value()[i]).has_value() ? 1 : 0;
        for (usize i = 1; i < a.value().size(); ++i)
            completions += rx.process_frame(a.value()[i]).has_value() ? 1 : 0;
        CHECK(completions == 2);
    }
}

TEST_CASE("Fast packet aborts") {
    FastPacketReassembler tx;
    FastPacketReassembler rx;

    dp::Vector<ErrorCode> reasons;
    rx.on_abort.subscribe([&](PGN, Address, const Error &e) { reasons.push_back(e.code); });

    SUBCASE("missing frame aborts the sequence and yields nothing") {
        auto frames = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x10);
        REQUIRE(frames.is_ok());
        auto &f = frames.value();
        CHECK_FALSE(rx.process_frame(f[0]).has_value());
        CHECK_FALSE(rx.process_frame(f[2]).has_value()); // frame 1 lost
        CHECK_FALSE(rx.process_frame(f[3]).has_value());
        CHECK(rx.active_sessions() == 0);
        CHECK(rx.stats().aborted == 1);
        CHECK(rx.stats().orphan_frames == 1);
        CHECK(rx.stats().completed == 0);
        REQUIRE(reasons.size() == 1);
        CHECK(reasons[0] == ErrorCode::ReassemblyAborted);
    }

    SUBCASE("new first frame supersedes an unfinished one") {
        auto first = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26, 0x00), 0x10);
        auto second = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26, 0x40), 0x10);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        rx.process_frame(first.value()[0]);
        rx.process_frame(first.value()[1]);

        dp::Optional<Message> msg;
        for (const auto &frame : second.value())
            msg = rx.process_frame(frame);
        REQUIRE(msg.has_value());
        CHECK(msg->data[0] == 0x40);
        CHECK(rx.stats().aborted == 1);
    }

    SUBCASE("idle session times out") {
        auto frames = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x10);
        REQUIRE(frames.is_ok());
        rx.process_frame(frames.value()[0]);
        rx.update(FAST_PACKET_TIMEOUT_MS - 1);
        CHECK(rx.active_sessions() == 1);
        rx.update(1);
        CHECK(rx.active_sessions() == 0);
        CHECK(rx.stats().timed_out == 1);
        REQUIRE(reasons.size() == 1);
        CHECK(reasons[0] == ErrorCode::ReassemblyTimeout);

        // The rest of the sequence is now orphaned
        CHECK_FALSE(rx.process_frame(frames.value()[1]).has_value());
        CHECK(rx.stats().orphan_frames == 1);
    }

    SUBCASE("activity resets the idle timer") {
        auto frames = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x10);
        REQUIRE(frames.is_ok());
        rx.process_frame(frames.value()[0]);
        rx.update(500);
        rx.process_frame(frames.value()[1]);
        rx.update(500);
        CHECK(rx.active_sessions() == 1);
    }

    SUBCASE("declared length of zero") {
        const u8 payload[8] = {0x00, 0x00, 1, 2, 3, 4, 5, 6};
        Frame bad = Frame::make(PGN_ENGINE_PARAMS_DYNAMIC, 0x10, payload);
        CHECK_FALSE(rx.process_frame(bad).has_value());
        CHECK(rx.active_sessions() == 0);
        REQUIRE(reasons.size() == 1);
        CHECK(reasons[0] == ErrorCode::ReassemblyAborted);
    }

    SUBCASE("session limit evicts the stalest") {
        ReassemblerConfig config;
        config.sessions(2);
        FastPacketReassembler small(config);
        auto a = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x10);
        auto b = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x11);
        auto c = tx.fragment(PGN_ENGINE_PARAMS_DYNAMIC, counting_payload(26), 0x12);
        small.process_frame(a.value()[0]);
        small.update(10);
        small.process_frame(b.value()[0]);
        small.process_frame(c.value()[0]);
        CHECK(small.active_sessions() == 2);
        CHECK(small.stats().aborted == 1);
        // 0x10 was evicted
        CHECK_FALSE(small.process_frame(a.value()[1]).has_value());
        CHECK(small.stats().orphan_frames == 1);
    }
}
