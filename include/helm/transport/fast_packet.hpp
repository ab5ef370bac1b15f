#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/identifier.hpp"
#include "../core/message.hpp"
#include "../util/event.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace helm {
    namespace transport {

        struct ReassemblerConfig {
            u32 timeout_ms = FAST_PACKET_TIMEOUT_MS;
            u32 max_sessions = FAST_PACKET_MAX_SESSIONS;

            ReassemblerConfig &timeout(u32 ms) {
                timeout_ms = ms;
                return *this;
            }
            ReassemblerConfig &sessions(u32 max) {
                max_sessions = max;
                return *this;
            }
        };

        struct ReassemblerStats {
            u64 completed = 0;
            u64 aborted = 0;
            u64 timed_out = 0;
            u64 orphan_frames = 0; // continuation frames with no session
        };

        // ─── NMEA 2000 Fast Packet reassembly ───────────────────────────────────────
        // Payloads of 9-223 bytes travel as a frame sequence:
        //   First frame: [seq_counter:3|frame_counter:5][total_bytes][6 data bytes]
        //   Subsequent:  [seq_counter:3|frame_counter:5][7 data bytes]
        // One session per (source, PGN). A broken sequence discards the session.
        class FastPacketReassembler {
            struct Session {
                PGN pgn = 0;
                Address source = NULL_ADDRESS;
                u8 sequence = 0;
                u8 expected_frame = 0;
                u32 total_bytes = 0;
                u32 bytes_received = 0;
                u32 idle_ms = 0;
                Timestamp started_ms = 0;
                dp::Vector<u8> data;
            };

            ReassemblerConfig config_;
            dp::Vector<Session> sessions_;
            ReassemblerStats stats_;
            u8 tx_sequence_ = 0;

          public:
            static constexpr u32 FIRST_FRAME_DATA = 6;
            static constexpr u32 SUBSEQUENT_FRAME_DATA = 7;

            explicit FastPacketReassembler(ReassemblerConfig config = {}) : config_(std::move(config)) {}

            // ─── Feed one frame; returns the payload once complete ──────────────────
            dp::Optional<Message> process_frame(const Frame &frame) {
                u8 frame_counter = frame.fast_packet_counter();
                u8 sequence = frame.fast_packet_sequence();
                Address src = frame.source();
                PGN pgn = frame.pgn();

                if (frame_counter == 0) {
                    return start_session(frame, src, pgn, sequence);
                }

                auto it = find_session(src, pgn);
                if (it == sessions_.end()) {
                    stats_.orphan_frames++;
                    echo::category("helm.transport.fp").trace("orphan frame: pgn=", pgn, " src=", src);
                    return dp::nullopt;
                }

                if (it->sequence != sequence || frame_counter != it->expected_frame) {
                    echo::category("helm.transport.fp")
                        .warn("sequence broken: pgn=", pgn, " src=", src, " expected=", it->expected_frame,
                              " got=", frame_counter, " seq=", sequence, "/", it->sequence);
                    discard(it, Error::reassembly_aborted(pgn));
                    return dp::nullopt;
                }

                usize offset = FIRST_FRAME_DATA + (frame_counter - 1) * SUBSEQUENT_FRAME_DATA;
                for (u8 i = 0; i < SUBSEQUENT_FRAME_DATA && (offset + i) < it->total_bytes; ++i) {
                    it->data[offset + i] = frame.data[i + 1];
                }
                it->bytes_received = static_cast<u32>(offset + SUBSEQUENT_FRAME_DATA);
                if (it->bytes_received > it->total_bytes) {
                    it->bytes_received = it->total_bytes;
                }
                it->expected_frame++;
                it->idle_ms = 0;

                if (it->bytes_received >= it->total_bytes) {
                    auto msg = make_message(*it, frame.timestamp_ms);
                    sessions_.erase(it);
                    return msg;
                }
                return dp::nullopt;
            }

            // ─── Age sessions; drop those idle past the timeout ─────────────────────
            void update(u32 elapsed_ms) {
                for (auto it = sessions_.begin(); it != sessions_.end();) {
                    it->idle_ms += elapsed_ms;
                    if (it->idle_ms >= config_.timeout_ms) {
                        echo::category("helm.transport.fp")
                            .warn("session timeout: pgn=", it->pgn, " src=", it->source, " received=",
                                  it->bytes_received, "/", it->total_bytes);
                        stats_.timed_out++;
                        on_abort.emit(it->pgn, it->source, Error::reassembly_timeout(it->pgn));
                        it = sessions_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

            // ─── Split a payload into frames ─────────────────────────────────────────
            Result<dp::Vector<Frame>> fragment(PGN pgn, const dp::Vector<u8> &data, Address source) {
                if (data.size() > FAST_PACKET_MAX_DATA) {
                    return Result<dp::Vector<Frame>>::err(
                        Error::malformed_field("payload exceeds fast packet maximum"));
                }

                dp::Vector<Frame> frames;
                u8 seq = static_cast<u8>((tx_sequence_++ & 0x07) << 5);
                usize remaining = data.size() > FIRST_FRAME_DATA ? data.size() - FIRST_FRAME_DATA : 0;
                u8 total_frames =
                    static_cast<u8>(1 + (remaining + SUBSEQUENT_FRAME_DATA - 1) / SUBSEQUENT_FRAME_DATA);

                Frame first;
                first.id = Identifier::encode(Priority::Default, pgn, source, BROADCAST_ADDRESS);
                first.data[0] = seq;
                first.data[1] = static_cast<u8>(data.size());
                for (u8 i = 0; i < FIRST_FRAME_DATA; ++i) {
                    first.data[i + 2] = i < data.size() ? data[i] : 0xFF;
                }
                frames.push_back(first);

                usize offset = FIRST_FRAME_DATA;
                for (u8 frame_num = 1; frame_num < total_frames; ++frame_num) {
                    Frame f;
                    f.id = first.id;
                    f.data[0] = seq | frame_num;
                    for (u8 i = 0; i < SUBSEQUENT_FRAME_DATA; ++i) {
                        f.data[i + 1] = (offset + i < data.size()) ? data[offset + i] : 0xFF;
                    }
                    frames.push_back(f);
                    offset += SUBSEQUENT_FRAME_DATA;
                }
                return Result<dp::Vector<Frame>>::ok(std::move(frames));
            }

            usize active_sessions() const noexcept { return sessions_.size(); }
            const ReassemblerStats &stats() const noexcept { return stats_; }
            const ReassemblerConfig &config() const noexcept { return config_; }

            void reset() { sessions_.clear(); }

            // (pgn, source, reason) for every discarded partial payload
            Event<PGN, Address, const Error &> on_abort;

          private:
            using SessionIter = dp::Vector<Session>::iterator;

            SessionIter find_session(Address src, PGN pgn) {
                for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
                    if (it->source == src && it->pgn == pgn)
                        return it;
                }
                return sessions_.end();
            }

            void discard(SessionIter it, const Error &reason) {
                stats_.aborted++;
                PGN pgn = it->pgn;
                Address src = it->source;
                sessions_.erase(it);
                on_abort.emit(pgn, src, reason);
            }

            dp::Optional<Message> start_session(const Frame &frame, Address src, PGN pgn, u8 sequence) {
                // A new first frame always supersedes an unfinished session for the same key
                auto existing = find_session(src, pgn);
                if (existing != sessions_.end()) {
                    echo::category("helm.transport.fp").debug("session restarted: pgn=", pgn, " src=", src);
                    discard(existing, Error::reassembly_aborted(pgn));
                }

                u8 total_bytes = frame.data[1];
                if (total_bytes == 0 || total_bytes > FAST_PACKET_MAX_DATA) {
                    echo::category("helm.transport.fp").warn("bad declared length ", total_bytes, " pgn=", pgn);
                    stats_.aborted++;
                    on_abort.emit(pgn, src, Error::reassembly_aborted(pgn));
                    return dp::nullopt;
                }

                Session session;
                session.pgn = pgn;
                session.source = src;
                session.sequence = sequence;
                session.expected_frame = 1;
                session.total_bytes = total_bytes;
                session.started_ms = frame.timestamp_ms;
                session.data.resize(total_bytes, 0xFF);

                u32 copy_len = total_bytes < FIRST_FRAME_DATA ? total_bytes : FIRST_FRAME_DATA;
                for (u32 i = 0; i < copy_len; ++i) {
                    session.data[i] = frame.data[i + 2];
                }
                session.bytes_received = copy_len;

                if (session.bytes_received >= session.total_bytes) {
                    return make_message(session, frame.timestamp_ms);
                }

                if (sessions_.size() >= config_.max_sessions && !sessions_.empty()) {
                    auto oldest = sessions_.begin();
                    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
                        if (it->idle_ms > oldest->idle_ms)
                            oldest = it;
                    }
                    echo::category("helm.transport.fp").warn("session limit reached, evicting pgn=", oldest->pgn);
                    discard(oldest, Error::reassembly_aborted(oldest->pgn));
                }
                sessions_.push_back(std::move(session));
                return dp::nullopt;
            }

            Message make_message(const Session &session, Timestamp timestamp_ms) {
                stats_.completed++;
                Message msg;
                msg.pgn = session.pgn;
                msg.source = session.source;
                msg.destination = BROADCAST_ADDRESS;
                msg.timestamp_ms = timestamp_ms;
                msg.data = session.data;
                return msg;
            }
        };

    } // namespace transport
    using namespace transport;
} // namespace helm
