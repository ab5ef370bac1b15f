#pragma once

#include "event.hpp"

namespace helm {
    namespace util {

        // ─── Timestamped state machine ──────────────────────────────────────────────
        // Remembers when the current state was entered and which state preceded it.
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            StateEnum previous_;
            Timestamp since_ms_ = 0;

          public:
            explicit StateMachine(StateEnum initial, Timestamp now_ms = 0)
                : state_(initial), previous_(initial), since_ms_(now_ms) {}

            StateEnum state() const noexcept { return state_; }
            StateEnum previous() const noexcept { return previous_; }
            Timestamp since() const noexcept { return since_ms_; }

            // Returns true when the state actually changed
            bool transition(StateEnum new_state, Timestamp now_ms = 0) {
                if (new_state == state_)
                    return false;
                StateEnum old = state_;
                previous_ = old;
                state_ = new_state;
                since_ms_ = now_ms;
                on_transition.emit(old, new_state);
                return true;
            }

            bool is(StateEnum s) const noexcept { return state_ == s; }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace helm
