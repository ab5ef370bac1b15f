#pragma once

#include "../core/types.hpp"
#include <atomic>
#include <datapod/datapod.hpp>
#include <functional>
#include <memory>
#include <mutex>

namespace helm {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Type-safe event dispatcher ──────────────────────────────────────────────
        // Supports:
        //   - subscribe/unsubscribe with tokens
        //   - subscribe or unsubscribe from inside a listener
        //   - emits from several threads at once
        // Each emit walks a snapshot of the listener list taken under the lock, so
        // listeners run unlocked. A listener added during dispatch is first called
        // by the next emit; one removed during dispatch is not called again.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = 0;
                std::function<void(Args...)> fn;
                std::atomic<bool> active{true};

                Listener(ListenerToken t, std::function<void(Args...)> f) : token(t), fn(std::move(f)) {}
            };
            using ListenerPtr = std::shared_ptr<Listener>;

            dp::Vector<ListenerPtr> listeners_;
            ListenerToken next_token_ = 1;
            mutable std::mutex mutex_;

          public:
            Event() = default;

            // Copies get their own listener entries holding the same callables
            Event(const Event &other) {
                std::lock_guard<std::mutex> lock(other.mutex_);
                next_token_ = other.next_token_;
                for (const auto &l : other.listeners_) {
                    listeners_.push_back(std::make_shared<Listener>(l->token, l->fn));
                }
            }

            Event(Event &&other) noexcept {
                std::lock_guard<std::mutex> lock(other.mutex_);
                listeners_ = std::move(other.listeners_);
                next_token_ = other.next_token_;
            }

            Event &operator=(const Event &other) {
                if (this != &other) {
                    Event copy(other);
                    std::scoped_lock lock(mutex_, copy.mutex_);
                    listeners_ = std::move(copy.listeners_);
                    next_token_ = copy.next_token_;
                }
                return *this;
            }

            Event &operator=(Event &&other) noexcept {
                if (this != &other) {
                    std::scoped_lock lock(mutex_, other.mutex_);
                    listeners_ = std::move(other.listeners_);
                    next_token_ = other.next_token_;
                }
                return *this;
            }

            ListenerToken subscribe(std::function<void(Args...)> fn) {
                std::lock_guard<std::mutex> lock(mutex_);
                ListenerToken token = next_token_++;
                listeners_.push_back(std::make_shared<Listener>(token, std::move(fn)));
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if ((*it)->token == token) {
                        (*it)->active.store(false);
                        listeners_.erase(it);
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                dp::Vector<ListenerPtr> snapshot;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (listeners_.size() == 0)
                        return;
                    snapshot = listeners_;
                }
                for (const auto &l : snapshot) {
                    if (l->active.load() && l->fn) {
                        l->fn(args...);
                    }
                }
            }

            usize count() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return listeners_.size();
            }

            bool empty() const { return count() == 0; }

            void clear() {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto &l : listeners_) {
                    l->active.store(false);
                }
                listeners_.clear();
            }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace helm
