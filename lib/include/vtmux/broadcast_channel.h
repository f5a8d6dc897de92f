#pragma once

#include "di/container/queue/queue.h"
#include "di/container/vector/vector.h"
#include "di/sync/synchronized.h"
#include "di/util/exchange.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/pointer/box.h"
#include "dius/condition_variable.h"
#include "dius/steady_clock.h"

namespace vtmux {
/// @brief Multi-consumer channel where every receiver observes every value
///
/// Values published after a receiver subscribes are queued for that receiver
/// until it takes them, so a slow receiver never loses values and never blocks
/// the publisher. Receivers unsubscribe when destroyed. The channel must
/// outlive all of its receivers.
///
/// Values are copied into each receiver's queue. Types which are move only must
/// provide a clone() member function.
template<typename T>
class BroadcastChannel {
    struct Subscriber {
        u64 id { 0 };
        di::Queue<T> queue;
        bool closed { false };
        dius::ConditionVariable condition;
    };

    struct State {
        di::Vector<di::Box<Subscriber>> subscribers;
        u64 next_id { 1 };
    };

public:
    class Receiver {
    public:
        Receiver(Receiver&& other) : m_channel(di::exchange(other.m_channel, nullptr)), m_id(other.m_id) {}

        auto operator=(Receiver&& other) -> Receiver& {
            if (this != &other) {
                reset();
                m_channel = di::exchange(other.m_channel, nullptr);
                m_id = other.m_id;
            }
            return *this;
        }

        ~Receiver() { reset(); }

        // Block until a value is available. Returns none once the channel has
        // been closed and every queued value was taken.
        auto receive() -> di::Optional<T> {
            if (!m_channel) {
                return {};
            }
            return m_channel->receive(m_id);
        }

        // Block until a value is available, the channel is closed or deadline
        // passes. Returns none unless a value was taken.
        auto receive_until(dius::SteadyClock::TimePoint deadline) -> di::Optional<T> {
            if (!m_channel) {
                return {};
            }
            return m_channel->receive_until(m_id, deadline);
        }

        // Take a queued value without blocking.
        auto try_receive() -> di::Optional<T> {
            if (!m_channel) {
                return {};
            }
            return m_channel->try_receive(m_id);
        }

        auto is_closed() const -> bool { return !m_channel || m_channel->is_closed(m_id); }

    private:
        friend class BroadcastChannel;

        Receiver(BroadcastChannel* channel, u64 id) : m_channel(channel), m_id(id) {}

        void reset() {
            if (auto* channel = di::exchange(m_channel, nullptr)) {
                channel->unsubscribe(m_id);
            }
        }

        BroadcastChannel* m_channel { nullptr };
        u64 m_id { 0 };
    };

    BroadcastChannel() = default;

    BroadcastChannel(BroadcastChannel const&) = delete;
    auto operator=(BroadcastChannel const&) -> BroadcastChannel& = delete;

    // Subscribe to values published from now on. When closed is set, the
    // receiver starts out closed and will never receive anything.
    auto subscribe(bool closed = false) -> Receiver {
        return m_state.with_lock([&](State& state) {
            auto id = state.next_id++;
            auto subscriber = di::make_box<Subscriber>();
            subscriber->id = id;
            subscriber->closed = closed;
            state.subscribers.push_back(di::move(subscriber));
            return Receiver(this, id);
        });
    }

    // Queue value for every live receiver. Returns false if there are none.
    auto publish(T const& value) -> bool {
        return m_state.with_lock([&](State& state) {
            auto delivered = false;
            for (auto& subscriber : state.subscribers) {
                if (subscriber->closed) {
                    continue;
                }
                subscriber->queue.push(copy(value));
                subscriber->condition.notify_one();
                delivered = true;
            }
            return delivered;
        });
    }

    // Close every current receiver. Values already queued can still be taken.
    void close() {
        m_state.with_lock([&](State& state) {
            for (auto& subscriber : state.subscribers) {
                subscriber->closed = true;
                subscriber->condition.notify_one();
            }
        });
    }

    auto receiver_count() -> usize {
        return m_state.with_lock([&](State& state) {
            return state.subscribers.size();
        });
    }

private:
    static auto copy(T const& value) -> T {
        if constexpr (requires { value.clone(); }) {
            return value.clone();
        } else {
            return value;
        }
    }

    // Must be called with the lock held.
    static auto find(State& state, u64 id) -> Subscriber* {
        for (auto& subscriber : state.subscribers) {
            if (subscriber->id == id) {
                return subscriber.get();
            }
        }
        return nullptr;
    }

    void unsubscribe(u64 id) {
        m_state.with_lock([&](State& state) {
            for (auto it = state.subscribers.begin(); it != state.subscribers.end(); ++it) {
                if ((*it)->id == id) {
                    state.subscribers.erase(it);
                    return;
                }
            }
        });
    }

    auto receive(u64 id) -> di::Optional<T> {
        auto lock = di::UniqueLock(m_state.get_lock());

        // SAFETY: we acquired the lock manually above.
        auto& state = m_state.get_assuming_no_concurrent_accesses();
        auto* subscriber = find(state, id);
        if (!subscriber) {
            return {};
        }
        subscriber->condition.wait(lock, [&] {
            return !subscriber->queue.empty() || subscriber->closed;
        });
        return subscriber->queue.pop();
    }

    auto receive_until(u64 id, dius::SteadyClock::TimePoint deadline) -> di::Optional<T> {
        auto lock = di::UniqueLock(m_state.get_lock());

        // SAFETY: we acquired the lock manually above.
        auto& state = m_state.get_assuming_no_concurrent_accesses();
        auto* subscriber = find(state, id);
        if (!subscriber) {
            return {};
        }
        (void) subscriber->condition.wait_until(lock, deadline, [&] {
            return !subscriber->queue.empty() || subscriber->closed;
        });
        return subscriber->queue.pop();
    }

    auto try_receive(u64 id) -> di::Optional<T> {
        return m_state.with_lock([&](State& state) -> di::Optional<T> {
            auto* subscriber = find(state, id);
            if (!subscriber) {
                return {};
            }
            return subscriber->queue.pop();
        });
    }

    auto is_closed(u64 id) -> bool {
        return m_state.with_lock([&](State& state) {
            auto* subscriber = find(state, id);
            return !subscriber || (subscriber->closed && subscriber->queue.empty());
        });
    }

    di::Synchronized<State> m_state;
};
}
