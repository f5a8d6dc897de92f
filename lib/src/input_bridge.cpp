#include "vtmux/input_bridge.h"

#include "di/function/overload.h"
#include "di/util/exchange.h"
#include "di/vocab/tuple/prelude.h"
#include "dius/print.h"
#include "vtmux/input_codec.h"

namespace vtmux {
auto BridgeEvent::clone() const -> BridgeEvent {
    return di::visit(di::overload(
                         [](InputEvent const& event) -> BridgeEvent {
                             return { clone_input_event(event) };
                         },
                         [](SourceClosed const& closed) -> BridgeEvent {
                             return { closed };
                         }),
                     value);
}

InputBridge::~InputBridge() {
    stop();
}

void InputBridge::stop() {
    auto thread = m_lifecycle.with_lock([&](Lifecycle& lifecycle) {
        lifecycle.stopping = true;
        return di::exchange(lifecycle.thread, di::Optional<dius::Thread> {});
    });
    if (thread) {
        m_source->wake();
        (void) thread->join();
    }
    m_channel.close();
}

auto InputBridge::subscribe() -> di::Result<Receiver> {
    auto receiver = TRY(m_lifecycle.with_lock([&](Lifecycle& lifecycle) -> di::Result<Receiver> {
        if (lifecycle.source_closed || lifecycle.stopping) {
            return m_channel.subscribe(true);
        }

        auto receiver = m_channel.subscribe();
        if (!lifecycle.thread_active) {
            // The old thread must have fully exited before a new one reads the source.
            auto old_thread = di::exchange(lifecycle.thread, di::Optional<dius::Thread> {});
            if (old_thread) {
                (void) old_thread->join();
            }

            lifecycle.thread = TRY(dius::Thread::create([this] {
                input_thread();
            }));
            lifecycle.thread_active = true;
            lifecycle.generation++;
        }
        return receiver;
    }));
    return receiver;
}

auto InputBridge::state() -> InputBridgeState {
    auto [generation, thread_active, source_closed] = m_lifecycle.with_lock([&](Lifecycle& lifecycle) {
        return di::Tuple { lifecycle.generation, lifecycle.thread_active, lifecycle.source_closed };
    });
    if (generation == 0) {
        return InputBridgeState::NotStarted;
    }
    if (source_closed || !thread_active || receiver_count() == 0) {
        return InputBridgeState::Terminated;
    }
    return InputBridgeState::Running;
}

auto InputBridge::generation() -> u32 {
    return m_lifecycle.with_lock([&](Lifecycle& lifecycle) {
        return lifecycle.generation;
    });
}

void InputBridge::join_thread() {
    auto thread = m_lifecycle.with_lock([&](Lifecycle& lifecycle) {
        return di::exchange(lifecycle.thread, di::Optional<dius::Thread> {});
    });
    if (thread) {
        (void) thread->join();
    }
}

auto InputBridge::should_exit_without_receivers() -> bool {
    // Checked under the lifecycle lock so a concurrent subscribe() either sees
    // the thread as active, or launches a replacement.
    return m_lifecycle.with_lock([&](Lifecycle& lifecycle) {
        if (m_channel.receiver_count() > 0 && !lifecycle.stopping) {
            return false;
        }
        lifecycle.thread_active = false;
        return true;
    });
}

auto InputBridge::publish(InputEvent event) -> bool {
    if (m_channel.publish(BridgeEvent { di::move(event) })) {
        return true;
    }
    return !should_exit_without_receivers();
}

void InputBridge::publish_closed(bool error) {
    m_lifecycle.with_lock([&](Lifecycle& lifecycle) {
        lifecycle.source_closed = true;
        lifecycle.thread_active = false;
    });
    (void) m_channel.publish(BridgeEvent { SourceClosed { error } });
    m_channel.close();
}

void InputBridge::input_thread() {
    auto buffer = di::Vector<byte> {};
    buffer.resize(4096);

    auto pending = di::Vector<byte> {};
    for (;;) {
        if (should_exit_without_receivers()) {
            return;
        }

        auto ready = m_source->wait_and_read(buffer.span());
        if (!ready) {
            dius::eprintln("Failed to read terminal input: {}"_sv, ready.error().message());
            publish_closed(true);
            return;
        }

        // A wake-up means the bridge is stopping or lost a receiver, even if input arrived with it.
        if (ready->woken && should_exit_without_receivers()) {
            return;
        }

        if (ready->resize) {
            auto size = ready->resize.value();
            if (!publish(ResizeEvent { size.cols, size.rows })) {
                return;
            }
        }

        if (ready->end_of_file) {
            dius::eprintln("Terminal input reached end of file"_sv);
            publish_closed(false);
            return;
        }

        if (ready->woken && ready->bytes_read == 0 && !ready->resize) {
            continue;
        }

        for (auto i = 0_usize; i < ready->bytes_read; i++) {
            pending.push_back(buffer[i]);
        }

        // A full read suggests the rest of a sequence is already buffered.
        auto more_data_likely = ready->bytes_read == buffer.size();
        auto offset = 0_usize;
        while (offset < pending.size()) {
            auto parsed =
                parse_input_event(di::Span<byte const>(pending.data() + offset, pending.size() - offset), more_data_likely);
            if (!parsed) {
                break;
            }
            offset += parsed->consumed;
            if (!publish(di::move(parsed->event))) {
                return;
            }
        }

        auto rest = di::Vector<byte> {};
        for (auto i = offset; i < pending.size(); i++) {
            rest.push_back(pending[i]);
        }
        pending = di::move(rest);
    }
}
}
