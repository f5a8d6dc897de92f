#pragma once

#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/sync/synchronized.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/pointer/box.h"
#include "di/vocab/variant/prelude.h"
#include "dius/thread.h"
#include "vtmux/broadcast_channel.h"
#include "vtmux/input_event.h"
#include "vtmux/input_source.h"

namespace vtmux {
/// @brief The input source reached end of file (error unset) or failed to read (error set).
struct SourceClosed {
    bool error { false };

    auto operator==(SourceClosed const&) const -> bool = default;
};

/// @brief A value published by the input bridge.
struct BridgeEvent {
    di::Variant<InputEvent, SourceClosed> value;

    auto clone() const -> BridgeEvent;
};

enum class InputBridgeState {
    NotStarted,
    Running,
    Terminated,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<InputBridgeState>) {
    using enum InputBridgeState;
    return di::make_enumerators<"InputBridgeState">(di::enumerator<"NotStarted", NotStarted>,
                                                    di::enumerator<"Running", Running>,
                                                    di::enumerator<"Terminated", Terminated>);
}

/// @brief Owns an input source on a dedicated thread and broadcasts decoded events
///
/// The thread is launched by the first subscribe(). It blocks on the source,
/// decodes events with parse_input_event(), and publishes them to every
/// receiver in decode order. The thread is never cancelled. It exits when the
/// source reports end of file or an error (after publishing SourceClosed). It
/// also exits once every receiver has been dropped or stop() was called, which
/// is checked before each read and whenever the source is woken.
///
/// Subscribing after the thread exited because its receivers were dropped
/// launches a new thread. Subscribing after the source closed, or after
/// stop(), returns a receiver which is already closed.
///
/// Receivers must not outlive the bridge.
class InputBridge {
public:
    using Receiver = BroadcastChannel<BridgeEvent>::Receiver;

    explicit InputBridge(di::Box<InputSource> source) : m_source(di::move(source)) {}
    ~InputBridge();

    auto subscribe() -> di::Result<Receiver>;

    auto state() -> InputBridgeState;
    auto receiver_count() -> usize { return m_channel.receiver_count(); }

    // Number of times the input thread has been launched.
    auto generation() -> u32;

    // Wait for the current input thread to exit on its own.
    void join_thread();

    // Make the input thread exit even though receivers remain, and close
    // them. Input which was read but not yet published is dropped.
    void stop();

private:
    struct Lifecycle {
        u32 generation { 0 };
        bool thread_active { false };
        bool source_closed { false };
        bool stopping { false };
        di::Optional<dius::Thread> thread;
    };

    void input_thread();

    // Publish event. Returns false when the thread should exit because nobody is listening.
    auto publish(InputEvent event) -> bool;
    void publish_closed(bool error);
    auto should_exit_without_receivers() -> bool;

    di::Box<InputSource> m_source;
    BroadcastChannel<BridgeEvent> m_channel;
    di::Synchronized<Lifecycle> m_lifecycle;
};
}
