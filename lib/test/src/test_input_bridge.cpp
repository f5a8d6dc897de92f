#include "di/container/queue/queue.h"
#include "di/sync/synchronized.h"
#include "dius/condition_variable.h"
#include "dius/test/prelude.h"
#include "vtmux/input_bridge.h"
#include "vtmux/input_source.h"
#include "vtmux/key_event.h"

namespace input_bridge {
using namespace vtmux;

// Input fed by the test, read by the bridge's thread.
struct FakeInput {
    struct State {
        di::Queue<di::Vector<byte>> chunks;
        di::Optional<Size> resize;
        bool end_of_file { false };
        bool error { false };
        bool woken { false };
        bool input_on_wake { false };
    };

    void push(di::StringView text) {
        update([&](State& state) {
            auto chunk = di::Vector<byte> {};
            for (auto b : di::as_bytes(text.span())) {
                chunk.push_back(b);
            }
            state.chunks.push(di::move(chunk));
        });
    }

    template<typename F>
    void update(F&& function) {
        state.with_lock([&](State& value) {
            function(value);
        });
        condition.notify_all();
    }

    di::Synchronized<State> state;
    dius::ConditionVariable condition;
};

class FakeInputSource final : public InputSource {
public:
    explicit FakeInputSource(FakeInput& input) : m_input(input) {}

    auto wait_and_read(di::Span<byte> buffer) -> di::Result<InputReady> override {
        auto lock = di::UniqueLock(m_input.state.get_lock());

        // SAFETY: we acquired the lock manually above.
        auto& state = m_input.state.get_assuming_no_concurrent_accesses();
        m_input.condition.wait(lock, [&] {
            return !state.chunks.empty() || state.resize || state.end_of_file || state.error || state.woken;
        });

        if (state.error) {
            return di::Unexpected(di::BasicError::InvalidArgument);
        }

        auto ready = InputReady {};
        ready.woken = di::exchange(state.woken, false);
        ready.resize = di::exchange(state.resize, di::Optional<Size> {});
        if (auto chunk = state.chunks.pop()) {
            for (auto b : *chunk) {
                buffer[ready.bytes_read++] = b;
            }
        } else if (state.end_of_file) {
            ready.end_of_file = true;
        }
        return ready;
    }

    void wake() override {
        m_input.update([](FakeInput::State& state) {
            state.woken = true;
            if (state.input_on_wake) {
                auto chunk = di::Vector<byte> {};
                chunk.push_back(byte('x'));
                state.chunks.push(di::move(chunk));
            }
        });
    }

private:
    FakeInput& m_input;
};

static auto key_of(di::Optional<BridgeEvent> const& event) -> di::Optional<KeyEvent> {
    if (!event) {
        return {};
    }
    auto input = di::get_if<InputEvent>(event->value);
    if (!input) {
        return {};
    }
    auto key = di::get_if<KeyEvent>(*input);
    if (!key) {
        return {};
    }
    return *key;
}

static auto closed_of(di::Optional<BridgeEvent> const& event) -> di::Optional<SourceClosed> {
    if (!event) {
        return {};
    }
    auto closed = di::get_if<SourceClosed>(event->value);
    if (!closed) {
        return {};
    }
    return *closed;
}

static void not_started() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));

    ASSERT_EQ(bridge.state(), InputBridgeState::NotStarted);
    ASSERT_EQ(bridge.generation(), 0u);
    ASSERT_EQ(bridge.receiver_count(), 0u);
}

static void broadcast() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));

    auto a = bridge.subscribe();
    ASSERT(a);
    auto b = bridge.subscribe();
    ASSERT(b);
    ASSERT_EQ(bridge.state(), InputBridgeState::Running);
    ASSERT_EQ(bridge.generation(), 1u);
    ASSERT_EQ(bridge.receiver_count(), 2u);

    input.push("a\033[A"_sv);
    input.push("\033[1;"_sv);
    input.push("2Bz"_sv);

    auto expected = di::Array {
        KeyEvent::character(U'a'),
        KeyEvent::key_down(Key::Up),
        KeyEvent::key_down(Key::Down, Modifiers::Shift),
        KeyEvent::character(U'z'),
    };
    for (auto* receiver : di::Array { &*a, &*b }) {
        for (auto const& key : expected) {
            auto event = key_of(receiver->receive());
            ASSERT(event.has_value());
            ASSERT_EQ(*event, key);
        }
    }
}

static void resize() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));
    auto receiver = bridge.subscribe();
    ASSERT(receiver);

    input.update([](FakeInput::State& state) {
        state.resize = Size { 40, 120 };
    });

    auto event = receiver->receive();
    ASSERT(event.has_value());
    auto input_event = di::get_if<InputEvent>(event->value);
    ASSERT(input_event.has_value());
    auto size = di::get_if<ResizeEvent>(*input_event);
    ASSERT(size.has_value());
    ASSERT_EQ(*size, (ResizeEvent { .cols = 120, .rows = 40 }));
}

static void terminates_without_receivers() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));

    {
        auto receiver = bridge.subscribe();
        ASSERT(receiver);
        ASSERT_EQ(bridge.state(), InputBridgeState::Running);
    }

    // The thread notices nobody is listening before its next read, or when publishing.
    input.push("x"_sv);
    bridge.join_thread();
    ASSERT_EQ(bridge.state(), InputBridgeState::Terminated);
    ASSERT_EQ(bridge.generation(), 1u);

    // Depending on timing, the thread may have exited without reading "x".
    input.update([](FakeInput::State& state) {
        while (state.chunks.pop()) {}
    });

    // Subscribing again starts a new thread.
    auto receiver = bridge.subscribe();
    ASSERT(receiver);
    ASSERT_EQ(bridge.state(), InputBridgeState::Running);
    ASSERT_EQ(bridge.generation(), 2u);

    input.push("y"_sv);
    ASSERT(key_of(receiver->receive()) == KeyEvent::character(U'y'));
}

static void end_of_file() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));
    auto receiver = bridge.subscribe();
    ASSERT(receiver);

    input.push("q"_sv);
    input.update([](FakeInput::State& state) {
        state.end_of_file = true;
    });

    ASSERT(key_of(receiver->receive()) == KeyEvent::character(U'q'));
    auto closed = closed_of(receiver->receive());
    ASSERT(closed.has_value());
    ASSERT(!closed->error);
    ASSERT(!receiver->receive());
    ASSERT(receiver->is_closed());

    bridge.join_thread();
    ASSERT_EQ(bridge.state(), InputBridgeState::Terminated);

    // Nothing more can be read, so new receivers start out closed.
    auto late = bridge.subscribe();
    ASSERT(late);
    ASSERT(late->is_closed());
    ASSERT_EQ(bridge.generation(), 1u);
}

static void read_error() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));
    auto receiver = bridge.subscribe();
    ASSERT(receiver);

    input.update([](FakeInput::State& state) {
        state.error = true;
    });

    auto closed = closed_of(receiver->receive());
    ASSERT(closed.has_value());
    ASSERT(closed->error);
    ASSERT(!receiver->receive());
    bridge.join_thread();
    ASSERT_EQ(bridge.state(), InputBridgeState::Terminated);
}

static void destroy_while_running() {
    auto input = FakeInput {};
    {
        auto bridge = InputBridge(di::make_box<FakeInputSource>(input));
        auto receiver = bridge.subscribe();
        ASSERT(receiver);
        ASSERT_EQ(bridge.state(), InputBridgeState::Running);

        input.push("a"_sv);
        ASSERT(key_of(receiver->receive()) == KeyEvent::character(U'a'));
    }

    // The destructor woke the thread and joined it, so nothing reads the source anymore.
    input.push("b"_sv);
    auto still_queued = input.state.with_lock([](FakeInput::State& state) {
        return !state.chunks.empty();
    });
    ASSERT(still_queued);
}

static void stop_with_pending_input() {
    auto input = FakeInput {};
    auto bridge = InputBridge(di::make_box<FakeInputSource>(input));
    auto receiver = bridge.subscribe();
    ASSERT(receiver);

    // The wake-up arrives in the same read as more input, while a receiver is still listening.
    input.update([](FakeInput::State& state) {
        state.input_on_wake = true;
    });
    bridge.stop();

    ASSERT_EQ(bridge.state(), InputBridgeState::Terminated);
    ASSERT(!receiver->receive());
    ASSERT(receiver->is_closed());

    // Stopping is final.
    auto late = bridge.subscribe();
    ASSERT(late);
    ASSERT(late->is_closed());
    ASSERT_EQ(bridge.generation(), 1u);
}

TEST(input_bridge, not_started)
TEST(input_bridge, broadcast)
TEST(input_bridge, resize)
TEST(input_bridge, terminates_without_receivers)
TEST(input_bridge, end_of_file)
TEST(input_bridge, read_error)
TEST(input_bridge, destroy_while_running)
TEST(input_bridge, stop_with_pending_input)
}
