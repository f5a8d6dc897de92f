#include "dius/test/prelude.h"
#include "dius/thread.h"
#include "vtmux/broadcast_channel.h"
#include "vtmux/input_bridge.h"
#include "vtmux/key_event.h"
#include "vtmux/process.h"
#include "vtmux/session_multiplexer.h"

namespace session_multiplexer {
using namespace vtmux;

// Everything a fake child saw. Outlives the process so tests can inspect dropped children.
struct ProcessLog {
    di::String name;
    di::Vector<Size> resizes;
    di::Vector<byte> written;
    di::Vector<byte> output;
    bool exited { false };
    bool exits_when_killed { true };
};

class FakeProcess final : public ChildProcess {
public:
    FakeProcess(ProcessLog& log, di::Vector<di::String>& calls) : m_log(log), m_calls(calls) {}
    ~FakeProcess() override { record("drop"_sv); }

    auto take_output() -> di::Vector<byte> override { return di::exchange(m_log.output, di::Vector<byte> {}); }

    auto write(di::Span<byte const> bytes) -> di::Result<> override {
        for (auto b : bytes) {
            m_log.written.push_back(b);
        }
        return {};
    }

    auto resize(Size const& size) -> di::Result<> override {
        m_log.resizes.push_back(size);
        return {};
    }

    auto kill() -> di::Result<> override {
        record("kill"_sv);
        if (m_log.exits_when_killed) {
            m_log.exited = true;
        }
        return {};
    }

    void close() override { record("close"_sv); }

    auto has_exited() -> bool override { return m_log.exited; }

    auto wait_until(dius::SteadyClock::TimePoint) -> bool override {
        record("wait"_sv);
        return m_log.exited;
    }

private:
    void record(di::StringView action) { m_calls.push_back(*di::present("{} {}"_sv, action, m_log.name)); }

    ProcessLog& m_log;
    di::Vector<di::String>& m_calls;
};

class FakeSpawner final : public ProcessSpawner {
public:
    auto spawn(ProcessCommand const& command, Size const& size) -> di::Result<di::Box<ChildProcess>> override {
        auto program = command.display();
        if (program.starts_with("missing"_sv)) {
            return di::Unexpected(di::BasicError::NoSuchFileOrDirectory);
        }

        auto log = di::make_box<ProcessLog>();
        log->name = di::move(program);
        log->resizes.push_back(size);
        auto& result = *log;
        logs.push_back(di::move(log));
        return di::make_box<FakeProcess>(result, calls);
    }

    auto log(usize index) -> ProcessLog& { return *logs[index]; }

    di::Vector<di::Box<ProcessLog>> logs;
    di::Vector<di::String> calls;
};

class FakeDisplay final : public Display {
public:
    void render_active_session(SessionMultiplexer const& multiplexer) override {
        session_renders++;
        last_rendered = multiplexer.active_index();
    }
    void render_status_bar(SessionMultiplexer const&) override { status_renders++; }
    void invalidate() override { invalidations++; }

    usize session_renders { 0 };
    usize status_renders { 0 };
    usize invalidations { 0 };
    usize last_rendered { 0 };
};

static auto make_config(auto... commands) -> MultiplexerConfig {
    auto config = MultiplexerConfig {};
    (
        [&](di::TransparentStringView command) {
            if (auto session = parse_session_config(command)) {
                config.sessions.push_back(di::move(session).value());
            }
        }(commands),
        ...);
    config.shutdown_timeout = di::Milliseconds(10);
    return config;
}

static auto bytes_of(di::StringView text) -> di::Vector<byte> {
    auto result = di::Vector<byte> {};
    for (auto b : di::as_bytes(text.span())) {
        result.push_back(b);
    }
    return result;
}

constexpr auto terminal_size = Size { 25, 80 };

static void create() {
    auto spawner = FakeSpawner {};

    auto none = SessionMultiplexer::create(MultiplexerConfig {}, terminal_size, spawner);
    ASSERT(!none);

    auto too_many = SessionMultiplexer::create(
        make_config("a"_tsv, "b"_tsv, "c"_tsv, "d"_tsv, "e"_tsv, "f"_tsv, "g"_tsv, "h"_tsv, "i"_tsv, "j"_tsv),
        terminal_size, spawner);
    ASSERT(!too_many);

    auto result = SessionMultiplexer::create(make_config("shell=bash"_tsv, "/usr/bin/htop -d 5"_tsv),
                                             terminal_size, spawner);
    ASSERT(result);
    auto& multiplexer = **result;
    ASSERT_EQ(multiplexer.sessions().size(), 2u);
    ASSERT_EQ(multiplexer.session(0).name(), "shell"_sv);
    ASSERT_EQ(multiplexer.session(1).name(), "htop"_sv);
    ASSERT_EQ(multiplexer.active_index(), 0u);

    // One row is left for the status bar.
    ASSERT_EQ(multiplexer.session_size(), (Size { 24, 80 }));
    ASSERT_EQ(multiplexer.session(1).size(), (Size { 24, 80 }));

    // Nothing is spawned until the sessions are started.
    ASSERT(spawner.logs.empty());
}

static void start_all() {
    auto spawner = FakeSpawner {};
    auto multiplexer =
        SessionMultiplexer::create(make_config("one=bash"_tsv, "two=top"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);

    ASSERT((*multiplexer)->start_all());
    ASSERT_EQ(spawner.logs.size(), 2u);
    ASSERT_EQ(spawner.log(0).name, "bash"_sv);
    ASSERT_EQ(spawner.log(1).resizes[0], (Size { 24, 80 }));
    ASSERT((*multiplexer)->session(0).is_running());
    ASSERT((*multiplexer)->session(1).is_running());

    // Starting again leaves running sessions alone.
    ASSERT((*multiplexer)->start_all());
    ASSERT_EQ(spawner.logs.size(), 2u);
}

static void start_all_fails_fast() {
    auto spawner = FakeSpawner {};
    auto multiplexer = SessionMultiplexer::create(
        make_config("one=bash"_tsv, "bad=missing-program --flag"_tsv, "three=top"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);

    auto result = (*multiplexer)->start_all();
    ASSERT(!result);
    ASSERT_EQ(result.error().session_name, "bad"_sv);
    ASSERT_EQ(result.error().command, "missing-program --flag"_sv);

    auto message = result.error().message();
    ASSERT(message.starts_with("Failed to start process 'bad' (missing-program --flag): "_sv));
    ASSERT(message.ends_with(". Please ensure it's installed and in PATH."_sv));

    // The session after the failure was never started.
    ASSERT_EQ(spawner.logs.size(), 1u);
    ASSERT((*multiplexer)->session(0).is_running());
    ASSERT(!(*multiplexer)->session(1).has_process());
    ASSERT(!(*multiplexer)->session(2).has_process());
}

static void switch_forces_repaint() {
    auto spawner = FakeSpawner {};
    auto multiplexer = SessionMultiplexer::create(make_config("a=vim"_tsv, "b=less"_tsv, "c=top"_tsv),
                                                  terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());
    ASSERT(m.take_needs_full_render());
    ASSERT(!m.take_needs_full_render());

    ASSERT(m.switch_to(1) == 0u);
    ASSERT_EQ(m.active_index(), 1u);
    ASSERT(m.take_needs_full_render());

    // The new session is resized to a minimal size and back. The others are untouched.
    auto expected = di::Vector<Size> {};
    expected.push_back(Size { 24, 80 });
    expected.push_back(Size { 1, 1 });
    expected.push_back(Size { 24, 80 });
    ASSERT(spawner.log(1).resizes == expected);
    ASSERT_EQ(spawner.log(0).resizes.size(), 1u);
    ASSERT_EQ(spawner.log(2).resizes.size(), 1u);

    // Switching to the active session does nothing.
    ASSERT(m.switch_to(1) == 1u);
    ASSERT_EQ(spawner.log(1).resizes.size(), 3u);
    ASSERT(!m.take_needs_full_render());

    ASSERT(!m.switch_to(3));
    ASSERT_EQ(m.active_index(), 1u);
}

static void poll_all() {
    auto spawner = FakeSpawner {};
    auto multiplexer =
        SessionMultiplexer::create(make_config("a=bash"_tsv, "b=bash"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    // Background sessions are drained too, but only active output needs a render.
    spawner.log(1).output = bytes_of("background"_sv);
    ASSERT(!m.poll_all());
    ASSERT(m.session(1).screen().row_text(0).starts_with("background"_sv));
    ASSERT(spawner.log(1).output.empty());

    spawner.log(0).output = bytes_of("hello\r\nworld"_sv);
    ASSERT(m.poll_all());
    ASSERT(m.session(0).screen().row_text(0).starts_with("hello"_sv));
    ASSERT(m.session(0).screen().row_text(1).starts_with("world"_sv));
    ASSERT(!m.poll_all());

    // Replies to queries are written back to the child.
    spawner.log(0).output = bytes_of("\033[6n"_sv);
    ASSERT(m.poll_all());
    ASSERT(spawner.log(0).written == bytes_of("\033[2;6R"_sv));

    spawner.log(1).exited = true;
    (void) m.poll_all();
    ASSERT(!m.session(1).is_running());
    ASSERT(m.session(0).is_running());
}

static void handle_events() {
    auto spawner = FakeSpawner {};
    auto multiplexer =
        SessionMultiplexer::create(make_config("a=bash"_tsv, "b=bash"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    ASSERT(!m.handle_event(KeyEvent::character(U'l')));
    ASSERT(!m.handle_event(KeyEvent::key_down(Key::Enter)));
    ASSERT(!m.handle_event(KeyEvent::key_down(Key::Up)));
    ASSERT(spawner.log(0).written == bytes_of("l\r\033[A"_sv));

    // F2 switches to the second session, and isn't forwarded.
    ASSERT(!m.handle_event(KeyEvent::key_down(Key::F2)));
    ASSERT_EQ(m.active_index(), 1u);
    ASSERT(!m.handle_event(KeyEvent::character(U'x')));
    ASSERT(spawner.log(1).written == bytes_of("x"_sv));

    // F9 has no session here.
    ASSERT(!m.handle_event(KeyEvent::key_down(Key::F9)));
    ASSERT_EQ(m.active_index(), 1u);

    ASSERT(!m.handle_event(PasteEvent("ls"_s)));
    ASSERT(spawner.log(1).written == bytes_of("x\033[200~ls\033[201~"_sv));

    ASSERT(!m.handle_event(ResizeEvent { .cols = 100, .rows = 31 }));
    ASSERT_EQ(m.terminal_size(), (Size { 31, 100 }));
    ASSERT_EQ(m.session(0).size(), (Size { 30, 100 }));
    ASSERT_EQ(*spawner.log(0).resizes.back(), (Size { 30, 100 }));

    ASSERT(m.handle_event(KeyEvent::character(U'q', Modifiers::Control)));
}

static void status_line() {
    auto spawner = FakeSpawner {};
    auto multiplexer =
        SessionMultiplexer::create(make_config("a=bash"_tsv, "b=top"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    ASSERT_EQ(m.status_line(), " [1:a]  2:b   F1-F2: Switch | Ctrl+Q: Quit"_sv);

    spawner.log(0).exited = true;
    (void) m.poll_all();
    (void) m.switch_to(1);
    ASSERT_EQ(m.status_line(), " 1:a*  [2:b]   F1-F2: Switch | Ctrl+Q: Quit"_sv);
}

static void shutdown() {
    auto spawner = FakeSpawner {};
    auto multiplexer =
        SessionMultiplexer::create(make_config("a=bash"_tsv, "b=top"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    ASSERT(m.shutdown());

    // Every child is killed before any is closed, and dropped only after all exited.
    auto expected = di::Array {
        "kill bash"_sv, "kill top"_sv, "close bash"_sv, "close top"_sv,
        "wait bash"_sv, "wait top"_sv, "drop bash"_sv,  "drop top"_sv,
    };
    ASSERT_EQ(spawner.calls.size(), expected.size());
    for (auto i = 0_usize; i < expected.size(); i++) {
        ASSERT_EQ(spawner.calls[i], expected[i]);
    }
    ASSERT(!m.session(0).has_process());
    ASSERT(!m.session(1).has_process());
}

static void shutdown_timeout() {
    auto spawner = FakeSpawner {};
    auto multiplexer = SessionMultiplexer::create(make_config("stubborn"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());
    spawner.log(0).exits_when_killed = false;

    ASSERT(!m.shutdown());
    ASSERT(m.session(0).has_process());
}

static void run_until_quit() {
    auto spawner = FakeSpawner {};
    auto multiplexer =
        SessionMultiplexer::create(make_config("a=bash"_tsv, "b=top"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    auto channel = BroadcastChannel<BridgeEvent> {};
    auto receiver = channel.subscribe();
    ASSERT(channel.publish(BridgeEvent { InputEvent(KeyEvent::character(U'a')) }));
    ASSERT(channel.publish(BridgeEvent { InputEvent(KeyEvent::key_down(Key::F2)) }));
    ASSERT(channel.publish(BridgeEvent { InputEvent(KeyEvent::character(U'q', Modifiers::Control)) }));
    ASSERT(channel.publish(BridgeEvent { InputEvent(KeyEvent::character(U'b')) }));

    auto display = FakeDisplay {};
    ASSERT(m.run(receiver, display));

    ASSERT(spawner.log(0).written == bytes_of("a"_sv));
    ASSERT(spawner.log(1).written.empty());
    ASSERT_EQ(m.active_index(), 1u);
    ASSERT(display.session_renders >= 1u);
    ASSERT(display.status_renders >= 1u);
    ASSERT(display.invalidations >= 1u);
    ASSERT_EQ(display.last_rendered, 0u);

    // Events after the quit are left queued.
    ASSERT(receiver.try_receive().has_value());
}

static void run_until_input_closed() {
    auto spawner = FakeSpawner {};
    auto multiplexer = SessionMultiplexer::create(make_config("a=bash"_tsv), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    auto channel = BroadcastChannel<BridgeEvent> {};
    auto receiver = channel.subscribe();
    ASSERT(channel.publish(BridgeEvent { SourceClosed { false } }));

    auto display = FakeDisplay {};
    ASSERT(m.run(receiver, display));
    ASSERT_EQ(display.invalidations, 1u);

    auto closed_receiver = channel.subscribe(true);
    ASSERT(m.run(closed_receiver, display));
}

static void run_wakes_on_input() {
    auto spawner = FakeSpawner {};
    auto config = make_config("a=bash"_tsv);

    // With the ticks a minute apart, only input can end the wait in time.
    config.poll_interval = di::Seconds(60);
    config.status_interval = di::Seconds(60);
    auto multiplexer = SessionMultiplexer::create(di::move(config), terminal_size, spawner);
    ASSERT(multiplexer);
    auto& m = **multiplexer;
    ASSERT(m.start_all());

    auto channel = BroadcastChannel<BridgeEvent> {};
    auto receiver = channel.subscribe();
    auto thread = dius::Thread::create([&] {
        dius::this_thread::sleep_until(dius::SteadyClock::now() + di::Milliseconds(20));
        (void) channel.publish(BridgeEvent { InputEvent(KeyEvent::character(U'x')) });
        (void) channel.publish(BridgeEvent { InputEvent(KeyEvent::character(U'q', Modifiers::Control)) });
    });
    ASSERT(thread);

    auto display = FakeDisplay {};
    auto start = dius::SteadyClock::now();
    ASSERT(m.run(receiver, display));
    ASSERT(dius::SteadyClock::now() < start + di::Seconds(30));
    ASSERT(thread->join());
    ASSERT(spawner.log(0).written == bytes_of("x"_sv));
}

TEST(session_multiplexer, create)
TEST(session_multiplexer, start_all)
TEST(session_multiplexer, start_all_fails_fast)
TEST(session_multiplexer, switch_forces_repaint)
TEST(session_multiplexer, poll_all)
TEST(session_multiplexer, handle_events)
TEST(session_multiplexer, status_line)
TEST(session_multiplexer, shutdown)
TEST(session_multiplexer, shutdown_timeout)
TEST(session_multiplexer, run_until_quit)
TEST(session_multiplexer, run_until_input_closed)
TEST(session_multiplexer, run_wakes_on_input)
}
