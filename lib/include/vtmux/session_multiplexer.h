#pragma once

#include "di/container/vector/vector.h"
#include "di/vocab/error/result.h"
#include "di/vocab/expected/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/pointer/box.h"
#include "dius/steady_clock.h"
#include "vtmux/input_bridge.h"
#include "vtmux/input_event.h"
#include "vtmux/key_bind.h"
#include "vtmux/process.h"
#include "vtmux/session.h"
#include "vtmux/size.h"
#include "vtmux/status_bar.h"

namespace vtmux {
struct MultiplexerConfig {
    di::Vector<SessionConfig> sessions;
    dius::SteadyClock::Duration poll_interval { di::Milliseconds(10) };
    dius::SteadyClock::Duration status_interval { di::Milliseconds(500) };
    dius::SteadyClock::Duration shutdown_timeout { di::Seconds(1) };
};

/// @brief Paints the multiplexer to the physical terminal.
class Display {
public:
    virtual ~Display() = default;

    virtual void render_active_session(SessionMultiplexer const& multiplexer) = 0;
    virtual void render_status_bar(SessionMultiplexer const& multiplexer) = 0;

    // Discard anything cached about the previous frame.
    virtual void invalidate() = 0;
};

/// @brief Drives several sessions, of which one is visible
///
/// Every session is polled, not just the active one, so background children
/// never block on a full pseudo terminal. The physical terminal is shared by
/// the sessions and a one row status bar at the bottom, so sessions are sized
/// one row shorter than the terminal.
class SessionMultiplexer {
public:
    constexpr static auto max_sessions = 9_usize;

    // Fails if no session is configured, or more than max_sessions are.
    static auto create(MultiplexerConfig config, Size const& terminal_size, ProcessSpawner& spawner)
        -> di::Result<di::Box<SessionMultiplexer>>;

    explicit SessionMultiplexer(MultiplexerConfig config, Size const& terminal_size, ProcessSpawner& spawner);
    ~SessionMultiplexer();

    // Start every session which isn't running. Stops at the first failure.
    auto start_all() -> di::Expected<void, SpawnError>;

    // Start a single session. Failing is not fatal to the other sessions.
    auto start(usize index) -> di::Expected<void, SpawnError>;

    // Make session index visible. The newly active child is resized to a
    // minimal size and back, which makes full screen programs repaint.
    // Returns the previously active index, or none if index is out of range.
    auto switch_to(usize index) -> di::Optional<usize>;

    // Drain output from every session. Returns whether the active session had output.
    auto poll_all() -> bool;

    void resize_all(Size const& terminal_size);

    // Write bytes to the active session.
    auto send_input(di::Span<byte const> bytes) -> di::Result<>;

    // Run key bindings, or forward the event to the active session. Returns
    // true when exiting was requested.
    auto handle_event(InputEvent const& event) -> bool;

    // Kill every child, then close their output, then wait up to the shutdown
    // timeout for them to exit, and finally drop them. Returns false if the
    // timeout passed, in which case the caller should exit immediately.
    auto shutdown() -> bool;

    // Loop until exit is requested or the input closes. Output is polled and
    // the status bar refreshed on fixed intervals, while input is handled as
    // it arrives.
    auto run(InputBridge::Receiver& input, Display& display) -> di::Result<>;

    auto sessions() const -> di::Vector<di::Box<Session>> const& { return m_sessions; }
    auto session(usize index) -> Session& { return *m_sessions[index]; }
    auto session(usize index) const -> Session const& { return *m_sessions[index]; }
    auto active_index() const -> usize { return m_active_index; }
    auto active_session() const -> Session const& { return *m_sessions[m_active_index]; }
    auto active_session() -> Session& { return *m_sessions[m_active_index]; }

    auto terminal_size() const -> Size const& { return m_terminal_size; }
    auto session_size() const -> Size;

    auto status_line() const -> di::String;
    auto config() const -> MultiplexerConfig const& { return m_config; }

    // Set whenever the visible session changed since the last call.
    auto take_needs_full_render() -> bool;

private:
    void forward_event(InputEvent const& event);

    MultiplexerConfig m_config;
    Size m_terminal_size;
    ProcessSpawner& m_spawner;
    di::Vector<di::Box<Session>> m_sessions;
    di::Vector<KeyBind> m_key_binds;
    usize m_active_index { 0 };
    bool m_needs_full_render { true };
    bool m_shut_down { false };
};
}
