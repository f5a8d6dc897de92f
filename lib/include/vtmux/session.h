#pragma once

#include "di/container/string/string.h"
#include "di/vocab/error/result.h"
#include "di/vocab/expected/prelude.h"
#include "di/vocab/pointer/box.h"
#include "vtmux/output_decoder.h"
#include "vtmux/process.h"
#include "vtmux/size.h"
#include "vtmux/terminal/screen.h"

namespace vtmux {
/// @brief Definition of a session, before it is started.
struct SessionConfig {
    di::String name;
    ProcessCommand command;

    auto clone() const -> SessionConfig { return { name.clone(), command.clone() }; }
};

// Parse a session from the command line. "name=cmd args" names the session,
// otherwise it is named after the program. Arguments are separated by spaces.
auto parse_session_config(di::TransparentStringView text) -> di::Result<SessionConfig>;

/// @brief A child process failed to start.
struct SpawnError {
    di::String session_name;
    di::String command;
    di::String reason;

    auto message() const -> di::String;
};

/// @brief One virtual terminal: a child process, its screen and the decoder driving it
///
/// The screen exists from construction, and the child process from start().
/// Sessions are not movable, because the decoder refers to the screen.
class Session {
public:
    explicit Session(SessionConfig config, Size const& size);

    Session(Session const&) = delete;
    auto operator=(Session const&) -> Session& = delete;

    auto start(ProcessSpawner& spawner) -> di::Expected<void, SpawnError>;

    // Drain output from the child into the screen. Returns whether any output was
    // decoded. Detects the child exiting, which is logged once.
    auto poll() -> bool;

    auto write(di::Span<byte const> bytes) -> di::Result<>;
    void resize(Size const& size);

    // Send only a size change to the child, leaving the screen alone.
    void resize_child(Size const& size);

    // Shutdown steps, which are called for every session in this order.
    void kill();
    void close();
    auto wait_until(dius::SteadyClock::TimePoint deadline) -> bool;
    void drop();

    auto name() const -> di::StringView { return m_config.name; }
    auto command() const -> ProcessCommand const& { return m_config.command; }
    auto is_running() const -> bool { return m_running; }
    auto has_process() const -> bool { return !!m_process; }
    auto title() const -> di::StringView { return m_decoder.title(); }
    auto progress() const -> di::Optional<terminal::OSCProgress> const& { return m_decoder.progress(); }
    auto screen() const -> terminal::Screen const& { return *m_screen; }
    auto size() const -> Size const& { return m_size; }

private:
    SessionConfig m_config;
    Size m_size;
    di::Box<terminal::Screen> m_screen;
    OutputDecoder m_decoder;
    di::Box<ChildProcess> m_process;
    bool m_running { false };
};
}
