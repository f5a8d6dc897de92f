#include "vtmux/session_multiplexer.h"

#include "di/container/algorithm/prelude.h"
#include "di/function/overload.h"
#include "di/util/exchange.h"
#include "dius/print.h"
#include "vtmux/input_codec.h"
#include "vtmux/key_event_io.h"

namespace vtmux {
// Size used for the first step of the resize which forces a repaint.
constexpr auto minimal_size = Size { 1, 1 };

auto SessionMultiplexer::create(MultiplexerConfig config, Size const& terminal_size, ProcessSpawner& spawner)
    -> di::Result<di::Box<SessionMultiplexer>> {
    if (config.sessions.empty()) {
        dius::eprintln("At least one session must be configured"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    if (config.sessions.size() > max_sessions) {
        dius::eprintln("Maximum of {} sessions allowed"_sv, max_sessions);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    return di::make_box<SessionMultiplexer>(di::move(config), terminal_size, spawner);
}

SessionMultiplexer::SessionMultiplexer(MultiplexerConfig config, Size const& terminal_size, ProcessSpawner& spawner)
    : m_config(di::move(config)), m_terminal_size(terminal_size), m_spawner(spawner), m_key_binds(make_key_binds()) {
    auto size = session_size();
    for (auto const& session_config : m_config.sessions) {
        m_sessions.push_back(di::make_box<Session>(session_config.clone(), size));
    }
}

SessionMultiplexer::~SessionMultiplexer() {
    if (!m_shut_down) {
        (void) shutdown();
    }
}

auto SessionMultiplexer::session_size() const -> Size {
    auto size = m_terminal_size.rows_shrinked(status_bar_height);
    size.rows = di::max(size.rows, 1_u32);
    size.cols = di::max(size.cols, 1_u32);
    return size;
}

auto SessionMultiplexer::start_all() -> di::Expected<void, SpawnError> {
    for (auto i = 0_usize; i < m_sessions.size(); i++) {
        if (!m_sessions[i]->has_process()) {
            TRY(start(i));
        }
    }
    return {};
}

auto SessionMultiplexer::start(usize index) -> di::Expected<void, SpawnError> {
    if (index >= m_sessions.size()) {
        return {};
    }
    auto& session = *m_sessions[index];

    // Restarting an exited session replaces its process.
    if (session.has_process() && !session.is_running()) {
        session.drop();
    }
    return session.start(m_spawner);
}

auto SessionMultiplexer::switch_to(usize index) -> di::Optional<usize> {
    if (index >= m_sessions.size()) {
        return {};
    }

    auto old_index = di::exchange(m_active_index, index);
    if (old_index == index) {
        return old_index;
    }

    auto& session = *m_sessions[index];
    session.resize_child(minimal_size);
    session.resize_child(session.size());
    m_needs_full_render = true;

    dius::eprintln("Switched from session {} ('{}') to session {} ('{}')"_sv, old_index + 1,
                   m_sessions[old_index]->name(), index + 1, session.name());
    return old_index;
}

auto SessionMultiplexer::poll_all() -> bool {
    auto active_had_output = false;
    for (auto i = 0_usize; i < m_sessions.size(); i++) {
        if (m_sessions[i]->poll() && i == m_active_index) {
            active_had_output = true;
        }
    }
    return active_had_output;
}

void SessionMultiplexer::resize_all(Size const& terminal_size) {
    m_terminal_size = terminal_size;
    auto size = session_size();
    for (auto& session : m_sessions) {
        session->resize(size);
    }
    m_needs_full_render = true;
}

auto SessionMultiplexer::send_input(di::Span<byte const> bytes) -> di::Result<> {
    return active_session().write(bytes);
}

auto SessionMultiplexer::handle_event(InputEvent const& event) -> bool {
    if (auto key_event = di::get_if<KeyEvent>(event)) {
        for (auto const& bind : m_key_binds) {
            if (bind.matches(*key_event)) {
                auto exit_requested = false;
                bind.action.apply({
                    .key_event = *key_event,
                    .multiplexer = *this,
                    .exit_requested = exit_requested,
                });
                return exit_requested;
            }
        }
    }

    if (auto resize_event = di::get_if<ResizeEvent>(event)) {
        resize_all(resize_event->size());
        return false;
    }

    forward_event(event);
    return false;
}

void SessionMultiplexer::forward_event(InputEvent const& event) {
    auto bytes = di::visit(di::overload(
                               [](KeyEvent const& key_event) -> di::Optional<di::String> {
                                   return serialize_legacy_key_event(key_event);
                               },
                               [&](auto const&) -> di::Optional<di::String> {
                                   return generate_input_event(event);
                               }),
                           event);
    if (!bytes) {
        return;
    }
    if (auto result = send_input(di::as_bytes(bytes->span())); !result) {
        dius::eprintln("Failed to write to session '{}': {}"_sv, active_session().name(), result.error().message());
    }
}

auto SessionMultiplexer::shutdown() -> bool {
    m_shut_down = true;

    // Closing alone doesn't terminate the child, so kill first.
    for (auto& session : m_sessions) {
        session->kill();
    }
    for (auto& session : m_sessions) {
        session->close();
    }

    auto deadline = dius::SteadyClock::now() + m_config.shutdown_timeout;
    auto finished = true;
    for (auto& session : m_sessions) {
        if (!session->wait_until(deadline)) {
            dius::eprintln("Session '{}' did not exit before the shutdown timeout"_sv, session->name());
            finished = false;
        }
    }
    if (!finished) {
        return false;
    }

    for (auto& session : m_sessions) {
        session->drop();
    }
    return true;
}

auto SessionMultiplexer::status_line() const -> di::String {
    auto entries = di::Vector<StatusBarEntry> {};
    for (auto const& session : m_sessions) {
        entries.push_back({ session->name(), session->is_running() });
    }
    return status_bar_text(entries.span(), m_active_index, m_terminal_size.cols);
}

auto SessionMultiplexer::take_needs_full_render() -> bool {
    return di::exchange(m_needs_full_render, false);
}

auto SessionMultiplexer::run(InputBridge::Receiver& input, Display& display) -> di::Result<> {
    auto now = dius::SteadyClock::now();
    auto next_poll = now;
    auto next_status = now;

    take_needs_full_render();
    display.invalidate();
    display.render_active_session(*this);
    display.render_status_bar(*this);
    for (;;) {
        now = dius::SteadyClock::now();

        if (next_poll <= now) {
            if (poll_all()) {
                display.render_active_session(*this);
            }
            while (next_poll <= now) {
                next_poll += m_config.poll_interval;
            }
        }

        if (next_status <= now) {
            display.render_status_bar(*this);
            while (next_status <= now) {
                next_status += m_config.status_interval;
            }
        }

        // Block until input arrives or the next tick is due, then drain whatever else is queued.
        auto deadline = di::min(next_poll, next_status);
        for (auto event = input.receive_until(deadline); event; event = input.try_receive()) {
            if (auto closed = di::get_if<SourceClosed>(event->value)) {
                dius::eprintln("Input closed ({}), exiting"_sv, closed->error ? "error"_sv : "end of file"_sv);
                return {};
            }
            if (auto input_event = di::get_if<InputEvent>(event->value)) {
                if (handle_event(*input_event)) {
                    dius::eprintln("Exit requested"_sv);
                    return {};
                }
            }
        }
        if (input.is_closed()) {
            return {};
        }

        if (take_needs_full_render()) {
            display.invalidate();
            display.render_active_session(*this);
            display.render_status_bar(*this);
        }
    }
}
}
