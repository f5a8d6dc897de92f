#include "vtmux/session.h"

#include "di/format/prelude.h"
#include "di/util/exchange.h"
#include "dius/print.h"
#include "vtmux/utf8_stream_decoder.h"

namespace vtmux {
static auto decode_name(di::TransparentString const& text) -> di::String {
    auto decoder = Utf8StreamDecoder {};
    auto result = di::String {};
    for (auto code_unit : text) {
        decoder.feed(result, byte(code_unit));
    }
    for (auto code_point : decoder.flush()) {
        result.push_back(code_point);
    }
    return result;
}

auto parse_session_config(di::TransparentStringView text) -> di::Result<SessionConfig> {
    auto argv = di::Vector<di::TransparentString> {};
    auto name = di::Optional<di::TransparentString> {};
    auto current = di::TransparentString {};
    auto flush_argument = [&] {
        if (!current.empty()) {
            argv.push_back(di::exchange(current, di::TransparentString {}));
        }
    };

    for (auto code_unit : text) {
        if (code_unit == ' ' || code_unit == '\t') {
            flush_argument();
            continue;
        }
        // Only the first word may carry a name.
        if (code_unit == '=' && !name && argv.empty() && !current.empty()) {
            name = di::exchange(current, di::TransparentString {});
            continue;
        }
        current.push_back(code_unit);
    }
    flush_argument();

    if (argv.empty()) {
        dius::eprintln("Session command is empty"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto display_name = [&] -> di::String {
        if (name) {
            return decode_name(*name);
        }
        // Strip any leading directories from the program.
        auto const& program = argv[0];
        auto start = 0_usize;
        auto index = 0_usize;
        for (auto code_unit : program) {
            index++;
            if (code_unit == '/') {
                start = index;
            }
        }
        auto base = di::TransparentString {};
        index = 0;
        for (auto code_unit : program) {
            if (index++ >= start) {
                base.push_back(code_unit);
            }
        }
        return decode_name(base.empty() ? program : base);
    }();

    return SessionConfig { di::move(display_name), ProcessCommand { di::move(argv) } };
}

auto SpawnError::message() const -> di::String {
    return *di::present("Failed to start process '{}' ({}): {}. Please ensure it's installed and in PATH."_sv,
                        session_name, command, reason);
}

Session::Session(SessionConfig config, Size const& size)
    : m_config(di::move(config))
    , m_size(size)
    , m_screen(di::make_box<terminal::Screen>(size))
    , m_decoder(*m_screen) {}

auto Session::start(ProcessSpawner& spawner) -> di::Expected<void, SpawnError> {
    if (m_running) {
        return {};
    }

    dius::eprintln("Starting session '{}' ({})"_sv, name(), m_config.command.display());
    auto process = spawner.spawn(m_config.command, m_size);
    if (!process) {
        auto error = SpawnError { m_config.name.clone(), m_config.command.display(),
                                  *di::present("{}"_sv, process.error().message()) };
        dius::eprintln("{}"_sv, error.message());
        return di::Unexpected(di::move(error));
    }

    m_process = di::move(process).value();
    m_running = true;
    return {};
}

auto Session::poll() -> bool {
    if (!m_process) {
        return false;
    }

    // Check for exit before reading, so output written just before exiting is kept.
    auto exited = m_process->has_exited();
    auto output = m_process->take_output();
    auto had_output = !output.empty();
    if (had_output) {
        m_decoder.feed(output.span());

        auto replies = m_decoder.take_replies();
        if (!replies.empty()) {
            if (auto result = m_process->write(replies.span()); !result) {
                dius::eprintln("Failed to reply to session '{}': {}"_sv, name(), result.error().message());
            }
        }
        for (auto const& event : m_decoder.take_events()) {
            if (auto title = di::get_if<TitleChange>(event)) {
                dius::eprintln("Session '{}' set title: {}"_sv, name(), title->title);
            }
        }
    }

    if (exited && m_running) {
        dius::eprintln("Session '{}' exited"_sv, name());
        m_running = false;
    }
    return had_output;
}

auto Session::write(di::Span<byte const> bytes) -> di::Result<> {
    if (!m_process || !m_running) {
        return {};
    }
    return m_process->write(bytes);
}

void Session::resize(Size const& size) {
    m_size = size;
    m_screen->resize(size);
    resize_child(size);
}

void Session::resize_child(Size const& size) {
    if (m_process) {
        if (auto result = m_process->resize(size); !result) {
            dius::eprintln("Failed to resize session '{}': {}"_sv, name(), result.error().message());
        }
    }
}

void Session::kill() {
    if (m_process) {
        if (auto result = m_process->kill(); !result) {
            dius::eprintln("Failed to kill session '{}': {}"_sv, name(), result.error().message());
        }
    }
}

void Session::close() {
    if (m_process) {
        m_process->close();
    }
}

auto Session::wait_until(dius::SteadyClock::TimePoint deadline) -> bool {
    if (!m_process) {
        return true;
    }
    return m_process->wait_until(deadline);
}

void Session::drop() {
    m_process = nullptr;
    m_running = false;
}
}
