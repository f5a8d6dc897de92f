#include <unistd.h>

#include "di/cli/parser.h"
#include "di/container/string/string_view.h"
#include "di/util/scope_exit.h"
#include "dius/main.h"
#include "dius/print.h"
#include "dius/sync_file.h"
#include "dius/system/process.h"
#include "vtmux/input_bridge.h"
#include "vtmux/pty_process.h"
#include "vtmux/renderer.h"
#include "vtmux/session.h"
#include "vtmux/session_multiplexer.h"
#include "vtmux/size.h"
#include "vtmux/terminal_input_source.h"

namespace vtmux {
struct Args {
    di::Vector<di::TransparentStringView> command;
    di::Optional<di::PathView> log_file;
    u32 poll_interval { 10 };
    u32 status_interval { 500 };
    u32 shutdown_timeout { 1000 };
    bool help { false };

    constexpr static auto get_cli_parser() {
        return di::cli_parser<Args>("vtmux"_sv, "Run several terminal programs, switching between them with F1-F9"_sv)
            .option<&Args::log_file>('l', "log-file"_tsv, "Write diagnostics to a file (default /tmp/vtmux.log)"_sv)
            .option<&Args::poll_interval>('p', "poll-interval"_tsv, "Milliseconds between polls of child output"_sv)
            .option<&Args::status_interval>('s', "status-interval"_tsv,
                                            "Milliseconds between status bar refreshes"_sv)
            .option<&Args::shutdown_timeout>('t', "shutdown-timeout"_tsv,
                                             "Milliseconds to wait for children to exit before forcing exit"_sv)
            .argument<&Args::command>("COMMAND"_sv,
                                      "Program to run in a session, optionally prefixed with NAME="_sv)
            .help();
    }
};

// Runs with the terminal in raw mode and on the alternate screen. Both are
// restored before returning.
static auto run_interactive(SessionMultiplexer& multiplexer) -> di::Result<> {
    // Setup - raw mode
    auto _ = TRY(dius::stdin.enter_raw_mode());

    // Setup - alternate screen and input reporting.
    auto renderer = Renderer(dius::stdin);
    TRY(renderer.setup());
    auto _ = di::ScopeExit([&] {
        (void) renderer.cleanup();
    });

    // Setup - input thread.
    auto source = TRY(TerminalInputSource::create());
    auto bridge = InputBridge(di::move(source));
    auto receiver = TRY(bridge.subscribe());

    return multiplexer.run(receiver, renderer);
}

static auto main(Args& args) -> di::Result<void> {
    if (args.command.empty()) {
        dius::eprintln("error: vtmux requires at least one command to run"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    if (args.command.size() > SessionMultiplexer::max_sessions) {
        dius::eprintln("error: vtmux supports at most {} commands"_sv, SessionMultiplexer::max_sessions);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto config = MultiplexerConfig {};
    for (auto command : args.command) {
        config.sessions.push_back(TRY(parse_session_config(command)));
    }
    config.poll_interval = di::Milliseconds(args.poll_interval);
    config.status_interval = di::Milliseconds(args.status_interval);
    config.shutdown_timeout = di::Milliseconds(args.shutdown_timeout);

    // Setup - log to file.
    [[maybe_unused]] auto& log = dius::stderr =
        TRY(dius::open_sync(args.log_file.value_or("/tmp/vtmux.log"_pv), dius::OpenMode::WriteClobber));

    // Setup - block SIGWINCH, which is read through a signalfd by the input thread.
    TRY(dius::system::mask_signal(dius::Signal::WindowChange));

    auto terminal_size = Size::from_window_size(TRY(dius::stdin.get_tty_window_size()));
    auto spawner = PtyProcessSpawner {};
    auto multiplexer = TRY(SessionMultiplexer::create(di::move(config), terminal_size, spawner));

    if (auto result = multiplexer->start_all(); !result) {
        // Diagnostics go to the log, so report this on the terminal as well.
        dius::println("{}"_sv, result.error().message());
        if (!multiplexer->shutdown()) {
            _exit(1);
        }
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto result = run_interactive(*multiplexer);
    if (!result) {
        dius::eprintln("Event loop failed: {}"_sv, result.error().message());
    }

    // Children which ignore the hangup would keep us alive forever, so give up
    // without running any more destructors.
    if (!multiplexer->shutdown()) {
        dius::println("vtmux: sessions did not exit in time, forcing exit"_sv);
        _exit(1);
    }
    return result;
}
}

DIUS_MAIN(vtmux::Args, vtmux)
