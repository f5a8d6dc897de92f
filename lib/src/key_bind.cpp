#include "vtmux/key_bind.h"

#include "di/format/prelude.h"
#include "vtmux/session_multiplexer.h"

namespace vtmux {
auto KeyBind::matches(KeyEvent const& event) const -> bool {
    if (event.key() != key || event.modifiers() != modifiers) {
        return false;
    }
    if (key == Key::Character) {
        // Terminals report Ctrl+Q and Ctrl+Shift+Q identically.
        auto lower = event.code_point() >= U'A' && event.code_point() <= U'Z' ? event.code_point() - U'A' + U'a'
                                                                              : event.code_point();
        return c32(lower) == code_point;
    }
    return true;
}

static auto switch_session(usize index) -> Action {
    return {
        .description = *di::present("Switch to session {}"_sv, index + 1),
        .apply =
            [index](ActionContext const& context) {
                (void) context.multiplexer.switch_to(index);
            },
    };
}

static auto quit() -> Action {
    return {
        .description = "Quit"_s,
        .apply =
            [](ActionContext const& context) {
                context.exit_requested = true;
            },
    };
}

auto make_key_binds() -> di::Vector<KeyBind> {
    auto result = di::Vector<KeyBind> {};
    for (auto i = 0_usize; i < SessionMultiplexer::max_sessions; i++) {
        result.push_back({
            .key = Key(di::to_underlying(Key::F1) + i),
            .action = switch_session(i),
        });
    }
    result.push_back({
        .key = Key::Character,
        .code_point = U'q',
        .modifiers = Modifiers::Control,
        .action = quit(),
    });
    return result;
}
}
