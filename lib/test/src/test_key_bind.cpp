#include "di/test/prelude.h"
#include "vtmux/key_bind.h"
#include "vtmux/session_multiplexer.h"

namespace key_bind {
using namespace vtmux;

static auto find_bind(di::Vector<KeyBind> const& binds, KeyEvent const& event) -> KeyBind const* {
    for (auto const& bind : binds) {
        if (bind.matches(event)) {
            return &bind;
        }
    }
    return nullptr;
}

static void defaults() {
    auto binds = make_key_binds();
    ASSERT_EQ(binds.size(), SessionMultiplexer::max_sessions + 1);

    auto* f1 = find_bind(binds, KeyEvent::key_down(Key::F1));
    ASSERT(f1);
    ASSERT_EQ(f1->action.description, "Switch to session 1"_sv);

    auto* f9 = find_bind(binds, KeyEvent::key_down(Key::F9));
    ASSERT(f9);
    ASSERT_EQ(f9->action.description, "Switch to session 9"_sv);

    auto* quit = find_bind(binds, KeyEvent::character(U'q', Modifiers::Control));
    ASSERT(quit);
    ASSERT_EQ(quit->action.description, "Quit"_sv);
}

static void matching() {
    auto binds = make_key_binds();

    // Ctrl+Shift+Q arrives as Ctrl+Q from most terminals, but both quit.
    ASSERT(find_bind(binds, KeyEvent::character(U'Q', Modifiers::Control)));

    ASSERT(!find_bind(binds, KeyEvent::key_down(Key::F10)));
    ASSERT(!find_bind(binds, KeyEvent::key_down(Key::F1, Modifiers::Shift)));
    ASSERT(!find_bind(binds, KeyEvent::character(U'q')));
    ASSERT(!find_bind(binds, KeyEvent::character(U'q', Modifiers::Control | Modifiers::Alt)));
    ASSERT(!find_bind(binds, KeyEvent::character(U'w', Modifiers::Control)));
}

TEST(key_bind, defaults)
TEST(key_bind, matching)
}
