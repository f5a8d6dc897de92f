#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"
#include "di/function/container/function.h"
#include "vtmux/key.h"
#include "vtmux/key_event.h"
#include "vtmux/modifiers.h"

namespace vtmux {
class SessionMultiplexer;

struct ActionContext {
    KeyEvent const& key_event;
    SessionMultiplexer& multiplexer;
    bool& exit_requested;
};

struct Action {
    di::String description;
    di::Function<void(ActionContext const&) const&> apply;
};

struct KeyBind {
    Key key { Key::None };
    c32 code_point { 0 }; ///< Only checked when key is Key::Character
    Modifiers modifiers { Modifiers::None };
    Action action;

    auto matches(KeyEvent const& event) const -> bool;
};

// F1..F9 switch to the matching session, and Ctrl+Q quits.
auto make_key_binds() -> di::Vector<KeyBind>;
}
