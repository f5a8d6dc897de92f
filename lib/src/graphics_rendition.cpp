#include "vtmux/graphics_rendition.h"

#include "di/container/vector/vector.h"
#include "di/vocab/tuple/prelude.h"
#include "vtmux/params.h"

namespace vtmux {
struct ParsedColor {
    usize consumed { 1 };
    di::Optional<Color> color;
};

static auto rgb(u32 r, u32 g, u32 b) -> di::Optional<Color> {
    if (r > 255 || g > 255 || b > 255) {
        return {};
    }
    return Color(u8(r), u8(g), u8(b));
}

static auto indexed(u32 index) -> di::Optional<Color> {
    if (index > 255) {
        return {};
    }
    return Color::indexed(u8(index));
}

// Parse an extended color (SGR 38 or 48). The following forms are accepted:
//   38;5;I       -- legacy 256 color form, always 3 parameters.
//   38;2;R;G;B   -- legacy true color form, always 5 parameters.
//   38:5:I       -- subparameter form of the above.
//   38:2:R:G:B   -- subparameter form without a color space.
//   38:2:X:R:G:B -- subparameter form with a color space, which is ignored.
// The legacy forms have no delimiter marking where the color ends, so the
// parameter count is fixed by the color mode. When the sequence is too short
// or a component is out of range, the color is skipped but the parameters
// it claims are still consumed so they aren't misread as attributes.
static auto parse_extended_color(Params const& params, usize index) -> ParsedColor {
    auto subparams = params.subparams(index);
    if (subparams.size() > 1) {
        switch (subparams.get(1)) {
            case 5:
                if (subparams.size() < 3) {
                    return {};
                }
                return { 1, indexed(subparams.get(2)) };
            case 2:
                if (subparams.size() != 5 && subparams.size() != 6) {
                    return {};
                }
                return { 1, rgb(subparams.get(subparams.size() - 3), subparams.get(subparams.size() - 2),
                                subparams.get(subparams.size() - 1)) };
            default:
                return {};
        }
    }

    auto remaining = params.size() - index;
    switch (params.get(index + 1)) {
        case 5:
            if (remaining < 3) {
                return { remaining, {} };
            }
            return { 3, indexed(params.get(index + 2)) };
        case 2:
            if (remaining < 5) {
                return { remaining, {} };
            }
            return { 5, rgb(params.get(index + 2), params.get(index + 3), params.get(index + 4)) };
        default:
            return { remaining, {} };
    }
}

// Select Graphics Rendition - https://vt100.net/docs/vt510-rm/SGR.html
//   Extended colors are described here:
//     https://invisible-island.net/xterm/ctlseqs/ctlseqs.html#h4-Functions-using-CSI-_-ordered-by-the-final-character-lparen-s-rparen:CSI-Pm-m.1CA7
void GraphicsRendition::update_with_csi_params(Params const& params) {
    // No params = reset.
    if (params.empty()) {
        *this = {};
        return;
    }

    for (auto i = 0_usize; i < params.size(); i++) {
        auto code = params.get(i, 0);
        switch (code) {
            case 0:
                *this = {};
                break;
            case 1:
                font_weight = FontWeight::Bold;
                break;
            case 2:
                font_weight = FontWeight::Dim;
                break;
            case 3:
                italic = true;
                break;
            case 4:
                underline_mode = params.get_subparam(i, 1, 1) == 0 ? UnderlineMode::None : UnderlineMode::Normal;
                break;
            case 5:
                blink_mode = BlinkMode::Normal;
                break;
            case 6:
                blink_mode = BlinkMode::Rapid;
                break;
            case 7:
                inverted = true;
                break;
            case 8:
                invisible = true;
                break;
            case 9:
                strike_through = true;
                break;
            case 21:
                underline_mode = UnderlineMode::Double;
                break;
            case 22:
                font_weight = FontWeight::None;
                break;
            case 23:
                italic = false;
                break;
            case 24:
                underline_mode = UnderlineMode::None;
                break;
            case 25:
                blink_mode = BlinkMode::None;
                break;
            case 27:
                inverted = false;
                break;
            case 28:
                invisible = false;
                break;
            case 29:
                strike_through = false;
                break;
            case 30:
            case 31:
            case 32:
            case 33:
            case 34:
            case 35:
            case 36:
            case 37:
                fg = Color(Color::Palette(Color::Palette::Black + (code - 30)));
                break;
            case 38:
            case 48: {
                auto [consumed, color] = parse_extended_color(params, i);
                if (color) {
                    (code == 38 ? fg : bg) = *color;
                }
                i += consumed - 1;
                break;
            }
            case 39:
                fg = {};
                break;
            case 40:
            case 41:
            case 42:
            case 43:
            case 44:
            case 45:
            case 46:
            case 47:
                bg = Color(Color::Palette(Color::Palette::Black + (code - 40)));
                break;
            case 49:
                bg = {};
                break;
            case 90:
            case 91:
            case 92:
            case 93:
            case 94:
            case 95:
            case 96:
            case 97:
                fg = Color(Color::Palette(Color::Palette::DarkGrey + (code - 90)));
                break;
            case 100:
            case 101:
            case 102:
            case 103:
            case 104:
            case 105:
            case 106:
            case 107:
                bg = Color(Color::Palette(Color::Palette::DarkGrey + (code - 100)));
                break;
            default:
                break;
        }
    }
}

static void add_color_params(Params& params, Color const& color, bool foreground) {
    switch (color.type) {
        case Color::Type::Default:
            return;
        case Color::Type::Palette:
            if (color.r < Color::Palette::DarkGrey) {
                params.add_param((foreground ? 30u : 40u) + color.r);
            } else {
                params.add_param((foreground ? 90u : 100u) + (color.r - Color::Palette::DarkGrey));
            }
            return;
        case Color::Type::Indexed:
            params.add_param(foreground ? 38 : 48);
            params.add_param(5);
            params.add_param(color.r);
            return;
        case Color::Type::Custom:
            params.add_param(foreground ? 38 : 48);
            params.add_param(2);
            params.add_param(color.r);
            params.add_param(color.g);
            params.add_param(color.b);
            return;
    }
}

auto GraphicsRendition::as_csi_params() const -> Params {
    auto result = Params {};
    result.add_param(0);

    switch (font_weight) {
        case FontWeight::Bold:
            result.add_param(1);
            break;
        case FontWeight::Dim:
            result.add_param(2);
            break;
        case FontWeight::None:
            break;
    }
    if (italic) {
        result.add_param(3);
    }
    switch (underline_mode) {
        case UnderlineMode::Normal:
            result.add_param(4);
            break;
        case UnderlineMode::Double:
            result.add_param(21);
            break;
        case UnderlineMode::None:
            break;
    }
    switch (blink_mode) {
        case BlinkMode::Normal:
            result.add_param(5);
            break;
        case BlinkMode::Rapid:
            result.add_param(6);
            break;
        case BlinkMode::None:
            break;
    }
    if (inverted) {
        result.add_param(7);
    }
    if (invisible) {
        result.add_param(8);
    }
    if (strike_through) {
        result.add_param(9);
    }

    add_color_params(result, fg, true);
    add_color_params(result, bg, false);
    return result;
}
}
