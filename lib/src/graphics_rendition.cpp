#include "prez/graphics_rendition.h"

#include "di/format/prelude.h"

namespace prez {
// Palette colors map onto 30-37 and 90-97 for the foreground, and 40-47 and 100-107 for the
// background. True color uses the legacy form without subparameters: code;2;r;g;b.
static void add_color(Params& params, Color const& color, u32 normal_base, u32 bright_base, u32 custom_code) {
    switch (color.type) {
        case Color::Type::Default:
            return;
        case Color::Type::Palette:
            if (color.index < Color::BrightBlack) {
                params.add(normal_base + color.index);
            } else {
                params.add(bright_base + (color.index - Color::BrightBlack));
            }
            return;
        case Color::Type::Custom:
            params.add(custom_code, 2, color.r, color.g, color.b);
            return;
    }
}

auto GraphicsRendition::as_csi_params() const -> Params {
    auto result = Params {};
    result.add(0);
    if (bold) {
        result.add(1);
    }
    if (italic) {
        result.add(3);
    }
    add_color(result, fg, 30, 90, 38);
    add_color(result, bg, 40, 100, 48);
    return result;
}

auto GraphicsRendition::as_sgr() const -> di::String {
    return *di::present("\033[{}m"_sv, as_csi_params().to_string());
}
}
