#pragma once

#include "di/reflect/prelude.h"
#include "di/types/prelude.h"
#include "dius/tty.h"

namespace prez {
struct WindowSize {
    u32 rows { 0 };
    u32 cols { 0 };
    u32 xpixels { 0 };
    u32 ypixels { 0 };

    static auto from_window_size(dius::tty::WindowSize const& window_size) -> WindowSize {
        return { window_size.rows, window_size.cols, window_size.pixel_width, window_size.pixel_height };
    }

    auto rows_shrinked(u32 r) const -> WindowSize {
        if (r >= rows) {
            return { 0, cols, xpixels, 0 };
        }
        return { rows - r, cols, xpixels, ypixels - (r * ypixels / rows) };
    }

    // Pixel size of a single cell, or 0 when the terminal doesn't report pixel dimensions.
    auto cell_width() const -> u32 { return cols == 0 ? 0 : xpixels / cols; }
    auto cell_height() const -> u32 { return rows == 0 ? 0 : ypixels / rows; }

    auto operator==(WindowSize const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<WindowSize>) {
        return di::make_fields<"WindowSize">(
            di::field<"rows", &WindowSize::rows>, di::field<"cols", &WindowSize::cols>,
            di::field<"xpixels", &WindowSize::xpixels>, di::field<"ypixels", &WindowSize::ypixels>);
    }
};
}
