#include "prez/terminal_backend.h"

#include "di/container/algorithm/minmax.h"
#include "di/format/prelude.h"
#include "di/io/writer_print.h"
#include "di/serialization/base64.h"

namespace prez {
// Encodes to exactly 4096 bytes of base64.
constexpr static auto image_chunk_size = 3072_usize;

auto AnsiTerminalBackend::window_size() -> di::Result<WindowSize> {
    return WindowSize::from_window_size(TRY(m_output.get_tty_window_size()));
}

auto AnsiTerminalBackend::enter_raw_mode() -> di::Result<RawModeGuard> {
    return m_output.enter_raw_mode();
}

void AnsiTerminalBackend::enter_alternate_screen() {
    // Also disable autowrap, so that text running past the right edge is clipped.
    di::writer_print<di::String::Encoding>(m_buffer, "\033[?1049h\033[?7l"_sv);
}

void AnsiTerminalBackend::leave_alternate_screen() {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[?7h\033[?1049l"_sv);
}

void AnsiTerminalBackend::hide_cursor() {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[?25l"_sv);
}

void AnsiTerminalBackend::show_cursor() {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[?25h"_sv);
}

void AnsiTerminalBackend::set_colors(Colors const& colors) {
    auto rendition = TextStyle {}.with_colors(colors).as_graphics_rendition({});
    di::writer_print<di::String::Encoding>(m_buffer, "{}"_sv, rendition.as_sgr());
}

void AnsiTerminalBackend::clear_screen() {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[2J\033[H"_sv);
}

void AnsiTerminalBackend::move_to(u32 row, u32 col) {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[{};{}H"_sv, row + 1, col + 1);
}

void AnsiTerminalBackend::move_to_row(u32 row) {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[{}d"_sv, row + 1);
}

void AnsiTerminalBackend::move_to_column(u32 col) {
    di::writer_print<di::String::Encoding>(m_buffer, "\033[{}G"_sv, col + 1);
}

void AnsiTerminalBackend::print(di::StringView text, GraphicsRendition const& rendition) {
    di::writer_print<di::String::Encoding>(m_buffer, "{}{}"_sv, rendition.as_sgr(), text);
}

auto AnsiTerminalBackend::draw_image(ImageHandle const& image, u32 rows, u32 cols) -> di::Result<> {
    // Kitty graphics protocol, scaled to the requested cell area. The terminal reads PNG files
    // directly (t=f), so the path must be absolute.
    if (image.format == ImageFormat::Png) {
        if (!image.path.is_absolute()) {
            return di::Unexpected(di::BasicError::InvalidArgument);
        }
        auto path = di::Base64View(di::as_bytes(image.path.data().span()));
        di::writer_print<di::String::Encoding>(m_buffer, "\033_Gf=100,t=f,a=T,q=2,c={},r={};{}\033\\"_sv, cols, rows,
                                               path);
        return {};
    }

    // Everything else is sent as raw RGBA, split into chunks of at most 4096 encoded bytes.
    auto pixels = image.pixels.span();
    if (pixels.empty()) {
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    for (auto offset = 0_usize; offset < pixels.size(); offset += image_chunk_size) {
        auto chunk = *pixels.subspan(offset, di::min(image_chunk_size, pixels.size() - offset));
        auto more = offset + chunk.size() < pixels.size() ? 1 : 0;
        if (offset == 0) {
            di::writer_print<di::String::Encoding>(m_buffer, "\033_Gf=32,s={},v={},a=T,q=2,c={},r={},m={};{}\033\\"_sv,
                                                   image.width, image.height, cols, rows, more,
                                                   di::Base64View(di::as_bytes(chunk)));
        } else {
            di::writer_print<di::String::Encoding>(m_buffer, "\033_Gm={};{}\033\\"_sv, more,
                                                   di::Base64View(di::as_bytes(chunk)));
        }
    }
    return {};
}

auto AnsiTerminalBackend::flush() -> di::Result<> {
    auto text = di::move(m_buffer).vector();
    m_buffer = {};
    return m_output.write_exactly(di::as_bytes(text.span()));
}
}
