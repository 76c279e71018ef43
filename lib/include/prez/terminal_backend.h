#pragma once

#include "di/container/string/prelude.h"
#include "di/function/container/function.h"
#include "di/io/vector_writer.h"
#include "di/util/scope_exit.h"
#include "di/vocab/error/result.h"
#include "dius/sync_file.h"
#include "prez/graphics_rendition.h"
#include "prez/resources.h"
#include "prez/size.h"
#include "prez/styled_text.h"

namespace prez {
using RawModeGuard = di::ScopeExit<di::Function<void()>>;

// Everything the render pipeline needs from a terminal. Output may be buffered until flush().
class TerminalBackend {
public:
    virtual ~TerminalBackend() = default;

    virtual auto window_size() -> di::Result<WindowSize> = 0;
    virtual auto enter_raw_mode() -> di::Result<RawModeGuard> = 0;

    virtual void enter_alternate_screen() = 0;
    virtual void leave_alternate_screen() = 0;
    virtual void hide_cursor() = 0;
    virtual void show_cursor() = 0;

    virtual void set_colors(Colors const& colors) = 0;
    virtual void clear_screen() = 0;

    // Rows and columns are 0 indexed.
    virtual void move_to(u32 row, u32 col) = 0;
    virtual void move_to_row(u32 row) = 0;
    virtual void move_to_column(u32 col) = 0;

    virtual void print(di::StringView text, GraphicsRendition const& rendition) = 0;
    virtual auto draw_image(ImageHandle const& image, u32 rows, u32 cols) -> di::Result<> = 0;

    virtual auto flush() -> di::Result<> = 0;
};

/// @brief Backend which writes ANSI escape sequences to a tty.
///
/// Output is accumulated and only written to the terminal on flush(), so that every frame reaches
/// the terminal in a single write.
class AnsiTerminalBackend final : public TerminalBackend {
public:
    explicit AnsiTerminalBackend(dius::SyncFile& output) : m_output(output) {}

    auto window_size() -> di::Result<WindowSize> override;
    auto enter_raw_mode() -> di::Result<RawModeGuard> override;

    void enter_alternate_screen() override;
    void leave_alternate_screen() override;
    void hide_cursor() override;
    void show_cursor() override;

    void set_colors(Colors const& colors) override;
    void clear_screen() override;

    void move_to(u32 row, u32 col) override;
    void move_to_row(u32 row) override;
    void move_to_column(u32 col) override;

    void print(di::StringView text, GraphicsRendition const& rendition) override;
    auto draw_image(ImageHandle const& image, u32 rows, u32 cols) -> di::Result<> override;

    auto flush() -> di::Result<> override;

private:
    dius::SyncFile& m_output;
    di::VectorWriter<> m_buffer;
};
}
