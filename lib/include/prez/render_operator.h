#pragma once

#include "di/container/string/prelude.h"
#include "di/reflect/prelude.h"
#include "di/vocab/error/result.h"
#include "prez/render_operation.h"
#include "prez/size.h"
#include "prez/terminal_backend.h"
#include "prez/theme.h"

namespace prez {
enum class RenderErrorKind {
    Io,
    UnsupportedStructure,
    Other,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<RenderErrorKind>) {
    using enum RenderErrorKind;
    return di::make_enumerators<"RenderErrorKind">(di::enumerator<"Io", Io>,
                                                   di::enumerator<"UnsupportedStructure", UnsupportedStructure>,
                                                   di::enumerator<"Other", Other>);
}

struct RenderError {
    RenderErrorKind kind { RenderErrorKind::Other };
    di::String message;

    auto describe() const -> di::String;

    auto operator==(RenderError const&) const -> bool = default;
};

// Column at which text of the given width starts, for a window with the given number of columns.
auto start_column(Alignment const& alignment, usize width, u32 columns) -> u32;

/// @brief Executes render operations against a terminal backend.
///
/// The operator keeps track of the row the cursor is on and of the colors set by the last
/// SetColors operation. Content is positioned within the slide dimensions, while
/// JumpToWindowBottom targets the last row of the whole window.
class RenderOperator {
public:
    explicit RenderOperator(TerminalBackend& backend, WindowSize slide_dimensions, WindowSize window_dimensions)
        : m_backend(backend), m_slide_dimensions(slide_dimensions), m_window_dimensions(window_dimensions) {}

    auto render(RenderOperation const& operation) -> di::Expected<void, RenderError>;

    auto current_row() const -> u32 { return m_current_row; }
    auto current_colors() const -> Colors const& { return m_current_colors; }

private:
    void jump_to_row(u32 row);
    void render_text(WeightedLine const& line, Alignment const& alignment);
    void render_preformatted_line(RenderPreformattedLine const& line);
    void render_separator();
    auto render_image(ImageHandle const& image) -> di::Expected<void, RenderError>;
    auto render_dynamic(AsRenderOperations const& generator) -> di::Expected<void, RenderError>;

    TerminalBackend& m_backend;
    WindowSize m_slide_dimensions;
    WindowSize m_window_dimensions;
    Colors m_current_colors;
    u32 m_current_row { 0 };
};
}
