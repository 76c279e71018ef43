#pragma once

#include "di/vocab/error/result.h"
#include "di/vocab/optional/prelude.h"
#include "prez/presentation.h"
#include "prez/render_operator.h"
#include "prez/terminal_backend.h"

namespace prez {
/// @brief Owns the terminal while a presentation is being shown.
///
/// Creating a drawer puts the terminal in raw mode, switches to the alternate screen and hides the
/// cursor. All of this is undone when the drawer is destroyed.
class Drawer {
public:
    // Rows at the bottom of the window which are not part of the slide area.
    constexpr static auto reserved_rows = 3_u32;

    static auto create(TerminalBackend& backend) -> di::Expected<Drawer, RenderError>;

    Drawer(Drawer&& other);
    Drawer& operator=(Drawer&&) = delete;

    ~Drawer();

    auto render_slide(Presentation const& presentation) -> di::Expected<void, RenderError>;

    // Shows a fixed error screen. This doesn't depend on any theme, so it works even when the
    // presentation failed to build.
    auto render_error(di::StringView message) -> di::Expected<void, RenderError>;

private:
    explicit Drawer(TerminalBackend& backend, RawModeGuard raw_mode)
        : m_backend(&backend), m_raw_mode(di::move(raw_mode)) {}

    auto window_size() -> di::Expected<WindowSize, RenderError>;
    auto flush() -> di::Expected<void, RenderError>;

    TerminalBackend* m_backend { nullptr };
    di::Optional<RawModeGuard> m_raw_mode;
};
}
