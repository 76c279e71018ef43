#include "prez/drawer.h"

namespace prez {
auto Drawer::create(TerminalBackend& backend) -> di::Expected<Drawer, RenderError> {
    auto raw_mode = backend.enter_raw_mode();
    if (!raw_mode) {
        return di::Unexpected(RenderError(RenderErrorKind::Io, "failed to enter raw mode"_s));
    }

    auto drawer = Drawer(backend, di::move(raw_mode).value());
    backend.enter_alternate_screen();
    backend.hide_cursor();
    TRY(drawer.flush());
    return drawer;
}

Drawer::Drawer(Drawer&& other)
    : m_backend(di::exchange(other.m_backend, nullptr)), m_raw_mode(di::move(other.m_raw_mode)) {
    other.m_raw_mode = {};
}

Drawer::~Drawer() {
    if (!m_backend) {
        return;
    }
    m_backend->show_cursor();
    m_backend->leave_alternate_screen();
    (void) m_backend->flush();
}

auto Drawer::window_size() -> di::Expected<WindowSize, RenderError> {
    auto size = m_backend->window_size();
    if (!size) {
        return di::Unexpected(RenderError(RenderErrorKind::Io, "failed to query the window size"_s));
    }
    return size.value();
}

auto Drawer::flush() -> di::Expected<void, RenderError> {
    if (!m_backend->flush()) {
        return di::Unexpected(RenderError(RenderErrorKind::Io, "failed to write to the terminal"_s));
    }
    return {};
}

auto Drawer::render_slide(Presentation const& presentation) -> di::Expected<void, RenderError> {
    auto dimensions = TRY(window_size());
    auto slide_dimensions = dimensions.rows_shrinked(reserved_rows);

    auto renderer = RenderOperator(*m_backend, slide_dimensions, dimensions);
    for (auto const& operation : presentation.current_slide().render_operations) {
        TRY(renderer.render(operation));
    }
    return flush();
}

auto Drawer::render_error(di::StringView message) -> di::Expected<void, RenderError> {
    auto dimensions = TRY(window_size());

    auto heading = di::Vector<WeightedText> {};
    heading.push_back(WeightedText::from(StyledText::styled("Error loading presentation"_sv, TextStyle {}.bolded())));
    heading.push_back(WeightedText::from(StyledText::plain(": "_sv)));

    auto error = di::Vector<WeightedText> {};
    error.push_back(WeightedText::from(StyledText::plain(message)));

    auto alignment = Alignment(CenterAlignment { 0, 5 });
    auto operations = di::Vector<RenderOperation> {};
    operations.push_back(SetColors { Colors { Color(Color::Red), Color(Color::Black) } });
    operations.push_back(ClearScreen {});
    operations.push_back(JumpToVerticalCenter {});
    operations.push_back(RenderTextLine { WeightedLine::from(di::move(heading)), alignment });
    operations.push_back(RenderLineBreak {});
    operations.push_back(RenderLineBreak {});
    operations.push_back(RenderTextLine { WeightedLine::from(di::move(error)), alignment });

    auto renderer = RenderOperator(*m_backend, dimensions, dimensions);
    for (auto const& operation : operations) {
        TRY(renderer.render(operation));
    }
    return flush();
}
}
