#include "presenter.h"

#include "dius/print.h"

namespace prez {
auto Presenter::run() -> di::Result<> {
    TRY(render());

    auto buffer = di::Vector<byte> {};
    buffer.resize(4096);

    auto parser = CommandParser {};
    for (;;) {
        auto nread = TRY(m_input.read_some(buffer.span()));
        if (nread == 0) {
            return {};
        }

        for (auto const& command : parser.parse(*buffer.span().subspan(0, nread))) {
            if (!apply_command(m_presentation, command)) {
                return {};
            }
        }

        // Always redraw, which also picks up any change to the window size.
        TRY(render());
    }
}

auto apply_command(Presentation& presentation, InputCommand const& command) -> bool {
    switch (command.command) {
        case Command::Next:
            presentation.jump_next();
            break;
        case Command::Previous:
            presentation.jump_previous();
            break;
        case Command::First:
            presentation.jump_first();
            break;
        case Command::Last:
            presentation.jump_last();
            break;
        case Command::JumpTo:
            presentation.jump_to(command.slide);
            break;
        case Command::Quit:
            return false;
    }
    return true;
}

auto Presenter::render() -> di::Result<> {
    auto result = m_drawer.render_slide(m_presentation);
    if (!result) {
        dius::eprintln("failed to render slide {}: {}"_sv, m_presentation.current_slide_index() + 1,
                       result.error().describe());
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    return {};
}

auto show_error(Drawer& drawer, dius::SyncFile& input, di::StringView message) -> di::Result<> {
    auto result = drawer.render_error(message);
    if (!result) {
        dius::eprintln("failed to render error screen: {}"_sv, result.error().describe());
        return di::Unexpected(di::BasicError::InvalidArgument);
    }

    auto buffer = di::Vector<byte> {};
    buffer.resize(64);
    TRY(input.read_some(buffer.span()));
    return {};
}
}
