#pragma once

#include "di/vocab/error/result.h"
#include "dius/sync_file.h"
#include "prez/drawer.h"
#include "prez/input.h"
#include "prez/presentation.h"

namespace prez {
// Applies a single command to the presentation. Returns false once the user asked to quit.
auto apply_command(Presentation& presentation, InputCommand const& command) -> bool;

// Interactive loop: renders the current slide and navigates in response to key presses.
class Presenter {
public:
    explicit Presenter(Presentation& presentation, Drawer& drawer, dius::SyncFile& input)
        : m_presentation(presentation), m_drawer(drawer), m_input(input) {}

    auto run() -> di::Result<>;

private:
    auto render() -> di::Result<>;

    Presentation& m_presentation;
    Drawer& m_drawer;
    dius::SyncFile& m_input;
};

// Shows a build error until any key is pressed.
auto show_error(Drawer& drawer, dius::SyncFile& input, di::StringView message) -> di::Result<>;
}
