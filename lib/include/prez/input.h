#pragma once

#include "di/container/vector/vector.h"
#include "di/reflect/prelude.h"
#include "di/vocab/optional/prelude.h"
#include "di/vocab/span/prelude.h"

namespace prez {
enum class Command {
    Next,
    Previous,
    First,
    Last,
    JumpTo,
    Quit,
};

constexpr auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<Command>) {
    using enum Command;
    return di::make_enumerators<"Command">(di::enumerator<"Next", Next>, di::enumerator<"Previous", Previous>,
                                           di::enumerator<"First", First>, di::enumerator<"Last", Last>,
                                           di::enumerator<"JumpTo", JumpTo>, di::enumerator<"Quit", Quit>);
}

struct InputCommand {
    Command command { Command::Next };
    usize slide { 0 }; ///< 0 indexed target slide, only used by JumpTo.

    auto operator==(InputCommand const&) const -> bool = default;

    constexpr friend auto tag_invoke(di::Tag<di::reflect>, di::InPlaceType<InputCommand>) {
        return di::make_fields<"InputCommand">(di::field<"command", &InputCommand::command>,
                                               di::field<"slide", &InputCommand::slide>);
    }
};

/// @brief Translates raw terminal input into presenter commands.
///
/// Input is processed incrementally: escape sequences and numeric prefixes may be split across
/// calls to parse(). A number typed before `G` jumps to that (1 indexed) slide.
class CommandParser {
public:
    auto parse(di::Span<byte const> input) -> di::Vector<InputCommand>;

private:
    enum class State {
        Ground,
        Escape,
        Csi,
    };

    void on_ground(u8 code_unit, di::Vector<InputCommand>& commands);
    void on_csi_final(u8 code_unit, di::Vector<InputCommand>& commands);

    State m_state { State::Ground };
    di::Optional<usize> m_number;
    usize m_csi_param { 0 };
};
}
