#include "prez/input.h"

namespace prez {
auto CommandParser::parse(di::Span<byte const> input) -> di::Vector<InputCommand> {
    auto commands = di::Vector<InputCommand> {};
    for (auto value : input) {
        auto code_unit = u8(value);
        switch (m_state) {
            case State::Ground:
                on_ground(code_unit, commands);
                break;
            case State::Escape:
                if (code_unit == '[') {
                    m_state = State::Csi;
                    m_csi_param = 0;
                } else {
                    // Alt+key or a lone escape key press, neither of which are bound.
                    m_state = State::Ground;
                }
                break;
            case State::Csi:
                if (code_unit >= '0' && code_unit <= '9') {
                    m_csi_param = m_csi_param * 10 + (code_unit - '0');
                } else if (code_unit >= 0x40 && code_unit <= 0x7e) {
                    on_csi_final(code_unit, commands);
                    m_state = State::Ground;
                }
                break;
        }
    }
    return commands;
}

void CommandParser::on_ground(u8 code_unit, di::Vector<InputCommand>& commands) {
    if (code_unit >= '0' && code_unit <= '9') {
        m_number = m_number.value_or(0) * 10 + (code_unit - '0');
        return;
    }

    auto number = m_number;
    m_number = {};
    switch (code_unit) {
        case '\033':
            m_state = State::Escape;
            break;
        case 'l':
        case 'j':
        case ' ':
            commands.push_back(InputCommand { Command::Next });
            break;
        case 'h':
        case 'k':
            commands.push_back(InputCommand { Command::Previous });
            break;
        case 'g':
            commands.push_back(InputCommand { Command::First });
            break;
        case 'G':
            if (number) {
                commands.push_back(InputCommand { Command::JumpTo, *number == 0 ? 0 : *number - 1 });
            } else {
                commands.push_back(InputCommand { Command::Last });
            }
            break;
        case 'q':
        case 0x03: // Ctrl+C
            commands.push_back(InputCommand { Command::Quit });
            break;
        default:
            break;
    }
}

void CommandParser::on_csi_final(u8 code_unit, di::Vector<InputCommand>& commands) {
    switch (code_unit) {
        case 'B':
        case 'C':
            commands.push_back(InputCommand { Command::Next });
            break;
        case 'A':
        case 'D':
            commands.push_back(InputCommand { Command::Previous });
            break;
        case 'H':
            commands.push_back(InputCommand { Command::First });
            break;
        case 'F':
            commands.push_back(InputCommand { Command::Last });
            break;
        case '~':
            // Page up and page down.
            if (m_csi_param == 5) {
                commands.push_back(InputCommand { Command::Previous });
            } else if (m_csi_param == 6) {
                commands.push_back(InputCommand { Command::Next });
            }
            break;
        default:
            break;
    }
}
}
