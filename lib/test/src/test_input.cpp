#include "di/test/prelude.h"
#include "prez/input.h"

namespace input {
using namespace prez;

static auto parse(CommandParser& parser, di::StringView input) -> di::Vector<InputCommand> {
    return parser.parse(di::as_bytes(input.span()));
}

static void keys() {
    struct Case {
        di::StringView input;
        di::Vector<InputCommand> expected;
    };

    auto make = [](auto... commands) {
        auto result = di::Vector<InputCommand> {};
        (result.push_back(commands), ...);
        return result;
    };

    auto next = InputCommand { Command::Next };
    auto previous = InputCommand { Command::Previous };
    auto first = InputCommand { Command::First };
    auto last = InputCommand { Command::Last };
    auto quit = InputCommand { Command::Quit };

    auto cases = di::Array {
        Case { "l"_sv, make(next) },
        Case { "j k"_sv, make(next, previous, next) },
        Case { "h"_sv, make(previous) },
        Case { "gG"_sv, make(first, last) },
        Case { "q"_sv, make(quit) },
        Case { "\x03"_sv, make(quit) },
        Case { "12G"_sv, make(InputCommand { Command::JumpTo, 11 }) },
        Case { "1G"_sv, make(InputCommand { Command::JumpTo, 0 }) },
        Case { "0G"_sv, make(InputCommand { Command::JumpTo, 0 }) },
        // A number not followed by G is dropped.
        Case { "3l"_sv, make(next) },
        Case { "3lG"_sv, make(next, last) },
        Case { "\033[C\033[B"_sv, make(next, next) },
        Case { "\033[D\033[A"_sv, make(previous, previous) },
        Case { "\033[H\033[F"_sv, make(first, last) },
        Case { "\033[5~\033[6~"_sv, make(previous, next) },
        Case { "\033[1;5C"_sv, make(next) },
        Case { "\033x"_sv, make() },
        Case { "zZ!"_sv, make() },
    };

    for (auto const& [input, expected] : cases) {
        auto parser = CommandParser {};
        ASSERT_EQ(parse(parser, input), expected);
    }
}

static void split_input() {
    auto parser = CommandParser {};
    ASSERT(parse(parser, "\033"_sv).empty());
    ASSERT(parse(parser, "["_sv).empty());

    auto commands = parse(parser, "C"_sv);
    ASSERT_EQ(commands.size(), 1u);
    ASSERT_EQ(commands[0], InputCommand { Command::Next });

    ASSERT(parse(parser, "1"_sv).empty());
    ASSERT(parse(parser, "5"_sv).empty());
    commands = parse(parser, "G"_sv);
    ASSERT_EQ(commands.size(), 1u);
    ASSERT_EQ(commands[0], (InputCommand { Command::JumpTo, 14 }));
}

TEST(input, keys)
TEST(input, split_input)
}
