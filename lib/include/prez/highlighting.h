#pragma once

#include "di/container/string/prelude.h"
#include "di/container/vector/vector.h"

namespace prez {
// A single line of a highlighted code block. formatted may contain escape sequences, original is the
// same line as it appeared in the source.
struct CodeLine {
    di::String formatted;
    di::String original;

    auto clone() const -> CodeLine { return { formatted.clone(), original.clone() }; }

    auto operator==(CodeLine const&) const -> bool = default;
};

class CodeHighlighter {
public:
    virtual ~CodeHighlighter() = default;

    virtual auto highlight(di::StringView code, di::StringView language) const -> di::Vector<CodeLine> = 0;
};

// Highlighter which leaves every line untouched, regardless of the language.
class PlainHighlighter final : public CodeHighlighter {
public:
    auto highlight(di::StringView code, di::StringView language) const -> di::Vector<CodeLine> override;
};

// Splits text on '\n'. A trailing newline does not produce an extra empty line.
auto split_lines(di::StringView text) -> di::Vector<di::StringView>;
}
