#include "prez/highlighting.h"

#include "di/format/prelude.h"

namespace prez {
auto split_lines(di::StringView text) -> di::Vector<di::StringView> {
    auto lines = di::Vector<di::StringView> {};
    for (di::StringView line : text | di::split(U'\n')) {
        lines.push_back(line);
    }
    if (!lines.empty() && lines.back().value().empty()) {
        lines.pop_back();
    }
    return lines;
}

auto PlainHighlighter::highlight(di::StringView code, di::StringView) const -> di::Vector<CodeLine> {
    auto result = di::Vector<CodeLine> {};
    for (auto line : split_lines(code)) {
        result.push_back(CodeLine { line.to_owned(), line.to_owned() });
    }
    return result;
}
}
