#include "prez/text_width.h"

#include "dius/unicode/width.h"

namespace prez {
auto display_width(di::StringView text) -> usize {
    auto result = 0_usize;
    for (auto code_point : text) {
        result += dius::unicode::code_point_width(code_point).value_or(0);
    }
    return result;
}

static auto is_white_space(c32 code_point) -> bool {
    return code_point == U' ' || code_point == U'\t' || code_point == U'\r' || code_point == U'\n';
}

auto trim_end(di::StringView text) -> di::StringView {
    auto end = text.begin();
    for (auto it = text.begin(); it != text.end(); ++it) {
        if (!is_white_space(*it)) {
            end = it;
            ++end;
        }
    }
    return text.substr(text.begin(), end);
}
}
