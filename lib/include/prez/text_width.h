#pragma once

#include "di/container/string/string_view.h"
#include "di/types/prelude.h"

namespace prez {
// Number of terminal columns needed to display text. Each code point contributes its east asian
// width (so wide CJK characters count as 2), and control or zero-width code points count as 0.
auto display_width(di::StringView text) -> usize;

// Drops trailing white space (spaces, tabs, carriage returns and newlines).
auto trim_end(di::StringView text) -> di::StringView;
}
