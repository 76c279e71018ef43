#pragma once

#include "di/container/string/prelude.h"
#include "prez/presentation.h"
#include "prez/render_operation.h"
#include "prez/size.h"

namespace prez {
// Human readable listing of render operations, one per line. Dynamic operations are expanded
// using the given dimensions and listed indented below them.
auto dump_operations(di::Span<RenderOperation const> operations, WindowSize const& dimensions, usize depth = 0)
    -> di::String;
auto dump_presentation(Presentation const& presentation, WindowSize const& dimensions) -> di::String;
}
