#pragma once

#include "di/container/path/path.h"
#include "di/container/path/path_view.h"
#include "di/container/string/string_view.h"

namespace prez {
// Document text is UTF-8 while paths are raw bytes, so paths taken from documents need converting.
auto to_path(di::StringView path) -> di::Path;

// Resolves path against base unless it is already absolute.
auto resolve_path(di::PathView base, di::StringView path) -> di::Path;

// Makes path absolute by joining it onto working_directory.
auto absolute_path(di::PathView path, di::PathView working_directory) -> di::Path;

// Directory containing path, or an empty path if it has no directory component.
auto parent_directory(di::PathView path) -> di::Path;
}
