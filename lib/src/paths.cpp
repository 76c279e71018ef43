#include "prez/paths.h"

#include "di/container/algorithm/find_last.h"
#include "di/container/view/transform.h"
#include "di/util/construct.h"

namespace prez {
auto to_path(di::StringView path) -> di::Path {
    auto raw = path.span() | di::transform(di::construct<char>) | di::to<di::TransparentString>();
    return di::Path(di::move(raw));
}

auto resolve_path(di::PathView base, di::StringView path) -> di::Path {
    auto result = to_path(path);
    if (result.is_absolute() || base.data().empty()) {
        return result;
    }
    auto resolved = base.to_owned();
    resolved /= result.data();
    return resolved;
}

auto absolute_path(di::PathView path, di::PathView working_directory) -> di::Path {
    if (path.is_absolute()) {
        return path.to_owned();
    }
    auto result = working_directory.to_owned();
    result /= path.data();
    return result;
}

auto parent_directory(di::PathView path) -> di::Path {
    auto data = path.data();
    auto [slash, _] = di::find_last(data, '/');
    if (slash == data.end()) {
        return {};
    }
    if (slash == data.begin()) {
        return "/"_pv.to_owned();
    }
    return di::Path(data.substr(data.begin(), slash).to_owned());
}
}
