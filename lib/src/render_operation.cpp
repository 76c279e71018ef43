#include "prez/render_operation.h"

namespace prez {
auto clone_operation(RenderOperation const& operation) -> RenderOperation {
    return di::visit(
        [](auto const& op) -> RenderOperation {
            return di::clone(op);
        },
        operation);
}

auto clone_operations(di::Vector<RenderOperation> const& operations) -> di::Vector<RenderOperation> {
    auto result = di::Vector<RenderOperation> {};
    for (auto const& operation : operations) {
        result.push_back(clone_operation(operation));
    }
    return result;
}
}
