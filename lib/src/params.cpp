#include "prez/params.h"

#include "di/container/view/transform.h"
#include "di/format/prelude.h"

namespace prez {
auto Params::to_string() const -> di::String {
    return m_values | di::transform([](u32 value) {
               return di::to_string(value);
           }) |
           di::join_with(U';') | di::to<di::String>();
}
}
