#pragma once

#include "di/container/string/string.h"
#include "di/container/vector/vector.h"

namespace prez {
// Numeric parameters of an outgoing CSI sequence, serialized separated by `;`.
class Params {
public:
    Params() = default;

    auto empty() const -> bool { return m_values.empty(); }
    auto size() const -> usize { return m_values.size(); }

    void add(u32 value) { m_values.push_back(value); }

    template<typename... Ts>
    void add(u32 value, Ts... rest) {
        add(value);
        add(rest...);
    }

    auto to_string() const -> di::String;

    auto operator==(Params const&) const -> bool = default;

private:
    di::Vector<u32> m_values;
};
}
