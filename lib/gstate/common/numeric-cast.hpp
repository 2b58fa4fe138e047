#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <typeinfo>
#include <utility>
#include "format.hpp"
#include "error.hpp"

namespace gstate {
    // lossless integral conversion; throws if the value does not fit into the target type
    template<typename TO, typename FROM>
    constexpr TO numeric_cast(const FROM from)
    {
        static_assert(std::numeric_limits<TO>::is_integer && std::numeric_limits<FROM>::is_integer);
        if (!std::in_range<TO>(from)) [[unlikely]]
            throw error(fmt::format("can't convert {} {} to {}: the value is out of range [{}, {}]",
                typeid(FROM).name(), from, typeid(TO).name(),
                std::numeric_limits<TO>::min(), std::numeric_limits<TO>::max()));
        return static_cast<TO>(from);
    }
}
