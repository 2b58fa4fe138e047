#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <fmt/core.h>
#include <fmt/format.h>

namespace gstate {
    template<typename... Args>
    std::string format(fmt::format_string<Args...> fmt, Args&&... a)
    {
        return fmt::format(fmt, std::forward<Args>(a)...);
    }
}

namespace fmt {
    // byte strings are always rendered as uppercase hex without a prefix
    template<>
    struct formatter<std::span<const uint8_t>>: formatter<int> {
        template<typename T, typename FormatContext>
        auto format(const T &data, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = ctx.out();
            for (const uint8_t v: data) {
                out_it = fmt::format_to(out_it, "{:02X}", v);
            }
            return out_it;
        }
    };

    template<typename T>
    struct formatter<std::optional<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const std::optional<T> &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            if (v)
                return fmt::format_to(ctx.out(), "{}", *v);
            return fmt::format_to(ctx.out(), "std::nullopt");
        }
    };
}
