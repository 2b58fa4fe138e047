#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <utility>
#include <variant>
#include <vector>
#include "errors.hpp"
#include "value.hpp"

namespace gstate::state {
    struct identity_t {
        bool operator==(const identity_t &) const
        {
            return true;
        }
    };

    struct write_t {
        value_t value {};

        bool operator==(const write_t &o) const = default;
    };

    // a commutative accumulation into a value of the same type
    template<typename T>
    struct add_t {
        T delta {};

        bool operator==(const add_t &o) const = default;
    };
    using add_int32_t = add_t<int32_t>;
    using add_uint128_t = add_t<uint128_t>;
    using add_uint256_t = add_t<uint256_t>;
    using add_uint512_t = add_t<uint512_t>;

    struct add_keys_t {
        named_keys_t keys {};

        bool operator==(const add_keys_t &o) const = default;
    };

    using transform_base_t = std::variant<
        identity_t,
        write_t,
        add_int32_t,
        add_uint128_t,
        add_uint256_t,
        add_uint512_t,
        add_keys_t
    >;

    struct transform_t: transform_base_t {
        using base_type = transform_base_t;
        using base_type::base_type;

        static transform_t from_bytes(decoder &dec);
        void to_bytes(encoder &enc) const;

        // Computes the new value of a key currently holding the given value.
        // Throws err_merge_type_t when the shapes do not match and err_overflow_t on an unsigned overflow.
        [[nodiscard]] value_t merge(value_t current) const;

        // A single transform equivalent to applying this one and then the next.
        [[nodiscard]] transform_t compose(const transform_t &next) const;

        [[nodiscard]] bool is_write() const noexcept
        {
            return std::holds_alternative<write_t>(*this);
        }

        [[nodiscard]] std::string_view type_name() const;

        bool operator==(const transform_t &o) const
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }
    };

    using effect_t = std::pair<key_t, transform_t>;
    using effect_list_t = std::vector<effect_t>;

    // the canonical representation of an effect stream: a count followed by the (key, transform) pairs in order
    extern uint8_vector encode_effects(const effect_list_t &effects);
    extern effect_list_t decode_effects(buffer bytes);
}

namespace fmt {
    template<>
    struct formatter<gstate::state::transform_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const gstate::state::transform_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace gstate::state;
            return std::visit([&](const auto &vv) {
                using T = std::decay_t<decltype(vv)>;
                if constexpr (std::is_same_v<T, identity_t>) {
                    return fmt::format_to(ctx.out(), "{}", v.type_name());
                } else if constexpr (std::is_same_v<T, write_t>) {
                    return fmt::format_to(ctx.out(), "{}({})", v.type_name(), vv.value);
                } else if constexpr (std::is_same_v<T, add_int32_t>) {
                    return fmt::format_to(ctx.out(), "{}({})", v.type_name(), vv.delta);
                } else if constexpr (std::is_same_v<T, add_keys_t>) {
                    return fmt::format_to(ctx.out(), "{}({})", v.type_name(), vv.keys);
                } else {
                    return fmt::format_to(ctx.out(), "{}({})", v.type_name(), vv.delta.str());
                }
            }, v);
        }
    };
}
