/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "transform.hpp"

namespace gstate::state {
    namespace {
        int32_t wrapping_add(const int32_t a, const int32_t b)
        {
            return static_cast<int32_t>(static_cast<uint32_t>(a) + static_cast<uint32_t>(b));
        }

        template<wide_uint_c T>
        T checked_add(const T &a, const T &b, const std::string_view type)
        {
            // fixed-width unchecked integers wrap around
            T sum = a + b;
            if (sum < a) [[unlikely]]
                throw err_overflow_t { type };
            return sum;
        }

        void union_keys(named_keys_t &target, const named_keys_t &update)
        {
            for (const auto &[name, key]: update) {
                if (const auto [it, created] = target.try_emplace(name, key); !created && it->second != key) [[unlikely]]
                    throw err_merge_type_t(fmt::format("named key {} maps to {} and cannot be remapped to {}", name, it->second, key));
            }
        }
    }

    transform_t transform_t::from_bytes(decoder &dec)
    {
        switch (const auto typ = dec.uint_fixed<uint8_t>(1); typ) {
            case 0: return identity_t {};
            case 1: return write_t { value_t::from_bytes(dec) };
            case 2: {
                int32_t delta;
                dec.process(delta);
                return add_int32_t { delta };
            }
            case 3: return add_uint128_t { decode_wide_uint<uint128_t>(dec) };
            case 4: return add_uint256_t { decode_wide_uint<uint256_t>(dec) };
            case 5: return add_uint512_t { decode_wide_uint<uint512_t>(dec) };
            case 6: return add_keys_t { named_keys_t::from_bytes(dec) };
            [[unlikely]] default: throw error(fmt::format("unsupported transform type: {}", typ));
        }
    }

    void transform_t::to_bytes(encoder &enc) const
    {
        enc.uint_fixed(1, index());
        std::visit([&](const auto &t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, write_t>) {
                t.value.to_bytes(enc);
            } else if constexpr (std::is_same_v<T, add_int32_t>) {
                enc.process(t.delta);
            } else if constexpr (std::is_same_v<T, add_keys_t>) {
                t.keys.to_bytes(enc);
            } else if constexpr (!std::is_same_v<T, identity_t>) {
                encode_wide_uint(enc, t.delta);
            }
        }, *this);
    }

    value_t transform_t::merge(value_t current) const
    {
        return std::visit([&](const auto &t) -> value_t {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, identity_t>) {
                return current;
            } else if constexpr (std::is_same_v<T, write_t>) {
                return t.value;
            } else if constexpr (std::is_same_v<T, add_int32_t>) {
                if (auto *v = std::get_if<int32_t>(&current)) {
                    *v = wrapping_add(*v, t.delta);
                    return current;
                }
            } else if constexpr (std::is_same_v<T, add_keys_t>) {
                if (auto *acc = std::get_if<account_t>(&current)) {
                    union_keys(acc->named_keys, t.keys);
                    return current;
                }
                if (auto *con = std::get_if<contract_t>(&current)) {
                    union_keys(con->named_keys, t.keys);
                    return current;
                }
            } else {
                using D = decltype(t.delta);
                if (auto *v = std::get_if<D>(&current)) {
                    *v = checked_add(*v, t.delta, current.type_name());
                    return current;
                }
            }
            throw err_merge_type_t { type_name(), current.type_name() };
        }, *this);
    }

    transform_t transform_t::compose(const transform_t &next) const
    {
        return std::visit([&](const auto &a, const auto &b) -> transform_t {
            using A = std::decay_t<decltype(a)>;
            using B = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<B, write_t>) {
                return b;
            } else if constexpr (std::is_same_v<B, identity_t>) {
                return a;
            } else if constexpr (std::is_same_v<A, identity_t>) {
                return b;
            } else if constexpr (std::is_same_v<A, write_t>) {
                return write_t { next.merge(a.value) };
            } else if constexpr (std::is_same_v<A, B>) {
                if constexpr (std::is_same_v<A, add_int32_t>) {
                    return add_int32_t { wrapping_add(a.delta, b.delta) };
                } else if constexpr (std::is_same_v<A, add_keys_t>) {
                    auto keys = a.keys;
                    union_keys(keys, b.keys);
                    return add_keys_t { std::move(keys) };
                } else {
                    return A { checked_add(a.delta, b.delta, type_name()) };
                }
            } else {
                throw err_merge_type_t(fmt::format("a {} transform cannot be followed by a {} transform", type_name(), next.type_name()));
            }
        }, *this, next);
    }

    std::string_view transform_t::type_name() const
    {
        using namespace std::string_view_literals;
        static constexpr std::array names {
            "identity"sv,
            "write"sv,
            "add_int32"sv,
            "add_uint128"sv,
            "add_uint256"sv,
            "add_uint512"sv,
            "add_keys"sv
        };
        static_assert(names.size() == std::variant_size_v<base_type>);
        return names.at(index());
    }

    uint8_vector encode_effects(const effect_list_t &effects)
    {
        encoder enc {};
        enc.uint_varlen(effects.size());
        for (const auto &[key, t]: effects) {
            key.to_bytes(enc);
            t.to_bytes(enc);
        }
        return std::move(enc.bytes());
    }

    effect_list_t decode_effects(const buffer bytes)
    {
        decoder dec { bytes };
        const auto sz = dec.uint_varlen<size_t>();
        effect_list_t effects {};
        for (size_t i = 0; i < sz; ++i) {
            auto key = key_t::from_bytes(dec);
            effects.emplace_back(std::move(key), transform_t::from_bytes(dec));
        }
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} unexpected trailing bytes after an effect list", dec.size()));
        return effects;
    }
}
