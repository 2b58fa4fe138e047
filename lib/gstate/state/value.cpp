/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "value.hpp"

namespace gstate::state {
    named_keys_t named_keys_t::from_bytes(decoder &dec)
    {
        named_keys_t res {};
        const auto sz = dec.uint_varlen<size_t>();
        for (size_t i = 0; i < sz; ++i) {
            std::string name {};
            dec.process_string(name);
            auto key = key_t::from_bytes(dec);
            if (!res.empty() && !(res.rbegin()->first < name)) [[unlikely]]
                throw error(fmt::format("named keys are not in strictly increasing order: {} after {}", name, res.rbegin()->first));
            res.emplace_hint(res.end(), std::move(name), std::move(key));
        }
        return res;
    }

    void named_keys_t::to_bytes(encoder &enc) const
    {
        enc.uint_varlen(size());
        for (const auto &[name, key]: *this) {
            enc.process_string(name);
            key.to_bytes(enc);
        }
    }

    value_t value_t::from_bytes(decoder &dec)
    {
        switch (const auto typ = dec.uint_fixed<uint8_t>(1); typ) {
            case 0: {
                int32_t v;
                dec.process(v);
                return v;
            }
            case 1: return decode_wide_uint<uint128_t>(dec);
            case 2: return decode_wide_uint<uint256_t>(dec);
            case 3: return decode_wide_uint<uint512_t>(dec);
            case 4: {
                uint8_vector v {};
                dec.process_bytes(v);
                return v;
            }
            case 5: {
                std::vector<int32_t> v {};
                dec.process_array(v);
                return v;
            }
            case 6: {
                std::string v {};
                dec.process_string(v);
                return v;
            }
            case 7: {
                std::vector<std::string> v {};
                dec.process_array(v);
                return v;
            }
            case 8: return codec::from<named_key_t>(dec);
            case 9: return codec::from<account_t>(dec);
            case 10: return codec::from<contract_t>(dec);
            [[unlikely]] default: throw error(fmt::format("unsupported value type: {}", typ));
        }
    }

    value_t value_t::decode(const buffer bytes)
    {
        return state::from_bytes<value_t>(bytes);
    }

    void value_t::to_bytes(encoder &enc) const
    {
        enc.uint_fixed(1, index());
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (wide_uint_c<T>) {
                encode_wide_uint(enc, v);
            } else if constexpr (std::is_same_v<T, uint8_vector>) {
                enc.process_bytes(v);
            } else if constexpr (std::is_same_v<T, std::vector<int32_t>> || std::is_same_v<T, std::vector<std::string>>) {
                enc.process_array(v);
            } else {
                enc.process(v);
            }
        }, *this);
    }

    uint8_vector value_t::encode() const
    {
        encoder enc { *this };
        return std::move(enc.bytes());
    }

    std::string_view value_t::type_name() const
    {
        using namespace std::string_view_literals;
        static constexpr std::array names {
            "int32"sv,
            "uint128"sv,
            "uint256"sv,
            "uint512"sv,
            "byte_array"sv,
            "list_int32"sv,
            "string"sv,
            "list_string"sv,
            "named_key"sv,
            "account"sv,
            "contract"sv
        };
        static_assert(names.size() == std::variant_size_v<base_type>);
        return names.at(index());
    }
}
