#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <string>
#include <variant>
#include <vector>
#include <boost/multiprecision/cpp_int.hpp>
#include "key.hpp"

namespace gstate::state {
    using uint128_t = boost::multiprecision::uint128_t;
    using uint256_t = boost::multiprecision::uint256_t;
    using uint512_t = boost::multiprecision::uint512_t;
    using public_key_t = byte_array<32>;

    template<typename T>
    concept wide_uint_c = std::is_same_v<T, uint128_t> || std::is_same_v<T, uint256_t> || std::is_same_v<T, uint512_t>;

    template<wide_uint_c T>
    inline constexpr size_t wide_uint_size = 0;
    template<>
    inline constexpr size_t wide_uint_size<uint128_t> = 16;
    template<>
    inline constexpr size_t wide_uint_size<uint256_t> = 32;
    template<>
    inline constexpr size_t wide_uint_size<uint512_t> = 64;

    // fixed-width little-endian
    template<wide_uint_c T>
    void encode_wide_uint(encoder &enc, const T &val)
    {
        std::vector<uint8_t> bytes {};
        bytes.reserve(wide_uint_size<T>);
        boost::multiprecision::export_bits(val, std::back_inserter(bytes), 8, false);
        if (bytes.size() > wide_uint_size<T>) [[unlikely]]
            throw error(fmt::format("{} does not fit into {} bytes", val.str(), wide_uint_size<T>));
        bytes.resize(wide_uint_size<T>, 0);
        enc.process_bytes_fixed(buffer { bytes.data(), bytes.size() });
    }

    template<wide_uint_c T>
    T decode_wide_uint(decoder &dec)
    {
        const auto bytes = dec.next_bytes(wide_uint_size<T>);
        T res {};
        boost::multiprecision::import_bits(res, bytes.begin(), bytes.end(), 8, false);
        return res;
    }

    // Encoded as a count followed by the entries in strictly increasing name order.
    struct named_keys_t: std::map<std::string, key_t> {
        using base_type = std::map<std::string, key_t>;
        using base_type::base_type;

        static named_keys_t from_bytes(decoder &dec);
        void to_bytes(encoder &enc) const;
    };

    struct named_key_t {
        std::string name {};
        key_t key {};

        void serialize(auto &archive)
        {
            archive.process(name);
            archive.process(key);
        }

        bool operator==(const named_key_t &o) const = default;
    };

    struct account_t {
        public_key_t public_key {};
        uint64_t nonce = 0;
        named_keys_t named_keys {};

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(public_key);
            archive.process(nonce);
            archive.process(named_keys);
        }

        bool operator==(const account_t &o) const = default;
    };

    struct contract_t {
        uint8_vector bytes {};
        named_keys_t named_keys {};
        uint64_t protocol_version = 0;

        void serialize(auto &archive)
        {
            archive.process_bytes(bytes);
            archive.process(named_keys);
            archive.process(protocol_version);
        }

        bool operator==(const contract_t &o) const = default;
    };

    using value_base_t = std::variant<
        int32_t,
        uint128_t,
        uint256_t,
        uint512_t,
        uint8_vector,
        std::vector<int32_t>,
        std::string,
        std::vector<std::string>,
        named_key_t,
        account_t,
        contract_t
    >;

    struct value_t: value_base_t {
        using base_type = value_base_t;
        using base_type::base_type;

        static value_t from_bytes(decoder &dec);
        // the canonical byte representation must be consumed entirely
        static value_t decode(buffer bytes);

        void to_bytes(encoder &enc) const;
        [[nodiscard]] uint8_vector encode() const;
        [[nodiscard]] std::string_view type_name() const;

        bool operator==(const value_t &o) const
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<gstate::state::named_keys_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const gstate::state::named_keys_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            auto out_it = fmt::format_to(ctx.out(), "{{");
            for (auto it = v.begin(); it != v.end(); ++it) {
                if (it != v.begin())
                    out_it = fmt::format_to(out_it, ", ");
                out_it = fmt::format_to(out_it, "{}={}", it->first, it->second);
            }
            return fmt::format_to(out_it, "}}");
        }
    };

    template<>
    struct formatter<gstate::state::value_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const gstate::state::value_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace gstate::state;
            return std::visit([&](const auto &vv) {
                using T = std::decay_t<decltype(vv)>;
                auto out_it = fmt::format_to(ctx.out(), "{}:", v.type_name());
                if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, std::string> || std::is_same_v<T, gstate::uint8_vector>) {
                    return fmt::format_to(out_it, "{}", vv);
                } else if constexpr (wide_uint_c<T>) {
                    return fmt::format_to(out_it, "{}", vv.str());
                } else if constexpr (std::is_same_v<T, std::vector<int32_t>> || std::is_same_v<T, std::vector<std::string>>) {
                    out_it = fmt::format_to(out_it, "[");
                    for (size_t i = 0; i < vv.size(); ++i) {
                        if (i)
                            out_it = fmt::format_to(out_it, ", ");
                        out_it = fmt::format_to(out_it, "{}", vv[i]);
                    }
                    return fmt::format_to(out_it, "]");
                } else if constexpr (std::is_same_v<T, named_key_t>) {
                    return fmt::format_to(out_it, "{}={}", vv.name, vv.key);
                } else if constexpr (std::is_same_v<T, account_t>) {
                    return fmt::format_to(out_it, "{} nonce: {} named_keys: {}", vv.public_key, vv.nonce, vv.named_keys);
                } else {
                    return fmt::format_to(out_it, "{} bytes protocol_version: {} named_keys: {}",
                        vv.bytes.size(), vv.protocol_version, vv.named_keys);
                }
            }, v);
        }
    };
}
