#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <variant>
#include "encoding.hpp"

namespace gstate::state {
    using account_address_t = byte_array<20>;
    using hash_t = byte_array<32>;

    namespace access_rights {
        static constexpr uint8_t none = 0;
        static constexpr uint8_t read = 1;
        static constexpr uint8_t write = 2;
        static constexpr uint8_t add = 4;
        static constexpr uint8_t read_write = read | write;
        static constexpr uint8_t read_add_write = read | add | write;
    }

    struct account_key_t {
        account_address_t address {};

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(address);
        }

        std::strong_ordering operator<=>(const account_key_t &o) const noexcept = default;
        bool operator==(const account_key_t &o) const noexcept = default;
    };

    struct hash_key_t {
        hash_t hash {};

        void serialize(auto &archive)
        {
            archive.process_bytes_fixed(hash);
        }

        std::strong_ordering operator<=>(const hash_key_t &o) const noexcept = default;
        bool operator==(const hash_key_t &o) const noexcept = default;
    };

    struct uref_key_t {
        hash_t address {};
        uint8_t rights = access_rights::none;

        static uref_key_t from_bytes(decoder &dec);
        void to_bytes(encoder &enc) const;

        std::strong_ordering operator<=>(const uref_key_t &o) const noexcept = default;
        bool operator==(const uref_key_t &o) const noexcept = default;
    };

    using key_base_t = std::variant<account_key_t, hash_key_t, uref_key_t>;

    // Ordered by the tag first and then by the payload which matches the byte order of the encoded keys.
    struct key_t: key_base_t {
        using base_type = key_base_t;
        using base_type::base_type;

        static key_t account(const account_address_t &address);
        static key_t hash(const hash_t &hash);
        static key_t uref(const hash_t &address, uint8_t rights);
        static key_t from_bytes(decoder &dec);

        void to_bytes(encoder &enc) const;
        [[nodiscard]] uint8_vector encode() const;
        [[nodiscard]] std::string_view type_name() const;

        std::strong_ordering operator<=>(const key_t &o) const noexcept
        {
            return static_cast<const base_type &>(*this) <=> static_cast<const base_type &>(o);
        }

        bool operator==(const key_t &o) const noexcept
        {
            return static_cast<const base_type &>(*this) == static_cast<const base_type &>(o);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<gstate::state::key_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const gstate::state::key_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace gstate::state;
            return std::visit([&](const auto &k) {
                using T = std::decay_t<decltype(k)>;
                if constexpr (std::is_same_v<T, account_key_t>) {
                    return fmt::format_to(ctx.out(), "account:{}", k.address);
                } else if constexpr (std::is_same_v<T, hash_key_t>) {
                    return fmt::format_to(ctx.out(), "hash:{}", k.hash);
                } else {
                    return fmt::format_to(ctx.out(), "uref:{}:{:03b}", k.address, k.rights);
                }
            }, v);
        }
    };
}
