/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "key.hpp"

namespace gstate::state {
    uref_key_t uref_key_t::from_bytes(decoder &dec)
    {
        uref_key_t res {};
        dec.process_bytes_fixed(res.address);
        res.rights = dec.uint_fixed<uint8_t>(1);
        if (res.rights > access_rights::read_add_write) [[unlikely]]
            throw error(fmt::format("invalid uref access rights: {}", res.rights));
        return res;
    }

    void uref_key_t::to_bytes(encoder &enc) const
    {
        if (rights > access_rights::read_add_write) [[unlikely]]
            throw error(fmt::format("invalid uref access rights: {}", rights));
        enc.process_bytes_fixed(address);
        enc.uint_fixed(1, rights);
    }

    key_t key_t::account(const account_address_t &address)
    {
        return account_key_t { address };
    }

    key_t key_t::hash(const hash_t &hash)
    {
        return hash_key_t { hash };
    }

    key_t key_t::uref(const hash_t &address, const uint8_t rights)
    {
        if (rights > access_rights::read_add_write) [[unlikely]]
            throw error(fmt::format("invalid uref access rights: {}", rights));
        return uref_key_t { address, rights };
    }

    key_t key_t::from_bytes(decoder &dec)
    {
        switch (const auto typ = dec.uint_fixed<uint8_t>(1); typ) {
            case 0: return codec::from<account_key_t>(dec);
            case 1: return codec::from<hash_key_t>(dec);
            case 2: return uref_key_t::from_bytes(dec);
            [[unlikely]] default: throw error(fmt::format("unsupported key type: {}", typ));
        }
    }

    void key_t::to_bytes(encoder &enc) const
    {
        enc.uint_fixed(1, index());
        std::visit([&](const auto &k) {
            enc.process(k);
        }, *this);
    }

    uint8_vector key_t::encode() const
    {
        encoder enc { *this };
        return std::move(enc.bytes());
    }

    std::string_view key_t::type_name() const
    {
        using namespace std::string_view_literals;
        static constexpr std::array names { "account"sv, "hash"sv, "uref"sv };
        return names.at(index());
    }
}
