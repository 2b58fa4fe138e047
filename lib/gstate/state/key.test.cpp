/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <gstate/common/test.hpp>
#include "key.hpp"

namespace {
    using namespace gstate;
    using namespace gstate::state;

    hash_t filled_hash(const uint8_t b)
    {
        hash_t h {};
        std::fill(h.begin(), h.end(), b);
        return h;
    }
}

suite gstate_state_key_suite = [] {
    "gstate::state::key"_test = [] {
        "encoding"_test = [] {
            const auto addr = account_address_t::from_hex("000102030405060708090A0B0C0D0E0F10111213");
            expect_equal(uint8_vector::from_hex("00000102030405060708090A0B0C0D0E0F10111213"), state::key_t::account(addr).encode());
            expect_equal(uint8_vector::from_hex("01" "1111111111111111111111111111111111111111111111111111111111111111"),
                state::key_t::hash(filled_hash(0x11)).encode());
            expect_equal(uint8_vector::from_hex("02" "2222222222222222222222222222222222222222222222222222222222222222" "07"),
                state::key_t::uref(filled_hash(0x22), access_rights::read_add_write).encode());
        };
        "decoding"_test = [] {
            const auto k = state::key_t::uref(filled_hash(0x33), access_rights::read_write);
            expect_equal(k, from_bytes<state::key_t>(k.encode()));
            expect_equal(std::string_view { "uref" }, k.type_name());
            expect(throws<error>([] {
                from_bytes<state::key_t>(uint8_vector::from_hex("03" "0000000000000000000000000000000000000000"));
            }));
            expect(throws<error>([] {
                from_bytes<state::key_t>(uint8_vector::from_hex("02" "2222222222222222222222222222222222222222222222222222222222222222" "08"));
            }));
            expect(throws<error>([] { from_bytes<state::key_t>(uint8_vector::from_hex("00" "0102")); }));
        };
        "invalid access rights"_test = [] {
            expect(throws<error>([] { static_cast<void>(state::key_t::uref(filled_hash(0x01), 8)); }));
        };
        "order matches the encoded order"_test = [] {
            std::vector<state::key_t> keys {
                state::key_t::uref(filled_hash(0x01), access_rights::write),
                state::key_t::hash(filled_hash(0x02)),
                state::key_t::account(account_address_t::from_hex("FF00000000000000000000000000000000000000")),
                state::key_t::uref(filled_hash(0x01), access_rights::read),
                state::key_t::hash(filled_hash(0x01)),
                state::key_t::account(account_address_t::from_hex("0000000000000000000000000000000000000001"))
            };
            auto by_key = keys;
            std::sort(by_key.begin(), by_key.end());
            auto by_bytes = keys;
            std::sort(by_bytes.begin(), by_bytes.end(), [](const auto &a, const auto &b) {
                return a.encode() < b.encode();
            });
            expect(by_key == by_bytes);
            expect_equal(state::key_t::account(account_address_t::from_hex("0000000000000000000000000000000000000001")), by_key.front());
            expect_equal(state::key_t::uref(filled_hash(0x01), access_rights::write), by_key.back());
        };
        "format"_test = [] {
            const auto k = state::key_t::uref(filled_hash(0xAB), access_rights::read_add_write);
            expect_equal(std::string { "uref:ABABABABABABABABABABABABABABABABABABABABABABABABABABABABABABABAB:111" }, fmt::format("{}", k));
        };
    };
};
