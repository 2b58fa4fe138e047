/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/test.hpp>
#include "value.hpp"

namespace {
    using namespace gstate;
    using namespace gstate::state;

    std::string repeat(const std::string_view hex_byte, const size_t n)
    {
        std::string res {};
        for (size_t i = 0; i < n; ++i)
            res += hex_byte;
        return res;
    }

    hash_t filled_hash(const uint8_t b)
    {
        hash_t h {};
        std::fill(h.begin(), h.end(), b);
        return h;
    }
}

suite gstate_state_value_suite = [] {
    "gstate::state::value"_test = [] {
        const auto acc_key = state::key_t::account(account_address_t::from_hex("0000000000000000000000000000000000000001"));
        "canonical encoding"_test = [&] {
            const std::vector<std::pair<value_t, std::string>> cases {
                { int32_t { -1 }, "00FFFFFFFF" },
                { uint128_t { 150 }, "0196" + repeat("00", 15) },
                { uint256_t { 0x0102 }, "020201" + repeat("00", 30) },
                { uint512_t { 1 }, "0301" + repeat("00", 63) },
                { uint8_vector::from_hex("010203"), "0403010203" },
                { std::vector<int32_t> { 1, -1 }, "050201000000FFFFFFFF" },
                { std::string { "hello" }, "06" "05" "68656C6C6F" },
                { std::vector<std::string> { "a", "bc" }, "07" "02" "0161" "026263" },
                { named_key_t { "x", state::key_t::hash(filled_hash(0x11)) }, "08" "0178" "01" + repeat("11", 32) },
                { account_t { public_key_t::from_hex(repeat("AA", 32)), 1, named_keys_t { { "a", acc_key } } },
                    "09" + repeat("AA", 32) + "0100000000000000" "01" "0161" "00" + repeat("00", 19) + "01" },
                { contract_t { uint8_vector::from_hex("C0DE"), named_keys_t {}, 1 }, "0A" "02" "C0DE" "00" "0100000000000000" }
            };
            for (const auto &[val, hex]: cases) {
                const auto exp = uint8_vector::from_hex(hex);
                expect_equal(exp, val.encode(), val.type_name());
                expect_equal(val, value_t::decode(exp), val.type_name());
            }
        };
        "decoding failures"_test = [&] {
            // unknown tag
            expect(throws<error>([] { static_cast<void>(value_t::decode(uint8_vector::from_hex("0B00"))); }));
            // trailing bytes
            expect(throws<error>([] { static_cast<void>(value_t::decode(uint8_vector::from_hex("00FFFFFFFF00"))); }));
            // truncated
            expect(throws<error>([] { static_cast<void>(value_t::decode(uint8_vector::from_hex("01" + repeat("00", 15)))); }));
            // named keys out of order
            const auto key_hex = "00" + repeat("00", 19) + "01";
            const auto unordered = "09" + repeat("AA", 32) + "0100000000000000" "02" "0162" + key_hex + "0161" + key_hex;
            expect(throws<error>([&] { static_cast<void>(value_t::decode(uint8_vector::from_hex(unordered))); }));
            // duplicate named keys
            const auto duplicate = "09" + repeat("AA", 32) + "0100000000000000" "02" "0161" + key_hex + "0161" + key_hex;
            expect(throws<error>([&] { static_cast<void>(value_t::decode(uint8_vector::from_hex(duplicate))); }));
        };
        "size limit"_test = [] {
            const value_t big { uint8_vector(max_sequence_size + 1) };
            expect(throws<error>([&] { static_cast<void>(big.encode()); }));
            const value_t max { uint8_vector(max_sequence_size) };
            expect_equal(max, value_t::decode(max.encode()));
        };
        "format"_test = [&] {
            expect_equal(std::string { "uint512:150" }, fmt::format("{}", value_t { uint512_t { 150 } }));
            expect_equal(std::string { "list_int32:[1, 2]" }, fmt::format("{}", value_t { std::vector<int32_t> { 1, 2 } }));
            expect_equal(std::string { "string:hello" }, fmt::format("{}", value_t { std::string { "hello" } }));
            expect_equal(std::string { "byte_array:C0DE" }, fmt::format("{}", value_t { uint8_vector::from_hex("C0DE") }));
        };
    };
};
