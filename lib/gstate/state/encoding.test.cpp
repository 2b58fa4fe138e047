/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/test.hpp>
#include "encoding.hpp"

namespace {
    using namespace gstate;
    using namespace gstate::state;
    using namespace std::string_view_literals;
}

suite gstate_state_encoding_suite = [] {
    "gstate::state::encoding"_test = [] {
        "uint_varlen"_test = [] {
            const std::vector<std::pair<uint64_t, std::string_view>> cases {
                { 0, "00" },
                { 127, "7F" },
                { 128, "8080" },
                { 1023, "83FF" },
                { 16384, "C00040" },
                { (uint64_t { 1 } << 56) - 1, "FEFFFFFFFFFFFFFF" },
                { uint64_t { 1 } << 56, "FF0000000000000001" },
                { std::numeric_limits<uint64_t>::max(), "FFFFFFFFFFFFFFFFFF" }
            };
            for (const auto &[val, hex]: cases) {
                const auto exp = uint8_vector::from_hex(hex);
                encoder enc {};
                enc.uint_varlen(val);
                expect_equal(exp, enc.bytes(), hex);
                decoder dec { exp };
                expect_equal(val, dec.uint_varlen(), hex);
                expect(dec.empty());
            }
        };
        "uint_varlen rejects longer than necessary forms"_test = [] {
            for (const auto hex: { "8003"sv, "807F"sv, "C00000"sv, "C0FF3F"sv, "FE00000000000001"sv, "FF0000000000000000"sv, "FFFFFFFFFFFFFFFF00"sv }) {
                const auto bytes = uint8_vector::from_hex(hex);
                decoder dec { bytes };
                expect(throws<error>([&] { static_cast<void>(dec.uint_varlen()); }));
            }
            expect(throws<error>([] { from_bytes<std::string>(uint8_vector::from_hex("800568656C6C6F")); }));
        };
        "little-endian integers"_test = [] {
            encoder enc { uint32_t { 0x01020304 }, int32_t { -2 }, uint64_t { 5 } };
            expect_equal(uint8_vector::from_hex("04030201FEFFFFFF0500000000000000"), enc.bytes());
            decoder dec { enc.bytes() };
            uint32_t a;
            int32_t b;
            uint64_t c;
            dec.process(a);
            dec.process(b);
            dec.process(c);
            expect_equal(uint32_t { 0x01020304 }, a);
            expect_equal(int32_t { -2 }, b);
            expect_equal(uint64_t { 5 }, c);
        };
        "strings"_test = [] {
            encoder enc { std::string { "hello" } };
            expect_equal(uint8_vector::from_hex("0568656C6C6F"), enc.bytes());
            expect_equal(std::string { "hello" }, from_bytes<std::string>(enc.bytes()));
        };
        "truncated input"_test = [] {
            expect(throws<error>([] { from_bytes<uint32_t>(uint8_vector::from_hex("010203")); }));
            expect(throws<error>([] { from_bytes<std::string>(uint8_vector::from_hex("0568656C")); }));
        };
        "trailing bytes"_test = [] {
            expect(throws<error>([] { from_bytes<uint32_t>(uint8_vector::from_hex("0102030405")); }));
        };
        "sequence size limit"_test = [] {
            const uint8_vector big(max_sequence_size + 1);
            encoder enc {};
            expect(throws<error>([&] { enc.process_bytes(big); }));
            expect(enc.bytes().empty());
            encoder len_enc {};
            len_enc.uint_varlen(max_sequence_size + 1);
            decoder dec { len_enc.bytes() };
            uint8_vector out {};
            expect(throws<error>([&] { dec.process_bytes(out); }));
        };
    };
};
