/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "numeric-cast.hpp"

namespace {
    using namespace gstate;
}

suite gstate_common_numeric_cast_suite = [] {
    "gstate::common::numeric_cast"_test = [] {
        "in range"_test = [] {
            expect_equal(uint8_t { 7 }, numeric_cast<uint8_t>(uint64_t { 7 }));
            expect_equal(int32_t { -5 }, numeric_cast<int32_t>(int64_t { -5 }));
            expect_equal(size_t { 0x100000 }, numeric_cast<size_t>(uint64_t { 0x100000 }));
            expect_equal(uint64_t { std::numeric_limits<int64_t>::max() }, numeric_cast<uint64_t>(std::numeric_limits<int64_t>::max()));
        };
        "out of range"_test = [] {
            expect(throws([] { numeric_cast<uint8_t>(uint64_t { 256 }); }));
            expect(throws([] { numeric_cast<uint32_t>(int64_t { -1 }); }));
            expect(throws([] { numeric_cast<int32_t>(std::numeric_limits<uint64_t>::max()); }));
        };
    };
};
