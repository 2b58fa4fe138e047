/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/test.hpp>
#include "update-map.hpp"

namespace {
    using namespace gstate;
    using namespace gstate::container;
    using map_t = std::map<uint8_vector, uint8_vector>;
}

suite gstate_container_update_map_suite = [] {
    "gstate::container::update_map"_test = [] {
        "staged updates are invisible to the base until commit"_test = [] {
            map_t base {};
            base.try_emplace(uint8_vector::from_hex("01"), uint8_vector::from_hex("AA"));
            update_map_t<map_t> m { base };
            expect_equal(std::optional { uint8_vector::from_hex("AA") }, m.get(uint8_vector::from_hex("01")));
            expect_equal(std::optional<uint8_vector> {}, m.get(uint8_vector::from_hex("02")));
            m.set(uint8_vector::from_hex("01"), uint8_vector::from_hex("BB"));
            m.set(uint8_vector::from_hex("02"), uint8_vector::from_hex("CC"));
            expect_equal(std::optional { uint8_vector::from_hex("BB") }, m.get(uint8_vector::from_hex("01")));
            expect_equal(size_t { 1 }, base.size());
            expect_equal(uint8_vector::from_hex("AA"), base.at(uint8_vector::from_hex("01")));
            m.commit(base);
            expect(m.empty());
            expect_equal(size_t { 2 }, base.size());
            expect_equal(uint8_vector::from_hex("BB"), base.at(uint8_vector::from_hex("01")));
            expect_equal(uint8_vector::from_hex("CC"), base.at(uint8_vector::from_hex("02")));
        };
        "setting the base value drops the update"_test = [] {
            map_t base {};
            base.try_emplace(uint8_vector::from_hex("01"), uint8_vector::from_hex("AA"));
            update_map_t<map_t> m { base };
            m.set(uint8_vector::from_hex("01"), uint8_vector::from_hex("BB"));
            expect(!m.empty());
            m.set(uint8_vector::from_hex("01"), uint8_vector::from_hex("AA"));
            expect(m.empty());
        };
    };
};
