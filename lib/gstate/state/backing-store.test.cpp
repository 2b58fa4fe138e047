/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/test.hpp>
#include <gstate/storage/memory.hpp>
#include "backing-store.hpp"

namespace {
    using namespace gstate;
    using namespace gstate::state;
    using namespace std::string_view_literals;

    const storage::lmdb::config_t test_config { .map_size=1ULL << 24U, .no_sync=true };

    template<typename F>
    void for_each_store(const std::string_view name, const F &f)
    {
        {
            backing_store_t store { std::make_shared<storage::memory::db_t>() };
            f(store);
        }
        {
            const file::tmp_directory tmp_dir { fmt::format("test-gstate-backing-store-{}", name) };
            storage::lmdb::registry_t reg {};
            auto store = backing_store_t::open(reg, tmp_dir.path(), test_config);
            f(store);
        }
    }

    state::key_t account_key(const uint8_t b)
    {
        account_address_t addr {};
        addr[19] = b;
        return state::key_t::account(addr);
    }
}

suite gstate_state_backing_store_suite = [] {
    "gstate::state::backing_store"_test = [] {
        "read of a missing key"_test = [] {
            for_each_store("missing"sv, [](backing_store_t &store) {
                expect(!store.read_opt(account_key(1)).has_value());
                try {
                    static_cast<void>(store.read(account_key(1)));
                    expect(false);
                } catch (const err_key_not_found_t &ex) {
                    expect_equal(account_key(1), ex.key);
                }
            });
        };
        "write and read"_test = [] {
            for_each_store("write"sv, [](backing_store_t &store) {
                const std::vector<key_value_t> items {
                    { account_key(1), uint128_t { 100 } },
                    { account_key(2), std::string { "hello" } },
                    { state::key_t::hash(hash_t {}), account_t { {}, 3, named_keys_t { { "x", account_key(1) } } } }
                };
                store.write(items);
                for (const auto &[k, v]: items)
                    expect_equal(v, store.read(k));
                store.write_single(account_key(1), int32_t { -1 });
                expect_equal(value_t { int32_t { -1 } }, store.read(account_key(1)));
                expect_equal(size_t { 3 }, store.db()->size());
            });
        };
        "a failed encoding leaves no trace"_test = [] {
            for_each_store("atomic"sv, [](backing_store_t &store) {
                store.write_single(account_key(1), int32_t { 1 });
                const std::vector<key_value_t> items {
                    { account_key(1), int32_t { 2 } },
                    { account_key(2), uint8_vector(max_sequence_size + 1) },
                    { account_key(3), int32_t { 3 } }
                };
                expect(throws<error>([&] { store.write(items); }));
                expect_equal(value_t { int32_t { 1 } }, store.read(account_key(1)));
                expect(!store.read_opt(account_key(2)).has_value());
                expect(!store.read_opt(account_key(3)).has_value());
            });
        };
        "undecodable bytes are not a missing key"_test = [] {
            for_each_store("decode"sv, [](backing_store_t &store) {
                store.db()->set(account_key(1).encode(), uint8_vector::from_hex("0B"));
                store.db()->set(account_key(2).encode(), uint8_vector::from_hex("00010203"));
                expect(throws<err_decode_t>([&] { static_cast<void>(store.read(account_key(1))); }));
                expect(throws<err_decode_t>([&] { static_cast<void>(store.read_opt(account_key(2))); }));
            });
        };
        "update"_test = [] {
            for_each_store("update"sv, [](backing_store_t &store) {
                store.update([](backing_store_t::txn_t &txn) {
                    expect(!txn.read_opt(account_key(1)).has_value());
                    txn.put(account_key(1), std::string { "abc" });
                    expect_equal(std::optional<value_t> { std::string { "abc" } }, txn.read_opt(account_key(1)));
                });
                expect_equal(value_t { std::string { "abc" } }, store.read(account_key(1)));
                expect(throws<error>([&] {
                    store.update([](backing_store_t::txn_t &txn) {
                        txn.put(account_key(1), std::string { "def" });
                        throw error("abort");
                    });
                }));
                expect_equal(value_t { std::string { "abc" } }, store.read(account_key(1)));
            });
        };
        "open is idempotent per path"_test = [] {
            const file::tmp_directory tmp_dir { "test-gstate-backing-store-open" };
            storage::lmdb::registry_t reg {};
            auto store1 = backing_store_t::open(reg, tmp_dir.path(), test_config);
            auto store2 = backing_store_t::open(reg, tmp_dir.path(), test_config);
            expect_equal(size_t { 1 }, reg.size());
            store1.write_single(account_key(7), uint256_t { 42 });
            expect_equal(value_t { uint256_t { 42 } }, store2.read(account_key(7)));
            // an independent registry gets its own handle once the first one is released
            store1 = backing_store_t { std::make_shared<storage::memory::db_t>() };
            store2 = backing_store_t { std::make_shared<storage::memory::db_t>() };
            expect_equal(size_t { 0 }, reg.size());
            storage::lmdb::registry_t reg2 {};
            auto store3 = backing_store_t::open(reg2, tmp_dir.path(), test_config);
            expect_equal(value_t { uint256_t { 42 } }, store3.read(account_key(7)));
        };
    };
};
