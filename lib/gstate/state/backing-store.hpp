#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <optional>
#include <span>
#include <gstate/storage/lmdb.hpp>
#include "errors.hpp"
#include "value.hpp"

namespace gstate::state {
    using key_value_t = std::pair<key_t, value_t>;

    // Stores values as opaque byte strings. The encoding and decoding happen at this boundary only.
    struct backing_store_t {
        // a typed view over a single write transaction of the underlying store
        struct txn_t {
            explicit txn_t(storage::txn_t &txn):
                _txn { txn }
            {
            }

            [[nodiscard]] std::optional<value_t> read_opt(const key_t &key) const;
            void put(const key_t &key, const value_t &val);
        private:
            storage::txn_t &_txn;
        };
        using update_func_t = std::function<void(txn_t &)>;

        static backing_store_t open(storage::lmdb::registry_t &registry, std::string_view dir_path,
            const storage::lmdb::config_t &cfg={});

        explicit backing_store_t(storage::db_ptr_t db);

        [[nodiscard]] value_t read(const key_t &key) const;
        [[nodiscard]] std::optional<value_t> read_opt(const key_t &key) const;
        void write(std::span<const key_value_t> items);
        void write_single(const key_t &key, const value_t &val);
        void update(const update_func_t &fn);

        [[nodiscard]] const storage::db_ptr_t &db() const noexcept
        {
            return _db;
        }
    private:
        storage::db_ptr_t _db;
    };
}
