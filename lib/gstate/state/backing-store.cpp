/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/logger.hpp>
#include "backing-store.hpp"

namespace gstate::state {
    namespace {
        std::optional<value_t> decode_stored(const key_t &key, const storage::value_t &bytes)
        {
            if (!bytes)
                return {};
            try {
                return value_t::decode(*bytes);
            } catch (const error &ex) {
                throw err_decode_t(fmt::format("the value of {} cannot be decoded", key), ex);
            }
        }
    }

    std::optional<value_t> backing_store_t::txn_t::read_opt(const key_t &key) const
    {
        return decode_stored(key, _txn.get(key.encode()));
    }

    void backing_store_t::txn_t::put(const key_t &key, const value_t &val)
    {
        _txn.set(key.encode(), val.encode());
    }

    backing_store_t backing_store_t::open(storage::lmdb::registry_t &registry, const std::string_view dir_path,
        const storage::lmdb::config_t &cfg)
    {
        auto env = registry.open(dir_path, cfg);
        auto db = std::make_shared<storage::lmdb::db_t>(std::move(env), cfg.store_name);
        logger::info("opened the {} store at {}", cfg.store_name, db->dir_path());
        return backing_store_t { std::move(db) };
    }

    backing_store_t::backing_store_t(storage::db_ptr_t db):
        _db { std::move(db) }
    {
        if (!_db) [[unlikely]]
            throw error("backing_store_t requires a storage instance");
    }

    value_t backing_store_t::read(const key_t &key) const
    {
        auto val = read_opt(key);
        if (!val)
            throw err_key_not_found_t { key };
        return std::move(*val);
    }

    std::optional<value_t> backing_store_t::read_opt(const key_t &key) const
    {
        return decode_stored(key, _db->get(key.encode()));
    }

    void backing_store_t::write(const std::span<const key_value_t> items)
    {
        // encode everything first so that an encoding failure happens before the transaction starts
        storage::batch_t batch {};
        batch.reserve(items.size());
        for (const auto &[key, val]: items)
            batch.emplace_back(key.encode(), val.encode());
        _db->write(batch);
    }

    void backing_store_t::write_single(const key_t &key, const value_t &val)
    {
        const key_value_t item { key, val };
        write(std::span { &item, 1 });
    }

    void backing_store_t::update(const update_func_t &fn)
    {
        _db->update([&](storage::txn_t &raw_txn) {
            txn_t txn { raw_txn };
            fn(txn);
        });
    }
}
