/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <mutex>
#include <shared_mutex>
#include <gstate/container/update-map.hpp>
#include "memory.hpp"

namespace gstate::storage::memory {
    struct db_t::impl {
        void clear()
        {
            std::scoped_lock write_lk { _write_mutex };
            std::unique_lock data_lk { _data_mutex };
            _db.clear();
        }

        void foreach(const observer_t &obs) const
        {
            std::shared_lock lk { _data_mutex };
            for (const auto &[k, v]: _db) {
                obs(k, v);
            }
        }

        value_t get(const buffer k) const
        {
            std::shared_lock lk { _data_mutex };
            if (const auto it = _db.find(uint8_vector { k }); it != _db.end())
                return it->second;
            return {};
        }

        void update(const update_func_t &fn)
        {
            // _db is modified only by the holder of the write lock, so the staged reads below do not need the data lock
            std::scoped_lock write_lk { _write_mutex };
            staging_txn_t txn { _db };
            fn(txn);
            // readers are not blocked by transactions that leave every value as it was
            if (txn.empty())
                return;
            std::unique_lock data_lk { _data_mutex };
            txn.commit(_db);
        }

        [[nodiscard]] size_t size() const
        {
            std::shared_lock lk { _data_mutex };
            return _db.size();
        }
    private:
        using map_t = std::map<uint8_vector, uint8_vector>;

        struct staging_txn_t: txn_t {
            explicit staging_txn_t(const map_t &base):
                _updates { base }
            {
            }

            value_t get(const buffer key) const override
            {
                return _updates.get(uint8_vector { key });
            }

            void set(const buffer key, const buffer val) override
            {
                if (key.empty()) [[unlikely]]
                    throw err_backing_store_t("memory: empty keys are not supported");
                _updates.set(uint8_vector { key }, uint8_vector { val });
            }

            [[nodiscard]] bool empty() const
            {
                return _updates.empty();
            }

            void commit(map_t &target)
            {
                _updates.commit(target);
            }
        private:
            container::update_map_t<map_t> _updates;
        };

        map_t _db {};
        std::mutex _write_mutex {};
        mutable std::shared_mutex _data_mutex {};
    };

    db_t::db_t():
        _impl { std::make_unique<impl>() }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const buffer key) const
    {
        return _impl->get(key);
    }

    void db_t::update(const update_func_t &fn)
    {
        _impl->update(fn);
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }
}
