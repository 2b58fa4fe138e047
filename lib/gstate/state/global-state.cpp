/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/logger.hpp>
#include "global-state.hpp"

namespace gstate::state {
    namespace {
        void apply_in_txn(backing_store_t::txn_t &txn, const key_t &key, const transform_t &t)
        {
            auto current = txn.read_opt(key);
            if (!current) {
                // only a write can create a key
                if (const auto *w = std::get_if<write_t>(&t)) {
                    txn.put(key, w->value);
                    return;
                }
                throw err_key_not_found_t { key };
            }
            txn.put(key, t.merge(std::move(*current)));
        }
    }

    global_state_t::global_state_t(backing_store_t store):
        _store { std::move(store) }
    {
    }

    value_t global_state_t::get(const key_t &key) const
    {
        return _store.read(key);
    }

    std::optional<value_t> global_state_t::get_opt(const key_t &key) const
    {
        return _store.read_opt(key);
    }

    void global_state_t::apply(const key_t &key, const transform_t &t)
    {
        try {
            _store.update([&](backing_store_t::txn_t &txn) {
                apply_in_txn(txn, key, t);
            });
        } catch (const error &ex) {
            logger::debug("global_state: apply of {} to {} failed: {}", t, key, ex.what());
            throw;
        }
        logger::trace("global_state: applied {} to {}", t, key);
    }

    void global_state_t::commit(const effect_list_t &effects)
    {
        try {
            _store.update([&](backing_store_t::txn_t &txn) {
                for (const auto &[key, t]: effects)
                    apply_in_txn(txn, key, t);
            });
        } catch (const error &ex) {
            logger::debug("global_state: commit of {} effects failed: {}", effects.size(), ex.what());
            throw;
        }
        logger::trace("global_state: committed {} effects", effects.size());
    }

    tracking_copy_t global_state_t::tracking_copy() const
    {
        return tracking_copy_t { *this };
    }
}
