#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "backing-store.hpp"
#include "tracking-copy.hpp"

namespace gstate::state {
    // The authoritative view of the state and the point where effects are merged into it.
    struct global_state_t {
        explicit global_state_t(backing_store_t store);

        [[nodiscard]] value_t get(const key_t &key) const;
        [[nodiscard]] std::optional<value_t> get_opt(const key_t &key) const;

        // Read, merge and write happen within one write transaction.
        // A failed apply leaves the stored state unchanged.
        void apply(const key_t &key, const transform_t &t);
        // all effects in order within one write transaction; any failure discards all of them
        void commit(const effect_list_t &effects);

        [[nodiscard]] tracking_copy_t tracking_copy() const;

        [[nodiscard]] const backing_store_t &store() const noexcept
        {
            return _store;
        }
    private:
        backing_store_t _store;
    };
}
