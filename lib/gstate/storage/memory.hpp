#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "common.hpp"

namespace gstate::storage::memory {
    // Keeps the data in a process-local map with the same transaction semantics as the LMDB store.
    // Writers are serialized while readers see only committed data.
    struct db_t: storage::db_t {
        explicit db_t();
        ~db_t() override;
        void clear() override;
        void foreach(const observer_t &) const override;
        value_t get(buffer key) const override;
        void update(const update_func_t &) override;
        [[nodiscard]] size_t size() const override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
