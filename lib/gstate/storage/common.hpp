#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>
#include <gstate/common/bytes.hpp>

namespace gstate::storage {
    using value_t = std::optional<uint8_vector>;
    using observer_t = std::function<void(uint8_vector, uint8_vector)>;
    using batch_t = std::vector<std::pair<uint8_vector, uint8_vector>>;

    struct err_backing_store_t: error {
        using error::error;
    };

    // A write transaction: reads observe the writes made earlier in the same transaction.
    struct txn_t {
        virtual ~txn_t() = default;
        [[nodiscard]] virtual value_t get(buffer key) const = 0;
        virtual void set(buffer key, buffer val) = 0;
    };
    using update_func_t = std::function<void(txn_t &)>;

    struct db_t {
        virtual ~db_t() = default;
        virtual void clear() = 0;
        virtual void foreach(const observer_t &) const = 0;
        [[nodiscard]] virtual value_t get(buffer key) const = 0;
        // Runs the function inside a single write transaction.
        // Commits if it returns normally, discards all of its writes if it throws.
        virtual void update(const update_func_t &) = 0;
        [[nodiscard]] virtual size_t size() const = 0;

        void set(const buffer key, const buffer val)
        {
            update([&](txn_t &txn) {
                txn.set(key, val);
            });
        }

        void write(const batch_t &batch)
        {
            update([&](txn_t &txn) {
                for (const auto &[k, v]: batch)
                    txn.set(k, v);
            });
        }

        [[nodiscard]] bool empty() const
        {
            return size() == 0;
        }
    };
    using db_ptr_t = std::shared_ptr<db_t>;
}
