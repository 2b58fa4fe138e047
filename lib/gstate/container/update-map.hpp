#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <optional>

namespace gstate::container {
    /*
     * Stages writes on top of a read-only base map until they are committed or dropped.
     * Keys are never removed: a write either replaces a value or introduces a new one.
     * The base must outlive the update map and must not change while updates are staged.
     */
    template<typename M>
    struct update_map_t {
        using key_type = typename M::key_type;
        using mapped_type = typename M::mapped_type;

        explicit update_map_t(const M &base):
            _base { base }
        {
        }

        bool empty() const
        {
            return _updates.empty();
        }

        std::optional<mapped_type> get(const key_type &k) const
        {
            if (const auto it = _updates.find(k); it != _updates.end())
                return it->second;
            if (const auto it = _base.find(k); it != _base.end())
                return it->second;
            return {};
        }

        void set(const key_type &k, mapped_type v)
        {
            // a write that restores the base value cancels the staged one
            if (const auto it = _base.find(k); it != _base.end() && it->second == v) {
                _updates.erase(k);
                return;
            }
            _updates.insert_or_assign(k, std::move(v));
        }

        void commit(M &target)
        {
            for (auto &&[k, v]: _updates)
                target.insert_or_assign(k, std::move(v));
            _updates.clear();
        }
    private:
        const M &_base;
        std::map<key_type, mapped_type> _updates {};
    };
}
