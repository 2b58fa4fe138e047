/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/logger.hpp>
#include "global-state.hpp"

namespace gstate::state {
    op_t operator+(const op_t a, const op_t b)
    {
        if (b == op_t::noop)
            return a;
        if (a == op_t::noop)
            return b;
        if (a == b)
            return a;
        return op_t::write;
    }

    tracking_copy_t::tracking_copy_t(const global_state_t &gs):
        _gs { gs }
    {
    }

    value_t tracking_copy_t::read(const key_t &key)
    {
        _track(key, op_t::read);
        auto val = _view(key);
        if (!val)
            throw err_key_not_found_t { key };
        return std::move(*val);
    }

    std::optional<value_t> tracking_copy_t::read_opt(const key_t &key)
    {
        _track(key, op_t::read);
        return _view(key);
    }

    void tracking_copy_t::write(const key_t &key, transform_t t)
    {
        op_t op = op_t::add;
        if (t.is_write())
            op = op_t::write;
        else if (std::holds_alternative<identity_t>(t))
            op = op_t::noop;
        _record(key, std::move(t));
        _track(key, op);
    }

    add_result_t tracking_copy_t::add(const key_t &key, transform_t t)
    {
        auto res = add_result_t::success;
        err_merge_any_t::catch_into(
            [&] {
                auto val = _view(key);
                if (!val)
                    throw err_key_not_found_t { key };
                static_cast<void>(t.merge(std::move(*val)));
                const auto op = t.is_write() ? op_t::write : op_t::add;
                _record(key, t);
                _track(key, op);
            },
            [&](err_merge_any_t err) {
                res = std::visit([](const auto &e) {
                    using T = std::decay_t<decltype(e)>;
                    if constexpr (std::is_same_v<T, err_key_not_found_t>)
                        return add_result_t::key_not_found;
                    else if constexpr (std::is_same_v<T, err_merge_type_t>)
                        return add_result_t::type_mismatch;
                    else
                        return add_result_t::overflow;
                }, err);
                logger::debug("tracking_copy: {} to {} rejected: {}", t, key, res);
            }
        );
        return res;
    }

    std::map<key_t, transform_t> tracking_copy_t::transforms()
    {
        std::map<key_t, transform_t> res {};
        for (const auto &[key, positions]: _pending) {
            // composition drops the effects before a write, so they are checked against the view first
            static_cast<void>(_view(key));
            auto acc = _effects.at(positions.front()).second;
            for (auto it = std::next(positions.begin()); it != positions.end(); ++it)
                acc = acc.compose(_effects.at(*it).second);
            res.emplace_hint(res.end(), key, std::move(acc));
        }
        return res;
    }

    const std::optional<value_t> &tracking_copy_t::_base(const key_t &key)
    {
        auto it = _cache.find(key);
        if (it == _cache.end())
            it = _cache.emplace_hint(it, key, _gs.get_opt(key));
        return it->second;
    }

    std::optional<value_t> tracking_copy_t::_view(const key_t &key)
    {
        const auto pit = _pending.find(key);
        if (pit == _pending.end())
            return _base(key);
        const auto &positions = pit->second;
        std::optional<value_t> val {};
        // a leading write replaces whatever is stored, so the global state is not consulted
        if (!_effects[positions.front()].second.is_write())
            val = _base(key);
        // every pending effect is folded in log order so that the view fails exactly when a replay would
        for (const auto pos: positions) {
            const auto &t = _effects[pos].second;
            if (!val && !t.is_write())
                throw err_key_not_found_t { key };
            val = t.merge(val ? std::move(*val) : value_t {});
        }
        return val;
    }

    void tracking_copy_t::_record(const key_t &key, transform_t t)
    {
        _pending[key].emplace_back(_effects.size());
        _effects.emplace_back(key, std::move(t));
    }

    void tracking_copy_t::_track(const key_t &key, const op_t op)
    {
        if (auto [it, created] = _ops.try_emplace(key, op); !created)
            it->second = it->second + op;
    }
}
