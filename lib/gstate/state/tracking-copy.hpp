#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <array>
#include <map>
#include <optional>
#include <vector>
#include "transform.hpp"

namespace gstate::state {
    struct global_state_t;

    // the strongest kind of access an execution made to a key
    enum class op_t: uint8_t {
        noop,
        read,
        add,
        write
    };
    // combines two accesses to the same key
    extern op_t operator+(op_t a, op_t b);
    using op_map_t = std::map<key_t, op_t>;

    enum class add_result_t: uint8_t {
        success,
        key_not_found,
        type_mismatch,
        overflow
    };

    /*
     * An isolated overlay over a global state used by a single execution.
     * Reads see the pending effects of this copy. Nothing reaches the global state until
     * the caller replays effects() through global_state_t::apply or hands them to global_state_t::commit.
     * Not thread-safe and must not outlive the global state it was created from.
     */
    struct tracking_copy_t {
        explicit tracking_copy_t(const global_state_t &gs);

        [[nodiscard]] value_t read(const key_t &key);
        [[nodiscard]] std::optional<value_t> read_opt(const key_t &key);
        void write(const key_t &key, transform_t t);
        // records the transform only if it can be merged into the current view of the key
        [[nodiscard]] add_result_t add(const key_t &key, transform_t t);

        [[nodiscard]] const effect_list_t &effects() const noexcept
        {
            return _effects;
        }

        [[nodiscard]] const op_map_t &ops() const noexcept
        {
            return _ops;
        }

        // The pending transforms composed into one per key.
        // Throws like read() if the pending effects of a key cannot be applied to its current value.
        [[nodiscard]] std::map<key_t, transform_t> transforms();
    private:
        const global_state_t &_gs;
        std::map<key_t, std::optional<value_t>> _cache {};
        effect_list_t _effects {};
        // positions in _effects per key
        std::map<key_t, std::vector<size_t>> _pending {};
        op_map_t _ops {};

        const std::optional<value_t> &_base(const key_t &key);
        std::optional<value_t> _view(const key_t &key);
        void _record(const key_t &key, transform_t t);
        void _track(const key_t &key, op_t op);
    };
}

namespace fmt {
    template<>
    struct formatter<gstate::state::op_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const gstate::state::op_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace std::string_view_literals;
            static constexpr std::array names { "noop"sv, "read"sv, "add"sv, "write"sv };
            return fmt::format_to(ctx.out(), "{}", names.at(static_cast<size_t>(v)));
        }
    };

    template<>
    struct formatter<gstate::state::add_result_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const gstate::state::add_result_t &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using namespace std::string_view_literals;
            static constexpr std::array names { "success"sv, "key_not_found"sv, "type_mismatch"sv, "overflow"sv };
            return fmt::format_to(ctx.out(), "{}", names.at(static_cast<size_t>(v)));
        }
    };
}
