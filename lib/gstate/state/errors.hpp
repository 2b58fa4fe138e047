#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <variant>
#include <gstate/common/error.hpp>
#include <gstate/storage/common.hpp>
#include "key.hpp"

namespace gstate::state {
    using storage::err_backing_store_t;

    struct err_key_not_found_t final: error {
        key_t key;

        explicit err_key_not_found_t(const key_t &k):
            error { fmt::format("key not found: {}", k) },
            key { k }
        {
        }

        bool operator==(const err_key_not_found_t &o) const { return key == o.key; }
    };

    struct err_decode_t final: error {
        using error::error;
    };

    struct err_merge_type_t final: error {
        using error::error;

        err_merge_type_t(const std::string_view transform_type, const std::string_view value_type):
            error { fmt::format("a {} transform cannot be applied to a {} value", transform_type, value_type) }
        {
        }
    };

    struct err_overflow_t final: error {
        explicit err_overflow_t(const std::string_view type):
            error { fmt::format("{} addition overflow", type) }
        {
        }
    };

    template<typename BASE_T, typename BASE_V>
    struct err_group_t: BASE_V {
        using base_type = BASE_V;
        using base_type::base_type;

        static void catch_into(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (std::variant_size_v<BASE_V> > 0) {
                catch_into_impl<std::variant_size_v<BASE_V> - 1>(action, on_error);
            }
        }
    private:
        template<size_t I>
        static void catch_into_impl(const std::function<void()> &action, const std::function<void(BASE_T)> &on_error)
        {
            if constexpr (I == 0) {
                try {
                    action();
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            } else {
                try {
                    catch_into_impl<I - 1>(action, on_error);
                } catch (std::variant_alternative_t<I, BASE_V> &err) {
                    on_error(std::move(err));
                }
            }
        }
    };

    // the failures of merging a transform into the current value of a key
    using err_merge_base_t = std::variant<err_key_not_found_t, err_merge_type_t, err_overflow_t>;
    struct err_merge_any_t: err_group_t<err_merge_any_t, err_merge_base_t> {
        using base_type = err_group_t<err_merge_any_t, err_merge_base_t>;
        using base_type::base_type;
    };
}
