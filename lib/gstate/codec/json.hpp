#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <string>
#include <type_traits>
#include <typeinfo>
#include <boost/json.hpp>
#include <gstate/common/bytes.hpp>
#include "serializable.hpp"

namespace gstate::codec::json {
    using namespace boost::json;

    extern value parse(const buffer &buf);
    extern value load(const std::string &path);
    extern std::string to_string(const value &jv);

    // Populates objects through their serialize(archive) method.
    // Fields missing from a JSON object are left untouched so that defaults survive.
    struct decoder: archive_t {
        explicit decoder(const value &jv):
            _jv { jv }
        {
        }

        template<typename T>
        static void decode(const value &jv, T &val)
        {
            if constexpr (serializable_c<T>) {
                decoder dec { jv };
                val.serialize(dec);
            } else if constexpr (std::is_same_v<T, bool> || std::is_integral_v<T>) {
                val = boost::json::value_to<T>(jv);
            } else if constexpr (std::is_same_v<T, std::string>) {
                if (!jv.is_string()) [[unlikely]]
                    throw error(fmt::format("expected a JSON string but got: {}", to_string(jv)));
                val = std::string { jv.get_string().data(), jv.get_string().size() };
            } else {
                throw error(fmt::format("json deserialization is not enabled for type {}", typeid(T).name()));
            }
        }

        void process(auto &val)
        {
            decode(_jv, val);
        }

        void process(const std::string_view name, auto &val)
        {
            if (!_jv.is_object()) [[unlikely]]
                throw error(fmt::format("expected a JSON object but got: {}", to_string(_jv)));
            const auto &jo = _jv.get_object();
            if (const auto it = jo.find(boost::json::string_view { name.data(), name.size() }); it != jo.end())
                decode(it->value(), val);
        }
    private:
        const value &_jv;
    };

    template<serializable_c T>
    T load_obj(const std::string &path)
    {
        const auto j = load(path);
        decoder dec { j };
        return codec::from<T>(dec);
    }
}
