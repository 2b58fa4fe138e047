/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <boost/json.hpp>
#include <gstate/common/file.hpp>
#include "json.hpp"

namespace gstate::codec::json {
    value parse(const buffer &buf)
    {
        return boost::json::parse(boost::json::string_view { reinterpret_cast<const char *>(buf.data()), buf.size() });
    }

    value load(const std::string &path)
    {
        try {
            return parse(file::read(path));
        } catch (const boost::system::system_error &ex) {
            throw error(fmt::format("failed to parse JSON from {}", path), ex);
        }
    }

    std::string to_string(const value &jv)
    {
        return boost::json::serialize(jv);
    }
}
