/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <gstate/common/test.hpp>
#include "json.hpp"

namespace {
    using namespace gstate;
    using namespace gstate::codec::json;
    using namespace std::string_view_literals;

    struct settings_t {
        uint64_t limit = 10;
        uint32_t count = 3;
        bool enabled = false;
        std::string name = "default";

        void serialize(auto &archive)
        {
            archive.process("limit"sv, limit);
            archive.process("count"sv, count);
            archive.process("enabled"sv, enabled);
            archive.process("name"sv, name);
        }
    };
}

suite gstate_codec_json_suite = [] {
    "gstate::codec::json"_test = [] {
        "parse"_test = [] {
            const auto j = parse(buffer { "{\"name\": \"abc\", \"version\": 123}"sv });
            expect(j.is_object());
            const auto &name = j.as_object().at("name").as_string();
            expect_equal(std::string_view { "abc" }, std::string_view { name.data(), name.size() });
            expect_equal(int64_t { 123 }, j.as_object().at("version").as_int64());
            expect(throws([] { parse(buffer { "{\"name\": "sv }); }));
        };
        "load_obj keeps defaults for missing fields"_test = [] {
            file::tmp t { "gstate-json-load-obj-test.json" };
            file::write(t.path(), "{\"limit\": 1024, \"enabled\": true}"sv);
            const auto s = load_obj<settings_t>(t.path());
            expect_equal(uint64_t { 1024 }, s.limit);
            expect_equal(uint32_t { 3 }, s.count);
            expect(s.enabled);
            expect_equal(std::string { "default" }, s.name);
        };
        "load_obj rejects non-objects"_test = [] {
            file::tmp t { "gstate-json-load-obj-array-test.json" };
            file::write(t.path(), "[1, 2, 3]"sv);
            expect(throws<error>([&] { load_obj<settings_t>(t.path()); }));
        };
        "load of a missing file"_test = [] {
            expect(throws<error>([] { load("/nonexistent/gstate-json-test.json"); }));
        };
    };
};
