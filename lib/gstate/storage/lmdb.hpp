#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <string>
#include <string_view>
#include "common.hpp"

namespace gstate::storage::lmdb {
    struct config_t {
        uint64_t map_size = 1ULL << 30U;
        uint32_t max_dbs = 8;
        uint32_t max_readers = 126;
        bool no_sync = false;
        std::string store_name = "global_state";

        static config_t load(const std::string &path);

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("map_size"sv, map_size);
            archive.process("max_dbs"sv, max_dbs);
            archive.process("max_readers"sv, max_readers);
            archive.process("no_sync"sv, no_sync);
            archive.process("store_name"sv, store_name);
        }

        bool operator==(const config_t &o) const = default;
    };

    // An opened LMDB environment. Closed when the last reference to it is released.
    struct env_t;
    using env_ptr_t = std::shared_ptr<env_t>;

    // LMDB allows a single open environment per directory within a process.
    // The registry hands out the already-open one when the same directory is requested again.
    // An entry is removed once its environment has been closed, and an open of a directory
    // whose environment is still closing waits for the close to complete.
    struct registry_t {
        registry_t();
        ~registry_t();
        registry_t(const registry_t &) =delete;
        registry_t &operator=(const registry_t &) =delete;

        // the config is used only when the environment is not open yet
        env_ptr_t open(std::string_view dir_path, const config_t &cfg={});
        // the number of environments that are open or being closed
        [[nodiscard]] size_t size() const;
    private:
        struct state_t;
        struct env_closer_t;
        // shared with the environments so that they can deregister after the registry is gone
        std::shared_ptr<state_t> _state;
    };

    struct db_t: storage::db_t {
        db_t(env_ptr_t env, std::string_view name);
        ~db_t() override;
        void clear() override;
        void foreach(const observer_t &) const override;
        value_t get(buffer key) const override;
        void update(const update_func_t &) override;
        [[nodiscard]] size_t size() const override;
        [[nodiscard]] const std::string &dir_path() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
