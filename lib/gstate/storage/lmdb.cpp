/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

extern "C" {
    #include <lmdb.h>
}

#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <gstate/codec/json.hpp>
#include <gstate/common/logger.hpp>
#include "lmdb.hpp"

namespace gstate::storage::lmdb {
    namespace {
        void _throw_lmdb(const int rc, const char *what)
        {
            if (rc == MDB_SUCCESS) [[likely]]
                return;
            throw err_backing_store_t(fmt::format("lmdb: {}: {}", what, mdb_strerror(rc)));
        }

        MDB_val _to_mdb_val(const buffer b)
        {
            MDB_val v {};
            v.mv_size = b.size();
            v.mv_data = const_cast<void *>(static_cast<const void *>(b.data()));
            return v;
        }

        uint8_vector _from_mdb_val(const MDB_val &v)
        {
            uint8_vector out(v.mv_size);
            if (!out.empty())
                std::memcpy(out.data(), v.mv_data, v.mv_size);
            return out;
        }

        // aborts the transaction unless it has been committed
        struct txn_guard_t {
            MDB_txn *txn = nullptr;

            txn_guard_t(MDB_env *env, const unsigned int flags, const char *what)
            {
                _throw_lmdb(mdb_txn_begin(env, nullptr, flags, &txn), what);
            }

            ~txn_guard_t()
            {
                if (txn)
                    mdb_txn_abort(txn);
            }

            txn_guard_t(const txn_guard_t &) =delete;
            txn_guard_t &operator=(const txn_guard_t &) =delete;

            void commit(const char *what)
            {
                const auto rc = mdb_txn_commit(txn);
                // the handle is released by mdb_txn_commit even when it fails
                txn = nullptr;
                _throw_lmdb(rc, what);
            }
        };
    }

    config_t config_t::load(const std::string &path)
    {
        return codec::json::load_obj<config_t>(path);
    }

    struct env_t {
        env_t(std::string dir_path, const config_t &cfg):
            _dir_path { std::move(dir_path) }
        {
            _throw_lmdb(mdb_env_create(&_env), "env_create");
            try {
                _throw_lmdb(mdb_env_set_maxdbs(_env, cfg.max_dbs), "env_set_maxdbs");
                _throw_lmdb(mdb_env_set_mapsize(_env, cfg.map_size), "env_set_mapsize");
                _throw_lmdb(mdb_env_set_maxreaders(_env, cfg.max_readers), "env_set_maxreaders");
                unsigned int flags = MDB_NOTLS;
                if (cfg.no_sync)
                    flags |= MDB_NOSYNC;
                _throw_lmdb(mdb_env_open(_env, _dir_path.c_str(), flags, 0664), "env_open");
            } catch (...) {
                mdb_env_close(_env);
                throw;
            }
            logger::debug("lmdb: opened environment at {} map_size: {} no_sync: {}", _dir_path, cfg.map_size, cfg.no_sync);
        }

        ~env_t()
        {
            mdb_env_close(_env);
            logger::debug("lmdb: closed environment at {}", _dir_path);
        }

        env_t(const env_t &) =delete;
        env_t &operator=(const env_t &) =delete;

        MDB_dbi open_dbi(const std::string &name)
        {
            // LMDB does not allow concurrent transactions in one process to open named databases
            std::scoped_lock lk { _dbi_mutex };
            txn_guard_t txn { _env, 0, "txn_begin(dbi_open)" };
            MDB_dbi dbi;
            _throw_lmdb(mdb_dbi_open(txn.txn, name.c_str(), MDB_CREATE, &dbi), "dbi_open");
            txn.commit("txn_commit(dbi_open)");
            return dbi;
        }

        MDB_env *handle() const noexcept
        {
            return _env;
        }

        const std::string &dir_path() const noexcept
        {
            return _dir_path;
        }
    private:
        std::string _dir_path;
        MDB_env *_env = nullptr;
        std::mutex _dbi_mutex {};
    };

    struct registry_t::state_t {
        std::mutex mutex {};
        std::condition_variable closed {};
        std::map<std::string, std::weak_ptr<env_t>> envs {};
    };

    // closes the environment and then lets the waiting openers of the same directory proceed
    struct registry_t::env_closer_t {
        std::shared_ptr<state_t> state;
        std::string path;
        bool registered = false;

        void operator()(env_t *env) const
        {
            delete env;
            if (!registered)
                return;
            std::scoped_lock lk { state->mutex };
            state->envs.erase(path);
            state->closed.notify_all();
        }
    };

    registry_t::registry_t():
        _state { std::make_shared<state_t>() }
    {
    }

    registry_t::~registry_t() =default;

    env_ptr_t registry_t::open(const std::string_view dir_path, const config_t &cfg)
    {
        std::filesystem::create_directories(dir_path);
        auto canon_path = std::filesystem::canonical(dir_path).string();
        std::unique_lock lk { _state->mutex };
        for (;;) {
            const auto it = _state->envs.find(canon_path);
            if (it == _state->envs.end())
                break;
            if (auto env = it->second.lock())
                return env;
            // the last handle has been released but mdb_env_close has not finished yet
            _state->closed.wait(lk);
        }
        auto it = _state->envs.try_emplace(canon_path).first;
        try {
            env_closer_t closer { _state, std::move(canon_path) };
            env_ptr_t env { new env_t { it->first, cfg }, std::move(closer) };
            // from here on the entry is removed by the closer
            std::get_deleter<env_closer_t>(env)->registered = true;
            it->second = env;
            return env;
        } catch (...) {
            _state->envs.erase(it);
            throw;
        }
    }

    size_t registry_t::size() const
    {
        std::scoped_lock lk { _state->mutex };
        return _state->envs.size();
    }

    struct db_t::impl {
        impl(env_ptr_t env, const std::string_view name):
            _env { std::move(env) },
            _dbi { _env->open_dbi(std::string { name }) }
        {
        }

        void clear()
        {
            txn_guard_t txn { _env->handle(), 0, "txn_begin(clear)" };
            _throw_lmdb(mdb_drop(txn.txn, _dbi, 0), "drop");
            txn.commit("txn_commit(clear)");
        }

        void foreach(const observer_t &obs) const
        {
            txn_guard_t txn { _env->handle(), MDB_RDONLY, "txn_begin(foreach)" };
            MDB_cursor *cur = nullptr;
            _throw_lmdb(mdb_cursor_open(txn.txn, _dbi, &cur), "cursor_open");
            try {
                MDB_val k {}, v {};
                auto rc = mdb_cursor_get(cur, &k, &v, MDB_FIRST);
                while (rc == MDB_SUCCESS) {
                    obs(_from_mdb_val(k), _from_mdb_val(v));
                    rc = mdb_cursor_get(cur, &k, &v, MDB_NEXT);
                }
                if (rc != MDB_NOTFOUND)
                    _throw_lmdb(rc, "cursor_get");
            } catch (...) {
                mdb_cursor_close(cur);
                throw;
            }
            mdb_cursor_close(cur);
        }

        value_t get(const buffer key) const
        {
            txn_guard_t txn { _env->handle(), MDB_RDONLY, "txn_begin(get)" };
            return _get(txn.txn, key);
        }

        void update(const update_func_t &fn)
        {
            txn_guard_t txn { _env->handle(), 0, "txn_begin(update)" };
            write_txn_t wtxn { *this, txn.txn };
            fn(wtxn);
            txn.commit("txn_commit(update)");
        }

        size_t size() const
        {
            txn_guard_t txn { _env->handle(), MDB_RDONLY, "txn_begin(size)" };
            MDB_stat st {};
            _throw_lmdb(mdb_stat(txn.txn, _dbi, &st), "stat");
            return static_cast<size_t>(st.ms_entries);
        }

        const std::string &dir_path() const
        {
            return _env->dir_path();
        }
    private:
        struct write_txn_t: txn_t {
            write_txn_t(const impl &parent, MDB_txn *txn):
                _parent { parent },
                _txn { txn }
            {
            }

            value_t get(const buffer key) const override
            {
                return _parent._get(_txn, key);
            }

            void set(const buffer key, const buffer val) override
            {
                auto k = _to_mdb_val(key);
                auto v = _to_mdb_val(val);
                _throw_lmdb(mdb_put(_txn, _parent._dbi, &k, &v, 0), "put");
            }
        private:
            const impl &_parent;
            MDB_txn *_txn;
        };

        env_ptr_t _env;
        MDB_dbi _dbi;

        value_t _get(MDB_txn *txn, const buffer key) const
        {
            auto k = _to_mdb_val(key);
            MDB_val v {};
            const auto rc = mdb_get(txn, _dbi, &k, &v);
            if (rc == MDB_NOTFOUND)
                return {};
            _throw_lmdb(rc, "get");
            return _from_mdb_val(v);
        }
    };

    db_t::db_t(env_ptr_t env, const std::string_view name):
        _impl { std::make_unique<impl>(std::move(env), name) }
    {
    }

    db_t::~db_t() = default;

    void db_t::clear()
    {
        _impl->clear();
    }

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    value_t db_t::get(const buffer key) const
    {
        return _impl->get(key);
    }

    void db_t::update(const update_func_t &fn)
    {
        _impl->update(fn);
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }

    const std::string &db_t::dir_path() const
    {
        return _impl->dir_path();
    }
}
