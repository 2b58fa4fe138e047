#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <typeinfo>
#include <gstate/codec/serializable.hpp>
#include <gstate/common/bytes.hpp>
#include <gstate/common/numeric-cast.hpp>

namespace gstate::state {
    // the longest byte string or list that can be stored in a value
    static constexpr size_t max_sequence_size = size_t { 1 } << 22U;

    struct decoder;
    struct encoder;

    template<typename T>
    concept from_bytes_c = requires(decoder &dec)
    {
        { T::from_bytes(dec) };
    };

    template<typename T>
    concept to_bytes_c = requires(const T &t, encoder &enc)
    {
        { t.to_bytes(enc) };
    };

    // Integers are little-endian and sequences are prefixed with their varlen-encoded size.
    struct encoder: codec::archive_t {
        template<typename ...Args>
        explicit encoder(const Args &... args)
        {
            (process(args), ...);
        }

        void uint_fixed(const size_t num_bytes, const uint64_t val)
        {
            auto x = val;
            for (size_t i = 0; i < num_bytes; ++i, x >>= 8U)
                _bytes.emplace_back(static_cast<uint8_t>(x));
            if (num_bytes < 8 && x) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded as a sequence of {} bytes", val, num_bytes));
        }

        // one prefix byte whose leading one-bits give the number of the following little-endian bytes
        void uint_varlen(const uint64_t x)
        {
            if (x >= uint64_t { 1 } << 56U) [[unlikely]] {
                _bytes.emplace_back(0xFF);
                uint_fixed(8, x);
                return;
            }
            size_t l = 0;
            while (x >= uint64_t { 1 } << (7 * (l + 1)))
                ++l;
            const auto prefix = static_cast<uint8_t>(0x100U - (0x100U >> l));
            _bytes.emplace_back(prefix | static_cast<uint8_t>(x >> (l * 8)));
            uint_fixed(l, x & ((uint64_t { 1 } << (l * 8)) - 1));
        }

        void process_array(const auto &self, const size_t max_sz=max_sequence_size)
        {
            if (self.size() > max_sz) [[unlikely]]
                throw error(fmt::format("array size {} is above the limit of {}", self.size(), max_sz));
            uint_varlen(self.size());
            for (const auto &v: self)
                process(v);
        }

        void process_bytes(const buffer bytes)
        {
            if (bytes.size() > max_sequence_size) [[unlikely]]
                throw error(fmt::format("byte string size {} is above the limit of {}", bytes.size(), max_sequence_size));
            uint_varlen(bytes.size());
            _bytes << bytes;
        }

        void process_string(const std::string &s)
        {
            process_bytes(buffer { s });
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _bytes << bytes;
        }

        template<typename T>
        void process(const T &val)
        {
            if constexpr (to_bytes_c<T>) {
                val.to_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                // serialize() is shared with the decoder and thus non-const
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (std::is_same_v<T, std::string>) {
                process_string(val);
            } else if constexpr (std::is_integral_v<T>) {
                uint_fixed(sizeof(T), static_cast<std::make_unsigned_t<T>>(val));
            } else {
                throw error(fmt::format("serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, const T &val)
        {
            process(val);
        }

        uint8_vector &bytes()
        {
            return _bytes;
        }

        const uint8_vector &bytes() const
        {
            return _bytes;
        }
    private:
        uint8_vector _bytes {};
    };

    struct decoder: codec::archive_t {
        explicit decoder(const buffer bytes) noexcept:
            _ptr { bytes.data() },
            _end { bytes.data() + bytes.size() }
        {
        }

        template<typename T>
        T uint_fixed(const size_t num_bytes)
        {
            if (num_bytes > 8) [[unlikely]]
                throw error(fmt::format("uint_fixed supports at most 8 bytes but got {}", num_bytes));
            const auto bytes = next_bytes(num_bytes);
            uint64_t x = 0;
            for (size_t i = num_bytes; i > 0; --i)
                x = (x << 8U) | bytes[i - 1];
            return numeric_cast<T>(x);
        }

        template<typename T=uint64_t>
        T uint_varlen()
        {
            const auto prefix = uint_fixed<uint8_t>(1);
            size_t l = 0;
            while (l < 8 && (prefix & (0x80U >> l)))
                ++l;
            uint64_t x;
            if (l == 8) {
                x = uint_fixed<uint64_t>(8);
            } else {
                const uint64_t high = prefix & (0xFFU >> l);
                x = (high << (l * 8)) | uint_fixed<uint64_t>(l);
            }
            // the encoding is canonical only when no shorter form can hold the value
            if (l > 0 && x < (uint64_t { 1 } << (7 * l))) [[unlikely]]
                throw error(fmt::format("non-canonical encoding of {} with {} length bytes", x, l));
            return numeric_cast<T>(x);
        }

        template<typename T>
        void process(T &val)
        {
            if constexpr (from_bytes_c<T>) {
                val = T::from_bytes(*this);
            } else if constexpr (codec::serializable_c<T>) {
                val.serialize(*this);
            } else if constexpr (std::is_same_v<T, std::string>) {
                process_string(val);
            } else if constexpr (std::is_integral_v<T>) {
                val = static_cast<T>(uint_fixed<std::make_unsigned_t<T>>(sizeof(T)));
            } else {
                throw error(fmt::format("serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, T &val)
        {
            process(val);
        }

        void process_array(auto &self, const size_t max_sz=max_sequence_size)
        {
            const auto sz = _sequence_size(max_sz);
            self.clear();
            self.reserve(sz);
            for (size_t i = 0; i < sz; ++i)
                process(self.emplace_back());
        }

        void process_bytes(std::vector<uint8_t> &bytes)
        {
            const auto data = next_bytes(_sequence_size(max_sequence_size));
            bytes.assign(data.begin(), data.end());
        }

        void process_string(std::string &s)
        {
            s = static_cast<std::string_view>(next_bytes(_sequence_size(max_sequence_size)));
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            const auto data = next_bytes(bytes.size());
            std::copy(data.begin(), data.end(), bytes.begin());
        }

        [[nodiscard]] buffer next_bytes(const size_t sz)
        {
            if (sz > size()) [[unlikely]]
                throw error(fmt::format("codec: {} bytes requested but only {} are left", sz, size()));
            const buffer res { _ptr, sz };
            _ptr += sz;
            return res;
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _ptr >= _end;
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return static_cast<size_t>(_end - _ptr);
        }
    private:
        const uint8_t *_ptr, *_end;

        size_t _sequence_size(const size_t max_sz)
        {
            const auto sz = uint_varlen<size_t>();
            if (sz > max_sz) [[unlikely]]
                throw error(fmt::format("sequence size {} is above the limit of {}", sz, max_sz));
            return sz;
        }
    };

    // the whole buffer must be consumed
    template<typename T>
    T from_bytes(const buffer bytes)
    {
        decoder dec { bytes };
        T res;
        dec.process(res);
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} unexpected trailing bytes after a {}", dec.size(), typeid(T).name()));
        return res;
    }
}
