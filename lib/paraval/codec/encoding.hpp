#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <bit>
#include <concepts>
#include <cstdint>
#include <limits>
#include <typeinfo>
#include <paraval/common/bytes.hpp>
#include <paraval/common/numeric-cast.hpp>

namespace paraval::codec {
    // Types opt into the wire codec with a serialize(auto &archive) method
    // that lists their fields in wire order. The same method drives both directions.
    struct archive_t {
    };

    template<typename T>
    concept serializable_c = requires(T t, archive_t a)
    {
        { t.serialize(a) } -> std::same_as<void>;
    };

    template<typename T>
    concept byte_array_c = std::is_same_v<T, byte_array<sizeof(T)>>;

    struct encoder: archive_t {
        static void uint_fixed(const std::span<uint8_t> &bytes, const size_t num_bytes, const uint64_t val)
        {
            if (!num_bytes) [[unlikely]]
                throw error("codec::encoder: uint_fixed: num_bytes must be greater than 0!");
            if (bytes.size() != num_bytes) [[unlikely]]
                throw error(fmt::format("uint_fixed: expected an output buffer of {} bytes, got {}", num_bytes, bytes.size()));
            auto x = val;
            for (size_t i = 0; i < num_bytes; ++i) {
                bytes[i] = static_cast<uint8_t>(x & 0xFF);
                x >>= 8;
            }
            if (x) [[unlikely]]
                throw error(fmt::format("{} cannot be encoded as a sequence of {} bytes", val, num_bytes));
        }

        template<typename ...Args>
        explicit encoder(const Args &... args)
        {
            (process(args), ...);
        }

        void uint_fixed(const size_t num_bytes, const uint64_t val)
        {
            for (size_t i = 0; i < num_bytes; ++i) {
                _bytes.emplace_back(0);
            }
            // emplace_back can reallocate, so take the pointer only after that
            uint_fixed(std::span { _bytes.data() + _bytes.size() - num_bytes, num_bytes }, num_bytes, val);
        }

        // a prefix byte with l leading one bits is followed by l little-endian bytes
        void uint_varlen(const uint64_t x)
        {
            static constexpr uint64_t max_short_val = uint64_t { 1 } << 56;
            if (x >= max_short_val) [[unlikely]] {
                _bytes.emplace_back(0xFF);
                uint_fixed(8, x);
                return;
            }
            if (x == 0) {
                _bytes.emplace_back(0);
                return;
            }
            size_t l = 0;
            while (x >= uint64_t { 1 } << (7 * (l + 1))) {
                ++l;
            }
            const auto base = l << 3;
            const auto bit_mask = static_cast<uint8_t>(0x100 - (0x100 >> l));
            const auto high_bits = static_cast<uint8_t>(x >> base);
            _bytes.emplace_back(bit_mask | high_bits);
            if (l > 0)
                uint_fixed(l, x & ((uint64_t { 1 } << base) - 1));
        }

        template<typename T>
        void process_varlen_uint(const T &val)
        {
            uint_varlen(val);
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            if (!(static_cast<int>(self.size() >= min_sz) & static_cast<int>(self.size() <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", self.size(), min_sz, max_sz));
            process_varlen_uint(self.size());
            for (const auto &v: self)
                encode(v);
        }

        void process_bytes(const buffer bytes)
        {
            process_varlen_uint(bytes.size());
            _bytes << bytes;
        }

        void process_bytes_fixed(const buffer bytes)
        {
            _bytes << bytes;
        }

        template<typename T>
        void process(const T &val)
        {
            if constexpr (serializable_c<T>) {
                // the encoder does not modify the value, so the const_cast is safe
                const_cast<T &>(val).serialize(*this);
            } else if constexpr (byte_array_c<T>) {
                process_bytes_fixed(val);
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                uint_fixed(8, val);
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                uint_fixed(4, val);
            } else if constexpr (std::is_same_v<T, uint16_t>) {
                uint_fixed(2, val);
            } else if constexpr (std::is_same_v<T, uint8_t>) {
                uint_fixed(1, val);
            } else if constexpr (std::is_same_v<T, bool>) {
                uint_fixed(1, static_cast<uint8_t>(val));
            } else {
                throw error(fmt::format("serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process(const std::string_view, const T &val)
        {
            process(val);
        }

        template<typename T>
        void encode(const T &val)
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

    struct decoder: archive_t {
        explicit decoder(const buffer bytes) noexcept:
            _ptr { bytes.data() },
            _end { bytes.data() + bytes.size() }
        {
        }

        template<typename T>
        T uint_fixed(const size_t num_bytes)
        {
            if (num_bytes > 8) [[unlikely]]
                throw error("uint_fixed supports 8-bytes values at most!");
            T x = 0;
            for (size_t i = 0; i < num_bytes; ++i) {
                x |= static_cast<T>(next()) << (i * 8);
            }
            return x;
        }

        template<typename T=uint64_t>
        T uint_varlen()
        {
            const auto prefix = next();
            const auto l = static_cast<size_t>(std::countl_one(prefix));
            if (l == 8)
                return numeric_cast<T>(uint_fixed<uint64_t>(8));
            uint64_t res = static_cast<uint64_t>(prefix & (0xFF >> (l + 1))) << (l << 3);
            if (l > 0)
                res |= uint_fixed<uint64_t>(l);
            return numeric_cast<T>(res);
        }

        template<typename T>
        void decode(T &val)
        {
            if constexpr (serializable_c<T>) {
                val.serialize(*this);
            } else if constexpr (byte_array_c<T>) {
                process_bytes_fixed(val);
            } else if constexpr (std::is_same_v<uint64_t, T>) {
                val = uint_fixed<T>(8);
            } else if constexpr (std::is_same_v<uint32_t, T>) {
                val = uint_fixed<T>(4);
            } else if constexpr (std::is_same_v<uint16_t, T>) {
                val = uint_fixed<T>(2);
            } else if constexpr (std::is_same_v<uint8_t, T>) {
                val = uint_fixed<T>(1);
            } else if constexpr (std::is_same_v<bool, T>) {
                val = static_cast<T>(uint_fixed<uint8_t>(1));
            } else {
                throw error(fmt::format("serialization is not enabled for type {}", typeid(T).name()));
            }
        }

        template<typename T>
        void process_varlen_uint(T &val)
        {
            val = uint_varlen<T>();
        }

        template<typename T>
        void process(T &val)
        {
            decode(val);
        }

        template<typename T>
        void process(const std::string_view, T &val)
        {
            process(val);
        }

        void process_array(auto &self, const size_t min_sz=0, const size_t max_sz=std::numeric_limits<size_t>::max())
        {
            using T = std::decay_t<decltype(self)>;
            const auto sz = uint_varlen<size_t>();
            if (!(static_cast<int>(sz >= min_sz) & static_cast<int>(sz <= max_sz))) [[unlikely]]
                throw error(fmt::format("array size {} is out of allowed bounds: [{}, {}]", sz, min_sz, max_sz));
            // every item takes at least one byte
            if (sz > size()) [[unlikely]]
                throw error(fmt::format("array size {} is greater than the number of remaining bytes {}", sz, size()));
            self.clear();
            self.reserve(sz);
            for (size_t i = 0; i < sz; ++i) {
                typename T::value_type v;
                process(v);
                self.emplace_back(std::move(v));
            }
        }

        void process_bytes(std::vector<uint8_t> &bytes)
        {
            const auto sz = uint_varlen<size_t>();
            const auto data = next_bytes(sz);
            bytes.assign(data.begin(), data.end());
        }

        void process_bytes_fixed(const std::span<uint8_t> bytes)
        {
            const auto data = next_bytes(bytes.size());
            std::copy(data.begin(), data.end(), bytes.begin());
        }

        [[nodiscard]] uint8_t next()
        {
            if (_ptr >= _end) [[unlikely]]
                throw error("codec: an attempt to read past the end of the byte stream");
            return *_ptr++;
        }

        [[nodiscard]] buffer next_bytes(const size_t sz)
        {
            if (sz > size()) [[unlikely]]
                throw error("codec: an attempt to read past the end of the byte stream");
            const auto *begin = _ptr;
            _ptr += sz;
            return { begin, sz };
        }

        [[nodiscard]] bool empty() const noexcept
        {
            return _ptr >= _end;
        }

        [[nodiscard]] buffer bytes() const noexcept
        {
            return { _ptr, size() };
        }

        [[nodiscard]] size_t size() const noexcept
        {
            return empty() ? size_t { 0 } : static_cast<size_t>(_end - _ptr);
        }
    private:
        const uint8_t *_ptr, *_end;
    };

    // the whole input must be consumed, trailing bytes are an error
    template<typename T>
    T from_bytes(const buffer bytes)
    {
        decoder dec { bytes };
        T res;
        dec.decode(res);
        if (!dec.empty()) [[unlikely]]
            throw error(fmt::format("{} trailing bytes after a value of type {}", dec.size(), typeid(T).name()));
        return res;
    }

    template<typename T>
    uint8_vector to_bytes(const T &val)
    {
        encoder enc { val };
        return std::move(enc.bytes());
    }
}
