/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <array>
#include "node.hpp"

namespace paraval::trie {
    key_t make_key(const buffer storage_key, const hash_func &hf)
    {
        const auto h = hash_of(storage_key, hf);
        key_t k;
        std::copy_n(h.begin(), k.size(), k.begin());
        return k;
    }

    bool key_bit(const key_t &k, const size_t i)
    {
        if (i >= key_bits) [[unlikely]]
            throw error(fmt::format("bit index {} is beyond the key size of {} bits", i, key_bits));
        return k[i >> 3] & (0x80 >> (i & 7));
    }

    hash_t node_ref(const hash_t &h)
    {
        hash_t res = h;
        res[0] &= 0x7F;
        return res;
    }

    hash_t hash_of(const buffer bytes, const hash_func &hf)
    {
        hash_t res;
        hf(res, bytes);
        return res;
    }

    buffer empty_node()
    {
        static constexpr std::array<uint8_t, 1> bytes { 0 };
        return { bytes.data(), bytes.size() };
    }

    hash_t empty_root(const hash_func &hf)
    {
        return hash_of(empty_node(), hf);
    }

    encoded_node_t::encoded_node_t(const leaf_t &leaf)
    {
        static_assert(sizeof(left) == sizeof(leaf.key) + 1);
        std::visit([&](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, value_inplace_t>) {
                left[0] = 0b10000000 | static_cast<uint8_t>(v.size());
                std::copy(v.begin(), v.end(), right.begin());
                std::fill(right.begin() + v.size(), right.end(), 0);
            } else {
                left[0] = 0b11000000;
                right = v;
            }
            std::copy(leaf.key.begin(), leaf.key.end(), left.begin() + 1);
        }, leaf.value);
    }

    encoded_node_t::encoded_node_t(const hash_t &l, const hash_t &r):
        left { l },
        right { r }
    {
        left[0] &= 0x7F;
    }

    hash_t encoded_node_t::hash(const hash_func &hf) const
    {
        return hash_of(*this, hf);
    }

    decoded_node_t decode_node(const buffer bytes)
    {
        if (bytes.size() != sizeof(encoded_node_t)) [[unlikely]]
            throw error(fmt::format("a trie node must have {} bytes but got {}", sizeof(encoded_node_t), bytes.size()));
        const auto hdr = bytes[0];
        if (!(hdr & 0x80))
            return branch_t { bytes.subbuf(0, 32), bytes.subbuf(32, 32) };
        leaf_t leaf { bytes.subbuf(1, 31), value_inplace_t {} };
        if ((hdr & 0xC0) == 0xC0) {
            if (hdr != 0xC0) [[unlikely]]
                throw error(fmt::format("unsupported trie leaf header: {:02X}", hdr));
            leaf.value = value_hash_t { bytes.subbuf(32, 32) };
            return leaf;
        }
        const size_t sz = hdr & 0x3F;
        if (sz > max_inplace_value_size) [[unlikely]]
            throw error(fmt::format("an embedded trie value cannot have {} bytes", sz));
        const auto padding = bytes.subbuf(32 + sz);
        if (std::any_of(padding.begin(), padding.end(), [](const auto b) { return b != 0; })) [[unlikely]]
            throw error("an embedded trie value has non-zero padding");
        const auto val = bytes.subbuf(32, sz);
        leaf.value = value_inplace_t { val.begin(), val.end() };
        return leaf;
    }
}
