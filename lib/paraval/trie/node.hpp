#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <variant>
#include <boost/container/static_vector.hpp>
#include <paraval/common/bytes.hpp>
#include <paraval/crypto/blake2b.hpp>

namespace paraval::trie {
    using hash_t = crypto::blake2b::hash_t;
    using hash_span_t = crypto::blake2b::hash_span_t;
    using hash_func = std::function<void(const hash_span_t &, const buffer &)>;
    using key_t = byte_array<31>;

    static constexpr auto blake2b_hash_func = static_cast<void(*)(const hash_span_t &, const buffer &)>(crypto::blake2b::digest);
    static constexpr size_t key_bits = key_t::num_bits();
    static constexpr size_t max_inplace_value_size = sizeof(hash_t);

    // A trie key is the first 31 bytes of the hash of the storage key.
    extern key_t make_key(buffer storage_key, const hash_func &hf);
    // Bits are numbered from the most significant bit of the first byte.
    extern bool key_bit(const key_t &k, size_t i);
    // Branches keep only 255 bits of their left child's hash, so lookups use hashes with the top bit cleared.
    extern hash_t node_ref(const hash_t &h);
    extern hash_t hash_of(buffer bytes, const hash_func &hf);
    // A trie without keys is committed as a single zero byte.
    // The all-zero hash marks only an absent child of a branch and is never a root.
    extern buffer empty_node();
    extern hash_t empty_root(const hash_func &hf);

    struct value_inplace_t: boost::container::static_vector<uint8_t, max_inplace_value_size> {
        using base_type = boost::container::static_vector<uint8_t, max_inplace_value_size>;
        using base_type::base_type;
    };

    using value_hash_t = hash_t;
    using value_base_t = std::variant<value_inplace_t, value_hash_t>;

    struct value_t: value_base_t {
        using base_type = value_base_t;
        using base_type::base_type;

        value_t() =default;

        value_t(const buffer &val, const hash_func &hf):
            base_type { _from_bytes(val, hf) }
        {
        }

        [[nodiscard]] bool inplace() const noexcept
        {
            return std::holds_alternative<value_inplace_t>(*this);
        }
    private:
        static value_base_t _from_bytes(const buffer &v, const hash_func &hf)
        {
            if (v.size() <= max_inplace_value_size)
                return value_inplace_t { v.begin(), v.end() };
            return hash_of(v, hf);
        }
    };

    struct leaf_t {
        key_t key;
        value_t value;

        bool operator==(const leaf_t &o) const =default;
    };

    struct branch_t {
        hash_t left;
        hash_t right;

        bool operator==(const branch_t &o) const =default;
    };

    using decoded_node_t = std::variant<branch_t, leaf_t>;

    // The 64-byte serialized form of a node.
    // A branch: the left child's hash with the top bit cleared followed by the right child's hash.
    // An embedded leaf: 0x80 | value size, the key, the value padded with zeros.
    // A hashed leaf: 0xC0, the key, the hash of the value.
    struct encoded_node_t {
        hash_t left;
        hash_t right;

        explicit encoded_node_t(const leaf_t &leaf);
        encoded_node_t(const hash_t &l, const hash_t &r);

        [[nodiscard]] hash_t hash(const hash_func &hf) const;

        operator buffer() const
        {
            return { reinterpret_cast<const uint8_t *>(this), sizeof(*this) };
        }
    };
    static_assert(sizeof(encoded_node_t) == 64U);

    // Throws paraval::error on bytes that are not a canonical node encoding.
    extern decoded_node_t decode_node(buffer bytes);
}
