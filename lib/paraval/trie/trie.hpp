#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <span>
#include <vector>
#include "node-store.hpp"

namespace paraval::trie {
    using opt_value_bytes_t = std::optional<uint8_vector>;

    // A binary merkle trie over 248-bit keys.
    // When constructed from a root inside a node store, nodes are loaded lazily on first access.
    // Methods that reach a node missing from the store throw err_incomplete_witness_t.
    struct trie_t {
        explicit trie_t(const hash_func &hf=blake2b_hash_func);
        trie_t(node_store_ptr_t store, const hash_t &root);
        trie_t(trie_t &&o);
        ~trie_t();

        trie_t &operator=(trie_t &&o);

        [[nodiscard]] bool empty() const;
        bool erase(const key_t &key);
        [[nodiscard]] opt_value_bytes_t get(const key_t &key) const;
        void set(const key_t &key, buffer value);
        [[nodiscard]] hash_t root() const;
        // writes all nodes and values created since the last commit into the store
        void commit();
        // the node and value blobs needed to read the keys and to erase them
        [[nodiscard]] std::vector<uint8_vector> prove(std::span<const key_t> keys) const;
        [[nodiscard]] const node_store_ptr_t &store() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    // does not modify the store; returns an empty optional when the key is absent
    extern opt_value_bytes_t read_value(const node_store_t &store, const hash_t &root, const key_t &key);
    extern hash_t merklize(const std::map<key_t, uint8_vector> &entries, const hash_func &hf=blake2b_hash_func);
}
