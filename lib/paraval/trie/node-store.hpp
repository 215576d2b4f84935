#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <memory>
#include <optional>
#include "node.hpp"

namespace paraval::trie {
    struct err_incomplete_witness_t final: error {
        explicit err_incomplete_witness_t(const hash_t &missing):
            error { fmt::format("err_incomplete_witness_t: {} is not available", missing) },
            _missing { missing }
        {
        }

        [[nodiscard]] const hash_t &missing() const noexcept
        {
            return _missing;
        }
    private:
        hash_t _missing;
    };

    // Content-addressed and reference-counted storage of trie nodes and out-of-line values.
    struct node_store_t {
        using observer_t = std::function<void(const hash_t &, buffer)>;

        explicit node_store_t(const hash_func &hf=blake2b_hash_func);

        // returns the hash of the blob; a repeated insert only increases the reference count
        hash_t insert(buffer bytes);
        // returns false if the blob is not present; the blob is erased when its last reference goes away
        bool remove(const hash_t &h);
        // the returned view stays valid until the blob is removed
        [[nodiscard]] std::optional<buffer> get(const hash_t &h) const;
        // unlike get requires all 256 bits of the hash to match
        [[nodiscard]] bool contains(const hash_t &h) const;
        [[nodiscard]] size_t refs(const hash_t &h) const;
        [[nodiscard]] size_t size() const;
        void foreach(const observer_t &obs) const;
        [[nodiscard]] const hash_func &hasher() const;
    private:
        struct entry_t {
            hash_t hash;
            uint8_vector bytes;
            size_t refs = 0;
        };

        hash_func _hash_func;
        std::map<hash_t, entry_t> _entries {};
    };
    using node_store_ptr_t = std::shared_ptr<node_store_t>;
}
