#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <span>
#include <paraval/codec/types.hpp>
#include <paraval/trie/node-store.hpp>
#include "common.hpp"

namespace paraval::storage::witness {
    struct err_witness_mismatch_t final: error {
        explicit err_witness_mismatch_t(const root_t &root):
            error { fmt::format("err_witness_mismatch_t: the witness does not contain the claimed root {}", root) }
        {
        }
    };

    // A storage view over a witness bundle: reads go to the witness trie,
    // writes are collected in an overlay and never modify the witness.
    //
    // Writes are pending until the next successful storage_root call, after which they become committed.
    // Every storage_root call recomputes the root from the unchanged base root
    // with the committed and the pending writes applied, so repeated calls are idempotent.
    // Reads see the pending writes first, then the committed ones, then the witness trie.
    struct db_t: storage::backend_t {
        db_t(std::span<const codec::byte_sequence_t> witness, const root_t &root, const trie::hash_func &hf=trie::blake2b_hash_func);
        ~db_t() override;
        // missing or malformed witness data on the lookup path reads as an absent value
        value_t get(buffer key) const override;
        void insert(buffer key, buffer val) override;
        void remove(buffer key) override;
        // returns the all-zero root when the writes touch nodes that the witness does not include
        root_t storage_root() override;

        [[nodiscard]] const root_t &base_root() const;
        [[nodiscard]] size_t num_pending() const;
        [[nodiscard]] size_t num_committed() const;
        [[nodiscard]] const trie::node_store_t &store() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
