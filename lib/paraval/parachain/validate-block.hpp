#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include <paraval/host/context.hpp>
#include "errors.hpp"
#include "types.hpp"

namespace paraval::parachain {
    // Runs the block against the storage that the host externals currently expose.
    using execute_block_func = std::function<void(const block_t &)>;

    struct validation_result_t {
        hash_t block_hash {};
        host::call_stats_t stats {};
    };

    // Checks the parent linkage and the witness of a block and executes it over the witness storage.
    // The storage externals are bound to the witness storage only while execute runs
    // and the previous bindings are restored on every exit path.
    // Throws err_decode_t, err_bad_parent_hash_t, err_witness_mismatch_t
    // or whatever the execution throws.
    extern validation_result_t validate_block(const validation_params_t &params, const execute_block_func &execute,
        const trie::hash_func &hf=trie::blake2b_hash_func);
}
