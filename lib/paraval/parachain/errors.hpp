#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/common/error.hpp>
#include <paraval/storage/witness.hpp>

namespace paraval::parachain {
    struct err_decode_t final: error {
        explicit err_decode_t(const std::string_view what, const std::exception &ex):
            error { fmt::format("err_decode_t: invalid {}", what), ex }
        {
        }
    };

    struct err_bad_parent_hash_t final: error {
        explicit err_bad_parent_hash_t(const trie::hash_t &expected, const trie::hash_t &actual):
            error { fmt::format("err_bad_parent_hash_t: the block refers to parent {} but the parent header hashes to {}", expected, actual) }
        {
        }
    };

    using err_witness_mismatch_t = storage::witness::err_witness_mismatch_t;
}
