#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/codec/encoding.hpp>
#include <paraval/codec/types.hpp>
#include <paraval/trie/node.hpp>

namespace paraval::parachain {
    using hash_t = trie::hash_t;
    using block_number_t = uint32_t;
    using extrinsic_t = codec::byte_sequence_t;
    using extrinsics_t = codec::sequence_t<extrinsic_t>;
    using digest_item_t = codec::byte_sequence_t;
    using digest_t = codec::sequence_t<digest_item_t>;
    using witness_t = codec::sequence_t<codec::byte_sequence_t>;

    struct header_t {
        hash_t parent_hash {};
        block_number_t number = 0;
        hash_t state_root {};
        hash_t extrinsics_root {};
        digest_t digest {};

        [[nodiscard]] hash_t hash(const trie::hash_func &hf=trie::blake2b_hash_func) const
        {
            return trie::hash_of(codec::to_bytes(*this), hf);
        }

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("parent_hash"sv, parent_hash);
            archive.process_varlen_uint(number);
            archive.process("state_root"sv, state_root);
            archive.process("extrinsics_root"sv, extrinsics_root);
            archive.process("digest"sv, digest);
        }

        bool operator==(const header_t &o) const =default;
    };

    struct block_t {
        header_t header;
        extrinsics_t extrinsics;

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("header"sv, header);
            archive.process("extrinsics"sv, extrinsics);
        }

        bool operator==(const block_t &o) const =default;
    };

    // The payload a collator submits: the block and the trie nodes that prove the parent state it touches.
    struct block_data_t {
        header_t header;
        extrinsics_t extrinsics;
        witness_t witness;
        hash_t witness_root {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("header"sv, header);
            archive.process("extrinsics"sv, extrinsics);
            archive.process("witness"sv, witness);
            archive.process("witness_root"sv, witness_root);
        }

        bool operator==(const block_data_t &o) const =default;
    };

    // Both payloads stay encoded until the validation decodes them.
    struct validation_params_t {
        codec::byte_sequence_t block_data {};
        codec::byte_sequence_t parent_head {};

        void serialize(auto &archive)
        {
            using namespace std::string_view_literals;
            archive.process("block_data"sv, block_data);
            archive.process("parent_head"sv, parent_head);
        }
    };
}
