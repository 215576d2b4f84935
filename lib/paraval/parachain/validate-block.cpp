/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/common/logger.hpp>
#include <paraval/host/externals.hpp>
#include <paraval/storage/witness.hpp>
#include "validate-block.hpp"

namespace paraval::parachain {
    namespace {
        template<typename T>
        T decode_payload(const std::string_view what, const buffer bytes)
        {
            try {
                return codec::from_bytes<T>(bytes);
            } catch (const std::exception &ex) {
                throw err_decode_t { what, ex };
            }
        }
    }

    validation_result_t validate_block(const validation_params_t &params, const execute_block_func &execute, const trie::hash_func &hf)
    {
        if (!execute) [[unlikely]]
            throw error("validate_block: the execution routine is not set");
        auto block_data = decode_payload<block_data_t>("block data", params.block_data);
        const auto parent_head = decode_payload<header_t>("parent header", params.parent_head);
        logger::debug("validate_block: decoded block #{} with {} extrinsics and a witness of {} nodes",
            block_data.header.number, block_data.extrinsics.size(), block_data.witness.size());

        const block_t block { std::move(block_data.header), std::move(block_data.extrinsics) };
        const auto parent_hash = parent_head.hash(hf);
        if (block.header.parent_hash != parent_hash) [[unlikely]]
            throw err_bad_parent_hash_t { block.header.parent_hash, parent_hash };

        storage::witness::db_t witness_db { block_data.witness, block_data.witness_root, hf };
        validation_result_t res { block.header.hash(hf) };
        host::context_t ctx { witness_db };
        {
            const host::interposition_t guard { ctx };
            logger::debug("validate_block: executing block {}", res.block_hash);
            logger::run_log_errors_rethrow([&] {
                execute(block);
            });
        }
        res.stats = ctx.stats();
        logger::debug("validate_block: block {} executed with {} host calls ({}), {} bytes returned in {} allocations",
            res.block_hash, res.stats.total(), res.stats, ctx.arena().num_bytes(), ctx.arena().num_allocations());
        return res;
    }
}
