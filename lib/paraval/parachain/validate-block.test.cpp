/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/common/numeric-cast.hpp>
#include <paraval/common/test.hpp>
#include <paraval/host/externals.hpp>
#include <paraval/storage/memory.hpp>
#include <paraval/trie/trie.hpp>
#include "validate-block.hpp"

namespace {
    using namespace paraval;
    using namespace paraval::parachain;
    using namespace std::string_view_literals;

    void set(const std::string_view k, const std::string_view v)
    {
        const buffer kb = k;
        const buffer vb = v;
        host::ext_set_storage(kb.data(), numeric_cast<uint32_t>(kb.size()), vb.data(), numeric_cast<uint32_t>(vb.size()));
    }

    storage::value_t get(const std::string_view k)
    {
        const buffer kb = k;
        uint32_t written = 0;
        const auto *ptr = host::ext_get_allocated_storage(kb.data(), numeric_cast<uint32_t>(kb.size()), &written);
        if (written == host::value_absent)
            return {};
        return uint8_vector { buffer { ptr, written } };
    }

    storage::root_t root()
    {
        storage::root_t res {};
        host::ext_storage_root(res.data());
        return res;
    }

    struct chain_fixture_t {
        header_t parent {};
        block_data_t block_data {};

        explicit chain_fixture_t(const std::map<std::string, std::string> &state)
        {
            trie::trie_t t {};
            for (const auto &[k, v]: state)
                t.set(trie::make_key(k, trie::blake2b_hash_func), v);
            t.commit();
            t.store()->foreach([&](const auto &, const buffer bytes) {
                block_data.witness.emplace_back(bytes);
            });
            parent.number = 7;
            parent.state_root = t.root();
            block_data.header.parent_hash = parent.hash();
            block_data.header.number = 8;
            block_data.header.digest.emplace_back(uint8_vector::from_hex("AABB"));
            block_data.extrinsics.emplace_back(uint8_vector::from_hex("0102"));
            block_data.extrinsics.emplace_back(uint8_vector::from_hex("030405"));
            block_data.witness_root = t.root();
        }

        [[nodiscard]] validation_params_t params() const
        {
            return { codec::byte_sequence_t { codec::to_bytes(block_data) }, codec::byte_sequence_t { codec::to_bytes(parent) } };
        }
    };
}

suite paraval_parachain_validate_block_suite = [] {
    "paraval::parachain::validate_block"_test = [] {
        static const std::map<std::string, std::string> single_state { { "a", "1" } };
        "header encoding"_test = [] {
            header_t h {};
            h.number = 128;
            h.digest.emplace_back(uint8_vector::from_hex("FF"));
            const auto bytes = codec::to_bytes(h);
            expect_equal(size_t { 32 + 2 + 32 + 32 + 3 }, bytes.size());
            expect(codec::from_bytes<header_t>(bytes) == h);
            expect_equal(trie::hash_of(bytes, trie::blake2b_hash_func), h.hash());
        };
        "execution over the witness"_test = [] {
            const chain_fixture_t f { single_state };
            expect_equal(trie::hash_t::from_hex("BAD0875FD4F989A2D65D84B86B2B527DA2AE2B73A15F5A018C46972137BA67B9"), f.block_data.witness_root);
            size_t num_calls = 0;
            storage::value_t before {}, after {};
            storage::root_t new_root {};
            const auto res = validate_block(f.params(), [&](const block_t &blk) {
                ++num_calls;
                expect(blk.header == f.block_data.header);
                expect(blk.extrinsics == f.block_data.extrinsics);
                before = get("a"sv);
                set("a"sv, "2"sv);
                after = get("a"sv);
                new_root = root();
            });
            expect_equal(size_t { 1 }, num_calls);
            expect_equal(storage::value_t { uint8_vector { "1"sv } }, before);
            expect_equal(storage::value_t { uint8_vector { "2"sv } }, after);
            expect_equal(trie::hash_t::from_hex("19FC8F7B21A4F7570301E3F56D088A02704D69D284D58F62F88ED23EC48ED2E8"), new_root);
            expect(new_root != f.block_data.witness_root);
            std::map<trie::key_t, uint8_vector> expected {};
            expected.try_emplace(trie::make_key("a"sv, trie::blake2b_hash_func), uint8_vector { "2"sv });
            expect_equal(trie::merklize(expected), new_root);
            expect_equal(f.block_data.header.hash(), res.block_hash);
            expect_equal(size_t { 2 }, res.stats.get_allocated_storage);
            expect_equal(size_t { 1 }, res.stats.set_storage);
            expect_equal(size_t { 1 }, res.stats.storage_root);
            expect_equal(size_t { 4 }, res.stats.total());
            expect(host::bindings() == host::unbound_externals());
            expect(host::context_t::slot() == nullptr);
        };
        "bad parent hash"_test = [] {
            chain_fixture_t f { single_state };
            f.block_data.header.parent_hash[0] ^= 0x01;
            size_t num_calls = 0;
            expect(throws<err_bad_parent_hash_t>([&] {
                static_cast<void>(validate_block(f.params(), [&](const block_t &) { ++num_calls; }));
            }));
            expect_equal(size_t { 0 }, num_calls);
            f.parent.number = 6;
            expect(throws<err_bad_parent_hash_t>([&] {
                static_cast<void>(validate_block(f.params(), [&](const block_t &) { ++num_calls; }));
            }));
            expect_equal(size_t { 0 }, num_calls);
        };
        "witness mismatch"_test = [] {
            chain_fixture_t f { single_state };
            f.block_data.witness_root[31] ^= 0x01;
            size_t num_calls = 0;
            expect(throws<err_witness_mismatch_t>([&] {
                static_cast<void>(validate_block(f.params(), [&](const block_t &) { ++num_calls; }));
            }));
            f.block_data.witness_root = f.parent.state_root;
            f.block_data.witness.clear();
            expect(throws<err_witness_mismatch_t>([&] {
                static_cast<void>(validate_block(f.params(), [&](const block_t &) { ++num_calls; }));
            }));
            expect_equal(size_t { 0 }, num_calls);
        };
        "malformed payloads"_test = [] {
            const chain_fixture_t f { single_state };
            size_t num_calls = 0;
            const auto run = [&](const validation_params_t &params) {
                static_cast<void>(validate_block(params, [&](const block_t &) { ++num_calls; }));
            };
            {
                auto params = f.params();
                params.block_data = codec::byte_sequence_t { uint8_vector::from_hex("FF") };
                expect(throws<err_decode_t>([&] { run(params); }));
            }
            {
                auto params = f.params();
                params.block_data.emplace_back(0);
                expect(throws<err_decode_t>([&] { run(params); }));
            }
            {
                auto params = f.params();
                params.block_data.resize(params.block_data.size() - 1);
                expect(throws<err_decode_t>([&] { run(params); }));
            }
            {
                auto params = f.params();
                params.parent_head.resize(40);
                expect(throws<err_decode_t>([&] { run(params); }));
            }
            {
                auto params = f.params();
                params.parent_head.clear();
                expect(throws<err_decode_t>([&] { run(params); }));
            }
            expect_equal(size_t { 0 }, num_calls);
            expect(throws<error>([&] { static_cast<void>(validate_block(f.params(), execute_block_func {})); }));
        };
        "bindings restored after a failed execution"_test = [] {
            const chain_fixture_t f { single_state };
            expect(throws<error>([&] {
                static_cast<void>(validate_block(f.params(), [](const block_t &) {
                    set("a"sv, "2"sv);
                    throw error("execution failed");
                }));
            }));
            expect(host::bindings() == host::unbound_externals());
            expect(host::context_t::slot() == nullptr);
        };
        "bindings restored to an outer backend"_test = [] {
            const chain_fixture_t f { single_state };
            storage::memory::db_t outer_db {};
            host::context_t outer_ctx { outer_db };
            const host::interposition_t outer { outer_ctx };
            set("a"sv, "outer"sv);
            storage::value_t inner_value {};
            static_cast<void>(validate_block(f.params(), [&](const block_t &) {
                inner_value = get("a"sv);
                set("b"sv, "inner"sv);
            }));
            expect_equal(storage::value_t { uint8_vector { "1"sv } }, inner_value);
            expect(host::context_t::slot() == &outer_ctx);
            expect_equal(storage::value_t { uint8_vector { "outer"sv } }, get("a"sv));
            expect_equal(storage::value_t {}, get("b"sv));
        };
        "partial witness"_test = [] {
            std::map<std::string, std::string> state {};
            for (size_t i = 0; i < 0x20; ++i)
                state.try_emplace(fmt::format("key-{}", i), fmt::format("value-{}", i));
            chain_fixture_t f { state };
            // only the root node
            trie::trie_t t {};
            for (const auto &[k, v]: state)
                t.set(trie::make_key(k, trie::blake2b_hash_func), v);
            t.commit();
            const auto root_blob = t.store()->get(t.root());
            expect(root_blob.has_value());
            f.block_data.witness.clear();
            f.block_data.witness.emplace_back(*root_blob);
            storage::value_t missing_value { uint8_vector {} };
            storage::root_t new_root = f.block_data.witness_root;
            static_cast<void>(validate_block(f.params(), [&](const block_t &) {
                missing_value = get("key-0"sv);
                set("key-1"sv, "updated"sv);
                new_root = root();
            }));
            expect_equal(storage::value_t {}, missing_value);
            expect_equal(storage::root_t {}, new_root);
        };
    };
};
