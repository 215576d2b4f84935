/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/common/test.hpp>
#include <paraval/trie/trie.hpp>
#include "memory.hpp"

namespace {
    using namespace paraval;
    using namespace paraval::storage;
    using namespace std::string_view_literals;
}

suite paraval_storage_memory_suite = [] {
    "paraval::storage::memory"_test = [] {
        "get, insert, and remove"_test = [] {
            memory::db_t db {};
            expect_equal(value_t {}, db.get("AB"sv));
            expect(!db.contains("AB"sv));
            db.insert("AB"sv, "CD"sv);
            expect_equal(value_t { uint8_vector { "CD"sv } }, db.get("AB"sv));
            expect(db.contains("AB"sv));
            db.insert("AB"sv, "EF"sv);
            expect_equal(value_t { uint8_vector { "EF"sv } }, db.get("AB"sv));
            db.remove("AB"sv);
            expect_equal(value_t {}, db.get("AB"sv));
            db.remove("AB"sv);
            expect_equal(size_t { 0 }, db.size());
        };
        "storage_root"_test = [] {
            memory::db_t db {};
            expect_equal(trie::empty_root(trie::blake2b_hash_func), db.storage_root());
            expect(db.storage_root() != root_t {});
            db.insert("a"sv, "1"sv);
            expect_equal(root_t::from_hex("BAD0875FD4F989A2D65D84B86B2B527DA2AE2B73A15F5A018C46972137BA67B9"), db.storage_root());
            db.insert("b"sv, "2"sv);
            expect_equal(root_t::from_hex("83562D34307F4F70E57E48DA7B60AB79501AD288890C37C7234494520CFA6553"), db.storage_root());
            db.remove("b"sv);
            expect_equal(root_t::from_hex("BAD0875FD4F989A2D65D84B86B2B527DA2AE2B73A15F5A018C46972137BA67B9"), db.storage_root());
            db.remove("a"sv);
            expect_equal(trie::empty_root(trie::blake2b_hash_func), db.storage_root());
        };
        "foreach"_test = [] {
            memory::db_t db {};
            std::map<uint8_vector, uint8_vector> exp {};
            exp.try_emplace(uint8_vector::from_hex("AABB"), uint8_vector::from_hex("0011"));
            exp.try_emplace(uint8_vector::from_hex("CCDD"), uint8_vector::from_hex("2233"));
            for (const auto &[k, v]: exp)
                db.insert(k, v);
            std::map<uint8_vector, uint8_vector> act {};
            db.foreach([&](const buffer k, const buffer v) {
                act.try_emplace(uint8_vector { k }, uint8_vector { v });
            });
            expect(exp == act);
        };
    };
};
