/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/common/numeric-cast.hpp>
#include <paraval/common/test.hpp>
#include <paraval/storage/memory.hpp>
#include "externals.hpp"

namespace {
    using namespace paraval;
    using namespace paraval::host;
    using namespace std::string_view_literals;

    void set(const std::string_view k, const std::string_view v)
    {
        const buffer kb = k;
        const buffer vb = v;
        ext_set_storage(kb.data(), numeric_cast<uint32_t>(kb.size()), vb.data(), numeric_cast<uint32_t>(vb.size()));
    }

    uint32_t exists(const std::string_view k)
    {
        const buffer kb = k;
        return ext_exists_storage(kb.data(), numeric_cast<uint32_t>(kb.size()));
    }

    void clear(const std::string_view k)
    {
        const buffer kb = k;
        ext_clear_storage(kb.data(), numeric_cast<uint32_t>(kb.size()));
    }

    storage::value_t get(const std::string_view k)
    {
        const buffer kb = k;
        uint32_t written = 0;
        const auto *ptr = ext_get_allocated_storage(kb.data(), numeric_cast<uint32_t>(kb.size()), &written);
        if (written == value_absent) {
            expect(ptr == nullptr);
            return {};
        }
        expect(ptr != nullptr);
        return uint8_vector { buffer { ptr, written } };
    }

    storage::root_t root()
    {
        storage::root_t res {};
        ext_storage_root(res.data());
        return res;
    }

    size_t num_test_calls = 0;

    uint32_t test_exists_storage(const uint8_t *, uint32_t)
    {
        ++num_test_calls;
        return 7;
    }
}

suite paraval_host_externals_suite = [] {
    "paraval::host::externals"_test = [] {
        "unbound by default"_test = [] {
            expect(bindings() == unbound_externals());
            expect(context_t::slot() == nullptr);
            expect(throws<error>([] { static_cast<void>(exists("a"sv)); }));
            expect(throws<error>([] { set("a"sv, "1"sv); }));
            expect(throws<error>([] { static_cast<void>(root()); }));
            expect(throws<error>([] { static_cast<void>(context_t::active()); }));
        };
        "storage operations"_test = [] {
            storage::memory::db_t db {};
            context_t ctx { db };
            {
                interposition_t guard { ctx };
                expect(bindings() == context_externals());
                expect(context_t::slot() == &ctx);
                expect_equal(uint32_t { 0 }, exists("a"sv));
                expect_equal(storage::value_t {}, get("a"sv));
                set("a"sv, "1"sv);
                expect_equal(uint32_t { 1 }, exists("a"sv));
                expect_equal(storage::value_t { uint8_vector { "1"sv } }, get("a"sv));
                expect_equal(storage::root_t::from_hex("BAD0875FD4F989A2D65D84B86B2B527DA2AE2B73A15F5A018C46972137BA67B9"), root());
                set("empty"sv, ""sv);
                expect_equal(uint32_t { 1 }, exists("empty"sv));
                expect_equal(storage::value_t { uint8_vector {} }, get("empty"sv));
                clear("a"sv);
                expect_equal(uint32_t { 0 }, exists("a"sv));
                expect_equal(storage::value_t {}, get("a"sv));
            }
            expect(bindings() == unbound_externals());
            expect(context_t::slot() == nullptr);
            expect_equal(size_t { 4 }, ctx.stats().get_allocated_storage);
            expect_equal(size_t { 4 }, ctx.stats().exists_storage);
            expect_equal(size_t { 2 }, ctx.stats().set_storage);
            expect_equal(size_t { 1 }, ctx.stats().clear_storage);
            expect_equal(size_t { 1 }, ctx.stats().storage_root);
            expect_equal(size_t { 0 }, ctx.stats().get_storage_into);
        };
        "get_storage_into"_test = [] {
            storage::memory::db_t db {};
            db.insert("k"sv, "0123456789"sv);
            context_t ctx { db };
            interposition_t guard { ctx };
            const buffer key = "k"sv;
            std::array<uint8_t, 4> out {};
            expect_equal(uint32_t { 4 }, ext_get_storage_into(key.data(), 1, out.data(), 4, 0));
            expect_equal(std::string_view { "0123" }, static_cast<std::string_view>(buffer { out.data(), 4 }));
            expect_equal(uint32_t { 3 }, ext_get_storage_into(key.data(), 1, out.data(), 4, 7));
            expect_equal(std::string_view { "789" }, static_cast<std::string_view>(buffer { out.data(), 3 }));
            expect_equal(uint32_t { 2 }, ext_get_storage_into(key.data(), 1, out.data(), 2, 3));
            expect_equal(std::string_view { "34" }, static_cast<std::string_view>(buffer { out.data(), 2 }));
            out = { 0xAA, 0xAA, 0xAA, 0xAA };
            expect_equal(uint32_t { 0 }, ext_get_storage_into(key.data(), 1, out.data(), 4, 10));
            expect_equal(uint32_t { 0 }, ext_get_storage_into(key.data(), 1, out.data(), 4, 1000));
            expect_equal(uint32_t { 0 }, ext_get_storage_into(key.data(), 1, out.data(), 0, 0));
            expect_equal(uint8_t { 0xAA }, out[0]);
            const buffer missing = "missing"sv;
            expect_equal(value_absent, ext_get_storage_into(missing.data(), 7, out.data(), 4, 0));
            expect_equal(size_t { 7 }, ctx.stats().get_storage_into);
        };
        "allocations are owned by the context"_test = [] {
            storage::memory::db_t db {};
            db.insert("k"sv, "value"sv);
            context_t ctx { db };
            interposition_t guard { ctx };
            const buffer key = "k"sv;
            uint32_t written = 0;
            const auto *p1 = ext_get_allocated_storage(key.data(), 1, &written);
            const auto *p2 = ext_get_allocated_storage(key.data(), 1, &written);
            expect_equal(uint32_t { 5 }, written);
            expect(p1 != p2);
            expect_equal(std::string_view { "value" }, static_cast<std::string_view>(buffer { p1, written }));
            expect_equal(size_t { 2 }, ctx.arena().num_allocations());
            expect_equal(size_t { 10 }, ctx.arena().num_bytes());
            expect_equal(size_t { 2 }, ctx.stats().total());
        };
        "nested installations"_test = [] {
            storage::memory::db_t outer_db {};
            storage::memory::db_t inner_db {};
            context_t outer_ctx { outer_db };
            context_t inner_ctx { inner_db };
            interposition_t outer { outer_ctx };
            set("a"sv, "outer"sv);
            {
                interposition_t inner { inner_ctx };
                expect(context_t::slot() == &inner_ctx);
                expect_equal(uint32_t { 0 }, exists("a"sv));
                set("a"sv, "inner"sv);
            }
            expect(context_t::slot() == &outer_ctx);
            expect_equal(storage::value_t { uint8_vector { "outer"sv } }, get("a"sv));
            expect_equal(storage::value_t { uint8_vector { "inner"sv } }, inner_db.get("a"sv));
        };
        "restored after an exception"_test = [] {
            storage::memory::db_t db {};
            context_t ctx { db };
            expect(throws<error>([&] {
                interposition_t guard { ctx };
                set("a"sv, "1"sv);
                throw error("execution failed");
            }));
            expect(bindings() == unbound_externals());
            expect(context_t::slot() == nullptr);
            expect_equal(storage::value_t { uint8_vector { "1"sv } }, db.get("a"sv));
        };
        "custom tables"_test = [] {
            storage::memory::db_t db {};
            context_t ctx { db };
            auto ext = context_externals();
            ext.exists_storage = test_exists_storage;
            num_test_calls = 0;
            {
                interposition_t guard { ctx, ext };
                expect_equal(uint32_t { 7 }, exists("a"sv));
                set("a"sv, "1"sv);
            }
            expect_equal(size_t { 1 }, num_test_calls);
            expect(db.contains("a"sv));
            expect(bindings() == unbound_externals());
        };
    };
};
