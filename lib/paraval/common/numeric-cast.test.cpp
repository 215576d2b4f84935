/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "test.hpp"
#include "numeric-cast.hpp"

namespace {
    using namespace paraval;
}

suite paraval_common_numeric_cast_suite = [] {
    "paraval::common::numeric_cast"_test = [] {
        expect_equal(uint32_t { 24 }, numeric_cast<uint32_t>(size_t { 24 }));
        expect_equal(int64_t { -24 }, numeric_cast<int64_t>(int32_t { -24 }));
        expect_equal(uint32_t { 0xFFFFFFFFU }, numeric_cast<uint32_t>(uint64_t { 0xFFFFFFFFULL }));
        expect(throws([] { static_cast<void>(numeric_cast<uint32_t>(uint64_t { 0x100000000ULL })); }));
        expect(throws([] { static_cast<void>(numeric_cast<uint32_t>(int64_t { -1 })); }));
        expect(throws([] { static_cast<void>(numeric_cast<int64_t>(std::numeric_limits<uint64_t>::max())); }));
    };
};
