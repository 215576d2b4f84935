#pragma once
/* Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <memory>
#include <vector>
#include "bytes.hpp"

namespace paraval {
    // Owns every buffer handed out during its lifetime and releases them together.
    // Pointers returned by allocate and copy stay valid until the arena is destroyed.
    struct call_arena_t {
        call_arena_t() =default;
        call_arena_t(const call_arena_t &) =delete;
        call_arena_t &operator=(const call_arena_t &) =delete;

        // never returns nullptr, even for zero-sized requests
        uint8_t *allocate(const size_t sz)
        {
            auto &chunk = _chunks.emplace_back(std::make_unique<uint8_t[]>(std::max(sz, size_t { 1 })));
            _num_bytes += sz;
            return chunk.get();
        }

        uint8_t *copy(const buffer bytes)
        {
            auto *ptr = allocate(bytes.size());
            std::copy(bytes.begin(), bytes.end(), ptr);
            return ptr;
        }

        [[nodiscard]] size_t num_allocations() const noexcept
        {
            return _chunks.size();
        }

        [[nodiscard]] size_t num_bytes() const noexcept
        {
            return _num_bytes;
        }
    private:
        std::vector<std::unique_ptr<uint8_t[]>> _chunks {};
        size_t _num_bytes = 0;
    };
}
