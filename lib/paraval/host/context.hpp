#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <paraval/common/arena.hpp>
#include <paraval/storage/common.hpp>

namespace paraval::host {
    struct call_stats_t {
        size_t get_allocated_storage = 0;
        size_t get_storage_into = 0;
        size_t set_storage = 0;
        size_t exists_storage = 0;
        size_t clear_storage = 0;
        size_t storage_root = 0;

        [[nodiscard]] size_t total() const noexcept
        {
            return get_allocated_storage + get_storage_into + set_storage
                + exists_storage + clear_storage + storage_root;
        }
    };

    // The state of a single validation call that the host externals operate on.
    // Buffers returned to the block execution are owned by the arena and live as long as the context.
    struct context_t {
        explicit context_t(storage::backend_t &storage);
        context_t(const context_t &) =delete;
        context_t &operator=(const context_t &) =delete;

        [[nodiscard]] storage::backend_t &storage() const noexcept
        {
            return _storage;
        }

        [[nodiscard]] call_arena_t &arena() noexcept
        {
            return _arena;
        }

        [[nodiscard]] call_stats_t &stats() noexcept
        {
            return _stats;
        }

        [[nodiscard]] const call_stats_t &stats() const noexcept
        {
            return _stats;
        }

        // the process-wide slot with the installed context; does not own it
        static context_t *&slot();
        // throws when no context is installed
        static context_t &active();
    private:
        storage::backend_t &_storage;
        call_arena_t _arena {};
        call_stats_t _stats {};
    };
}

namespace fmt {
    template<>
    struct formatter<paraval::host::call_stats_t>: formatter<int> {
        template<typename FormatContext>
        auto format(const paraval::host::call_stats_t &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "get_allocated: {} get_into: {} set: {} exists: {} clear: {} root: {}",
                v.get_allocated_storage, v.get_storage_into, v.set_storage, v.exists_storage, v.clear_storage, v.storage_root);
        }
    };
}
