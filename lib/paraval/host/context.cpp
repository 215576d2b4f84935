/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "context.hpp"

namespace paraval::host {
    context_t::context_t(storage::backend_t &storage):
        _storage { storage }
    {
    }

    context_t *&context_t::slot()
    {
        static context_t *ctx = nullptr;
        return ctx;
    }

    context_t &context_t::active()
    {
        auto *ctx = slot();
        if (!ctx) [[unlikely]]
            throw error("host: no validation context is installed");
        return *ctx;
    }
}
