#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <functional>
#include "common.hpp"

namespace paraval::storage::memory {
    using observer_t = std::function<void(buffer, buffer)>;

    // A plain map of all key-value pairs. Its root is the merkle root of the whole map.
    struct db_t: storage::backend_t {
        explicit db_t(const trie::hash_func &hf=trie::blake2b_hash_func);
        ~db_t() override;
        value_t get(buffer key) const override;
        void insert(buffer key, buffer val) override;
        void remove(buffer key) override;
        root_t storage_root() override;
        void foreach(const observer_t &obs) const;
        [[nodiscard]] size_t size() const;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };
}
