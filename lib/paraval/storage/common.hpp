#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <memory>
#include <optional>
#include <paraval/common/bytes.hpp>
#include <paraval/trie/node.hpp>

namespace paraval::storage {
    using value_t = std::optional<uint8_vector>;
    using root_t = trie::hash_t;
    static_assert(sizeof(root_t) == 32U);

    // The key-value interface that the block execution sees through the host externals.
    struct backend_t {
        virtual ~backend_t() =default;
        [[nodiscard]] virtual value_t get(buffer key) const =0;
        virtual void insert(buffer key, buffer val) =0;
        virtual void remove(buffer key) =0;
        // the all-zero root signals that the root could not be computed
        [[nodiscard]] virtual root_t storage_root() =0;

        [[nodiscard]] virtual bool contains(const buffer key) const
        {
            return get(key).has_value();
        }
    };
    using backend_ptr_t = std::shared_ptr<backend_t>;
}
