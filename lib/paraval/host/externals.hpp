#pragma once
/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <cstdint>
#include <limits>
#include "context.hpp"

namespace paraval::host {
    using get_allocated_storage_func = uint8_t *(*)(const uint8_t *key, uint32_t key_len, uint32_t *written_out);
    using get_storage_into_func = uint32_t (*)(const uint8_t *key, uint32_t key_len, uint8_t *value, uint32_t value_len, uint32_t value_offset);
    using set_storage_func = void (*)(const uint8_t *key, uint32_t key_len, const uint8_t *value, uint32_t value_len);
    using exists_storage_func = uint32_t (*)(const uint8_t *key, uint32_t key_len);
    using clear_storage_func = void (*)(const uint8_t *key, uint32_t key_len);
    using storage_root_func = void (*)(uint8_t *result);

    // reported in place of a length when the key has no value
    static constexpr uint32_t value_absent = std::numeric_limits<uint32_t>::max();
    static constexpr size_t storage_root_size = sizeof(storage::root_t);

    struct externals_t {
        get_allocated_storage_func get_allocated_storage = nullptr;
        get_storage_into_func get_storage_into = nullptr;
        set_storage_func set_storage = nullptr;
        exists_storage_func exists_storage = nullptr;
        clear_storage_func clear_storage = nullptr;
        storage_root_func storage_root = nullptr;

        bool operator==(const externals_t &o) const =default;
    };

    // the process-wide table the ext_* entry points dispatch through
    extern externals_t &bindings();
    // every operation throws paraval::error
    extern const externals_t &unbound_externals();
    // operations on the storage of context_t::active()
    extern const externals_t &context_externals();

    // The pointer and length arguments are trusted to describe valid memory.
    // A buffer returned by ext_get_allocated_storage is owned by the active context and must not be freed.
    extern uint8_t *ext_get_allocated_storage(const uint8_t *key, uint32_t key_len, uint32_t *written_out);
    extern uint32_t ext_get_storage_into(const uint8_t *key, uint32_t key_len, uint8_t *value, uint32_t value_len, uint32_t value_offset);
    extern void ext_set_storage(const uint8_t *key, uint32_t key_len, const uint8_t *value, uint32_t value_len);
    extern uint32_t ext_exists_storage(const uint8_t *key, uint32_t key_len);
    extern void ext_clear_storage(const uint8_t *key, uint32_t key_len);
    extern void ext_storage_root(uint8_t *result);

    // Installs the externals and the context for the lifetime of the object
    // and restores the previous ones on destruction.
    struct interposition_t {
        explicit interposition_t(context_t &ctx, const externals_t &ext=context_externals());
        ~interposition_t();
        interposition_t(const interposition_t &) =delete;
        interposition_t &operator=(const interposition_t &) =delete;
    private:
        externals_t _saved_bindings;
        context_t *_saved_context;
    };
}
