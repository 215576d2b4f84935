/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <paraval/common/logger.hpp>
#include <paraval/common/numeric-cast.hpp>
#include "externals.hpp"

namespace paraval::host {
    namespace {
        [[noreturn]] void throw_unbound(const std::string_view name)
        {
            throw error(fmt::format("host: {} is called while no storage backend is bound", name));
        }

        namespace unbound {
            uint8_t *get_allocated_storage(const uint8_t *, uint32_t, uint32_t *)
            {
                throw_unbound("ext_get_allocated_storage");
            }

            uint32_t get_storage_into(const uint8_t *, uint32_t, uint8_t *, uint32_t, uint32_t)
            {
                throw_unbound("ext_get_storage_into");
            }

            void set_storage(const uint8_t *, uint32_t, const uint8_t *, uint32_t)
            {
                throw_unbound("ext_set_storage");
            }

            uint32_t exists_storage(const uint8_t *, uint32_t)
            {
                throw_unbound("ext_exists_storage");
            }

            void clear_storage(const uint8_t *, uint32_t)
            {
                throw_unbound("ext_clear_storage");
            }

            void storage_root(uint8_t *)
            {
                throw_unbound("ext_storage_root");
            }
        }

        namespace bound {
            uint8_t *get_allocated_storage(const uint8_t *key_ptr, const uint32_t key_len, uint32_t *written_out)
            {
                auto &ctx = context_t::active();
                ++ctx.stats().get_allocated_storage;
                const buffer key { key_ptr, key_len };
                const auto val = ctx.storage().get(key);
                if (!val) {
                    logger::trace("ext_get_allocated_storage: key: {} absent", key);
                    *written_out = value_absent;
                    return nullptr;
                }
                if (val->size() >= value_absent) [[unlikely]]
                    throw error(fmt::format("host: a value of {} bytes cannot be returned", val->size()));
                logger::trace("ext_get_allocated_storage: key: {} size: {}", key, val->size());
                *written_out = numeric_cast<uint32_t>(val->size());
                return ctx.arena().copy(*val);
            }

            uint32_t get_storage_into(const uint8_t *key_ptr, const uint32_t key_len, uint8_t *value_ptr, const uint32_t value_len, const uint32_t value_offset)
            {
                auto &ctx = context_t::active();
                ++ctx.stats().get_storage_into;
                const buffer key { key_ptr, key_len };
                const auto val = ctx.storage().get(key);
                if (!val) {
                    logger::trace("ext_get_storage_into: key: {} absent", key);
                    return value_absent;
                }
                const write_buffer out { value_ptr, value_len };
                const size_t offset = value_offset;
                const auto num_copied = offset < val->size() ? std::min(out.size(), val->size() - offset) : size_t { 0 };
                if (num_copied > 0) {
                    const auto src = static_cast<buffer>(*val).subbuf(offset, num_copied);
                    std::copy_n(src.begin(), num_copied, out.begin());
                }
                logger::trace("ext_get_storage_into: key: {} size: {} offset: {} copied: {}", key, val->size(), offset, num_copied);
                return numeric_cast<uint32_t>(num_copied);
            }

            void set_storage(const uint8_t *key_ptr, const uint32_t key_len, const uint8_t *value_ptr, const uint32_t value_len)
            {
                auto &ctx = context_t::active();
                ++ctx.stats().set_storage;
                const buffer key { key_ptr, key_len };
                const buffer val { value_ptr, value_len };
                logger::trace("ext_set_storage: key: {} size: {}", key, val.size());
                ctx.storage().insert(key, val);
            }

            uint32_t exists_storage(const uint8_t *key_ptr, const uint32_t key_len)
            {
                auto &ctx = context_t::active();
                ++ctx.stats().exists_storage;
                const buffer key { key_ptr, key_len };
                const auto res = ctx.storage().contains(key);
                logger::trace("ext_exists_storage: key: {} exists: {}", key, res);
                return res ? 1 : 0;
            }

            void clear_storage(const uint8_t *key_ptr, const uint32_t key_len)
            {
                auto &ctx = context_t::active();
                ++ctx.stats().clear_storage;
                const buffer key { key_ptr, key_len };
                logger::trace("ext_clear_storage: key: {}", key);
                ctx.storage().remove(key);
            }

            void storage_root(uint8_t *result)
            {
                auto &ctx = context_t::active();
                ++ctx.stats().storage_root;
                const auto root = ctx.storage().storage_root();
                static_assert(sizeof(root) == storage_root_size);
                logger::trace("ext_storage_root: {}", root);
                std::copy(root.begin(), root.end(), result);
            }
        }
    }

    externals_t &bindings()
    {
        static externals_t ext = unbound_externals();
        return ext;
    }

    const externals_t &unbound_externals()
    {
        static const externals_t ext {
            unbound::get_allocated_storage,
            unbound::get_storage_into,
            unbound::set_storage,
            unbound::exists_storage,
            unbound::clear_storage,
            unbound::storage_root
        };
        return ext;
    }

    const externals_t &context_externals()
    {
        static const externals_t ext {
            bound::get_allocated_storage,
            bound::get_storage_into,
            bound::set_storage,
            bound::exists_storage,
            bound::clear_storage,
            bound::storage_root
        };
        return ext;
    }

    uint8_t *ext_get_allocated_storage(const uint8_t *key, const uint32_t key_len, uint32_t *written_out)
    {
        return bindings().get_allocated_storage(key, key_len, written_out);
    }

    uint32_t ext_get_storage_into(const uint8_t *key, const uint32_t key_len, uint8_t *value, const uint32_t value_len, const uint32_t value_offset)
    {
        return bindings().get_storage_into(key, key_len, value, value_len, value_offset);
    }

    void ext_set_storage(const uint8_t *key, const uint32_t key_len, const uint8_t *value, const uint32_t value_len)
    {
        bindings().set_storage(key, key_len, value, value_len);
    }

    uint32_t ext_exists_storage(const uint8_t *key, const uint32_t key_len)
    {
        return bindings().exists_storage(key, key_len);
    }

    void ext_clear_storage(const uint8_t *key, const uint32_t key_len)
    {
        bindings().clear_storage(key, key_len);
    }

    void ext_storage_root(uint8_t *result)
    {
        bindings().storage_root(result);
    }

    interposition_t::interposition_t(context_t &ctx, const externals_t &ext):
        _saved_bindings { bindings() },
        _saved_context { context_t::slot() }
    {
        bindings() = ext;
        context_t::slot() = &ctx;
        logger::trace("host: installed the storage externals");
    }

    interposition_t::~interposition_t()
    {
        bindings() = _saved_bindings;
        context_t::slot() = _saved_context;
    }
}
