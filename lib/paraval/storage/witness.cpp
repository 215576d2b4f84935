/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <paraval/common/logger.hpp>
#include <paraval/trie/trie.hpp>
#include "witness.hpp"

namespace paraval::storage::witness {
    struct db_t::impl {
        impl(const std::span<const codec::byte_sequence_t> witness, const root_t &root, const trie::hash_func &hf):
            _hash_func { hf },
            _store { std::make_shared<trie::node_store_t>(hf) },
            _base_root { root }
        {
            for (const auto &blob: witness)
                _store->insert(blob);
            if (!_store->contains(_base_root)) [[unlikely]]
                throw err_witness_mismatch_t { _base_root };
            logger::debug("witness: loaded {} blobs with {} unique, root: {}", witness.size(), _store->size(), _base_root);
        }

        value_t get(const buffer key) const
        {
            if (const auto it = _pending.find(key); it != _pending.end())
                return it->second;
            if (const auto it = _committed.find(key); it != _committed.end())
                return it->second;
            try {
                return trie::read_value(*_store, _base_root, trie::make_key(key, _hash_func));
            } catch (const error &ex) {
                logger::warn("witness: the lookup of key {} is incomplete, treating it as absent: {}", key, ex.what());
                return {};
            }
        }

        void insert(const buffer key, const buffer val)
        {
            _pending.insert_or_assign(uint8_vector { key }, value_t { val });
        }

        void remove(const buffer key)
        {
            _pending.insert_or_assign(uint8_vector { key }, value_t {});
        }

        root_t storage_root()
        {
            try {
                trie::trie_t trie { _store, _base_root };
                _apply(trie, _committed);
                _apply(trie, _pending);
                const auto root = trie.root();
                for (auto &[k, v]: _pending)
                    _committed.insert_or_assign(k, std::move(v));
                _pending.clear();
                logger::debug("witness: storage root {} with {} committed changes", root, _committed.size());
                return root;
            } catch (const error &ex) {
                logger::warn("witness: failed to apply {} pending and {} committed changes: {}",
                    _pending.size(), _committed.size(), ex.what());
                return root_t {};
            }
        }

        const root_t &base_root() const
        {
            return _base_root;
        }

        size_t num_pending() const
        {
            return _pending.size();
        }

        size_t num_committed() const
        {
            return _committed.size();
        }

        const trie::node_store_t &store() const
        {
            return *_store;
        }
    private:
        // an empty value marks a removed key
        using overlay_t = std::map<uint8_vector, value_t, std::less<>>;

        const trie::hash_func _hash_func;
        trie::node_store_ptr_t _store;
        const root_t _base_root;
        overlay_t _pending {};
        overlay_t _committed {};

        void _apply(trie::trie_t &trie, const overlay_t &changes) const
        {
            for (const auto &[k, v]: changes) {
                const auto tk = trie::make_key(k, _hash_func);
                if (v)
                    trie.set(tk, *v);
                else
                    trie.erase(tk);
            }
        }
    };

    db_t::db_t(const std::span<const codec::byte_sequence_t> witness, const root_t &root, const trie::hash_func &hf):
        _impl { std::make_unique<impl>(witness, root, hf) }
    {
    }

    db_t::~db_t() =default;

    value_t db_t::get(const buffer key) const
    {
        return _impl->get(key);
    }

    void db_t::insert(const buffer key, const buffer val)
    {
        _impl->insert(key, val);
    }

    void db_t::remove(const buffer key)
    {
        _impl->remove(key);
    }

    root_t db_t::storage_root()
    {
        return _impl->storage_root();
    }

    const root_t &db_t::base_root() const
    {
        return _impl->base_root();
    }

    size_t db_t::num_pending() const
    {
        return _impl->num_pending();
    }

    size_t db_t::num_committed() const
    {
        return _impl->num_committed();
    }

    const trie::node_store_t &db_t::store() const
    {
        return _impl->store();
    }
}
