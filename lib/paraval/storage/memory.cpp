/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <map>
#include <paraval/trie/trie.hpp>
#include "memory.hpp"

namespace paraval::storage::memory {
    struct db_t::impl {
        explicit impl(const trie::hash_func &hf):
            _hash_func { hf }
        {
        }

        value_t get(const buffer key) const
        {
            if (const auto it = _db.find(key); it != _db.end())
                return it->second;
            return {};
        }

        void insert(const buffer key, const buffer val)
        {
            _db.insert_or_assign(uint8_vector { key }, uint8_vector { val });
        }

        void remove(const buffer key)
        {
            if (const auto it = _db.find(key); it != _db.end())
                _db.erase(it);
        }

        root_t storage_root() const
        {
            std::map<trie::key_t, uint8_vector> entries {};
            for (const auto &[k, v]: _db)
                entries.try_emplace(trie::make_key(k, _hash_func), v);
            return trie::merklize(entries, _hash_func);
        }

        void foreach(const observer_t &obs) const
        {
            for (const auto &[k, v]: _db)
                obs(k, v);
        }

        [[nodiscard]] size_t size() const
        {
            return _db.size();
        }
    private:
        const trie::hash_func _hash_func;
        std::map<uint8_vector, uint8_vector, std::less<>> _db {};
    };

    db_t::db_t(const trie::hash_func &hf):
        _impl { std::make_unique<impl>(hf) }
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

    void db_t::foreach(const observer_t &obs) const
    {
        _impl->foreach(obs);
    }

    size_t db_t::size() const
    {
        return _impl->size();
    }
}
