/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include "node-store.hpp"

namespace paraval::trie {
    node_store_t::node_store_t(const hash_func &hf):
        _hash_func { hf }
    {
    }

    hash_t node_store_t::insert(const buffer bytes)
    {
        const auto h = hash_of(bytes, _hash_func);
        auto [it, created] = _entries.try_emplace(node_ref(h), entry_t { h, uint8_vector { bytes } });
        if (!created && it->second.hash != h) [[unlikely]]
            throw error(fmt::format("node store: a 255-bit collision between {} and {}", it->second.hash, h));
        ++it->second.refs;
        return h;
    }

    bool node_store_t::remove(const hash_t &h)
    {
        const auto it = _entries.find(node_ref(h));
        if (it == _entries.end())
            return false;
        if (--it->second.refs == 0)
            _entries.erase(it);
        return true;
    }

    std::optional<buffer> node_store_t::get(const hash_t &h) const
    {
        if (const auto it = _entries.find(node_ref(h)); it != _entries.end())
            return static_cast<buffer>(it->second.bytes);
        return {};
    }

    bool node_store_t::contains(const hash_t &h) const
    {
        const auto it = _entries.find(node_ref(h));
        return it != _entries.end() && it->second.hash == h;
    }

    size_t node_store_t::refs(const hash_t &h) const
    {
        if (const auto it = _entries.find(node_ref(h)); it != _entries.end())
            return it->second.refs;
        return 0;
    }

    size_t node_store_t::size() const
    {
        return _entries.size();
    }

    void node_store_t::foreach(const observer_t &obs) const
    {
        for (const auto &[ref, e]: _entries)
            obs(e.hash, e.bytes);
    }

    const hash_func &node_store_t::hasher() const
    {
        return _hash_func;
    }
}
