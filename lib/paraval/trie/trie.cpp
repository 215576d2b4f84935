/* Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <algorithm>
#include <set>
#include "trie.hpp"

namespace paraval::trie {
    namespace {
        using values_map_t = std::map<hash_t, uint8_vector>;
        using blob_observer_t = std::function<void(buffer)>;

        const hash_t &empty_hash()
        {
            static hash_t empty {};
            return empty;
        }

        buffer load_blob(const node_store_t &store, const hash_t &h)
        {
            if (auto bytes = store.get(h); bytes)
                return *bytes;
            throw err_incomplete_witness_t { h };
        }

        opt_value_bytes_t value_bytes(const node_store_t &store, const value_t &val, const values_map_t *local)
        {
            if (const auto *inplace = std::get_if<value_inplace_t>(&val))
                return uint8_vector { buffer { inplace->data(), inplace->size() } };
            const auto &h = std::get<value_hash_t>(val);
            if (local) {
                if (const auto it = local->find(h); it != local->end())
                    return it->second;
            }
            return uint8_vector { load_blob(store, h) };
        }

        // walks the stored nodes starting at the given depth
        opt_value_bytes_t read_stored(const node_store_t &store, hash_t h, const key_t &key, size_t depth, const values_map_t *local)
        {
            while (h != empty_hash()) {
                const auto node = decode_node(load_blob(store, h));
                if (const auto *branch = std::get_if<branch_t>(&node)) {
                    h = key_bit(key, depth++) ? branch->right : branch->left;
                    continue;
                }
                const auto &leaf = std::get<leaf_t>(node);
                if (leaf.key != key)
                    return {};
                return value_bytes(store, leaf.value, local);
            }
            return {};
        }

        // removals can lift a leaf to any level of the path, so every sibling on it is included
        void prove_stored(const node_store_t &store, hash_t h, const key_t &key, size_t depth, const blob_observer_t &obs)
        {
            while (h != empty_hash()) {
                const auto bytes = load_blob(store, h);
                obs(bytes);
                const auto node = decode_node(bytes);
                if (const auto *branch = std::get_if<branch_t>(&node)) {
                    const auto right = key_bit(key, depth++);
                    if (const auto &sibling = right ? branch->left : branch->right; sibling != empty_hash())
                        obs(load_blob(store, sibling));
                    h = right ? branch->right : branch->left;
                    continue;
                }
                if (const auto &leaf = std::get<leaf_t>(node); !leaf.value.inplace())
                    obs(load_blob(store, std::get<value_hash_t>(leaf.value)));
                break;
            }
        }

        using entry_iterator_t = std::map<key_t, uint8_vector>::const_iterator;

        hash_t merklize_range(const entry_iterator_t begin, const entry_iterator_t end, const size_t depth, const hash_func &hf)
        {
            if (begin == end)
                return empty_hash();
            if (std::next(begin) == end)
                return encoded_node_t { leaf_t { begin->first, value_t { begin->second, hf } } }.hash(hf);
            const auto mid = std::partition_point(begin, end, [&](const auto &kv) { return !key_bit(kv.first, depth); });
            return encoded_node_t {
                merklize_range(begin, mid, depth + 1, hf),
                merklize_range(mid, end, depth + 1, hf)
            }.hash(hf);
        }
    }

    struct trie_t::impl {
        impl(node_store_ptr_t store, const hash_t &root):
            _store { std::move(store) },
            _hash_func { _store->hasher() }
        {
            if (root != empty_hash() && root != empty_root(_hash_func))
                _root = node_t::make_stub(root);
        }

        bool empty() const
        {
            return !_root;
        }

        bool erase(const key_t &key)
        {
            return _erase(_root, 0, key);
        }

        opt_value_bytes_t get(const key_t &key) const
        {
            const node_t *node = _root.get();
            size_t depth = 0;
            while (node) {
                if (!node->loaded)
                    return read_stored(*_store, *node->hash, key, depth, &_values);
                if (node->leaf) {
                    if (node->leaf->key != key)
                        return {};
                    return value_bytes(*_store, node->leaf->value, &_values);
                }
                node = key_bit(key, depth++) ? node->right.get() : node->left.get();
            }
            return {};
        }

        void set(const key_t &key, const buffer bytes)
        {
            value_t val { bytes, _hash_func };
            if (!val.inplace())
                _values.try_emplace(std::get<value_hash_t>(val), bytes);
            _set(_root, 0, key, std::move(val));
        }

        hash_t root() const
        {
            if (!_root)
                return empty_root(_hash_func);
            return _hash(_root);
        }

        void commit()
        {
            if (!_root && !_store->contains(empty_root(_hash_func)))
                _store->insert(empty_node());
            _commit(_root);
            for (const auto &[h, bytes]: _values) {
                if (!_store->contains(h))
                    _store->insert(bytes);
            }
            _values.clear();
        }

        std::vector<uint8_vector> prove(const std::span<const key_t> keys) const
        {
            std::vector<uint8_vector> res {};
            std::set<hash_t> known {};
            const blob_observer_t add = [&](const buffer bytes) {
                if (known.emplace(hash_of(bytes, _hash_func)).second)
                    res.emplace_back(bytes);
            };
            if (!_root)
                add(empty_node());
            for (const auto &key: keys)
                _prove(key, add);
            return res;
        }

        const node_store_ptr_t &store() const
        {
            return _store;
        }
    private:
        struct node_t;
        using node_ptr_t = std::unique_ptr<node_t>;

        struct node_t {
            bool loaded = true;
            std::optional<leaf_t> leaf {};
            node_ptr_t left {};
            node_ptr_t right {};
            // for nodes loaded from a left branch slot only the lower 255 bits are meaningful
            mutable std::optional<hash_t> hash {};

            static node_ptr_t make_stub(const hash_t &h)
            {
                auto node = std::make_unique<node_t>();
                node->loaded = false;
                node->hash = h;
                return node;
            }

            static node_ptr_t make_leaf(const key_t &k, value_t v)
            {
                auto node = std::make_unique<node_t>();
                node->leaf.emplace(leaf_t { k, std::move(v) });
                return node;
            }
        };

        node_store_ptr_t _store;
        const hash_func _hash_func;
        node_ptr_t _root {};
        values_map_t _values {};

        void _load(node_ptr_t &node) const
        {
            if (node->loaded)
                return;
            const auto decoded = decode_node(load_blob(*_store, *node->hash));
            if (const auto *branch = std::get_if<branch_t>(&decoded)) {
                if (branch->left != empty_hash())
                    node->left = node_t::make_stub(branch->left);
                if (branch->right != empty_hash())
                    node->right = node_t::make_stub(branch->right);
            } else {
                node->leaf.emplace(std::get<leaf_t>(decoded));
                node->hash.reset();
            }
            node->loaded = true;
        }

        void _set(node_ptr_t &node, const size_t depth, const key_t &key, value_t val)
        {
            if (!node) {
                node = node_t::make_leaf(key, std::move(val));
                return;
            }
            _load(node);
            node->hash.reset();
            if (!node->leaf) {
                _set(key_bit(key, depth) ? node->right : node->left, depth + 1, key, std::move(val));
                return;
            }
            if (node->leaf->key == key) {
                node->leaf->value = std::move(val);
                return;
            }
            auto existing = std::move(node);
            node = std::make_unique<node_t>();
            node_t *cur = node.get();
            for (size_t d = depth; ; ++d) {
                const auto existing_bit = key_bit(existing->leaf->key, d);
                const auto new_bit = key_bit(key, d);
                if (existing_bit != new_bit) {
                    (existing_bit ? cur->right : cur->left) = std::move(existing);
                    (new_bit ? cur->right : cur->left) = node_t::make_leaf(key, std::move(val));
                    break;
                }
                auto &next = existing_bit ? cur->right : cur->left;
                next = std::make_unique<node_t>();
                cur = next.get();
            }
        }

        bool _erase(node_ptr_t &node, const size_t depth, const key_t &key)
        {
            if (!node)
                return false;
            _load(node);
            if (node->leaf) {
                if (node->leaf->key != key)
                    return false;
                node.reset();
                return true;
            }
            if (!_erase(key_bit(key, depth) ? node->right : node->left, depth + 1, key))
                return false;
            node->hash.reset();
            if (node->left && node->right)
                return true;
            if (!node->left && !node->right) {
                node.reset();
                return true;
            }
            // a branch with a single leaf below it collapses into that leaf
            auto &sole = node->left ? node->left : node->right;
            _load(sole);
            if (sole->leaf) {
                sole->hash.reset();
                node = std::move(sole);
            }
            return true;
        }

        const hash_t &_hash(const node_ptr_t &node) const
        {
            if (!node)
                return empty_hash();
            if (!node->hash) {
                if (node->leaf) {
                    node->hash = encoded_node_t { *node->leaf }.hash(_hash_func);
                } else {
                    node->hash = encoded_node_t { _hash(node->left), _hash(node->right) }.hash(_hash_func);
                }
            }
            return *node->hash;
        }

        void _commit(const node_ptr_t &node)
        {
            if (!node || !node->loaded)
                return;
            if (node->leaf) {
                _insert_new(encoded_node_t { *node->leaf });
                return;
            }
            _commit(node->left);
            _commit(node->right);
            _insert_new(encoded_node_t { _hash(node->left), _hash(node->right) });
        }

        void _insert_new(const encoded_node_t &enc)
        {
            if (!_store->contains(enc.hash(_hash_func)))
                _store->insert(enc);
        }

        void _prove(const key_t &key, const blob_observer_t &obs) const
        {
            const node_t *node = _root.get();
            size_t depth = 0;
            while (node) {
                if (!node->loaded) {
                    prove_stored(*_store, *node->hash, key, depth, obs);
                    return;
                }
                if (node->leaf) {
                    obs(encoded_node_t { *node->leaf });
                    if (!node->leaf->value.inplace()) {
                        if (auto bytes = value_bytes(*_store, node->leaf->value, &_values); bytes)
                            obs(*bytes);
                    }
                    return;
                }
                obs(encoded_node_t { _hash(node->left), _hash(node->right) });
                const auto right = key_bit(key, depth++);
                if (const auto *sibling = right ? node->left.get() : node->right.get(); sibling)
                    _prove_sibling(*sibling, obs);
                node = right ? node->right.get() : node->left.get();
            }
        }

        void _prove_sibling(const node_t &sibling, const blob_observer_t &obs) const
        {
            if (!sibling.loaded) {
                obs(load_blob(*_store, *sibling.hash));
            } else if (sibling.leaf) {
                obs(encoded_node_t { *sibling.leaf });
            } else {
                obs(encoded_node_t { _hash(sibling.left), _hash(sibling.right) });
            }
        }
    };

    trie_t::trie_t(const hash_func &hf):
        _impl { std::make_unique<impl>(std::make_shared<node_store_t>(hf), empty_hash()) }
    {
    }

    trie_t::trie_t(node_store_ptr_t store, const hash_t &root):
        _impl { std::make_unique<impl>(std::move(store), root) }
    {
    }

    trie_t::trie_t(trie_t &&o) =default;

    trie_t::~trie_t() =default;

    trie_t &trie_t::operator=(trie_t &&o) =default;

    bool trie_t::empty() const
    {
        return _impl->empty();
    }

    bool trie_t::erase(const key_t &key)
    {
        return _impl->erase(key);
    }

    opt_value_bytes_t trie_t::get(const key_t &key) const
    {
        return _impl->get(key);
    }

    void trie_t::set(const key_t &key, const buffer value)
    {
        _impl->set(key, value);
    }

    hash_t trie_t::root() const
    {
        return _impl->root();
    }

    void trie_t::commit()
    {
        _impl->commit();
    }

    std::vector<uint8_vector> trie_t::prove(const std::span<const key_t> keys) const
    {
        return _impl->prove(keys);
    }

    const node_store_ptr_t &trie_t::store() const
    {
        return _impl->store();
    }

    opt_value_bytes_t read_value(const node_store_t &store, const hash_t &root, const key_t &key)
    {
        if (root == empty_root(store.hasher()))
            return {};
        return read_stored(store, root, key, 0, nullptr);
    }

    hash_t merklize(const std::map<key_t, uint8_vector> &entries, const hash_func &hf)
    {
        if (entries.empty())
            return empty_root(hf);
        return merklize_range(entries.begin(), entries.end(), 0, hf);
    }
}
