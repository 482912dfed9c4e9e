// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_ENUMERABLE_H
#define MINTSUITE_ENUMERABLE_H

/**
 * @file enumerable.h
 * @brief Order-tracking sets and maps with O(1) removal
 *
 * Entries live in a dense vector, with an index map from key to slot.
 * Removal moves the last entry into the freed slot (swap-and-pop), so
 * enumeration order changes on removal.
 *
 * Enumeration is only guaranteed up to MAX_ENUMERABLE_ENTRIES entries;
 * callers that enumerate whole collections check Length() against it.
 */

#include <mintsuite/chain.h>

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace mintsuite {

/** Upper bound on entries returned by whole-collection enumeration */
static constexpr size_t MAX_ENUMERABLE_ENTRIES = 10000;

template <typename T>
class EnumerableSet
{
public:
    /** @return true if the value was added, false if already present */
    bool Add(const T& value)
    {
        if (Contains(value)) {
            return false;
        }
        index_[value] = values_.size();
        values_.push_back(value);
        return true;
    }

    /** @return true if the value was removed, false if it was absent */
    bool Remove(const T& valueIn)
    {
        // Copy first: valueIn may alias an entry that is about to move
        const T value = valueIn;
        auto it = index_.find(value);
        if (it == index_.end()) {
            return false;
        }
        size_t slot = it->second;
        size_t last = values_.size() - 1;
        if (slot != last) {
            values_[slot] = values_[last];
            index_[values_[slot]] = slot;
        }
        values_.pop_back();
        index_.erase(value);
        return true;
    }

    bool Contains(const T& value) const { return index_.count(value) > 0; }

    size_t Length() const { return values_.size(); }

    /** @throws RevertError if index is out of bounds */
    const T& At(size_t index) const
    {
        Require(index < values_.size(), "EnumerableSet: index out of bounds");
        return values_[index];
    }

    /** @throws RevertError if the set exceeds MAX_ENUMERABLE_ENTRIES */
    const std::vector<T>& Values() const
    {
        Require(values_.size() <= MAX_ENUMERABLE_ENTRIES, "EnumerableSet: too many entries to enumerate");
        return values_;
    }

private:
    std::vector<T> values_;
    std::map<T, size_t> index_;
};

template <typename K, typename V>
class EnumerableMap
{
public:
    /** @return true if the key was newly added, false if an existing value was overwritten */
    bool Set(const K& key, const V& value)
    {
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_[it->second].second = value;
            return false;
        }
        index_[key] = entries_.size();
        entries_.emplace_back(key, value);
        return true;
    }

    /** @return true if the key was removed, false if it was absent */
    bool Remove(const K& keyIn)
    {
        const K key = keyIn;
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        size_t slot = it->second;
        size_t last = entries_.size() - 1;
        if (slot != last) {
            entries_[slot] = entries_[last];
            index_[entries_[slot].first] = slot;
        }
        entries_.pop_back();
        index_.erase(key);
        return true;
    }

    bool Contains(const K& key) const { return index_.count(key) > 0; }

    size_t Length() const { return entries_.size(); }

    /** @throws RevertError with reason if the key is absent */
    const V& Get(const K& key, const std::string& reason) const
    {
        auto it = index_.find(key);
        Require(it != index_.end(), reason);
        return entries_[it->second].second;
    }

    const V& Get(const K& key) const
    {
        return Get(key, "EnumerableMap: nonexistent key");
    }

    /** @throws RevertError if index is out of bounds */
    const std::pair<K, V>& At(size_t index) const
    {
        Require(index < entries_.size(), "EnumerableMap: index out of bounds");
        return entries_[index];
    }

    /** @throws RevertError if the map exceeds MAX_ENUMERABLE_ENTRIES */
    const std::vector<std::pair<K, V>>& Entries() const
    {
        Require(entries_.size() <= MAX_ENUMERABLE_ENTRIES, "EnumerableMap: too many entries to enumerate");
        return entries_;
    }

private:
    std::vector<std::pair<K, V>> entries_;
    std::map<K, size_t> index_;
};

} // namespace mintsuite

#endif // MINTSUITE_ENUMERABLE_H
