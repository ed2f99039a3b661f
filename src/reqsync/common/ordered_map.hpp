/**
 * @file ordered_map.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"

namespace reqsync
{

/**
 * @brief A string-keyed map that preserves insertion order.
 *
 * @details
 * `OrderedMap<V>` stores unique keys with their values in the order in which
 * they were inserted, and provides O(1) average-case lookup by key.
 * Internally, it combines a `std::vector` of entries (for ordered storage)
 * with a `std::unordered_map` (for key-to-index mapping).
 *
 * Snapshot content is held in this container so that every traversal, and
 * therefore every emitted action, follows the order of the source snapshot.
 *
 * @par Duplicate handling
 * - `insert()` throws `std::invalid_argument` if the key is already present.
 * - `insert_or_assign()` replaces the value in place, keeping the key's position.
 *
 * @par Invariants
 * - For all `i` in `[0, size())`: `find(entries()[i].first)` points at
 *   `entries()[i].second`.
 * - Entries are enumerated in insertion order.
 *
 * @par Exception safety
 * - `insert()` provides the strong exception guarantee.
 * - `at()` throws `std::out_of_range` for absent keys.
 *
 * @par Thread safety
 * - No internal synchronization; concurrent reads are safe.
 */
template <typename V>
class OrderedMap
{
public:
    using value_type = std::pair<std::string, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;

public:
    OrderedMap() = default;

    OrderedMap(std::initializer_list<value_type> entries)
    {
        for (const auto& entry : entries)
        {
            insert(entry.first, entry.second);
        }
    }

    /**
     * @brief Insert a new key.
     * @throw std::invalid_argument if `key` is already present.
     */
    void insert(const std::string& key, V value)
    {
        if (m_index.count(key) != 0)
        {
            throw std::invalid_argument("OrderedMap::insert: duplicate key '" + key + "'");
        }
        m_entries.emplace_back(key, std::move(value));
        try
        {
            m_index.emplace(key, m_entries.size() - 1);
        }
        catch (...)
        {
            m_entries.pop_back();
            throw;
        }
    }

    void insert_or_assign(const std::string& key, V value)
    {
        auto it = m_index.find(key);
        if (it == m_index.end())
        {
            insert(key, std::move(value));
            return;
        }
        m_entries[it->second].second = std::move(value);
    }

    /**
     * @brief Find a value by key.
     * @return Pointer to the value, or nullptr if absent.
     */
    const V* find(const std::string& key) const noexcept
    {
        auto it = m_index.find(key);
        if (it == m_index.end())
        {
            return nullptr;
        }
        return &m_entries[it->second].second;
    }

    V* find(const std::string& key) noexcept
    {
        auto it = m_index.find(key);
        if (it == m_index.end())
        {
            return nullptr;
        }
        return &m_entries[it->second].second;
    }

    const V& at(const std::string& key) const
    {
        const V* value = find(key);
        if (value == nullptr)
        {
            throw std::out_of_range("OrderedMap::at: no key '" + key + "'");
        }
        return *value;
    }

    bool contains(const std::string& key) const noexcept
    {
        return m_index.count(key) != 0;
    }

    std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    const std::vector<value_type>& entries() const noexcept
    {
        return m_entries;
    }

    const_iterator begin() const noexcept
    {
        return m_entries.begin();
    }

    const_iterator end() const noexcept
    {
        return m_entries.end();
    }

private:
    std::vector<value_type> m_entries;
    std::unordered_map<std::string, std::size_t> m_index;
};

} // namespace reqsync
