/**
 * @file index_set.hpp
 */
#pragma once
#include "phasegraph/common/common.hpp"

namespace phasegraph
{

/**
 * @brief A set of unique indices with insertion-order preservation.
 *
 * @details
 * `IndexSet` stores unique `size_t` values in the order they were first
 * inserted. It combines a `std::vector` (ordered storage, O(1) access by
 * position) with a `std::unordered_set` (O(1) average membership test).
 *
 * @par Growth during iteration
 * Iterating by position while inserting is well defined: a loop of the form
 * `for (size_t i = 0; i < set.size(); ++i)` visits every element, including
 * the ones appended during the loop. This is how breadth-first closures are
 * computed over phase dependencies.
 *
 * @par Duplicate handling
 * - `insert()` returns false and leaves the order unchanged for a duplicate.
 *
 * @par Thread safety
 * - No internal synchronization. Concurrent reads are safe.
 */
class IndexSet
{
public:
    IndexSet() = default;

    IndexSet(std::initializer_list<size_t> values)
    {
        for (size_t value : values)
        {
            insert(value);
        }
    }

    /**
     * @brief Insert a value if not already present.
     * @return True if the value was inserted, false if it was a duplicate.
     */
    bool insert(size_t value)
    {
        if (!m_members.insert(value).second)
        {
            return false;
        }
        m_order.push_back(value);
        return true;
    }

    bool contains(size_t value) const noexcept
    {
        return m_members.find(value) != m_members.end();
    }

    size_t size() const noexcept
    {
        return m_order.size();
    }

    bool empty() const noexcept
    {
        return m_order.empty();
    }

    /**
     * @brief Access the value at the given insertion position.
     * @throw std::out_of_range if `pos >= size()`.
     */
    size_t at(size_t pos) const
    {
        if (pos >= m_order.size())
        {
            throw std::out_of_range("IndexSet::at: position out of range");
        }
        return m_order[pos];
    }

    const std::vector<size_t>& values() const noexcept
    {
        return m_order;
    }

    std::vector<size_t>::const_iterator begin() const noexcept
    {
        return m_order.begin();
    }

    std::vector<size_t>::const_iterator end() const noexcept
    {
        return m_order.end();
    }

    bool operator==(const IndexSet& other) const
    {
        return m_members == other.m_members;
    }

    bool operator!=(const IndexSet& other) const
    {
        return !(*this == other);
    }

private:
    std::vector<size_t> m_order;
    std::unordered_set<size_t> m_members;
};

} // namespace phasegraph
