/**
 * @file OrderedSet.hpp
 * @brief Set that remembers insertion order.
 */

#pragma once
#include <vector>
#include <unordered_set>

namespace linkwalker::domain {

template <typename T>
class OrderedSet {
public:
    /** @return True if the value was not present yet. */
    bool insert(const T& value) {
        if (!m_seen.insert(value).second) return false;
        m_items.push_back(value);
        return true;
    }

    bool empty() const { return m_items.empty(); }
    size_t size() const { return m_items.size(); }

    /** @brief Values in first-seen order. */
    const std::vector<T>& items() const { return m_items; }

private:
    std::vector<T> m_items;
    std::unordered_set<T> m_seen;
};

} // namespace linkwalker::domain
