#pragma once
#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "utils/Logger.hpp"

namespace st {

// Bounded word -> suggestions cache with least-recently-used eviction.
class SuggestionCache {
public:
    using Suggestions = std::vector<std::string>;

    explicit SuggestionCache(size_t capacity = 100) : m_capacity(capacity) {}

    // Returns nullptr on a miss. A hit marks the entry as most recently used.
    const Suggestions* find(const std::string& key) {
        auto it = m_index.find(key);
        if (it == m_index.end())
            return nullptr;
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return &it->second->second;
    }

    bool contains(const std::string& key) const { return m_index.count(key) != 0; }

    void insert(const std::string& key, Suggestions suggestions) {
        auto it = m_index.find(key);
        if (it != m_index.end()) {
            it->second->second = std::move(suggestions);
            m_entries.splice(m_entries.begin(), m_entries, it->second);
            return;
        }
        if (m_entries.size() >= m_capacity)
            evictOldest();
        m_entries.emplace_front(key, std::move(suggestions));
        m_index[key] = m_entries.begin();
    }

    bool erase(const std::string& key) {
        auto it = m_index.find(key);
        if (it == m_index.end())
            return false;
        m_entries.erase(it->second);
        m_index.erase(it);
        return true;
    }

    void clear() {
        m_entries.clear();
        m_index.clear();
    }

    size_t size() const { return m_entries.size(); }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_entries.empty(); }

private:
    using Entry = std::pair<std::string, Suggestions>;

    void evictOldest() {
        if (m_entries.empty())
            return;
        const Entry& oldest = m_entries.back();
        if (logEnabled(LogLevel::Debug))
            ST_LOG(LogLevel::Debug, "Suggestion cache full, evicting \"" + oldest.first + "\"");
        m_index.erase(oldest.first);
        m_entries.pop_back();
    }

    size_t m_capacity;
    std::list<Entry> m_entries; // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> m_index;
};

} // namespace st
