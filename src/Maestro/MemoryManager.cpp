// =================================================================
// src/Maestro/MemoryManager.cpp
// =================================================================
// Implementation of the short-term / long-term memory manager.

#include "Maestro/MemoryManager.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>

namespace Maestro {

MemoryManager::MemoryManager(const MemoryConfig& config)
    : m_config(config) {
    if (m_config.short_term_capacity == 0) {
        m_config.short_term_capacity = 1;
    }
}

bool MemoryManager::storeShortTerm(const std::string& key, const nlohmann::json& value, double importance) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_short_term.erase(std::remove_if(m_short_term.begin(), m_short_term.end(),
                                      [&key](const MemoryEntry& entry) { return entry.key == key; }),
                       m_short_term.end());

    while (m_short_term.size() >= m_config.short_term_capacity) {
        m_short_term.pop_front();
        m_stats.evictions++;
    }

    MemoryEntry entry;
    entry.key = key;
    entry.value = value;
    entry.importance = std::clamp(importance, 0.0, 1.0);

    bool promoted = false;
    if (entry.importance >= m_config.consolidation_threshold) {
        promoteLocked(entry);
        promoted = true;
    }

    m_short_term.push_back(std::move(entry));
    return promoted;
}

void MemoryManager::storeLongTerm(const std::string& key, const nlohmann::json& value, double importance) {
    std::lock_guard<std::mutex> lock(m_mutex);

    MemoryEntry entry;
    entry.key = key;
    entry.value = value;
    entry.importance = std::clamp(importance, 0.0, 1.0);
    entry.promoted = true;
    m_long_term[key] = std::move(entry);
}

size_t MemoryManager::consolidate() {
    std::lock_guard<std::mutex> lock(m_mutex);

    size_t promoted = 0;
    for (auto& entry : m_short_term) {
        if (!entry.promoted && entry.importance >= m_config.consolidation_threshold) {
            promoteLocked(entry);
            promoted++;
        }
    }

    if (promoted > 0) {
        Logger::getInstance().debug("MemoryManager", "Consolidated " + std::to_string(promoted) + " entries");
    }
    return promoted;
}

std::optional<nlohmann::json> MemoryManager::retrieve(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto now = std::chrono::system_clock::now();

    for (auto it = m_short_term.rbegin(); it != m_short_term.rend(); ++it) {
        if (it->key == key) {
            it->access_count++;
            it->last_accessed = now;
            m_stats.hits++;
            return it->value;
        }
    }

    auto long_it = m_long_term.find(key);
    if (long_it != m_long_term.end()) {
        long_it->second.access_count++;
        long_it->second.last_accessed = now;
        m_stats.hits++;
        return long_it->second.value;
    }

    m_stats.misses++;
    return std::nullopt;
}

std::vector<MemoryEntry> MemoryManager::getRecent(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<MemoryEntry> recent;
    for (auto it = m_short_term.rbegin(); it != m_short_term.rend() && recent.size() < count; ++it) {
        recent.push_back(*it);
    }
    return recent;
}

std::vector<MemoryEntry> MemoryManager::searchByPrefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<MemoryEntry> matches;
    for (const auto& [key, entry] : m_long_term) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            matches.push_back(entry);
        }
    }
    std::sort(matches.begin(), matches.end(),
              [](const MemoryEntry& a, const MemoryEntry& b) { return a.key < b.key; });
    return matches;
}

bool MemoryManager::hasLongTerm(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_long_term.count(key) > 0;
}

bool MemoryManager::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t before = m_short_term.size();
    m_short_term.erase(std::remove_if(m_short_term.begin(), m_short_term.end(),
                                      [&key](const MemoryEntry& entry) { return entry.key == key; }),
                       m_short_term.end());
    bool removed = m_short_term.size() != before;
    removed = (m_long_term.erase(key) > 0) || removed;
    return removed;
}

void MemoryManager::clearShortTerm() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_short_term.clear();
}

MemoryStatistics MemoryManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    MemoryStatistics stats = m_stats;
    stats.short_term_entries = m_short_term.size();
    stats.long_term_entries = m_long_term.size();
    return stats;
}

void MemoryManager::promoteLocked(MemoryEntry& entry) {
    entry.promoted = true;
    m_long_term[entry.key] = entry;
    m_stats.promotions++;
}

} // namespace Maestro
