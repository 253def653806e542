// =================================================================
// include/Maestro/MemoryManager.hpp
// =================================================================
// Short-term / long-term key-value memory with importance-based
// consolidation.

#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <deque>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace Maestro {

/**
 * @brief One remembered value
 */
struct MemoryEntry {
    std::string key;                              ///< Lookup key
    nlohmann::json value;                         ///< Stored value
    double importance = 0.5;                      ///< Importance (0.0-1.0)
    size_t access_count = 0;                      ///< Number of retrievals
    bool promoted = false;                        ///< Already copied to long-term storage
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::chrono::system_clock::time_point last_accessed = std::chrono::system_clock::now();
};

/**
 * @brief Memory manager configuration
 */
struct MemoryConfig {
    size_t short_term_capacity = 100;             ///< Ring buffer size
    double consolidation_threshold = 0.7;         ///< Importance promoting to long-term
};

/**
 * @brief Memory counters
 */
struct MemoryStatistics {
    size_t short_term_entries = 0;
    size_t long_term_entries = 0;
    size_t promotions = 0;
    size_t evictions = 0;
    size_t hits = 0;
    size_t misses = 0;
};

/**
 * @brief Bounded short-term buffer backed by an unbounded long-term map
 */
class MemoryManager {
public:
    explicit MemoryManager(const MemoryConfig& config = MemoryConfig());

    virtual ~MemoryManager() = default;

    /**
     * @brief Store a short-term entry, promoting it when important enough
     * @param key Entry key (replaces an existing short-term entry)
     * @param value Value to store
     * @param importance Importance (0.0-1.0)
     * @return True if the entry was also promoted to long-term storage
     */
    virtual bool storeShortTerm(const std::string& key, const nlohmann::json& value, double importance = 0.5);

    /**
     * @brief Store directly in long-term storage
     */
    virtual void storeLongTerm(const std::string& key, const nlohmann::json& value, double importance = 0.5);

    /**
     * @brief Promote every short-term entry at or above the threshold
     * @return Number of entries promoted by this sweep
     */
    virtual size_t consolidate();

    /**
     * @brief Look a key up, short-term first
     * @return Value, or empty when unknown
     */
    virtual std::optional<nlohmann::json> retrieve(const std::string& key);

    /**
     * @brief Most recent short-term entries, newest first
     */
    std::vector<MemoryEntry> getRecent(size_t count) const;

    /**
     * @brief Long-term entries whose key starts with a prefix
     */
    std::vector<MemoryEntry> searchByPrefix(const std::string& prefix) const;

    bool hasLongTerm(const std::string& key) const;

    /**
     * @brief Remove a key from both stores
     * @return True if anything was removed
     */
    bool forget(const std::string& key);

    void clearShortTerm();

    MemoryStatistics getStatistics() const;

private:
    MemoryConfig m_config;
    std::deque<MemoryEntry> m_short_term;
    std::unordered_map<std::string, MemoryEntry> m_long_term;
    MemoryStatistics m_stats;
    mutable std::mutex m_mutex;

    void promoteLocked(MemoryEntry& entry);
};

} // namespace Maestro
