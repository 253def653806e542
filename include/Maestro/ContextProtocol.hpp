// =================================================================
// include/Maestro/ContextProtocol.hpp
// =================================================================
// Scoped context entries shared between agents, with relevance ranking,
// expiry and a background sweep.

#pragma once

#include <string>
#include <memory>
#include <vector>
#include <set>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace Maestro {

/**
 * @brief Visibility of a context entry
 */
enum class ContextScope {
    PRIVATE,    ///< Owner only
    SHARED,     ///< Owner plus an explicit agent set
    GLOBAL      ///< Every agent
};

/**
 * @brief Kind of fact an entry records
 */
enum class ContextType {
    FACT,
    OBSERVATION,
    DECISION,
    RESULT,
    INSTRUCTION
};

std::string contextScopeToString(ContextScope scope);
std::string contextTypeToString(ContextType type);

/**
 * @brief One stored context fact
 */
struct ContextEntry {
    std::string id;                               ///< Unique entry identifier
    ContextType type = ContextType::FACT;         ///< Entry kind
    ContextScope scope = ContextScope::PRIVATE;   ///< Visibility
    std::string owner;                            ///< Agent that stored the entry
    std::set<std::string> shared_with;            ///< Agents a SHARED entry is visible to
    std::string content;                          ///< Entry text
    double importance = 0.5;                      ///< Importance (0.0-1.0)
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> expires_at; ///< Absent = never expires
    double relevance_score = 0.0;                 ///< Score from the last relevance query

    bool isExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;

    /**
     * @brief Check whether an agent may read the entry
     */
    bool isVisibleTo(const std::string& agent_id) const;
};

/**
 * @brief Context protocol configuration
 */
struct ContextProtocolConfig {
    std::chrono::milliseconds default_ttl{0};     ///< TTL applied when store gets none, 0 = no expiry
    std::chrono::seconds cleanup_interval{60};    ///< Sweep period of the cleanup thread
    std::chrono::hours recency_window{24};        ///< Recency decays linearly to zero over this window
    double keyword_weight = 0.5;
    double recency_weight = 0.2;
    double importance_weight = 0.3;
};

/**
 * @brief Context counters
 */
struct ContextStatistics {
    size_t total_entries = 0;
    size_t private_entries = 0;
    size_t shared_entries = 0;
    size_t global_entries = 0;
    size_t expired_removed = 0;
    size_t retrievals = 0;
};

/**
 * @brief Store of scoped context entries
 */
class ContextProtocol {
public:
    explicit ContextProtocol(const ContextProtocolConfig& config = ContextProtocolConfig());

    /**
     * @brief Destructor, stops the cleanup thread
     */
    virtual ~ContextProtocol();

    /**
     * @brief Store a new entry
     * @param owner Owning agent
     * @param content Entry text
     * @param type Entry kind
     * @param scope Initial visibility
     * @param importance Importance (0.0-1.0)
     * @param ttl Time to live, config default when unset, 0 = no expiry
     * @return Entry id
     */
    virtual std::string storeContext(const std::string& owner, const std::string& content,
                                     ContextType type = ContextType::FACT,
                                     ContextScope scope = ContextScope::PRIVATE,
                                     double importance = 0.5,
                                     std::optional<std::chrono::milliseconds> ttl = std::nullopt);

    /**
     * @brief Fetch an entry by id, whatever its scope
     * @return Entry, or empty when unknown or expired
     */
    virtual std::optional<ContextEntry> getContext(const std::string& id) const;

    /**
     * @brief Rank the entries visible to an agent against a query
     * @param agent_id Requesting agent
     * @param query Query text
     * @param top_k Maximum entries
     * @return Entries, most relevant first, relevance_score filled in
     */
    virtual std::vector<ContextEntry> retrieveRelevantContext(const std::string& agent_id,
                                                              const std::string& query,
                                                              size_t top_k = 5);

    /**
     * @brief Make an entry visible to more agents (scope becomes SHARED)
     * @return False if the entry is unknown or expired
     */
    virtual bool shareContext(const std::string& id, const std::vector<std::string>& agents);

    /**
     * @brief Make an entry visible to every agent
     */
    virtual bool promoteToGlobal(const std::string& id);

    /**
     * @brief Entries visible to an agent, oldest first
     */
    std::vector<ContextEntry> getAgentContexts(const std::string& agent_id) const;

    bool deleteContext(const std::string& id);

    bool updateImportance(const std::string& id, double importance);

    /**
     * @brief Physically remove expired entries
     * @return Number of entries removed
     */
    size_t cleanupExpired();

    /**
     * @brief Start the periodic sweep
     * @param interval Sweep period, config value when zero
     */
    void startCleanupThread(std::chrono::milliseconds interval = std::chrono::milliseconds(0));

    void stopCleanupThread();

    ContextStatistics getStatistics() const;

private:
    ContextProtocolConfig m_config;
    std::unordered_map<std::string, ContextEntry> m_entries;
    ContextStatistics m_stats;
    mutable std::mutex m_mutex;

    std::unique_ptr<std::thread> m_cleanup_thread;
    std::atomic<bool> m_stop_cleanup{false};
    std::mutex m_cleanup_mutex;
    std::condition_variable m_cleanup_cv;

    double scoreEntry(const ContextEntry& entry, const std::set<std::string>& query_terms,
                      std::chrono::system_clock::time_point now) const;
    void cleanupLoop(std::chrono::milliseconds interval);
};

} // namespace Maestro
