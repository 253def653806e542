// =================================================================
// src/Maestro/ContextProtocol.cpp
// =================================================================
// Implementation of the scoped context store.

#include "Maestro/ContextProtocol.hpp"
#include "Maestro/Logger.hpp"
#include "Maestro/Types.hpp"
#include <algorithm>
#include <cctype>

namespace Maestro {

std::string contextScopeToString(ContextScope scope) {
    switch (scope) {
        case ContextScope::PRIVATE: return "private";
        case ContextScope::SHARED: return "shared";
        case ContextScope::GLOBAL: return "global";
        default: return "unknown";
    }
}

std::string contextTypeToString(ContextType type) {
    switch (type) {
        case ContextType::FACT: return "fact";
        case ContextType::OBSERVATION: return "observation";
        case ContextType::DECISION: return "decision";
        case ContextType::RESULT: return "result";
        case ContextType::INSTRUCTION: return "instruction";
        default: return "unknown";
    }
}

namespace {

std::set<std::string> keywordSet(const std::string& text) {
    std::set<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            words.insert(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.insert(current);
    }
    return words;
}

} // anonymous namespace

bool ContextEntry::isExpired(std::chrono::system_clock::time_point now) const {
    return expires_at.has_value() && now >= *expires_at;
}

bool ContextEntry::isVisibleTo(const std::string& agent_id) const {
    switch (scope) {
        case ContextScope::GLOBAL:
            return true;
        case ContextScope::SHARED:
            return owner == agent_id || shared_with.count(agent_id) > 0;
        case ContextScope::PRIVATE:
        default:
            return owner == agent_id;
    }
}

ContextProtocol::ContextProtocol(const ContextProtocolConfig& config)
    : m_config(config) {
}

ContextProtocol::~ContextProtocol() {
    stopCleanupThread();
}

std::string ContextProtocol::storeContext(const std::string& owner, const std::string& content,
                                          ContextType type, ContextScope scope, double importance,
                                          std::optional<std::chrono::milliseconds> ttl) {
    ContextEntry entry;
    entry.id = generateId("ctx");
    entry.type = type;
    entry.scope = scope;
    entry.owner = owner;
    entry.content = content;
    entry.importance = std::clamp(importance, 0.0, 1.0);

    std::chrono::milliseconds effective_ttl = ttl.value_or(m_config.default_ttl);
    if (effective_ttl.count() > 0) {
        entry.expires_at = entry.timestamp + effective_ttl;
    }

    std::string id = entry.id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries[id] = std::move(entry);
    }

    Logger::getInstance().debug("ContextProtocol", "Stored " + contextScopeToString(scope) +
                               " context " + id, "Owner: " + owner);
    return id;
}

std::optional<ContextEntry> ContextProtocol::getContext(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.isExpired()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ContextEntry> ContextProtocol::retrieveRelevantContext(const std::string& agent_id,
                                                                   const std::string& query,
                                                                   size_t top_k) {
    std::set<std::string> query_terms = keywordSet(query);
    auto now = std::chrono::system_clock::now();

    std::vector<ContextEntry> candidates;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.retrievals++;
        for (const auto& [id, entry] : m_entries) {
            if (entry.isExpired(now) || !entry.isVisibleTo(agent_id)) {
                continue;
            }
            ContextEntry scored = entry;
            scored.relevance_score = scoreEntry(entry, query_terms, now);
            candidates.push_back(std::move(scored));
        }
    }

    std::sort(candidates.begin(), candidates.end(), [](const ContextEntry& a, const ContextEntry& b) {
        if (a.relevance_score != b.relevance_score) {
            return a.relevance_score > b.relevance_score;
        }
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.id < b.id;
    });

    if (candidates.size() > top_k) {
        candidates.resize(top_k);
    }
    return candidates;
}

bool ContextProtocol::shareContext(const std::string& id, const std::vector<std::string>& agents) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.isExpired()) {
        Logger::getInstance().warning("ContextProtocol",
                                     errorKindToString(ErrorKind::NOT_FOUND) + ": context " + id);
        return false;
    }

    ContextEntry& entry = it->second;
    entry.shared_with.insert(agents.begin(), agents.end());
    if (entry.scope == ContextScope::PRIVATE) {
        entry.scope = ContextScope::SHARED;
    }
    return true;
}

bool ContextProtocol::promoteToGlobal(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.isExpired()) {
        Logger::getInstance().warning("ContextProtocol",
                                     errorKindToString(ErrorKind::NOT_FOUND) + ": context " + id);
        return false;
    }
    it->second.scope = ContextScope::GLOBAL;
    return true;
}

std::vector<ContextEntry> ContextProtocol::getAgentContexts(const std::string& agent_id) const {
    auto now = std::chrono::system_clock::now();
    std::vector<ContextEntry> visible;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            if (!entry.isExpired(now) && entry.isVisibleTo(agent_id)) {
                visible.push_back(entry);
            }
        }
    }

    std::sort(visible.begin(), visible.end(), [](const ContextEntry& a, const ContextEntry& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp < b.timestamp;
        }
        return a.id < b.id;
    });
    return visible;
}

bool ContextProtocol::deleteContext(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.erase(id) > 0;
}

bool ContextProtocol::updateImportance(const std::string& id, double importance) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    it->second.importance = std::clamp(importance, 0.0, 1.0);
    return true;
}

size_t ContextProtocol::cleanupExpired() {
    auto now = std::chrono::system_clock::now();
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (it->second.isExpired(now)) {
                it = m_entries.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        m_stats.expired_removed += removed;
    }

    if (removed > 0) {
        Logger::getInstance().debug("ContextProtocol", "Removed " + std::to_string(removed) + " expired entries");
    }
    return removed;
}

void ContextProtocol::startCleanupThread(std::chrono::milliseconds interval) {
    if (m_cleanup_thread) {
        return;
    }
    if (interval.count() <= 0) {
        interval = std::chrono::duration_cast<std::chrono::milliseconds>(m_config.cleanup_interval);
    }

    m_stop_cleanup.store(false);
    m_cleanup_thread = std::make_unique<std::thread>(&ContextProtocol::cleanupLoop, this, interval);
    Logger::getInstance().info("ContextProtocol", "Started cleanup thread");
}

void ContextProtocol::stopCleanupThread() {
    if (m_cleanup_thread) {
        {
            std::lock_guard<std::mutex> lock(m_cleanup_mutex);
            m_stop_cleanup.store(true);
        }
        m_cleanup_cv.notify_all();
        m_cleanup_thread->join();
        m_cleanup_thread.reset();
        Logger::getInstance().info("ContextProtocol", "Stopped cleanup thread");
    }
}

ContextStatistics ContextProtocol::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    ContextStatistics stats = m_stats;
    stats.total_entries = m_entries.size();
    stats.private_entries = 0;
    stats.shared_entries = 0;
    stats.global_entries = 0;
    for (const auto& [id, entry] : m_entries) {
        switch (entry.scope) {
            case ContextScope::PRIVATE: stats.private_entries++; break;
            case ContextScope::SHARED: stats.shared_entries++; break;
            case ContextScope::GLOBAL: stats.global_entries++; break;
        }
    }
    return stats;
}

double ContextProtocol::scoreEntry(const ContextEntry& entry, const std::set<std::string>& query_terms,
                                   std::chrono::system_clock::time_point now) const {
    double keyword_score = 0.0;
    if (!query_terms.empty()) {
        std::set<std::string> entry_terms = keywordSet(entry.content);
        size_t overlap = 0;
        for (const auto& term : query_terms) {
            if (entry_terms.count(term) > 0) {
                overlap++;
            }
        }
        keyword_score = static_cast<double>(overlap) / query_terms.size();
    }

    double age = std::chrono::duration<double>(now - entry.timestamp).count();
    double window = std::chrono::duration<double>(m_config.recency_window).count();
    double recency_score = window > 0.0 ? std::max(0.0, 1.0 - age / window) : 0.0;

    return m_config.keyword_weight * keyword_score +
           m_config.recency_weight * recency_score +
           m_config.importance_weight * entry.importance;
}

void ContextProtocol::cleanupLoop(std::chrono::milliseconds interval) {
    while (!m_stop_cleanup.load()) {
        try {
            cleanupExpired();
        } catch (const std::exception& e) {
            Logger::getInstance().error("ContextProtocol",
                "Cleanup loop error: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(m_cleanup_mutex);
        m_cleanup_cv.wait_for(lock, interval, [this] { return m_stop_cleanup.load(); });
    }
}

} // namespace Maestro
