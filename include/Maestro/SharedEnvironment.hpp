// =================================================================
// include/Maestro/SharedEnvironment.hpp
// =================================================================
// Resources that workers contend for, a shared key/value state and
// the event log of everything that happened to both.

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <set>
#include <deque>
#include <optional>
#include <unordered_map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace Maestro {

/**
 * @brief How holders share a resource
 */
enum class ResourceAccess {
    SHARED,     ///< Up to capacity holders at once
    EXCLUSIVE,  ///< One holder at a time
    READ_ONLY   ///< Any number of holders, data fixed by the owner
};

std::string resourceAccessToString(ResourceAccess access);

/**
 * @brief Parse "shared", "exclusive" or "read_only"
 * @throws MaestroError INVALID_ARGUMENT for other names
 */
ResourceAccess resourceAccessFromString(const std::string& name);

/**
 * @brief Snapshot of one resource
 */
struct ResourceInfo {
    std::string id;
    std::string name;                             ///< Unique within the environment
    std::string kind;                             ///< Free-form category, e.g. "tool" or "data"
    ResourceAccess access = ResourceAccess::SHARED;
    size_t capacity = 1;                          ///< Concurrent holders, 1 for EXCLUSIVE
    std::string owner;                            ///< Agent that created the resource
    std::set<std::string> holders;
    nlohmann::json data;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();

    bool isAvailable() const;
};

/**
 * @brief Something that happened in the environment
 */
struct EnvironmentEvent {
    std::string id;
    std::string type;                             ///< e.g. "resource_accessed"
    std::string agent_id;                         ///< Agent that caused it, may be empty
    std::string resource_id;                      ///< Empty for agent and state events
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Shared environment configuration
 */
struct SharedEnvironmentConfig {
    std::string name = "default";
    size_t max_events = 10000;                    ///< Oldest events are dropped beyond this
    std::chrono::milliseconds default_wait{10000}; ///< Wait for a busy resource when none is given
    size_t reasoning_slots = 2;                   ///< Concurrent reasoning calls across workers
};

/**
 * @brief Environment counters
 */
struct EnvironmentStatistics {
    size_t registered_agents = 0;
    size_t resources = 0;
    size_t resources_in_use = 0;
    size_t resources_created = 0;
    size_t accesses = 0;
    size_t releases = 0;
    size_t conflicts = 0;                         ///< Requests that found the resource full
    size_t timeouts = 0;                          ///< Conflicts that were never granted
    size_t events = 0;
};

/**
 * @brief Registry of contended resources shared by registered agents
 *
 * A request for a full SHARED or EXCLUSIVE resource blocks until a holder
 * releases it, the requester is unregistered, the resource is removed or
 * the wait elapses. Unregistering an agent releases everything it holds.
 */
class SharedEnvironment {
public:
    explicit SharedEnvironment(const SharedEnvironmentConfig& config = SharedEnvironmentConfig());

    void registerAgent(const std::string& agent_id);

    /**
     * @brief Remove an agent and release every resource it holds
     */
    void unregisterAgent(const std::string& agent_id);

    bool isRegistered(const std::string& agent_id) const;

    /**
     * @brief Create a resource
     * @param name Unique resource name
     * @param kind Resource category
     * @param access Access mode
     * @param owner Creating agent, may be empty
     * @param capacity Concurrent holders, ignored for EXCLUSIVE
     * @param data Initial data
     * @return Resource id
     * @throws MaestroError INVALID_ARGUMENT for a taken name or zero capacity
     */
    std::string createResource(const std::string& name, const std::string& kind, ResourceAccess access,
                               const std::string& owner = "", size_t capacity = 1,
                               nlohmann::json data = nullptr);

    /**
     * @brief Remove a resource, waking anyone waiting for it
     */
    bool removeResource(const std::string& resource_id);

    std::optional<std::string> findResource(const std::string& name) const;

    /**
     * @brief Acquire a resource for an agent
     * @param resource_id Resource to acquire
     * @param agent_id Registered requester
     * @param wait Longest wait for a full resource, config default when unset
     * @return True once the agent holds the resource, false for unknown
     *         resources, unregistered agents and elapsed waits
     */
    bool requestResource(const std::string& resource_id, const std::string& agent_id,
                         std::optional<std::chrono::milliseconds> wait = std::nullopt);

    /**
     * @brief Give a resource back
     * @return False if the agent does not hold it
     */
    bool releaseResource(const std::string& resource_id, const std::string& agent_id);

    std::optional<ResourceInfo> getResource(const std::string& resource_id) const;

    /**
     * @brief Replace a resource's data
     *
     * The agent must hold the resource. READ_ONLY data can only be
     * replaced by the owner.
     */
    bool updateResourceData(const std::string& resource_id, nlohmann::json data, const std::string& agent_id);

    void setSharedState(const std::string& key, nlohmann::json value, const std::string& agent_id);
    std::optional<nlohmann::json> getSharedState(const std::string& key) const;

    /**
     * @brief Recent events, oldest first
     * @param agent_id Only events caused by this agent, all when empty
     * @param type Only events of this type, all when empty
     * @param limit Maximum events, the newest are kept
     */
    std::vector<EnvironmentEvent> getEvents(const std::string& agent_id = "", const std::string& type = "",
                                            size_t limit = 100) const;

    std::vector<ResourceInfo> listResources(bool available_only = false) const;

    const SharedEnvironmentConfig& getConfig() const { return m_config; }

    EnvironmentStatistics getStatistics() const;

    /**
     * @brief Human-readable summary of resources and counters
     */
    std::string getReport() const;

private:
    SharedEnvironmentConfig m_config;
    std::set<std::string> m_agents;
    std::unordered_map<std::string, ResourceInfo> m_resources;
    std::unordered_map<std::string, nlohmann::json> m_state;
    std::deque<EnvironmentEvent> m_events;
    EnvironmentStatistics m_stats;

    mutable std::mutex m_mutex;
    std::condition_variable m_released;

    // Caller holds m_mutex
    void emit(const std::string& type, const std::string& agent_id, const std::string& resource_id,
              nlohmann::json data = nlohmann::json::object());
};

/**
 * @brief Holds a resource for the lifetime of the lease
 */
class ResourceLease {
public:
    ResourceLease(SharedEnvironment& environment, std::string resource_id, std::string agent_id,
                  std::optional<std::chrono::milliseconds> wait = std::nullopt);
    ~ResourceLease();

    ResourceLease(const ResourceLease&) = delete;
    ResourceLease& operator=(const ResourceLease&) = delete;

    bool granted() const { return m_granted; }
    explicit operator bool() const { return m_granted; }

private:
    SharedEnvironment& m_environment;
    std::string m_resource_id;
    std::string m_agent_id;
    bool m_granted = false;
};

} // namespace Maestro
