// =================================================================
// include/Maestro/LoadBalancer.hpp
// =================================================================
// Load tracking for distributing subtasks across worker agents.

#pragma once

#include "Maestro/Types.hpp"
#include <string>
#include <memory>
#include <vector>
#include <map>
#include <unordered_map>
#include <chrono>
#include <shared_mutex>
#include <atomic>

namespace Maestro {

/**
 * @brief Load information for one agent
 */
struct AgentLoad {
    std::string agent_id;                         ///< Agent identifier
    std::atomic<double> load{0.0};                ///< Caller-reported load (0.0-1.0)
    std::atomic<size_t> active_tasks{0};          ///< Tasks currently running
    std::atomic<size_t> completed_tasks{0};       ///< Successfully finished tasks
    std::atomic<size_t> failed_tasks{0};          ///< Failed tasks
    std::atomic<double> average_response_time{0.0}; ///< Average task time in ms
};

/**
 * @brief Load balancer configuration
 */
struct LoadBalancerConfig {
    double response_time_smoothing = 0.2;         ///< Weight of the newest sample in the moving average
};

/**
 * @brief Tracks per-agent load and distributes work by it
 *
 * The agent map is guarded by a reader/writer lock; values of one agent
 * are atomics so updates for different agents never contend.
 */
class LoadBalancer {
public:
    /**
     * @brief Constructor
     * @param config Load balancer configuration
     */
    explicit LoadBalancer(const LoadBalancerConfig& config = LoadBalancerConfig());

    virtual ~LoadBalancer() = default;

    /**
     * @brief Report an agent's current load
     * @param agent_id Agent identifier (tracked from first report on)
     * @param load Load value, clamped to 0.0-1.0
     */
    virtual void setLoad(const std::string& agent_id, double load);

    /**
     * @brief Get an agent's load
     * @return Reported load, 0.0 for untracked agents
     */
    virtual double getLoad(const std::string& agent_id) const;

    /**
     * @brief Pick the candidate with the lowest load
     * @param candidates Agent ids in preference order
     * @return First candidate with minimal load, empty if there are none
     */
    virtual std::string leastLoadedAgent(const std::vector<std::string>& candidates) const;

    /**
     * @brief Assign tasks round-robin over agents sorted by ascending load
     * @param tasks Tasks to assign, in order
     * @param agents Agent ids (ties keep their input order)
     * @return Tasks per agent id
     */
    virtual std::map<std::string, std::vector<Task>> distributeTasks(
        const std::vector<Task>& tasks, const std::vector<std::string>& agents) const;

    /**
     * @brief Record task start
     * @param agent_id Agent handling the task
     */
    virtual void recordTaskStart(const std::string& agent_id);

    /**
     * @brief Record task completion
     * @param agent_id Agent that handled the task
     * @param response_time Task time in milliseconds
     * @param success Whether the task succeeded
     */
    virtual void recordTaskEnd(const std::string& agent_id, double response_time, bool success);

    /**
     * @brief Stop tracking an agent
     * @return True if the agent was tracked
     */
    virtual bool removeAgent(const std::string& agent_id);

    /**
     * @brief Get load balancer statistics
     * @return Statistics as formatted string
     */
    virtual std::string getStatistics() const;

    size_t getActiveTasks(const std::string& agent_id) const;

    std::vector<std::string> getTrackedAgents() const;

private:
    LoadBalancerConfig m_config;

    // Shared so an entry outlives a concurrent removeAgent() while in use
    std::unordered_map<std::string, std::shared_ptr<AgentLoad>> m_agents;
    mutable std::shared_mutex m_agents_mutex;

    std::shared_ptr<AgentLoad> findAgent(const std::string& agent_id) const;
    std::shared_ptr<AgentLoad> findOrCreateAgent(const std::string& agent_id);
};

} // namespace Maestro
