// =================================================================
// src/Maestro/LoadBalancer.cpp
// =================================================================
// Implementation of the load balancer.

#include "Maestro/LoadBalancer.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <mutex>

namespace Maestro {

LoadBalancer::LoadBalancer(const LoadBalancerConfig& config)
    : m_config(config) {
    Logger::getInstance().debug("LoadBalancer", "Initialized");
}

void LoadBalancer::setLoad(const std::string& agent_id, double load) {
    auto agent = findOrCreateAgent(agent_id);
    agent->load.store(std::clamp(load, 0.0, 1.0));
}

double LoadBalancer::getLoad(const std::string& agent_id) const {
    auto agent = findAgent(agent_id);
    return agent ? agent->load.load() : 0.0;
}

std::string LoadBalancer::leastLoadedAgent(const std::vector<std::string>& candidates) const {
    if (candidates.empty()) return "";

    // Strict comparison keeps the earliest candidate on ties
    std::string best = candidates.front();
    double best_load = getLoad(best);
    for (size_t i = 1; i < candidates.size(); ++i) {
        double load = getLoad(candidates[i]);
        if (load < best_load) {
            best = candidates[i];
            best_load = load;
        }
    }
    return best;
}

std::map<std::string, std::vector<Task>> LoadBalancer::distributeTasks(
    const std::vector<Task>& tasks, const std::vector<std::string>& agents) const {

    std::map<std::string, std::vector<Task>> distribution;
    if (agents.empty()) {
        if (!tasks.empty()) {
            Logger::getInstance().warning("LoadBalancer", "No agents to distribute " +
                                         std::to_string(tasks.size()) + " tasks to");
        }
        return distribution;
    }

    std::vector<std::pair<std::string, double>> ordered;
    for (const auto& agent_id : agents) {
        ordered.emplace_back(agent_id, getLoad(agent_id));
    }
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    for (size_t i = 0; i < tasks.size(); ++i) {
        distribution[ordered[i % ordered.size()].first].push_back(tasks[i]);
    }
    return distribution;
}

void LoadBalancer::recordTaskStart(const std::string& agent_id) {
    auto agent = findOrCreateAgent(agent_id);
    agent->active_tasks.fetch_add(1);

    Logger::getInstance().debug("LoadBalancer", "Started task on agent " + agent_id);
}

void LoadBalancer::recordTaskEnd(const std::string& agent_id, double response_time, bool success) {
    auto agent = findOrCreateAgent(agent_id);

    size_t active = agent->active_tasks.load();
    while (active > 0 && !agent->active_tasks.compare_exchange_weak(active, active - 1)) {
    }

    if (success) {
        agent->completed_tasks.fetch_add(1);
    } else {
        agent->failed_tasks.fetch_add(1);
    }

    // Exponential moving average
    double current_avg = agent->average_response_time.load();
    if (current_avg == 0.0) {
        agent->average_response_time.store(response_time);
    } else {
        double alpha = m_config.response_time_smoothing;
        agent->average_response_time.store(alpha * response_time + (1.0 - alpha) * current_avg);
    }

    Logger::getInstance().debug("LoadBalancer",
        "Completed task on agent " + agent_id + " in " + std::to_string(response_time) + "ms");
}

bool LoadBalancer::removeAgent(const std::string& agent_id) {
    std::unique_lock<std::shared_mutex> lock(m_agents_mutex);
    if (m_agents.erase(agent_id) == 0) {
        return false;
    }
    Logger::getInstance().info("LoadBalancer", "Removed agent " + agent_id);
    return true;
}

std::string LoadBalancer::getStatistics() const {
    std::shared_lock<std::shared_mutex> lock(m_agents_mutex);

    std::vector<const AgentLoad*> agents;
    for (const auto& [agent_id, agent] : m_agents) {
        agents.push_back(agent.get());
    }
    std::sort(agents.begin(), agents.end(),
              [](const AgentLoad* a, const AgentLoad* b) { return a->agent_id < b->agent_id; });

    std::ostringstream stats;
    stats << "Load Balancer Statistics\n";
    stats << "========================\n\n";
    stats << "Tracked Agents: " << agents.size() << "\n\n";

    for (const auto* agent : agents) {
        stats << "Agent: " << agent->agent_id << "\n";
        stats << "  Load: " << std::fixed << std::setprecision(2) << agent->load.load() << "\n";
        stats << "  Active Tasks: " << agent->active_tasks.load() << "\n";
        stats << "  Completed: " << agent->completed_tasks.load() << "\n";
        stats << "  Failed: " << agent->failed_tasks.load() << "\n";
        stats << "  Avg Response Time: " << std::fixed << std::setprecision(1)
              << agent->average_response_time.load() << "ms\n\n";
    }

    return stats.str();
}

size_t LoadBalancer::getActiveTasks(const std::string& agent_id) const {
    auto agent = findAgent(agent_id);
    return agent ? agent->active_tasks.load() : 0;
}

std::vector<std::string> LoadBalancer::getTrackedAgents() const {
    std::shared_lock<std::shared_mutex> lock(m_agents_mutex);
    std::vector<std::string> ids;
    for (const auto& [agent_id, agent] : m_agents) {
        ids.push_back(agent_id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::shared_ptr<AgentLoad> LoadBalancer::findAgent(const std::string& agent_id) const {
    std::shared_lock<std::shared_mutex> lock(m_agents_mutex);
    auto it = m_agents.find(agent_id);
    return (it != m_agents.end()) ? it->second : nullptr;
}

std::shared_ptr<AgentLoad> LoadBalancer::findOrCreateAgent(const std::string& agent_id) {
    if (auto existing = findAgent(agent_id)) {
        return existing;
    }

    std::unique_lock<std::shared_mutex> lock(m_agents_mutex);
    auto& slot = m_agents[agent_id];
    if (!slot) {
        slot = std::make_shared<AgentLoad>();
        slot->agent_id = agent_id;
    }
    return slot;
}

} // namespace Maestro
