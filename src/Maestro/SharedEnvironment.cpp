// =================================================================
// src/Maestro/SharedEnvironment.cpp
// =================================================================
// Implementation of the shared resource environment.

#include "Maestro/SharedEnvironment.hpp"
#include "Maestro/Logger.hpp"
#include "Maestro/Types.hpp"
#include <algorithm>
#include <sstream>

using json = nlohmann::json;

namespace Maestro {

std::string resourceAccessToString(ResourceAccess access) {
    switch (access) {
        case ResourceAccess::SHARED: return "shared";
        case ResourceAccess::EXCLUSIVE: return "exclusive";
        case ResourceAccess::READ_ONLY: return "read_only";
        default: return "unknown";
    }
}

ResourceAccess resourceAccessFromString(const std::string& name) {
    if (name == "shared") return ResourceAccess::SHARED;
    if (name == "exclusive") return ResourceAccess::EXCLUSIVE;
    if (name == "read_only") return ResourceAccess::READ_ONLY;
    throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Unknown resource access mode: " + name);
}

bool ResourceInfo::isAvailable() const {
    return access == ResourceAccess::READ_ONLY || holders.size() < capacity;
}

SharedEnvironment::SharedEnvironment(const SharedEnvironmentConfig& config)
    : m_config(config) {
    Logger::getInstance().debug("SharedEnvironment", "Environment '" + m_config.name + "' ready");
}

void SharedEnvironment::registerAgent(const std::string& agent_id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_agents.insert(agent_id).second) {
            return;
        }
        emit("agent_joined", agent_id, "");
    }
    Logger::getInstance().debug("SharedEnvironment", "Agent joined " + m_config.name, agent_id);
}

void SharedEnvironment::unregisterAgent(const std::string& agent_id) {
    size_t released = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_agents.erase(agent_id) == 0) {
            return;
        }
        for (auto& [id, resource] : m_resources) {
            released += resource.holders.erase(agent_id);
        }
        emit("agent_left", agent_id, "", {{"released", released}});
    }
    m_released.notify_all();
    Logger::getInstance().debug("SharedEnvironment", "Agent left " + m_config.name,
                                agent_id + ", released " + std::to_string(released));
}

bool SharedEnvironment::isRegistered(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_agents.count(agent_id) > 0;
}

std::string SharedEnvironment::createResource(const std::string& name, const std::string& kind,
                                              ResourceAccess access, const std::string& owner,
                                              size_t capacity, json data) {
    if (capacity == 0 && access == ResourceAccess::SHARED) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Resource capacity must be positive: " + name);
    }

    ResourceInfo resource;
    resource.id = generateId("res");
    resource.name = name;
    resource.kind = kind;
    resource.access = access;
    resource.capacity = access == ResourceAccess::EXCLUSIVE ? 1 : capacity;
    size_t effective_capacity = resource.capacity;
    resource.owner = owner;
    resource.data = std::move(data);

    std::string id = resource.id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [existing_id, existing] : m_resources) {
            if (existing.name == name) {
                throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Resource already exists: " + name);
            }
        }
        m_resources[id] = std::move(resource);
        m_stats.resources_created++;
        emit("resource_created", owner, id, {{"name", name}, {"kind", kind},
                                              {"access", resourceAccessToString(access)}});
    }

    Logger::getInstance().info("SharedEnvironment", "Resource '" + name + "' created",
                               "Access: " + resourceAccessToString(access) +
                               ", Capacity: " + std::to_string(effective_capacity));
    return id;
}

bool SharedEnvironment::removeResource(const std::string& resource_id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_resources.erase(resource_id) == 0) {
            return false;
        }
        emit("resource_removed", "", resource_id);
    }
    m_released.notify_all();
    return true;
}

std::optional<std::string> SharedEnvironment::findResource(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, resource] : m_resources) {
        if (resource.name == name) {
            return id;
        }
    }
    return std::nullopt;
}

bool SharedEnvironment::requestResource(const std::string& resource_id, const std::string& agent_id,
                                        std::optional<std::chrono::milliseconds> wait) {
    std::unique_lock<std::mutex> lock(m_mutex);

    auto it = m_resources.find(resource_id);
    if (it == m_resources.end()) {
        lock.unlock();
        Logger::getInstance().warning("SharedEnvironment", "Request for unknown resource", resource_id);
        return false;
    }
    if (m_agents.count(agent_id) == 0) {
        lock.unlock();
        Logger::getInstance().warning("SharedEnvironment", "Request from unregistered agent", agent_id);
        return false;
    }
    if (it->second.holders.count(agent_id) > 0) {
        return true;
    }

    if (!it->second.isAvailable()) {
        m_stats.conflicts++;
        std::string name = it->second.name;
        auto deadline = std::chrono::steady_clock::now() + wait.value_or(m_config.default_wait);

        // The map may rehash while we wait, so look the resource up again each time
        bool woken = m_released.wait_until(lock, deadline, [&] {
            auto current = m_resources.find(resource_id);
            return current == m_resources.end() || m_agents.count(agent_id) == 0 ||
                   current->second.isAvailable();
        });

        it = m_resources.find(resource_id);
        if (!woken || it == m_resources.end() || m_agents.count(agent_id) == 0) {
            if (!woken) {
                m_stats.timeouts++;
            }
            lock.unlock();
            Logger::getInstance().warning("SharedEnvironment", "Agent " + agent_id + " not granted '" + name + "'",
                                         woken ? "Resource or agent went away" : "Wait elapsed");
            return false;
        }
    }

    ResourceInfo& resource = it->second;
    resource.holders.insert(agent_id);
    m_stats.accesses++;
    size_t holders = resource.holders.size();
    std::string name = resource.name;
    emit("resource_accessed", agent_id, resource_id, {{"access", resourceAccessToString(resource.access)},
                                                      {"holders", holders}});
    lock.unlock();

    Logger::getInstance().debug("SharedEnvironment", "Agent " + agent_id + " holds '" + name + "'",
                                "Holders: " + std::to_string(holders));
    return true;
}

bool SharedEnvironment::releaseResource(const std::string& resource_id, const std::string& agent_id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_resources.find(resource_id);
        if (it == m_resources.end() || it->second.holders.erase(agent_id) == 0) {
            return false;
        }
        m_stats.releases++;
        emit("resource_released", agent_id, resource_id, {{"holders", it->second.holders.size()}});
    }
    m_released.notify_all();
    return true;
}

std::optional<ResourceInfo> SharedEnvironment::getResource(const std::string& resource_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_resources.find(resource_id);
    if (it == m_resources.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SharedEnvironment::updateResourceData(const std::string& resource_id, json data,
                                           const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_resources.find(resource_id);
    if (it == m_resources.end()) {
        return false;
    }

    ResourceInfo& resource = it->second;
    bool allowed = resource.access == ResourceAccess::READ_ONLY
        ? resource.owner == agent_id
        : resource.holders.count(agent_id) > 0;
    if (!allowed) {
        Logger::getInstance().warning("SharedEnvironment", "Agent " + agent_id + " may not update '" +
                                     resource.name + "'");
        return false;
    }

    resource.data = std::move(data);
    emit("resource_updated", agent_id, resource_id, {{"size", resource.data.dump().size()}});
    return true;
}

void SharedEnvironment::setSharedState(const std::string& key, json value, const std::string& agent_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string type_name = value.type_name();
    m_state[key] = std::move(value);
    emit("state_updated", agent_id, "", {{"key", key}, {"value_type", type_name}});
}

std::optional<json> SharedEnvironment::getSharedState(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.find(key);
    if (it == m_state.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EnvironmentEvent> SharedEnvironment::getEvents(const std::string& agent_id, const std::string& type,
                                                           size_t limit) const {
    std::vector<EnvironmentEvent> matches;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& event : m_events) {
        if (!agent_id.empty() && event.agent_id != agent_id) continue;
        if (!type.empty() && event.type != type) continue;
        matches.push_back(event);
    }
    if (matches.size() > limit) {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(limit));
    }
    return matches;
}

std::vector<ResourceInfo> SharedEnvironment::listResources(bool available_only) const {
    std::vector<ResourceInfo> resources;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, resource] : m_resources) {
            if (!available_only || resource.isAvailable()) {
                resources.push_back(resource);
            }
        }
    }
    std::sort(resources.begin(), resources.end(), [](const ResourceInfo& a, const ResourceInfo& b) {
        return a.name < b.name;
    });
    return resources;
}

EnvironmentStatistics SharedEnvironment::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    EnvironmentStatistics stats = m_stats;
    stats.registered_agents = m_agents.size();
    stats.resources = m_resources.size();
    stats.resources_in_use = static_cast<size_t>(std::count_if(m_resources.begin(), m_resources.end(),
        [](const auto& entry) { return !entry.second.holders.empty(); }));
    return stats;
}

std::string SharedEnvironment::getReport() const {
    EnvironmentStatistics stats = getStatistics();
    std::vector<ResourceInfo> resources = listResources();

    std::ostringstream report;
    report << "Shared Environment: " << m_config.name << "\n";
    report << "===================\n\n";
    report << "Agents: " << stats.registered_agents << "\n";
    report << "Resources: " << stats.resources << " (" << stats.resources_in_use << " in use)\n";
    report << "Accesses: " << stats.accesses << "\n";
    report << "Releases: " << stats.releases << "\n";
    report << "Conflicts: " << stats.conflicts << "\n";
    report << "Timeouts: " << stats.timeouts << "\n";
    report << "Events: " << stats.events << "\n\n";

    for (const auto& resource : resources) {
        report << "Resource: " << resource.name << " (" << resourceAccessToString(resource.access) << ")\n";
        report << "  Kind: " << resource.kind << "\n";
        report << "  Holders: " << resource.holders.size();
        if (resource.access != ResourceAccess::READ_ONLY) {
            report << "/" << resource.capacity;
        }
        report << "\n\n";
    }

    return report.str();
}

void SharedEnvironment::emit(const std::string& type, const std::string& agent_id,
                             const std::string& resource_id, json data) {
    EnvironmentEvent event;
    event.id = generateId("evt");
    event.type = type;
    event.agent_id = agent_id;
    event.resource_id = resource_id;
    event.data = std::move(data);

    m_events.push_back(std::move(event));
    m_stats.events++;
    while (m_events.size() > m_config.max_events) {
        m_events.pop_front();
    }
}

// =================================================================
// ResourceLease
// =================================================================

ResourceLease::ResourceLease(SharedEnvironment& environment, std::string resource_id, std::string agent_id,
                             std::optional<std::chrono::milliseconds> wait)
    : m_environment(environment), m_resource_id(std::move(resource_id)), m_agent_id(std::move(agent_id)) {
    m_granted = m_environment.requestResource(m_resource_id, m_agent_id, wait);
}

ResourceLease::~ResourceLease() {
    if (m_granted) {
        m_environment.releaseResource(m_resource_id, m_agent_id);
    }
}

} // namespace Maestro
