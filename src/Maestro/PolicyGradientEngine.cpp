// =================================================================
// src/Maestro/PolicyGradientEngine.cpp
// =================================================================
// Implementation of the tabular policy gradient learner.

#include "Maestro/PolicyGradientEngine.hpp"
#include "Maestro/StateKey.hpp"
#include "Maestro/Types.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>

namespace Maestro {

PolicyGradientEngine::PolicyGradientEngine(const PolicyGradientConfig& config, unsigned int seed)
    : m_config(config), m_rng(seed) {
}

std::string PolicyGradientEngine::selectAction(const nlohmann::json& state,
                                               const std::vector<std::string>& actions) {
    if (actions.empty()) {
        return "";
    }

    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureActionsLocked(key, actions);

    const auto& distribution = m_policies[key];
    std::vector<double> weights;
    for (const auto& action : actions) {
        auto it = distribution.find(action);
        weights.push_back(it != distribution.end() ? it->second : 0.0);
    }

    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return actions[pick(m_rng)];
}

void PolicyGradientEngine::recordStep(const nlohmann::json& state, const std::string& action, double reward) {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureActionsLocked(key, {action});
    m_episode.push_back(Step{key, action, reward});
}

size_t PolicyGradientEngine::endEpisode() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_episode.empty()) {
        return 0;
    }

    std::vector<double> returns(m_episode.size(), 0.0);
    double running = 0.0;
    for (size_t i = m_episode.size(); i-- > 0;) {
        running = m_episode[i].reward + m_config.discount_factor * running;
        returns[i] = running;
    }

    for (size_t i = 0; i < m_episode.size(); ++i) {
        const Step& step = m_episode[i];
        double& baseline = m_baselines[step.state_key];
        double advantage = returns[i] - baseline;
        baseline += m_config.baseline_learning_rate * advantage;
        nudgeLocked(step.state_key, step.action, advantage);
    }

    size_t steps = m_episode.size();
    m_episode.clear();

    Logger::getInstance().debug("PolicyGradient", "Episode applied", "Steps: " + std::to_string(steps));
    return steps;
}

void PolicyGradientEngine::applyHumanFeedback(const nlohmann::json& state, const std::string& action,
                                              double preference) {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureActionsLocked(key, {action});
    nudgeLocked(key, action, preference);
}

std::map<std::string, double> PolicyGradientEngine::getActionProbabilities(const nlohmann::json& state) const {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_policies.find(key);
    return (it != m_policies.end()) ? it->second : std::map<std::string, double>();
}

double PolicyGradientEngine::getBaseline(const nlohmann::json& state) const {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_baselines.find(key);
    return (it != m_baselines.end()) ? it->second : 0.0;
}

size_t PolicyGradientEngine::episodeLength() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_episode.size();
}

LearningSnapshot PolicyGradientEngine::toSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    LearningSnapshot snapshot;
    snapshot.engine = "policy_gradient";
    snapshot.parameters["learning_rate"] = m_config.learning_rate;
    snapshot.parameters["discount_factor"] = m_config.discount_factor;
    snapshot.parameters["baseline_learning_rate"] = m_config.baseline_learning_rate;
    snapshot.parameters["min_probability"] = m_config.min_probability;
    for (const auto& [state, distribution] : m_policies) {
        snapshot.table[state] = distribution;
    }
    for (const auto& [state, baseline] : m_baselines) {
        snapshot.baselines[state] = baseline;
    }
    return snapshot;
}

void PolicyGradientEngine::loadSnapshot(const LearningSnapshot& snapshot) {
    if (snapshot.engine != "policy_gradient") {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT,
                           "Snapshot engine '" + snapshot.engine + "' is not policy_gradient");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_policies.clear();
    m_baselines.clear();
    for (const auto& [state, distribution] : snapshot.table) {
        m_policies[state] = distribution;
    }
    for (const auto& [state, baseline] : snapshot.baselines) {
        m_baselines[state] = baseline;
    }
}

void PolicyGradientEngine::ensureActionsLocked(const std::string& state_key,
                                               const std::vector<std::string>& actions) {
    auto& distribution = m_policies[state_key];
    bool added = false;
    for (const auto& action : actions) {
        if (distribution.count(action) == 0) {
            // New actions enter at the uniform share of the grown distribution
            double share = 1.0 / (distribution.size() + 1);
            double scale = 1.0 - share;
            for (auto& [existing, probability] : distribution) {
                probability *= scale;
            }
            distribution[action] = share;
            added = true;
        }
    }
    if (added) {
        normalizeLocked(distribution);
    }
}

void PolicyGradientEngine::nudgeLocked(const std::string& state_key, const std::string& action, double signal) {
    auto& distribution = m_policies[state_key];
    double& probability = distribution[action];
    probability += m_config.learning_rate * signal * (1.0 - probability);

    for (auto& [name, value] : distribution) {
        value = std::clamp(value, m_config.min_probability, 1.0);
    }
    normalizeLocked(distribution);
}

void PolicyGradientEngine::normalizeLocked(std::map<std::string, double>& distribution) const {
    double total = 0.0;
    for (const auto& [name, value] : distribution) {
        total += value;
    }
    if (total <= 0.0) {
        double uniform = distribution.empty() ? 0.0 : 1.0 / distribution.size();
        for (auto& [name, value] : distribution) {
            value = uniform;
        }
        return;
    }
    for (auto& [name, value] : distribution) {
        value /= total;
    }
}

} // namespace Maestro
