// =================================================================
// src/Maestro/QLearningEngine.cpp
// =================================================================
// Implementation of tabular Q-learning.

#include "Maestro/QLearningEngine.hpp"
#include "Maestro/StateKey.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>

namespace Maestro {

QLearningEngine::QLearningEngine(const QLearningConfig& config, unsigned int seed)
    : m_config(config), m_exploration_rate(config.exploration_rate), m_rng(seed) {
}

std::string QLearningEngine::selectAction(const nlohmann::json& state, const std::vector<std::string>& actions) {
    if (actions.empty()) {
        return "";
    }

    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    if (coin(m_rng) < m_exploration_rate) {
        std::uniform_int_distribution<size_t> pick(0, actions.size() - 1);
        return actions[pick(m_rng)];
    }
    return bestActionLocked(key, actions);
}

std::string QLearningEngine::bestAction(const nlohmann::json& state, const std::vector<std::string>& actions) const {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    return bestActionLocked(key, actions);
}

double QLearningEngine::update(const nlohmann::json& state, const std::string& action, double reward,
                               const nlohmann::json& next_state, bool terminal) {
    std::string key = stateToKey(state);
    std::string next_key = stateToKey(next_state);

    std::lock_guard<std::mutex> lock(m_mutex);
    return updateLocked(key, action, reward, next_key, terminal);
}

double QLearningEngine::update(const Experience& experience) {
    return update(experience.state, experience.action, experience.reward,
                  experience.next_state, experience.terminal);
}

double QLearningEngine::getQValue(const nlohmann::json& state, const std::string& action) const {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);

    auto state_it = m_table.find(key);
    if (state_it == m_table.end()) {
        return 0.0;
    }
    auto action_it = state_it->second.find(action);
    return (action_it != state_it->second.end()) ? action_it->second : 0.0;
}

void QLearningEngine::setQValue(const nlohmann::json& state, const std::string& action, double value) {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_table[key][action] = value;
}

double QLearningEngine::maxQValue(const nlohmann::json& state) const {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    return maxQLocked(key);
}

void QLearningEngine::storeExperience(const Experience& experience) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_replay_buffer.push_back(experience);
    while (m_replay_buffer.size() > m_config.replay_capacity) {
        m_replay_buffer.pop_front();
    }
}

size_t QLearningEngine::replay(size_t batch_size) {
    if (batch_size == 0) {
        batch_size = m_config.replay_batch_size;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_replay_buffer.empty()) {
        return 0;
    }

    std::uniform_int_distribution<size_t> pick(0, m_replay_buffer.size() - 1);
    size_t count = std::min(batch_size, m_replay_buffer.size());
    for (size_t i = 0; i < count; ++i) {
        const Experience& experience = m_replay_buffer[pick(m_rng)];
        updateLocked(stateToKey(experience.state), experience.action, experience.reward,
                     stateToKey(experience.next_state), experience.terminal);
    }

    Logger::getInstance().debug("QLearning", "Replayed " + std::to_string(count) + " experiences");
    return count;
}

double QLearningEngine::applyHumanFeedback(const nlohmann::json& state, const std::string& action,
                                           double feedback) {
    std::string key = stateToKey(state);
    std::lock_guard<std::mutex> lock(m_mutex);
    return updateLocked(key, action, feedback * m_config.feedback_scale, key, true);
}

void QLearningEngine::endEpisode() {
    std::lock_guard<std::mutex> lock(m_mutex);
    // Never raises epsilon: an engine configured below the floor stays there
    if (m_exploration_rate > m_config.min_exploration_rate) {
        m_exploration_rate = std::max(m_config.min_exploration_rate,
                                      m_exploration_rate * m_config.exploration_decay);
    }
}

double QLearningEngine::learnEpisode(const Experience& experience) {
    double value = update(experience);
    storeExperience(experience);

    size_t episodes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        episodes = ++m_episodes;
    }
    if (m_config.replay_batch_size > 0 && episodes % m_config.replay_batch_size == 0) {
        replay();
    }

    endEpisode();
    return value;
}

size_t QLearningEngine::getEpisodeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_episodes;
}

double QLearningEngine::getExplorationRate() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_exploration_rate;
}

size_t QLearningEngine::tableSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t entries = 0;
    for (const auto& [state, actions] : m_table) {
        entries += actions.size();
    }
    return entries;
}

size_t QLearningEngine::replayBufferSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_replay_buffer.size();
}

LearningSnapshot QLearningEngine::toSnapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    LearningSnapshot snapshot;
    snapshot.engine = "q_learning";
    snapshot.parameters["learning_rate"] = m_config.learning_rate;
    snapshot.parameters["discount_factor"] = m_config.discount_factor;
    snapshot.parameters["exploration_rate"] = m_exploration_rate;
    snapshot.parameters["exploration_decay"] = m_config.exploration_decay;
    snapshot.parameters["min_exploration_rate"] = m_config.min_exploration_rate;
    for (const auto& [state, actions] : m_table) {
        for (const auto& [action, value] : actions) {
            snapshot.table[state][action] = value;
        }
    }
    return snapshot;
}

void QLearningEngine::loadSnapshot(const LearningSnapshot& snapshot) {
    if (snapshot.engine != "q_learning") {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT,
                           "Snapshot engine '" + snapshot.engine + "' is not q_learning");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_table.clear();
    for (const auto& [state, actions] : snapshot.table) {
        for (const auto& [action, value] : actions) {
            m_table[state][action] = value;
        }
    }

    auto it = snapshot.parameters.find("exploration_rate");
    if (it != snapshot.parameters.end()) {
        m_exploration_rate = it->second;
    }
}

double QLearningEngine::updateLocked(const std::string& state_key, const std::string& action, double reward,
                                     const std::string& next_key, bool terminal) {
    double max_next = terminal ? 0.0 : maxQLocked(next_key);
    double& q = m_table[state_key][action];
    q += m_config.learning_rate * (reward + m_config.discount_factor * max_next - q);
    return q;
}

double QLearningEngine::maxQLocked(const std::string& state_key) const {
    auto state_it = m_table.find(state_key);
    if (state_it == m_table.end() || state_it->second.empty()) {
        return 0.0;
    }

    double best = state_it->second.begin()->second;
    for (const auto& [action, value] : state_it->second) {
        best = std::max(best, value);
    }
    return best;
}

std::string QLearningEngine::bestActionLocked(const std::string& state_key,
                                              const std::vector<std::string>& actions) const {
    if (actions.empty()) {
        return "";
    }

    auto state_it = m_table.find(state_key);
    std::string best = actions.front();
    double best_value = 0.0;
    bool first = true;
    for (const auto& action : actions) {
        double value = 0.0;
        if (state_it != m_table.end()) {
            auto action_it = state_it->second.find(action);
            if (action_it != state_it->second.end()) {
                value = action_it->second;
            }
        }
        if (first || value > best_value) {
            best = action;
            best_value = value;
            first = false;
        }
    }
    return best;
}

} // namespace Maestro
