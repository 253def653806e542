// =================================================================
// include/Maestro/QLearningEngine.hpp
// =================================================================
// Tabular Q-learning with epsilon-greedy selection, experience replay
// and human feedback.

#pragma once

#include "Maestro/Types.hpp"
#include "Maestro/LearningStore.hpp"
#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <random>
#include <mutex>

namespace Maestro {

/**
 * @brief Q-learning hyperparameters
 */
struct QLearningConfig {
    double learning_rate = 0.1;                   ///< Alpha
    double discount_factor = 0.9;                 ///< Gamma
    double exploration_rate = 0.1;                ///< Initial epsilon
    double exploration_decay = 0.995;             ///< Epsilon multiplier per episode
    double min_exploration_rate = 0.01;           ///< Epsilon floor
    size_t replay_capacity = 1000;                ///< Replay buffer size
    size_t replay_batch_size = 32;                ///< Default replay batch
    double feedback_scale = 1.0;                  ///< Reward per unit of human feedback
};

/**
 * @brief Per state-action value table
 */
class QLearningEngine {
public:
    /**
     * @brief Constructor
     * @param config Hyperparameters
     * @param seed Seed for exploration and replay sampling
     */
    explicit QLearningEngine(const QLearningConfig& config = QLearningConfig(),
                             unsigned int seed = std::random_device{}());

    virtual ~QLearningEngine() = default;

    /**
     * @brief Epsilon-greedy action choice
     * @param state Current state
     * @param actions Available actions, greedy ties go to the earliest
     * @return Chosen action, empty if there are no actions
     */
    virtual std::string selectAction(const nlohmann::json& state, const std::vector<std::string>& actions);

    /**
     * @brief Greedy action choice without exploration
     */
    std::string bestAction(const nlohmann::json& state, const std::vector<std::string>& actions) const;

    /**
     * @brief Apply one Q update
     * @param state State the action was taken in
     * @param action Action taken
     * @param reward Observed reward
     * @param next_state Resulting state
     * @param terminal Whether the episode ended (future value taken as 0)
     * @return Updated Q(state, action)
     */
    virtual double update(const nlohmann::json& state, const std::string& action, double reward,
                          const nlohmann::json& next_state, bool terminal);

    double update(const Experience& experience);

    double getQValue(const nlohmann::json& state, const std::string& action) const;
    void setQValue(const nlohmann::json& state, const std::string& action, double value);

    /**
     * @brief Highest known value for a state, 0 when the state is unknown
     */
    double maxQValue(const nlohmann::json& state) const;

    /**
     * @brief Add a transition to the bounded replay buffer
     */
    void storeExperience(const Experience& experience);

    /**
     * @brief Re-train on a random batch from the replay buffer
     * @param batch_size Batch size, config default when zero
     * @return Number of updates applied
     */
    size_t replay(size_t batch_size = 0);

    /**
     * @brief Treat human feedback as a terminal reward
     * @param feedback Feedback value (positive = good)
     * @return Updated Q(state, action)
     */
    double applyHumanFeedback(const nlohmann::json& state, const std::string& action, double feedback);

    /**
     * @brief Decay epsilon toward its floor
     */
    void endEpisode();

    /**
     * @brief Learn from one finished episode
     *
     * Applies the update, keeps the transition for replay, replays one
     * batch every replay_batch_size episodes and then decays epsilon.
     * @return Updated Q(state, action)
     */
    double learnEpisode(const Experience& experience);

    size_t getEpisodeCount() const;

    double getExplorationRate() const;
    size_t tableSize() const;
    size_t replayBufferSize() const;

    LearningSnapshot toSnapshot() const;

    /**
     * @brief Replace the table and exploration state
     * @throws MaestroError INVALID_ARGUMENT when the snapshot belongs to another engine
     */
    void loadSnapshot(const LearningSnapshot& snapshot);

private:
    QLearningConfig m_config;
    double m_exploration_rate;
    std::unordered_map<std::string, std::unordered_map<std::string, double>> m_table;
    std::deque<Experience> m_replay_buffer;
    size_t m_episodes = 0;
    std::mt19937 m_rng;
    mutable std::mutex m_mutex;

    double updateLocked(const std::string& state_key, const std::string& action, double reward,
                        const std::string& next_key, bool terminal);
    double maxQLocked(const std::string& state_key) const;
    std::string bestActionLocked(const std::string& state_key, const std::vector<std::string>& actions) const;
};

} // namespace Maestro
