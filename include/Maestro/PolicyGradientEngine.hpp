// =================================================================
// include/Maestro/PolicyGradientEngine.hpp
// =================================================================
// Per-state action distributions updated from episode returns against a
// per-state value baseline.

#pragma once

#include "Maestro/LearningStore.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <random>
#include <mutex>

namespace Maestro {

/**
 * @brief Policy gradient hyperparameters
 */
struct PolicyGradientConfig {
    double learning_rate = 0.1;                   ///< Step size for probability nudges
    double discount_factor = 0.9;                 ///< Return discount
    double baseline_learning_rate = 0.1;          ///< Step size for baseline updates
    double min_probability = 0.01;                ///< Floor before renormalizing
};

/**
 * @brief Tabular policy gradient learner
 */
class PolicyGradientEngine {
public:
    explicit PolicyGradientEngine(const PolicyGradientConfig& config = PolicyGradientConfig(),
                                  unsigned int seed = std::random_device{}());

    virtual ~PolicyGradientEngine() = default;

    /**
     * @brief Sample an action from the state's distribution
     *
     * Unknown states start uniform over the given actions; actions new to a
     * known state are added and the distribution renormalized.
     *
     * @return Sampled action, empty if there are no actions
     */
    virtual std::string selectAction(const nlohmann::json& state, const std::vector<std::string>& actions);

    /**
     * @brief Record one step of the current episode
     */
    void recordStep(const nlohmann::json& state, const std::string& action, double reward);

    /**
     * @brief Apply discounted-return updates for the recorded episode
     * @return Number of steps consumed
     */
    virtual size_t endEpisode();

    /**
     * @brief Nudge an action directly by a human preference
     * @param preference Positive to favor the action, negative to avoid it
     */
    void applyHumanFeedback(const nlohmann::json& state, const std::string& action, double preference);

    /**
     * @brief Current distribution of a state, empty when unknown
     */
    std::map<std::string, double> getActionProbabilities(const nlohmann::json& state) const;

    /**
     * @brief Value baseline of a state, 0 when unknown
     */
    double getBaseline(const nlohmann::json& state) const;

    size_t episodeLength() const;

    LearningSnapshot toSnapshot() const;

    /**
     * @brief Replace distributions and baselines
     * @throws MaestroError INVALID_ARGUMENT when the snapshot belongs to another engine
     */
    void loadSnapshot(const LearningSnapshot& snapshot);

private:
    struct Step {
        std::string state_key;
        std::string action;
        double reward;
    };

    PolicyGradientConfig m_config;
    std::unordered_map<std::string, std::map<std::string, double>> m_policies;
    std::unordered_map<std::string, double> m_baselines;
    std::vector<Step> m_episode;
    std::mt19937 m_rng;
    mutable std::mutex m_mutex;

    void ensureActionsLocked(const std::string& state_key, const std::vector<std::string>& actions);
    void nudgeLocked(const std::string& state_key, const std::string& action, double signal);
    void normalizeLocked(std::map<std::string, double>& distribution) const;
};

} // namespace Maestro
