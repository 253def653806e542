// =================================================================
// include/Maestro/ScalingStrategy.hpp
// =================================================================
// Task complexity assessment and the agent / tool-call budgets and
// decomposition plans derived from it.

#pragma once

#include "Maestro/Types.hpp"
#include <string>

namespace Maestro {

/**
 * @brief Complexity buckets
 */
enum class TaskComplexity {
    SIMPLE,         ///< Score <= 2
    MODERATE,       ///< Score <= 6
    COMPLEX,        ///< Score <= 12
    VERY_COMPLEX    ///< Score > 12
};

std::string taskComplexityToString(TaskComplexity complexity);

/**
 * @brief Decomposition methods
 */
enum class DecompositionMethod {
    NONE,
    REQUIREMENT_BASED,
    HIERARCHICAL,
    DIVIDE_AND_CONQUER
};

std::string decompositionMethodToString(DecompositionMethod method);

/**
 * @brief Complexity assessment of one task
 */
struct ComplexityAssessment {
    double score = 0.0;                           ///< Raw weighted score
    TaskComplexity complexity = TaskComplexity::SIMPLE;
};

/**
 * @brief Recommended resources for one task
 */
struct AgentAllocation {
    size_t agent_count = 1;                       ///< Agents to involve
    size_t tool_calls_per_agent = 5;              ///< Tool-call budget per agent
    TaskComplexity complexity = TaskComplexity::SIMPLE;
};

/**
 * @brief Recommended decomposition
 */
struct DecompositionPlan {
    bool should_decompose = false;
    DecompositionMethod method = DecompositionMethod::NONE;
    size_t target_subtasks = 1;
};

/**
 * @brief Score weights and thresholds
 */
struct ScalingConfig {
    double requirement_weight = 2.0;              ///< Per requirement
    size_t long_description = 200;                ///< Characters for the first length tier
    size_t very_long_description = 500;           ///< Characters for the second length tier
    double long_description_bonus = 1.5;
    double very_long_description_bonus = 3.0;
    double subtask_weight = 1.5;                  ///< Per existing child task
    int high_priority_threshold = 8;
    double high_priority_bonus = 1.0;
    double context_weight = 0.5;                  ///< Per context entry
    double simple_max = 2.0;
    double moderate_max = 6.0;
    double complex_max = 12.0;
};

/**
 * @brief Maps task shape to complexity, budgets and decomposition plans
 */
class ScalingStrategy {
public:
    explicit ScalingStrategy(const ScalingConfig& config = ScalingConfig());

    /**
     * @brief Score and bucket a task
     * @param task Task to assess
     * @return Raw score and complexity bucket
     */
    ComplexityAssessment assessComplexity(const Task& task) const;

    /**
     * @brief Recommend agent count and tool-call budget
     * @param task Task to plan for
     * @param available_agents Number of agents that could take part
     * @return Allocation never exceeding available_agents or max(1, requirements)
     */
    AgentAllocation getAgentAllocation(const Task& task, size_t available_agents) const;

    /**
     * @brief Recommend whether and how to split a task
     */
    DecompositionPlan getDecompositionStrategy(const Task& task) const;

    const ScalingConfig& getConfig() const { return m_config; }

private:
    ScalingConfig m_config;
};

} // namespace Maestro
