// =================================================================
// src/Maestro/ScalingStrategy.cpp
// =================================================================
// Implementation of complexity scoring and resource recommendations.

#include "Maestro/ScalingStrategy.hpp"
#include <algorithm>

namespace Maestro {

std::string taskComplexityToString(TaskComplexity complexity) {
    switch (complexity) {
        case TaskComplexity::SIMPLE: return "simple";
        case TaskComplexity::MODERATE: return "moderate";
        case TaskComplexity::COMPLEX: return "complex";
        case TaskComplexity::VERY_COMPLEX: return "very_complex";
        default: return "unknown";
    }
}

std::string decompositionMethodToString(DecompositionMethod method) {
    switch (method) {
        case DecompositionMethod::NONE: return "none";
        case DecompositionMethod::REQUIREMENT_BASED: return "requirement_based";
        case DecompositionMethod::HIERARCHICAL: return "hierarchical";
        case DecompositionMethod::DIVIDE_AND_CONQUER: return "divide_and_conquer";
        default: return "unknown";
    }
}

ScalingStrategy::ScalingStrategy(const ScalingConfig& config)
    : m_config(config) {
}

ComplexityAssessment ScalingStrategy::assessComplexity(const Task& task) const {
    ComplexityAssessment assessment;
    double score = 0.0;

    score += task.requirements.size() * m_config.requirement_weight;

    if (task.description.length() > m_config.very_long_description) {
        score += m_config.very_long_description_bonus;
    } else if (task.description.length() > m_config.long_description) {
        score += m_config.long_description_bonus;
    }

    score += task.child_task_ids.size() * m_config.subtask_weight;

    if (task.priority >= m_config.high_priority_threshold) {
        score += m_config.high_priority_bonus;
    }

    score += task.context.size() * m_config.context_weight;

    assessment.score = score;
    if (score <= m_config.simple_max) {
        assessment.complexity = TaskComplexity::SIMPLE;
    } else if (score <= m_config.moderate_max) {
        assessment.complexity = TaskComplexity::MODERATE;
    } else if (score <= m_config.complex_max) {
        assessment.complexity = TaskComplexity::COMPLEX;
    } else {
        assessment.complexity = TaskComplexity::VERY_COMPLEX;
    }
    return assessment;
}

AgentAllocation ScalingStrategy::getAgentAllocation(const Task& task, size_t available_agents) const {
    AgentAllocation allocation;
    allocation.complexity = assessComplexity(task).complexity;

    switch (allocation.complexity) {
        case TaskComplexity::SIMPLE:
            allocation.agent_count = 1;
            allocation.tool_calls_per_agent = 5;
            break;
        case TaskComplexity::MODERATE:
            allocation.agent_count = 4;
            allocation.tool_calls_per_agent = 10;
            break;
        case TaskComplexity::COMPLEX:
            allocation.agent_count = 8;
            allocation.tool_calls_per_agent = 15;
            break;
        case TaskComplexity::VERY_COMPLEX:
            allocation.agent_count = 15;
            allocation.tool_calls_per_agent = 20;
            break;
    }

    size_t requirement_cap = std::max<size_t>(1, task.requirements.size());
    allocation.agent_count = std::min({allocation.agent_count, available_agents, requirement_cap});
    return allocation;
}

DecompositionPlan ScalingStrategy::getDecompositionStrategy(const Task& task) const {
    DecompositionPlan plan;
    size_t requirements = task.requirements.size();

    switch (assessComplexity(task).complexity) {
        case TaskComplexity::SIMPLE:
            plan.should_decompose = false;
            plan.method = DecompositionMethod::NONE;
            plan.target_subtasks = 1;
            break;
        case TaskComplexity::MODERATE:
            plan.should_decompose = true;
            plan.method = DecompositionMethod::REQUIREMENT_BASED;
            plan.target_subtasks = std::min<size_t>(4, std::max<size_t>(2, requirements));
            break;
        case TaskComplexity::COMPLEX:
            plan.should_decompose = true;
            plan.method = DecompositionMethod::HIERARCHICAL;
            plan.target_subtasks = std::min<size_t>(8, std::max<size_t>(3, requirements));
            break;
        case TaskComplexity::VERY_COMPLEX:
            plan.should_decompose = true;
            plan.method = DecompositionMethod::DIVIDE_AND_CONQUER;
            plan.target_subtasks = std::min<size_t>(15, std::max<size_t>(5, requirements));
            break;
    }
    return plan;
}

} // namespace Maestro
