// =================================================================
// include/Maestro/Agent.hpp
// =================================================================
// The single contract every worker agent implements.

#pragma once

#include "Maestro/Types.hpp"
#include <string>
#include <vector>

namespace Maestro {

/// Task context key carrying the tool-call budget the orchestrator granted
inline constexpr const char* TOOL_CALL_BUDGET_KEY = "tool_call_budget";

/**
 * @brief Worker agent contract
 *
 * Implementations must tolerate concurrent calls for different tasks;
 * the bus endpoint in front of each agent keeps at most one in flight.
 */
class Agent {
public:
    virtual ~Agent() = default;

    /**
     * @brief Get the agent identifier
     */
    virtual std::string getId() const = 0;

    /**
     * @brief Get the agent flavor ("research", "code", ...)
     */
    virtual std::string getType() const = 0;

    /**
     * @brief Get the declared capability set
     */
    virtual std::vector<AgentCapability> getCapabilities() const = 0;

    /**
     * @brief Execute one task
     * @param task Task to execute
     * @return Result for the task, success=false on failure
     */
    virtual Result processTask(const Task& task) = 0;
};

} // namespace Maestro
