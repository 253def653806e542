// =================================================================
// include/Maestro/Workers.hpp
// =================================================================
// Concrete worker agent flavors and the factory used by configuration.

#pragma once

#include "Maestro/Agent.hpp"
#include "Maestro/ReasoningBackend.hpp"
#include "Maestro/FallbackChain.hpp"
#include "Maestro/MemoryManager.hpp"
#include "Maestro/SemanticMemory.hpp"
#include "Maestro/ContextProtocol.hpp"
#include "Maestro/QLearningEngine.hpp"
#include "Maestro/SharedEnvironment.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Maestro {

/// Environment resource a worker holds while it calls the reasoning backend
inline constexpr const char* REASONING_RESOURCE = "reasoning_backend";

/**
 * @brief Shared services a worker may use, all optional
 */
struct WorkerToolkit {
    std::shared_ptr<ReasoningBackend> reasoning;  ///< Text generation
    std::shared_ptr<FallbackChain> fallback;      ///< Alternatives when reasoning fails
    std::shared_ptr<MemoryManager> memory;        ///< Records task outcomes
    std::shared_ptr<SemanticMemory> semantic;     ///< Similar earlier tasks
    std::shared_ptr<ContextProtocol> context;     ///< Prior facts and published results
    std::shared_ptr<QLearningEngine> learner;     ///< Chooses between reasoning and heuristics
    std::shared_ptr<SharedEnvironment> environment; ///< Rations reasoning calls through REASONING_RESOURCE
    size_t tool_call_budget = 10;                 ///< Maximum backend calls per task, lowered by a
                                                  ///< smaller TOOL_CALL_BUDGET_KEY in the task context
};

class ResearchAgent final : public Agent {
public:
    ResearchAgent(const std::string& id, WorkerToolkit toolkit = WorkerToolkit());

    std::string getId() const override { return m_id; }
    std::string getType() const override { return "research"; }
    std::vector<AgentCapability> getCapabilities() const override;
    Result processTask(const Task& task) override;

private:
    const std::string m_id;
    const WorkerToolkit m_toolkit;
};

class CodeAgent final : public Agent {
public:
    CodeAgent(const std::string& id, WorkerToolkit toolkit = WorkerToolkit());

    std::string getId() const override { return m_id; }
    std::string getType() const override { return "code"; }
    std::vector<AgentCapability> getCapabilities() const override;
    Result processTask(const Task& task) override;

private:
    const std::string m_id;
    const WorkerToolkit m_toolkit;
};

class TestAgent final : public Agent {
public:
    TestAgent(const std::string& id, WorkerToolkit toolkit = WorkerToolkit());

    std::string getId() const override { return m_id; }
    std::string getType() const override { return "test"; }
    std::vector<AgentCapability> getCapabilities() const override;
    Result processTask(const Task& task) override;

private:
    const std::string m_id;
    const WorkerToolkit m_toolkit;
};

/**
 * @brief Computes summary statistics over a "data" context value
 *        (comma separated numbers)
 */
class DataAnalysisAgent final : public Agent {
public:
    DataAnalysisAgent(const std::string& id, WorkerToolkit toolkit = WorkerToolkit());

    std::string getId() const override { return m_id; }
    std::string getType() const override { return "data_analysis"; }
    std::vector<AgentCapability> getCapabilities() const override;
    Result processTask(const Task& task) override;

private:
    const std::string m_id;
    const WorkerToolkit m_toolkit;
};

class GeneralAgent final : public Agent {
public:
    GeneralAgent(const std::string& id, WorkerToolkit toolkit = WorkerToolkit());

    std::string getId() const override { return m_id; }
    std::string getType() const override { return "general"; }
    std::vector<AgentCapability> getCapabilities() const override;
    Result processTask(const Task& task) override;

private:
    const std::string m_id;
    const WorkerToolkit m_toolkit;
};

/**
 * @brief Names accepted by makeAgent
 */
std::vector<std::string> knownAgentTypes();

/**
 * @brief Create a worker of the given flavor
 * @param type "research", "code", "test", "data_analysis" or "general"
 * @param id Agent identifier
 * @param toolkit Shared services
 * @throws MaestroError INVALID_ARGUMENT for unknown types
 */
std::shared_ptr<Agent> makeAgent(const std::string& type, const std::string& id,
                                 const WorkerToolkit& toolkit = WorkerToolkit());

} // namespace Maestro
