// =================================================================
// include/Maestro/System.hpp
// =================================================================
// Assembles bus, load balancer, shared memories, learning engines,
// reasoning backend, environment, workers and orchestrator from a SystemConfig.

#pragma once

#include "Maestro/ConfigLoader.hpp"
#include "Maestro/MessageBus.hpp"
#include "Maestro/LoadBalancer.hpp"
#include "Maestro/FallbackChain.hpp"
#include "Maestro/MemoryManager.hpp"
#include "Maestro/SemanticMemory.hpp"
#include "Maestro/ContextProtocol.hpp"
#include "Maestro/QLearningEngine.hpp"
#include "Maestro/ReasoningBackend.hpp"
#include "Maestro/TaskStore.hpp"
#include "Maestro/SharedEnvironment.hpp"
#include "Maestro/QualityVerifier.hpp"
#include "Maestro/Orchestrator.hpp"
#include <memory>
#include <string>

namespace Maestro {

/**
 * @brief Owns one fully wired orchestration system
 *
 * Members are declared so that the orchestrator (and its worker
 * endpoints) is torn down before the bus it uses.
 */
class System {
public:
    /**
     * @brief Build every component described by the configuration
     * @param config System configuration
     * @param reasoning Reasoning backend override, replaces the configured one when set
     * @throws MaestroError INVALID_ARGUMENT for unknown worker types or strategies
     */
    explicit System(const SystemConfig& config, std::shared_ptr<ReasoningBackend> reasoning = nullptr);

    ~System();

    System(const System&) = delete;
    System& operator=(const System&) = delete;

    Orchestrator& getOrchestrator() { return *m_orchestrator; }
    MessageBus& getMessageBus() { return *m_bus; }
    LoadBalancer& getLoadBalancer() { return *m_load_balancer; }
    FallbackRegistry& getFallbackRegistry() { return m_fallbacks; }

    std::shared_ptr<MemoryManager> getMemory() const { return m_memory; }
    std::shared_ptr<SemanticMemory> getSemanticMemory() const { return m_semantic; }
    std::shared_ptr<ContextProtocol> getContext() const { return m_context; }
    std::shared_ptr<QLearningEngine> getWorkerLearner() const { return m_worker_learner; }
    std::shared_ptr<QLearningEngine> getOrchestratorLearner() const { return m_orchestrator_learner; }
    std::shared_ptr<TaskStore> getTaskStore() const { return m_store; }
    std::shared_ptr<SharedEnvironment> getEnvironment() const { return m_environment; }
    std::shared_ptr<QualityVerifier> getQualityVerifier() const { return m_verifier; }

    const SystemConfig& getConfig() const { return m_config; }

    /**
     * @brief Write both learning tables to the configured directory
     * @throws MaestroError UNAVAILABLE when the files cannot be written
     */
    void saveLearning();

private:
    SystemConfig m_config;

    std::unique_ptr<MessageBus> m_bus;
    std::unique_ptr<LoadBalancer> m_load_balancer;
    FallbackRegistry m_fallbacks;

    std::shared_ptr<MemoryManager> m_memory;
    std::shared_ptr<SemanticMemory> m_semantic;
    std::shared_ptr<ContextProtocol> m_context;
    std::shared_ptr<QLearningEngine> m_worker_learner;
    std::shared_ptr<QLearningEngine> m_orchestrator_learner;
    std::shared_ptr<ReasoningBackend> m_reasoning;
    std::shared_ptr<TaskStore> m_store;
    std::shared_ptr<SharedEnvironment> m_environment;
    std::shared_ptr<QualityVerifier> m_verifier;

    std::unique_ptr<Orchestrator> m_orchestrator;

    void setupReasoning(std::shared_ptr<ReasoningBackend> reasoning);
    void setupLearning();
    void setupStore();
    void setupWorkers();
};

} // namespace Maestro
