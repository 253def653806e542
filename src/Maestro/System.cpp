// =================================================================
// src/Maestro/System.cpp
// =================================================================
// Wiring of the orchestration components from configuration.

#include "Maestro/System.hpp"
#include "Maestro/LearningStore.hpp"
#include "Maestro/Workers.hpp"
#include "Maestro/Logger.hpp"

using json = nlohmann::json;

namespace Maestro {

namespace {

const char* REASONING_CHAIN = "reasoning";
const char* WORKER_LEARNING = "workers";
const char* ORCHESTRATOR_LEARNING = "orchestrator";

FallbackHandler backendHandler(std::shared_ptr<ReasoningBackend> backend) {
    return [backend](const json& args) -> json {
        ReasoningReply reply = backend->generate(args.at("prompt").get<std::string>(),
                                                 args.value("system_prompt", ""));
        if (!reply.ok) {
            throw MaestroError(ErrorKind::UNAVAILABLE, backend->getName() + " returned no text");
        }
        return reply.text;
    };
}

} // anonymous namespace

System::System(const SystemConfig& config, std::shared_ptr<ReasoningBackend> reasoning)
    : m_config(config) {
    m_bus = std::make_unique<MessageBus>(m_config.message_bus);
    m_load_balancer = std::make_unique<LoadBalancer>();

    m_memory = std::make_shared<MemoryManager>(m_config.memory);
    m_semantic = std::make_shared<SemanticMemory>(m_config.semantic_memory);
    m_context = std::make_shared<ContextProtocol>(m_config.context);
    m_context->startCleanupThread();

    m_environment = std::make_shared<SharedEnvironment>(m_config.environment);

    setupReasoning(std::move(reasoning));
    setupLearning();
    setupStore();

    m_orchestrator = std::make_unique<Orchestrator>(*m_bus, *m_load_balancer, m_config.orchestrator);
    m_orchestrator->setTaskStore(m_store);
    m_orchestrator->setLearningEngine(m_orchestrator_learner);
    if (m_config.verification.enabled) {
        m_verifier = std::make_shared<QualityVerifier>(m_config.verification.quality);
        m_orchestrator->setQualityVerifier(m_verifier);
    }

    setupWorkers();

    Logger::getInstance().info("System", "System assembled",
                              "Workers: " + std::to_string(m_orchestrator->getWorkerCount()));
}

System::~System() {
    if (m_orchestrator) {
        m_orchestrator->shutdown();
    }
    if (m_context) {
        m_context->stopCleanupThread();
    }
}

void System::setupReasoning(std::shared_ptr<ReasoningBackend> reasoning) {
    if (reasoning) {
        m_reasoning = std::move(reasoning);
    } else if (m_config.reasoning.enabled) {
        m_reasoning = std::make_shared<OllamaReasoningBackend>(m_config.reasoning.ollama);
    }

    if (!m_reasoning) {
        return;
    }

    m_environment->createResource(REASONING_RESOURCE, "tool", ResourceAccess::SHARED, "system",
                                  m_config.environment.reasoning_slots);

    auto chain = m_fallbacks.registerChain(REASONING_CHAIN, fallbackStrategyFromString(m_config.fallback.strategy));
    const auto& models = m_config.fallback.models;
    for (size_t i = 0; i < models.size(); ++i) {
        OllamaConfig alternative = m_config.reasoning.ollama;
        alternative.model_name = models[i];
        chain->addFallback(models[i], backendHandler(std::make_shared<OllamaReasoningBackend>(alternative)),
                           static_cast<int>(models.size() - i));
    }
}

void System::setupLearning() {
    if (!m_config.learning.enabled) {
        return;
    }

    m_worker_learner = std::make_shared<QLearningEngine>(m_config.learning.q_learning);
    m_orchestrator_learner = std::make_shared<QLearningEngine>(m_config.learning.q_learning);

    if (m_config.persistence.learning_directory.empty()) {
        return;
    }

    JsonLearningStore store(m_config.persistence.learning_directory);
    const std::pair<const char*, std::shared_ptr<QLearningEngine>> engines[] = {
        {WORKER_LEARNING, m_worker_learner},
        {ORCHESTRATOR_LEARNING, m_orchestrator_learner}
    };
    for (const auto& [name, engine] : engines) {
        try {
            if (auto snapshot = store.load(name)) {
                engine->loadSnapshot(*snapshot);
                Logger::getInstance().info("System", std::string("Restored learning table: ") + name,
                                          "States: " + std::to_string(engine->tableSize()));
            }
        } catch (const MaestroError& e) {
            Logger::getInstance().warning("System", std::string("Starting with an empty learning table: ") + name,
                                         e.what());
        }
    }
}

void System::setupStore() {
    const std::string& kind = m_config.persistence.task_store;
    if (kind == "memory") {
        m_store = std::make_shared<InMemoryTaskStore>();
    } else if (kind == "jsonl") {
        m_store = std::make_shared<JsonlTaskStore>(m_config.persistence.task_store_path);
    } else if (kind != "none") {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Unknown task store: " + kind);
    }
}

void System::setupWorkers() {
    std::shared_ptr<FallbackChain> chain = m_fallbacks.hasChain(REASONING_CHAIN)
        ? m_fallbacks.getChain(REASONING_CHAIN) : nullptr;

    for (const auto& settings : m_config.workers) {
        WorkerToolkit toolkit;
        toolkit.reasoning = m_reasoning;
        toolkit.fallback = chain;
        toolkit.memory = m_memory;
        toolkit.semantic = m_semantic;
        toolkit.context = m_context;
        toolkit.learner = m_worker_learner;
        toolkit.environment = m_environment;
        toolkit.tool_call_budget = settings.tool_call_budget;

        std::string id = settings.id.empty() ? generateId(settings.type) : settings.id;
        if (!m_orchestrator->registerWorker(makeAgent(settings.type, id, toolkit))) {
            Logger::getInstance().warning("System", "Worker not registered", id);
            continue;
        }
        m_environment->registerAgent(id);
    }
}

void System::saveLearning() {
    if (m_config.persistence.learning_directory.empty()) {
        return;
    }

    JsonLearningStore store(m_config.persistence.learning_directory);
    if (m_worker_learner) {
        store.save(WORKER_LEARNING, m_worker_learner->toSnapshot());
    }
    if (m_orchestrator_learner) {
        store.save(ORCHESTRATOR_LEARNING, m_orchestrator_learner->toSnapshot());
    }
}

} // namespace Maestro
