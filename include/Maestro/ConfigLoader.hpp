// =================================================================
// include/Maestro/ConfigLoader.hpp
// =================================================================
// Parses maestro.yml into the configuration of every component.

#pragma once

#include "Maestro/MessageBus.hpp"
#include "Maestro/MemoryManager.hpp"
#include "Maestro/SemanticMemory.hpp"
#include "Maestro/ContextProtocol.hpp"
#include "Maestro/QLearningEngine.hpp"
#include "Maestro/Orchestrator.hpp"
#include "Maestro/ReasoningBackend.hpp"
#include "Maestro/SharedEnvironment.hpp"
#include "Maestro/QualityVerifier.hpp"
#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace Maestro {

/**
 * @brief Logger settings
 */
struct LoggingSettings {
    std::string directory = ".maestro/logs";
    std::string console_level = "info";
    std::string file_level = "debug";
    bool console = true;
    bool file = true;
    size_t max_file_size_mb = 10;
    size_t max_files = 5;
};

/**
 * @brief Fallback chain placed in front of the reasoning backend
 */
struct FallbackSettings {
    std::string strategy = "sequential";          ///< sequential, parallel, weighted or adaptive
    std::vector<std::string> models;              ///< Alternative models on the same server
};

/**
 * @brief Learning settings
 */
struct LearningSettings {
    bool enabled = true;
    QLearningConfig q_learning;
};

/**
 * @brief Reasoning backend settings
 */
struct ReasoningSettings {
    bool enabled = false;                         ///< Off unless a server is configured
    OllamaConfig ollama;
};

/**
 * @brief One configured worker
 */
struct WorkerSettings {
    std::string type;                             ///< Flavor accepted by makeAgent
    std::string id;                               ///< Agent id, generated when empty
    size_t tool_call_budget = 10;
};

/**
 * @brief Persistence settings
 */
struct PersistenceSettings {
    std::string task_store = "memory";            ///< memory, jsonl or none
    std::string task_store_path = ".maestro/tasks.jsonl";
    std::string learning_directory = ".maestro/learning";
};

/**
 * @brief Result verification settings
 */
struct VerificationSettings {
    bool enabled = true;
    QualityVerifierConfig quality;
};

/**
 * @brief Complete system configuration
 */
struct SystemConfig {
    LoggingSettings logging;
    MessageBusConfig message_bus;
    FallbackSettings fallback;
    MemoryConfig memory;
    SemanticMemoryConfig semantic_memory;
    ContextProtocolConfig context;
    LearningSettings learning;
    OrchestratorConfig orchestrator;
    ReasoningSettings reasoning;
    SharedEnvironmentConfig environment;
    VerificationSettings verification;
    std::vector<WorkerSettings> workers;
    PersistenceSettings persistence;
};

/**
 * @brief Reads SystemConfig from YAML
 *
 * Missing keys keep their defaults. When no workers section is given, one
 * worker of every flavor is configured.
 */
class ConfigLoader {
public:
    /**
     * @brief Load configuration from a file
     * @param path YAML file path
     * @return Parsed configuration, defaults when the file does not exist
     * @throws MaestroError INVALID_ARGUMENT for malformed YAML
     */
    static SystemConfig loadFromFile(const std::string& path);

    /**
     * @brief Load configuration from YAML text
     * @throws MaestroError INVALID_ARGUMENT for malformed YAML
     */
    static SystemConfig loadFromString(const std::string& yaml);

    /**
     * @brief Configuration with default workers and no file
     */
    static SystemConfig defaults();

    /**
     * @brief Check a configuration for values the components cannot use
     * @return Problem descriptions, empty when valid
     */
    static std::vector<std::string> validate(const SystemConfig& config);

private:
    static SystemConfig parse(const YAML::Node& root);
};

} // namespace Maestro
