// =================================================================
// src/Maestro/ConfigLoader.cpp
// =================================================================
// YAML configuration parsing and validation.

#include "Maestro/ConfigLoader.hpp"
#include "Maestro/FallbackChain.hpp"
#include "Maestro/Workers.hpp"
#include "Maestro/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>

namespace Maestro {

namespace {

template <typename T>
void readValue(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

template <typename Duration>
void readDuration(const YAML::Node& node, const char* key, Duration& target) {
    if (node[key]) {
        target = Duration(node[key].as<long>());
    }
}

bool inUnitRange(double value) {
    return value >= 0.0 && value <= 1.0;
}

std::string defaultWorkerId(const std::string& type, size_t index) {
    return type + "-" + std::to_string(index + 1);
}

} // anonymous namespace

SystemConfig ConfigLoader::defaults() {
    SystemConfig config;
    for (const auto& type : knownAgentTypes()) {
        WorkerSettings worker;
        worker.type = type;
        worker.id = defaultWorkerId(type, 0);
        config.workers.push_back(worker);
    }
    return config;
}

SystemConfig ConfigLoader::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::getInstance().warning("ConfigLoader", "Configuration file not found, using defaults", path);
        return defaults();
    }

    try {
        YAML::Node root = YAML::LoadFile(path);
        SystemConfig config = parse(root);
        Logger::getInstance().info("ConfigLoader", "Loaded configuration", path);
        return config;
    } catch (const YAML::Exception& e) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Failed to parse configuration file " + path + ": " + e.what());
    }
}

SystemConfig ConfigLoader::loadFromString(const std::string& yaml) {
    try {
        return parse(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, std::string("Failed to parse configuration: ") + e.what());
    }
}

SystemConfig ConfigLoader::parse(const YAML::Node& root) {
    SystemConfig config = defaults();
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Configuration root must be a mapping");
    }

    if (YAML::Node logging = root["logging"]) {
        readValue(logging, "directory", config.logging.directory);
        readValue(logging, "console_level", config.logging.console_level);
        readValue(logging, "file_level", config.logging.file_level);
        readValue(logging, "console", config.logging.console);
        readValue(logging, "file", config.logging.file);
        readValue(logging, "max_file_size_mb", config.logging.max_file_size_mb);
        readValue(logging, "max_files", config.logging.max_files);
    }

    if (YAML::Node bus = root["message_bus"]) {
        readValue(bus, "queue_capacity", config.message_bus.queue_capacity);
        readValue(bus, "history_size", config.message_bus.history_size);
        readDuration(bus, "response_timeout_ms", config.message_bus.default_response_timeout);
    }

    if (YAML::Node fallback = root["fallback"]) {
        readValue(fallback, "strategy", config.fallback.strategy);
        if (fallback["models"]) {
            config.fallback.models.clear();
            for (const auto& model : fallback["models"]) {
                config.fallback.models.push_back(model.as<std::string>());
            }
        }
    }

    if (YAML::Node memory = root["memory"]) {
        readValue(memory, "short_term_capacity", config.memory.short_term_capacity);
        readValue(memory, "consolidation_threshold", config.memory.consolidation_threshold);
    }

    if (YAML::Node semantic = root["semantic_memory"]) {
        readValue(semantic, "capacity", config.semantic_memory.capacity);
        readValue(semantic, "minimum_similarity", config.semantic_memory.minimum_similarity);
        readValue(semantic, "embedding_dimension", config.semantic_memory.embedding_dimension);
    }

    if (YAML::Node context = root["context"]) {
        readDuration(context, "default_ttl_ms", config.context.default_ttl);
        readDuration(context, "cleanup_interval_s", config.context.cleanup_interval);
        readDuration(context, "recency_window_h", config.context.recency_window);
        readValue(context, "keyword_weight", config.context.keyword_weight);
        readValue(context, "recency_weight", config.context.recency_weight);
        readValue(context, "importance_weight", config.context.importance_weight);
    }

    if (YAML::Node learning = root["learning"]) {
        readValue(learning, "enabled", config.learning.enabled);
        QLearningConfig& q = config.learning.q_learning;
        readValue(learning, "learning_rate", q.learning_rate);
        readValue(learning, "discount_factor", q.discount_factor);
        readValue(learning, "exploration_rate", q.exploration_rate);
        readValue(learning, "exploration_decay", q.exploration_decay);
        readValue(learning, "min_exploration_rate", q.min_exploration_rate);
        readValue(learning, "replay_capacity", q.replay_capacity);
        readValue(learning, "replay_batch_size", q.replay_batch_size);
        readValue(learning, "feedback_scale", q.feedback_scale);
    }

    if (YAML::Node orchestrator = root["orchestrator"]) {
        readValue(orchestrator, "id", config.orchestrator.orchestrator_id);
        readDuration(orchestrator, "subtask_timeout_ms", config.orchestrator.subtask_timeout);
        readValue(orchestrator, "max_tasks_per_worker", config.orchestrator.max_tasks_per_worker);
        readValue(orchestrator, "decomposition_threshold", config.orchestrator.decomposition_threshold);
        readValue(orchestrator, "complexity_normalizer", config.orchestrator.complexity_normalizer);
        readValue(orchestrator, "enable_learning", config.orchestrator.enable_learning);
        readValue(orchestrator, "stage_history_limit", config.orchestrator.stage_history_limit);
        readValue(orchestrator, "quality_window", config.orchestrator.quality_window);
    }

    if (YAML::Node reasoning = root["reasoning"]) {
        readValue(reasoning, "enabled", config.reasoning.enabled);
        readValue(reasoning, "server_url", config.reasoning.ollama.server_url);
        readValue(reasoning, "model", config.reasoning.ollama.model_name);
        readDuration(reasoning, "connection_timeout_s", config.reasoning.ollama.connection_timeout);
        readDuration(reasoning, "read_timeout_s", config.reasoning.ollama.read_timeout);
    }

    if (YAML::Node environment = root["environment"]) {
        readValue(environment, "name", config.environment.name);
        readValue(environment, "max_events", config.environment.max_events);
        readDuration(environment, "resource_wait_ms", config.environment.default_wait);
        readValue(environment, "reasoning_slots", config.environment.reasoning_slots);
    }

    if (YAML::Node verification = root["verification"]) {
        readValue(verification, "enabled", config.verification.enabled);
        readValue(verification, "pass_threshold", config.verification.quality.pass_threshold);
    }

    if (YAML::Node workers = root["workers"]) {
        if (!workers.IsSequence()) {
            throw MaestroError(ErrorKind::INVALID_ARGUMENT, "'workers' must be a list");
        }
        config.workers.clear();
        for (size_t i = 0; i < workers.size(); ++i) {
            const YAML::Node& node = workers[i];
            WorkerSettings worker;
            readValue(node, "type", worker.type);
            readValue(node, "id", worker.id);
            readValue(node, "tool_call_budget", worker.tool_call_budget);
            if (worker.id.empty()) {
                worker.id = defaultWorkerId(worker.type, i);
            }
            config.workers.push_back(worker);
        }
    }

    if (YAML::Node persistence = root["persistence"]) {
        readValue(persistence, "task_store", config.persistence.task_store);
        readValue(persistence, "task_store_path", config.persistence.task_store_path);
        readValue(persistence, "learning_directory", config.persistence.learning_directory);
    }

    return config;
}

std::vector<std::string> ConfigLoader::validate(const SystemConfig& config) {
    std::vector<std::string> problems;

    const std::set<std::string> levels = {"debug", "info", "warn", "warning", "error", "crit", "critical"};
    auto checkLevel = [&](const std::string& name, const std::string& field) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (levels.count(lower) == 0) {
            problems.push_back(field + ": unknown log level '" + name + "'");
        }
    };
    checkLevel(config.logging.console_level, "logging.console_level");
    checkLevel(config.logging.file_level, "logging.file_level");
    if (config.logging.max_files == 0) {
        problems.push_back("logging.max_files must be positive");
    }

    if (config.message_bus.queue_capacity == 0) {
        problems.push_back("message_bus.queue_capacity must be positive");
    }
    if (config.message_bus.default_response_timeout.count() <= 0) {
        problems.push_back("message_bus.response_timeout_ms must be positive");
    }

    try {
        fallbackStrategyFromString(config.fallback.strategy);
    } catch (const MaestroError& e) {
        problems.push_back("fallback.strategy: " + std::string(e.what()));
    }

    if (config.memory.short_term_capacity == 0) {
        problems.push_back("memory.short_term_capacity must be positive");
    }
    if (!inUnitRange(config.memory.consolidation_threshold)) {
        problems.push_back("memory.consolidation_threshold must be within [0, 1]");
    }

    if (config.semantic_memory.capacity == 0) {
        problems.push_back("semantic_memory.capacity must be positive");
    }
    if (config.semantic_memory.embedding_dimension == 0) {
        problems.push_back("semantic_memory.embedding_dimension must be positive");
    }
    if (config.semantic_memory.minimum_similarity < -1.0 || config.semantic_memory.minimum_similarity > 1.0) {
        problems.push_back("semantic_memory.minimum_similarity must be within [-1, 1]");
    }

    if (config.context.default_ttl.count() < 0) {
        problems.push_back("context.default_ttl_ms must not be negative");
    }
    if (config.context.cleanup_interval.count() <= 0) {
        problems.push_back("context.cleanup_interval_s must be positive");
    }

    const QLearningConfig& q = config.learning.q_learning;
    if (!inUnitRange(q.learning_rate)) problems.push_back("learning.learning_rate must be within [0, 1]");
    if (!inUnitRange(q.discount_factor)) problems.push_back("learning.discount_factor must be within [0, 1]");
    if (!inUnitRange(q.exploration_rate)) problems.push_back("learning.exploration_rate must be within [0, 1]");
    if (!inUnitRange(q.min_exploration_rate)) problems.push_back("learning.min_exploration_rate must be within [0, 1]");
    if (q.exploration_decay <= 0.0 || q.exploration_decay > 1.0) {
        problems.push_back("learning.exploration_decay must be within (0, 1]");
    }

    if (config.orchestrator.orchestrator_id.empty()) {
        problems.push_back("orchestrator.id must not be empty");
    }
    if (config.orchestrator.subtask_timeout.count() <= 0) {
        problems.push_back("orchestrator.subtask_timeout_ms must be positive");
    }
    if (config.orchestrator.max_tasks_per_worker == 0) {
        problems.push_back("orchestrator.max_tasks_per_worker must be positive");
    }
    if (!inUnitRange(config.orchestrator.decomposition_threshold)) {
        problems.push_back("orchestrator.decomposition_threshold must be within [0, 1]");
    }
    if (config.orchestrator.complexity_normalizer <= 0.0) {
        problems.push_back("orchestrator.complexity_normalizer must be positive");
    }
    if (config.orchestrator.stage_history_limit == 0) {
        problems.push_back("orchestrator.stage_history_limit must be positive");
    }
    if (config.orchestrator.quality_window == 0) {
        problems.push_back("orchestrator.quality_window must be positive");
    }

    if (config.environment.reasoning_slots == 0) {
        problems.push_back("environment.reasoning_slots must be positive");
    }
    if (config.environment.default_wait.count() <= 0) {
        problems.push_back("environment.resource_wait_ms must be positive");
    }
    if (!inUnitRange(config.verification.quality.pass_threshold)) {
        problems.push_back("verification.pass_threshold must be within [0, 1]");
    }

    if (config.reasoning.enabled && config.reasoning.ollama.server_url.empty()) {
        problems.push_back("reasoning.server_url is required when reasoning is enabled");
    }

    if (config.workers.empty()) {
        problems.push_back("workers: at least one worker is required");
    }
    const std::vector<std::string> types = knownAgentTypes();
    std::set<std::string> ids;
    for (const auto& worker : config.workers) {
        if (std::find(types.begin(), types.end(), worker.type) == types.end()) {
            problems.push_back("workers: unknown worker type '" + worker.type + "'");
        }
        if (!ids.insert(worker.id).second) {
            problems.push_back("workers: duplicate worker id '" + worker.id + "'");
        }
        if (worker.id == config.orchestrator.orchestrator_id) {
            problems.push_back("workers: id '" + worker.id + "' collides with the orchestrator id");
        }
    }

    const std::string& store = config.persistence.task_store;
    if (store != "memory" && store != "jsonl" && store != "none") {
        problems.push_back("persistence.task_store must be memory, jsonl or none");
    }
    if (store == "jsonl" && config.persistence.task_store_path.empty()) {
        problems.push_back("persistence.task_store_path is required for the jsonl store");
    }

    return problems;
}

} // namespace Maestro
