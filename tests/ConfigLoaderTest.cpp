// =================================================================
// tests/ConfigLoaderTest.cpp
// =================================================================
// Unit tests for ConfigLoader component.

#include "Maestro/ConfigLoader.hpp"
#include "Maestro/Workers.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <fstream>
#include <filesystem>
#include <algorithm>

namespace fs = std::filesystem;

class ConfigLoaderTest {
private:
    fs::path m_dir;

    static bool mentions(const std::vector<std::string>& problems, const std::string& text) {
        return std::any_of(problems.begin(), problems.end(),
                           [&text](const std::string& p) { return p.find(text) != std::string::npos; });
    }

    static bool throwsInvalidArgument(const std::string& yaml) {
        try {
            Maestro::ConfigLoader::loadFromString(yaml);
        } catch (const Maestro::MaestroError& e) {
            return e.kind() == Maestro::ErrorKind::INVALID_ARGUMENT;
        }
        return false;
    }

public:
    ConfigLoaderTest() {
        Maestro::Logger::getInstance().setConsoleLogging(false);
        Maestro::Logger::getInstance().setFileLogging(false);
        m_dir = fs::temp_directory_path() / "maestro_config_loader_test";
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);
    }

    ~ConfigLoaderTest() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }

    void testDefaults() {
        std::cout << "Testing default configuration..." << std::endl;

        auto config = Maestro::ConfigLoader::defaults();
        auto types = Maestro::knownAgentTypes();
        assert(config.workers.size() == types.size() && "One worker of every flavor");
        for (size_t i = 0; i < types.size(); ++i) {
            assert(config.workers[i].type == types[i]);
            assert(config.workers[i].id == types[i] + "-1");
        }

        assert(config.orchestrator.orchestrator_id == "orchestrator");
        assert(config.persistence.task_store == "memory");
        assert(!config.reasoning.enabled);
        assert(config.fallback.strategy == "sequential");
        assert(Maestro::ConfigLoader::validate(config).empty() && "Defaults are valid");

        std::cout << "✓ Defaults test passed" << std::endl;
    }

    void testLoadFromString() {
        std::cout << "Testing load from string..." << std::endl;

        const std::string yaml = R"(
logging:
  console_level: warn
  file: false
message_bus:
  queue_capacity: 16
  response_timeout_ms: 250
fallback:
  strategy: adaptive
  models: [phi3:mini, mistral:7b]
memory:
  short_term_capacity: 8
  consolidation_threshold: 0.9
context:
  default_ttl_ms: 1500
  cleanup_interval_s: 5
learning:
  enabled: false
  learning_rate: 0.3
orchestrator:
  id: conductor
  subtask_timeout_ms: 2000
  decomposition_threshold: 0.25
  stage_history_limit: 50
  quality_window: 20
reasoning:
  enabled: true
  server_url: http://gpu-box:11434
  model: codellama:13b
  read_timeout_s: 30
environment:
  name: lab
  resource_wait_ms: 750
  reasoning_slots: 4
verification:
  enabled: false
  pass_threshold: 0.8
persistence:
  task_store: jsonl
  task_store_path: /tmp/tasks.jsonl
)";

        auto config = Maestro::ConfigLoader::loadFromString(yaml);
        assert(config.logging.console_level == "warn");
        assert(!config.logging.file);
        assert(config.logging.console && "Missing keys keep their defaults");
        assert(config.message_bus.queue_capacity == 16);
        assert(config.message_bus.default_response_timeout == std::chrono::milliseconds(250));
        assert(config.fallback.strategy == "adaptive");
        assert(config.fallback.models.size() == 2);
        assert(config.fallback.models[1] == "mistral:7b");
        assert(config.memory.short_term_capacity == 8);
        assert(config.memory.consolidation_threshold == 0.9);
        assert(config.context.default_ttl == std::chrono::milliseconds(1500));
        assert(config.context.cleanup_interval == std::chrono::seconds(5));
        assert(!config.learning.enabled);
        assert(config.learning.q_learning.learning_rate == 0.3);
        assert(config.learning.q_learning.discount_factor == 0.9);
        assert(config.orchestrator.orchestrator_id == "conductor");
        assert(config.orchestrator.subtask_timeout == std::chrono::milliseconds(2000));
        assert(config.orchestrator.decomposition_threshold == 0.25);
        assert(config.orchestrator.stage_history_limit == 50);
        assert(config.orchestrator.quality_window == 20);
        assert(config.environment.name == "lab");
        assert(config.environment.default_wait == std::chrono::milliseconds(750));
        assert(config.environment.reasoning_slots == 4);
        assert(config.environment.max_events == 10000);
        assert(!config.verification.enabled);
        assert(config.verification.quality.pass_threshold == 0.8);
        assert(config.reasoning.enabled);
        assert(config.reasoning.ollama.server_url == "http://gpu-box:11434");
        assert(config.reasoning.ollama.model_name == "codellama:13b");
        assert(config.reasoning.ollama.read_timeout == std::chrono::seconds(30));
        assert(config.persistence.task_store == "jsonl");
        assert(config.persistence.task_store_path == "/tmp/tasks.jsonl");
        assert(config.workers.size() == Maestro::knownAgentTypes().size() && "Default workers without a list");

        assert(Maestro::ConfigLoader::validate(config).empty());

        std::cout << "✓ Load from string test passed" << std::endl;
    }

    void testWorkersList() {
        std::cout << "Testing workers list..." << std::endl;

        auto config = Maestro::ConfigLoader::loadFromString(R"(
workers:
  - type: research
    id: scout
    tool_call_budget: 3
  - type: code
  - type: code
)");
        assert(config.workers.size() == 3 && "A workers list replaces the defaults");
        assert(config.workers[0].id == "scout");
        assert(config.workers[0].tool_call_budget == 3);
        assert(config.workers[1].id == "code-2" && "Ids are generated from type and position");
        assert(config.workers[2].id == "code-3");
        assert(config.workers[2].tool_call_budget == 10);

        assert(throwsInvalidArgument("workers:\n  type: research\n") && "workers must be a list");

        std::cout << "✓ Workers list test passed" << std::endl;
    }

    void testMalformedInput() {
        std::cout << "Testing malformed configuration..." << std::endl;

        assert(throwsInvalidArgument("logging: [unclosed") && "Invalid YAML");
        assert(throwsInvalidArgument("- just\n- a list\n") && "Root must be a mapping");
        assert(throwsInvalidArgument("message_bus:\n  queue_capacity: lots\n") && "Type mismatch");

        // Empty text is not an error
        auto empty = Maestro::ConfigLoader::loadFromString("");
        assert(empty.workers.size() == Maestro::knownAgentTypes().size());

        std::cout << "✓ Malformed input test passed" << std::endl;
    }

    void testValidate() {
        std::cout << "Testing validation..." << std::endl;

        auto config = Maestro::ConfigLoader::defaults();
        config.logging.console_level = "loud";
        config.message_bus.queue_capacity = 0;
        config.fallback.strategy = "random";
        config.memory.consolidation_threshold = 1.5;
        config.learning.q_learning.exploration_decay = 0.0;
        config.orchestrator.subtask_timeout = std::chrono::milliseconds(0);
        config.reasoning.enabled = true;
        config.reasoning.ollama.server_url.clear();
        config.persistence.task_store = "sqlite";
        config.orchestrator.stage_history_limit = 0;
        config.orchestrator.quality_window = 0;
        config.environment.reasoning_slots = 0;
        config.environment.default_wait = std::chrono::milliseconds(0);
        config.verification.quality.pass_threshold = 1.2;
        config.workers.push_back({"wizard", "wizard-1", 10});
        config.workers.push_back({"code", "code-1", 10});
        config.workers.push_back({"general", "orchestrator", 10});

        auto problems = Maestro::ConfigLoader::validate(config);
        assert(mentions(problems, "unknown log level 'loud'"));
        assert(mentions(problems, "message_bus.queue_capacity must be positive"));
        assert(mentions(problems, "fallback.strategy"));
        assert(mentions(problems, "memory.consolidation_threshold"));
        assert(mentions(problems, "learning.exploration_decay"));
        assert(mentions(problems, "orchestrator.subtask_timeout_ms"));
        assert(mentions(problems, "reasoning.server_url is required"));
        assert(mentions(problems, "persistence.task_store must be memory, jsonl or none"));
        assert(mentions(problems, "orchestrator.stage_history_limit must be positive"));
        assert(mentions(problems, "orchestrator.quality_window must be positive"));
        assert(mentions(problems, "environment.reasoning_slots must be positive"));
        assert(mentions(problems, "environment.resource_wait_ms must be positive"));
        assert(mentions(problems, "verification.pass_threshold"));
        assert(mentions(problems, "unknown worker type 'wizard'"));
        assert(mentions(problems, "duplicate worker id 'code-1'"));
        assert(mentions(problems, "collides with the orchestrator id"));

        auto no_workers = Maestro::ConfigLoader::defaults();
        no_workers.workers.clear();
        assert(mentions(Maestro::ConfigLoader::validate(no_workers), "at least one worker"));

        std::cout << "✓ Validation test passed" << std::endl;
    }

    void testLoadFromFile() {
        std::cout << "Testing load from file..." << std::endl;

        auto missing = Maestro::ConfigLoader::loadFromFile((m_dir / "absent.yml").string());
        assert(missing.workers.size() == Maestro::knownAgentTypes().size() && "Missing file yields defaults");

        fs::path path = m_dir / "maestro.yml";
        {
            std::ofstream file(path);
            file << "orchestrator:\n  max_tasks_per_worker: 2\n";
        }
        auto config = Maestro::ConfigLoader::loadFromFile(path.string());
        assert(config.orchestrator.max_tasks_per_worker == 2);

        fs::path broken = m_dir / "broken.yml";
        {
            std::ofstream file(broken);
            file << "orchestrator: {id: [\n";
        }
        bool threw = false;
        try {
            Maestro::ConfigLoader::loadFromFile(broken.string());
        } catch (const Maestro::MaestroError& e) {
            threw = e.kind() == Maestro::ErrorKind::INVALID_ARGUMENT;
            assert(std::string(e.what()).find("broken.yml") != std::string::npos);
        }
        assert(threw);

        std::cout << "✓ Load from file test passed" << std::endl;
    }

    void testShippedConfiguration() {
        std::cout << "Testing shipped configuration..." << std::endl;

        fs::path shipped = fs::path(MAESTRO_SOURCE_DIR) / "config" / "maestro.yml";
        assert(fs::exists(shipped));

        auto config = Maestro::ConfigLoader::loadFromFile(shipped.string());
        assert(config.workers.size() == 5);
        assert(config.workers[1].tool_call_budget == 15);
        assert(config.persistence.task_store == "jsonl");
        assert(config.environment.reasoning_slots == 2);
        assert(config.verification.enabled);
        assert(Maestro::ConfigLoader::validate(config).empty() && "Shipped configuration is valid");

        std::cout << "✓ Shipped configuration test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ConfigLoader unit tests..." << std::endl;
        std::cout << "==================================" << std::endl << std::endl;

        testDefaults();
        std::cout << std::endl;

        testLoadFromString();
        std::cout << std::endl;

        testWorkersList();
        std::cout << std::endl;

        testMalformedInput();
        std::cout << std::endl;

        testValidate();
        std::cout << std::endl;

        testLoadFromFile();
        std::cout << std::endl;

        testShippedConfiguration();
        std::cout << std::endl;

        std::cout << "All ConfigLoader tests passed!" << std::endl;
    }
};

int main() {
    try {
        ConfigLoaderTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ConfigLoader component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
