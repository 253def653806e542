// =================================================================
// src/Maestro/Core.cpp
// =================================================================
// Implementation of the command-line application.

#include "Maestro/Core.hpp"
#include "Maestro/System.hpp"
#include "Maestro/Workers.hpp"
#include "Maestro/Logger.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <unordered_map>

namespace Maestro {

Core::Core(const Commands& commands)
    : m_commands(commands) {
}

int Core::run() {
    if (m_commands.quiet) {
        Logger::getInstance().setConsoleLogging(false);
    }

    try {
        m_config = ConfigLoader::loadFromFile(m_commands.config_path);
    } catch (const MaestroError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_FAILED;
    }
    configureLogging();

    if (m_commands.active_command == "run") {
        return handleRun();
    } else if (m_commands.active_command == "agents") {
        return handleAgents();
    } else if (m_commands.active_command == "config") {
        return handleConfig();
    }

    std::cerr << "Error: Unknown command '" << m_commands.active_command << "'." << std::endl;
    return EXIT_FAILED;
}

void Core::configureLogging() const {
    const LoggingSettings& settings = m_config.logging;
    Logger& logger = Logger::getInstance();

    logger.setFileLogging(settings.file);
    logger.setConsoleLogging(settings.console && !m_commands.quiet);
    logger.setConsoleLogLevel(Logger::parseLevel(settings.console_level));
    logger.setFileLogLevel(Logger::parseLevel(settings.file_level));
    logger.initialize(settings.directory, settings.max_file_size_mb * 1024 * 1024, settings.max_files);
}

int Core::handleRun() {
    auto problems = ConfigLoader::validate(m_config);
    if (!problems.empty()) {
        std::cerr << "Invalid configuration " << m_commands.config_path << ":" << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return EXIT_FAILED;
    }

    std::unordered_map<std::string, std::string> context;
    for (const auto& pair : m_commands.context_pairs) {
        size_t separator = pair.find('=');
        if (separator == std::string::npos || separator == 0) {
            std::cerr << "Error: context values must look like key=value, got '" << pair << "'" << std::endl;
            return EXIT_FAILED;
        }
        context[pair.substr(0, separator)] = pair.substr(separator + 1);
    }

    auto start_time = std::chrono::steady_clock::now();
    Logger::getInstance().logSessionStart("run", m_commands.description);

    int exit_code = EXIT_FAILED;
    {
        System system(m_config);
        Orchestrator& orchestrator = system.getOrchestrator();

        std::string task_id = orchestrator.submitTask(m_commands.description, m_commands.requirements,
                                                      m_commands.priority, context);
        auto result = orchestrator.processSubmitted(task_id);

        if (result) {
            std::cout << resultToJson(*result).dump(2) << std::endl;

            auto outcome = result->metadata.find("outcome");
            if (result->success) {
                exit_code = EXIT_SUCCEEDED;
            } else if (outcome != result->metadata.end() && outcome->second == "partial") {
                exit_code = EXIT_PARTIAL;
            }
        } else {
            std::cerr << "Error: task " << task_id << " was not processed." << std::endl;
        }

        try {
            system.saveLearning();
        } catch (const MaestroError& e) {
            Logger::getInstance().warning("Core", "Learning tables were not saved", e.what());
        }
        Logger::getInstance().debug("Core", "Session environment\n" + system.getEnvironment()->getReport());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    Logger::getInstance().logSessionEnd("run", exit_code, duration.count());
    Logger::getInstance().flush();
    return exit_code;
}

int Core::handleAgents() {
    std::cout << "Configured Workers" << std::endl;
    std::cout << "==================" << std::endl;

    bool all_known = true;
    for (const auto& settings : m_config.workers) {
        std::cout << std::endl;
        try {
            auto agent = makeAgent(settings.type, settings.id);
            std::cout << agent->getId() << " (" << agent->getType() << ")" << std::endl;
            std::cout << "  Tool-call budget: " << settings.tool_call_budget << std::endl;
            for (const auto& capability : agent->getCapabilities()) {
                std::cout << "  " << std::left << std::setw(24) << capability.name
                          << std::fixed << std::setprecision(2) << capability.proficiency
                          << "  " << capability.description << std::endl;
            }
        } catch (const MaestroError& e) {
            all_known = false;
            std::cout << settings.id << " (" << settings.type << ")" << std::endl;
            std::cout << "  Error: " << e.what() << std::endl;
        }
    }

    return all_known ? EXIT_SUCCEEDED : EXIT_FAILED;
}

int Core::handleConfig() {
    std::cout << "Configuration: " << m_commands.config_path << std::endl;

    auto problems = ConfigLoader::validate(m_config);
    if (problems.empty()) {
        std::cout << "Configuration is valid." << std::endl;
        std::cout << "  Workers: " << m_config.workers.size() << std::endl;
        std::cout << "  Fallback strategy: " << m_config.fallback.strategy << std::endl;
        std::cout << "  Reasoning: " << (m_config.reasoning.enabled
                                        ? m_config.reasoning.ollama.server_url + " (" +
                                          m_config.reasoning.ollama.model_name + ")"
                                        : std::string("disabled")) << std::endl;
        std::cout << "  Task store: " << m_config.persistence.task_store << std::endl;
        return EXIT_SUCCEEDED;
    }

    std::cout << problems.size() << " problem(s) found:" << std::endl;
    for (const auto& problem : problems) {
        std::cout << "  - " << problem << std::endl;
    }
    return EXIT_FAILED;
}

} // namespace Maestro
