// =================================================================
// src/Maestro/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Maestro/CliParser.hpp"

namespace Maestro {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Maestro: multi-agent task orchestration.");
    m_app->require_subcommand(1);
    // Global options may follow the subcommand: maestro run "..." -c file.yml
    m_app->fallthrough();

    m_app->add_option("-c,--config", m_commands.config_path, "Path to the YAML configuration file.");
    m_app->add_flag("-q,--quiet", m_commands.quiet, "Suppress console logging.");

    // Record which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupRunCommand(*m_app);
    setupAgentsCommand(*m_app);
    setupConfigCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupRunCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("run", "Processes one task and prints the synthesized result as JSON.");
    sub->add_option("description", m_commands.description, "The task description.")->required();
    sub->add_option("-r,--requirement", m_commands.requirements, "A requirement tag (repeatable).");
    sub->add_option("-p,--priority", m_commands.priority, "Task priority, higher is more urgent (default: 5)")
        ->check(CLI::Range(0, 10));
    sub->add_option("--context", m_commands.context_pairs, "Context value as key=value (repeatable).");
}

void CliParser::setupAgentsCommand(CLI::App& app) {
    app.add_subcommand("agents", "Lists the configured workers and their capabilities.");
}

void CliParser::setupConfigCommand(CLI::App& app) {
    app.add_subcommand("config", "Validates the configuration file and prints any problems.");
}

} // namespace Maestro
