// =================================================================
// include/Maestro/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Maestro {

// Parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Shared by every command
    std::string config_path = "config/maestro.yml";
    bool quiet = false;

    // Options for 'run'
    std::string description;
    std::vector<std::string> requirements;
    int priority = 5;
    std::vector<std::string> context_pairs; // key=value
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    const Commands& getCommands() const;

private:
    void setupRunCommand(CLI::App& app);
    void setupAgentsCommand(CLI::App& app);
    void setupConfigCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Maestro
