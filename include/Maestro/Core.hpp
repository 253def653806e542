// =================================================================
// include/Maestro/Core.hpp
// =================================================================
// Defines the command-line application: loads configuration, builds the
// system and dispatches the parsed command.

#pragma once

#include "Maestro/CliParser.hpp"
#include "Maestro/ConfigLoader.hpp"
#include <string>

namespace Maestro {

/**
 * @brief Exit codes of the run command
 */
enum ExitCode {
    EXIT_SUCCEEDED = 0,
    EXIT_FAILED = 1,
    EXIT_PARTIAL = 2
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     */
    explicit Core(const Commands& commands);

    /**
     * @brief Runs the command selected on the command line.
     * @return Process exit code
     */
    int run();

private:
    int handleRun();
    int handleAgents();
    int handleConfig();

    void configureLogging() const;

    const Commands& m_commands;
    SystemConfig m_config;
};

} // namespace Maestro
