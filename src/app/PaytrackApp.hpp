/**
 * @file PaytrackApp.hpp
 * @brief Command-line front end for the reconciliation services.
 */

#pragma once

#include <string>
#include <vector>

#include "application/AppServices.hpp"

namespace paytrack::app {

enum class Command {
    Ledger,
    Reconcile,
    AuditHistory
};

/**
 * @struct CommandLine
 * @brief Parsed form of: paytrack <snapshot.json> [--settings <file>] (--ledger | --reconcile <id> | --audit-history)
 */
struct CommandLine {
    std::string snapshotPath;
    std::string settingsPath = "settings.json";
    Command command = Command::Ledger;
    std::string paycheckId;
};

/**
 * @class PaytrackApp
 * @brief Composition root: wires the snapshot store into the services and prints one JSON report.
 */
class PaytrackApp {
public:
    /**
     * @brief Parses argv (without the program name).
     * @throws std::invalid_argument on unknown or incomplete options.
     */
    static CommandLine ParseArguments(const std::vector<std::string>& args);

    static std::string Usage();

    /**
     * @brief Runs one command.
     * @return Exit code (0 for success).
     */
    int Run(const CommandLine& commandLine);

private:
    /**
     * @brief Loads settings and the snapshot, then builds the services.
     * @return True if initialization succeeded.
     */
    bool Init(const CommandLine& commandLine);

    application::AppServices m_services;
};

} // namespace paytrack::app
