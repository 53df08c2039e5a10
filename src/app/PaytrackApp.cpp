/**
 * @file PaytrackApp.cpp
 * @brief Implementation of the PaytrackApp class.
 */
#include "app/PaytrackApp.hpp"

#include <cstddef>
#include <iostream>
#include <stdexcept>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/JsonSnapshotStore.hpp"
#include "infrastructure/ReportSerializer.hpp"

namespace paytrack::app {

CommandLine PaytrackApp::ParseArguments(const std::vector<std::string>& args) {
    CommandLine cl;
    bool commandSeen = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--settings") {
            if (i + 1 >= args.size()) throw std::invalid_argument("--settings needs a file");
            cl.settingsPath = args[++i];
        } else if (arg == "--ledger") {
            cl.command = Command::Ledger;
            commandSeen = true;
        } else if (arg == "--audit-history") {
            cl.command = Command::AuditHistory;
            commandSeen = true;
        } else if (arg == "--reconcile") {
            if (i + 1 >= args.size()) throw std::invalid_argument("--reconcile needs a paycheck id");
            cl.command = Command::Reconcile;
            cl.paycheckId = args[++i];
            commandSeen = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (cl.snapshotPath.empty()) {
            cl.snapshotPath = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (cl.snapshotPath.empty()) throw std::invalid_argument("Missing snapshot file");
    if (!commandSeen) throw std::invalid_argument("Missing command");
    return cl;
}

std::string PaytrackApp::Usage() {
    return "usage: paytrack <snapshot.json> [--settings <file>] "
           "(--ledger | --reconcile <paycheckId> | --audit-history)";
}

bool PaytrackApp::Init(const CommandLine& commandLine) {
    m_services.settings = infrastructure::ConfigLoader::LoadSettings(commandLine.settingsPath);

    std::shared_ptr<infrastructure::JsonSnapshotStore> store;
    try {
        store = infrastructure::JsonSnapshotStore::LoadFile(commandLine.snapshotPath);
    } catch (const std::exception& e) {
        std::cerr << "[PaytrackApp] Failed to load snapshot: " << e.what() << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    m_services.timesheetService = std::make_shared<application::TimesheetService>(
        store, store, store, m_services.settings);
    m_services.referenceResolver = std::make_shared<application::ReferenceContextResolver>(store);
    m_services.ledgerService = std::make_shared<application::LedgerService>(
        m_services.timesheetService, m_services.settings);
    m_services.reconciliationService = std::make_unique<application::ReconciliationService>(
        store, m_services.timesheetService, m_services.referenceResolver, m_services.ledgerService,
        m_services.settings);
    return true;
}

int PaytrackApp::Run(const CommandLine& commandLine) {
    if (!Init(commandLine)) {
        return 1;
    }

    try {
        switch (commandLine.command) {
            case Command::Ledger: {
                const auto rows = m_services.reconciliationService->BuildLedger();
                std::cout << infrastructure::ReportSerializer::LedgerToJson(rows) << std::endl;
                break;
            }
            case Command::Reconcile: {
                const auto result = m_services.reconciliationService->Reconcile(commandLine.paycheckId);
                std::cout << infrastructure::ReportSerializer::ReconciliationToJson(result) << std::endl;
                break;
            }
            case Command::AuditHistory: {
                const auto entries = m_services.reconciliationService->AuditHistory();
                std::cout << infrastructure::ReportSerializer::AuditHistoryToJson(entries) << std::endl;
                break;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[PaytrackApp] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace paytrack::app
