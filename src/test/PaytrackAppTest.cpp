#undef NDEBUG
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/PaytrackApp.hpp"

using namespace paytrack::app;

namespace {

bool Rejects(const std::vector<std::string>& args) {
    try {
        PaytrackApp::ParseArguments(args);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestValidCommands() {
    auto ledger = PaytrackApp::ParseArguments({"snapshot.json", "--ledger"});
    assert(ledger.snapshotPath == "snapshot.json");
    assert(ledger.settingsPath == "settings.json");
    assert(ledger.command == Command::Ledger);

    auto reconcile = PaytrackApp::ParseArguments({"--settings", "custom.json", "snapshot.json", "--reconcile", "42"});
    assert(reconcile.settingsPath == "custom.json");
    assert(reconcile.snapshotPath == "snapshot.json");
    assert(reconcile.command == Command::Reconcile);
    assert(reconcile.paycheckId == "42");

    auto history = PaytrackApp::ParseArguments({"snapshot.json", "--audit-history"});
    assert(history.command == Command::AuditHistory);
    std::cout << "[PASS] Valid command lines." << std::endl;
}

void TestRejectedCommandLines() {
    assert(Rejects({}));
    assert(Rejects({"--ledger"}));                            // no snapshot
    assert(Rejects({"snapshot.json"}));                       // no command
    assert(Rejects({"snapshot.json", "--ledger", "--settings"}));
    assert(Rejects({"snapshot.json", "--reconcile"}));
    assert(Rejects({"snapshot.json", "--ledger", "--verbose"}));
    assert(Rejects({"snapshot.json", "other.json", "--ledger"}));
    std::cout << "[PASS] Incomplete or unknown arguments are rejected." << std::endl;
}

void TestMissingSnapshotFails() {
    PaytrackApp app;
    CommandLine cl;
    cl.snapshotPath = "does/not/exist/snapshot.json";
    cl.settingsPath = "does/not/exist/settings.json";
    cl.command = Command::Ledger;
    assert(app.Run(cl) == 1);
    std::cout << "[PASS] Unreadable snapshot exits with an error." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PaytrackApp Test..." << std::endl;

    TestValidCommands();
    TestRejectedCommandLines();
    TestMissingSnapshotFails();

    std::cout << "[PASS] PaytrackApp Test." << std::endl;
    return 0;
}
