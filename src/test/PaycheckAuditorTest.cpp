#undef NDEBUG
#include <cassert>
#include <iostream>

#include "domain/services/PaycheckAuditor.hpp"
#include "test/TestFixtures.hpp"

using namespace paytrack::domain;
using namespace paytrack::test;

namespace {

DeclaredPaycheck CleanStatement() {
    DeclaredPaycheck p;
    p.id = "7";
    p.payDate = CivilDate(2025, 1, 24);
    p.periodEnding = CivilDate(2025, 1, 18);
    p.earnings = {
        Earning("Regular", 50.0, 80.0, 4000.0),
        Earning("Night Differential", 5.0, 10.0, 50.0),
    };
    p.earnings[1].amountAdjusted = 25.0;
    p.deductions = {Deduction("Federal Tax", 400.0), Deduction("OASDI", 250.0), Deduction("FEHB", 100.0)};
    p.grossPay = 4075.0;
    p.totalDeductions = 750.0;
    p.netPay = 3325.0;
    p.leave = {{"Annual", 6.45, 4.00, 2.30, 8.15}};
    return p;
}

void TestCleanStatement() {
    auto flags = PaycheckAuditor::audit(CleanStatement());
    assert(flags.empty());
    std::cout << "[PASS] Consistent statement has no flags." << std::endl;
}

void TestLeaveMinutes() {
    DeclaredPaycheck p = CleanStatement();
    p.leave[0].end = 8.00;
    auto flags = PaycheckAuditor::audit(p);
    assert(flags.size() == 1);
    const std::string& message = flags.at("leave_Annual_end");
    assert(message.find("6.45 + 4.00 - 2.30 should be 8.15, stub says 8.00") != std::string::npos);
    assert(message.find("off by 15 min") != std::string::npos);

    // One minute is tolerated: 8.16 vs 8.15.
    p.leave[0].end = 8.16;
    assert(PaycheckAuditor::audit(p).empty());

    // Exempt categories carry no running balance.
    p.leave = {{"Time Off Award", 4.0, 0.0, 0.0, 0.0}, {"Admin", 1.0, 0.0, 0.0, 9.0}};
    assert(PaycheckAuditor::audit(p).empty());
    std::cout << "[PASS] Leave continuity in minutes." << std::endl;
}

void TestGrossAndNet() {
    DeclaredPaycheck p = CleanStatement();
    p.grossPay = 4075.02; // off by 2 cents from the lines
    p.netPay = 3325.02;
    auto flags = PaycheckAuditor::audit(p);
    assert(flags.count("gross_pay") == 1);
    assert(flags.at("gross_pay") == "Sum (4075.00) != Gross (4075.02)");
    assert(flags.count("net_pay") == 0);

    p = CleanStatement();
    p.netPay = 3300.0;
    flags = PaycheckAuditor::audit(p);
    assert(flags.size() == 1);
    assert(flags.at("net_pay").find("Math Error: Gross - Ded != Net") == 0);

    // Within a cent passes.
    p = CleanStatement();
    p.netPay = 3325.005;
    assert(PaycheckAuditor::audit(p).empty());
    std::cout << "[PASS] Gross and net sums." << std::endl;
}

void TestCodeDrift() {
    DeclaredPaycheck previous = CleanStatement();
    DeclaredPaycheck current = CleanStatement();
    assert(PaycheckAuditor::compareLineCodes(previous, current).empty());

    current.earnings.push_back(Earning("Sunday Premium", 12.5, 8.0, 100.0));
    current.deductions.push_back(Deduction("Garnishment", 80.0));
    current.deductions.erase(current.deductions.begin() + 2); // FEHB dropped

    auto alerts = PaycheckAuditor::compareLineCodes(previous, current);
    assert(alerts.size() == 3);
    assert(alerts[0] == "ALERT: New Earning Code detected: Sunday Premium");
    assert(alerts[1] == "CRITICAL: New Deduction appearing: Garnishment");
    assert(alerts[2] == "WARNING: Deduction disappeared: FEHB");
    std::cout << "[PASS] Code drift between statements." << std::endl;
}

void TestEffectiveTaxRate() {
    DeclaredPaycheck p = CleanStatement();
    p.grossPay = 5000.0;
    // Federal Tax + OASDI = 650 of 5000.
    assert(Near(PaycheckAuditor::effectiveTaxRate(p), 13.0));
    p.grossPay = 0.0;
    assert(Near(PaycheckAuditor::effectiveTaxRate(p), 0.0));
    std::cout << "[PASS] Effective tax rate." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PaycheckAuditor Test..." << std::endl;

    TestCleanStatement();
    TestLeaveMinutes();
    TestGrossAndNet();
    TestCodeDrift();
    TestEffectiveTaxRate();

    std::cout << "[PASS] PaycheckAuditor Test." << std::endl;
    return 0;
}
