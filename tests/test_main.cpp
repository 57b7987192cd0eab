/**
 * pickassoc test runner
 */

#include "test_framework.hpp"
#include <cstring>
#include <iostream>
#include <string>

using namespace pickassoc::test;

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] [suite_name]\n"
              << "\nOptions:\n"
              << "  -h, --help     Show this help message\n"
              << "  -l, --list     List all test suites\n"
              << "\nWith a suite_name only that suite runs.\n";
}

int main(int argc, char* argv[]) {
    std::string suite_filter;
    bool list_only = false;
    
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--list") == 0) {
            list_only = true;
        } else if (argv[i][0] != '-') {
            suite_filter = argv[i];
        }
    }
    
    if (list_only) {
        std::cout << "Available test suites:\n";
        for (const auto& name : TestRegistry::instance().suiteNames()) {
            std::cout << "  " << name << "\n";
        }
        return 0;
    }
    
    std::cout << "pickassoc test suite" << std::endl;
    
    std::vector<TestResult> results = suite_filter.empty()
        ? TestRegistry::instance().runAll()
        : TestRegistry::instance().runSuite(suite_filter);
    
    printSummary(results);
    
    if (results.empty()) return 1;
    for (const auto& r : results) {
        if (!r.passed) return 1;
    }
    return 0;
}
