// =================================================================
// tests/TestRunner.cpp
// =================================================================
// Main test runner for all unit tests. Each suite is a separate
// executable built next to this one.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

fs::path g_test_dir = ".";

int runSuiteExecutable(const std::string& executable) {
    fs::path path = g_test_dir / executable;
    if (!fs::exists(path)) {
        std::cerr << "Test executable not found: " << path.string() << std::endl;
        return 1;
    }
    std::string command = "\"" + path.string() + "\"";
    return std::system(command.c_str());
}

} // anonymous namespace

struct TestSuite {
    std::string name;
    std::function<int()> test_function;
};

class TestRunner {
private:
    std::vector<TestSuite> test_suites;

public:
    TestRunner() {
        // Register all test suites
        const std::vector<std::string> names = {
            "MessageBus",
            "FallbackChain",
            "ScalingStrategy",
            "LoadBalancer",
            "MemoryManager",
            "SemanticMemory",
            "ContextProtocol",
            "SharedEnvironment",
            "QualityVerifier",
            "LearningEngine",
            "Workers",
            "TaskStore",
            "Orchestrator",
            "ConfigLoader",
            "Integration"
        };
        for (const auto& name : names) {
            test_suites.push_back({name, [name]() { return runSuiteExecutable(name + "Test"); }});
        }
    }

    int runAllTests() {
        std::cout << "🚀 Starting Maestro Unit Test Suite" << std::endl;
        std::cout << "===================================" << std::endl << std::endl;

        auto start_time = std::chrono::steady_clock::now();

        int total_tests = test_suites.size();
        int passed_tests = 0;
        int failed_tests = 0;

        for (const auto& suite : test_suites) {
            std::cout << "Running " << suite.name << " tests..." << std::endl;
            std::cout << std::string(40, '-') << std::endl;

            auto suite_start = std::chrono::steady_clock::now();
            int result = suite.test_function();
            auto suite_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - suite_start);

            if (result == 0) {
                std::cout << "✅ " << suite.name << " tests PASSED";
                std::cout << " (took " << suite_duration.count() << "ms)" << std::endl;
                passed_tests++;
            } else {
                std::cout << "❌ " << suite.name << " tests FAILED";
                std::cout << " (exit code: " << result << ")" << std::endl;
                failed_tests++;
            }

            std::cout << std::endl;
        }

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        // Print summary
        std::cout << "Test Summary" << std::endl;
        std::cout << "============" << std::endl;
        std::cout << "Total test suites: " << total_tests << std::endl;
        std::cout << "Passed: " << passed_tests << std::endl;
        std::cout << "Failed: " << failed_tests << std::endl;
        std::cout << "Total time: " << total_duration.count() << "ms" << std::endl;

        if (failed_tests == 0) {
            std::cout << std::endl << "🎉 All tests passed!" << std::endl;
            return 0;
        } else {
            std::cout << std::endl << "💥 " << failed_tests << " test suite(s) failed!" << std::endl;
            return 1;
        }
    }

    int runSpecificTest(const std::string& test_name) {
        for (const auto& suite : test_suites) {
            if (suite.name == test_name) {
                std::cout << "Running " << test_name << " tests only..." << std::endl;
                return suite.test_function();
            }
        }

        std::cerr << "Test suite '" << test_name << "' not found!" << std::endl;
        std::cerr << "Available test suites:" << std::endl;
        for (const auto& suite : test_suites) {
            std::cerr << "  - " << suite.name << std::endl;
        }
        return 1;
    }

    void listTests() {
        std::cout << "Available test suites:" << std::endl;
        for (const auto& suite : test_suites) {
            std::cout << "  - " << suite.name << std::endl;
        }
    }
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --help, -h          Show this help message" << std::endl;
    std::cout << "  --list, -l          List available test suites" << std::endl;
    std::cout << "  --test <name>       Run specific test suite" << std::endl;
    std::cout << "  (no arguments)      Run all test suites" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << "                     # Run all tests" << std::endl;
    std::cout << "  " << program_name << " --test MessageBus    # Run only MessageBus tests" << std::endl;
    std::cout << "  " << program_name << " --list               # List available test suites" << std::endl;
}

int main(int argc, char* argv[]) {
    g_test_dir = fs::absolute(fs::path(argv[0])).parent_path();
    TestRunner runner;

    if (argc == 1) {
        // No arguments - run all tests
        return runner.runAllTests();
    }

    std::string arg1 = argv[1];

    if (arg1 == "--help" || arg1 == "-h") {
        printUsage(argv[0]);
        return 0;
    }

    if (arg1 == "--list" || arg1 == "-l") {
        runner.listTests();
        return 0;
    }

    if (arg1 == "--test" && argc == 3) {
        return runner.runSpecificTest(argv[2]);
    }

    std::cerr << "Invalid arguments!" << std::endl;
    printUsage(argv[0]);
    return 1;
}
