/**
 * dexref - Test Runner
 *
 * Simple assert-based test framework for the dexref core.
 * Run with: ./dexref_tests [pattern] (after building)
 */

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <sstream>
#include <stdexcept>

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

static std::vector<TestResult> g_results;
static int g_tests_failed = 0;

// ============================================================================
// TEST MACROS
// ============================================================================

#define TEST_ASSERT(condition) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error("Assertion failed: " #condition); \
        } \
    } while (0)

#define TEST_ASSERT_MSG(condition, msg) \
    do { \
        if (!(condition)) { \
            throw std::runtime_error(std::string("Assertion failed: ") + msg); \
        } \
    } while (0)

#define TEST_ASSERT_EQ(expected, actual) \
    do { \
        if ((expected) != (actual)) { \
            std::ostringstream oss; \
            oss << "Expected " << (expected) << " but got " << (actual); \
            throw std::runtime_error(oss.str()); \
        } \
    } while (0)

#define TEST_ASSERT_NE(val1, val2) \
    do { \
        if ((val1) == (val2)) { \
            throw std::runtime_error("Expected values to be different"); \
        } \
    } while (0)

#define TEST_ASSERT_TRUE(condition) TEST_ASSERT(condition)
#define TEST_ASSERT_FALSE(condition) TEST_ASSERT(!(condition))
#define TEST_ASSERT_NULL(ptr) TEST_ASSERT((ptr) == nullptr)
#define TEST_ASSERT_NOT_NULL(ptr) TEST_ASSERT((ptr) != nullptr)

// ============================================================================
// TEST REGISTRATION
// ============================================================================

using TestFunc = std::function<void()>;

struct TestCase {
    std::string name;
    std::string suite;
    TestFunc func;
};

static std::vector<TestCase> g_tests;

class TestRegistrar {
public:
    TestRegistrar(const std::string& suite, const std::string& name, TestFunc func) {
        g_tests.push_back({name, suite, func});
    }
};

#define TEST(suite, name) \
    void test_##suite##_##name(); \
    static TestRegistrar g_registrar_##suite##_##name(#suite, #name, test_##suite##_##name); \
    void test_##suite##_##name()

// ============================================================================
// TEST RUNNER
// ============================================================================

void run_test(const TestCase& test) {
    TestResult result{test.suite + "::" + test.name, true, "OK"};

    try {
        test.func();
        std::cout << "  [PASS] " << result.name << "\n";
    } catch (const std::exception& e) {
        result.passed = false;
        result.message = e.what();
        g_tests_failed++;
        std::cout << "  [FAIL] " << result.name << "\n";
        std::cout << "         " << result.message << "\n";
    }

    g_results.push_back(result);
}

/**
 * Run every registered test whose "suite::name" contains the pattern.
 * An empty pattern runs everything.
 */
void run_tests(const std::string& pattern) {
    std::cout << "\n=== dexref Tests ===\n\n";

    std::string current_suite;
    for (const auto& test : g_tests) {
        std::string full_name = test.suite + "::" + test.name;
        if (!pattern.empty() && full_name.find(pattern) == std::string::npos) continue;

        if (test.suite != current_suite) {
            current_suite = test.suite;
            std::cout << "[" << current_suite << "]\n";
        }
        run_test(test);
    }

    std::cout << "\n=== Summary ===\n";
    std::cout << "Total:  " << g_results.size() << "\n";
    std::cout << "Passed: " << g_results.size() - g_tests_failed << "\n";
    std::cout << "Failed: " << g_tests_failed << "\n";

    if (g_tests_failed > 0) {
        std::cout << "\nFailed tests:\n";
        for (const auto& result : g_results) {
            if (!result.passed) {
                std::cout << "  - " << result.name << ": " << result.message << "\n";
            }
        }
    }

    std::cout << "\n";
}

// ============================================================================
// MAIN
// ============================================================================

// Test files register themselves through static initializers
#include "test_fixtures.hpp"
#include "test_override_matcher.cpp"
#include "test_generation.cpp"
#include "test_type_chart.cpp"
#include "test_resource_store.cpp"
#include "test_resolvers.cpp"
#include "test_evolution.cpp"
#include "test_name_validator.cpp"
#include "test_coverage.cpp"
#include "test_matchup.cpp"
#include "test_config.cpp"
#include "test_display.cpp"
#include "test_cli.cpp"

int main(int argc, char* argv[]) {
    run_tests(argc > 1 ? argv[1] : "");

    return g_tests_failed > 0 ? 1 : 0;
}
