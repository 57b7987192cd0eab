/**
 * pickassoc test framework
 *
 * Minimal self-registering unit tests: TEST(suite, name) bodies run in
 * suite order, ASSERT_* macros record the first failure and return.
 */

#pragma once

#include <chrono>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace pickassoc {
namespace test {

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
    double duration_ms;
};

struct TestCase {
    std::string name;
    std::function<void()> func;
};

class TestRegistry {
public:
    static TestRegistry& instance() {
        static TestRegistry reg;
        return reg;
    }
    
    void addTest(const std::string& suite, const std::string& name,
                 std::function<void()> func) {
        suites_[suite].push_back({name, func});
    }
    
    std::vector<std::string> suiteNames() const {
        std::vector<std::string> names;
        for (const auto& entry : suites_) names.push_back(entry.first);
        return names;
    }
    
    std::vector<TestResult> runAll() {
        std::vector<TestResult> results;
        for (const auto& entry : suites_) {
            runSuiteInto(entry.first, entry.second, results);
        }
        return results;
    }
    
    std::vector<TestResult> runSuite(const std::string& suite_name) {
        std::vector<TestResult> results;
        auto it = suites_.find(suite_name);
        if (it == suites_.end()) {
            std::cerr << "Suite not found: " << suite_name << std::endl;
            return results;
        }
        runSuiteInto(it->first, it->second, results);
        return results;
    }
    
    void fail(const std::string& message) {
        failed_ = true;
        failure_message_ = message;
    }
    
    bool isFailed() const { return failed_; }

private:
    TestRegistry() = default;
    std::map<std::string, std::vector<TestCase>> suites_;
    bool failed_ = false;
    std::string failure_message_;
    
    void runSuiteInto(const std::string& suite_name, const std::vector<TestCase>& tests,
                      std::vector<TestResult>& results) {
        std::cout << "\n=== " << suite_name << " ===" << std::endl;
        
        for (const auto& test : tests) {
            TestResult result;
            result.name = suite_name + "::" + test.name;
            
            auto start = std::chrono::steady_clock::now();
            try {
                test.func();
                result.passed = !failed_;
                if (failed_) result.message = failure_message_;
            } catch (const std::exception& e) {
                result.passed = false;
                result.message = std::string("Exception: ") + e.what();
            } catch (...) {
                result.passed = false;
                result.message = "Unknown exception";
            }
            auto end = std::chrono::steady_clock::now();
            result.duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
            
            failed_ = false;
            failure_message_.clear();
            
            if (result.passed) {
                std::cout << "  ✓ " << test.name << " (" << std::fixed << std::setprecision(2)
                          << result.duration_ms << "ms)" << std::endl;
            } else {
                std::cout << "  ✗ " << test.name << ": " << result.message << std::endl;
            }
            results.push_back(result);
        }
    }
};

struct TestRegistrar {
    TestRegistrar(const std::string& suite, const std::string& name,
                  std::function<void()> func) {
        TestRegistry::instance().addTest(suite, name, func);
    }
};

#define PICKASSOC_TEST_FAIL(what) \
    { \
        std::ostringstream oss; \
        oss << what << " at " << __FILE__ << ":" << __LINE__; \
        pickassoc::test::TestRegistry::instance().fail(oss.str()); \
        return; \
    }

#define ASSERT_TRUE(cond) \
    if (!(cond)) PICKASSOC_TEST_FAIL("ASSERT_TRUE failed: " #cond)

#define ASSERT_FALSE(cond) \
    if (cond) PICKASSOC_TEST_FAIL("ASSERT_FALSE failed: " #cond)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) PICKASSOC_TEST_FAIL("ASSERT_EQ failed: " << (a) << " != " << (b))

#define ASSERT_NE(a, b) \
    if ((a) == (b)) PICKASSOC_TEST_FAIL("ASSERT_NE failed: " << (a) << " == " << (b))

#define ASSERT_LT(a, b) \
    if (!((a) < (b))) PICKASSOC_TEST_FAIL("ASSERT_LT failed: " << (a) << " >= " << (b))

#define ASSERT_LE(a, b) \
    if (!((a) <= (b))) PICKASSOC_TEST_FAIL("ASSERT_LE failed: " << (a) << " > " << (b))

#define ASSERT_GT(a, b) \
    if (!((a) > (b))) PICKASSOC_TEST_FAIL("ASSERT_GT failed: " << (a) << " <= " << (b))

#define ASSERT_GE(a, b) \
    if (!((a) >= (b))) PICKASSOC_TEST_FAIL("ASSERT_GE failed: " << (a) << " < " << (b))

#define ASSERT_NEAR(a, b, eps) \
    if (!(std::abs((a) - (b)) <= (eps))) \
        PICKASSOC_TEST_FAIL("ASSERT_NEAR failed: |" << (a) << " - " << (b) << "| = " \
                            << std::abs((a) - (b)) << " > " << (eps))

// Also checks that the exception message contains `fragment`
#define ASSERT_THROW_MSG(expr, exc_type, fragment) \
    { \
        bool caught = false; \
        std::string caught_what; \
        try { expr; } catch (const exc_type& e) { caught = true; caught_what = e.what(); } \
        catch (...) {} \
        if (!caught) PICKASSOC_TEST_FAIL("ASSERT_THROW failed: expected " #exc_type) \
        if (caught_what.find(fragment) == std::string::npos) \
            PICKASSOC_TEST_FAIL("ASSERT_THROW message '" << caught_what \
                                << "' lacks '" << fragment << "'") \
    }

#define ASSERT_THROW(expr, exc_type) ASSERT_THROW_MSG(expr, exc_type, "")

#define ASSERT_NO_THROW(expr) \
    try { expr; } catch (const std::exception& e) \
        PICKASSOC_TEST_FAIL("ASSERT_NO_THROW failed: " << e.what())

#define TEST(suite, name) \
    void test_##suite##_##name(); \
    static pickassoc::test::TestRegistrar registrar_##suite##_##name( \
        #suite, #name, test_##suite##_##name); \
    void test_##suite##_##name()

inline void printSummary(const std::vector<TestResult>& results) {
    int passed = 0, failed = 0;
    double total_time = 0;
    
    for (const auto& r : results) {
        if (r.passed) passed++;
        else failed++;
        total_time += r.duration_ms;
    }
    
    std::cout << "\n========================================" << std::endl;
    std::cout << "Passed: " << passed << "/" << (passed + failed) << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "Total time: " << std::fixed << std::setprecision(2)
              << total_time << "ms" << std::endl;
    
    if (failed > 0) {
        std::cout << "\nFailed tests:" << std::endl;
        for (const auto& r : results) {
            if (!r.passed) std::cout << "  - " << r.name << ": " << r.message << std::endl;
        }
    }
    std::cout << "========================================" << std::endl;
}

} // namespace test
} // namespace pickassoc
