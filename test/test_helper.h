// test_helper.h - Minimal test framework (no external dependencies)
// Self-registering TEST cases, assert macros and a pass/fail summary

#ifndef YAMLDIFF_TEST_HELPER_H
#define YAMLDIFF_TEST_HELPER_H

#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#define TEST_GREEN "\033[0;32m"
#define TEST_RED   "\033[0;31m"
#define TEST_NC    "\033[0m"

namespace test {

inline int& tests_run() { static int n = 0; return n; }
inline int& tests_failed() { static int n = 0; return n; }
inline std::vector<std::string>& failed_tests() { static std::vector<std::string> v; return v; }

//=============================================================================
// Test Runner
//=============================================================================

inline void run_test(const char* name, std::function<void()> fn) {
    ++tests_run();
    try {
        fn();
        std::cout << TEST_GREEN "[PASS]" TEST_NC " " << name << "\n";
    } catch (const std::exception& e) {
        ++tests_failed();
        failed_tests().push_back(name);
        std::cout << TEST_RED "[FAIL]" TEST_NC " " << name << " (" << e.what() << ")\n";
    }
}

inline int print_summary() {
    std::cout << "\nTotal:  " << tests_run() << "\n"
              << "Passed: " << (tests_run() - tests_failed()) << "\n"
              << "Failed: " << tests_failed() << "\n";
    for (const auto& name : failed_tests()) {
        std::cout << "  - " << name << "\n";
    }
    return tests_failed() > 0 ? 1 : 0;
}

// Enums print as their underlying value
template<typename T>
auto to_printable(T val) -> typename std::enable_if<std::is_enum<T>::value, long long>::type {
    return static_cast<long long>(val);
}
template<typename T>
auto to_printable(T val) -> typename std::enable_if<!std::is_enum<T>::value, T>::type {
    return val;
}

inline std::string where(const char* file, int line) {
    return std::string(file) + ":" + std::to_string(line) + ": ";
}

} // namespace test

//=============================================================================
// TEST Macro (runs during static initialization)
//=============================================================================

#define TEST(name) \
    void test_##name(); \
    struct TestRunner_##name { \
        TestRunner_##name() { test::run_test(#name, test_##name); } \
    } test_runner_instance_##name; \
    void test_##name()

//=============================================================================
// Assert Macros
//=============================================================================

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) throw std::runtime_error(test::where(__FILE__, __LINE__) + "ASSERT_TRUE: " #cond); \
} while(0)

#define ASSERT_FALSE(cond) do { \
    if (cond) throw std::runtime_error(test::where(__FILE__, __LINE__) + "ASSERT_FALSE: " #cond); \
} while(0)

#define ASSERT_EQ(a, b) do { \
    auto va_ = (a); auto vb_ = (b); \
    if (!(va_ == vb_)) { \
        std::ostringstream ss; \
        ss << test::where(__FILE__, __LINE__) << #a << " (" << test::to_printable(va_) \
           << ") != " << #b << " (" << test::to_printable(vb_) << ")"; \
        throw std::runtime_error(ss.str()); \
    } \
} while(0)

#define ASSERT_NE(a, b) do { \
    auto va_ = (a); auto vb_ = (b); \
    if (va_ == vb_) { \
        std::ostringstream ss; \
        ss << test::where(__FILE__, __LINE__) << #a << " == " << #b \
           << " (" << test::to_printable(va_) << ")"; \
        throw std::runtime_error(ss.str()); \
    } \
} while(0)

// `stmt` must throw `ex_type`; the caught exception is available as `ex`
// inside `checks`
#define ASSERT_THROWS(stmt, ex_type, checks) do { \
    bool thrown_ = false; \
    try { stmt; } \
    catch (const ex_type& ex) { thrown_ = true; checks; } \
    if (!thrown_) throw std::runtime_error(test::where(__FILE__, __LINE__) + "expected " #ex_type " from " #stmt); \
} while(0)

#endif // YAMLDIFF_TEST_HELPER_H
