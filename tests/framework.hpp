/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file framework.hpp
 * @brief A lightweight, header-only unit testing micro-framework for chronoid.
 *
 * @details
 * Assertions throw `AssertionFailure`; `run` catches it (and any other exception
 * escaping a test body), reports the test as failed and counts it exactly once.
 */

#pragma once

#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace chronoid::test {

// ========================================================================
// Global Metrics
// ========================================================================

inline int passed_count = 0; ///< Cumulative successful test counter.
inline int failed_count = 0; ///< Cumulative failed test counter.

/**
 * @class AssertionFailure
 * @brief Thrown by assertion primitives after the failure has been printed.
 */
class AssertionFailure : public std::runtime_error {
  public:
    AssertionFailure() : std::runtime_error("Assertion failed") {}
};

// ========================================================================
// Assertion Primitives
// ========================================================================

/**
 * @brief Validates that two values are equivalent.
 */
template <typename T, typename U>
void assert_eq(const T& val1, const U& val2, const char* file, int line, const char* expr)
{
    if (!(val1 == val2)) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " != " << val2 << ")"
                  << std::endl;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that two values are NOT equivalent.
 */
template <typename T, typename U>
void assert_ne(const T& val1, const U& val2, const char* file, int line, const char* expr)
{
    if (val1 == val2) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " (" << val1 << " == " << val2 << ")"
                  << std::endl;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that a boolean expression evaluates to the expected value.
 */
inline void assert_bool(bool cond, bool expected, const char* file, int line, const char* expr)
{
    if (cond != expected) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line
                  << " -> Assertion failed: " << expr << " is " << (cond ? "TRUE" : "FALSE")
                  << std::endl;
        throw AssertionFailure();
    }
}

/**
 * @brief Validates that `func` throws an exception of type `E`.
 */
template <typename E>
void assert_throws(const std::function<void()>& func, const char* file, int line, const char* expr,
                   const char* type)
{
    try {
        func();
    } catch (const E&) {
        return;
    } catch (const std::exception& e) {
        std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
                  << " threw the wrong exception (" << e.what() << "), expected " << type
                  << std::endl;
        throw AssertionFailure();
    }
    std::cout << "\033[31m[FAIL]\033[0m " << file << ":" << line << " -> " << expr
              << " did not throw " << type << std::endl;
    throw AssertionFailure();
}

// ========================================================================
// Execution Orchestrator
// ========================================================================

/**
 * @brief Executes a test case within a protected execution context.
 */
inline void run(std::string_view name, const std::function<void()>& func)
{
    std::cout << "[RUN  ] " << name << "... " << std::flush;
    try {
        func();
        std::cout << "\r\033[32m[PASS]\033[0m " << name << "          " << std::endl;
        passed_count++;
        return;
    } catch (const AssertionFailure&) {
        // Details already printed by the assertion primitive.
    } catch (const std::exception& e) {
        std::cout << "\n\033[31m[FAIL]\033[0m Unexpected exception: " << e.what() << std::endl;
    }
    std::cout << "\r\033[31m[FAIL]\033[0m " << name << "          " << std::endl;
    failed_count++;
}

/**
 * @brief Emits a summary report of the current test session.
 */
inline void print_summary()
{
    std::cout << "\n\033[36m=== chronoid Test Summary ===\033[0m" << std::endl;
    std::cout << "Passed: " << passed_count << std::endl;
    if (failed_count > 0) {
        std::cout << "Failed: \033[31m" << failed_count << "\033[0m" << std::endl;
    } else {
        std::cout << "Failed: 0" << std::endl;
    }
    std::cout << "Total:  " << (passed_count + failed_count) << std::endl;
}

} // namespace chronoid::test

// ============================================================================
// API Macros
// ============================================================================

#define ASSERT_EQ(a, b) chronoid::test::assert_eq((a), (b), __FILE__, __LINE__, #a " == " #b)

#define ASSERT_NE(a, b) chronoid::test::assert_ne((a), (b), __FILE__, __LINE__, #a " != " #b)

#define ASSERT_TRUE(a) chronoid::test::assert_bool((a), true, __FILE__, __LINE__, #a)

#define ASSERT_FALSE(a) chronoid::test::assert_bool((a), false, __FILE__, __LINE__, #a)

/**
 * @def ASSERT_THROWS
 * @brief Asserts that evaluating `expr` throws `exception_type`.
 */
#define ASSERT_THROWS(expr, exception_type)                                                        \
    chronoid::test::assert_throws<exception_type>([&]() { (void)(expr); }, __FILE__, __LINE__,   \
                                                  #expr, #exception_type)

#define RUN_TEST(func_name) chronoid::test::run(#func_name, func_name)
