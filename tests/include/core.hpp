#pragma once

// =============================================================================
// celio - Test Registration and Execution Framework
// =============================================================================
//
// Header-only test harness shared by every tests/src/test_*.cpp executable.
//
// Features:
//   - Auto-registration via __COUNTER__
//   - Name filtering, fail-fast, list mode
//   - Colored output, quiet unless a test fails or -v is given
//   - Assertion macros with expected / actual reporting
//
// Usage:
//   CELIO_TEST_BEGIN
//
//   CELIO_TEST_UNIT(my_test) {
//       CELIO_ASSERT_EQ(1 + 1, 2);
//   }
//
//   CELIO_TEST_END
//   CELIO_TEST_MAIN()
//
// CLI:
//   ./test --help                     # Show all options
//   ./test --filter "sparse"          # Filter by name substring
//   ./test --fail-fast                # Stop on first failure
//   ./test --list                     # List tests and exit
//   ./test -v                         # Verbose output
//
// =============================================================================

#ifndef CELIO_TEST_HPP
#define CELIO_TEST_HPP

#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#define CELIO_UNIX_LIKE 1
#else
#define CELIO_UNIX_LIKE 0
#endif

// =============================================================================
// Configuration
// =============================================================================

namespace celio::test {

constexpr std::size_t MAX_TEST_UNITS = 512;

} // namespace celio::test

// =============================================================================
// Terminal Colors
// =============================================================================

namespace celio::test::color {

inline bool& enabled() {
    static bool on = true;
    return on;
}

inline const char* pick(const char* code) { return enabled() ? code : ""; }

inline const char* reset()   { return pick("\033[0m"); }
inline const char* bold()    { return pick("\033[1m"); }
inline const char* dim()     { return pick("\033[2m"); }
inline const char* red()     { return pick("\033[38;5;203m"); }
inline const char* green()   { return pick("\033[38;5;114m"); }
inline const char* cyan()    { return pick("\033[38;5;80m"); }

} // namespace celio::test::color

// =============================================================================
// Exception Classes
// =============================================================================

namespace celio::test {

class TestException : public std::exception {
public:
    TestException(const char* file, int line, const std::string& message,
                  const std::string& expected = "", const std::string& actual = "")
        : file_(file), line_(line), message_(message),
          expected_(expected), actual_(actual) {

        std::ostringstream oss;
        oss << file << ":" << line << ": " << message;
        if (!expected.empty() || !actual.empty()) {
            oss << "\n  Expected: " << expected;
            oss << "\n  Actual:   " << actual;
        }
        full_message_ = oss.str();
    }

    const char* what() const noexcept { return full_message_.c_str(); }
    const char* file() const { return file_; }
    int line() const { return line_; }
    const std::string& message() const { return message_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    const char* file_;
    int line_;
    std::string message_;
    std::string expected_;
    std::string actual_;
    std::string full_message_;
};

} // namespace celio::test

// =============================================================================
// Test Metadata and Results
// =============================================================================

namespace celio::test {

enum class TestStatus {
    PENDING,
    PASSED,
    FAILED,
    ERROR       // a celio or std exception escaped the test body
};

inline const char* status_string(TestStatus status) {
    switch (status) {
        case TestStatus::PENDING:  return "PENDING";
        case TestStatus::PASSED:   return "PASSED";
        case TestStatus::FAILED:   return "FAILED";
        case TestStatus::ERROR:    return "ERROR";
        default:                   return "UNKNOWN";
    }
}

using test_func_t = void(*)();

struct TestInfo {
    test_func_t func = nullptr;
    const char* name_str = nullptr;
    const char* file = nullptr;
    int line = 0;
};

struct TestResult {
    const TestInfo* test = nullptr;
    TestStatus status = TestStatus::PENDING;
    double duration_ms = 0.0;
    std::string error_message;
    std::string error_file;
    int error_line = 0;
    std::string expected_value;
    std::string actual_value;
};

} // namespace celio::test

// =============================================================================
// Global Test Storage
// =============================================================================

namespace celio::test::detail {

inline std::array<TestInfo, MAX_TEST_UNITS>& get_tests() {
    static std::array<TestInfo, MAX_TEST_UNITS> tests{};
    return tests;
}

inline std::size_t& get_count() {
    static std::size_t count = 0;
    return count;
}

inline void register_test(std::size_t idx, TestInfo info) {
    if (idx >= MAX_TEST_UNITS) {
        std::fprintf(stderr, "celio test: too many tests in one executable\n");
        std::exit(2);
    }
    get_tests()[idx] = std::move(info);
    if (idx + 1 > get_count()) get_count() = idx + 1;
}

} // namespace celio::test::detail

// =============================================================================
// Test Configuration
// =============================================================================

namespace celio::test {

struct Config {
    bool verbose = false;
    bool fail_fast = false;
    bool list_tests = false;
    const char* filter = nullptr;

    static Config& instance() {
        static Config cfg;
        return cfg;
    }
};

// =============================================================================
// CLI Parser
// =============================================================================

inline void print_help(const char* prog_name) {
    std::printf("Usage: %s [options]\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -h, --help          Show this message\n");
    std::printf("  -v, --verbose       Print every test result\n");
    std::printf("  --filter <text>     Run tests whose name contains <text>\n");
    std::printf("  --fail-fast         Stop at the first failure\n");
    std::printf("  --list              List tests and exit\n");
    std::printf("  --no-color          Disable ANSI colors\n\n");
    std::printf("Environment:\n");
    std::printf("  CELIO_TEST_FILTER   Same as --filter\n");
}

inline void parse_args(int argc, char* argv[]) {
    auto& cfg = Config::instance();

#if CELIO_UNIX_LIKE
    color::enabled() = ::isatty(STDOUT_FILENO) != 0;
#else
    color::enabled() = false;
#endif

    if (const char* env = std::getenv("CELIO_TEST_FILTER")) {
        cfg.filter = env;
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }
        else if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            cfg.verbose = true;
        }
        else if (std::strcmp(arg, "--filter") == 0 && i + 1 < argc) {
            cfg.filter = argv[++i];
        }
        else if (std::strcmp(arg, "--fail-fast") == 0) {
            cfg.fail_fast = true;
        }
        else if (std::strcmp(arg, "--list") == 0) {
            cfg.list_tests = true;
        }
        else if (std::strcmp(arg, "--no-color") == 0) {
            color::enabled() = false;
        }
        else {
            std::fprintf(stderr, "Unknown option: %s (try --help)\n", arg);
            std::exit(2);
        }
    }
}

// =============================================================================
// Reporters
// =============================================================================

class Reporter {
public:
    void on_run_start(int total_tests) {
        std::printf("\n%s==== celio tests ====%s  Tests: %s%d%s\n\n",
                    color::bold(), color::reset(), color::bold(), total_tests, color::reset());
    }

    void on_test_end(const TestResult& result) {
        const auto& cfg = Config::instance();
        switch (result.status) {
            case TestStatus::PASSED:
                if (cfg.verbose) {
                    std::printf("  %sPASS%s %s %s(%.2f ms)%s\n", color::green(), color::reset(),
                                result.test->name_str, color::dim(), result.duration_ms,
                                color::reset());
                }
                break;
            default:
                print_failure(result);
                break;
        }
    }

    void on_run_end(const std::vector<TestResult>& results, double total_time) {
        int passed = 0, failed = 0;
        for (const auto& r : results) {
            if (r.status == TestStatus::PASSED) ++passed;
            else ++failed;
        }
        std::printf("\n  %s%d passed%s", color::green(), passed, color::reset());
        if (failed) std::printf(", %s%d failed%s", color::red(), failed, color::reset());
        std::printf(" in %.3f s\n\n", total_time);
    }

private:
    static void print_failure(const TestResult& result) {
        std::printf("  %s%s%s %s\n", color::red(), status_string(result.status), color::reset(),
                    result.test->name_str);
        if (!result.error_file.empty()) {
            std::printf("    %s%s:%d%s\n", color::dim(), result.error_file.c_str(),
                        result.error_line, color::reset());
        }
        std::printf("    %s\n", result.error_message.c_str());
        if (!result.expected_value.empty() || !result.actual_value.empty()) {
            std::printf("    Expected: %s%s%s\n", color::cyan(), result.expected_value.c_str(),
                        color::reset());
            std::printf("    Actual:   %s%s%s\n", color::red(), result.actual_value.c_str(),
                        color::reset());
        }
    }
};

// =============================================================================
// Test Runner
// =============================================================================

class Runner {
public:
    Runner() : cfg_(Config::instance()) {}

    int run() {
        std::vector<std::size_t> test_indices;
        const auto& tests = detail::get_tests();
        const std::size_t count = detail::get_count();

        for (std::size_t i = 0; i < count; ++i) {
            if (!tests[i].func) continue;
            if (!should_run(tests[i])) continue;
            test_indices.push_back(i);
        }

        if (cfg_.list_tests) {
            for (std::size_t idx : test_indices) {
                std::printf("%s  %s%s:%d%s\n", tests[idx].name_str, color::dim(),
                            tests[idx].file, tests[idx].line, color::reset());
            }
            return 0;
        }

        reporter_.on_run_start(static_cast<int>(test_indices.size()));
        auto start_time = std::chrono::steady_clock::now();

        for (std::size_t idx : test_indices) {
            results_.push_back(run_test(tests[idx]));
            reporter_.on_test_end(results_.back());
            if (cfg_.fail_fast && is_failure(results_.back().status)) break;
        }

        auto end_time = std::chrono::steady_clock::now();
        reporter_.on_run_end(results_,
            std::chrono::duration<double>(end_time - start_time).count());

        for (const auto& r : results_) {
            if (is_failure(r.status)) return 1;
        }
        return 0;
    }

private:
    const Config& cfg_;
    Reporter reporter_;
    std::vector<TestResult> results_;

    static bool is_failure(TestStatus status) {
        return status == TestStatus::FAILED || status == TestStatus::ERROR;
    }

    bool should_run(const TestInfo& test) const {
        if (cfg_.filter && std::strstr(test.name_str, cfg_.filter) == nullptr) {
            return false;
        }
        return true;
    }

    static TestResult run_test(const TestInfo& test) {
        TestResult result;
        result.test = &test;

        auto t0 = std::chrono::steady_clock::now();
        try {
            test.func();
            result.status = TestStatus::PASSED;
        } catch (const TestException& e) {
            result.status = TestStatus::FAILED;
            result.error_message = e.message();
            result.error_file = e.file();
            result.error_line = e.line();
            result.expected_value = e.expected();
            result.actual_value = e.actual();
        } catch (const std::exception& e) {
            result.status = TestStatus::ERROR;
            result.error_message = std::string("Uncaught exception: ") + e.what();
        }
        auto t1 = std::chrono::steady_clock::now();
        result.duration_ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        return result;
    }
};

} // namespace celio::test

// =============================================================================
// Assertion Macros
// =============================================================================

// Helper to convert values to strings
namespace celio::test::detail {

template <typename T>
concept Streamable = requires(std::ostream& os, const T& v) { os << v; };

template <typename T>
inline std::string to_string_impl(const T& value) {
    if constexpr (std::is_enum_v<T>) {
        return std::to_string(static_cast<long long>(value));
    } else if constexpr (Streamable<T>) {
        std::ostringstream oss;
        oss << std::boolalpha << value;
        return oss.str();
    } else {
        return "<value>";
    }
}

inline std::string to_string_impl(const char* value) {
    return value ? std::string("\"") + value + "\"" : "nullptr";
}

inline std::string to_string_impl(const std::string& value) {
    return "\"" + value + "\"";
}

template <typename T>
inline std::string value_to_string(const T& value) {
    return to_string_impl(value);
}

} // namespace celio::test::detail

/// Equality assertion
#define CELIO_ASSERT_EQ(expected, actual) \
    do { \
        auto&& _exp = (expected); \
        auto&& _act = (actual); \
        if (!(_exp == _act)) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Expected equality: " #expected " == " #actual, \
                ::celio::test::detail::value_to_string(_exp), \
                ::celio::test::detail::value_to_string(_act)); \
        } \
    } while (0)

/// Inequality assertion
#define CELIO_ASSERT_NE(expected, actual) \
    do { \
        auto&& _exp = (expected); \
        auto&& _act = (actual); \
        if (_exp == _act) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Expected inequality: " #expected " != " #actual, \
                "not " + ::celio::test::detail::value_to_string(_exp), \
                ::celio::test::detail::value_to_string(_act)); \
        } \
    } while (0)

/// True assertion
#define CELIO_ASSERT_TRUE(expr) \
    do { \
        if (!(expr)) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Expected true: " #expr, "true", "false"); \
        } \
    } while (0)

/// False assertion
#define CELIO_ASSERT_FALSE(expr) \
    do { \
        if (expr) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Expected false: " #expr, "false", "true"); \
        } \
    } while (0)

/// Floating-point near assertion
#define CELIO_ASSERT_NEAR(expected, actual, tolerance) \
    do { \
        auto _exp = static_cast<double>(expected); \
        auto _act = static_cast<double>(actual); \
        auto _tol = static_cast<double>(tolerance); \
        if (std::abs(_exp - _act) > _tol) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Expected near: |" #expected " - " #actual "| <= " #tolerance, \
                std::to_string(_exp) + " +- " + std::to_string(_tol), \
                std::to_string(_act)); \
        } \
    } while (0)

/// String contains
#define CELIO_ASSERT_STR_CONTAINS(haystack, needle) \
    do { \
        std::string _hay(haystack); \
        std::string _ndl(needle); \
        if (_hay.find(_ndl) == std::string::npos) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "String does not contain substring", \
                "contains \"" + _ndl + "\"", \
                "\"" + _hay + "\""); \
        } \
    } while (0)

/// Exception assertion
#define CELIO_ASSERT_THROWS(expr, exception_type) \
    do { \
        bool _caught = false; \
        try { \
            expr; \
        } catch (const exception_type&) { \
            _caught = true; \
        } catch (const std::exception& _e) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Wrong exception type thrown by: " #expr, \
                #exception_type, _e.what()); \
        } \
        if (!_caught) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Expected exception not thrown: " #expr, \
                #exception_type, "no exception"); \
        } \
    } while (0)

/// No exception assertion
#define CELIO_ASSERT_NO_THROW(expr) \
    do { \
        try { \
            expr; \
        } catch (const std::exception& _e) { \
            throw ::celio::test::TestException(__FILE__, __LINE__, \
                "Unexpected exception: " #expr, \
                "no exception", _e.what()); \
        } \
    } while (0)

/// Fail immediately
#define CELIO_FAIL(msg) \
    throw ::celio::test::TestException(__FILE__, __LINE__, msg)

// =============================================================================
// Test Registration Macros
// =============================================================================

/// Begin test file
#define CELIO_TEST_BEGIN \
    namespace { \
    static constexpr std::size_t _celio_test_base = __COUNTER__;

/// Define a test unit
#define CELIO_TEST_UNIT(name) \
    static void _celio_test_##name(); \
    [[maybe_unused]] static bool _celio_reg_##name = []() { \
        constexpr std::size_t idx = __COUNTER__ - _celio_test_base - 1; \
        ::celio::test::TestInfo info; \
        info.func = _celio_test_##name; \
        info.name_str = #name; \
        info.file = __FILE__; \
        info.line = __LINE__; \
        ::celio::test::detail::register_test(idx, std::move(info)); \
        return true; \
    }(); \
    static void _celio_test_##name()

/// End test file
#define CELIO_TEST_END \
    } /* anonymous namespace */

/// Generate main()
#define CELIO_TEST_MAIN() \
    int main(int argc, char* argv[]) { \
        ::celio::test::parse_args(argc, argv); \
        ::celio::test::Runner runner; \
        return runner.run(); \
    }

#endif // CELIO_TEST_HPP
