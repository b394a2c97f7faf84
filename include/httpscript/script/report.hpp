/*
 * HTTPScript test report
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <map>
#include <string>
#include <variant>

namespace httpscript {

struct TestSuccess {};
struct TestError {
    std::string message;
};
using TestResult = std::variant<TestSuccess, TestError>;

inline bool is_failure(const TestResult& r) { return std::holds_alternative<TestError>(r); }

// Tests registered by client.test() during one request, keyed by test name.
class TestsReport {
public:
    void record(const std::string& name, TestResult result) { m_tests[name] = std::move(result); }

    const std::map<std::string, TestResult>& tests() const { return m_tests; }
    bool empty() const { return m_tests.empty(); }
    std::size_t size() const { return m_tests.size(); }

    std::map<std::string, std::string> failed() const {
        std::map<std::string, std::string> out;
        for (const auto& [name, result] : m_tests)
            if (auto e = std::get_if<TestError>(&result)) out[name] = e->message;
        return out;
    }

private:
    std::map<std::string, TestResult> m_tests;
};

} // namespace httpscript
