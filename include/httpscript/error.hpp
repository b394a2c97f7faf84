/*
 * HTTPScript Error Types
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Exception hierarchy shared by every stage. ParseError, TransportError and
 *   ScriptError are fatal and abort the run; failed tests are collected and
 *   reported together through TestFailuresError once every request ran.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "httpscript/parse/selection.hpp"

namespace httpscript {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Grammar or structural violation in a script file.
class ParseError : public Error {
public:
    ParseError(const std::string& message, Selection selection)
        : Error(message), m_selection(std::move(selection)) {}

    const Selection& selection() const noexcept { return m_selection; }

private:
    Selection m_selection;
};

// Network / protocol failure reported by the HttpClient.
class TransportError : public Error {
public:
    using Error::Error;
};

// Uncaught exception raised by a handler script (outside client.test).
class ScriptError : public Error {
public:
    explicit ScriptError(const std::string& message, std::optional<Selection> selection = std::nullopt)
        : Error(message), m_selection(std::move(selection)) {}

    const std::optional<Selection>& selection() const noexcept { return m_selection; }

private:
    std::optional<Selection> m_selection;
};

// Bad environment file, rc file, command line or format string.
class ConfigError : public Error {
public:
    using Error::Error;
};

struct TestFailure {
    std::string request; // display name, e.g. "api.http / #2"
    std::string test;
    std::string message;
};

// Raised at the end of a run that completed but had failing tests.
class TestFailuresError : public Error {
public:
    explicit TestFailuresError(std::vector<TestFailure> failures)
        : Error(describe(failures)), m_failures(std::move(failures)) {}

    const std::vector<TestFailure>& failures() const noexcept { return m_failures; }

private:
    static std::string describe(const std::vector<TestFailure>& failures) {
        std::string out = "failed tests:";
        for (const auto& f : failures) {
            out += "\n  `" + f.test + "` in [" + f.request + "]";
            if (!f.message.empty()) out += ": " + f.message;
        }
        return out;
    }

    std::vector<TestFailure> m_failures;
};

} // namespace httpscript
