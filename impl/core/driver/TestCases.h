#pragma once

#ifndef TEST_CASES_H
#define TEST_CASES_H

#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include "../shared/Components.h"

namespace TsonTest {
    // A failing case appends one line per broken expectation; a case that
    // leaves `failures` empty has passed.
    using Failures = std::vector<std::string>;

    struct TestCase {
        std::string name;
        std::function<void(Failures&)> run;
    };

    std::vector<TestCase> ScannerTests();
    std::vector<TestCase> ParserTests();
    std::vector<TestCase> RecordTests();
    std::vector<TestCase> ValueTests();

    inline std::string Quote(std::string_view source) {
        return "`" + std::string(source) + "`";
    }

    inline void Check(Failures& failures, bool condition, const std::string& what) {
        if (!condition) {
            failures.push_back(what);
        }
    }

    template <typename T>
    void ExpectValue(Failures& failures, std::string_view source, const T& expected) {
        auto result = TSON::parse<T>(source);
        if (!result) {
            failures.push_back(Quote(source) + ": expected success, got " + result.error().toString());
            return;
        }
        if (!(*result == expected)) {
            failures.push_back(Quote(source) + ": parsed value differs from the expected one");
        }
    }

    template <typename T>
    void ExpectErr(Failures& failures, std::string_view source, const TSON::ParserErr& expected) {
        auto result = TSON::parse<T>(source);
        if (result) {
            failures.push_back(Quote(source) + ": expected " + expected.toString() + ", got success");
            return;
        }
        if (result.error() != expected) {
            failures.push_back(Quote(source) + ": expected " + expected.toString() + ", got " + result.error().toString());
        }
    }

    template <typename T>
    void ExpectKind(Failures& failures, std::string_view source, const TSON::ParserErrKind& expected) {
        auto result = TSON::parse<T>(source);
        if (result) {
            failures.push_back(Quote(source) + ": expected " + expected.toString() + ", got success");
            return;
        }
        if (result.error().kind != expected) {
            failures.push_back(Quote(source) + ": expected " + expected.toString() + ", got " + result.error().toString());
        }
    }
};

#endif
