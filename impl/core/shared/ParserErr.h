#pragma once

#ifndef PARSER_ERR_H
#define PARSER_ERR_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include "Token.h"

namespace TSON {
    enum class ErrorCode {
        // Raised by the scanner
        UnterminatedString,
        UnrecognisedSymbol,
        UnrecognisedLiteral,
        InvalidNumber,
        InvalidEscapeSequence,

        // Raised by the parser
        ExpectedEndOfSource,
        ExpectedToken,
        UnexpectedToken,
        UnknownProperty,
        MissingProperty,

        // Raised by both
        UnexpectedEndOfSource
    };

    const char* ErrorCodeName(ErrorCode code);

    // Raised for internal invariant violations only. Never produced by bad input.
    class BugError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    class ParserErrKind {
    public:
        ParserErrKind(ErrorCode code) : code(code) {}

        static ParserErrKind ExpectedToken(Token::Kind kind) {
            ParserErrKind errKind(ErrorCode::ExpectedToken);
            errKind.expected = kind;
            return errKind;
        }

        static ParserErrKind MissingProperty(std::string name) {
            ParserErrKind errKind(ErrorCode::MissingProperty);
            errKind.property = std::move(name);
            return errKind;
        }

        ErrorCode getCode() const {
            return code;
        }

        // Meaningful for ErrorCode::ExpectedToken only.
        Token::Kind getExpected() const {
            return expected;
        }

        // Meaningful for ErrorCode::MissingProperty only.
        const std::string& getProperty() const {
            return property;
        }

        // "UnexpectedToken", "ExpectedToken(Colon)", "MissingProperty(age)"
        std::string toString() const;

        bool operator==(const ParserErrKind& other) const;
        bool operator!=(const ParserErrKind& other) const { return !(*this == other); }

    protected:
        ErrorCode code;
        Token::Kind expected = Token::Kind::Null;
        std::string property;
    };

    struct ParserErr {
        ParserErrKind kind;
        std::size_t line;
        std::string lexeme;

        std::string toString() const;

        bool operator==(const ParserErr& other) const {
            return kind == other.kind && line == other.line && lexeme == other.lexeme;
        }
        bool operator!=(const ParserErr& other) const { return !(*this == other); }
    };

    // Either a parsed value or the first error that stopped the parse.
    template <typename T>
    class Result {
    public:
        Result(T value) : storage(std::in_place_index<0>, std::move(value)) {}
        Result(ParserErr error) : storage(std::in_place_index<1>, std::move(error)) {}

        bool ok() const {
            return storage.index() == 0;
        }

        explicit operator bool() const {
            return ok();
        }

        T& value() & {
            if (!ok()) throw BugError("[BUG] Result::value() called on an error result: " + error().toString());
            return std::get<0>(storage);
        }

        const T& value() const& {
            if (!ok()) throw BugError("[BUG] Result::value() called on an error result: " + error().toString());
            return std::get<0>(storage);
        }

        T&& value() && {
            if (!ok()) throw BugError("[BUG] Result::value() called on an error result: " + error().toString());
            return std::get<0>(std::move(storage));
        }

        const ParserErr& error() const {
            if (ok()) throw BugError("[BUG] Result::error() called on a successful result");
            return std::get<1>(storage);
        }

        T& operator*() & { return value(); }
        const T& operator*() const& { return value(); }
        T&& operator*() && { return std::move(*this).value(); }
        T* operator->() { return &value(); }
        const T* operator->() const { return &value(); }

    protected:
        std::variant<T, ParserErr> storage;
    };
};

#endif
