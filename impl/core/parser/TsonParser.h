#pragma once

#ifndef TSON_PARSER_H
#define TSON_PARSER_H

#include <optional>
#include <string_view>
#include <utility>
#include "../shared/Token.h"
#include "../shared/ParserErr.h"
#include "../scanner/TsonScanner.h"

namespace TSONParser {
    // Cursor over the scanner's token stream: one token of lookahead
    // (current) plus the last consumed token (prev), used for diagnostics.
    class Parser {
    public:
        // Primes the cursor with the first token. Fails only if that first
        // token is malformed; an empty source gives a cursor already at end.
        static TSON::Result<Parser> Create(std::string_view source);

        Parser(const Parser&) = delete;
        Parser& operator=(const Parser&) = delete;
        Parser(Parser&&) = default;
        Parser& operator=(Parser&&) = default;

        // Current token, or UnexpectedEndOfSource when the input is exhausted.
        TSON::Result<Token::Token> peek() const;

        // Compares kinds only, any String token matches Kind::String.
        TSON::Result<bool> check(Token::Kind kind) const;

        // Moves current into prev and pulls the next token from the scanner.
        // Returns the token that was just consumed.
        TSON::Result<Token::Token> advance();

        // advance() if the current token has the given kind, otherwise
        // ExpectedToken(kind) at the current token.
        TSON::Result<Token::Token> consume(Token::Kind kind);

        // Object member name followed by ':'. Returns the key token. A key
        // that is not a string is UnexpectedToken at that key.
        TSON::Result<Token::Token> memberKey();

        // Last consumed token. Throws TSON::BugError before the first advance().
        const Token::Token& previous() const;

        bool isAtEnd() const {
            return !current.has_value();
        }

        // Anchored at the current token, falling back to the previous one
        // once the input is exhausted.
        TSON::ParserErr makeErr(TSON::ParserErrKind kind) const;
        // Anchored at the token that was just consumed.
        TSON::ParserErr makeErrPrev(TSON::ParserErrKind kind) const;
        TSON::ParserErr makeErrFromToken(TSON::ParserErrKind kind, const Token::Token& token) const;

        // Comma separated elements up to and including `closing`. The opening
        // bracket must already be consumed. parseElement returns the error that
        // stopped it, or std::nullopt. A comma directly before `closing` is
        // UnexpectedToken at the comma.
        template <typename ElementFn>
        std::optional<TSON::ParserErr> parseDelimited(Token::Kind closing, ElementFn&& parseElement) {
            auto empty = check(closing);
            if (!empty) return empty.error();

            if (!*empty) {
                while (true) {
                    if (auto err = parseElement()) return err;

                    auto comma = check(Token::Kind::Comma);
                    if (!comma) return comma.error();
                    if (!*comma) break;

                    if (auto next = advance(); !next) return next.error();

                    auto trailing = check(closing);
                    if (!trailing) return trailing.error();
                    if (*trailing) return makeErrPrev(TSON::ErrorCode::UnexpectedToken);
                }
            }

            auto close = consume(closing);
            if (!close) return close.error();
            return std::nullopt;
        }

    protected:
        TSONScanner::Scanner scanner;
        std::optional<Token::Token> prev;
        std::optional<Token::Token> current;

        explicit Parser(std::string_view source) : scanner(source) {}
    };
};

#endif
