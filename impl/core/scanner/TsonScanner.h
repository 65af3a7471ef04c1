#pragma once

#ifndef TSON_SCANNER_H
#define TSON_SCANNER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include "../shared/Token.h"
#include "../shared/ParserErr.h"

namespace TSONScanner {
    // Pull-based tokenizer over an in-memory source. The source must outlive
    // the scanner. Tokens are produced one at a time, nothing is buffered.
    class Scanner {
    public:
        explicit Scanner(std::string_view source) : source(source) {}

        // Next token, std::nullopt once the source is exhausted, or the
        // lexical error that stopped the scan.
        TSON::Result<std::optional<Token::Token>> NextToken();

        std::size_t GetLine() const {
            return line;
        }

    protected:
        std::string_view source;
        std::size_t tokenStart = 0;
        std::size_t current = 0;
        std::size_t line = 1;

        bool isAtEnd() const;
        std::size_t decodeAt(std::size_t pos, char32_t& cp) const;
        TSON::Result<char32_t> advance();
        std::optional<char32_t> peek() const;
        std::optional<char32_t> peekNext() const;
        void bump();
        bool matches(char32_t c);
        void skipWhitespace();

        Token::Token makeToken(Token::Kind kind, std::string decoded = {});
        TSON::ParserErr makeErr(TSON::ErrorCode code) const;

        TSON::Result<Token::Token> number();
        TSON::Result<Token::Token> literal();
        TSON::Result<Token::Token> string();
        TSON::Result<Token::Token> symbol(char32_t c);
        TSON::Result<char32_t> hex4();
    };

    // Encode a code point as UTF-8
    void AppendUtf8(std::string& out, char32_t cp);
};

#endif
