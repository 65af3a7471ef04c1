#pragma once

#ifndef TSON_PARSE_H
#define TSON_PARSE_H

#include <charconv>
#include <cmath>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../shared/Token.h"
#include "../shared/ParserErr.h"
#include "../shared/JsonValue.h"
#include "TsonParser.h"
#include "TsonRecord.h"

namespace TSON {
    template <typename T> struct IsOptional : std::false_type {};
    template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};

    template <typename T> struct IsSequence : std::false_type {};
    template <typename T, typename A> struct IsSequence<std::vector<T, A>> : std::true_type {};

    template <typename T> struct IsStringMap : std::false_type {};
    template <typename V, typename H, typename E, typename A>
    struct IsStringMap<std::unordered_map<std::string, V, H, E, A>> : std::true_type {};
    template <typename V, typename C, typename A>
    struct IsStringMap<std::map<std::string, V, C, A>> : std::true_type {};

    // Character types are text, not numbers
    template <typename T>
    inline constexpr bool IsCharType =
        std::is_same_v<T, char> || std::is_same_v<T, wchar_t> || std::is_same_v<T, char8_t> ||
        std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

    template <typename T>
    inline constexpr bool IsJsonNumber =
        std::is_arithmetic_v<T> && !std::is_same_v<T, bool> && !IsCharType<T>;

    template <typename T>
    inline constexpr bool AlwaysFalse = false;

    // True when an out-of-range number lexeme is too small rather than too
    // large, i.e. its leading significant digit sits below the decimal point
    // once the exponent is applied. The lexeme has already been shape-checked
    // by the scanner.
    inline bool IsUnderflow(std::string_view text) {
        std::size_t i = 0;
        if (i < text.size() && text[i] == '-') ++i;

        long long magnitude = 0;
        bool significant = false;
        std::size_t intDigits = 0;
        for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
            if (text[i] != '0') significant = true;
            if (significant) ++intDigits;
        }
        if (intDigits > 0) {
            magnitude = static_cast<long long>(intDigits) - 1;
        }

        if (i < text.size() && text[i] == '.') {
            ++i;
            long long leadingZeros = 0;
            for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
                if (!significant) {
                    if (text[i] == '0') {
                        ++leadingZeros;
                    }
                    else {
                        significant = true;
                        magnitude = -(leadingZeros + 1);
                    }
                }
            }
        }

        if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
            ++i;
            bool negative = false;
            if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
                negative = text[i] == '-';
                ++i;
            }
            // Saturates well past any floating exponent range
            long long exponent = 0;
            for (; i < text.size() && text[i] >= '0' && text[i] <= '9'; ++i) {
                if (exponent < 1000000) exponent = exponent * 10 + (text[i] - '0');
            }
            magnitude += negative ? -exponent : exponent;
        }

        return significant && magnitude < 0;
    }

    // Consumes the current token if it has the given kind, otherwise
    // UnexpectedToken at that token.
    inline Result<Token::Token> takePrimitive(TSONParser::Parser& parser, Token::Kind kind) {
        auto token = parser.peek();
        if (!token) return token;
        if (token->type != kind) {
            return parser.makeErr(ErrorCode::UnexpectedToken);
        }
        return parser.advance();
    }

    // Parse one value of type T from the cursor. The target type alone
    // selects the grammar, except for JsonValue which follows the token.
    template <typename T>
    Result<T> parseValue(TSONParser::Parser& parser) {
        if constexpr (std::is_same_v<T, JsonValue>) {
            auto token = parser.peek();
            if (!token) return token.error();

            switch (token->type) {
            case Token::Kind::LBrace: {
                auto members = parseValue<JsonValue::object_t>(parser);
                if (!members) return members.error();
                return JsonValue::Object(std::move(members).value());
            }
            case Token::Kind::LBracket: {
                auto elements = parseValue<JsonValue::array_t>(parser);
                if (!elements) return elements.error();
                return JsonValue::Array(std::move(elements).value());
            }
            case Token::Kind::String: {
                auto text = parseValue<std::string>(parser);
                if (!text) return text.error();
                return JsonValue::String(std::move(text).value());
            }
            case Token::Kind::Number: {
                auto number = parseValue<double>(parser);
                if (!number) return number.error();
                return JsonValue::Number(*number);
            }
            case Token::Kind::Bool: {
                auto flag = parseValue<bool>(parser);
                if (!flag) return flag.error();
                return JsonValue::Bool(*flag);
            }
            case Token::Kind::Null: {
                auto null = parser.advance();
                if (!null) return null.error();
                return JsonValue::Null();
            }
            default:
                return parser.makeErr(ErrorCode::UnexpectedToken);
            }
        }
        else if constexpr (std::is_same_v<T, bool>) {
            auto token = takePrimitive(parser, Token::Kind::Bool);
            if (!token) return token.error();
            return token->value == "true";
        }
        else if constexpr (IsJsonNumber<T>) {
            auto token = takePrimitive(parser, Token::Kind::Number);
            if (!token) return token.error();

            // The whole lexeme must convert. "5e2" or "1.5" stop early for
            // integers and "-5" does not convert to an unsigned type at all.
            const std::string& text = token->value;
            T out{};
            auto res = std::from_chars(text.data(), text.data() + text.size(), out);
            if (res.ptr != text.data() + text.size()) {
                return parser.makeErrPrev(ErrorCode::InvalidNumber);
            }
            if constexpr (std::is_floating_point_v<T>) {
                // Too small to represent rounds to a signed zero
                if (res.ec == std::errc::result_out_of_range && IsUnderflow(text)) {
                    return std::copysign(T(0), text.front() == '-' ? T(-1) : T(1));
                }
            }
            if (res.ec != std::errc()) {
                return parser.makeErrPrev(ErrorCode::InvalidNumber);
            }
            return out;
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            auto token = takePrimitive(parser, Token::Kind::String);
            if (!token) return token.error();
            return std::move(token->decoded);
        }
        else if constexpr (IsOptional<T>::value) {
            using Inner = typename T::value_type;

            auto isNull = parser.check(Token::Kind::Null);
            if (!isNull) return isNull.error();
            if (*isNull) {
                auto null = parser.advance();
                if (!null) return null.error();
                return T();
            }

            auto inner = parseValue<Inner>(parser);
            if (!inner) return inner.error();
            return T(std::move(inner).value());
        }
        else if constexpr (IsSequence<T>::value) {
            using Element = typename T::value_type;

            auto open = parser.consume(Token::Kind::LBracket);
            if (!open) return open.error();

            T elements;
            auto err = parser.parseDelimited(Token::Kind::RBracket, [&]() -> std::optional<ParserErr> {
                auto element = parseValue<Element>(parser);
                if (!element) return element.error();
                elements.push_back(std::move(element).value());
                return std::nullopt;
            });
            if (err) return *err;
            return elements;
        }
        else if constexpr (IsStringMap<T>::value) {
            using Mapped = typename T::mapped_type;

            auto open = parser.consume(Token::Kind::LBrace);
            if (!open) return open.error();

            T members;
            auto err = parser.parseDelimited(Token::Kind::RBrace, [&]() -> std::optional<ParserErr> {
                auto key = parser.memberKey();
                if (!key) return key.error();

                auto value = parseValue<Mapped>(parser);
                if (!value) return value.error();

                // Last write wins for repeated keys
                members.insert_or_assign(std::move(key->decoded), std::move(value).value());
                return std::nullopt;
            });
            if (err) return *err;
            return members;
        }
        else if constexpr (IsRecord<T>) {
            return parseRecord<T>(parser);
        }
        else {
            static_assert(AlwaysFalse<T>, "TSON cannot parse this type; specialize TSON::Schema for records");
        }
    }

    // Parse the whole source as exactly one value of type T. Anything after
    // that value is ExpectedEndOfSource.
    template <typename T>
    Result<T> parse(std::string_view source) {
        auto parser = TSONParser::Parser::Create(source);
        if (!parser) return parser.error();

        auto result = parseValue<T>(*parser);
        if (!result) return result;

        if (!parser->isAtEnd()) {
            return parser->makeErr(ErrorCode::ExpectedEndOfSource);
        }
        return result;
    }
};

#endif
