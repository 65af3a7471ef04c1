#include <optional>
#include <string>
#include <string_view>
#include "TsonParser.h"

namespace TSONParser {
    namespace {
        constexpr const char* BUG_PREV_BEFORE_ADVANCE = "[BUG] Called previous before advancing - no previous value";
        constexpr const char* BUG_NO_TOKEN_ERR_REPORT = "[BUG] Failed to get token for reporting error";
    }

    TSON::Result<Parser> Parser::Create(std::string_view source) {
        Parser parser(source);

        auto first = parser.scanner.NextToken();
        if (!first) return first.error();
        parser.current = std::move(first).value();

        return TSON::Result<Parser>(std::move(parser));
    }

    TSON::Result<Token::Token> Parser::peek() const {
        if (!current) {
            return makeErr(TSON::ErrorCode::UnexpectedEndOfSource);
        }
        return *current;
    }

    TSON::Result<bool> Parser::check(Token::Kind kind) const {
        auto token = peek();
        if (!token) return token.error();
        return token->type == kind;
    }

    TSON::Result<Token::Token> Parser::advance() {
        if (!current) {
            return makeErr(TSON::ErrorCode::UnexpectedEndOfSource);
        }

        prev = std::move(current);
        current.reset();

        auto next = scanner.NextToken();
        if (!next) return next.error();
        current = std::move(next).value();

        return *prev;
    }

    TSON::Result<Token::Token> Parser::consume(Token::Kind kind) {
        auto matches = check(kind);
        if (!matches) return matches.error();

        if (*matches) {
            return advance();
        }

        return makeErr(TSON::ParserErrKind::ExpectedToken(kind));
    }

    TSON::Result<Token::Token> Parser::memberKey() {
        auto key = advance();
        if (!key) return key;
        if (key->type != Token::Kind::String) {
            return makeErrPrev(TSON::ErrorCode::UnexpectedToken);
        }

        auto colon = consume(Token::Kind::Colon);
        if (!colon) return colon.error();

        return key;
    }

    const Token::Token& Parser::previous() const {
        if (!prev) {
            throw TSON::BugError(BUG_PREV_BEFORE_ADVANCE);
        }
        return *prev;
    }

    TSON::ParserErr Parser::makeErr(TSON::ParserErrKind kind) const {
        if (current) return makeErrFromToken(std::move(kind), *current);
        if (prev) return makeErrFromToken(std::move(kind), *prev);

        // Nothing was ever scanned, the source is empty or blank
        return TSON::ParserErr{ std::move(kind), scanner.GetLine(), "" };
    }

    TSON::ParserErr Parser::makeErrPrev(TSON::ParserErrKind kind) const {
        if (!prev) {
            throw TSON::BugError(BUG_NO_TOKEN_ERR_REPORT);
        }
        return makeErrFromToken(std::move(kind), *prev);
    }

    TSON::ParserErr Parser::makeErrFromToken(TSON::ParserErrKind kind, const Token::Token& token) const {
        return TSON::ParserErr{ std::move(kind), token.line, token.value };
    }
}
