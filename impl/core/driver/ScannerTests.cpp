#include <optional>
#include <string>
#include <tuple>
#include <vector>
#include "TestCases.h"

namespace TsonTest {
    namespace {
        // All tokens of `source`, or the first error.
        TSON::Result<std::vector<Token::Token>> scanAll(std::string_view source) {
            TSONScanner::Scanner scanner(source);
            std::vector<Token::Token> tokens;
            while (true) {
                auto next = scanner.NextToken();
                if (!next) return next.error();
                if (!next->has_value()) break;
                tokens.push_back(**next);
            }
            return tokens;
        }

        std::optional<Token::Token> firstToken(Failures& failures, std::string_view source) {
            TSONScanner::Scanner scanner(source);
            auto next = scanner.NextToken();
            if (!next) {
                failures.push_back(Quote(source) + ": unexpected " + next.error().toString());
                return std::nullopt;
            }
            if (!next->has_value()) {
                failures.push_back(Quote(source) + ": no token");
                return std::nullopt;
            }
            return **next;
        }

        void expectScanErr(Failures& failures, std::string_view source, const TSON::ParserErr& expected) {
            auto tokens = scanAll(source);
            if (tokens) {
                failures.push_back(Quote(source) + ": expected " + expected.toString() + ", scanned successfully");
            }
            else if (tokens.error() != expected) {
                failures.push_back(Quote(source) + ": expected " + expected.toString() + ", got " + tokens.error().toString());
            }
        }
    }

    std::vector<TestCase> ScannerTests() {
        using Token::Kind;
        using TSON::ErrorCode;

        return {
            { "scanner/individual tokens", [](Failures& failures) {
                const std::vector<std::tuple<std::string, Kind>> cases = {
                    { "[", Kind::LBracket },
                    { "]", Kind::RBracket },
                    { "{", Kind::LBrace },
                    { "}", Kind::RBrace },
                    { ":", Kind::Colon },
                    { ",", Kind::Comma },
                    { "1234", Kind::Number },
                    { "-1234", Kind::Number },
                    { "1234e5", Kind::Number },
                    { "1234E5", Kind::Number },
                    { "1234.567", Kind::Number },
                    { "1234.567e5", Kind::Number },
                    { "1234.567e+5", Kind::Number },
                    { "1234.567e-5", Kind::Number },
                    { "\"str a_b\"", Kind::String },
                    { "true", Kind::Bool },
                    { "false", Kind::Bool },
                    { "null", Kind::Null },
                };
                for (const auto& [source, kind] : cases) {
                    auto token = firstToken(failures, source);
                    if (!token) continue;
                    Check(failures, token->type == kind,
                        Quote(source) + ": expected " + Token::KindName(kind) + ", got " + Token::KindName(token->type));
                    Check(failures, token->value == source, Quote(source) + ": lexeme is " + Quote(token->value));
                }
            } },
            { "scanner/token sequence", [](Failures& failures) {
                auto tokens = scanAll("{ 1234 12.34 \"hi\" true false null [] }");
                if (!tokens) {
                    failures.push_back(tokens.error().toString());
                    return;
                }
                const std::vector<Kind> expected = {
                    Kind::LBrace, Kind::Number, Kind::Number, Kind::String, Kind::Bool,
                    Kind::Bool, Kind::Null, Kind::LBracket, Kind::RBracket, Kind::RBrace
                };
                Check(failures, tokens->size() == expected.size(), "token count is " + std::to_string(tokens->size()));
                for (size_t i = 0; i < expected.size() && i < tokens->size(); ++i) {
                    Check(failures, (*tokens)[i].type == expected[i],
                        "token " + std::to_string(i) + " is " + Token::KindName((*tokens)[i].type));
                }
                if (tokens->size() > 3) {
                    Check(failures, (*tokens)[3].decoded == "hi", "string token decoded to " + Quote((*tokens)[3].decoded));
                    Check(failures, (*tokens)[3].value == "\"hi\"", "string lexeme keeps its quotes");
                }
            } },
            { "scanner/whitespace and lines", [](Failures& failures) {
                auto tokens = scanAll("{\t\n1234 12.34 \"hi\"\n   \t  \n true \r\n false \rnull [] }");
                if (!tokens) {
                    failures.push_back(tokens.error().toString());
                    return;
                }
                const std::vector<size_t> lines = { 1, 2, 2, 2, 4, 5, 5, 5, 5, 5 };
                Check(failures, tokens->size() == lines.size(), "token count is " + std::to_string(tokens->size()));
                for (size_t i = 0; i < lines.size() && i < tokens->size(); ++i) {
                    Check(failures, (*tokens)[i].line == lines[i],
                        "token " + std::to_string(i) + " on line " + std::to_string((*tokens)[i].line));
                }
            } },
            { "scanner/end of source", [](Failures& failures) {
                TSONScanner::Scanner scanner("\"one_token\"");
                auto first = scanner.NextToken();
                Check(failures, first && first->has_value(), "first call yields a token");
                auto second = scanner.NextToken();
                Check(failures, second && !second->has_value(), "second call signals end of source");
                auto third = scanner.NextToken();
                Check(failures, third && !third->has_value(), "end of source is sticky");

                TSONScanner::Scanner blank(" \n\t\n");
                auto none = blank.NextToken();
                Check(failures, none && !none->has_value(), "blank source has no tokens");
                Check(failures, blank.GetLine() == 3, "blank source ends on line " + std::to_string(blank.GetLine()));
            } },
            { "scanner/invalid tokens", [](Failures& failures) {
                expectScanErr(failures, "\"unterminated\n", { ErrorCode::UnterminatedString, 1, "\"unterminated\n" });
                expectScanErr(failures, "\"end of source", { ErrorCode::UnexpectedEndOfSource, 1, "\"end of source" });
                expectScanErr(failures, "1234e", { ErrorCode::InvalidNumber, 1, "1234e" });
                expectScanErr(failures, "1234e+", { ErrorCode::InvalidNumber, 1, "1234e+" });
                expectScanErr(failures, "1234a", { ErrorCode::InvalidNumber, 1, "1234" });
                expectScanErr(failures, "1e5x", { ErrorCode::InvalidNumber, 1, "1e5" });
                expectScanErr(failures, "-", { ErrorCode::InvalidNumber, 1, "-" });
                expectScanErr(failures, "notkeyword", { ErrorCode::UnrecognisedLiteral, 1, "notkeyword" });
                expectScanErr(failures, "nulll", { ErrorCode::UnrecognisedLiteral, 1, "nulll" });
                expectScanErr(failures, "_", { ErrorCode::UnrecognisedSymbol, 1, "_" });
                expectScanErr(failures, "\n\n^", { ErrorCode::UnrecognisedSymbol, 3, "^" });
                expectScanErr(failures, "+1", { ErrorCode::UnrecognisedSymbol, 1, "+" });
            } },
            { "scanner/escape sequences", [](Failures& failures) {
                const std::vector<std::tuple<std::string, std::string>> cases = {
                    { "\"\\u00A9\"", "\xC2\xA9" },
                    { "\"\\u20AC\"", "\xE2\x82\xAC" },
                    { "\"\\u07FF\\u0800\\uFFFF\"", "\xDF\xBF\xE0\xA0\x80\xEF\xBF\xBF" },
                    { "\"\\uDBFF\\uDFFF\"", "\xF4\x8F\xBF\xBF" },
                    { "\"\\n\"", "\n" },
                    { "\"\\r\"", "\r" },
                    { "\"\\b\"", "\b" },
                    { "\"\\f\"", "\f" },
                    { "\"\\t\"", "\t" },
                    { "\"\\/\"", "/" },
                    { "\"\\\\\"", "\\" },
                    { "\"\\\"\"", "\"" },
                    { "\"a\\u0041b\"", "aAb" },
                    { "\"\\uD83D\\uDE00\"", "\xF0\x9F\x98\x80" },
                };
                for (const auto& [source, decoded] : cases) {
                    auto token = firstToken(failures, source);
                    if (!token) continue;
                    Check(failures, token->type == Kind::String, Quote(source) + ": not a string token");
                    Check(failures, token->decoded == decoded, Quote(source) + ": decoded to " + Quote(token->decoded));
                    Check(failures, token->value == source, Quote(source) + ": lexeme is " + Quote(token->value));
                }
            } },
            { "scanner/invalid escape sequences", [](Failures& failures) {
                expectScanErr(failures, "\"\\uZZZZ\"", { ErrorCode::InvalidEscapeSequence, 1, "\"\\uZZZZ" });
                expectScanErr(failures, "\"\\uD800\"", { ErrorCode::InvalidEscapeSequence, 1, "\"\\uD800" });
                expectScanErr(failures, "\"\\uDC00\"", { ErrorCode::InvalidEscapeSequence, 1, "\"\\uDC00" });
                expectScanErr(failures, "\"\\uD800\\u0041\"", { ErrorCode::InvalidEscapeSequence, 1, "\"\\uD800\\u0041" });
                expectScanErr(failures, "\"bad\\escape\"", { ErrorCode::InvalidEscapeSequence, 1, "\"bad\\e" });
                expectScanErr(failures, "\"\\u12", { ErrorCode::UnexpectedEndOfSource, 1, "\"\\u12" });
                expectScanErr(failures, "\"\\", { ErrorCode::UnexpectedEndOfSource, 1, "\"\\" });
            } },
            { "scanner/multibyte characters", [](Failures& failures) {
                // Raw UTF-8 is kept as is and never split
                const std::string source = "[\"caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80\", 1]";
                auto tokens = scanAll(source);
                if (!tokens) {
                    failures.push_back(tokens.error().toString());
                    return;
                }
                Check(failures, tokens->size() == 5, "token count is " + std::to_string(tokens->size()));
                if (tokens->size() == 5) {
                    Check(failures, (*tokens)[1].decoded == "caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80", "multibyte content decoded intact");
                    Check(failures, (*tokens)[3].value == "1", "token after the string is " + Quote((*tokens)[3].value));
                }
            } },
            { "scanner/malformed utf8", [](Failures& failures) {
                expectScanErr(failures, "\xFF", { ErrorCode::UnrecognisedSymbol, 1, "\xFF" });
                expectScanErr(failures, "\"ab\xC3\"", { ErrorCode::UnrecognisedSymbol, 1, "\"ab\xC3" });
                // Overlong encoding of '/'
                expectScanErr(failures, "\"\xC0\xAF\"", { ErrorCode::UnrecognisedSymbol, 1, "\"\xC0" });
            } },
            { "scanner/non-ascii letters", [](Failures& failures) {
                // Letters of any script belong to the literal and show up whole in the error
                expectScanErr(failures, "\xC3\xA9", { ErrorCode::UnrecognisedLiteral, 1, "\xC3\xA9" });
                expectScanErr(failures, "caf\xC3\xA9: 1", { ErrorCode::UnrecognisedLiteral, 1, "caf\xC3\xA9" });
                expectScanErr(failures, "\xD0\xB4\xD0\xB0", { ErrorCode::UnrecognisedLiteral, 1, "\xD0\xB4\xD0\xB0" });
                expectScanErr(failures, "\xE6\x97\xA5\xE6\x9C\xAC", { ErrorCode::UnrecognisedLiteral, 1, "\xE6\x97\xA5\xE6\x9C\xAC" });
                expectScanErr(failures, "12\xC3\xA9", { ErrorCode::InvalidNumber, 1, "12" });
                // Symbols outside ASCII are still symbols
                expectScanErr(failures, "\xE2\x82\xAC", { ErrorCode::UnrecognisedSymbol, 1, "\xE2\x82\xAC" });
                expectScanErr(failures, "\xC3\x97", { ErrorCode::UnrecognisedSymbol, 1, "\xC3\x97" });
            } },
        };
    }
}
