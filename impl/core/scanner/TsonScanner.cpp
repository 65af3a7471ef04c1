#include <optional>
#include <string>
#include <string_view>
#include "TsonScanner.h"

namespace TSONScanner {
    namespace {
        constexpr const char* BUG_END_OF_SOURCE = "[BUG] Reached end of source when shouldn't be possible";

        // Stands in for a byte that does not start a well-formed UTF-8 sequence.
        constexpr char32_t MALFORMED = 0xFFFFFFFF;

        bool isDigit(std::optional<char32_t> c) {
            return c && *c >= U'0' && *c <= U'9';
        }

        struct LetterRange {
            char32_t first;
            char32_t last;
        };

        // Letter blocks of the common scripts, sorted by first code point
        constexpr LetterRange NON_ASCII_LETTERS[] = {
            { 0x00AA, 0x00AA }, { 0x00B5, 0x00B5 }, { 0x00BA, 0x00BA },
            { 0x00C0, 0x00D6 }, { 0x00D8, 0x00F6 }, { 0x00F8, 0x02C1 },    // Latin-1, Latin Extended, IPA
            { 0x0370, 0x0373 }, { 0x0376, 0x0377 }, { 0x037B, 0x037D },
            { 0x0386, 0x0386 }, { 0x0388, 0x03F5 }, { 0x03F7, 0x0481 },    // Greek, Cyrillic
            { 0x048A, 0x052F }, { 0x0531, 0x0556 }, { 0x0561, 0x0587 },    // Cyrillic, Armenian
            { 0x05D0, 0x05EA }, { 0x0620, 0x064A }, { 0x0904, 0x0939 },    // Hebrew, Arabic, Devanagari
            { 0x0E01, 0x0E30 }, { 0x1E00, 0x1FBC }, { 0x3041, 0x3096 },    // Thai, Latin/Greek Extended, Hiragana
            { 0x30A1, 0x30FA }, { 0x3400, 0x4DBF }, { 0x4E00, 0x9FFF },    // Katakana, CJK
            { 0xAC00, 0xD7A3 }, { 0x20000, 0x2A6DF },                      // Hangul, CJK Extension B
        };

        bool isAlpha(std::optional<char32_t> c) {
            if (!c) return false;
            if ((*c >= U'a' && *c <= U'z') || (*c >= U'A' && *c <= U'Z')) return true;
            if (*c < 0x80 || *c == MALFORMED) return false;

            for (const auto& range : NON_ASCII_LETTERS) {
                if (*c < range.first) return false;
                if (*c <= range.last) return true;
            }
            return false;
        }

        int hexValue(char32_t c) {
            if (c >= U'0' && c <= U'9') return static_cast<int>(c - U'0');
            if (c >= U'a' && c <= U'f') return 10 + static_cast<int>(c - U'a');
            if (c >= U'A' && c <= U'F') return 10 + static_cast<int>(c - U'A');
            return -1;
        }

        bool isHighSurrogate(char32_t cp) { return cp >= 0xD800 && cp <= 0xDBFF; }
        bool isLowSurrogate(char32_t cp)  { return cp >= 0xDC00 && cp <= 0xDFFF; }
    }

    void AppendUtf8(std::string& out, char32_t cp) {
        if (cp > 0x10FFFF) {
            throw TSON::BugError("[BUG] Code point out of Unicode range");
        }
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
            return;
        }

        // Lead byte marker by encoded width
        constexpr unsigned char LEAD[] = { 0x00, 0x00, 0xC0, 0xE0, 0xF0 };
        const std::size_t width = cp < 0x800 ? 2 : cp < 0x10000 ? 3 : 4;

        char bytes[4];
        for (std::size_t i = width - 1; i > 0; --i) {
            bytes[i] = static_cast<char>(0x80 | (cp & 0x3F));
            cp >>= 6;
        }
        bytes[0] = static_cast<char>(LEAD[width] | cp);
        out.append(bytes, width);
    }

    bool Scanner::isAtEnd() const {
        return current >= source.size();
    }

    // Width in bytes of the UTF-8 sequence starting at pos, or 0 if it is
    // malformed (truncated, overlong, an encoded surrogate or past U+10FFFF).
    std::size_t Scanner::decodeAt(std::size_t pos, char32_t& cp) const {
        const std::size_t rem = source.size() - pos;
        const unsigned char c = static_cast<unsigned char>(source[pos]);

        if ((c & 0x80) == 0) {
            cp = c;
            return 1;
        }
        else if ((c & 0xE0) == 0xC0) {
            if (rem < 2) return 0;
            unsigned char c1 = static_cast<unsigned char>(source[pos + 1]);
            if ((c1 & 0xC0) != 0x80) return 0;

            cp = ((c & 0x1F) << 6) | (c1 & 0x3F);
            if (cp < 0x80) return 0;  // Overlong
            return 2;
        }
        else if ((c & 0xF0) == 0xE0) {
            if (rem < 3) return 0;
            unsigned char c1 = static_cast<unsigned char>(source[pos + 1]);
            unsigned char c2 = static_cast<unsigned char>(source[pos + 2]);
            if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) return 0;

            cp = ((c & 0x0F) << 12) |
                ((c1 & 0x3F) << 6) |
                (c2 & 0x3F);
            if (cp < 0x800) return 0;  // Overlong
            if (cp >= 0xD800 && cp <= 0xDFFF) return 0;  // Surrogates
            return 3;
        }
        else if ((c & 0xF8) == 0xF0) {
            if (rem < 4) return 0;
            unsigned char c1 = static_cast<unsigned char>(source[pos + 1]);
            unsigned char c2 = static_cast<unsigned char>(source[pos + 2]);
            unsigned char c3 = static_cast<unsigned char>(source[pos + 3]);
            if ((c1 & 0xC0) != 0x80 ||
                (c2 & 0xC0) != 0x80 ||
                (c3 & 0xC0) != 0x80) return 0;

            cp = ((c & 0x07) << 18) |
                ((c1 & 0x3F) << 12) |
                ((c2 & 0x3F) << 6) |
                (c3 & 0x3F);
            if (cp < 0x10000 || cp > 0x10FFFF) return 0;  // Overlong or out of range
            return 4;
        }

        // Invalid leading byte
        return 0;
    }

    // Consume one whole character, however many bytes it is encoded in.
    TSON::Result<char32_t> Scanner::advance() {
        if (isAtEnd()) {
            return makeErr(TSON::ErrorCode::UnexpectedEndOfSource);
        }

        char32_t cp = 0;
        std::size_t width = decodeAt(current, cp);
        if (width == 0) {
            ++current;
            return makeErr(TSON::ErrorCode::UnrecognisedSymbol);
        }

        current += width;
        return cp;
    }

    std::optional<char32_t> Scanner::peek() const {
        if (isAtEnd()) return std::nullopt;

        char32_t cp = 0;
        if (decodeAt(current, cp) == 0) return MALFORMED;
        return cp;
    }

    // Only used to look past ASCII characters, so the following one starts
    // exactly one byte later.
    std::optional<char32_t> Scanner::peekNext() const {
        if (current + 1 >= source.size()) return std::nullopt;

        char32_t cp = 0;
        if (decodeAt(current + 1, cp) == 0) return MALFORMED;
        return cp;
    }

    // Advance past a character already seen through peek().
    void Scanner::bump() {
        auto res = advance();
        if (!res) {
            throw TSON::BugError(BUG_END_OF_SOURCE);
        }
    }

    bool Scanner::matches(char32_t c) {
        if (peek() == c) {
            bump();
            return true;
        }

        return false;
    }

    void Scanner::skipWhitespace() {
        while (true) {
            auto c = peek();
            if (c == U' ' || c == U'\t' || c == U'\r') {
                bump();
            }
            else if (c == U'\n') {
                ++line;
                bump();
            }
            else {
                return;
            }
        }
    }

    Token::Token Scanner::makeToken(Token::Kind kind, std::string decoded) {
        std::size_t start = tokenStart;
        tokenStart = current;

        return Token::Token{
            std::string(source.substr(start, current - start)),
            kind,
            std::move(decoded),
            line
        };
    }

    TSON::ParserErr Scanner::makeErr(TSON::ErrorCode code) const {
        return TSON::ParserErr{
            code,
            line,
            std::string(source.substr(tokenStart, current - tokenStart))
        };
    }

    TSON::Result<Token::Token> Scanner::number() {
        while (isDigit(peek())) bump();

        if (matches(U'.')) {
            while (isDigit(peek())) bump();
        }

        if (peek() == U'e' || peek() == U'E') {
            bump();
            if (peek() == U'-' || peek() == U'+') bump();

            bool hasExponentDigits = false;
            while (isDigit(peek())) {
                bump();
                hasExponentDigits = true;
            }

            if (!hasExponentDigits) {
                return makeErr(TSON::ErrorCode::InvalidNumber);
            }
        }

        // "1234a", "1e5x"
        if (isAlpha(peek())) {
            return makeErr(TSON::ErrorCode::InvalidNumber);
        }

        if (source.substr(tokenStart, current - tokenStart) == "-") {
            return makeErr(TSON::ErrorCode::InvalidNumber);
        }

        return makeToken(Token::Kind::Number);
    }

    TSON::Result<Token::Token> Scanner::literal() {
        while (isAlpha(peek())) bump();

        auto word = source.substr(tokenStart, current - tokenStart);
        if (word == "null") {
            return makeToken(Token::Kind::Null);
        }
        if (word == "true" || word == "false") {
            return makeToken(Token::Kind::Bool);
        }

        return makeErr(TSON::ErrorCode::UnrecognisedLiteral);
    }

    // Reads the four characters after "\u". Running out of input is reported
    // before the digits are checked.
    TSON::Result<char32_t> Scanner::hex4() {
        char32_t digits[4];
        for (auto& digit : digits) {
            auto c = advance();
            if (!c) return c.error();
            digit = *c;
        }

        char32_t value = 0;
        for (char32_t digit : digits) {
            int h = hexValue(digit);
            if (h < 0) {
                return makeErr(TSON::ErrorCode::InvalidEscapeSequence);
            }
            value = (value << 4) | static_cast<char32_t>(h);
        }

        return value;
    }

    TSON::Result<Token::Token> Scanner::string() {
        std::string decoded;

        while (true) {
            auto next = peek();
            if (!next) {
                return makeErr(TSON::ErrorCode::UnexpectedEndOfSource);
            }
            if (*next == U'"') {
                break;
            }

            auto c = advance();
            if (!c) return c.error();

            if (*c == U'\n') {
                return makeErr(TSON::ErrorCode::UnterminatedString);
            }

            if (*c != U'\\') {
                AppendUtf8(decoded, *c);
                continue;
            }

            auto escape = advance();
            if (!escape) return escape.error();

            switch (*escape) {
            case U'"':  decoded.push_back('"');  break;
            case U'\\': decoded.push_back('\\'); break;
            case U'/':  decoded.push_back('/');  break;
            case U'b':  decoded.push_back('\b'); break;
            case U'f':  decoded.push_back('\f'); break;
            case U'n':  decoded.push_back('\n'); break;
            case U'r':  decoded.push_back('\r'); break;
            case U't':  decoded.push_back('\t'); break;
            case U'u': {
                auto unit = hex4();
                if (!unit) return unit.error();

                char32_t cp = *unit;
                if (isLowSurrogate(cp)) {
                    return makeErr(TSON::ErrorCode::InvalidEscapeSequence);
                }
                if (isHighSurrogate(cp)) {
                    // Only valid as the first half of a "\uXXXX\uXXXX" pair
                    if (peek() != U'\\' || peekNext() != U'u') {
                        return makeErr(TSON::ErrorCode::InvalidEscapeSequence);
                    }
                    bump();
                    bump();

                    auto low = hex4();
                    if (!low) return low.error();
                    if (!isLowSurrogate(*low)) {
                        return makeErr(TSON::ErrorCode::InvalidEscapeSequence);
                    }
                    cp = 0x10000 + (((cp - 0xD800) << 10) | (*low - 0xDC00));
                }
                AppendUtf8(decoded, cp);
            } break;
            default:
                return makeErr(TSON::ErrorCode::InvalidEscapeSequence);
            }
        }

        // Closing quote
        bump();
        return makeToken(Token::Kind::String, std::move(decoded));
    }

    TSON::Result<Token::Token> Scanner::symbol(char32_t c) {
        switch (c) {
        case U'{': return makeToken(Token::Kind::LBrace);
        case U'}': return makeToken(Token::Kind::RBrace);
        case U'[': return makeToken(Token::Kind::LBracket);
        case U']': return makeToken(Token::Kind::RBracket);
        case U':': return makeToken(Token::Kind::Colon);
        case U',': return makeToken(Token::Kind::Comma);
        default:   return makeErr(TSON::ErrorCode::UnrecognisedSymbol);
        }
    }

    TSON::Result<std::optional<Token::Token>> Scanner::NextToken() {
        skipWhitespace();

        if (isAtEnd()) {
            return std::optional<Token::Token>();
        }

        tokenStart = current;

        auto c = advance();
        if (!c) return c.error();

        TSON::Result<Token::Token> token = [&]() -> TSON::Result<Token::Token> {
            if (isDigit(*c) || *c == U'-') return number();
            if (isAlpha(*c)) return literal();
            if (*c == U'"') return string();
            return symbol(*c);
        }();

        if (!token) return token.error();
        return std::optional<Token::Token>(std::move(token).value());
    }
}
