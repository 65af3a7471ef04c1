#pragma once

#ifndef TOKEN_H
#define TOKEN_H

#include <cstddef>
#include <string>

namespace Token {
    enum class Kind {
        LBrace,
        RBrace,
        LBracket,
        RBracket,
        Colon,
        Comma,
        String,
        Number,
        Bool,
        Null
    };

    inline const char* KindName(Kind kind) {
        switch (kind) {
        case Kind::LBrace:   return "LBrace";
        case Kind::RBrace:   return "RBrace";
        case Kind::LBracket: return "LBracket";
        case Kind::RBracket: return "RBracket";
        case Kind::Colon:    return "Colon";
        case Kind::Comma:    return "Comma";
        case Kind::String:   return "String";
        case Kind::Number:   return "Number";
        case Kind::Bool:     return "Bool";
        case Kind::Null:     return "Null";
        }
        return "?";
    }

    struct Token {
        // Exact source slice, quotes and escapes included.
        std::string value;
        Kind type;
        // Unescaped content, only set for Kind::String.
        std::string decoded;
        std::size_t line;

        bool operator==(const Token& other) const {
            return type == other.type && line == other.line &&
                value == other.value && decoded == other.decoded;
        }
        bool operator!=(const Token& other) const { return !(*this == other); }
    };
};

#endif
