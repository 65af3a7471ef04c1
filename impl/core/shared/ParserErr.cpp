#include <string>
#include "ParserErr.h"

namespace TSON {
    const char* ErrorCodeName(ErrorCode code) {
        switch (code) {
        case ErrorCode::UnterminatedString:    return "UnterminatedString";
        case ErrorCode::UnrecognisedSymbol:    return "UnrecognisedSymbol";
        case ErrorCode::UnrecognisedLiteral:   return "UnrecognisedLiteral";
        case ErrorCode::InvalidNumber:         return "InvalidNumber";
        case ErrorCode::InvalidEscapeSequence: return "InvalidEscapeSequence";
        case ErrorCode::ExpectedEndOfSource:   return "ExpectedEndOfSource";
        case ErrorCode::ExpectedToken:         return "ExpectedToken";
        case ErrorCode::UnexpectedToken:       return "UnexpectedToken";
        case ErrorCode::UnknownProperty:       return "UnknownProperty";
        case ErrorCode::MissingProperty:       return "MissingProperty";
        case ErrorCode::UnexpectedEndOfSource: return "UnexpectedEndOfSource";
        }
        return "?";
    }

    std::string ParserErrKind::toString() const {
        std::string name = ErrorCodeName(code);
        if (code == ErrorCode::ExpectedToken) {
            return name + "(" + Token::KindName(expected) + ")";
        }
        if (code == ErrorCode::MissingProperty) {
            return name + "(" + property + ")";
        }
        return name;
    }

    bool ParserErrKind::operator==(const ParserErrKind& other) const {
        if (code != other.code) return false;
        if (code == ErrorCode::ExpectedToken) return expected == other.expected;
        if (code == ErrorCode::MissingProperty) return property == other.property;
        return true;
    }

    std::string ParserErr::toString() const {
        return "(line " + std::to_string(line) + ") " + kind.toString() + ": '" + lexeme + "'";
    }
}
