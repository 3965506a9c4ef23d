#pragma once

#include "common/diagnostic.hpp"
#include "source/position.hpp"
#include "token/token.hpp"
#include <string>
#include <string_view>

namespace Lexis
{

enum class LexErrorCode
{
    DuplicateExponent,
    MalformedExponent,
    UnterminatedString,
    MalformedUnicodeEscape,
    UnterminatedBlockComment,
    InvalidToken,
};

constexpr std::string_view format(LexErrorCode code)
{
    switch (code)
    {
        case LexErrorCode::DuplicateExponent:        return "duplicate_exponent";
        case LexErrorCode::MalformedExponent:        return "malformed_exponent";
        case LexErrorCode::UnterminatedString:       return "unterminated_string";
        case LexErrorCode::MalformedUnicodeEscape:   return "malformed_unicode_escape";
        case LexErrorCode::UnterminatedBlockComment: return "unterminated_block_comment";
        case LexErrorCode::InvalidToken:             return "invalid_token";
    }
    return "unknown";
}

struct LexError
{
    LexErrorCode code;
    std::string description;
    Position position;

    // The token being scanned when the error was detected.
    Token token;

    std::string format() const
    {
        return position.format() + " (" + std::string(Lexis::format(code)) + ") " + description;
    }

    Diagnostic to_diagnostic(std::string_view systemName = "Lexer") const
    {
        return Diagnostic(Diagnostic::Severity::Error, description, position, systemName);
    }
};

}
