#pragma once

#include "kind.hpp"
#include "source/position.hpp"
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Lexis
{

class TokenConversionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// A lexed unit of source text. `from` and `to` are byte offsets of the first
// and last byte of the token, so a one character token has from == to.
struct TokenField
{
    std::string_view name;
    std::string value;
};

class Token
{
public:
    static constexpr size_t field_count = 6;
    Token() = default;
    Token(TokenKind kind, Position position, int64_t from, int64_t to, std::string value);

    TokenKind kind() const { return tokenKind; }
    const Position& position() const { return tokenPosition; }
    int64_t from() const { return fromOffset; }
    int64_t to() const { return toOffset; }
    const std::string& value() const { return tokenValue; }

    std::string_view descriptor() const { return Lexis::format(tokenKind); }
    size_t value_hash() const;

    bool is_identifier() const { return tokenKind == TokenKind::Identifier; }
    bool is_newline() const { return tokenKind == TokenKind::Newline; }
    bool is_literal() const { return Lexis::is_literal(tokenKind); }
    bool is_integer() const { return Lexis::is_integer(tokenKind); }
    bool is_float() const { return Lexis::is_float(tokenKind); }
    bool is_string() const { return Lexis::is_string(tokenKind); }
    bool is_comment() const { return Lexis::is_comment(tokenKind); }
    bool is_punctuation() const { return Lexis::is_punctuation(tokenKind); }
    bool is_boolean() const { return Lexis::is_boolean(tokenKind); }
    bool is_null() const { return Lexis::is_null(tokenKind); }

    int64_t to_integer() const;
    double to_float() const;
    const std::string& to_string() const { return tokenValue; }

    std::string format() const;

    // kind, value, from, to, line and column as text, in that order.
    std::array<TokenField, field_count> fields() const;

    bool operator==(const Token& other) const = default;

private:
    TokenKind tokenKind = TokenKind::Invalid;
    Position tokenPosition;
    int64_t fromOffset = -1;
    int64_t toOffset = -1;
    std::string tokenValue;
};

}
