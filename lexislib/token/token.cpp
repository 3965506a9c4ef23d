#include "token.hpp"

#include <charconv>
#include <functional>
#include <limits>

namespace Lexis
{

Token::Token(TokenKind kind, Position position, int64_t from, int64_t to, std::string value)
    : tokenKind(kind)
    , tokenPosition(position)
    , fromOffset(from)
    , toOffset(to)
    , tokenValue(std::move(value))
{
}

size_t Token::value_hash() const
{
    return std::hash<std::string_view>{}(tokenValue);
}



#pragma region Conversion Helpers

static std::string_view trim_leading_space(std::string_view text)
{
    size_t start = 0;
    while (start < text.size() &&
           (text[start] == ' ' || text[start] == '\t' || text[start] == '\n' ||
            text[start] == '\r' || text[start] == '\f' || text[start] == '\v'))
    {
        start++;
    }
    return text.substr(start);
}

static std::string_view strip_base_prefix(std::string_view text)
{
    if (text.size() >= 2 && text[0] == '0' &&
        (text[1] == 'x' || text[1] == 'X' || text[1] == 'b' || text[1] == 'B'))
    {
        return text.substr(2);
    }
    return text;
}

// Parses the longest run of digits in `base` at the front of `text`.
// No digits yields zero.
static int64_t parse_integer_prefix(std::string_view text, int base)
{
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+'))
    {
        negative = text[0] == '-';
        text.remove_prefix(1);
    }

    uint64_t magnitude = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), magnitude, base);
    if (ec == std::errc::invalid_argument)
    {
        return 0;
    }
    if (ec == std::errc::result_out_of_range)
    {
        throw TokenConversionError("Integer literal out of range: " + std::string(text));
    }

    uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (negative)
    {
        if (magnitude > limit + 1)
        {
            throw TokenConversionError("Integer literal out of range: -" + std::string(text));
        }
        return static_cast<int64_t>(0 - magnitude);
    }
    if (magnitude > limit)
    {
        throw TokenConversionError("Integer literal out of range: " + std::string(text));
    }
    return static_cast<int64_t>(magnitude);
}

// Longest decimal float at the front of `text`; nothing parseable yields 0.0.
static double parse_float_prefix(std::string_view text)
{
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+'))
    {
        negative = text[0] == '-';
        text.remove_prefix(1);
    }

    double result = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec == std::errc::invalid_argument)
    {
        return 0.0;
    }
    return negative ? -result : result;
}



#pragma region Conversion

int64_t Token::to_integer() const
{
    switch (tokenKind)
    {
        // Exponent literals keep only their leading digits.
        case TokenKind::LiteralInteger:
        case TokenKind::LiteralIntegerExp:
            return parse_integer_prefix(tokenValue, 10);
        case TokenKind::LiteralSingleString:
        case TokenKind::LiteralDoubleString:
            return parse_integer_prefix(trim_leading_space(tokenValue), 10);
        case TokenKind::LiteralHex:
            return parse_integer_prefix(strip_base_prefix(tokenValue), 16);
        case TokenKind::LiteralBinary:
            return parse_integer_prefix(strip_base_prefix(tokenValue), 2);
        case TokenKind::LiteralFloat:
        case TokenKind::LiteralFloatExp:
        {
            double value = parse_float_prefix(tokenValue);
            if (!(value > -9.2e18 && value < 9.2e18))
            {
                throw TokenConversionError("Float literal out of integer range: " + tokenValue);
            }
            return static_cast<int64_t>(value);
        }
        default:
            throw TokenConversionError("Cannot convert " + std::string(descriptor()) + " token to an integer");
    }
}

double Token::to_float() const
{
    switch (tokenKind)
    {
        case TokenKind::LiteralFloat:
        case TokenKind::LiteralFloatExp:
        case TokenKind::LiteralInteger:
        case TokenKind::LiteralIntegerExp:
            return parse_float_prefix(tokenValue);
        case TokenKind::LiteralSingleString:
        case TokenKind::LiteralDoubleString:
            return parse_float_prefix(trim_leading_space(tokenValue));
        default:
            return static_cast<double>(to_integer());
    }
}



#pragma region Format

std::string Token::format() const
{
    std::string shown = tokenKind == TokenKind::Newline ? "\\n" : tokenValue;
    return tokenPosition.format() + " " + std::string(descriptor()) + " '" + shown + "' (" +
           std::to_string(fromOffset) + ".." + std::to_string(toOffset) + ")";
}

std::array<TokenField, Token::field_count> Token::fields() const
{
    return {{
        {"kind", std::string(Lexis::name(tokenKind))},
        {"value", tokenValue},
        {"from", std::to_string(fromOffset)},
        {"to", std::to_string(toOffset)},
        {"line", std::to_string(tokenPosition.line)},
        {"column", std::to_string(tokenPosition.column)},
    }};
}

}
