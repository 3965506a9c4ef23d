#pragma once

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace Lexis
{

#pragma region TokenKind

enum class TokenKind : uint8_t
{
    Invalid,
    Newline,
    Identifier,

    // Comments
    LineComment,
    BlockComment,

    // Literal keywords
    TrueKeyword,
    FalseKeyword,
    NullKeyword,

    // Literals
    LiteralInteger,
    LiteralFloat,
    LiteralIntegerExp,
    LiteralFloatExp,
    LiteralHex,
    LiteralBinary,
    LiteralSingleString,
    LiteralDoubleString,

    // Punctuation
    Dot,
    DoubleDot,
    TripleDot,
    Bang,
    NotEqual,
    Question,
    Hash,
    At,
    Dollar,
    Percent,
    ParenOpen,
    ParenClose,
    BracketOpen,
    BracketClose,
    CurlOpen,
    CurlClose,
    Caret,
    Tilde,
    Grave,
    Backslash,
    Slash,
    Comma,
    Semicolon,
    Greater,
    ShiftRight,
    GreaterEqual,
    Less,
    ShiftLeft,
    LessEqual,
    Assign,
    Equal,
    Pipe,
    Or,
    Ampersand,
    And,
    Colon,
    DoubleColon,
    Minus,
    DoubleMinus,
    Arrow,
    Plus,
    DoublePlus,
    Star,
    DoubleStar,
};

constexpr size_t token_kind_count = static_cast<size_t>(TokenKind::DoubleStar) + 1;

static_assert(token_kind_count <= 64, "TokenKindSet stores kinds in a 64 bit mask");



#pragma region Punctuation Table

struct PunctuationEntry
{
    TokenKind kind;
    std::string_view text;
};

inline constexpr std::array<PunctuationEntry, 44> punctuation_table = {{
    {TokenKind::Dot,          "."},
    {TokenKind::DoubleDot,    ".."},
    {TokenKind::TripleDot,    "..."},
    {TokenKind::Bang,         "!"},
    {TokenKind::NotEqual,     "!="},
    {TokenKind::Question,     "?"},
    {TokenKind::Hash,         "#"},
    {TokenKind::At,           "@"},
    {TokenKind::Dollar,       "$"},
    {TokenKind::Percent,      "%"},
    {TokenKind::ParenOpen,    "("},
    {TokenKind::ParenClose,   ")"},
    {TokenKind::BracketOpen,  "["},
    {TokenKind::BracketClose, "]"},
    {TokenKind::CurlOpen,     "{"},
    {TokenKind::CurlClose,    "}"},
    {TokenKind::Caret,        "^"},
    {TokenKind::Tilde,        "~"},
    {TokenKind::Grave,        "`"},
    {TokenKind::Backslash,    "\\"},
    {TokenKind::Slash,        "/"},
    {TokenKind::Comma,        ","},
    {TokenKind::Semicolon,    ";"},
    {TokenKind::Greater,      ">"},
    {TokenKind::ShiftRight,   ">>"},
    {TokenKind::GreaterEqual, ">="},
    {TokenKind::Less,         "<"},
    {TokenKind::ShiftLeft,    "<<"},
    {TokenKind::LessEqual,    "<="},
    {TokenKind::Assign,       "="},
    {TokenKind::Equal,        "=="},
    {TokenKind::Pipe,         "|"},
    {TokenKind::Or,           "||"},
    {TokenKind::Ampersand,    "&"},
    {TokenKind::And,          "&&"},
    {TokenKind::Colon,        ":"},
    {TokenKind::DoubleColon,  "::"},
    {TokenKind::Minus,        "-"},
    {TokenKind::DoubleMinus,  "--"},
    {TokenKind::Arrow,        "->"},
    {TokenKind::Plus,         "+"},
    {TokenKind::DoublePlus,   "++"},
    {TokenKind::Star,         "*"},
    {TokenKind::DoubleStar,   "**"},
}};

constexpr std::optional<std::string_view> punctuation_text(TokenKind k)
{
    for (const auto& entry : punctuation_table)
    {
        if (entry.kind == k)
        {
            return entry.text;
        }
    }
    return std::nullopt;
}

constexpr std::optional<TokenKind> punctuation_kind(std::string_view text)
{
    for (const auto& entry : punctuation_table)
    {
        if (entry.text == text)
        {
            return entry.kind;
        }
    }
    return std::nullopt;
}



#pragma region Category Helpers

constexpr bool is_keyword(TokenKind k)
{
    switch (k)
    {
        case TokenKind::TrueKeyword:
        case TokenKind::FalseKeyword:
        case TokenKind::NullKeyword:
            return true;
        default:
            return false;
    }
}

constexpr bool is_literal(TokenKind k)
{
    if (is_keyword(k))
    {
        return true;
    }

    switch (k)
    {
        case TokenKind::LiteralInteger:
        case TokenKind::LiteralFloat:
        case TokenKind::LiteralIntegerExp:
        case TokenKind::LiteralFloatExp:
        case TokenKind::LiteralHex:
        case TokenKind::LiteralBinary:
        case TokenKind::LiteralSingleString:
        case TokenKind::LiteralDoubleString:
            return true;
        default:
            return false;
    }
}

constexpr bool is_integer(TokenKind k)
{
    return k == TokenKind::LiteralInteger ||
           k == TokenKind::LiteralIntegerExp ||
           k == TokenKind::LiteralHex ||
           k == TokenKind::LiteralBinary;
}

constexpr bool is_float(TokenKind k)
{
    return k == TokenKind::LiteralFloat ||
           k == TokenKind::LiteralFloatExp;
}

constexpr bool is_string(TokenKind k)
{
    return k == TokenKind::LiteralSingleString ||
           k == TokenKind::LiteralDoubleString;
}

constexpr bool is_comment(TokenKind k)
{
    return k == TokenKind::LineComment ||
           k == TokenKind::BlockComment;
}

constexpr bool is_boolean(TokenKind k)
{
    return k == TokenKind::TrueKeyword ||
           k == TokenKind::FalseKeyword;
}

constexpr bool is_null(TokenKind k)
{
    return k == TokenKind::NullKeyword;
}

constexpr bool is_punctuation(TokenKind k)
{
    return punctuation_text(k).has_value();
}



#pragma region TokenKindSet

class TokenKindSet
{
public:
    constexpr TokenKindSet() = default;

    constexpr TokenKindSet(std::initializer_list<TokenKind> kinds)
    {
        for (TokenKind k : kinds)
        {
            insert(k);
        }
    }

    constexpr void insert(TokenKind k)
    {
        bits |= bit(k);
    }

    constexpr bool contains(TokenKind k) const
    {
        return (bits & bit(k)) != 0;
    }

    constexpr bool empty() const
    {
        return bits == 0;
    }

    constexpr TokenKindSet operator|(TokenKindSet other) const
    {
        TokenKindSet result;
        result.bits = bits | other.bits;
        return result;
    }

    constexpr bool operator==(const TokenKindSet& other) const = default;

private:
    static constexpr uint64_t bit(TokenKind k)
    {
        return uint64_t{1} << static_cast<uint64_t>(k);
    }

    uint64_t bits = 0;
};

inline constexpr TokenKindSet whitespace_kinds = {
    TokenKind::Newline,
    TokenKind::LineComment,
    TokenKind::BlockComment,
};

inline constexpr TokenKindSet integer_kinds = {
    TokenKind::LiteralInteger,
    TokenKind::LiteralIntegerExp,
    TokenKind::LiteralHex,
    TokenKind::LiteralBinary,
};

inline constexpr TokenKindSet float_readable_kinds = TokenKindSet{
    TokenKind::LiteralFloat,
    TokenKind::LiteralFloatExp,
} | integer_kinds;

inline constexpr TokenKindSet boolean_kinds = {
    TokenKind::TrueKeyword,
    TokenKind::FalseKeyword,
};

inline constexpr TokenKindSet string_kinds = {
    TokenKind::LiteralSingleString,
    TokenKind::LiteralDoubleString,
};



#pragma region Format

constexpr std::string_view format(TokenKind k)
{
    switch (k)
    {
        case TokenKind::Invalid:             return "invalid";
        case TokenKind::Newline:             return "\\n";
        case TokenKind::Identifier:          return "identifier";
        case TokenKind::LineComment:         return "// comment";
        case TokenKind::BlockComment:        return "/* comment */";

        case TokenKind::TrueKeyword:         return "true";
        case TokenKind::FalseKeyword:        return "false";
        case TokenKind::NullKeyword:         return "null";

        case TokenKind::LiteralInteger:      return "integer";
        case TokenKind::LiteralFloat:        return "float";
        case TokenKind::LiteralIntegerExp:   return "integer exp";
        case TokenKind::LiteralFloatExp:     return "float exp";
        case TokenKind::LiteralHex:          return "hexnum lit";
        case TokenKind::LiteralBinary:       return "binary lit";
        case TokenKind::LiteralSingleString: return "'...' string";
        case TokenKind::LiteralDoubleString: return "\"...\" string";

        default:
            return punctuation_text(k).value_or("invalid");
    }
}

constexpr std::string_view name(TokenKind k)
{
    switch (k)
    {
        case TokenKind::Invalid:             return "Invalid";
        case TokenKind::Newline:             return "Newline";
        case TokenKind::Identifier:          return "Identifier";
        case TokenKind::LineComment:         return "LineComment";
        case TokenKind::BlockComment:        return "BlockComment";
        case TokenKind::TrueKeyword:         return "TrueKeyword";
        case TokenKind::FalseKeyword:        return "FalseKeyword";
        case TokenKind::NullKeyword:         return "NullKeyword";
        case TokenKind::LiteralInteger:      return "LiteralInteger";
        case TokenKind::LiteralFloat:        return "LiteralFloat";
        case TokenKind::LiteralIntegerExp:   return "LiteralIntegerExp";
        case TokenKind::LiteralFloatExp:     return "LiteralFloatExp";
        case TokenKind::LiteralHex:          return "LiteralHex";
        case TokenKind::LiteralBinary:       return "LiteralBinary";
        case TokenKind::LiteralSingleString: return "LiteralSingleString";
        case TokenKind::LiteralDoubleString: return "LiteralDoubleString";

        case TokenKind::Dot:                 return "Dot";
        case TokenKind::DoubleDot:           return "DoubleDot";
        case TokenKind::TripleDot:           return "TripleDot";
        case TokenKind::Bang:                return "Bang";
        case TokenKind::NotEqual:            return "NotEqual";
        case TokenKind::Question:            return "Question";
        case TokenKind::Hash:                return "Hash";
        case TokenKind::At:                  return "At";
        case TokenKind::Dollar:              return "Dollar";
        case TokenKind::Percent:             return "Percent";
        case TokenKind::ParenOpen:           return "ParenOpen";
        case TokenKind::ParenClose:          return "ParenClose";
        case TokenKind::BracketOpen:         return "BracketOpen";
        case TokenKind::BracketClose:        return "BracketClose";
        case TokenKind::CurlOpen:            return "CurlOpen";
        case TokenKind::CurlClose:           return "CurlClose";
        case TokenKind::Caret:               return "Caret";
        case TokenKind::Tilde:               return "Tilde";
        case TokenKind::Grave:               return "Grave";
        case TokenKind::Backslash:           return "Backslash";
        case TokenKind::Slash:               return "Slash";
        case TokenKind::Comma:               return "Comma";
        case TokenKind::Semicolon:           return "Semicolon";
        case TokenKind::Greater:             return "Greater";
        case TokenKind::ShiftRight:          return "ShiftRight";
        case TokenKind::GreaterEqual:        return "GreaterEqual";
        case TokenKind::Less:                return "Less";
        case TokenKind::ShiftLeft:           return "ShiftLeft";
        case TokenKind::LessEqual:           return "LessEqual";
        case TokenKind::Assign:              return "Assign";
        case TokenKind::Equal:               return "Equal";
        case TokenKind::Pipe:                return "Pipe";
        case TokenKind::Or:                  return "Or";
        case TokenKind::Ampersand:           return "Ampersand";
        case TokenKind::And:                 return "And";
        case TokenKind::Colon:               return "Colon";
        case TokenKind::DoubleColon:         return "DoubleColon";
        case TokenKind::Minus:               return "Minus";
        case TokenKind::DoubleMinus:         return "DoubleMinus";
        case TokenKind::Arrow:               return "Arrow";
        case TokenKind::Plus:                return "Plus";
        case TokenKind::DoublePlus:          return "DoublePlus";
        case TokenKind::Star:                return "Star";
        case TokenKind::DoubleStar:          return "DoubleStar";
    }
    return "Unknown";
}

constexpr std::optional<TokenKind> kind_from_name(std::string_view text)
{
    for (size_t i = 0; i < token_kind_count; ++i)
    {
        auto k = static_cast<TokenKind>(i);
        if (name(k) == text)
        {
            return k;
        }
    }
    return std::nullopt;
}

}
