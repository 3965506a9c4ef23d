#include "lexer.hpp"
#include <logger.hpp>

namespace Lexis
{

Lexer::Lexer(LexerOptions options)
    : lexerOptions(options)
{
}

LexResult Lexer::run(std::string_view source, TokenKind untilKind, std::optional<size_t> maxTokens, const TokenCallback& callback)
{
    lastError.reset();
    walker.emplace(source);

    size_t firstIndex = lexedTokens.size();
    bool ok = scan_tokens(untilKind, maxTokens, callback);

    walker.reset();

    if (!ok)
    {
        LOG(LogChannel::Lexer) << lastError->format();
        return *lastError;
    }

    if (Logger::is_enabled(LogChannel::Debug))
    {
        LOG(LogChannel::Debug) << "lexed " << (lexedTokens.size() - firstIndex) << " tokens from "
                               << source.size() << " bytes";
    }
    return std::span<const Token>(lexedTokens).subspan(firstIndex);
}

void Lexer::reset()
{
    lexedTokens.clear();
    lastError.reset();
    walker.reset();
}



#pragma region Helpers

bool Lexer::scan_tokens(TokenKind untilKind, std::optional<size_t> maxTokens, const TokenCallback& callback)
{
    size_t appended = 0;
    walker->advance();

    while (!maxTokens || appended < *maxTokens)
    {
        skip_whitespace();
        if (walker->is_at_end())
        {
            break;
        }

        TokenDraft draft;
        draft.from = walker->index();
        draft.position = walker->position();

        if (!scan_token(draft))
        {
            return false;
        }

        if (draft.kind == TokenKind::Invalid)
        {
            Token offending(draft.kind, draft.position, draft.from, walker->index(), draft.value);
            return fail(LexErrorCode::InvalidToken, "Invalid token: " + offending.format(), draft);
        }

        TokenKind kind = draft.kind;
        if (!is_filtered(kind))
        {
            lexedTokens.push_back(finish_token(draft));
            appended++;
            if (callback)
            {
                callback(lexedTokens.back());
            }
        }

        if (kind == untilKind)
        {
            break;
        }

        walker->advance();
    }

    return true;
}

void Lexer::skip_whitespace()
{
    char c = walker->current();
    while (!walker->is_at_end() && (c == ' ' || c == '\t' || c == '\r'))
    {
        c = walker->advance();
    }
}

bool Lexer::is_filtered(TokenKind kind) const
{
    return (lexerOptions.skipComments && is_comment(kind)) ||
           (lexerOptions.skipNewlines && kind == TokenKind::Newline);
}

Token Lexer::finish_token(TokenDraft& draft) const
{
    return Token(draft.kind, draft.position, draft.from, walker->index(), std::move(draft.value));
}

bool Lexer::fail(LexErrorCode code, std::string description, const TokenDraft& draft)
{
    lastError = LexError{
        code,
        std::move(description),
        walker->position(),
        Token(draft.kind, draft.position, draft.from, walker->index(), draft.value),
    };
    return false;
}



#pragma region Scanning

bool Lexer::scan_token(TokenDraft& draft)
{
    char c = walker->current();

    if (c == '"' || c == '\'')
    {
        return scan_string(draft);
    }
    if (c == '0')
    {
        char next = walker->peek();
        if (next == 'x' || next == 'X' || next == 'b' || next == 'B')
        {
            scan_base_number(draft);
            return true;
        }
        return scan_number(draft);
    }
    if (is_digit(c))
    {
        return scan_number(draft);
    }
    if (is_alpha(c))
    {
        scan_word(draft);
        return true;
    }

    switch (c)
    {
        case '.':
            if (is_digit(walker->peek()))
            {
                return scan_number(draft);
            }
            scan_dots(draft);
            return true;

        case '\n':
            draft.kind = TokenKind::Newline;
            draft.value = "\n";
            return true;

        case '?': case '#': case '@': case '$': case '%':
        case '(': case ')': case '[': case ']': case '{': case '}':
        case '^': case '~': case '`': case '\\': case ',': case ';':
            scan_punctuation(draft, std::string_view(&c, 1));
            return true;

        case '=': case '|': case '&': case ':': case '+': case '*':
        {
            char text[2] = {c, c};
            if (walker->peek() == c)
            {
                walker->advance();
                scan_punctuation(draft, std::string_view(text, 2));
            }
            else
            {
                scan_punctuation(draft, std::string_view(text, 1));
            }
            return true;
        }

        case '!':
            if (walker->peek() == '=')
            {
                walker->advance();
                scan_punctuation(draft, "!=");
            }
            else
            {
                scan_punctuation(draft, "!");
            }
            return true;

        case '>':
        case '<':
        {
            char text[2] = {c, walker->peek()};
            if (text[1] == '=' || text[1] == c)
            {
                walker->advance();
                scan_punctuation(draft, std::string_view(text, 2));
            }
            else
            {
                scan_punctuation(draft, std::string_view(text, 1));
            }
            return true;
        }

        case '-':
        {
            char text[2] = {c, walker->peek()};
            if (text[1] == '>' || text[1] == '-')
            {
                walker->advance();
                scan_punctuation(draft, std::string_view(text, 2));
            }
            else
            {
                scan_punctuation(draft, std::string_view(text, 1));
            }
            return true;
        }

        case '/':
            if (walker->peek() == '/')
            {
                scan_line_comment(draft);
                return true;
            }
            if (walker->peek() == '*')
            {
                return scan_block_comment(draft);
            }
            scan_punctuation(draft, "/");
            return true;

        default:
            draft.kind = TokenKind::Invalid;
            draft.value = std::string(1, c);
            return true;
    }
}

void Lexer::scan_punctuation(TokenDraft& draft, std::string_view text)
{
    draft.kind = punctuation_kind(text).value_or(TokenKind::Invalid);
    draft.value = std::string(text);
}

void Lexer::scan_dots(TokenDraft& draft)
{
    TokenKind kind = TokenKind::Dot;
    if (walker->peek() == '.')
    {
        walker->advance();
        kind = TokenKind::DoubleDot;

        if (walker->peek() == '.')
        {
            walker->advance();
            kind = TokenKind::TripleDot;
        }
    }

    draft.kind = kind;
    draft.value = std::string(Lexis::format(kind));
}

void Lexer::scan_word(TokenDraft& draft)
{
    while (is_alphanumeric(walker->peek()))
    {
        walker->advance();
    }

    std::string_view word = walker->slice(draft.from, walker->index());

    if (word == "true")
    {
        draft.kind = TokenKind::TrueKeyword;
    }
    else if (word == "false")
    {
        draft.kind = TokenKind::FalseKeyword;
    }
    else if (word == "null")
    {
        draft.kind = TokenKind::NullKeyword;
    }
    else
    {
        draft.kind = TokenKind::Identifier;
    }

    draft.value = std::string(word);
}

bool Lexer::scan_number(TokenDraft& draft)
{
    bool isFloat = walker->current() == '.';
    bool isExponent = false;
    draft.kind = isFloat ? TokenKind::LiteralFloat : TokenKind::LiteralInteger;

    while (walker->has_next())
    {
        char c = walker->peek();

        if (c == '.')
        {
            // One decimal point per number. A point after the exponent still
            // turns the literal into a plain float.
            if (isFloat)
            {
                break;
            }
            isFloat = true;
            draft.kind = TokenKind::LiteralFloat;
            walker->advance();
        }
        else if (is_digit(c))
        {
            walker->advance();
        }
        else if (c == 'e' || c == 'E')
        {
            if (isExponent)
            {
                walker->advance();
                return fail(LexErrorCode::DuplicateExponent,
                            "Malformed number literal: exponent already provided", draft);
            }

            isExponent = true;
            draft.kind = isFloat ? TokenKind::LiteralFloatExp : TokenKind::LiteralIntegerExp;

            walker->advance();
            c = walker->advance();
            if (c == '-' || c == '+')
            {
                c = walker->advance();
            }

            if (walker->is_at_end() || !is_digit(c))
            {
                return fail(LexErrorCode::MalformedExponent,
                            "Malformed number literal: exponent expected but not provided", draft);
            }
        }
        else
        {
            break;
        }
    }

    draft.value = std::string(walker->slice(draft.from, walker->index()));
    return true;
}

void Lexer::scan_base_number(TokenDraft& draft)
{
    char marker = walker->advance();

    if (marker == 'b' || marker == 'B')
    {
        draft.kind = TokenKind::LiteralBinary;
        while (walker->peek() == '0' || walker->peek() == '1')
        {
            walker->advance();
        }
    }
    else
    {
        draft.kind = TokenKind::LiteralHex;
        while (is_hex_digit(walker->peek()))
        {
            walker->advance();
        }
    }

    draft.value = std::string(walker->slice(draft.from, walker->index()));
}

bool Lexer::scan_string(TokenDraft& draft)
{
    char opening = walker->current();
    draft.kind = opening == '\'' ? TokenKind::LiteralSingleString : TokenKind::LiteralDoubleString;

    std::string chars;
    bool escape = false;
    bool closed = false;

    while (true)
    {
        char c = walker->advance();
        if (walker->is_at_end())
        {
            break;
        }

        if (escape)
        {
            escape = false;
            switch (c)
            {
                case 'x':
                case 'X':
                    if (!scan_unicode_escape(draft, c, chars))
                    {
                        return false;
                    }
                    continue;
                case 'r': c = '\r'; break;
                case 'n': c = '\n'; break;
                case 't': c = '\t'; break;
                case '0': c = '\0'; break;
                case 'b': c = '\b'; break;
                case 'a': c = '\a'; break;
                case 'f': c = '\f'; break;
                case 'v': c = '\v'; break;
                default:
                    break;
            }
            chars += c;
            continue;
        }

        if (c == opening)
        {
            closed = true;
            break;
        }
        if (c == '\\')
        {
            escape = true;
            continue;
        }

        chars += c;
    }

    if (!closed)
    {
        return fail(LexErrorCode::UnterminatedString, "Unterminated string", draft);
    }

    draft.value = std::move(chars);
    return true;
}

// `\x` takes up to four hex digits and `\X` up to eight; the code point is
// appended as UTF-8.
bool Lexer::scan_unicode_escape(TokenDraft& draft, char marker, std::string& out)
{
    if (!walker->has_next() || !is_hex_digit(walker->peek()))
    {
        return fail(LexErrorCode::MalformedUnicodeEscape,
                    "Malformed unicode literal in string - no hex code provided.", draft);
    }

    int remaining = marker == 'x' ? 4 : 8;
    uint32_t codepoint = 0;

    while (remaining > 0 && walker->has_next() && is_hex_digit(walker->peek()))
    {
        char digit = walker->advance();
        uint32_t nibble = 0;
        if (digit >= '0' && digit <= '9')
        {
            nibble = static_cast<uint32_t>(digit - '0');
        }
        else if (digit >= 'a' && digit <= 'f')
        {
            nibble = static_cast<uint32_t>(digit - 'a' + 10);
        }
        else
        {
            nibble = static_cast<uint32_t>(digit - 'A' + 10);
        }
        codepoint = (codepoint << 4) | nibble;
        remaining--;
    }

    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF))
    {
        return fail(LexErrorCode::MalformedUnicodeEscape,
                    "Malformed unicode literal in string - invalid code point.", draft);
    }

    if (codepoint < 0x80)
    {
        out += static_cast<char>(codepoint);
    }
    else if (codepoint < 0x800)
    {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
    else if (codepoint < 0x10000)
    {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
    return true;
}

void Lexer::scan_line_comment(TokenDraft& draft)
{
    draft.kind = TokenKind::LineComment;

    while (walker->has_next() && walker->peek() != '\n')
    {
        walker->advance();
    }

    if (!lexerOptions.skipComments)
    {
        draft.value = std::string(walker->slice(draft.from, walker->index()));
    }
}

bool Lexer::scan_block_comment(TokenDraft& draft)
{
    draft.kind = TokenKind::BlockComment;

    walker->advance();
    bool closed = false;

    while (true)
    {
        char c = walker->advance();
        if (walker->is_at_end())
        {
            break;
        }
        if (c == '*' && walker->peek() == '/')
        {
            walker->advance();
            closed = true;
            break;
        }
    }

    if (!closed)
    {
        return fail(LexErrorCode::UnterminatedBlockComment, "Unterminated block comment", draft);
    }

    if (!lexerOptions.skipComments)
    {
        draft.value = std::string(walker->slice(draft.from, walker->index()));
    }
    return true;
}



#pragma region Character Classification

bool Lexer::is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool Lexer::is_hex_digit(char c)
{
    return is_digit(c) ||
           (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

bool Lexer::is_alpha(char c)
{
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           c == '_';
}

bool Lexer::is_alphanumeric(char c)
{
    return is_alpha(c) || is_digit(c);
}

}
