#include "reader.hpp"

#include <functional>
#include <stdexcept>
#include <logger.hpp>

namespace Lexis
{

bool TokenMatch::matches(const Token& token) const
{
    if (kind && token.kind() != *kind)
    {
        return false;
    }
    if (kinds && !kinds->contains(token.kind()))
    {
        return false;
    }
    if (valueHash && token.value_hash() != *valueHash)
    {
        return false;
    }
    if (value && token.value() != *value)
    {
        return false;
    }
    return true;
}

TokenReader::TokenReader(std::span<const Token> tokens)
    : source(std::make_unique<SpanTokenSource>(tokens))
{
}

TokenReader::TokenReader(std::unique_ptr<TokenSource> source)
    : source(std::move(source))
{
    if (!this->source)
    {
        throw std::invalid_argument("TokenReader requires a token source");
    }
}

size_t TokenReader::hash_value(std::string_view value)
{
    return std::hash<std::string_view>{}(value);
}

std::optional<Token> TokenReader::take()
{
    peek();
    if (!lookahead)
    {
        return std::nullopt;
    }

    std::optional<Token> token = std::move(lookahead);
    lookahead.reset();
    lookaheadFilled = false;
    return token;
}



#pragma region Lookahead

const std::optional<Token>& TokenReader::peek()
{
    if (!lookaheadFilled)
    {
        lookahead = source->next();
        lookaheadFilled = true;
    }
    return lookahead;
}

std::optional<TokenKind> TokenReader::peek_kind()
{
    const auto& next = peek();
    if (!next)
    {
        return std::nullopt;
    }
    return next->kind();
}

std::optional<bool> TokenReader::next_is(TokenKindSet kinds, std::optional<std::string_view> value)
{
    const auto& next = peek();
    if (!next)
    {
        return std::nullopt;
    }
    return kinds.contains(next->kind()) && (!value || *value == next->value());
}

bool TokenReader::eof()
{
    return !peek().has_value();
}



#pragma region Reading

ReadResult<Token> TokenReader::match_next(const TokenMatch& match)
{
    if (match.skipWhitespace.value_or(skipWhitespaceOnRead))
    {
        skip_whitespace_tokens();
    }

    const auto& next = peek();
    if (!next)
    {
        LOG(LogChannel::Reader) << "read past end of tokens";
        return ReadError{ReadErrorKind::EndOfStream, "Attempt to read past end of tokens", std::nullopt};
    }

    if (!match.matches(*next))
    {
        LOG(LogChannel::Reader) << match.failMessage << ", found " << next->format();
        return ReadError{ReadErrorKind::Mismatch, match.failMessage, *next};
    }

    return *next;
}

// The token is consumed only once its value converts.
template<typename T, typename Convert>
ReadResult<T> TokenReader::read_converted(const TokenMatch& match, Convert convert)
{
    auto next = match_next(match);
    if (!next)
    {
        return next.error();
    }

    std::optional<T> value;
    try
    {
        value = convert(next.value());
    }
    catch (const TokenConversionError& e)
    {
        LOG(LogChannel::Reader) << e.what();
        return ReadError{ReadErrorKind::Conversion, e.what(), next.value()};
    }

    currentToken = take();
    return std::move(*value);
}

ReadResult<Token> TokenReader::read_token(const TokenMatch& match)
{
    auto next = match_next(match);
    if (!next)
    {
        return next.error();
    }

    currentToken = take();
    return *currentToken;
}

ReadResult<double> TokenReader::read_float(std::optional<size_t> valueHash, std::string failMessage)
{
    return read_converted<double>({.kinds = float_readable_kinds, .valueHash = valueHash, .failMessage = std::move(failMessage)},
                                  [](const Token& token) { return token.to_float(); });
}

ReadResult<int64_t> TokenReader::read_integer(std::optional<size_t> valueHash, std::string failMessage)
{
    return read_converted<int64_t>({.kinds = integer_kinds, .valueHash = valueHash, .failMessage = std::move(failMessage)},
                                   [](const Token& token) { return token.to_integer(); });
}

ReadResult<bool> TokenReader::read_boolean(std::optional<size_t> valueHash, std::string failMessage)
{
    return read_converted<bool>({.kinds = boolean_kinds, .valueHash = valueHash, .failMessage = std::move(failMessage)},
                                [](const Token& token) { return token.kind() == TokenKind::TrueKeyword; });
}

ReadResult<std::string> TokenReader::read_string(std::optional<size_t> valueHash, std::string failMessage)
{
    return read_converted<std::string>({.kinds = string_kinds, .valueHash = valueHash, .failMessage = std::move(failMessage)},
                                       [](const Token& token) { return token.value(); });
}



#pragma region Skipping

ReadResult<Token> TokenReader::skip_token()
{
    std::optional<Token> token = take();
    if (!token)
    {
        return ReadError{ReadErrorKind::EndOfStream, "Attempt to skip token with no more tokens", std::nullopt};
    }

    currentToken = std::move(token);
    return *currentToken;
}

size_t TokenReader::skip_tokens(std::optional<size_t> count, std::optional<TokenKindSet> kinds)
{
    if (!count && !kinds)
    {
        throw std::invalid_argument("skip_tokens requires a count or a set of kinds");
    }

    size_t skipped = 0;
    while (!count || skipped < *count)
    {
        std::optional<TokenKind> kind = peek_kind();
        if (!kind || (kinds && !kinds->contains(*kind)))
        {
            break;
        }

        currentToken = take();
        skipped++;
    }
    return skipped;
}

TokenReader& TokenReader::skip_to_token(TokenKindSet kinds, bool through)
{
    if (kinds.empty())
    {
        throw std::invalid_argument("skip_to_token requires at least one token kind");
    }

    while (true)
    {
        std::optional<TokenKind> kind = peek_kind();
        if (!kind || kinds.contains(*kind))
        {
            break;
        }
        currentToken = take();
    }

    if (through && !eof())
    {
        currentToken = take();
    }
    return *this;
}

TokenReader& TokenReader::skip_whitespace_tokens()
{
    skip_tokens(std::nullopt, whitespace_kinds);
    return *this;
}

}
