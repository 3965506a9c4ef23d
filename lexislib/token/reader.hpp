#pragma once

#include "common/result.hpp"
#include "source.hpp"
#include "token.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace Lexis
{

enum class ReadErrorKind
{
    Mismatch,
    EndOfStream,

    // The token matched but its value does not fit the requested type.
    Conversion,
};

struct ReadError
{
    ReadErrorKind kind;
    std::string message;

    // The token that failed to match. Empty at end of stream.
    std::optional<Token> found;
};

template<typename T>
using ReadResult = Result<T, ReadError>;

// Criteria for TokenReader::read_token. Every criterion that is set must hold.
struct TokenMatch
{
    std::optional<TokenKind> kind;
    std::optional<TokenKindSet> kinds;
    std::optional<size_t> valueHash;
    std::optional<std::string> value;

    // Overrides TokenReader::skip_whitespace_on_read() for this read.
    std::optional<bool> skipWhitespace;

    std::string failMessage = "Failed to read token.";

    bool matches(const Token& token) const;
};

// Forward-only reader over a token source with one token of lookahead. The
// underlying source is never pulled more than one token ahead of consumption.
class TokenReader
{
public:
    explicit TokenReader(std::span<const Token> tokens);
    explicit TokenReader(std::unique_ptr<TokenSource> source);

    bool skip_whitespace_on_read() const { return skipWhitespaceOnRead; }
    void set_skip_whitespace_on_read(bool skip) { skipWhitespaceOnRead = skip; }

    #pragma region Lookahead

    const std::optional<Token>& current() const { return currentToken; }
    const std::optional<Token>& peek();
    std::optional<TokenKind> peek_kind();
    std::optional<bool> next_is(TokenKindSet kinds, std::optional<std::string_view> value = std::nullopt);
    bool eof();

    #pragma region Reading

    ReadResult<Token> read_token(const TokenMatch& match = {});

    ReadResult<double> read_float(std::optional<size_t> valueHash = std::nullopt,
                                  std::string failMessage = "Expected float literal");
    ReadResult<int64_t> read_integer(std::optional<size_t> valueHash = std::nullopt,
                                     std::string failMessage = "Expected integer literal");
    ReadResult<bool> read_boolean(std::optional<size_t> valueHash = std::nullopt,
                                  std::string failMessage = "Expected boolean literal");
    ReadResult<std::string> read_string(std::optional<size_t> valueHash = std::nullopt,
                                        std::string failMessage = "Expected string literal");

    #pragma region Skipping

    ReadResult<Token> skip_token();

    // Skips at most `count` tokens and, if `kinds` is given, only while the
    // next token is one of them. Returns the number of tokens skipped.
    size_t skip_tokens(std::optional<size_t> count, std::optional<TokenKindSet> kinds = std::nullopt);

    TokenReader& skip_to_token(TokenKindSet kinds, bool through = false);
    TokenReader& skip_whitespace_tokens();

    static size_t hash_value(std::string_view value);

private:
    std::optional<Token> take();

    // Skips whitespace if requested and checks the next token against
    // `match` without consuming it.
    ReadResult<Token> match_next(const TokenMatch& match);

    template<typename T, typename Convert>
    ReadResult<T> read_converted(const TokenMatch& match, Convert convert);

    std::unique_ptr<TokenSource> source;
    std::optional<Token> lookahead;
    bool lookaheadFilled = false;
    std::optional<Token> currentToken;
    bool skipWhitespaceOnRead = true;
};

}
