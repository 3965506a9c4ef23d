#pragma once

#include "common/result.hpp"
#include "lexer/error.hpp"
#include "token/token.hpp"
#include "source/walker.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Lexis
{

struct LexerOptions
{
    // Comment tokens are scanned but not emitted, and their text is not kept.
    bool skipComments = false;
    bool skipNewlines = false;
};

using LexResult = Result<std::span<const Token>, LexError>;
using TokenCallback = std::function<void(const Token&)>;

class Lexer
{
public:
    Lexer() = default;
    explicit Lexer(LexerOptions options);

    // Lexes the whole of `source`, appending to tokens(). Stops after a token
    // of `untilKind` has been produced or after `maxTokens` tokens have been
    // appended. On success the span covers the tokens appended by this run and
    // stays valid until the next run() or reset().
    LexResult run(std::string_view source,
                  TokenKind untilKind = TokenKind::Invalid,
                  std::optional<size_t> maxTokens = std::nullopt,
                  const TokenCallback& callback = {});

    void reset();

    const std::vector<Token>& tokens() const { return lexedTokens; }
    const std::optional<LexError>& error() const { return lastError; }

    const LexerOptions& options() const { return lexerOptions; }
    void set_options(LexerOptions options) { lexerOptions = options; }

    bool skip_comments() const { return lexerOptions.skipComments; }
    void set_skip_comments(bool skip) { lexerOptions.skipComments = skip; }

    bool skip_newlines() const { return lexerOptions.skipNewlines; }
    void set_skip_newlines(bool skip) { lexerOptions.skipNewlines = skip; }

private:
    struct TokenDraft
    {
        TokenKind kind = TokenKind::Invalid;
        int64_t from = -1;
        Position position;
        std::string value;
    };

    #pragma region Helpers

    bool scan_tokens(TokenKind untilKind, std::optional<size_t> maxTokens, const TokenCallback& callback);
    void skip_whitespace();
    bool is_filtered(TokenKind kind) const;
    Token finish_token(TokenDraft& draft) const;
    bool fail(LexErrorCode code, std::string description, const TokenDraft& draft);

    #pragma region Scanning

    bool scan_token(TokenDraft& draft);
    void scan_punctuation(TokenDraft& draft, std::string_view text);
    void scan_dots(TokenDraft& draft);
    void scan_word(TokenDraft& draft);
    bool scan_number(TokenDraft& draft);
    void scan_base_number(TokenDraft& draft);
    bool scan_string(TokenDraft& draft);
    bool scan_unicode_escape(TokenDraft& draft, char marker, std::string& out);
    void scan_line_comment(TokenDraft& draft);
    bool scan_block_comment(TokenDraft& draft);

    #pragma region Character Classification

    static bool is_digit(char c);
    static bool is_hex_digit(char c);
    static bool is_alpha(char c);
    static bool is_alphanumeric(char c);

    LexerOptions lexerOptions;
    std::vector<Token> lexedTokens;
    std::optional<LexError> lastError;

    // Only engaged for the duration of run().
    std::optional<SourceWalker> walker;
};

}
