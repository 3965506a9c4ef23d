#pragma once

#include "token.hpp"
#include <functional>
#include <optional>
#include <span>

namespace Lexis
{

// Pull-style producer of tokens. next() returns an empty optional once the
// sequence is exhausted, and keeps doing so.
class TokenSource
{
public:
    virtual ~TokenSource() = default;

    virtual std::optional<Token> next() = 0;
};

class SpanTokenSource final : public TokenSource
{
public:
    explicit SpanTokenSource(std::span<const Token> tokens);

    std::optional<Token> next() override;

    size_t position() const { return tokenIndex; }

private:
    std::span<const Token> tokens;
    size_t tokenIndex = 0;
};

class GeneratorTokenSource final : public TokenSource
{
public:
    using Generator = std::function<std::optional<Token>()>;

    explicit GeneratorTokenSource(Generator generator);

    std::optional<Token> next() override;

private:
    Generator generator;
    bool exhausted = false;
};

}
