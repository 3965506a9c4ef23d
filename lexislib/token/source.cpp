#include "source.hpp"

namespace Lexis
{

SpanTokenSource::SpanTokenSource(std::span<const Token> tokens)
    : tokens(tokens)
{
}

std::optional<Token> SpanTokenSource::next()
{
    if (tokenIndex >= tokens.size())
    {
        return std::nullopt;
    }
    return tokens[tokenIndex++];
}

GeneratorTokenSource::GeneratorTokenSource(Generator generator)
    : generator(std::move(generator))
{
}

std::optional<Token> GeneratorTokenSource::next()
{
    if (exhausted || !generator)
    {
        return std::nullopt;
    }

    std::optional<Token> token = generator();
    if (!token)
    {
        exhausted = true;
    }
    return token;
}

}
