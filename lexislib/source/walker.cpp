#include "walker.hpp"

namespace Lexis
{

SourceWalker::SourceWalker(std::string_view source)
    : source(source)
{
}

bool SourceWalker::is_at_end() const
{
    return atEnd;
}

bool SourceWalker::has_next() const
{
    return !atEnd && currentIndex + 1 < static_cast<int64_t>(source.size());
}

char SourceWalker::current() const
{
    return currentChar;
}

char SourceWalker::peek() const
{
    if (!has_next())
    {
        return '\0';
    }
    return source[static_cast<size_t>(currentIndex + 1)];
}

char SourceWalker::advance()
{
    if (atEnd)
    {
        return '\0';
    }

    if (!has_next())
    {
        atEnd = true;
        currentChar = '\0';
        return currentChar;
    }

    if (currentIndex >= 0 && currentChar == '\n')
    {
        currentPosition.line++;
        currentPosition.column = 0;
    }

    currentIndex++;
    currentChar = source[static_cast<size_t>(currentIndex)];
    currentPosition.column++;
    return currentChar;
}

int64_t SourceWalker::index() const
{
    return currentIndex;
}

const Position& SourceWalker::position() const
{
    return currentPosition;
}

std::string_view SourceWalker::slice(int64_t from, int64_t to) const
{
    if (from < 0 || to < from || to >= static_cast<int64_t>(source.size()))
    {
        return {};
    }
    return source.substr(static_cast<size_t>(from), static_cast<size_t>(to - from + 1));
}

}
