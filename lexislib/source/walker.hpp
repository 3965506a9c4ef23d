#pragma once

#include <string_view>
#include <cstdint>

#include <source/position.hpp>

namespace Lexis
{

// Cursor over source text with one character of lookahead. The cursor starts
// before the first character; advance() moves onto the next character and
// makes it current.
class SourceWalker
{
public:
    explicit SourceWalker(std::string_view source);

    bool is_at_end() const;
    bool has_next() const;
    char current() const;
    char peek() const;
    char advance();

    int64_t index() const;
    const Position& position() const;
    std::string_view slice(int64_t from, int64_t to) const;

private:
    std::string_view source;

    int64_t currentIndex = -1;
    char currentChar = '\0';
    bool atEnd = false;
    Position currentPosition{1, 0};
};

}
