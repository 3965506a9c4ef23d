#pragma once

#include <cstdint>
#include <string>

namespace Lexis
{

struct Position
{
    int64_t line = -1;
    int64_t column = -1;

    Position() = default;
    Position(int64_t line, int64_t column);

    bool is_valid() const;
    std::string format() const;

    bool operator==(const Position& other) const = default;
};

}
