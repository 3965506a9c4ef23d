#include "position.hpp"

namespace Lexis
{

Position::Position(int64_t line, int64_t column)
    : line(line)
    , column(column)
{
}

bool Position::is_valid() const
{
    return line >= 1 && column >= 0;
}

std::string Position::format() const
{
    return "[" + std::to_string(line) + ":" + std::to_string(column) + "]";
}

}
