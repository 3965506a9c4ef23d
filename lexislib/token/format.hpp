#pragma once

#include "token.hpp"
#include <span>
#include <string>

namespace Lexis
{

std::string format_tokens(std::span<const Token> tokens);

}
