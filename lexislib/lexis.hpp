#pragma once

#include "lexer/lexer.hpp"
#include "token/reader.hpp"
#include "token/format.hpp"
#include "source/file.hpp"
#include "common/diagnostic.hpp"
