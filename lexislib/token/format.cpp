#include "format.hpp"
#include <table_builder.hpp>
#include <vector>

namespace Lexis
{

static std::string escape_value(const std::string& value)
{
    std::string result;
    for (char c : value)
    {
        switch (c)
        {
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            case '\0': result += "\\0"; break;
            default:   result += c;     break;
        }
    }
    return result;
}

std::string format_tokens(std::span<const Token> tokens)
{
    TableBuilder table;

    std::vector<std::string> header = {"#"};
    for (const TokenField& field : Token().fields())
    {
        header.emplace_back(field.name);
    }
    table.set_header(std::move(header));

    for (size_t i = 0; i < tokens.size(); ++i)
    {
        std::vector<std::string> row = {std::to_string(i)};
        for (TokenField& field : tokens[i].fields())
        {
            row.push_back(field.name == "value" ? "'" + escape_value(field.value) + "'" : std::move(field.value));
        }
        table.add_row(std::move(row));
    }

    return table.build();
}

}
