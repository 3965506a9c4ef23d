#include "file.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <token/token.hpp>

namespace Lexis
{

SourceFile::SourceFile(std::string source, std::string path, uint32_t id)
    : sourceText(std::move(source))
    , filePath(std::move(path))
    , fileId(id)
{
}

SourceFile SourceFile::load(std::string_view path, uint32_t id)
{
    std::ifstream file{std::string{path}, std::ios::binary};
    if (!file)
    {
        throw std::runtime_error("Could not open file: " + std::string(path));
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return SourceFile(buffer.str(), std::string(path), id);
}

std::string_view SourceFile::text(const Token& token) const
{
    int64_t from = token.from();
    int64_t to = token.to();
    if (from < 0 || to < from || to >= static_cast<int64_t>(sourceText.size()))
    {
        return {};
    }
    return std::string_view(sourceText).substr(static_cast<size_t>(from), static_cast<size_t>(to - from + 1));
}

std::string_view SourceFile::line_text(int64_t line) const
{
    if (line < 1)
    {
        return {};
    }

    size_t offset = 0;
    int64_t currentLine = 1;

    while (offset < sourceText.size() && currentLine < line)
    {
        if (sourceText[offset] == '\n')
        {
            currentLine++;
        }
        offset++;
    }

    if (currentLine != line)
    {
        return {};
    }

    size_t end = sourceText.find('\n', offset);
    if (end == std::string::npos)
    {
        end = sourceText.size();
    }
    return std::string_view(sourceText).substr(offset, end - offset);
}

}
