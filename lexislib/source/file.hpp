#pragma once

#include <string>
#include <string_view>
#include <cstdint>

namespace Lexis
{

class Token;

class SourceFile
{
public:
    SourceFile(std::string sourceText, std::string filePath, uint32_t id);

    static SourceFile load(std::string_view path, uint32_t id);

    std::string_view source() const { return sourceText; }
    std::string_view path() const { return filePath; }
    uint32_t file_id() const { return fileId; }

    std::string_view text(const Token& token) const;
    std::string_view line_text(int64_t line) const;

private:
    std::string sourceText;
    std::string filePath;
    uint32_t fileId;
};

}
