#pragma once

#include "source/position.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace Lexis
{



struct Diagnostic
{
    enum class Severity
    {
        Information,
        Warning,
        Error
    };

    Severity severity;
    std::string systemName;
    std::string message;
    Position location;

    Diagnostic(Severity sev, std::string_view msg, const Position& loc, std::string_view sysName)
        : severity(sev)
        , systemName(sysName)
        , message(msg)
        , location(loc)
    {
    }

    std::string_view severity_string() const
    {
        switch (severity)
        {
            case Severity::Information:
                return "Info";
            case Severity::Warning:
                return "Warning";
            case Severity::Error:
                return "Error";
        }
        return "Unknown";
    }

    std::string format() const
    {
        return "[" + systemName + "] " + std::string(severity_string()) +
               location.format() + ": " + message;
    }

    std::string format(std::string_view filename) const
    {
        return std::string(filename) + ":" + std::to_string(location.line) +
               ":" + std::to_string(location.column) + ": " +
               std::string(severity_string()) + ": " + message;
    }

    // Source line followed by a caret under the reported column.
    std::string excerpt(std::string_view lineText) const
    {
        std::string result(lineText);
        result += "\n";
        for (int64_t i = 1; i < location.column; ++i)
        {
            size_t index = static_cast<size_t>(i - 1);
            result += index < lineText.size() && lineText[index] == '\t' ? '\t' : ' ';
        }
        result += "^";
        return result;
    }
};



class DiagnosticSystem
{
public:
    DiagnosticSystem(std::string_view sysName)
        : systemName(sysName)
    {
    }

    void report(const Diagnostic& diag)
    {
        diagnostics.push_back(diag);
    }

    void info(std::string_view msg, const Position& loc)
    {
        diagnostics.emplace_back(Diagnostic::Severity::Information, msg, loc, systemName);
    }

    void warn(std::string_view msg, const Position& loc)
    {
        diagnostics.emplace_back(Diagnostic::Severity::Warning, msg, loc, systemName);
    }

    void error(std::string_view msg, const Position& loc)
    {
        diagnostics.emplace_back(Diagnostic::Severity::Error, msg, loc, systemName);
    }

    void clear()
    {
        diagnostics.clear();
    }

    const std::vector<Diagnostic>& get_diagnostics() const
    {
        return diagnostics;
    }

    bool has_errors() const
    {
        return error_count() > 0;
    }

    size_t error_count() const
    {
        size_t count = 0;
        for (const auto& diag : diagnostics)
        {
            if (diag.severity == Diagnostic::Severity::Error)
            {
                count++;
            }
        }
        return count;
    }

    std::string_view name() const
    {
        return systemName;
    }

private:
    std::string systemName;
    std::vector<Diagnostic> diagnostics;
};


}
