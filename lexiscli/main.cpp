#include <charconv>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <logger.hpp>
#include <lexis.hpp>

struct CliOptions
{
    Lexis::LexerOptions lexer;
    Lexis::TokenKind untilKind = Lexis::TokenKind::Invalid;
    std::optional<size_t> maxTokens;
    bool quiet = false;
    std::vector<std::string> files;
};

static void print_usage()
{
    LOG(LogChannel::General) << "Usage: lexis [--skip-comments] [--skip-newlines] [--until <kind>] "
                                "[--max <count>] [--quiet] <file>...";
}

static std::optional<CliOptions> parse_arguments(int argc, char* argv[])
{
    CliOptions options;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (arg == "--skip-comments")
        {
            options.lexer.skipComments = true;
        }
        else if (arg == "--skip-newlines")
        {
            options.lexer.skipNewlines = true;
        }
        else if (arg == "--quiet")
        {
            options.quiet = true;
        }
        else if (arg == "--until" && i + 1 < argc)
        {
            auto kind = Lexis::kind_from_name(argv[++i]);
            if (!kind)
            {
                LOG(LogChannel::General) << "Error: Unknown token kind '" << argv[i] << "'";
                return std::nullopt;
            }
            options.untilKind = *kind;
        }
        else if (arg == "--max" && i + 1 < argc)
        {
            std::string_view text = argv[++i];
            size_t count = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
            if (ec != std::errc() || ptr != text.data() + text.size())
            {
                LOG(LogChannel::General) << "Error: Invalid token count '" << text << "'";
                return std::nullopt;
            }
            options.maxTokens = count;
        }
        else if (arg.starts_with("--"))
        {
            LOG(LogChannel::General) << "Error: Unknown option '" << arg << "'";
            return std::nullopt;
        }
        else
        {
            options.files.emplace_back(arg);
        }
    }

    if (options.files.empty())
    {
        return std::nullopt;
    }
    return options;
}

int main(int argc, char* argv[])
{
    std::optional<CliOptions> options = parse_arguments(argc, argv);
    if (!options)
    {
        print_usage();
        return 1;
    }

    // Lexical errors are reported below as diagnostics.
    Logger::disable(LogChannel::Lexer);

    Lexis::Lexer lexer(options->lexer);
    Lexis::DiagnosticSystem diagnostics("Lexer");

    for (size_t i = 0; i < options->files.size(); ++i)
    {
        const std::string& path = options->files[i];

        std::optional<Lexis::SourceFile> sourceFile;
        try
        {
            sourceFile.emplace(Lexis::SourceFile::load(path, static_cast<uint32_t>(i)));
        }
        catch (const std::runtime_error& e)
        {
            LOG(LogChannel::General) << "Error: " << e.what();
            return 1;
        }

        lexer.reset();
        Lexis::LexResult result = lexer.run(sourceFile->source(), options->untilKind, options->maxTokens);

        if (!options->quiet)
        {
            std::cout << "== " << path << "\n";
            std::cout << Lexis::format_tokens(lexer.tokens()) << "\n";
        }

        if (!result)
        {
            const Lexis::LexError& error = result.error();
            Lexis::Diagnostic diag = error.to_diagnostic(diagnostics.name());
            diagnostics.report(diag);

            std::cerr << diag.format(path) << "\n";
            std::cerr << diag.excerpt(sourceFile->line_text(error.position.line)) << "\n";
        }
    }

    if (diagnostics.has_errors())
    {
        LOG(LogChannel::General) << diagnostics.error_count() << " file(s) failed to lex";
        return 1;
    }
    return 0;
}
