#include "test_harness.hpp"

#include <vector>
#include <logger.hpp>

using namespace Lexis;

static std::vector<Token> lex(std::string_view source, LexerOptions options = {})
{
    Lexer lexer(options);
    LexResult result = lexer.run(source);
    if (!result)
    {
        throw std::runtime_error("unexpected lex error: " + result.error().format());
    }
    return std::vector<Token>(result.value().begin(), result.value().end());
}

static LexError lex_error(std::string_view source)
{
    Lexer lexer;
    LexResult result = lexer.run(source);
    if (result)
    {
        throw std::runtime_error("expected a lex error for '" + std::string(source) + "'");
    }
    return result.error();
}

static void expect_kinds(const std::vector<TokenKind>& expected, const std::vector<Token>& tokens, const char* msg)
{
    expect_count(expected.size(), tokens.size(), msg);
    for (size_t i = 0; i < expected.size(); ++i)
    {
        expect_eq(expected[i], tokens[i].kind(), msg);
    }
}

// === Basics ===

void test_empty_input()
{
    expect_count(0, lex("").size(), "empty source");
    expect_count(0, lex(" \t\r ").size(), "blank source");
}

void test_identifiers_and_keywords()
{
    auto tokens = lex("foo _bar x1 true false null trueish");
    expect_kinds({
        TokenKind::Identifier, TokenKind::Identifier, TokenKind::Identifier,
        TokenKind::TrueKeyword, TokenKind::FalseKeyword, TokenKind::NullKeyword,
        TokenKind::Identifier,
    }, tokens, "words");

    expect_eq(std::string("_bar"), tokens[1].value(), "underscore identifier");
    expect_eq(std::string("x1"), tokens[2].value(), "identifier with digit");
    expect_eq(std::string("trueish"), tokens[6].value(), "keyword prefix stays identifier");
}

// === Numbers ===

void test_decimal_integers()
{
    const int64_t values[] = {0, 7, 42, 123456, 9223372036854775807};
    for (int64_t value : values)
    {
        auto tokens = lex(std::to_string(value));
        expect_count(1, tokens.size(), "one integer token");
        expect_eq(TokenKind::LiteralInteger, tokens[0].kind(), "integer kind");
        expect_eq(value, tokens[0].to_integer(), "integer value");
    }
}

void test_hex_and_binary()
{
    auto hex = lex("0x1A");
    expect_count(1, hex.size(), "one hex token");
    expect_eq(TokenKind::LiteralHex, hex[0].kind(), "hex kind");
    expect_eq(std::string("0x1A"), hex[0].value(), "hex keeps prefix");
    expect_eq(int64_t(26), hex[0].to_integer(), "hex value");

    auto bin = lex("0b101");
    expect_count(1, bin.size(), "one binary token");
    expect_eq(TokenKind::LiteralBinary, bin[0].kind(), "binary kind");
    expect_eq(int64_t(5), bin[0].to_integer(), "binary value");

    auto upper = lex("0XfF 0B11");
    expect_eq(int64_t(255), upper[0].to_integer(), "upper case hex prefix");
    expect_eq(int64_t(3), upper[1].to_integer(), "upper case binary prefix");

    auto bare = lex("0x");
    expect_eq(TokenKind::LiteralHex, bare[0].kind(), "bare prefix is hex");
    expect_eq(int64_t(0), bare[0].to_integer(), "bare prefix value");

    auto trailing = lex("0b12");
    expect_kinds({TokenKind::LiteralBinary, TokenKind::LiteralInteger}, trailing, "binary stops at 2");
    expect_eq(std::string("0b1"), trailing[0].value(), "binary digits");
}

void test_floats_and_exponents()
{
    auto tokens = lex("1.5 .5 1.5e-3 2e10 1E+2 3.0E2");
    expect_kinds({
        TokenKind::LiteralFloat, TokenKind::LiteralFloat, TokenKind::LiteralFloatExp,
        TokenKind::LiteralIntegerExp, TokenKind::LiteralIntegerExp, TokenKind::LiteralFloatExp,
    }, tokens, "number kinds");

    expect_eq(std::string(".5"), tokens[1].value(), "leading dot float");
    expect_eq(std::string("1.5e-3"), tokens[2].value(), "float exp text");
    expect_near(0.0015, tokens[2].to_float(), "float exp value");
    expect_eq(int64_t(1), tokens[4].to_integer(), "integer exp keeps leading digits");
    expect_near(100.0, tokens[4].to_float(), "integer exp as float");
}

void test_second_decimal_point_ends_number()
{
    auto tokens = lex("1..2");
    expect_kinds({TokenKind::LiteralFloat, TokenKind::LiteralFloat}, tokens, "1. then .2");
    expect_eq(std::string("1."), tokens[0].value(), "first float");
    expect_eq(std::string(".2"), tokens[1].value(), "second float");

    auto dotted = lex("1.2.3");
    expect_eq(std::string("1.2"), dotted[0].value(), "first part");
    expect_eq(std::string(".3"), dotted[1].value(), "second part");

    auto exponent = lex("1e5.5");
    expect_kinds({TokenKind::LiteralFloat}, exponent, "point after exponent stays in the literal");
    expect_eq(std::string("1e5.5"), exponent[0].value(), "whole literal");
    expect_near(100000.0, exponent[0].to_float(), "float value stops at the point");

    auto twice = lex("1.5e2.5");
    expect_kinds({TokenKind::LiteralFloatExp, TokenKind::LiteralFloat}, twice, "second point ends the literal");
}

void test_malformed_exponent()
{
    expect_eq(LexErrorCode::MalformedExponent, lex_error("1e").code, "no digit after e");
    expect_eq(LexErrorCode::MalformedExponent, lex_error("1e+").code, "no digit after sign");
    expect_eq(LexErrorCode::MalformedExponent, lex_error("2.0Ex").code, "letter after E");

    LexError error = lex_error("x 1e");
    expect_position(1, 4, error.position, "reported at the exponent marker");
    expect_eq(std::string("Malformed number literal: exponent expected but not provided"), error.description, "description");
}

void test_duplicate_exponent()
{
    expect_eq(LexErrorCode::DuplicateExponent, lex_error("1e1e1").code, "second e");
    expect_eq(LexErrorCode::DuplicateExponent, lex_error("1.2e3E4").code, "second E");

    LexError error = lex_error("1e1e1");
    expect_position(1, 4, error.position, "reported at the second marker");
}

// === Strings ===

void test_string_escape_decoding()
{
    auto tokens = lex("'a\\nb'");
    expect_count(1, tokens.size(), "one string token");
    expect_eq(TokenKind::LiteralSingleString, tokens[0].kind(), "single quoted");
    expect_eq(std::string("a\nb"), tokens[0].value(), "newline escape decoded");
    expect_count(3, tokens[0].value().size(), "three characters");

    auto dbl = lex("\"hi\"");
    expect_eq(TokenKind::LiteralDoubleString, dbl[0].kind(), "double quoted");
    expect_eq(std::string("hi"), dbl[0].value(), "double quoted value");
}

void test_simple_escapes()
{
    expect_eq(std::string("\t\r\b\a\f\v"), lex(R"('\t\r\b\a\f\v')")[0].value(), "control escapes");
    expect_eq(std::string(1, '\0'), lex(R"('\0')")[0].value(), "nul escape");
    expect_eq(std::string("it's"), lex(R"('it\'s')")[0].value(), "escaped quote");
    expect_eq(std::string("a\\b"), lex(R"('a\\b')")[0].value(), "escaped backslash");
    expect_eq(std::string("q\"q"), lex(R"("q\"q")")[0].value(), "escaped double quote");
    expect_eq(std::string("q"), lex(R"('\q')")[0].value(), "unknown escape keeps character");
    expect_eq(std::string("say \"hi\""), lex(R"('say "hi"')")[0].value(), "other quote needs no escape");
}

void test_unicode_escapes()
{
    expect_eq(std::string("A"), lex(R"('\x41')")[0].value(), "short escape");
    expect_eq(std::string("\xC3\xA9"), lex(R"('\x00e9')")[0].value(), "two byte code point");
    expect_eq(std::string("\xE2\x82\xAC"), lex(R"('\x20AC')")[0].value(), "three byte code point");
    expect_eq(std::string("\xF0\x9F\x98\x80"), lex(R"('\X0001F600')")[0].value(), "eight digit escape");
    expect_eq(std::string("Az"), lex(R"('\x41z')")[0].value(), "escape stops at non hex");
    expect_eq(std::string("A1"), lex(R"('\x00411')")[0].value(), "at most four digits");
}

void test_malformed_unicode_escape()
{
    expect_eq(LexErrorCode::MalformedUnicodeEscape, lex_error(R"('\xZZ')").code, "no hex digit");
    expect_eq(LexErrorCode::MalformedUnicodeEscape, lex_error(R"('\x')").code, "quote right after escape");
    expect_eq(LexErrorCode::MalformedUnicodeEscape, lex_error(R"('\xD800')").code, "surrogate");
    expect_eq(LexErrorCode::MalformedUnicodeEscape, lex_error(R"('\X00110000')").code, "beyond unicode range");
}

void test_unterminated_string()
{
    LexError error = lex_error("'abc");
    expect_eq(LexErrorCode::UnterminatedString, error.code, "missing quote");
    expect_position(1, 4, error.position, "reported at end of input");
    expect_eq(std::string("Unterminated string"), error.description, "description");

    expect_eq(LexErrorCode::UnterminatedString, lex_error("'abc\\'").code, "escaped closing quote");
    expect_eq(LexErrorCode::UnterminatedString, lex_error("\"abc'").code, "mismatched quotes");
}

// === Punctuation ===

void test_every_punctuation_lexes_to_one_token()
{
    for (const auto& entry : punctuation_table)
    {
        auto tokens = lex(entry.text);
        expect_count(1, tokens.size(), "single token");
        expect_eq(entry.kind, tokens[0].kind(), "punctuation kind");
        expect_eq(std::string(entry.text), tokens[0].value(), "punctuation value");
        expect_eq(int64_t(entry.text.size()) - 1, tokens[0].to(), "span covers the text");
    }
}

void test_maximal_munch()
{
    expect_kinds({TokenKind::Identifier, TokenKind::LessEqual, TokenKind::Identifier}, lex("a<=b"), "a<=b");
    expect_kinds({TokenKind::Arrow, TokenKind::Greater}, lex("->>"), "->>");
    expect_kinds({TokenKind::Equal, TokenKind::Assign}, lex("==="), "===");
    expect_kinds({TokenKind::TripleDot, TokenKind::Dot}, lex("...."), "....");
    expect_kinds({TokenKind::ShiftLeft, TokenKind::Assign}, lex("<<="), "<<=");
    expect_kinds({TokenKind::DoubleMinus, TokenKind::Minus}, lex("---"), "---");
    expect_kinds({TokenKind::Bang, TokenKind::Bang}, lex("!!"), "!!");
    expect_kinds({TokenKind::Identifier, TokenKind::Slash, TokenKind::Identifier}, lex("a/b"), "a/b");
    expect_kinds({TokenKind::Dot, TokenKind::Identifier}, lex(".x"), ".x");
}

// === Newlines and positions ===

void test_newlines()
{
    auto tokens = lex("a\nb");
    expect_kinds({TokenKind::Identifier, TokenKind::Newline, TokenKind::Identifier}, tokens, "a newline b");
    expect_eq(std::string("\n"), tokens[1].value(), "newline value");

    auto crlf = lex("a\r\nb");
    expect_kinds({TokenKind::Identifier, TokenKind::Newline, TokenKind::Identifier}, crlf, "carriage return skipped");
}

void test_source_positions()
{
    auto tokens = lex("foo  bar\n  baz");
    expect_count(4, tokens.size(), "token count");

    expect_position(1, 1, tokens[0].position(), "foo");
    expect_eq(int64_t(0), tokens[0].from(), "foo from");
    expect_eq(int64_t(2), tokens[0].to(), "foo to");

    expect_position(1, 6, tokens[1].position(), "bar");
    expect_eq(int64_t(5), tokens[1].from(), "bar from");
    expect_eq(int64_t(7), tokens[1].to(), "bar to");

    expect_position(1, 9, tokens[2].position(), "newline");
    expect_eq(int64_t(8), tokens[2].from(), "newline from");

    expect_position(2, 3, tokens[3].position(), "baz");
    expect_eq(int64_t(11), tokens[3].from(), "baz from");
    expect_eq(int64_t(13), tokens[3].to(), "baz to");
}

void test_string_span_includes_quotes()
{
    auto tokens = lex("x 'a\\tb'");
    expect_eq(int64_t(2), tokens[1].from(), "opening quote");
    expect_eq(int64_t(7), tokens[1].to(), "closing quote");
}

// === Comments ===

void test_comments()
{
    auto tokens = lex("a // c\nb");
    expect_kinds({TokenKind::Identifier, TokenKind::LineComment, TokenKind::Newline, TokenKind::Identifier},
                 tokens, "line comment");
    expect_eq(std::string("// c"), tokens[1].value(), "line comment text excludes newline");

    auto block = lex("a /* x\n y */ b");
    expect_kinds({TokenKind::Identifier, TokenKind::BlockComment, TokenKind::Identifier}, block, "block comment");
    expect_eq(std::string("/* x\n y */"), block[1].value(), "block comment text");
    expect_position(2, 7, block[2].position(), "line counting continues through comments");

    auto trailing = lex("x // end");
    expect_eq(std::string("// end"), trailing[1].value(), "comment at end of input");
}

void test_skip_comments_and_newlines()
{
    LexerOptions options;
    options.skipComments = true;
    options.skipNewlines = true;

    auto tokens = lex("a // c\nb", options);
    expect_kinds({TokenKind::Identifier, TokenKind::Identifier}, tokens, "only identifiers");
    expect_eq(std::string("a"), tokens[0].value(), "first identifier");
    expect_eq(std::string("b"), tokens[1].value(), "second identifier");

    LexerOptions commentsOnly;
    commentsOnly.skipComments = true;
    auto kept = lex("a /* x */\nb", commentsOnly);
    expect_kinds({TokenKind::Identifier, TokenKind::Newline, TokenKind::Identifier}, kept, "newlines kept");
}

void test_unterminated_block_comment()
{
    expect_eq(LexErrorCode::UnterminatedBlockComment, lex_error("/* abc").code, "no closing marker");
    expect_eq(LexErrorCode::UnterminatedBlockComment, lex_error("/*/").code, "slash is not a closing marker");
    expect_eq(LexErrorCode::UnterminatedBlockComment, lex_error("/* a *").code, "star at end");
}

// === Errors ===

void test_invalid_token()
{
    Lexer lexer;
    LexResult result = lexer.run("a \x01");
    expect_true(result.is_error(), "control character fails");
    expect_eq(LexErrorCode::InvalidToken, result.error().code, "invalid token code");
    expect_position(1, 3, result.error().position, "invalid token position");
    expect_true(result.error().description.find("Invalid token") != std::string::npos, "description");
    expect_count(1, lexer.tokens().size(), "tokens before the error remain");

    expect_eq(LexErrorCode::InvalidToken, lex_error("\xC3\xA9").code, "non ascii byte outside string");
}

void test_error_record_on_instance()
{
    Lexer lexer;
    LexResult result = lexer.run("1e1e1");
    expect_true(result.is_error(), "fails");
    expect_true(lexer.error().has_value(), "error kept on the lexer");
    expect_eq(LexErrorCode::DuplicateExponent, lexer.error()->code, "same code");
    expect_position(result.error().position.line, result.error().position.column, lexer.error()->position, "same position");
    expect_true(lexer.error()->format().find("(duplicate_exponent)") != std::string::npos, "formatted code");

    LexResult next = lexer.run("ok");
    expect_true(next.is_ok(), "next run succeeds");
    expect_true(!lexer.error().has_value(), "error cleared by run");
}

// === Run control ===

void test_until_kind()
{
    Lexer lexer;
    LexResult result = lexer.run("a ; b ; c", TokenKind::Semicolon);
    expect_true(result.is_ok(), "lexes");
    expect_count(2, result.value().size(), "stops after the first semicolon");
    expect_eq(TokenKind::Semicolon, result.value()[1].kind(), "semicolon included");
}

void test_max_tokens()
{
    Lexer lexer;
    LexResult result = lexer.run("a b c d", TokenKind::Invalid, 2);
    expect_true(result.is_ok(), "lexes");
    expect_count(2, result.value().size(), "two tokens");
    expect_eq(std::string("b"), result.value()[1].value(), "second token");

    Lexer skipping(LexerOptions{false, true});
    LexResult filtered = skipping.run("a\n\nb\nc", TokenKind::Invalid, 2);
    expect_count(2, filtered.value().size(), "filtered tokens do not count");
    expect_eq(std::string("b"), filtered.value()[1].value(), "second appended token");

    Lexer none;
    expect_count(0, none.run("a b", TokenKind::Invalid, 0).value().size(), "zero tokens");
}

void test_token_callback()
{
    Lexer lexer(LexerOptions{true, false});
    std::vector<std::string> seen;
    LexResult result = lexer.run("x // note\ny", TokenKind::Invalid, std::nullopt,
                                 [&seen](const Token& token) { seen.push_back(token.value()); });
    expect_true(result.is_ok(), "lexes");
    expect_count(3, seen.size(), "callback sees appended tokens only");
    expect_eq(std::string("x"), seen[0], "first");
    expect_eq(std::string("\n"), seen[1], "newline");
    expect_eq(std::string("y"), seen[2], "last");
}

void test_runs_accumulate_until_reset()
{
    Lexer lexer;
    expect_true(lexer.run("a").is_ok(), "first run");
    LexResult second = lexer.run("b c");
    expect_true(second.is_ok(), "second run");
    expect_count(2, second.value().size(), "span covers this run only");
    expect_count(3, lexer.tokens().size(), "tokens accumulate");

    lexer.reset();
    expect_count(0, lexer.tokens().size(), "reset clears tokens");
}

void test_reset_is_idempotent()
{
    const char* source = "fn add(a, b) -> int { return a + b ** 2; } // done\n'x\\x41' 0x1F 1.5e3";
    Lexer lexer;
    lexer.set_skip_newlines(true);

    lexer.reset();
    expect_true(lexer.run(source).is_ok(), "first run");
    std::vector<Token> first = lexer.tokens();

    lexer.reset();
    expect_true(lexer.run(source).is_ok(), "second run");
    std::vector<Token> second = lexer.tokens();

    expect_count(first.size(), second.size(), "same length");
    for (size_t i = 0; i < first.size(); ++i)
    {
        expect_true(first[i] == second[i], "identical token");
    }
    expect_true(lexer.skip_newlines(), "reset keeps configuration");
}

void test_option_accessors()
{
    Lexer lexer;
    expect_true(!lexer.skip_comments(), "comments kept by default");
    expect_true(!lexer.skip_newlines(), "newlines kept by default");

    lexer.set_skip_comments(true);
    expect_true(lexer.options().skipComments, "options reflect setter");

    lexer.set_options(LexerOptions{});
    expect_true(!lexer.skip_comments(), "options replaced");
}

int main()
{
    std::cout << "Running lexer tests...\n";

    Logger::disable(LogChannel::Lexer);

    RUN_TEST(test_empty_input);
    RUN_TEST(test_identifiers_and_keywords);
    RUN_TEST(test_decimal_integers);
    RUN_TEST(test_hex_and_binary);
    RUN_TEST(test_floats_and_exponents);
    RUN_TEST(test_second_decimal_point_ends_number);
    RUN_TEST(test_malformed_exponent);
    RUN_TEST(test_duplicate_exponent);
    RUN_TEST(test_string_escape_decoding);
    RUN_TEST(test_simple_escapes);
    RUN_TEST(test_unicode_escapes);
    RUN_TEST(test_malformed_unicode_escape);
    RUN_TEST(test_unterminated_string);
    RUN_TEST(test_every_punctuation_lexes_to_one_token);
    RUN_TEST(test_maximal_munch);
    RUN_TEST(test_newlines);
    RUN_TEST(test_source_positions);
    RUN_TEST(test_string_span_includes_quotes);
    RUN_TEST(test_comments);
    RUN_TEST(test_skip_comments_and_newlines);
    RUN_TEST(test_unterminated_block_comment);
    RUN_TEST(test_invalid_token);
    RUN_TEST(test_error_record_on_instance);
    RUN_TEST(test_until_kind);
    RUN_TEST(test_max_tokens);
    RUN_TEST(test_token_callback);
    RUN_TEST(test_runs_accumulate_until_reset);
    RUN_TEST(test_reset_is_idempotent);
    RUN_TEST(test_option_accessors);

    return finish_tests();
}
