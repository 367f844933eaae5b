#include <catch2/catch.hpp>
#include <cc/lang/scanner.hpp>
#include <cstdlib>
#include <string>
#include <vector>

using namespace cc;

static std::string fixture_dir() {
    const char* src = std::getenv("CC_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

struct Lexed {
    std::vector<PpToken> tokens;   // without the final Eof
    std::string trivia;            // all trivia, concatenated
    std::string rebuilt;           // trivia + spellings, in order
};

static Lexed lex_all(CharStream& s) {
    Lexed out;
    for (;;) {
        std::string trivia;
        auto r = next_token(s, trivia);
        REQUIRE(r.is_ok());
        out.trivia += trivia;
        out.rebuilt += trivia;
        if (r.value().type == PpTokenType::Eof) break;
        out.rebuilt += pp_token_spelling(r.value());
        out.tokens.push_back(r.value());
    }
    return out;
}

static Lexed lex_text(const std::string& text) {
    CharStream s;
    s.push_text("<input>", text);
    return lex_all(s);
}

static std::vector<PpTokenType> types_of(const std::string& text) {
    std::vector<PpTokenType> types;
    for (auto& t : lex_text(text).tokens) types.push_back(t.type);
    return types;
}

// ===== Terminal state =====

TEST_CASE("empty input gives Eof", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "");
    std::string trivia;
    auto r = next_token(s, trivia);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().type == PpTokenType::Eof);
    REQUIRE(trivia.empty());
}

TEST_CASE("Eof repeats after the end", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "x  ");
    std::string trivia;
    REQUIRE(next_token(s, trivia).value().type == PpTokenType::Identifier);
    for (int i = 0; i < 5; ++i) {
        auto r = next_token(s, trivia);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().type == PpTokenType::Eof);
    }
    REQUIRE(trivia == "  ");
}

// ===== Identifiers =====

TEST_CASE("identifiers", "[scanner]") {
    auto lx = lex_text("foo _bar baz42 __x_1");
    REQUIRE(lx.tokens.size() == 4);
    REQUIRE(lx.tokens[0].type == PpTokenType::Identifier);
    REQUIRE(lx.tokens[0].text == "foo");
    REQUIRE(lx.tokens[1].text == "_bar");
    REQUIRE(lx.tokens[2].text == "baz42");
    REQUIRE(lx.tokens[3].text == "__x_1");
    REQUIRE(lx.tokens[3].pos == Position{0, 1, 16});
}

TEST_CASE("identifier spliced across lines", "[scanner]") {
    auto lx = lex_text("ab\\\ncd ef");
    REQUIRE(lx.tokens.size() == 2);
    REQUIRE(lx.tokens[0].text == "abcd");
    REQUIRE(lx.tokens[1].pos == Position{0, 2, 4});
}

// ===== Line endings =====

TEST_CASE("line ending styles tokenize identically", "[scanner]") {
    for (const char* text : {"a\nb", "a\rb", "a\r\nb", "a\n\rb"}) {
        CAPTURE(text);
        auto lx = lex_text(text);
        REQUIRE(lx.tokens.size() == 2);
        REQUIRE(lx.tokens[0].text == "a");
        REQUIRE(lx.tokens[1].text == "b");
        REQUIRE(lx.tokens[1].pos.line == 2);
        REQUIRE(lx.tokens[1].pos.col == 1);
        REQUIRE(lx.trivia == "\n");
    }
}

TEST_CASE("after_newline is set when the preceding whitespace held a newline", "[scanner]") {
    auto lx = lex_text("a b\n  # c /* \n */ d");
    REQUIRE(lx.tokens.size() == 5);
    REQUIRE_FALSE(lx.tokens[0].after_newline);
    REQUIRE_FALSE(lx.tokens[1].after_newline);
    REQUIRE(lx.tokens[2].type == PpTokenType::Hash);
    REQUIRE(lx.tokens[2].after_newline);
    REQUIRE_FALSE(lx.tokens[3].after_newline);
    // The newline inside the comment is not whitespace
    REQUIRE_FALSE(lx.tokens[4].after_newline);
}

TEST_CASE("first token of the input has no preceding newline", "[scanner]") {
    auto lx = lex_text("#define X 1\n#undef X");
    REQUIRE(lx.tokens.size() == 7);
    REQUIRE(lx.tokens[0].type == PpTokenType::Hash);
    REQUIRE_FALSE(lx.tokens[0].after_newline);
    REQUIRE(lx.tokens[4].type == PpTokenType::Hash);
    REQUIRE(lx.tokens[4].after_newline);

    // A blank first line does count
    auto blank = lex_text("\n#x");
    REQUIRE(blank.tokens[0].after_newline);
}

// ===== Numbers =====

TEST_CASE("numbers", "[scanner]") {
    auto lx = lex_text("0 42 0x1F 1.5e+3 7E-2 10UL 1.2.3 9abc_z");
    std::vector<std::string> want = {"0", "42", "0x1F", "1.5e+3", "7E-2",
                                     "10UL", "1.2.3", "9abc_z"};
    REQUIRE(lx.tokens.size() == want.size());
    for (size_t i = 0; i < want.size(); ++i) {
        REQUIRE(lx.tokens[i].type == PpTokenType::Number);
        REQUIRE(lx.tokens[i].text == want[i]);
    }
}

TEST_CASE("leading dot decides between number and punctuator", "[scanner]") {
    auto dot = lex_text(".b");
    REQUIRE(dot.tokens.size() == 2);
    REQUIRE(dot.tokens[0].type == PpTokenType::Dot);
    REQUIRE(dot.tokens[1].type == PpTokenType::Identifier);
    REQUIRE(dot.tokens[1].text == "b");

    auto num = lex_text(".31e-0");
    REQUIRE(num.tokens.size() == 1);
    REQUIRE(num.tokens[0].type == PpTokenType::Number);
    REQUIRE(num.tokens[0].text == ".31e-0");
}

TEST_CASE("sign only follows an exponent letter", "[scanner]") {
    REQUIRE(types_of("1+2") == std::vector<PpTokenType>{
        PpTokenType::Number, PpTokenType::Add, PpTokenType::Number});
    auto lx = lex_text("0xe+1");
    REQUIRE(lx.tokens.size() == 1);
    REQUIRE(lx.tokens[0].text == "0xe+1");
}

TEST_CASE("dot followed by a spliced digit is a number", "[scanner]") {
    auto lx = lex_text(".\\\n5");
    REQUIRE(lx.tokens.size() == 1);
    REQUIRE(lx.tokens[0].type == PpTokenType::Number);
    REQUIRE(lx.tokens[0].text == ".5");
}

// ===== Literals =====

TEST_CASE("character and string literals", "[scanner]") {
    auto lx = lex_text("'a' \"hello world\" '\\'' \"say \\\"hi\\\"\"");
    REQUIRE(lx.tokens.size() == 4);
    REQUIRE(lx.tokens[0].type == PpTokenType::CharLiteral);
    REQUIRE(lx.tokens[0].text == "a");
    REQUIRE(lx.tokens[1].type == PpTokenType::StringLiteral);
    REQUIRE(lx.tokens[1].text == "hello world");
    REQUIRE(lx.tokens[2].type == PpTokenType::CharLiteral);
    REQUIRE(lx.tokens[2].text == "\\'");
    REQUIRE(lx.tokens[3].type == PpTokenType::StringLiteral);
    REQUIRE(lx.tokens[3].text == "say \\\"hi\\\"");
}

TEST_CASE("escapes are kept as written", "[scanner]") {
    auto lx = lex_text("\"\\n\\t\\\\\" '\\x41'");
    REQUIRE(lx.tokens[0].text == "\\n\\t\\\\");
    REQUIRE(lx.tokens[1].text == "\\x41");
}

TEST_CASE("empty literals", "[scanner]") {
    auto lx = lex_text("\"\" ''");
    REQUIRE(lx.tokens.size() == 2);
    REQUIRE(lx.tokens[0].type == PpTokenType::StringLiteral);
    REQUIRE(lx.tokens[0].text.empty());
    REQUIRE(lx.tokens[1].type == PpTokenType::CharLiteral);
}

TEST_CASE("comment openers inside a string are text", "[scanner]") {
    auto lx = lex_text("\"/* not // a comment */\"");
    REQUIRE(lx.tokens.size() == 1);
    REQUIRE(lx.tokens[0].text == "/* not // a comment */");
}

TEST_CASE("string continued with a splice", "[scanner]") {
    auto lx = lex_text("\"ab\\\ncd\"");
    REQUIRE(lx.tokens.size() == 1);
    REQUIRE(lx.tokens[0].text == "abcd");
}

TEST_CASE("unterminated char literal recovers at the next token", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "'a\n,");
    std::string trivia;

    auto r = next_token(s, trivia);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "unterminated character constant");
    REQUIRE(r.error().pos == std::optional<Position>(Position{0, 1, 1}));

    auto next = next_token(s, trivia);
    REQUIRE(next.is_ok());
    REQUIRE(next.value().type == PpTokenType::Comma);
    REQUIRE(next.value().after_newline);
}

TEST_CASE("unterminated string at end of input", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "x = \"abc");
    std::string trivia;
    REQUIRE(next_token(s, trivia).is_ok());
    REQUIRE(next_token(s, trivia).is_ok());

    auto r = next_token(s, trivia);
    REQUIRE(r.is_err());
    REQUIRE(r.error() == CcError{"unterminated string constant", Position{0, 1, 5}});
    REQUIRE(next_token(s, trivia).value().type == PpTokenType::Eof);
}

TEST_CASE("escape at end of input is unterminated", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "'\\");
    std::string trivia;
    auto r = next_token(s, trivia);
    REQUIRE(r.is_err());
    REQUIRE(r.error().pos->col == 1);
}

// ===== Punctuators =====

TEST_CASE("punctuator sequence", "[scanner]") {
    REQUIRE(types_of("a->b[i] += *p++ != ~q;") == std::vector<PpTokenType>{
        PpTokenType::Identifier, PpTokenType::Arrow, PpTokenType::Identifier,
        PpTokenType::LeftBracket, PpTokenType::Identifier, PpTokenType::RightBracket,
        PpTokenType::AddAssign, PpTokenType::Star, PpTokenType::Identifier,
        PpTokenType::Increment, PpTokenType::NotEqual, PpTokenType::BitNot,
        PpTokenType::Identifier, PpTokenType::Semicolon});
}

TEST_CASE("longest match for shift assignment", "[scanner]") {
    REQUIRE(types_of("<<=") == std::vector<PpTokenType>{PpTokenType::LeftShiftAssign});
    REQUIRE(types_of("<< =") == std::vector<PpTokenType>{
        PpTokenType::ShiftLeft, PpTokenType::Assign});
}

TEST_CASE("splice inside an operator", "[scanner]") {
    auto spliced = lex_text("a=\\\n=");
    auto plain = lex_text("a==");
    REQUIRE(spliced.tokens.size() == 2);
    REQUIRE(spliced.tokens[1].type == PpTokenType::Equal);
    REQUIRE(plain.tokens[1].type == PpTokenType::Equal);
    REQUIRE(spliced.trivia.empty());
}

TEST_CASE("punctuator text is empty and spelling comes from the type", "[scanner]") {
    auto lx = lex_text(">>=");
    REQUIRE(lx.tokens[0].text.empty());
    REQUIRE(pp_token_spelling(lx.tokens[0]) == ">>=");
}

// ===== Comments =====

TEST_CASE("block comment collapses to one space", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "/* x \n y */==");
    std::string trivia;
    auto r = next_token(s, trivia);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().type == PpTokenType::Equal);
    REQUIRE(trivia == " ");
    REQUIRE(r.value().pos == Position{0, 2, 6});
}

TEST_CASE("line comment collapses to one space", "[scanner]") {
    auto lx = lex_text("a // rest of line\nb");
    REQUIRE(lx.tokens.size() == 2);
    REQUIRE(lx.trivia == "  \n");
    REQUIRE(lx.tokens[1].after_newline);
}

TEST_CASE("line comment at end of input", "[scanner]") {
    auto lx = lex_text("x //");
    REQUIRE(lx.tokens.size() == 1);
    REQUIRE(lx.trivia == "  ");
}

TEST_CASE("block comment terminator edge cases", "[scanner]") {
    REQUIRE(types_of("/*/ still comment */x") == std::vector<PpTokenType>{
        PpTokenType::Identifier});
    REQUIRE(types_of("/**/x") == std::vector<PpTokenType>{PpTokenType::Identifier});
    REQUIRE(types_of("/***/x") == std::vector<PpTokenType>{PpTokenType::Identifier});
    REQUIRE(types_of("/* a ** b **/ /") == std::vector<PpTokenType>{PpTokenType::Divide});
}

TEST_CASE("spliced comment terminator", "[scanner]") {
    auto lx = lex_text("/* c *\\\n/ y");
    REQUIRE(lx.tokens.size() == 1);
    REQUIRE(lx.tokens[0].text == "y");
}

TEST_CASE("comments do not nest", "[scanner]") {
    REQUIRE(types_of("/* /* */ */") == std::vector<PpTokenType>{
        PpTokenType::Star, PpTokenType::Divide});
}

TEST_CASE("adjacent comments each give a space", "[scanner]") {
    auto lx = lex_text("/*a*//*b*/// c");
    REQUIRE(lx.tokens.empty());
    REQUIRE(lx.trivia == "   ");
}

TEST_CASE("unterminated block comment", "[scanner]") {
    CharStream s;
    s.push_text("<input>", "a\n  /* never closed *");
    std::string trivia;
    REQUIRE(next_token(s, trivia).is_ok());

    auto r = next_token(s, trivia);
    REQUIRE(r.is_err());
    REQUIRE(r.error() == CcError{"unterminated block comment", Position{0, 2, 3}});

    auto eof = next_token(s, trivia);
    REQUIRE(eof.is_ok());
    REQUIRE(eof.value().type == PpTokenType::Eof);
}

TEST_CASE("comment comes out as a token in neither form", "[scanner]") {
    for (auto& t : lex_text("/* a */ b // c\n/**/").tokens) {
        REQUIRE(t.type != PpTokenType::BlockComment);
        REQUIRE(t.type != PpTokenType::LineComment);
    }
}

// ===== Other characters =====

TEST_CASE("unrecognized characters become Other", "[scanner]") {
    auto lx = lex_text("@ $ ` \\");
    REQUIRE(lx.tokens.size() == 4);
    for (auto& t : lx.tokens) REQUIRE(t.type == PpTokenType::Other);
    REQUIRE(lx.tokens[0].text == "@");
    REQUIRE(lx.tokens[3].text == "\\");
}

TEST_CASE("stray backslash between tokens", "[scanner]") {
    REQUIRE(types_of("a\\b") == std::vector<PpTokenType>{
        PpTokenType::Identifier, PpTokenType::Other, PpTokenType::Identifier});
}

// ===== Reconstruction =====

TEST_CASE("trivia and spellings rebuild the input", "[scanner]") {
    std::string src = "int main(void) {\n\treturn 'x' + \"s\" - .5e+1;\n}\n";
    REQUIRE(lex_text(src).rebuilt == src);
}

TEST_CASE("rebuilt text collapses comments and removes splices", "[scanner]") {
    auto lx = lex_text("a /* long\ncomment */ b // tail\nc\\\nd\r\ne");
    REQUIRE(lx.rebuilt == "a   b  \ncd\ne");
}

// ===== Nested files =====

TEST_CASE("tokens continue across an included file", "[scanner]") {
    CharStream s;
    s.push_text("main.c", "int a;\nint b;");
    std::string trivia;

    // Consume "int a;" and push the header at that point
    for (int i = 0; i < 3; ++i) REQUIRE(next_token(s, trivia).is_ok());
    s.push_text("inc.h", "long c;\n");

    std::vector<std::pair<std::string, uint32_t>> seen;
    for (;;) {
        auto r = next_token(s, trivia);
        REQUIRE(r.is_ok());
        if (r.value().type == PpTokenType::Eof) break;
        seen.emplace_back(pp_token_spelling(r.value()), r.value().pos.file);
    }

    std::vector<std::pair<std::string, uint32_t>> want = {
        {"long", 1}, {"c", 1}, {";", 1}, {"int", 0}, {"b", 0}, {";", 0}};
    REQUIRE(seen == want);
}

TEST_CASE("lex a fixture file", "[scanner]") {
    CharStream s;
    REQUIRE(s.push(fixture_dir() + "/sample.c").is_ok());
    auto lx = lex_all(s);

    REQUIRE(lx.tokens.front().type == PpTokenType::Hash);
    REQUIRE(lx.tokens.front().pos == Position{0, 2, 1});
    REQUIRE(lx.tokens.front().after_newline);

    int strings = 0, numbers = 0;
    bool saw_shift_assign = false, saw_arrow = false;
    for (auto& t : lx.tokens) {
        if (t.type == PpTokenType::StringLiteral) {
            ++strings;
            REQUIRE(t.text == "hello, \\\"world\\\"\\n");
        }
        if (t.type == PpTokenType::Number) ++numbers;
        if (t.type == PpTokenType::LeftShiftAssign) saw_shift_assign = true;
        if (t.type == PpTokenType::Arrow) saw_arrow = true;
        REQUIRE(t.type != PpTokenType::Other);
    }
    REQUIRE(strings == 1);
    REQUIRE(numbers == 4);
    REQUIRE(saw_shift_assign);
    REQUIRE(saw_arrow);

    // Last tokens: MAX(x, y); } with the splice removed
    auto n = lx.tokens.size();
    REQUIRE(lx.tokens[n - 4].text == "y");
    REQUIRE(lx.tokens[n - 4].pos.line == 18);
    REQUIRE(lx.tokens[n - 1].type == PpTokenType::RightBrace);
}
