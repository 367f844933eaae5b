#include <cc/lang/scanner.hpp>
#include <cc/lang/punctuator.hpp>
#include <cc/lang/splice.hpp>
#include <cctype>

namespace cc {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

struct Scanner {
    SpliceCursor in;
    std::string& trivia;
    bool saw_newline = false;

    Scanner(CharStream& stream, std::string& out)
        : in(stream), trivia(out) {}

    bool peek_is(char c) {
        auto sc = in.peek();
        return sc && sc->ch == c;
    }

    PpToken make(PpTokenType type, std::string text, Position pos) const {
        PpToken tok;
        tok.type = type;
        tok.text = std::move(text);
        tok.pos = pos;
        tok.after_newline = saw_newline;
        return tok;
    }

    Result<PpToken> run() {
        for (;;) {
            skip_whitespace();

            auto sc = in.peek();
            if (!sc) {
                return Result<PpToken>::ok(make(PpTokenType::Eof, "", Position{}));
            }

            Position p = sc->pos;
            char c = sc->ch;

            if (is_ident_start(c)) {
                return Result<PpToken>::ok(scan_identifier(p));
            }

            // ".5" is a number, "." alone is a punctuator
            if (is_digit(c) || (c == '.' && starts_fraction())) {
                return Result<PpToken>::ok(scan_number(p));
            }

            if (c == '\'' || c == '"') {
                return scan_literal(p, c);
            }

            auto punct = match_punctuator(in);
            if (punct == PpTokenType::BlockComment) {
                CC_TRY(skip_block_comment(p));
                trivia += ' ';
                continue;
            }
            if (punct == PpTokenType::LineComment) {
                skip_line_comment();
                trivia += ' ';
                continue;
            }
            if (punct) {
                return Result<PpToken>::ok(make(*punct, "", p));
            }

            in.next();
            return Result<PpToken>::ok(make(PpTokenType::Other, std::string(1, c), p));
        }
    }

    void skip_whitespace() {
        while (auto sc = in.peek()) {
            if (!is_space(sc->ch)) break;
            if (sc->ch == '\n') saw_newline = true;
            trivia += sc->ch;
            in.next();
        }
    }

    bool starts_fraction() const {
        auto after = in.peek_n(1);
        return after && is_digit(after->ch);
    }

    PpToken scan_identifier(Position p) {
        std::string text;
        while (auto sc = in.peek()) {
            if (!is_ident_char(sc->ch)) break;
            text += sc->ch;
            in.next();
        }
        return make(PpTokenType::Identifier, std::move(text), p);
    }

    // pp-number: digits, letters, '_', '.', and a sign right after e/E.
    // Anything this accepts is checked for being a real constant later.
    PpToken scan_number(Position p) {
        std::string text;
        while (auto sc = in.peek()) {
            char c = sc->ch;
            if (c == 'e' || c == 'E') {
                text += c;
                in.next();
                if (peek_is('+') || peek_is('-')) {
                    text += in.next()->ch;
                }
                continue;
            }
            if (!is_ident_char(c) && c != '.') break;
            text += c;
            in.next();
        }
        return make(PpTokenType::Number, std::move(text), p);
    }

    Result<PpToken> scan_literal(Position p, char quote) {
        bool is_char = (quote == '\'');
        in.next();

        std::string text;
        for (;;) {
            auto sc = in.peek();
            if (!sc || sc->ch == '\n') {
                return CcError{is_char ? "unterminated character constant"
                                       : "unterminated string constant", p};
            }
            in.next();
            if (sc->ch == quote) break;

            text += sc->ch;
            if (sc->ch == '\\') {
                // Keep the escape as written; only its extent matters here
                auto esc = in.peek();
                if (esc && esc->ch != '\n') {
                    text += esc->ch;
                    in.next();
                }
            }
        }

        return Result<PpToken>::ok(make(
            is_char ? PpTokenType::CharLiteral : PpTokenType::StringLiteral,
            std::move(text), p));
    }

    Status skip_block_comment(Position p) {
        bool star = false;
        while (auto sc = in.next()) {
            if (star && sc->ch == '/') return ok_status();
            star = (sc->ch == '*');
        }
        return CcError{"unterminated block comment", p};
    }

    void skip_line_comment() {
        while (auto sc = in.peek()) {
            if (sc->ch == '\n') break;
            in.next();
        }
    }
};

} // anonymous namespace

Result<PpToken> next_token(CharStream& stream, std::string& trivia) {
    Scanner scanner(stream, trivia);
    return scanner.run();
}

} // namespace cc
