#include <cc/lang/punctuator.hpp>
#include <initializer_list>

namespace cc {

namespace {

void insert(PunctTable& table, const char* text, PpTokenType token) {
    PunctTable* level = &table;
    PunctNode* node = nullptr;
    for (const char* p = text; *p; ++p) {
        node = &(*level)[*p];
        level = &node->next;
    }
    node->token = token;
}

PunctTable build_table() {
    PunctTable table;
    for (PpTokenType t : {
             PpTokenType::Hash, PpTokenType::Add, PpTokenType::Subtract,
             PpTokenType::Star, PpTokenType::Divide, PpTokenType::Mod,
             PpTokenType::Increment, PpTokenType::Decrement,
             PpTokenType::Equal, PpTokenType::NotEqual,
             PpTokenType::Less, PpTokenType::LessEqual,
             PpTokenType::Greater, PpTokenType::GreaterEqual,
             PpTokenType::LogicalNot, PpTokenType::LogicalAnd,
             PpTokenType::LogicalOr, PpTokenType::BitNot,
             PpTokenType::Ampersand, PpTokenType::BitOr, PpTokenType::BitXor,
             PpTokenType::ShiftLeft, PpTokenType::ShiftRight,
             PpTokenType::Assign, PpTokenType::AddAssign,
             PpTokenType::SubtractAssign, PpTokenType::MultiplyAssign,
             PpTokenType::DivideAssign, PpTokenType::ModAssign,
             PpTokenType::AndAssign, PpTokenType::OrAssign,
             PpTokenType::XorAssign, PpTokenType::LeftShiftAssign,
             PpTokenType::RightShiftAssign,
             PpTokenType::LeftBracket, PpTokenType::RightBracket,
             PpTokenType::LeftParen, PpTokenType::RightParen,
             PpTokenType::LeftBrace, PpTokenType::RightBrace,
             PpTokenType::Dot, PpTokenType::Arrow, PpTokenType::Semicolon,
             PpTokenType::Question, PpTokenType::Colon, PpTokenType::Comma,
             PpTokenType::BlockComment, PpTokenType::LineComment}) {
        insert(table, punctuator_text(t), t);
    }
    return table;
}

// Every prefix of a C punctuator is itself a punctuator, so the deepest
// node reached is always a complete match and no backtracking is needed.
std::optional<PpTokenType> match_from(const PunctTable& table, SpliceCursor& in) {
    auto sc = in.peek();
    if (!sc) return std::nullopt;

    auto it = table.find(sc->ch);
    if (it == table.end()) return std::nullopt;

    in.next();
    if (auto deeper = match_from(it->second.next, in)) {
        return deeper;
    }
    return it->second.token;
}

} // anonymous namespace

const PunctTable& punctuator_table() {
    static const PunctTable table = build_table();
    return table;
}

std::optional<PpTokenType> match_punctuator(SpliceCursor& in) {
    return match_from(punctuator_table(), in);
}

} // namespace cc
