#pragma once

#include <cc/lang/position.hpp>
#include <string>

namespace cc {

enum class PpTokenType {
    Identifier,
    Number,         // raw pp-number, not yet validated
    CharLiteral,    // text holds the raw contents between the quotes
    StringLiteral,

    // Punctuators
    Hash,
    Add,
    Subtract,
    Star,
    Divide,
    Mod,
    Increment,
    Decrement,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    LogicalNot,
    LogicalAnd,
    LogicalOr,
    BitNot,
    Ampersand,
    BitOr,
    BitXor,
    ShiftLeft,
    ShiftRight,
    Assign,
    AddAssign,
    SubtractAssign,
    MultiplyAssign,
    DivideAssign,
    ModAssign,
    AndAssign,
    OrAssign,
    XorAssign,
    LeftShiftAssign,
    RightShiftAssign,
    LeftBracket,
    RightBracket,
    LeftParen,
    RightParen,
    LeftBrace,
    RightBrace,
    Dot,
    Arrow,
    Semicolon,
    Question,
    Colon,
    Comma,

    // Comment openers found by the punctuator table. The scanner swallows
    // them; next_token() never returns either one.
    BlockComment,
    LineComment,

    Other,          // any single character nothing else accepts
    Eof
};

struct PpToken {
    PpTokenType type = PpTokenType::Eof;
    std::string text;   // empty for punctuators and Eof
    Position pos;       // first character; default for Eof
    bool after_newline = false;  // whitespace before the token held a newline
};

const char* pp_token_name(PpTokenType t);

// Punctuator text for a punctuator type, nullptr for anything else
const char* punctuator_text(PpTokenType t);

// Source text of the token: literals get their quotes back
std::string pp_token_spelling(const PpToken& tok);

} // namespace cc
