#include <cc/lang/pp_token.hpp>

namespace cc {

const char* pp_token_name(PpTokenType t) {
    switch (t) {
    case PpTokenType::Identifier:       return "Identifier";
    case PpTokenType::Number:           return "Number";
    case PpTokenType::CharLiteral:      return "CharLiteral";
    case PpTokenType::StringLiteral:    return "StringLiteral";
    case PpTokenType::Hash:             return "Hash";
    case PpTokenType::Add:              return "Add";
    case PpTokenType::Subtract:         return "Subtract";
    case PpTokenType::Star:             return "Star";
    case PpTokenType::Divide:           return "Divide";
    case PpTokenType::Mod:              return "Mod";
    case PpTokenType::Increment:        return "Increment";
    case PpTokenType::Decrement:        return "Decrement";
    case PpTokenType::Equal:            return "Equal";
    case PpTokenType::NotEqual:         return "NotEqual";
    case PpTokenType::Less:             return "Less";
    case PpTokenType::LessEqual:        return "LessEqual";
    case PpTokenType::Greater:          return "Greater";
    case PpTokenType::GreaterEqual:     return "GreaterEqual";
    case PpTokenType::LogicalNot:       return "LogicalNot";
    case PpTokenType::LogicalAnd:       return "LogicalAnd";
    case PpTokenType::LogicalOr:        return "LogicalOr";
    case PpTokenType::BitNot:           return "BitNot";
    case PpTokenType::Ampersand:        return "Ampersand";
    case PpTokenType::BitOr:            return "BitOr";
    case PpTokenType::BitXor:           return "BitXor";
    case PpTokenType::ShiftLeft:        return "ShiftLeft";
    case PpTokenType::ShiftRight:       return "ShiftRight";
    case PpTokenType::Assign:           return "Assign";
    case PpTokenType::AddAssign:        return "AddAssign";
    case PpTokenType::SubtractAssign:   return "SubtractAssign";
    case PpTokenType::MultiplyAssign:   return "MultiplyAssign";
    case PpTokenType::DivideAssign:     return "DivideAssign";
    case PpTokenType::ModAssign:        return "ModAssign";
    case PpTokenType::AndAssign:        return "AndAssign";
    case PpTokenType::OrAssign:         return "OrAssign";
    case PpTokenType::XorAssign:        return "XorAssign";
    case PpTokenType::LeftShiftAssign:  return "LeftShiftAssign";
    case PpTokenType::RightShiftAssign: return "RightShiftAssign";
    case PpTokenType::LeftBracket:      return "LeftBracket";
    case PpTokenType::RightBracket:     return "RightBracket";
    case PpTokenType::LeftParen:        return "LeftParen";
    case PpTokenType::RightParen:       return "RightParen";
    case PpTokenType::LeftBrace:        return "LeftBrace";
    case PpTokenType::RightBrace:       return "RightBrace";
    case PpTokenType::Dot:              return "Dot";
    case PpTokenType::Arrow:            return "Arrow";
    case PpTokenType::Semicolon:        return "Semicolon";
    case PpTokenType::Question:         return "Question";
    case PpTokenType::Colon:            return "Colon";
    case PpTokenType::Comma:            return "Comma";
    case PpTokenType::BlockComment:     return "BlockComment";
    case PpTokenType::LineComment:      return "LineComment";
    case PpTokenType::Other:            return "Other";
    case PpTokenType::Eof:              return "Eof";
    }
    return "Unknown";
}

const char* punctuator_text(PpTokenType t) {
    switch (t) {
    case PpTokenType::Hash:             return "#";
    case PpTokenType::Add:              return "+";
    case PpTokenType::Subtract:         return "-";
    case PpTokenType::Star:             return "*";
    case PpTokenType::Divide:           return "/";
    case PpTokenType::Mod:              return "%";
    case PpTokenType::Increment:        return "++";
    case PpTokenType::Decrement:        return "--";
    case PpTokenType::Equal:            return "==";
    case PpTokenType::NotEqual:         return "!=";
    case PpTokenType::Less:             return "<";
    case PpTokenType::LessEqual:        return "<=";
    case PpTokenType::Greater:          return ">";
    case PpTokenType::GreaterEqual:     return ">=";
    case PpTokenType::LogicalNot:       return "!";
    case PpTokenType::LogicalAnd:       return "&&";
    case PpTokenType::LogicalOr:        return "||";
    case PpTokenType::BitNot:           return "~";
    case PpTokenType::Ampersand:        return "&";
    case PpTokenType::BitOr:            return "|";
    case PpTokenType::BitXor:           return "^";
    case PpTokenType::ShiftLeft:        return "<<";
    case PpTokenType::ShiftRight:       return ">>";
    case PpTokenType::Assign:           return "=";
    case PpTokenType::AddAssign:        return "+=";
    case PpTokenType::SubtractAssign:   return "-=";
    case PpTokenType::MultiplyAssign:   return "*=";
    case PpTokenType::DivideAssign:     return "/=";
    case PpTokenType::ModAssign:        return "%=";
    case PpTokenType::AndAssign:        return "&=";
    case PpTokenType::OrAssign:         return "|=";
    case PpTokenType::XorAssign:        return "^=";
    case PpTokenType::LeftShiftAssign:  return "<<=";
    case PpTokenType::RightShiftAssign: return ">>=";
    case PpTokenType::LeftBracket:      return "[";
    case PpTokenType::RightBracket:     return "]";
    case PpTokenType::LeftParen:        return "(";
    case PpTokenType::RightParen:       return ")";
    case PpTokenType::LeftBrace:        return "{";
    case PpTokenType::RightBrace:       return "}";
    case PpTokenType::Dot:              return ".";
    case PpTokenType::Arrow:            return "->";
    case PpTokenType::Semicolon:        return ";";
    case PpTokenType::Question:         return "?";
    case PpTokenType::Colon:            return ":";
    case PpTokenType::Comma:            return ",";
    case PpTokenType::BlockComment:     return "/*";
    case PpTokenType::LineComment:      return "//";
    default:
        return nullptr;
    }
}

std::string pp_token_spelling(const PpToken& tok) {
    switch (tok.type) {
    case PpTokenType::Identifier:
    case PpTokenType::Number:
    case PpTokenType::Other:
        return tok.text;
    case PpTokenType::CharLiteral:
        return "'" + tok.text + "'";
    case PpTokenType::StringLiteral:
        return "\"" + tok.text + "\"";
    case PpTokenType::Eof:
        return "";
    default:
        break;
    }
    const char* p = punctuator_text(tok.type);
    return p ? std::string(p) : std::string();
}

} // namespace cc
