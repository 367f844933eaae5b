#pragma once

#include <cc/lang/pp_token.hpp>
#include <cc/lang/source.hpp>
#include <cc/result.hpp>
#include <string>

namespace cc {

// Scan the next preprocessing token from `stream` (translation phases 1-3).
//
// Whitespace consumed before the token is appended to `trivia` verbatim and
// every comment is appended as a single ' '. The token's after_newline is
// set only when that whitespace held a newline, so the first token of the
// input reports false. At end of input the token is
// Eof, and keeps being Eof on further calls.
//
// Unterminated literals and block comments are errors positioned at the
// opening quote or "/*". The stream stays where scanning stopped, so the
// caller may keep calling next_token() to resume.
Result<PpToken> next_token(CharStream& stream, std::string& trivia);

} // namespace cc
