#pragma once

#include <cc/lang/pp_token.hpp>
#include <cc/lang/splice.hpp>
#include <map>
#include <optional>

namespace cc {

// One state of the punctuator trie. `token` is what has been matched when
// the input cannot be extended into one of `next`.
struct PunctNode {
    PpTokenType token = PpTokenType::Other;
    std::map<char, PunctNode> next;
};

using PunctTable = std::map<char, PunctNode>;

// Root of the trie for every C punctuator plus the "/*" and "//" comment
// openers. Built on first use, read-only afterwards.
const PunctTable& punctuator_table();

// Longest-match lookup. Consumes the matched characters and returns the
// token; consumes nothing and returns empty if the next character does not
// start a punctuator.
std::optional<PpTokenType> match_punctuator(SpliceCursor& in);

} // namespace cc
