#include <cc/lang/splice.hpp>

namespace cc {

namespace {

// A backslash is a splice when the next character is a newline of the same
// file. After a pop the newline would belong to the includer.
bool is_splice(const SourceChar& first, const std::optional<SourceChar>& second) {
    return first.ch == '\\' && second && second->ch == '\n' && !second->switched;
}

// Skips any splices at the front of `snap`. Returns whether a skipped
// backslash carried the switched flag.
bool skip_splices(CharStream::Snapshot& snap) {
    bool carried = false;
    for (;;) {
        auto first = snap.peek();
        if (!first || first->ch != '\\') break;

        CharStream::Snapshot after = snap;
        after.advance();
        if (!is_splice(*first, after.peek())) break;

        carried = carried || first->switched;
        after.advance();
        snap = std::move(after);
    }
    return carried;
}

} // anonymous namespace

std::optional<SourceChar> SpliceCursor::peek_n(size_t k) const {
    if (k == 0) {
        auto sc = stream_.peek();
        if (!sc || sc->ch != '\\') return sc;
    }

    CharStream::Snapshot snap = stream_.snapshot();
    for (size_t i = 0;; ++i) {
        bool carried = skip_splices(snap);
        auto sc = snap.peek();
        if (!sc) return std::nullopt;
        if (i == k) {
            sc->switched = sc->switched || carried;
            return sc;
        }
        snap.advance();
    }
}

std::optional<SourceChar> SpliceCursor::next() {
    bool carried = false;
    for (;;) {
        auto sc = stream_.next();
        if (!sc) return std::nullopt;

        if (sc->ch == '\\' && is_splice(*sc, stream_.peek())) {
            carried = carried || sc->switched;
            stream_.next();
            continue;
        }

        sc->switched = sc->switched || carried;
        return sc;
    }
}

} // namespace cc
