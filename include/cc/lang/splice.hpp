#pragma once

#include <cc/lang/source.hpp>
#include <cstddef>
#include <optional>

namespace cc {

// View of a CharStream with line splices (backslash + newline) removed.
// Nothing above this layer ever sees a spliced backslash or its newline.
class SpliceCursor {
public:
    explicit SpliceCursor(CharStream& stream) : stream_(stream) {}

    std::optional<SourceChar> peek() const { return peek_n(0); }

    // k-th genuine character ahead, skipping splices at every step
    std::optional<SourceChar> peek_n(size_t k) const;

    std::optional<SourceChar> next();

private:
    CharStream& stream_;
};

} // namespace cc
