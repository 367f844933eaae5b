#pragma once

#include <cc/lang/position.hpp>
#include <optional>
#include <string>

namespace cc {

struct CcError {
    std::string message;
    std::optional<Position> pos;

    CcError() = default;
    explicit CcError(std::string msg)
        : message(std::move(msg)) {}
    CcError(std::string msg, Position p)
        : message(std::move(msg)), pos(p) {}

    // "file:line:col: error: msg", dropping the parts that are unknown
    std::string format(const std::string& filename = "") const;

    bool operator==(const CcError& o) const;
    bool operator!=(const CcError& o) const;
};

} // namespace cc
