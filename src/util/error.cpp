#include <cc/error.hpp>

namespace cc {

std::string CcError::format(const std::string& filename) const {
    std::string result;

    if (pos.has_value()) {
        if (!filename.empty()) {
            result += filename;
            result += ":";
        }
        result += std::to_string(pos->line);
        result += ":";
        result += std::to_string(pos->col);
        result += ": ";
    } else if (!filename.empty()) {
        result += filename;
        result += ": ";
    }

    result += "error: ";
    result += message;
    return result;
}

bool CcError::operator==(const CcError& o) const {
    return message == o.message && pos == o.pos;
}

bool CcError::operator!=(const CcError& o) const {
    return !(*this == o);
}

} // namespace cc
