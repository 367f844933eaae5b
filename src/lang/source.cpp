#include <cc/lang/source.hpp>
#include <cc/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace cc {

// ---------------------------------------------------------------------------
// Loading
// ---------------------------------------------------------------------------

static std::string canonical_name(const std::string& path) {
    std::error_code ec;
    auto canon = fs::weakly_canonical(fs::path(path), ec);
    if (ec) return path;
    return canon.string();
}

std::optional<uint32_t> CharStream::find_loaded(const std::string& name) const {
    for (size_t i = 0; i < files_.size(); ++i) {
        if (files_[i].name == name) return static_cast<uint32_t>(i);
    }
    return std::nullopt;
}

uint32_t CharStream::add_file(std::string name, std::string display_name,
                              std::string text) {
    auto index = static_cast<uint32_t>(files_.size());
    log::debug("loaded '%s' as file #%u (%zu bytes)",
               display_name.c_str(), index, text.size());
    files_.push_back({std::move(name), std::move(display_name), std::move(text)});
    return index;
}

void CharStream::open(uint32_t file) {
    Cursor cur;
    cur.file = file;
    cur.next = 0;
    cur.next_pos = Position{file, 1, 1};
    stack_.push_back(cur);
    switched_ = true;

    // An empty file comes straight back off the stack
    pop_exhausted(stack_);
}

Status CharStream::push(const std::string& path) {
    std::string name = canonical_name(path);

    if (auto cached = find_loaded(name)) {
        log::debug("reusing cached file '%s' (#%u)",
                   files_[*cached].display_name.c_str(), *cached);
        open(*cached);
        return ok_status();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return CcError{"cannot open source file '" + path + "'"};
    }
    // A directory opens as a stream on Linux but yields no bytes
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return CcError{"cannot read source file '" + path + "'"};
    }
    std::ostringstream ss;
    if (in.peek() != std::ifstream::traits_type::eof()) {
        ss << in.rdbuf();
    }
    if (in.bad() || ss.fail()) {
        return CcError{"error reading source file '" + path + "'"};
    }

    open(add_file(std::move(name), path, ss.str()));
    return ok_status();
}

void CharStream::push_text(const std::string& name, std::string text) {
    if (auto cached = find_loaded(name)) {
        log::debug("reusing cached file '%s' (#%u)", name.c_str(), *cached);
        open(*cached);
        return;
    }
    open(add_file(name, name, std::move(text)));
}

std::optional<std::string> CharStream::filename(uint32_t index) const {
    if (index >= files_.size()) return std::nullopt;
    return files_[index].display_name;
}

// ---------------------------------------------------------------------------
// Cursor stack primitives, shared by the live stream and snapshots
// ---------------------------------------------------------------------------

bool CharStream::pop_exhausted(std::vector<Cursor>& stack) const {
    bool popped = false;
    while (!stack.empty()) {
        const Cursor& top = stack.back();
        if (top.next < files_[top.file].text.size()) break;
        stack.pop_back();
        popped = true;
    }
    return popped;
}

std::optional<SourceChar> CharStream::read(const std::vector<Cursor>& stack,
                                           bool switched) const {
    if (stack.empty()) return std::nullopt;

    const Cursor& top = stack.back();
    char ch = files_[top.file].text[top.next];
    if (ch == '\r') ch = '\n';
    return SourceChar{ch, top.next_pos, switched};
}

bool CharStream::step(std::vector<Cursor>& stack, bool& switched) const {
    if (stack.empty()) return false;

    Cursor& top = stack.back();
    const std::string& text = files_[top.file].text;
    char ch = text[top.next++];

    if (ch == '\r' || ch == '\n') {
        // CR/LF and LF/CR pairs are one line break; CR/CR and LF/LF are two
        char pair = (ch == '\r') ? '\n' : '\r';
        if (top.next < text.size() && text[top.next] == pair) {
            ++top.next;
        }
        ++top.next_pos.line;
        top.next_pos.col = 1;
    } else {
        ++top.next_pos.col;
    }

    switched = false;
    if (pop_exhausted(stack)) {
        switched = true;
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Live stream
// ---------------------------------------------------------------------------

std::optional<SourceChar> CharStream::peek() const {
    return read(stack_, switched_);
}

std::optional<SourceChar> CharStream::peek_n(size_t k) const {
    Snapshot snap = snapshot();
    for (size_t i = 0; i < k && !snap.at_end(); ++i) {
        snap.advance();
    }
    return snap.peek();
}

std::optional<SourceChar> CharStream::next() {
    auto sc = read(stack_, switched_);
    if (!sc) return std::nullopt;

    uint32_t file = stack_.back().file;
    if (step(stack_, switched_)) {
        log::trace("finished reading '%s' (#%u), %zu file(s) still open",
                   files_[file].display_name.c_str(), file, stack_.size());
    }
    return sc;
}

CharStream::Snapshot CharStream::snapshot() const {
    return Snapshot(*this, stack_, switched_);
}

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------

std::optional<SourceChar> CharStream::Snapshot::peek() const {
    return owner_->read(stack_, switched_);
}

void CharStream::Snapshot::advance() {
    owner_->step(stack_, switched_);
}

} // namespace cc
