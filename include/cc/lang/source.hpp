#pragma once

#include <cc/lang/position.hpp>
#include <cc/result.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cc {

// The full text of one source file. Never modified once loaded.
struct LoadedFile {
    std::string name;          // canonical name, the cache key
    std::string display_name;  // name used in diagnostics
    std::string text;
};

// Read position inside one file of the active-file stack
struct Cursor {
    uint32_t file = 0;
    size_t next = 0;
    Position next_pos;
};

// One normalized character. `switched` marks the first character delivered
// after the active-file stack changed (a push or a pop).
struct SourceChar {
    char ch = '\0';
    Position pos;
    bool switched = false;
};

// Character source over a stack of nested files, the innermost one being
// read. CR, LF, CR/LF and LF/CR are all delivered as a single '\n'. When a
// file runs out, reading resumes in the file that pushed it.
class CharStream {
public:
    // Throwaway copy of the cursor stack for lookahead. Shares the file
    // text with the stream and must not outlive it.
    class Snapshot {
    public:
        std::optional<SourceChar> peek() const;
        void advance();
        bool at_end() const { return stack_.empty(); }

    private:
        friend class CharStream;
        Snapshot(const CharStream& owner, std::vector<Cursor> stack, bool switched)
            : owner_(&owner), stack_(std::move(stack)), switched_(switched) {}

        const CharStream* owner_;
        std::vector<Cursor> stack_;
        bool switched_;
    };

    CharStream() = default;

    // Nest the file at `path` on top of the current one. A file that was
    // read before is taken from the cache.
    Status push(const std::string& path);

    // Nest in-memory text under a synthetic name. If `name` is already
    // loaded its cached text is used and `text` is ignored.
    void push_text(const std::string& name, std::string text);

    std::optional<SourceChar> peek() const;

    // The character the k-th following next() would return; peek_n(0) is peek()
    std::optional<SourceChar> peek_n(size_t k) const;

    std::optional<SourceChar> next();

    Snapshot snapshot() const;

    std::optional<std::string> filename(uint32_t index) const;

    bool at_end() const { return stack_.empty(); }
    size_t depth() const { return stack_.size(); }
    size_t file_count() const { return files_.size(); }

private:
    std::optional<uint32_t> find_loaded(const std::string& name) const;
    uint32_t add_file(std::string name, std::string display_name, std::string text);
    void open(uint32_t file);

    std::optional<SourceChar> read(const std::vector<Cursor>& stack, bool switched) const;
    // Consumes one logical character from the top cursor. Returns true if
    // exhausted files were popped as a result.
    bool step(std::vector<Cursor>& stack, bool& switched) const;
    bool pop_exhausted(std::vector<Cursor>& stack) const;

    std::vector<LoadedFile> files_;
    std::vector<Cursor> stack_;
    bool switched_ = false;
};

} // namespace cc
