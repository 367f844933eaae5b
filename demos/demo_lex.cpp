#include <cc/config.hpp>
#include <cc/lang/scanner.hpp>
#include <cc/log.hpp>
#include <filesystem>
#include <iostream>
#include <string>

using namespace cc;

static std::string escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '\v': out += "\\v"; break;
        case '\f': out += "\\f"; break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default:   out += c; break;
        }
    }
    return out;
}

static std::string where(const CharStream& stream, const Position& p, char sep) {
    return stream.filename(p.file).value_or("?") + sep +
           std::to_string(p.line) + ":" + std::to_string(p.col);
}

// One line per normalized character; '*' marks a file switch
static int dump_chars(CharStream& stream, const DumpConfig& dump) {
    while (auto sc = stream.next()) {
        if (dump.positions) {
            std::cout << where(stream, sc->pos, '@') << ": ";
        }
        std::cout << escape(std::string(1, sc->ch))
                  << (sc->switched ? " *" : "") << "\n";
    }
    return 0;
}

static int dump_tokens(CharStream& stream, const DumpConfig& dump) {
    int errors = 0;
    for (;;) {
        std::string trivia;
        auto r = next_token(stream, trivia);

        if (dump.trivia && !trivia.empty()) {
            std::cout << "  trivia \"" << escape(trivia) << "\"\n";
        }

        if (r.is_err()) {
            const auto& e = r.error();
            std::string file;
            if (e.pos) file = stream.filename(e.pos->file).value_or("");
            log::error("%s", e.format(file).c_str());
            ++errors;
            continue;
        }

        const PpToken& tok = r.value();
        if (tok.type == PpTokenType::Eof) break;

        if (dump.positions) {
            std::cout << where(stream, tok.pos, ':') << "  ";
        }
        std::cout << pp_token_name(tok.type);
        if (!tok.text.empty()) {
            std::cout << "  \"" << escape(tok.text) << "\"";
        }
        if (tok.after_newline) {
            std::cout << "  [bol]";
        }
        std::cout << "\n";
    }

    log::emit(errors ? log::Warn : log::Debug, "%d error(s) in %s", errors,
              stream.filename(0).value_or("?").c_str());
    return errors ? 1 : 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: cc-lex <file.c> [--chars] [--trivia] [--no-pos] "
                     "[--config <file.toml>]\n";
        return 1;
    }

    std::string path;
    std::optional<std::string> config_path;
    bool chars = false, trivia = false, no_pos = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--chars") {
            chars = true;
        } else if (arg == "--trivia") {
            trivia = true;
        } else if (arg == "--no-pos") {
            no_pos = true;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (path.empty()) {
            path = arg;
        } else {
            std::cerr << "error: unexpected argument '" << arg << "'\n";
            return 1;
        }
    }

    std::optional<Config> global;
    std::string global_path = global_config_path();
    std::error_code ec;
    if (!global_path.empty() && std::filesystem::exists(global_path, ec)) {
        auto g = Config::load(global_path);
        if (g.is_err()) {
            log::error("%s", g.error().format(global_path).c_str());
            return 1;
        }
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (config_path) {
        auto l = Config::load(*config_path);
        if (l.is_err()) {
            log::error("%s", l.error().format(*config_path).c_str());
            return 1;
        }
        local = std::move(l).value();
    }

    Config cfg = Config::effective(global, local);
    cfg.apply_logging();
    if (chars) cfg.dump.mode = DumpMode::Chars;
    if (trivia) cfg.dump.trivia = true;
    if (no_pos) cfg.dump.positions = false;
    log::debug("dump mode: %s", dump_mode_name(cfg.dump.mode));

    CharStream stream;
    auto pushed = stream.push(path);
    if (pushed.is_err()) {
        log::error("%s", pushed.error().format().c_str());
        return 1;
    }

    if (cfg.dump.mode == DumpMode::Chars) {
        return dump_chars(stream, cfg.dump);
    }
    return dump_tokens(stream, cfg.dump);
}
