#include <cc/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace cc {

const char* dump_mode_name(DumpMode m) {
    switch (m) {
        case DumpMode::Tokens: return "tokens";
        case DumpMode::Chars:  return "chars";
    }
    return "unknown";
}

std::optional<DumpMode> parse_dump_mode(const std::string& name) {
    if (name == "tokens") return DumpMode::Tokens;
    if (name == "chars") return DumpMode::Chars;
    return std::nullopt;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CcError{std::string("config TOML parse error: ") +
                       std::string(e.description())};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return CcError{"unknown log level '" + *v +
                               "' (expected trace, debug, info, warn or error)"};
            }
            cfg.logging.level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    // [dump] section
    if (auto dump = doc["dump"].as_table()) {
        if (auto v = (*dump)["mode"].value<std::string>()) {
            auto mode = parse_dump_mode(*v);
            if (!mode) {
                return CcError{"unknown dump mode '" + *v +
                               "' (expected tokens or chars)"};
            }
            cfg.dump.mode = *mode;
            cfg.dump_mode_set = true;
        }
        if (auto v = (*dump)["positions"].value<bool>()) {
            cfg.dump.positions = *v;
            cfg.dump_positions_set = true;
        }
        if (auto v = (*dump)["trivia"].value<bool>()) {
            cfg.dump.trivia = *v;
            cfg.dump_trivia_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CcError{"cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
    if (other.dump_mode_set) {
        dump.mode = other.dump.mode;
        dump_mode_set = true;
    }
    if (other.dump_positions_set) {
        dump.positions = other.dump.positions;
        dump_positions_set = true;
    }
    if (other.dump_trivia_set) {
        dump.trivia = other.dump.trivia;
        dump_trivia_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    if (log_level_set) log::set_level(logging.level);
    if (log_color_set) log::set_color_enabled(logging.color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.cc-lex/config.toml";
}

} // namespace cc
