#pragma once

#include <cc/log.hpp>
#include <cc/result.hpp>
#include <optional>
#include <string>

namespace cc {

enum class DumpMode { Tokens, Chars };

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

struct DumpConfig {
    DumpMode mode = DumpMode::Tokens;
    bool positions = true;
    bool trivia = false;
};

// Layered configuration for cc-lex: global file, then an explicit file.
// Later layers override only the fields they actually set.
struct Config {
    LogConfig logging;
    DumpConfig dump;
    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool dump_mode_set = false;
    bool dump_positions_set = false;
    bool dump_trivia_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push the [log] settings that were set into cc::log
    void apply_logging() const;
};

// ~/.cc-lex/config.toml, or "" when no home directory is known
std::string global_config_path();

const char* dump_mode_name(DumpMode m);
std::optional<DumpMode> parse_dump_mode(const std::string& name);

} // namespace cc
