#pragma once

#include <iostream>
#include <string>

namespace schemagen::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + verbose messages
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console logger for the sgc driver, colored through termcolor.
 *
 * Output routing:
 * - Errors, warnings → stderr
 * - Info, success, verbose, debug → stdout
 *
 * The schemagen library itself never logs; it reports through exceptions
 * that the driver turns into log lines here.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                   ColorMode color = ColorMode::Auto);

    // Message types (errors/warnings to stderr, others to stdout)
    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// Indented continuation line, e.g. the location of an error
    void indent(const std::string& message, int spaces = 2, LogLevel min_level = LogLevel::Normal);

    // Level control
    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    ColorMode color_mode_;

    bool should_log(LogLevel required_level) const;
};

} // namespace schemagen::driver
