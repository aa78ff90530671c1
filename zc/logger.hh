#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace zplc::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // + warnings, progress
    Verbose, // + notes, compilation steps
    Debug    // + resolved setup, backend options
};

enum class ColorMode {
    Auto,
    Always,
    Never
};

/**
 * Console output of the zc driver, colored with termcolor.
 *
 * Errors, warnings and notes go to stderr. Progress messages go to stdout
 * unless the rendered label is written there, see use_stderr_only().
 */
class Logger {
public:
    enum class Severity {
        Error,
        Warning,
        Note
    };

    explicit Logger(LogLevel level = LogLevel::Normal, ColorMode color = ColorMode::Auto);

    void error(const std::string& message) { emit(Severity::Error, message); }
    void warning(const std::string& message) { emit(Severity::Warning, message); }
    void note(const std::string& message) { emit(Severity::Note, message); }

    /// "file:line: warning: message"
    void diagnostic(Severity severity, const std::filesystem::path& file, std::size_t line,
                    const std::string& message);

    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

    void use_stderr_only(bool value) { stderr_only_ = value; }

private:
    LogLevel level_;
    bool stderr_only_ = false;

    bool enabled(LogLevel required) const { return level_ >= required; }
    std::ostream& progress() const;
    void emit(Severity severity, const std::string& message, const std::string& location = {});
};

} // namespace zplc::driver
