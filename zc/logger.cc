#include "logger.hh"

#include <iostream>

#include <termcolor/termcolor.hpp>

namespace zplc::driver {

namespace {
    struct severity_style {
        LogLevel level;
        const char* label;
        std::ostream& (*color)(std::ostream&);
    };

    severity_style style_of(Logger::Severity severity) {
        switch (severity) {
            case Logger::Severity::Error:
                return {LogLevel::Quiet, "error: ", termcolor::red};
            case Logger::Severity::Warning:
                return {LogLevel::Normal, "warning: ", termcolor::yellow};
            case Logger::Severity::Note:
                break;
        }
        return {LogLevel::Verbose, "note: ", termcolor::blue};
    }
}

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level) {
    if (color == ColorMode::Always) {
        std::cout << termcolor::colorize;
        std::cerr << termcolor::colorize;
    } else if (color == ColorMode::Never) {
        std::cout << termcolor::nocolorize;
        std::cerr << termcolor::nocolorize;
    }
}

std::ostream& Logger::progress() const {
    return stderr_only_ ? std::cerr : std::cout;
}

void Logger::emit(Severity severity, const std::string& message, const std::string& location) {
    const severity_style style = style_of(severity);
    if (!enabled(style.level)) {
        return;
    }
    if (!location.empty()) {
        std::cerr << termcolor::bold << location << ": " << termcolor::reset;
    }
    std::cerr << termcolor::bold << style.color << style.label << termcolor::reset << message << '\n';
}

void Logger::diagnostic(Severity severity, const std::filesystem::path& file, std::size_t line,
                        const std::string& message) {
    emit(severity, message, file.string() + ":" + std::to_string(line));
}

void Logger::info(const std::string& message) {
    if (enabled(LogLevel::Normal)) {
        progress() << message << '\n';
    }
}

void Logger::success(const std::string& message) {
    if (enabled(LogLevel::Normal)) {
        progress() << termcolor::green << message << termcolor::reset << '\n';
    }
}

void Logger::verbose(const std::string& message) {
    if (enabled(LogLevel::Verbose)) {
        progress() << termcolor::cyan << message << termcolor::reset << '\n';
    }
}

void Logger::debug(const std::string& message) {
    if (enabled(LogLevel::Debug)) {
        progress() << termcolor::magenta << "[debug] " << termcolor::reset << message << '\n';
    }
}

} // namespace zplc::driver
