#include "logger.hh"
#include <termcolor/termcolor.hpp>
#include <iostream>

namespace typeshape::driver {

Logger::Logger(Verbosity verbosity, ColorMode color)
    : verbosity_(verbosity)
{
    if (color == ColorMode::Always) {
        std::cout << termcolor::colorize;
        std::cerr << termcolor::colorize;
    } else if (color == ColorMode::Never) {
        std::cout << termcolor::nocolorize;
        std::cerr << termcolor::nocolorize;
    }
}

bool Logger::shows(Verbosity required) const {
    return static_cast<int>(verbosity_) >= static_cast<int>(required);
}

bool Logger::shows(diagnostic_level level) const {
    return shows(level == diagnostic_level::error ? Verbosity::Quiet : Verbosity::Normal);
}

void Logger::print_level(std::ostream& os, diagnostic_level level) {
    if (level == diagnostic_level::error) {
        os << termcolor::bold << termcolor::red << "error: ";
    } else {
        os << termcolor::bold << termcolor::yellow << "warning: ";
    }
    os << termcolor::reset;
}

void Logger::report(const diagnostic& diag) {
    if (!shows(diag.level)) return;

    std::cerr << termcolor::bold << diag.type_name << ": " << termcolor::reset;
    print_level(std::cerr, diag.level);
    std::cerr << diag.message;
    if (!diag.code.empty()) {
        std::cerr << " [" << diag.code << "]";
    }
    std::cerr << "\n";
}

void Logger::report(diagnostic_level level, const std::string& message) {
    if (!shows(level)) return;

    std::cerr << termcolor::bold << "tsh: " << termcolor::reset;
    print_level(std::cerr, level);
    std::cerr << message << "\n";
}

void Logger::summary(std::size_t errors, std::size_t warnings) {
    if (errors == 0 && warnings == 0) return;
    if (!shows(errors > 0 ? diagnostic_level::error : diagnostic_level::warning)) return;

    std::cerr << "\n";
    if (errors > 0) {
        std::cerr << errors << " error" << (errors != 1 ? "s" : "");
    }
    if (warnings > 0) {
        if (errors > 0) std::cerr << ", ";
        std::cerr << warnings << " warning" << (warnings != 1 ? "s" : "");
    }
    std::cerr << " generated.\n";
}

void Logger::trace(Verbosity min_verbosity, const std::string& message, int depth) {
    if (!shows(min_verbosity)) return;

    std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ');
    if (min_verbosity == Verbosity::Debug) {
        std::cout << termcolor::magenta << "[debug] " << termcolor::reset << message << "\n";
    } else {
        std::cout << termcolor::cyan << message << termcolor::reset << "\n";
    }
}

void Logger::done(const std::string& message) {
    if (!shows(Verbosity::Normal)) return;

    std::cout << termcolor::bold << termcolor::green << "ok: " << termcolor::reset << message << "\n";
}

} // namespace typeshape::driver
