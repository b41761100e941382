#pragma once

#include <typeshape/passes.hh>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace typeshape::driver {

/// How much of the run is shown. Errors are shown at every level.
enum class Verbosity {
    Quiet,   // errors only
    Normal,  // + warnings and the closing status line
    Verbose, // + pipeline stages
    Debug    // + roots and circular entries
};

enum class ColorMode {
    Auto,    // termcolor decides per stream
    Always,
    Never
};

/**
 * Terminal output of tsh.
 *
 * Everything the run reports is a diagnostic level (error, warning) or a
 * trace line with a minimum verbosity. Diagnostics go to stderr, traces
 * and the status line to stdout.
 */
class Logger {
public:
    explicit Logger(Verbosity verbosity = Verbosity::Normal,
                    ColorMode color = ColorMode::Auto);

    /// `<type>: error: message [E001]`
    void report(const diagnostic& diag);

    /// A failure outside any type, e.g. an unreadable input file
    void report(diagnostic_level level, const std::string& message);

    /// "N errors, M warnings generated." (nothing when both are zero)
    void summary(std::size_t errors, std::size_t warnings);

    void trace(Verbosity min_verbosity, const std::string& message, int depth = 0);

    /// Closing status line on success
    void done(const std::string& message);

private:
    Verbosity verbosity_;

    bool shows(Verbosity required) const;
    bool shows(diagnostic_level level) const;
    static void print_level(std::ostream& os, diagnostic_level level);
};

} // namespace typeshape::driver
