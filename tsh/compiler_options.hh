#pragma once

#include "logger.hh"
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace typeshape::driver {

/// Output mode for the compiler
enum class OutputMode {
    Compile,     // Normal compilation (default)
    PrintRoots   // Print the types that would be compiled and exit
};

/// Report format
enum class ReportFormat {
    Text,
    Yaml
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;
    std::filesystem::path output_file;               // -o, empty: stdout
    ReportFormat format = ReportFormat::Text;        // --format=text|yaml

    // ========================================================================
    // Compilation
    // ========================================================================

    std::vector<std::string> roots;                  // -r <name>, repeatable
    std::size_t max_depth = DEFAULT_MAX_DEPTH;       // --max-depth=<n>
    bool stop_on_first_error = false;                // --stop-on-first-error

    // ========================================================================
    // Warnings
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    std::set<std::string> disabled_warnings;         // -Wno-W001

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    Verbosity verbosity = Verbosity::Normal;         // -q, -v, --debug
    ColorMode color = ColorMode::Auto;               // --color, --no-color

    OutputMode output_mode = OutputMode::Compile;    // --print-roots
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

}  // namespace typeshape::driver
