#include "compiler_options.hh"
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace typeshape::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// -o file, -ofile
static std::string get_attached_or_next(const char* arg, const char* prefix,
                                        int& i, int argc, char** argv) {
    std::string value = get_option_value(arg, prefix);
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

static std::size_t parse_depth(const std::string& value) {
    std::size_t depth = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
    if (ec != std::errc() || end != value.data() + value.size() || depth == 0) {
        throw std::runtime_error("Invalid value for --max-depth: " + value +
                                 " (expected a positive integer)");
    }
    return depth;
}

static void require_not_quiet(const CompilerOptions& opts, const char* arg) {
    if (opts.verbosity == Verbosity::Quiet) {
        throw std::runtime_error(std::string("Cannot combine -q/--quiet with ") + arg);
    }
}

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            require_not_quiet(opts, arg);
            if (opts.verbosity != Verbosity::Debug) opts.verbosity = Verbosity::Verbose;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            require_not_quiet(opts, arg);
            opts.verbosity = Verbosity::Debug;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            if (opts.verbosity > Verbosity::Normal) {
                throw std::runtime_error("Cannot combine -q/--quiet with -v/--verbose or --debug");
            }
            opts.verbosity = Verbosity::Quiet;
            continue;
        }

        // Colors
        if (std::strcmp(arg, "--color") == 0) {
            opts.color = ColorMode::Always;
            continue;
        }

        if (std::strcmp(arg, "--no-color") == 0) {
            opts.color = ColorMode::Never;
            continue;
        }

        // Report destination
        if (starts_with(arg, "-o")) {
            opts.output_file = get_attached_or_next(arg, "-o", i, argc, argv);
            continue;
        }

        // Roots
        if (starts_with(arg, "-r")) {
            opts.roots.push_back(get_attached_or_next(arg, "-r", i, argc, argv));
            continue;
        }

        if (starts_with(arg, "--format=")) {
            std::string value = get_option_value(arg, "--format=");
            if (value == "text") {
                opts.format = ReportFormat::Text;
            } else if (value == "yaml") {
                opts.format = ReportFormat::Yaml;
            } else {
                throw std::runtime_error("Invalid choice for --format: " + value +
                                         "\nValid choices: text, yaml");
            }
            continue;
        }

        if (starts_with(arg, "--max-depth=")) {
            opts.max_depth = parse_depth(get_option_value(arg, "--max-depth="));
            continue;
        }

        if (std::strcmp(arg, "--stop-on-first-error") == 0) {
            opts.stop_on_first_error = true;
            continue;
        }

        if (std::strcmp(arg, "--print-roots") == 0) {
            opts.output_mode = OutputMode::PrintRoots;
            continue;
        }

        // Warning options
        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-Wno-")) {
            opts.disabled_warnings.insert(get_option_value(arg, "-Wno-"));
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <declaration-files>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <file>               Write the report to <file> (default: stdout)\n";
    std::cout << "  --format=<fmt>          Report format: text (default) or yaml\n";
    std::cout << "  --print-roots           Print the types that would be compiled and exit\n";
    std::cout << "\n";

    std::cout << "Compilation:\n";
    std::cout << "  -r <name>               Compile type <name> (repeatable; default: every\n";
    std::cout << "                          declaration without type parameters)\n";
    std::cout << "  --max-depth=<n>         Recursion limit for all passes (default: "
              << DEFAULT_MAX_DEPTH << ")\n";
    std::cout << "  --stop-on-first-error   Stop after the first type that fails\n";
    std::cout << "\n";

    std::cout << "Warnings:\n";
    std::cout << "  -Werror                 Treat warnings as errors\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Wno-<code>             Disable a specific warning (e.g., -Wno-W001)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Show pipeline stages\n";
    std::cout << "  --debug                 Also show roots and circular entries\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color                 Always use colors\n";
    std::cout << "  --no-color              Never use colors\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " types.yaml\n";
    std::cout << "  " << program_name << " -r Node --format=yaml -o node.yaml types.yaml\n";
}

void print_version() {
    std::cout << "tsh (typeshape type-algebra compiler) version 0.1.0\n";
}

}  // namespace typeshape::driver
