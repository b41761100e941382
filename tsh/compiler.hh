#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <typeshape/passes.hh>
#include <typeshape/yaml.hh>
#include <ostream>

namespace typeshape::driver {

/// Main compiler driver
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Compile the input files and write the report
    /// Returns 0 on success, non-zero on error
    int compile();

private:
    // ========================================================================
    // Compilation Pipeline Stages
    // ========================================================================

    /// Stage 1: Load and merge every declaration file
    yaml::declaration_set load_declarations();

    /// Stage 2: Run the type passes on the requested roots
    compile_result run_passes(const yaml::declaration_set& declarations);

    /// Stage 3: Write the report
    void write_report(const compile_result& result);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    compile_options make_compile_options(const yaml::declaration_set& declarations) const;

    void print_diagnostics(const compile_result& result);

    void write_text_report(const compile_result& result, std::ostream& os) const;

    /// --print-roots
    int print_roots(const yaml::declaration_set& declarations);

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace typeshape::driver
