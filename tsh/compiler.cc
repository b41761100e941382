#include "compiler.hh"
#include <typeshape/ir_printer.hh>
#include <fstream>
#include <iostream>
#include <sstream>

namespace typeshape::driver {

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        logger_.trace(Verbosity::Verbose, "Starting compilation...");

        // Stage 1: Declarations
        yaml::declaration_set declarations = load_declarations();

        if (options_.output_mode == OutputMode::PrintRoots) {
            return print_roots(declarations);
        }

        // Stage 2: Type passes
        compile_result result = run_passes(declarations);
        print_diagnostics(result);

        // Stage 3: Report (also written when some types failed)
        write_report(result);

        if (result.has_errors()) {
            return 1;
        }

        // stdout carries the report itself unless -o was given
        if (!options_.output_file.empty()) {
            logger_.done("Compiled " + std::to_string(result.types.size()) + " type(s)");
        }
        return 0;

    } catch (const yaml::yaml_error& e) {
        logger_.report(diagnostic_level::error, std::string("Declaration error: ") + e.what());
        return 1;
    } catch (const type_error& e) {
        logger_.report(diagnostic_level::error, std::string("Type error: ") + e.what());
        return 1;
    } catch (const internal_error& e) {
        logger_.report(diagnostic_level::error, std::string("Internal compiler error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.report(diagnostic_level::error, e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

yaml::declaration_set Compiler::load_declarations() {
    yaml::declaration_set merged;

    for (const auto& input_file : options_.input_files) {
        logger_.trace(Verbosity::Verbose, "Loading: " + input_file.string());

        yaml::declaration_set file_set = yaml::load_declarations_file(input_file.string());
        logger_.trace(Verbosity::Verbose, std::to_string(file_set.types.size()) + " declaration(s)", 1);

        yaml::merge_declarations(merged, file_set);
    }

    return merged;
}

compile_result Compiler::run_passes(const yaml::declaration_set& declarations) {
    logger_.trace(Verbosity::Verbose, "Running type passes...");

    compile_options opts = make_compile_options(declarations);
    for (const auto& root : opts.roots) {
        logger_.trace(Verbosity::Debug, "root: " + root, 1);
    }

    compile_result result = typeshape::compile(declarations.types, opts);

    logger_.trace(Verbosity::Verbose, "Instantiated " + std::to_string(result.memo.size()) + " type(s)");
    for (const auto& [key, info] : result.memo) {
        if (info.circular) {
            logger_.trace(Verbosity::Debug, "circular: " + key, 1);
        }
    }

    return result;
}

void Compiler::write_report(const compile_result& result) {
    std::ostringstream report;
    if (options_.format == ReportFormat::Yaml) {
        report << yaml::write_result(result);
    } else {
        write_text_report(result, report);
    }

    if (options_.output_file.empty()) {
        std::cout << report.str();
        return;
    }

    logger_.trace(Verbosity::Verbose, "Writing: " + options_.output_file.string());

    std::ofstream ofs(options_.output_file);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + options_.output_file.string());
    }

    ofs << report.str();

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + options_.output_file.string());
    }
}

// ============================================================================
// Utility Methods
// ============================================================================

compile_options Compiler::make_compile_options(const yaml::declaration_set& declarations) const {
    compile_options opts;
    opts.max_depth = options_.max_depth;
    opts.stop_on_first_error = options_.stop_on_first_error;
    opts.warnings_as_errors = options_.warnings_as_errors;
    opts.disabled_warnings = options_.disabled_warnings;

    // Command-line roots replace the ones named in the files
    if (!options_.roots.empty()) {
        opts.roots.insert(options_.roots.begin(), options_.roots.end());
    } else {
        opts.roots.insert(declarations.roots.begin(), declarations.roots.end());
    }

    return opts;
}

void Compiler::print_diagnostics(const compile_result& result) {
    std::size_t shown_warnings = 0;
    for (const auto& diag : result.diagnostics) {
        if (diag.level == diagnostic_level::warning) {
            if (options_.suppress_all_warnings) continue;
            ++shown_warnings;
        }
        logger_.report(diag);
    }

    logger_.summary(result.error_count(), shown_warnings);
}

void Compiler::write_text_report(const compile_result& result, std::ostream& os) const {
    for (const auto& [name, solved] : result.types) {
        os << name << " = " << solved << "\n";
    }

    if (result.instances.empty()) {
        return;
    }

    os << "\ninstances:\n";
    for (const auto& [key, solved] : result.instances) {
        os << "  " << key;

        auto entry = result.memo.find(key);
        bool circular = entry != result.memo.end() && entry->second.circular;
        auto usage = result.usage.find(key);
        std::size_t uses = usage != result.usage.end() ? usage->second : 0;

        os << " (" << uses << " use" << (uses != 1 ? "s" : "");
        if (circular) os << ", circular";
        if (result.emit_as_function(key)) os << ", named";
        os << ") = " << solved << "\n";
    }
}

int Compiler::print_roots(const yaml::declaration_set& declarations) {
    compile_options opts = make_compile_options(declarations);

    if (!opts.roots.empty()) {
        for (const auto& root : opts.roots) {
            std::cout << root << "\n";
        }
        return 0;
    }

    for (const auto& [name, declaration] : declarations.types) {
        const auto* alias = declaration.as<ir::type_alias>();
        const auto* iface = declaration.as<ir::interface_decl>();
        if ((alias && alias->parameter_count == 0) || (iface && iface->parameter_count == 0)) {
            std::cout << name << "\n";
        }
    }
    return 0;
}

}  // namespace typeshape::driver
