//
// Main compilation pipeline
//

#include <typeshape/passes.hh>
#include <typeshape/ir_utils.hh>

namespace typeshape {

namespace {
    diagnostic make_error(const std::string& type_name, const type_error& e) {
        return diagnostic{diagnostic_level::error, e.code(), type_name, e.what()};
    }

    bool is_root_candidate(const ir::type& declaration) {
        if (const auto* alias = declaration.as<ir::type_alias>()) {
            return alias->parameter_count == 0;
        }
        if (const auto* iface = declaration.as<ir::interface_decl>()) {
            return iface->parameter_count == 0;
        }
        return false;
    }

    std::vector<diagnostic> filter_diagnostics(std::vector<diagnostic> diagnostics,
                                               const compile_options& opts) {
        std::vector<diagnostic> filtered;
        for (auto& diag : diagnostics) {
            if (diag.level == diagnostic_level::warning &&
                opts.disabled_warnings.contains(diag.code)) {
                continue;
            }
            if (opts.warnings_as_errors && diag.level == diagnostic_level::warning) {
                diag.level = diagnostic_level::error;
            }
            filtered.push_back(std::move(diag));
        }
        return filtered;
    }
}

compile_result compile(ir::type_table declarations, const compile_options& opts) {
    compile_result result;
    std::vector<diagnostic> diagnostics;

    ir::register_builtins(declarations);

    // Pass 1: Resolution. A broken declaration only fails the types that use it
    std::set<std::string> unresolved =
        passes::resolve_declarations(declarations, diagnostics, opts.max_depth);

    bool stop = opts.stop_on_first_error && !diagnostics.empty();

    std::vector<std::string> roots;
    if (opts.roots.empty()) {
        for (const auto& [name, declaration] : declarations) {
            if (is_root_candidate(declaration) && !unresolved.contains(name)) {
                roots.push_back(name);
            }
        }
    } else {
        for (const auto& name : opts.roots) {
            if (!declarations.contains(name)) {
                diagnostics.push_back(make_error(name, unregistered_type_error(name)));
                stop = stop || opts.stop_on_first_error;
            } else if (!unresolved.contains(name)) {
                roots.push_back(name);
            }
        }
    }

    passes::intersection_solver solver(result.memo, opts.max_depth);

    for (const auto& name : roots) {
        if (stop) break;

        try {
            // Pass 2: Instantiation
            std::vector<std::string> new_keys;
            passes::instantiation_state state{declarations, result.memo, result.usage, new_keys, opts.max_depth};
            ir::type root = passes::instantiate(ir::make_type_ref(name), state);

            // Passes 3 and 4: Flatten and solve every entry this root created
            for (const auto& key : new_keys) {
                solver.solved_instance(key);
            }
            ir::type solved = solver.solve(passes::flatten(root));
            if (const auto* inst = solved.as<ir::instantiated_type>()) {
                solved = solver.solved_instance(inst->key);
            }

            if (solved.is<ir::failed_intersection>()) {
                diagnostics.push_back(diagnostic{diagnostic_level::warning, diag_codes::W_EMPTY_TYPE, name,
                                                 "Type '" + name + "' has no possible value"});
            }
            result.types.emplace(name, std::move(solved));
        } catch (const type_error& e) {
            diagnostics.push_back(make_error(name, e));
            stop = opts.stop_on_first_error;
        }
    }

    result.instances = solver.solved_instances();
    result.diagnostics = filter_diagnostics(std::move(diagnostics), opts);

    return result;
}

} // namespace typeshape
