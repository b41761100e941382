//
// Pass 1: Resolution
//
// Inlines references to non-structural aliases. Interfaces, aliases of
// object patterns and builtins are nominal boundaries, and so are aliases
// that reach themselves through other inlined aliases: inlining those
// would unroll the cycle one more level on every pass.
//

#include <typeshape/passes.hh>
#include <typeshape/ir_utils.hh>
#include "pass_utils.hh"

namespace typeshape::passes {

namespace {
    bool is_inlined_alias(const ir::type& declaration) {
        const auto* alias = declaration.as<ir::type_alias>();
        return alias && !alias->value.is<ir::object_pattern>();
    }

    void collect_references(const ir::type& t, std::set<std::string>& names) {
        if (const auto* ref = t.as<ir::type_ref>()) {
            names.insert(ref->name);
        }
        ir::map_children(t, [&](const ir::type& child) {
            collect_references(child, names);
            return child;
        });
    }

    /// Aliases that can reach themselves through references to inlined aliases
    std::set<std::string> find_recursive_aliases(const ir::type_table& named_types) {
        std::map<std::string, std::set<std::string>> edges;
        for (const auto& [name, declaration] : named_types) {
            if (!is_inlined_alias(declaration)) continue;

            std::set<std::string> referenced;
            collect_references(declaration, referenced);

            auto& targets = edges[name];
            for (const auto& target : referenced) {
                auto it = named_types.find(target);
                if (it != named_types.end() && is_inlined_alias(it->second)) {
                    targets.insert(target);
                }
            }
        }

        std::set<std::string> recursive;
        for (const auto& [start, successors] : edges) {
            std::vector<std::string> pending(successors.begin(), successors.end());
            std::set<std::string> seen;
            while (!pending.empty()) {
                std::string current = std::move(pending.back());
                pending.pop_back();
                if (current == start) {
                    recursive.insert(start);
                    break;
                }
                if (!seen.insert(current).second) continue;
                const auto& next = edges.at(current);
                pending.insert(pending.end(), next.begin(), next.end());
            }
        }
        return recursive;
    }

    class resolver {
    public:
        resolver(const ir::type_table& named_types, std::size_t max_depth)
            : named_types_(named_types)
            , recursive_(find_recursive_aliases(named_types))
            , max_depth_(max_depth)
        {
        }

        ir::type resolve(const ir::type& t, const std::string& type_name) {
            detail::scoped_push<std::string> visit(visited_, type_name);
            return resolve_type(t);
        }

    private:
        const ir::type_table& named_types_;
        std::set<std::string> recursive_;
        std::size_t max_depth_;
        std::vector<std::string> visited_;  // Names being expanded on the current path

        ir::type resolve_type(const ir::type& t) {
            return ir::transform(t,
                [](const ir::type& n) { return n.is<ir::type_ref>(); },
                [this](const ir::type& n) { return resolve_reference(n); });
        }

        ir::type resolve_reference(const ir::type& node) {
            const auto& ref = *node.as<ir::type_ref>();

            if (detail::on_stack(visited_, ref.name)) {
                return resolve_parameters(ref);
            }

            auto it = named_types_.find(ref.name);
            if (it == named_types_.end()) {
                throw unregistered_type_error(ref.name);
            }
            const ir::type& declaration = it->second;

            if (declaration.is<ir::type_alias>()) {
                if (!is_inlined_alias(declaration) || recursive_.contains(ref.name)) {
                    return resolve_parameters(ref);
                }

                ir::type body = ir::apply_type_parameters(declaration, ref.name, ref.parameters);
                if (visited_.size() >= max_depth_) {
                    throw depth_limit_error(ref.name, max_depth_);
                }
                detail::scoped_push<std::string> visit(visited_, ref.name);
                return resolve_type(body);
            }

            if (declaration.is<ir::interface_decl>() || declaration.is<ir::builtin_type>()) {
                return resolve_parameters(ref);
            }

            throw internal_error("type reference '" + ref.name + "' referenced a " +
                                 ir::kind_name(declaration) + " instead of an interface or alias");
        }

        // Kept reference: canonicalize its parameters so memo keys agree
        ir::type resolve_parameters(const ir::type_ref& ref) {
            std::vector<ir::type> parameters;
            parameters.reserve(ref.parameters.size());
            for (const auto& p : ref.parameters) {
                parameters.push_back(resolve_type(p));
            }
            return ir::make_type_ref(ref.name, std::move(parameters));
        }
    };
}

ir::type resolve_single_type(const ir::type& t,
                             const ir::type_table& named_types,
                             const std::string& type_name,
                             std::size_t max_depth) {
    resolver r(named_types, max_depth);
    return r.resolve(t, type_name);
}

void resolve_all_types(ir::type_table& named_types, std::size_t max_depth) {
    // Every declaration resolves against the table as it was passed in
    const ir::type_table snapshot = named_types;
    resolver r(snapshot, max_depth);

    for (auto& [type_name, declaration] : named_types) {
        declaration = r.resolve(declaration, type_name);
    }
}

std::set<std::string> resolve_declarations(ir::type_table& named_types,
                                           std::vector<diagnostic>& diagnostics,
                                           std::size_t max_depth) {
    const ir::type_table snapshot = named_types;
    resolver r(snapshot, max_depth);
    std::set<std::string> failed;

    for (auto& [type_name, declaration] : named_types) {
        try {
            declaration = r.resolve(declaration, type_name);
        } catch (const type_error& e) {
            diagnostics.push_back(diagnostic{diagnostic_level::error, e.code(), type_name, e.what()});
            failed.insert(type_name);
        }
    }

    return failed;
}

} // namespace typeshape::passes
