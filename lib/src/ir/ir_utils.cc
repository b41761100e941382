//
// IR traversal, parameter substitution, keys and classification
//

#include <typeshape/ir_utils.hh>
#include <typeshape/ir_printer.hh>
#include <typeshape/errors.hh>
#include <algorithm>

namespace typeshape::ir {

namespace {
    std::vector<type> map_all(const std::vector<type>& types, const node_transform& fn) {
        std::vector<type> result;
        result.reserve(types.size());
        for (const auto& t : types) {
            result.push_back(fn(t));
        }
        return result;
    }

    std::optional<type> map_optional(const std::optional<type>& t, const node_transform& fn) {
        if (!t) return std::nullopt;
        return fn(*t);
    }

    object_pattern map_object(const object_pattern& o, const node_transform& fn) {
        object_pattern result;
        result.properties.reserve(o.properties.size());
        for (const auto& prop : o.properties) {
            result.properties.push_back(make_property(prop.key, fn(prop.value), prop.optional));
        }
        result.string_indexer = map_optional(o.string_indexer, fn);
        result.number_indexer = map_optional(o.number_indexer, fn);
        return result;
    }

    // Every alternative is listed so a new IR variant fails to compile here
    struct child_mapper {
        const type& self;
        const node_transform& fn;

        type operator()(const primitive_type&) const { return self; }
        type operator()(const literal&) const { return self; }
        type operator()(const instantiated_type&) const { return self; }
        type operator()(const generic_type&) const { return self; }
        type operator()(const failed_intersection&) const { return self; }

        type operator()(const type_ref& r) const {
            return make_type_ref(r.name, map_all(r.parameters, fn));
        }

        type operator()(const type_alias& a) const {
            return make_alias(fn(a.value), a.parameter_count, map_all(a.defaults, fn));
        }

        type operator()(const interface_decl& i) const {
            return make_interface(map_object(i.body, fn), i.parameter_count, map_all(i.defaults, fn));
        }

        type operator()(const object_pattern& o) const {
            auto mapped = map_object(o, fn);
            return make_object(std::move(mapped.properties),
                               std::move(mapped.string_indexer),
                               std::move(mapped.number_indexer));
        }

        type operator()(const builtin_type& b) const {
            return make_builtin(b.kind, map_all(b.element_types, fn));
        }

        type operator()(const tuple& t) const {
            return ir::make_tuple(map_all(t.elements, fn), map_optional(t.rest, fn), t.first_optional_index);
        }

        type operator()(const union_type& u) const {
            return make_union(map_all(u.members, fn));
        }

        type operator()(const intersection& n) const {
            return make_intersection(map_all(n.members, fn));
        }
    };

    struct parameter_shape {
        std::size_t count;
        const std::vector<type>* defaults;
        type body;
    };

    std::optional<parameter_shape> parameter_shape_of(const type& declaration) {
        static const std::vector<type> no_defaults;

        if (const auto* alias = declaration.as<type_alias>()) {
            return parameter_shape{alias->parameter_count, &alias->defaults, alias->value};
        }
        if (const auto* iface = declaration.as<interface_decl>()) {
            return parameter_shape{iface->parameter_count, &iface->defaults,
                                   make_object(iface->body.properties,
                                               iface->body.string_indexer,
                                               iface->body.number_indexer)};
        }
        if (const auto* builtin = declaration.as<builtin_type>()) {
            return parameter_shape{builtin->element_types.size(), &no_defaults, declaration};
        }
        return std::nullopt;
    }
}

// ============================================================================
// Traversal
// ============================================================================

type map_children(const type& t, const node_transform& fn) {
    return std::visit(child_mapper{t, fn}, t.get().value);
}

type transform(const type& t, const node_predicate& matches, const node_transform& fn) {
    if (matches(t)) {
        return fn(t);
    }
    return map_children(t, [&](const type& child) {
        return transform(child, matches, fn);
    });
}

bool contains_node(const type& t, const node_predicate& pred) {
    bool found = false;
    transform(t,
        [&](const type& n) { return found || pred(n); },
        [&](const type& n) {
            found = true;
            return n;
        });
    return found;
}

// ============================================================================
// Type parameters
// ============================================================================

type substitute_generics(const type& body, const std::vector<type>& parameters) {
    return transform(body,
        [](const type& n) { return n.is<generic_type>(); },
        [&](const type& n) {
            std::size_t index = n.as<generic_type>()->index;
            if (index >= parameters.size()) {
                throw internal_error("generic parameter $" + std::to_string(index) +
                                     " used but only " + std::to_string(parameters.size()) +
                                     " parameter(s) are bound");
            }
            return parameters[index];
        });
}

bool accepts_type_parameters(const type& declaration) {
    return declaration.is<type_alias>() ||
           declaration.is<interface_decl>() ||
           declaration.is<builtin_type>();
}

type apply_type_parameters(const type& declaration,
                           const std::string& type_name,
                           const std::vector<type>& provided) {
    auto shape = parameter_shape_of(declaration);
    if (!shape) {
        throw type_does_not_accept_generic_parameters_error(type_name, kind_name(declaration));
    }

    std::size_t max_count = shape->count;
    std::size_t min_count = max_count - shape->defaults->size();
    if (provided.size() > max_count || provided.size() < min_count) {
        throw type_parameter_count_error(type_name, min_count, max_count, provided.size());
    }

    std::vector<type> parameters = provided;
    for (std::size_t i = provided.size(); i < max_count; ++i) {
        // A default may only see the parameters declared before it
        parameters.push_back(substitute_generics((*shape->defaults)[i - min_count], parameters));
    }

    return substitute_generics(shape->body, parameters);
}

std::string type_key(const type_ref& ref) {
    if (ref.parameters.empty()) {
        return ref.name;
    }
    std::string key = ref.name + "<";
    for (std::size_t i = 0; i < ref.parameters.size(); ++i) {
        if (i > 0) key += ", ";
        key += to_string(ref.parameters[i]);
    }
    key += ">";
    return key;
}

// ============================================================================
// Disjointness classification
// ============================================================================

const char* disjoint_kind_name(disjoint_kind kind) {
    switch (kind) {
        case disjoint_kind::array:     return "Array";
        case disjoint_kind::boolean:   return "boolean";
        case disjoint_kind::number:    return "number";
        case disjoint_kind::bigint:    return "bigint";
        case disjoint_kind::string:    return "string";
        case disjoint_kind::symbol:    return "symbol";
        case disjoint_kind::null:      return "null";
        case disjoint_kind::undefined: return "undefined";
        case disjoint_kind::object:    return "object";
        case disjoint_kind::map:       return "Map";
        case disjoint_kind::set:       return "Set";
    }
    throw internal_error("unknown disjoint kind");
}

hierarchy_info classify(const type& t) {
    hierarchy_info info;

    if (const auto* p = t.as<primitive_type>()) {
        switch (p->kind) {
            case primitive_kind::any:
            case primitive_kind::unknown:
                info.is_anything = true;
                break;
            case primitive_kind::string:    info.disjoint = disjoint_kind::string; break;
            case primitive_kind::number:    info.disjoint = disjoint_kind::number; break;
            case primitive_kind::bigint:    info.disjoint = disjoint_kind::bigint; break;
            case primitive_kind::boolean:   info.disjoint = disjoint_kind::boolean; break;
            case primitive_kind::symbol:    info.disjoint = disjoint_kind::symbol; break;
            case primitive_kind::object:    info.disjoint = disjoint_kind::object; break;
            case primitive_kind::null:      info.disjoint = disjoint_kind::null; break;
            case primitive_kind::undefined: info.disjoint = disjoint_kind::undefined; break;
        }
    } else if (const auto* l = t.as<literal>()) {
        if (std::holds_alternative<std::string>(l->value)) {
            info.disjoint = disjoint_kind::string;
        } else if (std::holds_alternative<bool>(l->value)) {
            info.disjoint = disjoint_kind::boolean;
        } else {
            info.disjoint = disjoint_kind::number;
        }
    } else if (t.is<object_pattern>()) {
        info.disjoint = disjoint_kind::object;
    } else if (t.is<tuple>()) {
        info.disjoint = disjoint_kind::array;
    } else if (const auto* b = t.as<builtin_type>()) {
        switch (b->kind) {
            case builtin_kind::array: info.disjoint = disjoint_kind::array; break;
            case builtin_kind::set:   info.disjoint = disjoint_kind::set; break;
            case builtin_kind::map:   info.disjoint = disjoint_kind::map; break;
        }
    }

    return info;
}

// ============================================================================
// Builtins
// ============================================================================

void register_builtins(type_table& table) {
    const std::pair<const char*, builtin_kind> builtins[] = {
        {"Array", builtin_kind::array},
        {"ReadonlyArray", builtin_kind::array},
        {"Set", builtin_kind::set},
        {"ReadonlySet", builtin_kind::set},
        {"Map", builtin_kind::map},
        {"ReadonlyMap", builtin_kind::map},
    };

    for (const auto& [name, kind] : builtins) {
        if (kind == builtin_kind::map) {
            table.emplace(name, make_map(make_generic(0), make_generic(1)));
        } else {
            table.emplace(name, make_builtin(kind, {make_generic(0)}));
        }
    }
}

} // namespace typeshape::ir
