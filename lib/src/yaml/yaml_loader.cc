//
// Declaration file loader
//

#include <typeshape/yaml.hh>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

namespace typeshape::yaml {

namespace {
    const char* const TYPE_FORMS[] = {
        "ref", "literal", "union", "intersection", "array", "set", "map", "tuple", "object"
    };

    std::string child_context(const std::string& context, const std::string& name) {
        return context.empty() ? name : context + "." + name;
    }

    std::string child_context(const std::string& context, std::size_t index) {
        return context + "[" + std::to_string(index) + "]";
    }

    std::string key_string(const fkyaml::node& key, const std::string& context) {
        if (!key.is_string()) {
            throw yaml_error(context, "keys must be strings");
        }
        return key.get_value<std::string>();
    }

    std::string scalar_string(const fkyaml::node& n, const std::string& context, const char* what) {
        if (!n.is_string()) {
            throw yaml_error(context, std::string(what) + " must be a string");
        }
        return n.get_value<std::string>();
    }

    std::size_t scalar_count(const fkyaml::node& n, const std::string& context, const char* what) {
        if (!n.is_integer() || n.get_value<std::int64_t>() < 0) {
            throw yaml_error(context, std::string(what) + " must be a non-negative integer");
        }
        return static_cast<std::size_t>(n.get_value<std::int64_t>());
    }

    /// Builds IR from the `types` section of one document
    class declaration_builder {
    public:
        declaration_set build(const fkyaml::node& root) {
            declaration_set result;

            if (!root.is_mapping()) {
                throw yaml_error("", "document must be a mapping");
            }

            if (root.contains("types")) {
                const auto& types = root["types"];
                if (!types.is_mapping()) {
                    throw yaml_error("types", "must be a mapping");
                }
                for (auto it = types.begin(); it != types.end(); ++it) {
                    std::string name = key_string(it.key(), "types");
                    std::string context = child_context("types", name);
                    result.types.emplace(name, build_declaration(*it, context));
                }
            }

            if (root.contains("roots")) {
                const auto& roots = root["roots"];
                if (!roots.is_sequence()) {
                    throw yaml_error("roots", "must be a sequence of type names");
                }
                for (std::size_t i = 0; i < roots.size(); ++i) {
                    result.roots.push_back(scalar_string(roots[i], child_context("roots", i), "root"));
                }
            }

            return result;
        }

    private:
        std::vector<std::string> parameters_;  // Type parameter names in scope

        // ====================================================================
        // Declarations
        // ====================================================================

        ir::type build_declaration(const fkyaml::node& decl, const std::string& context) {
            if (!decl.is_mapping()) {
                throw yaml_error(context, "declaration must be a mapping");
            }
            if (!decl.contains("kind")) {
                throw yaml_error(context, "missing 'kind' (alias or interface)");
            }
            std::string kind = scalar_string(decl["kind"], child_context(context, "kind"), "kind");

            std::vector<ir::type> defaults = build_parameters(decl, context);
            std::size_t count = parameters_.size();

            if (kind == "alias") {
                if (!decl.contains("type")) {
                    throw yaml_error(context, "alias needs a 'type'");
                }
                ir::type value = build_type(decl["type"], child_context(context, "type"));
                return ir::make_alias(std::move(value), count, std::move(defaults));
            }

            if (kind == "interface") {
                ir::type body = build_object(decl, context);
                return ir::make_interface(*body.as<ir::object_pattern>(), count, std::move(defaults));
            }

            throw yaml_error(child_context(context, "kind"),
                             "unknown kind '" + kind + "' (expected alias or interface)");
        }

        /// Sets the parameter scope and returns the trailing defaults
        std::vector<ir::type> build_parameters(const fkyaml::node& decl, const std::string& context) {
            parameters_.clear();
            std::vector<ir::type> defaults;

            if (!decl.contains("parameters")) {
                return defaults;
            }

            const auto& params = decl["parameters"];
            std::string params_context = child_context(context, "parameters");
            if (!params.is_sequence()) {
                throw yaml_error(params_context, "must be a sequence");
            }

            for (std::size_t i = 0; i < params.size(); ++i) {
                const auto& p = params[i];
                std::string p_context = child_context(params_context, i);

                std::string name;
                std::optional<ir::type> default_type;
                if (p.is_string()) {
                    name = p.get_value<std::string>();
                } else if (p.is_mapping() && p.contains("name")) {
                    name = scalar_string(p["name"], child_context(p_context, "name"), "parameter name");
                    if (p.contains("default")) {
                        // A default sees only the parameters declared before it
                        default_type = build_type(p["default"], child_context(p_context, "default"));
                    }
                } else {
                    throw yaml_error(p_context, "parameter must be a name or {name, default}");
                }

                if (std::find(parameters_.begin(), parameters_.end(), name) != parameters_.end()) {
                    throw yaml_error(p_context, "duplicate type parameter '" + name + "'");
                }

                if (default_type) {
                    defaults.push_back(std::move(*default_type));
                } else if (!defaults.empty()) {
                    throw yaml_error(p_context, "parameter '" + name + "' without a default follows one with a default");
                }

                parameters_.push_back(name);
            }

            return defaults;
        }

        // ====================================================================
        // Type expressions
        // ====================================================================

        ir::type build_type(const fkyaml::node& n, const std::string& context) {
            if (n.is_null()) {
                return ir::make_primitive(ir::primitive_kind::null);
            }
            if (n.is_string()) {
                return build_named(n.get_value<std::string>());
            }
            if (!n.is_mapping()) {
                throw yaml_error(context, "type must be a name or a mapping");
            }

            const char* form = nullptr;
            for (const char* candidate : TYPE_FORMS) {
                if (n.contains(std::string(candidate))) {
                    if (form) {
                        throw yaml_error(context, std::string("both '") + form + "' and '" + candidate + "' given");
                    }
                    form = candidate;
                }
            }
            if (!form) {
                throw yaml_error(context, "unrecognized type expression");
            }

            std::string form_name(form);
            std::string form_context = child_context(context, form_name);

            if (form_name == "ref") {
                return build_reference(n, context);
            }
            if (form_name == "literal") {
                return build_literal(n["literal"], form_context);
            }
            if (form_name == "union" || form_name == "intersection") {
                std::vector<ir::type> members = build_list(n[form_name], form_context);
                if (members.size() < 2) {
                    throw yaml_error(form_context, "needs at least two members");
                }
                return form_name == "union" ? ir::make_union(std::move(members))
                                            : ir::make_intersection(std::move(members));
            }
            if (form_name == "array") {
                return ir::make_array(build_type(n["array"], form_context));
            }
            if (form_name == "set") {
                return ir::make_set(build_type(n["set"], form_context));
            }
            if (form_name == "map") {
                std::vector<ir::type> kv = build_list(n["map"], form_context);
                if (kv.size() != 2) {
                    throw yaml_error(form_context, "must be [key, value]");
                }
                return ir::make_map(kv[0], kv[1]);
            }
            if (form_name == "tuple") {
                return build_tuple(n, context);
            }
            return build_object(n, context, "object");
        }

        ir::type build_named(const std::string& name) {
            auto param = std::find(parameters_.begin(), parameters_.end(), name);
            if (param != parameters_.end()) {
                return ir::make_generic(static_cast<std::size_t>(param - parameters_.begin()));
            }
            if (auto kind = ir::parse_primitive_kind(name)) {
                return ir::make_primitive(*kind);
            }
            return ir::make_type_ref(name);
        }

        ir::type build_reference(const fkyaml::node& n, const std::string& context) {
            std::string name = scalar_string(n["ref"], child_context(context, "ref"), "ref");
            std::vector<ir::type> args;
            if (n.contains("args")) {
                args = build_list(n["args"], child_context(context, "args"));
            }
            return ir::make_type_ref(std::move(name), std::move(args));
        }

        ir::type build_literal(const fkyaml::node& n, const std::string& context) {
            if (n.is_string()) {
                return ir::make_literal(n.get_value<std::string>());
            }
            if (n.is_boolean()) {
                return ir::make_literal(n.get_value<bool>());
            }
            if (n.is_integer()) {
                return ir::make_literal(static_cast<double>(n.get_value<std::int64_t>()));
            }
            if (n.is_float_number()) {
                return ir::make_literal(n.get_value<double>());
            }
            throw yaml_error(context, "literal must be a string, number or boolean");
        }

        ir::type build_tuple(const fkyaml::node& n, const std::string& context) {
            std::vector<ir::type> elements = build_list(n["tuple"], child_context(context, "tuple"));

            std::size_t first_optional = elements.size();
            if (n.contains("optional_from")) {
                std::string opt_context = child_context(context, "optional_from");
                first_optional = scalar_count(n["optional_from"], opt_context, "optional_from");
                if (first_optional > elements.size()) {
                    throw yaml_error(opt_context, "is past the last element");
                }
            }

            std::optional<ir::type> rest;
            if (n.contains("rest")) {
                rest = build_type(n["rest"], child_context(context, "rest"));
            }

            return ir::make_tuple(std::move(elements), std::move(rest), first_optional);
        }

        /// Object pattern from `properties_key` plus the index signatures
        /// found beside it
        ir::type build_object(const fkyaml::node& n, const std::string& context,
                              const char* properties_key = "properties") {
            std::vector<ir::property_signature> properties;

            if (n.contains(std::string(properties_key))) {
                const auto& props = n[std::string(properties_key)];
                std::string props_context = child_context(context, properties_key);
                if (!props.is_mapping() && !props.is_null()) {
                    throw yaml_error(props_context, "must be a mapping of property names to types");
                }
                if (props.is_mapping()) {
                    for (auto it = props.begin(); it != props.end(); ++it) {
                        std::string key = key_string(it.key(), props_context);
                        bool optional = key.size() > 1 && key.back() == '?';
                        if (optional) {
                            key.pop_back();
                        }
                        if (std::any_of(properties.begin(), properties.end(),
                                        [&](const auto& p) { return p.key == key; })) {
                            throw yaml_error(props_context, "duplicate property '" + key + "'");
                        }
                        ir::type value = build_type(*it, child_context(props_context, key));
                        properties.push_back(ir::make_property(std::move(key), std::move(value), optional));
                    }
                }
            }

            std::optional<ir::type> string_indexer;
            if (n.contains("string_index")) {
                string_indexer = build_type(n["string_index"], child_context(context, "string_index"));
            }
            std::optional<ir::type> number_indexer;
            if (n.contains("number_index")) {
                number_indexer = build_type(n["number_index"], child_context(context, "number_index"));
            }

            return ir::make_object(std::move(properties), std::move(string_indexer), std::move(number_indexer));
        }

        std::vector<ir::type> build_list(const fkyaml::node& n, const std::string& context) {
            if (!n.is_sequence()) {
                throw yaml_error(context, "must be a sequence");
            }
            std::vector<ir::type> types;
            types.reserve(n.size());
            for (std::size_t i = 0; i < n.size(); ++i) {
                types.push_back(build_type(n[i], child_context(context, i)));
            }
            return types;
        }
    };
}

declaration_set build_declarations(const fkyaml::node& root) {
    declaration_builder builder;
    return builder.build(root);
}

declaration_set load_declarations(const std::string& text) {
    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(text);
    } catch (const fkyaml::exception& e) {
        throw yaml_error("", "failed to parse YAML: " + std::string(e.what()));
    }
    return build_declarations(root);
}

declaration_set load_declarations_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return load_declarations(buffer.str());
    } catch (const yaml_error& e) {
        throw yaml_error(path, e.what());
    }
}

void merge_declarations(declaration_set& into, const declaration_set& from) {
    for (const auto& [name, declaration] : from.types) {
        if (!into.types.emplace(name, declaration).second) {
            throw yaml_error(child_context("types", name), "declared more than once");
        }
    }
    for (const auto& root : from.roots) {
        if (std::find(into.roots.begin(), into.roots.end(), root) == into.roots.end()) {
            into.roots.push_back(root);
        }
    }
}

} // namespace typeshape::yaml
