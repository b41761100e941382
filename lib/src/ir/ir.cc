//
// IR constructors and naming
//

#include <typeshape/ir.hh>
#include <typeshape/errors.hh>
#include <array>
#include <utility>

namespace typeshape::ir {

namespace {
    template <typename T>
    type wrap(T value) {
        return type(std::make_shared<const node>(node{node_variant{std::move(value)}}));
    }

    constexpr std::array<std::pair<const char*, primitive_kind>, 10> PRIMITIVE_NAMES = {{
        {"string", primitive_kind::string},
        {"number", primitive_kind::number},
        {"bigint", primitive_kind::bigint},
        {"boolean", primitive_kind::boolean},
        {"symbol", primitive_kind::symbol},
        {"object", primitive_kind::object},
        {"any", primitive_kind::any},
        {"unknown", primitive_kind::unknown},
        {"null", primitive_kind::null},
        {"undefined", primitive_kind::undefined},
    }};
}

type::type(std::shared_ptr<const node> n)
    : node_(std::move(n))
{
    if (!node_) {
        throw internal_error("IR handle constructed without a node");
    }
}

bool operator==(const type& a, const type& b) {
    return a.node_ == b.node_ || a.node_->value == b.node_->value;
}

// ============================================================================
// Constructors
// ============================================================================

type make_primitive(primitive_kind kind) {
    return wrap(primitive_type{kind});
}

type make_primitive(const std::string& name) {
    auto kind = parse_primitive_kind(name);
    if (!kind) {
        throw internal_error(name + " is not a primitive type");
    }
    return make_primitive(*kind);
}

type make_literal(std::string value) {
    return wrap(literal{literal_value{std::move(value)}});
}

type make_literal(const char* value) {
    return make_literal(std::string(value));
}

type make_literal(double value) {
    return wrap(literal{literal_value{value}});
}

type make_literal(bool value) {
    return wrap(literal{literal_value{value}});
}

type make_type_ref(std::string name, std::vector<type> parameters) {
    return wrap(type_ref{std::move(name), std::move(parameters)});
}

type make_instantiated(std::string key) {
    return wrap(instantiated_type{std::move(key)});
}

type make_generic(std::size_t index) {
    return wrap(generic_type{index});
}

type make_alias(type value, std::size_t parameter_count, std::vector<type> defaults) {
    if (defaults.size() > parameter_count) {
        throw internal_error("alias has more defaults than parameters");
    }
    return wrap(type_alias{std::move(value), parameter_count, std::move(defaults)});
}

type make_interface(object_pattern body, std::size_t parameter_count, std::vector<type> defaults) {
    if (defaults.size() > parameter_count) {
        throw internal_error("interface has more defaults than parameters");
    }
    return wrap(interface_decl{std::move(body), parameter_count, std::move(defaults)});
}

property_signature make_property(std::string key, type value, bool optional) {
    return property_signature{std::move(key), optional, std::move(value)};
}

type make_object(std::vector<property_signature> properties,
                 std::optional<type> string_indexer,
                 std::optional<type> number_indexer) {
    return wrap(object_pattern{std::move(properties),
                               std::move(string_indexer),
                               std::move(number_indexer)});
}

type make_builtin(builtin_kind kind, std::vector<type> element_types) {
    std::size_t expected = kind == builtin_kind::map ? 2 : 1;
    if (element_types.size() != expected) {
        throw internal_error(std::string("builtin ") + builtin_kind_name(kind) + " expects " +
                             std::to_string(expected) + " element type(s), got " +
                             std::to_string(element_types.size()));
    }
    return wrap(builtin_type{kind, std::move(element_types)});
}

type make_array(type element) {
    return make_builtin(builtin_kind::array, {std::move(element)});
}

type make_set(type element) {
    return make_builtin(builtin_kind::set, {std::move(element)});
}

type make_map(type key, type value) {
    return make_builtin(builtin_kind::map, {std::move(key), std::move(value)});
}

type make_tuple(std::vector<type> elements) {
    std::size_t count = elements.size();
    return ir::make_tuple(std::move(elements), std::nullopt, count);
}

type make_tuple(std::vector<type> elements, std::optional<type> rest, std::size_t first_optional_index) {
    return wrap(tuple{std::move(elements), std::move(rest), first_optional_index});
}

type make_union(std::vector<type> members) {
    if (members.size() < 2) {
        throw internal_error("union requires at least two members");
    }
    return wrap(union_type{std::move(members)});
}

type make_intersection(std::vector<type> members) {
    if (members.size() < 2) {
        throw internal_error("intersection requires at least two members");
    }
    return wrap(intersection{std::move(members)});
}

type make_failed_intersection() {
    return wrap(failed_intersection{});
}

// ============================================================================
// Names
// ============================================================================

const char* primitive_kind_name(primitive_kind kind) {
    for (const auto& [name, k] : PRIMITIVE_NAMES) {
        if (k == kind) return name;
    }
    throw internal_error("unknown primitive kind");
}

std::optional<primitive_kind> parse_primitive_kind(const std::string& name) {
    for (const auto& [n, kind] : PRIMITIVE_NAMES) {
        if (name == n) return kind;
    }
    return std::nullopt;
}

const char* builtin_kind_name(builtin_kind kind) {
    switch (kind) {
        case builtin_kind::array: return "Array";
        case builtin_kind::set:   return "Set";
        case builtin_kind::map:   return "Map";
    }
    throw internal_error("unknown builtin kind");
}

const char* kind_name(const type& t) {
    struct namer {
        const char* operator()(const primitive_type&) const { return "primitiveType"; }
        const char* operator()(const literal&) const { return "literal"; }
        const char* operator()(const type_ref&) const { return "type"; }
        const char* operator()(const instantiated_type&) const { return "instantiatedType"; }
        const char* operator()(const generic_type&) const { return "genericType"; }
        const char* operator()(const type_alias&) const { return "alias"; }
        const char* operator()(const interface_decl&) const { return "interface"; }
        const char* operator()(const object_pattern&) const { return "objectPattern"; }
        const char* operator()(const builtin_type&) const { return "builtinType"; }
        const char* operator()(const tuple&) const { return "tuple"; }
        const char* operator()(const union_type&) const { return "union"; }
        const char* operator()(const intersection&) const { return "intersection"; }
        const char* operator()(const failed_intersection&) const { return "failedIntersection"; }
    };
    return std::visit(namer{}, t.get().value);
}

} // namespace typeshape::ir
