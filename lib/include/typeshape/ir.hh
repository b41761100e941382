//
// Intermediate Representation (IR) for typeshape
//
// Closed, immutable, structurally compared description of a type.
// Produced by a front-end (or the YAML loader), rewritten by the passes
// in passes.hh and consumed by a validator code generator.
//

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace typeshape::ir {

struct node;

/// Shared, immutable handle to an IR node.
///
/// Copying a handle never copies the tree. Trees are ownership-acyclic:
/// recursion between declarations is expressed only through named
/// indirections (type_ref before instantiation, instantiated_type after).
class type {
public:
    explicit type(std::shared_ptr<const node> n);

    [[nodiscard]] const node& get() const { return *node_; }

    /// True if the node holds alternative T
    template <typename T>
    [[nodiscard]] bool is() const;

    /// Pointer to alternative T or nullptr
    template <typename T>
    [[nodiscard]] const T* as() const;

    /// Structural equality (identical handles compare equal without a walk)
    friend bool operator==(const type& a, const type& b);

private:
    std::shared_ptr<const node> node_;
};

// ============================================================================
// Variants
// ============================================================================

enum class primitive_kind {
    string,
    number,
    bigint,
    boolean,
    symbol,
    object,
    any,
    unknown,
    null,
    undefined
};

struct primitive_type {
    primitive_kind kind;

    bool operator==(const primitive_type&) const = default;
};

/// Exact value of a literal type: string, number or boolean
using literal_value = std::variant<std::string, double, bool>;

struct literal {
    literal_value value;

    bool operator==(const literal&) const = default;
};

/// Unresolved reference to a named declaration (pre-instantiation only)
struct type_ref {
    std::string name;
    std::vector<type> parameters;

    bool operator==(const type_ref&) const = default;
};

/// Indirection into the instantiation memo
struct instantiated_type {
    std::string key;

    bool operator==(const instantiated_type&) const = default;
};

/// Placeholder for the Nth type parameter inside a generic body
struct generic_type {
    std::size_t index;

    bool operator==(const generic_type&) const = default;
};

struct property_signature {
    std::string key;
    bool optional;
    type value;

    bool operator==(const property_signature&) const = default;
};

/// Structural object shape
struct object_pattern {
    std::vector<property_signature> properties;  ///< Declaration order
    std::optional<type> string_indexer;          ///< [key: string]: T
    std::optional<type> number_indexer;          ///< [index: number]: T

    bool operator==(const object_pattern&) const = default;
};

/// Named alias declaration.
/// `defaults` are trailing: default i applies to parameter
/// parameter_count - defaults.size() + i.
struct type_alias {
    type value;
    std::size_t parameter_count;
    std::vector<type> defaults;

    bool operator==(const type_alias&) const = default;
};

/// Named nominal declaration; same parameter rules as type_alias
struct interface_decl {
    object_pattern body;
    std::size_t parameter_count;
    std::vector<type> defaults;

    bool operator==(const interface_decl&) const = default;
};

enum class builtin_kind {
    array,
    set,
    map
};

/// Built-in container. Map has two element types (key, value), others one.
struct builtin_type {
    builtin_kind kind;
    std::vector<type> element_types;

    bool operator==(const builtin_type&) const = default;
};

struct tuple {
    std::vector<type> elements;
    std::optional<type> rest;
    std::size_t first_optional_index;  ///< Positions >= this index may be omitted

    bool operator==(const tuple&) const = default;
};

struct union_type {
    std::vector<type> members;  ///< At least two

    bool operator==(const union_type&) const = default;
};

struct intersection {
    std::vector<type> members;  ///< At least two

    bool operator==(const intersection&) const = default;
};

/// The empty type: no runtime value satisfies it. Absorbing and terminal.
struct failed_intersection {
    bool operator==(const failed_intersection&) const = default;
};

using node_variant = std::variant<
    primitive_type,
    literal,
    type_ref,
    instantiated_type,
    generic_type,
    type_alias,
    interface_decl,
    object_pattern,
    builtin_type,
    tuple,
    union_type,
    intersection,
    failed_intersection
>;

struct node {
    node_variant value;
};

template <typename T>
bool type::is() const {
    return std::holds_alternative<T>(node_->value);
}

template <typename T>
const T* type::as() const {
    return std::get_if<T>(&node_->value);
}

// ============================================================================
// Tables
// ============================================================================

/// Declared type name -> declaration (type_alias, interface_decl or builtin_type)
using type_table = std::map<std::string, type>;

/// Canonical key -> number of references
using usage_stats = std::map<std::string, std::size_t>;

/// One instantiation memo entry
struct type_info {
    usage_stats stats;      ///< References made by the instantiated body
    type value;             ///< Instantiated body
    bool circular = false;  ///< Body reaches its own key: emit as named function
};

/// Canonical key -> instantiated declaration
using instantiation_memo = std::map<std::string, type_info>;

// ============================================================================
// Constructors
// ============================================================================

type make_primitive(primitive_kind kind);

/// Throws internal_error if `name` is not a primitive type name
type make_primitive(const std::string& name);

type make_literal(std::string value);
type make_literal(const char* value);
type make_literal(double value);
type make_literal(bool value);

type make_type_ref(std::string name, std::vector<type> parameters = {});
type make_instantiated(std::string key);
type make_generic(std::size_t index);

type make_alias(type value, std::size_t parameter_count = 0, std::vector<type> defaults = {});
type make_interface(object_pattern body, std::size_t parameter_count = 0, std::vector<type> defaults = {});

property_signature make_property(std::string key, type value, bool optional = false);
type make_object(std::vector<property_signature> properties,
                 std::optional<type> string_indexer = std::nullopt,
                 std::optional<type> number_indexer = std::nullopt);

/// Throws internal_error on a wrong element count for `kind`
type make_builtin(builtin_kind kind, std::vector<type> element_types);
type make_array(type element);
type make_set(type element);
type make_map(type key, type value);

/// All elements required
type make_tuple(std::vector<type> elements);
type make_tuple(std::vector<type> elements, std::optional<type> rest, std::size_t first_optional_index);

/// Throw internal_error with fewer than two members
type make_union(std::vector<type> members);
type make_intersection(std::vector<type> members);

type make_failed_intersection();

// ============================================================================
// Names
// ============================================================================

const char* primitive_kind_name(primitive_kind kind);
std::optional<primitive_kind> parse_primitive_kind(const std::string& name);

const char* builtin_kind_name(builtin_kind kind);

/// Variant tag as used in diagnostics ("alias", "interface", "union", ...)
const char* kind_name(const type& t);

} // namespace typeshape::ir
