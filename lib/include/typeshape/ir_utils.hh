//
// IR traversal and helpers shared by the passes
//

#pragma once

#include <typeshape/ir.hh>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace typeshape::ir {

// ============================================================================
// Traversal
// ============================================================================

using node_predicate = std::function<bool(const type&)>;
using node_transform = std::function<type(const type&)>;

/// Rebuild `t` with `fn` applied to each direct child. Leaves are returned
/// unchanged. Declaration defaults count as children.
type map_children(const type& t, const node_transform& fn);

/// Top-down rewrite: a node matching `matches` is replaced by `fn(node)`
/// and its subtree is not visited further; other nodes are rebuilt from
/// their rewritten children.
type transform(const type& t, const node_predicate& matches, const node_transform& fn);

/// True if any node in `t` (including `t`) satisfies `pred`
bool contains_node(const type& t, const node_predicate& pred);

// ============================================================================
// Type parameters
// ============================================================================

/// Replace every generic_type(i) in `body` with parameters[i].
/// Throws internal_error for an index past the end.
type substitute_generics(const type& body, const std::vector<type>& parameters);

/// True for declaration kinds that can be referenced with type parameters
bool accepts_type_parameters(const type& declaration);

/// Instantiate a declaration body with the given parameters.
///
/// Missing trailing parameters take their declared defaults (which may
/// refer to earlier parameters). Returns the alias value, the interface
/// body as an object pattern, or the builtin with substituted elements.
///
/// @throws type_does_not_accept_generic_parameters_error for other kinds
/// @throws type_parameter_count_error on too many / too few parameters
type apply_type_parameters(const type& declaration,
                           const std::string& type_name,
                           const std::vector<type>& provided);

/// Canonical memo key of a reference: "Name" or "Name<P1, P2>"
std::string type_key(const type_ref& ref);

// ============================================================================
// Disjointness classification
// ============================================================================

/// Mutually exclusive runtime value categories
enum class disjoint_kind {
    array,
    boolean,
    number,
    bigint,
    string,
    symbol,
    null,
    undefined,
    object,
    map,
    set
};

const char* disjoint_kind_name(disjoint_kind kind);

struct hierarchy_info {
    bool is_anything = false;              ///< any / unknown
    std::optional<disjoint_kind> disjoint; ///< Empty for unclassifiable shapes
};

/// Classify a dereferenced, flattened operand of an intersection
hierarchy_info classify(const type& t);

// ============================================================================
// Builtins
// ============================================================================

/// Declare Array, ReadonlyArray, Set, ReadonlySet, Map and ReadonlyMap.
/// Existing entries with the same names are kept.
void register_builtins(type_table& table);

} // namespace typeshape::ir
