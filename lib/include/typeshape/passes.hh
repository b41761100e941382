//
// Type-algebra passes for typeshape
//
// Turns a table of declared types into canonical, fully instantiated IR
// ready for validator generation.
//
// PASSES:
//   1. Resolution     - Inline non-structural aliases, keep nominal references
//   2. Instantiation  - Expand parameterized references into memo entries
//   3. Flatten        - Normalize union / intersection operand lists
//   4. Intersections  - Reduce every intersection to one type or `never`
//
// USAGE EXAMPLE:
//   ir::type_table types = load_declarations_file("types.yaml").types;
//
//   compile_options opts;
//   opts.roots = {"Node"};
//
//   auto result = compile(types, opts);
//
//   if (result.has_errors()) {
//       result.print_diagnostics(std::cerr);
//       return 1;
//   }
//
//   const ir::type& node = result.types.at("Node");
//   bool named = result.emit_as_function("Node");
//

#pragma once

#include <typeshape/ir.hh>
#include <typeshape/errors.hh>
#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace typeshape {

/// Default recursion ceiling shared by all passes
constexpr std::size_t DEFAULT_MAX_DEPTH = 512;

// ============================================================================
// Diagnostics
// ============================================================================

enum class diagnostic_level {
    error,      ///< The type could not be compiled
    warning     ///< The type compiled but is suspicious
};

namespace diag_codes {
    constexpr const char* W_EMPTY_TYPE = "W001";  ///< Type has no possible value (solves to never)
}

/// A diagnostic about one requested type
struct diagnostic {
    diagnostic_level level;
    std::string code;       ///< E001, W001, ...
    std::string type_name;  ///< Requested type the diagnostic belongs to
    std::string message;

    /// Format as "Name: error: message [E001]"
    std::string format() const;
};

// ============================================================================
// Compilation
// ============================================================================

struct compile_options {
    /// Types to compile. Empty: every declaration without type parameters.
    std::set<std::string> roots;

    /// Recursion ceiling for alias inlining, instantiation and solving
    std::size_t max_depth = DEFAULT_MAX_DEPTH;

    /// Stop after the first type that fails
    bool stop_on_first_error = false;

    bool warnings_as_errors = false;           ///< Report warnings as errors
    std::set<std::string> disabled_warnings;   ///< Warning codes to drop (W001, ...)
};

/// Output of compile(), handed to a validator generator.
struct compile_result {
    /// Requested type name -> solved IR of its body
    std::map<std::string, ir::type> types;

    /// Instantiation memo (unsolved bodies, stats, circular flags)
    ir::instantiation_memo memo;

    /// Total references per memo key across all compiled types
    ir::usage_stats usage;

    /// Memo key -> solved body
    std::map<std::string, ir::type> instances;

    std::vector<diagnostic> diagnostics;

    bool has_errors() const;
    bool has_warnings() const;
    std::size_t error_count() const;
    std::size_t warning_count() const;

    /// Print every diagnostic followed by a summary line
    void print_diagnostics(std::ostream& os) const;

    /// Whether the generator must emit `key` as a named validator function
    /// rather than inline it: circular entries always, shared entries too.
    bool emit_as_function(const std::string& key) const;
};

/// Run all passes over a declaration table.
///
/// Builtin containers are registered first. A type_error aborts only the
/// type being compiled and is recorded as a diagnostic; internal_error
/// propagates.
compile_result compile(ir::type_table declarations, const compile_options& opts = {});

// ============================================================================
// Individual Passes
// ============================================================================

namespace passes {

/// Pass 1: Resolution
///
/// Rewrites every declaration in place. References to aliases whose value
/// is not an object pattern are replaced by the alias body (with type
/// parameters substituted), transitively. References to interfaces,
/// object-pattern aliases, builtins and recursive aliases are kept; only
/// their parameters are resolved. A name already being expanded on the
/// current path is kept as a reference. Idempotent.
///
/// @throws unregistered_type_error for an undeclared name
/// @throws depth_limit_error when alias inlining nests deeper than max_depth
void resolve_all_types(ir::type_table& named_types, std::size_t max_depth = DEFAULT_MAX_DEPTH);

/// Pass 1 with per-declaration error reporting: a declaration that fails
/// keeps its unresolved form and gets an error diagnostic.
///
/// @return names of the declarations that failed
std::set<std::string> resolve_declarations(ir::type_table& named_types,
                                           std::vector<diagnostic>& diagnostics,
                                           std::size_t max_depth = DEFAULT_MAX_DEPTH);

/// Resolve one IR value declared as `type_name` against `named_types`
ir::type resolve_single_type(const ir::type& t,
                             const ir::type_table& named_types,
                             const std::string& type_name,
                             std::size_t max_depth = DEFAULT_MAX_DEPTH);

/// Pass 2: Instantiation state, threaded explicitly through every call
struct instantiation_state {
    const ir::type_table& named_types;   ///< Resolved declarations
    ir::instantiation_memo& memo;        ///< Shared across calls
    ir::usage_stats& stats;              ///< Running reference counts
    std::vector<std::string>& new_keys;  ///< Keys created by this call, in creation order
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
};

/// Pass 2: Instantiation
///
/// Replaces every type_ref in `t` by an instantiated_type indirection and
/// creates a memo entry per distinct canonical key, visiting each
/// declaration body at most once. A key reached again while its own body is
/// being instantiated is a cycle; such keys are flagged circular once the
/// traversal finishes.
///
/// @throws unregistered_type_error, type_does_not_accept_generic_parameters_error,
///         type_parameter_count_error, depth_limit_error
ir::type instantiate(const ir::type& t, instantiation_state& state);

/// Pass 3: Flatten
///
/// Splices nested unions / intersections, removes duplicate operands,
/// drops `never` from unions, makes intersections with `never` `never`,
/// and distributes intersections over unions. Pure.
ir::type flatten(const ir::type& t);

/// Pass 4: Intersection solving.
///
/// Keeps solved memo bodies so that each instantiated operand is solved
/// once per compilation.
class intersection_solver {
public:
    explicit intersection_solver(const ir::instantiation_memo& memo,
                                 std::size_t max_depth = DEFAULT_MAX_DEPTH);

    /// Reduce every intersection in `t` (expects flattened input)
    ir::type solve(const ir::type& t);

    /// Solved body of a memo entry
    /// @throws circular_intersection_error if requested while being solved
    const ir::type& solved_instance(const std::string& key);

    [[nodiscard]] const std::map<std::string, ir::type>& solved_instances() const { return solved_; }

private:
    ir::type reduce(const std::vector<ir::type>& members);
    ir::type prune_union(const std::vector<ir::type>& members);
    ir::type unsolved_instance(const std::string& key);
    ir::type dereference(const ir::type& t, std::optional<std::string>& key);
    ir::type intersect(const ir::type& left, const ir::type& right);
    ir::type intersect_types(const ir::type& left, const ir::type& right);

    ir::type intersect_objects(const ir::object_pattern& left,
                               const ir::object_pattern& right,
                               const std::optional<std::string>& left_key,
                               const std::optional<std::string>& right_key);
    std::optional<ir::type> merge_shared_property(const ir::type& left, const ir::type& right,
                                                  const std::optional<std::pair<std::string, std::string>>& merge_pair);
    ir::type intersect_tuples(const ir::type& left, const ir::type& right);
    ir::type intersect_array_and_tuple(const ir::builtin_type& array, const ir::tuple& t);
    ir::type intersect_arrays(const ir::builtin_type& left, const ir::builtin_type& right);
    ir::type intersect_maps(const ir::builtin_type& left, const ir::builtin_type& right);
    ir::type intersect_sets(const ir::builtin_type& left, const ir::builtin_type& right);

    const ir::instantiation_memo& memo_;
    std::size_t max_depth_;
    std::size_t depth_ = 0;
    std::map<std::string, ir::type> solved_;
    std::vector<std::string> solving_;
    std::vector<std::pair<std::string, std::string>> merging_;
    std::optional<std::pair<std::string, std::string>> broken_cycle_;
};

/// Pass 4: Reduce every intersection in `t`, dereferencing through `memo`
ir::type solve_intersections(const ir::type& t,
                             const ir::instantiation_memo& memo,
                             std::size_t max_depth = DEFAULT_MAX_DEPTH);

} // namespace passes

} // namespace typeshape
