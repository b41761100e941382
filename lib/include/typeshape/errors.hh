//
// Errors raised by the typeshape passes.
//
// Two disjoint tiers:
//   type_error      - the input declarations are wrong. Aborts the affected
//                     type only; the pipeline turns it into a diagnostic.
//   internal_error  - an IR shape the passes should never see. Always a
//                     defect, never caught by the library.
//

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace typeshape {

/// Diagnostic codes, stable across versions.
///
/// - E001-E009: Symbol errors
/// - E010-E019: Type errors
/// - E030-E039: Dependency errors
/// - E060-E069: Resource limits
namespace diag_codes {
    constexpr const char* E_UNREGISTERED_TYPE = "E001";           ///< Reference to an undeclared type
    constexpr const char* E_TUPLE_SHAPE = "E012";                 ///< Tuples cannot be intersected
    constexpr const char* E_NO_GENERIC_PARAMETERS = "E015";       ///< Declaration kind takes no type parameters
    constexpr const char* E_PARAM_COUNT_MISMATCH = "E016";        ///< Wrong number of type parameters
    constexpr const char* E_CIRCULAR_INTERSECTION = "E031";       ///< Intersection operand depends on its own result
    constexpr const char* E_DEPTH_LIMIT = "E060";                 ///< Nesting exceeds compile_options::max_depth
}

enum class error_kind {
    unregistered_type,
    type_does_not_accept_generic_parameters,
    type_parameter_count,
    tuple_shape_mismatch,
    circular_intersection,
    depth_limit_exceeded
};

const char* error_kind_name(error_kind kind);

/// Base of all user-facing errors
class type_error : public std::runtime_error {
public:
    type_error(error_kind kind, const std::string& type_name, const std::string& message);

    [[nodiscard]] error_kind kind() const { return kind_; }
    [[nodiscard]] const char* code() const;
    [[nodiscard]] const std::string& type_name() const { return type_name_; }

private:
    error_kind kind_;
    std::string type_name_;
};

class unregistered_type_error : public type_error {
public:
    explicit unregistered_type_error(const std::string& type_name);
};

class type_does_not_accept_generic_parameters_error : public type_error {
public:
    type_does_not_accept_generic_parameters_error(const std::string& type_name,
                                                  const std::string& actual_kind);

    [[nodiscard]] const std::string& actual_kind() const { return actual_kind_; }

private:
    std::string actual_kind_;
};

class type_parameter_count_error : public type_error {
public:
    type_parameter_count_error(const std::string& type_name,
                               std::size_t expected_min,
                               std::size_t expected_max,
                               std::size_t provided);
};

class tuple_shape_error : public type_error {
public:
    explicit tuple_shape_error(const std::string& message);
};

class circular_intersection_error : public type_error {
public:
    explicit circular_intersection_error(const std::string& type_name);
};

class depth_limit_error : public type_error {
public:
    depth_limit_error(const std::string& type_name, std::size_t limit);
};

/// Violated internal invariant. Not a type_error on purpose: it must reach
/// the top of the run unchanged.
class internal_error : public std::logic_error {
public:
    explicit internal_error(const std::string& message)
        : std::logic_error("internal error: " + message) {}
};

} // namespace typeshape
