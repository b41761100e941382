//
// Error messages and codes
//

#include <typeshape/errors.hh>

namespace typeshape {

const char* error_kind_name(error_kind kind) {
    switch (kind) {
        case error_kind::unregistered_type:
            return "UnregisteredType";
        case error_kind::type_does_not_accept_generic_parameters:
            return "TypeDoesNotAcceptGenericParameters";
        case error_kind::type_parameter_count:
            return "TypeParameterCount";
        case error_kind::tuple_shape_mismatch:
            return "TupleShapeMismatch";
        case error_kind::circular_intersection:
            return "CircularIntersection";
        case error_kind::depth_limit_exceeded:
            return "DepthLimitExceeded";
    }
    throw internal_error("unknown error kind");
}

type_error::type_error(error_kind kind, const std::string& type_name, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind)
    , type_name_(type_name)
{
}

const char* type_error::code() const {
    switch (kind_) {
        case error_kind::unregistered_type:
            return diag_codes::E_UNREGISTERED_TYPE;
        case error_kind::type_does_not_accept_generic_parameters:
            return diag_codes::E_NO_GENERIC_PARAMETERS;
        case error_kind::type_parameter_count:
            return diag_codes::E_PARAM_COUNT_MISMATCH;
        case error_kind::tuple_shape_mismatch:
            return diag_codes::E_TUPLE_SHAPE;
        case error_kind::circular_intersection:
            return diag_codes::E_CIRCULAR_INTERSECTION;
        case error_kind::depth_limit_exceeded:
            return diag_codes::E_DEPTH_LIMIT;
    }
    throw internal_error("unknown error kind");
}

unregistered_type_error::unregistered_type_error(const std::string& type_name)
    : type_error(error_kind::unregistered_type, type_name,
                 "Type '" + type_name + "' has not been registered")
{
}

type_does_not_accept_generic_parameters_error::type_does_not_accept_generic_parameters_error(
    const std::string& type_name,
    const std::string& actual_kind)
    : type_error(error_kind::type_does_not_accept_generic_parameters, type_name,
                 "Type '" + type_name + "' is a " + actual_kind +
                 " and does not accept type parameters")
    , actual_kind_(actual_kind)
{
}

namespace {
    std::string format_count_message(const std::string& type_name,
                                     std::size_t expected_min,
                                     std::size_t expected_max,
                                     std::size_t provided) {
        std::string expected = std::to_string(expected_max);
        if (expected_min != expected_max) {
            expected = std::to_string(expected_min) + " to " + expected;
        }
        return "Type '" + type_name + "' expects " + expected +
               " type parameter(s) but " + std::to_string(provided) + " were provided";
    }
}

type_parameter_count_error::type_parameter_count_error(const std::string& type_name,
                                                       std::size_t expected_min,
                                                       std::size_t expected_max,
                                                       std::size_t provided)
    : type_error(error_kind::type_parameter_count, type_name,
                 format_count_message(type_name, expected_min, expected_max, provided))
{
}

tuple_shape_error::tuple_shape_error(const std::string& message)
    : type_error(error_kind::tuple_shape_mismatch, "", message)
{
}

circular_intersection_error::circular_intersection_error(const std::string& type_name)
    : type_error(error_kind::circular_intersection, type_name,
                 "Intersection with '" + type_name + "' depends on its own result")
{
}

depth_limit_error::depth_limit_error(const std::string& type_name, std::size_t limit)
    : type_error(error_kind::depth_limit_exceeded, type_name,
                 "Type '" + type_name + "' nests deeper than the limit of " +
                 std::to_string(limit))
{
}

} // namespace typeshape
