//
// IR model: constructors, invariants, structural equality
//

#include <doctest/doctest.h>
#include <typeshape/ir.hh>
#include <typeshape/errors.hh>

using namespace typeshape;
using namespace typeshape::ir;

TEST_SUITE("IR - Model") {

    TEST_CASE("Structurally equal trees compare equal") {
        type a = make_object({make_property("x", make_primitive(primitive_kind::number)),
                              make_property("y", make_array(make_literal("a")), true)});
        type b = make_object({make_property("x", make_primitive(primitive_kind::number)),
                              make_property("y", make_array(make_literal("a")), true)});

        CHECK(a == b);
        CHECK(&a.get() != &b.get());
    }

    TEST_CASE("Differences anywhere in the tree break equality") {
        type base = make_object({make_property("x", make_primitive(primitive_kind::number))});

        CHECK_FALSE(base == make_object({make_property("x", make_primitive(primitive_kind::string))}));
        CHECK_FALSE(base == make_object({make_property("x", make_primitive(primitive_kind::number), true)}));
        CHECK_FALSE(base == make_object({make_property("z", make_primitive(primitive_kind::number))}));
        CHECK_FALSE(base == make_object({make_property("x", make_primitive(primitive_kind::number))},
                                        make_primitive(primitive_kind::string)));
    }

    TEST_CASE("Literal values of different kinds are distinct") {
        CHECK(make_literal("1") == make_literal("1"));
        CHECK(make_literal(1.0) == make_literal(1.0));
        CHECK_FALSE(make_literal("1") == make_literal(1.0));
        CHECK_FALSE(make_literal(true) == make_literal(1.0));
        CHECK_FALSE(make_literal(true) == make_literal(false));
    }

    TEST_CASE("Copies share the node") {
        type a = make_union({make_primitive(primitive_kind::string), make_primitive(primitive_kind::null)});
        type b = a;

        CHECK(&a.get() == &b.get());
        CHECK(a == b);
    }

    TEST_CASE("Union and intersection need two members") {
        CHECK_THROWS_AS(make_union({}), internal_error);
        CHECK_THROWS_AS(make_union({make_primitive(primitive_kind::string)}), internal_error);
        CHECK_THROWS_AS(make_intersection({make_primitive(primitive_kind::string)}), internal_error);

        CHECK_NOTHROW(make_union({make_literal("a"), make_literal("b")}));
        CHECK_NOTHROW(make_intersection({make_literal("a"), make_literal("b")}));
    }

    TEST_CASE("Builtins check their element count") {
        CHECK_THROWS_AS(make_builtin(builtin_kind::map, {make_primitive(primitive_kind::string)}), internal_error);
        CHECK_THROWS_AS(make_builtin(builtin_kind::array, {}), internal_error);

        type m = make_map(make_primitive(primitive_kind::string), make_primitive(primitive_kind::number));
        REQUIRE(m.is<builtin_type>());
        CHECK(m.as<builtin_type>()->kind == builtin_kind::map);
        CHECK(m.as<builtin_type>()->element_types.size() == 2);
    }

    TEST_CASE("Declarations reject more defaults than parameters") {
        CHECK_THROWS_AS(make_alias(make_generic(0), 1,
                                   {make_primitive(primitive_kind::string), make_primitive(primitive_kind::number)}),
                        internal_error);
        CHECK_THROWS_AS(make_interface(object_pattern{}, 0, {make_primitive(primitive_kind::string)}),
                        internal_error);
    }

    TEST_CASE("Tuple without explicit optional index has all elements required") {
        type t = make_tuple({make_primitive(primitive_kind::string), make_primitive(primitive_kind::number)});
        REQUIRE(t.is<tuple>());
        CHECK(t.as<tuple>()->first_optional_index == 2);
        CHECK_FALSE(t.as<tuple>()->rest.has_value());

        std::vector<type> elements = t.as<tuple>()->elements;
        CHECK(ir::make_tuple(elements) == t);
        CHECK(ir::make_tuple(elements, std::nullopt, 2) == t);
    }

    TEST_CASE("Accessors") {
        type g = make_generic(3);

        CHECK(g.is<generic_type>());
        CHECK_FALSE(g.is<type_ref>());
        CHECK(g.as<type_ref>() == nullptr);
        REQUIRE(g.as<generic_type>() != nullptr);
        CHECK(g.as<generic_type>()->index == 3);
    }

    TEST_CASE("Primitive names") {
        CHECK(std::string(primitive_kind_name(primitive_kind::bigint)) == "bigint");
        CHECK(parse_primitive_kind("undefined") == primitive_kind::undefined);
        CHECK_FALSE(parse_primitive_kind("Array").has_value());

        CHECK(make_primitive("string") == make_primitive(primitive_kind::string));
        CHECK_THROWS_AS(make_primitive("Node"), internal_error);
    }

    TEST_CASE("Kind names") {
        CHECK(std::string(kind_name(make_primitive(primitive_kind::any))) == "primitiveType");
        CHECK(std::string(kind_name(make_literal(2.0))) == "literal");
        CHECK(std::string(kind_name(make_type_ref("A"))) == "type");
        CHECK(std::string(kind_name(make_instantiated("A"))) == "instantiatedType");
        CHECK(std::string(kind_name(make_generic(0))) == "genericType");
        CHECK(std::string(kind_name(make_alias(make_literal("a")))) == "alias");
        CHECK(std::string(kind_name(make_interface(object_pattern{}))) == "interface");
        CHECK(std::string(kind_name(make_object({}))) == "objectPattern");
        CHECK(std::string(kind_name(make_set(make_literal("a")))) == "builtinType");
        CHECK(std::string(kind_name(make_tuple({}))) == "tuple");
        CHECK(std::string(kind_name(make_union({make_literal("a"), make_literal("b")}))) == "union");
        CHECK(std::string(kind_name(make_intersection({make_literal("a"), make_literal("b")}))) == "intersection");
        CHECK(std::string(kind_name(make_failed_intersection())) == "failedIntersection");
    }
}
