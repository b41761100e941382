//
// Pass 1: Resolution
//

#include <doctest/doctest.h>
#include <typeshape/passes.hh>
#include <typeshape/ir_printer.hh>

using namespace typeshape;
using namespace typeshape::ir;

namespace {
    type str() { return make_primitive(primitive_kind::string); }
    type num() { return make_primitive(primitive_kind::number); }
    type null() { return make_primitive(primitive_kind::null); }

    type alias_value(const type_table& table, const std::string& name) {
        return table.at(name).as<type_alias>()->value;
    }
}

TEST_SUITE("Passes - Resolution") {

    TEST_CASE("Non-structural aliases are inlined transitively") {
        type_table table;
        table.emplace("A", make_alias(make_union({str(), make_type_ref("B")})));
        table.emplace("B", make_alias(make_array(make_type_ref("C"))));
        table.emplace("C", make_alias(num()));

        passes::resolve_all_types(table);

        CHECK(to_string(alias_value(table, "A")) == "string | Array<number>");
        CHECK(to_string(alias_value(table, "B")) == "Array<number>");
    }

    TEST_CASE("Interfaces, object aliases and builtins stay references") {
        type_table table;
        register_builtins(table);
        table.emplace("I", make_interface(object_pattern{}));
        table.emplace("O", make_alias(make_object({make_property("x", num())})));
        table.emplace("A", make_alias(make_tuple({make_type_ref("I"), make_type_ref("O"),
                                                  make_type_ref("Array", {str()})})));

        passes::resolve_all_types(table);

        CHECK(to_string(alias_value(table, "A")) == "[I, O, Array<string>]");
    }

    TEST_CASE("Parameters of kept references are resolved") {
        object_pattern body;
        body.properties.push_back(make_property("value", make_generic(0)));

        type_table table;
        table.emplace("Box", make_interface(body, 1));
        table.emplace("S", make_alias(str()));
        table.emplace("A", make_alias(make_type_ref("Box", {make_type_ref("S")})));

        passes::resolve_all_types(table);

        CHECK(alias_value(table, "A") == make_type_ref("Box", {str()}));
    }

    TEST_CASE("Generic alias parameters are substituted") {
        type_table table;
        table.emplace("Maybe", make_alias(make_union({make_generic(0), null()}), 1));
        table.emplace("A", make_alias(make_type_ref("Maybe", {str()})));

        passes::resolve_all_types(table);

        CHECK(to_string(alias_value(table, "A")) == "string | null");
    }

    TEST_CASE("Defaults apply during inlining") {
        type_table table;
        table.emplace("Pair", make_alias(make_tuple({make_generic(0), make_generic(1)}), 2, {num()}));
        table.emplace("A", make_alias(make_type_ref("Pair", {str()})));

        passes::resolve_all_types(table);

        CHECK(to_string(alias_value(table, "A")) == "[string, number]");
    }

    TEST_CASE("Self reference is kept") {
        type list = make_alias(make_union({null(), make_tuple({num(), make_type_ref("List")})}));

        type_table table;
        table.emplace("List", list);

        passes::resolve_all_types(table);

        CHECK(table.at("List") == list);
    }

    TEST_CASE("Mutually recursive aliases stay references") {
        type a = make_alias(make_union({null(), make_type_ref("B")}));
        type b = make_alias(make_union({str(), make_array(make_type_ref("A"))}));

        type_table table;
        table.emplace("A", a);
        table.emplace("B", b);
        table.emplace("C", make_alias(make_set(make_type_ref("A"))));

        passes::resolve_all_types(table);

        CHECK(table.at("A") == a);
        CHECK(table.at("B") == b);
        CHECK(to_string(alias_value(table, "C")) == "Set<A>");
    }

    TEST_CASE("Recursive generic alias keeps its canonical parameters") {
        type_table table;
        table.emplace("List", make_alias(make_union({null(), make_tuple({make_generic(0), make_type_ref("List", {make_generic(0)})})}), 1));
        table.emplace("S", make_alias(str()));
        table.emplace("Names", make_alias(make_type_ref("List", {make_type_ref("S")})));

        passes::resolve_all_types(table);

        CHECK(alias_value(table, "Names") == make_type_ref("List", {str()}));
    }

    TEST_CASE("Resolution is idempotent") {
        type_table table;
        register_builtins(table);
        table.emplace("A", make_alias(make_union({null(), make_type_ref("B")})));
        table.emplace("B", make_alias(make_union({str(), make_array(make_type_ref("A"))})));
        table.emplace("I", make_interface(object_pattern{{make_property("a", make_type_ref("A"))}, {}, {}}));

        passes::resolve_all_types(table);
        type_table once = table;
        passes::resolve_all_types(table);

        CHECK(table == once);
    }

    TEST_CASE("Each declaration resolves against the original table") {
        type_table table;
        table.emplace("A", make_alias(make_type_ref("B")));
        table.emplace("B", make_alias(make_type_ref("C")));
        table.emplace("C", make_alias(str()));

        passes::resolve_all_types(table);

        CHECK(alias_value(table, "A") == str());
        CHECK(alias_value(table, "B") == str());
    }

    TEST_CASE("Unknown name") {
        type_table table;
        table.emplace("A", make_alias(make_array(make_type_ref("Missing"))));

        try {
            passes::resolve_all_types(table);
            FAIL("expected unregistered_type_error");
        } catch (const unregistered_type_error& e) {
            CHECK(e.type_name() == "Missing");
            CHECK(std::string(e.code()) == "E001");
            CHECK(std::string(e.what()) == "Type 'Missing' has not been registered");
        }
    }

    TEST_CASE("Wrong parameter count on an inlined alias") {
        type_table table;
        table.emplace("Maybe", make_alias(make_union({make_generic(0), null()}), 1));
        table.emplace("A", make_alias(make_type_ref("Maybe", {str(), num()})));

        CHECK_THROWS_AS(passes::resolve_all_types(table), type_parameter_count_error);
    }

    TEST_CASE("A reference to a non-declaration is an internal error") {
        type_table table;
        table.emplace("X", make_literal("x"));
        table.emplace("A", make_alias(make_type_ref("X")));

        CHECK_THROWS_AS(passes::resolve_all_types(table), internal_error);
    }

    TEST_CASE("Alias chains deeper than the limit") {
        type_table table;
        table.emplace("A0", make_alias(make_type_ref("A1")));
        table.emplace("A1", make_alias(make_type_ref("A2")));
        table.emplace("A2", make_alias(make_type_ref("A3")));
        table.emplace("A3", make_alias(str()));

        CHECK_THROWS_AS(passes::resolve_all_types(table, 2), depth_limit_error);

        type_table fits = table;
        CHECK_NOTHROW(passes::resolve_all_types(fits, 8));
        CHECK(alias_value(fits, "A0") == str());
    }

    TEST_CASE("resolve_single_type") {
        type_table table;
        table.emplace("S", make_alias(str()));

        type resolved = passes::resolve_single_type(make_set(make_type_ref("S")), table, "Anonymous");
        CHECK(resolved == make_set(str()));
    }

    TEST_CASE("resolve_declarations reports failures per declaration") {
        type_table table;
        table.emplace("Bad", make_alias(make_array(make_type_ref("Missing"))));
        table.emplace("Good", make_alias(make_type_ref("S")));
        table.emplace("S", make_alias(str()));

        std::vector<diagnostic> diagnostics;
        std::set<std::string> failed = passes::resolve_declarations(table, diagnostics);

        CHECK(failed == std::set<std::string>{"Bad"});
        REQUIRE(diagnostics.size() == 1);
        CHECK(diagnostics[0].level == diagnostic_level::error);
        CHECK(diagnostics[0].code == "E001");
        CHECK(diagnostics[0].type_name == "Bad");

        CHECK(alias_value(table, "Good") == str());
        CHECK(to_string(alias_value(table, "Bad")) == "Array<Missing>");
    }
}
