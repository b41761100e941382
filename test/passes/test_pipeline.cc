//
// Full compilation pipeline
//

#include <doctest/doctest.h>
#include <typeshape/passes.hh>
#include <typeshape/ir_printer.hh>
#include <sstream>

using namespace typeshape;
using namespace typeshape::ir;

namespace {
    type str() { return make_primitive(primitive_kind::string); }
    type num() { return make_primitive(primitive_kind::number); }

    type node_interface() {
        object_pattern body;
        body.properties.push_back(make_property("value", make_generic(0)));
        body.properties.push_back(make_property("next", make_type_ref("Node", {make_generic(0)}), true));
        return make_interface(body, 1);
    }

    const diagnostic* find_diagnostic(const compile_result& result, const std::string& type_name) {
        for (const auto& d : result.diagnostics) {
            if (d.type_name == type_name) return &d;
        }
        return nullptr;
    }
}

TEST_SUITE("Passes - Pipeline") {

    TEST_CASE("Linked list compiles with a circular entry") {
        type_table table;
        table.emplace("Node", node_interface());
        table.emplace("NumberList", make_alias(make_type_ref("Node", {num()})));

        compile_result result = compile(table);

        CHECK(result.diagnostics.empty());
        CHECK(result.types.size() == 1);
        CHECK(to_string(result.types.at("NumberList")) == "Node<number>");

        REQUIRE(result.memo.contains("Node<number>"));
        CHECK(result.memo.at("Node<number>").circular);
        CHECK(result.emit_as_function("Node<number>"));
        CHECK(to_string(result.instances.at("Node<number>")) == "{value: number; next?: Node<number>}");
    }

    TEST_CASE("Generic declarations are not roots by default") {
        type_table table;
        table.emplace("Node", node_interface());
        table.emplace("Name", make_alias(str()));

        compile_result result = compile(table);

        CHECK(result.types.size() == 1);
        CHECK(result.types.at("Name") == str());
        CHECK_FALSE(result.types.contains("Array"));
    }

    TEST_CASE("Requested roots only") {
        type_table table;
        table.emplace("A", make_alias(str()));
        table.emplace("B", make_alias(num()));

        compile_options opts;
        opts.roots = {"B"};
        compile_result result = compile(table, opts);

        CHECK(result.types.size() == 1);
        CHECK(result.types.at("B") == num());
    }

    TEST_CASE("Intersections are solved through the memo") {
        type_table table;
        table.emplace("Named", make_interface(object_pattern{{make_property("name", str())}, {}, {}}));
        table.emplace("Aged", make_interface(object_pattern{{make_property("age", num())}, {}, {}}));
        table.emplace("Person", make_alias(make_intersection({make_type_ref("Named"), make_type_ref("Aged")})));

        compile_options opts;
        opts.roots = {"Person"};
        compile_result result = compile(table, opts);

        CHECK(result.diagnostics.empty());
        CHECK(to_string(result.types.at("Person")) == "{name: string; age: number}");
        CHECK(result.instances.contains("Named"));
        CHECK(result.instances.contains("Aged"));
    }

    TEST_CASE("A type intersected with itself in a property") {
        object_pattern node;
        node.properties.push_back(make_property("value", num()));
        node.properties.push_back(make_property(
            "next", make_union({make_intersection({make_type_ref("Node"), make_type_ref("Tagged")}),
                                make_primitive(primitive_kind::null)})));

        type_table table;
        table.emplace("Node", make_interface(node));
        table.emplace("Tagged", make_interface(object_pattern{{make_property("tag", str())}, {}, {}}));

        compile_options opts;
        opts.roots = {"Node"};
        compile_result result = compile(table, opts);

        CHECK(result.diagnostics.empty());
        REQUIRE(result.types.contains("Node"));
        CHECK(to_string(result.types.at("Node")) ==
              "{value: number; next: {value: number; next: (Node & Tagged) | null; tag: string} | null}");
    }

    TEST_CASE("Shared entries are emitted as functions") {
        object_pattern box;
        box.properties.push_back(make_property("value", make_generic(0)));

        type_table table;
        table.emplace("Box", make_interface(box, 1));
        table.emplace("Pair", make_alias(make_tuple({make_type_ref("Box", {str()}), make_type_ref("Box", {str()})})));

        compile_result result = compile(table);

        CHECK(result.usage.at("Box<string>") == 2);
        CHECK(result.emit_as_function("Box<string>"));
        CHECK_FALSE(result.emit_as_function("Pair"));
        CHECK_FALSE(result.emit_as_function("Unknown"));
    }

    TEST_CASE("A failing type does not stop the others") {
        type_table table;
        table.emplace("Bad", make_alias(make_array(make_type_ref("Missing"))));
        table.emplace("Shape", make_alias(make_intersection({make_tuple({num()}), make_tuple({num(), str()})})));
        table.emplace("Good", make_alias(make_array(str())));

        compile_result result = compile(table);

        CHECK(result.error_count() == 2);
        CHECK(result.types.size() == 1);
        CHECK(result.types.at("Good") == make_array(str()));

        const diagnostic* bad = find_diagnostic(result, "Bad");
        REQUIRE(bad != nullptr);
        CHECK(bad->code == "E001");

        const diagnostic* shape = find_diagnostic(result, "Shape");
        REQUIRE(shape != nullptr);
        CHECK(shape->code == "E012");
    }

    TEST_CASE("Stop on first error") {
        type_table table;
        table.emplace("A", make_alias(make_intersection({make_tuple({num()}), make_tuple({num(), str()})})));
        table.emplace("B", make_alias(make_intersection({make_tuple({str()}), make_tuple({num()})})));
        table.emplace("C", make_alias(str()));

        compile_options opts;
        opts.stop_on_first_error = true;
        compile_result result = compile(table, opts);

        CHECK(result.error_count() == 1);
        CHECK(result.diagnostics.front().type_name == "A");
        CHECK(result.types.empty());
    }

    TEST_CASE("Unknown requested root") {
        type_table table;
        table.emplace("A", make_alias(str()));

        compile_options opts;
        opts.roots = {"A", "Nope"};
        compile_result result = compile(table, opts);

        REQUIRE(result.error_count() == 1);
        CHECK(result.diagnostics[0].type_name == "Nope");
        CHECK(result.diagnostics[0].code == "E001");
        CHECK(result.types.contains("A"));
    }

    TEST_CASE("A type without values is a warning") {
        type_table table;
        table.emplace("Impossible", make_alias(make_intersection({str(), num()})));

        compile_result result = compile(table);

        CHECK_FALSE(result.has_errors());
        REQUIRE(result.warning_count() == 1);
        CHECK(result.diagnostics[0].code == "W001");
        CHECK(result.types.at("Impossible") == make_failed_intersection());
    }

    TEST_CASE("Warnings as errors") {
        type_table table;
        table.emplace("Impossible", make_alias(make_intersection({str(), num()})));

        compile_options opts;
        opts.warnings_as_errors = true;
        compile_result result = compile(table, opts);

        CHECK(result.has_errors());
        CHECK_FALSE(result.has_warnings());
    }

    TEST_CASE("Disabled warnings are dropped") {
        type_table table;
        table.emplace("Impossible", make_alias(make_intersection({str(), num()})));

        compile_options opts;
        opts.disabled_warnings = {"W001"};
        opts.warnings_as_errors = true;
        compile_result result = compile(table, opts);

        CHECK(result.diagnostics.empty());
    }

    TEST_CASE("Internal errors propagate") {
        type_table table;
        table.emplace("X", make_literal("x"));
        table.emplace("A", make_alias(make_type_ref("X")));

        CHECK_THROWS_AS(compile(table), internal_error);
    }

    TEST_CASE("Diagnostics are printed with a summary") {
        type_table table;
        table.emplace("Bad", make_alias(make_type_ref("Missing")));
        table.emplace("Impossible", make_alias(make_intersection({str(), num()})));

        compile_result result = compile(table);

        std::ostringstream out;
        result.print_diagnostics(out);

        CHECK(out.str().find("Bad: error: Type 'Missing' has not been registered [E001]") != std::string::npos);
        CHECK(out.str().find("Impossible: warning: Type 'Impossible' has no possible value [W001]") !=
              std::string::npos);
        CHECK(out.str().find("1 error, 1 warning generated.") != std::string::npos);
    }
}
