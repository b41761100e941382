//
// YAML front-end and result writer
//
// Declaration files:
//
//   types:
//     Node:
//       kind: interface
//       parameters: [T]
//       properties:
//         value: T
//         next?: {ref: Node, args: [T]}
//     MaybeNumber:
//       kind: alias
//       type: {union: [number, null]}
//   roots: [Node]
//

#pragma once

#include <typeshape/ir.hh>
#include <typeshape/passes.hh>
#include <stdexcept>
#include <string>
#include <vector>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace typeshape::yaml {

/**
 * Malformed declaration file.
 *
 * The context names where in the document the problem is, for example
 * "types.Node.properties.next".
 */
class yaml_error : public std::runtime_error {
public:
    yaml_error(const std::string& context, const std::string& message)
        : std::runtime_error(context.empty() ? message : context + ": " + message)
        , context_(context) {}

    const std::string& context() const { return context_; }

private:
    std::string context_;
};

/// Declarations read from one or more files
struct declaration_set {
    ir::type_table types;
    std::vector<std::string> roots;  ///< Requested types, in file order
};

/**
 * Build declarations from a parsed YAML document.
 *
 * @throws yaml_error on malformed declarations
 */
declaration_set build_declarations(const fkyaml::node& root);

/// Parse YAML text and build declarations
/// @throws yaml_error on syntax errors and malformed declarations
declaration_set load_declarations(const std::string& text);

/// @throws std::runtime_error if the file cannot be read
/// @throws yaml_error on syntax errors and malformed declarations
declaration_set load_declarations_file(const std::string& path);

/// Add `from` to `into`
/// @throws yaml_error if a type name is declared twice
void merge_declarations(declaration_set& into, const declaration_set& from);

/// Render a compile result as a YAML document (types, instances, diagnostics)
fkyaml::node result_to_yaml(const compile_result& result);

/// Serialized form of result_to_yaml()
std::string write_result(const compile_result& result);

} // namespace typeshape::yaml
