//
// Renders IR as TypeScript-like text.
//
// The rendering is deterministic and is the serialization used for
// canonical instantiation keys, so two structurally equal types always
// print identically.
//
// Examples:
//   Node<number>
//   {value: number; next?: Node<number>; [key: string]: unknown}
//   [string, number?, ...boolean]
//   Map<string, Array<number>>
//   "a" | 1 | true
//

#pragma once

#include <typeshape/ir.hh>
#include <iosfwd>
#include <string>

namespace typeshape::ir {

/// Render a type
std::string to_string(const type& t);

/// Render a literal value the way it appears inside a type ("a", 1.5, true)
std::string to_string(const literal_value& value);

std::ostream& operator<<(std::ostream& os, const type& t);

} // namespace typeshape::ir
