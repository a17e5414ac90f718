/**
 * @file snippet_validator.hpp
 * @brief Static checks applied to a snippet before it runs
 *
 * The snippet is parsed with the interpreter's own parser and its syntax
 * tree is walked once. Rejected:
 *
 * - `import` and `from ... import` statements
 * - attribute names starting with `_` (`x.__class__`, `x._private`)
 * - frame, code and generator introspection attributes (`gi_frame`,
 *   `f_globals`, `tb_frame`, `mro`, ...)
 * - identifiers, function names and parameters starting with `__`
 * - `.format` / `.format_map` anywhere but on a string literal, and on
 *   literals whose fields look up attributes or items (`'{0.gi_frame}'`)
 *
 * Requires a running interpreter.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace snipbox {
namespace env {

/**
 * @brief Validate a snippet
 *
 * @param code Snippet source
 *
 * @throws SnippetError with the syntax error or the first rejected construct,
 *         e.g. "ValidationError: import statements are not allowed (line 1)"
 * @throws InterpreterError if the parser cannot be loaded
 */
void ValidateSnippet(const std::string& code);

} // namespace env
} // namespace snipbox
