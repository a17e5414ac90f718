/**
 * @file errors.hpp
 * @brief Exceptions raised while preparing or running a snippet
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>

namespace snipbox {
namespace env {

/**
 * @class SnippetError
 * @brief The caller's code failed
 *
 * Syntax errors, rejected constructs, uncaught runtime exceptions and
 * results that cannot be represented as JSON. what() is the text relayed
 * to the caller, e.g. "ZeroDivisionError: division by zero (line 3)".
 */
class SnippetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class InterpreterError
 * @brief The embedded interpreter could not be started or configured
 */
class InterpreterError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace env
} // namespace snipbox
