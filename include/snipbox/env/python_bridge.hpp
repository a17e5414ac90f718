/**
 * @file python_bridge.hpp
 * @brief Conversions between interpreter objects and snipbox values
 *
 * Internal to the env module. Includes <Python.h>, so it must be the first
 * include of any translation unit that uses it.
 *
 * **Conventions**:
 * - Functions returning PyRef return an empty PyRef with a Python exception
 *   set on failure; they are called from inside interpreter callbacks.
 * - Functions returning C++ values throw SnippetError on failure; they are
 *   called from C++ code after the snippet ran.
 *
 * @date 2025
 */

#pragma once

#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include "snipbox/store/readonly_store.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace snipbox {
namespace env {

/// Filename the interpreter reports for snippet frames
constexpr const char* kSnippetFilename = "<snippet>";

/**
 * @class PyRef
 * @brief Owning reference to an interpreter object
 *
 * Takes over a new reference on construction and releases it on
 * destruction. Use Borrow() for borrowed references.
 */
class PyRef {
public:
    PyRef() = default;
    explicit PyRef(PyObject* object) : object_(object) {}

    static PyRef Borrow(PyObject* object) {
        Py_XINCREF(object);
        return PyRef(object);
    }

    ~PyRef() { Py_XDECREF(object_); }

    PyRef(PyRef&& other) noexcept : object_(std::exchange(other.object_, nullptr)) {}

    PyRef& operator=(PyRef&& other) noexcept {
        if (this != &other) {
            Py_XDECREF(object_);
            object_ = std::exchange(other.object_, nullptr);
        }
        return *this;
    }

    PyRef(const PyRef&) = delete;
    PyRef& operator=(const PyRef&) = delete;

    PyObject* get() const { return object_; }
    PyObject* release() { return std::exchange(object_, nullptr); }
    explicit operator bool() const { return object_ != nullptr; }

private:
    PyObject* object_{nullptr};
};

/**
 * @brief Fetch and clear the pending Python exception as caller-facing text
 *
 * Format: "<Type>: <message> (line N)", where N is the innermost snippet
 * line when the traceback reaches into the snippet. Syntax errors already
 * carry their location in the message and get no suffix.
 *
 * @return Description, or "unknown error" when no exception is pending
 */
std::string FetchErrorDescription();

/**
 * @brief Encode a str object as UTF-8, replacing unencodable code points
 * @return Encoded text, or an empty string for non-str objects
 */
std::string ToUtf8(PyObject* text);

/***************************************************************************
 * Interpreter-facing conversions (empty PyRef + exception on failure)
 ***************************************************************************/

PyRef JsonToPython(const nlohmann::ordered_json& value);
PyRef SqlValueToPython(const store::SqlValue& value);
/// Row as a dict in column order; a repeated column name keeps its first value
PyRef RowToDict(const store::Row& row);

/**
 * @brief Convert a data-access parameter argument
 *
 * list/tuple → positional, dict → named, None/missing → none, anything
 * else → a single positional value.
 *
 * @param params Argument object (may be nullptr)
 * @param out Converted parameters
 * @return false with TypeError/OverflowError set on unsupported values
 */
bool ToQueryParams(PyObject* params, store::QueryParams& out);

/***************************************************************************
 * C++-facing conversions (throw SnippetError)
 ***************************************************************************/

/**
 * @brief Convert a snippet value to JSON the way json.dumps would
 *
 * tuple/set/frozenset become arrays; dict keys of type str, int, float,
 * bool and None are stringified; everything else is rejected.
 *
 * @throws SnippetError for values that have no JSON representation
 */
nlohmann::ordered_json PythonToJson(PyObject* value);

} // namespace env
} // namespace snipbox
