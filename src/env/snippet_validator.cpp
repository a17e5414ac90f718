/**
 * @file snippet_validator.cpp
 * @brief Syntax tree walk over the snippet
 *
 * @date 2025
 */

#include "snipbox/env/python_bridge.hpp"
#include "snipbox/env/snippet_validator.hpp"
#include "snipbox/env/errors.hpp"

#include <array>
#include <unordered_set>

namespace snipbox {
namespace env {

namespace {

const std::unordered_set<std::string> kDeniedAttributes = {
    "gi_frame", "gi_code", "gi_yieldfrom",
    "cr_frame", "cr_code", "cr_await",
    "ag_frame", "ag_code",
    "f_globals", "f_locals", "f_builtins", "f_back", "f_code",
    "tb_frame", "tb_next",
    "mro"
};

// Node classes of interest, in lookup order
enum NodeKind {
    IMPORT,
    IMPORT_FROM,
    ATTRIBUTE,
    NAME,
    FUNCTION_DEF,
    ASYNC_FUNCTION_DEF,
    ARG,
    NODE_KIND_COUNT
};

constexpr std::array<const char*, NODE_KIND_COUNT> kNodeClassNames = {
    "Import", "ImportFrom", "Attribute", "Name", "FunctionDef", "AsyncFunctionDef", "arg"
};

PyRef GetAttr(PyObject* object, const char* name) {
    PyRef attribute(PyObject_GetAttrString(object, name));
    if (!attribute) {
        throw InterpreterError(FetchErrorDescription());
    }
    return attribute;
}

std::string StringAttr(PyObject* node, const char* name) {
    PyRef value(PyObject_GetAttrString(node, name));
    if (!value) {
        PyErr_Clear();
        return {};
    }
    return ToUtf8(value.get());
}

[[noreturn]] void Reject(const std::string& message, PyObject* node) {
    std::string text = "ValidationError: " + message;

    PyRef lineno(PyObject_GetAttrString(node, "lineno"));
    if (lineno && PyLong_Check(lineno.get())) {
        text += " (line " + std::to_string(PyLong_AsLong(lineno.get())) + ")";
    }
    PyErr_Clear();

    throw SnippetError(text);
}

// str.format resolves `{0.attr}` and `{0[key]}` itself, out of reach of the attribute checks
const std::unordered_set<std::string> kFormatMethods = {"format", "format_map"};

bool HasFieldLookup(const std::string& pattern) {
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '{') {
            continue;
        }
        if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
            ++i;
            continue;
        }
        for (std::size_t j = i + 1; j < pattern.size(); ++j) {
            const char c = pattern[j];
            if (c == '.' || c == '[') {
                return true;
            }
            if (c == '}' || c == '!' || c == ':' || c == '{') {
                break;
            }
        }
    }
    return false;
}

// Only a string literal with plain replacement fields may be formatted
void CheckFormatCall(PyObject* node) {
    PyRef target(PyObject_GetAttrString(node, "value"));
    if (!target) {
        PyErr_Clear();
        Reject("str.format is only allowed on string literals", node);
    }
    PyRef constant(PyObject_GetAttrString(target.get(), "value"));
    if (!constant || !PyUnicode_Check(constant.get())) {
        PyErr_Clear();
        Reject("str.format is only allowed on string literals", node);
    }
    if (HasFieldLookup(ToUtf8(constant.get()))) {
        Reject("attribute or index lookups in format fields are not allowed", node);
    }
}

bool IsDunder(const std::string& name) {
    return name.size() >= 2 && name[0] == '_' && name[1] == '_';
}

void CheckNode(PyObject* node, NodeKind kind) {
    switch (kind) {
        case IMPORT:
        case IMPORT_FROM:
            Reject("import statements are not allowed", node);

        case ATTRIBUTE: {
            const std::string attribute = StringAttr(node, "attr");
            if ((!attribute.empty() && attribute[0] == '_') || kDeniedAttributes.count(attribute) > 0) {
                Reject("access to attribute '" + attribute + "' is not allowed", node);
            }
            if (kFormatMethods.count(attribute) > 0) {
                CheckFormatCall(node);
            }
            break;
        }

        case NAME: {
            const std::string id = StringAttr(node, "id");
            if (IsDunder(id)) {
                Reject("name '" + id + "' is not allowed", node);
            }
            break;
        }

        case FUNCTION_DEF:
        case ASYNC_FUNCTION_DEF: {
            const std::string name = StringAttr(node, "name");
            if (IsDunder(name)) {
                Reject("function name '" + name + "' is not allowed", node);
            }
            break;
        }

        case ARG: {
            const std::string name = StringAttr(node, "arg");
            if (IsDunder(name)) {
                Reject("parameter name '" + name + "' is not allowed", node);
            }
            break;
        }

        default:
            break;
    }
}

} // anonymous namespace

void ValidateSnippet(const std::string& code) {
    if (code.find('\0') != std::string::npos) {
        throw SnippetError("ValidationError: source code contains null bytes");
    }

    PyRef ast(PyImport_ImportModule("ast"));
    if (!ast) {
        throw InterpreterError("cannot load parser: " + FetchErrorDescription());
    }

    PyRef source(PyUnicode_DecodeUTF8(code.data(), static_cast<Py_ssize_t>(code.size()), "strict"));
    if (!source) {
        throw SnippetError(FetchErrorDescription());
    }

    PyRef tree(PyObject_CallMethod(ast.get(), "parse", "Oss", source.get(), kSnippetFilename, "exec"));
    if (!tree) {
        throw SnippetError(FetchErrorDescription());
    }

    std::array<PyRef, NODE_KIND_COUNT> classes;
    for (std::size_t i = 0; i < classes.size(); ++i) {
        classes[i] = GetAttr(ast.get(), kNodeClassNames[i]);
    }

    PyRef nodes(PyObject_CallMethod(ast.get(), "walk", "O", tree.get()));
    if (!nodes) {
        throw InterpreterError(FetchErrorDescription());
    }
    PyRef iterator(PyObject_GetIter(nodes.get()));
    if (!iterator) {
        throw InterpreterError(FetchErrorDescription());
    }

    while (true) {
        PyRef node(PyIter_Next(iterator.get()));
        if (!node) {
            break;
        }
        for (std::size_t i = 0; i < classes.size(); ++i) {
            const int matches = PyObject_IsInstance(node.get(), classes[i].get());
            if (matches < 0) {
                throw InterpreterError(FetchErrorDescription());
            }
            if (matches == 1) {
                CheckNode(node.get(), static_cast<NodeKind>(i));
                break;
            }
        }
    }

    if (PyErr_Occurred()) {
        throw SnippetError(FetchErrorDescription());
    }
}

} // namespace env
} // namespace snipbox
