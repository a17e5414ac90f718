/**
 * @file python_bridge.cpp
 * @brief Implementation of interpreter/value conversions
 *
 * @date 2025
 */

#include "snipbox/env/python_bridge.hpp"
#include "snipbox/env/errors.hpp"

#include <cstdint>
#include <type_traits>
#include <variant>

namespace snipbox {
namespace env {

using json = nlohmann::ordered_json;

namespace {

constexpr int kMaxResultDepth = 200;

std::string TypeName(PyObject* object) {
    return Py_TYPE(object)->tp_name;
}

// Short exception name: "ZeroDivisionError", "DatabaseError", ...
std::string ExceptionName(PyObject* type) {
    if (type == nullptr || !PyType_Check(type)) {
        return "Exception";
    }
    std::string name = reinterpret_cast<PyTypeObject*>(type)->tp_name;
    const auto dot = name.rfind('.');
    if (dot != std::string::npos) {
        name = name.substr(dot + 1);
    }
    return name;
}

int InnermostSnippetLine(PyObject* traceback) {
    int line = 0;
    PyRef current = PyRef::Borrow(traceback);

    while (current && current.get() != Py_None) {
        PyRef frame(PyObject_GetAttrString(current.get(), "tb_frame"));
        PyRef code(frame ? PyObject_GetAttrString(frame.get(), "f_code") : nullptr);
        PyRef filename(code ? PyObject_GetAttrString(code.get(), "co_filename") : nullptr);
        PyRef lineno(PyObject_GetAttrString(current.get(), "tb_lineno"));

        if (filename && ToUtf8(filename.get()) == kSnippetFilename &&
            lineno && PyLong_Check(lineno.get())) {
            line = static_cast<int>(PyLong_AsLong(lineno.get()));
        }

        current = PyRef(PyObject_GetAttrString(current.get(), "tb_next"));
    }

    PyErr_Clear();
    return line;
}

bool ToSqlValue(PyObject* object, store::SqlValue& out) {
    if (object == Py_None) {
        out = std::monostate{};
        return true;
    }
    if (PyBool_Check(object)) {
        out = static_cast<std::int64_t>(object == Py_True ? 1 : 0);
        return true;
    }
    if (PyLong_Check(object)) {
        int overflow = 0;
        const long long value = PyLong_AsLongLongAndOverflow(object, &overflow);
        if (overflow != 0) {
            PyErr_SetString(PyExc_OverflowError,
                            "Python int too large to convert to SQLite INTEGER");
            return false;
        }
        if (value == -1 && PyErr_Occurred()) {
            return false;
        }
        out = static_cast<std::int64_t>(value);
        return true;
    }
    if (PyFloat_Check(object)) {
        out = PyFloat_AS_DOUBLE(object);
        return true;
    }
    if (PyUnicode_Check(object)) {
        Py_ssize_t size = 0;
        const char* data = PyUnicode_AsUTF8AndSize(object, &size);
        if (data == nullptr) {
            return false;
        }
        out = std::string(data, static_cast<std::size_t>(size));
        return true;
    }
    if (PyBytes_Check(object)) {
        const auto* data = reinterpret_cast<const std::uint8_t*>(PyBytes_AS_STRING(object));
        out = store::Blob(data, data + PyBytes_GET_SIZE(object));
        return true;
    }
    if (PyByteArray_Check(object)) {
        const auto* data = reinterpret_cast<const std::uint8_t*>(PyByteArray_AS_STRING(object));
        out = store::Blob(data, data + PyByteArray_GET_SIZE(object));
        return true;
    }

    PyErr_Format(PyExc_TypeError,
                 "Error binding parameter: type '%s' is not supported",
                 Py_TYPE(object)->tp_name);
    return false;
}

// Key stringification follows json.dumps
std::string KeyToString(PyObject* key) {
    if (PyUnicode_Check(key)) {
        return ToUtf8(key);
    }
    if (key == Py_None) {
        return "null";
    }
    if (PyBool_Check(key)) {
        return key == Py_True ? "true" : "false";
    }
    if (PyLong_Check(key) || PyFloat_Check(key)) {
        PyRef text(PyFloat_Check(key) ? PyObject_Repr(key) : PyObject_Str(key));
        if (!text) {
            throw SnippetError(FetchErrorDescription());
        }
        return ToUtf8(text.get());
    }
    throw SnippetError("TypeError: keys must be str, int, float, bool or None, not " +
                       TypeName(key));
}

json Convert(PyObject* value, int depth) {
    if (depth > kMaxResultDepth) {
        throw SnippetError("ValueError: result is nested too deeply");
    }

    if (value == nullptr || value == Py_None) {
        return nullptr;
    }
    if (PyBool_Check(value)) {
        return value == Py_True;
    }
    if (PyLong_Check(value)) {
        int overflow = 0;
        const long long number = PyLong_AsLongLongAndOverflow(value, &overflow);
        if (overflow == 0) {
            if (number == -1 && PyErr_Occurred()) {
                throw SnippetError(FetchErrorDescription());
            }
            return static_cast<std::int64_t>(number);
        }
        if (overflow > 0) {
            const unsigned long long unsigned_number = PyLong_AsUnsignedLongLong(value);
            if (!PyErr_Occurred()) {
                return static_cast<std::uint64_t>(unsigned_number);
            }
            PyErr_Clear();
        }
        // Beyond 64 bits the value cannot be carried exactly
        throw SnippetError("OverflowError: int too large to convert to JSON "
                           "(valid range is -2**63 to 2**64 - 1)");
    }
    if (PyFloat_Check(value)) {
        return PyFloat_AS_DOUBLE(value);
    }
    if (PyUnicode_Check(value)) {
        return ToUtf8(value);
    }

    if (PyList_Check(value) || PyTuple_Check(value)) {
        PyRef sequence(PySequence_Fast(value, "expected a sequence"));
        if (!sequence) {
            throw SnippetError(FetchErrorDescription());
        }
        json array = json::array();
        const Py_ssize_t size = PySequence_Fast_GET_SIZE(sequence.get());
        PyObject** items = PySequence_Fast_ITEMS(sequence.get());
        for (Py_ssize_t i = 0; i < size; ++i) {
            array.push_back(Convert(items[i], depth + 1));
        }
        return array;
    }

    if (PyAnySet_Check(value)) {
        PyRef iterator(PyObject_GetIter(value));
        if (!iterator) {
            throw SnippetError(FetchErrorDescription());
        }
        json array = json::array();
        while (true) {
            PyRef item(PyIter_Next(iterator.get()));
            if (!item) {
                break;
            }
            array.push_back(Convert(item.get(), depth + 1));
        }
        if (PyErr_Occurred()) {
            throw SnippetError(FetchErrorDescription());
        }
        return array;
    }

    if (PyDict_Check(value)) {
        json object = json::object();
        PyObject* key = nullptr;
        PyObject* item = nullptr;
        Py_ssize_t position = 0;
        while (PyDict_Next(value, &position, &key, &item)) {
            object[KeyToString(key)] = Convert(item, depth + 1);
        }
        return object;
    }

    throw SnippetError("TypeError: result is not JSON serializable: object of type '" +
                       TypeName(value) + "'");
}

} // anonymous namespace

std::string FetchErrorDescription() {
    PyObject* type = nullptr;
    PyObject* value = nullptr;
    PyObject* traceback = nullptr;
    PyErr_Fetch(&type, &value, &traceback);
    if (type == nullptr) {
        return "unknown error";
    }
    PyErr_NormalizeException(&type, &value, &traceback);

    PyRef type_ref(type);
    PyRef value_ref(value);
    PyRef traceback_ref(traceback);

    const std::string name = ExceptionName(type);

    std::string message;
    if (value != nullptr) {
        PyRef text(PyObject_Str(value));
        if (text) {
            message = ToUtf8(text.get());
        } else {
            PyErr_Clear();
        }
    }

    std::string description = message.empty() ? name : name + ": " + message;

    if (!PyErr_GivenExceptionMatches(type, PyExc_SyntaxError)) {
        const int line = InnermostSnippetLine(traceback);
        if (line > 0) {
            description += " (line " + std::to_string(line) + ")";
        }
    }

    return description;
}

std::string ToUtf8(PyObject* text) {
    if (text == nullptr || !PyUnicode_Check(text)) {
        return {};
    }
    PyRef bytes(PyUnicode_AsEncodedString(text, "utf-8", "replace"));
    if (!bytes) {
        PyErr_Clear();
        return {};
    }
    return std::string(PyBytes_AS_STRING(bytes.get()),
                       static_cast<std::size_t>(PyBytes_GET_SIZE(bytes.get())));
}

PyRef JsonToPython(const json& value) {
    switch (value.type()) {
        case json::value_t::boolean:
            return PyRef::Borrow(value.get<bool>() ? Py_True : Py_False);

        case json::value_t::number_integer:
            return PyRef(PyLong_FromLongLong(value.get<std::int64_t>()));

        case json::value_t::number_unsigned:
            return PyRef(PyLong_FromUnsignedLongLong(value.get<std::uint64_t>()));

        case json::value_t::number_float:
            return PyRef(PyFloat_FromDouble(value.get<double>()));

        case json::value_t::string: {
            const auto& text = value.get_ref<const std::string&>();
            return PyRef(PyUnicode_DecodeUTF8(text.data(),
                                              static_cast<Py_ssize_t>(text.size()),
                                              "replace"));
        }

        case json::value_t::array: {
            PyRef list(PyList_New(static_cast<Py_ssize_t>(value.size())));
            if (!list) {
                return {};
            }
            Py_ssize_t index = 0;
            for (const auto& element : value) {
                PyRef item = JsonToPython(element);
                if (!item) {
                    return {};
                }
                PyList_SET_ITEM(list.get(), index++, item.release());
            }
            return list;
        }

        case json::value_t::object: {
            PyRef dict(PyDict_New());
            if (!dict) {
                return {};
            }
            for (const auto& [key, element] : value.items()) {
                PyRef py_key(PyUnicode_DecodeUTF8(key.data(),
                                                  static_cast<Py_ssize_t>(key.size()),
                                                  "replace"));
                PyRef py_value = JsonToPython(element);
                if (!py_key || !py_value ||
                    PyDict_SetItem(dict.get(), py_key.get(), py_value.get()) != 0) {
                    return {};
                }
            }
            return dict;
        }

        case json::value_t::binary: {
            const auto& bytes = value.get_binary();
            return PyRef(PyBytes_FromStringAndSize(reinterpret_cast<const char*>(bytes.data()),
                                                   static_cast<Py_ssize_t>(bytes.size())));
        }

        case json::value_t::null:
        case json::value_t::discarded:
        default:
            return PyRef::Borrow(Py_None);
    }
}

PyRef SqlValueToPython(const store::SqlValue& value) {
    return std::visit([](const auto& v) -> PyRef {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return PyRef::Borrow(Py_None);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return PyRef(PyLong_FromLongLong(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return PyRef(PyFloat_FromDouble(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
            return PyRef(PyUnicode_DecodeUTF8(v.data(), static_cast<Py_ssize_t>(v.size()),
                                              "replace"));
        } else {
            return PyRef(PyBytes_FromStringAndSize(reinterpret_cast<const char*>(v.data()),
                                                   static_cast<Py_ssize_t>(v.size())));
        }
    }, value);
}

PyRef RowToDict(const store::Row& row) {
    PyRef dict(PyDict_New());
    if (!dict) {
        return {};
    }
    for (const auto& [column, value] : row) {
        PyRef key(PyUnicode_DecodeUTF8(column.data(), static_cast<Py_ssize_t>(column.size()),
                                       "replace"));
        if (!key) {
            return {};
        }
        // Repeated column names (p.*, m.*): the first occurrence wins
        const int present = PyDict_Contains(dict.get(), key.get());
        if (present < 0) {
            return {};
        }
        if (present == 1) {
            continue;
        }
        PyRef item = SqlValueToPython(value);
        if (!item || PyDict_SetItem(dict.get(), key.get(), item.get()) != 0) {
            return {};
        }
    }
    return dict;
}

bool ToQueryParams(PyObject* params, store::QueryParams& out) {
    out = store::QueryParams::None();

    if (params == nullptr || params == Py_None) {
        return true;
    }

    if (PyList_Check(params) || PyTuple_Check(params)) {
        PyRef sequence(PySequence_Fast(params, "expected a sequence"));
        if (!sequence) {
            return false;
        }
        const Py_ssize_t size = PySequence_Fast_GET_SIZE(sequence.get());
        PyObject** items = PySequence_Fast_ITEMS(sequence.get());
        out.positional.reserve(static_cast<std::size_t>(size));
        for (Py_ssize_t i = 0; i < size; ++i) {
            store::SqlValue value;
            if (!ToSqlValue(items[i], value)) {
                return false;
            }
            out.positional.push_back(std::move(value));
        }
        return true;
    }

    if (PyDict_Check(params)) {
        out.use_named = true;
        PyObject* key = nullptr;
        PyObject* item = nullptr;
        Py_ssize_t position = 0;
        while (PyDict_Next(params, &position, &key, &item)) {
            if (!PyUnicode_Check(key)) {
                PyErr_SetString(PyExc_TypeError, "parameter names must be str");
                return false;
            }
            store::SqlValue value;
            if (!ToSqlValue(item, value)) {
                return false;
            }
            out.named.emplace_back(ToUtf8(key), std::move(value));
        }
        return true;
    }

    store::SqlValue value;
    if (!ToSqlValue(params, value)) {
        return false;
    }
    out.positional.push_back(std::move(value));
    return true;
}

json PythonToJson(PyObject* value) {
    return Convert(value, 0);
}

} // namespace env
} // namespace snipbox
