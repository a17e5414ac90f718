/**
 * @file restricted_environment.cpp
 * @brief Namespace assembly and the print/query/scalarQuery bindings
 *
 * **Bindings**:
 * The three callables exposed to snippets are C functions whose `self` is a
 * capsule pointing at the environment's InterpreterBindings. They never let
 * a C++ exception escape into the interpreter:
 *
 * - store::StoreError  → DatabaseError (per-environment exception type)
 * - std::bad_alloc     → MemoryError
 * - std::exception     → RuntimeError
 *
 * **Allowlist**:
 * `__builtins__` is a fresh dictionary filled name by name from the
 * interpreter's builtins module; the library namespaces are SimpleNamespace
 * objects filled the same way from their modules. Modules themselves are
 * never exposed.
 *
 * @date 2025
 */

#include "snipbox/env/python_bridge.hpp"
#include "snipbox/env/restricted_environment.hpp"
#include "snipbox/env/errors.hpp"
#include "snipbox/env/snippet_validator.hpp"

#include <new>
#include <vector>

namespace snipbox {
namespace env {

using json = nlohmann::ordered_json;

/**
 * @struct InterpreterBindings
 * @brief State reachable from the snippet-facing callables
 */
struct InterpreterBindings {
    OutputCapture* output{nullptr};              ///< print() target
    const store::ReadOnlyStore* store{nullptr};  ///< query/scalarQuery target
    PyRef database_error;                        ///< DatabaseError type
    PyRef capsule;                               ///< `self` of the callables
    PyRef globals;                               ///< Snippet globals and locals
};

namespace {

constexpr const char* kCapsuleName = "snipbox.bindings";

const std::vector<const char*> kAllowedBuiltins = {
    "abs", "all", "any", "bool", "chr", "dict", "divmod", "enumerate", "filter",
    "float", "format", "frozenset", "int", "isinstance", "iter", "len", "list",
    "map", "max", "min", "next", "ord", "pow", "range", "repr", "reversed",
    "round", "set", "slice", "sorted", "str", "sum", "tuple", "zip"
};

const std::vector<const char*> kAllowedExceptions = {
    "Exception", "ArithmeticError", "AssertionError", "IndexError", "KeyError",
    "LookupError", "NameError", "RuntimeError", "StopIteration", "TypeError",
    "ValueError", "ZeroDivisionError"
};

const std::vector<const char*> kMathMembers = {
    "pi", "e", "tau", "inf", "nan",
    "sqrt", "isqrt", "pow", "exp", "log", "log2", "log10",
    "floor", "ceil", "trunc", "fabs", "fmod", "modf", "remainder", "copysign",
    "factorial", "gcd", "lcm", "comb", "perm", "prod", "fsum",
    "isclose", "isfinite", "isinf", "isnan",
    "sin", "cos", "tan", "asin", "acos", "atan", "atan2",
    "sinh", "cosh", "tanh", "hypot", "dist", "degrees", "radians"
};

const std::vector<const char*> kStatisticsMembers = {
    "mean", "fmean", "geometric_mean", "harmonic_mean",
    "median", "median_low", "median_high", "median_grouped",
    "mode", "multimode", "quantiles",
    "stdev", "pstdev", "variance", "pvariance",
    "StatisticsError"
};

const std::vector<const char*> kJsonMembers = {
    "dumps", "loads"
};

const std::vector<const char*> kReMembers = {
    "search", "match", "fullmatch", "findall", "finditer", "sub", "subn",
    "split", "escape", "compile",
    "IGNORECASE", "I", "MULTILINE", "M", "DOTALL", "S", "VERBOSE", "X", "ASCII", "A"
};

InterpreterBindings* FromSelf(PyObject* self) {
    return static_cast<InterpreterBindings*>(PyCapsule_GetPointer(self, kCapsuleName));
}

template <typename Call>
bool RunStoreCall(const InterpreterBindings& bindings, Call&& call) {
    try {
        call();
        return true;
    } catch (const store::StoreError& e) {
        PyErr_SetString(bindings.database_error.get(), e.what());
    } catch (const std::bad_alloc&) {
        PyErr_NoMemory();
    } catch (const std::exception& e) {
        PyErr_SetString(PyExc_RuntimeError, e.what());
    }
    return false;
}

// print(*objects, sep=' ', end='\n', flush=False)
PyObject* Print(PyObject* self, PyObject* args, PyObject* kwargs) {
    InterpreterBindings* bindings = FromSelf(self);
    if (bindings == nullptr) {
        return nullptr;
    }

    std::string sep = " ";
    std::string end = "\n";

    if (kwargs != nullptr) {
        PyObject* key = nullptr;
        PyObject* value = nullptr;
        Py_ssize_t position = 0;
        while (PyDict_Next(kwargs, &position, &key, &value)) {
            const std::string name = ToUtf8(key);
            if (name == "sep" || name == "end") {
                if (value == Py_None) {
                    continue;
                }
                if (!PyUnicode_Check(value)) {
                    PyErr_Format(PyExc_TypeError, "%s must be None or a string, not %.200s",
                                 name.c_str(), Py_TYPE(value)->tp_name);
                    return nullptr;
                }
                (name == "sep" ? sep : end) = ToUtf8(value);
            } else if (name == "flush") {
                continue;
            } else if (name == "file") {
                PyErr_SetString(PyExc_TypeError, "print() does not support file=");
                return nullptr;
            } else {
                PyErr_Format(PyExc_TypeError, "'%s' is an invalid keyword argument for print()",
                             name.c_str());
                return nullptr;
            }
        }
    }

    std::string text;
    const Py_ssize_t count = PyTuple_GET_SIZE(args);
    for (Py_ssize_t i = 0; i < count; ++i) {
        if (i > 0) {
            text += sep;
        }
        PyRef item(PyObject_Str(PyTuple_GET_ITEM(args, i)));
        if (!item) {
            return nullptr;
        }
        text += ToUtf8(item.get());
    }
    text += end;

    try {
        bindings->output->Write(text);
    } catch (const std::bad_alloc&) {
        return PyErr_NoMemory();
    }

    Py_RETURN_NONE;
}

bool ParseQueryArguments(PyObject* args, PyObject* kwargs, const char* format,
                         std::string& statement, store::QueryParams& params) {
    static const char* kKeywords[] = {"statement", "params", nullptr};

    PyObject* statement_object = nullptr;
    PyObject* params_object = nullptr;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, format, const_cast<char**>(kKeywords),
                                     &statement_object, &params_object)) {
        return false;
    }

    statement = ToUtf8(statement_object);
    return ToQueryParams(params_object, params);
}

// query(statement, params=None) -> list[dict]
PyObject* Query(PyObject* self, PyObject* args, PyObject* kwargs) {
    InterpreterBindings* bindings = FromSelf(self);
    if (bindings == nullptr) {
        return nullptr;
    }

    std::string statement;
    store::QueryParams params;
    if (!ParseQueryArguments(args, kwargs, "U|O:query", statement, params)) {
        return nullptr;
    }

    std::vector<store::Row> rows;
    if (!RunStoreCall(*bindings, [&]() { rows = bindings->store->Query(statement, params); })) {
        return nullptr;
    }

    PyRef list(PyList_New(static_cast<Py_ssize_t>(rows.size())));
    if (!list) {
        return nullptr;
    }
    for (std::size_t i = 0; i < rows.size(); ++i) {
        PyRef row = RowToDict(rows[i]);
        if (!row) {
            return nullptr;
        }
        PyList_SET_ITEM(list.get(), static_cast<Py_ssize_t>(i), row.release());
    }
    return list.release();
}

// scalarQuery(statement, params=None) -> None | value | dict
PyObject* ScalarQuery(PyObject* self, PyObject* args, PyObject* kwargs) {
    InterpreterBindings* bindings = FromSelf(self);
    if (bindings == nullptr) {
        return nullptr;
    }

    std::string statement;
    store::QueryParams params;
    if (!ParseQueryArguments(args, kwargs, "U|O:scalarQuery", statement, params)) {
        return nullptr;
    }

    store::ScalarResult scalar;
    if (!RunStoreCall(*bindings, [&]() { scalar = bindings->store->ScalarQuery(statement, params); })) {
        return nullptr;
    }

    switch (scalar.kind) {
        case store::ScalarResult::Kind::VALUE:
            return SqlValueToPython(scalar.value).release();
        case store::ScalarResult::Kind::ROW:
            return RowToDict(scalar.row).release();
        case store::ScalarResult::Kind::EMPTY:
        default:
            Py_RETURN_NONE;
    }
}

PyCFunction AsCFunction(PyCFunctionWithKeywords function) {
    return reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(function));
}

PyMethodDef kPrintDef = {
    "print", AsCFunction(Print), METH_VARARGS | METH_KEYWORDS,
    "print(*objects, sep=' ', end='\\n') -- write to the captured output"
};

PyMethodDef kQueryDef = {
    "query", AsCFunction(Query), METH_VARARGS | METH_KEYWORDS,
    "query(statement, params=None) -- all rows as a list of dicts"
};

PyMethodDef kScalarQueryDef = {
    "scalarQuery", AsCFunction(ScalarQuery), METH_VARARGS | METH_KEYWORDS,
    "scalarQuery(statement, params=None) -- None, a single value or the first row"
};

// ============================================================================
// NAMESPACE ASSEMBLY
// ============================================================================

void Check(bool ok, const std::string& what) {
    if (!ok) {
        throw InterpreterError(what + ": " + FetchErrorDescription());
    }
}

void SetItem(PyObject* dict, const char* name, PyObject* value) {
    Check(value != nullptr && PyDict_SetItemString(dict, name, value) == 0,
          std::string("cannot bind '") + name + "'");
}

PyRef ImportModule(const char* name) {
    PyRef module(PyImport_ImportModule(name));
    Check(static_cast<bool>(module), std::string("cannot load module '") + name + "'");
    return module;
}

void CopyMembers(PyObject* source, const std::vector<const char*>& names, PyObject* target) {
    for (const char* name : names) {
        PyRef member(PyObject_GetAttrString(source, name));
        Check(static_cast<bool>(member), std::string("missing member '") + name + "'");
        SetItem(target, name, member.get());
    }
}

PyRef MakeNamespace(PyObject* namespace_type, const char* module_name,
                    const std::vector<const char*>& names) {
    PyRef module = ImportModule(module_name);

    PyRef members(PyDict_New());
    Check(static_cast<bool>(members), "cannot allocate namespace");
    CopyMembers(module.get(), names, members.get());

    PyRef no_args(PyTuple_New(0));
    Check(static_cast<bool>(no_args), "cannot allocate namespace");

    PyRef bag(PyObject_Call(namespace_type, no_args.get(), members.get()));
    Check(static_cast<bool>(bag), std::string("cannot build namespace '") + module_name + "'");
    return bag;
}

PyRef MakeFunction(PyMethodDef* definition, PyObject* self) {
    PyRef function(PyCFunction_NewEx(definition, self, nullptr));
    Check(static_cast<bool>(function), std::string("cannot create '") + definition->ml_name + "'");
    return function;
}

} // anonymous namespace

// ============================================================================
// RESTRICTED ENVIRONMENT
// ============================================================================

RestrictedEnvironment::RestrictedEnvironment(std::unique_ptr<store::ReadOnlyStore> store,
                                             std::size_t max_output_chars)
    : store_(std::move(store))
    , output_(max_output_chars)
    , bindings_(std::make_unique<InterpreterBindings>()) {

    bindings_->output = &output_;
    bindings_->store = store_.get();
}

RestrictedEnvironment::~RestrictedEnvironment() {
    // Break cycles between snippet functions and the globals they close over
    if (bindings_->globals && Py_IsInitialized()) {
        PyDict_Clear(bindings_->globals.get());
    }
}

void RestrictedEnvironment::Run(const std::string& code) {
    ValidateSnippet(code);

    PyRef compiled(Py_CompileStringExFlags(code.c_str(), kSnippetFilename, Py_file_input,
                                           nullptr, -1));
    if (!compiled) {
        throw SnippetError(FetchErrorDescription());
    }

    PyRef value(PyEval_EvalCode(compiled.get(), bindings_->globals.get(), bindings_->globals.get()));
    if (!value) {
        throw SnippetError(FetchErrorDescription());
    }
}

json RestrictedEnvironment::GetResult() const {
    return PythonToJson(PyDict_GetItemString(bindings_->globals.get(), "result"));
}

// ============================================================================
// ENVIRONMENT BUILDER
// ============================================================================

EnvironmentBuilder::EnvironmentBuilder(store::StoreFactory store_factory,
                                       std::size_t max_output_chars)
    : store_factory_(std::move(store_factory))
    , max_output_chars_(max_output_chars) {
}

std::unique_ptr<RestrictedEnvironment> EnvironmentBuilder::Build(
    const std::filesystem::path& db_path,
    const json& args) const {

    if (!Py_IsInitialized()) {
        throw InterpreterError("interpreter is not running");
    }

    auto store = store_factory_ ? store_factory_(db_path) : nullptr;
    if (!store) {
        throw store::StoreUnavailable("no store handle (" + db_path.string() + ")");
    }

    std::unique_ptr<RestrictedEnvironment> environment(
        new RestrictedEnvironment(std::move(store), max_output_chars_));
    InterpreterBindings& bindings = *environment->bindings_;

    bindings.database_error = PyRef(PyErr_NewException("snipbox.DatabaseError", PyExc_Exception, nullptr));
    Check(static_cast<bool>(bindings.database_error), "cannot create DatabaseError");

    bindings.capsule = PyRef(PyCapsule_New(&bindings, kCapsuleName, nullptr));
    Check(static_cast<bool>(bindings.capsule), "cannot create bindings");

    // Builtins
    PyRef builtins_module = ImportModule("builtins");
    PyRef builtins(PyDict_New());
    Check(static_cast<bool>(builtins), "cannot allocate builtins");
    CopyMembers(builtins_module.get(), kAllowedBuiltins, builtins.get());
    CopyMembers(builtins_module.get(), kAllowedExceptions, builtins.get());
    SetItem(builtins.get(), "DatabaseError", bindings.database_error.get());
    SetItem(builtins.get(), "print", MakeFunction(&kPrintDef, bindings.capsule.get()).get());

    // Globals
    bindings.globals = PyRef(PyDict_New());
    Check(static_cast<bool>(bindings.globals), "cannot allocate globals");
    PyObject* globals = bindings.globals.get();

    SetItem(globals, "__builtins__", builtins.get());

    PyRef types = ImportModule("types");
    PyRef namespace_type(PyObject_GetAttrString(types.get(), "SimpleNamespace"));
    Check(static_cast<bool>(namespace_type), "cannot load SimpleNamespace");

    SetItem(globals, "math", MakeNamespace(namespace_type.get(), "math", kMathMembers).get());
    SetItem(globals, "statistics", MakeNamespace(namespace_type.get(), "statistics", kStatisticsMembers).get());
    SetItem(globals, "json", MakeNamespace(namespace_type.get(), "json", kJsonMembers).get());
    SetItem(globals, "re", MakeNamespace(namespace_type.get(), "re", kReMembers).get());

    SetItem(globals, "query", MakeFunction(&kQueryDef, bindings.capsule.get()).get());
    SetItem(globals, "scalarQuery", MakeFunction(&kScalarQueryDef, bindings.capsule.get()).get());

    PyRef snippet_args = JsonToPython(args);
    Check(static_cast<bool>(snippet_args), "cannot convert args");
    SetItem(globals, "args", snippet_args.get());
    SetItem(globals, "result", Py_None);

    return environment;
}

} // namespace env
} // namespace snipbox
