/**
 * @file interpreter.cpp
 * @brief Isolated interpreter start-up
 *
 * @date 2025
 */

#include "snipbox/env/python_bridge.hpp"
#include "snipbox/env/interpreter.hpp"
#include "snipbox/env/errors.hpp"

namespace snipbox {
namespace env {

namespace {

std::string StatusMessage(const PyStatus& status) {
    return status.err_msg != nullptr ? status.err_msg : "unknown error";
}

} // anonymous namespace

ScopedInterpreter::ScopedInterpreter(const std::string& python_home, bool finalize)
    : finalize_(finalize) {

    if (Py_IsInitialized()) {
        throw InterpreterError("interpreter already initialized");
    }

    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.install_signal_handlers = 0;
    config.site_import = 0;
    config.write_bytecode = 0;
    config.user_site_directory = 0;
    config.parse_argv = 0;

    PyStatus status;
    if (!python_home.empty()) {
        status = PyConfig_SetBytesString(&config, &config.home, python_home.c_str());
        if (PyStatus_Exception(status)) {
            PyConfig_Clear(&config);
            throw InterpreterError("invalid interpreter home: " + StatusMessage(status));
        }
    }

    status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        throw InterpreterError("failed to initialize interpreter: " + StatusMessage(status));
    }
}

ScopedInterpreter::~ScopedInterpreter() {
    if (finalize_ && Py_IsInitialized()) {
        Py_FinalizeEx();
    }
}

bool ScopedInterpreter::IsInitialized() {
    return Py_IsInitialized() != 0;
}

} // namespace env
} // namespace snipbox
