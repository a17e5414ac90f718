/**
 * @file interpreter.hpp
 * @brief Lifetime of the embedded interpreter
 *
 * The interpreter is started inside the worker process only. It runs in
 * isolated mode: no environment variables, no site packages, no signal
 * handlers and no bytecode cache writes.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace snipbox {
namespace env {

/**
 * @class ScopedInterpreter
 * @brief Initializes the interpreter on construction
 *
 * **Usage Example**:
 * @code
 * // worker: process exits right after, skip finalization
 * ScopedInterpreter interpreter(config.python_home, false);
 * @endcode
 */
class ScopedInterpreter {
public:
    /**
     * @brief Start an isolated interpreter
     *
     * @param python_home Standard library prefix (empty: built-in default)
     * @param finalize Finalize the interpreter on destruction
     *
     * @throws InterpreterError if the interpreter is already running or fails to start
     */
    explicit ScopedInterpreter(const std::string& python_home = {}, bool finalize = true);

    ~ScopedInterpreter();

    ScopedInterpreter(const ScopedInterpreter&) = delete;
    ScopedInterpreter& operator=(const ScopedInterpreter&) = delete;

    static bool IsInitialized();

private:
    bool finalize_;
};

} // namespace env
} // namespace snipbox
