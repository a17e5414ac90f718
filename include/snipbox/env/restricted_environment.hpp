/**
 * @file restricted_environment.hpp
 * @brief Per-invocation execution namespace for snippets
 *
 * A RestrictedEnvironment is a globals dictionary holding only:
 *
 * ```
 * __builtins__  allowlisted builtins, exception types and a capturing print()
 * math, statistics, json, re   attribute bags of pure functions
 * query(statement, params=None)        -> list of row dicts
 * scalarQuery(statement, params=None)  -> None | value | row dict
 * args          deep copy of the caller's parameters
 * result        None until the snippet assigns it
 * ```
 *
 * plus the read-only store handle behind query/scalarQuery and the bounded
 * output buffer behind print(). Nothing in it is shared with any other
 * invocation.
 *
 * @date 2025
 */

#pragma once

#include "snipbox/env/output_capture.hpp"
#include "snipbox/store/readonly_store.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace snipbox {
namespace env {

struct InterpreterBindings;

/**
 * @class RestrictedEnvironment
 * @brief Namespace, store handle and output buffer of one invocation
 *
 * Created by EnvironmentBuilder. Requires a running interpreter for its
 * whole lifetime.
 *
 * **Thread Safety**: NOT thread-safe.
 */
class RestrictedEnvironment {
public:
    ~RestrictedEnvironment();

    RestrictedEnvironment(const RestrictedEnvironment&) = delete;
    RestrictedEnvironment& operator=(const RestrictedEnvironment&) = delete;

    /**
     * @brief Validate and execute a snippet in this namespace
     *
     * Top-level statements run with one dictionary as globals and locals,
     * so functions defined by the snippet see its top-level bindings.
     *
     * @param code Snippet source
     *
     * @throws SnippetError on validation failure or any uncaught exception
     */
    void Run(const std::string& code);

    /**
     * @brief Current value of `result` as JSON
     * @throws SnippetError if the value has no JSON representation
     */
    nlohmann::ordered_json GetResult() const;

    const std::string& GetStdout() const { return output_.GetText(); }
    bool IsStdoutTruncated() const { return output_.IsTruncated(); }

    const store::ReadOnlyStore& GetStore() const { return *store_; }

private:
    friend class EnvironmentBuilder;

    RestrictedEnvironment(std::unique_ptr<store::ReadOnlyStore> store, std::size_t max_output_chars);

    std::unique_ptr<store::ReadOnlyStore> store_;   ///< Owned read-only handle
    OutputCapture output_;                          ///< print() target
    std::unique_ptr<InterpreterBindings> bindings_; ///< Interpreter-side objects
};

/**
 * @class EnvironmentBuilder
 * @brief Builds one RestrictedEnvironment per invocation
 *
 * **Usage Example**:
 * @code
 * EnvironmentBuilder builder(store::OpenReadOnly, 10000);
 * auto environment = builder.Build("za.sqlite3", {{"limit", 5}});
 * environment->Run("result = query('SELECT 1 AS one')");
 * auto result = environment->GetResult();   // [{"one": 1}]
 * @endcode
 */
class EnvironmentBuilder {
public:
    /**
     * @param store_factory Opens the read-only store handle
     * @param max_output_chars print() budget in code points
     */
    EnvironmentBuilder(store::StoreFactory store_factory, std::size_t max_output_chars);

    /**
     * @brief Open the store and assemble a fresh namespace
     *
     * @param db_path Store location
     * @param args Caller parameters (JSON object)
     * @return New environment
     *
     * @throws store::StoreUnavailable if the store cannot be opened
     * @throws InterpreterError if the interpreter is not running or the
     *         namespace cannot be assembled
     */
    std::unique_ptr<RestrictedEnvironment> Build(const std::filesystem::path& db_path,
                                                 const nlohmann::ordered_json& args) const;

private:
    store::StoreFactory store_factory_;
    std::size_t max_output_chars_;
};

} // namespace env
} // namespace snipbox
