/**
 * @file readonly_store.hpp
 * @brief Read-only handle to the SQLite data store
 *
 * Every snippet talks to the data store through exactly one ReadOnlyStore.
 * The handle is read-only three times over:
 *
 * - the connection is opened with SQLITE_OPEN_READONLY
 * - the session runs with `PRAGMA query_only = ON`
 * - an authorizer rejects everything that is not a read, a function call,
 *   a recursive CTE or an introspection pragma (ATTACH included)
 *
 * Any write or DDL statement therefore fails and leaves the file untouched.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

struct sqlite3;

namespace snipbox {
namespace store {

/**
 * @class StoreUnavailable
 * @brief The store could not be opened at the requested path
 *
 * Fatal for the invocation; raised before any snippet code runs.
 */
class StoreUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @class StoreError
 * @brief A statement was rejected or failed while running
 *
 * Covers syntax errors, rejected writes, bad bindings and step failures.
 */
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using Blob = std::vector<std::uint8_t>;

/// A single SQLite value: NULL, INTEGER, REAL, TEXT or BLOB
using SqlValue = std::variant<std::monostate, std::int64_t, double, std::string, Blob>;

/// One result row; column order is the result set's column order
using Row = std::vector<std::pair<std::string, SqlValue>>;

/**
 * @struct QueryParams
 * @brief Parameters bound to a statement
 *
 * Either positional (`?`, `?NNN`) or named (`:name`, `@name`, `$name`),
 * never both. Named keys are given without their prefix character.
 */
struct QueryParams {
    std::vector<SqlValue> positional;                      ///< Bound in order
    std::vector<std::pair<std::string, SqlValue>> named;   ///< Bound by name
    bool use_named{false};                                 ///< Select named binding

    static QueryParams None() { return QueryParams{}; }

    static QueryParams Positional(std::vector<SqlValue> values) {
        QueryParams params;
        params.positional = std::move(values);
        return params;
    }

    static QueryParams Named(std::vector<std::pair<std::string, SqlValue>> values) {
        QueryParams params;
        params.named = std::move(values);
        params.use_named = true;
        return params;
    }
};

/**
 * @struct ScalarResult
 * @brief Outcome of ReadOnlyStore::ScalarQuery
 *
 * - EMPTY: the statement returned no rows
 * - VALUE: one column was projected; `value` holds it
 * - ROW:   several columns were projected; `row` holds the first row
 */
struct ScalarResult {
    enum class Kind {
        EMPTY,
        VALUE,
        ROW
    };

    Kind kind{Kind::EMPTY};
    SqlValue value;
    Row row;
};

/**
 * @class ReadOnlyStore
 * @brief Owning, read-only SQLite connection
 *
 * **Thread Safety**: NOT thread-safe. One handle per worker invocation.
 *
 * **Usage Example**:
 * @code
 * auto store = ReadOnlyStore::Open("za.sqlite3");
 *
 * auto rows = store->Query("SELECT id, name FROM pokemons WHERE id < ?",
 *                          QueryParams::Positional({std::int64_t{10}}));
 * for (const auto& row : rows) {
 *     // row[0].first == "id", row[1].first == "name"
 * }
 *
 * auto count = store->ScalarQuery("SELECT count(*) FROM pokemons");
 * @endcode
 */
class ReadOnlyStore {
public:
    /**
     * @brief Open a read-only connection
     *
     * Opens the file, switches the session to query-only, disables extension
     * loading and ATTACH, installs the read-only authorizer and reads the
     * schema version once so that missing or corrupt files fail here rather
     * than on the first query.
     *
     * @param path Database file
     * @return Open handle
     *
     * @throws StoreUnavailable if the file cannot be opened as a database
     */
    static std::unique_ptr<ReadOnlyStore> Open(const std::filesystem::path& path);

    ~ReadOnlyStore();

    ReadOnlyStore(const ReadOnlyStore&) = delete;
    ReadOnlyStore& operator=(const ReadOnlyStore&) = delete;

    /**
     * @brief Run a read statement and collect every row
     *
     * No ordering is added; rows come back in the statement's natural order.
     *
     * @param sql Single SQL statement
     * @param params Bound parameters
     * @return Rows as ordered column/value lists
     *
     * @throws StoreError on compile, bind or step failure
     */
    std::vector<Row> Query(const std::string& sql,
                           const QueryParams& params = QueryParams::None()) const;

    /**
     * @brief Run a read statement and look at its first row only
     *
     * Rows after the first are never stepped.
     *
     * @param sql Single SQL statement
     * @param params Bound parameters
     * @return EMPTY, the single projected value, or the full first row
     *
     * @throws StoreError on compile, bind or step failure
     */
    ScalarResult ScalarQuery(const std::string& sql,
                             const QueryParams& params = QueryParams::None()) const;

    /**
     * @brief Path this handle was opened on
     */
    const std::filesystem::path& GetPath() const { return path_; }

private:
    ReadOnlyStore(sqlite3* db, std::filesystem::path path);

    sqlite3* db_;                   ///< Owned connection
    std::filesystem::path path_;    ///< Source path
};

/**
 * @brief Factory used by the environment builder to obtain a store handle
 */
using StoreFactory = std::function<std::unique_ptr<ReadOnlyStore>(const std::filesystem::path&)>;

/**
 * @brief Default StoreFactory: ReadOnlyStore::Open
 */
std::unique_ptr<ReadOnlyStore> OpenReadOnly(const std::filesystem::path& path);

} // namespace store
} // namespace snipbox
