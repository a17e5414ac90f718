/**
 * @file readonly_store.cpp
 * @brief Implementation of the read-only SQLite handle
 *
 * **Open Sequence**:
 * ```
 * sqlite3_open_v2(READONLY)
 *   → PRAGMA temp_store = MEMORY     (sorts never spill to disk)
 *   → PRAGMA query_only = ON         (session-level write guard)
 *   → disable load_extension, ATTACH, enable defensive mode
 *   → install authorizer             (reads, functions, CTEs, pragmas)
 *   → PRAGMA schema_version          (fails on missing/corrupt files)
 * ```
 *
 * **Binding Rules**:
 * - Positional: the number of values must match the statement's parameters
 * - Named: every named parameter must have a value; `?` is not allowed
 *
 * @date 2025
 */

#include "snipbox/store/readonly_store.hpp"

#include <spdlog/spdlog.h>
#include <sqlite3.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace snipbox {
namespace store {

namespace {

constexpr int kBusyTimeoutMs = 2000;

/// Introspection pragmas allowed with or without an argument
const std::set<std::string> kIntrospectionPragmas = {
    "table_info",
    "table_xinfo",
    "table_list",
    "index_list",
    "index_info",
    "index_xinfo",
    "foreign_key_list",
    "collation_list",
    "function_list",
    "module_list",
    "pragma_list",
    "compile_options",
    "database_list"
};

/// Setting pragmas allowed only in their read form (no argument)
const std::set<std::string> kReadOnlySettingPragmas = {
    "user_version",
    "schema_version",
    "application_id",
    "data_version",
    "page_count",
    "page_size",
    "freelist_count",
    "encoding"
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

std::string ToLower(const char* text) {
    std::string result = text ? text : "";
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

int Authorize(void* /*user_data*/, int action, const char* arg1, const char* arg2,
              const char* /*database*/, const char* /*trigger*/) {
    switch (action) {
        case SQLITE_SELECT:
        case SQLITE_READ:
        case SQLITE_RECURSIVE:
            return SQLITE_OK;
        case SQLITE_FUNCTION:
            return ToLower(arg2) == "load_extension" ? SQLITE_DENY : SQLITE_OK;
        case SQLITE_PRAGMA: {
            const auto name = ToLower(arg1);
            if (kIntrospectionPragmas.count(name) > 0) {
                return SQLITE_OK;
            }
            if (kReadOnlySettingPragmas.count(name) > 0 && arg2 == nullptr) {
                return SQLITE_OK;
            }
            return SQLITE_DENY;
        }
        default:
            return SQLITE_DENY;
    }
}

// Run a statement that produces no rows we care about
void ExecOrThrow(sqlite3* db, const char* sql) {
    char* message = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &message) != SQLITE_OK) {
        std::string error = message ? message : sqlite3_errmsg(db);
        sqlite3_free(message);
        throw StoreUnavailable(error);
    }
}

bool IsBlankTail(const char* tail) {
    if (tail == nullptr) {
        return true;
    }
    for (; *tail != '\0'; ++tail) {
        if (!std::isspace(static_cast<unsigned char>(*tail)) && *tail != ';') {
            return false;
        }
    }
    return true;
}

Statement Prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail) != SQLITE_OK) {
        sqlite3_finalize(raw);
        throw StoreError(sqlite3_errmsg(db));
    }
    Statement stmt(raw);
    if (!stmt) {
        throw StoreError("empty statement");
    }
    if (!IsBlankTail(tail)) {
        throw StoreError("only one statement can be executed at a time");
    }
    return stmt;
}

void BindValue(sqlite3* db, sqlite3_stmt* stmt, int index, const SqlValue& value) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::monostate>(value)) {
        rc = sqlite3_bind_null(stmt, index);
    } else if (const auto* integer = std::get_if<std::int64_t>(&value)) {
        rc = sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*integer));
    } else if (const auto* real = std::get_if<double>(&value)) {
        rc = sqlite3_bind_double(stmt, index, *real);
    } else if (const auto* text = std::get_if<std::string>(&value)) {
        rc = sqlite3_bind_text64(stmt, index, text->data(), text->size(),
                                 SQLITE_TRANSIENT, SQLITE_UTF8);
    } else if (const auto* blob = std::get_if<Blob>(&value)) {
        rc = sqlite3_bind_blob64(stmt, index, blob->data(), blob->size(), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
        throw StoreError(sqlite3_errmsg(db));
    }
}

void BindParams(sqlite3* db, sqlite3_stmt* stmt, const QueryParams& params) {
    const int expected = sqlite3_bind_parameter_count(stmt);

    if (!params.use_named) {
        if (static_cast<std::size_t>(expected) != params.positional.size()) {
            std::ostringstream oss;
            oss << "incorrect number of bindings supplied: the statement uses "
                << expected << ", and there are " << params.positional.size() << " supplied";
            throw StoreError(oss.str());
        }
        for (int i = 0; i < expected; ++i) {
            BindValue(db, stmt, i + 1, params.positional[static_cast<std::size_t>(i)]);
        }
        return;
    }

    for (int i = 1; i <= expected; ++i) {
        const char* raw_name = sqlite3_bind_parameter_name(stmt, i);
        if (raw_name == nullptr || raw_name[0] == '?') {
            throw StoreError("named parameters were supplied but the statement uses positional placeholders");
        }
        const std::string name(raw_name + 1);
        auto it = std::find_if(params.named.begin(), params.named.end(),
                               [&name](const auto& entry) { return entry.first == name; });
        if (it == params.named.end()) {
            throw StoreError("no value supplied for binding parameter " + std::string(raw_name));
        }
        BindValue(db, stmt, i, it->second);
    }
}

SqlValue ReadColumn(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<std::int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            const int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", static_cast<std::size_t>(size));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, index));
            const int size = sqlite3_column_bytes(stmt, index);
            return data ? Blob(data, data + size) : Blob{};
        }
        default:
            return std::monostate{};
    }
}

Row ReadRow(sqlite3_stmt* stmt) {
    const int columns = sqlite3_column_count(stmt);
    Row row;
    row.reserve(static_cast<std::size_t>(columns));
    for (int i = 0; i < columns; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        row.emplace_back(name ? name : "", ReadColumn(stmt, i));
    }
    return row;
}

// Step once; true when a row is available
bool Step(sqlite3* db, sqlite3_stmt* stmt) {
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throw StoreError(sqlite3_errmsg(db));
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

std::unique_ptr<ReadOnlyStore> ReadOnlyStore::Open(const std::filesystem::path& path) {
    spdlog::debug("Opening read-only store: {}", path.string());

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        throw StoreUnavailable(reason + " (" + path.string() + ")");
    }

    try {
        sqlite3_busy_timeout(db, kBusyTimeoutMs);
        sqlite3_extended_result_codes(db, 1);
        sqlite3_db_config(db, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
        sqlite3_db_config(db, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
        sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);

        ExecOrThrow(db, "PRAGMA temp_store = MEMORY");
        ExecOrThrow(db, "PRAGMA query_only = ON");

        sqlite3_set_authorizer(db, Authorize, nullptr);

        ExecOrThrow(db, "PRAGMA schema_version");
    } catch (const StoreUnavailable& e) {
        sqlite3_close(db);
        throw StoreUnavailable(std::string(e.what()) + " (" + path.string() + ")");
    }

    return std::unique_ptr<ReadOnlyStore>(new ReadOnlyStore(db, path));
}

ReadOnlyStore::ReadOnlyStore(sqlite3* db, std::filesystem::path path)
    : db_(db)
    , path_(std::move(path)) {
}

ReadOnlyStore::~ReadOnlyStore() {
    sqlite3_close(db_);
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<Row> ReadOnlyStore::Query(const std::string& sql, const QueryParams& params) const {
    auto stmt = Prepare(db_, sql);
    BindParams(db_, stmt.get(), params);

    std::vector<Row> rows;
    while (Step(db_, stmt.get())) {
        rows.push_back(ReadRow(stmt.get()));
    }
    return rows;
}

ScalarResult ReadOnlyStore::ScalarQuery(const std::string& sql, const QueryParams& params) const {
    auto stmt = Prepare(db_, sql);
    BindParams(db_, stmt.get(), params);

    ScalarResult result;
    if (!Step(db_, stmt.get())) {
        return result;
    }

    Row row = ReadRow(stmt.get());
    if (row.size() == 1) {
        result.kind = ScalarResult::Kind::VALUE;
        result.value = std::move(row.front().second);
    } else {
        result.kind = ScalarResult::Kind::ROW;
        result.row = std::move(row);
    }
    return result;
}

std::unique_ptr<ReadOnlyStore> OpenReadOnly(const std::filesystem::path& path) {
    return ReadOnlyStore::Open(path);
}

} // namespace store
} // namespace snipbox
