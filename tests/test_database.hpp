/**
 * @file test_database.hpp
 * @brief Scratch SQLite database for tests
 *
 * Creates a private directory with a small `pokemons` table, written through
 * a normal read-write connection so that tests can compare the store before
 * and after a snippet ran.
 *
 * @date 2025
 */

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace snipbox {
namespace test {

class TemporaryDatabase {
public:
    TemporaryDatabase() {
        std::string pattern = (std::filesystem::temp_directory_path() / "snipbox-test-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        if (::mkdtemp(buffer.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        directory_ = buffer.data();
        path_ = directory_ / "za.sqlite3";

        Exec("CREATE TABLE pokemons ("
             "  id INTEGER PRIMARY KEY,"
             "  name TEXT NOT NULL,"
             "  type TEXT,"
             "  attack REAL,"
             "  sprite BLOB"
             ");"
             "INSERT INTO pokemons VALUES (1, 'Bulbasaur', 'grass', 49.0, x'0102');"
             "INSERT INTO pokemons VALUES (4, 'Charmander', 'fire', 52.0, NULL);"
             "INSERT INTO pokemons VALUES (7, 'Squirtle', 'water', 48.0, NULL);");
    }

    ~TemporaryDatabase() {
        std::error_code ec;
        std::filesystem::remove_all(directory_, ec);
    }

    TemporaryDatabase(const TemporaryDatabase&) = delete;
    TemporaryDatabase& operator=(const TemporaryDatabase&) = delete;

    const std::filesystem::path& GetPath() const { return path_; }
    const std::filesystem::path& GetDirectory() const { return directory_; }

    /// Run statements through a read-write connection
    void Exec(const std::string& sql) const {
        sqlite3* db = nullptr;
        if (sqlite3_open_v2(path_.string().c_str(), &db,
                            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
            const std::string message = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw std::runtime_error("cannot open test database: " + message);
        }
        char* error = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
        const std::string message = error ? error : "";
        sqlite3_free(error);
        sqlite3_close(db);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("test database statement failed: " + message);
        }
    }

    /// Number of rows in the pokemons table, read independently of the store
    std::int64_t CountPokemons() const {
        sqlite3* db = nullptr;
        if (sqlite3_open_v2(path_.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("cannot open test database");
        }
        sqlite3_stmt* stmt = nullptr;
        std::int64_t count = -1;
        if (sqlite3_prepare_v2(db, "SELECT count(*) FROM pokemons", -1, &stmt, nullptr) == SQLITE_OK &&
            sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return count;
    }

private:
    std::filesystem::path directory_;
    std::filesystem::path path_;
};

} // namespace test
} // namespace snipbox
