#pragma once

#include <sqlite3.h>

#include <memory>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace paperdesk {

// Single-row SQLite store for the ledger snapshot. Every save replaces the
// row inside one immediate transaction. Payloads that fail to parse can be
// moved aside into state_quarantine before the ledger starts empty.
class StateDB {
public:
    explicit StateDB(std::string db_path, std::shared_ptr<spdlog::logger> logger = nullptr);
    ~StateDB();

    StateDB(const StateDB&) = delete;
    StateDB& operator=(const StateDB&) = delete;

    // Creates the parent directory, opens the file, applies pragmas and schema.
    bool open();
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool save(const std::string& payload, const std::string& updated_at);

    // Stored payload, or nullopt when no snapshot has been written yet.
    // A closed database or a failed read is persistence_failed, never nullopt.
    Result<std::optional<std::string>> load();

    bool quarantine(const std::string& payload, const std::string& reason, const std::string& at);
    long long quarantine_count();

    const std::string& path() const { return db_path_; }

private:
    bool exec_sql(const char* sql);
    bool init_schema_and_pragmas();
    void log_sqlite_err(const char* where) const;

    std::string db_path_;
    std::shared_ptr<spdlog::logger> logger_;
    sqlite3* db_{nullptr};
};

// Contents of the pre-SQLite plain state file, if it exists and is readable.
std::optional<std::string> read_legacy_state_file(const std::string& path);

} // namespace paperdesk
