#include "paperdesk/state_db.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace paperdesk {

namespace {

// Finalizes on scope exit.
struct Statement {
    sqlite3_stmt* stmt{nullptr};
    ~Statement() {
        if (stmt) sqlite3_finalize(stmt);
    }
};

} // namespace

StateDB::StateDB(std::string db_path, std::shared_ptr<spdlog::logger> logger)
    : db_path_(std::move(db_path)), logger_(std::move(logger)) {}

StateDB::~StateDB() {
    close();
}

void StateDB::log_sqlite_err(const char* where) const {
    if (logger_) {
        logger_->error("[StateDB] {} sqlite_err={}", where, db_ ? sqlite3_errmsg(db_) : "null-db");
    }
}

bool StateDB::open() {
    if (db_) return true;

    std::filesystem::path parent = std::filesystem::path(db_path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec && logger_) logger_->error("[StateDB] cannot create {}: {}", parent.string(), ec.message());
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        log_sqlite_err("sqlite3_open");
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    if (!init_schema_and_pragmas()) {
        close();
        return false;
    }
    return true;
}

void StateDB::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool StateDB::exec_sql(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        if (logger_) logger_->error("[StateDB] sqlite_exec failed: {}", err ? err : "");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool StateDB::init_schema_and_pragmas() {
    if (!exec_sql("PRAGMA journal_mode=WAL;")) return false;
    if (!exec_sql("PRAGMA synchronous=NORMAL;")) return false;
    if (!exec_sql("PRAGMA busy_timeout=5000;")) return false;

    const char* state_sql =
        "CREATE TABLE IF NOT EXISTS state_store ("
        "  id INTEGER PRIMARY KEY CHECK (id = 1),"
        "  payload TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL"
        ");";
    if (!exec_sql(state_sql)) return false;

    const char* quarantine_sql =
        "CREATE TABLE IF NOT EXISTS state_quarantine ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  payload TEXT NOT NULL,"
        "  reason TEXT NOT NULL,"
        "  quarantined_at TEXT NOT NULL"
        ");";
    return exec_sql(quarantine_sql);
}

bool StateDB::save(const std::string& payload, const std::string& updated_at) {
    if (!db_) return false;

    const char* upsert =
        "INSERT INTO state_store (id, payload, updated_at) VALUES (1, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET payload=excluded.payload, updated_at=excluded.updated_at;";

    if (!exec_sql("BEGIN IMMEDIATE TRANSACTION;")) return false;

    Statement st;
    if (sqlite3_prepare_v2(db_, upsert, -1, &st.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_err("sqlite3_prepare_v2(upsert)");
        exec_sql("ROLLBACK;");
        return false;
    }
    sqlite3_bind_text(st.stmt, 1, payload.c_str(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 2, updated_at.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(st.stmt) != SQLITE_DONE) {
        log_sqlite_err("sqlite3_step(upsert)");
        exec_sql("ROLLBACK;");
        return false;
    }

    if (!exec_sql("COMMIT;")) {
        exec_sql("ROLLBACK;");
        return false;
    }
    return true;
}

Result<std::optional<std::string>> StateDB::load() {
    using Payload = std::optional<std::string>;
    if (!db_) return ErrorCode::PersistenceFailed;

    Statement st;
    if (sqlite3_prepare_v2(db_, "SELECT payload FROM state_store WHERE id = 1;", -1, &st.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_err("sqlite3_prepare_v2(select)");
        return ErrorCode::PersistenceFailed;
    }

    int rc = sqlite3_step(st.stmt);
    if (rc == SQLITE_DONE) return Payload();
    if (rc != SQLITE_ROW) {
        log_sqlite_err("sqlite3_step(select)");
        return ErrorCode::PersistenceFailed;
    }

    const unsigned char* text = sqlite3_column_text(st.stmt, 0);
    int size = sqlite3_column_bytes(st.stmt, 0);
    if (!text) return Payload(std::string());
    return Payload(std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size)));
}

bool StateDB::quarantine(const std::string& payload, const std::string& reason, const std::string& at) {
    if (!db_) return false;

    Statement st;
    const char* insert = "INSERT INTO state_quarantine (payload, reason, quarantined_at) VALUES (?, ?, ?);";
    if (sqlite3_prepare_v2(db_, insert, -1, &st.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_err("sqlite3_prepare_v2(quarantine)");
        return false;
    }
    sqlite3_bind_text(st.stmt, 1, payload.c_str(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 2, reason.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.stmt, 3, at.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(st.stmt) != SQLITE_DONE) {
        log_sqlite_err("sqlite3_step(quarantine)");
        return false;
    }
    return true;
}

long long StateDB::quarantine_count() {
    if (!db_) return 0;

    Statement st;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM state_quarantine;", -1, &st.stmt, nullptr) != SQLITE_OK) {
        log_sqlite_err("sqlite3_prepare_v2(count)");
        return 0;
    }
    if (sqlite3_step(st.stmt) != SQLITE_ROW) return 0;
    return sqlite3_column_int64(st.stmt, 0);
}

std::optional<std::string> read_legacy_state_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace paperdesk
