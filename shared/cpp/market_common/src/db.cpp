#include "../include/db.hpp"
#include "../include/errors.hpp"
#include <sqlite3.h>
#include <iostream>

static std::string sqlite_message(sqlite3* db) {
    const char* m = db ? sqlite3_errmsg(db) : nullptr;
    return m ? std::string(m) : std::string("unknown");
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw InfrastructureError("SQLite prepare failed: " + sqlite_message(db_) + " [" + sql + "]");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept : db_(other.db_), stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(stmt_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, const char* v) {
    return bind(idx, std::string(v));
}

Statement& Statement::bind(int idx, int64_t v) {
    sqlite3_bind_int64(stmt_, idx, (sqlite3_int64)v);
    return *this;
}

Statement& Statement::bind(int idx, int v) {
    sqlite3_bind_int64(stmt_, idx, (sqlite3_int64)v);
    return *this;
}

Statement& Statement::bind(int idx, double v) {
    sqlite3_bind_double(stmt_, idx, v);
    return *this;
}

Statement& Statement::bind(int idx, bool v) {
    sqlite3_bind_int(stmt_, idx, v ? 1 : 0);
    return *this;
}

Statement& Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
    return *this;
}

Statement& Statement::bind(int idx, const std::optional<std::string>& v) {
    return v ? bind(idx, *v) : bind_null(idx);
}

Statement& Statement::bind(int idx, const std::optional<int64_t>& v) {
    return v ? bind(idx, *v) : bind_null(idx);
}

Statement& Statement::bind(int idx, const std::optional<double>& v) {
    return v ? bind(idx, *v) : bind_null(idx);
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw InfrastructureError("SQLite step failed: " + sqlite_message(db_));
}

void Statement::run() {
    while (step()) {}
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

bool Statement::is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

std::string Statement::text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(stmt_, col)) : std::string();
}

std::optional<std::string> Statement::opt_text(int col) const {
    if (is_null(col)) return std::nullopt;
    return text(col);
}

int64_t Statement::int64(int col) const {
    return (int64_t)sqlite3_column_int64(stmt_, col);
}

std::optional<int64_t> Statement::opt_int64(int col) const {
    if (is_null(col)) return std::nullopt;
    return int64(col);
}

double Statement::real(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::optional<double> Statement::opt_real(int col) const {
    if (is_null(col)) return std::nullopt;
    return real(col);
}

Database::Database(const std::string& path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = sqlite_message(db_);
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw InfrastructureError("Failed to open SQLite DB: " + path + " (" + msg + ")");
    }
    sqlite3_busy_timeout(db_, 5000);
    if (path != ":memory:") exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw InfrastructureError("SQLite error: " + msg);
    }
}

Statement Database::prepare(const std::string& sql) {
    return Statement(db_, sql);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

bool Database::ping() {
    try {
        auto guard = lock();
        Statement st(db_, "SELECT 1;");
        return st.step();
    } catch (const InfrastructureError& e) {
        std::cerr << "[db] ping failed: " << e.what() << std::endl;
        return false;
    }
}

Transaction::Transaction(Database& db) : db_(db), lock_(db.mtx_) {
    if (db_.tx_depth_++ == 0) {
        outer_ = true;
        try {
            db_.exec("BEGIN IMMEDIATE;");
        } catch (...) {
            --db_.tx_depth_;
            throw;
        }
    }
}

Transaction::~Transaction() {
    if (!done_ && outer_) {
        try {
            db_.exec("ROLLBACK;");
        } catch (const std::exception& e) {
            std::cerr << "[db] rollback failed: " << e.what() << std::endl;
        }
    }
    --db_.tx_depth_;
}

void Transaction::commit() {
    if (done_) return;
    if (outer_) db_.exec("COMMIT;");
    done_ = true;
}
