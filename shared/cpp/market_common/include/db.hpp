#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

class Database;

// Prepared statement bound to one connection. Bind indexes are 1-based,
// column indexes 0-based, as in the sqlite3 C API.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();
    Statement(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    Statement& operator=(Statement&&) = delete;

    Statement& bind(int idx, const std::string& v);
    Statement& bind(int idx, const char* v);
    Statement& bind(int idx, int64_t v);
    Statement& bind(int idx, int v);
    Statement& bind(int idx, double v);
    Statement& bind(int idx, bool v);
    Statement& bind_null(int idx);
    Statement& bind(int idx, const std::optional<std::string>& v);
    Statement& bind(int idx, const std::optional<int64_t>& v);
    Statement& bind(int idx, const std::optional<double>& v);

    // true while rows remain; false once the statement is done.
    bool step();
    void run();
    void reset();

    bool is_null(int col) const;
    std::string text(int col) const;
    std::optional<std::string> opt_text(int col) const;
    int64_t int64(int col) const;
    std::optional<int64_t> opt_int64(int col) const;
    double real(int col) const;
    std::optional<double> opt_real(int col) const;

private:
    sqlite3* db_ {nullptr};
    sqlite3_stmt* stmt_ {nullptr};
};

// One serialized SQLite connection shared by the stores of a service.
// Compound operations hold lock() for their whole duration.
class Database {
public:
    explicit Database(const std::string& path);
    ~Database();
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);
    int changes() const;
    bool ping();

    std::unique_lock<std::recursive_mutex> lock() { return std::unique_lock<std::recursive_mutex>(mtx_); }

private:
    friend class Transaction;
    sqlite3* db_ {nullptr};
    std::recursive_mutex mtx_;
    int tx_depth_ {0};
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called.
// Nested transactions on the same thread join the outermost one.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
    bool outer_ {false};
    bool done_ {false};
};
