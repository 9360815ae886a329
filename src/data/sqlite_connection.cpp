#include "sqlite_connection.hpp"
#include "utils.hpp"

#include <filesystem>
#include <stdexcept>

using namespace std;

namespace sqlite
{
    Statement::Statement(sqlite3 *db, const string &sql) : db_(db)
    {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK)
        {
            string message = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
            throw runtime_error("Failed to prepare statement: " + message);
        }
    }

    Statement::Statement(Statement &&other) noexcept : db_(other.db_), stmt_(other.stmt_)
    {
        other.stmt_ = nullptr;
    }

    Statement::~Statement()
    {
        if (stmt_)
            sqlite3_finalize(stmt_);
    }

    Statement &Statement::bind(int index, const string &value)
    {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
        return *this;
    }

    Statement &Statement::bind(int index, const char *value)
    {
        return value ? bind(index, string(value)) : bindNull(index);
    }

    Statement &Statement::bind(int index, int value)
    {
        sqlite3_bind_int(stmt_, index, value);
        return *this;
    }

    Statement &Statement::bind(int index, int64_t value)
    {
        sqlite3_bind_int64(stmt_, index, value);
        return *this;
    }

    Statement &Statement::bind(int index, double value)
    {
        sqlite3_bind_double(stmt_, index, value);
        return *this;
    }

    Statement &Statement::bind(int index, bool value)
    {
        sqlite3_bind_int(stmt_, index, value ? 1 : 0);
        return *this;
    }

    Statement &Statement::bindNull(int index)
    {
        sqlite3_bind_null(stmt_, index);
        return *this;
    }

    bool Statement::step()
    {
        int result = sqlite3_step(stmt_);
        if (result == SQLITE_ROW)
            return true;
        if (result == SQLITE_DONE)
            return false;

        throw runtime_error("Statement failed: " + string(sqlite3_errmsg(db_)));
    }

    void Statement::reset()
    {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool Statement::isNull(int column) const
    {
        return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
    }

    int Statement::getInt(int column) const
    {
        return sqlite3_column_int(stmt_, column);
    }

    int64_t Statement::getInt64(int column) const
    {
        return sqlite3_column_int64(stmt_, column);
    }

    double Statement::getDouble(int column) const
    {
        return sqlite3_column_double(stmt_, column);
    }

    string Statement::getText(int column) const
    {
        const unsigned char *text = sqlite3_column_text(stmt_, column);
        return text ? string(reinterpret_cast<const char *>(text)) : string();
    }

    Connection::Connection(const string &path)
    {
        error_code ec;
        filesystem::path parent = filesystem::path(path).parent_path();
        if (!parent.empty())
            filesystem::create_directories(parent, ec);

        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK)
        {
            string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
            sqlite3_close(db_);
            db_ = nullptr;
            throw runtime_error("Cannot open database " + path + ": " + message);
        }

        // Capture and HTTP threads may hit the same file
        sqlite3_busy_timeout(db_, 5000);
        execute("PRAGMA foreign_keys = ON");
    }

    Connection::~Connection()
    {
        if (db_)
            sqlite3_close(db_);
    }

    void Connection::execute(const string &sql)
    {
        char *error = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK)
        {
            string message = error ? error : "unknown error";
            sqlite3_free(error);
            throw runtime_error("SQL error: " + message);
        }
    }

    Statement Connection::prepare(const string &sql)
    {
        return Statement(db_, sql);
    }

    int64_t Connection::lastInsertId() const
    {
        return sqlite3_last_insert_rowid(db_);
    }

    int Connection::changes() const
    {
        return sqlite3_changes(db_);
    }

    Transaction::Transaction(Connection &connection) : connection_(connection)
    {
        connection_.execute("BEGIN");
    }

    Transaction::~Transaction()
    {
        if (committed_)
            return;

        try
        {
            connection_.execute("ROLLBACK");
        }
        catch (const exception &e)
        {
            log_error("Rollback failed: " + string(e.what()));
        }
    }

    void Transaction::commit()
    {
        connection_.execute("COMMIT");
        committed_ = true;
    }

} // namespace sqlite
