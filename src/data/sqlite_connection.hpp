#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <sqlite3.h>

using namespace std;

namespace sqlite
{
    // Prepared statement, finalized on destruction. Bind indexes start at 1, column indexes at 0
    class Statement
    {
    public:
        Statement(sqlite3 *db, const string &sql);
        ~Statement();

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;
        Statement(Statement &&other) noexcept;

        Statement &bind(int index, const string &value);
        Statement &bind(int index, const char *value);
        Statement &bind(int index, int value);
        Statement &bind(int index, int64_t value);
        Statement &bind(int index, double value);
        Statement &bind(int index, bool value);
        Statement &bindNull(int index);

        template <typename T>
        Statement &bind(int index, const optional<T> &value)
        {
            return value ? bind(index, *value) : bindNull(index);
        }

        // true while a row is available, false when done. Throws on error
        bool step();
        void reset();

        bool isNull(int column) const;
        int getInt(int column) const;
        int64_t getInt64(int column) const;
        double getDouble(int column) const;
        string getText(int column) const; // NULL -> ""

    private:
        sqlite3 *db_;
        sqlite3_stmt *stmt_ = nullptr;
    };

    // One open database handle. Throws runtime_error when the file cannot be opened
    class Connection
    {
    public:
        explicit Connection(const string &path);
        ~Connection();

        Connection(const Connection &) = delete;
        Connection &operator=(const Connection &) = delete;

        void execute(const string &sql);
        Statement prepare(const string &sql);

        int64_t lastInsertId() const;
        int changes() const;

        sqlite3 *handle() const { return db_; }

    private:
        sqlite3 *db_ = nullptr;
    };

    // Rolls back unless commit() was called
    class Transaction
    {
    public:
        explicit Transaction(Connection &connection);
        ~Transaction();

        void commit();

    private:
        Connection &connection_;
        bool committed_ = false;
    };

} // namespace sqlite
