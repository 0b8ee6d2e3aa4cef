#ifndef LOCALSYNC_CACHE_SRC_SQLITE_UTIL_HPP
#define LOCALSYNC_CACHE_SRC_SQLITE_UTIL_HPP

// Internal helpers shared by the SQLite-backed stores. Not installed.

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <sqlite3.h>

#include <localsync/cache/errors.hpp>

#include <vix/utils/Logger.hpp>

namespace localsync::cache::detail
{
    /// Translate a SQLite result code into the cache error taxonomy.
    inline void sqlite_check(int rc, sqlite3 *db, const char *stage)
    {
        if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE)
            return;

        std::string msg = "[cache][sqlite] ";
        msg += stage;
        msg += " error: ";
        msg += db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);

        const int primary = rc & 0xff;
        if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED)
            throw WriteContention(msg);

        throw StorageError(msg, rc);
    }

    /// Owns one prepared statement.
    class Statement
    {
    public:
        Statement(sqlite3 *db, const std::string &sql, const char *stage)
            : db_(db)
        {
            int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
            if (rc != SQLITE_OK)
            {
                if (stmt_)
                {
                    sqlite3_finalize(stmt_);
                    stmt_ = nullptr;
                }
                sqlite_check(rc, db_, stage);
            }
        }

        ~Statement()
        {
            if (stmt_)
                sqlite3_finalize(stmt_);
        }

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;

        [[nodiscard]] sqlite3_stmt *get() const noexcept { return stmt_; }

        /// true when a row is available, false when done.
        bool step(const char *stage)
        {
            int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW)
                return true;
            if (rc == SQLITE_DONE)
                return false;
            sqlite_check(rc, db_, stage);
            return false;
        }

    private:
        sqlite3 *db_;
        sqlite3_stmt *stmt_{nullptr};
    };

    inline void bind_text(sqlite3_stmt *st, int idx, std::string_view v)
    {
        sqlite3_bind_text(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }

    inline void bind_opt_text(sqlite3_stmt *st, int idx, const std::optional<std::string> &v)
    {
        if (v)
            bind_text(st, idx, *v);
        else
            sqlite3_bind_null(st, idx);
    }

    inline void bind_int64(sqlite3_stmt *st, int idx, std::int64_t v)
    {
        sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
    }

    inline void bind_opt_int64(sqlite3_stmt *st, int idx, const std::optional<std::int64_t> &v)
    {
        if (v)
            bind_int64(st, idx, *v);
        else
            sqlite3_bind_null(st, idx);
    }

    inline void bind_bool(sqlite3_stmt *st, int idx, bool v)
    {
        sqlite3_bind_int(st, idx, v ? 1 : 0);
    }

    inline std::string col_text(sqlite3_stmt *st, int col)
    {
        const unsigned char *txt = sqlite3_column_text(st, col);
        if (!txt)
            return {};
        return std::string(reinterpret_cast<const char *>(txt),
                           static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
    }

    inline std::optional<std::string> col_opt_text(sqlite3_stmt *st, int col)
    {
        if (sqlite3_column_type(st, col) == SQLITE_NULL)
            return std::nullopt;
        return col_text(st, col);
    }

    inline std::int64_t col_int64(sqlite3_stmt *st, int col)
    {
        return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
    }

    inline std::optional<std::int64_t> col_opt_int64(sqlite3_stmt *st, int col)
    {
        if (sqlite3_column_type(st, col) == SQLITE_NULL)
            return std::nullopt;
        return col_int64(st, col);
    }

    inline bool col_bool(sqlite3_stmt *st, int col)
    {
        return sqlite3_column_int(st, col) != 0;
    }

    /// Run a statement-less SQL string (DDL, PRAGMA).
    inline void exec_sql(sqlite3 *db, const char *sql, const char *stage)
    {
        char *errmsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK)
        {
            std::string msg = "[cache][sqlite] ";
            msg += stage;
            msg += " error: ";
            if (errmsg)
            {
                msg += errmsg;
                sqlite3_free(errmsg);
            }

            const int primary = rc & 0xff;
            if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED)
                throw WriteContention(msg);
            throw StorageError(msg, rc);
        }
    }

    /**
     * Run fn between BEGIN IMMEDIATE and COMMIT, rolling back if it throws.
     * depth counts open scopes on this connection: a nested call joins the
     * outer transaction instead of starting its own.
     */
    inline void run_transaction(sqlite3 *db, int &depth, const char *component,
                                const std::function<void()> &fn)
    {
        if (depth > 0)
        {
            ++depth;
            try
            {
                fn();
            }
            catch (...)
            {
                --depth;
                throw;
            }
            --depth;
            return;
        }

        exec_sql(db, "BEGIN IMMEDIATE;", "begin transaction");
        depth = 1;

        try
        {
            fn();
            exec_sql(db, "COMMIT;", "commit transaction");
            depth = 0;
        }
        catch (...)
        {
            depth = 0;
            char *errmsg = nullptr;
            if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, &errmsg) != SQLITE_OK)
            {
                vix::utils::Logger::getInstance().log(vix::utils::Logger::Level::WARN,
                                                      "[cache][{}] rollback failed: {}", component,
                                                      errmsg ? errmsg : "unknown error");
            }
            if (errmsg)
                sqlite3_free(errmsg);
            throw;
        }
    }

} // namespace localsync::cache::detail

#endif // LOCALSYNC_CACHE_SRC_SQLITE_UTIL_HPP
