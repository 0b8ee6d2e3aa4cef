#ifndef LOCALSYNC_CACHE_ERRORS_HPP
#define LOCALSYNC_CACHE_ERRORS_HPP

/**
 * @file errors.hpp
 * @brief Exception taxonomy of the cache.
 *
 * Storage failures are translated into these types at the store boundary.
 * Only WriteContention is retried (by the TransactionSerializer); every
 * other kind reaches the caller as-is. Read failures are never thrown from
 * the cache handle, they are reported through MessagePage::status.
 */

#include <stdexcept>
#include <string>
#include <string_view>

namespace localsync::cache
{
    enum class ErrorKind
    {
        StorageUnavailable,
        WriteContention,
        WriteFailed,
        ValidationError,
        StorageError
    };

    std::string_view to_string(ErrorKind kind) noexcept;

    class CacheError : public std::runtime_error
    {
    public:
        CacheError(ErrorKind kind, const std::string &what)
            : std::runtime_error(what), kind_(kind)
        {
        }

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    /// The store could not be initialized, or was never opened.
    class StorageUnavailable : public CacheError
    {
    public:
        explicit StorageUnavailable(const std::string &what)
            : CacheError(ErrorKind::StorageUnavailable, what) {}
    };

    /// Transient lock contention (SQLITE_BUSY / SQLITE_LOCKED).
    class WriteContention : public CacheError
    {
    public:
        explicit WriteContention(const std::string &what)
            : CacheError(ErrorKind::WriteContention, what) {}
    };

    /// A write unit failed after every retry attempt.
    class WriteFailed : public CacheError
    {
    public:
        WriteFailed(const std::string &what, int attempts)
            : CacheError(ErrorKind::WriteFailed, what), attempts_(attempts) {}

        [[nodiscard]] int attempts() const noexcept { return attempts_; }

    private:
        int attempts_;
    };

    /// A record is missing a required field.
    class ValidationError : public CacheError
    {
    public:
        explicit ValidationError(const std::string &what)
            : CacheError(ErrorKind::ValidationError, what) {}
    };

    /// Any other SQLite failure.
    class StorageError : public CacheError
    {
    public:
        StorageError(const std::string &what, int sqliteCode)
            : CacheError(ErrorKind::StorageError, what), code_(sqliteCode) {}

        [[nodiscard]] int sqlite_code() const noexcept { return code_; }

    private:
        int code_;
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_ERRORS_HPP
