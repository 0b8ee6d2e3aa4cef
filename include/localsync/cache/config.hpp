#ifndef LOCALSYNC_CACHE_CONFIG_HPP
#define LOCALSYNC_CACHE_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Cache-specific configuration.
 *
 * @details
 * Wraps the core `vix::config::Config` into a strongly-typed structure used
 * by the store, the serializer and the sweeper. Keeps all cache knobs in one
 * place instead of scattering literals across the codebase.
 */

#include <chrono>
#include <cstddef>

#include <vix/config/Config.hpp>

namespace localsync::cache
{
    /**
     * @struct Config
     * @brief Tunables controlling cache behaviour.
     */
    struct Config
    {
        /// Age after which synced, unpinned messages become eligible for deletion.
        int retentionDays = 30;

        /// Period between two retention sweeps.
        std::chrono::hours cleanupInterval{24};

        /// Run the periodic sweep automatically after open().
        bool autoCleanup = true;

        /// Attempts per write unit on lock contention (first try included).
        int maxWriteAttempts = 3;

        /// Base of the linear backoff: delay = base * attempt.
        std::chrono::milliseconds retryBaseDelay{100};

        /// Lifetime of a cached user profile.
        std::chrono::hours profileTtl{24};

        /// SQLite busy handler timeout (0 = report contention immediately).
        std::chrono::milliseconds busyTimeout{50};

        std::size_t defaultPageSize = 50;
        std::size_t maxPageSize = 500;

        /// Inactive communities not fetched for this long are dropped.
        int communityRetentionDays = 7;

        /**
         * @brief Build a Config from the core Vix config.
         *
         * Expected keys (optional):
         *  - cache.retention_days           (int, days)
         *  - cache.cleanup_interval_hours   (int, hours)
         *  - cache.auto_cleanup             (bool)
         *  - cache.max_write_attempts       (int)
         *  - cache.retry_base_delay_ms      (int, ms)
         *  - cache.profile_ttl_hours        (int, hours)
         *  - cache.busy_timeout_ms          (int, ms)
         *  - cache.default_page_size        (int)
         *  - cache.max_page_size            (int)
         *  - cache.community_retention_days (int, days)
         */
        static Config from_core(const vix::config::Config &core);
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_CONFIG_HPP
