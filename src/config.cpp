#include <localsync/cache/config.hpp>

#include <algorithm>

namespace localsync::cache
{
    Config Config::from_core(const vix::config::Config &core)
    {
        Config cfg;

        if (core.has("cache.retention_days"))
        {
            auto v = core.getInt("cache.retention_days", cfg.retentionDays);
            cfg.retentionDays = std::max(0, v);
        }

        if (core.has("cache.cleanup_interval_hours"))
        {
            auto v = core.getInt("cache.cleanup_interval_hours", static_cast<int>(cfg.cleanupInterval.count()));
            cfg.cleanupInterval = std::chrono::hours(std::max(1, v)); // min 1h
        }

        if (core.has("cache.auto_cleanup"))
        {
            cfg.autoCleanup = core.getBool("cache.auto_cleanup", cfg.autoCleanup);
        }

        if (core.has("cache.max_write_attempts"))
        {
            auto v = core.getInt("cache.max_write_attempts", cfg.maxWriteAttempts);
            cfg.maxWriteAttempts = std::clamp(v, 1, 10);
        }

        if (core.has("cache.retry_base_delay_ms"))
        {
            auto v = core.getInt("cache.retry_base_delay_ms", static_cast<int>(cfg.retryBaseDelay.count()));
            cfg.retryBaseDelay = std::chrono::milliseconds(std::max(0, v));
        }

        if (core.has("cache.profile_ttl_hours"))
        {
            auto v = core.getInt("cache.profile_ttl_hours", static_cast<int>(cfg.profileTtl.count()));
            cfg.profileTtl = std::chrono::hours(std::max(1, v));
        }

        if (core.has("cache.busy_timeout_ms"))
        {
            auto v = core.getInt("cache.busy_timeout_ms", static_cast<int>(cfg.busyTimeout.count()));
            cfg.busyTimeout = std::chrono::milliseconds(std::max(0, v));
        }

        if (core.has("cache.max_page_size"))
        {
            auto v = core.getInt("cache.max_page_size", static_cast<int>(cfg.maxPageSize));
            cfg.maxPageSize = static_cast<std::size_t>(std::max(1, v));
        }

        if (core.has("cache.default_page_size"))
        {
            auto v = core.getInt("cache.default_page_size", static_cast<int>(cfg.defaultPageSize));
            cfg.defaultPageSize = static_cast<std::size_t>(std::max(1, v));
        }
        cfg.defaultPageSize = std::min(cfg.defaultPageSize, cfg.maxPageSize);

        if (core.has("cache.community_retention_days"))
        {
            auto v = core.getInt("cache.community_retention_days", cfg.communityRetentionDays);
            cfg.communityRetentionDays = std::max(0, v);
        }

        return cfg;
    }

} // namespace localsync::cache
