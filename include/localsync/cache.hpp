#pragma once

//
// localsync: message cache umbrella header
//
// Usage:
//   #include <localsync/cache.hpp>
//
// Pulls in every building block of the cache:
//
//   Records & errors
//   ----------------
//   - localsync::cache::CachedMessage / InboundMessage  → message records
//   - localsync::cache::ConversationSyncCursor          → per-conversation sync state
//   - localsync::cache::CacheError and subclasses       → error taxonomy
//   - localsync::cache::Config                          → tunables (from vix::config)
//
//   Storage
//   -------
//   - localsync::cache::IMessageStore        → storage interface
//   - localsync::cache::SqliteMessageStore   → SQLite (WAL) implementation
//   - localsync::cache::CommunityStore       → community / space metadata cache
//
//   Write path
//   ----------
//   - localsync::cache::TransactionSerializer → single FIFO write queue with retry
//   - localsync::cache::lifecycle::*          → delivery status state machine
//   - localsync::cache::Reconciler            → merges server batches
//   - localsync::cache::RetentionSweeper      → periodic eviction
//
//   Handle & metrics
//   ----------------
//   - localsync::cache::MessageCache          → the object applications hold
//   - localsync::cache::CacheMetricsMonitor   → hit/miss/latency counters
//

#include <localsync/cache/types.hpp>
#include <localsync/cache/errors.hpp>
#include <localsync/cache/config.hpp>

#include <localsync/cache/MessageStore.hpp>
#include <localsync/cache/SqliteMessageStore.hpp>
#include <localsync/cache/CommunityStore.hpp>

#include <localsync/cache/TransactionSerializer.hpp>
#include <localsync/cache/Lifecycle.hpp>
#include <localsync/cache/Reconciler.hpp>
#include <localsync/cache/RetentionSweeper.hpp>

#include <localsync/cache/Metrics.hpp>
#include <localsync/cache/MessageCache.hpp>
