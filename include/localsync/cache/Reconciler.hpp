#ifndef LOCALSYNC_CACHE_RECONCILER_HPP
#define LOCALSYNC_CACHE_RECONCILER_HPP

/**
 * @file Reconciler.hpp
 * @brief Merges authoritative server batches into the message store.
 *
 * Identity resolution, per inbound record:
 *   1. serverId set      → existing row with that server id
 *   2. optimisticId set  → existing row with that optimistic id
 *   3. otherwise         → new row
 *
 * When both ids resolve to different rows (a confirmation raced a history
 * page), the optimistic row is folded into the server row and removed.
 *
 * The whole batch, cursor included, is applied in one store transaction.
 * Callers run reconcile() as a TransactionSerializer unit.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <localsync/cache/MessageStore.hpp>
#include <localsync/cache/types.hpp>

namespace localsync::cache
{
    struct ReconcileOptions
    {
        /// Overwrites cursor.hasMoreHistory when set (history pages know this).
        std::optional<bool> hasMoreHistory;

        /// Another sync of the same conversation is still in flight.
        bool otherSyncInFlight = false;

        /// Clock used for defaults; 0 means now_ms().
        Timestamp now = 0;
    };

    struct ReconcileReport
    {
        std::size_t inserted = 0;
        std::size_t updated = 0;
        std::size_t collapsed = 0; ///< optimistic duplicates folded into their server row
        std::size_t rejected = 0;  ///< records without identity or sender
        std::optional<Timestamp> newestTimestamp;

        [[nodiscard]] std::size_t applied() const noexcept { return inserted + updated + collapsed; }
    };

    class Reconciler
    {
    public:
        explicit Reconciler(IMessageStore &store) : store_(store) {}

        ReconcileReport reconcile(const std::string &conversationId,
                                  const std::vector<InboundMessage> &records,
                                  const ReconcileOptions &options = {});

        /**
         * @brief Apply the fields an inbound record supplies onto a cached row.
         *
         * Supplied fields overwrite, absent ones keep the local value.
         * isEditing is never touched. The result is SYNCED.
         */
        static CachedMessage merge(const CachedMessage &local, const InboundMessage &in);

        /// Build a brand-new row, or nullopt when sender or identity is missing.
        static std::optional<CachedMessage> materialize(const std::string &conversationId,
                                                        const InboundMessage &in,
                                                        Timestamp now);

    private:
        IMessageStore &store_;
    };

} // namespace localsync::cache

#endif // LOCALSYNC_CACHE_RECONCILER_HPP
