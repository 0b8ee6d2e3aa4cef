#include <localsync/cache/Reconciler.hpp>
#include <localsync/cache/Lifecycle.hpp>
#include <localsync/cache/errors.hpp>

#include <algorithm>

#include <vix/utils/Logger.hpp>

namespace localsync::cache
{
    static vix::utils::Logger &logger = vix::utils::Logger::getInstance();
    using Logger = vix::utils::Logger;

    namespace
    {
        template <typename T>
        void overwrite(T &dst, const std::optional<T> &src)
        {
            if (src)
                dst = *src;
        }

        template <typename T>
        void overwrite(std::optional<T> &dst, const std::optional<T> &src)
        {
            if (src)
                dst = src;
        }

        std::string describe(const InboundMessage &in)
        {
            if (in.serverId)
                return "server:" + *in.serverId;
            if (in.optimisticId)
                return "optimistic:" + *in.optimisticId;
            return "<no id>";
        }
    } // namespace

    CachedMessage Reconciler::merge(const CachedMessage &local, const InboundMessage &in)
    {
        CachedMessage out = local;

        overwrite(out.serverId, in.serverId);
        overwrite(out.optimisticId, in.optimisticId); // kept when the server omits it
        overwrite(out.senderId, in.senderId);
        overwrite(out.senderName, in.senderName);
        overwrite(out.senderAvatar, in.senderAvatar);
        overwrite(out.kind, in.kind);
        overwrite(out.content, in.content);
        overwrite(out.serverTimestamp, in.timestamp);
        overwrite(out.editedAt, in.editedAt);
        overwrite(out.deliveredAt, in.deliveredAt);
        overwrite(out.readAt, in.readAt);
        overwrite(out.deletedAt, in.deletedAt);
        overwrite(out.replyTo, in.replyTo);
        overwrite(out.isPinned, in.isPinned);
        overwrite(out.attachment, in.attachment);
        overwrite(out.metadata, in.metadata);

        if (in.status)
            out.status = lifecycle::merge_server_status(local.status, *in.status);

        if (out.senderName.empty())
            out.senderName = fallback_display_name(out.senderId);

        out.syncStatus = SyncStatus::Synced;
        return out;
    }

    std::optional<CachedMessage> Reconciler::materialize(const std::string &conversationId,
                                                         const InboundMessage &in,
                                                         Timestamp now)
    {
        if (!in.senderId || in.senderId->empty())
            return std::nullopt;
        if (!in.serverId && !in.optimisticId)
            return std::nullopt;

        CachedMessage msg;
        msg.conversationId = conversationId;
        msg.serverId = in.serverId;
        msg.optimisticId = in.optimisticId;
        msg.senderId = *in.senderId;
        msg.senderName = (in.senderName && !in.senderName->empty())
                             ? *in.senderName
                             : fallback_display_name(*in.senderId);
        msg.senderAvatar = in.senderAvatar;
        msg.kind = in.kind.value_or(MessageKind::Text);
        msg.content = in.content.value_or(std::string{});
        msg.status = in.status.value_or(MessageStatus::Delivered);
        msg.syncStatus = SyncStatus::Synced;
        msg.serverTimestamp = in.timestamp;
        msg.clientTimestamp = in.timestamp.value_or(now);
        msg.localTimestamp = now;
        msg.editedAt = in.editedAt;
        msg.deliveredAt = in.deliveredAt;
        msg.readAt = in.readAt;
        msg.deletedAt = in.deletedAt;
        msg.replyTo = in.replyTo;
        msg.isPinned = in.isPinned.value_or(false);
        msg.attachment = in.attachment;
        if (in.metadata)
            msg.metadata = *in.metadata;

        return msg;
    }

    ReconcileReport Reconciler::reconcile(const std::string &conversationId,
                                          const std::vector<InboundMessage> &records,
                                          const ReconcileOptions &options)
    {
        if (conversationId.empty())
            throw ValidationError("reconcile: empty conversation id");

        const Timestamp now = options.now != 0 ? options.now : now_ms();
        ReconcileReport report;

        store_.transaction(
            [&]
            {
                for (const auto &in : records)
                {
                    if (!in.serverId && !in.optimisticId)
                    {
                        ++report.rejected;
                        logger.log(Logger::Level::WARN,
                                   "[cache][Reconciler] record without identity skipped in {}",
                                   conversationId);
                        continue;
                    }

                    std::optional<CachedMessage> byServer;
                    std::optional<CachedMessage> byOptimistic;

                    if (in.serverId)
                        byServer = store_.find_by_server_id(conversationId, *in.serverId);
                    if (in.optimisticId)
                        byOptimistic = store_.find_by_optimistic_id(conversationId, *in.optimisticId);

                    if (byServer && byOptimistic && byServer->sequence != byOptimistic->sequence)
                    {
                        // Drop the optimistic row first: its optimistic id is about
                        // to land on the server row.
                        CachedMessage merged = merge(*byServer, in);
                        merged.isEditing = byServer->isEditing || byOptimistic->isEditing;

                        store_.remove_message(byOptimistic->sequence);
                        store_.upsert_message(merged);
                        ++report.collapsed;

                        logger.log(Logger::Level::DEBUG,
                                   "[cache][Reconciler] collapsed optimistic {} into {} ({})",
                                   *in.optimisticId, *in.serverId, conversationId);
                    }
                    else if (byServer || byOptimistic)
                    {
                        const CachedMessage &local = byServer ? *byServer : *byOptimistic;
                        store_.upsert_message(merge(local, in));
                        ++report.updated;
                    }
                    else
                    {
                        auto fresh = materialize(conversationId, in, now);
                        if (!fresh)
                        {
                            ++report.rejected;
                            logger.log(Logger::Level::WARN,
                                       "[cache][Reconciler] record {} has no sender, skipped in {}",
                                       describe(in), conversationId);
                            continue;
                        }

                        store_.upsert_message(*fresh);
                        ++report.inserted;
                    }

                    if (in.timestamp)
                    {
                        report.newestTimestamp = report.newestTimestamp
                                                     ? std::max(*report.newestTimestamp, *in.timestamp)
                                                     : *in.timestamp;
                    }
                }

                auto cursor = store_.get_sync_cursor(conversationId).value_or(ConversationSyncCursor{});
                cursor.conversationId = conversationId;

                if (report.newestTimestamp)
                {
                    cursor.lastSyncTimestamp = std::max(cursor.lastSyncTimestamp, *report.newestTimestamp);
                    cursor.lastMessageTimestamp = std::max(cursor.lastMessageTimestamp, *report.newestTimestamp);
                }

                cursor.cachedMessageCount = store_.count_messages(conversationId);
                if (options.hasMoreHistory)
                    cursor.hasMoreHistory = *options.hasMoreHistory;
                cursor.syncInProgress = options.otherSyncInFlight;

                store_.upsert_sync_cursor(cursor);
            });

        logger.log(Logger::Level::DEBUG,
                   "[cache][Reconciler] {}: {} inserted, {} updated, {} collapsed, {} rejected",
                   conversationId, report.inserted, report.updated, report.collapsed, report.rejected);

        return report;
    }

} // namespace localsync::cache
