#include <localsync/cache/Lifecycle.hpp>

namespace localsync::cache::lifecycle
{
    int rank(MessageStatus status) noexcept
    {
        switch (status)
        {
        case MessageStatus::Pending:
            return 0;
        case MessageStatus::Sent:
            return 1;
        case MessageStatus::Delivered:
            return 2;
        case MessageStatus::Read:
            return 3;
        case MessageStatus::Failed:
            break;
        }
        return -1;
    }

    bool is_terminal(MessageStatus status) noexcept
    {
        return status == MessageStatus::Read;
    }

    bool can_transition(MessageStatus from, MessageStatus to) noexcept
    {
        if (from == to)
            return true;

        if (to == MessageStatus::Failed)
            return from == MessageStatus::Pending || from == MessageStatus::Sent;

        if (from == MessageStatus::Failed)
            return false; // resend only

        return rank(to) > rank(from);
    }

    bool can_resend(MessageStatus from) noexcept
    {
        return from == MessageStatus::Failed;
    }

    MessageStatus merge_server_status(MessageStatus local, MessageStatus server) noexcept
    {
        if (local == MessageStatus::Pending || local == MessageStatus::Failed)
            return server;

        // local is a confirmed state
        if (server == MessageStatus::Failed)
            return local;

        return rank(server) >= rank(local) ? server : local;
    }

} // namespace localsync::cache::lifecycle
