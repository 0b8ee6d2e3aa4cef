#ifndef LOCALSYNC_CACHE_LIFECYCLE_HPP
#define LOCALSYNC_CACHE_LIFECYCLE_HPP

/**
 * @file Lifecycle.hpp
 * @brief Delivery status state machine of a message.
 *
 *   PENDING → SENT → DELIVERED → READ     (forward skips allowed)
 *   PENDING | SENT → FAILED
 *   FAILED → PENDING                       (explicit resend only)
 *
 * Same-state transitions are accepted as no-ops.
 */

#include <localsync/cache/types.hpp>

namespace localsync::cache::lifecycle
{
    /// Position on the forward path (PENDING=0 ... READ=3). FAILED has no rank (-1).
    [[nodiscard]] int rank(MessageStatus status) noexcept;

    /// READ is the only state nothing can leave.
    [[nodiscard]] bool is_terminal(MessageStatus status) noexcept;

    /// Transitions allowed for status updates (resend excluded).
    [[nodiscard]] bool can_transition(MessageStatus from, MessageStatus to) noexcept;

    /// FAILED → PENDING, the only backwards edge.
    [[nodiscard]] bool can_resend(MessageStatus from) noexcept;

    /**
     * @brief Status a row takes when the server reports `server` for it.
     *
     * The server wins, except that a row already SENT/DELIVERED/READ
     * locally never moves back to an earlier confirmed state.
     */
    [[nodiscard]] MessageStatus merge_server_status(MessageStatus local, MessageStatus server) noexcept;

} // namespace localsync::cache::lifecycle

#endif // LOCALSYNC_CACHE_LIFECYCLE_HPP
