#include <localsync/cache/types.hpp>
#include <localsync/cache/errors.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <utility>

namespace localsync::cache
{
    namespace
    {
        bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
                return false;

            for (std::size_t i = 0; i < a.size(); ++i)
            {
                const auto ca = static_cast<unsigned char>(a[i]);
                const auto cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb))
                    return false;
            }
            return true;
        }

        template <typename Enum, std::size_t N>
        std::optional<Enum> lookup(const std::array<std::pair<Enum, std::string_view>, N> &table,
                                   std::string_view s) noexcept
        {
            auto it = std::find_if(table.begin(), table.end(),
                                   [s](const auto &entry)
                                   { return iequals(entry.second, s); });
            if (it == table.end())
                return std::nullopt;
            return it->first;
        }

        constexpr std::array<std::pair<MessageStatus, std::string_view>, 5> kStatusNames{{
            {MessageStatus::Pending, "pending"},
            {MessageStatus::Sent, "sent"},
            {MessageStatus::Delivered, "delivered"},
            {MessageStatus::Read, "read"},
            {MessageStatus::Failed, "failed"},
        }};

        constexpr std::array<std::pair<SyncStatus, std::string_view>, 3> kSyncNames{{
            {SyncStatus::Synced, "synced"},
            {SyncStatus::Pending, "pending"},
            {SyncStatus::Failed, "failed"},
        }};

        constexpr std::array<std::pair<MessageKind, std::string_view>, 10> kKindNames{{
            {MessageKind::Text, "text"},
            {MessageKind::Image, "image"},
            {MessageKind::Video, "video"},
            {MessageKind::Audio, "audio"},
            {MessageKind::File, "file"},
            {MessageKind::System, "system"},
            {MessageKind::Reply, "reply"},
            {MessageKind::Forward, "forward"},
            {MessageKind::Thread, "thread"},
            {MessageKind::Announcement, "announcement"},
        }};

        template <typename Enum, std::size_t N>
        std::string_view name_of(const std::array<std::pair<Enum, std::string_view>, N> &table,
                                 Enum value) noexcept
        {
            for (const auto &entry : table)
            {
                if (entry.first == value)
                    return entry.second;
            }
            return "unknown";
        }
    } // namespace

    Timestamp now_ms() noexcept
    {
        using clock = std::chrono::system_clock;
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   clock::now().time_since_epoch())
            .count();
    }

    std::string_view to_string(MessageStatus s) noexcept { return name_of(kStatusNames, s); }
    std::string_view to_string(SyncStatus s) noexcept { return name_of(kSyncNames, s); }
    std::string_view to_string(MessageKind k) noexcept { return name_of(kKindNames, k); }

    std::optional<MessageStatus> parse_message_status(std::string_view s) noexcept
    {
        return lookup(kStatusNames, s);
    }

    std::optional<SyncStatus> parse_sync_status(std::string_view s) noexcept
    {
        return lookup(kSyncNames, s);
    }

    std::optional<MessageKind> parse_message_kind(std::string_view s) noexcept
    {
        return lookup(kKindNames, s);
    }

    std::string CachedMessage::identity_key() const
    {
        if (serverId && !serverId->empty())
            return *serverId;
        if (optimisticId && !optimisticId->empty())
            return *optimisticId;
        return {};
    }

    std::string fallback_display_name(const std::string &senderId)
    {
        return "User " + senderId.substr(0, 8);
    }

    std::string_view to_string(ErrorKind kind) noexcept
    {
        switch (kind)
        {
        case ErrorKind::StorageUnavailable:
            return "StorageUnavailable";
        case ErrorKind::WriteContention:
            return "WriteContention";
        case ErrorKind::WriteFailed:
            return "WriteFailed";
        case ErrorKind::ValidationError:
            return "ValidationError";
        case ErrorKind::StorageError:
            return "StorageError";
        }
        return "Unknown";
    }

} // namespace localsync::cache
