//
// examples/chat_cache_demo.cpp
//
// Walk through the life of a message in the local cache.
//
//   1) open the cache (reads before open() report NotReady)
//   2) show a draft immediately (PENDING, optimistic id)
//   3) the server confirms it: same row, now keyed by the server id
//   4) a history page arrives and is merged
//   5) read a page, print metrics
//
// Optional config file (config/config.json):
//
//   {
//     "cache": {
//       "retention_days": 30,
//       "cleanup_interval_hours": 24,
//       "max_write_attempts": 3
//     }
//   }
//

#include <filesystem>
#include <iostream>

#include <vix/config/Config.hpp>
#include <vix/utils/Logger.hpp>

#include <localsync/cache.hpp>

int main(int argc, char **argv)
{
    using namespace localsync::cache;
    using Logger = vix::utils::Logger;

    auto &log = Logger::getInstance();

    // ------------------------------------------------------------
    // 1) Config + cache handle
    // ------------------------------------------------------------
    const std::string dbPath = argc > 1 ? argv[1] : "chat-cache.db";

    Config config;
    if (std::filesystem::exists("config/config.json"))
    {
        vix::config::Config core{"config/config.json"};
        config = Config::from_core(core);
    }

    MessageCache cache{dbPath, config};

    auto cold = cache.get_messages("general");
    if (cold.status == QueryStatus::NotReady)
        log.log(Logger::Level::INFO, "[demo] cache not ready yet, a UI would show a spinner");

    try
    {
        cache.open();
    }
    catch (const StorageUnavailable &e)
    {
        log.log(Logger::Level::ERROR, "[demo] cannot open {}: {}", dbPath, e.what());
        return 1;
    }

    cache.set_visible_conversation("general");
    cache.on_refresh(
        [&log](const std::string &conversationId, const ReconcileReport &report)
        {
            log.log(Logger::Level::INFO, "[demo] refresh {}: +{} ~{} ({} collapsed)",
                    conversationId, report.inserted, report.updated, report.collapsed);
        });

    // ------------------------------------------------------------
    // 2) Optimistic send
    // ------------------------------------------------------------
    CachedMessage draft;
    draft.conversationId = "general";
    draft.optimisticId = "opt_1";
    draft.senderId = "alice-0001";
    draft.senderName = "Alice";
    draft.content = "hello room!";
    cache.add_optimistic_message(draft).get();

    // ------------------------------------------------------------
    // 3) Server confirmation
    // ------------------------------------------------------------
    InboundMessage ack;
    ack.serverId = "m1";
    ack.optimisticId = "opt_1";
    ack.status = MessageStatus::Sent;
    ack.timestamp = now_ms();
    cache.reconcile_batch("general", {ack}).get();

    // ------------------------------------------------------------
    // 4) History page from the server
    // ------------------------------------------------------------
    std::vector<InboundMessage> history;
    for (int i = 0; i < 3; ++i)
    {
        InboundMessage in;
        in.serverId = "h" + std::to_string(i);
        in.senderId = "bob-00000002";
        in.content = "older message #" + std::to_string(i);
        in.timestamp = now_ms() - (i + 1) * 60000;
        history.push_back(in);
    }

    ReconcileOptions options;
    options.hasMoreHistory = false;
    cache.reconcile_batch("general", history, options).get();

    cache.update_message_status("general", "m1", MessageStatus::Delivered).get();

    // ------------------------------------------------------------
    // 5) Read back
    // ------------------------------------------------------------
    auto page = cache.get_messages("general", 10);
    for (const auto &m : page.messages)
    {
        std::cout << m.identity_key() << "  [" << to_string(m.status) << "]  "
                  << m.senderName << ": " << m.content << "\n";
    }

    std::cout << "\n"
              << cache.metrics().render_prometheus();

    cache.close();
    return 0;
}
