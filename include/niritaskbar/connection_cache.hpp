#ifndef NIRITASKBAR_CONNECTION_CACHE_HPP
#define NIRITASKBAR_CONNECTION_CACHE_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <variant>

#include "niritaskbar/bus.hpp"
#include "niritaskbar/channel.hpp"

namespace niritaskbar {

    using CacheClock = std::chrono::steady_clock;

    struct CacheEntry {
        std::optional<uint32_t> pid;
        CacheClock::time_point  expiry;
    };

    // The peer -> pid map itself; owned by exactly one ConnectionCache worker.
    class CacheTable {
      public:
        explicit CacheTable(std::chrono::milliseconds ttl);

        // Refreshes the entry's expiry on a hit; nullptr on a miss.
        const CacheEntry* lookup(std::string_view peer, CacheClock::time_point now);
        void              insert(std::string peer, std::optional<uint32_t> pid, CacheClock::time_point now);
        void              remove(std::string_view peer);
        size_t            expire(CacheClock::time_point now);
        size_t            size() const;

      private:
        std::chrono::milliseconds                   ttl_;
        std::unordered_map<std::string, CacheEntry> entries_;
    };

    struct ConnectionCacheOptions {
        std::chrono::milliseconds                    ttl            = std::chrono::minutes(5);
        std::chrono::milliseconds                    sweep_interval = std::chrono::minutes(1);
        std::function<CacheClock::time_point()>      clock          = {};
        bool                                         debug_logging  = false;
    };

    // Maps bus peers to pids on a background worker.
    //
    // Callers never touch the map: lookups and bus lifecycle signals are queued
    // to the worker, which answers lookups through a promise.
    class ConnectionCache {
      public:
        ConnectionCache(BusIntrospector& introspector, ConnectionCacheOptions options);
        ~ConnectionCache();

        ConnectionCache(const ConnectionCache&)            = delete;
        ConnectionCache& operator=(const ConnectionCache&) = delete;

        // Blocks until the worker answers; asks the bus on a miss.
        std::optional<uint32_t> get(std::string_view peer);
        void                    name_owner_changed(NameOwnerChange change);

#ifdef NIRITASKBAR_TESTING
        void   sweep_for_tests();
        size_t size_for_tests();
#endif

      private:
        struct GetRequest {
            std::string                          peer;
            std::promise<std::optional<uint32_t>> result;
        };

        struct SweepRequest {
            bool                 expire = true;
            std::promise<size_t> remaining;
        };

        using Message = std::variant<GetRequest, NameOwnerChange, SweepRequest>;

        void                    run();
        void                    handle(GetRequest& request);
        void                    handle(const NameOwnerChange& change);
        std::optional<uint32_t> resolve(std::string_view peer);
        CacheClock::time_point  now() const;

        BusIntrospector&        introspector_;
        ConnectionCacheOptions  options_;
        CacheTable              table_;
        Channel<Message>        messages_;
        std::thread             worker_;
    };

} // namespace niritaskbar

#endif // NIRITASKBAR_CONNECTION_CACHE_HPP
